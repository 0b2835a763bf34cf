#pragma once

#include <covenant/schema/primitives.hpp>

#include <filesystem>
#include <functional>
#include <string_view>

namespace covenant::governance {

/// Returns the bytes of the governing policy document. Called on every
/// registration and verification so policy edits take effect immediately.
using policy_provider_t = std::function<covenant::schema::bytes_t()>;

/// Policy used when no document is available.
inline constexpr auto kGenesisPolicy = std::string_view{"GENESIS"};

/// Re-reads path on every call; falls back to kGenesisPolicy (with a
/// warning) when the file is missing or unreadable.
policy_provider_t make_file_policy_provider(std::filesystem::path path);

policy_provider_t make_static_policy_provider(covenant::schema::bytes_t policy);

}  // namespace covenant::governance
