#pragma once
#include <covenant/schema/primitives.hpp>
#include <initializer_list>
#include <string_view>

namespace covenant::blake3 {

covenant::schema::hash32_t hash(const std::string_view& str);
covenant::schema::hash32_t hash(const covenant::schema::bytes_view_t& bytes);

/// BLAKE3 over the concatenation of parts, without materializing it.
covenant::schema::hash32_t hash(
    std::initializer_list<covenant::schema::bytes_view_t> parts);

}  // namespace covenant::blake3
