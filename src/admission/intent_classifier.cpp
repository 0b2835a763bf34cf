#include <covenant/admission/intent_classifier.hpp>

#include <algorithm>
#include <array>
#include <cctype>

using covenant::schema::routing_tier_t;

namespace covenant::admission {

namespace {

// Prefix, and whether anything may follow it.
struct simple_prefix final {
  std::string_view text;
  bool exact{};
};

inline constexpr auto kSimplePrefixes = std::array{
    simple_prefix{"what is"},   simple_prefix{"what are"},
    simple_prefix{"tell me"},   simple_prefix{"list "},
    simple_prefix{"status"},    simple_prefix{"hello"},
    simple_prefix{"hi", true},  simple_prefix{"bye"},
    simple_prefix{"thanks"}};

inline constexpr auto kBatchKeywords = std::array<std::string_view, 6>{
    "schedule", "batch", "report", "export", "log", "archive"};

std::string normalize(const std::string_view input) {
  auto out = std::string{};
  out.reserve(input.size());
  auto begin = input.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return out;
  }
  auto end = input.find_last_not_of(" \t\r\n");
  for (const auto c : input.substr(begin, end - begin + 1)) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

// keyword followed by whitespace anywhere in the input.
bool has_batch_keyword(const std::string_view input,
                       const std::string_view keyword) {
  for (auto at = input.find(keyword); at != std::string_view::npos;
       at = input.find(keyword, at + 1)) {
    auto after = at + keyword.size();
    if (after < input.size() &&
        std::isspace(static_cast<unsigned char>(input[after])) != 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

classification_t classify_heuristically(const std::string_view input) {
  auto text = normalize(input);
  for (const auto& prefix : kSimplePrefixes) {
    if (prefix.exact ? text == prefix.text : text.starts_with(prefix.text)) {
      return classification_t{.tier = routing_tier_t::medium,
                              .concepts = {"simple_query"},
                              .reason = "simple query"};
    }
  }
  auto keyword = std::ranges::find_if(kBatchKeywords, [&](auto candidate) {
    return has_batch_keyword(text, candidate);
  });
  if (keyword != std::end(kBatchKeywords)) {
    return classification_t{.tier = routing_tier_t::low,
                            .concepts = {"batch_processing",
                                         std::string{*keyword}},
                            .reason = "batch work queued for lazy processing"};
  }
  return classification_t{.tier = routing_tier_t::high,
                          .concepts = {"complex_reasoning"},
                          .reason = "complex request requiring reasoning"};
}

intent_classifier_t make_heuristic_classifier() {
  return [](const std::string_view input) {
    return classify_heuristically(input);
  };
}

}  // namespace covenant::admission
