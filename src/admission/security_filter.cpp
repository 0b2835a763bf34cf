#include <covenant/admission/security_filter.hpp>

#include <array>
#include <cctype>

namespace covenant::admission {

namespace {

struct blocked_pattern final {
  std::string_view needle;
  std::string_view reason;
};

inline constexpr auto kBlockedPatterns = std::array{
    blocked_pattern{"drop table", "sql injection pattern detected: drop table"},
    blocked_pattern{"union select",
                    "sql injection pattern detected: union select"},
    blocked_pattern{"or 1=1", "sql injection pattern detected: or 1=1"},
    blocked_pattern{"$(", "command injection pattern detected: $("},
    blocked_pattern{"`", "command injection pattern detected: backtick"},
    blocked_pattern{"rm -rf", "command injection pattern detected: rm -rf"},
    blocked_pattern{"<script", "markup injection pattern detected: <script"}};

inline constexpr auto kDmlKeywords =
    std::array<std::string_view, 4>{"select", "insert", "update", "delete"};

inline constexpr auto kShellMetacharacters = std::string_view{";&|`$()"};

char lower(const char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool is_word(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_space(const char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool matches_at(const std::string_view input,
                const std::size_t offset,
                const std::string_view needle) {
  if (offset + needle.size() > input.size()) {
    return false;
  }
  for (auto i = std::size_t{0}; i < needle.size(); ++i) {
    if (lower(input[offset + i]) != needle[i]) {
      return false;
    }
  }
  return true;
}

bool contains(const std::string_view input, const std::string_view needle) {
  for (auto i = std::size_t{0}; i + needle.size() <= input.size(); ++i) {
    if (matches_at(input, i, needle)) {
      return true;
    }
  }
  return false;
}

std::size_t count_words(const std::string_view input,
                        const std::string_view word) {
  auto count = std::size_t{0};
  for (auto i = std::size_t{0}; i + word.size() <= input.size(); ++i) {
    if (!matches_at(input, i, word)) {
      continue;
    }
    auto starts = i == 0 || !is_word(input[i - 1]);
    auto ends = i + word.size() == input.size() ||
                !is_word(input[i + word.size()]);
    if (starts && ends) {
      ++count;
    }
  }
  return count;
}

// ' or " closing a literal, then ';' after optional whitespace.
bool has_quote_terminator(const std::string_view input) {
  for (auto i = std::size_t{0}; i < input.size(); ++i) {
    if (input[i] != '\'' && input[i] != '"') {
      continue;
    }
    auto j = i + 1;
    while (j < input.size() && is_space(input[j])) {
      ++j;
    }
    if (j < input.size() && input[j] == ';') {
      return true;
    }
  }
  return false;
}

// "--" that starts a trailing comment: followed by whitespace or the end.
bool has_comment_marker(const std::string_view input) {
  for (auto i = std::size_t{0}; i + 1 < input.size(); ++i) {
    if (input[i] == '-' && input[i + 1] == '-' &&
        (i + 2 == input.size() || is_space(input[i + 2]))) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::optional<std::string_view> inspect(const std::string_view input,
                                        const std::size_t max_input_bytes) {
  auto blank = true;
  for (const auto c : input) {
    if (!is_space(c)) {
      blank = false;
      break;
    }
  }
  if (blank) {
    return std::string_view{"empty input"};
  }
  if (input.size() > max_input_bytes) {
    return std::string_view{"input too large"};
  }
  for (const auto c : input) {
    auto byte = static_cast<unsigned char>(c);
    if ((byte < 0x20 && c != '\t' && c != '\n' && c != '\r') || byte == 0x7f) {
      return std::string_view{"control bytes in input"};
    }
  }

  for (const auto& pattern : kBlockedPatterns) {
    if (contains(input, pattern.needle)) {
      return pattern.reason;
    }
  }
  if (has_quote_terminator(input)) {
    return std::string_view{
        "sql injection pattern detected: quote terminator"};
  }
  if (has_comment_marker(input)) {
    return std::string_view{"sql injection pattern detected: comment marker"};
  }
  auto dml = std::size_t{0};
  for (const auto keyword : kDmlKeywords) {
    dml += count_words(input, keyword);
  }
  if (dml > 2) {
    return std::string_view{"sql injection pattern detected: dml keywords"};
  }

  auto metacharacters = std::size_t{0};
  for (const auto c : input) {
    if (kShellMetacharacters.find(c) != std::string_view::npos) {
      ++metacharacters;
    }
  }
  if (metacharacters >= 3) {
    return std::string_view{
        "command injection pattern detected: shell metacharacters"};
  }
  return std::nullopt;
}

}  // namespace covenant::admission
