#include "sign.hpp"
#include "duration_error.hpp"

#include <cctype>

namespace tparse {

namespace {
bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}
} // namespace

std::string_view trim(std::string_view text) {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

SignedText extract_sign(std::string_view input) {
  SignedText result;
  std::string_view rest = trim(input);
  if (!rest.empty() &&
      (rest.front() == '+' || rest.front() == '-' || rest.front() == '|')) {
    result.sign = rest.front() == '-' ? -1 : 1;
    rest = trim(rest.substr(1));
  }
  if (rest.find('\n') != std::string_view::npos) {
    throw DurationError(DurationErrorKind::Malformed,
                        "Duration expression spans several lines");
  }
  result.remainder = std::string(rest);
  return result;
}

} // namespace tparse
