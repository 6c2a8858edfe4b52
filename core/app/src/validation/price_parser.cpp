#include "tactical/validation/price_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace tactical {

namespace {

bool isNumberChar(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) || c == '.';
}

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string trimmed(const std::string& s) {
  const auto begin = std::find_if_not(s.begin(), s.end(), isSpace);
  const auto end = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
  return begin < end ? std::string(begin, end) : std::string();
}

struct NumberToken {
  std::size_t begin;
  std::size_t end;
};

}  // namespace

std::optional<double> PriceParser::parseNumber(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> PriceParser::parse(const std::string& text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  for (const char c : text) {
    if (c != ',' && c != '$') {
      cleaned.push_back(c);
    }
  }

  std::vector<NumberToken> tokens;
  for (std::size_t i = 0; i < cleaned.size();) {
    if (!isNumberChar(cleaned[i])) {
      ++i;
      continue;
    }
    std::size_t j = i;
    while (j < cleaned.size() && isNumberChar(cleaned[j])) {
      ++j;
    }
    tokens.push_back({i, j});
    i = j;
  }
  if (tokens.empty() || tokens.size() > 2) {
    return std::nullopt;
  }

  // A '-' glued to the first number at the start of a word is its sign.
  std::size_t first_begin = tokens[0].begin;
  if (first_begin > 0 && cleaned[first_begin - 1] == '-' &&
      (first_begin == 1 || isSpace(cleaned[first_begin - 2]))) {
    --first_begin;
  }
  const auto first =
      parseNumber(cleaned.substr(first_begin, tokens[0].end - first_begin));
  if (!first) {
    return std::nullopt;
  }
  if (tokens.size() == 1) {
    return first;
  }

  // Two numbers are only a price when they form a "low - high" range.
  const auto gap = trimmed(
      cleaned.substr(tokens[0].end, tokens[1].begin - tokens[0].end));
  if (gap != "-") {
    return std::nullopt;
  }
  const auto second = parseNumber(
      cleaned.substr(tokens[1].begin, tokens[1].end - tokens[1].begin));
  if (!second) {
    return std::nullopt;
  }
  return (*first + *second) / 2.0;
}

}  // namespace tactical
