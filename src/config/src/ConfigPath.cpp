/**
 * @file ConfigPath.cpp
 * @brief Path expression parsing and status strings.
 */

#include "src/config/inc/ConfigPath.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <charconv>
#include <utility>

#include <fmt/core.h>

namespace blkref {

namespace config {

using blkref::helpers::strings::isDigit;

namespace {

/// Characters that may not appear in a mapping key.
bool isKeyDelimiter(char c) noexcept { return c == '/' || c == '[' || c == ']' || c == '='; }

/// Drop one pair of matching surrounding quotes.
std::string_view unquote(std::string_view value) noexcept {
  if (value.size() >= 2 && (value.front() == '\'' || value.front() == '"') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

/// Parse the text between '[' and ']' into seg.
bool parseSelector(std::string_view body, PathSegment& seg) {
  if (body.empty()) {
    return false;
  }

  bool allDigits = true;
  for (const char C : body) {
    allDigits = allDigits && isDigit(C);
  }
  if (allDigits) {
    const auto [PTR, EC] = std::from_chars(body.data(), body.data() + body.size(), seg.index);
    if (EC != std::errc{} || PTR != body.data() + body.size()) {
      return false;
    }
    seg.selector = PathSegment::Selector::INDEX;
    return true;
  }

  const std::size_t EQ = body.find('=');
  if (EQ == std::string_view::npos || EQ == 0) {
    return false;
  }
  const std::string_view KEY = body.substr(0, EQ);
  for (const char C : KEY) {
    if (isKeyDelimiter(C)) {
      return false;
    }
  }
  seg.selector = PathSegment::Selector::MATCH;
  seg.matchKey.assign(KEY);
  seg.matchValue.assign(unquote(body.substr(EQ + 1)));
  return true;
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(DatabaseStatus status) noexcept {
  switch (status) {
  case DatabaseStatus::OK:
    return "OK";
  case DatabaseStatus::NOT_LOADED:
    return "NOT_LOADED";
  case DatabaseStatus::NOT_FOUND:
    return "NOT_FOUND";
  case DatabaseStatus::INVALID_PATH:
    return "INVALID_PATH";
  case DatabaseStatus::NOT_APPLICABLE:
    return "NOT_APPLICABLE";
  case DatabaseStatus::IO_FAILED:
    return "IO_FAILED";
  case DatabaseStatus::PARSE_FAILED:
    return "PARSE_FAILED";
  }
  return "UNKNOWN";
}

/* ----------------------------- PathSegment ----------------------------- */

std::string PathSegment::toString() const {
  switch (selector) {
  case Selector::INDEX:
    return fmt::format("{}[{}]", key, index);
  case Selector::MATCH:
    return fmt::format("{}[{}={}]", key, matchKey, matchValue);
  case Selector::NONE:
    break;
  }
  return key;
}

/* ----------------------------- ConfigPath ----------------------------- */

ConfigPath ConfigPath::parent() const {
  ConfigPath up{};
  if (!segments.empty()) {
    up.segments.assign(segments.begin(), segments.end() - 1);
  }
  return up;
}

std::string ConfigPath::toString() const {
  if (segments.empty()) {
    return "/";
  }
  std::string out;
  for (const PathSegment& SEG : segments) {
    out.push_back('/');
    out += SEG.toString();
  }
  return out;
}

DatabaseStatus parsePath(std::string_view text, ConfigPath& out) {
  if (text.empty() || text.front() != '/') {
    return DatabaseStatus::INVALID_PATH;
  }

  ConfigPath parsed{};
  if (text.size() == 1) {
    out = std::move(parsed);
    return DatabaseStatus::OK;
  }

  std::size_t pos = 0;
  while (pos < text.size()) {
    // pos sits on the '/' introducing a segment.
    ++pos;
    const std::size_t KEY_START = pos;
    while (pos < text.size() && !isKeyDelimiter(text[pos])) {
      ++pos;
    }
    if (pos == KEY_START) {
      return DatabaseStatus::INVALID_PATH;
    }

    PathSegment seg{};
    seg.key.assign(text.substr(KEY_START, pos - KEY_START));

    if (pos < text.size() && text[pos] == '[') {
      const std::size_t CLOSE = text.find(']', pos + 1);
      if (CLOSE == std::string_view::npos ||
          !parseSelector(text.substr(pos + 1, CLOSE - pos - 1), seg)) {
        return DatabaseStatus::INVALID_PATH;
      }
      pos = CLOSE + 1;
    }

    if (pos < text.size() && text[pos] != '/') {
      return DatabaseStatus::INVALID_PATH;
    }
    if (pos + 1 == text.size()) {
      // Trailing '/'.
      return DatabaseStatus::INVALID_PATH;
    }
    parsed.segments.push_back(std::move(seg));
  }

  out = std::move(parsed);
  return DatabaseStatus::OK;
}

} // namespace config

} // namespace blkref
