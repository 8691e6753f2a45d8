#include "TextUtils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

// Converts string to lowercase
std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Converts string to uppercase
std::string ToUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

// Case-insensitive string comparison
bool TextUtils::iequals(const std::string &a, const std::string &b) {
  if (a.length() != b.length()) {
    return false;
  }
  return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                    [](char char_a, char char_b) {
                      return std::tolower(static_cast<unsigned char>(char_a)) ==
                             std::tolower(static_cast<unsigned char>(char_b));
                    });
}

bool TextUtils::StartsWith(const std::string &text, const std::string &prefix) {
  return text.size() >= prefix.size() &&
         text.compare(0, prefix.size(), prefix) == 0;
}

bool TextUtils::EndsWith(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Removes leading and trailing whitespace
std::string TextUtils::Trim(const std::string &text) {
  const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
  auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
  auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
  if (begin >= end) {
    return std::string();
  }
  return std::string(begin, end);
}

// Splits 'text' on 'delimiter', trimming each piece
std::vector<std::string> TextUtils::Split(const std::string &text,
                                          char delimiter, bool dropEmpty) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream stream(text);
  while (std::getline(stream, current, delimiter)) {
    current = Trim(current);
    if (dropEmpty && current.empty()) {
      continue;
    }
    parts.push_back(current);
  }
  // getline drops a trailing empty field
  if (!dropEmpty && !text.empty() && text.back() == delimiter) {
    parts.emplace_back();
  }
  return parts;
}

// Converts a filename wildcard pattern (using '*' and '?') into its equivalent
// regular expression
std::string TextUtils::ConvertWildcardToRegex(const std::string &pattern) {
  if (pattern.empty()) {
    return "^.*$"; // An empty pattern implies matching any string
  }
  std::string regex_pattern;
  regex_pattern.reserve(pattern.length() * 2);
  regex_pattern += '^';
  for (char c : pattern) {
    switch (c) {
    case '*':
      regex_pattern += ".*";
      break;
    case '?':
      regex_pattern += '.';
      break;
    // Escape regex metacharacters to treat them literally
    case '.':
    case '^':
    case '$':
    case '|':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
    case '+':
    case '\\':
      regex_pattern += '\\';
      regex_pattern += c;
      break;
    default:
      regex_pattern += c;
      break;
    }
  }
  regex_pattern += '$';
  return regex_pattern;
}

bool TextUtils::HasWildcard(const std::string &pattern) {
  return pattern.find_first_of("*?") != std::string::npos;
}

std::pair<std::string, std::string>
TextUtils::SplitExtension(const std::string &fileName, bool isDirectory) {
  if (isDirectory) {
    return {fileName, std::string()};
  }
  const size_t lastDot = fileName.rfind('.');
  // No dot, a dotfile (".bashrc") or a trailing dot ("name.") means no
  // extension
  if (lastDot == std::string::npos || fileName.front() == '.' ||
      lastDot + 1 == fileName.size()) {
    return {fileName, std::string()};
  }
  return {fileName.substr(0, lastDot), fileName.substr(lastDot)};
}

// Formats 'time' in local time using a std::put_time format string
std::string TextUtils::FormatLocalTime(std::time_t time, const char *format) {
  std::tm time_tm = {};
#ifdef _WIN32
  localtime_s(&time_tm, &time);
#else
  localtime_r(&time, &time_tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&time_tm, format);
  return oss.str();
}

// Timestamp used in history entries
std::string TextUtils::CurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto now_c = std::chrono::system_clock::to_time_t(now);
  return FormatLocalTime(now_c, "%Y-%m-%d %H:%M:%S");
}

// Collapses a time point to its local calendar day as YYYYMMDD
int TextUtils::LocalDayKey(std::time_t time) {
  std::tm time_tm = {};
#ifdef _WIN32
  localtime_s(&time_tm, &time);
#else
  localtime_r(&time, &time_tm);
#endif
  return (time_tm.tm_year + 1900) * 10000 + (time_tm.tm_mon + 1) * 100 +
         time_tm.tm_mday;
}
