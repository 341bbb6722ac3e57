#include "helpers.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace helpers {

int isdigit_(int curr) { return isdigit(curr); }
int isalpha_(int curr) { return (isalpha(curr) || curr == '_'); }
int isalnum_(int curr) { return (isalnum(curr) || curr == '_'); }

bool IsWhitespace(int curr) {
  return curr == ' ' || curr == '\t' || curr == '\f' || curr == '\n' ||
         curr == '\r' || curr == '\v';
}

std::string SkipWhite(const std::string &p) {
  std::string::size_type i = 0;
  while (i < p.length() && (p[i] == ' ' || p[i] == '\t')) {
    i++;
  }
  return p.substr(i);
}

std::string Trim(const std::string &p) {
  std::string::size_type begin = 0;
  std::string::size_type end = p.length();
  while (begin < end && IsWhitespace(p[begin])) {
    begin++;
  }
  while (end > begin && IsWhitespace(p[end - 1])) {
    end--;
  }
  return p.substr(begin, end - begin);
}

std::string CollapseWhitespace(const std::string &p) {
  std::string result;
  bool pending_blank = false;
  for (char curr : p) {
    if (IsWhitespace(curr)) {
      pending_blank = !result.empty();
      continue;
    }
    if (pending_blank) {
      result.push_back(' ');
      pending_blank = false;
    }
    result.push_back(curr);
  }
  return result;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::string line;
  std::istringstream stream(text);
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

std::optional<std::string> ReadFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

} // namespace helpers
