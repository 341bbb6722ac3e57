#include "c_lexer.hpp"

#include "../errors/errors.hpp"
#include "../helpers/helpers.hpp"

#include <array>
#include <cstdio>
#include <fmt/core.h>
#include <string_view>
#include <utility>

namespace analyzer {
namespace {
// Longest first.
constexpr std::array<std::string_view, 22> kOperators{
    "...", "<<=", ">>=", "->", "++", "--", "<<", ">>", "<=", ">=", "==",
    "!=",  "&&",  "||",  "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^="};
} // namespace

CLexer::CLexer(std::string path, std::string text)
    : path_(std::move(path)), text_(std::move(text)), pos_(0), token_start_(0),
      line_number_(1), at_line_start_(true) {}

int CLexer::GetChar() {
  if (AtEnd()) {
    return EOF;
  }
  int curr = static_cast<unsigned char>(text_[pos_++]);
  if (curr == '\n') {
    line_number_++;
  }
  return curr;
}

int CLexer::Peek(std::size_t ahead) const {
  if (pos_ + ahead >= text_.size()) {
    return EOF;
  }
  return static_cast<unsigned char>(text_[pos_ + ahead]);
}

void CLexer::Fail(const std::string &message, int line) const {
  throw errors::StructuralAnalysisError(
      path_, fmt::format("{} at line {}", message, line));
}

std::vector<Token> CLexer::Tokenize() {
  std::vector<Token> tokens;
  bool space_before = false;

  while (!AtEnd()) {
    int curr = Peek();
    if (curr == '\n') {
      GetChar();
      at_line_start_ = true;
      space_before = true;
      continue;
    }
    if (helpers::IsWhitespace(curr)) {
      GetChar();
      space_before = true;
      continue;
    }
    if (curr == '/' && Peek(1) == '*') {
      SkipBlockComment();
      space_before = true;
      continue;
    }
    if (curr == '/' && Peek(1) == '/') {
      SkipLineComment();
      space_before = true;
      continue;
    }
    if (curr == '\\' && Peek(1) == '\n') {
      GetChar();
      GetChar();
      continue;
    }

    token_start_ = pos_;
    Token token;
    if (curr == '#' && at_line_start_) {
      token = ReadPreprocessor();
      at_line_start_ = true;
    } else {
      at_line_start_ = false;
      GetChar();
      if (curr == '"' || curr == '\'') {
        token = ReadQuoted(static_cast<char>(curr));
      } else if (helpers::isalpha_(curr)) {
        token = ReadWord(curr);
      } else if (helpers::isdigit_(curr) ||
                 (curr == '.' && helpers::isdigit_(Peek()))) {
        token = ReadNumber(curr);
      } else {
        token = ReadPunct(curr);
      }
    }
    token.offset = token_start_;
    token.space_before = space_before;
    space_before = false;
    tokens.push_back(std::move(token));
  }
  return tokens;
}

void CLexer::SkipBlockComment() {
  int start_line = line_number_;
  GetChar();
  GetChar();
  while (true) {
    int curr = GetChar();
    if (curr == EOF) {
      Fail("unterminated comment", start_line);
    }
    if (curr == '*' && Peek() == '/') {
      GetChar();
      return;
    }
  }
}

void CLexer::SkipLineComment() {
  while (!AtEnd() && Peek() != '\n') {
    if (Peek() == '\\' && Peek(1) == '\n') {
      GetChar();
    }
    GetChar();
  }
}

Token CLexer::ReadPreprocessor() {
  Token token{TokenKind::kPreprocessor, "", line_number_};
  while (!AtEnd() && Peek() != '\n') {
    int curr = Peek();
    if (curr == '\\' && Peek(1) == '\n') {
      GetChar();
      GetChar();
      token.text.push_back(' ');
      continue;
    }
    if (curr == '/' && Peek(1) == '*') {
      SkipBlockComment();
      token.text.push_back(' ');
      continue;
    }
    if (curr == '/' && Peek(1) == '/') {
      SkipLineComment();
      break;
    }
    token.text.push_back(static_cast<char>(GetChar()));
  }
  token.text = helpers::Trim(token.text);
  return token;
}

Token CLexer::ReadQuoted(char quote) {
  Token token{quote == '"' ? TokenKind::kString : TokenKind::kChar,
              std::string(1, quote), line_number_};
  while (true) {
    int curr = GetChar();
    if (curr == EOF || curr == '\n') {
      Fail(quote == '"' ? "unterminated string literal"
                        : "unterminated character literal",
           token.line);
    }
    token.text.push_back(static_cast<char>(curr));
    if (curr == '\\') {
      int escaped = GetChar();
      if (escaped == EOF) {
        Fail("unterminated literal", token.line);
      }
      token.text.push_back(static_cast<char>(escaped));
      continue;
    }
    if (curr == quote) {
      return token;
    }
  }
}

Token CLexer::ReadWord(int first) {
  Token token{TokenKind::kIdentifier, std::string(1, static_cast<char>(first)),
              line_number_};
  while (helpers::isalnum_(Peek())) {
    token.text.push_back(static_cast<char>(GetChar()));
  }
  // Prefixed literals: L"..", u8"..", U'x'
  if ((Peek() == '"' || Peek() == '\'') &&
      (token.text == "L" || token.text == "u" || token.text == "U" ||
       token.text == "u8")) {
    auto prefix = token.text;
    char quote = static_cast<char>(GetChar());
    token = ReadQuoted(quote);
    token.text = prefix + token.text;
  }
  return token;
}

Token CLexer::ReadNumber(int first) {
  Token token{TokenKind::kNumber, std::string(1, static_cast<char>(first)),
              line_number_};
  while (true) {
    int curr = Peek();
    if (helpers::isalnum_(curr) || curr == '.') {
      token.text.push_back(static_cast<char>(GetChar()));
      continue;
    }
    char last = token.text.back();
    if ((curr == '+' || curr == '-') &&
        (last == 'e' || last == 'E' || last == 'p' || last == 'P')) {
      token.text.push_back(static_cast<char>(GetChar()));
      continue;
    }
    break;
  }
  return token;
}

Token CLexer::ReadPunct(int first) {
  Token token{TokenKind::kPunct, std::string(1, static_cast<char>(first)),
              line_number_};
  std::string_view rest(text_.data() + token_start_,
                        text_.size() - token_start_);
  for (auto op : kOperators) {
    if (helpers::StartsWith(rest, op)) {
      for (std::size_t i = 1; i < op.size(); ++i) {
        GetChar();
      }
      token.text = std::string(op);
      break;
    }
  }
  return token;
}

} // namespace analyzer
