#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace analyzer {

enum class TokenKind {
  kIdentifier,
  kNumber,
  kString,
  kChar,
  kPunct,
  kPreprocessor ///< a whole directive line, continuations joined
};

struct Token {
  TokenKind kind;
  std::string text;
  int line = 1;
  std::size_t offset = 0; ///< byte offset of the first character
  bool space_before = false;

  bool Is(const char *value) const { return text == value; }
  bool IsIdentifier() const { return kind == TokenKind::kIdentifier; }
};

/**
 * @brief Splits C source text into tokens.
 *
 * Comments are dropped. Preprocessor directives are returned as single
 * tokens. Throws errors::StructuralAnalysisError on an unterminated comment
 * or literal.
 */
class CLexer {
public:
  /**
   * @brief Constructs a lexer over the given text.
   * @param path Reported in structural errors.
   * @param text The source text.
   */
  CLexer(std::string path, std::string text);

  /**
   * @brief Tokenizes the whole text.
   * @return The tokens in source order.
   */
  std::vector<Token> Tokenize();

private:
  int GetChar();
  int Peek(std::size_t ahead = 0) const;
  bool AtEnd() const { return pos_ >= text_.size(); }

  void SkipBlockComment();
  void SkipLineComment();
  Token ReadPreprocessor();
  Token ReadQuoted(char quote);
  Token ReadWord(int first);
  Token ReadNumber(int first);
  Token ReadPunct(int first);

  [[noreturn]] void Fail(const std::string &message, int line) const;

  std::string path_;
  std::string text_;
  std::size_t pos_;
  std::size_t token_start_;
  int line_number_;
  bool at_line_start_;
};

} // namespace analyzer
