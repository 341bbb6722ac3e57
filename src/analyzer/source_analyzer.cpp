#include "source_analyzer.hpp"

#include "../errors/errors.hpp"
#include "../fatal/fatal.hpp"
#include "../helpers/helpers.hpp"
#include "c_lexer.hpp"
#include "names.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <optional>
#include <utility>
#include <vector>

namespace analyzer {
namespace {
using Tokens = std::vector<Token>;

struct PendingBody {
  models::FunctionSignature signature;
  std::size_t open;
  std::size_t close;
};

std::string Join(const Tokens &tokens, std::size_t begin, std::size_t end,
                 std::optional<std::size_t> skip = std::nullopt) {
  std::string result;
  for (std::size_t i = begin; i < end; ++i) {
    if (skip.has_value() && *skip == i) {
      continue;
    }
    if (!result.empty() && tokens[i].space_before) {
      result += ' ';
    }
    result += tokens[i].text;
  }
  return result;
}

bool IsOpening(const Token &token) {
  return token.Is("(") || token.Is("[") || token.Is("{");
}

bool IsClosing(const Token &token) {
  return token.Is(")") || token.Is("]") || token.Is("}");
}

std::size_t FindClose(const Tokens &tokens, std::size_t open) {
  int depth = 0;
  for (std::size_t i = open; i < tokens.size(); ++i) {
    if (IsOpening(tokens[i])) {
      depth++;
    } else if (IsClosing(tokens[i])) {
      depth--;
      if (depth == 0) {
        return i;
      }
    }
  }
  return tokens.size() - 1;
}

void CheckBalance(const std::string &path, const Tokens &tokens) {
  std::vector<const Token *> stack;
  for (const auto &token : tokens) {
    if (IsOpening(token)) {
      stack.push_back(&token);
      continue;
    }
    if (!IsClosing(token)) {
      continue;
    }
    char expected = token.Is(")") ? '(' : token.Is("]") ? '[' : '{';
    if (stack.empty() || stack.back()->text[0] != expected) {
      throw errors::StructuralAnalysisError(
          path, fmt::format("unbalanced {} at line {}",
                            expected == '{' ? "braces" : "parentheses",
                            token.line));
    }
    stack.pop_back();
  }
  if (!stack.empty()) {
    const auto *open = stack.back();
    throw errors::StructuralAnalysisError(
        path, fmt::format("unbalanced {} at line {}",
                          open->Is("{") ? "braces" : "parentheses",
                          open->line));
  }
}

// Index of the first "(" at bracket depth 0 in [begin, end).
std::optional<std::size_t> FindTopLevelParen(const Tokens &tokens,
                                             std::size_t begin,
                                             std::size_t end) {
  int depth = 0;
  for (std::size_t i = begin; i < end; ++i) {
    if (depth == 0 && tokens[i].Is("(")) {
      return i;
    }
    if (IsOpening(tokens[i])) {
      depth++;
    } else if (IsClosing(tokens[i])) {
      depth--;
    }
  }
  return std::nullopt;
}

bool IsAttribute(const Token &token) {
  return token.Is("__attribute__") || token.Is("__asm__") || token.Is("asm") ||
         token.Is("__extension__");
}

// Skips attribute and asm groups starting at i; returns the next index.
std::size_t SkipAttributes(const Tokens &tokens, std::size_t i,
                           std::size_t end) {
  while (i < end && IsAttribute(tokens[i])) {
    if (i + 1 < end && tokens[i + 1].Is("(")) {
      i = FindClose(tokens, i + 1) + 1;
    } else {
      i++;
    }
  }
  return i;
}

std::vector<std::pair<std::size_t, std::size_t>>
SplitTopLevel(const Tokens &tokens, std::size_t begin, std::size_t end) {
  std::vector<std::pair<std::size_t, std::size_t>> groups;
  int depth = 0;
  std::size_t start = begin;
  for (std::size_t i = begin; i < end; ++i) {
    if (IsOpening(tokens[i])) {
      depth++;
    } else if (IsClosing(tokens[i])) {
      depth--;
    } else if (depth == 0 && tokens[i].Is(",")) {
      groups.emplace_back(start, i);
      start = i + 1;
    }
  }
  groups.emplace_back(start, end);
  return groups;
}

bool IsTagKeyword(const Token &token) {
  return token.Is("struct") || token.Is("union") || token.Is("enum");
}

models::Parameter ParseParameter(const Tokens &tokens, std::size_t begin,
                                 std::size_t end, std::size_t index) {
  models::Parameter parameter;
  std::string synthesized = fmt::format("arg{}", index + 1);

  // Function pointer: type (*name)(args)
  for (std::size_t q = begin; q + 2 < end; ++q) {
    if (!tokens[q].Is("(") || !tokens[q + 1].Is("*")) {
      continue;
    }
    if (tokens[q + 2].IsIdentifier() && q + 3 < end && tokens[q + 3].Is(")")) {
      parameter.name = tokens[q + 2].text;
      parameter.declaration = Join(tokens, begin, end);
      parameter.type = Join(tokens, begin, end, q + 2);
    } else {
      parameter.name = synthesized;
      parameter.type = Join(tokens, begin, end);
      parameter.declaration =
          Join(tokens, begin, q + 2) + parameter.name + Join(tokens, q + 2, end);
    }
    return parameter;
  }

  std::size_t stop = end;
  for (std::size_t i = begin; i < end; ++i) {
    if (tokens[i].Is("[")) {
      stop = i;
      break;
    }
  }

  bool named = false;
  if (stop > begin + 1) {
    std::size_t candidate = stop - 1;
    const auto &token = tokens[candidate];
    bool has_type = false;
    for (std::size_t i = begin; i < candidate; ++i) {
      auto kind = ParseNameToken(tokens[i].text);
      if (!kind.has_value() || *kind != NameKind::kQualifier) {
        has_type = true;
      }
    }
    named = token.IsIdentifier() && !IsKeyword(token.text) &&
            !IsTagKeyword(tokens[candidate - 1]) && has_type;
    if (named) {
      parameter.name = token.text;
      parameter.declaration = Join(tokens, begin, end);
      parameter.type = Join(tokens, begin, end, candidate);
    }
  }
  if (!named) {
    parameter.name = synthesized;
    parameter.type = Join(tokens, begin, end);
    std::string head = Join(tokens, begin, stop);
    parameter.declaration = head;
    if (!helpers::EndsWith(head, "*")) {
      parameter.declaration += ' ';
    }
    parameter.declaration += parameter.name + Join(tokens, stop, end);
  }
  parameter.type = helpers::CollapseWhitespace(parameter.type);
  return parameter;
}

void ParseParameters(const Tokens &tokens, std::size_t begin, std::size_t end,
                     models::FunctionSignature &signature) {
  auto groups = SplitTopLevel(tokens, begin, end);
  if (groups.size() == 1) {
    auto [first, last] = groups.front();
    if (first == last) {
      return;
    }
    if (last == first + 1 && tokens[first].Is("void")) {
      return;
    }
  }
  for (auto [first, last] : groups) {
    if (first == last) {
      continue;
    }
    if (last == first + 1 && tokens[first].Is("...")) {
      signature.is_variadic = true;
      continue;
    }
    signature.parameters.push_back(
        ParseParameter(tokens, first, last, signature.parameters.size()));
  }
}

/**
 * Parses a declarator head spanning [begin, end), where end is the ';' or
 * '{' that terminated it. Returns nothing when the head is not a function.
 */
std::optional<models::FunctionSignature>
ParseHead(const std::string &path, const Tokens &tokens, std::size_t begin,
          std::size_t end, bool definition) {
  if (begin >= end) {
    return std::nullopt;
  }
  for (std::size_t i = begin; i < end; ++i) {
    if (tokens[i].Is("typedef") || tokens[i].Is("_Static_assert")) {
      return std::nullopt;
    }
  }
  auto paren = FindTopLevelParen(tokens, begin, end);
  if (!paren.has_value() || *paren == begin) {
    return std::nullopt;
  }
  std::size_t p = *paren;

  models::FunctionSignature signature;
  signature.unit_path = path;
  std::size_t name_index;
  std::size_t close = FindClose(tokens, p);

  if (tokens[p - 1].IsIdentifier() && !IsKeyword(tokens[p - 1].text)) {
    name_index = p - 1;
    std::size_t rest = SkipAttributes(tokens, close + 1, end);
    signature.is_opaque = rest != end;
  } else if (p + 3 < end && tokens[p + 1].Is("*") &&
             tokens[p + 2].IsIdentifier() && tokens[p + 3].Is("(")) {
    // Function returning a function pointer.
    name_index = p + 2;
    signature.is_opaque = true;
  } else {
    return std::nullopt;
  }

  for (std::size_t i = begin; i < name_index; ++i) {
    if (tokens[i].Is("=")) {
      return std::nullopt;
    }
  }

  signature.name = tokens[name_index].text;
  signature.line = tokens[name_index].line;

  std::string return_type;
  std::size_t type_end = signature.is_opaque && name_index > p ? p : name_index;
  for (std::size_t i = begin; i < type_end;) {
    if (IsAttribute(tokens[i])) {
      i = SkipAttributes(tokens, i, type_end);
      continue;
    }
    auto kind = ParseNameToken(tokens[i].text);
    if (kind == NameKind::kStorage) {
      if (tokens[i].Is("static")) {
        signature.is_static = true;
      }
      i++;
      continue;
    }
    if (!return_type.empty() && tokens[i].space_before) {
      return_type += ' ';
    }
    return_type += tokens[i].text;
    i++;
  }
  if (return_type.empty()) {
    if (!definition) {
      // A bare NAME(...) at file scope is a macro invocation.
      return std::nullopt;
    }
    return_type = "int";
  }
  signature.return_type = helpers::CollapseWhitespace(return_type);
  signature.declaration = helpers::CollapseWhitespace(Join(tokens, begin, end));

  if (!signature.is_opaque) {
    ParseParameters(tokens, p + 1, close, signature);
  }
  return signature;
}

void AddFunction(models::SourceUnit &unit, models::FunctionSignature signature) {
  for (auto &existing : unit.functions) {
    if (existing.name != signature.name) {
      continue;
    }
    if (!existing.is_definition && signature.is_definition) {
      signature.is_static = signature.is_static || existing.is_static;
      existing = std::move(signature);
    }
    return;
  }
  unit.functions.push_back(std::move(signature));
}

void HandleDirective(models::SourceUnit &unit, const Token &token) {
  std::string line = helpers::SkipWhite(token.text.substr(1));
  std::size_t word_end = 0;
  while (word_end < line.size() && helpers::isalpha_(line[word_end])) {
    word_end++;
  }
  std::string directive = line.substr(0, word_end);
  std::string rest = helpers::SkipWhite(line.substr(word_end));

  if (directive == "include") {
    auto target = helpers::Trim(rest);
    if (!target.empty() && std::find(unit.includes.begin(), unit.includes.end(),
                                     target) == unit.includes.end()) {
      unit.includes.push_back(target);
    }
    return;
  }
  if (directive == "define") {
    std::size_t name_end = 0;
    while (name_end < rest.size() && helpers::isalnum_(rest[name_end])) {
      name_end++;
    }
    if (name_end > 0 && name_end < rest.size() && rest[name_end] == '(') {
      unit.macros.insert(rest.substr(0, name_end));
    }
  }
}

void HandleGlobals(models::SourceUnit &unit, const Tokens &tokens,
                   std::size_t begin, std::size_t end) {
  if (tokens[begin].Is("typedef") || tokens[begin].Is("_Static_assert")) {
    return;
  }
  std::string declaration =
      helpers::CollapseWhitespace(Join(tokens, begin, end)) + ";";
  bool is_extern = tokens[begin].Is("extern");

  for (auto [first, last] : SplitTopLevel(tokens, begin, end)) {
    std::string name;
    int depth = 0;
    for (std::size_t i = first; i < last; ++i) {
      const auto &token = tokens[i];
      if (depth == 0 && (token.Is("=") || token.Is("["))) {
        break;
      }
      if (token.Is("(") && i + 2 < last && tokens[i + 1].Is("*") &&
          tokens[i + 2].IsIdentifier()) {
        name = tokens[i + 2].text;
        break;
      }
      if (IsOpening(token)) {
        depth++;
        continue;
      }
      if (IsClosing(token)) {
        depth--;
        continue;
      }
      if (depth == 0 && token.IsIdentifier() && !IsKeyword(token.text) &&
          !(i > first && IsTagKeyword(tokens[i - 1]))) {
        name = token.text;
      }
    }
    // A lone identifier is a macro or type name, not a declarator.
    if (first == begin && last - first < 2) {
      name.clear();
    }
    if (!name.empty() && !unit.HasGlobal(name)) {
      unit.globals.push_back(models::GlobalVariable{name, declaration, is_extern});
    }
  }
}

void ScanBody(const models::SourceUnit &unit, const Tokens &tokens,
              std::size_t begin, std::size_t end,
              models::FunctionSignature &signature) {
  auto is_parameter = [&signature](const std::string &name) {
    return std::any_of(signature.parameters.begin(), signature.parameters.end(),
                       [&name](const models::Parameter &parameter) {
                         return parameter.name == name;
                       });
  };

  for (std::size_t j = begin; j < end; ++j) {
    const auto &token = tokens[j];
    if (token.kind == TokenKind::kPunct) {
      if (token.Is("?") || token.Is("&&") || token.Is("||")) {
        signature.decision_points++;
      }
      continue;
    }
    if (!token.IsIdentifier()) {
      continue;
    }
    if (token.Is("if") || token.Is("for") || token.Is("while") ||
        token.Is("case")) {
      signature.decision_points++;
      continue;
    }
    if (IsKeyword(token.text)) {
      continue;
    }
    if (j > begin && (tokens[j - 1].Is(".") || tokens[j - 1].Is("->"))) {
      continue;
    }
    if (is_parameter(token.text)) {
      continue;
    }
    bool followed_by_paren = j + 1 < end && tokens[j + 1].Is("(");
    if (unit.HasGlobal(token.text)) {
      signature.globals_used.insert(token.text);
      continue;
    }
    if (followed_by_paren && unit.macros.count(token.text) == 0) {
      signature.calls.insert(token.text);
    }
  }
}
} // namespace

models::SourceUnit SourceAnalyzer::Parse(const std::string &path,
                                         const std::string &text) const {
  models::SourceUnit unit;
  unit.path = path;
  unit.text = text;
  unit.is_header = helpers::EndsWith(path, ".h");

  CLexer lexer(path, text);
  Tokens tokens;
  for (auto &token : lexer.Tokenize()) {
    if (token.kind == TokenKind::kPreprocessor) {
      HandleDirective(unit, token);
    } else {
      tokens.push_back(std::move(token));
    }
  }
  CheckBalance(path, tokens);

  std::vector<PendingBody> bodies;
  std::size_t i = 0;
  while (i < tokens.size()) {
    if (tokens[i].Is("}") || tokens[i].Is(";")) {
      i++;
      continue;
    }
    std::size_t start = i;
    int depth = 0;
    bool done = false;
    while (i < tokens.size() && !done) {
      const auto &token = tokens[i];
      if (token.Is("(") || token.Is("[")) {
        depth++;
      } else if (token.Is(")") || token.Is("]")) {
        depth--;
      } else if (depth == 0 && token.Is(";")) {
        auto signature = ParseHead(path, tokens, start, i, false);
        if (signature.has_value()) {
          AddFunction(unit, std::move(*signature));
        } else {
          HandleGlobals(unit, tokens, start, i);
        }
        done = true;
      } else if (depth == 0 && token.Is("{")) {
        if (i == start + 2 && tokens[start].Is("extern") &&
            tokens[start + 1].kind == TokenKind::kString) {
          // extern "C" { ... }: the block is transparent.
          done = true;
        } else {
          std::size_t close = FindClose(tokens, i);
          bool aggregate = (i > start && IsTagKeyword(tokens[i - 1])) ||
                           (i >= start + 2 && IsTagKeyword(tokens[i - 2]) &&
                            tokens[i - 1].IsIdentifier());
          for (std::size_t k = start; k < i && !aggregate; ++k) {
            aggregate = tokens[k].Is("=");
          }
          auto signature = aggregate
                               ? std::nullopt
                               : ParseHead(path, tokens, start, i, true);
          if (signature.has_value()) {
            signature->is_definition = true;
            signature->body = text.substr(
                tokens[i].offset, tokens[close].offset + 1 - tokens[i].offset);
            bodies.push_back(PendingBody{std::move(*signature), i, close});
            i = close;
            done = true;
          } else {
            i = close;
          }
        }
      }
      i++;
    }
  }

  // Bodies are scanned once every global of the unit is known.
  for (auto &pending : bodies) {
    ScanBody(unit, tokens, pending.open + 1, pending.close, pending.signature);
    AddFunction(unit, std::move(pending.signature));
  }
  std::stable_sort(unit.functions.begin(), unit.functions.end(),
                   [](const models::FunctionSignature &a,
                      const models::FunctionSignature &b) {
                     return a.line < b.line;
                   });
  return unit;
}

models::SourceUnit SourceAnalyzer::AnalyzeText(const std::string &path,
                                               const std::string &text) const {
  try {
    return Parse(path, text);
  } catch (const errors::StructuralAnalysisError &e) {
    loger::warning(fmt::format("skipping {}", path), e.what());
    models::SourceUnit unit;
    unit.path = path;
    unit.text = text;
    unit.is_header = helpers::EndsWith(path, ".h");
    unit.structural_error = true;
    unit.error_message = e.what();
    return unit;
  }
}

models::SourceUnit SourceAnalyzer::Analyze(const std::string &path) const {
  auto text = helpers::ReadFile(path);
  if (!text.has_value()) {
    loger::warning(fmt::format("cannot read {}", path));
    models::SourceUnit unit;
    unit.path = path;
    unit.is_header = helpers::EndsWith(path, ".h");
    unit.structural_error = true;
    unit.error_message = "cannot read file";
    return unit;
  }
  loger::info(fmt::format("analyzing {}", path));
  return AnalyzeText(path, *text);
}

} // namespace analyzer
