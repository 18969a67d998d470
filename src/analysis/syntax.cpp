#include "pw/analysis/syntax.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>

namespace pw::analysis {

namespace {

constexpr std::array<std::string_view, 38> kKeywords = {
    "async",  "await",      "break",  "case",    "catch",  "class",
    "const",  "continue",   "debugger", "default", "delete", "do",
    "else",   "export",     "extends", "false",  "finally", "for",
    "function", "if",       "import", "in",      "instanceof", "let",
    "new",    "null",       "return", "super",   "switch", "throw",
    "true",   "try",        "typeof", "var",     "void",   "while",
    "yield",  "undefined"};

constexpr std::array<std::string_view, 35> kPunctuators = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=",
    "||=",  "??=", "=>",  "==",  "!=",  "<=",  ">=",  "&&",  "||",
    "??",   "?.",  "++",  "--",  "+=",  "-=",  "*=",  "/=",  "%=",
    "&=",   "|=",  "^=",  "**",  "<<",  ">>",  "::",  "#!"};

bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool IsIdentPart(char c) {
  return IsIdentStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

bool IsKeyword(std::string_view word) {
  return std::find(kKeywords.begin(), kKeywords.end(), word) != kKeywords.end();
}

bool RegexAllowedAfter(const std::vector<Token>& tokens) {
  if (tokens.empty()) {
    return true;
  }
  const Token& prev = tokens.back();
  switch (prev.kind) {
    case TokenKind::kIdentifier:
    case TokenKind::kNumber:
    case TokenKind::kString:
    case TokenKind::kTemplate:
    case TokenKind::kRegex:
      return false;
    case TokenKind::kKeyword:
      return prev.text != "true" && prev.text != "false" && prev.text != "null" &&
             prev.text != "super" && prev.text != "undefined";
    case TokenKind::kPunct:
      return prev.text != ")" && prev.text != "]" && prev.text != "}" &&
             prev.text != "++" && prev.text != "--";
  }
  return true;
}

class Lexer {
 public:
  explicit Lexer(std::string_view source) : src_(source) {}

  std::vector<Token> Run() {
    std::vector<Token> out;
    while (pos_ < src_.size()) {
      const char c = src_[pos_];
      if (c == '\n') {
        ++line_;
        ++pos_;
        continue;
      }
      if (std::isspace(static_cast<unsigned char>(c))) {
        ++pos_;
        continue;
      }
      if (c == '/' && Peek(1) == '/') {
        SkipLineComment();
        continue;
      }
      if (c == '/' && Peek(1) == '*') {
        SkipBlockComment();
        continue;
      }
      if (c == '"' || c == '\'') {
        out.push_back(ReadString(c));
        continue;
      }
      if (c == '`') {
        out.push_back(ReadTemplate());
        continue;
      }
      if (std::isdigit(static_cast<unsigned char>(c)) ||
          (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
        out.push_back(ReadNumber());
        continue;
      }
      if (IsIdentStart(c)) {
        out.push_back(ReadWord());
        continue;
      }
      if (c == '/' && RegexAllowedAfter(out)) {
        if (auto regex = TryReadRegex()) {
          out.push_back(std::move(*regex));
          continue;
        }
      }
      out.push_back(ReadPunct());
    }
    return out;
  }

 private:
  char Peek(std::size_t ahead) const {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }

  void SkipLineComment() {
    while (pos_ < src_.size() && src_[pos_] != '\n') {
      ++pos_;
    }
  }

  void SkipBlockComment() {
    pos_ += 2;
    while (pos_ < src_.size()) {
      if (src_[pos_] == '*' && Peek(1) == '/') {
        pos_ += 2;
        return;
      }
      if (src_[pos_] == '\n') {
        ++line_;
      }
      ++pos_;
    }
  }

  Token ReadString(char quote) {
    Token token{TokenKind::kString, {}, line_, false};
    ++pos_;
    while (pos_ < src_.size()) {
      const char c = src_[pos_];
      if (c == '\\' && pos_ + 1 < src_.size()) {
        if (src_[pos_ + 1] == '\n') {
          ++line_;
        }
        token.text.push_back(src_[pos_ + 1]);
        pos_ += 2;
        continue;
      }
      if (c == quote) {
        ++pos_;
        break;
      }
      if (c == '\n') {
        break;  // unterminated
      }
      token.text.push_back(c);
      ++pos_;
    }
    return token;
  }

  Token ReadTemplate() {
    Token token{TokenKind::kTemplate, {}, line_, false};
    ++pos_;
    while (pos_ < src_.size()) {
      const char c = src_[pos_];
      if (c == '\\' && pos_ + 1 < src_.size()) {
        token.text.append(src_.substr(pos_, 2));
        pos_ += 2;
        continue;
      }
      if (c == '`') {
        ++pos_;
        break;
      }
      if (c == '$' && Peek(1) == '{') {
        token.has_substitution = true;
        int depth = 0;
        while (pos_ < src_.size()) {
          const char s = src_[pos_];
          token.text.push_back(s);
          ++pos_;
          if (s == '\n') {
            ++line_;
          } else if (s == '{') {
            ++depth;
          } else if (s == '}' && --depth == 0) {
            break;
          }
        }
        continue;
      }
      if (c == '\n') {
        ++line_;
      }
      token.text.push_back(c);
      ++pos_;
    }
    return token;
  }

  Token ReadNumber() {
    const std::size_t start = pos_;
    while (pos_ < src_.size() &&
           (std::isalnum(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '.' ||
            src_[pos_] == '_')) {
      ++pos_;
    }
    return Token{TokenKind::kNumber, std::string(src_.substr(start, pos_ - start)), line_, false};
  }

  Token ReadWord() {
    const std::size_t start = pos_;
    while (pos_ < src_.size() && IsIdentPart(src_[pos_])) {
      ++pos_;
    }
    std::string word(src_.substr(start, pos_ - start));
    const TokenKind kind = IsKeyword(word) ? TokenKind::kKeyword : TokenKind::kIdentifier;
    return Token{kind, std::move(word), line_, false};
  }

  std::optional<Token> TryReadRegex() {
    std::size_t cursor = pos_ + 1;
    bool in_class = false;
    while (cursor < src_.size()) {
      const char c = src_[cursor];
      if (c == '\n') {
        return std::nullopt;
      }
      if (c == '\\') {
        cursor += 2;
        continue;
      }
      if (c == '[') {
        in_class = true;
      } else if (c == ']') {
        in_class = false;
      } else if (c == '/' && !in_class) {
        ++cursor;
        while (cursor < src_.size() && IsIdentPart(src_[cursor])) {
          ++cursor;
        }
        Token token{TokenKind::kRegex, std::string(src_.substr(pos_, cursor - pos_)), line_,
                    false};
        pos_ = cursor;
        return token;
      }
      ++cursor;
    }
    return std::nullopt;
  }

  Token ReadPunct() {
    const std::string_view rest = src_.substr(pos_);
    for (std::string_view p : kPunctuators) {
      if (rest.substr(0, p.size()) == p) {
        pos_ += p.size();
        return Token{TokenKind::kPunct, std::string(p), line_, false};
      }
    }
    ++pos_;
    return Token{TokenKind::kPunct, std::string(1, rest.front()), line_, false};
  }

  std::string_view src_;
  std::size_t pos_{0};
  int line_{1};
};

bool IsPunct(const Token& token, std::string_view text) {
  return token.kind == TokenKind::kPunct && token.text == text;
}

bool IsOpen(const Token& token) {
  return IsPunct(token, "(") || IsPunct(token, "[") || IsPunct(token, "{");
}

bool IsClose(const Token& token) {
  return IsPunct(token, ")") || IsPunct(token, "]") || IsPunct(token, "}");
}

bool IsMemberDot(const Token& token) { return IsPunct(token, ".") || IsPunct(token, "?."); }

// Reads `ident (('.' | '?.') ident)*` starting at |i|; returns one past the end.
std::size_t ReadDottedPath(const std::vector<Token>& tokens, std::size_t i, std::string& path) {
  path = tokens[i].text;
  std::size_t cursor = i + 1;
  while (cursor + 1 < tokens.size() && IsMemberDot(tokens[cursor]) &&
         tokens[cursor + 1].kind == TokenKind::kIdentifier) {
    path.push_back('.');
    path.append(tokens[cursor + 1].text);
    cursor += 2;
  }
  return cursor;
}

bool StartsPath(const std::vector<Token>& tokens, std::size_t i) {
  return tokens[i].kind == TokenKind::kIdentifier && (i == 0 || !IsMemberDot(tokens[i - 1]));
}

// Substitution bodies of a template literal: "a ${x} b ${y.z}" -> {"x", "y.z"}.
std::vector<std::string> SubstitutionBodies(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while ((pos = text.find("${", pos)) != std::string_view::npos) {
    int depth = 0;
    std::size_t cursor = pos + 1;
    for (; cursor < text.size(); ++cursor) {
      if (text[cursor] == '{') {
        ++depth;
      } else if (text[cursor] == '}' && --depth == 0) {
        break;
      }
    }
    out.emplace_back(text.substr(pos + 2, cursor > pos + 2 ? cursor - pos - 2 : 0));
    pos = cursor;
  }
  return out;
}

bool IsValueLike(const Token& token) {
  return token.kind == TokenKind::kIdentifier || token.kind == TokenKind::kNumber ||
         token.kind == TokenKind::kString || token.kind == TokenKind::kTemplate ||
         token.kind == TokenKind::kRegex || IsPunct(token, ")") || IsPunct(token, "]");
}

bool StartsStatement(const Token& token) {
  static constexpr std::array<std::string_view, 12> kStatementKeywords = {
      "const", "let", "var", "function", "class", "if", "for", "while", "return", "import",
      "export", "throw"};
  return token.kind == TokenKind::kKeyword &&
         std::find(kStatementKeywords.begin(), kStatementKeywords.end(), token.text) !=
             kStatementKeywords.end();
}

class Parser {
 public:
  explicit Parser(const std::vector<Token>& tokens) : tokens_(tokens) {}

  SyntaxTree Run() {
    SyntaxTree tree;
    for (std::size_t i = 0; i < tokens_.size(); ++i) {
      const Token& token = tokens_[i];
      if (token.kind == TokenKind::kKeyword) {
        OnKeyword(i, tree.metrics);
        continue;
      }
      if (token.kind == TokenKind::kPunct) {
        OnPunct(i, tree.metrics);
        continue;
      }
      if (StartsPath(tokens_, i)) {
        OnPath(i, tree);
      }
    }
    return tree;
  }

 private:
  enum class BlockKind { kPlain, kControl, kFunction };

  const Token* At(std::size_t i) const { return i < tokens_.size() ? &tokens_[i] : nullptr; }

  bool PunctAt(std::size_t i, std::string_view text) const {
    const Token* token = At(i);
    return token != nullptr && IsPunct(*token, text);
  }

  bool KeywordAt(std::size_t i, std::string_view text) const {
    const Token* token = At(i);
    return token != nullptr && token->kind == TokenKind::kKeyword && token->text == text;
  }

  std::size_t MatchClose(std::size_t open) const {
    int depth = 0;
    for (std::size_t i = open; i < tokens_.size(); ++i) {
      if (IsOpen(tokens_[i])) {
        ++depth;
      } else if (IsClose(tokens_[i]) && --depth == 0) {
        return i;
      }
    }
    return tokens_.size();
  }

  std::vector<Expression> SplitArguments(std::size_t open, std::size_t close) const {
    std::vector<Expression> args;
    Expression current;
    int depth = 0;
    for (std::size_t i = open + 1; i < close && i < tokens_.size(); ++i) {
      const Token& token = tokens_[i];
      if (depth == 0 && IsPunct(token, ",")) {
        if (!current.tokens.empty()) {
          args.push_back(std::move(current));
        }
        current = Expression{};
        continue;
      }
      if (IsOpen(token)) {
        ++depth;
      } else if (IsClose(token)) {
        --depth;
      }
      if (current.tokens.empty()) {
        current.line = token.line;
      }
      current.tokens.push_back(token);
    }
    if (!current.tokens.empty()) {
      args.push_back(std::move(current));
    }
    return args;
  }

  Expression ReadValue(std::size_t start) const {
    Expression value;
    value.line = start < tokens_.size() ? tokens_[start].line : 1;
    int depth = 0;
    for (std::size_t i = start; i < tokens_.size(); ++i) {
      const Token& token = tokens_[i];
      if (depth == 0) {
        if (IsPunct(token, ";") || IsPunct(token, ",") || IsClose(token)) {
          break;
        }
        if (!value.tokens.empty()) {
          const Token& prev = value.tokens.back();
          if (StartsStatement(token)) {
            break;
          }
          if (token.line > prev.line && IsValueLike(prev) &&
              token.kind == TokenKind::kIdentifier) {
            break;  // next statement without a semicolon
          }
        }
      }
      if (IsOpen(token)) {
        ++depth;
      } else if (IsClose(token)) {
        --depth;
      }
      value.tokens.push_back(token);
    }
    return value;
  }

  void OnKeyword(std::size_t i, StructureMetrics& metrics) {
    const std::string& word = tokens_[i].text;
    if (word == "if" || word == "for" || word == "while" || word == "catch" ||
        word == "switch" || word == "do") {
      if (word != "switch" && word != "do") {
        ++metrics.cyclomatic;
      }
      metrics.cognitive += 1 + control_depth_;
      pending_control_ = true;
    } else if (word == "else") {
      if (!KeywordAt(i + 1, "if")) {
        metrics.cognitive += 1;
        pending_control_ = true;
      }
    } else if (word == "case") {
      ++metrics.cyclomatic;
    } else if (word == "function") {
      ++metrics.functions;
      pending_function_ = true;
    } else if (word == "class") {
      ++metrics.classes;
    }
  }

  void OnPunct(std::size_t i, StructureMetrics& metrics) {
    const std::string& text = tokens_[i].text;
    if (text == "&&" || text == "||" || text == "??") {
      ++metrics.cyclomatic;
      ++metrics.cognitive;
    } else if (text == "?") {
      ++metrics.cyclomatic;
      metrics.cognitive += 1 + control_depth_;
    } else if (text == "=>") {
      ++metrics.functions;
      pending_function_ = PunctAt(i + 1, "{");
    } else if (text == ";") {
      pending_control_ = false;
    } else if (text == "{") {
      BlockKind kind = BlockKind::kPlain;
      if (pending_control_) {
        kind = BlockKind::kControl;
        ++control_depth_;
        metrics.max_nesting = std::max(metrics.max_nesting, control_depth_);
      } else if (pending_function_) {
        kind = BlockKind::kFunction;
      }
      pending_control_ = false;
      pending_function_ = false;
      blocks_.push_back(kind);
    } else if (text == "}") {
      if (!blocks_.empty()) {
        if (blocks_.back() == BlockKind::kControl) {
          --control_depth_;
        }
        blocks_.pop_back();
      }
    }
  }

  void OnPath(std::size_t i, SyntaxTree& tree) {
    std::string path;
    const std::size_t end = ReadDottedPath(tokens_, i, path);
    const int line = tokens_[i].line;
    if (path.find('.') != std::string::npos) {
      tree.nodes.emplace_back(MemberNode{path, line});
    }
    if (PunctAt(end, "(")) {
      if (i > 0 && KeywordAt(i - 1, "function")) {
        return;
      }
      const std::size_t close = MatchClose(end);
      if (path.find('.') == std::string::npos && PunctAt(close + 1, "{")) {
        return;  // method definition
      }
      auto args = SplitArguments(end, close);
      if (i > 0 && KeywordAt(i - 1, "new")) {
        tree.nodes.emplace_back(NewNode{path, std::move(args), line});
      } else {
        tree.nodes.emplace_back(CallNode{path, std::move(args), line});
      }
      return;
    }
    if (PunctAt(end, "=") || PunctAt(end, "+=") || PunctAt(end, "||=") || PunctAt(end, "??=")) {
      AssignmentNode node;
      node.target = path;
      node.line = line;
      node.declaration = i > 0 && (KeywordAt(i - 1, "const") || KeywordAt(i - 1, "let") ||
                                   KeywordAt(i - 1, "var"));
      node.value = ReadValue(end + 1);
      tree.nodes.emplace_back(std::move(node));
    }
  }

  const std::vector<Token>& tokens_;
  std::vector<BlockKind> blocks_;
  int control_depth_{0};
  bool pending_control_{false};
  bool pending_function_{false};
};

} // namespace

std::vector<Token> Tokenize(std::string_view source) {
  if (source.substr(0, 2) == "#!") {
    const auto eol = source.find('\n');
    source = eol == std::string_view::npos ? std::string_view{} : source.substr(eol);
  }
  return Lexer(source).Run();
}

SyntaxTree ParseSyntaxTree(const std::vector<Token>& tokens) { return Parser(tokens).Run(); }

bool Expression::IsLiteral() const {
  if (tokens.empty()) {
    return false;
  }
  bool expect_operand = true;
  for (const auto& token : tokens) {
    if (expect_operand) {
      const bool literal =
          token.kind == TokenKind::kString || token.kind == TokenKind::kNumber ||
          (token.kind == TokenKind::kTemplate && !token.has_substitution) ||
          (token.kind == TokenKind::kKeyword &&
           (token.text == "true" || token.text == "false" || token.text == "null"));
      if (!literal) {
        return false;
      }
    } else if (!IsPunct(token, "+")) {
      return false;
    }
    expect_operand = !expect_operand;
  }
  return !expect_operand;
}

bool Expression::HasTemplateSubstitution() const {
  return std::any_of(tokens.begin(), tokens.end(), [](const Token& token) {
    return token.kind == TokenKind::kTemplate && token.has_substitution;
  });
}

bool Expression::HasConcatenation() const {
  const bool has_plus = std::any_of(tokens.begin(), tokens.end(),
                                    [](const Token& token) { return IsPunct(token, "+"); });
  return has_plus && !IsLiteral();
}

std::vector<std::string> Expression::References() const {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (tokens[i].kind == TokenKind::kTemplate && tokens[i].has_substitution) {
      for (const auto& body : SubstitutionBodies(tokens[i].text)) {
        Expression inner;
        inner.tokens = Tokenize(body);
        auto nested = inner.References();
        out.insert(out.end(), nested.begin(), nested.end());
      }
      continue;
    }
    if (StartsPath(tokens, i)) {
      std::string path;
      ReadDottedPath(tokens, i, path);
      out.push_back(std::move(path));
    }
  }
  return out;
}

std::string Expression::Text() const {
  std::string out;
  bool prev_word = false;
  for (const auto& token : tokens) {
    const bool word = token.kind == TokenKind::kIdentifier || token.kind == TokenKind::kKeyword ||
                      token.kind == TokenKind::kNumber;
    if (word && prev_word) {
      out.push_back(' ');
    }
    switch (token.kind) {
      case TokenKind::kString:
        out.push_back('\'');
        out.append(token.text);
        out.push_back('\'');
        break;
      case TokenKind::kTemplate:
        out.push_back('`');
        out.append(token.text);
        out.push_back('`');
        break;
      default:
        out.append(token.text);
        break;
    }
    prev_word = word;
  }
  return out;
}

std::string_view LastSegment(std::string_view path) noexcept {
  const auto dot = path.rfind('.');
  return dot == std::string_view::npos ? path : path.substr(dot + 1);
}

std::string_view ObjectPath(std::string_view path) noexcept {
  const auto dot = path.rfind('.');
  return dot == std::string_view::npos ? std::string_view{} : path.substr(0, dot);
}

} // namespace pw::analysis
