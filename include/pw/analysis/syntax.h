#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pw::analysis {

enum class TokenKind : std::uint8_t {
  kIdentifier,
  kKeyword,
  kString,
  kTemplate,
  kNumber,
  kRegex,
  kPunct
};

struct Token {
  TokenKind kind{TokenKind::kPunct};
  std::string text;
  int line{1};
  // Template literal containing at least one ${...} substitution.
  bool has_substitution{false};
};

// Lexes JavaScript/TypeScript source. Comments are dropped; unterminated
// strings and comments end at end of input rather than failing.
std::vector<Token> Tokenize(std::string_view source);

// Token-range summary of an expression (call argument, assigned value).
struct Expression {
  std::vector<Token> tokens;
  int line{1};

  bool IsLiteral() const;
  bool HasTemplateSubstitution() const;
  // '+' joining at least one non-literal operand.
  bool HasConcatenation() const;
  // Dotted identifier paths referenced by the expression, e.g. "req.body.name".
  std::vector<std::string> References() const;
  // Source-like rendering used for evidence and substring checks.
  std::string Text() const;
};

struct CallNode {
  std::string callee;
  std::vector<Expression> arguments;
  int line{1};
};

struct NewNode {
  std::string callee;
  std::vector<Expression> arguments;
  int line{1};
};

struct AssignmentNode {
  std::string target;
  Expression value;
  bool declaration{false};
  int line{1};
};

struct MemberNode {
  std::string path;
  int line{1};
};

using SyntaxNode = std::variant<CallNode, NewNode, AssignmentNode, MemberNode>;

struct StructureMetrics {
  int cyclomatic{1};
  int cognitive{0};
  int max_nesting{0};
  int functions{0};
  int classes{0};
};

// Shallow syntax tree: the call, construction, assignment and member-access
// nodes of one file, in source order.
struct SyntaxTree {
  std::vector<SyntaxNode> nodes;
  StructureMetrics metrics;
};

SyntaxTree ParseSyntaxTree(const std::vector<Token>& tokens);

// Last segment of a dotted path ("fs.promises.readFile" -> "readFile").
std::string_view LastSegment(std::string_view path) noexcept;
// Everything before the last segment, empty for bare names.
std::string_view ObjectPath(std::string_view path) noexcept;

} // namespace pw::analysis
