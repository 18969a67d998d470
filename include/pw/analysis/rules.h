#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "pw/analysis/code_analyzer.h"
#include "pw/analysis/syntax.h"

namespace pw::analysis {

// Line-oriented regular-expression rule.
struct PatternRule {
  std::regex pattern;
  VulnerabilityType type;
  Severity severity;
  std::string cwe;
  std::string title;
  std::string remediation;
};

const std::vector<PatternRule>& DefaultPatternRules();

// Findings carry line, type, severity, texts; the caller fills id, file,
// evidence and pass.
std::vector<SecurityVulnerability> RunPatternRules(std::string_view source,
                                                   const std::vector<PatternRule>& rules);

// Syntax rules. Each one inspects a single node kind; the registry dispatches
// a node only to the rules with a matching Inspect overload.
struct SqlInjectionRule {
  void Inspect(const CallNode& node, std::vector<SecurityVulnerability>& out) const;
};

struct DomAssignmentXssRule {
  void Inspect(const AssignmentNode& node, std::vector<SecurityVulnerability>& out) const;
};

struct DomWriteXssRule {
  void Inspect(const CallNode& node, std::vector<SecurityVulnerability>& out) const;
};

struct PathTraversalRule {
  void Inspect(const CallNode& node, std::vector<SecurityVulnerability>& out) const;
};

struct CommandInjectionRule {
  void Inspect(const CallNode& node, std::vector<SecurityVulnerability>& out) const;
};

struct WeakCryptoRule {
  void Inspect(const CallNode& node, std::vector<SecurityVulnerability>& out) const;
};

struct InsecureRandomRule {
  void Inspect(const MemberNode& node, std::vector<SecurityVulnerability>& out) const;
};

using SyntaxRule = std::variant<SqlInjectionRule, DomAssignmentXssRule, DomWriteXssRule,
                                PathTraversalRule, CommandInjectionRule, WeakCryptoRule,
                                InsecureRandomRule>;

template <typename Rule, typename Node>
concept InspectsNode = requires(const Rule& rule, const Node& node,
                                std::vector<SecurityVulnerability>& out) {
  rule.Inspect(node, out);
};

const std::vector<SyntaxRule>& DefaultSyntaxRules();

std::vector<SecurityVulnerability> RunSyntaxRules(const SyntaxTree& tree,
                                                  const std::vector<SyntaxRule>& rules);

// Shared sink classification for the syntax rules and the flow passes.
enum class SinkKind { kNone, kFileWrite, kCommand, kQuery };

SinkKind ClassifySink(std::string_view callee);
bool IsCommandCallee(std::string_view callee);
bool IsQueryCallee(std::string_view callee);

} // namespace pw::analysis
