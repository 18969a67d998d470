#include "pw/analysis/rules.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <type_traits>

namespace pw::analysis {

namespace {

constexpr std::array<std::string_view, 6> kCommandMethods = {
    "exec", "execSync", "execFile", "execFileSync", "spawn", "spawnSync"};

constexpr std::array<std::string_view, 5> kChildProcessObjects = {
    "child_process", "childProcess", "cp", "proc", "shell"};

constexpr std::array<std::string_view, 4> kQueryMethods = {"query", "execute", "raw", "prepare"};

constexpr std::array<std::string_view, 5> kFileWriteMethods = {
    "writeFile", "writeFileSync", "appendFile", "appendFileSync", "createWriteStream"};

constexpr std::array<std::string_view, 18> kFsMethods = {
    "readFile",       "readFileSync",  "writeFile",  "writeFileSync", "appendFile",
    "appendFileSync", "createReadStream", "createWriteStream", "unlink", "unlinkSync",
    "readdir",        "readdirSync",   "rm",         "rmSync",        "open",
    "openSync",       "stat",          "statSync"};

constexpr std::array<std::string_view, 4> kFsObjects = {"fs", "fs.promises", "fsp", "fse"};

constexpr std::array<std::string_view, 9> kInputRoots = {
    "req", "request", "params", "query", "body", "input", "userInput", "process.argv", "ctx"};

template <std::size_t N>
bool Contains(const std::array<std::string_view, N>& values, std::string_view needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ReferencesInput(const Expression& expr) {
  for (const auto& ref : expr.References()) {
    for (std::string_view root : kInputRoots) {
      if (ref == root || (ref.size() > root.size() && ref.compare(0, root.size(), root) == 0 &&
                          ref[root.size()] == '.')) {
        return true;
      }
    }
  }
  return false;
}

bool IsDynamic(const Expression& expr) {
  return expr.HasTemplateSubstitution() || expr.HasConcatenation();
}

SecurityVulnerability Finding(VulnerabilityType type, Severity severity, std::string title,
                              std::string description, std::string cwe, std::string remediation,
                              int line) {
  SecurityVulnerability v;
  v.type = type;
  v.severity = severity;
  v.title = std::move(title);
  v.description = std::move(description);
  v.cwe = std::move(cwe);
  v.remediation = std::move(remediation);
  v.line = line;
  return v;
}

bool IsCommentLine(std::string_view line) {
  const auto first = line.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return true;
  }
  const std::string_view rest = line.substr(first);
  return rest.substr(0, 2) == "//" || rest.substr(0, 2) == "/*" || rest.front() == '*';
}

PatternRule MakePattern(const char* expr, VulnerabilityType type, Severity severity,
                        const char* cwe, const char* title, const char* remediation) {
  return PatternRule{std::regex(expr, std::regex::ECMAScript | std::regex::icase |
                                          std::regex::optimize),
                     type, severity, cwe, title, remediation};
}

} // namespace

const std::vector<PatternRule>& DefaultPatternRules() {
  static const std::vector<PatternRule> rules = {
      MakePattern(R"((password|passwd|pwd|secret|api[_-]?key|access[_-]?token|auth[_-]?token|private[_-]?key)["']?\s*[:=]\s*["'][^"'\s]{4,}["'])",
                  VulnerabilityType::kHardcodedCredentials, Severity::kCritical, "CWE-798",
                  "Hard-coded credential",
                  "Load credentials from the host's secret store or environment at runtime."),
      MakePattern(R"(\bAKIA[0-9A-Z]{16}\b)", VulnerabilityType::kHardcodedCredentials,
                  Severity::kCritical, "CWE-798", "Embedded cloud access key",
                  "Revoke the key and load credentials at runtime."),
      MakePattern(R"((^|[^.\w])eval\s*\()", VulnerabilityType::kCodeInjection,
                  Severity::kCritical, "CWE-94", "Dynamic code evaluation",
                  "Replace eval with explicit parsing (JSON.parse) or a dispatch table."),
      MakePattern(R"(\bnew\s+Function\s*\()", VulnerabilityType::kCodeInjection, Severity::kHigh,
                  "CWE-94", "Function constructor",
                  "Avoid constructing functions from strings."),
      MakePattern(R"(\b(unserialize|deserialize)\s*\(|\byaml\.load\s*\(|\bpickle\.loads?\s*\()",
                  VulnerabilityType::kInsecureDeserialization, Severity::kHigh, "CWE-502",
                  "Unsafe deserialization",
                  "Deserialize only with schema-validating, data-only parsers."),
      MakePattern(R"(http://(?!localhost|127\.0\.0\.1|0\.0\.0\.0)[a-z0-9])",
                  VulnerabilityType::kInsecureCommunication, Severity::kLow, "CWE-319",
                  "Plain-text HTTP endpoint", "Use https:// endpoints."),
      MakePattern(R"(console\.(log|info|debug|warn)\s*\(.*(password|secret|token|api_?key))",
                  VulnerabilityType::kInformationDisclosure, Severity::kMedium, "CWE-532",
                  "Secret written to log output",
                  "Remove secrets from log statements or redact them."),
  };
  return rules;
}

std::vector<SecurityVulnerability> RunPatternRules(std::string_view source,
                                                   const std::vector<PatternRule>& rules) {
  std::vector<SecurityVulnerability> out;
  std::istringstream stream{std::string(source)};
  std::string line;
  int line_no = 0;
  while (std::getline(stream, line)) {
    ++line_no;
    if (IsCommentLine(line)) {
      continue;
    }
    for (const auto& rule : rules) {
      if (std::regex_search(line, rule.pattern)) {
        out.push_back(Finding(rule.type, rule.severity, rule.title,
                              rule.title + " matched in source", rule.cwe, rule.remediation,
                              line_no));
      }
    }
  }
  return out;
}

bool IsCommandCallee(std::string_view callee) {
  if (!Contains(kCommandMethods, LastSegment(callee))) {
    return false;
  }
  const std::string_view object = ObjectPath(callee);
  return object.empty() || Contains(kChildProcessObjects, object);
}

bool IsQueryCallee(std::string_view callee) {
  return !ObjectPath(callee).empty() && Contains(kQueryMethods, LastSegment(callee)) &&
         ObjectPath(callee) != "document";
}

SinkKind ClassifySink(std::string_view callee) {
  if (IsCommandCallee(callee)) {
    return SinkKind::kCommand;
  }
  if (IsQueryCallee(callee)) {
    return SinkKind::kQuery;
  }
  if (Contains(kFileWriteMethods, LastSegment(callee))) {
    return SinkKind::kFileWrite;
  }
  return SinkKind::kNone;
}

void SqlInjectionRule::Inspect(const CallNode& node,
                               std::vector<SecurityVulnerability>& out) const {
  if (!IsQueryCallee(node.callee) || node.arguments.empty()) {
    return;
  }
  if (IsDynamic(node.arguments.front())) {
    out.push_back(Finding(VulnerabilityType::kSqlInjection, Severity::kHigh,
                          "SQL query built from dynamic text",
                          "Query passed to " + node.callee +
                              " is assembled by concatenation or template substitution",
                          "CWE-89", "Use parameterized queries with bound values.", node.line));
  }
}

void DomAssignmentXssRule::Inspect(const AssignmentNode& node,
                                   std::vector<SecurityVulnerability>& out) const {
  const std::string_view property = LastSegment(node.target);
  if (property != "innerHTML" && property != "outerHTML") {
    return;
  }
  if (!node.value.IsLiteral()) {
    out.push_back(Finding(VulnerabilityType::kCrossSiteScripting, Severity::kHigh,
                          "Unescaped HTML assignment",
                          "Non-literal value assigned to " + node.target, "CWE-79",
                          "Assign textContent or sanitize markup before insertion.", node.line));
  }
}

void DomWriteXssRule::Inspect(const CallNode& node,
                              std::vector<SecurityVulnerability>& out) const {
  const std::string_view method = LastSegment(node.callee);
  const Expression* markup = nullptr;
  if ((node.callee == "document.write" || node.callee == "document.writeln") &&
      !node.arguments.empty()) {
    markup = &node.arguments.front();
  } else if (method == "insertAdjacentHTML" && node.arguments.size() >= 2) {
    markup = &node.arguments[1];
  }
  if (markup != nullptr && !markup->IsLiteral()) {
    out.push_back(Finding(VulnerabilityType::kCrossSiteScripting, Severity::kHigh,
                          "Dynamic markup written to the document",
                          "Non-literal markup passed to " + node.callee, "CWE-79",
                          "Build DOM nodes explicitly or sanitize markup.", node.line));
  }
}

void PathTraversalRule::Inspect(const CallNode& node,
                                std::vector<SecurityVulnerability>& out) const {
  if (!Contains(kFsObjects, ObjectPath(node.callee)) ||
      !Contains(kFsMethods, LastSegment(node.callee)) || node.arguments.empty()) {
    return;
  }
  const Expression& target = node.arguments.front();
  const bool dot_dot = target.Text().find("../") != std::string::npos;
  if (dot_dot || IsDynamic(target) || ReferencesInput(target)) {
    out.push_back(Finding(VulnerabilityType::kPathTraversal, Severity::kHigh,
                          "File path derived from variable input",
                          "Path argument of " + node.callee + " is not a fixed location",
                          "CWE-22",
                          "Resolve paths against a fixed base and reject '..' components.",
                          node.line));
  }
}

void CommandInjectionRule::Inspect(const CallNode& node,
                                   std::vector<SecurityVulnerability>& out) const {
  if (!IsCommandCallee(node.callee) || node.arguments.empty()) {
    return;
  }
  if (!node.arguments.front().IsLiteral()) {
    out.push_back(Finding(VulnerabilityType::kCommandInjection, Severity::kCritical,
                          "Shell command built from variable input",
                          "Non-literal command passed to " + node.callee, "CWE-78",
                          "Use execFile with a fixed program and an argument array.",
                          node.line));
  }
}

void WeakCryptoRule::Inspect(const CallNode& node,
                             std::vector<SecurityVulnerability>& out) const {
  const std::string_view method = LastSegment(node.callee);
  if (method == "createCipher") {
    out.push_back(Finding(VulnerabilityType::kWeakCryptography, Severity::kMedium,
                          "Deprecated cipher construction",
                          "createCipher derives keys without salt or IV", "CWE-327",
                          "Use createCipheriv with an AEAD mode such as aes-256-gcm.",
                          node.line));
    return;
  }
  if ((method != "createHash" && method != "createHmac" && method != "createCipheriv") ||
      node.arguments.empty()) {
    return;
  }
  const auto& first = node.arguments.front();
  if (first.tokens.size() != 1 || first.tokens.front().kind != TokenKind::kString) {
    return;
  }
  const std::string algorithm = Lower(first.tokens.front().text);
  const bool weak = algorithm == "md5" || algorithm == "md4" || algorithm == "sha1" ||
                    algorithm.rfind("des", 0) == 0 || algorithm.rfind("rc4", 0) == 0;
  if (weak) {
    out.push_back(Finding(VulnerabilityType::kWeakCryptography, Severity::kMedium,
                          "Weak cryptographic algorithm",
                          "Algorithm '" + algorithm + "' used with " + node.callee, "CWE-327",
                          "Use SHA-256 or stronger digests and AES-GCM.", node.line));
  }
}

void InsecureRandomRule::Inspect(const MemberNode& node,
                                 std::vector<SecurityVulnerability>& out) const {
  if (node.path == "Math.random") {
    out.push_back(Finding(VulnerabilityType::kInsecureRandomness, Severity::kLow,
                          "Non-cryptographic random source",
                          "Math.random is predictable", "CWE-338",
                          "Use crypto.randomBytes or crypto.getRandomValues for security values.",
                          node.line));
  }
}

const std::vector<SyntaxRule>& DefaultSyntaxRules() {
  static const std::vector<SyntaxRule> rules = {
      SqlInjectionRule{},  DomAssignmentXssRule{}, DomWriteXssRule{}, PathTraversalRule{},
      CommandInjectionRule{}, WeakCryptoRule{},     InsecureRandomRule{}};
  return rules;
}

std::vector<SecurityVulnerability> RunSyntaxRules(const SyntaxTree& tree,
                                                  const std::vector<SyntaxRule>& rules) {
  std::vector<SecurityVulnerability> out;
  for (const auto& node : tree.nodes) {
    for (const auto& rule : rules) {
      std::visit(
          [&out](const auto& r, const auto& n) {
            using RuleT = std::decay_t<decltype(r)>;
            using NodeT = std::decay_t<decltype(n)>;
            if constexpr (InspectsNode<RuleT, NodeT>) {
              r.Inspect(n, out);
            }
          },
          rule, node);
    }
  }
  return out;
}

} // namespace pw::analysis
