#include "pw/analysis/code_analyzer.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>
#include <tuple>

#include <nlohmann/json.hpp>

#include "pw/analysis/flow.h"
#include "pw/analysis/rules.h"
#include "pw/analysis/syntax.h"
#include "pw/crypto/digest.h"
#include "pw/crypto/sha256.h"
#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"

namespace pw::analysis {

namespace {

using Steady = std::chrono::steady_clock;

constexpr std::array<std::string_view, 7> kSourceExtensions = {".js",  ".jsx", ".ts", ".tsx",
                                                               ".mjs", ".cjs", ".json"};

constexpr std::array<std::string_view, 10> kExcludedDirectories = {
    "node_modules", ".git", ".svn", ".hg", ".vscode", "dist", "build", "coverage", ".next", ".nuxt"};

constexpr std::size_t kMaxEvidence = 120;

constexpr int kCyclomaticPenaltyThreshold = 100;
constexpr int kNestingPenaltyThreshold = 5;
constexpr int kComplexityRecommendationThreshold = 50;

struct Advisory {
  std::string_view package;
  std::optional<std::array<int, 3>> fixed;  // nullopt: every version affected
  std::optional<std::array<int, 3>> exact;
  Severity severity;
  std::string_view reference;
  std::string_view summary;
};

using Version = std::array<int, 3>;

const std::array<Advisory, 10> kAdvisories = {{
    {"lodash", Version{4, 17, 21}, std::nullopt, Severity::kHigh, "CVE-2021-23337",
     "Command injection through template"},
    {"minimist", Version{1, 2, 6}, std::nullopt, Severity::kHigh, "CVE-2021-44906",
     "Prototype pollution"},
    {"event-stream", std::nullopt, Version{3, 3, 6}, Severity::kCritical, "GHSA-mh6f-8j2x-4483",
     "Release carried malicious flatmap-stream payload"},
    {"node-serialize", std::nullopt, std::nullopt, Severity::kCritical, "CVE-2017-5941",
     "Remote code execution through unserialize"},
    {"axios", Version{0, 21, 1}, std::nullopt, Severity::kMedium, "CVE-2020-28168",
     "Server-side request forgery via redirects"},
    {"jsonwebtoken", Version{9, 0, 0}, std::nullopt, Severity::kHigh, "CVE-2022-23529",
     "Unsafe key handling in verify"},
    {"handlebars", Version{4, 7, 7}, std::nullopt, Severity::kHigh, "CVE-2021-23369",
     "Remote code execution when compiling untrusted templates"},
    {"moment", Version{2, 29, 4}, std::nullopt, Severity::kHigh, "CVE-2022-31129",
     "Regular expression denial of service in RFC 2822 parsing"},
    {"node-fetch", Version{2, 6, 7}, std::nullopt, Severity::kMedium, "CVE-2022-0235",
     "Cookie leak on cross-origin redirect"},
    {"serialize-javascript", Version{3, 1, 0}, std::nullopt, Severity::kHigh, "CVE-2020-7660",
     "Remote code execution through crafted objects"},
}};

constexpr std::array<std::string_view, 8> kSecretKeySuffixes = {
    "password", "passwd", "secret", "apikey", "token", "privatekey", "accesskey", "clientsecret"};

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

std::string Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(first, last - first + 1));
}

std::vector<std::string> SplitLines(std::string_view content) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= content.size()) {
    const auto eol = content.find('\n', start);
    if (eol == std::string_view::npos) {
      if (start < content.size()) {
        lines.emplace_back(content.substr(start));
      }
      break;
    }
    lines.emplace_back(content.substr(start, eol - start));
    start = eol + 1;
  }
  return lines;
}

bool IsSourceFile(const std::filesystem::path& path) {
  const std::string ext = Lower(path.extension().string());
  return std::find(kSourceExtensions.begin(), kSourceExtensions.end(), ext) !=
         kSourceExtensions.end();
}

bool IsExcludedDirectory(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  return std::find(kExcludedDirectories.begin(), kExcludedDirectories.end(), name) !=
         kExcludedDirectories.end();
}

bool IsTestFile(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  return name.find(".test.") != std::string::npos || name.find(".spec.") != std::string::npos;
}

std::optional<Version> ParseVersion(std::string_view spec) {
  const auto start = spec.find_first_of("0123456789");
  if (start == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view prefix = spec.substr(0, start);
  if (prefix.find_first_not_of("^~>=<v ") != std::string_view::npos) {
    return std::nullopt;  // git urls, file: and tag specifiers
  }
  Version version{0, 0, 0};
  std::size_t part = 0;
  std::size_t pos = start;
  while (part < version.size() && pos < spec.size()) {
    int value = 0;
    bool digits = false;
    while (pos < spec.size() && std::isdigit(static_cast<unsigned char>(spec[pos]))) {
      value = value * 10 + (spec[pos] - '0');
      digits = true;
      ++pos;
    }
    if (!digits) {
      break;
    }
    version[part++] = value;
    if (pos >= spec.size() || spec[pos] != '.') {
      break;
    }
    ++pos;
  }
  return version;
}

class Budget {
 public:
  Budget(Steady::time_point started, std::chrono::milliseconds limit)
      : started_(started), limit_(limit) {}

  bool Exceeded() const { return Steady::now() - started_ > limit_; }

 private:
  Steady::time_point started_;
  std::chrono::milliseconds limit_;
};

class FileAnalysis {
 public:
  FileAnalysis(std::string relative, std::string content)
      : relative_(std::move(relative)), content_(std::move(content)),
        lines_(SplitLines(content_)) {}

  void RunSourcePasses(QualityMetrics& metrics) {
    const auto tokens = Tokenize(content_);
    const SyntaxTree tree = ParseSyntaxTree(tokens);
    metrics.cyclomatic_complexity += tree.metrics.cyclomatic;
    metrics.cognitive_complexity += tree.metrics.cognitive;
    metrics.max_nesting_depth = std::max(metrics.max_nesting_depth, tree.metrics.max_nesting);
    metrics.function_count += tree.metrics.functions;
    metrics.class_count += tree.metrics.classes;

    Append(RunPatternRules(content_, DefaultPatternRules()), DetectionPass::kPattern);
    Append(RunSyntaxRules(tree, DefaultSyntaxRules()), DetectionPass::kSyntax);
    Append(RunDataFlowPass(tree), DetectionPass::kDataFlow);
    Append(RunTaintPass(tree), DetectionPass::kTaint);
  }

  // Returns false when the document is not valid JSON.
  bool RunConfigPasses(bool package_manifest) {
    auto document = nlohmann::json::parse(content_, nullptr, false);
    if (document.is_discarded()) {
      return false;
    }
    std::vector<SecurityVulnerability> found;
    ScanConfigNode(document, "", package_manifest, found);
    Append(std::move(found), DetectionPass::kConfig);
    if (package_manifest && document.is_object()) {
      std::vector<SecurityVulnerability> deps;
      ScanDependencies(document, deps);
      Append(std::move(deps), DetectionPass::kDependency);
    }
    return true;
  }

  std::size_t LinesOfCode() const {
    return static_cast<std::size_t>(std::count_if(lines_.begin(), lines_.end(), [](const auto& l) {
      return !Trim(l).empty();
    }));
  }

  std::vector<SecurityVulnerability>& findings() { return findings_; }

 private:
  void Append(std::vector<SecurityVulnerability> found, DetectionPass pass) {
    for (auto& finding : found) {
      finding.file = relative_;
      finding.pass = pass;
      if (finding.line < 1) {
        finding.line = 1;
      }
      if (finding.evidence.empty() && static_cast<std::size_t>(finding.line) <= lines_.size()) {
        finding.evidence = Trim(lines_[static_cast<std::size_t>(finding.line) - 1]);
        if (finding.evidence.size() > kMaxEvidence) {
          finding.evidence.resize(kMaxEvidence);
        }
      }
      finding.id = "PW-" + crypto::SHA256_Hex(relative_ + ":" + std::to_string(finding.line) +
                                              ":" + std::string(ToString(finding.type)))
                               .substr(0, 12);
      findings_.push_back(std::move(finding));
    }
  }

  int LineOfKey(std::string_view key) const {
    const std::string quoted = "\"" + std::string(key) + "\"";
    for (std::size_t i = 0; i < lines_.size(); ++i) {
      if (lines_[i].find(quoted) != std::string::npos) {
        return static_cast<int>(i + 1);
      }
    }
    return 1;
  }

  static bool IsPlaceholder(std::string_view value) {
    return value.empty() || value.rfind("${", 0) == 0 || value.front() == '<' ||
           value.rfind("env:", 0) == 0 || value.rfind("process.env", 0) == 0;
  }

  static std::string NormalizedKey(std::string_view key) {
    std::string out;
    for (char c : key) {
      if (c != '_' && c != '-') {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
      }
    }
    return out;
  }

  void ScanConfigNode(const nlohmann::json& node, const std::string& parent, bool package_manifest,
                      std::vector<SecurityVulnerability>& out) const {
    if (node.is_array()) {
      for (const auto& item : node) {
        ScanConfigNode(item, parent, package_manifest, out);
      }
      return;
    }
    if (!node.is_object()) {
      return;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
      const std::string& key = it.key();
      if (package_manifest && parent.empty() &&
          (key == "dependencies" || key == "devDependencies" || key == "optionalDependencies" ||
           key == "peerDependencies" || key == "scripts")) {
        continue;
      }
      const std::string normalized = NormalizedKey(key);
      const auto& value = it.value();
      if (value.is_string()) {
        const auto text = value.get<std::string>();
        const bool secret_name = std::any_of(
            kSecretKeySuffixes.begin(), kSecretKeySuffixes.end(),
            [&normalized](std::string_view suffix) { return EndsWith(normalized, suffix); });
        if (secret_name && !IsPlaceholder(text)) {
          SecurityVulnerability v;
          v.type = VulnerabilityType::kHardcodedCredentials;
          v.severity = Severity::kHigh;
          v.title = "Secret stored in configuration";
          v.description = "Key '" + key + "' holds a literal secret value";
          v.cwe = "CWE-798";
          v.remediation = "Reference secrets through environment or a secret store.";
          v.line = LineOfKey(key);
          out.push_back(std::move(v));
        }
      } else if (value.is_boolean() && !value.get<bool>()) {
        const std::string parent_norm = NormalizedKey(parent);
        const bool tls_flag = normalized == "rejectunauthorized" || normalized == "ssl" ||
                              normalized == "tls" || normalized == "https" ||
                              normalized == "secure" || normalized == "verifyssl" ||
                              (normalized == "enabled" && (parent_norm == "ssl" || parent_norm == "tls"));
        if (tls_flag) {
          SecurityVulnerability v;
          v.type = VulnerabilityType::kInsecureConfiguration;
          v.severity = Severity::kHigh;
          v.title = "Transport security disabled";
          v.description = "Configuration key '" + key + "' disables TLS protection";
          v.cwe = "CWE-319";
          v.remediation = "Keep TLS enabled and certificate verification on.";
          v.line = LineOfKey(key);
          out.push_back(std::move(v));
        }
      } else {
        ScanConfigNode(value, key, package_manifest, out);
      }
    }
  }

  void ScanDependencies(const nlohmann::json& manifest,
                        std::vector<SecurityVulnerability>& out) const {
    for (const char* section : {"dependencies", "optionalDependencies"}) {
      auto it = manifest.find(section);
      if (it == manifest.end() || !it->is_object()) {
        continue;
      }
      for (auto dep = it->begin(); dep != it->end(); ++dep) {
        if (!dep.value().is_string()) {
          continue;
        }
        const std::string& name = dep.key();
        const auto spec = Trim(dep.value().get<std::string>());
        if (spec.empty() || spec == "*" || spec == "latest" || spec == "x") {
          SecurityVulnerability v;
          v.type = VulnerabilityType::kVulnerableDependency;
          v.severity = Severity::kLow;
          v.title = "Unpinned dependency version";
          v.description = "Dependency '" + name + "' accepts any version ('" + spec + "')";
          v.cwe = "CWE-1104";
          v.remediation = "Pin dependencies to reviewed version ranges.";
          v.line = LineOfKey(name);
          out.push_back(std::move(v));
          continue;
        }
        const auto version = ParseVersion(spec);
        for (const auto& advisory : kAdvisories) {
          if (advisory.package != name) {
            continue;
          }
          bool affected = !advisory.fixed && !advisory.exact;
          if (version && advisory.fixed) {
            affected = *version < *advisory.fixed;
          }
          if (version && advisory.exact) {
            affected = *version == *advisory.exact;
          }
          if (!affected) {
            continue;
          }
          SecurityVulnerability v;
          v.type = VulnerabilityType::kVulnerableDependency;
          v.severity = advisory.severity;
          v.title = "Dependency with known vulnerability";
          v.description = name + "@" + spec + ": " + std::string(advisory.summary) + " (" +
                          std::string(advisory.reference) + ")";
          v.cwe = "CWE-1395";
          v.remediation = advisory.fixed ? "Upgrade " + name + " to a fixed release."
                                         : "Remove " + name + ".";
          v.line = LineOfKey(name);
          out.push_back(std::move(v));
        }
      }
    }
  }

  std::string relative_;
  std::string content_;
  std::vector<std::string> lines_;
  std::vector<SecurityVulnerability> findings_;
};

std::vector<SecurityVulnerability> Deduplicate(std::vector<SecurityVulnerability> findings) {
  std::map<std::tuple<std::string, int, VulnerabilityType>, SecurityVulnerability> unique;
  for (auto& finding : findings) {
    auto key = std::make_tuple(finding.file, finding.line, finding.type);
    auto it = unique.find(key);
    if (it == unique.end()) {
      unique.emplace(std::move(key), std::move(finding));
    } else if (finding.severity > it->second.severity) {
      it->second = std::move(finding);
    }
  }
  std::vector<SecurityVulnerability> out;
  out.reserve(unique.size());
  for (auto& [key, finding] : unique) {
    out.push_back(std::move(finding));
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.severity != b.severity) {
      return a.severity > b.severity;
    }
    if (a.file != b.file) {
      return a.file < b.file;
    }
    return a.line < b.line;
  });
  return out;
}

struct RecommendationClass {
  std::string_view id;
  std::string_view title;
  std::string_view description;
  std::vector<VulnerabilityType> types;
};

const std::vector<RecommendationClass>& RecommendationClasses() {
  static const std::vector<RecommendationClass> classes = {
      {"rec-input-validation", "Validate and sanitize untrusted input",
       "Route request data and network responses through validation before they reach queries, "
       "commands, file paths or markup.",
       {VulnerabilityType::kInjection, VulnerabilityType::kSqlInjection,
        VulnerabilityType::kCommandInjection, VulnerabilityType::kCodeInjection,
        VulnerabilityType::kCrossSiteScripting, VulnerabilityType::kPathTraversal}},
      {"rec-secret-management", "Move secrets out of the plugin",
       "Credentials embedded in code or configuration ship with every copy of the plugin.",
       {VulnerabilityType::kHardcodedCredentials}},
      {"rec-crypto-upgrade", "Upgrade cryptographic primitives",
       "Replace MD5/SHA-1, legacy ciphers and Math.random with modern algorithms and a CSPRNG.",
       {VulnerabilityType::kWeakCryptography, VulnerabilityType::kInsecureRandomness}},
      {"rec-safe-deserialization", "Use data-only deserialization",
       "Parse untrusted documents with schema validation instead of object revivers.",
       {VulnerabilityType::kInsecureDeserialization}},
      {"rec-transport-security", "Enforce transport security",
       "Use HTTPS endpoints and keep certificate verification enabled.",
       {VulnerabilityType::kInsecureCommunication, VulnerabilityType::kInsecureConfiguration}},
      {"rec-log-hygiene", "Keep secrets out of logs",
       "Redact credentials and tokens before logging.",
       {VulnerabilityType::kInformationDisclosure}},
      {"rec-dependency-upgrade", "Upgrade vulnerable dependencies",
       "Update or remove dependencies with published advisories and pin versions.",
       {VulnerabilityType::kVulnerableDependency}},
  };
  return classes;
}

std::vector<Recommendation> BuildRecommendations(const std::vector<SecurityVulnerability>& findings,
                                                 const QualityMetrics& metrics) {
  std::vector<Recommendation> out;
  for (const auto& cls : RecommendationClasses()) {
    std::optional<Severity> priority;
    for (const auto& finding : findings) {
      if (std::find(cls.types.begin(), cls.types.end(), finding.type) != cls.types.end()) {
        priority = priority ? std::max(*priority, finding.severity) : finding.severity;
      }
    }
    if (priority) {
      out.push_back(Recommendation{std::string(cls.id), *priority, std::string(cls.title),
                                   std::string(cls.description)});
    }
  }
  if (metrics.cyclomatic_complexity > kComplexityRecommendationThreshold) {
    out.push_back(Recommendation{"rec-reduce-complexity", Severity::kMedium,
                                 "Reduce code complexity",
                                 "Cyclomatic complexity of " +
                                     std::to_string(metrics.cyclomatic_complexity) +
                                     " makes review and testing unreliable."});
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const auto& a, const auto& b) { return a.priority > b.priority; });
  return out;
}

AnalysisResult Aborted(AnalysisStatus status, std::string error, std::vector<std::string> warnings) {
  AnalysisResult result;
  result.status = status;
  result.safe = false;
  result.score = 0;
  result.error = std::move(error);
  result.warnings = std::move(warnings);
  return result;
}

AnalysisResult RunAnalysis(const std::filesystem::path& root, const AnalysisOptions& options,
                           const AnalyzerHooks& hooks, const Budget& budget) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return Aborted(AnalysisStatus::kFailed, std::string(errors::msg::kAnalysisRootMissing) + ": " +
                                                root.string(),
                   {});
  }

  std::vector<std::pair<std::string, std::filesystem::path>> candidates;
  std::vector<std::string> warnings;
  auto it = std::filesystem::recursive_directory_iterator(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return Aborted(AnalysisStatus::kFailed, "Unable to enumerate " + root.string() + ": " +
                                                ec.message(),
                   {});
  }
  for (const auto end = std::filesystem::recursive_directory_iterator(); it != end;
       it.increment(ec)) {
    if (ec) {
      warnings.push_back("Directory walk error: " + ec.message());
      ec.clear();
      break;
    }
    if (budget.Exceeded()) {
      return Aborted(AnalysisStatus::kTimeout, std::string(errors::msg::kAnalysisTimedOut),
                     std::move(warnings));
    }
    const auto& entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
      if (IsExcludedDirectory(entry.path()) || it.depth() + 1 >= options.max_depth ||
          (!options.include_tests && entry.path().filename() == "__tests__")) {
        it.disable_recursion_pending();
      }
      continue;
    }
    const bool file_like = entry.is_regular_file(type_ec) || entry.is_symlink(type_ec);
    if (!file_like || !IsSourceFile(entry.path())) {
      continue;
    }
    if (!options.include_tests && IsTestFile(entry.path())) {
      continue;
    }
    candidates.emplace_back(entry.path().lexically_relative(root).generic_string(), entry.path());
  }
  std::sort(candidates.begin(), candidates.end());

  AnalysisResult result;
  result.warnings = std::move(warnings);
  crypto::Digest signature(crypto::HashAlgorithm::kSha256);
  std::vector<SecurityVulnerability> findings;

  for (const auto& [relative, path] : candidates) {
    if (budget.Exceeded()) {
      return Aborted(AnalysisStatus::kTimeout, std::string(errors::msg::kAnalysisTimedOut),
                     std::move(result.warnings));
    }
    try {
      if (hooks.before_file) {
        hooks.before_file(path);
      }
      std::error_code size_ec;
      const auto size = std::filesystem::file_size(path, size_ec);
      if (size_ec) {
        result.warnings.push_back("Skipped unreadable file " + relative + ": " + size_ec.message());
        ++result.metrics.files_skipped;
        continue;
      }
      if (size > options.max_file_size) {
        result.warnings.push_back("Skipped oversized file " + relative + " (" +
                                  std::to_string(size) + " bytes)");
        ++result.metrics.files_skipped;
        continue;
      }
      std::ifstream in(path, std::ios::binary);
      if (!in) {
        result.warnings.push_back("Skipped unreadable file " + relative);
        ++result.metrics.files_skipped;
        continue;
      }
      std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
      if (in.bad()) {
        result.warnings.push_back("Skipped unreadable file " + relative);
        ++result.metrics.files_skipped;
        continue;
      }
      signature.Update(relative);
      signature.Update(std::string_view("\0", 1));
      signature.Update(content);
      signature.Update(std::string_view("\0", 1));

      const bool json = Lower(path.extension().string()) == ".json";
      FileAnalysis file(relative, std::move(content));
      if (json) {
        if (!file.RunConfigPasses(path.filename() == "package.json")) {
          result.warnings.push_back("Unparseable JSON in " + relative);
        }
      } else {
        file.RunSourcePasses(result.metrics);
        result.metrics.lines_of_code += file.LinesOfCode();
      }
      auto& found = file.findings();
      findings.insert(findings.end(), std::make_move_iterator(found.begin()),
                      std::make_move_iterator(found.end()));
      ++result.metrics.files_scanned;
    } catch (const std::exception& ex) {
      result.warnings.push_back("Analysis of " + relative + " failed: " + ex.what());
      ++result.metrics.files_skipped;
    }
  }
  if (budget.Exceeded()) {
    return Aborted(AnalysisStatus::kTimeout, std::string(errors::msg::kAnalysisTimedOut),
                   std::move(result.warnings));
  }

  const auto digest = signature.Final();
  result.signature = HexEncode(digest.data(), digest.size());
  result.vulnerabilities = Deduplicate(std::move(findings));
  result.safe = std::none_of(result.vulnerabilities.begin(), result.vulnerabilities.end(),
                             [](const auto& v) { return v.severity >= Severity::kHigh; });
  result.score = ComputeScore(result.vulnerabilities, result.metrics);
  result.recommendations = BuildRecommendations(result.vulnerabilities, result.metrics);
  result.status = AnalysisStatus::kCompleted;
  return result;
}

orchestrator::EventSeverity EventSeverityFor(const AnalysisResult& result) {
  if (result.status != AnalysisStatus::kCompleted) {
    return orchestrator::EventSeverity::kError;
  }
  return result.safe ? orchestrator::EventSeverity::kInfo : orchestrator::EventSeverity::kWarning;
}

} // namespace

std::string_view ToString(VulnerabilityType type) noexcept {
  switch (type) {
    case VulnerabilityType::kInjection:
      return "INJECTION";
    case VulnerabilityType::kSqlInjection:
      return "SQL_INJECTION";
    case VulnerabilityType::kCommandInjection:
      return "COMMAND_INJECTION";
    case VulnerabilityType::kCodeInjection:
      return "CODE_INJECTION";
    case VulnerabilityType::kCrossSiteScripting:
      return "XSS";
    case VulnerabilityType::kPathTraversal:
      return "PATH_TRAVERSAL";
    case VulnerabilityType::kHardcodedCredentials:
      return "HARDCODED_CREDENTIALS";
    case VulnerabilityType::kWeakCryptography:
      return "WEAK_CRYPTOGRAPHY";
    case VulnerabilityType::kInsecureRandomness:
      return "INSECURE_RANDOMNESS";
    case VulnerabilityType::kInsecureDeserialization:
      return "INSECURE_DESERIALIZATION";
    case VulnerabilityType::kInsecureCommunication:
      return "INSECURE_COMMUNICATION";
    case VulnerabilityType::kInformationDisclosure:
      return "INFORMATION_DISCLOSURE";
    case VulnerabilityType::kVulnerableDependency:
      return "VULNERABLE_DEPENDENCY";
    case VulnerabilityType::kInsecureConfiguration:
      return "INSECURE_CONFIGURATION";
  }
  return "UNKNOWN";
}

std::string_view ToString(DetectionPass pass) noexcept {
  switch (pass) {
    case DetectionPass::kPattern:
      return "pattern";
    case DetectionPass::kSyntax:
      return "syntax";
    case DetectionPass::kDataFlow:
      return "data-flow";
    case DetectionPass::kTaint:
      return "taint";
    case DetectionPass::kConfig:
      return "config";
    case DetectionPass::kDependency:
      return "dependency";
  }
  return "unknown";
}

std::string_view ToString(AnalysisStatus status) noexcept {
  switch (status) {
    case AnalysisStatus::kCompleted:
      return "COMPLETED";
    case AnalysisStatus::kTimeout:
      return "TIMEOUT";
    case AnalysisStatus::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

int SeverityDeduction(Severity severity) noexcept {
  switch (severity) {
    case Severity::kCritical:
      return 25;
    case Severity::kHigh:
      return 15;
    case Severity::kMedium:
      return 8;
    case Severity::kLow:
      return 3;
    case Severity::kInfo:
      return 0;
  }
  return 0;
}

int ComputeScore(const std::vector<SecurityVulnerability>& findings,
                 const QualityMetrics& metrics) noexcept {
  int score = 100;
  for (const auto& finding : findings) {
    score -= SeverityDeduction(finding.severity);
  }
  if (metrics.cyclomatic_complexity > kCyclomaticPenaltyThreshold) {
    score -= 10;
  }
  if (metrics.max_nesting_depth > kNestingPenaltyThreshold) {
    score -= 5;
  }
  return std::max(score, 0);
}

CodeAnalyzer::CodeAnalyzer(orchestrator::EventBus& bus, AnalyzerHooks hooks)
    : bus_(bus), hooks_(std::move(hooks)) {}

AnalysisResult CodeAnalyzer::Analyze(const std::filesystem::path& root,
                                     const AnalysisOptions& options) const {
  const auto started = Steady::now();
  AnalysisResult result;
  try {
    result = RunAnalysis(root, options, hooks_, Budget(started, options.timeout));
  } catch (const Error& err) {
    result = Aborted(AnalysisStatus::kFailed, err.what(), {});
  } catch (const std::exception& ex) {
    result = Aborted(AnalysisStatus::kFailed, std::string("Analysis failed: ") + ex.what(), {});
  }
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Steady::now() - started);

  try {
    orchestrator::Event event;
    event.category = orchestrator::EventCategory::kSecurity;
    event.severity = EventSeverityFor(result);
    event.event_id = "analysis_completed";
    event.message = "Static analysis finished";
    event.fields.emplace_back("root", root.string(), orchestrator::FieldPrivacy::kHash);
    event.fields.emplace_back("status", std::string(ToString(result.status)));
    event.fields.emplace_back("score", std::to_string(result.score),
                              orchestrator::FieldPrivacy::kPublic, true);
    event.fields.emplace_back("findings", std::to_string(result.vulnerabilities.size()),
                              orchestrator::FieldPrivacy::kPublic, true);
    event.fields.emplace_back("duration_ms", std::to_string(result.duration.count()),
                              orchestrator::FieldPrivacy::kPublic, true);
    bus_.Publish(event);
  } catch (const std::exception& ex) {
    result.warnings.push_back(std::string("Analysis event not published: ") + ex.what());
  }
  return result;
}

} // namespace pw::analysis
