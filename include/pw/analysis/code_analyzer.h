#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "pw/types.h"

namespace pw::orchestrator {
class EventBus;
}

namespace pw::analysis {

enum class VulnerabilityType : std::uint8_t {
  kInjection,
  kSqlInjection,
  kCommandInjection,
  kCodeInjection,
  kCrossSiteScripting,
  kPathTraversal,
  kHardcodedCredentials,
  kWeakCryptography,
  kInsecureRandomness,
  kInsecureDeserialization,
  kInsecureCommunication,
  kInformationDisclosure,
  kVulnerableDependency,
  kInsecureConfiguration
};

std::string_view ToString(VulnerabilityType type) noexcept;

// Which pass produced a finding.
enum class DetectionPass : std::uint8_t { kPattern, kSyntax, kDataFlow, kTaint, kConfig, kDependency };

std::string_view ToString(DetectionPass pass) noexcept;

struct SecurityVulnerability {
  std::string id;
  VulnerabilityType type{VulnerabilityType::kInjection};
  Severity severity{Severity::kLow};
  std::string title;
  std::string description;
  std::string file;  // relative to the analysis root, '/' separated
  int line{0};
  std::string cwe;
  std::string remediation;
  std::string evidence;
  DetectionPass pass{DetectionPass::kPattern};
};

struct QualityMetrics {
  int cyclomatic_complexity{0};
  int cognitive_complexity{0};
  int max_nesting_depth{0};
  int function_count{0};
  int class_count{0};
  std::size_t lines_of_code{0};
  std::size_t files_scanned{0};
  std::size_t files_skipped{0};
};

struct Recommendation {
  std::string id;
  Severity priority{Severity::kLow};
  std::string title;
  std::string description;
};

enum class AnalysisStatus : std::uint8_t { kCompleted, kTimeout, kFailed };

std::string_view ToString(AnalysisStatus status) noexcept;

struct AnalysisOptions {
  bool include_tests{false};
  int max_depth{10};
  std::chrono::milliseconds timeout{300000};
  std::uintmax_t max_file_size{10u * 1024u * 1024u};
};

struct AnalysisResult {
  AnalysisStatus status{AnalysisStatus::kCompleted};
  bool safe{false};
  int score{0};
  std::vector<SecurityVulnerability> vulnerabilities;
  QualityMetrics metrics;
  std::vector<Recommendation> recommendations;
  std::string signature;  // hex SHA-256 over (relative path, content) pairs
  std::vector<std::string> warnings;
  std::string error;
  std::chrono::milliseconds duration{0};
};

struct AnalyzerHooks { // TSK120_Analyzer_Test_Seams
  std::function<void(const std::filesystem::path&)> before_file;
};

// Per-severity deduction used by the score.
int SeverityDeduction(Severity severity) noexcept;

class CodeAnalyzer {
 public:
  explicit CodeAnalyzer(orchestrator::EventBus& bus, AnalyzerHooks hooks = {});

  // Never throws: failures are reported through AnalysisResult::status.
  AnalysisResult Analyze(const std::filesystem::path& root,
                         const AnalysisOptions& options = {}) const;

 private:
  orchestrator::EventBus& bus_;
  AnalyzerHooks hooks_;
};

// Exposed for tests and for the orchestration layer's own scoring.
int ComputeScore(const std::vector<SecurityVulnerability>& findings,
                 const QualityMetrics& metrics) noexcept;

} // namespace pw::analysis
