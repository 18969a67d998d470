#include "pw/analysis/code_analyzer.h" // TSK120_Analyzer

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

#include "pw/orchestrator/event_bus.h"
#include "test_support.h"

namespace {

  using pw::Severity;
  using pw::analysis::AnalysisOptions;
  using pw::analysis::AnalysisResult;
  using pw::analysis::AnalysisStatus;
  using pw::analysis::CodeAnalyzer;
  using pw::analysis::DetectionPass;
  using pw::analysis::VulnerabilityType;
  using pw::test::Expect;
  using pw::test::TempDir;
  using pw::test::WriteFile;

  std::size_t CountType(const AnalysisResult& result, VulnerabilityType type) {
    return static_cast<std::size_t>(std::count_if(result.vulnerabilities.begin(), result.vulnerabilities.end(),
                                                  [type](const auto& v) { return v.type == type; }));
  }

  void TestCleanTree() {
    TempDir dir("pw_analyzer");
    WriteFile(dir.path() / "index.js",
              "// plugin entry point\n"
              "// const password = \"hunter22\"; eval(payload)\n"
              "function greet(name) {\n"
              "  return 'hello ' + name;\n"
              "}\n"
              "module.exports = { greet };\n");
    pw::orchestrator::EventBus bus;
    int events = 0;
    bus.Subscribe([&](const pw::orchestrator::Event& e) {
      if (e.event_id == "analysis_completed") {
        ++events;
      }
    });
    CodeAnalyzer analyzer(bus);
    const auto result = analyzer.Analyze(dir.path());
    Expect(result.status == AnalysisStatus::kCompleted, "clean tree completes");
    Expect(result.vulnerabilities.empty(), "commented-out code is not reported");
    Expect(result.score == 100 && result.safe, "clean tree scores 100");
    Expect(result.metrics.files_scanned == 1 && result.metrics.function_count == 1, "one file, one function");
    Expect(result.signature.size() == 64, "signature is hex SHA-256");
    Expect(events == 1, "completion event published");
  }

  void TestScoreFromFindings() { // TSK120_Scoring
    TempDir dir("pw_analyzer");
    WriteFile(dir.path() / "index.js",
              "const crypto = require('crypto');\n"
              "const digest = crypto.createHash('md5');\n"
              "const a = Math.random();\n"
              "const b = Math.random();\n"
              "const docs = 'http://example.com/docs';\n"
              "const help = 'http://example.org/help';\n");
    pw::orchestrator::EventBus bus;
    const auto result = CodeAnalyzer(bus).Analyze(dir.path());
    Expect(result.status == AnalysisStatus::kCompleted, "completed");
    Expect(result.vulnerabilities.size() == 5, "one medium and four low findings");
    Expect(CountType(result, VulnerabilityType::kWeakCryptography) == 1, "md5 digest flagged");
    Expect(CountType(result, VulnerabilityType::kInsecureRandomness) == 2, "Math.random flagged per line");
    Expect(CountType(result, VulnerabilityType::kInsecureCommunication) == 2, "plain http flagged per line");
    Expect(result.score == 80, "100 - 8 - 4 * 3");
    Expect(result.safe, "no HIGH or CRITICAL finding keeps the plugin safe");
    Expect(!result.vulnerabilities.empty() && result.vulnerabilities.front().severity == Severity::kMedium,
           "findings ordered by severity");
    const auto weak = std::find_if(result.vulnerabilities.begin(), result.vulnerabilities.end(),
                                   [](const auto& v) { return v.type == VulnerabilityType::kWeakCryptography; });
    Expect(weak != result.vulnerabilities.end() && weak->line == 2 && weak->file == "index.js" &&
               weak->cwe == "CWE-327" && weak->id.rfind("PW-", 0) == 0,
           "finding location and metadata");
    Expect(std::any_of(result.recommendations.begin(), result.recommendations.end(),
                       [](const auto& r) { return r.id == "rec-crypto-upgrade"; }),
           "crypto recommendation emitted");
  }

  void TestCodeInjection() {
    TempDir dir("pw_analyzer");
    WriteFile(dir.path() / "run.js", "const value = eval(input);\n");
    pw::orchestrator::EventBus bus;
    const auto result = CodeAnalyzer(bus).Analyze(dir.path());
    Expect(result.vulnerabilities.size() == 1, "single eval finding");
    Expect(!result.vulnerabilities.empty() &&
               result.vulnerabilities[0].type == VulnerabilityType::kCodeInjection &&
               result.vulnerabilities[0].severity == Severity::kCritical &&
               result.vulnerabilities[0].pass == DetectionPass::kPattern,
           "eval is critical code injection");
    Expect(result.score == 75 && !result.safe, "critical finding costs 25 and marks unsafe");
  }

  void TestCommandInjectionDeduplicated() {
    TempDir dir("pw_analyzer");
    WriteFile(dir.path() / "shell.js",
              "const child_process = require('child_process');\n"
              "child_process.exec(req.body.cmd);\n");
    pw::orchestrator::EventBus bus;
    const auto result = CodeAnalyzer(bus).Analyze(dir.path());
    Expect(CountType(result, VulnerabilityType::kCommandInjection) == 1,
           "syntax and data-flow hits on one line collapse to one finding");
    Expect(!result.vulnerabilities.empty() && result.vulnerabilities[0].severity == Severity::kCritical &&
               result.vulnerabilities[0].line == 2,
           "the more severe duplicate is kept");
  }

  void TestDataFlowAndTaint() { // TSK121_Flow
    TempDir dir("pw_analyzer");
    WriteFile(dir.path() / "direct.js", "db.query(req.body.sql);\n");
    WriteFile(dir.path() / "indirect.js",
              "const fs = require('fs');\n"
              "const name = req.query.file;\n"
              "const target = '/var/data/' + name;\n"
              "fs.writeFile(target, 'x');\n");
    pw::orchestrator::EventBus bus;
    const auto result = CodeAnalyzer(bus).Analyze(dir.path());
    Expect(result.vulnerabilities.size() == 2, "one data-flow and one taint finding");
    const auto direct = std::find_if(result.vulnerabilities.begin(), result.vulnerabilities.end(),
                                     [](const auto& v) { return v.file == "direct.js"; });
    Expect(direct != result.vulnerabilities.end() && direct->pass == DetectionPass::kDataFlow &&
               direct->type == VulnerabilityType::kInjection && direct->severity == Severity::kHigh,
           "request body reaching a query is a data-flow finding");
    const auto indirect = std::find_if(result.vulnerabilities.begin(), result.vulnerabilities.end(),
                                       [](const auto& v) { return v.file == "indirect.js"; });
    Expect(indirect != result.vulnerabilities.end() && indirect->pass == DetectionPass::kTaint &&
               indirect->line == 4 && indirect->severity == Severity::kHigh,
           "taint propagates through an intermediate assignment");
    Expect(result.score == 70, "two HIGH findings");
  }

  void TestJsonDocuments() {
    TempDir dir("pw_analyzer");
    WriteFile(dir.path() / "package.json",
              "{\n"
              "  \"name\": \"demo\",\n"
              "  \"dependencies\": {\n"
              "    \"lodash\": \"4.17.15\",\n"
              "    \"left-pad\": \"*\"\n"
              "  }\n"
              "}\n");
    WriteFile(dir.path() / "config" / "settings.json",
              "{\n"
              "  \"database\": { \"password\": \"hunter2secret\" },\n"
              "  \"apiToken\": \"${API_TOKEN}\",\n"
              "  \"tls\": false\n"
              "}\n");
    WriteFile(dir.path() / "broken.json", "{ not json");
    pw::orchestrator::EventBus bus;
    const auto result = CodeAnalyzer(bus).Analyze(dir.path());
    Expect(CountType(result, VulnerabilityType::kVulnerableDependency) == 2, "advisory and unpinned dependency");
    const auto lodash = std::find_if(result.vulnerabilities.begin(), result.vulnerabilities.end(), [](const auto& v) {
      return v.type == VulnerabilityType::kVulnerableDependency && v.severity == Severity::kHigh;
    });
    Expect(lodash != result.vulnerabilities.end() && lodash->line == 4 && lodash->pass == DetectionPass::kDependency,
           "lodash advisory located on its line");
    Expect(CountType(result, VulnerabilityType::kHardcodedCredentials) == 1, "literal password flagged once");
    Expect(CountType(result, VulnerabilityType::kInsecureConfiguration) == 1, "tls disabled flagged");
    Expect(std::any_of(result.warnings.begin(), result.warnings.end(),
                       [](const auto& w) { return w.find("broken.json") != std::string::npos; }),
           "unparseable JSON warned about");
    Expect(!result.safe, "HIGH findings mark unsafe");
  }

  void TestFileSelection() {
    TempDir dir("pw_analyzer");
    WriteFile(dir.path() / "src" / "util.test.js", "eval(x);\n");
    WriteFile(dir.path() / "__tests__" / "helper.js", "eval(y);\n");
    WriteFile(dir.path() / "node_modules" / "dep" / "index.js", "eval(z);\n");
    WriteFile(dir.path() / "README.md", "eval(w)\n");
    WriteFile(dir.path() / "src" / "main.js", "module.exports = 1;\n");
    pw::orchestrator::EventBus bus;
    CodeAnalyzer analyzer(bus);
    auto result = analyzer.Analyze(dir.path());
    Expect(result.vulnerabilities.empty() && result.metrics.files_scanned == 1,
           "tests, dependencies and non-source files are skipped");

    AnalysisOptions options;
    options.include_tests = true;
    result = analyzer.Analyze(dir.path(), options);
    Expect(result.vulnerabilities.size() == 2 && result.metrics.files_scanned == 3,
           "test files scanned on request while node_modules stays excluded");
  }

  void TestOversizedFileSkipped() {
    TempDir dir("pw_analyzer");
    WriteFile(dir.path() / "big.js", std::string(256, 'a') + "\neval(x);\n");
    WriteFile(dir.path() / "small.js", "var a;\n");
    AnalysisOptions options;
    options.max_file_size = 64;
    pw::orchestrator::EventBus bus;
    const auto result = CodeAnalyzer(bus).Analyze(dir.path(), options);
    Expect(result.status == AnalysisStatus::kCompleted, "oversize is not fatal");
    Expect(result.metrics.files_skipped == 1 && result.metrics.files_scanned == 1, "oversized file counted");
    Expect(result.vulnerabilities.empty(), "skipped content is not analyzed");
    Expect(!result.warnings.empty() && result.warnings[0].find("big.js") != std::string::npos,
           "skip warning names the file");
  }

  void TestFailures() {
    pw::orchestrator::EventBus bus;
    TempDir dir("pw_analyzer");
    auto result = CodeAnalyzer(bus).Analyze(dir.path() / "absent");
    Expect(result.status == AnalysisStatus::kFailed && result.score == 0 && !result.safe,
           "missing root fails closed");
    Expect(!result.error.empty(), "failure carries an error message");

    WriteFile(dir.path() / "a.js", "var a;\n");
    WriteFile(dir.path() / "b.js", "var b;\n");
    pw::analysis::AnalyzerHooks hooks;
    hooks.before_file = [](const std::filesystem::path&) {
      std::this_thread::sleep_for(std::chrono::milliseconds(80));
    };
    AnalysisOptions options;
    options.timeout = std::chrono::milliseconds(20);
    result = CodeAnalyzer(bus, hooks).Analyze(dir.path(), options);
    Expect(result.status == AnalysisStatus::kTimeout, "budget overrun reports timeout");
    Expect(result.score == 0 && !result.safe, "timeout is never safe");
  }

  void TestSignatureTracksContent() {
    TempDir first("pw_analyzer");
    TempDir second("pw_analyzer");
    WriteFile(first.path() / "lib" / "a.js", "var a = 1;\n");
    WriteFile(first.path() / "b.js", "var b = 2;\n");
    WriteFile(second.path() / "b.js", "var b = 2;\n");
    WriteFile(second.path() / "lib" / "a.js", "var a = 1;\n");
    pw::orchestrator::EventBus bus;
    CodeAnalyzer analyzer(bus);
    const auto one = analyzer.Analyze(first.path());
    const auto two = analyzer.Analyze(second.path());
    Expect(one.signature == two.signature, "signature independent of location and creation order");
    WriteFile(second.path() / "b.js", "var b = 3;\n");
    Expect(analyzer.Analyze(second.path()).signature != one.signature, "content change alters signature");
  }

} // namespace

int main() {
  TestCleanTree();
  TestScoreFromFindings();
  TestCodeInjection();
  TestCommandInjectionDeduplicated();
  TestDataFlowAndTaint();
  TestJsonDocuments();
  TestFileSelection();
  TestOversizedFileSkipped();
  TestFailures();
  TestSignatureTracksContent();
  return pw::test::Finish("code analyzer");
}
