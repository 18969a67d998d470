#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "pw/analysis/code_analyzer.h"
#include "pw/crypto/x509.h"
#include "pw/error.h"
#include "pw/orchestrator/config.h"
#include "pw/orchestrator/event_bus.h"
#include "pw/orchestrator/io_util.h"
#include "pw/orchestrator/orchestration.h"
#include "pw/trust/signature_verifier.h"
#include "pw/types.h"

namespace {

  using nlohmann::json;

  // TSK009
  constexpr int kExitOk = 0;
  constexpr int kExitDenied = 1;
  constexpr int kExitUsage = 64;
  constexpr int kExitIO = 74;
  constexpr int kExitSecurity = 77;

  void PrintUsage() {
    std::cerr << "PluginWarden\n";
    std::cerr << "Usage:\n";
    std::cerr << "  pwctl analyze <dir> [--include-tests]\n";
    std::cerr << "  pwctl verify  <dir> [--manifest=<file>] [--anchor=<LEVEL>:<pem>]...\n";
    std::cerr << "  pwctl sign    <dir> --cert=<pem> --key=<pem> [--chain=<pem>]... [--passphrase-env=<VAR>]\n";
    std::cerr << "  pwctl gen-cert --out=<prefix> --subject=<cn> [--ca=<prefix>] [--permission=<p>]...\n";
    std::cerr << "                 [--days=<n>] [--key=ec|rsa|ed25519]\n";
    std::cerr << "  pwctl install <id> <dir> [--config=<file>] [--log=<file>]\n";
    std::cerr << "\nExit codes: 0 ok, 1 denied or invalid, 64 usage, 74 I/O, 77 security\n";
  }

  int ExitCodeFor(const pw::Error& err) {
    switch (err.domain) {
    case pw::ErrorDomain::Security:
    case pw::ErrorDomain::Crypto:
      return kExitSecurity;
    case pw::ErrorDomain::Validation:
    case pw::ErrorDomain::Config:
      return kExitUsage;
    case pw::ErrorDomain::IO:
    case pw::ErrorDomain::Dependency:
    case pw::ErrorDomain::State:
    case pw::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  std::string_view DomainLabel(pw::ErrorDomain domain) {
    switch (domain) {
    case pw::ErrorDomain::Security:
      return "Security error";
    case pw::ErrorDomain::IO:
      return "I/O error";
    case pw::ErrorDomain::Crypto:
      return "Crypto error";
    case pw::ErrorDomain::Validation:
      return "Validation error";
    case pw::ErrorDomain::Config:
      return "Configuration error";
    case pw::ErrorDomain::Dependency:
      return "Dependency error";
    case pw::ErrorDomain::State:
      return "State error";
    case pw::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const pw::Error& err) {
    std::cerr << DomainLabel(err.domain) << ": " << err.what() << std::endl;
    for (const auto& frame : err.context) {
      std::cerr << "  at " << frame << std::endl;
    }
  }

  // "--name=value" -> value
  std::optional<std::string> FlagValue(std::string_view arg, std::string_view name) {
    if (arg.size() <= name.size() + 3 || arg.substr(0, 2) != "--" || arg.substr(2, name.size()) != name ||
        arg[name.size() + 2] != '=') {
      return std::nullopt;
    }
    return std::string(arg.substr(name.size() + 3));
  }

  json ToJson(const pw::analysis::AnalysisResult& result) {
    json findings = json::array();
    for (const auto& v : result.vulnerabilities) {
      findings.push_back({{"id", v.id},
                          {"type", pw::analysis::ToString(v.type)},
                          {"severity", pw::ToString(v.severity)},
                          {"title", v.title},
                          {"file", v.file},
                          {"line", v.line},
                          {"cwe", v.cwe},
                          {"remediation", v.remediation},
                          {"pass", pw::analysis::ToString(v.pass)}});
    }
    json recommendations = json::array();
    for (const auto& r : result.recommendations) {
      recommendations.push_back({{"priority", pw::ToString(r.priority)}, {"title", r.title}});
    }
    return {{"status", pw::analysis::ToString(result.status)},
            {"safe", result.safe},
            {"score", result.score},
            {"signature", result.signature},
            {"vulnerabilities", findings},
            {"recommendations", recommendations},
            {"metrics",
             {{"cyclomatic_complexity", result.metrics.cyclomatic_complexity},
              {"cognitive_complexity", result.metrics.cognitive_complexity},
              {"max_nesting_depth", result.metrics.max_nesting_depth},
              {"functions", result.metrics.function_count},
              {"classes", result.metrics.class_count},
              {"lines_of_code", result.metrics.lines_of_code},
              {"files_scanned", result.metrics.files_scanned},
              {"files_skipped", result.metrics.files_skipped}}},
            {"warnings", result.warnings},
            {"error", result.error},
            {"duration_ms", result.duration.count()}};
  }

  json ToJson(const std::vector<pw::trust::VerificationIssue>& issues) {
    json out = json::array();
    for (const auto& issue : issues) {
      out.push_back({{"code", pw::trust::ToString(issue.code)},
                     {"severity", pw::trust::ToString(issue.severity)},
                     {"message", issue.message}});
    }
    return out;
  }

  json ToJson(const pw::trust::VerificationResult& result) {
    json chain = json::array();
    for (const auto& cert : result.chain) {
      chain.push_back({{"subject", cert.subject},
                       {"issuer", cert.issuer},
                       {"serial", cert.serial},
                       {"valid_from", pw::FormatTimestamp(cert.valid_from)},
                       {"valid_to", pw::FormatTimestamp(cert.valid_to)},
                       {"fingerprint", cert.fingerprint},
                       {"trust_level", pw::ToString(cert.trust_level)},
                       {"revoked", cert.revoked}});
    }
    return {{"valid", result.valid},
            {"trust_level", pw::ToString(result.trust_level)},
            {"chain_complete", result.chain_complete},
            {"reached", pw::trust::ToString(result.reached)},
            {"chain", chain},
            {"errors", ToJson(result.errors)},
            {"warnings", ToJson(result.warnings)}};
  }

  json ToJson(const pw::orchestrator::InstallationResult& result) {
    json violations = json::array();
    for (const auto& v : result.violations) {
      violations.push_back({{"id", v.id},
                            {"kind", pw::security::ToString(v.kind)},
                            {"severity", pw::ToString(v.severity)},
                            {"description", v.description},
                            {"blocked", v.blocked}});
    }
    json restrictions = json::array();
    for (const auto& r : result.restrictions) {
      restrictions.push_back({{"type", pw::orchestrator::ToString(r.type)},
                              {"rule", r.rule},
                              {"targets", r.targets},
                              {"reason", r.reason}});
    }
    json out = {{"plugin_id", result.plugin_id},
                {"allowed", result.allowed},
                {"score", result.score},
                {"risk_level", pw::ToString(result.risk_level)},
                {"trust_level", pw::ToString(result.trust_level)},
                {"violations", violations},
                {"restrictions", restrictions},
                {"recommendations", result.recommendations},
                {"profile_version", result.profile_version}};
    out["sandbox_id"] = result.sandbox_id ? json(*result.sandbox_id) : json(nullptr);
    if (result.verification) {
      out["verification"] = ToJson(*result.verification);
    }
    return out;
  }

  int HandleAnalyze(const std::filesystem::path& dir, bool include_tests) {
    pw::orchestrator::EventBus bus;
    pw::analysis::CodeAnalyzer analyzer(bus);
    pw::analysis::AnalysisOptions options;
    options.include_tests = include_tests;
    const auto result = analyzer.Analyze(dir, options);
    std::cout << ToJson(result).dump(2) << std::endl;
    if (result.status != pw::analysis::AnalysisStatus::kCompleted) {
      return kExitIO;
    }
    return result.safe ? kExitOk : kExitDenied;
  }

  int HandleVerify(const std::filesystem::path& dir, const std::optional<std::filesystem::path>& manifest,
                   const std::vector<std::string>& anchors) {
    pw::orchestrator::EventBus bus;
    pw::trust::SignatureVerifier verifier(bus);
    for (const auto& spec : anchors) {
      const auto colon = spec.find(':');
      if (colon == std::string::npos) {
        std::cerr << "Validation error: --anchor expects <LEVEL>:<pem>" << std::endl;
        return kExitUsage;
      }
      const std::filesystem::path pem = spec.substr(colon + 1);
      verifier.AddTrustAnchor(pem.stem().string(),
                              pw::crypto::Certificate::FromPem(pw::orchestrator::ReadFileText(pem)),
                              pw::ParseTrustLevel(spec.substr(0, colon)));
    }
    const auto result = verifier.Verify(dir, manifest);
    std::cout << ToJson(result).dump(2) << std::endl;
    return result.valid ? kExitOk : kExitDenied;
  }

  int HandleSign(const std::filesystem::path& dir, const std::filesystem::path& cert,
                 const std::filesystem::path& key, const std::vector<std::filesystem::path>& chain,
                 const std::optional<std::string>& passphrase_env) {
    std::optional<std::string> passphrase;
    if (passphrase_env) {
      const char* value = std::getenv(passphrase_env->c_str());
      if (value == nullptr) {
        std::cerr << "Configuration error: environment variable " << *passphrase_env << " is not set" << std::endl;
        return kExitUsage;
      }
      passphrase = value;
    }
    std::string chain_pem;
    for (const auto& path : chain) {
      chain_pem += pw::orchestrator::ReadFileText(path);
    }
    pw::orchestrator::EventBus bus;
    pw::trust::SignatureVerifier verifier(bus);
    pw::trust::SignOptions options;
    options.manifest_path = dir / pw::trust::kDefaultManifestName;
    const auto signature = verifier.Sign(
        dir, pw::orchestrator::ReadFileText(cert), pw::orchestrator::ReadFileText(key),
        passphrase ? std::optional<std::string_view>(*passphrase) : std::nullopt, chain_pem, options);
    pw::trust::SignatureVerifier::WriteSignature(*options.manifest_path, signature);
    std::cout << json{{"manifest", options.manifest_path->string()},
                      {"algorithm", pw::crypto::ToString(signature.algorithm)},
                      {"content_hash", signature.content_hash},
                      {"signing_time", pw::FormatTimestamp(signature.signing_time)}}
                     .dump(2)
              << std::endl;
    return kExitOk;
  }

  void WritePrivate(const std::filesystem::path& path, const std::string& text) {
    pw::orchestrator::AtomicReplace(path, text);
    std::error_code ec;
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
      std::clog << "[pwctl] could not restrict " << path.string() << ": " << ec.message() << std::endl;
    }
  }

  int HandleGenCert(const std::string& out, const std::string& subject, const std::optional<std::string>& ca,
                    const std::vector<std::string>& permissions, int days, pw::crypto::KeyType key_type) {
    pw::crypto::CertificateRequest request;
    request.common_name = subject;
    request.key_type = key_type;
    request.validity_days = days;
    request.permissions = permissions;
    request.is_ca = !ca.has_value();

    std::optional<pw::crypto::IssuedCertificate> issuer;
    if (ca) {
      issuer.emplace(pw::crypto::IssuedCertificate{
          pw::crypto::Certificate::FromPem(pw::orchestrator::ReadFileText(*ca + ".crt")),
          pw::crypto::PrivateKey::FromPem(pw::orchestrator::ReadFileText(*ca + ".key"))});
    }
    const auto issued = pw::crypto::GenerateCertificate(request, issuer ? &*issuer : nullptr);
    pw::orchestrator::AtomicReplace(std::filesystem::path(out + ".crt"), issued.certificate.ToPem());
    WritePrivate(out + ".key", issued.key.ToPem());
    std::cout << json{{"certificate", out + ".crt"},
                      {"key", out + ".key"},
                      {"subject", issued.certificate.Subject()},
                      {"issuer", issued.certificate.Issuer()},
                      {"serial", issued.certificate.SerialHex()},
                      {"fingerprint", issued.certificate.FingerprintSha256()},
                      {"permissions", issued.certificate.Permissions()}}
                     .dump(2)
              << std::endl;
    return kExitOk;
  }

  int HandleInstall(const std::string& id, const std::filesystem::path& dir,
                    const std::optional<std::filesystem::path>& config_path,
                    const std::optional<std::filesystem::path>& log_path) {
    auto config = config_path ? pw::orchestrator::LoadOrchestrationConfig(*config_path)
                              : pw::orchestrator::OrchestrationConfig{};
    if (log_path) {
      config.auditing.log = *log_path;
    }
    pw::orchestrator::SecurityServices services(std::move(config));
    pw::SecurityContext context;
    context.request_id = pw::MakeId("cli");
    context.timestamp = pw::Clock::now();
    context.ip_address = "127.0.0.1";
    context.user_agent = "pwctl";
    if (const char* user = std::getenv("USER"); user != nullptr) {
      context.user_id = user;
    }
    const auto result = services.orchestration().ProcessPluginInstallation(id, dir, context);
    std::cout << ToJson(result).dump(2) << std::endl;
    return result.allowed ? kExitOk : kExitDenied;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string_view cmd = argv[1];
    std::vector<std::string_view> positional;
    std::vector<std::string_view> flags;
    for (int index = 2; index < argc; ++index) {
      std::string_view arg = argv[index];
      (arg.rfind("--", 0) == 0 ? flags : positional).push_back(arg);
    }

    if (cmd == "analyze") {
      bool include_tests = false;
      for (auto flag : flags) {
        if (flag != "--include-tests") {
          PrintUsage();
          return kExitUsage;
        }
        include_tests = true;
      }
      if (positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleAnalyze(std::filesystem::path(positional[0]), include_tests);
    }
    if (cmd == "verify") {
      std::optional<std::filesystem::path> manifest;
      std::vector<std::string> anchors;
      for (auto flag : flags) {
        if (auto value = FlagValue(flag, "manifest")) {
          manifest = *value;
        } else if (auto anchor = FlagValue(flag, "anchor")) {
          anchors.push_back(*anchor);
        } else {
          PrintUsage();
          return kExitUsage;
        }
      }
      if (positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleVerify(std::filesystem::path(positional[0]), manifest, anchors);
    }
    if (cmd == "sign") {
      std::optional<std::filesystem::path> cert;
      std::optional<std::filesystem::path> key;
      std::vector<std::filesystem::path> chain;
      std::optional<std::string> passphrase_env;
      for (auto flag : flags) {
        if (auto value = FlagValue(flag, "cert")) {
          cert = *value;
        } else if (auto key_value = FlagValue(flag, "key")) {
          key = *key_value;
        } else if (auto chain_value = FlagValue(flag, "chain")) {
          chain.emplace_back(*chain_value);
        } else if (auto env = FlagValue(flag, "passphrase-env")) {
          passphrase_env = *env;
        } else {
          PrintUsage();
          return kExitUsage;
        }
      }
      if (positional.size() != 1 || !cert || !key) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleSign(std::filesystem::path(positional[0]), *cert, *key, chain, passphrase_env);
    }
    if (cmd == "gen-cert") {
      std::optional<std::string> out;
      std::optional<std::string> subject;
      std::optional<std::string> ca;
      std::vector<std::string> permissions;
      int days = 365;
      auto key_type = pw::crypto::KeyType::kEc;
      for (auto flag : flags) {
        if (auto value = FlagValue(flag, "out")) {
          out = *value;
        } else if (auto cn = FlagValue(flag, "subject")) {
          subject = *cn;
        } else if (auto ca_value = FlagValue(flag, "ca")) {
          ca = *ca_value;
        } else if (auto permission = FlagValue(flag, "permission")) {
          permissions.push_back(*permission);
        } else if (auto days_value = FlagValue(flag, "days")) {
          try {
            days = std::stoi(*days_value);
          } catch (const std::exception&) {
            std::cerr << "Validation error: --days expects a number" << std::endl;
            return kExitUsage;
          }
          if (days <= 0) {
            std::cerr << "Validation error: --days must be positive" << std::endl;
            return kExitUsage;
          }
        } else if (auto type = FlagValue(flag, "key")) {
          if (*type == "ec") {
            key_type = pw::crypto::KeyType::kEc;
          } else if (*type == "rsa") {
            key_type = pw::crypto::KeyType::kRsa;
          } else if (*type == "ed25519") {
            key_type = pw::crypto::KeyType::kEd25519;
          } else {
            std::cerr << "Validation error: unknown key type " << *type << std::endl;
            return kExitUsage;
          }
        } else {
          PrintUsage();
          return kExitUsage;
        }
      }
      if (!positional.empty() || !out || !subject) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleGenCert(*out, *subject, ca, permissions, days, key_type);
    }
    if (cmd == "install") {
      std::optional<std::filesystem::path> config;
      std::optional<std::filesystem::path> log;
      for (auto flag : flags) {
        if (auto value = FlagValue(flag, "config")) {
          config = *value;
        } else if (auto log_value = FlagValue(flag, "log")) {
          log = *log_value;
        } else {
          PrintUsage();
          return kExitUsage;
        }
      }
      if (positional.size() != 2) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleInstall(std::string(positional[0]), std::filesystem::path(positional[1]), config, log);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const pw::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
