#include "pw/orchestrator/config.h"

#include <charconv>
#include <functional>
#include <map>
#include <set>
#include <sstream>

#include "pw/error.h"
#include "pw/orchestrator/io_util.h"

namespace pw::orchestrator {

namespace {

std::string Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t");
  return std::string(text.substr(first, last - first + 1));
}

[[noreturn]] void ThrowInvalid(std::size_t line, const std::string& key, const std::string& value,
                               const std::string& why) {
  throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
              "Line " + std::to_string(line) + ": invalid value '" + value + "' for " + key + " (" + why + ")");
}

bool ParseBool(std::size_t line, const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "off") {
    return false;
  }
  ThrowInvalid(line, key, value, "expected a boolean");
}

std::uint64_t ParseUnsigned(std::size_t line, const std::string& key, const std::string& value) {
  std::uint64_t out = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty()) {
    ThrowInvalid(line, key, value, "expected a non-negative integer");
  }
  return out;
}

std::chrono::milliseconds ParseMillis(std::size_t line, const std::string& key, const std::string& value) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(ParseUnsigned(line, key, value)));
}

std::vector<std::string> SplitList(const std::string& value, char separator) {
  std::vector<std::string> out;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, separator)) {
    auto trimmed = Trim(item);
    if (!trimmed.empty()) {
      out.push_back(std::move(trimmed));
    }
  }
  return out;
}

using Setter = std::function<void(OrchestrationConfig&, std::size_t, const std::string&, const std::string&)>;

const std::map<std::string, Setter, std::less<>>& Setters() {
  static const std::map<std::string, Setter, std::less<>> kSetters = {
      {"static_analysis.enabled",
       [](auto& c, auto line, const auto& k, const auto& v) { c.static_analysis.enabled = ParseBool(line, k, v); }},
      {"static_analysis.timeout_ms",
       [](auto& c, auto line, const auto& k, const auto& v) { c.static_analysis.timeout = ParseMillis(line, k, v); }},
      {"static_analysis.max_file_size",
       [](auto& c, auto line, const auto& k, const auto& v) {
         c.static_analysis.max_file_size = ParseUnsigned(line, k, v);
       }},
      {"static_analysis.strict_mode",
       [](auto& c, auto line, const auto& k, const auto& v) { c.static_analysis.strict_mode = ParseBool(line, k, v); }},
      {"static_analysis.include_tests",
       [](auto& c, auto line, const auto& k, const auto& v) {
         c.static_analysis.include_tests = ParseBool(line, k, v);
       }},
      {"static_analysis.max_depth",
       [](auto& c, auto line, const auto& k, const auto& v) {
         c.static_analysis.max_depth = static_cast<int>(ParseUnsigned(line, k, v));
       }},
      {"runtime.enabled",
       [](auto& c, auto line, const auto& k, const auto& v) { c.runtime.enabled = ParseBool(line, k, v); }},
      {"runtime.auto_isolate",
       [](auto& c, auto line, const auto& k, const auto& v) { c.runtime.auto_isolate = ParseBool(line, k, v); }},
      {"runtime.policy",
       [](auto& c, auto line, const auto& k, const auto& v) {
         if (v.empty()) {
           ThrowInvalid(line, k, v, "policy id is empty");
         }
         c.runtime.policy = v;
       }},
      {"runtime.sandbox_root",
       [](auto& c, auto, const auto&, const auto& v) { c.runtime.sandbox.root_dir = v; }},
      {"runtime.unit_path", [](auto& c, auto, const auto&, const auto& v) { c.runtime.sandbox.unit_path = v; }},
      {"runtime.interpreter",
       [](auto& c, auto line, const auto& k, const auto& v) {
         auto parts = SplitList(v, ' ');
         if (parts.empty()) {
           ThrowInvalid(line, k, v, "interpreter is empty");
         }
         c.runtime.sandbox.interpreter = std::move(parts);
       }},
      {"runtime.memory_limit",
       [](auto& c, auto line, const auto& k, const auto& v) {
         c.runtime.sandbox.memory.limit_bytes = ParseUnsigned(line, k, v);
       }},
      {"runtime.cpu_time_ms",
       [](auto& c, auto line, const auto& k, const auto& v) { c.runtime.sandbox.cpu.cpu_time = ParseMillis(line, k, v); }},
      {"runtime.max_processes",
       [](auto& c, auto line, const auto& k, const auto& v) {
         c.runtime.sandbox.max_processes = static_cast<std::uint32_t>(ParseUnsigned(line, k, v));
       }},
      {"runtime.metrics_interval_ms",
       [](auto& c, auto line, const auto& k, const auto& v) {
         c.runtime.sandbox.monitoring.metrics_interval = ParseMillis(line, k, v);
       }},
      {"runtime.monitoring",
       [](auto& c, auto line, const auto& k, const auto& v) {
         c.runtime.sandbox.monitoring.enabled = ParseBool(line, k, v);
       }},
      {"signatures.enabled",
       [](auto& c, auto line, const auto& k, const auto& v) { c.signatures.enabled = ParseBool(line, k, v); }},
      {"signatures.require",
       [](auto& c, auto line, const auto& k, const auto& v) { c.signatures.require = ParseBool(line, k, v); }},
      {"signatures.allow_unsigned",
       [](auto& c, auto line, const auto& k, const auto& v) { c.signatures.allow_unsigned = ParseBool(line, k, v); }},
      {"auditing.enabled",
       [](auto& c, auto line, const auto& k, const auto& v) { c.auditing.enabled = ParseBool(line, k, v); }},
      {"auditing.retention_days",
       [](auto& c, auto line, const auto& k, const auto& v) {
         c.auditing.retention_days = static_cast<int>(ParseUnsigned(line, k, v));
       }},
      {"auditing.log", [](auto& c, auto, const auto&, const auto& v) { c.auditing.log = v; }},
      {"compliance.frameworks",
       [](auto& c, auto line, const auto& k, const auto& v) {
         std::vector<audit::ComplianceFramework> frameworks;
         for (const auto& name : SplitList(v, ',')) {
           try {
             frameworks.push_back(audit::ParseComplianceFramework(name));
           } catch (const Error&) {
             ThrowInvalid(line, k, name, "unknown compliance framework");
           }
         }
         c.compliance_frameworks = std::move(frameworks);
       }},
      {"threat_detection.enabled",
       [](auto& c, auto line, const auto& k, const auto& v) { c.threat_detection.enabled = ParseBool(line, k, v); }},
      {"threat_detection.interval_ms",
       [](auto& c, auto line, const auto& k, const auto& v) {
         c.threat_detection.interval = ParseMillis(line, k, v);
       }},
      {"incident_response.enabled",
       [](auto& c, auto line, const auto& k, const auto& v) { c.incident_response.enabled = ParseBool(line, k, v); }},
      {"incident_response.escalation_threshold",
       [](auto& c, auto line, const auto& k, const auto& v) {
         const auto threshold = ParseUnsigned(line, k, v);
         if (threshold == 0) {
           ThrowInvalid(line, k, v, "threshold must be positive");
         }
         c.incident_response.escalation_threshold = static_cast<std::size_t>(threshold);
       }},
      {"crl", [](auto& c, auto, const auto&, const auto& v) { c.crls.emplace_back(v); }},
  };
  return kSetters;
}

void SetAnchor(OrchestrationConfig& config, std::size_t line, const std::string& key, const std::string& value) {
  const auto name = key.substr(std::string_view("anchor.").size());
  const auto colon = value.find(':');
  if (name.empty() || colon == std::string::npos || colon + 1 >= value.size()) {
    ThrowInvalid(line, key, value, "expected <LEVEL>:<pem path>");
  }
  AnchorSetting anchor;
  anchor.name = name;
  try {
    anchor.level = ParseTrustLevel(Trim(value.substr(0, colon)));
  } catch (const Error&) {
    ThrowInvalid(line, key, value, "unknown trust level");
  }
  anchor.pem = Trim(value.substr(colon + 1));
  config.anchors.push_back(std::move(anchor));
}

} // namespace

OrchestrationConfig ParseOrchestrationConfig(std::string_view text) {
  OrchestrationConfig config;
  std::set<std::string> seen;
  std::istringstream stream{std::string(text)};
  std::string raw;
  std::size_t line_number = 0;
  while (std::getline(stream, raw)) {
    ++line_number;
    if (!raw.empty() && raw.back() == '\r') {
      raw.pop_back();
    }
    const auto line = Trim(raw);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      throw Error(ErrorDomain::Config, errors::config::kMalformedLine,
                  "Line " + std::to_string(line_number) + ": expected key=value");
    }
    const auto key = Trim(std::string_view(line).substr(0, eq));
    const auto value = Trim(std::string_view(line).substr(eq + 1));
    if (key != "crl" && !seen.insert(key).second) {
      throw Error(ErrorDomain::Config, errors::config::kDuplicateKey,
                  "Line " + std::to_string(line_number) + ": duplicate key " + key);
    }
    if (key.rfind("anchor.", 0) == 0) {
      SetAnchor(config, line_number, key, value);
      continue;
    }
    const auto& setters = Setters();
    auto it = setters.find(key);
    if (it == setters.end()) {
      throw Error(ErrorDomain::Config, errors::config::kUnknownKey,
                  "Line " + std::to_string(line_number) + ": unknown key " + key);
    }
    it->second(config, line_number, key, value);
  }
  return config;
}

OrchestrationConfig LoadOrchestrationConfig(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw Error(ErrorDomain::Config, errors::config::kFileMissing, "Configuration file not found: " + path.string());
  }
  auto config = ParseOrchestrationConfig(ReadFileText(path));
  const auto base = path.parent_path();
  auto resolve = [&base](std::filesystem::path& p) {
    if (!p.empty() && p.is_relative()) {
      p = base / p;
    }
  };
  for (auto& anchor : config.anchors) {
    resolve(anchor.pem);
  }
  for (auto& crl : config.crls) {
    resolve(crl);
  }
  resolve(config.auditing.log);
  return config;
}

} // namespace pw::orchestrator
