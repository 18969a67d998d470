#include "pw/analysis/flow.h"

#include <algorithm>
#include <array>
#include <map>
#include <string_view>

#include "pw/analysis/rules.h"

namespace pw::analysis {

namespace {

constexpr std::array<std::string_view, 19> kSourcePrefixes = {
    "req.body",     "req.query",      "req.params",      "req.headers",  "req.cookies",
    "request.body", "request.query",  "request.params",  "request.headers",
    "ctx.request",  "ctx.query",      "ctx.params",      "process.argv", "process.env",
    "event.data",   "message.data",   "location.search", "location.hash", "response.data"};

// Network clients whose results count as untrusted response data.
constexpr std::array<std::string_view, 5> kNetworkRoots = {"fetch", "axios", "got", "superagent",
                                                           "needle"};

constexpr std::array<std::string_view, 15> kSanitizers = {
    "escape",      "escapeHtml",  "sanitize",   "sanitizeHtml", "encodeURIComponent",
    "parseInt",    "parseFloat",  "Number",     "basename",     "escapeShellArg",
    "shellescape", "quote",       "validate",   "isValid",      "escapeId"};

bool PathMatches(std::string_view ref, std::string_view prefix) {
  return ref == prefix || (ref.size() > prefix.size() && ref.compare(0, prefix.size(), prefix) == 0 &&
                           ref[prefix.size()] == '.');
}

std::string_view FirstSegment(std::string_view path) {
  const auto dot = path.find('.');
  return dot == std::string_view::npos ? path : path.substr(0, dot);
}

struct SinkUse {
  std::string variable;
  std::string origin;
};

std::optional<SinkUse> FindUse(const CallNode& call,
                               const std::map<std::string, std::string>& names) {
  for (const auto& arg : call.arguments) {
    if (IsSanitized(arg)) {
      continue;
    }
    for (const auto& ref : arg.References()) {
      for (const auto& [name, origin] : names) {
        if (PathMatches(ref, name)) {
          return SinkUse{name, origin};
        }
      }
    }
  }
  return std::nullopt;
}

SecurityVulnerability SinkFinding(const CallNode& call, SinkKind kind, const SinkUse& use,
                                  DetectionPass pass) {
  SecurityVulnerability v;
  v.line = call.line;
  v.pass = pass;
  const bool command = kind == SinkKind::kCommand;
  v.type = command ? VulnerabilityType::kCommandInjection : VulnerabilityType::kInjection;
  v.cwe = command ? "CWE-78" : "CWE-20";
  if (pass == DetectionPass::kTaint) {
    v.severity = command ? Severity::kCritical : Severity::kHigh;
    v.title = "Tainted value reaches sensitive sink";
  } else {
    v.severity = Severity::kHigh;
    v.title = "Untrusted input reaches sensitive sink";
  }
  v.description = "Value of '" + use.variable + "' from " + use.origin + " flows into " +
                  call.callee;
  v.remediation = "Validate or sanitize untrusted data before passing it to " + call.callee + ".";
  return v;
}

} // namespace

std::optional<std::string> UntrustedSource(const Expression& expr) {
  for (const auto& ref : expr.References()) {
    for (std::string_view prefix : kSourcePrefixes) {
      if (PathMatches(ref, prefix)) {
        return std::string(prefix);
      }
    }
    const std::string_view root = FirstSegment(ref);
    if (std::find(kNetworkRoots.begin(), kNetworkRoots.end(), root) != kNetworkRoots.end()) {
      return std::string(root) + " response";
    }
  }
  return std::nullopt;
}

bool IsSanitized(const Expression& expr) {
  for (const auto& ref : expr.References()) {
    const std::string_view last = LastSegment(ref);
    if (std::find(kSanitizers.begin(), kSanitizers.end(), last) != kSanitizers.end()) {
      return true;
    }
  }
  return false;
}

std::vector<SecurityVulnerability> RunDataFlowPass(const SyntaxTree& tree) {
  std::vector<SecurityVulnerability> out;
  std::map<std::string, std::string> direct;
  for (const auto& node : tree.nodes) {
    if (const auto* assign = std::get_if<AssignmentNode>(&node)) {
      auto source = UntrustedSource(assign->value);
      if (source && !IsSanitized(assign->value)) {
        direct[assign->target] = *source;
      } else {
        direct.erase(assign->target);
      }
      continue;
    }
    const auto* call = std::get_if<CallNode>(&node);
    if (call == nullptr) {
      continue;
    }
    const SinkKind kind = ClassifySink(call->callee);
    if (kind == SinkKind::kNone) {
      continue;
    }
    if (auto use = FindUse(*call, direct)) {
      out.push_back(SinkFinding(*call, kind, *use, DetectionPass::kDataFlow));
      continue;
    }
    for (const auto& arg : call->arguments) {
      auto source = UntrustedSource(arg);
      if (source && !IsSanitized(arg)) {
        out.push_back(SinkFinding(*call, kind, SinkUse{*source, *source}, DetectionPass::kDataFlow));
        break;
      }
    }
  }
  return out;
}

std::vector<SecurityVulnerability> RunTaintPass(const SyntaxTree& tree) {
  std::vector<const AssignmentNode*> assignments;
  std::vector<const CallNode*> sinks;
  for (const auto& node : tree.nodes) {
    if (const auto* assign = std::get_if<AssignmentNode>(&node)) {
      assignments.push_back(assign);
    } else if (const auto* call = std::get_if<CallNode>(&node)) {
      if (ClassifySink(call->callee) != SinkKind::kNone) {
        sinks.push_back(call);
      }
    }
  }

  std::map<std::string, std::string> tainted;
  for (const auto* assign : assignments) {
    auto source = UntrustedSource(assign->value);
    if (source && !IsSanitized(assign->value)) {
      tainted.emplace(assign->target, *source);
    }
  }
  // Each round adds at least one name, so |assignments| rounds suffice.
  bool changed = !tainted.empty();
  for (std::size_t round = 0; changed && round < assignments.size(); ++round) {
    changed = false;
    for (const auto* assign : assignments) {
      if (tainted.count(assign->target) != 0 || IsSanitized(assign->value)) {
        continue;
      }
      for (const auto& ref : assign->value.References()) {
        auto hit = std::find_if(tainted.begin(), tainted.end(), [&ref](const auto& entry) {
          return PathMatches(ref, entry.first);
        });
        if (hit != tainted.end()) {
          const std::string origin = hit->second;
          tainted.emplace(assign->target, origin);
          changed = true;
          break;
        }
      }
    }
  }

  std::vector<SecurityVulnerability> out;
  if (tainted.empty()) {
    return out;
  }
  for (const auto* call : sinks) {
    if (auto use = FindUse(*call, tainted)) {
      out.push_back(SinkFinding(*call, ClassifySink(call->callee), *use, DetectionPass::kTaint));
    }
  }
  return out;
}

} // namespace pw::analysis
