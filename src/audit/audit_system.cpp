#include "pw/audit/audit_system.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

#include "pw/error.h"
#include "pw/errors.h"
#include "pw/orchestrator/event_bus.h"

namespace pw::audit {

using nlohmann::json;

namespace {

constexpr auto kStaleIncidentAge = std::chrono::hours(24);
constexpr std::size_t kMaxFindingEvidence = 10;

std::string Trim(std::string_view text) {
  const auto begin = text.find_first_not_of(" \t");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t");
  return std::string(text.substr(begin, end - begin + 1));
}

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ContainsNoCase(std::string_view haystack, std::string_view needle) {
  return !needle.empty() && Lower(haystack).find(Lower(needle)) != std::string::npos;
}

bool IsUnresolved(IncidentStatus status) noexcept {
  return status == IncidentStatus::kOpen || status == IncidentStatus::kInProgress ||
         status == IncidentStatus::kEscalated;
}

double Minutes(TimePoint from, TimePoint to) {
  return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

int RiskWeight(Severity severity) noexcept {
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

orchestrator::EventSeverity BusSeverity(Severity severity) noexcept {
  switch (severity) {
  case Severity::kCritical:
    return orchestrator::EventSeverity::kCritical;
  case Severity::kHigh:
    return orchestrator::EventSeverity::kError;
  case Severity::kMedium:
    return orchestrator::EventSeverity::kWarning;
  case Severity::kLow:
  case Severity::kInfo:
    return orchestrator::EventSeverity::kInfo;
  }
  return orchestrator::EventSeverity::kInfo;
}

void AddUnique(std::vector<std::string>& values, const std::string& value) {
  if (!value.empty() && std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

IncidentCategory CategoryFor(EventType type) noexcept {
  switch (type) {
  case EventType::kDataExfiltration:
  case EventType::kDataAccess:
    return IncidentCategory::kPrivacy;
  case EventType::kPolicyViolation:
    return IncidentCategory::kCompliance;
  case EventType::kSystemError:
    return IncidentCategory::kOperational;
  case EventType::kRuntimeViolation:
    return IncidentCategory::kAvailability;
  default:
    return IncidentCategory::kSecurity;
  }
}

json ToJson(const std::optional<std::string>& value) {
  return value ? json(*value) : json(nullptr);
}

json ToJson(const SecurityEvent& event) {
  json details = json::object();
  for (const auto& [key, value] : event.details) {
    details[key] = value;
  }
  return json{
      {"id", event.id},
      {"timestamp", FormatTimestamp(event.timestamp)},
      {"type", ToString(event.type)},
      {"severity", ToString(event.severity)},
      {"source",
       {{"type", ToString(event.source.type)},
        {"component", event.source.component},
        {"instance", event.source.instance}}},
      {"plugin_id", ToJson(event.plugin_id)},
      {"sandbox_id", ToJson(event.sandbox_id)},
      {"request_id", event.context.request_id},
      {"user_id", ToJson(event.context.user_id)},
      {"ip_address", event.context.ip_address},
      {"user_agent", ToJson(event.context.user_agent)},
      {"session_id", ToJson(event.context.session_id)},
      {"description", event.description},
      {"details", details},
      {"tags", event.tags},
      {"correlation_id", ToJson(event.correlation_id)},
      {"resolved", event.resolved},
      {"resolved_at", event.resolved_at ? json(FormatTimestamp(*event.resolved_at)) : json(nullptr)},
      {"resolved_by", ToJson(event.resolved_by)},
      {"mitigation", event.mitigation},
  };
}

json ToJson(const SecurityIncident& incident) {
  json timeline = json::array();
  for (const auto& entry : incident.timeline) {
    timeline.push_back({{"timestamp", FormatTimestamp(entry.timestamp)},
                        {"action", entry.action},
                        {"actor", entry.actor},
                        {"description", entry.description}});
  }
  return json{
      {"id", incident.id},
      {"title", incident.title},
      {"description", incident.description},
      {"severity", ToString(incident.severity)},
      {"status", ToString(incident.status)},
      {"category", ToString(incident.category)},
      {"source", incident.source},
      {"created_at", FormatTimestamp(incident.created_at)},
      {"detected_at", FormatTimestamp(incident.detected_at)},
      {"events", incident.event_ids},
      {"affected_plugins", incident.affected_plugins},
      {"affected_users", incident.affected_users},
      {"impact",
       {{"data_exposed", incident.impact.data_exposed},
        {"systems_affected", incident.impact.systems_affected},
        {"users_affected", incident.impact.users_affected},
        {"data_volume", incident.impact.data_volume},
        {"reputation_impact", ToString(incident.impact.reputation_impact)},
        {"compliance_impact", incident.impact.compliance_impact},
        {"availability_impact", ToString(incident.impact.availability_impact)}}},
      {"timeline", timeline},
      {"assigned_to", ToJson(incident.assigned_to)},
      {"resolved_at", incident.resolved_at ? json(FormatTimestamp(*incident.resolved_at)) : json(nullptr)},
      {"resolution", incident.resolution},
  };
}

json ToJson(const AuditMetrics& metrics) {
  json by_type = json::object();
  for (const auto& [type, count] : metrics.events_by_type) {
    by_type[std::string(ToString(type))] = count;
  }
  json by_severity = json::object();
  for (const auto& [severity, count] : metrics.events_by_severity) {
    by_severity[std::string(ToString(severity))] = count;
  }
  json by_status = json::object();
  for (const auto& [status, count] : metrics.incidents_by_status) {
    by_status[std::string(ToString(status))] = count;
  }
  json incident_severity = json::object();
  for (const auto& [severity, count] : metrics.incidents_by_severity) {
    incident_severity[std::string(ToString(severity))] = count;
  }
  return json{
      {"total_events", metrics.total_events},
      {"events_by_type", by_type},
      {"events_by_severity", by_severity},
      {"total_incidents", metrics.total_incidents},
      {"incidents_by_status", by_status},
      {"incidents_by_severity", incident_severity},
      {"mean_time_to_detect_minutes", metrics.mean_time_to_detect_minutes},
      {"mean_time_to_resolve_minutes", metrics.mean_time_to_resolve_minutes},
      {"compliance_score", metrics.compliance_score},
      {"risk_score", metrics.risk_score},
      {"threats_blocked", metrics.threats_blocked},
      {"active_threats", metrics.active_threats},
  };
}

json ToJson(const ComplianceReport& report) {
  json controls = json::array();
  for (const auto& control : report.controls) {
    controls.push_back({{"id", control.id},
                        {"name", control.name},
                        {"category", control.category},
                        {"status", ToString(control.status)},
                        {"score", control.score},
                        {"evidence", control.evidence},
                        {"owner", control.owner}});
  }
  json violations = json::array();
  for (const auto& violation : report.violations) {
    violations.push_back({{"id", violation.id},
                          {"control_id", violation.control_id},
                          {"severity", ToString(violation.severity)},
                          {"description", violation.description},
                          {"remediation", violation.remediation},
                          {"due_date", FormatTimestamp(violation.due_date)}});
  }
  json recommendations = json::array();
  for (const auto& recommendation : report.recommendations) {
    recommendations.push_back({{"id", recommendation.id},
                               {"title", recommendation.title},
                               {"description", recommendation.description},
                               {"priority", ToString(recommendation.priority)},
                               {"category", recommendation.category}});
  }
  json evidence = json::array();
  for (const auto& item : report.evidence) {
    evidence.push_back({{"id", item.id},
                        {"type", item.type},
                        {"description", item.description},
                        {"data", item.data},
                        {"hash", item.hash},
                        {"verified", item.verified}});
  }
  return json{
      {"id", report.id},
      {"framework", ToString(report.framework)},
      {"period_start", FormatTimestamp(report.period.start)},
      {"period_end", FormatTimestamp(report.period.end)},
      {"overall_score", report.overall_score},
      {"controls", controls},
      {"violations", violations},
      {"recommendations", recommendations},
      {"evidence", evidence},
      {"generated_at", FormatTimestamp(report.generated_at)},
      {"next_review", FormatTimestamp(report.next_review)},
  };
}

std::string CsvCell(const json& value) {
  std::string text;
  if (value.is_null()) {
    return {};
  }
  text = value.is_string() ? value.get<std::string>() : value.dump();
  if (text.find_first_of(",\"\n\r") == std::string::npos) {
    return text;
  }
  std::string quoted = "\"";
  for (char c : text) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

std::string ToCsv(const json& data) {
  std::ostringstream out;
  if (data.is_array()) {
    std::vector<std::string> columns;
    for (const auto& row : data) {
      for (const auto& item : row.items()) {
        AddUnique(columns, item.key());
      }
    }
    for (std::size_t i = 0; i < columns.size(); ++i) {
      out << (i ? "," : "") << CsvCell(columns[i]);
    }
    out << "\n";
    for (const auto& row : data) {
      for (std::size_t i = 0; i < columns.size(); ++i) {
        out << (i ? "," : "");
        if (row.contains(columns[i])) {
          out << CsvCell(row.at(columns[i]));
        }
      }
      out << "\n";
    }
    return out.str();
  }
  out << "key,value\n";
  for (const auto& item : data.items()) {
    out << CsvCell(item.key()) << "," << CsvCell(item.value()) << "\n";
  }
  return out.str();
}

std::string XmlEscape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      out.push_back(c);
    }
  }
  return out;
}

std::string XmlName(std::string_view key) {
  std::string name;
  for (char c : key) {
    const auto uc = static_cast<unsigned char>(c);
    name.push_back(std::isalnum(uc) || c == '_' || c == '-' || c == '.' ? c : '_');
  }
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) || name.front() == '-' ||
      name.front() == '.') {
    name.insert(name.begin(), '_');
  }
  return name;
}

void WriteXml(std::ostringstream& out, const std::string& name, const json& value, int depth) {
  const std::string indent(static_cast<std::size_t>(depth) * 2, ' ');
  if (value.is_object()) {
    out << indent << "<" << name << ">\n";
    for (const auto& item : value.items()) {
      WriteXml(out, XmlName(item.key()), item.value(), depth + 1);
    }
    out << indent << "</" << name << ">\n";
  } else if (value.is_array()) {
    out << indent << "<" << name << ">\n";
    for (const auto& item : value) {
      WriteXml(out, "item", item, depth + 1);
    }
    out << indent << "</" << name << ">\n";
  } else if (value.is_null()) {
    out << indent << "<" << name << "/>\n";
  } else {
    out << indent << "<" << name << ">"
        << XmlEscape(value.is_string() ? value.get<std::string>() : value.dump()) << "</" << name << ">\n";
  }
}

std::string ToXml(ExportKind kind, const json& data) {
  std::ostringstream out;
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  out << "<export kind=\"" << ToString(kind) << "\">\n";
  if (data.is_array()) {
    for (const auto& item : data) {
      WriteXml(out, "record", item, 1);
    }
  } else {
    for (const auto& item : data.items()) {
      WriteXml(out, XmlName(item.key()), item.value(), 1);
    }
  }
  out << "</export>\n";
  return out.str();
}

[[noreturn]] void ThrowUnknown(std::string_view kind, std::string_view name) {
  throw Error(ErrorDomain::Validation, errors::validation::kUnknownEnumName,
              "Unknown " + std::string(kind) + ": " + std::string(name));
}

} // namespace

std::string_view ToString(EventType type) noexcept {
  switch (type) {
  case EventType::kLoginSuccess:
    return "LOGIN_SUCCESS";
  case EventType::kLoginFailure:
    return "LOGIN_FAILURE";
  case EventType::kPermissionDenied:
    return "PERMISSION_DENIED";
  case EventType::kPluginInstall:
    return "PLUGIN_INSTALL";
  case EventType::kPluginUninstall:
    return "PLUGIN_UNINSTALL";
  case EventType::kPluginExecution:
    return "PLUGIN_EXECUTION";
  case EventType::kSecurityViolation:
    return "SECURITY_VIOLATION";
  case EventType::kRuntimeViolation:
    return "RUNTIME_VIOLATION";
  case EventType::kDataAccess:
    return "DATA_ACCESS";
  case EventType::kDataExfiltration:
    return "DATA_EXFILTRATION";
  case EventType::kConfigurationChange:
    return "CONFIGURATION_CHANGE";
  case EventType::kMalwareDetected:
    return "MALWARE_DETECTED";
  case EventType::kSuspiciousActivity:
    return "SUSPICIOUS_ACTIVITY";
  case EventType::kPolicyViolation:
    return "POLICY_VIOLATION";
  case EventType::kSystemError:
    return "SYSTEM_ERROR";
  }
  return "SUSPICIOUS_ACTIVITY";
}

EventType ParseEventType(std::string_view name) {
  for (int i = 0; i <= static_cast<int>(EventType::kSystemError); ++i) {
    const auto candidate = static_cast<EventType>(i);
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  ThrowUnknown("event type", name);
}

std::string_view ToString(SourceType type) noexcept {
  switch (type) {
  case SourceType::kPlugin:
    return "PLUGIN";
  case SourceType::kSystem:
    return "SYSTEM";
  case SourceType::kUser:
    return "USER";
  case SourceType::kNetwork:
    return "NETWORK";
  case SourceType::kApplication:
    return "APPLICATION";
  case SourceType::kExternal:
    return "EXTERNAL";
  }
  return "SYSTEM";
}

std::string_view ToString(IncidentStatus status) noexcept {
  switch (status) {
  case IncidentStatus::kOpen:
    return "OPEN";
  case IncidentStatus::kInProgress:
    return "IN_PROGRESS";
  case IncidentStatus::kResolved:
    return "RESOLVED";
  case IncidentStatus::kClosed:
    return "CLOSED";
  case IncidentStatus::kEscalated:
    return "ESCALATED";
  }
  return "OPEN";
}

IncidentStatus ParseIncidentStatus(std::string_view name) {
  for (auto candidate : {IncidentStatus::kOpen, IncidentStatus::kInProgress, IncidentStatus::kResolved,
                         IncidentStatus::kClosed, IncidentStatus::kEscalated}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  ThrowUnknown("incident status", name);
}

std::string_view ToString(IncidentCategory category) noexcept {
  switch (category) {
  case IncidentCategory::kSecurity:
    return "SECURITY";
  case IncidentCategory::kCompliance:
    return "COMPLIANCE";
  case IncidentCategory::kOperational:
    return "OPERATIONAL";
  case IncidentCategory::kPrivacy:
    return "PRIVACY";
  case IncidentCategory::kAvailability:
    return "AVAILABILITY";
  }
  return "SECURITY";
}

std::string_view ToString(AvailabilityImpact impact) noexcept {
  switch (impact) {
  case AvailabilityImpact::kNone:
    return "NONE";
  case AvailabilityImpact::kMinor:
    return "MINOR";
  case AvailabilityImpact::kMajor:
    return "MAJOR";
  case AvailabilityImpact::kCritical:
    return "CRITICAL";
  }
  return "NONE";
}

std::string_view ToString(PolicyAction action) noexcept {
  switch (action) {
  case PolicyAction::kAllow:
    return "ALLOW";
  case PolicyAction::kWarn:
    return "WARN";
  case PolicyAction::kDeny:
    return "DENY";
  case PolicyAction::kQuarantine:
    return "QUARANTINE";
  case PolicyAction::kEscalate:
    return "ESCALATE";
  }
  return "WARN";
}

PolicyAction ParsePolicyAction(std::string_view name) {
  for (auto candidate : {PolicyAction::kAllow, PolicyAction::kWarn, PolicyAction::kDeny, PolicyAction::kQuarantine,
                         PolicyAction::kEscalate}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  ThrowUnknown("policy action", name);
}

std::string_view ToString(IndicatorType type) noexcept {
  switch (type) {
  case IndicatorType::kIpAddress:
    return "IP";
  case IndicatorType::kDomain:
    return "DOMAIN";
  case IndicatorType::kHash:
    return "HASH";
  case IndicatorType::kUserAgent:
    return "USER_AGENT";
  case IndicatorType::kUrl:
    return "URL";
  }
  return "IP";
}

std::string_view ToString(ExportKind kind) noexcept {
  switch (kind) {
  case ExportKind::kEvents:
    return "EVENTS";
  case ExportKind::kIncidents:
    return "INCIDENTS";
  case ExportKind::kMetrics:
    return "METRICS";
  case ExportKind::kCompliance:
    return "COMPLIANCE";
  }
  return "EVENTS";
}

std::string_view ToString(ExportFormat format) noexcept {
  switch (format) {
  case ExportFormat::kJson:
    return "JSON";
  case ExportFormat::kCsv:
    return "CSV";
  case ExportFormat::kXml:
    return "XML";
  }
  return "JSON";
}

ExportKind ParseExportKind(std::string_view name) {
  for (auto candidate : {ExportKind::kEvents, ExportKind::kIncidents, ExportKind::kMetrics, ExportKind::kCompliance}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  ThrowUnknown("export kind", name);
}

ExportFormat ParseExportFormat(std::string_view name) {
  for (auto candidate : {ExportFormat::kJson, ExportFormat::kCsv, ExportFormat::kXml}) {
    if (ToString(candidate) == name) {
      return candidate;
    }
  }
  ThrowUnknown("export format", name);
}

std::string_view ToString(AuditType type) noexcept {
  switch (type) {
  case AuditType::kPeriodic:
    return "PERIODIC";
  case AuditType::kIncident:
    return "INCIDENT";
  case AuditType::kCompliance:
    return "COMPLIANCE";
  }
  return "PERIODIC";
}

bool IsValidTransition(IncidentStatus from, IncidentStatus to, Severity severity) noexcept {
  const bool critical = severity == Severity::kCritical;
  switch (from) {
  case IncidentStatus::kOpen:
    return to == IncidentStatus::kInProgress || (to == IncidentStatus::kEscalated && critical);
  case IncidentStatus::kInProgress:
    return to == IncidentStatus::kResolved || (to == IncidentStatus::kEscalated && critical);
  case IncidentStatus::kEscalated:
    return to == IncidentStatus::kInProgress || to == IncidentStatus::kResolved;
  case IncidentStatus::kResolved:
    return to == IncidentStatus::kClosed || to == IncidentStatus::kInProgress;
  case IncidentStatus::kClosed:
    return false;
  }
  return false;
}

struct AuditSystem::CompiledRule {
  struct Clause {
    std::string field;
    std::string op;
    std::string value;
    std::optional<Severity> severity;
  };
  std::vector<Clause> clauses;

  static CompiledRule Compile(const AuditRule& rule) {
    static const std::set<std::string> kFields = {"type",       "severity",         "plugin_id", "user_id",
                                                  "ip_address", "source.component", "tag",       "description"};
    static const std::vector<std::string> kOps = {"==", "!=", ">=", "<=", "contains"};
    auto fail = [&rule](const std::string& why) {
      return Error(ErrorDomain::Validation, errors::validation::kRuleConditionInvalid,
                   "Rule " + rule.id + " condition invalid: " + why);
    };
    CompiledRule compiled;
    std::string_view rest = rule.condition;
    while (true) {
      const auto split = rest.find("&&");
      const std::string clause_text = Trim(rest.substr(0, split));
      if (clause_text.empty()) {
        throw fail("empty clause");
      }
      std::istringstream in(clause_text);
      Clause clause;
      in >> clause.field >> clause.op;
      std::getline(in, clause.value);
      clause.value = Trim(clause.value);
      if (clause.value.size() >= 2 && (clause.value.front() == '\'' || clause.value.front() == '"') &&
          clause.value.back() == clause.value.front()) {
        clause.value = clause.value.substr(1, clause.value.size() - 2);
      }
      if (kFields.count(clause.field) == 0) {
        throw fail("unknown field '" + clause.field + "'");
      }
      if (std::find(kOps.begin(), kOps.end(), clause.op) == kOps.end()) {
        throw fail("unknown operator '" + clause.op + "'");
      }
      if ((clause.op == ">=" || clause.op == "<=") && clause.field != "severity") {
        throw fail("ordering operators apply to severity only");
      }
      try {
        if (clause.field == "severity") {
          clause.severity = ParseSeverity(clause.value);
        } else if (clause.field == "type" && clause.op != "contains") {
          ParseEventType(clause.value);
        }
      } catch (const Error& err) {
        throw fail(err.what());
      }
      compiled.clauses.push_back(std::move(clause));
      if (split == std::string_view::npos) {
        break;
      }
      rest = rest.substr(split + 2);
    }
    return compiled;
  }

  static bool Compare(const std::string& actual, const Clause& clause) {
    if (clause.op == "==") {
      return actual == clause.value;
    }
    if (clause.op == "!=") {
      return actual != clause.value;
    }
    return ContainsNoCase(actual, clause.value);
  }

  bool Matches(const SecurityEvent& event) const {
    for (const auto& clause : clauses) {
      bool ok = false;
      if (clause.field == "severity") {
        const auto want = *clause.severity;
        if (clause.op == "==") {
          ok = event.severity == want;
        } else if (clause.op == "!=") {
          ok = event.severity != want;
        } else if (clause.op == ">=") {
          ok = event.severity >= want;
        } else if (clause.op == "<=") {
          ok = event.severity <= want;
        } else {
          ok = ContainsNoCase(ToString(event.severity), clause.value);
        }
      } else if (clause.field == "tag") {
        const bool any = std::any_of(event.tags.begin(), event.tags.end(), [&](const std::string& tag) {
          return clause.op == "contains" ? ContainsNoCase(tag, clause.value) : tag == clause.value;
        });
        ok = clause.op == "!=" ? !any : any;
      } else {
        std::string actual;
        if (clause.field == "type") {
          actual = std::string(ToString(event.type));
        } else if (clause.field == "plugin_id") {
          actual = event.plugin_id.value_or("");
        } else if (clause.field == "user_id") {
          actual = event.context.user_id.value_or("");
        } else if (clause.field == "ip_address") {
          actual = event.context.ip_address;
        } else if (clause.field == "source.component") {
          actual = event.source.component;
        } else {
          actual = event.description;
        }
        ok = Compare(actual, clause);
      }
      if (!ok) {
        return false;
      }
    }
    return true;
  }
};

struct AuditSystem::Pending {
  std::vector<orchestrator::Event> events;
};

AuditSystem::AuditSystem(orchestrator::EventBus& bus, AuditOptions options, AuditHooks hooks)
    : bus_(bus), options_(std::move(options)), hooks_(std::move(hooks)) {}

AuditSystem::~AuditSystem() = default;

TimePoint AuditSystem::Now() const {
  return hooks_.now ? hooks_.now() : Clock::now();
}

// Record timestamps are strictly increasing so that events are totally ordered.
TimePoint AuditSystem::NextTimestampLocked() {
  auto now = Now();
  if (now <= last_timestamp_) {
    now = last_timestamp_ + std::chrono::microseconds(1);
  }
  last_timestamp_ = now;
  return now;
}

void AuditSystem::SetAuditLog(std::shared_ptr<orchestrator::JsonLineLogger> log) {
  std::lock_guard<std::mutex> guard(mutex_);
  log_ = std::move(log);
}

std::string AuditSystem::CorrelationKey(const SecurityEvent& event) const {
  if (event.correlation_id && !event.correlation_id->empty()) {
    return "corr:" + *event.correlation_id;
  }
  if (event.plugin_id && !event.plugin_id->empty()) {
    return "plugin:" + *event.plugin_id;
  }
  return "ip:" + event.context.ip_address + "|" + std::string(ToString(event.type));
}

void AuditSystem::Flush(Pending& pending) {
  for (const auto& event : pending.events) {
    try {
      bus_.Publish(event);
    } catch (const std::exception& ex) {
      std::clog << "{\"event\":\"audit_publish_failed\",\"message\":\"" << ex.what() << "\"}" << std::endl;
    }
  }
  pending.events.clear();
}

SecurityEvent AuditSystem::RecordEvent(SecurityEvent draft) {
  Pending pending;
  SecurityEvent stored;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    draft.id = MakeId("evt");
    draft.timestamp = NextTimestampLocked();
    draft.resolved = false;
    draft.resolved_at.reset();
    draft.resolved_by.reset();

    ++metrics_.total_events;
    ++metrics_.events_by_type[draft.type];
    ++metrics_.events_by_severity[draft.severity];

    event_index_[draft.id] = events_.size();
    events_.push_back(std::move(draft));
    auto& event = events_.back();

    orchestrator::Event bus_event;
    bus_event.category = orchestrator::EventCategory::kSecurity;
    bus_event.severity = BusSeverity(event.severity);
    bus_event.event_id = "security_event";
    bus_event.message = event.description;
    bus_event.fields.emplace_back("audit_event_id", event.id);
    bus_event.fields.emplace_back("type", std::string(ToString(event.type)));
    bus_event.fields.emplace_back("severity", std::string(ToString(event.severity)));
    bus_event.fields.emplace_back("request_id", event.context.request_id);
    if (event.plugin_id) {
      bus_event.fields.emplace_back("plugin_id", *event.plugin_id);
    }
    if (event.context.user_id) {
      bus_event.fields.emplace_back("user_id", *event.context.user_id, orchestrator::FieldPrivacy::kHash);
    }
    bus_event.fields.emplace_back("ip_address", event.context.ip_address, orchestrator::FieldPrivacy::kRedact);
    pending.events.push_back(std::move(bus_event));

    EvaluateLocked(event, pending);
    stored = events_.at(event_index_.at(event.id));
  }
  Flush(pending);
  return stored;
}

void AuditSystem::EvaluateLocked(SecurityEvent& event, Pending& pending) {
  std::vector<std::string> reasons;
  Severity incident_severity = event.severity;
  bool trigger = event.severity == Severity::kCritical;
  if (trigger) {
    reasons.push_back("critical event");
  }

  // Policy rules.
  for (std::size_t p = 0; p < policies_.size(); ++p) {
    auto& policy = policies_[p];
    if (!policy.active) {
      continue;
    }
    for (std::size_t r = 0; r < policy.rules.size(); ++r) {
      auto& rule = policy.rules[r];
      if (!rule.enabled || !compiled_rules_[p][r].Matches(event)) {
        continue;
      }
      ++rule.trigger_count;
      rule.last_triggered = event.timestamp;
      AddUnique(event.tags, "rule:" + rule.id);
      if (rule.action == PolicyAction::kDeny || rule.action == PolicyAction::kQuarantine) {
        ++metrics_.threats_blocked;
        AddUnique(event.tags, "blocked");
      }
      if (rule.severity >= Severity::kHigh || rule.action == PolicyAction::kEscalate) {
        trigger = true;
        incident_severity = std::max(incident_severity, rule.severity);
        reasons.push_back("policy rule " + rule.id + " (" + std::string(ToString(rule.action)) + ")");
      }
    }
  }

  // Threat intelligence.
  for (const auto& indicator : indicators_) {
    if (!indicator.active || (indicator.expires_at && *indicator.expires_at < event.timestamp)) {
      continue;
    }
    bool match = false;
    switch (indicator.type) {
    case IndicatorType::kIpAddress:
      match = event.context.ip_address == indicator.value;
      break;
    case IndicatorType::kUserAgent:
      match = event.context.user_agent && ContainsNoCase(*event.context.user_agent, indicator.value);
      break;
    case IndicatorType::kHash:
      match = std::any_of(event.details.begin(), event.details.end(),
                          [&](const auto& entry) { return Lower(entry.second) == Lower(indicator.value); });
      break;
    case IndicatorType::kDomain:
    case IndicatorType::kUrl:
      match = ContainsNoCase(event.description, indicator.value) ||
              std::any_of(event.details.begin(), event.details.end(),
                          [&](const auto& entry) { return ContainsNoCase(entry.second, indicator.value); });
      break;
    }
    if (match) {
      trigger = true;
      incident_severity = std::max(incident_severity, indicator.severity);
      AddUnique(event.tags, "threat:" + indicator.id);
      reasons.push_back("threat indicator " + std::string(ToString(indicator.type)) + " " + indicator.value);
    }
  }

  // Correlation and anomaly score.
  const auto key = CorrelationKey(event);
  const auto window_start = event.timestamp - options_.correlation_window;
  const auto anomaly_start = event.timestamp - options_.anomaly_window;
  const std::string subject = event.plugin_id.value_or(event.context.ip_address);
  // Routine INFO/LOW traffic neither counts toward nor triggers correlation.
  const bool notable = event.severity >= Severity::kMedium;
  std::vector<std::string> correlated;
  std::size_t burst = 0;
  // events_ is ordered by timestamp, so only the tail inside the widest window is visited.
  const auto scan_start = std::min(window_start, anomaly_start);
  for (auto it = events_.rbegin(); notable && it != events_.rend(); ++it) {
    const auto& other = *it;
    if (other.timestamp < scan_start) {
      break;
    }
    if (other.severity < Severity::kMedium) {
      continue;
    }
    if (other.timestamp >= window_start && CorrelationKey(other) == key) {
      correlated.push_back(other.id);
      incident_severity = std::max(incident_severity, other.severity);
    }
    if (other.timestamp >= anomaly_start && other.type == event.type &&
        other.plugin_id.value_or(other.context.ip_address) == subject) {
      ++burst;
    }
  }
  std::reverse(correlated.begin(), correlated.end());
  if (correlated.size() >= options_.correlation_threshold) {
    trigger = true;
    reasons.push_back(std::to_string(correlated.size()) + " correlated events");
  }
  const double anomaly =
      std::min(1.0, static_cast<double>(burst) / static_cast<double>(std::max<std::size_t>(options_.anomaly_burst, 1)));
  if (anomaly > options_.anomaly_threshold) {
    trigger = true;
    reasons.push_back("anomaly score " + std::to_string(anomaly).substr(0, 4));
  }

  // An unresolved incident for the same key absorbs the event.
  for (auto& incident : incidents_) {
    if (!notable || incident.correlation_key != key || !IsUnresolved(incident.status)) {
      continue;
    }
    AddUnique(incident.event_ids, event.id);
    if (event.plugin_id) {
      AddUnique(incident.affected_plugins, *event.plugin_id);
      AddUnique(incident.impact.systems_affected, *event.plugin_id);
    }
    if (event.context.user_id) {
      AddUnique(incident.affected_users, *event.context.user_id);
      incident.impact.users_affected = static_cast<std::uint32_t>(incident.affected_users.size());
    }
    incident.timeline.push_back({event.timestamp, "EVENT_CORRELATED", "SYSTEM",
                                 "Correlated event " + event.id + " (" + std::string(ToString(event.type)) + ")"});
    if (event.severity > incident.severity) {
      --metrics_.incidents_by_severity[incident.severity];
      incident.severity = event.severity;
      ++metrics_.incidents_by_severity[incident.severity];
      if (incident.severity == Severity::kCritical && incident.status != IncidentStatus::kEscalated) {
        EscalateLocked(incident, pending);
      }
    }
    return;
  }
  if (!trigger) {
    return;
  }

  IncidentDraft draft;
  draft.title = std::string(ToString(event.type)) + " detected";
  std::string because;
  for (const auto& reason : reasons) {
    because += (because.empty() ? "" : "; ") + reason;
  }
  draft.description = event.description + (because.empty() ? "" : " [" + because + "]");
  draft.severity = incident_severity;
  draft.category = CategoryFor(event.type);
  draft.source = event.source.component;
  draft.event_ids = correlated;
  AddUnique(draft.event_ids, event.id);
  CreateIncidentLocked(std::move(draft), key, pending);
}

SecurityIncident& AuditSystem::CreateIncidentLocked(IncidentDraft draft, std::string correlation_key,
                                                    Pending& pending) {
  SecurityIncident incident;
  incident.id = MakeId("inc");
  incident.title = std::move(draft.title);
  incident.description = std::move(draft.description);
  incident.severity = draft.severity;
  incident.status = IncidentStatus::kOpen;
  incident.category = draft.category;
  incident.source = std::move(draft.source);
  incident.created_at = NextTimestampLocked();
  incident.detected_at = incident.created_at;
  incident.correlation_key = std::move(correlation_key);
  incident.impact.reputation_impact = std::max(Severity::kLow, draft.severity);

  std::optional<TimePoint> earliest;
  for (const auto& event_id : draft.event_ids) {
    AddUnique(incident.event_ids, event_id);
    auto it = event_index_.find(event_id);
    if (it == event_index_.end()) {
      continue;
    }
    const auto& event = events_[it->second];
    if (!earliest || event.timestamp < *earliest) {
      earliest = event.timestamp;
    }
    if (event.plugin_id) {
      AddUnique(incident.affected_plugins, *event.plugin_id);
      AddUnique(incident.impact.systems_affected, *event.plugin_id);
    }
    if (event.context.user_id) {
      AddUnique(incident.affected_users, *event.context.user_id);
    }
    if (event.type == EventType::kDataExfiltration) {
      incident.impact.data_exposed = true;
      AddUnique(incident.impact.compliance_impact, "GDPR");
    }
  }
  incident.impact.users_affected = static_cast<std::uint32_t>(incident.affected_users.size());
  if (incident.category == IncidentCategory::kAvailability) {
    incident.impact.availability_impact =
        incident.severity >= Severity::kHigh ? AvailabilityImpact::kMajor : AvailabilityImpact::kMinor;
  }
  incident.timeline.push_back(
      {incident.created_at, "INCIDENT_CREATED", "SYSTEM", "Incident created: " + incident.title});

  // Mean time to detect, as a running average with the previous value.
  if (earliest) {
    const double minutes = Minutes(*earliest, incident.detected_at);
    metrics_.mean_time_to_detect_minutes =
        mttd_seeded_ ? (metrics_.mean_time_to_detect_minutes + minutes) / 2.0 : minutes;
    mttd_seeded_ = true;
  }
  ++metrics_.total_incidents;
  ++metrics_.incidents_by_status[incident.status];
  ++metrics_.incidents_by_severity[incident.severity];

  orchestrator::Event bus_event;
  bus_event.category = orchestrator::EventCategory::kSecurity;
  bus_event.severity = BusSeverity(incident.severity);
  bus_event.event_id = "incident_created";
  bus_event.message = incident.title;
  bus_event.fields.emplace_back("incident_id", incident.id);
  bus_event.fields.emplace_back("severity", std::string(ToString(incident.severity)));
  bus_event.fields.emplace_back("events", std::to_string(incident.event_ids.size()),
                                orchestrator::FieldPrivacy::kPublic, true);
  pending.events.push_back(std::move(bus_event));

  incidents_.push_back(std::move(incident));
  auto& stored = incidents_.back();
  if (stored.severity == Severity::kCritical) {
    EscalateLocked(stored, pending);
  }
  return stored;
}

void AuditSystem::EscalateLocked(SecurityIncident& incident, Pending& pending) {
  const auto now = NextTimestampLocked();
  --metrics_.incidents_by_status[incident.status];
  incident.status = IncidentStatus::kEscalated;
  ++metrics_.incidents_by_status[incident.status];
  incident.assigned_to = options_.escalation_assignee;
  incident.timeline.push_back(
      {now, "ESCALATED", "SYSTEM", "Critical incident escalated to " + options_.escalation_assignee});

  orchestrator::Event bus_event;
  bus_event.category = orchestrator::EventCategory::kSecurity;
  bus_event.severity = orchestrator::EventSeverity::kCritical;
  bus_event.event_id = "incident_escalated";
  bus_event.message = incident.title;
  bus_event.fields.emplace_back("incident_id", incident.id);
  bus_event.fields.emplace_back("assigned_to", options_.escalation_assignee);
  pending.events.push_back(std::move(bus_event));
}

SecurityIncident AuditSystem::CreateIncident(IncidentDraft draft) {
  Pending pending;
  SecurityIncident created;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    created = CreateIncidentLocked(std::move(draft), MakeId("manual"), pending);
  }
  Flush(pending);
  return created;
}

SecurityIncident AuditSystem::UpdateIncidentStatus(const std::string& incident_id, IncidentStatus status,
                                                   const std::string& actor, std::optional<std::string> notes) {
  Pending pending;
  SecurityIncident updated;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = std::find_if(incidents_.begin(), incidents_.end(),
                           [&](const SecurityIncident& incident) { return incident.id == incident_id; });
    if (it == incidents_.end()) {
      throw Error(ErrorDomain::State, errors::state::kIncidentNotFound,
                  std::string(errors::msg::kIncidentNotFound) + ": " + incident_id);
    }
    auto& incident = *it;
    const auto previous = incident.status;
    if (!IsValidTransition(previous, status, incident.severity)) {
      throw Error(ErrorDomain::State, errors::state::kInvalidIncidentTransition,
                  std::string(errors::msg::kInvalidIncidentTransition) + ": " + std::string(ToString(previous)) +
                      " -> " + std::string(ToString(status)));
    }
    if (status == IncidentStatus::kClosed && !incident.resolved_at) {
      throw Error(ErrorDomain::State, errors::state::kInvalidIncidentTransition,
                  std::string(errors::msg::kResolutionRequired));
    }
    const auto now = NextTimestampLocked();
    if (status == IncidentStatus::kResolved) {
      incident.resolved_at = now;
      incident.resolution = notes.value_or("Resolved by " + actor);
      const double minutes = Minutes(incident.detected_at, now);
      metrics_.mean_time_to_resolve_minutes =
          mttr_seeded_ ? (metrics_.mean_time_to_resolve_minutes + minutes) / 2.0 : minutes;
      mttr_seeded_ = true;
    } else if (previous == IncidentStatus::kResolved && status == IncidentStatus::kInProgress) {
      incident.resolved_at.reset();
      incident.resolution.clear();
    } else if (status == IncidentStatus::kEscalated && !incident.assigned_to) {
      incident.assigned_to = options_.escalation_assignee;
    }
    incident.status = status;
    --metrics_.incidents_by_status[previous];
    ++metrics_.incidents_by_status[status];
    std::string description =
        "Status changed from " + std::string(ToString(previous)) + " to " + std::string(ToString(status));
    if (notes) {
      description += ": " + *notes;
    }
    incident.timeline.push_back({now, "STATUS_CHANGED", actor, description});

    orchestrator::Event bus_event;
    bus_event.category = orchestrator::EventCategory::kSecurity;
    bus_event.event_id = "incident_status_changed";
    bus_event.message = description;
    bus_event.fields.emplace_back("incident_id", incident.id);
    bus_event.fields.emplace_back("actor", actor, orchestrator::FieldPrivacy::kHash);
    pending.events.push_back(std::move(bus_event));
    updated = incident;
  }
  Flush(pending);
  return updated;
}

void AuditSystem::ResolveEvent(const std::string& event_id, const std::string& actor, std::string mitigation) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = event_index_.find(event_id);
  if (it == event_index_.end()) {
    throw Error(ErrorDomain::State, errors::state::kIncidentNotFound, "Security event not found: " + event_id);
  }
  auto& event = events_[it->second];
  event.resolved = true;
  event.resolved_at = Now();
  event.resolved_by = actor;
  event.mitigation = std::move(mitigation);
}

std::optional<SecurityEvent> AuditSystem::GetEvent(const std::string& event_id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = event_index_.find(event_id);
  if (it == event_index_.end()) {
    return std::nullopt;
  }
  return events_[it->second];
}

std::optional<SecurityIncident> AuditSystem::GetIncident(const std::string& incident_id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  for (const auto& incident : incidents_) {
    if (incident.id == incident_id) {
      return incident;
    }
  }
  return std::nullopt;
}

std::vector<SecurityIncident> AuditSystem::ListIncidents() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return incidents_;
}

void AuditSystem::AddPolicy(AuditPolicy policy) {
  std::vector<CompiledRule> compiled;
  compiled.reserve(policy.rules.size());
  for (const auto& rule : policy.rules) {
    compiled.push_back(CompiledRule::Compile(rule));
  }
  std::lock_guard<std::mutex> guard(mutex_);
  for (std::size_t i = 0; i < policies_.size(); ++i) {
    if (policies_[i].id == policy.id) {
      policies_[i] = std::move(policy);
      compiled_rules_[i] = std::move(compiled);
      return;
    }
  }
  policies_.push_back(std::move(policy));
  compiled_rules_.push_back(std::move(compiled));
}

std::vector<AuditPolicy> AuditSystem::Policies() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return policies_;
}

void AuditSystem::AddThreatIndicator(ThreatIndicator indicator) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (indicator.id.empty()) {
    indicator.id = MakeId("ioc");
  }
  if (indicator.first_seen == TimePoint{}) {
    indicator.first_seen = Now();
  }
  indicators_.push_back(std::move(indicator));
}

std::vector<ThreatIndicator> AuditSystem::ActiveIndicators() const {
  std::lock_guard<std::mutex> guard(mutex_);
  const auto now = Now();
  std::vector<ThreatIndicator> out;
  for (const auto& indicator : indicators_) {
    if (indicator.active && (!indicator.expires_at || *indicator.expires_at >= now)) {
      out.push_back(indicator);
    }
  }
  return out;
}

AuditMetrics AuditSystem::Metrics() const {
  std::lock_guard<std::mutex> guard(mutex_);
  AuditMetrics out = metrics_;
  int risk = 0;
  out.active_threats = 0;
  for (const auto& incident : incidents_) {
    if (IsUnresolved(incident.status)) {
      ++out.active_threats;
      risk += RiskWeight(incident.severity);
    }
  }
  out.risk_score = std::min(100, risk);
  return out;
}

std::vector<SecurityEvent> AuditSystem::SearchEvents(const EventFilter& filter) const {
  std::lock_guard<std::mutex> guard(mutex_);
  const std::size_t limit = filter.limit == 0 ? 50 : filter.limit;
  const std::size_t skip = filter.page * limit;
  std::vector<SecurityEvent> out;
  std::size_t matched = 0;
  for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
    const auto& event = *it;
    if ((filter.type && event.type != *filter.type) || (filter.severity && event.severity != *filter.severity) ||
        (filter.plugin_id && event.plugin_id != filter.plugin_id) ||
        (filter.user_id && event.context.user_id != filter.user_id) ||
        (filter.ip_address && event.context.ip_address != *filter.ip_address) ||
        (filter.period && !filter.period->Contains(event.timestamp)) ||
        (filter.resolved && event.resolved != *filter.resolved)) {
      continue;
    }
    if (!filter.tags.empty() &&
        std::none_of(filter.tags.begin(), filter.tags.end(), [&event](const std::string& tag) {
          return std::find(event.tags.begin(), event.tags.end(), tag) != event.tags.end();
        })) {
      continue;
    }
    if (matched++ < skip) {
      continue;
    }
    out.push_back(event);
    if (out.size() == limit) {
      break;
    }
  }
  return out;
}

PeriodStatistics AuditSystem::CollectStatisticsLocked(const DateRange& period) const {
  PeriodStatistics stats;
  for (const auto& event : events_) {
    if (!period.Contains(event.timestamp)) {
      continue;
    }
    ++stats.events;
    switch (event.type) {
    case EventType::kLoginFailure:
      ++stats.login_failures;
      break;
    case EventType::kPermissionDenied:
      ++stats.permission_denials;
      break;
    case EventType::kMalwareDetected:
      ++stats.malware_detections;
      break;
    case EventType::kDataExfiltration:
      ++stats.exfiltration_events;
      break;
    case EventType::kPolicyViolation:
      ++stats.policy_violations;
      break;
    case EventType::kConfigurationChange:
      ++stats.configuration_changes;
      break;
    case EventType::kSuspiciousActivity:
      ++stats.suspicious_activities;
      break;
    default:
      break;
    }
    if (event.severity >= Severity::kHigh && !event.resolved) {
      ++stats.unresolved_high_events;
    }
  }
  for (const auto& incident : incidents_) {
    if (!period.Contains(incident.created_at)) {
      continue;
    }
    ++stats.incidents;
    if (!IsUnresolved(incident.status)) {
      ++stats.incidents_resolved;
    } else if (incident.severity == Severity::kCritical) {
      ++stats.incidents_unresolved_critical;
    }
  }
  stats.audit_log_intact = !log_ || log_->Verify();
  return stats;
}

ComplianceReport AuditSystem::GenerateComplianceReport(ComplianceFramework framework, const DateRange& period) {
  Pending pending;
  ComplianceReport report;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto stats = CollectStatisticsLocked(period);
    report = BuildComplianceReport(framework, period, stats, Now());
    reports_.push_back(report);
    metrics_.compliance_score = report.overall_score;

    orchestrator::Event bus_event;
    bus_event.category = orchestrator::EventCategory::kSecurity;
    bus_event.event_id = "compliance_report_generated";
    bus_event.message = "Compliance report generated";
    bus_event.fields.emplace_back("framework", std::string(ToString(framework)));
    bus_event.fields.emplace_back("score", std::to_string(static_cast<int>(report.overall_score)),
                                  orchestrator::FieldPrivacy::kPublic, true);
    bus_event.fields.emplace_back("violations", std::to_string(report.violations.size()),
                                  orchestrator::FieldPrivacy::kPublic, true);
    pending.events.push_back(std::move(bus_event));
  }
  Flush(pending);
  return report;
}

std::vector<ComplianceReport> AuditSystem::ComplianceReports() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return reports_;
}

std::string AuditSystem::ExportData(ExportKind kind, ExportFormat format, const EventFilter& filter) const {
  json data;
  switch (kind) {
  case ExportKind::kEvents:
    data = json::array();
    for (const auto& event : SearchEvents(filter)) {
      data.push_back(ToJson(event));
    }
    break;
  case ExportKind::kIncidents:
    data = json::array();
    for (const auto& incident : ListIncidents()) {
      data.push_back(ToJson(incident));
    }
    break;
  case ExportKind::kMetrics:
    data = ToJson(Metrics());
    break;
  case ExportKind::kCompliance:
    data = json::array();
    for (const auto& report : ComplianceReports()) {
      data.push_back(ToJson(report));
    }
    break;
  }
  switch (format) {
  case ExportFormat::kJson:
    return data.dump(2);
  case ExportFormat::kCsv:
    return ToCsv(data);
  case ExportFormat::kXml:
    return ToXml(kind, data);
  }
  return data.dump(2);
}

AuditReport AuditSystem::PerformSecurityAudit(AuditType type) const {
  std::lock_guard<std::mutex> guard(mutex_);
  const auto now = Now();
  AuditReport report;
  report.id = MakeId("aud");
  report.type = type;

  auto add = [&report](std::string category, Severity severity, std::string description,
                       std::vector<std::string> evidence, std::string recommendation) {
    report.findings.push_back({MakeId("fnd"), std::move(category), severity, std::move(description),
                               std::move(evidence), std::move(recommendation)});
  };

  if (type == AuditType::kPeriodic) {
    std::map<EventType, std::pair<Severity, std::vector<std::string>>> unresolved;
    std::uint64_t login_failures = 0;
    for (const auto& event : events_) {
      if (event.type == EventType::kLoginFailure) {
        ++login_failures;
      }
      if (event.resolved || event.severity < Severity::kHigh) {
        continue;
      }
      auto& entry = unresolved[event.type];
      entry.first = std::max(entry.first, event.severity);
      if (entry.second.size() < kMaxFindingEvidence) {
        entry.second.push_back(event.id);
      }
    }
    for (auto& [event_type, entry] : unresolved) {
      add("events", entry.first,
          "Unresolved high severity " + std::string(ToString(event_type)) + " events",
          entry.second, "Investigate and resolve outstanding " + std::string(ToString(event_type)) + " events");
    }
    if (login_failures >= 5) {
      add("access", Severity::kMedium, std::to_string(login_failures) + " failed logins recorded", {},
          "Enforce account lockout and review authentication logs");
    }
    for (const auto& policy : policies_) {
      for (const auto& rule : policy.rules) {
        if (!rule.enabled) {
          add("policy", Severity::kLow, "Rule " + rule.id + " in policy " + policy.id + " is disabled", {},
              "Re-enable or retire disabled policy rules");
        } else if (rule.trigger_count > 0 && rule.action != PolicyAction::kAllow &&
                   rule.action != PolicyAction::kWarn) {
          add("policy", Severity::kMedium,
              "Rule " + rule.id + " triggered " + std::to_string(rule.trigger_count) + " times", {},
              "Review sources repeatedly hitting " + std::string(ToString(rule.action)) + " rules");
        }
      }
    }
    for (const auto& indicator : indicators_) {
      if (indicator.active && indicator.expires_at && *indicator.expires_at < now) {
        add("threat-intel", Severity::kLow, "Threat indicator " + indicator.id + " has expired", {indicator.id},
            "Refresh threat intelligence feeds");
      }
    }
  }

  if (type == AuditType::kPeriodic || type == AuditType::kIncident) {
    for (const auto& incident : incidents_) {
      if (!IsUnresolved(incident.status)) {
        continue;
      }
      if (incident.severity >= Severity::kHigh) {
        add("incidents", incident.severity,
            "Incident " + incident.id + " (" + incident.title + ") is " + std::string(ToString(incident.status)),
            incident.event_ids, "Drive high severity incidents to resolution");
      }
      if (now - incident.detected_at > kStaleIncidentAge) {
        add("incidents", Severity::kHigh, "Incident " + incident.id + " has been open for more than 24 hours",
            {incident.id}, "Assign an owner and set a resolution target for stale incidents");
      }
    }
  }

  if (type == AuditType::kCompliance) {
    if (reports_.empty()) {
      add("compliance", Severity::kMedium, "No compliance report has been generated", {},
          "Generate compliance reports for every configured framework");
    } else {
      const auto& latest = reports_.back();
      for (const auto& violation : latest.violations) {
        add("compliance", violation.severity,
            std::string(ToString(latest.framework)) + " " + violation.control_id + ": " + violation.description,
            {violation.id}, violation.remediation);
      }
    }
    if (log_ && !log_->Verify()) {
      add("compliance", Severity::kCritical, "Audit log chain verification failed", {log_->path().string()},
          "Preserve the log for forensics and rotate the audit key");
    }
  }

  int score = 0;
  for (const auto& finding : report.findings) {
    score += RiskWeight(finding.severity);
    if (finding.severity >= Severity::kHigh) {
      report.risk.key_risks.push_back(finding.description);
    }
    if (!finding.recommendation.empty()) {
      AddUnique(report.recommendations, finding.recommendation);
    }
  }
  report.risk.score = std::min(100, score);
  if (report.risk.score >= 75) {
    report.risk.overall = RiskLevel::kCritical;
  } else if (report.risk.score >= 50) {
    report.risk.overall = RiskLevel::kHigh;
  } else if (report.risk.score >= 25) {
    report.risk.overall = RiskLevel::kMedium;
  } else {
    report.risk.overall = RiskLevel::kLow;
  }
  report.risk.mitigations = report.recommendations;
  report.completed_at = now;
  return report;
}

std::size_t AuditSystem::ApplyRetention(std::chrono::hours retention) {
  std::lock_guard<std::mutex> guard(mutex_);
  const auto cutoff = Now() - retention;
  std::set<std::string> referenced;
  for (const auto& incident : incidents_) {
    if (IsUnresolved(incident.status)) {
      referenced.insert(incident.event_ids.begin(), incident.event_ids.end());
    }
  }
  const auto before = events_.size();
  events_.erase(std::remove_if(events_.begin(), events_.end(),
                               [&](const SecurityEvent& event) {
                                 return event.timestamp < cutoff && referenced.count(event.id) == 0;
                               }),
                events_.end());
  event_index_.clear();
  for (std::size_t i = 0; i < events_.size(); ++i) {
    event_index_[events_[i].id] = i;
  }
  return before - events_.size();
}

} // namespace pw::audit
