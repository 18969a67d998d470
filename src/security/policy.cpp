#include "pw/security/policy.h"

#include <algorithm>
#include <charconv>
#include <set>

#include <arpa/inet.h>

#include "pw/error.h"
#include "pw/errors.h"

namespace pw::security {

namespace {

bool ParseIpv4(std::string_view text, std::uint32_t& out) {
  in_addr addr{};
  const std::string copy(text);
  if (::inet_pton(AF_INET, copy.c_str(), &addr) != 1) {
    return false;
  }
  out = ntohl(addr.s_addr);
  return true;
}

bool CidrContains(std::string_view host, std::string_view cidr) {
  const auto slash = cidr.find('/');
  if (slash == std::string_view::npos) {
    return false;
  }
  unsigned prefix = 0;
  const auto bits = cidr.substr(slash + 1);
  const auto [ptr, ec] = std::from_chars(bits.data(), bits.data() + bits.size(), prefix);
  if (ec != std::errc{} || ptr != bits.data() + bits.size() || prefix > 32) {
    return false;
  }
  std::uint32_t network = 0;
  std::uint32_t address = 0;
  if (!ParseIpv4(cidr.substr(0, slash), network) || !ParseIpv4(host, address)) {
    return false;
  }
  const std::uint32_t mask = prefix == 0 ? 0u : ~0u << (32 - prefix);
  return (network & mask) == (address & mask);
}

Error Invalid(const std::string& id, const std::string& why) {
  return Error(ErrorDomain::Validation, errors::validation::kPolicyInvalid,
               "Security policy " + (id.empty() ? std::string("<unnamed>") : id) + " invalid: " + why);
}

} // namespace

SecurityPolicy DefaultSecurityPolicy() {
  SecurityPolicy policy;
  policy.id = std::string(kDefaultPolicyId);
  policy.name = "Default Security Policy";
  policy.permissions = {"storage.read", "network.https"};
  policy.network.allowed_hosts = {"api.github.com", "registry.npmjs.org"};
  policy.network.blocked_hosts = {"0.0.0.0/8", "169.254.0.0/16"};
  policy.network.allowed_ports = {443, 80};
  policy.network.max_connections = 10;
  policy.filesystem.allowed_paths = {"/tmp/plugin-storage", "/var/log/plugin"};
  policy.filesystem.blocked_paths = {"/etc", "/usr/bin", "/root", "/home"};
  policy.execution.allowed_executables = {"node", "python3"};
  return policy;
}

void ValidatePolicy(const SecurityPolicy& policy) {
  if (policy.id.empty()) {
    throw Invalid(policy.id, "id is empty");
  }
  if (policy.execution.max_memory == 0) {
    throw Invalid(policy.id, "execution.max_memory must be positive");
  }
  if (policy.execution.max_cpu_time.count() <= 0) {
    throw Invalid(policy.id, "execution.max_cpu_time must be positive");
  }
  if (policy.filesystem.max_file_size > policy.filesystem.max_disk_usage) {
    throw Invalid(policy.id, "filesystem.max_file_size exceeds max_disk_usage");
  }
  for (const auto& path : policy.filesystem.allowed_paths) {
    if (!path.is_absolute()) {
      throw Invalid(policy.id, "allowed path is not absolute: " + path.string());
    }
    for (const auto& blocked : policy.filesystem.blocked_paths) {
      if (PathWithin(path, blocked)) {
        throw Invalid(policy.id, "allowed path " + path.string() + " lies inside blocked " + blocked.string());
      }
    }
  }
  std::set<std::string> seen;
  for (const auto& permission : policy.permissions) {
    if (permission.empty() || !seen.insert(permission).second) {
      throw Invalid(policy.id, "empty or duplicate permission '" + permission + "'");
    }
  }
}

bool HostMatches(std::string_view host, std::string_view pattern) {
  if (host.empty() || pattern.empty()) {
    return false;
  }
  if (pattern.find('/') != std::string_view::npos) {
    return CidrContains(host, pattern);
  }
  if (host == pattern) {
    return true;
  }
  return host.size() > pattern.size() && host.substr(host.size() - pattern.size()) == pattern &&
         host[host.size() - pattern.size() - 1] == '.';
}

bool PathWithin(const std::filesystem::path& path, const std::filesystem::path& root) {
  const auto normal = path.lexically_normal();
  const auto base = root.lexically_normal();
  auto p = normal.begin();
  for (auto r = base.begin(); r != base.end(); ++r, ++p) {
    if (r->empty()) {
      continue;  // trailing separator
    }
    if (p == normal.end() || *p != *r) {
      return false;
    }
  }
  return true;
}

PolicyStore::PolicyStore() {
  auto snapshot = std::make_shared<const SecurityPolicy>(DefaultSecurityPolicy());
  policies_.emplace(snapshot->id, snapshot);
}

PolicySnapshot PolicyStore::Register(SecurityPolicy policy) {
  ValidatePolicy(policy);
  std::lock_guard<std::mutex> guard(mutex_);
  if (policies_.count(policy.id) != 0) {
    throw Invalid(policy.id, "already registered");
  }
  policy.version = 1;
  auto snapshot = std::make_shared<const SecurityPolicy>(std::move(policy));
  policies_.emplace(snapshot->id, snapshot);
  return snapshot;
}

PolicySnapshot PolicyStore::Update(SecurityPolicy policy) {
  ValidatePolicy(policy);
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = policies_.find(policy.id);
  if (it == policies_.end()) {
    throw Error(ErrorDomain::State, errors::state::kPolicyNotFound,
                std::string(errors::msg::kPolicyNotFound) + ": " + policy.id);
  }
  policy.version = it->second->version + 1;
  it->second = std::make_shared<const SecurityPolicy>(std::move(policy));
  return it->second;
}

PolicySnapshot PolicyStore::Get(const std::string& id) const {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = policies_.find(id);
  if (it == policies_.end()) {
    throw Error(ErrorDomain::State, errors::state::kPolicyNotFound,
                std::string(errors::msg::kPolicyNotFound) + ": " + id);
  }
  return it->second;
}

std::vector<PolicySnapshot> PolicyStore::List() const {
  std::lock_guard<std::mutex> guard(mutex_);
  std::vector<PolicySnapshot> out;
  out.reserve(policies_.size());
  for (const auto& [id, snapshot] : policies_) {
    out.push_back(snapshot);
  }
  return out;
}

} // namespace pw::security
