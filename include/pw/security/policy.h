#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace pw::security {

inline constexpr std::string_view kDefaultPolicyId{"default-security-policy"};

struct NetworkPolicy {
  std::vector<std::string> allowed_hosts;  // empty: any host not blocked
  std::vector<std::string> blocked_hosts;  // host names, dot suffixes or IPv4 CIDR
  std::vector<std::uint16_t> allowed_ports;  // empty: any port
  std::uint32_t max_connections{10};
};

struct FilesystemPolicy {
  std::vector<std::filesystem::path> allowed_paths;  // writable besides the workspace
  std::vector<std::filesystem::path> blocked_paths;
  std::uint64_t max_file_size{100ull * 1024 * 1024};
  std::uint64_t max_disk_usage{1024ull * 1024 * 1024};
};

struct ExecutionPolicy {
  std::chrono::milliseconds max_cpu_time{300000};
  std::uint64_t max_memory{512ull * 1024 * 1024};
  std::uint32_t max_processes{5};
  std::vector<std::string> allowed_executables;
};

struct DataAccessPolicy {
  std::vector<std::string> allowed_databases;
  std::vector<std::string> allowed_tables;
  std::chrono::milliseconds max_query_time{30000};
  std::uint64_t max_result_size{10ull * 1024 * 1024};
};

// Immutable once published; updates publish a new snapshot with a higher
// version. Sandboxes keep the snapshot they were created with.
struct SecurityPolicy {
  std::string id;
  std::string name;
  std::uint64_t version{1};
  std::vector<std::string> permissions;
  NetworkPolicy network;
  FilesystemPolicy filesystem;
  ExecutionPolicy execution;
  DataAccessPolicy data_access;
};

using PolicySnapshot = std::shared_ptr<const SecurityPolicy>;

SecurityPolicy DefaultSecurityPolicy();

// Throws pw::Error(Validation, kPolicyInvalid).
void ValidatePolicy(const SecurityPolicy& policy);

// True when |host| equals |pattern|, is a subdomain of it, or is an IPv4
// address inside a CIDR |pattern|.
bool HostMatches(std::string_view host, std::string_view pattern);

// True when |path| is |root| or lies below it, compared lexically.
bool PathWithin(const std::filesystem::path& path, const std::filesystem::path& root);

class PolicyStore {
 public:
  PolicyStore();

  // Throws Validation kPolicyInvalid for a malformed policy and for an id
  // that is already registered.
  PolicySnapshot Register(SecurityPolicy policy);
  // Replaces the policy with a new snapshot at version + 1. Throws State
  // kPolicyNotFound when the id is unknown.
  PolicySnapshot Update(SecurityPolicy policy);
  // Throws State kPolicyNotFound.
  PolicySnapshot Get(const std::string& id) const;
  std::vector<PolicySnapshot> List() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, PolicySnapshot> policies_;
};

} // namespace pw::security
