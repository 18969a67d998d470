#pragma once
// TSK019 structured logging

#include <array>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "pw/crypto/hmac_sha256.h"

namespace pw::orchestrator {

  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  // Short tagged digest ("hash:<16 hex>") used for privacy-classified fields.
  std::string HashForTelemetry(std::string_view input);

  // Serializes |event| as a single JSON object, or an empty string when the
  // encoded form would exceed |max_bytes|.
  std::string BuildEventJson(const Event& event, const std::string& timestamp, std::size_t max_bytes);

  // Append-only JSON line sink. Each line carries audit_prev_count, audit_seq
  // and an HMAC-SHA256 chained over the previous line's MAC; the key lives in
  // "<log>.key" and the chain head in "<log>.state".
  class JsonLineLogger {
  public:
    explicit JsonLineLogger(std::filesystem::path log_path);
    JsonLineLogger(const JsonLineLogger&) = delete;
    JsonLineLogger& operator=(const JsonLineLogger&) = delete;

    void Log(const Event& event);
    // Recomputes the chain of the current log generation.
    bool Verify();
    std::uint64_t EntryCount();
    bool IntegrityOk();
    const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    using Mac = std::array<std::uint8_t, crypto::HMAC_SHA256::TAG_SIZE>;

    void EnsureOpen();
    void EnsureKey();
    void RotateIfNeeded(std::size_t incoming_bytes);
    std::size_t ResolveMaxBytes() const;
    bool ParseLog(Mac& mac, std::uint64_t& sequence);
    bool LoadStateLocked();
    void PersistStateLocked();

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    std::filesystem::path key_path_;
    std::filesystem::path state_path_;
    std::size_t max_bytes_;
    const std::size_t max_files_ = 3;
    Mac hmac_key_{};
    Mac last_mac_{};
    std::uint64_t entry_counter_{0};
    std::uint64_t generation_start_{0};
    Mac generation_mac_{};
    bool key_loaded_{false};
    bool integrity_ok_{true};
  };

  // Recomputes the chain of an existing log using the key and state kept
  // beside it. False when the chain, the key or the state does not match.
  bool VerifyJsonLineLog(const std::filesystem::path& log_path);

  // Synchronous fan-out. Subscribers run on the publishing thread in
  // registration order; a publish issued from inside a subscriber is dropped.
  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    EventBus();
    ~EventBus();
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);
    void AttachLogger(std::shared_ptr<JsonLineLogger> logger);
    std::uint64_t published() const noexcept { return published_.load(std::memory_order_relaxed); }

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
    std::atomic<std::uint64_t> published_{0};
  };

} // namespace pw::orchestrator
