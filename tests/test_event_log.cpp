#include "pw/orchestrator/event_bus.h" // TSK019 structured logging

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

  using pw::orchestrator::Event;
  using pw::orchestrator::EventBus;
  using pw::orchestrator::EventCategory;
  using pw::orchestrator::EventField;
  using pw::orchestrator::FieldPrivacy;
  using pw::orchestrator::JsonLineLogger;
  using pw::test::Expect;

  Event MakeEvent(std::string id, std::string message) {
    Event event;
    event.category = EventCategory::kSecurity;
    event.event_id = std::move(id);
    event.message = std::move(message);
    return event;
  }

  void TestSubscriberOrder() {
    EventBus bus;
    std::vector<std::string> seen;
    bus.Subscribe([&](const Event& e) { seen.push_back("first:" + e.event_id); });
    bus.Subscribe([&](const Event& e) { seen.push_back("second:" + e.event_id); });
    bus.Publish(MakeEvent("a", "one"));
    bus.Publish(MakeEvent("b", "two"));
    Expect(seen.size() == 4, "every subscriber sees every event");
    Expect(seen.size() == 4 && seen[0] == "first:a" && seen[1] == "second:a" && seen[2] == "first:b",
           "delivery follows registration and publish order");
    Expect(bus.published() == 2, "published counter");
  }

  void TestReentrantPublishDropped() { // TSK019
    EventBus bus;
    int deliveries = 0;
    bus.Subscribe([&](const Event& e) {
      ++deliveries;
      if (e.event_id == "outer") {
        bus.Publish(MakeEvent("inner", "nested"));
      }
    });
    bus.Publish(MakeEvent("outer", "top"));
    Expect(deliveries == 1, "publish from inside a subscriber is dropped");
    bus.Publish(MakeEvent("after", "later"));
    Expect(deliveries == 2, "guard is released after the outer publish");
  }

  void TestFieldPrivacy() {
    Event event = MakeEvent("privacy", "fields");
    event.fields.emplace_back("user", "alice", FieldPrivacy::kRedact);
    event.fields.emplace_back("ip", "10.0.0.1", FieldPrivacy::kHash);
    event.fields.emplace_back("count", "3", FieldPrivacy::kPublic, true);
    const auto json = pw::orchestrator::BuildEventJson(event, "2024-01-01T00:00:00.000000Z", 4096);
    Expect(json.find("alice") == std::string::npos, "redacted value not serialized");
    Expect(json.find("[REDACTED]") != std::string::npos, "redaction marker present");
    Expect(json.find("10.0.0.1") == std::string::npos, "hashed value not serialized");
    Expect(json.find("\"ip\":\"hash:") != std::string::npos, "hash tag present");
    Expect(json.find("\"count\":3") != std::string::npos, "numeric field unquoted");
    Expect(pw::orchestrator::BuildEventJson(event, "ts", 16).empty(), "oversize encoding refused");
  }

  void TestChainedLog() { // TSK019
    pw::test::TempDir dir("pw_event_log");
    const auto path = dir.path() / "audit" / "events.log";
    {
      auto logger = std::make_shared<JsonLineLogger>(path);
      EventBus bus;
      bus.AttachLogger(logger);
      for (int i = 0; i < 5; ++i) {
        bus.Publish(MakeEvent("entry", "line " + std::to_string(i)));
      }
      Expect(logger->EntryCount() == 5, "five entries chained");
      Expect(logger->Verify(), "fresh chain verifies");
    }
    Expect(pw::orchestrator::VerifyJsonLineLog(path), "chain verifies after reopen");
    {
      JsonLineLogger reopened(path);
      Expect(reopened.IntegrityOk(), "reopened logger accepts its own chain");
      reopened.Log(MakeEvent("entry", "appended"));
      Expect(reopened.EntryCount() == 6, "sequence continues across reopen");
    }

    auto text = pw::test::ReadFile(path);
    const auto pos = text.find("line 2");
    Expect(pos != std::string::npos, "entry text present");
    text.replace(pos, 6, "line X");
    pw::test::WriteFile(path, text);
    Expect(!pw::orchestrator::VerifyJsonLineLog(path), "edited line breaks the chain");
  }

  void TestTruncationDetected() {
    pw::test::TempDir dir("pw_event_log");
    const auto path = dir.path() / "events.log";
    {
      JsonLineLogger logger(path);
      logger.Log(MakeEvent("a", "first"));
      logger.Log(MakeEvent("b", "second"));
    }
    auto text = pw::test::ReadFile(path);
    const auto first_newline = text.find('\n');
    pw::test::WriteFile(path, text.substr(0, first_newline + 1));
    Expect(!pw::orchestrator::VerifyJsonLineLog(path), "dropped tail does not match the stored chain head");
    Expect(!pw::orchestrator::VerifyJsonLineLog(dir.path() / "missing.log"), "missing log does not verify");
  }

} // namespace

int main() {
  TestSubscriberOrder();
  TestReentrantPublishDropped();
  TestFieldPrivacy();
  TestChainedLog();
  TestTruncationDetected();
  return pw::test::Finish("event log");
}
