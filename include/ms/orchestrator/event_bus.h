#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ms::orchestrator {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError };

  struct EventField {
    std::string key;
    std::string value;
    bool numeric{false};  // rendered without quotes (numbers and booleans)

    EventField(std::string k, std::string v, bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), numeric(is_numeric) {}
  };

  inline EventField NumericField(std::string key, std::int64_t value) {
    return EventField(std::move(key), std::to_string(value), true);
  }

  inline EventField BoolField(std::string key, bool value) {
    return EventField(std::move(key), value ? "true" : "false", true);
  }

  struct Event {
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;

    // Value of the first field named key, or empty.
    [[nodiscard]] std::string Field(std::string_view key) const;
  };

  const char* SeverityToString(EventSeverity severity);
  bool ParseSeverity(std::string_view text, EventSeverity& out);

  enum class LogFormat { kText, kJson };

  // Renders events as text or JSON lines on a stream, dropping anything below
  // the configured minimum severity.
  class LogWriter {
  public:
    LogWriter(std::ostream& out, LogFormat format, EventSeverity min_severity);
    void Log(const Event& event);

  private:
    std::string FormatJson(const Event& event, std::chrono::system_clock::time_point tp) const;
    std::string FormatText(const Event& event, std::chrono::system_clock::time_point tp) const;

    std::mutex mutex_;
    std::ostream& out_;
    LogFormat format_;
    EventSeverity min_severity_;
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus() = default;

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Publishes on the process bus; subscriber failures are reported on
  // std::clog instead of propagating. Safe to call from destructors.
  void PublishEvent(const Event& event) noexcept;
  void PublishEvent(EventSeverity severity, std::string event_id, std::string message,
                    std::vector<EventField> fields = {}) noexcept;

  void ResetEventBusForTesting(); // test-only teardown

} // namespace ms::orchestrator
