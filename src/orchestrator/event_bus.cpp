#include "ms/orchestrator/event_bus.h"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace ms::orchestrator {
namespace {

struct EventBusSingletonStorage { // manage singleton lifetime
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() { // allow deterministic teardown
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {  // suppress recursive publish from inside a subscriber
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

const char* SeverityToShortString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "DBG";
  case EventSeverity::kInfo:
    return "INF";
  case EventSeverity::kWarning:
    return "WRN";
  case EventSeverity::kError:
    return "ERR";
  }
  return "INF";
}

std::tm ToUtc(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  return tm;
}

std::tm ToLocal(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (unsigned char c : value) {
    if (c <= 0x20 || c == '"' || c == '=') {
      return true;
    }
  }
  return false;
}

} // namespace

std::string Event::Field(std::string_view key) const {
  for (const auto& field : fields) {
    if (field.key == key) {
      return field.value;
    }
  }
  return {};
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warn";
  case EventSeverity::kError:
    return "error";
  }
  return "info";
}

bool ParseSeverity(std::string_view text, EventSeverity& out) {
  if (text == "debug") {
    out = EventSeverity::kDebug;
  } else if (text == "info") {
    out = EventSeverity::kInfo;
  } else if (text == "warn" || text == "warning") {
    out = EventSeverity::kWarning;
  } else if (text == "error") {
    out = EventSeverity::kError;
  } else {
    return false;
  }
  return true;
}

LogWriter::LogWriter(std::ostream& out, LogFormat format, EventSeverity min_severity)
    : out_(out), format_(format), min_severity_(min_severity) {}

std::string LogWriter::FormatJson(const Event& event,
                                  std::chrono::system_clock::time_point tp) const {
  const auto tm = ToUtc(tp);
  const auto fractional =
      std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
      std::chrono::seconds(1);
  std::ostringstream ts;
  ts << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  ts << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';

  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"";
  payload += ts.str();
  payload += "\",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"";
    payload += EscapeJson(event.event_id);
    payload += "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"";
    payload += EscapeJson(event.message);
    payload += "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"";
    payload += EscapeJson(field.key);
    payload += "\":";
    if (field.numeric) {
      payload += field.value;
    } else {
      payload += "\"";
      payload += EscapeJson(field.value);
      payload += "\"";
    }
  }
  payload += "}";
  return payload;
}

std::string LogWriter::FormatText(const Event& event,
                                  std::chrono::system_clock::time_point tp) const {
  const auto tm = ToLocal(tp);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S") << ' ' << SeverityToShortString(event.severity) << ' '
      << event.message;
  for (const auto& field : event.fields) {
    oss << ' ' << field.key << '=';
    if (!field.numeric && NeedsQuoting(field.value)) {
      oss << '"' << EscapeJson(field.value) << '"';
    } else {
      oss << field.value;
    }
  }
  return oss.str();
}

void LogWriter::Log(const Event& event) {
  if (static_cast<int>(event.severity) < static_cast<int>(min_severity_)) {
    return;
  }
  const auto now = std::chrono::system_clock::now();
  auto line = format_ == LogFormat::kJson ? FormatJson(event, now) : FormatText(event, now);
  std::lock_guard<std::mutex> guard(mutex_);
  out_ << line << '\n';
  out_.flush();
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() {
      storage.instance = std::make_unique<EventBus>(); // lazy init
    });
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  std::shared_ptr<const SubscriberList> targets;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    targets = subscribers_snapshot_;
  }
  if (targets) {
    for (const auto& subscriber : *targets) {
      if (subscriber) {
        subscriber(event);
      }
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto updated = subscribers_snapshot_ ? std::make_shared<SubscriberList>(*subscribers_snapshot_)
                                        : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  subscribers_snapshot_ = std::move(updated);
}

void PublishEvent(const Event& event) noexcept {
  try {
    EventBus::Instance().Publish(event);
  } catch (const std::exception& publish_error) {
    std::clog << "{\"event\":\"eventbus_error\",\"message\":\"event publish failed\",\"detail\":\""
              << EscapeJson(publish_error.what()) << "\"}" << std::endl;
  }
}

void PublishEvent(EventSeverity severity, std::string event_id, std::string message,
                  std::vector<EventField> fields) noexcept {
  Event event;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  PublishEvent(event);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  storage.Reset();
}

} // namespace ms::orchestrator
