#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "ms/orchestrator/event_bus.h"

namespace ms::testing {

// Collects every event published on the process bus from construction on.
class EventRecorder {
public:
  EventRecorder() : events_(std::make_shared<std::vector<orchestrator::Event>>()) {
    orchestrator::ResetEventBusForTesting();
    auto sink = events_;
    orchestrator::EventBus::Instance().Subscribe(
        [sink](const orchestrator::Event& event) { sink->push_back(event); });
  }

  const std::vector<orchestrator::Event>& Events() const { return *events_; }

  void Clear() { events_->clear(); }

  std::size_t Count(std::string_view event_id) const {
    std::size_t count = 0;
    for (const auto& event : *events_) {
      if (event.event_id == event_id) {
        ++count;
      }
    }
    return count;
  }

  std::size_t Count(std::string_view event_id, std::string_view key, std::string_view value) const {
    std::size_t count = 0;
    for (const auto& event : *events_) {
      if (event.event_id == event_id && event.Field(key) == value) {
        ++count;
      }
    }
    return count;
  }

private:
  std::shared_ptr<std::vector<orchestrator::Event>> events_;
};

} // namespace ms::testing
