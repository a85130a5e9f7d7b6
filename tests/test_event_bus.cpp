#include "ms/orchestrator/event_bus.h"

#include <cassert>
#include <sstream>
#include <string>
#include <vector>

namespace {

using ms::orchestrator::BoolField;
using ms::orchestrator::Event;
using ms::orchestrator::EventBus;
using ms::orchestrator::EventSeverity;
using ms::orchestrator::LogFormat;
using ms::orchestrator::LogWriter;
using ms::orchestrator::NumericField;

Event SampleEvent() {
  Event event;
  event.severity = EventSeverity::kWarning;
  event.event_id = "target_exists";
  event.message = "target already exists";
  event.fields.emplace_back("src", "/mirror/a \"quoted\".txt");
  event.fields.push_back(NumericField("files_moved", 3));
  event.fields.push_back(BoolField("dry-run", false));
  return event;
}

void TestJsonLines() {
  std::ostringstream out;
  LogWriter writer(out, LogFormat::kJson, EventSeverity::kInfo);
  writer.Log(SampleEvent());
  const auto line = out.str();
  assert(line.back() == '\n');
  assert(line.find("\"severity\":\"warn\"") != std::string::npos);
  assert(line.find("\"event_id\":\"target_exists\"") != std::string::npos);
  assert(line.find("\"src\":\"/mirror/a \\\"quoted\\\".txt\"") != std::string::npos);
  assert(line.find("\"files_moved\":3") != std::string::npos);
  assert(line.find("\"dry-run\":false") != std::string::npos);
}

void TestTextAndThreshold() {
  std::ostringstream out;
  LogWriter writer(out, LogFormat::kText, EventSeverity::kWarning);
  Event debug;
  debug.severity = EventSeverity::kDebug;
  debug.message = "hidden";
  writer.Log(debug);
  assert(out.str().empty());

  writer.Log(SampleEvent());
  const auto line = out.str();
  assert(line.find("WRN target already exists") != std::string::npos);
  assert(line.find("files_moved=3") != std::string::npos);
  assert(line.find("src=\"/mirror/a \\\"quoted\\\".txt\"") != std::string::npos);
}

void TestSeverityNames() {
  EventSeverity severity = EventSeverity::kInfo;
  assert(ms::orchestrator::ParseSeverity("warning", severity) && severity == EventSeverity::kWarning);
  assert(ms::orchestrator::ParseSeverity("debug", severity) && severity == EventSeverity::kDebug);
  assert(!ms::orchestrator::ParseSeverity("verbose", severity));
  assert(std::string(ms::orchestrator::SeverityToString(EventSeverity::kError)) == "error");
}

void TestBusDelivery() {
  ms::orchestrator::ResetEventBusForTesting();
  std::vector<std::string> seen;
  EventBus::Instance().Subscribe([&seen](const Event& event) { seen.push_back(event.event_id); });
  EventBus::Instance().Subscribe([](const Event& event) {
    // Publishing from inside a subscriber is suppressed.
    EventBus::Instance().Publish(event);
  });
  ms::orchestrator::PublishEvent(EventSeverity::kInfo, "mode_started", "starting");
  assert(seen.size() == 1 && seen.front() == "mode_started");
  assert(SampleEvent().Field("files_moved") == "3");
  assert(SampleEvent().Field("absent").empty());
  ms::orchestrator::ResetEventBusForTesting();
}

}  // namespace

int main() {
  TestJsonLines();
  TestTextAndThreshold();
  TestSeverityNames();
  TestBusDelivery();
  return 0;
}
