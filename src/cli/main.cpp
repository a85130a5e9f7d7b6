#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "ms/core/cancellation.h"
#include "ms/error.h"
#include "ms/fs/os_filesystem.h"
#include "ms/orchestrator/config.h"
#include "ms/orchestrator/event_bus.h"
#include "ms/orchestrator/program.h"

#ifndef MS_VERSION
#define MS_VERSION "0.0.0"
#endif

namespace {

  constexpr auto kExitTimeout = std::chrono::seconds(10);
  constexpr auto kSignalPollInterval = std::chrono::milliseconds(100);

  std::atomic<bool> g_signal_received{false};
  std::atomic<int> g_signal_number{0};

  void HandleTerminationSignal(int signal_number) {
    g_signal_number.store(signal_number, std::memory_order_relaxed);
    g_signal_received.store(true, std::memory_order_release);
  }

  void InstallSignalHandlers() {
    std::signal(SIGINT, HandleTerminationSignal);
    std::signal(SIGTERM, HandleTerminationSignal);
  }

  void PublishExit(int code) {
    ms::orchestrator::PublishEvent(ms::orchestrator::EventSeverity::kInfo, "program_exited",
                                   "program exited", {ms::orchestrator::NumericField("code", code)});
  }

} // namespace

int main(int argc, char** argv) {
  using namespace ms::orchestrator;

  std::cout << "MirrorShuttle (v" << MS_VERSION
            << ") - Keep your organization, ditch the ransomware.\n\n";

  const std::string program_name = argc > 0 ? argv[0] : "mirrorshuttle";
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  Options options;
  Mode mode = Mode::kMove;
  try {
    CommandLine command_line;
    try {
      command_line = ParseCommandLine(args);
      if (command_line.help) {
        PrintUsage(std::cerr, program_name);
        return kExitSuccess;
      }
      options = ResolveOptions(command_line);
    } catch (const ms::Error& err) {
      std::cerr << "fatal: failed to parse configuration: " << err.what() << "\n\n";
      PrintUsage(std::cerr, program_name);
      return kExitConfigFailure;
    }
    try {
      mode = ValidateOptions(options);
    } catch (const ms::Error& err) {
      std::cerr << "fatal: failed to validate configuration: " << err.what() << "\n\n";
      PrintUsage(std::cerr, program_name);
      return kExitConfigFailure;
    }
    std::cout << FormatOptions(options) << std::flush;
  } catch (const std::exception& err) {
    std::cerr << "fatal: failed to print configuration: " << err.what() << "\n\n";
    return kExitConfigFailure;
  }

  static LogWriter writer(std::cerr, options.json ? LogFormat::kJson : LogFormat::kText,
                          LogSeverity(options));
  EventBus::Instance().Subscribe([](const Event& event) { writer.Log(event); });

  ms::fs::OsFilesystem filesystem;
  ms::core::CancellationToken token;
  Program program(filesystem, options, mode);

  std::promise<int> done;
  auto result = done.get_future();
  InstallSignalHandlers();
  std::thread worker([&]() {
    try {
      done.set_value(program.Run(token));
    } catch (...) {
      done.set_exception(std::current_exception());
    }
  });

  while (result.wait_for(kSignalPollInterval) != std::future_status::ready) {
    if (!g_signal_received.load(std::memory_order_acquire)) {
      continue;
    }
    PublishEvent(EventSeverity::kWarning, "signal_received",
                 "received interrupt signal; shutting down (waiting up to 10s)...",
                 {{"op", options.mode},
                  NumericField("signal", g_signal_number.load(std::memory_order_relaxed))});
    token.Cancel();
    if (result.wait_for(kExitTimeout) != std::future_status::ready) {
      PublishEvent(EventSeverity::kError, "exit_timeout",
                   "timed out while waiting for program exit; killing...",
                   {{"op", options.mode}, {"error-type", "fatal"}});
      PublishExit(kExitFailure);
      std::_Exit(kExitFailure);
    }
    break;
  }

  worker.join();
  int code = kExitFailure;
  try {
    code = result.get();
  } catch (const std::exception& err) {
    PublishEvent(EventSeverity::kError, "internal_error", "internal error recovered",
                 {{"op", options.mode}, {"error", err.what()}, {"error-type", "fatal"}});
  }
  PublishExit(code);
  return code;
}
