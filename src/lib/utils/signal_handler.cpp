#include "signal_handler.hpp"

#include <unistd.h>

#include <array>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <boost/stacktrace.hpp>

namespace stratus {

namespace {

constexpr std::array<int, 6> kSignalNumbers{SIGTERM, SIGSEGV, SIGINT, SIGILL, SIGABRT, SIGFPE};

// Function names are at most 64 characters, full ARNs at most 140.
constexpr size_t kFunctionNameBufferSize = 160;

// Written before the first remote call, read only by the handler. Empty while no deployment runs.
std::array<char, kFunctionNameBufferSize> function_in_deployment{};

const char* SignalName(int signal_number) {
  switch (signal_number) {
    case SIGTERM:
      return "SIGTERM";
    case SIGSEGV:
      return "SIGSEGV";
    case SIGINT:
      return "SIGINT";
    case SIGILL:
      return "SIGILL";
    case SIGABRT:
      return "SIGABRT";
    case SIGFPE:
      return "SIGFPE";
    default:
      return "UNKNOWN";
  }
}

// Only write(2) and strlen are used here, both are async-signal-safe.
void WriteToStandardError(const char* message) {
  [[maybe_unused]] const ssize_t bytes_written = write(STDERR_FILENO, message, std::strlen(message));
}

void HandleSignal(int signal_number) {
  if (function_in_deployment.front() == '\0') {
    WriteToStandardError("Signal received: ");
    WriteToStandardError(SignalName(signal_number));
    WriteToStandardError("\n");
  } else {
    WriteToStandardError("Deployment of function '");
    WriteToStandardError(function_in_deployment.data());
    WriteToStandardError("' interrupted by ");
    WriteToStandardError(SignalName(signal_number));
    WriteToStandardError(".\nRemote changes applied before the interruption are kept. Re-run the deployment to "
                         "reconcile.\n");
  }
#if STRATUS_DEBUG
  std::cerr << boost::stacktrace::stacktrace(0, 15) << std::flush;
#endif

  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  std::_Exit(128 + signal_number);
}

}  // namespace

void RegisterSignalHandler() {
  for (const auto signal_number : kSignalNumbers) {
    std::signal(signal_number, HandleSignal);
  }
}

void SetFunctionInDeployment(const std::string& function_name) {
  const size_t length = function_name.copy(function_in_deployment.data(), function_in_deployment.size() - 1);
  function_in_deployment[length] = '\0';
}

void DeregisterSignalHandler() {
  for (const auto signal_number : kSignalNumbers) {
    std::signal(signal_number, SIG_DFL);
  }
}

std::string SignalToString(int signal_number) { return SignalName(signal_number); }

}  // namespace stratus
