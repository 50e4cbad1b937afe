#pragma once

#include <string>

namespace stratus {

/*
 * Registers handlers for termination and crash signals. The handler reports the signal and terminates the process
 * with exit code 128 + signal number.
 */
void RegisterSignalHandler();

/*
 * Names the function whose deployment is running. An interruption from then on also reports that remote changes
 * applied so far stay in place.
 */
void SetFunctionInDeployment(const std::string& function_name);

/*
 * Replaces the signal handling behavior by the default one.
 */
void DeregisterSignalHandler();

/*
 * Returns a string describing the signal number.
 */
std::string SignalToString(int signal_number);

}  // namespace stratus
