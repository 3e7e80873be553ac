#pragma once

#include <string>
#include <vector>

// Run args[0] (looked up on PATH) with the terminal's stdio and wait for it.
// Returns the exit status, 127 when the program could not be executed, or
// 128 + signal number when it was killed. Throws std::runtime_error when
// no child process could be started.
int exec_command(const std::vector<std::string> &args);

// Same as exec_command, but stdout of the child is collected into `out`.
int capture_command(const std::vector<std::string> &args, std::string &out);

// Whether `name` resolves to an executable, as `command -v` would.
bool find_executable(const std::string &name);

// Human-readable command line for log messages.
std::string join_args(const std::vector<std::string> &args);
