#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Process {
// True when program can be found through PATH (or is an executable path).
bool available(std::string_view program);

// Throws DependencyMissing when program cannot be found.
void require(std::string_view program);

// Runs argv[0] with the given arguments, waits and returns its exit status.
// A process killed by a signal reports 128 + signal number.
int run(const std::vector<std::string>& argv);
}  // namespace Process
