#include "process.hpp"

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <system_error>

#include "error.hpp"
#include "log.hpp"

extern char** environ;

namespace Process {
bool available(std::string_view program) {
    if (program.find('/') != std::string_view::npos) {
        return ::access(std::string(program).c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + std::string(program);
        if (::access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

void require(std::string_view program) {
    if (!available(program)) {
        throw DependencyMissing(std::string(program));
    }
}

int run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::invalid_argument("Process::run: empty command line");
    }
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    std::string command_line;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
        command_line += (command_line.empty() ? "" : " ") + arg;
    }
    args.push_back(nullptr);
    Log::debug("Running: " + command_line);

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "cannot start " + argv[0]);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid for " + argv[0]);
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}
}  // namespace Process
