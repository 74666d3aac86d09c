#include <httplib.h>

#include <algorithm>
#include <iostream>
#include <thread>

#include "error.hpp"
#include "log.hpp"
#include "service.hpp"
#include "storage.hpp"

namespace {
void print_usage() {
    std::cerr << "usage: transfersh-devserver [--host H] [--port P] [--auth user:pass]\n"
              << "                            [--log-level ERROR|WARN|INFO|DEBUG]\n"
              << "Files are kept in memory and are gone when the server stops.\n";
}
}  // namespace

int main(int argc, char* argv[]) {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::optional<Credentials> auth;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw UsageError("Option " + arg + " requires an argument.");
                return argv[++i];
            };
            if (arg == "--host") {
                host = value();
            } else if (arg == "--port") {
                port = std::stoi(value());
            } else if (arg == "--auth") {
                const std::string pair = value();
                const auto colon = pair.find(':');
                if (colon == std::string::npos) throw UsageError("--auth expects user:pass");
                auth = Credentials{pair.substr(0, colon), pair.substr(colon + 1)};
            } else if (arg == "--log-level") {
                const std::string text = value();
                auto level = Log::parse_level(text);
                if (!level) throw UsageError("Invalid log level: " + text);
                Log::set_level(*level);
            } else if (arg == "-h" || arg == "--help") {
                print_usage();
                return 0;
            } else {
                print_usage();
                throw UsageError("Unknown option: " + arg);
            }
        }

        MemoryStorage storage;
        httplib::Server svr;
        HostingService service(storage, auth);
        service.mount(svr);

        // Enable thread pool for concurrent request handling
        int num_threads = std::max(2, static_cast<int>(std::thread::hardware_concurrency()));
        svr.new_task_queue = [num_threads] { return new httplib::ThreadPool(num_threads); };

        Log::info("Server listening on " + host + ":" + std::to_string(port) + " with " + std::to_string(num_threads) +
                  " worker threads");
        if (!svr.listen(host, port)) {
            Log::error("Cannot listen on " + host + ":" + std::to_string(port));
            return 1;
        }
        return 0;
    } catch (const TransferError& e) {
        Log::error(e.what());
        return e.exit_code();
    } catch (const std::exception& e) {
        Log::error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
