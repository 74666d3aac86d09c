#pragma once

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

enum class ErrorKind { Usage, DependencyMissing, Staging, Network, Authorization, Parse, Cancelled };

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Usage:
            return "usage";
        case ErrorKind::DependencyMissing:
            return "missing dependency";
        case ErrorKind::Staging:
            return "staging";
        case ErrorKind::Network:
            return "network";
        case ErrorKind::Authorization:
            return "authorization";
        case ErrorKind::Parse:
            return "parse";
        case ErrorKind::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

inline int exit_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Cancelled:
            return 1;
        case ErrorKind::Usage:
            return 2;
        case ErrorKind::DependencyMissing:
            return 3;
        case ErrorKind::Staging:
            return 4;
        case ErrorKind::Network:
            return 5;
        case ErrorKind::Authorization:
            return 6;
        case ErrorKind::Parse:
            return 7;
    }
    return 1;
}

class TransferError : public std::runtime_error {
   public:
    TransferError(ErrorKind kind, const std::string& message) : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }
    int exit_code() const noexcept { return ::exit_code(m_kind); }

   private:
    ErrorKind m_kind;
};

class UsageError : public TransferError {
   public:
    explicit UsageError(const std::string& message) : TransferError(ErrorKind::Usage, message) {}
};

class DependencyMissing : public TransferError {
   public:
    explicit DependencyMissing(const std::string& program)
        : TransferError(ErrorKind::DependencyMissing, program + " is not installed"), m_program(program) {}

    const std::string& program() const noexcept { return m_program; }

   private:
    std::string m_program;
};

class StagingError : public TransferError {
   public:
    explicit StagingError(const std::string& message) : TransferError(ErrorKind::Staging, message) {}
};

class NetworkError : public TransferError {
   public:
    explicit NetworkError(const std::string& message) : TransferError(ErrorKind::Network, message) {}

   protected:
    NetworkError(ErrorKind kind, const std::string& message) : TransferError(kind, message) {}
};

// The service rejected the credentials. The exchange itself may have completed.
class AuthorizationError : public NetworkError {
   public:
    explicit AuthorizationError(const std::string& message) : NetworkError(ErrorKind::Authorization, message) {}
};

// Bytes were transmitted but the expected metadata is missing from the answer.
class ParseError : public TransferError {
   public:
    ParseError(const std::string& message, std::string raw_exchange)
        : TransferError(ErrorKind::Parse, message), m_raw(std::move(raw_exchange)) {}

    const std::string& raw_exchange() const noexcept { return m_raw; }

   private:
    std::string m_raw;
};

class Cancelled : public TransferError {
   public:
    explicit Cancelled(const std::string& message) : TransferError(ErrorKind::Cancelled, message) {}
};

namespace Error {
inline void print_usage(std::string_view command = {}) {
    if (command == "send") {
        std::cerr << "usage: transfer send [options] <file|directory> [<file|directory>...]\n"
                  << "    -d, --max-downloads <n>   maximum number of downloads\n"
                  << "    -D, --max-days <n>        maximum number of days the file is kept\n"
                  << "    -k, --key <key>           encryption key\n"
                  << "    -u, --user <user>         basic auth user\n"
                  << "    -p, --password <pass>     basic auth password\n"
                  << "    -y                        do not ask for confirmation\n"
                  << "    --no-progress             do not draw the progress bar\n";
    } else if (command == "receive") {
        std::cerr << "usage: transfer receive [options] <url> [destination]\n"
                  << "    -k, --key <key>           decryption key\n"
                  << "    -u, --unzip               offer to extract archives after download\n"
                  << "    --no-progress             do not draw the progress bar\n";
    } else if (command == "delete") {
        std::cerr << "usage: transfer delete <x-url-delete>\n";
    } else if (command == "info") {
        std::cerr << "usage: transfer info [--json] <url>\n";
    } else {
        std::cerr << "usage: transfer [global options] <command> [args]\n"
                  << "global options:\n"
                  << "    --log-level <ERROR|WARN|INFO|DEBUG>\n"
                  << "    --tmp-dir <directory>\n"
                  << "    --config <file>\n"
                  << "commands:\n"
                  << "    send       upload files or directories\n"
                  << "    receive    download a file\n"
                  << "    delete     delete an uploaded file\n"
                  << "    info       show information about an uploaded file\n"
                  << "environment:\n"
                  << "    TRANSFERSH_URL, TRANSFERSH_MAX_DAYS, TRANSFERSH_MAX_DOWNLOADS,\n"
                  << "    TRANSFERSH_ENCRYPTION_KEY, AUTH_USER, AUTH_PASS, LOG_LEVEL\n";
    }
}

inline void invalid_command(std::string_view command) {
    std::cerr << "Invalid command: " << command << "\n";
    print_usage();
}
}  // namespace Error
