#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "archive.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "error.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "progress.hpp"
#include "prompt.hpp"
#include "staging.hpp"
#include "transport.hpp"
#include "types.h"
#include "utils.hpp"

using Args = std::vector<std::string>;

namespace {
const std::string& need_value(const Args& args, size_t& i, const std::string& option) {
    if (i + 1 >= args.size()) {
        throw UsageError("Option " + option + " requires an argument.");
    }
    return args[++i];
}

bool is_help(const std::string& arg) { return arg == "-h" || arg == "--help"; }

int send_command(Settings settings, const Args& args) {
    TransferRequest request;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-d" || arg == "--max-downloads") {
            settings.max_downloads = Config::parse_positive(need_value(args, i, arg), "Max downloads");
        } else if (arg == "-D" || arg == "--max-days") {
            settings.max_days = Config::parse_positive(need_value(args, i, arg), "Max days");
        } else if (arg == "-k" || arg == "--key") {
            settings.encryption_key = need_value(args, i, arg);
        } else if (arg == "-u" || arg == "--user") {
            settings.auth_user = need_value(args, i, arg);
        } else if (arg == "-p" || arg == "--password") {
            settings.auth_pass = need_value(args, i, arg);
        } else if (arg == "-y") {
            Log::debug("Bypassing confirmation.");
            request.request_confirmation = false;
        } else if (arg == "--no-progress") {
            request.show_progress = false;
        } else if (is_help(arg)) {
            Error::print_usage(Command::SEND);
            return 0;
        } else {
            break;
        }
    }
    request.inputs.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    if (request.inputs.empty()) {
        Error::print_usage(Command::SEND);
        throw UsageError("No files or directories specified to send.");
    }
    request.service_url = settings.service_url;
    request.max_downloads = settings.max_downloads;
    request.max_days = settings.max_days;
    request.encryption_key = settings.encryption_key;
    request.credentials = Config::credentials(settings);

    StagingArea staging(settings.tmp_dir);
    InterruptGuard interrupt_guard(staging);
    ZipArchiver archiver;
    OpenSslCipher cipher;
    HttpTransport transport(staging.dir(), settings.read_timeout);
    TerminalPrompter prompter;

    const TransferResult result = SendPipeline(archiver, cipher, transport, prompter, staging).run(request);

    std::string remote_name = Utils::url_basename(result.download_url);
    std::string receive_suffix;
    if (Utils::ends_with(remote_name, ENCRYPTED_SUFFIX)) {
        receive_suffix += " --key YOUR_KEY_HERE";
        remote_name.resize(remote_name.size() - ENCRYPTED_SUFFIX.size());
    }
    if (Archive::is_extractable(remote_name)) receive_suffix += " --unzip";

    std::cout << "\nUpload successful.\n\n"
              << "Link to the file: " << result.download_url << "\n"
              << "Receive command: transfer receive" << receive_suffix << " " << result.download_url << "\n";
    if (result.delete_url) {
        std::cout << "\nDelete command: transfer delete " << *result.delete_url << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int receive_command(const Settings& settings, const Args& args) {
    ReceiveRequest request;
    request.decryption_key = settings.encryption_key;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-k" || arg == "--key") {
            request.decryption_key = need_value(args, i, arg);
        } else if (arg == "-u" || arg == "--unzip") {
            Log::debug("Will offer to unzip after download.");
            request.offer_extract = true;
        } else if (arg == "--no-progress") {
            request.show_progress = false;
        } else if (is_help(arg)) {
            Error::print_usage(Command::RECEIVE);
            return 0;
        } else {
            break;
        }
    }
    if (i >= args.size()) {
        Error::print_usage(Command::RECEIVE);
        throw UsageError("No URL specified to receive.");
    }
    request.url = args[i++];
    if (i < args.size()) request.destination = args[i++];

    StagingArea staging(settings.tmp_dir);
    InterruptGuard interrupt_guard(staging);
    ZipArchiver archiver;
    OpenSslCipher cipher;
    HttpTransport transport(staging.dir(), settings.read_timeout);
    TerminalPrompter prompter;

    ReceivePipeline(transport, cipher, archiver, prompter, staging).run(request);
    return 0;
}

int delete_command(const Settings& settings, const Args& args) {
    if (!args.empty() && is_help(args.front())) {
        Error::print_usage(Command::DELETE);
        return 0;
    }
    if (args.empty()) {
        Error::print_usage(Command::DELETE);
        throw UsageError("No delete URL specified.");
    }
    HttpTransport transport(settings.tmp_dir, settings.read_timeout);
    Remote::delete_file(transport, args.front());
    return 0;
}

int info_command(const Settings& settings, const Args& args) {
    bool as_json = false;
    std::string url;
    for (const auto& arg : args) {
        if (arg == "--json") {
            as_json = true;
        } else if (is_help(arg)) {
            Error::print_usage(Command::INFO);
            return 0;
        } else if (url.empty()) {
            url = arg;
        }
    }
    if (url.empty()) {
        Error::print_usage(Command::INFO);
        throw UsageError("No URL specified for info.");
    }
    HttpTransport transport(settings.tmp_dir, settings.read_timeout);
    const FileInfo info = Remote::info(transport, url);

    if (as_json) {
        json out;
        out["url"] = url;
        out["size"] = info.size ? json(*info.size) : json(nullptr);
        out["mime_type"] = info.mime_type ? json(*info.mime_type) : json(nullptr);
        out["remaining_days"] = info.remaining_days ? json(*info.remaining_days) : json(nullptr);
        out["remaining_downloads"] = info.remaining_downloads ? json(*info.remaining_downloads) : json(nullptr);
        std::cout << out.dump(2) << std::endl;
        return 0;
    }
    std::cout << "File Information for: " << url << "\n";
    std::cout << "  File Size: "
              << (info.size ? format_bytes(*info.size) + " (" + std::to_string(*info.size) + " bytes)" : "Not available")
              << "\n";
    std::cout << "  Mime-Type: " << info.mime_type.value_or("Not available") << "\n";
    std::cout << "  Remaining Days: " << info.remaining_days.value_or("Not available or unlimited") << "\n";
    std::cout << "  Remaining Downloads: " << info.remaining_downloads.value_or("Not available or unlimited")
              << std::endl;
    return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);
    const Args args(argv + 1, argv + argc);

    try {
        std::optional<std::string> log_level;
        std::optional<fs::path> tmp_dir;
        std::optional<fs::path> config_file;
        size_t i = 0;
        for (; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (is_help(arg)) {
                Error::print_usage();
                return 0;
            } else if (arg == "--log-level") {
                log_level = need_value(args, i, arg);
            } else if (arg == "--tmp-dir") {
                tmp_dir = need_value(args, i, arg);
            } else if (arg == "--config") {
                config_file = need_value(args, i, arg);
            } else {
                break;
            }
        }

        Settings settings = Config::load(config_file);
        if (log_level) {
            auto level = Log::parse_level(*log_level);
            if (!level) {
                Error::print_usage();
                throw UsageError("Invalid log level: " + *log_level + ". Must be ERROR, WARN, INFO, or DEBUG.");
            }
            settings.log_level = *level;
        }
        Log::set_level(settings.log_level);
        if (tmp_dir) {
            Config::set_tmp_dir(settings, *tmp_dir);
            Log::info("Using custom temporary directory: " + settings.tmp_dir.string());
        }

        if (i >= args.size()) {
            Error::print_usage();
            throw UsageError("No command specified.");
        }
        const std::string command = args[i];
        const Args rest(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());

        if (command == Command::SEND) return send_command(settings, rest);
        if (command == Command::RECEIVE) return receive_command(settings, rest);
        if (command == Command::DELETE) return delete_command(settings, rest);
        if (command == Command::INFO) return info_command(settings, rest);

        Error::invalid_command(command);
        return exit_code(ErrorKind::Usage);
    } catch (const ParseError& e) {
        Log::error(e.what());
        Log::error("Full response for analysis:\n" + e.raw_exchange());
        return e.exit_code();
    } catch (const TransferError& e) {
        Log::error(e.what());
        return e.exit_code();
    } catch (const std::exception& e) {
        Log::error(std::string("Unexpected error: ") + e.what());
        return 1;
    }
}
