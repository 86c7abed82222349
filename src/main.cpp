#include "turbofetch/errors.hpp"
#include "turbofetch/progress_monitor.hpp"
#include "turbofetch/transfer_orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onInterrupt(int) { g_interrupted = 1; }

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url>" << std::endl;
    std::cerr << "Options:\n"
              << "  -o <path>            Output file or directory (default: current directory)\n"
              << "  -c <n|auto>          Connections, 1-32 (default: auto)\n"
              << "  -s <mbps>            Nominal link speed in Mbps (default: 80)\n"
              << "  -b <auto|on|off>     Stage ranges in RAM before writing (default: auto)\n"
              << "  -H <Name: value>     Extra request header, may repeat\n"
              << "  -t <seconds>         Per-request timeout (default: none)\n"
              << "  --no-overwrite       Add a _1, _2, ... suffix instead of overwriting\n"
              << "  --pre-allocate       Reserve disk blocks before downloading\n"
              << "  --hash <hex>         Expected digest of the downloaded file\n"
              << "  --hash-type <name>   Digest algorithm (default: md5)\n"
              << "  -q                   No progress panel\n"
              << "  -v                   Verbose logging\n"
              << "  -h, --help           Show this message" << std::endl;
}

int parseInt(const std::string& text, const char* what) {
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception&) {
        throw turbofetch::InvalidArgumentError(std::string("Invalid ") + what + ": " + text);
    }
}

double parseDouble(const std::string& text, const char* what) {
    try {
        std::size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception&) {
        throw turbofetch::InvalidArgumentError(std::string("Invalid ") + what + ": " + text);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        turbofetch::DownloadOptions options;
        turbofetch::DownloadRequest request;
        request.output_path = std::filesystem::current_path().string();
        bool quiet = false;
        bool verbose = false;
        std::string url;

        int arg_index = 1;
        const auto nextValue = [&](const std::string& option) -> std::string {
            if (arg_index + 1 >= argc) {
                throw turbofetch::InvalidArgumentError("Missing value for " + option);
            }
            arg_index += 2;
            return argv[arg_index - 1];
        };

        while (arg_index < argc) {
            const std::string option = argv[arg_index];

            if (option == "-o") {
                request.output_path = nextValue(option);
            } else if (option == "-c") {
                const std::string value = nextValue(option);
                options.max_connections = value == "auto"
                    ? turbofetch::ConnectionCount::automatic()
                    : turbofetch::ConnectionCount::fixed(parseInt(value, "connection count"));
            } else if (option == "-s") {
                options.connection_speed_mbps = parseDouble(nextValue(option), "connection speed");
            } else if (option == "-b") {
                const std::string value = nextValue(option);
                if (value == "auto") {
                    request.use_ram_buffer = turbofetch::WriteMode::Auto;
                } else if (value == "on") {
                    request.use_ram_buffer = turbofetch::WriteMode::Buffered;
                } else if (value == "off") {
                    request.use_ram_buffer = turbofetch::WriteMode::Direct;
                } else {
                    throw turbofetch::InvalidArgumentError("Invalid buffer mode: " + value);
                }
            } else if (option == "-H") {
                const std::string header = nextValue(option);
                const auto colon = header.find(':');
                if (colon == std::string::npos || colon == 0) {
                    throw turbofetch::InvalidArgumentError("Invalid header: " + header);
                }
                const auto value_start = header.find_first_not_of(' ', colon + 1);
                options.custom_headers[header.substr(0, colon)] =
                    value_start == std::string::npos ? std::string{} : header.substr(value_start);
            } else if (option == "-t") {
                options.timeout_seconds = parseInt(nextValue(option), "timeout");
            } else if (option == "--no-overwrite") {
                options.overwrite = false;
                ++arg_index;
            } else if (option == "--pre-allocate") {
                request.pre_allocate = true;
                ++arg_index;
            } else if (option == "--hash") {
                request.expected_hash = nextValue(option);
            } else if (option == "--hash-type") {
                request.hash_type = nextValue(option);
            } else if (option == "-q") {
                quiet = true;
                ++arg_index;
            } else if (option == "-v") {
                verbose = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (!option.empty() && option[0] == '-') {
                printUsage(argv[0]);
                return 1;
            } else if (url.empty()) {
                url = option;
                ++arg_index;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (url.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        // Progress goes to stdout, so keep log lines on stderr.
        spdlog::set_default_logger(spdlog::stderr_color_mt("turbofetch"));
        spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

        turbofetch::TransferOrchestrator orchestrator(options);
        std::signal(SIGINT, onInterrupt);

        std::atomic<bool> finished{false};
        std::optional<turbofetch::DownloadResult> result;
        std::exception_ptr failure;
        std::thread transfer([&]() {
            try {
                result = orchestrator.download(url, request);
            } catch (...) {
                failure = std::current_exception();
            }
            finished.store(true);
        });

        const auto tick = [&]() {
            if (g_interrupted) {
                orchestrator.cancel();
            }
            return !finished.load();
        };

        if (quiet) {
            while (tick()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        } else {
            turbofetch::ProgressMonitor monitor([&]() { return orchestrator.getProgress(); }, tick);
            monitor.run();
        }
        transfer.join();

        if (failure) {
            std::rethrow_exception(failure);
        }
        if (!result) {
            std::cerr << "Download cancelled" << std::endl;
            return 0;
        }

        std::cout << result->output_path << std::endl;
        if (result->digest) {
            std::cout << request.hash_type << ": " << *result->digest << std::endl;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
