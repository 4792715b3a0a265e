#include <cctype>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "asio.hpp"
#include "client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "server.hpp"
#include "types.h"
#include "utils.hpp"

namespace {

struct Options {
    Config config;
    std::vector<std::string> files;
    bool once = false;
};

bool parse_options(int argc, char* argv[], Options& opts) {
    std::vector<std::string> args(argv + 2, argv + argc);

    // config file first so command-line flags override it
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--config") {
            opts.config = load_config(args[i + 1]);
        }
    }
    apply_env(opts.config);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) throw std::invalid_argument("missing value for " + arg);
            return args[++i];
        };
        if (arg == "--config") {
            ++i;
        } else if (arg == "--host") {
            opts.config.host = value();
        } else if (arg == "--port") {
            opts.config.port = parse_port(value());
        } else if (arg == "--dir") {
            opts.config.storage_dir = value();
        } else if (arg == "--buffer") {
            opts.config.buffer_size = parse_buffer_size(value());
        } else if (arg == "--no-ack") {
            opts.config.acknowledge = false;
        } else if (arg == "--once") {
            opts.once = true;
        } else if (arg == "--quiet") {
            Log::set_level(Log::Level::Quiet);
        } else if (arg == "--verbose") {
            Log::set_level(Log::Level::Debug);
        } else if (arg.rfind("--", 0) == 0) {
            Error::invalid_option(arg);
            return false;
        } else {
            opts.files.push_back(arg);
        }
    }
    validate(opts.config);
    return true;
}

int run_server(const Options& opts) {
    std::cout << "==================================================\n"
              << "       DROPLINE RECEIVER\n"
              << "==================================================\n";
    asio::io_context io;
    try {
        Server s(io, opts.config);
        if (opts.once) s.set_connection_limit(1);
        s.set_progress(ConsoleProgress());

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&s](const asio::error_code& ec, int) {
            if (!ec) {
                Log::info("Server shutting down...");
                s.stop();
            }
        });
        s.on_transfer([&signals, &opts](const TransferResult&) {
            if (opts.once) signals.cancel();
        });
        io.run();
        Log::info("Handled " + std::to_string(s.connections_handled()) + " connection(s).");
    } catch (const NetworkError& e) {
        Log::error(e.what());
        Log::info("Make sure the port is not already in use.");
        return 1;
    } catch (const std::runtime_error& e) {
        Log::error(e.what());
        return 1;
    }
    Log::info("Server stopped.");
    return 0;
}

std::string strip_quotes(std::string path) {
    auto strip = [&path](char q) {
        while (!path.empty() && path.front() == q) path.erase(path.begin());
        while (!path.empty() && path.back() == q) path.pop_back();
    };
    strip('"');
    strip('\'');
    return path;
}

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// send_file already logs the failure with its kind, phase and byte count.
bool send_one(const std::string& path, const Config& config) {
    return send_file(path, config, ConsoleProgress()).ok;
}

int run_interactive(const Config& config) {
    std::cout << "==================================================\n"
              << "       DROPLINE SENDER\n"
              << "==================================================\n\n"
              << "[*] Receiver address: " << config.host << ":" << config.port << "\n\n";
    bool all_ok = true;
    std::string line;
    while (true) {
        std::cout << "--------------------------------------------------\n"
                  << "[?] Enter the file path to send (or 'quit' to exit): " << std::flush;
        if (!std::getline(std::cin, line)) break;
        std::string path = trim(line);
        std::string lowered = path;
        for (char& c : lowered) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lowered == "quit" || lowered == "exit" || lowered == "q") {
            Log::info("Goodbye!");
            break;
        }
        if (path.empty()) {
            Log::error("Please enter a valid file path.");
            continue;
        }
        path = strip_quotes(path);
        if (!Utils::check_file_exists(path)) {
            Log::error("File not found: " + path);
            continue;
        }
        if (send_one(path, config)) {
            Log::ok("Transfer complete!");
        } else {
            Log::info("Please try again.");
            all_ok = false;
        }
    }
    return all_ok ? 0 : 1;
}

int run_client(const Options& opts) {
    if (opts.files.empty()) {
        return run_interactive(opts.config);
    }
    bool all_ok = true;
    for (const auto& file : opts.files) {
        if (!send_one(file, opts.config)) all_ok = false;
    }
    return all_ok ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        Error::print_usage();
        return 1;
    }
    const std::string_view cmd = argv[1];
    if (cmd != Command::SERVE && cmd != Command::SEND) {
        std::cerr << "Invalid Command!\n";
        Error::print_usage();
        return 1;
    }

    Options opts;
    try {
        if (!parse_options(argc, argv, opts)) return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        Error::print_usage();
        return 1;
    }

    if (cmd == Command::SERVE) {
        if (!opts.files.empty()) {
            Error::invalid_option(opts.files.front());
            return 1;
        }
        return run_server(opts);
    }
    return run_client(opts);
}
