#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include "SessionManager.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " --watch <dir> [options]       transcribe chunks as they appear\n"
              << "  " << argv0 << " consolidate <session-id> [options]\n"
              << "  " << argv0 << " sessions [options]\n"
              << "\nOptions:\n"
              << "  --config <file>     JSON configuration\n"
              << "  --model <file>      whisper ggml model\n"
              << "  --output <file>     transcript path\n"
              << "  --db <file>         session database\n"
              << "  --log-file <file>   append log lines to this file\n"
              << "  --verbose           debug logging\n";
}

struct Options {
    std::string command = "watch";
    std::string watch_dir;
    std::string session_id;
    std::string config_path;
    std::string model_path;
    std::string output_path;
    std::string db_path;
    std::string log_file;
    bool        verbose = false;
};

bool parse_args(int argc, char* argv[], Options& opts) {
    int i = 1;
    if (i < argc && (std::string(argv[i]) == "consolidate" || std::string(argv[i]) == "sessions")) {
        opts.command = argv[i++];
        if (opts.command == "consolidate") {
            if (i >= argc) return false;
            opts.session_id = argv[i++];
        }
    }

    for (; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        if (arg == "--watch") {
            if (!next(opts.watch_dir)) return false;
        } else if (arg == "--config") {
            if (!next(opts.config_path)) return false;
        } else if (arg == "--model") {
            if (!next(opts.model_path)) return false;
        } else if (arg == "--output") {
            if (!next(opts.output_path)) return false;
        } else if (arg == "--db") {
            if (!next(opts.db_path)) return false;
        } else if (arg == "--log-file") {
            if (!next(opts.log_file)) return false;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }

    return opts.command != "watch" || !opts.watch_dir.empty();
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }

    cs::PipelineConfig config;
    if (!opts.config_path.empty()) {
        config = cs::ConfigLoader::load_file(opts.config_path);
    }
    if (!opts.model_path.empty()) config.model_path = opts.model_path;
    if (!opts.db_path.empty())    config.database_path = opts.db_path;
    if (!opts.log_file.empty())   config.log_file = opts.log_file;

    auto& log = cs::Logger::instance();
    log.set_level(opts.verbose ? cs::LogLevel::Debug
                               : cs::Logger::level_from_string(config.log_level));
    if (!config.log_file.empty() && !log.open_file(config.log_file)) {
        std::cerr << "Cannot open log file " << config.log_file << std::endl;
    }

    if (config.database_path.empty()) {
        std::filesystem::path base = opts.watch_dir.empty() ? "." : opts.watch_dir;
        config.database_path = (base / "chunkscribe.db").string();
    }

    // Consolidation and listing never transcribe; skip loading the model.
    if (opts.command != "watch") config.model_path.clear();

    cs::SessionManager manager(config);
    if (!manager.init()) {
        std::cerr << "Failed to open session database " << config.database_path << std::endl;
        return 1;
    }

    if (opts.command == "sessions") {
        for (const auto& s : manager.get_sessions()) {
            std::cout << s.id << "  " << cs::status_to_string(s.status) << "  "
                      << s.source_path << std::endl;
        }
        return 0;
    }

    if (opts.command == "consolidate") {
        return manager.consolidate_session(opts.session_id, opts.output_path) ? 0 : 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string session_id = manager.start_session(opts.watch_dir, opts.output_path);
    if (session_id.empty()) {
        std::cerr << "Failed to start session" << std::endl;
        return 1;
    }
    std::cout << "Session " << session_id << ": watching " << opts.watch_dir
              << " (Ctrl-C to finish)" << std::endl;

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nFinishing session..." << std::endl;
    bool ok = manager.stop_session();
    std::cout << (ok ? "Done." : "No transcript produced.") << std::endl;
    return ok ? 0 : 1;
}
