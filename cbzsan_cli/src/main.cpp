#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "../../libcbzsan/include/archive_scanner.hpp"
#include "../../libcbzsan/include/codec_registry.hpp"
#include "../../libcbzsan/include/event_bus.hpp"
#include "../../libcbzsan/include/events.hpp"
#include "../../libcbzsan/include/logger.hpp"
#include "../../libcbzsan/include/pipeline_orchestrator.hpp"
#include "../../libcbzsan/include/suffix_renamer.hpp"

using namespace cbzsan;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static std::atomic<PipelineOrchestrator*> g_orchestrator{nullptr};
static_assert(std::atomic<PipelineOrchestrator*>::is_always_lock_free);

// handle ctrl+c or termination signals; only touches lock-free atomics
extern "C" void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (PipelineOrchestrator* orchestrator = g_orchestrator.load()) {
            orchestrator->request_stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8", ".UTF-8" /* Windows */};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Debug, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static void setup_sinks(const Settings& settings) {
    const LogLevel level = settings.verbose ? LogLevel::Debug : Logger::string_to_level(settings.log_level);

    Logger::clear_sinks();
    if (!settings.quiet) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = level;
        Logger::add_sink(std::move(console_sink));
    }
    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file, level);
        const bool opened = file_sink->is_open();
        Logger::add_sink(std::move(file_sink));
        if (!opened) {
            Logger::log(LogLevel::Warning, "Can't open log file: " + settings.log_file.string(), "main");
        }
    }
}

static int run_sanitize(const Settings& settings) {
    const CodecRegistry registry;
    EventBus bus;
    std::vector<ArchiveResult> results;

    bus.subscribe<ArchiveCompleteEvent>([&](const ArchiveCompleteEvent& e) {
        Logger::log(LogLevel::Info,
                    "Sanitized " + e.path.string() + " (" + std::to_string(e.original_size) + " -> " +
                    std::to_string(e.new_size) + " bytes, " +
                    std::to_string(e.extraction.duplicates.size()) + " duplicates, " +
                    std::to_string(e.normalize.images_replaced) + " images replaced), original kept as " +
                    e.backup_path.filename().string(),
                    "main");
        results.push_back(make_result(e));
    });
    bus.subscribe<ArchiveSkippedEvent>([&](const ArchiveSkippedEvent& e) {
        results.push_back(make_result(e));
    });
    bus.subscribe<ArchiveErrorEvent>([&](const ArchiveErrorEvent& e) {
        results.push_back(make_result(e));
    });

    PipelineOrchestrator orchestrator(settings.to_sanitize_options(), registry, bus);
    g_orchestrator.store(&orchestrator);
    if (interrupted.load()) {
        orchestrator.request_stop();
    }

    const auto start_total = std::chrono::steady_clock::now();
    const BatchSummary summary = orchestrator.process_batch(settings.inputs);
    g_orchestrator.store(nullptr);
    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet && !results.empty()) {
        print_console_report(results, summary, total_seconds);
    }
    if (!settings.report_path.empty()) {
        export_csv_report(results, summary, settings.report_path, total_seconds);
    }

    // an interrupt is reported by the orchestrator's log, not the exit status
    return 0;
}

static int run_find(const Settings& settings) {
    const ArchiveScanner scanner(settings.size_mb);
    for (const auto& input : settings.inputs) {
        if (interrupted.load()) break;
        scanner.scan_all({input});
    }
    return 0;
}

static int run_rename(const Settings& settings) {
    const SuffixRenamer renamer(settings.extension, settings.dry_run);
    for (const auto& input : settings.inputs) {
        if (interrupted.load()) break;
        renamer.rename(input);
    }
    return 0;
}

int main(int argc, char* argv[]) {

    CLI::App app{"cbzsan: sanitize comic book (CBZ) archives."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    setup_sinks(settings);
    init_utf8_locale();

    if (settings.inputs.empty()) {
        Logger::log(LogLevel::Debug, "No input files.", "main");
    }

    try {
        switch (settings.command) {
            case Command::Sanitize: return run_sanitize(settings);
            case Command::Find:     return run_find(settings);
            case Command::Rename:   return run_rename(settings);
            case Command::None:     break;
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Fatal: ") + e.what(), "main");
        return 1;
    }
    return 0;
}
