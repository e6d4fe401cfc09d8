#ifndef CBZSAN_REPORT_GENERATOR_HPP
#define CBZSAN_REPORT_GENERATOR_HPP

#include "../../../libcbzsan/include/events.hpp"
#include "../../../libcbzsan/include/pipeline_orchestrator.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Outcome of one archive, collected from the EventBus for reporting.
 */
struct ArchiveResult {
    std::filesystem::path path;
    cbzsan::ArchiveState state = cbzsan::ArchiveState::Pending;
    std::uintmax_t size_before = 0;
    std::uintmax_t size_after = 0;
    std::size_t entries = 0;
    std::size_t duplicates = 0;
    std::size_t rejected = 0;
    std::size_t images = 0;
    std::size_t resized = 0;
    std::size_t replaced = 0;
    std::size_t dropped = 0;
    double seconds = 0.0;
    std::string error_msg;
};

ArchiveResult make_result(const cbzsan::ArchiveCompleteEvent& e);
ArchiveResult make_result(const cbzsan::ArchiveSkippedEvent& e);
ArchiveResult make_result(const cbzsan::ArchiveErrorEvent& e);

/// @return Terminal width in columns, 80 if it cannot be determined.
unsigned get_terminal_width();

/**
 * @brief Prints one line per archive plus totals to stderr.
 */
void print_console_report(const std::vector<ArchiveResult>& results,
                          const cbzsan::BatchSummary& summary,
                          double total_seconds);

/**
 * @brief Writes the per-archive results and totals as CSV.
 * @return false if the file cannot be written.
 */
bool export_csv_report(const std::vector<ArchiveResult>& results,
                       const cbzsan::BatchSummary& summary,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // CBZSAN_REPORT_GENERATOR_HPP
