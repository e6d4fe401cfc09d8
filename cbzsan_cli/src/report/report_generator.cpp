#include "report_generator.hpp"
#include "../../../libcbzsan/include/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string fixed2(const double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

static double delta_percent(const ArchiveResult& r) {
    return r.state == cbzsan::ArchiveState::Done && r.size_before
               ? 100.0 * (1.0 - static_cast<double>(r.size_after) / static_cast<double>(r.size_before))
               : 0.0;
}

static std::string state_label(const ArchiveResult& r, const bool colors) {
    const std::string label(cbzsan::archive_state_to_string(r.state));
    if (!colors) return label;
    switch (r.state) {
        case cbzsan::ArchiveState::Done:    return "\033[1;32m" + label + "\033[0m";
        case cbzsan::ArchiveState::Skipped: return "\033[1;33m" + label + "\033[0m";
        default:                            return "\033[1;31m" + label + "\033[0m";
    }
}

ArchiveResult make_result(const cbzsan::ArchiveCompleteEvent& e) {
    ArchiveResult r;
    r.path = e.path;
    r.state = cbzsan::ArchiveState::Done;
    r.size_before = e.original_size;
    r.size_after = e.new_size;
    r.entries = e.entries_written;
    r.duplicates = e.extraction.duplicates.size();
    r.rejected = e.extraction.rejected.size();
    r.images = e.normalize.images_examined;
    r.resized = e.normalize.images_resized;
    r.replaced = e.normalize.images_replaced;
    r.dropped = e.normalize.non_images_dropped;
    r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
    return r;
}

ArchiveResult make_result(const cbzsan::ArchiveSkippedEvent& e) {
    ArchiveResult r;
    r.path = e.path;
    r.state = cbzsan::ArchiveState::Skipped;
    r.error_msg = e.reason;
    return r;
}

ArchiveResult make_result(const cbzsan::ArchiveErrorEvent& e) {
    ArchiveResult r;
    r.path = e.path;
    r.state = cbzsan::ArchiveState::Failed;
    r.size_before = e.original_size;
    r.error_msg = e.classified
        ? std::string(cbzsan::error_kind_to_string(e.kind)) + ": " + e.error_message
        : e.error_message;
    return r;
}

void print_console_report(const std::vector<ArchiveResult>& results,
                          const cbzsan::BatchSummary& summary,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    constexpr unsigned state_w = 9;
    constexpr unsigned num_w = 11;
    constexpr unsigned small_w = 6;
    const unsigned fixed_cols_width = state_w + 2 * num_w + 4 * small_w + 10;
    const unsigned file_col_width = term_width > fixed_cols_width + 15
                                        ? std::min(term_width - fixed_cols_width, 48u)
                                        : 15;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() < max_len ? s : s.substr(0, max_len - 4) + "... ";
    };

    std::cerr << "\n"
              << std::left << std::setw(file_col_width) << "Archive"
              << std::setw(state_w) << "State"
              << std::setw(num_w) << "Before(KB)"
              << std::setw(num_w) << "After(KB)"
              << std::setw(small_w) << "Dups"
              << std::setw(small_w) << "Imgs"
              << std::setw(small_w) << "Resz"
              << std::setw(small_w) << "Repl"
              << std::setw(10) << "Delta(%)"
              << "Error"
              << "\n";

    std::uintmax_t total_before = 0;
    std::uintmax_t total_after = 0;
    for (const auto& r : results) {
        // padding is computed on the plain label, colors are added around it
        const std::string plain = std::string(cbzsan::archive_state_to_string(r.state));
        const std::string padding(state_w > plain.size() ? state_w - plain.size() : 1, ' ');
        const bool done = r.state == cbzsan::ArchiveState::Done;

        std::cerr << std::left << std::setw(file_col_width) << truncate(r.path.filename().string(), file_col_width)
                  << state_label(r, use_colors) << padding
                  << std::setw(num_w) << (r.size_before / 1024)
                  << std::setw(num_w) << (done ? std::to_string(r.size_after / 1024) : "-")
                  << std::setw(small_w) << r.duplicates
                  << std::setw(small_w) << r.images
                  << std::setw(small_w) << r.resized
                  << std::setw(small_w) << r.replaced
                  << std::setw(10) << (done ? fixed2(delta_percent(r)) + "%" : "-")
                  << r.error_msg
                  << "\n";

        if (done) {
            total_before += r.size_before;
            total_after += r.size_after;
        }
    }

    std::cerr << "\nArchives: " << summary.done << " done, " << summary.skipped << " skipped, "
              << summary.failed << " failed" << (summary.interrupted ? " (interrupted)" : "") << "\n";
    if (total_before > 0) {
        const double saved = total_before > total_after ? static_cast<double>(total_before - total_after) : 0.0;
        std::cerr << "Total saved space: " << static_cast<std::uintmax_t>(saved / 1024) << " KB ("
                  << fixed2(100.0 * saved / static_cast<double>(total_before)) << "%)\n";
    }
    std::cerr << "Total time: " << fixed2(total_seconds) << " s\n";
}

bool export_csv_report(const std::vector<ArchiveResult>& results,
                       const cbzsan::BatchSummary& summary,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Can't write report: " + output_path.string(), "report");
        return false;
    }

    out << "Archive,State,Before(KB),After(KB),Delta(%),Entries,Duplicates,Rejected,Images,Resized,Replaced,Dropped,Time(s),Error\n";

    std::size_t duplicates = 0, resized = 0, replaced = 0;
    for (const auto& r : results) {
        const bool done = r.state == cbzsan::ArchiveState::Done;
        out << csv_escape(r.path.string()) << ","
            << cbzsan::archive_state_to_string(r.state) << ","
            << (r.size_before / 1024) << ","
            << (done ? std::to_string(r.size_after / 1024) : "") << ","
            << (done ? fixed2(delta_percent(r)) : "") << ","
            << r.entries << ","
            << r.duplicates << ","
            << r.rejected << ","
            << r.images << ","
            << r.resized << ","
            << r.replaced << ","
            << r.dropped << ","
            << fixed2(r.seconds) << ","
            << csv_escape(r.error_msg) << "\n";
        duplicates += r.duplicates;
        resized += r.resized;
        replaced += r.replaced;
    }

    out << "\n\nDone,Skipped,Failed,Duplicates,Resized,Replaced,Total time(s)\n";
    out << summary.done << "," << summary.skipped << "," << summary.failed << ","
        << duplicates << "," << resized << "," << replaced << ","
        << fixed2(total_seconds) << "\n";

    out.close();
    if (!out) {
        Logger::log(LogLevel::Error, "Write error on report: " + output_path.string(), "report");
        return false;
    }
    return true;
}
