#include "../../include/suffix_renamer.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <system_error>
#include <utility>

namespace cbzsan {

namespace fs = std::filesystem;

static const char* renamer_tag() {
    return "rename";
}

static std::string regex_escape(const std::string_view text) {
    static constexpr std::string_view special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (const char c : text) {
        if (special.find(c) != std::string_view::npos) out += '\\';
        out += c;
    }
    return out;
}

static std::string to_upper_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

SuffixRenamer::SuffixRenamer(std::string extension, const bool dry_run)
    : extension_(std::move(extension)), dry_run_(dry_run) {
    if (!extension_.empty() && extension_.front() == '.') {
        extension_.erase(0, 1);
    }
}

std::optional<fs::path> SuffixRenamer::stripped_name(const fs::path& file) const {
    const std::regex pattern("(.*)_\\d+\\." + regex_escape(extension_));
    const std::string name = file.filename().string();
    std::smatch match;
    if (!std::regex_match(name, match, pattern)) {
        return std::nullopt;
    }
    return file.parent_path() / (match[1].str() + "." + extension_);
}

RenameResult SuffixRenamer::rename(const fs::path& file) const {
    RenameResult result;
    result.source = file;
    Logger::log(LogLevel::Debug, "Handling file: " + file.string(), renamer_tag());

    if (!file.filename().string().ends_with("." + extension_)) {
        Logger::log(LogLevel::Warning, "Not a " + to_upper_copy(extension_) + " file: " + file.string(), renamer_tag());
        result.outcome = RenameOutcome::WrongExtension;
        return result;
    }

    const auto destination = stripped_name(file);
    if (!destination) {
        Logger::log(LogLevel::Warning, "Does not match: " + file.string(), renamer_tag());
        result.outcome = RenameOutcome::NotMatching;
        return result;
    }
    result.destination = *destination;

    std::error_code ec;
    if (fs::exists(fs::symlink_status(*destination, ec))) {
        Logger::log(LogLevel::Error, "File with destination name exists: " + destination->string(), renamer_tag());
        result.outcome = RenameOutcome::DestinationExists;
        return result;
    }

    if (dry_run_) {
        Logger::log(LogLevel::Info, "[DRY-RUN] Would rename: " + file.string() + " -> " + destination->string(), renamer_tag());
        result.outcome = RenameOutcome::DryRun;
        return result;
    }

    Logger::log(LogLevel::Debug, "Renaming: " + file.string() + " -> " + destination->string(), renamer_tag());
    fs::rename(file, *destination, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Rename failed: " + file.string() + " (" + ec.message() + ")", renamer_tag());
        result.outcome = RenameOutcome::Failed;
        return result;
    }
    result.outcome = RenameOutcome::Renamed;
    return result;
}

} // namespace cbzsan
