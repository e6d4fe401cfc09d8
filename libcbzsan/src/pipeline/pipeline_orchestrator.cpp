#include "../../include/pipeline_orchestrator.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/sanitize_error.hpp"
#include <chrono>
#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace cbzsan {

static const char* orchestrator_tag() {
    return "Pipeline";
}

PipelineOrchestrator::PipelineOrchestrator(SanitizeOptions options,
                                           const CodecRegistry& registry,
                                           EventBus& bus)
    : options_(std::move(options)),
      normalizer_(options_.bbox, options_.quality, options_.preserve_metadata, options_.drop_non_images, registry),
      event_bus_(bus) {}

void PipelineOrchestrator::transition(const fs::path& archive, ArchiveState& state, const ArchiveState next) const {
    Logger::log(LogLevel::Debug,
                archive.filename().string() + ": " + std::string(archive_state_to_string(state)) +
                " -> " + std::string(archive_state_to_string(next)),
                orchestrator_tag());
    state = next;
}

ArchiveState PipelineOrchestrator::process(const fs::path& archive) {
    ArchiveState state = ArchiveState::Pending;
    Logger::log(LogLevel::Info, "Sanitizing file: " + archive.string(), orchestrator_tag());

    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        const std::string reason = ec ? "Cannot access file: " + ec.message() : "Cannot access file";
        Logger::log(LogLevel::Warning, reason + ": " + archive.string(), orchestrator_tag());
        transition(archive, state, ArchiveState::Skipped);
        event_bus_.publish(ArchiveSkippedEvent{archive, std::string(error_kind_to_string(ErrorKind::UnreadableInput)) + ": " + reason});
        return state;
    }
    const std::uintmax_t original_size = fs::file_size(archive, ec);
    const bool readable = !ec && unique_FILE(open_file(archive, "rb")) != nullptr;
    if (!readable) {
        const std::string reason = ec ? ec.message() : "not readable";
        Logger::log(LogLevel::Warning, "Cannot access file: " + archive.string() + " (" + reason + ")", orchestrator_tag());
        transition(archive, state, ArchiveState::Skipped);
        event_bus_.publish(ArchiveSkippedEvent{archive, std::string(error_kind_to_string(ErrorKind::UnreadableInput)) + ": " + reason});
        return state;
    }

    event_bus_.publish(ArchiveStartEvent{archive, original_size});
    const auto start = std::chrono::steady_clock::now();

    try {
        const ScopedTempDir work_dir(options_.temp_root, "cbzsan");

        transition(archive, state, ArchiveState::Extracting);
        ExtractionReport extraction = extractor_.extract(archive, work_dir.path());

        transition(archive, state, ArchiveState::Normalizing);
        const NormalizeStats stats = normalizer_.normalize(work_dir.path());

        transition(archive, state, ArchiveState::Repackaging);
        const RepackReport repack = repackager_.repack(work_dir.path(), archive);

        transition(archive, state, ArchiveState::Done);
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        ArchiveCompleteEvent done;
        done.path = archive;
        done.backup_path = repack.backup_path;
        done.original_size = original_size;
        done.new_size = repack.archive_size;
        done.entries_written = repack.entries_written;
        done.extraction = std::move(extraction);
        done.normalize = stats;
        done.duration = duration;
        event_bus_.publish(done);
        return state;
    } catch (const SanitizeError& e) {
        Logger::log(LogLevel::Error,
                    std::string(error_kind_to_string(e.kind())) + " in " + archive.string() + " during " +
                    std::string(archive_state_to_string(state)) + ": " + e.what(),
                    orchestrator_tag());
        transition(archive, state, ArchiveState::Failed);
        event_bus_.publish(ArchiveErrorEvent{archive, e.kind(), true, e.what(), original_size});
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error,
                    "Failed " + archive.string() + " during " + std::string(archive_state_to_string(state)) +
                    ": " + e.what(),
                    orchestrator_tag());
        transition(archive, state, ArchiveState::Failed);
        event_bus_.publish(ArchiveErrorEvent{archive, ErrorKind::CorruptArchive, false, e.what(), original_size});
    }
    return state;
}

BatchSummary PipelineOrchestrator::process_batch(const std::vector<fs::path>& archives) {
    BatchSummary summary;
    for (const auto& archive : archives) {
        if (is_stopped()) {
            Logger::log(LogLevel::Warning, "Interrupted, not starting " + archive.string(), orchestrator_tag());
            summary.interrupted = true;
            break;
        }
        switch (process(archive)) {
            case ArchiveState::Done:    ++summary.done; break;
            case ArchiveState::Skipped: ++summary.skipped; break;
            default:                    ++summary.failed; break;
        }
    }
    return summary;
}

} // namespace cbzsan
