/**
 * @file pipeline_orchestrator.hpp
 * @brief Runs extract, normalize and repackage for each input archive.
 *
 * This file contains the PipelineOrchestrator class, which owns the
 * per-archive state machine, isolates every archive in its own scoped
 * working directory and contains failures so a batch always completes.
 */

#ifndef CBZSAN_PIPELINE_ORCHESTRATOR_HPP
#define CBZSAN_PIPELINE_ORCHESTRATOR_HPP

#include "archive_extractor.hpp"
#include "archive_repackager.hpp"
#include "codec_registry.hpp"
#include "event_bus.hpp"
#include "image_normalizer.hpp"
#include "sanitize_options.hpp"
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace cbzsan {

/**
 * @brief Per-archive processing state.
 *
 * PENDING -> EXTRACTING -> NORMALIZING -> REPACKAGING -> DONE, with
 * SKIPPED and FAILED as the other terminal states.
 */
enum class ArchiveState {
    Pending,
    Extracting,
    Normalizing,
    Repackaging,
    Done,
    Skipped,
    Failed
};

constexpr std::string_view archive_state_to_string(const ArchiveState state) noexcept {
    switch (state) {
        case ArchiveState::Pending:     return "PENDING";
        case ArchiveState::Extracting:  return "EXTRACTING";
        case ArchiveState::Normalizing: return "NORMALIZING";
        case ArchiveState::Repackaging: return "REPACKAGING";
        case ArchiveState::Done:        return "DONE";
        case ArchiveState::Skipped:     return "SKIPPED";
        case ArchiveState::Failed:      return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @brief Outcome counts of a batch.
 */
struct BatchSummary {
    std::size_t done = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    bool interrupted = false; ///< true if the stop flag ended the batch early
};

/**
 * @brief Sanitizes archives one after another.
 *
 * @details For each archive:
 * - an inaccessible or non-regular input is SKIPPED before anything is created;
 * - otherwise a ScopedTempDir is created under the temp root, the archive is
 *   extracted into it, normalized in place and repackaged over the input;
 * - any exception is caught here and turns the archive FAILED.
 *
 * Progress is published on the EventBus given at construction.
 */
class PipelineOrchestrator {
public:
    /**
     * @param options Run configuration.
     * @param registry Codecs used by the normalizer. Must outlive this object.
     * @param bus Bus receiving the archive events. Must outlive this object.
     */
    PipelineOrchestrator(SanitizeOptions options, const CodecRegistry& registry, EventBus& bus);

    /**
     * @brief Sanitizes a single archive.
     * @return The terminal state: Done, Skipped or Failed.
     */
    ArchiveState process(const std::filesystem::path& archive);

    /**
     * @brief Sanitizes archives in order, stopping early once a stop is requested.
     *
     * The stop flag is checked before each archive; an archive already in
     * flight always runs to completion.
     */
    BatchSummary process_batch(const std::vector<std::filesystem::path>& archives);

    /**
     * @brief Request the batch to stop before the next archive.
     *
     * Only stores an atomic flag, so it is safe to call from a signal handler.
     */
    void request_stop() noexcept { stop_flag_.store(true, std::memory_order_relaxed); }

    /// @return true if a stop has been requested.
    [[nodiscard]] bool is_stopped() const noexcept {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const SanitizeOptions& options() const noexcept { return options_; }

private:
    void transition(const std::filesystem::path& archive, ArchiveState& state, ArchiveState next) const;

    SanitizeOptions options_;
    ArchiveExtractor extractor_;
    ImageNormalizer normalizer_;
    ArchiveRepackager repackager_;
    EventBus& event_bus_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace cbzsan

#endif // CBZSAN_PIPELINE_ORCHESTRATOR_HPP
