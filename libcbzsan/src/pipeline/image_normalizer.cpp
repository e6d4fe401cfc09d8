#include "../../include/image_normalizer.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_resizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <cstdint>
#include <exception>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace cbzsan {

namespace fs = std::filesystem;

static const char* normalizer_tag() {
    return "ImageNormalizer";
}

namespace {

/**
 * @brief Removes the resized candidate unless it was promoted.
 */
struct CandidateGuard {
    fs::path path;
    bool released = false;

    explicit CandidateGuard(fs::path p) : path(std::move(p)) {}
    ~CandidateGuard() {
        if (released) return;
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove candidate " + path.string() + ": " + ec.message(), normalizer_tag());
        }
    }

    CandidateGuard(const CandidateGuard&) = delete;
    CandidateGuard& operator=(const CandidateGuard&) = delete;
};

std::string size_string(const std::uint32_t w, const std::uint32_t h) {
    return std::to_string(w) + "x" + std::to_string(h);
}

} // namespace

NormalizeStats& NormalizeStats::operator+=(const NormalizeStats& other) noexcept {
    images_examined += other.images_examined;
    images_resized += other.images_resized;
    images_replaced += other.images_replaced;
    images_kept += other.images_kept;
    non_images += other.non_images;
    non_images_dropped += other.non_images_dropped;
    undecodable += other.undecodable;
    failures += other.failures;
    return *this;
}

ImageNormalizer::ImageNormalizer(const BoundingBox& box,
                                 const int quality,
                                 const bool preserve_metadata,
                                 const bool drop_non_images,
                                 const CodecRegistry& registry)
    : box_(box),
      quality_(std::clamp(quality, 1, 100)),
      preserve_metadata_(preserve_metadata),
      drop_non_images_(drop_non_images),
      registry_(registry) {}

NormalizeStats ImageNormalizer::normalize(const fs::path& working_tree) const {
    NormalizeStats stats;
    walk(working_tree, stats);
    Logger::log(LogLevel::Debug,
                "Normalized " + working_tree.string() + ": " +
                std::to_string(stats.images_examined) + " images, " +
                std::to_string(stats.images_replaced) + " replaced, " +
                std::to_string(stats.non_images) + " non-images",
                normalizer_tag());
    return stats;
}

void ImageNormalizer::walk(const fs::path& dir, NormalizeStats& stats) const {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't list directory " + dir.string() + ": " + ec.message(), normalizer_tag());
        ++stats.failures;
    }

    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename() < b.path().filename();
    });

    for (const auto& entry : entries) {
        const fs::path& p = entry.path();
        std::error_code sec;
        if (entry.is_symlink(sec)) {
            Logger::log(LogLevel::Debug, "Ignoring symlink: " + p.string(), normalizer_tag());
            continue;
        }
        if (entry.is_directory(sec)) {
            walk(p, stats);
            continue;
        }
        if (!entry.is_regular_file(sec)) {
            continue;
        }

        try {
            normalize_file(p, stats);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "Leaving " + p.string() + " untouched: " + e.what(), normalizer_tag());
            ++stats.failures;
        }
    }
}

void ImageNormalizer::normalize_file(const fs::path& file, NormalizeStats& stats) const {
    ProbeResult probe = registry_.probe(file, preserve_metadata_);

    if (const auto* not_image = std::get_if<NotAnImage>(&probe)) {
        if (not_image->undecodable_image) {
            Logger::log(LogLevel::Warning, "Not a valid image: " + file.string() + " (" + not_image->reason + ")", normalizer_tag());
            ++stats.undecodable;
            return;
        }
        ++stats.non_images;
        if (!drop_non_images_) {
            Logger::log(LogLevel::Debug, "Keeping non-image file: " + file.string() + " (" + not_image->reason + ")", normalizer_tag());
            return;
        }
        std::error_code ec;
        if (fs::remove(file, ec)) {
            Logger::log(LogLevel::Info, "Removing non-image file: " + file.string(), normalizer_tag());
            ++stats.non_images_dropped;
        } else {
            Logger::log(LogLevel::Warning, "Can't remove non-image file " + file.string() + ": " + ec.message(), normalizer_tag());
        }
        return;
    }

    auto& decoded = std::get<DecodedImage>(probe);
    Image image = std::move(decoded.image);
    ++stats.images_examined;

    if (const auto target = compute_target_size(image.width, image.height, box_)) {
        Logger::log(LogLevel::Debug,
                    "Resizing image: " + file.string() + " " + size_string(image.width, image.height) +
                    " -> " + size_string(target->width, target->height),
                    normalizer_tag());
        image = resize_area(image, *target);
        ++stats.images_resized;
    } else {
        Logger::log(LogLevel::Debug,
                    "Image is small enough: " + file.string() + " " + size_string(image.width, image.height),
                    normalizer_tag());
    }

    const auto original_mtime = file_mtime(file);
    CandidateGuard candidate(add_filename_suffix(file, "resized-" + RandomUtils::random_suffix()));

    EncodeOptions options;
    options.quality = quality_;
    options.preserve_metadata = preserve_metadata_;
    decoded.codec->encode(image, candidate.path, options);

    const auto size_before = fs::file_size(file);
    const auto size_after = fs::file_size(candidate.path);

    if (size_before <= size_after) {
        Logger::log(LogLevel::Debug,
                    "Keeping original " + file.string() + " (" + std::to_string(size_before) +
                    " <= " + std::to_string(size_after) + " bytes)",
                    normalizer_tag());
        ++stats.images_kept;
        return;
    }

    fs::rename(candidate.path, file);
    candidate.released = true;
    ++stats.images_replaced;

    if (original_mtime && !set_file_mtime(file, *original_mtime)) {
        Logger::log(LogLevel::Debug, "Can't restore modification time of " + file.string(), normalizer_tag());
    }
    Logger::log(LogLevel::Debug,
                "Replaced " + file.string() + " (" + std::to_string(size_before) + " -> " +
                std::to_string(size_after) + " bytes)",
                normalizer_tag());
}

} // namespace cbzsan
