#ifndef CBZSAN_MIME_DETECTOR_HPP
#define CBZSAN_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace cbzsan {

    /**
     * @brief Content-based MIME type detection.
     *
     * Archive members carry arbitrary names, so detection looks at the
     * bytes, never at the extension.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detects the MIME type of a file using libmagic.
         *
         * If libmagic is unavailable or cannot load its database, falls back
         * to a small built-in table of image and zip signatures.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type string (e.g., "image/jpeg"), "inode/x-empty"
         *         for an empty file, or an empty string if the file cannot be read.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Signature-table detection only, without libmagic.
         * @return A MIME type, "application/octet-stream" when nothing matches,
         *         or an empty string if the file cannot be read.
         */
        static std::string detect_by_signature(const std::filesystem::path& path);

        /// @return true for any "image/..." MIME type.
        static bool is_image_mime(std::string_view mime) noexcept {
            return mime.starts_with("image/");
        }
    };

} // namespace cbzsan

#endif // CBZSAN_MIME_DETECTOR_HPP
