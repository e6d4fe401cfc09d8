#ifndef CBZSAN_FILE_UTILS_HPP
#define CBZSAN_FILE_UTILS_HPP

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cbzsan {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief RAII deleter for FILE pointers.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Inserts "-{suffix}" between a file's stem and its extension.
     *
     * "dir/book.cbz" + "orig" -> "dir/book-orig.cbz". A file without an
     * extension just gets the suffix appended.
     */
    std::filesystem::path add_filename_suffix(const std::filesystem::path &file,
                                              std::string_view suffix);

    /**
     * @brief Creates a uniquely named directory "{prefix}-{random}" under base_dir.
     * @throws std::runtime_error if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir_in(const std::filesystem::path &base_dir,
                                           const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     * @param dir The path to the directory to be removed.
     * @param tag The logger tag.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /// @return The modification time of a file, or nullopt if it cannot be read.
    std::optional<std::time_t> file_mtime(const std::filesystem::path &path);

    /// @brief Sets access and modification time of a file; returns false on failure.
    bool set_file_mtime(const std::filesystem::path &path, std::time_t mtime);

    /**
     * @brief Exclusively owned temporary directory, removed on destruction.
     *
     * One instance backs the working tree of a single archive. The
     * directory is created in the constructor and removed recursively in
     * the destructor, on every exit path.
     */
    class ScopedTempDir {
    public:
        ScopedTempDir(const std::filesystem::path &base_dir, const std::string &prefix);
        ~ScopedTempDir();

        ScopedTempDir(const ScopedTempDir &) = delete;
        ScopedTempDir &operator=(const ScopedTempDir &) = delete;

        [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

} // namespace cbzsan

#endif // CBZSAN_FILE_UTILS_HPP
