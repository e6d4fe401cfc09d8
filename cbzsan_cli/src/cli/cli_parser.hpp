#ifndef CBZSAN_CLI_PARSER_HPP
#define CBZSAN_CLI_PARSER_HPP

#include "../../../libcbzsan/include/sanitize_options.hpp"
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class Command {
    None,
    Sanitize,
    Find,
    Rename
};

struct Settings {
    Command command = Command::None;

    // global
    bool verbose = false;
    bool quiet = false;
    std::string log_level = "INFO";
    std::filesystem::path log_file;

    // sanitize
    std::string resize = "1440x";
    int quality = 75;
    std::filesystem::path tmp_root = "/tmp";
    bool keep_metadata = false;
    bool drop_non_images = false;
    std::filesystem::path report_path;

    // find
    double size_mb = 1.5;

    // rename
    std::string extension = "cbz";
    bool dry_run = false;

    std::vector<std::filesystem::path> inputs;

    /**
     * @brief Converts the validated sanitize settings into library options.
     * @throws std::invalid_argument if resize does not parse (prevented by the validator).
     */
    [[nodiscard]] cbzsan::SanitizeOptions to_sanitize_options() const;
};

/**
 * @brief Configures the CLI11 parser with the global options and the
 * sanitize, find and rename subcommands.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // CBZSAN_CLI_PARSER_HPP
