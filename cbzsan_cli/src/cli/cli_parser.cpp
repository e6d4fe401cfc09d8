#include "cli_parser.hpp"
#include "../../../libcbzsan/include/bounding_box.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>

namespace {
// validates the compact "WxH" resize grammar
struct BoundingBoxValidator : CLI::Validator {
    BoundingBoxValidator() {
        name_ = "BBOX";
        func_ = [](const std::string& str) {
            if (!cbzsan::parse_bounding_box(str)) {
                return std::string("Invalid resize parameter: '") + str +
                       "'. Expected [WIDTH]x[HEIGHT] with positive numbers, e.g. 1440x, x2000, 1200x1800.";
            }
            return std::string(); // ok
        };
    }
};

// extension given to rename: non-empty, no path separators
struct ExtensionValidator : CLI::Validator {
    ExtensionValidator() {
        name_ = "EXT";
        func_ = [](const std::string& str) {
            const std::string ext = !str.empty() && str.front() == '.' ? str.substr(1) : str;
            if (ext.empty() || ext.find_first_of("/\\") != std::string::npos) {
                return std::string("Invalid extension: '") + str + "'.";
            }
            return std::string(); // ok
        };
    }
};
} // namespace

cbzsan::SanitizeOptions Settings::to_sanitize_options() const {
    const auto box = cbzsan::parse_bounding_box(resize);
    if (!box) {
        throw std::invalid_argument("Invalid resize parameter: " + resize);
    }
    cbzsan::SanitizeOptions options;
    options.bbox = *box;
    options.quality = quality;
    options.temp_root = tmp_root;
    options.preserve_metadata = keep_metadata;
    options.drop_non_images = drop_non_images;
    return options;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);
    app.fallthrough();

    // --- Global options ---
    app.add_flag("-v,--verbose", settings.verbose,
                 "Show more output (same as --log-level DEBUG).");

    app.add_flag("--quiet", settings.quiet,
                 "No console logging and no summary; errors still reach --log-file.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("INFO")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "WARN", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also append logs to this file.");

    // --- sanitize ---
    CLI::App* sanitize = app.add_subcommand("sanitize",
        "Remove duplicate entries and downsample oversized images of CBZ files.\n"
        "Each FILE is replaced by a sanitized archive; the original is kept as FILE-orig.\n"
        "A hard kill during repackaging can leave only the -orig backup behind.");

    sanitize->add_option("-r,--resize", settings.resize,
                         "Bounding box [WIDTH]x[HEIGHT]; an omitted side is unconstrained.")
                         ->default_val("1440x")
                         ->check(BoundingBoxValidator());

    sanitize->add_option("-q,--quality", settings.quality,
                         "Quality parameter for the image compression algorithm.")
                         ->default_val(75)
                         ->check(CLI::Range(1, 100));

    sanitize->add_option("-t,--tmp", settings.tmp_root,
                         "Root path for temporary directories.")
                         ->default_val("/tmp");

    sanitize->add_flag("--keep-metadata", settings.keep_metadata,
                       "Keep ICC, EXIF, XMP and comment metadata when re-encoding images.");

    sanitize->add_flag("--drop-non-images", settings.drop_non_images,
                       "Remove archive members that are not images.");

    sanitize->add_option("--report", settings.report_path,
                         "CSV report export filename.")
                         ->take_last();

    sanitize->add_option("files", settings.inputs, "Space separated list of CBZ files");
    sanitize->callback([&settings]() { settings.command = Command::Sanitize; });

    // --- find ---
    CLI::App* find = app.add_subcommand("find",
        "Search zip/CBZ files for large entries and duplicates. Nothing is modified.");

    find->add_option("-z,--size", settings.size_mb,
                     "Size limit [MB] for candidates (candidates must be larger).")
                     ->default_val(1.5)
                     ->check(CLI::PositiveNumber);

    find->add_option("files", settings.inputs, "Space separated list of CBZ files");
    find->callback([&settings]() { settings.command = Command::Find; });

    // --- rename ---
    CLI::App* rename = app.add_subcommand("rename",
        "Remove the numeric suffix of file names (foobar_1234.cbz -> foobar.cbz).");

    rename->add_option("--ext", settings.extension,
                       "Extension of the files to rename.")
                       ->default_val("cbz")
                       ->check(ExtensionValidator());

    rename->add_flag("--dry-run", settings.dry_run,
                     "Only log what would be renamed.");

    rename->add_option("files", settings.inputs, "Space separated list of CBZ files");
    rename->callback([&settings]() { settings.command = Command::Rename; });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.verbose && settings.quiet) {
            throw CLI::ValidationError("--verbose and --quiet cannot be used together.");
        }
    });
}
