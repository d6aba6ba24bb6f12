/**
 * \file cli.hpp
 * \brief Command-line surface: argument parsing, default directories and validation.
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "docsync/sync.hpp"

namespace docsync {
namespace fs = std::filesystem;

/** \brief Raw command-line values before defaults are applied. */
struct CliArgs {
    std::optional<fs::path> dest_dir;
    std::vector<fs::path> source_dirs;   //!< Empty = use the default documents directory.
    std::optional<ExtensionSet> extensions;
    SyncOptions options;
    bool show_help = false;
};

/** \brief Usage text printed by --help. */
std::string usage_text();

/**
 * \brief Parse argv. argv[0] is ignored.
 * \throws std::invalid_argument on unknown options, missing values or bad numbers.
 */
CliArgs parse_args(int argc, const char *const argv[]);

/** \brief Split a list option on \p sep, dropping empty items. */
std::vector<std::string> split_list(std::string_view value, char sep);

/**
 * \brief Home directory of the current user: $HOME, else the passwd entry.
 * \throws std::runtime_error if neither is available.
 */
fs::path lookup_home_directory();

/**
 * \brief Name of the effective user: passwd entry, else $USER.
 * \throws std::runtime_error if neither is available.
 */
std::string lookup_user_name();

/** \brief Removable reader mount point, /media/<user>/KOBOeReader. */
fs::path default_destination_directory();

/** \brief ~/Documents. */
std::vector<fs::path> default_documents_directories();

/** \brief True if \p p names an existing directory that could be inspected. */
bool is_accessible_dir(const fs::path &p);

/**
 * \brief Apply defaults and validate every directory.
 * \throws std::runtime_error naming the first inaccessible directory.
 */
SyncConfig resolve_config(const CliArgs &args);

/**
 * \brief Remove surrounding symmetric quotes ("..." or '...') if present.
 * \param v Input string view.
 * \return A copy without outer quotes if both ends match and are quotes; otherwise the original content.
 */
std::string strip_quotes(std::string_view v);

} // namespace docsync
