/**
 * \file sync.hpp
 * \brief Core synchronization pipeline for DocSync.
 *
 * Copies documents whose extension is recognized from one or more source trees into a single
 * flat destination directory. A file is copied only if no entry with the same name exists at
 * the destination; existing files are never updated, renamed or removed.
 *
 * The run is a pipeline of four stages connected by bounded channels:
 * scanner -> coordinator -> copy tasks, with scanner and coordinator both reporting to the
 * statistics aggregator.
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "docsync/channel.hpp"
#include "docsync/console.hpp"
#include "docsync/copy_executor.hpp"
#include "docsync/unique_fd.hpp"

namespace docsync {
namespace fs = std::filesystem;

inline constexpr std::size_t kCandidateChannelBound = 128;
inline constexpr std::size_t kStatisticsChannelBound = 128;

/** \brief Recognized extensions, without the leading dot. Matching is case-sensitive. */
using ExtensionSet = std::set<std::string, std::less<>>;

/** \brief Extensions synchronized when none are configured. */
ExtensionSet default_extensions();

/** \brief Payload-free notification counted by the aggregator. */
enum class Statistic {
    found_source,     //!< Scanner accepted a candidate
    skipped_existing, //!< Destination already had an entry with that name
    copied            //!< Copy task dispatched
};

/**
 * \struct RunSummary
 * \brief Final counters of a run. For a completed run found == skipped + copied.
 */
struct RunSummary {
    std::uintmax_t found = 0;
    std::uintmax_t skipped = 0;
    std::uintmax_t copied = 0;
    std::vector<fs::path> source_dirs; //!< Labels printed in the summary
};

/** \brief Options controlling synchronization behavior. */
struct SyncOptions {
    bool dry_run = false;   //!< If true, do not modify filesystem; statistics show intended actions.
    bool verbose = false;   //!< If true, print the resolved configuration before the run.
    unsigned threads = 0;   //!< Copy worker threads. 0 = hardware concurrency.
};

/** \brief Everything a run needs; directories are expected to be validated already. */
struct SyncConfig {
    std::vector<fs::path> source_dirs;
    fs::path dest_dir;
    ExtensionSet extensions = default_extensions();
    SyncOptions options;
};

/**
 * \brief Text form of a path for user-facing output.
 * \throws std::runtime_error if the path is not valid UTF-8.
 */
std::string path_text(const fs::path &p);

/** \brief True if the extension of \p p, without its dot, is in \p extensions. */
bool has_recognized_extension(const fs::path &p, const ExtensionSet &extensions);

/** \brief Source directory labels joined with " and ". */
std::string join_labels(const std::vector<fs::path> &dirs);

/** \brief The multi-line report printed at the end of a successful run. */
std::string format_summary(const RunSummary &summary);

/**
 * \brief Scanner stage. Walks every directory in order and emits matching regular files.
 * \details One Statistic::found_source is sent per candidate. Returns early if the candidate
 * receiver hung up.
 * \throws fs::filesystem_error on any traversal failure.
 */
void find_documents(const std::vector<fs::path> &dirs, const ExtensionSet &extensions,
                    Sender<fs::path> &candidates, Sender<Statistic> &stats);

/**
 * \brief Copy task body: stream \p src into the descriptor created for \p dest.
 * \details On failure the partially written destination is removed before the error propagates.
 * \throws std::system_error on any I/O failure.
 */
void copy_document(const fs::path &src, const fs::path &dest, UniqueFd dest_fd, Console &console);

/** \brief Dry-run copy task body: report the copy that would happen. */
void report_dry_run_copy(const fs::path &src, const fs::path &dest, Console &console);

/**
 * \brief Coordinator stage. Consumes candidates, claims destination names with an exclusive
 * create and dispatches one copy task per claimed name.
 * \details Once the candidate channel closes, every dispatched task is awaited in dispatch
 * order. The first failure is rethrown after all tasks have finished; later failures are
 * reported as warnings.
 * \throws std::system_error if a destination cannot be created for a reason other than
 * already existing, or the first copy failure.
 */
void sync_documents(const fs::path &dest_dir, const SyncOptions &options,
                    Receiver<fs::path> &candidates, Sender<Statistic> &stats,
                    CopyExecutor &executor, Console &console);

/**
 * \brief Aggregator stage. Counts statistics until the channel closes, then prints the summary
 * unless \p aborted was raised by a failing stage.
 */
RunSummary collect_stats(const std::vector<fs::path> &source_dirs, Receiver<Statistic> &stats,
                         Console &console, const std::atomic<bool> &aborted);

/**
 * \brief Run the whole pipeline and wait for every stage.
 * \param config Directories, extensions and options.
 * \param out Stream receiving progress lines and the summary.
 * \return Final counters.
 * \throws The first fatal error of the coordinator, scanner or aggregator, in that order.
 */
RunSummary run_sync(const SyncConfig &config, std::ostream &out = std::cout, std::ostream &err = std::cerr);

} // namespace docsync
