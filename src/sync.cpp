#include "docsync/sync.hpp"
#include <cerrno>
#include <exception>
#include <fcntl.h>
#include <future>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <unordered_set>
#include <utility>

namespace docsync {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

bool is_utf8(std::string_view s) {
    std::size_t i = 0;
    while(i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0; std::uint32_t cp = 0;
        if(c < 0x80) { ++i; continue; }
        else if((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if(i + len > s.size()) return false;
        for(std::size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i+k]);
            if((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates and out-of-range code points
        if((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if(cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::system_error errno_error(int err, const std::string &what, const fs::path &p) {
    return std::system_error(err, std::generic_category(), what + " " + p.string());
}

void write_all(int fd, const char *data, std::size_t len, const fs::path &dest) {
    while(len > 0) {
        ssize_t n = ::write(fd, data, len);
        if(n < 0) {
            const int err = errno;
            if(err == EINTR) continue;
            throw errno_error(err, "cannot write", dest);
        }
        data += n; len -= static_cast<std::size_t>(n);
    }
}

void stream_file(const fs::path &src, int dest_fd, const fs::path &dest) {
    UniqueFd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if(!in) { const int err = errno; throw errno_error(err, "cannot open", src); }
    std::vector<char> buf(kCopyBufferSize);
    for(;;) {
        ssize_t got = ::read(in.get(), buf.data(), buf.size());
        if(got < 0) {
            const int err = errno;
            if(err == EINTR) continue;
            throw errno_error(err, "cannot read", src);
        }
        if(got == 0) break;
        write_all(dest_fd, buf.data(), static_cast<std::size_t>(got), dest);
    }
}

// Dry runs cannot create anything, so the exclusive create is simulated: a name is free if
// nothing exists at the destination and no earlier candidate of this run claimed it.
bool claim_dry_run(const fs::path &dest, std::unordered_set<std::string> &claimed) {
    std::error_code ec;
    auto st = fs::symlink_status(dest, ec);
    if(st.type() != fs::file_type::not_found) {
        if(ec) throw fs::filesystem_error("cannot inspect destination", dest, ec);
        return false;
    }
    return claimed.insert(dest.native()).second;
}

void report(Sender<Statistic> &stats, Statistic stat) {
    if(!stats.send(stat)) throw std::runtime_error("statistics aggregator stopped before the run finished");
}

} // namespace

ExtensionSet default_extensions() {
    return {"epub", "pdf"};
}

std::string path_text(const fs::path &p) {
    const std::string &s = p.native();
    if(!is_utf8(s)) throw std::runtime_error("could not decode a path to UTF-8");
    return s;
}

bool has_recognized_extension(const fs::path &p, const ExtensionSet &extensions) {
    auto ext = p.extension().native();
    if(ext.size() < 2) return false; // no extension, or a lone trailing dot
    return extensions.find(std::string_view(ext).substr(1)) != extensions.end();
}

std::string join_labels(const std::vector<fs::path> &dirs) {
    std::string s;
    for(std::size_t i = 0; i < dirs.size(); ++i) {
        if(i > 0) s += " and ";
        s += path_text(dirs[i]);
    }
    return s;
}

std::string format_summary(const RunSummary &summary) {
    std::ostringstream os;
    os << "\n"
       << "Found documents in documents directory at " << join_labels(summary.source_dirs) << ": " << summary.found << "\n"
       << "Documents not copied because they already exist at the destination: " << summary.skipped << "\n"
       << "Documents copied: " << summary.copied;
    return os.str();
}

// ================= Scanner =================
void find_documents(const std::vector<fs::path> &dirs, const ExtensionSet &extensions,
                    Sender<fs::path> &candidates, Sender<Statistic> &stats) {
    for(auto const &dir : dirs) {
        // Throwing iteration: an unreadable entry anywhere aborts the run.
        for(auto const &entry : fs::recursive_directory_iterator(dir)) {
            if(!entry.is_regular_file()) continue;
            if(!has_recognized_extension(entry.path(), extensions)) continue;
            if(!stats.send(Statistic::found_source)) return;
            if(!candidates.send(entry.path())) return;
        }
    }
}

// ================= Copy task =================
void copy_document(const fs::path &src, const fs::path &dest, UniqueFd dest_fd, Console &console) {
    try {
        // Text forms are resolved first so an undecodable path fails before any byte is written.
        const std::string src_str = path_text(src);
        const std::string dest_str = path_text(dest);
        stream_file(src, dest_fd.get(), dest);
        if(dest_fd.close() != 0) { const int err = errno; throw errno_error(err, "cannot close", dest); }
        console.line("Copied " + src_str + " to " + dest_str);
    } catch(const std::exception &) {
        dest_fd.reset();
        std::error_code ec; fs::remove(dest, ec);
        if(ec) console.warn("cannot remove partial copy " + dest.string() + ": " + ec.message());
        throw;
    }
}

void report_dry_run_copy(const fs::path &src, const fs::path &dest, Console &console) {
    console.line("Dry-running; would otherwise copy " + path_text(src) + " to " + path_text(dest));
}

// ================= Coordinator =================
void sync_documents(const fs::path &dest_dir, const SyncOptions &options,
                    Receiver<fs::path> &candidates, Sender<Statistic> &stats,
                    CopyExecutor &executor, Console &console) {
    std::vector<std::future<void>> copies;
    std::unordered_set<std::string> claimed; // dry-run only
    std::exception_ptr failure;

    try {
        while(auto candidate = candidates.recv()) {
            fs::path src = std::move(*candidate);
            if(!src.has_filename()) continue;
            const fs::path dest = dest_dir / src.filename();

            bool created = false;
            UniqueFd dest_fd;
            if(options.dry_run) {
                created = claim_dry_run(dest, claimed);
            } else {
                // O_EXCL: creation itself fails with EEXIST, there is no separate existence probe.
                const int fd = ::open(dest.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
                const int err = errno;
                if(fd >= 0) { dest_fd = UniqueFd(fd); created = true; }
                else if(err != EEXIST) throw errno_error(err, "cannot create", dest);
            }

            if(created) {
                if(options.dry_run) {
                    copies.push_back(executor.submit([src, dest, &console]{ report_dry_run_copy(src, dest, console); }));
                } else {
                    copies.push_back(executor.submit([src, dest, fd = std::move(dest_fd), &console]() mutable {
                        copy_document(src, dest, std::move(fd), console);
                    }));
                }
                report(stats, Statistic::copied);
            } else {
                console.line("Document " + path_text(dest) + " already exists at the destination; will not copy across.");
                report(stats, Statistic::skipped_existing);
            }
        }
    } catch(...) {
        failure = std::current_exception();
    }

    // FIFO join; completion order of the tasks themselves is unconstrained.
    for(auto &copy : copies) {
        try {
            copy.get();
        } catch(const std::exception &e) {
            if(!failure) failure = std::current_exception();
            else console.warn(std::string("copy failed after an earlier error: ") + e.what());
        }
    }
    if(failure) std::rethrow_exception(failure);
}

// ================= Aggregator =================
RunSummary collect_stats(const std::vector<fs::path> &source_dirs, Receiver<Statistic> &stats,
                         Console &console, const std::atomic<bool> &aborted) {
    RunSummary summary;
    summary.source_dirs = source_dirs;
    while(auto stat = stats.recv()) {
        switch(*stat) {
            case Statistic::found_source: ++summary.found; break;
            case Statistic::skipped_existing: ++summary.skipped; break;
            case Statistic::copied: ++summary.copied; break;
        }
    }
    if(!aborted.load()) console.line(format_summary(summary));
    return summary;
}

// ================= Pipeline =================
RunSummary run_sync(const SyncConfig &config, std::ostream &out, std::ostream &err) {
    Console console(out, err);
    std::atomic<bool> aborted{false};

    if(config.options.verbose) {
        std::string exts;
        for(auto const &e : config.extensions) { if(!exts.empty()) exts += ","; exts += e; }
        console.line("Documents directories: " + join_labels(config.source_dirs));
        console.line("Destination directory: " + path_text(config.dest_dir));
        console.line("Extensions: " + exts);
        if(config.options.dry_run) console.line("Mode: dry run");
    }

    auto [candidates_tx, candidates_rx] = make_channel<fs::path>(kCandidateChannelBound);
    auto [stats_tx, stats_rx] = make_channel<Statistic>(kStatisticsChannelBound);

    auto stats_collection = std::async(std::launch::async, [&, rx = std::move(stats_rx)]() mutable {
        return collect_stats(config.source_dirs, rx, console, aborted);
    });

    auto document_finding = std::async(std::launch::async,
        [&, candidates = std::move(candidates_tx), stats = stats_tx]() mutable {
            try {
                find_documents(config.source_dirs, config.extensions, candidates, stats);
            } catch(...) {
                // Raise the flag before the senders go away so the aggregator sees it.
                aborted = true;
                candidates.reset(); stats.reset();
                throw;
            }
            candidates.reset(); stats.reset();
        });

    std::exception_ptr failure;
    try {
        // Leaves scope, joining its workers, before stats_tx is released.
        CopyExecutor executor(config.options.threads);
        sync_documents(config.dest_dir, config.options, candidates_rx, stats_tx, executor, console);
    } catch(...) {
        failure = std::current_exception();
        aborted = true;
        candidates_rx.close(); // a scanner blocked on a full channel must not hang the join
    }
    stats_tx.reset();

    try { document_finding.get(); }
    catch(const std::exception &e) {
        if(!failure) failure = std::current_exception();
        else console.warn(std::string("scanning also failed: ") + e.what());
    }
    RunSummary summary;
    try { summary = stats_collection.get(); }
    catch(const std::exception &e) {
        if(!failure) failure = std::current_exception();
        else console.warn(std::string("statistics collection also failed: ") + e.what());
    }

    if(failure) std::rethrow_exception(failure);
    return summary;
}

} // namespace docsync
