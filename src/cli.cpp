#include "docsync/cli.hpp"
#include <cstdlib>
#include <pwd.h>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace docsync {
namespace fs = std::filesystem;

namespace {

const passwd *current_passwd() {
    return ::getpwuid(::geteuid());
}

unsigned parse_threads(const std::string &val) {
    int n = 0;
    try { n = std::stoi(val); }
    catch(const std::exception &) { throw std::invalid_argument("invalid threads value: " + val); }
    if(n <= 0) throw std::invalid_argument("threads must be >0");
    return static_cast<unsigned>(n);
}

} // namespace

std::string usage_text() {
    return "Usage: docsync [options]\n"
           "Copy EPUB and PDF documents from the documents directories into a flat destination\n"
           "directory, such as a mounted e-book reader. Documents already present at the\n"
           "destination are left untouched.\n"
           "Options:\n"
           "  --destination-directory, -d <dir>  Destination (default /media/<user>/KOBOeReader)\n"
           "  --documents-directories, -s <dirs> Colon separated source directories, repeatable\n"
           "                                     (default ~/Documents)\n"
           "  --extensions, -e <exts>            Comma separated extensions (default epub,pdf)\n"
           "  --threads <n>                      Copy worker threads (default: one per core)\n"
           "  --dry-run, -n                      Show what would be copied without copying\n"
           "  --verbose, -v                      Print the resolved configuration first\n"
           "  --help, -h                         Show this text\n";
}

std::vector<std::string> split_list(std::string_view value, char sep) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while(start <= value.size()) {
        std::size_t end = value.find(sep, start);
        if(end == std::string_view::npos) end = value.size();
        if(end > start) items.emplace_back(value.substr(start, end - start));
        start = end + 1;
    }
    return items;
}

CliArgs parse_args(int argc, const char *const argv[]) {
    CliArgs args;
    auto value_of = [&](int &i, std::string_view flag) -> std::string {
        if(i + 1 >= argc) throw std::invalid_argument(std::string(flag) + " requires a value");
        return strip_quotes(argv[++i]);
    };
    for(int i = 1; i < argc; ++i) {
        std::string_view a = argv[i];
        if(a == "--help" || a == "-h") { args.show_help = true; continue; }
        if(a == "--dry-run" || a == "-n") { args.options.dry_run = true; continue; }
        if(a == "--verbose" || a == "-v") { args.options.verbose = true; continue; }
        if(a == "--threads") { args.options.threads = parse_threads(value_of(i, a)); continue; }
        if(a == "--destination-directory" || a == "-d") { args.dest_dir = fs::path(value_of(i, a)); continue; }
        if(a == "--documents-directories" || a == "-s") {
            for(auto &dir : split_list(value_of(i, a), ':')) args.source_dirs.emplace_back(dir);
            continue;
        }
        if(a == "--extensions" || a == "-e") {
            ExtensionSet exts;
            for(auto &ext : split_list(value_of(i, a), ',')) {
                if(ext.front() == '.') ext.erase(0, 1);
                if(!ext.empty()) exts.insert(ext);
            }
            if(exts.empty()) throw std::invalid_argument("--extensions requires at least one extension");
            args.extensions = std::move(exts);
            continue;
        }
        throw std::invalid_argument("unexpected argument: " + std::string(a));
    }
    return args;
}

fs::path lookup_home_directory() {
    if(const char *home = std::getenv("HOME"); home && *home) return home;
    if(const passwd *pw = current_passwd(); pw && pw->pw_dir && *pw->pw_dir) return pw->pw_dir;
    throw std::runtime_error("failed to read the current home directory");
}

std::string lookup_user_name() {
    if(const passwd *pw = current_passwd(); pw && pw->pw_name && *pw->pw_name) return pw->pw_name;
    if(const char *user = std::getenv("USER"); user && *user) return user;
    throw std::runtime_error("failed to read the current user name");
}

fs::path default_destination_directory() {
    return fs::path("/media") / lookup_user_name() / "KOBOeReader";
}

std::vector<fs::path> default_documents_directories() {
    return {lookup_home_directory() / "Documents"};
}

bool is_accessible_dir(const fs::path &p) {
    std::error_code ec;
    return fs::is_directory(p, ec) && !ec;
}

SyncConfig resolve_config(const CliArgs &args) {
    SyncConfig config;
    config.dest_dir = args.dest_dir ? *args.dest_dir : default_destination_directory();
    config.source_dirs = args.source_dirs.empty() ? default_documents_directories() : args.source_dirs;
    if(args.extensions) config.extensions = *args.extensions;
    config.options = args.options;

    if(!is_accessible_dir(config.dest_dir))
        throw std::runtime_error("The destination directory at " + path_text(config.dest_dir) + " is not accessible");
    for(auto const &dir : config.source_dirs) {
        if(!is_accessible_dir(dir))
            throw std::runtime_error("The documents directory at " + path_text(dir) + " is not accessible");
    }
    return config;
}

std::string strip_quotes(std::string_view v) {
    if(v.size()>=2) {
        char a=v.front(), b=v.back();
        if((a=='"'&&b=='"')||(a=='\''&&b=='\'')) { v.remove_prefix(1); v.remove_suffix(1); }
    }
    return std::string(v);
}

} // namespace docsync
