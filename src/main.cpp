// main.cpp - CLI entry for DocSync
#include <iostream>
#include "docsync/cli.hpp"
#include "docsync/sync.hpp"

int main(int argc, char* argv[]) {
    try {
        docsync::CliArgs args = docsync::parse_args(argc, argv);
        if(args.show_help) {
            std::cout << docsync::usage_text();
            return 0;
        }
        docsync::SyncConfig config = docsync::resolve_config(args);
        docsync::run_sync(config, std::cout, std::cerr);
    } catch(const std::invalid_argument &e) {
        std::cerr << "Error: " << e.what() << "\n" << docsync::usage_text();
        return 1;
    } catch(const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
