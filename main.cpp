#include "config.hpp"
#include "forest_builder.hpp"
#include "listing_file.hpp"
#include "listing_node.hpp"
#include "loader.hpp"
#include "tui.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cerr << "usage: tree_watcher [--print] [--strategy stack|recursive] [--config <path>] [file]\n";
}

int print_listing(const std::filesystem::path& path, const ViewerConfig& config, BuildStrategy strategy) {
    std::vector<std::string> lines;
    std::string encoding;

    ReadStatus read = read_listing_file(path, lines, encoding);
    if (read != ReadStatus::Ok) {
        std::cerr << describe(read) << ": " << path.string() << "\n";
        return 1;
    }

    LoadResult result = load_listing(lines, strategy);
    if (result.status != LoadStatus::Ok) {
        std::cerr << describe(result.status) << "\n";
        return 1;
    }

    print_forest(result.forest, std::cout, config.folder_icon, config.file_icon);
    return 0;
}

}

int main(int argc, char** argv) {
    std::filesystem::path listing_path {"tree_output.txt"};
    std::filesystem::path config_path {"config.json"};
    BuildStrategy strategy {BuildStrategy::Recursive};
    bool print_only {false};

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--print") {
            print_only = true;
        }
        else if (arg == "--strategy" && i + 1 < argc) {
            if (!parse_strategy(argv[++i], strategy)) {
                std::cerr << "Unknown build strategy " << argv[i] << "\n";
                print_usage();
                return 1;
            }
        }
        else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        }
        else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Unknown option " << arg << "\n";
            print_usage();
            return 1;
        }
        else {
            listing_path = arg;
        }
    }

    ViewerConfig config;
    if (!load_config(config_path, config)) {
        std::cerr << "Using default icons for the invalid config entries\n";
    }

    if (print_only) {
        return print_listing(listing_path, config, strategy);
    }

    if (!std::filesystem::exists(listing_path)) {
        std::cerr << "Default file not found. Pass the listing to load: " << listing_path.string() << "\n";
        print_usage();
        return 1;
    }

    run_tui(listing_path, config, strategy);
    return 0;
}
