#ifndef CONFIG_H
#define CONFIG_H

#include "listing_node.hpp"

#include <filesystem>
#include <map>
#include <string>

struct ViewerConfig {
    std::string file_icon {"📄"};
    std::string folder_icon {"📂"};
    // Lower-case extension with its dot (".txt") to icon.
    std::map<std::string, std::string> extension_icons {};
};

// Reads config.json. A missing file is created with the defaults. Keys that
// are malformed keep their defaults and make the call return false.
bool load_config(const std::filesystem::path& path, ViewerConfig& config);

bool save_config(const std::filesystem::path& path, const ViewerConfig& config);

// Folder icon for nodes with children, else the icon of the name's
// extension, else the file icon.
const std::string& icon_for(const ViewerConfig& config, const ListingNode& node);

#endif
