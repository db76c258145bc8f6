#include "config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// ".tar.gz" files get the ".gz" icon; dot files have no extension.
std::string lower_extension(const std::string& name) {
    const auto pos = name.find_last_of('.');
    if (pos == std::string::npos || pos == 0) {
        return {};
    }
    return to_lower(name.substr(pos));
}

std::string normalize_extension(const std::string& key) {
    if (!key.empty() && key.front() == '.') {
        return to_lower(key);
    }
    return "." + to_lower(key);
}

bool read_string(const json& data, const char* key, std::string& out) {
    if (!data.contains(key)) {
        return true;
    }
    if (!data[key].is_string()) {
        std::cerr << "Config key " << key << " must be a string\n";
        return false;
    }
    out = data[key].get<std::string>();
    return true;
}

}

bool save_config(const fs::path& path, const ViewerConfig& config) {
    json data {
        {"file_icon", config.file_icon},
        {"folder_icon", config.folder_icon},
        {"extension_icons", config.extension_icons},
    };

    std::ofstream out {path};
    if (!out.is_open()) {
        std::cerr << "Error creating config at " << path.string() << "\n";
        return false;
    }
    out << data.dump(4, ' ', false) << "\n";
    return static_cast<bool>(out);
}

bool load_config(const fs::path& path, ViewerConfig& config) {
    if (!fs::exists(path)) {
        return save_config(path, config);
    }

    std::ifstream in {path};
    if (!in.is_open()) {
        std::cerr << "Error loading config: cannot open " << path.string() << "\n";
        return false;
    }

    json data {};
    try {
        data = json::parse(in);
    }
    catch (const json::exception& e) {
        std::cerr << "Error loading config: " << e.what() << "\n";
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Error loading config: top level must be an object\n";
        return false;
    }

    bool ok = read_string(data, "file_icon", config.file_icon);
    ok = read_string(data, "folder_icon", config.folder_icon) && ok;

    if (data.contains("extension_icons")) {
        const json& icons = data["extension_icons"];
        if (!icons.is_object()) {
            std::cerr << "Config key extension_icons must be an object\n";
            return false;
        }
        for (const auto& [ext, icon] : icons.items()) {
            if (!icon.is_string()) {
                std::cerr << "Icon for " << ext << " must be a string\n";
                ok = false;
                continue;
            }
            config.extension_icons[normalize_extension(ext)] = icon.get<std::string>();
        }
    }
    return ok;
}

const std::string& icon_for(const ViewerConfig& config, const ListingNode& node) {
    if (node.is_folder()) {
        return config.folder_icon;
    }
    const std::string ext = lower_extension(node.name);
    if (!ext.empty()) {
        auto it = config.extension_icons.find(ext);
        if (it != config.extension_icons.end()) {
            return it->second;
        }
    }
    return config.file_icon;
}
