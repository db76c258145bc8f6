#include "listing_file.hpp"
#include "utf8.hpp"

#include <iconv.h>

#include <cerrno>
#include <fstream>
#include <iostream>
#include <iterator>

namespace {

bool starts_with_bytes(const std::string& bytes, std::string_view prefix) {
    return std::string_view(bytes).substr(0, prefix.size()) == prefix;
}

class IconvHandle
{
public:
    IconvHandle(const char* to, const char* from) : m_cd {iconv_open(to, from)} {}
    ~IconvHandle() {
        if (is_open()) {
            iconv_close(m_cd);
        }
    }
    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool is_open() const { return m_cd != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return m_cd; }

private:
    iconv_t m_cd;
};

}

const char* describe(ReadStatus status) {
    switch (status) {
    case ReadStatus::Ok:
        return "Loaded";
    case ReadStatus::OpenFailed:
        return "Error loading file";
    case ReadStatus::Empty:
        return "File is empty";
    case ReadStatus::DecodeFailed:
        return "Could not decode file as UTF-8 or GBK";
    }
    return "Unknown";
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines {};
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

bool convert_to_utf8(const std::string& bytes, const char* from_encoding, std::string& out) {
    IconvHandle cd {"UTF-8", from_encoding};
    if (!cd.is_open()) {
        std::cerr << "Encoding " << from_encoding << " is not supported\n";
        return false;
    }

    out.clear();
    std::string input = bytes;
    char* in_ptr = input.data();
    std::size_t in_left = input.size();

    std::string buffer(4096, '\0');
    while (in_left > 0) {
        char* out_ptr = buffer.data();
        std::size_t out_left = buffer.size();
        std::size_t rc = iconv(cd.get(), &in_ptr, &in_left, &out_ptr, &out_left);
        out.append(buffer.data(), buffer.size() - out_left);
        if (rc == static_cast<std::size_t>(-1) && errno != E2BIG) {
            return false;
        }
    }

    char* out_ptr = buffer.data();
    std::size_t out_left = buffer.size();
    if (iconv(cd.get(), nullptr, nullptr, &out_ptr, &out_left) == static_cast<std::size_t>(-1)) {
        return false;
    }
    out.append(buffer.data(), buffer.size() - out_left);
    return true;
}

ReadStatus decode_listing(const std::string& bytes,
                          std::vector<std::string>& lines, std::string& encoding)
{
    lines.clear();
    if (bytes.empty()) {
        return ReadStatus::Empty;
    }

    std::string text {};
    if (starts_with_bytes(bytes, "\xFF\xFE") || starts_with_bytes(bytes, "\xFE\xFF")) {
        encoding = starts_with_bytes(bytes, "\xFF\xFE") ? "UTF-16LE" : "UTF-16BE";
        if (!convert_to_utf8(bytes.substr(2), encoding.c_str(), text)) {
            return ReadStatus::DecodeFailed;
        }
    }
    else if (is_valid_utf8(bytes)) {
        encoding = "UTF-8";
        text = starts_with_bytes(bytes, "\xEF\xBB\xBF") ? bytes.substr(3) : bytes;
    }
    else {
        encoding = "GBK";
        if (!convert_to_utf8(bytes, "GBK", text)) {
            return ReadStatus::DecodeFailed;
        }
    }

    lines = split_lines(text);
    if (lines.empty()) {
        return ReadStatus::Empty;
    }
    return ReadStatus::Ok;
}

ReadStatus read_listing_file(const std::filesystem::path& path,
                             std::vector<std::string>& lines, std::string& encoding)
{
    std::ifstream file {path, std::ios::binary};
    if (!file.is_open()) {
        std::cerr << "Failed to open listing at path " << path.string() << "\n";
        return ReadStatus::OpenFailed;
    }

    std::string bytes {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        std::cerr << "Read failed for " << path.string() << "\n";
        return ReadStatus::OpenFailed;
    }

    return decode_listing(bytes, lines, encoding);
}
