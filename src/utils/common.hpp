#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace filecron::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline long long ToEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

// Expands a leading "~" to $HOME.
inline std::filesystem::path ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath();
    }
    if (path.rfind("~/", 0) == 0) {
        return GetHomePath() / path.substr(2);
    }
    return std::filesystem::path(path);
}

// Cuts value to at most max_chars code points without splitting a UTF-8 sequence.
inline std::string TruncateUtf8(const std::string& value, std::size_t max_chars) {
    std::size_t chars = 0;
    std::size_t i = 0;
    while (i < value.size()) {
        if (chars == max_chars) {
            return value.substr(0, i);
        }
        const auto lead = static_cast<unsigned char>(value[i]);
        std::size_t width = 1;
        if ((lead & 0xE0) == 0xC0) {
            width = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            width = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            width = 4;
        }
        if (i + width > value.size()) {
            return value.substr(0, i);
        }
        i += width;
        ++chars;
    }
    return value;
}

}  // namespace filecron::utils
