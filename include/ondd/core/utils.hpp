#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ondd::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static std::string format_bytes(std::uint64_t bytes);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
};

}
