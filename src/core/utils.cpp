#include "handoff/core/utils.hpp"
#include <algorithm>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <cctype>
#include <cmath>
#include <ctime>
#include <sys/utsname.h>

namespace handoff::core::utils {

std::string StringUtils::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    
    if (start >= end) {
        return "";
    }
    return std::string(start, end);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_speed(double bytes_per_second) {
    if (!(bytes_per_second > 0.0)) {
        return format_bytes(0) + "/s";
    }
    return format_bytes(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }
    
    auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    
    auto minutes = seconds / 60;
    seconds %= 60;
    
    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }
    
    auto hours = minutes / 60;
    minutes %= 60;
    
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

std::string StringUtils::format_time_remaining(std::optional<std::chrono::seconds> remaining) {
    if (!remaining) {
        return "--:--";
    }
    return format_duration(std::chrono::duration_cast<std::chrono::milliseconds>(*remaining));
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::string FileUtils::get_file_extension(const std::filesystem::path& path) {
    return path.extension().string();
}

std::filesystem::path FileUtils::unique_path(const std::filesystem::path& directory,
                                             const std::string& file_name) {
    auto candidate = directory / file_name;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate;
    }
    
    std::filesystem::path name(file_name);
    auto stem = name.stem().string();
    auto extension = name.extension().string();
    
    for (int n = 1;; ++n) {
        candidate = directory / (stem + " (" + std::to_string(n) + ")" + extension);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

bool FileUtils::write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    
    file.write(reinterpret_cast<const char*>(content.data()),
               static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(file);
}

std::string TimeUtils::format_timestamp(std::uint64_t unix_ms) {
    auto time_t = static_cast<std::time_t>(unix_ms / 1000);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << unix_ms % 1000 << 'Z';
    return oss.str();
}

std::string SystemUtils::device_description() {
    struct utsname info{};
    if (uname(&info) != 0) {
        return "unknown device";
    }
    return std::string(info.sysname) + " " + info.release + " (" + info.nodename + ")";
}

}
