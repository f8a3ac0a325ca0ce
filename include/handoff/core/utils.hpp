#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace handoff::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_speed(double bytes_per_second);
    static std::string format_duration(std::chrono::milliseconds duration);
    
    // "--:--" when the remaining time is unknown.
    static std::string format_time_remaining(std::optional<std::chrono::seconds> remaining);
};

class FileUtils {
public:
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::string get_file_extension(const std::filesystem::path& path);
    
    // First path in `directory` named `file_name` that does not exist yet,
    // appending " (n)" before the extension on collision.
    static std::filesystem::path unique_path(const std::filesystem::path& directory,
                                             const std::string& file_name);
    static bool write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& content);
};

class TimeUtils {
public:
    // Unix milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
    static std::string format_timestamp(std::uint64_t unix_ms);
};

class SystemUtils {
public:
    // "<os> <release> (<host>)", used as deviceInfo in connection requests.
    static std::string device_description();
};

}
