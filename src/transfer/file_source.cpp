#include "handoff/transfer/file_source.hpp"
#include "handoff/core/utils.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <stdexcept>

namespace handoff::transfer {

std::string guess_mime_type(const std::string& file_name) {
    static const std::map<std::string, std::string> types = {
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".heic", "image/heic"},
        {".heif", "image/heif"},
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".m4v", "video/x-m4v"},
        {".webm", "video/webm"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".txt", "text/plain"},
        {".mp3", "audio/mpeg"},
        {".m4a", "audio/mp4"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
    };
    
    auto extension = core::utils::StringUtils::to_lower(
        core::utils::FileUtils::get_file_extension(file_name));
    auto it = types.find(extension);
    return it == types.end() ? "" : it->second;
}

MemoryFileSource::MemoryFileSource(std::string name, std::vector<std::uint8_t> data,
                                   std::string mime_type, std::uint64_t last_modified)
    : name_(std::move(name))
    , data_(std::move(data))
    , mime_type_(mime_type.empty() ? guess_mime_type(name_) : std::move(mime_type))
    , last_modified_(last_modified) {}

std::size_t MemoryFileSource::read(std::uint64_t offset, std::span<std::uint8_t> buffer) {
    if (offset >= data_.size()) {
        return 0;
    }
    auto count = std::min<std::uint64_t>(buffer.size(), data_.size() - offset);
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset), count, buffer.begin());
    return static_cast<std::size_t>(count);
}

DiskFileSource::DiskFileSource(const std::filesystem::path& path)
    : path_(path)
    , stream_(path, std::ios::binary)
    , mime_type_(guess_mime_type(path.filename().string()))
    , size_(0)
    , last_modified_(0) {
    
    if (!std::filesystem::is_regular_file(path) || !stream_.is_open()) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    
    std::error_code ec;
    size_ = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat file " + path.string() + ": " + ec.message());
    }
    
    auto write_time = std::filesystem::last_write_time(path, ec);
    if (!ec) {
        auto system_time = std::chrono::file_clock::to_sys(write_time);
        last_modified_ = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            system_time.time_since_epoch()).count());
    }
}

std::size_t DiskFileSource::read(std::uint64_t offset, std::span<std::uint8_t> buffer) {
    if (offset >= size_) {
        return 0;
    }
    
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    if (!stream_) {
        throw std::runtime_error("Seek failed in " + path_.string());
    }
    
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    auto bytes_read = stream_.gcount();
    if (bytes_read <= 0 && !stream_.eof()) {
        throw std::runtime_error("Read failed in " + path_.string());
    }
    
    return static_cast<std::size_t>(bytes_read);
}

}
