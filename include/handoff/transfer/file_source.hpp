#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <vector>

namespace handoff::transfer {

// Read-only byte source for one outgoing file.
class FileSource {
public:
    virtual ~FileSource() = default;
    
    virtual std::string name() const = 0;
    virtual std::string mime_type() const = 0;
    virtual std::uint64_t size() const = 0;
    virtual std::uint64_t last_modified() const = 0;  // unix ms
    
    // Reads up to buffer.size() bytes starting at `offset`. Throws std::runtime_error on I/O failure.
    virtual std::size_t read(std::uint64_t offset, std::span<std::uint8_t> buffer) = 0;
};

// Empty string when the extension is unknown.
std::string guess_mime_type(const std::string& file_name);

class MemoryFileSource : public FileSource {
public:
    MemoryFileSource(std::string name, std::vector<std::uint8_t> data,
                     std::string mime_type = "", std::uint64_t last_modified = 0);
    
    std::string name() const override { return name_; }
    std::string mime_type() const override { return mime_type_; }
    std::uint64_t size() const override { return data_.size(); }
    std::uint64_t last_modified() const override { return last_modified_; }
    std::size_t read(std::uint64_t offset, std::span<std::uint8_t> buffer) override;
    
    const std::vector<std::uint8_t>& data() const { return data_; }

private:
    std::string name_;
    std::vector<std::uint8_t> data_;
    std::string mime_type_;
    std::uint64_t last_modified_;
};

class DiskFileSource : public FileSource {
public:
    // Throws std::runtime_error when the path is not a readable regular file.
    explicit DiskFileSource(const std::filesystem::path& path);
    
    std::string name() const override { return path_.filename().string(); }
    std::string mime_type() const override { return mime_type_; }
    std::uint64_t size() const override { return size_; }
    std::uint64_t last_modified() const override { return last_modified_; }
    std::size_t read(std::uint64_t offset, std::span<std::uint8_t> buffer) override;
    
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream stream_;
    std::string mime_type_;
    std::uint64_t size_;
    std::uint64_t last_modified_;
};

}
