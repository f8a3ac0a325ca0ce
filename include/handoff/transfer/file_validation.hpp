#pragma once

#include "handoff/transfer/file_source.hpp"
#include "handoff/core/limits.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace handoff::transfer {

constexpr std::size_t MAX_FILE_NAME_LENGTH = 255;

struct FileMetadata {
    std::string id;
    std::string name;
    std::string sanitized_name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::uint64_t last_modified = 0;
    std::uint64_t total_chunks = 0;
    std::optional<std::string> hash;    // checksum of the first chunk
};

struct ValidationResult {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    
    bool is_valid() const { return errors.empty(); }
};

struct RejectedFile {
    std::shared_ptr<FileSource> source;
    ValidationResult result;
};

struct BatchValidation {
    std::vector<std::shared_ptr<FileSource>> valid_files;
    std::vector<RejectedFile> rejected_files;
    std::uint64_t total_size = 0;
    bool within_session_limit = true;
    bool within_file_count_limit = true;
    
    bool accepted() const { return within_session_limit && within_file_count_limit && !valid_files.empty(); }
    std::string rejection_reason() const;
};

// Removes traversal sequences, separators, markup and control characters;
// caps the length while keeping the extension.
std::string sanitize_file_name(const std::string& name);

// Lower-case extension including the dot, empty when there is none.
std::string file_extension(const std::string& name);
bool is_blocked_extension(const std::string& name);
bool is_allowed_mime_type(const std::string& mime_type);

// True when the leading bytes match the declared type, or no signature is known for it.
bool matches_signature(FileSource& source);

ValidationResult validate_file(FileSource& source, const core::TransferLimits& limits);
BatchValidation validate_batch(const std::vector<std::shared_ptr<FileSource>>& files,
                               const core::TransferLimits& limits);

std::uint64_t chunk_count(std::uint64_t size, std::uint32_t chunk_size);
FileMetadata create_file_metadata(FileSource& source, const core::TransferLimits& limits);

}
