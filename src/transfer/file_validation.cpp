#include "handoff/transfer/file_validation.hpp"
#include "handoff/crypto/hash.hpp"
#include "handoff/crypto/random.hpp"
#include "handoff/core/utils.hpp"
#include <algorithm>
#include <array>
#include <map>
#include <set>

namespace handoff::transfer {

namespace {
    using Signature = std::vector<std::uint8_t>;

    const std::map<std::string, std::vector<Signature>>& known_signatures() {
        static const std::map<std::string, std::vector<Signature>> signatures = {
            {"image/jpeg", {{0xFF, 0xD8, 0xFF}}},
            {"image/png", {{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}}},
            {"image/gif", {{0x47, 0x49, 0x46, 0x38, 0x37, 0x61}, {0x47, 0x49, 0x46, 0x38, 0x39, 0x61}}},
            {"image/webp", {{0x52, 0x49, 0x46, 0x46}}},
            {"video/webm", {{0x1A, 0x45, 0xDF, 0xA3}}},
            {"application/pdf", {{0x25, 0x50, 0x44, 0x46}}},
            {"application/zip", {{0x50, 0x4B, 0x03, 0x04}, {0x50, 0x4B, 0x05, 0x06}}},
            {"application/msword", {{0xD0, 0xCF, 0x11, 0xE0}}},
            {"application/vnd.openxmlformats-officedocument.wordprocessingml.document", {{0x50, 0x4B, 0x03, 0x04}}},
        };
        return signatures;
    }

    const std::set<std::string>& blocked_extensions() {
        static const std::set<std::string> extensions = {
            ".exe", ".bat", ".cmd", ".com", ".msi", ".scr",
            ".vbs", ".vbe", ".js", ".jse", ".ws", ".wsf", ".wsc", ".wsh",
            ".ps1", ".psm1", ".psd1",
            ".sh", ".bash", ".zsh",
            ".app", ".dmg", ".pkg",
            ".apk", ".deb", ".rpm",
        };
        return extensions;
    }

    const std::set<std::string>& allowed_mime_types() {
        static const std::set<std::string> types = {
            "image/jpeg", "image/png", "image/gif", "image/webp", "image/heic", "image/heif",
            "video/mp4", "video/quicktime", "video/x-m4v", "video/webm",
            "application/pdf",
            "application/msword",
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
            "text/plain",
            "application/vnd.ms-excel",
            "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
            "audio/mpeg", "audio/mp4", "audio/wav", "audio/ogg",
        };
        return types;
    }
}

std::string BatchValidation::rejection_reason() const {
    if (!within_session_limit) {
        return "Batch of " + core::utils::StringUtils::format_bytes(total_size) +
               " exceeds the session limit";
    }
    if (!within_file_count_limit) {
        return "Too many files in one batch (" + std::to_string(valid_files.size()) + ")";
    }
    if (valid_files.empty()) {
        return "No valid files to send";
    }
    return "";
}

std::string sanitize_file_name(const std::string& name) {
    static const std::string forbidden = "/\\<>:\"|?*";
    std::string sanitized = name;
    sanitized.erase(std::remove_if(sanitized.begin(), sanitized.end(), [](char c) {
        auto byte = static_cast<unsigned char>(c);
        return forbidden.find(c) != std::string::npos || byte < 0x20 || byte == 0x7F;
    }), sanitized.end());
    
    // Removing ".." can join two dots into a new pair, so repeat until none is left.
    for (auto pos = sanitized.find(".."); pos != std::string::npos; pos = sanitized.find("..")) {
        sanitized.erase(pos, 2);
    }
    
    if (sanitized.size() > MAX_FILE_NAME_LENGTH) {
        auto dot = sanitized.find_last_of('.');
        if (dot != std::string::npos && dot > 0 && sanitized.size() - dot < MAX_FILE_NAME_LENGTH) {
            auto extension = sanitized.substr(dot);
            sanitized = sanitized.substr(0, MAX_FILE_NAME_LENGTH - extension.size()) + extension;
        } else {
            sanitized.resize(MAX_FILE_NAME_LENGTH);
        }
    }
    
    if (core::utils::StringUtils::trim(sanitized).empty()) {
        sanitized = "unnamed_file";
    }
    
    return sanitized;
}

std::string file_extension(const std::string& name) {
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos) {
        return "";
    }
    return core::utils::StringUtils::to_lower(name.substr(dot));
}

bool is_blocked_extension(const std::string& name) {
    return blocked_extensions().count(file_extension(name)) > 0;
}

bool is_allowed_mime_type(const std::string& mime_type) {
    return allowed_mime_types().count(mime_type) > 0;
}

bool matches_signature(FileSource& source) {
    auto it = known_signatures().find(source.mime_type());
    if (it == known_signatures().end()) {
        return true;
    }
    
    std::array<std::uint8_t, 12> header{};
    auto length = source.read(0, header);
    
    return std::any_of(it->second.begin(), it->second.end(), [&](const Signature& signature) {
        return signature.size() <= length &&
               std::equal(signature.begin(), signature.end(), header.begin());
    });
}

ValidationResult validate_file(FileSource& source, const core::TransferLimits& limits) {
    ValidationResult result;
    auto name = source.name();
    auto mime_type = source.mime_type();
    
    if (source.size() > limits.max_file_size) {
        result.errors.push_back("File exceeds maximum size of " +
                                core::utils::StringUtils::format_bytes(limits.max_file_size));
    }
    
    if (source.size() == 0) {
        result.errors.push_back("File is empty");
    }
    
    if (is_blocked_extension(name)) {
        result.errors.push_back("This file type is not allowed for security reasons");
    }
    
    if (!is_allowed_mime_type(mime_type)) {
        if (mime_type.empty()) {
            result.warnings.push_back("Unknown file type - proceed with caution");
        } else {
            result.warnings.push_back("File type \"" + mime_type + "\" may not be fully supported");
        }
    }
    
    if (source.size() > 0) {
        try {
            if (!matches_signature(source)) {
                result.warnings.push_back("File signature does not match declared type");
            }
        } catch (const std::exception& e) {
            result.errors.push_back(std::string("File could not be read: ") + e.what());
        }
    }
    
    if (sanitize_file_name(name) != name) {
        result.warnings.push_back("File name was modified for security");
    }
    
    return result;
}

BatchValidation validate_batch(const std::vector<std::shared_ptr<FileSource>>& files,
                               const core::TransferLimits& limits) {
    BatchValidation batch;
    
    for (const auto& file : files) {
        auto result = validate_file(*file, limits);
        if (result.is_valid()) {
            batch.total_size += file->size();
            batch.valid_files.push_back(file);
        } else {
            batch.rejected_files.push_back({file, std::move(result)});
        }
    }
    
    batch.within_session_limit = batch.total_size <= limits.max_session_size;
    batch.within_file_count_limit = batch.valid_files.size() <= limits.max_files_per_batch;
    return batch;
}

std::uint64_t chunk_count(std::uint64_t size, std::uint32_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return (size + chunk_size - 1) / chunk_size;
}

FileMetadata create_file_metadata(FileSource& source, const core::TransferLimits& limits) {
    FileMetadata metadata;
    metadata.id = crypto::SecureRandom::generate_hex_id(8);
    metadata.name = source.name();
    metadata.sanitized_name = sanitize_file_name(metadata.name);
    metadata.size = source.size();
    metadata.mime_type = source.mime_type().empty() ? "application/octet-stream" : source.mime_type();
    metadata.last_modified = source.last_modified();
    metadata.total_chunks = chunk_count(metadata.size, limits.chunk_size);
    
    std::vector<std::uint8_t> first_chunk(static_cast<std::size_t>(
        std::min<std::uint64_t>(metadata.size, limits.chunk_size)));
    if (!first_chunk.empty()) {
        first_chunk.resize(source.read(0, first_chunk));
        metadata.hash = crypto::hash_utils::chunk_checksum(first_chunk);
    }
    
    return metadata;
}

}
