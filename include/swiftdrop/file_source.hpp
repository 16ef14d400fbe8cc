#pragma once

#include "swiftdrop/protocol.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace swiftdrop::file_source {

using Bytes = std::vector<std::uint8_t>;

// A file held in memory, shared read-only between the caller and the engine.
struct FilePayload {
    protocol::FileMetadata metadata;
    std::shared_ptr<const Bytes> data;
};

// Guesses a MIME type from the extension; application/octet-stream otherwise.
std::string ContentTypeFor(const std::filesystem::path& path);

std::string NewTransferId();

FilePayload ReadFile(const std::filesystem::path& path);
FilePayload FromBytes(std::string name, Bytes data, std::string content_type = {});

void WriteFile(const std::filesystem::path& path, const Bytes& data);

}  // namespace swiftdrop::file_source
