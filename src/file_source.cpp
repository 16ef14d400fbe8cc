#include "swiftdrop/file_source.hpp"

#include "swiftdrop/crypto.hpp"
#include "swiftdrop/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_map>

namespace swiftdrop::file_source {

namespace {

const std::unordered_map<std::string, std::string>& ContentTypes() {
    static const std::unordered_map<std::string, std::string> kTypes = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".mkv", "video/x-matroska"},
        {".mov", "video/quicktime"},
    };
    return kTypes;
}

}  // namespace

std::string ContentTypeFor(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    auto it = ContentTypes().find(ext);
    if (it == ContentTypes().end()) {
        return "application/octet-stream";
    }
    return it->second;
}

std::string NewTransferId() {
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    for (std::uint8_t byte : crypto::RandomBytes(16)) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

FilePayload ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ValidationError("Failed to open file: " + path.string());
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw ValidationError("Failed to read file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);

    Bytes data(static_cast<std::size_t>(size));
    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw ValidationError("Failed to read file: " + path.string());
        }
    }
    return FromBytes(path.filename().string(), std::move(data), ContentTypeFor(path));
}

FilePayload FromBytes(std::string name, Bytes data, std::string content_type) {
    FilePayload payload;
    payload.metadata.content_type = content_type.empty() ? ContentTypeFor(name) : std::move(content_type);
    payload.metadata.name = std::move(name);
    payload.metadata.size = data.size();
    payload.metadata.transfer_id = NewTransferId();
    payload.data = std::make_shared<const Bytes>(std::move(data));
    return payload;
}

void WriteFile(const std::filesystem::path& path, const Bytes& data) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw ValidationError("Failed to open file for writing: " + path.string());
    }
    if (!data.empty()) {
        output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    if (!output) {
        throw ValidationError("Failed to write file: " + path.string());
    }
}

}  // namespace swiftdrop::file_source
