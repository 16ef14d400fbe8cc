#include "swiftdrop/rendezvous.hpp"

#include "swiftdrop/base64.hpp"
#include "swiftdrop/constants.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/log.hpp"
#include "swiftdrop/metadata.hpp"

#include <algorithm>
#include <vector>

namespace swiftdrop::rendezvous {

namespace {

constexpr const char* kInvalid = "Invalid code format";

std::string Trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool IsDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

std::string Encode(const RendezvousCode& code) {
    metadata::Fields fields;
    fields.emplace_back("s", code.negotiation_blob);
    fields.emplace_back("i", code.ice_server);
    fields.emplace_back("c", std::to_string(code.chunk_size == 0 ? constants::kCodeDefaultChunkSize
                                                                 : code.chunk_size));
    if (!code.public_key.empty()) {
        fields.emplace_back("p", code.public_key);
    }
    fields.emplace_back("h", code.high_performance ? "1" : "0");
    std::string json = metadata::Build(fields);
    return base64::EncodeUrl(std::vector<std::uint8_t>(json.begin(), json.end()));
}

RendezvousCode Parse(const std::string& text) {
    std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        throw ValidationError(kInvalid);
    }
    bool ok = false;
    std::vector<std::uint8_t> decoded = base64::DecodeUrl(trimmed, &ok);
    if (!ok || decoded.empty()) {
        throw ValidationError(kInvalid);
    }
    metadata::MetadataMap meta;
    try {
        meta = metadata::Parse(std::string(decoded.begin(), decoded.end()));
    } catch (const FormatError& ex) {
        log::Get()->debug("rendezvous code rejected: {}", ex.what());
        throw ValidationError(kInvalid);
    }
    if (!metadata::Has(meta, "s")) {
        throw ValidationError(kInvalid);
    }

    RendezvousCode code;
    code.negotiation_blob = metadata::GetValue(meta, "s");
    code.ice_server = metadata::GetValue(meta, "i");
    code.public_key = metadata::GetValue(meta, "p");
    if (code.negotiation_blob.empty()) {
        throw ValidationError(kInvalid);
    }

    std::string chunk = metadata::GetValue(meta, "c");
    if (chunk.empty()) {
        code.chunk_size = constants::kCodeDefaultChunkSize;
    } else {
        if (!IsDigits(chunk)) {
            throw ValidationError(kInvalid);
        }
        try {
            code.chunk_size = std::stoull(chunk);
        } catch (const std::exception&) {
            throw ValidationError(kInvalid);
        }
        if (code.chunk_size == 0) {
            throw ValidationError(kInvalid);
        }
    }

    std::string high = metadata::GetValue(meta, "h");
    if (!high.empty() && high != "0" && high != "1") {
        throw ValidationError(kInvalid);
    }
    code.high_performance = high == "1" || code.chunk_size > constants::kCodeHighPerformanceChunk;
    return code;
}

}  // namespace swiftdrop::rendezvous
