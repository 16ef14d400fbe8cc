#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace swiftdrop::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);
std::vector<std::uint8_t> Decode(const std::string& input, bool* ok = nullptr);

// URL-safe alphabet ('-', '_'), no padding. Decoding accepts missing padding.
std::string EncodeUrl(const std::vector<std::uint8_t>& data);
std::vector<std::uint8_t> DecodeUrl(const std::string& input, bool* ok = nullptr);

}  // namespace swiftdrop::base64
