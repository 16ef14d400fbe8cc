#include "swiftdrop/base64.hpp"

#include <array>
#include <cctype>
#include <string>
#include <vector>

namespace swiftdrop::base64 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kUrlEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::array<std::uint8_t, 256> BuildDecodeTable(const char* alphabet) {
    std::array<std::uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(alphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable(kEncTable);
const std::array<std::uint8_t, 256> kUrlDecTable = BuildDecodeTable(kUrlEncTable);

std::string EncodeWith(const std::vector<std::uint8_t>& data, const char* table, bool pad) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(table[(triple >> 18) & 0x3F]);
        out.push_back(table[(triple >> 12) & 0x3F]);
        out.push_back(table[(triple >> 6) & 0x3F]);
        out.push_back(table[triple & 0x3F]);
        i += 3;
    }
    if (i < data.size()) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(table[(triple >> 18) & 0x3F]);
        if (i + 1 < data.size()) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
            out.push_back(table[(triple >> 12) & 0x3F]);
            out.push_back(table[(triple >> 6) & 0x3F]);
            if (pad) {
                out.push_back('=');
            }
        } else {
            out.push_back(table[(triple >> 12) & 0x3F]);
            if (pad) {
                out.push_back('=');
                out.push_back('=');
            }
        }
    }
    return out;
}

std::vector<std::uint8_t> DecodeWith(const std::string& input,
                                     const std::array<std::uint8_t, 256>& table,
                                     bool* ok) {
    bool success = true;
    std::vector<std::uint8_t> out;
    out.reserve((input.size() / 4) * 3 + 3);

    int val = 0;
    int valb = -8;
    std::size_t symbols = 0;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=') {
            break;
        }
        std::uint8_t decoded = table[c];
        if (decoded == 0xFF) {
            success = false;
            break;
        }
        val = ((val << 6) + decoded) & 0xFFFFFF;
        valb += 6;
        ++symbols;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    // A single trailing symbol cannot encode a byte.
    if (symbols % 4 == 1) {
        success = false;
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    return EncodeWith(data, kEncTable, true);
}

std::vector<std::uint8_t> Decode(const std::string& input, bool* ok) {
    return DecodeWith(input, kDecTable, ok);
}

std::string EncodeUrl(const std::vector<std::uint8_t>& data) {
    return EncodeWith(data, kUrlEncTable, false);
}

std::vector<std::uint8_t> DecodeUrl(const std::string& input, bool* ok) {
    return DecodeWith(input, kUrlDecTable, ok);
}

}  // namespace swiftdrop::base64
