#include "swiftdrop/metadata.hpp"

#include "swiftdrop/errors.hpp"

#include <cstdint>

namespace swiftdrop::metadata {

namespace {

const char kHex[] = "0123456789abcdef";

std::string EscapeJson(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        auto byte = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (byte < 0x20) {
                    out += "\\u00";
                    out.push_back(kHex[byte >> 4]);
                    out.push_back(kHex[byte & 0x0F]);
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

void AppendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

class Reader {
public:
    explicit Reader(std::string_view text) : text_(text) {}

    void SkipSpace() {
        while (pos_ < text_.size()
               && (text_[pos_] == ' ' || text_[pos_] == '\n' || text_[pos_] == '\r' || text_[pos_] == '\t')) {
            ++pos_;
        }
    }

    bool Consume(char expected) {
        SkipSpace();
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    void Expect(char expected) {
        if (!Consume(expected)) {
            throw FormatError(std::string("Malformed JSON: expected '") + expected + "'");
        }
    }

    bool AtEnd() {
        SkipSpace();
        return pos_ == text_.size();
    }

    std::string String() {
        Expect('"');
        std::string out;
        while (true) {
            if (pos_ >= text_.size()) {
                throw FormatError("Malformed JSON: unterminated string");
            }
            char ch = text_[pos_++];
            if (ch == '"') {
                return out;
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (pos_ >= text_.size()) {
                throw FormatError("Malformed JSON: dangling escape");
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u':
                    AppendUtf8(out, Hex4());
                    break;
                default:
                    throw FormatError("Malformed JSON: bad escape");
            }
        }
    }

private:
    std::uint32_t Hex4() {
        if (pos_ + 4 > text_.size()) {
            throw FormatError("Malformed JSON: short \\u escape");
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') {
                value |= static_cast<std::uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                value |= static_cast<std::uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                value |= static_cast<std::uint32_t>(c - 'A' + 10);
            } else {
                throw FormatError("Malformed JSON: bad \\u escape");
            }
        }
        return value;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

std::string Build(const Fields& fields) {
    std::string json;
    json.reserve(fields.size() * 32);
    json.push_back('{');
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            json.push_back(',');
        }
        json.push_back('"');
        json += EscapeJson(fields[i].first);
        json += "\":\"";
        json += EscapeJson(fields[i].second);
        json.push_back('"');
    }
    json.push_back('}');
    return json;
}

MetadataMap Parse(std::string_view json) {
    Reader reader(json);
    MetadataMap result;
    reader.Expect('{');
    if (!reader.Consume('}')) {
        do {
            std::string key = reader.String();
            reader.Expect(':');
            result[key] = reader.String();
        } while (reader.Consume(','));
        reader.Expect('}');
    }
    if (!reader.AtEnd()) {
        throw FormatError("Malformed JSON: trailing data");
    }
    return result;
}

std::string GetValue(const MetadataMap& meta, std::string_view key) {
    auto it = meta.find(std::string(key));
    if (it == meta.end()) {
        return {};
    }
    return it->second;
}

bool Has(const MetadataMap& meta, std::string_view key) {
    return meta.find(std::string(key)) != meta.end();
}

}  // namespace swiftdrop::metadata
