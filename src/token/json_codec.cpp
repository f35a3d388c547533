/// @file json_codec.cpp
/// @brief Flat-object JSON codec for JWT headers and claim sets.

#include "json_codec.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>

namespace keyring::token::detail {

namespace {

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

/// Recursive-descent reader over one JSON text.
class Reader {
public:
    explicit Reader(std::string_view text) : text_(text) {}

    std::optional<Claims> readObject() {
        skipWs();
        if (!consume('{')) {
            return std::nullopt;
        }
        Claims claims;
        skipWs();
        if (consume('}')) {
            return finish(std::move(claims));
        }
        while (true) {
            skipWs();
            auto name = readString();
            if (!name) {
                return std::nullopt;
            }
            skipWs();
            if (!consume(':')) {
                return std::nullopt;
            }
            auto value = readValue();
            if (!value) {
                return std::nullopt;
            }
            if (!claims.emplace(std::move(*name), std::move(*value)).second) {
                return std::nullopt;  // duplicate member
            }
            skipWs();
            if (consume('}')) {
                return finish(std::move(claims));
            }
            if (!consume(',')) {
                return std::nullopt;
            }
        }
    }

private:
    std::optional<Claims> finish(Claims claims) {
        skipWs();
        if (pos_ != text_.size()) {
            return std::nullopt;
        }
        return claims;
    }

    void skipWs() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' ||
                text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consumeLiteral(std::string_view literal) {
        if (text_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    std::optional<uint32_t> readHex4() {
        if (pos_ + 4 > text_.size()) {
            return std::nullopt;
        }
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, value, 16);
        if (ec != std::errc() || ptr != text_.data() + pos_ + 4) {
            return std::nullopt;
        }
        pos_ += 4;
        return value;
    }

    std::optional<std::string> readString() {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    auto unit = readHex4();
                    if (!unit) {
                        return std::nullopt;
                    }
                    uint32_t codepoint = *unit;
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                        if (!consumeLiteral("\\u")) {
                            return std::nullopt;
                        }
                        auto low = readHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                            return std::nullopt;
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                        return std::nullopt;  // lone low surrogate
                    }
                    appendUtf8(out, codepoint);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<ClaimValue> readNumber() {
        const auto start = pos_;
        bool integral = true;
        consume('-');
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c >= '0' && c <= '9') {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
                integral = false;
                ++pos_;
            } else {
                break;
            }
        }
        auto token = text_.substr(start, pos_ - start);
        if (token.empty() || token == "-") {
            return std::nullopt;
        }

        if (integral) {
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            if (ec == std::errc() && ptr == token.data() + token.size()) {
                return ClaimValue(value);
            }
            if (ec != std::errc::result_out_of_range) {
                return std::nullopt;
            }
        }

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc() || ptr != token.data() + token.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return ClaimValue(value);
    }

    std::optional<ClaimValue> readStringArray() {
        std::vector<std::string> items;
        skipWs();
        if (consume(']')) {
            return ClaimValue(std::move(items));
        }
        while (true) {
            skipWs();
            auto item = readString();
            if (!item) {
                return std::nullopt;
            }
            items.push_back(std::move(*item));
            skipWs();
            if (consume(']')) {
                return ClaimValue(std::move(items));
            }
            if (!consume(',')) {
                return std::nullopt;
            }
        }
    }

    std::optional<ClaimValue> readValue() {
        skipWs();
        if (pos_ >= text_.size()) {
            return std::nullopt;
        }
        char c = text_[pos_];
        if (c == '"') {
            auto s = readString();
            if (!s) {
                return std::nullopt;
            }
            return ClaimValue(std::move(*s));
        }
        if (c == '[') {
            ++pos_;
            return readStringArray();
        }
        if (consumeLiteral("true")) {
            return ClaimValue(true);
        }
        if (consumeLiteral("false")) {
            return ClaimValue(false);
        }
        if (consumeLiteral("null")) {
            return ClaimValue(nullptr);
        }
        if (c == '-' || (c >= '0' && c <= '9')) {
            return readNumber();
        }
        return std::nullopt;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // anonymous namespace

std::string jsonQuote(std::string_view value) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(hexChars[(c >> 4) & 0x0F]);
                    out.push_back(hexChars[c & 0x0F]);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

std::string encodeClaimValue(const ClaimValue& value) {
    struct Visitor {
        std::string operator()(std::nullptr_t) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            if (!std::isfinite(d)) {
                return "null";
            }
            std::array<char, 32> buf{};
            auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
            if (ec != std::errc()) {
                return "null";
            }
            return std::string(buf.data(), ptr);
        }
        std::string operator()(const std::string& s) const { return jsonQuote(s); }
        std::string operator()(const std::vector<std::string>& items) const {
            std::string out = "[";
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0) {
                    out.push_back(',');
                }
                out += jsonQuote(items[i]);
            }
            out.push_back(']');
            return out;
        }
    };
    return std::visit(Visitor{}, value);
}

std::string encodeClaims(const Claims& claims) {
    std::string out = "{";
    bool first = true;
    for (const auto& [name, value] : claims) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        out += jsonQuote(name);
        out.push_back(':');
        out += encodeClaimValue(value);
    }
    out.push_back('}');
    return out;
}

std::optional<Claims> decodeClaims(std::string_view json) {
    Reader reader(json);
    return reader.readObject();
}

}  // namespace keyring::token::detail
