#include <packmeta/key_path.hpp>
#include <cstdint>
#include <cstdio>

namespace packmeta {

static bool is_bare_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

static bool is_ws(char c) {
    return c == ' ' || c == '\t';
}

bool is_bare_key(std::string_view key) {
    if (key.empty()) return false;
    for (char c : key) {
        if (!is_bare_char(c)) return false;
    }
    return true;
}

std::string quote_string(const std::string& s) {
    std::string out = "\"";
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\f': out += "\\f"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04X", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
    return out;
}

std::string format_key(const std::string& key) {
    return is_bare_key(key) ? key : quote_string(key);
}

KeyPath KeyPath::child(std::string segment) const {
    KeyPath next = *this;
    next.segments_.push_back(std::move(segment));
    return next;
}

std::string KeyPath::to_string() const {
    std::string out;
    for (size_t i = 0; i < segments_.size(); i++) {
        if (i > 0) out += '.';
        out += format_key(segments_[i]);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

namespace {

class KeyPathParser {
public:
    explicit KeyPathParser(std::string_view text) : text_(text) {}

    Result<KeyPath> run() {
        std::vector<std::string> segments;

        skip_ws();
        if (at_end()) return Result<KeyPath>::ok(KeyPath{});

        while (true) {
            skip_ws();
            auto seg = segment();
            if (seg.is_err()) return std::move(seg).error();
            segments.push_back(std::move(seg).value());

            skip_ws();
            if (at_end()) break;
            if (peek() != '.') {
                return fail(std::string("unexpected character '") + peek() +
                            "' after key segment");
            }
            pos_++;
        }

        return Result<KeyPath>::ok(KeyPath(std::move(segments)));
    }

private:
    std::string_view text_;
    size_t pos_ = 0;

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return text_[pos_]; }

    void skip_ws() {
        while (!at_end() && is_ws(peek())) pos_++;
    }

    PackError fail(const std::string& what) const {
        return PackError{PackError::InvalidPath,
            "invalid key path '" + std::string(text_) + "': " + what +
            " (at offset " + std::to_string(pos_) + ")",
            "quote segments that contain characters other than A-Z a-z 0-9 _ -"}
            .with_subject(std::string(text_));
    }

    Result<std::string> segment() {
        if (at_end()) return fail("expected a key segment");
        char c = peek();
        if (c == '"') return basic_string();
        if (c == '\'') return literal_string();

        size_t start = pos_;
        while (!at_end() && is_bare_char(peek())) pos_++;
        if (pos_ == start) {
            if (c == '.') return fail("empty key segment");
            return fail(std::string("invalid character '") + c + "' in bare key");
        }
        return Result<std::string>::ok(std::string(text_.substr(start, pos_ - start)));
    }

    Result<std::string> literal_string() {
        pos_++;  // opening '
        size_t start = pos_;
        while (!at_end() && peek() != '\'') pos_++;
        if (at_end()) return fail("unterminated literal string");
        std::string out(text_.substr(start, pos_ - start));
        pos_++;  // closing '
        return Result<std::string>::ok(std::move(out));
    }

    Result<std::string> basic_string() {
        pos_++;  // opening "
        std::string out;
        while (true) {
            if (at_end()) return fail("unterminated basic string");
            char c = peek();
            if (c == '"') {
                pos_++;
                return Result<std::string>::ok(std::move(out));
            }
            if (c != '\\') {
                out += c;
                pos_++;
                continue;
            }

            pos_++;
            if (at_end()) return fail("unterminated escape sequence");
            char e = peek();
            pos_++;
            switch (e) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case 'b':  out += '\b'; break;
                case 't':  out += '\t'; break;
                case 'n':  out += '\n'; break;
                case 'f':  out += '\f'; break;
                case 'r':  out += '\r'; break;
                case 'u': {
                    auto st = unicode_escape(4, out);
                    if (st.is_err()) return std::move(st).error();
                    break;
                }
                case 'U': {
                    auto st = unicode_escape(8, out);
                    if (st.is_err()) return std::move(st).error();
                    break;
                }
                default:
                    return fail(std::string("unknown escape '\\") + e + "'");
            }
        }
    }

    Status unicode_escape(size_t digits, std::string& out) {
        if (pos_ + digits > text_.size()) return fail("truncated unicode escape");

        uint32_t cp = 0;
        for (size_t i = 0; i < digits; i++) {
            char h = text_[pos_ + i];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else return fail("invalid hex digit in unicode escape");
        }
        pos_ += digits;

        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return fail("unicode escape is not a scalar value");
        }

        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        return ok_status();
    }
};

} // namespace

Result<KeyPath> KeyPath::parse(std::string_view text) {
    return KeyPathParser(text).run();
}

} // namespace packmeta
