#include "TextDecoding.hpp"

#include "Errors.hpp"

#include <cstdint>

namespace ws {

bool is_valid_utf8(const std::string& bytes) {
    const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t n = bytes.size();

    size_t i = 0;
    while (i < n) {
        const unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates, out of range.
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

std::optional<std::string> decode_native_text(const char* raw) {
    if (!raw) {
        return std::nullopt;
    }
    std::string text(raw);
    if (!is_valid_utf8(text)) {
        return std::nullopt;
    }
    return text;
}

std::string decode_native_text_or_throw(const char* raw, const std::string& field) {
    if (!raw) {
        throw DecodeError("native field '" + field + "' is null");
    }
    std::optional<std::string> text = decode_native_text(raw);
    if (!text) {
        throw DecodeError("native field '" + field + "' is not valid UTF-8");
    }
    return *text;
}

} // namespace ws
