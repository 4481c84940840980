#pragma once

#include <optional>
#include <string>

namespace ws {

/// Whether `bytes` is well-formed UTF-8 (no overlongs, no surrogates,
/// nothing above U+10FFFF).
bool is_valid_utf8(const std::string& bytes);

/// Copy a NUL-terminated native string.  Returns nullopt when `raw` is null
/// or not valid UTF-8.
std::optional<std::string> decode_native_text(const char* raw);

/// Same as decode_native_text() but throws DecodeError naming `field`.
std::string decode_native_text_or_throw(const char* raw, const std::string& field);

} // namespace ws
