#pragma once

#include <unicode/utf8.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docgate::unicode {

/// True when the whole buffer is well-formed UTF-8.
[[nodiscard]] bool is_valid_utf8(std::string_view text);

/// Copy of @p text with each ill-formed sequence replaced by U+FFFD.
[[nodiscard]] std::string scrub_utf8(std::string_view text);

/**
 * @brief Canonical composition (NFC) via ICU Normalizer2.
 * @return Normalized UTF-8, or nullopt when the input is not valid UTF-8
 *         or ICU reports an error.
 */
[[nodiscard]] std::optional<std::string> normalize_nfc(std::string_view text);

/**
 * @brief Walk UTF-8 text one code point at a time.
 *
 * fn(cp, bytes) is called for each code point with the raw bytes that
 * encode it. Ill-formed sequences are reported with cp < 0 so callers
 * can pass them through untouched.
 */
template<typename Fn>
void for_each_code_point(std::string_view text, Fn&& fn) {
    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        const int32_t start = i;
        UChar32 c = 0;
        U8_NEXT(s, i, length, c);
        fn(static_cast<int32_t>(c),
           text.substr(static_cast<size_t>(start), static_cast<size_t>(i - start)));
    }
}

} // namespace docgate::unicode
