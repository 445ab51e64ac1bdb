#include "core/unicode.hpp"

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

namespace docgate::unicode {

bool is_valid_utf8(std::string_view text) {
    bool valid = true;
    for_each_code_point(text, [&valid](int32_t cp, std::string_view) {
        if (cp < 0) valid = false;
    });
    return valid;
}

std::string scrub_utf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for_each_code_point(text, [&out](int32_t cp, std::string_view bytes) {
        if (cp < 0) {
            out += "\xEF\xBF\xBD";
        } else {
            out.append(bytes);
        }
    });
    return out;
}

std::optional<std::string> normalize_nfc(std::string_view text) {
    if (!is_valid_utf8(text)) {
        return std::nullopt;
    }

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status) || nfc == nullptr) {
        return std::nullopt;
    }

    const icu::UnicodeString source = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));

    // Fast path: most text is already composed
    if (nfc->isNormalized(source, status) && U_SUCCESS(status)) {
        return std::string(text);
    }
    status = U_ZERO_ERROR;

    const icu::UnicodeString normalized = nfc->normalize(source, status);
    if (U_FAILURE(status)) {
        return std::nullopt;
    }

    std::string out;
    normalized.toUTF8String(out);
    return out;
}

} // namespace docgate::unicode
