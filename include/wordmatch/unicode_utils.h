#pragma once

#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include <unicode/uchar.h>
#include <string>

namespace wordmatch {
namespace unicode {

/**
 * Convert std::string (assumed UTF-8) to ICU UnicodeString
 * Invalid sequences become U+FFFD
 */
inline icu::UnicodeString to_unicode_string(const std::string& utf8_str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8_str.c_str(), static_cast<int32_t>(utf8_str.length())));
}

/**
 * Convert ICU UnicodeString to std::string (UTF-8)
 */
inline std::string from_unicode_string(const icu::UnicodeString& ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

/**
 * Decode a UTF-8 string into code points
 */
inline std::u32string to_code_points(const std::string& utf8_str) {
    std::u32string result;
    if (utf8_str.empty()) {
        return result;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    result.reserve(static_cast<size_t>(ustr.countChar32()));
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        result.push_back(static_cast<char32_t>(ustr.char32At(i)));
    }
    return result;
}

/**
 * Encode code points back to a UTF-8 string
 */
inline std::string from_code_points(const std::u32string& code_points) {
    if (code_points.empty()) {
        return "";
    }
    icu::UnicodeString ustr = icu::UnicodeString::fromUTF32(
        reinterpret_cast<const UChar32*>(code_points.data()), static_cast<int32_t>(code_points.length()));
    return from_unicode_string(ustr);
}

/**
 * Convert code points to lowercase (Unicode-aware, root locale)
 * Works on the whole sequence so context-sensitive mappings (final sigma) apply
 */
inline std::u32string to_lower(const std::u32string& code_points) {
    if (code_points.empty()) {
        return code_points;
    }
    icu::UnicodeString ustr = icu::UnicodeString::fromUTF32(
        reinterpret_cast<const UChar32*>(code_points.data()), static_cast<int32_t>(code_points.length()));
    ustr.toLower(icu::Locale::getRoot());
    std::u32string result;
    result.reserve(code_points.size());
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        result.push_back(static_cast<char32_t>(ustr.char32At(i)));
    }
    return result;
}

// White_Space property
inline bool is_whitespace(char32_t c) {
    return u_isUWhiteSpace(static_cast<UChar32>(c));
}

// General category Cc only; u_iscntrl would also accept Cf, Zl and Zp
inline bool is_control(char32_t c) {
    return u_charType(static_cast<UChar32>(c)) == U_CONTROL_CHAR;
}

}  // namespace unicode
}  // namespace wordmatch
