#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

enum class WhitespaceMode : uint8_t {
    Ascii,    // SP HT LF CR VT FF
    CLocale,  // Ascii plus the Latin-1 NBSP byte 0xA0, as glibc iswspace does in "C"
    Unicode   // Zs, U+0085, U+2028, U+2029 and the Ascii set; never ZWSP, WJ or BOM
};

namespace whitespace_tables {

constexpr uint8_t ASCII_FLAG = 1 << 0;
constexpr uint8_t CLOCALE_FLAG = 1 << 1;

// Every Unicode whitespace codepoint is below this bound.
constexpr char32_t BITMAP_LIMIT = 0x3001;

using ByteTable = std::array<uint8_t, 256>;
using Bitmap = std::array<uint8_t, BITMAP_LIMIT / 8 + 1>;

constexpr ByteTable buildByteTable() {
    ByteTable lut{};
    const uint8_t ascii[] = {' ', '\t', '\n', '\r', 0x0B, 0x0C};
    for (uint8_t c : ascii) {
        lut[c] |= ASCII_FLAG | CLOCALE_FLAG;
    }
    lut[0xA0] |= CLOCALE_FLAG;
    return lut;
}

constexpr Bitmap buildUnicodeBitmap() {
    Bitmap bitmap{};
    const char32_t spaces[] = {
        // ASCII whitespace
        0x0009, 0x000A, 0x000B, 0x000C, 0x000D, 0x0020,
        0x0085, // NEXT LINE
        // Zs
        0x00A0, 0x1680,
        0x2000, 0x2001, 0x2002, 0x2003, 0x2004, 0x2005,
        0x2006, 0x2007, 0x2008, 0x2009, 0x200A,
        0x202F, 0x205F, 0x3000,
        // Zl, Zp
        0x2028, 0x2029,
    };
    for (char32_t cp : spaces) {
        bitmap[cp / 8] |= static_cast<uint8_t>(1u << (cp % 8));
    }
    return bitmap;
}

inline constexpr ByteTable BYTE_LUT = buildByteTable();
inline constexpr Bitmap UNICODE_BITMAP = buildUnicodeBitmap();

}

class WhitespaceClassifier {
public:
    static bool isWhitespace(char32_t unit, WhitespaceMode mode) {
        switch (mode) {
            case WhitespaceMode::Ascii:
                return unit < 0x80 && isAsciiWhitespace(static_cast<uint8_t>(unit));
            case WhitespaceMode::CLocale:
                return unit < 0x100 && isCLocaleWhitespace(static_cast<uint8_t>(unit));
            case WhitespaceMode::Unicode:
                return isUnicodeWhitespace(unit);
        }
        return false;
    }

    static bool isAsciiWhitespace(uint8_t byte) {
        return (whitespace_tables::BYTE_LUT[byte] & whitespace_tables::ASCII_FLAG) != 0;
    }

    static bool isCLocaleWhitespace(uint8_t byte) {
        return (whitespace_tables::BYTE_LUT[byte] & whitespace_tables::CLOCALE_FLAG) != 0;
    }

    // Table lookup only; no general-category queries.
    static bool isUnicodeWhitespace(char32_t cp) {
        if (cp < 0x80) return isAsciiWhitespace(static_cast<uint8_t>(cp));
        if (cp >= whitespace_tables::BITMAP_LIMIT) return false;
        return (whitespace_tables::UNICODE_BITMAP[cp / 8] & (1u << (cp % 8))) != 0;
    }
};
