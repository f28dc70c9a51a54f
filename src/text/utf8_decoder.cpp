#include "text/utf8_decoder.h"

namespace {

struct LeadInfo {
    size_t length;
    uint8_t second_lo;
    uint8_t second_hi;
    char32_t bits;
};

inline LeadInfo classifyLead(uint8_t lead) {
    if (lead < 0xC2) return {0, 0, 0, 0};  // continuation byte or overlong C0/C1
    if (lead < 0xE0) return {2, 0x80, 0xBF, static_cast<char32_t>(lead & 0x1F)};
    if (lead < 0xF0) {
        const uint8_t lo = (lead == 0xE0) ? 0xA0 : 0x80;  // below U+0800 is overlong
        const uint8_t hi = (lead == 0xED) ? 0x9F : 0xBF;  // D800..DFFF are surrogates
        return {3, lo, hi, static_cast<char32_t>(lead & 0x0F)};
    }
    if (lead < 0xF5) {
        const uint8_t lo = (lead == 0xF0) ? 0x90 : 0x80;  // below U+10000 is overlong
        const uint8_t hi = (lead == 0xF4) ? 0x8F : 0xBF;  // above U+10FFFF
        return {4, lo, hi, static_cast<char32_t>(lead & 0x07)};
    }
    return {0, 0, 0, 0};
}

}

size_t Utf8Decoder::sequenceLength(uint8_t lead) {
    if (lead < 0x80) return 1;
    return classifyLead(lead).length;
}

DecodeResult Utf8Decoder::decode(const uint8_t* data, size_t len) {
    const uint8_t lead = data[0];
    if (lead < 0x80) {
        return {lead, 1, false};
    }

    const LeadInfo info = classifyLead(lead);
    if (info.length == 0) {
        return {kReplacementCodepoint, 1, false};
    }

    char32_t cp = info.bits;
    for (size_t i = 1; i < info.length; i++) {
        if (i >= len) {
            // Ran out of input with every byte so far still valid
            return {kReplacementCodepoint, i, true};
        }

        const uint8_t byte = data[i];
        // Only the second byte has a lead-dependent range
        const bool valid = (i == 1) ? (byte >= info.second_lo && byte <= info.second_hi)
                                    : isContinuation(byte);
        if (!valid) {
            return {kReplacementCodepoint, i, false};
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    return {cp, info.length, false};
}
