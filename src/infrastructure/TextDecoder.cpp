/**
 * @file TextDecoder.cpp
 * @brief Implementation of TextDecoder.
 */

#include "infrastructure/TextDecoder.hpp"

namespace findoc::infrastructure {

namespace {
    const char kReplacement[] = "\xEF\xBF\xBD";

    // Number of continuation bytes for a lead byte and the allowed range of
    // the first one (Unicode Table 3-7). Returns -1 for bytes that can never lead.
    int SequenceShape(unsigned char lead, unsigned char& lo, unsigned char& hi) {
        lo = 0x80;
        hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) return 1;
        if (lead == 0xE0) { lo = 0xA0; return 2; }
        if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) return 2;
        if (lead == 0xED) { hi = 0x9F; return 2; }
        if (lead == 0xF0) { lo = 0x90; return 3; }
        if (lead >= 0xF1 && lead <= 0xF3) return 3;
        if (lead == 0xF4) { hi = 0x8F; return 3; }
        return -1;
    }
}

TextDecoder::DecodeResult TextDecoder::DecodeUtf8(const std::string& bytes) {
    DecodeResult result;
    result.text.reserve(bytes.size());

    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            result.text.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        unsigned char lo = 0, hi = 0;
        int need = SequenceShape(lead, lo, hi);
        if (need < 0) {
            result.text.append(kReplacement);
            ++result.replacements;
            ++i;
            continue;
        }

        std::size_t j = i + 1;
        int got = 0;
        while (got < need && j < n) {
            unsigned char c = static_cast<unsigned char>(bytes[j]);
            unsigned char min = (got == 0) ? lo : 0x80;
            unsigned char max = (got == 0) ? hi : 0xBF;
            if (c < min || c > max) break;
            ++got;
            ++j;
        }

        if (got == need) {
            result.text.append(bytes, i, j - i);
        } else {
            // The maximal valid prefix collapses to one replacement; the
            // offending byte is examined again as a potential lead.
            result.text.append(kReplacement);
            ++result.replacements;
        }
        i = j;
    }

    result.usedFallback = result.replacements > 0;
    return result;
}

} // namespace findoc::infrastructure
