/**
 * @file TextDecoder.hpp
 * @brief Byte -> text decoding for uploaded documents.
 */

#pragma once

#include <string>

namespace findoc::infrastructure {

class TextDecoder {
public:
    struct DecodeResult {
        std::string text;             ///< Always valid UTF-8.
        bool usedFallback = false;    ///< True when invalid bytes were replaced.
        std::size_t replacements = 0;
    };

    /**
     * @brief Decodes bytes as UTF-8, replacing each maximal invalid subsequence with U+FFFD.
     *
     * Never fails. Identical input always yields identical output.
     */
    static DecodeResult DecodeUtf8(const std::string& bytes);
};

} // namespace findoc::infrastructure
