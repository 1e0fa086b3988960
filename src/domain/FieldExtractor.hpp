/**
 * @file FieldExtractor.hpp
 * @brief Pattern-based extraction of invoice fields from plain text.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/ParsedFields.hpp"

namespace findoc::domain {

/**
 * @class FieldExtractor
 * @brief Pure text -> fields transformation. No state, no I/O, never throws on any input.
 *
 * Each field has an ordered list of patterns. The first pattern that matches
 * anywhere in the normalized text wins; later patterns for that field are
 * not tried. Matching is case-insensitive and byte-oriented, so the
 * multi-byte currency symbols are matched literally.
 */
class FieldExtractor {
public:
    /**
     * @brief Extracts vendor, invoice number, date and total.
     * @param text Decoded document text (UTF-8).
     * @return Four optional fields; empty input yields all nulls.
     */
    static ParsedFields Extract(const std::string& text);

    /**
     * @brief Collapses line endings to '\n' and horizontal whitespace runs to one space.
     * Line breaks are preserved.
     */
    static std::string NormalizeText(const std::string& text);

    /**
     * @brief Reduces a captured amount such as "$2,000.00" or "₹ 1,234" to its number.
     *
     * Spaces (including U+00A0), currency symbols and thousands separators are
     * removed, leaving digits and the decimal point.
     * @return std::nullopt when nothing remains.
     */
    static std::optional<std::string> NormalizeAmount(const std::string& amount);
};

} // namespace findoc::domain
