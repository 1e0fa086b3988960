/**
 * @file ParsedFields.hpp
 * @brief Value object holding the structured fields extracted from a document.
 */

#pragma once

#include <optional>
#include <string>

namespace findoc::domain {

/**
 * @struct ParsedFields
 * @brief Best-effort candidate fields. An absent field is std::nullopt, never an empty string.
 */
struct ParsedFields {
    std::optional<std::string> vendor;
    std::optional<std::string> invoiceNo;
    std::optional<std::string> date;
    std::optional<std::string> total;   ///< Normalized amount (digits and decimal point only).

    bool empty() const {
        return !vendor && !invoiceNo && !date && !total;
    }

    bool operator==(const ParsedFields& other) const {
        return vendor == other.vendor && invoiceNo == other.invoiceNo &&
               date == other.date && total == other.total;
    }

    bool operator!=(const ParsedFields& other) const { return !(*this == other); }
};

} // namespace findoc::domain
