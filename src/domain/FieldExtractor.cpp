/**
 * @file FieldExtractor.cpp
 * @brief Implementation of FieldExtractor.
 */

#include "domain/FieldExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <regex>
#include <vector>

namespace findoc::domain {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

// libstdc++ matches every repetition of a quantified atom with one level of
// recursion, so the patterns below only locate where a value starts and use
// bounded repeats. The value itself is scanned by hand (ScanValue).
const std::string kGap = "\\s{0,64}";

// "$", "₹" and "£" as raw UTF-8 bytes.
const char* const kCurrencySymbols[] = {"$", "\xE2\x82\xB9", "\xC2\xA3"};
const std::string kCurrency = "(?:\\$|\xE2\x82\xB9|\xC2\xA3)";

// Where the value of a match is taken from.
enum class ValueShape {
    Whole,       ///< First non-empty capture group, else the whole match.
    RestOfLine,  ///< From the match end up to the next '\n'.
    Token,       ///< Run of [A-Za-z0-9_/-] from the match end.
    Amount       ///< Optional currency, blanks, [0-9,] run, optional ".dd".
};

struct Pattern {
    std::regex regex;
    ValueShape shape;
};

// Label at the start of a line; the value is the rest of that line.
Pattern LabelledLine(const std::string& label) {
    return {std::regex("(?:^|\\n) ?" + label + ": ?(?=[^ \\n])", kFlags), ValueShape::RestOfLine};
}

// Label followed by an amount.
Pattern LabelledAmount(const std::string& label) {
    return {std::regex("\\b" + label + kGap + "[:-]?" + kGap + "(?=" + kCurrency + "?" + kGap + "[0-9,])", kFlags),
            ValueShape::Amount};
}

Pattern LabelledToken(const std::string& label) {
    return {std::regex(label + kGap + "(?=[\\w/-])", kFlags), ValueShape::Token};
}

std::optional<std::string> NonEmpty(std::string value) {
    if (value.empty()) return std::nullopt;
    return value;
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsTokenChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '/' || c == '-';
}

std::string ScanValue(const std::string& text, std::size_t pos, ValueShape shape) {
    const std::size_t n = text.size();
    std::size_t end = pos;
    switch (shape) {
        case ValueShape::RestOfLine:
            end = std::min(text.find('\n', pos), n);
            break;
        case ValueShape::Token:
            while (end < n && IsTokenChar(text[end])) ++end;
            break;
        case ValueShape::Amount:
            for (const char* symbol : kCurrencySymbols) {
                if (text.compare(end, std::strlen(symbol), symbol) == 0) {
                    end += std::strlen(symbol);
                    break;
                }
            }
            while (end < n && std::isspace(static_cast<unsigned char>(text[end]))) ++end;
            while (end < n && (IsDigit(text[end]) || text[end] == ',')) ++end;
            if (end + 2 < n && text[end] == '.' && IsDigit(text[end + 1]) && IsDigit(text[end + 2])) {
                end += 3;
            }
            break;
        case ValueShape::Whole:
            break;
    }
    return text.substr(pos, end - pos);
}

struct FieldRule {
    std::optional<std::string> ParsedFields::*target;
    std::vector<Pattern> patterns;   ///< Priority order, first match wins.
    std::optional<std::string> (*finish)(const std::string&);
};

const std::vector<FieldRule>& Rules() {
    static const std::vector<FieldRule> rules = {
        {&ParsedFields::vendor,
         {LabelledLine("From"), LabelledLine("Vendor"), LabelledLine("Bill To")},
         nullptr},
        {&ParsedFields::invoiceNo,
         {LabelledToken("Invoice" + kGap + "No\\.?:?"),
          LabelledToken("Inv\\.?" + kGap + "#"),
          LabelledToken("Invoice" + kGap + "#")},
         nullptr},
        {&ParsedFields::date,
         {{std::regex(R"re((\d{4}-\d{2}-\d{2}))re", kFlags), ValueShape::Whole},
          {std::regex(R"re((\d{2}/\d{2}/\d{4}))re", kFlags), ValueShape::Whole},
          {std::regex(R"re((\d{1,2} [A-Za-z]{3,9} \d{4}))re", kFlags), ValueShape::Whole}},
         nullptr},
        {&ParsedFields::total,
         {LabelledAmount("Total"),
          LabelledAmount("Amount"),
          {std::regex("(?=" + kCurrency + kGap + "[0-9,])", kFlags), ValueShape::Amount}},
         &FieldExtractor::NormalizeAmount},
    };
    return rules;
}

std::optional<std::string> FirstMatch(const std::vector<Pattern>& patterns, const std::string& text) {
    for (const auto& pattern : patterns) {
        std::smatch match;
        bool found = false;
        try {
            found = std::regex_search(text, match, pattern.regex);
        } catch (const std::regex_error&) {
            // Engine limits (complexity/stack) count as no match for this pattern.
            found = false;
        }
        if (!found) continue;

        if (pattern.shape != ValueShape::Whole) {
            auto start = static_cast<std::size_t>(match.position(0) + match.length(0));
            return NonEmpty(Trim(ScanValue(text, start, pattern.shape)));
        }
        for (std::size_t i = 1; i < match.size(); ++i) {
            if (match[i].matched && match[i].length() > 0) {
                return NonEmpty(Trim(match[i].str()));
            }
        }
        return NonEmpty(Trim(match[0].str()));
    }
    return std::nullopt;
}

} // namespace

ParsedFields FieldExtractor::Extract(const std::string& text) {
    ParsedFields fields;
    if (text.empty()) return fields;

    const std::string normalized = NormalizeText(text);
    for (const auto& rule : Rules()) {
        auto value = FirstMatch(rule.patterns, normalized);
        if (value && rule.finish) {
            value = rule.finish(*value);
        }
        fields.*(rule.target) = std::move(value);
    }
    return fields;
}

std::string FieldExtractor::NormalizeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            out.push_back('\n');
        } else if (c == ' ' || c == '\t') {
            if (out.empty() || out.back() != ' ') out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> FieldExtractor::NormalizeAmount(const std::string& amount) {
    std::string digits;
    digits.reserve(amount.size());
    for (char c : amount) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            digits.push_back(c);
        }
    }
    return NonEmpty(std::move(digits));
}

} // namespace findoc::domain
