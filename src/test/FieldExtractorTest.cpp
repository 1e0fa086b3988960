#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/FieldExtractor.hpp"

using findoc::domain::FieldExtractor;
using findoc::domain::ParsedFields;

namespace {

bool IsTrimmed(const std::string& s) {
    const std::string ws = " \t\n\r";
    return !s.empty() && ws.find(s.front()) == std::string::npos && ws.find(s.back()) == std::string::npos;
}

void CheckShape(const ParsedFields& f) {
    for (const auto* field : {&f.vendor, &f.invoiceNo, &f.date, &f.total}) {
        if (*field) assert(IsTrimmed(**field));
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting FieldExtractor Test..." << std::endl;

    // Reference invoice
    {
        auto f = FieldExtractor::Extract("Vendor: Acme Ltd\nInvoice No.: INV-900\nDate: 2024-04-05\nTotal: $2,000.00\n");
        assert(f.vendor == std::string("Acme Ltd"));
        assert(f.invoiceNo == std::string("INV-900"));
        assert(f.date == std::string("2024-04-05"));
        assert(f.total == std::string("2000.00"));
    }

    // Empty input
    {
        auto f = FieldExtractor::Extract("");
        assert(!f.vendor && !f.invoiceNo && !f.date && !f.total);
        assert(f.empty());
    }

    // Labelled total beats an earlier Amount label and a bare currency amount
    {
        auto f = FieldExtractor::Extract("Paid $9.99 upfront\nAmount: $5.00\nTotal: $1,250.50\n");
        assert(f.total == std::string("1250.50"));
    }

    // Amount label beats a bare amount
    {
        auto f = FieldExtractor::Extract("Deposit $40\nAmount: 1,000\n");
        assert(f.total == std::string("1000"));
    }

    // Bare currency amounts, leftmost wins
    {
        auto f = FieldExtractor::Extract("Paid \xC2\xA3 75.20 by card, fee \xC2\xA3" "3.00");
        assert(f.total == std::string("75.20"));

        auto r = FieldExtractor::Extract("Grand sum \xE2\x82\xB9 12,34,567 only");
        assert(r.total == std::string("1234567"));
    }

    // Vendor: pattern priority, not text position
    {
        auto f = FieldExtractor::Extract("Vendor: Beta Supplies\nFrom: Alpha Corp\n");
        assert(f.vendor == std::string("Alpha Corp"));

        auto g = FieldExtractor::Extract("Bill To: Gamma LLC\n");
        assert(g.vendor == std::string("Gamma LLC"));
    }

    // Vendor value is the rest of the label's own line only
    {
        auto f = FieldExtractor::Extract("From:\nAcme Ltd\n");
        assert(!f.vendor);
    }

    // Case-insensitive labels
    {
        auto f = FieldExtractor::Extract("VENDOR: acme corp\ninvoice no: ab-12\nTOTAL: 99.50");
        assert(f.vendor == std::string("acme corp"));
        assert(f.invoiceNo == std::string("ab-12"));
        assert(f.total == std::string("99.50"));
    }

    // Whitespace normalization keeps line structure
    {
        auto f = FieldExtractor::Extract("Vendor:\t\tAcme   Ltd  \r\nInvoice #  A-7\r\n");
        assert(f.vendor == std::string("Acme Ltd"));
        assert(f.invoiceNo == std::string("A-7"));
        assert(FieldExtractor::NormalizeText("a\t\tb  c\r\nd\re") == "a b c\nd\ne");
    }

    // Invoice number variants
    {
        auto f = FieldExtractor::Extract("Inv. #88/B");
        assert(f.invoiceNo == std::string("88/B"));
    }

    // Date priority and formats
    {
        assert(FieldExtractor::Extract("on 01/02/2023 and 2023-02-01").date == std::string("2023-02-01"));
        assert(FieldExtractor::Extract("Due 05/04/2024").date == std::string("05/04/2024"));
        assert(FieldExtractor::Extract("Issued 5 April 2024").date == std::string("5 April 2024"));
        assert(!FieldExtractor::Extract("no dates here").date);
    }

    // Amount normalization
    {
        assert(FieldExtractor::NormalizeAmount("$2,000.00") == std::string("2000.00"));
        assert(FieldExtractor::NormalizeAmount("\xE2\x82\xB9 1,234") == std::string("1234"));
        assert(FieldExtractor::NormalizeAmount("\xC2\xA0\xC2\xA3 7.5 ") == std::string("7.5"));
        assert(!FieldExtractor::NormalizeAmount(","));
        assert(!FieldExtractor::NormalizeAmount(""));
        assert(!FieldExtractor::NormalizeAmount("$ "));
    }

    // Purity and output shape over assorted inputs
    {
        const std::vector<std::string> inputs = {
            "   ",
            "\n\n\n",
            "Total: ,",
            "From:   Spaced Vendor   \nTotal:\t$ 3",
            "Invoice No.:\nINV-1",
            std::string("bin\0ary\xFF\xFE data", 14),
            "Vendor: X\nVendor: Y\nAmount: \xC2\xA3" "10\nTotal: 11",
        };
        for (const auto& input : inputs) {
            auto first = FieldExtractor::Extract(input);
            auto second = FieldExtractor::Extract(input);
            assert(first == second);
            CheckShape(first);
        }
        assert(!FieldExtractor::Extract("Total: ,").total);
        assert(FieldExtractor::Extract("From:   Spaced Vendor   \nTotal:\t$ 3").vendor == std::string("Spaced Vendor"));
    }

    // Very long values are scanned without deep regex recursion
    {
        const std::string longName(1 << 20, 'a');
        auto f = FieldExtractor::Extract("From: " + longName + "\nTotal: $5\n");
        assert(f.vendor == longName);
        assert(f.total == std::string("5"));

        const std::string digits(1 << 20, '7');
        auto g = FieldExtractor::Extract("Paid $" + digits + " in full");
        assert(g.total == digits);

        auto h = FieldExtractor::Extract("Invoice # " + longName);
        assert(h.invoiceNo == longName);

        // A label separated from its amount by a huge gap is not a labelled total
        auto k = FieldExtractor::Extract("Total:" + std::string(100000, '\n') + "\xC2\xA3" "8.25");
        assert(k.total == std::string("8.25"));
        CheckShape(k);
    }

    std::cout << "[PASS] FieldExtractor Test." << std::endl;
    return 0;
}
