#include <cassert>
#include <chrono>
#include <iostream>

#include "domain/DocumentRecord.hpp"

using namespace findoc::domain;

namespace {

ParsedFields SampleFields() {
    ParsedFields fields;
    fields.vendor = "Acme Ltd";
    fields.total = "10.00";
    return fields;
}

template <typename Fn>
bool Throws(Fn fn) {
    try {
        fn();
    } catch (const InvalidTransitionError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting DocumentRecord Test..." << std::endl;

    const auto t0 = std::chrono::system_clock::now();
    const auto t1 = t0 + std::chrono::seconds(5);

    // PENDING -> SUCCESS
    {
        DocumentRecord record;
        record.id = 1;
        record.createdAt = record.updatedAt = t0;
        record.apply(RecordUpdate::Succeeded("Vendor: Acme Ltd", SampleFields()), t1);
        assert(record.status == DocumentStatus::Success);
        assert(record.rawText == "Vendor: Acme Ltd");
        assert(record.parsedFields == SampleFields());
        assert(record.updatedAt == t1);
        assert(record.createdAt == t0);

        // Terminal states are final
        assert(Throws([&] { record.apply(RecordUpdate::Failed(), t1); }));
        assert(record.status == DocumentStatus::Success);
        assert(record.rawText == "Vendor: Acme Ltd");
    }

    // PENDING -> FAILED leaves text and fields empty
    {
        DocumentRecord record;
        record.apply(RecordUpdate::Failed());
        assert(record.status == DocumentStatus::Failed);
        assert(record.rawText.empty());
        assert(record.parsedFields.empty());
        assert(Throws([&] { record.apply(RecordUpdate::Succeeded("late", SampleFields())); }));
    }

    // SUCCESS needs text and fields
    {
        DocumentRecord record;
        RecordUpdate noText;
        noText.status = DocumentStatus::Success;
        noText.parsedFields = SampleFields();
        assert(Throws([&] { record.apply(noText); }));
        assert(Throws([&] { record.apply(RecordUpdate::Succeeded("", SampleFields())); }));
        assert(record.status == DocumentStatus::Pending);

        // No fields found is still a valid SUCCESS
        record.apply(RecordUpdate::Succeeded("nothing to see", ParsedFields{}));
        assert(record.status == DocumentStatus::Success);
        assert(record.parsedFields.empty());
    }

    // FAILED carries no text
    {
        DocumentRecord record;
        RecordUpdate update = RecordUpdate::Failed();
        update.rawText = "partial";
        assert(Throws([&] { record.apply(update); }));
        assert(record.status == DocumentStatus::Pending);
    }

    // No way back to PENDING, and no text without a status change
    {
        DocumentRecord record;
        RecordUpdate back;
        back.status = DocumentStatus::Pending;
        assert(Throws([&] { record.apply(back); }));

        RecordUpdate textOnly;
        textOnly.rawText = "text";
        assert(Throws([&] { record.apply(textOnly); }));
        assert(record.rawText.empty());
    }

    // Job id is assigned once
    {
        DocumentRecord record;
        record.apply(RecordUpdate::AssignJob("job-1"));
        assert(record.jobId == std::string("job-1"));
        assert(record.status == DocumentStatus::Pending);

        record.apply(RecordUpdate::AssignJob("job-1"));
        assert(Throws([&] { record.apply(RecordUpdate::AssignJob("job-2")); }));
        assert(record.jobId == std::string("job-1"));
        assert(Throws([&] { DocumentRecord other; other.apply(RecordUpdate::AssignJob("")); }));
    }

    // String forms
    {
        assert(StatusToString(DocumentStatus::Failed) == "FAILED");
        assert(StatusFromString("SUCCESS") == DocumentStatus::Success);
        assert(!StatusFromString("DONE"));
    }

    std::cout << "[PASS] DocumentRecord Test." << std::endl;
    return 0;
}
