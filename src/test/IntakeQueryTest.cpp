#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "application/DocumentIntakeService.hpp"
#include "application/DocumentProcessor.hpp"
#include "application/DocumentQueryService.hpp"
#include "application/WorkDispatcher.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DocumentRepositoryFs.hpp"
#include "infrastructure/JobResultStore.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace findoc::domain;
using namespace findoc::application;
using namespace findoc::infrastructure;

namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Fails every record creation with a non-storage error.
class RejectingRepository : public DocumentRepository {
public:
    std::int64_t createRecord(const std::optional<std::string>&, DocumentStatus) override {
        throw std::invalid_argument("rejected");
    }
    std::optional<DocumentRecord> getRecord(std::int64_t) override { return std::nullopt; }
    DocumentRecord updateRecord(std::int64_t id, const RecordUpdate&) override { throw RecordNotFoundError(id); }
    std::vector<DocumentRecord> listRecords(std::size_t, std::size_t) override { return {}; }
};

bool EndsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Intake/Query Test..." << std::endl;

    const std::string testRoot = "test_project_root_intake";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    auto config = ConfigLoader::Load(testRoot);
    auto persistence = std::make_shared<PersistenceService>();
    auto repo = std::make_shared<DocumentRepositoryFs>(config.recordsPath, persistence);
    auto jobs = std::make_shared<JobResultStore>(config.jobsPath, persistence);
    auto processor = std::make_shared<DocumentProcessor>(repo);
    auto dispatcher = std::make_shared<WorkDispatcher>(config.workerCount, [processor](std::int64_t id, const std::string& path) {
        return processor->process(id, path);
    }, jobs);
    DocumentIntakeService intake(config.storagePath, repo, dispatcher, persistence);
    DocumentQueryService query(repo, dispatcher);

    const std::string invoice = "Vendor: Acme Ltd\nInvoice No.: INV-900\nDate: 2024-04-05\nTotal: $2,000.00\n";

    // Upload through extraction
    auto receipt = intake.upload("invoice.txt", invoice);
    assert(!receipt.jobId.empty());
    assert(receipt.documentId == 1);
    dispatcher->waitIdle();

    {
        auto status = query.getTaskStatus(receipt.jobId);
        assert(status);
        assert(status->state == JobState::Success);

        auto j = ToJson(*status);
        assert(j["task_id"] == receipt.jobId);
        assert(j["status"] == "SUCCESS");
        assert(j["result"]["vendor"] == "Acme Ltd");
        assert(j["result"]["invoice_no"] == "INV-900");
        assert(j["result"]["date"] == "2024-04-05");
        assert(j["result"]["total"] == "2000.00");
        assert(!j.contains("error"));
    }

    {
        auto view = query.getDocument(receipt.documentId);
        assert(view);
        assert(view->status == DocumentStatus::Success);
        assert(view->jobId == receipt.jobId);
        assert(view->filename == std::string("invoice.txt"));

        auto j = ToJson(*view);
        assert(j["id"] == receipt.documentId);
        assert(j["filename"] == "invoice.txt");
        assert(j["raw_text"] == invoice);
        assert(j["parsed"]["vendor"] == "Acme Ltd");
        assert(j["task_id"] == receipt.jobId);
        assert(j["status"] == "SUCCESS");
        assert(EndsWith(j["created_at"].get<std::string>(), "Z"));
    }

    // The blob lands in the storage directory under a unique name
    {
        int blobs = 0;
        for (const auto& entry : fs::directory_iterator(config.storagePath)) {
            std::string name = entry.path().filename().string();
            if (EndsWith(name, "-invoice.txt")) {
                assert(ReadFile(entry.path()) == invoice);
                ++blobs;
            }
        }
        assert(blobs == 1);
    }

    // Client-supplied names are reduced to a base name
    auto escaped = intake.upload("../../escape.txt", "Total: 5\n");
    auto unnamed = intake.upload("", "memo without fields\n");
    dispatcher->waitIdle();
    {
        assert(query.getDocument(escaped.documentId)->filename == std::string("escape.txt"));
        assert(!fs::exists(fs::path(testRoot).parent_path() / "escape.txt"));
        auto name = query.getDocument(unnamed.documentId)->filename;
        assert(name && name->rfind("upload-", 0) == 0);

        // No fields found is still SUCCESS, with an all-null parsed object
        auto j = ToJson(*query.getDocument(unnamed.documentId));
        assert(j["status"] == "SUCCESS");
        assert(j["parsed"]["vendor"].is_null());
        assert(j["parsed"]["total"].is_null());
    }

    // Missing blob: the job succeeds, the outcome and the record say why
    std::string missingJob;
    std::int64_t missingId = 0;
    {
        missingId = repo->createRecord(std::string("lost.txt"));
        missingJob = dispatcher->submit(missingId, (fs::path(config.storagePath) / "lost.txt").string());
        dispatcher->waitIdle();

        auto status = query.getTaskStatus(missingJob);
        assert(status->state == JobState::Success);
        assert(status->result->kind == OutcomeKind::FileNotFound);
        auto j = ToJson(*status);
        assert(j["result"]["error"] == "file not found");

        auto view = ToJson(*query.getDocument(missingId));
        assert(view["status"] == "FAILED");
        assert(view["raw_text"] == "");
        assert(view["parsed"]["invoice_no"].is_null());
        assert(view["task_id"].is_null());
    }

    // Empty upload: the job fails and so does the record
    auto blank = intake.upload("blank.txt", "");
    dispatcher->waitIdle();
    {
        auto status = query.getTaskStatus(blank.jobId);
        assert(status->state == JobState::Failure);
        auto j = ToJson(*status);
        assert(j["status"] == "FAILURE");
        assert(j["result"].is_null());
        assert(!j["error"].get<std::string>().empty());
        assert(query.getDocument(blank.documentId)->status == DocumentStatus::Failed);
    }

    // Pending jobs carry no result
    {
        JobStatus pending;
        pending.jobId = "pending-job";
        auto j = ToJson(pending);
        assert(j["status"] == "PENDING");
        assert(j["result"].is_null());
        assert(!j.contains("error"));
    }

    // Local files go through the same path under their base name
    {
        const fs::path local = fs::path(testRoot) / "local-invoice.txt";
        std::ofstream(local, std::ios::binary) << "Bill To: Local Traders\nTotal: \xC2\xA3" "45.00\n";
        auto fromFile = intake.uploadFile(local.string());
        dispatcher->waitIdle();

        auto view = query.getDocument(fromFile.documentId);
        assert(view->filename == std::string("local-invoice.txt"));
        assert(view->parsed.vendor == std::string("Local Traders"));
        assert(view->parsed.total == std::string("45.00"));

        bool missing = false;
        try {
            intake.uploadFile((fs::path(testRoot) / "nope.txt").string());
        } catch (const std::runtime_error&) {
            missing = true;
        }
        assert(missing);
    }

    // Names that are not valid UTF-8 are stored with replacement characters
    {
        auto odd = intake.upload(std::string("bad\xFF" "name.txt"), "Total: 5\n");
        dispatcher->waitIdle();
        auto view = query.getDocument(odd.documentId);
        assert(view->filename == std::string("bad\xEF\xBF\xBD" "name.txt"));
        assert(view->status == DocumentStatus::Success);
        assert(ToJson(*view)["filename"] == "bad\xEF\xBF\xBD" "name.txt");
    }

    // A failed record creation leaves no blob behind
    {
        const std::string rejectedStorage = (fs::path(testRoot) / "rejected").string();
        DocumentIntakeService rejecting(rejectedStorage, std::make_shared<RejectingRepository>(), dispatcher, persistence);
        bool threw = false;
        try {
            rejecting.upload("x.txt", "Total: 1\n");
        } catch (const PersistenceError&) {
            threw = true;
        }
        assert(threw);
        assert(fs::is_empty(rejectedStorage));
    }

    // Lookups and listing
    {
        assert(!query.getDocument(999));
        assert(!query.getTaskStatus("no-such-task"));

        auto all = query.listDocuments();
        assert(all.size() == 7);
        auto page = query.listDocuments(1, 2);
        assert(page.size() == 2);
        assert(page[0].id == 2 && page[1].id == 3);
        assert(query.listDocuments(10, 5).empty());
    }

    dispatcher->shutdown();
    persistence->flush();

    // Job results survive a restart
    {
        JobResultStore reloaded(config.jobsPath, persistence);
        assert(reloaded.load() == 7);
        auto status = reloaded.get(receipt.jobId);
        assert(status && status->state == JobState::Success);
        assert(status->documentId == receipt.documentId);
        assert(status->result->fields.total == std::string("2000.00"));

        auto missing = reloaded.get(missingJob);
        assert(missing->result->kind == OutcomeKind::FileNotFound);
        assert(missing->documentId == missingId);
        assert(reloaded.get(blank.jobId)->state == JobState::Failure);
    }

    persistence->stop();
    fs::remove_all(testRoot);

    std::cout << "[PASS] Intake/Query Test." << std::endl;
    return 0;
}
