#include "s3sync/sync/uploader.hpp"

#include "s3sync/events/events.hpp"
#include "s3sync/ledger/sqlite_ledger.hpp"
#include "../support/fake_object_store.hpp"
#include "../support/test_utils.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using s3sync::ErrorCode;
using s3sync::events::EventBus;
using s3sync::events::PartUploadedEvent;
using s3sync::ledger::SqliteLedger;
using s3sync::storage::StorageClass;
using s3sync::sync::FileUnit;
using s3sync::sync::PartRecord;
using s3sync::sync::Uploader;
using s3sync::sync::UploadStatus;
using s3sync::testing::create_temp_dir;
using s3sync::testing::FakeObjectStore;
using s3sync::testing::write_file;

namespace {

class UploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("s3sync_uploader");
        stage_ = root_ / "stage";
        auto opened = SqliteLedger::open(":memory:");
        ASSERT_TRUE(opened.is_ok());
        ledger_ = std::move(opened.value());
    }

    FileUnit whole(const std::string& path, const std::string& content) {
        write_file(root_ / path, content);
        EXPECT_TRUE(ledger_->upsert_file_status(path, 1, UploadStatus::Pending).is_ok());
        FileUnit unit;
        unit.path = path;
        unit.size_bytes = content.size();
        return unit;
    }

    std::vector<PartRecord> three_parts() {
        auto transfer = ledger_->create_transfer("big.bin", 1, 4);
        EXPECT_TRUE(transfer.is_ok());
        transfer_id_ = transfer.value().transfer_id;

        std::vector<std::string> paths{"big.bin.part0000", "big.bin.part0001", "big.bin.part0002"};
        write_file(stage_ / paths[0], "0123");
        write_file(stage_ / paths[1], "4567");
        write_file(stage_ / paths[2], "89");
        EXPECT_TRUE(ledger_->record_parts(transfer_id_, paths).is_ok());

        auto parts = ledger_->list_parts(transfer_id_);
        EXPECT_TRUE(parts.is_ok());
        return parts.value();
    }

    UploadStatus file_status(const std::string& path) {
        auto status = ledger_->get_file_status(path);
        EXPECT_TRUE(status.is_ok());
        EXPECT_TRUE(status.value().has_value());
        return status.value()->upload_status;
    }

    fs::path root_;
    fs::path stage_;
    std::unique_ptr<SqliteLedger> ledger_;
    EventBus bus_;
    FakeObjectStore store_;
    std::string transfer_id_;
};

} // namespace

TEST_F(UploaderTest, UploadsWholeFileThenCommits) {
    Uploader uploader(root_, store_, bus_);
    const auto unit = whole("docs/report.pdf", "report body");

    ASSERT_TRUE(uploader.upload_unit(unit, false, *ledger_).is_ok());

    ASSERT_EQ(store_.puts().size(), 1u);
    EXPECT_EQ(store_.puts()[0].key, "docs/report.pdf");
    EXPECT_EQ(store_.puts()[0].body, "report body");
    EXPECT_EQ(store_.puts()[0].size_bytes, 11u);
    EXPECT_EQ(store_.puts()[0].storage_class, StorageClass::Standard);
    EXPECT_EQ(file_status("docs/report.pdf"), UploadStatus::Uploaded);
}

TEST_F(UploaderTest, DeepUsesArchiveClass) {
    Uploader uploader(root_, store_, bus_);
    const auto unit = whole("cold.bin", "x");

    ASSERT_TRUE(uploader.upload_unit(unit, true, *ledger_).is_ok());

    ASSERT_EQ(store_.puts().size(), 1u);
    EXPECT_EQ(store_.puts()[0].storage_class, StorageClass::DeepArchive);
}

TEST_F(UploaderTest, MissingFileIsIoErrorWithoutPut) {
    Uploader uploader(root_, store_, bus_);
    FileUnit unit;
    unit.path = "gone.txt";
    unit.size_bytes = 3;

    auto result = uploader.upload_unit(unit, false, *ledger_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
    EXPECT_EQ(store_.attempts(), 0u);
}

TEST_F(UploaderTest, RejectedPutLeavesStatusPending) {
    Uploader uploader(root_, store_, bus_);
    const auto unit = whole("a.txt", "aaa");
    store_.fail_on_key("a.txt");

    auto result = uploader.upload_unit(unit, false, *ledger_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Transport);
    EXPECT_EQ(file_status("a.txt"), UploadStatus::Pending);
    EXPECT_TRUE(fs::exists(root_ / "a.txt"));
}

TEST_F(UploaderTest, CommitFailureIsLedgerError) {
    Uploader uploader(root_, store_, bus_);
    write_file(root_ / "untracked.txt", "abc");
    FileUnit unit;
    unit.path = "untracked.txt";
    unit.size_bytes = 3;

    auto result = uploader.upload_unit(unit, false, *ledger_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Ledger);
}

TEST_F(UploaderTest, UploadsPartsInSequenceWithPerPartCommits) {
    Uploader uploader(root_, store_, bus_);
    const auto parts = three_parts();

    std::vector<PartUploadedEvent> uploaded;
    bus_.subscribe<PartUploadedEvent>([&](const PartUploadedEvent& e) { uploaded.push_back(e); });

    auto result = uploader.upload_parts(parts, stage_, false, *ledger_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 3u);

    const std::vector<std::string> expected{"big.bin.part0000", "big.bin.part0001", "big.bin.part0002"};
    EXPECT_EQ(store_.keys(), expected);
    EXPECT_EQ(store_.puts()[1].body, "4567");
    ASSERT_EQ(uploaded.size(), 3u);
    EXPECT_EQ(uploaded[2].sequence, 2u);
    EXPECT_EQ(uploaded[2].size_bytes, 2u);

    auto stored = ledger_->list_parts(transfer_id_);
    ASSERT_TRUE(stored.is_ok());
    for (const auto& part : stored.value()) {
        EXPECT_EQ(part.upload_status, UploadStatus::Uploaded);
    }
}

TEST_F(UploaderTest, StopsAtFirstFailedPart) {
    Uploader uploader(root_, store_, bus_);
    const auto parts = three_parts();
    store_.fail_on_key("big.bin.part0001");

    auto result = uploader.upload_parts(parts, stage_, false, *ledger_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Transport);

    auto stored = ledger_->list_parts(transfer_id_);
    ASSERT_TRUE(stored.is_ok());
    ASSERT_EQ(stored.value().size(), 3u);
    EXPECT_EQ(stored.value()[0].upload_status, UploadStatus::Uploaded);
    EXPECT_EQ(stored.value()[1].upload_status, UploadStatus::Pending);
    EXPECT_EQ(stored.value()[2].upload_status, UploadStatus::Pending);
    EXPECT_EQ(store_.attempts(), 2u);
}

TEST_F(UploaderTest, SkipsPartsAlreadyUploaded) {
    Uploader uploader(root_, store_, bus_);
    auto parts = three_parts();
    parts[0].upload_status = UploadStatus::Uploaded;

    auto result = uploader.upload_parts(parts, stage_, false, *ledger_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 2u);

    const std::vector<std::string> expected{"big.bin.part0001", "big.bin.part0002"};
    EXPECT_EQ(store_.keys(), expected);
}

TEST_F(UploaderTest, RejectsOutOfOrderParts) {
    Uploader uploader(root_, store_, bus_);
    auto parts = three_parts();
    std::swap(parts[0], parts[1]);

    auto result = uploader.upload_parts(parts, stage_, false, *ledger_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Coordination);
}

TEST_F(UploaderTest, MissingStagedPartIsIoError) {
    Uploader uploader(root_, store_, bus_);
    const auto parts = three_parts();
    // Same name beside the source is not where parts are read from
    write_file(root_ / "big.bin.part0000", "user");
    fs::remove(stage_ / "big.bin.part0000");

    auto result = uploader.upload_parts(parts, stage_, false, *ledger_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
    EXPECT_EQ(store_.attempts(), 0u);
}
