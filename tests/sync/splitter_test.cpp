#include "s3sync/sync/splitter.hpp"

#include "../support/test_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using s3sync::CancellationToken;
using s3sync::ErrorCode;
using s3sync::sync::Channel;
using s3sync::sync::FileSplitter;
using s3sync::sync::PieceReady;
using s3sync::sync::SplitEvent;
using s3sync::sync::SplitFinished;
using s3sync::testing::create_temp_dir;
using s3sync::testing::piece_files;
using s3sync::testing::read_file;
using s3sync::testing::write_file;

namespace {

struct SplitRun {
    std::vector<PieceReady> pieces;
    std::vector<SplitFinished> finished;
    bool message_after_finish = false;
};

SplitRun drain(Channel<SplitEvent>& channel) {
    SplitRun run;
    while (auto event = channel.receive()) {
        if (!run.finished.empty()) {
            run.message_after_finish = true;
        }
        if (auto* piece = std::get_if<PieceReady>(&*event)) {
            run.pieces.push_back(*piece);
        } else {
            run.finished.push_back(std::get<SplitFinished>(*event));
        }
    }
    return run;
}

} // namespace

TEST(FileSplitterTest, SplitsIntoOrderedPieces) {
    const auto dir = create_temp_dir("s3sync_splitter");
    const auto source = dir / "big.bin";
    write_file(source, "0123456789");
    fs::create_directories(dir / "stage");

    Channel<SplitEvent> channel;
    CancellationToken token;
    FileSplitter::run(source, dir / "stage", 4, channel, token);
    const auto run = drain(channel);

    ASSERT_EQ(run.pieces.size(), 3u);
    ASSERT_EQ(run.finished.size(), 1u);
    EXPECT_FALSE(run.finished[0].error.has_value());
    EXPECT_FALSE(run.message_after_finish);

    EXPECT_EQ(run.pieces[0].path, dir / "stage" / "big.bin.part0000");
    EXPECT_EQ(run.pieces[1].path, dir / "stage" / "big.bin.part0001");
    EXPECT_EQ(run.pieces[2].path, dir / "stage" / "big.bin.part0002");
    EXPECT_EQ(run.pieces[0].size_bytes, 4u);
    EXPECT_EQ(run.pieces[1].size_bytes, 4u);
    EXPECT_EQ(run.pieces[2].size_bytes, 2u);

    std::string rebuilt;
    for (const auto& piece : run.pieces) {
        rebuilt += read_file(piece.path);
    }
    EXPECT_EQ(rebuilt, "0123456789");
}

TEST(FileSplitterTest, ExactMultipleHasNoEmptyTail) {
    const auto dir = create_temp_dir("s3sync_splitter");
    const auto source = dir / "even.bin";
    write_file(source, "abcdefgh");

    Channel<SplitEvent> channel;
    CancellationToken token;
    FileSplitter::run(source, dir, 4, channel, token);
    const auto run = drain(channel);

    ASSERT_EQ(run.pieces.size(), 2u);
    EXPECT_FALSE(fs::exists(dir / "even.bin.part0002"));
}

TEST(FileSplitterTest, EmptySourceProducesNoPieces) {
    const auto dir = create_temp_dir("s3sync_splitter");
    const auto source = dir / "empty.bin";
    write_file(source, "");

    Channel<SplitEvent> channel;
    CancellationToken token;
    FileSplitter::run(source, dir, 4, channel, token);
    const auto run = drain(channel);

    EXPECT_TRUE(run.pieces.empty());
    ASSERT_EQ(run.finished.size(), 1u);
    EXPECT_FALSE(run.finished[0].error.has_value());
}

TEST(FileSplitterTest, MissingSourceReportsIoError) {
    const auto dir = create_temp_dir("s3sync_splitter");

    Channel<SplitEvent> channel;
    CancellationToken token;
    FileSplitter::run(dir / "missing.bin", dir, 4, channel, token);
    const auto run = drain(channel);

    EXPECT_TRUE(run.pieces.empty());
    ASSERT_EQ(run.finished.size(), 1u);
    ASSERT_TRUE(run.finished[0].error.has_value());
    EXPECT_EQ(run.finished[0].error->code, ErrorCode::Io);
}

TEST(FileSplitterTest, ZeroPieceSizeIsRejected) {
    const auto dir = create_temp_dir("s3sync_splitter");
    const auto source = dir / "big.bin";
    write_file(source, "0123456789");

    Channel<SplitEvent> channel;
    CancellationToken token;
    FileSplitter::run(source, dir, 0, channel, token);
    const auto run = drain(channel);

    ASSERT_EQ(run.finished.size(), 1u);
    ASSERT_TRUE(run.finished[0].error.has_value());
    EXPECT_EQ(run.finished[0].error->code, ErrorCode::Coordination);
    EXPECT_TRUE(piece_files(dir).empty());
}

TEST(FileSplitterTest, CancelledRunLeavesNoPieces) {
    const auto dir = create_temp_dir("s3sync_splitter");
    const auto source = dir / "big.bin";
    write_file(source, "0123456789");

    Channel<SplitEvent> channel;
    CancellationToken token;
    token.cancel();
    FileSplitter::run(source, dir, 4, channel, token);
    const auto run = drain(channel);

    EXPECT_TRUE(run.pieces.empty());
    ASSERT_EQ(run.finished.size(), 1u);
    ASSERT_TRUE(run.finished[0].error.has_value());
    EXPECT_EQ(run.finished[0].error->code, ErrorCode::Cancelled);
    EXPECT_TRUE(piece_files(dir).empty());
}

TEST(FileSplitterTest, SourceDirectoryIsLeftAlone) {
    const auto dir = create_temp_dir("s3sync_splitter");
    const auto source = dir / "big.bin";
    write_file(source, "0123456789");
    write_file(dir / "big.bin.part0000", "mine");
    fs::create_directories(dir / "stage");

    Channel<SplitEvent> channel;
    CancellationToken token;
    FileSplitter::run(source, dir / "stage", 4, channel, token);
    const auto run = drain(channel);

    ASSERT_EQ(run.pieces.size(), 3u);
    EXPECT_EQ(read_file(dir / "big.bin.part0000"), "mine");
    EXPECT_EQ(read_file(dir / "stage" / "big.bin.part0000"), "0123");
}

TEST(FileSplitterTest, PieceNames) {
    EXPECT_EQ(FileSplitter::piece_suffix(3), ".part0003");
    EXPECT_EQ(FileSplitter::piece_suffix(12345), ".part12345");
    EXPECT_EQ(FileSplitter::piece_path("stage", "media/video.mov", 12), fs::path("stage/video.mov.part0012"));
}

TEST(FileSplitterTest, CleanUpCountsRemovedPieces) {
    const auto dir = create_temp_dir("s3sync_splitter");
    write_file(dir / "a.part0000", "a");
    write_file(dir / "a.part0001", "b");

    const auto removed = FileSplitter::clean_up({dir / "a.part0000", dir / "a.part0001", dir / "a.part0002"});

    EXPECT_EQ(removed, 2u);
    EXPECT_TRUE(piece_files(dir).empty());
}

TEST(FileSplitterTest, FailureAfterFirstPieceKeepsOrderAndEndsOnce) {
    const auto dir = create_temp_dir("s3sync_splitter");
    const auto source = dir / "big.bin";
    write_file(source, "0123456789");
    // A directory where the second piece belongs cannot be opened for writing
    fs::create_directories(dir / "stage" / "big.bin.part0001");

    Channel<SplitEvent> channel;
    CancellationToken token;
    FileSplitter::run(source, dir / "stage", 4, channel, token);
    const auto run = drain(channel);

    ASSERT_EQ(run.pieces.size(), 1u);
    EXPECT_EQ(run.pieces[0].path, dir / "stage" / "big.bin.part0000");
    ASSERT_EQ(run.finished.size(), 1u);
    ASSERT_TRUE(run.finished[0].error.has_value());
    EXPECT_EQ(run.finished[0].error->code, ErrorCode::Io);
    EXPECT_FALSE(run.message_after_finish);
}
