#include <gtest/gtest.h>
#include "events.hpp"
#include "jpeg_codec.hpp"
#include "pipeline_orchestrator.hpp"
#include "testing.hpp"
#include <algorithm>

namespace cbzsan {

namespace fs = std::filesystem;

class PipelineOrchestratorTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    CodecRegistry registry;
    EventBus bus;

    std::vector<ArchiveCompleteEvent> completed;
    std::vector<ArchiveSkippedEvent> skipped;
    std::vector<ArchiveErrorEvent> errors;
    std::size_t started = 0;

    void SetUp() override {
        fs::create_directories(WorkRoot());
        bus.subscribe<ArchiveStartEvent>([this](const ArchiveStartEvent&) { ++started; });
        bus.subscribe<ArchiveCompleteEvent>([this](const ArchiveCompleteEvent& e) { completed.push_back(e); });
        bus.subscribe<ArchiveSkippedEvent>([this](const ArchiveSkippedEvent& e) { skipped.push_back(e); });
        bus.subscribe<ArchiveErrorEvent>([this](const ArchiveErrorEvent& e) { errors.push_back(e); });
    }

    fs::path WorkRoot() const { return temp_dir.Path() / "work"; }
    fs::path Input(const std::string& name) const { return temp_dir.Path() / name; }

    SanitizeOptions Options(const std::string& box = "1440x") const {
        SanitizeOptions options;
        options.bbox = *parse_bounding_box(box);
        options.temp_root = WorkRoot();
        return options;
    }

    bool WorkRootIsEmpty() const { return fs::is_empty(WorkRoot()); }
};

TEST_F(PipelineOrchestratorTest, SanitizesComicEndToEnd) {
    const std::string page = testutil::MakeJpegBytes(3000, 4000, 95, Input("scratch.jpg"));
    testutil::WriteZip(Input("book.cbz"), {
        {"page1.jpg", page},
        {"page1.jpg", "duplicate that must not win"},
        {"notes.txt", "chapter notes\n"},
    });
    const std::string original = testutil::ReadFile(Input("book.cbz"));

    PipelineOrchestrator orchestrator(Options("1440x"), registry, bus);
    EXPECT_EQ(orchestrator.process(Input("book.cbz")), ArchiveState::Done);

    // original preserved byte-for-byte under the backup name
    EXPECT_EQ(testutil::ReadFile(Input("book-orig.cbz")), original);

    const auto entries = testutil::ReadZip(Input("book.cbz"));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "notes.txt");
    EXPECT_EQ(entries[0].second, "chapter notes\n");
    EXPECT_EQ(entries[1].first, "page1.jpg");

    testutil::WriteFile(Input("out.jpg"), entries[1].second);
    const Image result = JpegCodec().decode(Input("out.jpg"), false);
    EXPECT_EQ(result.width, 1440u);
    EXPECT_EQ(result.height, 1920u);

    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(started, 1u);
    EXPECT_EQ(completed[0].backup_path, Input("book-orig.cbz"));
    EXPECT_EQ(completed[0].extraction.duplicates.size(), 1u);
    EXPECT_EQ(completed[0].normalize.images_resized, 1u);
    EXPECT_EQ(completed[0].normalize.images_replaced, 1u);
    EXPECT_EQ(completed[0].entries_written, 2u);
    EXPECT_EQ(completed[0].original_size, original.size());
    EXPECT_LT(completed[0].new_size, completed[0].original_size);
    EXPECT_TRUE(WorkRootIsEmpty());
}

TEST_F(PipelineOrchestratorTest, MissingInputIsSkipped) {
    PipelineOrchestrator orchestrator(Options(), registry, bus);
    EXPECT_EQ(orchestrator.process(Input("missing.cbz")), ArchiveState::Skipped);

    ASSERT_EQ(skipped.size(), 1u);
    EXPECT_EQ(skipped[0].reason.rfind("UnreadableInput", 0), 0u);
    EXPECT_EQ(started, 0u);
    EXPECT_FALSE(fs::exists(Input("missing-orig.cbz")));
    EXPECT_TRUE(WorkRootIsEmpty());
}

TEST_F(PipelineOrchestratorTest, DirectoryInputIsSkipped) {
    fs::create_directories(Input("folder.cbz"));
    PipelineOrchestrator orchestrator(Options(), registry, bus);
    EXPECT_EQ(orchestrator.process(Input("folder.cbz")), ArchiveState::Skipped);
    EXPECT_EQ(skipped.size(), 1u);
}

TEST_F(PipelineOrchestratorTest, CorruptArchiveFailsWithoutMutation) {
    testutil::WriteFile(Input("bad.cbz"), "definitely not a zip");
    PipelineOrchestrator orchestrator(Options(), registry, bus);
    EXPECT_EQ(orchestrator.process(Input("bad.cbz")), ArchiveState::Failed);

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(errors[0].classified);
    EXPECT_EQ(errors[0].kind, ErrorKind::CorruptArchive);
    EXPECT_EQ(testutil::ReadFile(Input("bad.cbz")), "definitely not a zip");
    EXPECT_FALSE(fs::exists(Input("bad-orig.cbz")));
    EXPECT_TRUE(WorkRootIsEmpty());
}

TEST_F(PipelineOrchestratorTest, BackupCollisionFailsWithoutMutation) {
    testutil::WriteZip(Input("book.cbz"), {{"notes.txt", "hello\n"}});
    testutil::WriteFile(Input("book-orig.cbz"), "previous run");
    const std::string original = testutil::ReadFile(Input("book.cbz"));

    PipelineOrchestrator orchestrator(Options(), registry, bus);
    EXPECT_EQ(orchestrator.process(Input("book.cbz")), ArchiveState::Failed);

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::DestinationBackupCollision);
    EXPECT_EQ(testutil::ReadFile(Input("book.cbz")), original);
    EXPECT_EQ(testutil::ReadFile(Input("book-orig.cbz")), "previous run");
    EXPECT_TRUE(WorkRootIsEmpty());
}

TEST_F(PipelineOrchestratorTest, TraversalEntriesAreDroppedFromOutput) {
    testutil::WriteZip(Input("book.cbz"), {
        {"../escape.txt", "nope"},
        {"page.txt", "kept"},
    });
    PipelineOrchestrator orchestrator(Options(), registry, bus);
    EXPECT_EQ(orchestrator.process(Input("book.cbz")), ArchiveState::Done);

    EXPECT_EQ(testutil::ReadZipNames(Input("book.cbz")), std::vector<std::string>{"page.txt"});
    EXPECT_FALSE(fs::exists(temp_dir.Path() / "escape.txt"));
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].extraction.rejected.size(), 1u);
}

TEST_F(PipelineOrchestratorTest, BatchContinuesPastFailures) {
    testutil::WriteFile(Input("bad.cbz"), "garbage");
    testutil::WriteZip(Input("good.cbz"), {{"notes.txt", "hello\n"}});

    PipelineOrchestrator orchestrator(Options(), registry, bus);
    const BatchSummary summary = orchestrator.process_batch(
        {Input("bad.cbz"), Input("missing.cbz"), Input("good.cbz")});
    EXPECT_EQ(summary.done, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_FALSE(summary.interrupted);
    EXPECT_TRUE(fs::exists(Input("good-orig.cbz")));
}

TEST_F(PipelineOrchestratorTest, StopRequestEndsBatchBeforeNextArchive) {
    testutil::WriteZip(Input("a.cbz"), {{"notes.txt", "a\n"}});
    testutil::WriteZip(Input("b.cbz"), {{"notes.txt", "b\n"}});

    PipelineOrchestrator orchestrator(Options(), registry, bus);
    // stop as soon as the first archive completes
    bus.subscribe<ArchiveCompleteEvent>([&](const ArchiveCompleteEvent&) { orchestrator.request_stop(); });

    const BatchSummary summary = orchestrator.process_batch({Input("a.cbz"), Input("b.cbz")});
    EXPECT_TRUE(orchestrator.is_stopped());
    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.done, 1u);
    EXPECT_TRUE(fs::exists(Input("a-orig.cbz")));
    EXPECT_FALSE(fs::exists(Input("b-orig.cbz")));
}

TEST(ArchiveStateTest, NamesAreStable) {
    EXPECT_EQ(archive_state_to_string(ArchiveState::Pending), "PENDING");
    EXPECT_EQ(archive_state_to_string(ArchiveState::Done), "DONE");
    EXPECT_EQ(archive_state_to_string(ArchiveState::Failed), "FAILED");
}

TEST(EventBusTest, DeliversToSubscribersOfTheEventType) {
    EventBus bus;
    int skipped = 0;
    int errors = 0;
    bus.subscribe<ArchiveSkippedEvent>([&](const ArchiveSkippedEvent&) { ++skipped; });
    bus.subscribe<ArchiveSkippedEvent>([&](const ArchiveSkippedEvent&) { ++skipped; });
    bus.subscribe<ArchiveErrorEvent>([&](const ArchiveErrorEvent&) { ++errors; });

    bus.publish(ArchiveSkippedEvent{"x.cbz", "reason"});
    bus.publish(ArchiveStartEvent{"x.cbz", 1});
    EXPECT_EQ(skipped, 2);
    EXPECT_EQ(errors, 0);
    EXPECT_EQ(bus.subscriber_count<ArchiveSkippedEvent>(), 2u);
    EXPECT_EQ(bus.subscriber_count<ArchiveStartEvent>(), 0u);
}

} // namespace cbzsan
