#include <filesystem>
#include <system_error>

#include <gtest/gtest.h>

#include "tasks/task_store.hpp"
#include "test_support.hpp"

namespace filecron::tasks {
namespace {

using filecron::testing::MakeTask;
using filecron::testing::ReadJson;
using filecron::testing::TempDir;
using filecron::testing::WriteFile;

TEST(TaskStoreTest, RecognizesRecordFileNames) {
    EXPECT_TRUE(TaskStore::IsRecordFileName("t1.json"));
    EXPECT_TRUE(TaskStore::IsRecordFileName("daily-report.json"));
    EXPECT_FALSE(TaskStore::IsRecordFileName(".t1.json"));
    EXPECT_FALSE(TaskStore::IsRecordFileName(".t1.json.123.0.tmp"));
    EXPECT_FALSE(TaskStore::IsRecordFileName("t1.json.swp"));
    EXPECT_FALSE(TaskStore::IsRecordFileName("t1.txt"));
    EXPECT_FALSE(TaskStore::IsRecordFileName(".json"));
    EXPECT_FALSE(TaskStore::IsRecordFileName(""));

    EXPECT_EQ(TaskStore::TaskIdFromFileName("t1.json"), "t1");
    EXPECT_EQ(TaskStore::TaskIdFromFileName("notes.txt"), "");
}

TEST(TaskStoreTest, ListsOnlyRecordFilesInNameOrder) {
    TempDir dir;
    TaskStore store(dir.Path());
    WriteFile(dir.Path() / "b.json", "{}");
    WriteFile(dir.Path() / "a.json", "{}");
    WriteFile(dir.Path() / ".hidden.json", "{}");
    WriteFile(dir.Path() / "readme.md", "#");
    std::filesystem::create_directories(dir.Path() / "nested.json");

    const auto files = store.ListRecordFiles();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename().string(), "a.json");
    EXPECT_EQ(files[1].filename().string(), "b.json");
}

TEST(TaskStoreTest, MissingDirectoryListsNothingUntilCreated) {
    TempDir dir;
    TaskStore store(dir.Path() / "tasks" / "inner");
    EXPECT_TRUE(store.ListRecordFiles().empty());
    store.EnsureDirectory();
    EXPECT_TRUE(std::filesystem::is_directory(store.Directory()));
}

TEST(TaskStoreTest, LoadDistinguishesMissingInvalidAndValid) {
    TempDir dir;
    TaskStore store(dir.Path());

    EXPECT_EQ(store.Load(store.PathFor("absent")).status, LoadStatus::kMissing);

    WriteFile(store.PathFor("partial"), "{\"taskId\": \"partial\", ");
    const auto partial = store.Load(store.PathFor("partial"));
    EXPECT_EQ(partial.status, LoadStatus::kInvalid);
    EXPECT_FALSE(partial.reportable);
    EXPECT_FALSE(partial.error.empty());

    WriteFile(store.PathFor("t1"), MakeTask("t1", "2026-01-01T10:00:00+08:00").dump());
    const auto valid = store.Load(store.PathFor("t1"));
    ASSERT_EQ(valid.status, LoadStatus::kOk);
    EXPECT_EQ(valid.record.task_id, "t1");
    EXPECT_EQ(valid.record.tool_call.tool_name, "Echo");
}

TEST(TaskStoreTest, BrokenToolCallIsReportableWithIdentity) {
    TempDir dir;
    TaskStore store(dir.Path());
    auto data = MakeTask("t9", "2026-01-01T10:00:00+08:00");
    data["tool_call"].erase("arguments");
    WriteFile(store.PathFor("t9"), data.dump());

    const auto loaded = store.Load(store.PathFor("t9"));
    EXPECT_EQ(loaded.status, LoadStatus::kInvalid);
    EXPECT_TRUE(loaded.reportable);
    EXPECT_EQ(loaded.record.task_id, "t9");
    EXPECT_EQ(loaded.record.scheduled_local_time, "2026-01-01T10:00:00+08:00");
    EXPECT_EQ(loaded.record.document, data);
}

TEST(TaskStoreTest, TaskIdInsideFileIsAuthoritative) {
    TempDir dir;
    TaskStore store(dir.Path());
    WriteFile(dir.Path() / "renamed.json", MakeTask("original-id", "2026-01-01T10:00:00+08:00").dump());

    const auto loaded = store.Load(dir.Path() / "renamed.json");
    ASSERT_EQ(loaded.status, LoadStatus::kOk);
    EXPECT_EQ(loaded.record.task_id, "original-id");
}

TEST(TaskStoreTest, WriteReplacesFileWithoutLeavingTempFiles) {
    TempDir dir;
    TaskStore store(dir.Path());
    const auto path = store.PathFor("t1");
    WriteFile(path, MakeTask("t1", "2026-01-01T10:00:00+08:00").dump());

    auto updated = MakeTask("t1", "2026-01-01T10:01:00+08:00");
    updated["interval"] = 60;
    store.Write(path, updated);

    EXPECT_EQ(ReadJson(path), updated);
    std::size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.Path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST(TaskStoreTest, WriteIntoMissingDirectoryThrows) {
    TempDir dir;
    TaskStore store(dir.Path() / "gone");
    EXPECT_ANY_THROW(store.Write(store.PathFor("t1"), MakeTask("t1", "2026-01-01T10:00:00+08:00")));
}

TEST(TaskStoreTest, RemoveReportsWhetherAFileWasDeleted) {
    TempDir dir;
    TaskStore store(dir.Path());
    const auto path = store.PathFor("t1");
    WriteFile(path, "{}");

    std::error_code ec;
    EXPECT_TRUE(store.Remove(path, ec));
    EXPECT_FALSE(ec);
    EXPECT_FALSE(store.Exists(path));
    EXPECT_FALSE(store.Remove(path, ec));
    EXPECT_FALSE(ec);
}

}  // namespace
}  // namespace filecron::tasks
