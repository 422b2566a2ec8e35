#include <gtest/gtest.h>
#include "response/ViolationJournal.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace fence;

class ViolationJournalTest : public ::testing::Test {
protected:
    std::filesystem::path dir_ = std::filesystem::temp_directory_path() / "ebpfence_journal_test";
    std::filesystem::path path_ = dir_ / "nested" / "journal.jsonl";
    EventBus bus;

    void SetUp() override {
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::vector<nlohmann::json> ReadRecords() const {
        std::vector<nlohmann::json> records;
        std::ifstream in(path_);
        std::string line;
        while (std::getline(in, line)) {
            records.push_back(nlohmann::json::parse(line));
        }
        return records;
    }
};

TEST_F(ViolationJournalTest, InitializeRequiresBus) {
    ViolationJournal journal;
    EXPECT_FALSE(journal.Initialize(path_.string(), nullptr));
}

TEST_F(ViolationJournalTest, CreatesParentDirectories) {
    ViolationJournal journal;
    ASSERT_TRUE(journal.Initialize(path_.string(), &bus));
    EXPECT_TRUE(std::filesystem::exists(path_.parent_path()));
}

TEST_F(ViolationJournalTest, FormatsViolationRecord) {
    Notification notification(NotificationType::ACCESS_VIOLATION, 1234, "cat");
    notification.file_path = "/etc/passwd";
    notification.count = 1;
    notification.threshold = 2;

    auto record = nlohmann::json::parse(ViolationJournal::FormatRecord(notification));

    EXPECT_EQ(record["type"], "ACCESS_VIOLATION");
    EXPECT_EQ(record["pid"], 1234);
    EXPECT_EQ(record["process_name"], "cat");
    EXPECT_EQ(record["file_path"], "/etc/passwd");
    EXPECT_EQ(record["count"], 1);
    EXPECT_EQ(record["threshold"], 2);
    EXPECT_EQ(record["timestamp"].get<uint64_t>(), notification.timestamp);
    EXPECT_FALSE(record.contains("error"));
}

TEST_F(ViolationJournalTest, BlockFailedRecordCarriesError) {
    Notification notification(NotificationType::BLOCK_FAILED, 5, "sh");
    notification.error_message = "map update rejected";

    auto record = nlohmann::json::parse(ViolationJournal::FormatRecord(notification));

    EXPECT_EQ(record["type"], "BLOCK_FAILED");
    EXPECT_EQ(record["error"], "map update rejected");
}

TEST_F(ViolationJournalTest, NonUtf8PathStillProducesValidJson) {
    Notification notification(NotificationType::ACCESS_VIOLATION, 1, "cat");
    notification.file_path = std::string("/tmp/\xff\xfe", 7);

    std::string line = ViolationJournal::FormatRecord(notification);
    EXPECT_NO_THROW(nlohmann::json::parse(line));
}

TEST_F(ViolationJournalTest, WritesOneLinePerNotification) {
    ViolationJournal journal;
    ASSERT_TRUE(journal.Initialize(path_.string(), &bus));
    journal.Start();

    bus.Publish(Notification(NotificationType::ACCESS_VIOLATION, 1, "a"));
    bus.Publish(Notification(NotificationType::ACCESS_VIOLATION, 1, "a"));
    bus.Publish(Notification(NotificationType::ACTOR_BLOCKED, 1, "a"));
    journal.Stop();

    EXPECT_EQ(journal.GetRecordCount(), 3u);
    auto records = ReadRecords();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2]["type"], "ACTOR_BLOCKED");
}

TEST_F(ViolationJournalTest, StopDrainsAsyncDeliveries) {
    bus.InitAsyncPool(1);
    ViolationJournal journal;
    ASSERT_TRUE(journal.Initialize(path_.string(), &bus));
    journal.Start();

    for (int i = 0; i < 50; ++i) {
        bus.PublishAsync(Notification(NotificationType::ACCESS_VIOLATION, 9, "loop"));
    }
    journal.Stop();

    EXPECT_EQ(ReadRecords().size(), 50u);
    EXPECT_EQ(bus.GetSubscriberCount(NotificationType::ACCESS_VIOLATION), 0u);
}

TEST_F(ViolationJournalTest, AppendsAcrossSessions) {
    {
        ViolationJournal journal;
        ASSERT_TRUE(journal.Initialize(path_.string(), &bus));
        journal.Start();
        bus.Publish(Notification(NotificationType::ACCESS_VIOLATION, 1, "a"));
    }
    {
        ViolationJournal journal;
        ASSERT_TRUE(journal.Initialize(path_.string(), &bus));
        journal.Start();
        bus.Publish(Notification(NotificationType::ACCESS_VIOLATION, 2, "b"));
    }

    auto records = ReadRecords();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["pid"], 1);
    EXPECT_EQ(records[1]["pid"], 2);
}
