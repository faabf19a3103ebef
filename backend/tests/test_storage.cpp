#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <json/json.h>
#include "storage/Storage.hpp"
#include "TestSupport.hpp"

TEST(StorageTest, StoreFileRoundTripsWithTheRightKey) {
    TempDir dir;
    Scheduler scheduler;
    CardStore store(scheduler);
    auto card = store.create(dutchWord("huis", "house"), T0);
    store.applyGrade(card.record.id, ReviewQuality::GOOD, T0);

    AuthSession session = signedIn();
    const std::string file = Storage::storeFileFor(dir.str(), session.username);
    ASSERT_TRUE(Storage::saveStore(store.snapshot(), file, session.key));

    StoreSnapshot loaded;
    ASSERT_TRUE(Storage::loadStore(loaded, file, session.key));
    EXPECT_TRUE(loaded.equals(store.snapshot()));

    std::vector<unsigned char> wrong(32, 0x07);
    StoreSnapshot rejected;
    EXPECT_FALSE(Storage::loadStore(rejected, file, wrong));
    EXPECT_TRUE(rejected.items.empty());
}

TEST(StorageTest, MissingStoreFileLoadsEmpty) {
    TempDir dir;
    AuthSession session = signedIn();
    StoreSnapshot loaded;
    EXPECT_TRUE(Storage::loadStore(loaded, dir.file("nothing.dat"), session.key));
    EXPECT_TRUE(loaded.items.empty());
}

TEST(StorageTest, CorruptStoreFileIsRejected) {
    TempDir dir;
    {
        std::ofstream out(dir.file("bad.dat"), std::ios::binary);
        out << "NOTWWDATA and some bytes";
    }
    AuthSession session = signedIn();
    StoreSnapshot loaded;
    EXPECT_FALSE(Storage::loadStore(loaded, dir.file("bad.dat"), session.key));
    EXPECT_FALSE(Storage::saveStore(loaded, dir.file("x.dat"), std::vector<unsigned char>(5, 1)));
}

TEST(StorageTest, UsersFileRoundTrip) {
    TempDir dir;
    std::vector<User> users(2);
    users[0] = User{ "anna", "$argon2id$fake", "00ff", T0 };
    users[1] = User{ "bram", "$argon2id$other", "a1b2", T0 + 1 };
    ASSERT_TRUE(Storage::saveUsers(users, Storage::userFileIn(dir.str())));

    std::vector<User> loaded;
    ASSERT_TRUE(Storage::loadUsers(loaded, Storage::userFileIn(dir.str())));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[1].username, "bram");
    EXPECT_EQ(loaded[1].enc_salt, "a1b2");
    EXPECT_EQ(loaded[1].created_at, T0 + 1);
}

TEST(StorageTest, IssueReportsAppendJsonLines) {
    TempDir dir;
    const std::string log = Storage::issueFileIn(dir.str());

    IssueReport report;
    report.record_id = "c1";
    report.item_id = "w1";
    report.text = "huis";
    report.translation = "house";
    report.note = "wrong article";
    report.reported_at = T0;
    ASSERT_TRUE(Storage::appendIssue(report, log));
    report.note.reset();
    ASSERT_TRUE(Storage::appendIssue(report, log));

    std::ifstream in(log);
    std::vector<Json::Value> rows;
    std::string text;
    while (std::getline(in, text)) {
        Json::Value row;
        Json::CharReaderBuilder builder;
        std::string errs;
        std::istringstream ss(text);
        ASSERT_TRUE(Json::parseFromStream(builder, ss, &row, &errs)) << errs;
        rows.push_back(row);
    }
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["card_id"].asString(), "c1");
    EXPECT_EQ(rows[0]["note"].asString(), "wrong article");
    EXPECT_EQ(rows[0]["reported_at"].asString(), "2024-05-01T10:00:00Z");
    EXPECT_TRUE(rows[1]["note"].isNull());
}
