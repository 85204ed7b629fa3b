// Plain body codec and the encrypted file-backed store.

#include <gtest/gtest.h>
#include <cstdio>
#include <sodium.h>

#include "storage/Storage.hpp"
#include "storage/FileItemStore.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

std::vector<Item> sampleItems() {
    Item a = makeItem("a1", CardState::RELEARNING, kT0 + 10 * kMinute, 10, 0, 2.3);
    a.lapses = 1;
    a.review_count = 7;
    a.last_review = kT0;

    Item b = makeItem("b2", CardState::REVIEW, kT0 + 6 * kDay, 6.5, 0, 2.65);
    b.review_count = 3;
    b.last_review = kT0 - kDay;

    return { a, b, makeItem("c3", CardState::NEW, kT0) };
}

TEST(StorageTest, PlainBodyKeepsItemsAndConfig) {
    LearningConfig cfg;
    cfg.learning_steps = { 2, 20 };
    cfg.easy_interval = 5;
    auto items = sampleItems();

    std::vector<Item> parsed;
    LearningConfig parsedCfg;
    ASSERT_TRUE(Storage::parsePlain(Storage::serializePlain(items, cfg), parsed, parsedCfg));

    EXPECT_EQ(parsedCfg, cfg);
    ASSERT_EQ(parsed.size(), items.size());
    for (size_t i = 0; i < items.size(); ++i) expectSameItem(items[i], parsed[i]);
    EXPECT_EQ(parsed[0].intervalUnit(), IntervalUnit::MINUTES);
    EXPECT_EQ(parsed[1].intervalUnit(), IntervalUnit::DAYS);
    EXPECT_EQ(parsed[2].intervalUnit(), IntervalUnit::NONE);
}

TEST(StorageTest, MultilineTextSurvives) {
    Item it = makeItem("m", CardState::NEW, kT0);
    it.front = "line one\nline two";
    it.back = "back\\slash\n---";

    std::vector<Item> parsed;
    LearningConfig cfg;
    ASSERT_TRUE(Storage::parsePlain(Storage::serializePlain({ it }, LearningConfig()), parsed, cfg));
    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].front, it.front);
    EXPECT_EQ(parsed[0].back, it.back);
}

TEST(StorageTest, RejectsMalformedBodies) {
    std::string body = Storage::serializePlain(sampleItems(), LearningConfig());
    std::vector<Item> items;
    LearningConfig cfg;

    // Drop the final "---\n"
    EXPECT_FALSE(Storage::parsePlain(body.substr(0, body.size() - 4), items, cfg));
    EXPECT_TRUE(items.empty());

    EXPECT_FALSE(Storage::parsePlain("[items]\n", items, cfg));
    EXPECT_FALSE(Storage::parsePlain("[config]\nease:2\n", items, cfg));

    std::string badState = body;
    badState.replace(badState.find("\nrelearning\n") + 1, 10, "forgotten");
    EXPECT_FALSE(Storage::parsePlain(badState, items, cfg));
}

TEST(StorageTest, RejectsOutOfRangeSchedulingFields) {
    std::vector<Item> bad(4, makeItem("x", CardState::LEARNING, kT0, 10, 1, 2.5));
    bad[0].current_step = -2;
    bad[1].ease = 1.0;
    bad[2].interval = -1.0;
    bad[3].lapses = -1;

    for (const auto& it : bad) {
        std::vector<Item> items;
        LearningConfig cfg;
        EXPECT_FALSE(Storage::parsePlain(Storage::serializePlain({ it }, LearningConfig()), items, cfg));
        EXPECT_TRUE(items.empty());
    }

    // Ease exactly at the floor is a legitimate value
    Item floor = makeItem("f", CardState::REVIEW, kT0, 3, 0, 1.3);
    std::vector<Item> items;
    LearningConfig cfg;
    EXPECT_TRUE(Storage::parsePlain(Storage::serializePlain({ floor }, LearningConfig()), items, cfg));
}

TEST(StorageTest, EmptyCollectionParses) {
    std::vector<Item> items = sampleItems();
    LearningConfig cfg;
    ASSERT_TRUE(Storage::parsePlain(Storage::serializePlain({}, LearningConfig()), items, cfg));
    EXPECT_TRUE(items.empty());
    EXPECT_EQ(cfg, LearningConfig::defaults());
}

class FileItemStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_GE(sodium_init(), 0);
        path = ::testing::TempDir() + "retenir_store_test.dat";
        std::remove(path.c_str());
    }

    void TearDown() override { std::remove(path.c_str()); }

    std::string path;
};

TEST_F(FileItemStoreTest, NewFileStartsEmptyWithDefaults) {
    FileItemStore store(path);
    ASSERT_TRUE(store.open("correct horse"));

    std::vector<Item> items;
    LearningConfig cfg;
    ASSERT_TRUE(store.loadAll(items));
    ASSERT_TRUE(store.loadConfig(cfg));
    EXPECT_TRUE(items.empty());
    EXPECT_EQ(cfg, LearningConfig::defaults());
}

TEST_F(FileItemStoreTest, ReopenRestoresItemsAndConfig) {
    LearningConfig cfg;
    cfg.relearning_steps = { 5, 15 };
    cfg.new_cards_per_day = 7;
    auto items = sampleItems();

    {
        FileItemStore store(path);
        ASSERT_TRUE(store.open("correct horse"));
        for (const auto& it : items) ASSERT_TRUE(store.save(it));
        ASSERT_TRUE(store.saveConfig(cfg));
        ASSERT_TRUE(store.remove("c3"));
        EXPECT_FALSE(store.remove("c3"));
    }

    FileItemStore reopened(path);
    ASSERT_TRUE(reopened.open("correct horse"));

    std::vector<Item> loaded;
    LearningConfig loadedCfg;
    ASSERT_TRUE(reopened.loadAll(loaded));
    ASSERT_TRUE(reopened.loadConfig(loadedCfg));

    EXPECT_EQ(loadedCfg, cfg);
    ASSERT_EQ(loaded.size(), 2u);
    expectSameItem(items[0], loaded[0]);
    expectSameItem(items[1], loaded[1]);

    std::vector<Item> due;
    ASSERT_TRUE(reopened.loadDue(kT0 + 10 * kMinute, due));
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0].id, "a1");
}

TEST_F(FileItemStoreTest, WrongPassphraseIsRejected) {
    {
        FileItemStore store(path);
        ASSERT_TRUE(store.open("correct horse"));
        ASSERT_TRUE(store.save(makeItem("a", CardState::NEW, kT0)));
    }

    FileItemStore store(path);
    EXPECT_FALSE(store.open("battery staple"));
    EXPECT_FALSE(store.isOpen());

    std::vector<Item> items;
    EXPECT_FALSE(store.loadAll(items));
}

TEST_F(FileItemStoreTest, InvalidConfigIsNotPersisted) {
    FileItemStore store(path);
    ASSERT_TRUE(store.open("correct horse"));

    LearningConfig bad;
    bad.learning_steps.clear();
    EXPECT_FALSE(store.saveConfig(bad));

    LearningConfig cfg;
    ASSERT_TRUE(store.loadConfig(cfg));
    EXPECT_EQ(cfg, LearningConfig::defaults());
}

}  // namespace
