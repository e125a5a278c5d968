// File persistence: card catalogue text file and encrypted progress file.

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sodium.h>
#include <unistd.h>

#include "core/Scheduler.hpp"
#include "storage/Storage.hpp"

namespace {

constexpr std::time_t T = 1700000000;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_GE(sodium_init(), 0);
        root = std::filesystem::temp_directory_path()
            / ("retain_storage_test_" + std::to_string(getpid()) + "_"
               + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(root);

        key.resize(crypto_secretbox_KEYBYTES);
        crypto_secretbox_keygen(key.data());
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::string Path(const std::string& name) const { return (root / name).string(); }

    std::filesystem::path root;
    std::vector<unsigned char> key;
};

std::vector<Progress> SampleProgress() {
    Scheduler s;
    Card c1(1, "q", "a");
    Card c2(2, "q", "a");
    Progress a = s.update(5, c1, std::nullopt, ReviewQuality::GOOD, T);
    a.version = 1;
    Progress b = s.update(5, c2, std::nullopt, ReviewQuality::AGAIN, T);
    b = s.update(5, c2, b, ReviewQuality::EASY, T + SECONDS_PER_DAY);
    b.version = 2;
    return { a, b };
}

TEST_F(StorageTest, CardsSurviveMultilineFields) {
    Card a(3, "Line one\nline two", "C:\\path");
    a.created_seq = 1;
    a.scope = "GS1";
    a.base_difficulty = 7.5;
    a.explanation = std::string("see\nnotes");
    a.source = CardSource::GENERATED;
    Card b(4, "q", "a");
    b.created_seq = 2;

    ASSERT_TRUE(Storage::saveCards({ a, b }, Path("cards.txt")));

    std::vector<Card> loaded;
    ASSERT_TRUE(Storage::loadCards(loaded, Path("cards.txt")));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].prompt, a.prompt);
    EXPECT_EQ(loaded[0].answer, a.answer);
    EXPECT_EQ(loaded[0].explanation, a.explanation);
    EXPECT_EQ(loaded[0].scope, "GS1");
    EXPECT_DOUBLE_EQ(loaded[0].base_difficulty, 7.5);
    EXPECT_EQ(loaded[0].source, CardSource::GENERATED);
    EXPECT_FALSE(loaded[1].explanation.has_value());
    EXPECT_EQ(loaded[1].id, 4u);
}

TEST_F(StorageTest, DuplicateCardIdsAreRefused) {
    Card a(4, "first", "a");
    a.created_seq = 1;
    a.scope = "GS1";
    Card b(4, "second", "b");
    b.created_seq = 2;
    b.scope = "GS1";
    ASSERT_TRUE(Storage::saveCards({ a, b }, Path("cards.txt")));

    std::vector<Card> loaded;
    EXPECT_FALSE(Storage::loadCards(loaded, Path("cards.txt")));
    EXPECT_TRUE(loaded.empty());
}

TEST_F(StorageTest, MissingFilesLoadAsEmpty) {
    std::vector<Card> cards;
    EXPECT_TRUE(Storage::loadCards(cards, Path("absent.txt")));
    EXPECT_TRUE(cards.empty());

    std::vector<Progress> progress;
    EXPECT_TRUE(Storage::loadProgress(progress, Path("absent.dat"), key));
    EXPECT_TRUE(progress.empty());
}

TEST_F(StorageTest, ProgressIsEncryptedAndRestored) {
    auto records = SampleProgress();
    ASSERT_TRUE(Storage::saveProgress(records, Path("progress.dat"), key));

    std::ifstream raw(Path("progress.dat"), std::ios::binary);
    std::string bytes((std::istreambuf_iterator<char>(raw)), std::istreambuf_iterator<char>());
    EXPECT_EQ(bytes.rfind("SRPROG1\n", 0), 0u);
    EXPECT_EQ(bytes.find("reviewing"), std::string::npos);

    std::vector<Progress> loaded;
    ASSERT_TRUE(Storage::loadProgress(loaded, Path("progress.dat"), key));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0], records[0]);
    EXPECT_EQ(loaded[1], records[1]);
}

TEST_F(StorageTest, WrongKeyIsRejected) {
    ASSERT_TRUE(Storage::saveProgress(SampleProgress(), Path("progress.dat"), key));

    std::vector<unsigned char> other(crypto_secretbox_KEYBYTES);
    crypto_secretbox_keygen(other.data());

    std::vector<Progress> loaded;
    EXPECT_FALSE(Storage::loadProgress(loaded, Path("progress.dat"), other));
    EXPECT_TRUE(loaded.empty());

    std::vector<unsigned char> short_key(8, 0);
    EXPECT_FALSE(Storage::loadProgress(loaded, Path("progress.dat"), short_key));
    EXPECT_FALSE(Storage::saveProgress(SampleProgress(), Path("other.dat"), short_key));
}

TEST_F(StorageTest, RecordsBreakingInvariantsAreRefused) {
    auto records = SampleProgress();
    records[0].next_due_at = *records[0].next_due_at - SECONDS_PER_DAY;
    ASSERT_TRUE(Storage::saveProgress(records, Path("progress.dat"), key));

    std::vector<Progress> loaded;
    EXPECT_FALSE(Storage::loadProgress(loaded, Path("progress.dat"), key));
    EXPECT_TRUE(loaded.empty());
}

TEST_F(StorageTest, KeyDerivationIsDeterministicPerPassphrase) {
    std::string salt = Storage::generateSaltHex();
    EXPECT_EQ(salt.size(), 2u * crypto_pwhash_SALTBYTES);

    std::vector<unsigned char> k1, k2, k3;
    ASSERT_TRUE(Storage::deriveKey("correct horse", salt, k1));
    ASSERT_TRUE(Storage::deriveKey("correct horse", salt, k2));
    ASSERT_TRUE(Storage::deriveKey("battery staple", salt, k3));
    EXPECT_EQ(k1.size(), crypto_secretbox_KEYBYTES);
    EXPECT_EQ(k1, k2);
    EXPECT_NE(k1, k3);

    EXPECT_FALSE(Storage::deriveKey("x", "", k3));
    EXPECT_FALSE(Storage::deriveKey("x", "zz", k3));
}

}  // namespace
