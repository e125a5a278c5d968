// Card catalogue used as the content-pipeline stand-in.

#include <gtest/gtest.h>
#include <stdexcept>

#include "core/Errors.hpp"
#include "storage/CardRepository.hpp"

namespace {

TEST(CardRepositoryTest, CreatesCardsInOrder) {
    CardRepository repo;
    CardId a = repo.createCard("Capital of France?", "Paris", std::nullopt, " GS1 ", 4.0);
    CardId b = repo.createCard("2+2?", "4", std::string("basic arithmetic"), "GS2", 12.0, CardSource::GENERATED);

    EXPECT_LT(a, b);
    EXPECT_EQ(repo.size(), 2u);

    auto ca = repo.find(a);
    ASSERT_TRUE(ca.has_value());
    EXPECT_EQ(ca->scope, "GS1");
    EXPECT_DOUBLE_EQ(ca->base_difficulty, 4.0);
    EXPECT_FALSE(ca->explanation.has_value());
    EXPECT_EQ(ca->source, CardSource::AUTHORED);

    auto cb = repo.find(b);
    ASSERT_TRUE(cb.has_value());
    EXPECT_DOUBLE_EQ(cb->base_difficulty, 10.0);
    EXPECT_EQ(*cb->explanation, "basic arithmetic");
    EXPECT_EQ(cb->source, CardSource::GENERATED);
    EXPECT_LT(ca->created_seq, cb->created_seq);
}

TEST(CardRepositoryTest, RequiresPromptAndAnswer) {
    CardRepository repo;
    EXPECT_THROW(repo.createCard("", "a", std::nullopt, "s"), std::invalid_argument);
    EXPECT_THROW(repo.createCard("q", "", std::nullopt, "s"), std::invalid_argument);
    EXPECT_EQ(repo.size(), 0u);
}

TEST(CardRepositoryTest, FiltersByScope) {
    CardRepository repo;
    CardId a = repo.createCard("q1", "a", std::nullopt, "GS1");
    repo.createCard("q2", "a", std::nullopt, "GS2");
    CardId c = repo.createCard("q3", "a", std::nullopt, "GS1");

    auto gs1 = repo.inScope(std::string("GS1"));
    ASSERT_EQ(gs1.size(), 2u);
    EXPECT_EQ(gs1[0].id, a);
    EXPECT_EQ(gs1[1].id, c);

    EXPECT_EQ(repo.inScope(std::nullopt).size(), 3u);
    EXPECT_TRUE(repo.inScope(std::string("nope")).empty());
}

TEST(CardRepositoryTest, EditsMetadataOnly) {
    CardRepository repo;
    CardId id = repo.createCard("q", "a", std::nullopt, "GS1");
    repo.editMetadata(id, std::string("because"), std::string("GS9"));

    auto c = repo.find(id);
    EXPECT_EQ(*c->explanation, "because");
    EXPECT_EQ(c->scope, "GS9");
    EXPECT_EQ(c->prompt, "q");

    EXPECT_THROW(repo.editMetadata(999, std::nullopt, std::nullopt), UnknownCardError);
}

TEST(CardRepositoryTest, ParsesDecimalDifficulty) {
    EXPECT_EQ(Card::parseDifficulty("2.5"), 2.5);
    EXPECT_EQ(Card::parseDifficulty(" 10 "), 10.0);
    EXPECT_EQ(Card::parseDifficulty("1"), 1.0);
    EXPECT_FALSE(Card::parseDifficulty("-3").has_value());
    EXPECT_FALSE(Card::parseDifficulty("11").has_value());
    EXPECT_FALSE(Card::parseDifficulty("7x").has_value());
    EXPECT_FALSE(Card::parseDifficulty("").has_value());
    EXPECT_FALSE(Card::parseDifficulty("nan").has_value());
}

TEST(CardRepositoryTest, RestoreRejectsDuplicateIds) {
    Card a(40, "q", "a");
    a.created_seq = 1;
    Card b(40, "q again", "a again");
    b.created_seq = 2;
    Card keep(7, "kept", "kept");
    keep.created_seq = 1;

    CardRepository repo;
    repo.restore({ keep });
    EXPECT_THROW(repo.restore({ a, b }), std::invalid_argument);
    EXPECT_EQ(repo.size(), 1u);
    EXPECT_TRUE(repo.contains(7));
}

TEST(CardRepositoryTest, RestoreContinuesNumbering) {
    Card old(40, "q", "a");
    old.created_seq = 12;
    CardRepository repo;
    repo.restore({ old });

    EXPECT_TRUE(repo.contains(40));
    CardId next = repo.createCard("q2", "a2", std::nullopt, "");
    EXPECT_EQ(next, 41u);
    EXPECT_EQ(repo.find(next)->created_seq, 13u);
}

}  // namespace
