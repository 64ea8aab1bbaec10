/**
 * @file test_lexicon_writer.cpp
 * @brief Unit tests for the phased write against the in-memory store
 */

#include <gtest/gtest.h>
#include <storage/lexicon_writer.hpp>
#include <storage/memory_lexicon_store.hpp>
#include <utils/logger.hpp>
#include <cctype>
#include <unistd.h>

using namespace Lexicode;

namespace {

class LexiconWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::min_level();
        Logger::set_min_level(Logger::Level::Error);

        result.assembled.insert({"happy", "3010-00001-3-1-1", 10050});
        result.assembled.insert({"unhappy", "3999-00001-3-1-0", 10});
        result.assembled.insert({"fired", "3999-00002-3-1-1", 10});
        result.antonym_updates = {{"unhappy", "3999-00001-3-1-0", "3999-00001-3-1-2"}};
        result.override_updates = {{"fired", "3999-00002-3-1-1", "3999-00002-3-1-2"}};

        result.final_snapshot = result.assembled;
        for (const auto& u : result.antonym_updates) ASSERT_TRUE(result.final_snapshot.update_code(u.word, u.old_code, u.new_code));
        for (const auto& u : result.override_updates) ASSERT_TRUE(result.final_snapshot.update_code(u.word, u.old_code, u.new_code));

        result.base_forms = {{"happier", "happy"}};
        result.antonyms = {{"happy", "unhappy"}, {"unhappy", "happy"}};
    }

    void TearDown() override {
        Logger::set_min_level(saved_level_);
    }

    BuildResult result;
    MemoryLexiconStore store;
    Logger::Level saved_level_ = Logger::Level::Stat;
};

} // namespace

// ============================================================================
// Phases
// ============================================================================

TEST_F(LexiconWriterTest, ReplayMatchesFinalSnapshot) {
    LexiconWriter writer(store);
    WriteOutcome outcome = writer.write(result, "lexicode");

    EXPECT_EQ(outcome.destination, "lexicode");
    EXPECT_FALSE(outcome.redirected);
    EXPECT_EQ(outcome.entries_written, 3u);
    EXPECT_EQ(outcome.antonym_rows, 1u);
    EXPECT_EQ(outcome.override_rows, 1u);

    const auto& dest = store.committed("lexicode");
    EXPECT_EQ(dest.lexicon.fingerprint(), result.final_snapshot.fingerprint());
    EXPECT_TRUE(dest.lexicon.contains("unhappy", "3999-00001-3-1-2"));
    EXPECT_TRUE(dest.lexicon.contains("fired", "3999-00002-3-1-2"));
    EXPECT_EQ(dest.base_forms.at("happier"), "happy");
    EXPECT_EQ(dest.antonyms.size(), 2u);
    EXPECT_FALSE(store.in_transaction());
}

TEST_F(LexiconWriterTest, MetadataRecorded) {
    LexiconWriter writer(store);
    writer.write(result, "lexicode");
    store.open_destination("lexicode");

    EXPECT_EQ(store.load_metadata("fingerprint"), std::optional<std::string>(result.final_snapshot.fingerprint()));
    EXPECT_EQ(store.load_metadata("entries"), std::optional<std::string>("3"));
    EXPECT_EQ(store.load_metadata("format"), std::optional<std::string>("HHHH-LLLLL-P-A-V"));
    EXPECT_FALSE(store.load_metadata("nope").has_value());
    EXPECT_EQ(store.load_entries().size(), 3u);
}

TEST_F(LexiconWriterTest, RewriteReplacesPreviousBuild) {
    LexiconWriter writer(store);
    writer.write(result, "lexicode");

    BuildResult smaller;
    smaller.assembled.insert({"calm", "3999-00001-3-1-0", 10});
    smaller.final_snapshot = smaller.assembled;
    writer.write(smaller, "lexicode");

    const auto& dest = store.committed("lexicode");
    EXPECT_EQ(dest.lexicon.size(), 1u);
    EXPECT_TRUE(dest.antonyms.empty());
}

// ============================================================================
// Failure handling
// ============================================================================

TEST_F(LexiconWriterTest, LockedDestinationRedirects) {
    store.lock_destination("lexicode");
    LexiconWriter writer(store);
    WriteOutcome outcome = writer.write(result, "lexicode");

    EXPECT_TRUE(outcome.redirected);
    EXPECT_EQ(outcome.destination.rfind("lexicode_", 0), 0u);
    EXPECT_EQ(outcome.destination.size(), std::string("lexicode_").size() + 14 + 1 +
                                              std::to_string(static_cast<long>(::getpid())).size());
    EXPECT_EQ(store.committed("lexicode").lexicon.size(), 0u);
    EXPECT_EQ(store.committed(outcome.destination).lexicon.size(), 3u);
}

TEST_F(LexiconWriterTest, MissedUpdateRollsBackEverything) {
    LexiconWriter writer(store);
    writer.write(result, "lexicode");
    std::string before = store.committed("lexicode").lexicon.fingerprint();

    BuildResult broken = result;
    broken.assembled.insert({"sad", "3999-00009-3-1-0", 1});
    broken.override_updates.push_back({"ghost", "0999-00001-1-1-0", "0999-00001-1-1-2"});
    EXPECT_THROW(writer.write(broken, "lexicode"), std::runtime_error);

    EXPECT_FALSE(store.in_transaction());
    EXPECT_EQ(store.committed("lexicode").lexicon.fingerprint(), before);
    EXPECT_FALSE(store.committed("lexicode").lexicon.contains("sad"));
}

TEST(MemoryLexiconStoreTest, TransactionGuard) {
    MemoryLexiconStore store;
    EXPECT_THROW(store.insert_entries({{"a", "0001-00001-1-1-0", 1}}), std::runtime_error);
    {
        StoreTransaction txn(store);
        store.reset_destination("scratch");
        store.insert_entries({{"a", "0001-00001-1-1-0", 1}});
        EXPECT_EQ(store.load_entries().size(), 1u);
    }
    EXPECT_FALSE(store.in_transaction());
    EXPECT_FALSE(store.has_destination("scratch"));
    EXPECT_THROW(store.open_destination("scratch"), std::runtime_error);

    {
        StoreTransaction txn(store);
        store.reset_destination("scratch");
        store.insert_entries({{"a", "0001-00001-1-1-0", 1}, {"a", "0001-00001-1-1-0", 7}});
        txn.commit();
    }
    ASSERT_TRUE(store.has_destination("scratch"));
    EXPECT_EQ(store.committed("scratch").lexicon.entries()[0].priority, 1u);
}

TEST(MemoryLexiconStoreTest, UnlockedDestinationDropsNormally) {
    MemoryLexiconStore store;
    store.lock_destination("lexicode");
    store.unlock_destination("lexicode");
    StoreTransaction txn(store);
    EXPECT_NO_THROW(store.reset_destination("lexicode"));
    EXPECT_THROW(store.begin(), std::runtime_error);
}

TEST(LexiconWriterNamingTest, AlternateDestinationShape) {
    std::string name = LexiconWriter::alternate_destination("lex");
    ASSERT_GT(name.size(), 19u);
    EXPECT_EQ(name.substr(0, 4), "lex_");
    for (size_t i = 4; i < 18; ++i) EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(name[i]))) << name;
    EXPECT_EQ(name[18], '_');
}

TEST(LexiconWriterNamingTest, LongBaseFitsIdentifierLimit) {
    std::string base(48, 'a');
    std::string name = LexiconWriter::alternate_destination(base);
    std::string pid = std::to_string(static_cast<long>(::getpid()));

    EXPECT_LE(name.size(), LexiconWriter::MAX_IDENTIFIER_LENGTH);
    size_t kept = LexiconWriter::MAX_IDENTIFIER_LENGTH - (1 + 14 + 1 + pid.size());
    EXPECT_EQ(name.size(), LexiconWriter::MAX_IDENTIFIER_LENGTH);
    EXPECT_EQ(name.substr(0, kept + 1), base.substr(0, kept) + "_");
    for (size_t i = kept + 1; i < kept + 15; ++i) EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(name[i]))) << name;
    EXPECT_EQ(name.substr(name.size() - pid.size() - 1), "_" + pid);

    EXPECT_NE(LexiconWriter::alternate_destination(std::string(40, 'b')).find(std::string(40, 'b') + "_"),
              std::string::npos);
}
