/**
 * @file test_lexicon_pipeline.cpp
 * @brief End-to-end tests: WordNet files -> build -> store -> validation
 */

#include <gtest/gtest.h>
#include <knowledge/knowledge_base.hpp>
#include <lexicon/lexicon_builder.hpp>
#include <report/build_report.hpp>
#include <storage/lexicon_writer.hpp>
#include <storage/memory_lexicon_store.hpp>
#include <support/mini_wordnet.hpp>
#include <utils/logger.hpp>
#include <validate/validator.hpp>

using namespace Lexicode;

namespace {

class LexiconPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::min_level();
        Logger::set_min_level(Logger::Level::Error);
    }

    void TearDown() override {
        Logger::set_min_level(saved_level_);
    }

    BuildResult build() const {
        KnowledgeBase kb = KnowledgeBase::load(wordnet.dict_dir(), wordnet.sentiwordnet_path());
        return LexiconBuilder(tables).build(kb.graph, kb.sentiment, kb.morphy);
    }

    LexicodeTest::MiniWordNet wordnet{"pipeline"};
    ResolverTables tables;
    Logger::Level saved_level_ = Logger::Level::Stat;
};

} // namespace

// ============================================================================
// Stored codes
// ============================================================================

TEST_F(LexiconPipelineTest, LayoffIsNegativeAbstractEvent) {
    BuildResult result = build();
    MemoryLexiconStore store;
    WriteOutcome outcome = LexiconWriter(store).write(result, "lexicode");
    const auto& stored = store.committed(outcome.destination).lexicon;

    auto layoff = stored.primary("layoff");
    ASSERT_TRUE(layoff.has_value());
    EXPECT_EQ(layoff->code, "0233-00001-1-2-2");
    EXPECT_EQ(layoff->priority, 10013u);
    EXPECT_TRUE(stored.contains("redundancy", "0233-00001-1-2-2"));
    EXPECT_EQ(stored.primary("redundancy")->priority, 10010u);
}

TEST_F(LexiconPipelineTest, OverrideBeatsPositiveSentiment) {
    BuildResult result = build();
    MemoryLexiconStore store;
    LexiconWriter(store).write(result, "lexicode");
    const auto& stored = store.committed("lexicode").lexicon;

    ASSERT_EQ(stored.codes_for("fired").size(), 1u);
    EXPECT_EQ(stored.codes_for("fired")[0], "3999-00002-3-1-2");
    EXPECT_EQ(code_valence(stored.codes_for("fired")[0]), Valence::Negative);
}

TEST_F(LexiconPipelineTest, AntonymPullsNeutralWord) {
    BuildResult result = build();
    EXPECT_TRUE(result.assembled.contains("unhappy", "3999-00001-3-1-0"));
    EXPECT_TRUE(result.final_snapshot.contains("unhappy", "3999-00001-3-1-2"));
    EXPECT_TRUE(result.final_snapshot.contains("happy", "3010-00001-3-1-1"));
    EXPECT_EQ(result.stats.antonym_flips, 1u);
}

TEST_F(LexiconPipelineTest, EveryPartOfSpeechCoded) {
    BuildResult result = build();
    const auto& s = result.final_snapshot;
    EXPECT_TRUE(s.contains("person", "0012-00001-1-0-0"));
    EXPECT_TRUE(s.contains("individual", "0012-00001-1-0-0"));
    EXPECT_TRUE(s.contains("manager", "0211-00001-1-0-0"));
    EXPECT_TRUE(s.contains("entity", "0001-00001-1-1-0"));
    EXPECT_TRUE(s.contains("thing", "0999-00001-1-1-0"));
    EXPECT_TRUE(s.contains("fire", "2102-00001-2-1-2"));
    EXPECT_TRUE(s.contains("sack", "2102-00001-2-1-2"));
    EXPECT_TRUE(s.contains("galore", "3999-00003-3-1-0"));
    EXPECT_TRUE(s.contains("quickly", "4002-00001-4-1-0"));
}

TEST_F(LexiconPipelineTest, AuxiliaryTables) {
    BuildResult result = build();
    EXPECT_EQ(result.antonyms.size(), 2u);
    EXPECT_EQ(result.base_forms.count("men"), 0u);
    EXPECT_EQ(result.stats.unique_words, result.final_snapshot.word_count());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(LexiconPipelineTest, RebuildIsDeterministicAndValid) {
    BuildResult first = build();
    BuildResult second = build();
    EXPECT_EQ(first.final_snapshot.fingerprint(), second.final_snapshot.fingerprint());

    MemoryLexiconStore store;
    WriteOutcome outcome = LexiconWriter(store).write(first, "lexicode");
    store.open_destination(outcome.destination);

    ValidationInput input;
    input.rows = store.load_entries();
    input.recorded_fingerprint = store.load_metadata("fingerprint");
    input.reference = second.final_snapshot.entries();
    input.overrides = &tables.overrides;

    ValidationReport report = Validator::run(input);
    EXPECT_TRUE(report.passed());
    EXPECT_EQ(report.issue_count(), 0u);
    EXPECT_EQ(report.mappings, first.final_snapshot.size());

    auto doc = BuildReport::to_json(first, &outcome);
    EXPECT_EQ(doc["fingerprint"], first.final_snapshot.fingerprint());
    EXPECT_EQ(doc["destination"], "lexicode");
    EXPECT_FALSE(doc["redirected"].get<bool>());
}

TEST_F(LexiconPipelineTest, TamperedStoreFailsValidation) {
    BuildResult result = build();
    MemoryLexiconStore store;
    LexiconWriter(store).write(result, "lexicode");

    store.begin();
    store.open_destination("lexicode");
    ASSERT_TRUE(store.update_code("fired", "3999-00002-3-1-2", "3999-00002-3-1-1"));
    store.commit();

    ValidationInput input;
    input.rows = store.load_entries();
    input.recorded_fingerprint = store.load_metadata("fingerprint");
    input.overrides = &tables.overrides;

    ValidationReport report = Validator::run(input);
    EXPECT_FALSE(report.passed());
    EXPECT_EQ(report.issue_count(), 2u);   // fingerprint, override precedence
}
