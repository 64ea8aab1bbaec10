/**
 * @file test_validator.cpp
 * @brief Unit tests for the post-build checks and the JSON report
 */

#include <gtest/gtest.h>
#include <report/build_report.hpp>
#include <utils/logger.hpp>
#include <validate/validator.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

using namespace Lexicode;

static std::vector<LexiconEntry> sample_rows() {
    return {
        {"happy", "3010-00001-3-1-1", 10050},
        {"unhappy", "3999-00001-3-1-2", 10},
        {"layoff", "0233-00001-1-2-2", 10013},
        {"redundancy", "0233-00001-1-2-2", 10010},
        {"run", "2999-00001-2-1-0", 10},
        {"run", "0999-00004-1-1-0", 12},
    };
}

static const CheckResult& check_named(const ValidationReport& report, const std::string& name) {
    for (const auto& c : report.checks) {
        if (c.name == name) return c;
    }
    throw std::runtime_error("no check " + name);
}

// ============================================================================
// Hard checks
// ============================================================================

TEST(ValidatorTest, DeterminismAgainstRebuild) {
    auto rows = sample_rows();
    auto same = sample_rows();
    std::reverse(same.begin(), same.end());
    EXPECT_TRUE(Validator::check_determinism(rows, same, std::nullopt).passed);

    auto changed = sample_rows();
    changed[1].code = "3999-00001-3-1-0";
    changed.push_back({"extra", "0999-00009-1-1-0", 1});
    auto result = Validator::check_determinism(rows, changed, std::nullopt);
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.issues.size(), 2u);
}

TEST(ValidatorTest, DeterminismAgainstRecordedFingerprint) {
    auto rows = sample_rows();
    std::string fp = fingerprint_rows(rows);
    EXPECT_TRUE(Validator::check_determinism(rows, std::nullopt, fp).passed);
    EXPECT_FALSE(Validator::check_determinism(rows, std::nullopt, std::string("deadbeef")).passed);

    auto unverified = Validator::check_determinism(rows, std::nullopt, std::nullopt);
    EXPECT_TRUE(unverified.passed);
    EXPECT_FALSE(unverified.notes.empty());
}

TEST(ValidatorTest, FormatCheck) {
    auto rows = sample_rows();
    EXPECT_TRUE(Validator::check_format(rows).passed);
    rows.push_back({"bad", "0233-0001-1-2-2", 1});
    rows.push_back({"worse", "0233-00001-7-2-2", 1});
    auto result = Validator::check_format(rows);
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.issues.size(), 2u);
}

TEST(ValidatorTest, KeyUniqueness) {
    auto rows = sample_rows();
    EXPECT_TRUE(Validator::check_key_uniqueness(rows).passed);
    rows.push_back(rows.front());
    EXPECT_FALSE(Validator::check_key_uniqueness(rows).passed);
}

TEST(ValidatorTest, OverridePrecedence) {
    OverrideTable overrides;
    overrides.set("redundancy", Valence::Negative);
    auto rows = sample_rows();
    EXPECT_TRUE(Validator::check_override_precedence(rows, overrides).passed);

    rows.push_back({"redundancy", "0233-00002-1-2-1", 5});
    auto result = Validator::check_override_precedence(rows, overrides);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_NE(result.issues[0].find("0233-00002-1-2-1"), std::string::npos);
}

// ============================================================================
// Advisory checks
// ============================================================================

TEST(ValidatorTest, AdvisoryChecksNeverFail) {
    auto rows = sample_rows();
    auto pos = Validator::pos_distribution(rows);
    EXPECT_TRUE(pos.passed);
    EXPECT_EQ(pos.notes.size(), 3u);
    EXPECT_EQ(pos.notes[0].rfind("Nouns: 3", 0), 0u);

    auto superclasses = Validator::superclass_distribution(rows);
    EXPECT_TRUE(superclasses.passed);
    EXPECT_EQ(superclasses.notes.back(), "Total superclasses: 5");

    auto polysemy = Validator::polysemy(rows);
    EXPECT_EQ(polysemy.notes.front(), "'run': 2 senses");

    auto samples = Validator::sample_lookups(rows, {"run", "zebra"});
    EXPECT_TRUE(samples.passed);
    ASSERT_EQ(samples.issues.size(), 1u);
    EXPECT_EQ(samples.notes[0], "'run': 2 code(s) - 0999-00004-1-1-0");
}

TEST(ValidatorTest, RunIsAndOverHardChecks) {
    Logger::Level level = Logger::min_level();
    Logger::set_min_level(Logger::Level::Error);
    OverrideTable overrides = OverrideTable::defaults();

    ValidationInput input;
    input.rows = sample_rows();
    input.recorded_fingerprint = fingerprint_rows(input.rows);
    input.overrides = &overrides;
    ValidationReport report = Validator::run(input);
    EXPECT_TRUE(report.passed());
    EXPECT_EQ(report.words, 5u);
    EXPECT_EQ(report.mappings, 6u);
    EXPECT_EQ(report.checks.size(), 8u);
    EXPECT_TRUE(check_named(report, "sample lookups").passed);
    Validator::log(report);

    input.rows.push_back({"fired", "2102-00001-2-1-1", 1});
    report = Validator::run(input);
    EXPECT_FALSE(report.passed());
    EXPECT_FALSE(check_named(report, "override precedence").passed);
    EXPECT_FALSE(check_named(report, "determinism").passed);
    EXPECT_EQ(report.issue_count(), 2u);
    Validator::log(report);
    Logger::set_min_level(level);
}

TEST(ValidatorTest, LogCapsIssues) {
    std::ostringstream out;
    Logger::set_sink(out);
    std::vector<LexiconEntry> rows;
    for (int i = 0; i < 25; ++i) rows.push_back({"w" + std::to_string(i), "bad-" + std::to_string(i), 1});
    ValidationInput input;
    input.rows = rows;
    ValidationReport report = Validator::run(input);
    Validator::log(report);
    Logger::reset_sink();

    EXPECT_FALSE(report.passed());
    EXPECT_EQ(report.issue_count(), 25u);
    std::string text = out.str();
    size_t listed = 0;
    for (size_t p = text.find("  - "); p != std::string::npos; p = text.find("  - ", p + 1)) ++listed;
    EXPECT_EQ(listed, Validator::MAX_LOGGED_ISSUES);
}

// ============================================================================
// Report
// ============================================================================

TEST(BuildReportTest, ValidationJson) {
    ValidationInput input;
    input.rows = sample_rows();
    auto doc = BuildReport::to_json(Validator::run(input));
    EXPECT_TRUE(doc["passed"].get<bool>());
    EXPECT_EQ(doc["mappings"].get<size_t>(), 6u);
    EXPECT_EQ(doc["checks"][0]["name"], "determinism");
    EXPECT_EQ(doc["checks"][0]["severity"], "hard");
}
