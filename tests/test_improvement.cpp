#include "engineconfig.h"
#include "improvementgenerator.h"

#include <QRegularExpression>
#include <QSet>

#include <gtest/gtest.h>

namespace {

TEST(ImprovementGeneratorTest, EmptyPasswordIsInvalid) {
    EngineError error;
    EXPECT_TRUE(ImprovementGenerator::improve(QString(), &error).isEmpty());
    EXPECT_EQ(EngineError::InvalidInput, error.kind);
}

TEST(ImprovementGeneratorTest, LeetspeakReplacesAllOccurrences) {
    EXPECT_EQ(QString("P@$$w0rd"), ImprovementGenerator::leetspeak("Password"));
    EXPECT_EQ(QString("73$7"), ImprovementGenerator::leetspeak("TEST"));
    EXPECT_EQ(QString("xyz"), ImprovementGenerator::leetspeak("xyz"));
}

TEST(ImprovementGeneratorTest, WeakPasswordGetsStrongerVariants) {
    const QString original = "monkey";
    const int originalScore = StrengthScorer::score(original).score;

    EngineError error;
    const QList<ImprovementCandidate> candidates = ImprovementGenerator::improve(original, &error);
    EXPECT_FALSE(error.isError());
    ASSERT_FALSE(candidates.isEmpty());
    EXPECT_LE(candidates.size(), EngineConfig::MAX_IMPROVEMENTS);
    EXPECT_GT(candidates.first().score, originalScore);

    QSet<QString> seen;
    for (int i = 0; i < candidates.size(); ++i) {
        const ImprovementCandidate& c = candidates.at(i);
        EXPECT_NE(original, c.password);
        EXPECT_FALSE(seen.contains(c.password));
        seen.insert(c.password);
        EXPECT_GE(c.score, originalScore);
        EXPECT_EQ(StrengthScorer::score(c.password).score, c.score);
        EXPECT_EQ(StrengthScorer::levelForScore(c.score), c.level);
        EXPECT_FALSE(c.strategy.isEmpty());
        EXPECT_FALSE(c.description.isEmpty());
        if (i > 0) EXPECT_LE(c.score, candidates.at(i - 1).score);
    }
}

TEST(ImprovementGeneratorTest, StrongPasswordNeverGetsWorse) {
    const QString original = "Tr0ub4dor&3xtra!";
    const int originalScore = StrengthScorer::score(original).score;
    for (const ImprovementCandidate& c : ImprovementGenerator::improve(original))
        EXPECT_GE(c.score, originalScore) << c.password.toStdString();
}

TEST(ImprovementGeneratorTest, ShortPasswordIsExtended) {
    bool extended = false;
    for (const ImprovementCandidate& c : ImprovementGenerator::improve("abc")) {
        if (c.password.startsWith("abc") && c.password.size() == EngineConfig::IMPROVEMENT_TARGET_LENGTH)
            extended = true;
    }
    EXPECT_TRUE(extended);
}

TEST(ImprovementGeneratorTest, PassphraseKeepsPlaceholderTextVerbatim) {
    const QString original = "ab%1cdXY";
    const QRegularExpression wrapped(
        "^[A-Za-z]+-" + QRegularExpression::escape(original) + "-[0-9]{3}!$");

    bool found = false;
    for (const ImprovementCandidate& c : ImprovementGenerator::improve(original)) {
        if (c.strategy != "Passphrase creation") continue;
        found = true;
        EXPECT_TRUE(wrapped.match(c.password).hasMatch()) << c.password.toStdString();
        EXPECT_FALSE(c.password.contains("%3"));
    }
    EXPECT_TRUE(found);
}

} // namespace
