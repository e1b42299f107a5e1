#include "cracktimeestimator.h"
#include "engineconfig.h"
#include "strengthscorer.h"

#include <QSettings>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include <cfloat>

namespace {

TEST(CrackTimeEstimatorTest, FiveEntriesInFixedOrder) {
    const QList<CrackTimeEntry> entries = CrackTimeEstimator::estimate(40.0);
    ASSERT_EQ(5, entries.size());
    EXPECT_EQ(HashAlgorithm::PlainText, entries.at(0).algorithm);
    EXPECT_EQ(HashAlgorithm::MD5, entries.at(1).algorithm);
    EXPECT_EQ(HashAlgorithm::SHA256, entries.at(2).algorithm);
    EXPECT_EQ(HashAlgorithm::Bcrypt, entries.at(3).algorithm);
    EXPECT_EQ(HashAlgorithm::Argon2, entries.at(4).algorithm);
}

TEST(CrackTimeEstimatorTest, TimesNonDecreasingAcrossAlgorithms) {
    const QStringList samples = {"a", "password", "Pass123", "Tr0ub4dor&3xtra!", QString(128, QChar('Q'))};
    for (const QString& sample : samples) {
        const QList<CrackTimeEntry> entries = CrackTimeEstimator::estimate(StrengthScorer::score(sample));
        for (int i = 1; i < entries.size(); ++i) {
            EXPECT_GE(entries.at(i).timeSeconds, entries.at(i - 1).timeSeconds);
            EXPECT_LT(entries.at(i).attackSpeedHashesPerSecond, entries.at(i - 1).attackSpeedHashesPerSecond);
        }
    }
}

TEST(CrackTimeEstimatorTest, HalfKeyspaceOverThroughput) {
    // 2^20 guesses, half searched on average.
    EXPECT_NEAR(524.288, CrackTimeEstimator::secondsToCrack(20.0, 1000.0), 1e-9);
    const double oneGuess = 0.5 / EngineConfig::MD5_HASHES_PER_SECOND;
    EXPECT_NEAR(oneGuess, CrackTimeEstimator::secondsToCrack(0.0, EngineConfig::MD5_HASHES_PER_SECOND),
                oneGuess * 1e-12);
}

TEST(CrackTimeEstimatorTest, CommonPasswordIsOneGuess) {
    const QList<CrackTimeEntry> entries = CrackTimeEstimator::estimate(StrengthScorer::score("password"));
    for (const CrackTimeEntry& entry : entries) EXPECT_EQ(QString("Instant"), entry.timeHuman);
}

TEST(CrackTimeEstimatorTest, SaturatesInsteadOfOverflowing) {
    const double seconds = CrackTimeEstimator::secondsToCrack(5000.0, 1.0);
    EXPECT_EQ(DBL_MAX, seconds);
    EXPECT_EQ(QString("Effectively forever (centuries)"), CrackTimeEstimator::formatDuration(seconds));
}

TEST(CrackTimeEstimatorTest, FormatsLargestUnit) {
    EXPECT_EQ(QString("Instant"), CrackTimeEstimator::formatDuration(0.2));
    EXPECT_EQ(QString("30.00 seconds"), CrackTimeEstimator::formatDuration(30.0));
    EXPECT_EQ(QString("2.00 minutes"), CrackTimeEstimator::formatDuration(120.0));
    EXPECT_EQ(QString("3.00 hours"), CrackTimeEstimator::formatDuration(3 * 3600.0));
    EXPECT_EQ(QString("2.00 days"), CrackTimeEstimator::formatDuration(2 * 86400.0));
    EXPECT_EQ(QString("5.00 years"), CrackTimeEstimator::formatDuration(5 * 31536000.0));
    EXPECT_EQ(QString("3.00 centuries"), CrackTimeEstimator::formatDuration(300 * 31536000.0));
    EXPECT_TRUE(CrackTimeEstimator::formatDuration(1e30).endsWith("centuries"));
    EXPECT_TRUE(CrackTimeEstimator::formatDuration(1e30).contains("e+"));
}

TEST(CrackTimeEstimatorTest, StrongPasswordTakesYearsOnArgon2) {
    const QList<CrackTimeEntry> entries = CrackTimeEstimator::estimate(StrengthScorer::score("Tr0ub4dor&3xtra!"));
    const CrackTimeEntry& argon2 = entries.last();
    EXPECT_EQ(HashAlgorithm::Argon2, argon2.algorithm);
    EXPECT_GE(argon2.timeSeconds, 31536000.0);
    EXPECT_TRUE(argon2.timeHuman.contains("centuries") || argon2.timeHuman.contains("years"));
}

TEST(CrackTimeModelTest, RejectsNonDecreasingSpeeds) {
    CrackTimeModel model;
    EXPECT_FALSE(model.setSpeeds({1e3, 1e4, 1e2, 1e1, 1}));
    EXPECT_FALSE(model.setSpeeds({1e3, 1e2, 1e1, 1}));
    EXPECT_FALSE(model.setSpeeds({1e3, 1e2, 1e1, 1, 0}));
    EXPECT_DOUBLE_EQ(EngineConfig::MD5_HASHES_PER_SECOND, model.speed(HashAlgorithm::MD5));
    EXPECT_TRUE(model.setSpeeds({1e5, 1e4, 1e3, 1e2, 1e1}));
    EXPECT_DOUBLE_EQ(1e4, model.speed(HashAlgorithm::MD5));
}

TEST(CrackTimeModelTest, LoadsOverridesFromSettings) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("speeds.ini");
    {
        QSettings settings(path, QSettings::IniFormat);
        settings.beginGroup("attack_speeds");
        settings.setValue("md5", 2e11);
        settings.setValue("argon2", 500.0);
        settings.endGroup();
        settings.sync();
    }

    QSettings settings(path, QSettings::IniFormat);
    CrackTimeModel model;
    ASSERT_TRUE(CrackTimeModel::fromSettings(settings, model));
    EXPECT_DOUBLE_EQ(2e11, model.speed(HashAlgorithm::MD5));
    EXPECT_DOUBLE_EQ(500.0, model.speed(HashAlgorithm::Argon2));
    EXPECT_DOUBLE_EQ(EngineConfig::BCRYPT_HASHES_PER_SECOND, model.speed(HashAlgorithm::Bcrypt));
}

TEST(CrackTimeModelTest, KeepsDefaultsForInvalidSettings) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("bad.ini");
    {
        QSettings settings(path, QSettings::IniFormat);
        settings.setValue("attack_speeds/argon2", 1e20);
        settings.sync();
    }

    QSettings settings(path, QSettings::IniFormat);
    CrackTimeModel model;
    EXPECT_FALSE(CrackTimeModel::fromSettings(settings, model));
    EXPECT_DOUBLE_EQ(EngineConfig::ARGON2_HASHES_PER_SECOND, model.speed(HashAlgorithm::Argon2));
}

} // namespace
