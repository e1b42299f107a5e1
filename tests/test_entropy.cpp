#include "entropyestimator.h"
#include "patterndetector.h"

#include <gtest/gtest.h>

#include <cmath>

namespace {

TEST(PatternDetectorTest, PlainTextHasNoPatterns) {
    const PatternReport report = PatternDetector::analyze("Monkey2019");
    EXPECT_FALSE(report.hasAny());
    EXPECT_DOUBLE_EQ(10.0, report.weightedLength());
}

TEST(PatternDetectorTest, DetectsRepeatRuns) {
    EXPECT_FALSE(PatternDetector::analyze("aab").hasRepeat);

    const PatternReport report = PatternDetector::analyze("xaaay");
    EXPECT_TRUE(report.hasRepeat);
    ASSERT_EQ(5, report.weights.size());
    EXPECT_DOUBLE_EQ(1.0, report.weights.at(1));
    EXPECT_DOUBLE_EQ(1.0, report.weights.at(2));
    EXPECT_DOUBLE_EQ(0.20, report.weights.at(3));
    EXPECT_DOUBLE_EQ(1.0, report.weights.at(4));
}

TEST(PatternDetectorTest, DetectsAscendingAndDescendingSequences) {
    EXPECT_TRUE(PatternDetector::analyze("xabc").hasSequence);
    EXPECT_TRUE(PatternDetector::analyze("CBA").hasSequence);
    EXPECT_TRUE(PatternDetector::analyze("987").hasSequence);
    EXPECT_FALSE(PatternDetector::analyze("ab9").hasSequence);
    EXPECT_FALSE(PatternDetector::analyze("aca").hasSequence);
    // Direction change restarts the run.
    EXPECT_FALSE(PatternDetector::analyze("aba").hasSequence);
}

TEST(PatternDetectorTest, DetectsKeyboardRuns) {
    EXPECT_TRUE(PatternDetector::analyze("qwe").hasKeyboardRun);
    EXPECT_TRUE(PatternDetector::analyze("LKJ").hasKeyboardRun);
    EXPECT_TRUE(PatternDetector::analyze("zxcvbnm").hasKeyboardRun);
    EXPECT_FALSE(PatternDetector::analyze("qaz").hasKeyboardRun);
    EXPECT_FALSE(PatternDetector::analyze("qwe").hasSequence);
}

TEST(PatternDetectorTest, OverlappingRulesTakeSmallestWeight) {
    // "123" is both a sequence and a keyboard run.
    const PatternReport report = PatternDetector::analyze("123");
    EXPECT_TRUE(report.hasSequence);
    EXPECT_TRUE(report.hasKeyboardRun);
    EXPECT_DOUBLE_EQ(0.30, report.weights.at(2));
}

TEST(EntropyEstimatorTest, EmptyInputIsZero) {
    EXPECT_DOUBLE_EQ(0.0, EntropyEstimator::estimate(QString()));
    EXPECT_DOUBLE_EQ(0.0, EntropyEstimator::estimate(QString(QChar(0x01))));
}

TEST(EntropyEstimatorTest, LengthTimesLog2Alphabet) {
    EXPECT_NEAR(8 * std::log2(26.0), EntropyEstimator::estimate("password"), 1e-9);
    EXPECT_NEAR(10 * std::log2(94.0), EntropyEstimator::estimate("MyP@ssw0rd"), 1e-9);
}

TEST(EntropyEstimatorTest, PatternsReduceEntropy) {
    EXPECT_LT(EntropyEstimator::estimate("abcdef"), EntropyEstimator::estimate("axbycz"));
    EXPECT_LT(EntropyEstimator::estimate("aaaaaa"), EntropyEstimator::estimate("abacad"));
}

TEST(EntropyEstimatorTest, NonDecreasingWhenAppending) {
    const QStringList seeds = {"aB3!", "abc", "aaaa", "qwerty123", "Tr0ub4dor&3xtra!", "zz9"};
    for (const QString& seed : seeds) {
        QString text;
        double previous = 0.0;
        for (int i = 0; i < 40; ++i) {
            text.append(seed.at(i % seed.size()));
            if (text.size() < seed.size()) continue;
            const double bits = EntropyEstimator::estimate(text);
            EXPECT_GE(bits, previous) << "seed index " << i;
            previous = bits;
        }
    }
}

TEST(EntropyEstimatorTest, RoundsToTwoDecimals) {
    EXPECT_DOUBLE_EQ(37.6, EntropyEstimator::roundForDisplay(37.6035));
    EXPECT_DOUBLE_EQ(65.55, EntropyEstimator::roundForDisplay(65.5459));
}

} // namespace
