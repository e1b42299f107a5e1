#include "strengthscorer.h"
#include "commonpasswords.h"
#include "engineconfig.h"
#include "entropyestimator.h"

#include <QtGlobal>

StrengthResult StrengthScorer::score(const QString& password, EngineError* error) {
    if (password.isNull()) {
        setError(error, EngineError::InvalidInput, "Password is required");
        return StrengthResult();
    }
    clearError(error);

    const CharacterSetProfile charSets = CharacterSetProfile::classify(password);
    const PatternReport patterns = PatternDetector::analyze(password);
    const double entropyBits = EntropyEstimator::estimate(charSets, patterns);
    const bool isCommon = CommonPasswords::contains(password);

    return evaluate(codePointLength(password), charSets, entropyBits, isCommon, patterns);
}

StrengthResult StrengthScorer::evaluate(int length,
                                        const CharacterSetProfile& charSets,
                                        double entropyBits,
                                        bool isCommon,
                                        const PatternReport& patterns) {
    const int classes = charSets.classCount();

    int points = lengthPoints(length)
                 + diversityPoints(classes)
                 + entropyPoints(entropyBits)
                 + bestPracticePoints(length, classes, patterns.hasRepeat);

    if (isCommon) points -= EngineConfig::COMMON_PASSWORD_PENALTY;
    if (patterns.hasAny()) points -= EngineConfig::PATTERN_PENALTY;

    StrengthResult result;
    result.score = qBound(0, points, 100);
    result.level = levelForScore(result.score);
    result.length = length;
    result.entropyBits = entropyBits;
    result.charSets = charSets;
    result.isCommon = isCommon;
    result.patterns = patterns;
    return result;
}

int StrengthScorer::lengthPoints(int length) {
    if (length >= 16) return EngineConfig::LENGTH_POINTS_16;
    if (length >= 12) return EngineConfig::LENGTH_POINTS_12;
    if (length >= 8) return EngineConfig::LENGTH_POINTS_8;
    if (length >= 6) return EngineConfig::LENGTH_POINTS_6;
    return 0;
}

int StrengthScorer::diversityPoints(int classCount) {
    return EngineConfig::DIVERSITY_POINTS[qBound(0, classCount, 4)];
}

int StrengthScorer::entropyPoints(double entropyBits) {
    if (entropyBits >= EngineConfig::ENTROPY_BITS_HIGH) return EngineConfig::ENTROPY_POINTS_HIGH;
    if (entropyBits >= EngineConfig::ENTROPY_BITS_GOOD) return EngineConfig::ENTROPY_POINTS_GOOD;
    if (entropyBits >= EngineConfig::ENTROPY_BITS_FAIR) return EngineConfig::ENTROPY_POINTS_FAIR;
    if (entropyBits >= EngineConfig::ENTROPY_BITS_LOW) return EngineConfig::ENTROPY_POINTS_LOW;
    return 0;
}

int StrengthScorer::bestPracticePoints(int length, int classCount, bool hasRepeat) {
    if (length == 0) return 0;
    int points = 0;
    if (length >= EngineConfig::BEST_PRACTICE_MIN_LENGTH && classCount >= EngineConfig::BEST_PRACTICE_MIN_CLASSES)
        points += EngineConfig::BEST_PRACTICE_POINTS;
    if (!hasRepeat) points += EngineConfig::NO_REPEAT_POINTS;
    return points;
}

StrengthScorer::Level StrengthScorer::levelForScore(int score) {
    if (score >= EngineConfig::VERY_STRONG_THRESHOLD) return VERY_STRONG;
    if (score >= EngineConfig::STRONG_THRESHOLD) return STRONG;
    if (score >= EngineConfig::MODERATE_THRESHOLD) return MODERATE;
    if (score >= EngineConfig::WEAK_THRESHOLD) return WEAK;
    return VERY_WEAK;
}

QString StrengthScorer::levelToString(StrengthScorer::Level level) {
    switch (level) {
    case VERY_WEAK: return "Very Weak";
    case WEAK: return "Weak";
    case MODERATE: return "Moderate";
    case STRONG: return "Strong";
    case VERY_STRONG: return "Very Strong";
    default: return "Unknown";
    }
}
