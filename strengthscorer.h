#ifndef STRENGTHSCORER_H
#define STRENGTHSCORER_H

#include "charsetprofile.h"
#include "engineerror.h"
#include "patterndetector.h"

#include <QString>

struct StrengthResult;

class StrengthScorer {
public:
    enum Level {
        VERY_WEAK,
        WEAK,
        MODERATE,
        STRONG,
        VERY_STRONG
    };

    // Full pipeline: classify, detect patterns, estimate entropy, check the
    // blocklist, then score. A null string fails with InvalidInput.
    static StrengthResult score(const QString& password, EngineError* error = nullptr);

    static StrengthResult evaluate(int length,
                                   const CharacterSetProfile& charSets,
                                   double entropyBits,
                                   bool isCommon,
                                   const PatternReport& patterns);

    static int lengthPoints(int length);
    static int diversityPoints(int classCount);
    static int entropyPoints(double entropyBits);
    static int bestPracticePoints(int length, int classCount, bool hasRepeat);

    static Level levelForScore(int score);
    static QString levelToString(Level level);
};

struct StrengthResult {
    int score = 0;
    StrengthScorer::Level level = StrengthScorer::VERY_WEAK;
    int length = 0;
    double entropyBits = 0.0;
    CharacterSetProfile charSets;
    bool isCommon = false;
    PatternReport patterns;

    QString levelName() const { return StrengthScorer::levelToString(level); }
};

#endif // STRENGTHSCORER_H
