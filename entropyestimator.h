#ifndef ENTROPYESTIMATOR_H
#define ENTROPYESTIMATOR_H

#include "charsetprofile.h"
#include "patterndetector.h"

#include <QString>

class EntropyEstimator {
public:
    // log2(alphabetSize) per code point, discounted by the pattern weights.
    static double estimate(const CharacterSetProfile& profile, const PatternReport& patterns);
    static double estimate(const QString& password);

    static double roundForDisplay(double bits);
};

#endif // ENTROPYESTIMATOR_H
