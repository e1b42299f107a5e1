#include "entropyestimator.h"

#include <cmath>

double EntropyEstimator::estimate(const CharacterSetProfile& profile, const PatternReport& patterns) {
    const int alphabetSize = profile.alphabetSize();
    if (alphabetSize <= 1 || patterns.weights.isEmpty()) return 0.0;
    return std::log2(static_cast<double>(alphabetSize)) * patterns.weightedLength();
}

double EntropyEstimator::estimate(const QString& password) {
    return estimate(CharacterSetProfile::classify(password), PatternDetector::analyze(password));
}

double EntropyEstimator::roundForDisplay(double bits) {
    return std::round(bits * 100.0) / 100.0;
}
