#include "patterndetector.h"
#include "engineconfig.h"

#include <QChar>

#include <algorithm>
#include <cstring>

namespace {

const char* const KEYBOARD_ROWS[] = {
    "1234567890",
    "qwertyuiop",
    "asdfghjkl",
    "zxcvbnm"
};

bool keyboardPosition(uint cp, int& row, int& column) {
    if (cp == 0 || cp > 0x7f) return false;
    for (int r = 0; r < 4; ++r) {
        const char* hit = std::strchr(KEYBOARD_ROWS[r], static_cast<int>(cp));
        if (hit) {
            row = r;
            column = static_cast<int>(hit - KEYBOARD_ROWS[r]);
            return true;
        }
    }
    return false;
}

bool isAsciiLetter(uint cp) { return cp >= 'a' && cp <= 'z'; }
bool isAsciiDigit(uint cp) { return cp >= '0' && cp <= '9'; }

bool sameSequenceGroup(uint a, uint b) {
    return (isAsciiLetter(a) && isAsciiLetter(b)) || (isAsciiDigit(a) && isAsciiDigit(b));
}

// Tracks a directional run (sequence or keyboard). Returns the new run length.
int extendRun(int step, int& run, int& direction) {
    if (step == 1 || step == -1) {
        if (run >= 2 && step == direction) {
            ++run;
        } else {
            run = 2;
            direction = step;
        }
    } else {
        run = 1;
        direction = 0;
    }
    return run;
}

} // namespace

double PatternReport::weightedLength() const {
    double total = 0.0;
    for (double w : weights) total += w;
    return total;
}

PatternReport PatternDetector::analyze(const QString& password) {
    PatternReport report;

    QList<uint> cps = password.toUcs4();
    for (uint& cp : cps) cp = QChar::toLower(cp);

    report.weights = QList<double>(cps.size(), 1.0);

    int repeatRun = 1;
    int sequenceRun = 1;
    int sequenceDirection = 0;
    int keyboardRun = 1;
    int keyboardDirection = 0;

    for (qsizetype i = 1; i < cps.size(); ++i) {
        const uint prev = cps.at(i - 1);
        const uint cur = cps.at(i);
        double& weight = report.weights[i];

        repeatRun = (cur == prev) ? repeatRun + 1 : 1;
        if (repeatRun >= EngineConfig::MIN_PATTERN_RUN) {
            report.hasRepeat = true;
            weight = std::min(weight, EngineConfig::REPEAT_WEIGHT);
        }

        const int sequenceStep = sameSequenceGroup(prev, cur)
                                     ? static_cast<int>(cur) - static_cast<int>(prev) : 0;
        if (extendRun(sequenceStep, sequenceRun, sequenceDirection) >= EngineConfig::MIN_PATTERN_RUN) {
            report.hasSequence = true;
            weight = std::min(weight, EngineConfig::SEQUENCE_WEIGHT);
        }

        int prevRow = -1, prevColumn = -1, curRow = -1, curColumn = -1;
        int keyboardStep = 0;
        if (keyboardPosition(prev, prevRow, prevColumn) && keyboardPosition(cur, curRow, curColumn)
            && prevRow == curRow) {
            keyboardStep = curColumn - prevColumn;
        }
        if (extendRun(keyboardStep, keyboardRun, keyboardDirection) >= EngineConfig::MIN_PATTERN_RUN) {
            report.hasKeyboardRun = true;
            weight = std::min(weight, EngineConfig::KEYBOARD_WEIGHT);
        }
    }

    return report;
}
