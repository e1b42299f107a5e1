#ifndef PATTERNDETECTOR_H
#define PATTERNDETECTOR_H

#include <QList>
#include <QString>

struct PatternReport {
    bool hasRepeat = false;
    bool hasSequence = false;
    bool hasKeyboardRun = false;
    // One weight in (0,1] per code point of the analysed string.
    QList<double> weights;

    bool hasAny() const { return hasRepeat || hasSequence || hasKeyboardRun; }
    double weightedLength() const;
};

/*
 * Detects predictable runs in a password, case-insensitively:
 *  - repeat:   three or more identical code points ("aaa", "111")
 *  - sequence: three or more letters or digits stepping by +1 or -1 ("abc", "987")
 *  - keyboard: three or more horizontally adjacent keys of one QWERTY row ("qwe", "lkj")
 *
 * Only the code points that extend a run past its second member are discounted,
 * using the fixed weights of EngineConfig. A code point matched by several rules
 * gets the smallest weight. Earlier code points are never re-weighted, so
 * appending characters can only add weight.
 */
class PatternDetector {
public:
    static PatternReport analyze(const QString& password);
};

#endif // PATTERNDETECTOR_H
