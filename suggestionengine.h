#ifndef SUGGESTIONENGINE_H
#define SUGGESTIONENGINE_H

#include <QList>
#include <QString>
#include <QStringList>

struct StrengthResult;

struct Suggestion {
    enum Severity {
        CRITICAL,
        WARNING,
        GOOD_PRACTICE,
        NEUTRAL
    };

    Severity severity = NEUTRAL;
    QString text;

    static QString marker(Severity severity);
};

class SuggestionEngine {
public:
    // Rules run in a fixed order and never suppress each other. The positive
    // acknowledgement only appears when no other rule fired.
    static QList<Suggestion> suggest(const QString& password, const StrengthResult& strength);
    static QStringList toStrings(const QList<Suggestion>& suggestions);
};

#endif // SUGGESTIONENGINE_H
