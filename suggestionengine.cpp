#include "suggestionengine.h"
#include "engineconfig.h"
#include "strengthscorer.h"

#include <QChar>
#include <QStringList>

namespace {

bool isSingleWord(const QString& password) {
    if (codePointLength(password) < 4) return false;
    const QList<uint> codePoints = password.toUcs4();
    for (uint cp : codePoints) {
        if (!QChar::isLetter(cp)) return false;
    }
    return true;
}

void add(QList<Suggestion>& out, Suggestion::Severity severity, const QString& text) {
    Suggestion s;
    s.severity = severity;
    s.text = Suggestion::marker(severity) + " " + text;
    out.append(s);
}

} // namespace

QString Suggestion::marker(Suggestion::Severity severity) {
    switch (severity) {
    case CRITICAL: return "CRITICAL:";
    case WARNING: return "WARNING:";
    case GOOD_PRACTICE: return "TIP:";
    case NEUTRAL: return "OK:";
    default: return "";
    }
}

QList<Suggestion> SuggestionEngine::suggest(const QString& password, const StrengthResult& strength) {
    QList<Suggestion> out;

    if (strength.isCommon)
        add(out, Suggestion::CRITICAL, "This is a commonly used password! Change it immediately.");

    const CharacterSetProfile& sets = strength.charSets;
    if (!sets.hasLowercase) add(out, Suggestion::WARNING, "Add lowercase letters (a-z).");
    if (!sets.hasUppercase) add(out, Suggestion::WARNING, "Add uppercase letters (A-Z).");
    if (!sets.hasDigit) add(out, Suggestion::WARNING, "Add numbers (0-9).");
    if (!sets.hasSpecial) add(out, Suggestion::WARNING, "Add special characters (!@#$%^&*).");

    if (strength.length < EngineConfig::MIN_RECOMMENDED_LENGTH) {
        add(out, Suggestion::WARNING,
            QString("Increase length to at least %1 characters (current: %2).")
                .arg(EngineConfig::MIN_RECOMMENDED_LENGTH).arg(strength.length));
    } else if (strength.length < EngineConfig::GOOD_LENGTH) {
        add(out, Suggestion::GOOD_PRACTICE,
            QString("Consider %1+ characters for better security (current: %2).")
                .arg(EngineConfig::GOOD_LENGTH).arg(strength.length));
    }

    if (strength.patterns.hasSequence || strength.patterns.hasKeyboardRun)
        add(out, Suggestion::WARNING, "Avoid predictable patterns (abc, 123, keyboard rows like qwerty).");
    if (strength.patterns.hasRepeat)
        add(out, Suggestion::WARNING, "Avoid repeating the same character several times in a row.");

    if (isSingleWord(password))
        add(out, Suggestion::GOOD_PRACTICE, "Avoid single dictionary words; use a passphrase or random characters.");

    if (!out.isEmpty()) {
        add(out, Suggestion::GOOD_PRACTICE, "Use a passphrase, e.g. 'Correct-Horse-Battery-Staple-2024!'.");
        add(out, Suggestion::GOOD_PRACTICE, "Use a password manager to generate and store strong passwords.");
        add(out, Suggestion::GOOD_PRACTICE, "Never reuse passwords across different accounts.");
    } else if (strength.level == StrengthScorer::VERY_STRONG) {
        add(out, Suggestion::NEUTRAL, "Excellent password! Keep this security level for all accounts.");
    }

    return out;
}

QStringList SuggestionEngine::toStrings(const QList<Suggestion>& suggestions) {
    QStringList texts;
    for (const Suggestion& s : suggestions) texts.append(s.text);
    return texts;
}
