#include "improvementgenerator.h"
#include "charsetprofile.h"
#include "engineconfig.h"
#include "logging.h"
#include "passwordgenerator.h"
#include "securerandom.h"

#include <QHash>
#include <QSet>
#include <QStringList>

#include <algorithm>

namespace {

struct Variant {
    QString password;
    QString strategy;
    QString description;
};

bool appendRandom(QString& text, const QString& pool, int count) {
    QChar ch;
    for (int i = 0; i < count; ++i) {
        if (!SecureRandom::pick(pool, ch)) return false;
        text.append(ch);
    }
    return true;
}

bool extendTo(QString& text, int targetLength) {
    static const QString ALL = PasswordGenerator::LOWERCASE + PasswordGenerator::UPPERCASE
                               + PasswordGenerator::DIGITS + PasswordGenerator::SPECIAL;
    const int missing = targetLength - codePointLength(text);
    return missing <= 0 || appendRandom(text, ALL, missing);
}

bool appendMissingClasses(QString& text, const CharacterSetProfile& profile) {
    if (!profile.hasLowercase && !appendRandom(text, PasswordGenerator::LOWERCASE, 1)) return false;
    if (!profile.hasUppercase && !appendRandom(text, PasswordGenerator::UPPERCASE, 1)) return false;
    if (!profile.hasDigit && !appendRandom(text, PasswordGenerator::DIGITS, 1)) return false;
    if (!profile.hasSpecial && !appendRandom(text, PasswordGenerator::SPECIAL, 1)) return false;
    return true;
}

bool collectVariants(const QString& original, QList<Variant>& variants) {
    const CharacterSetProfile profile = CharacterSetProfile::classify(original);
    const int target = EngineConfig::IMPROVEMENT_TARGET_LENGTH;

    struct MissingClass {
        bool missing;
        const QString& pool;
        const char* strategy;
        const char* description;
    };
    const MissingClass classes[] = {
        {!profile.hasLowercase, PasswordGenerator::LOWERCASE, "Added lowercase", "Appended a random lowercase letter"},
        {!profile.hasUppercase, PasswordGenerator::UPPERCASE, "Added uppercase", "Appended a random uppercase letter"},
        {!profile.hasDigit, PasswordGenerator::DIGITS, "Added number", "Appended a random digit"},
        {!profile.hasSpecial, PasswordGenerator::SPECIAL, "Added special character", "Increased complexity with a symbol"},
    };
    for (const MissingClass& mc : classes) {
        if (!mc.missing) continue;
        QString candidate = original;
        if (!appendRandom(candidate, mc.pool, 1)) return false;
        variants.append({candidate, mc.strategy, mc.description});
    }

    if (codePointLength(original) < target) {
        QString candidate = original;
        if (!extendTo(candidate, target)) return false;
        variants.append({candidate, "Extended length",
                         QString("Extended to %1 characters").arg(codePointLength(candidate))});
    }

    const QString leet = ImprovementGenerator::leetspeak(original);
    if (leet != original)
        variants.append({leet, "Character substitution", "Replaced letters with numbers and symbols"});

    if (!profile.hasUppercase && !original.isEmpty() && original.at(0).isLower()) {
        QString candidate = original;
        candidate[0] = candidate.at(0).toUpper();
        variants.append({candidate, "Capitalised", "Capitalised the first letter"});
    }

    if (codePointLength(original) > 3) {
        static const QStringList WORDS = {"Secure", "Strong", "Private", "Safe"};
        quint32 word = 0;
        quint32 number = 0;
        if (!SecureRandom::bounded(static_cast<quint32>(WORDS.size()), word)
            || !SecureRandom::bounded(900, number))
            return false;
        const QString candidate = QString("%1-%2-%3!").arg(WORDS.at(word), original, QString::number(100 + number));
        variants.append({candidate, "Passphrase creation", "Wrapped into a memorable passphrase"});
    }

    {
        QString candidate = leet;
        if (!extendTo(candidate, target)) return false;
        variants.append({candidate, "Substitution and extension",
                         QString("Substituted characters and extended to %1 characters").arg(codePointLength(candidate))});
    }

    {
        QString candidate = original;
        if (!appendMissingClasses(candidate, profile) || !extendTo(candidate, target)) return false;
        variants.append({candidate, "Complexity and extension",
                         QString("Added every missing character type and extended to %1 characters")
                             .arg(codePointLength(candidate))});
    }

    return true;
}

} // namespace

QString ImprovementGenerator::leetspeak(const QString& password) {
    static const QHash<QChar, QChar> LEET = {
        {'a', '@'}, {'e', '3'}, {'i', '!'}, {'o', '0'}, {'s', '$'}, {'t', '7'}
    };
    QString out = password;
    for (QChar& ch : out) {
        const auto it = LEET.constFind(ch.toLower());
        if (it != LEET.constEnd()) ch = it.value();
    }
    return out;
}

QList<ImprovementCandidate> ImprovementGenerator::improve(const QString& password, EngineError* error) {
    if (password.isEmpty()) {
        setError(error, EngineError::InvalidInput, "Password cannot be empty");
        return {};
    }

    QList<Variant> variants;
    if (!collectVariants(password, variants)) {
        setError(error, EngineError::BackendUnavailable, "Secure random source failed");
        return {};
    }
    clearError(error);

    const int originalScore = StrengthScorer::score(password).score;

    QList<ImprovementCandidate> candidates;
    QSet<QString> seen;
    for (const Variant& v : variants) {
        if (v.password == password || seen.contains(v.password)) continue;
        seen.insert(v.password);

        const StrengthResult strength = StrengthScorer::score(v.password);
        if (strength.score < originalScore) continue;

        ImprovementCandidate candidate;
        candidate.password = v.password;
        candidate.score = strength.score;
        candidate.level = strength.level;
        candidate.strategy = v.strategy;
        candidate.description = v.description;
        candidates.append(candidate);
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const ImprovementCandidate& a, const ImprovementCandidate& b) { return a.score > b.score; });
    if (candidates.size() > EngineConfig::MAX_IMPROVEMENTS)
        candidates.resize(EngineConfig::MAX_IMPROVEMENTS);

    qCDebug(lcEngine) << "Produced" << candidates.size() << "improvements out of" << variants.size() << "variants";
    return candidates;
}
