#ifndef IMPROVEMENTGENERATOR_H
#define IMPROVEMENTGENERATOR_H

#include "engineerror.h"
#include "strengthscorer.h"

#include <QList>
#include <QString>

struct ImprovementCandidate {
    QString password;
    int score = 0;
    StrengthScorer::Level level = StrengthScorer::VERY_WEAK;
    QString strategy;
    QString description;
};

/*
 * Builds stronger variants of a password:
 *  - one extra character for each class the password lacks
 *  - extension to EngineConfig::IMPROVEMENT_TARGET_LENGTH with random characters
 *  - leetspeak substitution (a->@ e->3 i->! o->0 s->$ t->7)
 *  - capitalised first letter
 *  - passphrase wrap, "Word-<password>-NNN!"
 *  - two combinations: leetspeak + extension, missing classes + extension
 *
 * Every variant is re-scored with StrengthScorer. Variants that equal the
 * original or score below it are dropped, duplicates keep their first
 * occurrence, and the rest are ordered by descending score (stable).
 */
class ImprovementGenerator {
public:
    static QList<ImprovementCandidate> improve(const QString& password, EngineError* error = nullptr);

    static QString leetspeak(const QString& password);
};

#endif // IMPROVEMENTGENERATOR_H
