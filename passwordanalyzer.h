#ifndef PASSWORDANALYZER_H
#define PASSWORDANALYZER_H

#include "cracktimeestimator.h"
#include "engineerror.h"
#include "hashdemonstrator.h"
#include "strengthscorer.h"
#include "suggestionengine.h"

#include <QList>
#include <QString>

struct AnalysisReport {
    StrengthResult strength;
    QList<CrackTimeEntry> crackTimes;
    QList<Suggestion> suggestions;
    HashDemonstration hashes;
};

class PasswordAnalyzer {
public:
    explicit PasswordAnalyzer(const CrackTimeModel& model = CrackTimeModel());

    // Empty or null input fails with InvalidInput. Missing hash backends do not
    // fail the analysis; they are listed in hashes.unavailable.
    bool analyze(const QString& password, AnalysisReport& report, EngineError* error = nullptr) const;

    const CrackTimeModel& crackTimeModel() const { return m_model; }

private:
    CrackTimeModel m_model;
};

#endif // PASSWORDANALYZER_H
