#include "passwordanalyzer.h"
#include "logging.h"

PasswordAnalyzer::PasswordAnalyzer(const CrackTimeModel& model)
    : m_model(model) {}

bool PasswordAnalyzer::analyze(const QString& password, AnalysisReport& report, EngineError* error) const {
    if (password.isEmpty())
        return setError(error, EngineError::InvalidInput, "Password cannot be empty");

    report.strength = StrengthScorer::score(password, error);
    if (error && error->isError()) return false;

    report.crackTimes = CrackTimeEstimator::estimate(report.strength, m_model);
    report.suggestions = SuggestionEngine::suggest(password, report.strength);
    report.hashes = HashDemonstrator::demonstrate(password);

    qCDebug(lcEngine) << "Analyzed password of length" << report.strength.length
                      << "score" << report.strength.score
                      << "hash backends missing" << report.hashes.unavailable.size();
    clearError(error);
    return true;
}
