#include "passwordservice.h"
#include "algorithmcatalog.h"
#include "commonpasswords.h"
#include "engineconfig.h"
#include "entropyestimator.h"
#include "improvementgenerator.h"
#include "logging.h"
#include "passwordgenerator.h"

#include <QJsonArray>

#include <cmath>

namespace {

QJsonObject strengthToJson(const StrengthResult& strength) {
    QJsonObject charSets;
    charSets["lowercase"] = strength.charSets.hasLowercase;
    charSets["uppercase"] = strength.charSets.hasUppercase;
    charSets["digits"] = strength.charSets.hasDigit;
    charSets["special"] = strength.charSets.hasSpecial;

    QJsonObject patterns;
    patterns["repeat"] = strength.patterns.hasRepeat;
    patterns["sequence"] = strength.patterns.hasSequence;
    patterns["keyboard"] = strength.patterns.hasKeyboardRun;

    QJsonObject json;
    json["score"] = strength.score;
    json["level"] = strength.levelName();
    json["length"] = strength.length;
    json["entropy"] = EntropyEstimator::roundForDisplay(strength.entropyBits);
    json["char_sets"] = charSets;
    json["patterns"] = patterns;
    json["is_common"] = strength.isCommon;
    return json;
}

QString shortenForDisplay(const QString& digest) {
    if (digest.size() <= EngineConfig::HASH_DISPLAY_LIMIT) return digest;
    return digest.left(EngineConfig::HASH_DISPLAY_LIMIT) + "...";
}

bool readBool(const QJsonObject& request, const QString& key, bool& out, EngineError* error) {
    const QJsonValue value = request.value(key);
    if (value.isUndefined() || value.isNull()) return true;
    if (!value.isBool()) return setError(error, EngineError::InvalidSpec, key + " must be a boolean");
    out = value.toBool();
    return true;
}

} // namespace

PasswordService::PasswordService(const CrackTimeModel& model)
    : m_analyzer(model) {}

QStringList PasswordService::operations() {
    return {"analyze", "generate", "improve", "algorithms", "examples", "health"};
}

QJsonObject PasswordService::handle(const QString& operation, const QJsonObject& request) const {
    qCDebug(lcService) << "Handling" << operation;
    if (operation == "analyze") return analyze(request);
    if (operation == "generate") return generate(request);
    if (operation == "improve") return improve(request);
    if (operation == "algorithms") return algorithms();
    if (operation == "examples") return examples();
    if (operation == "health") return health();

    EngineError error;
    setError(&error, EngineError::InvalidInput, "Unknown operation: " + operation);
    return failure(error);
}

QJsonObject PasswordService::success(const QJsonValue& data) {
    QJsonObject envelope;
    envelope["success"] = true;
    envelope["data"] = data;
    return envelope;
}

QJsonObject PasswordService::failure(const EngineError& error) {
    qCInfo(lcService) << "Request failed:" << EngineError::kindToString(error.kind) << error.message;
    QJsonObject envelope;
    envelope["success"] = false;
    envelope["error"] = error.message;
    envelope["kind"] = EngineError::kindToString(error.kind);
    envelope["status"] = EngineError::statusCodeFor(error.kind);
    return envelope;
}

bool PasswordService::passwordFrom(const QJsonObject& request, QString& password, EngineError* error) {
    const QJsonValue value = request.value("password");
    if (!value.isString()) return setError(error, EngineError::InvalidInput, "Password is required");
    password = value.toString();
    if (password.isEmpty()) return setError(error, EngineError::InvalidInput, "Password cannot be empty");
    return true;
}

QJsonObject PasswordService::analyze(const QJsonObject& request) const {
    EngineError error;
    QString password;
    AnalysisReport report;
    if (!passwordFrom(request, password, &error) || !m_analyzer.analyze(password, report, &error))
        return failure(error);

    QJsonArray crackTimes;
    for (const CrackTimeEntry& entry : report.crackTimes) {
        QJsonObject json;
        json["algorithm"] = algorithmKey(entry.algorithm);
        json["time_human"] = entry.timeHuman;
        json["time_seconds"] = entry.timeSeconds;
        json["attack_speed"] = entry.attackSpeedHashesPerSecond;
        crackTimes.append(json);
    }

    QJsonObject hashes;
    QJsonObject notes;
    for (const HashDigest& digest : report.hashes.digests) {
        hashes[algorithmKey(digest.algorithm)] = shortenForDisplay(digest.digest);
        notes[algorithmKey(digest.algorithm)] = digest.note;
    }
    QJsonArray unavailable;
    for (HashAlgorithm algorithm : report.hashes.unavailable) unavailable.append(algorithmKey(algorithm));

    QJsonObject data;
    data["strength"] = strengthToJson(report.strength);
    data["crack_times"] = crackTimes;
    data["suggestions"] = QJsonArray::fromStringList(SuggestionEngine::toStrings(report.suggestions));
    data["hashes"] = hashes;
    data["hash_notes"] = notes;
    data["unavailable_hashes"] = unavailable;
    return success(data);
}

QJsonObject PasswordService::generate(const QJsonObject& request) const {
    EngineError error;
    GenerationSpec spec;

    const QJsonValue length = request.value("length");
    if (!length.isUndefined() && !length.isNull()) {
        const double value = length.toDouble();
        if (!length.isDouble() || std::trunc(value) != value) {
            setError(&error, EngineError::InvalidSpec, "length must be an integer");
            return failure(error);
        }
        // Values beyond int range still get the generator's range error.
        if (value < EngineConfig::MIN_GENERATED_LENGTH) spec.length = EngineConfig::MIN_GENERATED_LENGTH - 1;
        else if (value > EngineConfig::MAX_GENERATED_LENGTH) spec.length = EngineConfig::MAX_GENERATED_LENGTH + 1;
        else spec.length = static_cast<int>(value);
    }
    if (!readBool(request, "include_lowercase", spec.includeLowercase, &error)
        || !readBool(request, "include_uppercase", spec.includeUppercase, &error)
        || !readBool(request, "include_digits", spec.includeDigits, &error)
        || !readBool(request, "include_special", spec.includeSpecial, &error))
        return failure(error);

    const QString password = PasswordGenerator::generate(spec, &error);
    if (error.isError()) return failure(error);

    const StrengthResult strength = StrengthScorer::score(password);
    QJsonObject data;
    data["password"] = password;
    data["score"] = strength.score;
    data["level"] = strength.levelName();
    data["length"] = strength.length;
    data["entropy"] = EntropyEstimator::roundForDisplay(strength.entropyBits);
    return success(data);
}

QJsonObject PasswordService::improve(const QJsonObject& request) const {
    EngineError error;
    QString password;
    if (!passwordFrom(request, password, &error)) return failure(error);

    const QList<ImprovementCandidate> candidates = ImprovementGenerator::improve(password, &error);
    if (error.isError()) return failure(error);

    QJsonArray improvements;
    for (const ImprovementCandidate& candidate : candidates) {
        QJsonObject json;
        json["password"] = candidate.password;
        json["score"] = candidate.score;
        json["level"] = StrengthScorer::levelToString(candidate.level);
        json["length"] = codePointLength(candidate.password);
        json["strategy"] = candidate.strategy;
        json["description"] = candidate.description;
        improvements.append(json);
    }

    QJsonObject data;
    data["original"] = password;
    data["improvements"] = improvements;
    return success(data);
}

QJsonObject PasswordService::algorithms() const {
    QJsonArray list;
    for (const AlgorithmInfo& info : AlgorithmCatalog::algorithms()) {
        QJsonObject json;
        json["name"] = info.name;
        json["year"] = info.year;
        json["status"] = info.status;
        json["speed"] = info.speed;
        json["description"] = info.description;
        json["use_case"] = info.useCase;
        json["attack_speed"] = m_analyzer.crackTimeModel().speed(info.algorithm);
        if (info.algorithm == HashAlgorithm::Argon2 || info.algorithm == HashAlgorithm::Bcrypt)
            json["available"] = HashDemonstrator::isAvailable(info.algorithm);
        list.append(json);
    }
    return success(list);
}

QJsonObject PasswordService::examples() const {
    QJsonArray list;
    for (const ExamplePassword& example : AlgorithmCatalog::examples()) {
        QJsonObject json;
        json["password"] = example.password;
        json["description"] = example.description;
        json["expected_score"] = example.expectedScore;
        list.append(json);
    }
    return success(list);
}

QJsonObject PasswordService::health() const {
    QJsonObject data;
    const bool blocklistLoaded = CommonPasswords::isLoaded();
    data["status"] = blocklistLoaded ? QString("healthy") : QString("degraded");
    data["argon2_available"] = HashDemonstrator::isAvailable(HashAlgorithm::Argon2);
    data["bcrypt_available"] = HashDemonstrator::isAvailable(HashAlgorithm::Bcrypt);
    data["blocklist_loaded"] = blocklistLoaded;
    return success(data);
}
