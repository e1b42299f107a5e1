#include "cracktimeestimator.h"
#include "engineconfig.h"
#include "logging.h"
#include "strengthscorer.h"

#include <QSettings>

#include <cfloat>
#include <cmath>

namespace {

const double SECONDS_PER_MINUTE = 60.0;
const double SECONDS_PER_HOUR = 3600.0;
const double SECONDS_PER_DAY = 86400.0;
const double SECONDS_PER_YEAR = 31536000.0;
const double SECONDS_PER_CENTURY = SECONDS_PER_YEAR * 100.0;
const double SCIENTIFIC_CENTURIES = 1e6;

} // namespace

QString algorithmKey(HashAlgorithm algorithm) {
    switch (algorithm) {
    case HashAlgorithm::PlainText: return "plaintext";
    case HashAlgorithm::MD5: return "md5";
    case HashAlgorithm::SHA256: return "sha256";
    case HashAlgorithm::Bcrypt: return "bcrypt";
    case HashAlgorithm::Argon2: return "argon2";
    }
    return "unknown";
}

QList<HashAlgorithm> allAlgorithms() {
    return {HashAlgorithm::PlainText, HashAlgorithm::MD5, HashAlgorithm::SHA256,
            HashAlgorithm::Bcrypt, HashAlgorithm::Argon2};
}

CrackTimeModel::CrackTimeModel()
    : m_speeds{EngineConfig::PLAINTEXT_HASHES_PER_SECOND,
               EngineConfig::MD5_HASHES_PER_SECOND,
               EngineConfig::SHA256_HASHES_PER_SECOND,
               EngineConfig::BCRYPT_HASHES_PER_SECOND,
               EngineConfig::ARGON2_HASHES_PER_SECOND} {}

double CrackTimeModel::speed(HashAlgorithm algorithm) const {
    return m_speeds.at(static_cast<int>(algorithm));
}

bool CrackTimeModel::setSpeeds(const QList<double>& speeds) {
    if (speeds.size() != m_speeds.size()) return false;
    for (qsizetype i = 0; i < speeds.size(); ++i) {
        if (!(speeds.at(i) > 0.0) || !std::isfinite(speeds.at(i))) return false;
        if (i > 0 && !(speeds.at(i) < speeds.at(i - 1))) return false;
    }
    m_speeds = speeds;
    return true;
}

bool CrackTimeModel::fromSettings(QSettings& settings, CrackTimeModel& model) {
    QList<double> speeds;
    settings.beginGroup("attack_speeds");
    for (HashAlgorithm algorithm : allAlgorithms()) {
        const QString key = algorithmKey(algorithm);
        bool ok = true;
        const double value = settings.contains(key) ? settings.value(key).toDouble(&ok)
                                                    : model.speed(algorithm);
        if (!ok) {
            qCWarning(lcEngine) << "Attack speed for" << key << "is not a number";
            settings.endGroup();
            return false;
        }
        speeds.append(value);
    }
    settings.endGroup();

    if (!model.setSpeeds(speeds)) {
        qCWarning(lcEngine) << "Attack speeds must be positive and strictly decreasing; keeping defaults";
        return false;
    }
    return true;
}

QList<CrackTimeEntry> CrackTimeEstimator::estimate(const StrengthResult& strength, const CrackTimeModel& model) {
    return estimate(strength.isCommon ? 0.0 : strength.entropyBits, model);
}

QList<CrackTimeEntry> CrackTimeEstimator::estimate(double keyspaceBits, const CrackTimeModel& model) {
    QList<CrackTimeEntry> entries;
    for (HashAlgorithm algorithm : allAlgorithms()) {
        CrackTimeEntry entry;
        entry.algorithm = algorithm;
        entry.attackSpeedHashesPerSecond = model.speed(algorithm);
        entry.timeSeconds = secondsToCrack(keyspaceBits, entry.attackSpeedHashesPerSecond);
        entry.timeHuman = formatDuration(entry.timeSeconds);
        entries.append(entry);
    }
    return entries;
}

double CrackTimeEstimator::secondsToCrack(double keyspaceBits, double hashesPerSecond) {
    if (keyspaceBits < 0.0) keyspaceBits = 0.0;
    // log2(2^bits / (2 * speed))
    const double log2Seconds = keyspaceBits - 1.0 - std::log2(hashesPerSecond);
    if (log2Seconds >= std::log2(DBL_MAX)) return DBL_MAX;
    return std::exp2(log2Seconds);
}

QString CrackTimeEstimator::formatDuration(double seconds) {
    if (!std::isfinite(seconds) || seconds >= DBL_MAX) return "Effectively forever (centuries)";
    if (seconds < 1.0) return "Instant";
    if (seconds < SECONDS_PER_MINUTE) return QString("%1 seconds").arg(seconds, 0, 'f', 2);
    if (seconds < SECONDS_PER_HOUR) return QString("%1 minutes").arg(seconds / SECONDS_PER_MINUTE, 0, 'f', 2);
    if (seconds < SECONDS_PER_DAY) return QString("%1 hours").arg(seconds / SECONDS_PER_HOUR, 0, 'f', 2);
    if (seconds < SECONDS_PER_YEAR) return QString("%1 days").arg(seconds / SECONDS_PER_DAY, 0, 'f', 2);
    if (seconds < SECONDS_PER_CENTURY) return QString("%1 years").arg(seconds / SECONDS_PER_YEAR, 0, 'f', 2);

    const double centuries = seconds / SECONDS_PER_CENTURY;
    if (centuries < SCIENTIFIC_CENTURIES) return QString("%1 centuries").arg(centuries, 0, 'f', 2);
    return QString("%1 centuries").arg(centuries, 0, 'e', 2);
}
