#ifndef CRACKTIMEESTIMATOR_H
#define CRACKTIMEESTIMATOR_H

#include <QList>
#include <QString>

class QSettings;
struct StrengthResult;

enum class HashAlgorithm {
    PlainText,
    MD5,
    SHA256,
    Bcrypt,
    Argon2
};

QString algorithmKey(HashAlgorithm algorithm);
QList<HashAlgorithm> allAlgorithms();

struct CrackTimeEntry {
    HashAlgorithm algorithm = HashAlgorithm::PlainText;
    double attackSpeedHashesPerSecond = 0.0;
    double timeSeconds = 0.0;
    QString timeHuman;
};

// Attacker throughput per algorithm, in hashes per second.
class CrackTimeModel {
public:
    CrackTimeModel();

    double speed(HashAlgorithm algorithm) const;
    bool setSpeeds(const QList<double>& speeds);

    // Reads [attack_speeds] overrides. Keeps the defaults and returns false
    // when the values are not positive and strictly decreasing.
    static bool fromSettings(QSettings& settings, CrackTimeModel& model);

private:
    QList<double> m_speeds;
};

class CrackTimeEstimator {
public:
    // One entry per algorithm in PlainText, MD5, SHA256, Bcrypt, Argon2 order.
    // The keyspace is 2^entropyBits, or a single guess for a common password.
    static QList<CrackTimeEntry> estimate(const StrengthResult& strength,
                                          const CrackTimeModel& model = CrackTimeModel());
    static QList<CrackTimeEntry> estimate(double keyspaceBits,
                                          const CrackTimeModel& model = CrackTimeModel());

    // Average case, half the keyspace. Saturates to DBL_MAX instead of overflowing.
    static double secondsToCrack(double keyspaceBits, double hashesPerSecond);
    static QString formatDuration(double seconds);
};

#endif // CRACKTIMEESTIMATOR_H
