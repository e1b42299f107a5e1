#ifndef HASHDEMONSTRATOR_H
#define HASHDEMONSTRATOR_H

#include "cracktimeestimator.h"
#include "engineerror.h"

#include <QByteArray>
#include <QList>
#include <QString>

struct HashDigest {
    HashAlgorithm algorithm = HashAlgorithm::PlainText;
    QString digest;
    bool salted = false;
    QString note;
};

struct HashDemonstration {
    QList<HashDigest> digests;
    // Backends that are missing at run time. Their entries are omitted.
    QList<HashAlgorithm> unavailable;

    bool contains(HashAlgorithm algorithm) const;
    QString digestFor(HashAlgorithm algorithm) const;
};

// Educational hashing only. The bcrypt and Argon2 cost parameters are kept
// low on purpose and must not be reused for real credential storage.
class HashDemonstrator {
public:
    static HashDemonstration demonstrate(const QString& password);

    static QString hash(HashAlgorithm algorithm, const QString& password, EngineError* error = nullptr);
    static bool verify(HashAlgorithm algorithm, const QString& password, const QString& digest);

    static bool isAvailable(HashAlgorithm algorithm);

private:
    static QByteArray evpDigest(const QByteArray& data, HashAlgorithm algorithm, EngineError* error);
    static QString bcryptHash(const QByteArray& password, EngineError* error);
    static bool bcryptVerify(const QByteArray& password, const QString& digest);
    static QString argon2Hash(const QByteArray& password, EngineError* error);
    static bool argon2Verify(const QByteArray& password, const QString& digest);
    static bool deriveArgon2(const QByteArray& password, const QByteArray& salt,
                             quint32 iterations, quint32 memoryKib, quint32 lanes,
                             QByteArray& tag);
};

#endif // HASHDEMONSTRATOR_H
