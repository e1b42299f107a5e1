#include "hashdemonstrator.h"
#include "engineconfig.h"
#include "logging.h"

#include <QStringList>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <crypt.h>

#include <cstring>
#include <memory>

namespace {

// Argon2 is provided by OpenSSL 3.2 and later. These are the parameter names
// of its ARGON2ID KDF (OSSL_KDF_PARAM_ARGON2_LANES / _MEMCOST).
const char* const ARGON2_KDF_NAME = "ARGON2ID";
const char* const ARGON2_PARAM_LANES = "lanes";
const char* const ARGON2_PARAM_MEMCOST = "memcost";
const int ARGON2_VERSION = 0x13;

const char* const BCRYPT_PREFIX = "$2b$";

const QByteArray::Base64Options PHC_BASE64 = QByteArray::Base64Encoding | QByteArray::OmitTrailingEquals;

QString openSslError() {
    const unsigned long code = ERR_get_error();
    return code ? QString::fromLatin1(ERR_error_string(code, nullptr)) : QString("unknown error");
}

bool constantTimeEquals(const QByteArray& a, const QByteArray& b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.constData(), b.constData(), static_cast<size_t>(a.size())) == 0;
}

} // namespace

bool HashDemonstration::contains(HashAlgorithm algorithm) const {
    for (const HashDigest& d : digests) {
        if (d.algorithm == algorithm) return true;
    }
    return false;
}

QString HashDemonstration::digestFor(HashAlgorithm algorithm) const {
    for (const HashDigest& d : digests) {
        if (d.algorithm == algorithm) return d.digest;
    }
    return QString();
}

HashDemonstration HashDemonstrator::demonstrate(const QString& password) {
    HashDemonstration result;
    for (HashAlgorithm algorithm : allAlgorithms()) {
        EngineError error;
        HashDigest digest;
        digest.algorithm = algorithm;
        digest.digest = hash(algorithm, password, &error);
        if (error.isError()) {
            qCInfo(lcHash) << "Omitting" << algorithmKey(algorithm) << "digest:" << error.message;
            result.unavailable.append(algorithm);
            continue;
        }
        switch (algorithm) {
        case HashAlgorithm::PlainText:
            digest.note = "UNSAFE: stored exactly as typed";
            break;
        case HashAlgorithm::MD5:
            digest.note = "Unsalted and fast; broken for password storage";
            break;
        case HashAlgorithm::SHA256:
            digest.note = "Unsalted and fast; not meant for passwords";
            break;
        case HashAlgorithm::Bcrypt:
            digest.salted = true;
            digest.note = QString("Salted; demo cost %1, not a production setting").arg(EngineConfig::BCRYPT_COST);
            break;
        case HashAlgorithm::Argon2:
            digest.salted = true;
            digest.note = QString("Salted, memory-hard; demo cost m=%1 KiB t=%2, not a production setting")
                              .arg(EngineConfig::ARGON2_MEMORY_KIB)
                              .arg(EngineConfig::ARGON2_ITERATIONS);
            break;
        }
        result.digests.append(digest);
    }
    return result;
}

QString HashDemonstrator::hash(HashAlgorithm algorithm, const QString& password, EngineError* error) {
    clearError(error);
    const QByteArray utf8 = password.toUtf8();
    switch (algorithm) {
    case HashAlgorithm::PlainText:
        return password;
    case HashAlgorithm::MD5:
    case HashAlgorithm::SHA256: {
        const QByteArray raw = evpDigest(utf8, algorithm, error);
        return raw.isEmpty() ? QString() : QString::fromLatin1(raw.toHex());
    }
    case HashAlgorithm::Bcrypt:
        return bcryptHash(utf8, error);
    case HashAlgorithm::Argon2:
        return argon2Hash(utf8, error);
    }
    setError(error, EngineError::InvalidInput, "Unknown hash algorithm");
    return QString();
}

bool HashDemonstrator::verify(HashAlgorithm algorithm, const QString& password, const QString& digest) {
    const QByteArray utf8 = password.toUtf8();
    switch (algorithm) {
    case HashAlgorithm::PlainText:
        return constantTimeEquals(utf8, digest.toUtf8());
    case HashAlgorithm::MD5:
    case HashAlgorithm::SHA256: {
        const QByteArray raw = evpDigest(utf8, algorithm, nullptr);
        return !raw.isEmpty() && constantTimeEquals(raw.toHex(), digest.toLatin1().toLower());
    }
    case HashAlgorithm::Bcrypt:
        return bcryptVerify(utf8, digest);
    case HashAlgorithm::Argon2:
        return argon2Verify(utf8, digest);
    }
    return false;
}

bool HashDemonstrator::isAvailable(HashAlgorithm algorithm) {
    if (algorithm == HashAlgorithm::Argon2) {
        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, ARGON2_KDF_NAME, nullptr);
        if (!kdf) {
            ERR_clear_error();
            return false;
        }
        EVP_KDF_free(kdf);
        return true;
    }
    if (algorithm == HashAlgorithm::Bcrypt) {
        char setting[CRYPT_GENSALT_OUTPUT_SIZE];
        return crypt_gensalt_rn(BCRYPT_PREFIX, EngineConfig::BCRYPT_COST, nullptr, 0,
                                setting, static_cast<int>(sizeof(setting))) != nullptr;
    }
    return true;
}

QByteArray HashDemonstrator::evpDigest(const QByteArray& data, HashAlgorithm algorithm, EngineError* error) {
    const EVP_MD* md = (algorithm == HashAlgorithm::MD5) ? EVP_md5() : EVP_sha256();
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        setError(error, EngineError::BackendUnavailable, "EVP_MD_CTX_new failed");
        return QByteArray();
    }

    QByteArray out(EVP_MAX_MD_SIZE, 0);
    unsigned int len = 0;
    bool success = true;
    if (success && 1 != EVP_DigestInit_ex(ctx, md, nullptr)) {
        setError(error, EngineError::BackendUnavailable, "EVP_DigestInit_ex failed: " + openSslError());
        success = false;
    }
    if (success && 1 != EVP_DigestUpdate(ctx, data.constData(), static_cast<size_t>(data.size()))) {
        setError(error, EngineError::BackendUnavailable, "EVP_DigestUpdate failed: " + openSslError());
        success = false;
    }
    if (success && 1 != EVP_DigestFinal_ex(ctx, reinterpret_cast<unsigned char*>(out.data()), &len)) {
        setError(error, EngineError::BackendUnavailable, "EVP_DigestFinal_ex failed: " + openSslError());
        success = false;
    }

    EVP_MD_CTX_free(ctx);
    if (!success) return QByteArray();
    out.resize(static_cast<qsizetype>(len));
    return out;
}

QString HashDemonstrator::bcryptHash(const QByteArray& password, EngineError* error) {
    char setting[CRYPT_GENSALT_OUTPUT_SIZE];
    if (!crypt_gensalt_rn(BCRYPT_PREFIX, EngineConfig::BCRYPT_COST, nullptr, 0, setting, static_cast<int>(sizeof(setting)))) {
        setError(error, EngineError::BackendUnavailable, "bcrypt is not supported by the system crypt library");
        return QString();
    }

    std::unique_ptr<crypt_data> data = std::make_unique<crypt_data>();
    const char* hashed = crypt_r(password.constData(), setting, data.get());
    if (!hashed || hashed[0] == '*') {
        setError(error, EngineError::BackendUnavailable, "crypt_r failed for bcrypt");
        return QString();
    }
    return QString::fromLatin1(hashed);
}

bool HashDemonstrator::bcryptVerify(const QByteArray& password, const QString& digest) {
    const QByteArray stored = digest.toLatin1();
    if (!stored.startsWith("$2")) return false;

    std::unique_ptr<crypt_data> data = std::make_unique<crypt_data>();
    const char* hashed = crypt_r(password.constData(), stored.constData(), data.get());
    if (!hashed || hashed[0] == '*') return false;
    return constantTimeEquals(QByteArray(hashed), stored);
}

bool HashDemonstrator::deriveArgon2(const QByteArray& password, const QByteArray& salt,
                                    quint32 iterations, quint32 memoryKib, quint32 lanes,
                                    QByteArray& tag) {
    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, ARGON2_KDF_NAME, nullptr);
    if (!kdf) {
        ERR_clear_error();
        return false;
    }
    EVP_KDF_CTX* ctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);
    if (!ctx) return false;

    uint32_t iter = iterations;
    uint32_t mem = memoryKib;
    uint32_t lanesParam = lanes;
    OSSL_PARAM params[6];
    OSSL_PARAM* p = params;
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD,
                                             const_cast<char*>(password.constData()),
                                             static_cast<size_t>(password.size()));
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT,
                                             const_cast<char*>(salt.constData()),
                                             static_cast<size_t>(salt.size()));
    *p++ = OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter);
    *p++ = OSSL_PARAM_construct_uint32(ARGON2_PARAM_LANES, &lanesParam);
    *p++ = OSSL_PARAM_construct_uint32(ARGON2_PARAM_MEMCOST, &mem);
    *p = OSSL_PARAM_construct_end();

    const bool success = 1 == EVP_KDF_derive(ctx, reinterpret_cast<unsigned char*>(tag.data()),
                                             static_cast<size_t>(tag.size()), params);
    if (!success) qCWarning(lcHash) << "Argon2 derivation failed:" << openSslError();
    EVP_KDF_CTX_free(ctx);
    return success;
}

QString HashDemonstrator::argon2Hash(const QByteArray& password, EngineError* error) {
    QByteArray salt(EngineConfig::ARGON2_SALT_BYTES, 0);
    if (RAND_bytes(reinterpret_cast<unsigned char*>(salt.data()), salt.size()) != 1) {
        setError(error, EngineError::BackendUnavailable, "Could not generate random salt for Argon2");
        return QString();
    }

    QByteArray tag(EngineConfig::ARGON2_TAG_BYTES, 0);
    if (!deriveArgon2(password, salt, EngineConfig::ARGON2_ITERATIONS, EngineConfig::ARGON2_MEMORY_KIB,
                      EngineConfig::ARGON2_LANES, tag)) {
        setError(error, EngineError::BackendUnavailable, "Argon2id requires OpenSSL 3.2 or later");
        return QString();
    }

    return QString("$argon2id$v=%1$m=%2,t=%3,p=%4$%5$%6")
        .arg(ARGON2_VERSION)
        .arg(EngineConfig::ARGON2_MEMORY_KIB)
        .arg(EngineConfig::ARGON2_ITERATIONS)
        .arg(EngineConfig::ARGON2_LANES)
        .arg(QString::fromLatin1(salt.toBase64(PHC_BASE64)),
             QString::fromLatin1(tag.toBase64(PHC_BASE64)));
}

bool HashDemonstrator::argon2Verify(const QByteArray& password, const QString& digest) {
    // $argon2id$v=19$m=<kib>,t=<iter>,p=<lanes>$<salt>$<tag>
    const QStringList fields = digest.split('$');
    if (fields.size() != 6 || !fields.at(0).isEmpty() || fields.at(1) != "argon2id"
        || fields.at(2) != QString("v=%1").arg(ARGON2_VERSION))
        return false;

    quint32 memoryKib = 0, iterations = 0, lanes = 0;
    const QStringList costs = fields.at(3).split(',');
    for (const QString& cost : costs) {
        const QStringList kv = cost.split('=');
        if (kv.size() != 2) return false;
        bool ok = false;
        const quint32 value = kv.at(1).toUInt(&ok);
        if (!ok) return false;
        if (kv.at(0) == "m") memoryKib = value;
        else if (kv.at(0) == "t") iterations = value;
        else if (kv.at(0) == "p") lanes = value;
        else return false;
    }
    if (memoryKib == 0 || iterations == 0 || lanes == 0) return false;

    const QByteArray salt = QByteArray::fromBase64(fields.at(4).toLatin1(), PHC_BASE64);
    const QByteArray expected = QByteArray::fromBase64(fields.at(5).toLatin1(), PHC_BASE64);
    if (salt.isEmpty() || expected.isEmpty()) return false;

    QByteArray tag(expected.size(), 0);
    if (!deriveArgon2(password, salt, iterations, memoryKib, lanes, tag)) return false;
    return constantTimeEquals(tag, expected);
}
