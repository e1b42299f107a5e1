#include "securerandom.h"
#include "logging.h"

#include <openssl/err.h>
#include <openssl/rand.h>

bool SecureRandom::bounded(quint32 bound, quint32& out) {
    if (bound == 0) return false;

    // Reject the top of the range that would bias the modulo.
    const quint64 range = Q_UINT64_C(1) << 32;
    const quint64 limit = range - (range % bound);
    quint32 value = 0;
    do {
        if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
            qCWarning(lcEngine) << "RAND_bytes failed:" << ERR_error_string(ERR_get_error(), nullptr);
            return false;
        }
    } while (static_cast<quint64>(value) >= limit);

    out = value % bound;
    return true;
}

bool SecureRandom::pick(const QString& alphabet, QChar& out) {
    quint32 index = 0;
    if (!bounded(static_cast<quint32>(alphabet.size()), index)) return false;
    out = alphabet.at(static_cast<qsizetype>(index));
    return true;
}

bool SecureRandom::shuffle(QString& text) {
    for (qsizetype i = text.size() - 1; i > 0; --i) {
        quint32 j = 0;
        if (!bounded(static_cast<quint32>(i + 1), j)) return false;
        if (static_cast<qsizetype>(j) != i) {
            const QChar tmp = text.at(i);
            text[i] = text.at(j);
            text[j] = tmp;
        }
    }
    return true;
}
