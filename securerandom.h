#ifndef SECURERANDOM_H
#define SECURERANDOM_H

#include <QString>
#include <QtGlobal>

// Unbiased helpers on top of OpenSSL's CSPRNG. Every function returns false
// when RAND_bytes fails.
class SecureRandom {
public:
    static bool bounded(quint32 bound, quint32& out);
    static bool pick(const QString& alphabet, QChar& out);
    static bool shuffle(QString& text);
};

#endif // SECURERANDOM_H
