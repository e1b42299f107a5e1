#include "passwordgenerator.h"
#include "logging.h"
#include "securerandom.h"

#include <QStringList>

const QString PasswordGenerator::LOWERCASE = "abcdefghijklmnopqrstuvwxyz";
const QString PasswordGenerator::UPPERCASE = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
const QString PasswordGenerator::DIGITS = "0123456789";
const QString PasswordGenerator::SPECIAL = "!@#$%^&*()_+-=[]{}|;:,.<>?";

bool PasswordGenerator::validate(const GenerationSpec& spec, EngineError* error) {
    if (spec.length < EngineConfig::MIN_GENERATED_LENGTH || spec.length > EngineConfig::MAX_GENERATED_LENGTH) {
        return setError(error, EngineError::InvalidSpec,
                        QString("Length must be between %1 and %2")
                            .arg(EngineConfig::MIN_GENERATED_LENGTH)
                            .arg(EngineConfig::MAX_GENERATED_LENGTH));
    }
    if (!spec.includeLowercase && !spec.includeUppercase && !spec.includeDigits && !spec.includeSpecial)
        return setError(error, EngineError::InvalidSpec, "At least one character type must be selected");
    clearError(error);
    return true;
}

QString PasswordGenerator::generate(const GenerationSpec& spec, EngineError* error) {
    if (!validate(spec, error)) return QString();

    QStringList pools;
    if (spec.includeLowercase) pools.append(LOWERCASE);
    if (spec.includeUppercase) pools.append(UPPERCASE);
    if (spec.includeDigits) pools.append(DIGITS);
    if (spec.includeSpecial) pools.append(SPECIAL);
    const QString all = pools.join(QString());

    QString out;
    out.reserve(spec.length);
    bool ok = true;
    QChar ch;
    for (const QString& pool : pools) {
        ok = ok && SecureRandom::pick(pool, ch);
        if (ok) out.append(ch);
    }
    while (ok && out.size() < spec.length) {
        ok = SecureRandom::pick(all, ch);
        if (ok) out.append(ch);
    }

    if (!ok || !SecureRandom::shuffle(out)) {
        setError(error, EngineError::BackendUnavailable, "Secure random source failed");
        return QString();
    }

    qCDebug(lcEngine) << "Generated password of length" << out.size() << "from" << pools.size() << "classes";
    return out;
}
