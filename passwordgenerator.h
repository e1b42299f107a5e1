#ifndef PASSWORDGENERATOR_H
#define PASSWORDGENERATOR_H

#include "engineconfig.h"
#include "engineerror.h"

#include <QString>

struct GenerationSpec {
    int length = EngineConfig::DEFAULT_GENERATED_LENGTH;
    bool includeLowercase = true;
    bool includeUppercase = true;
    bool includeDigits = true;
    bool includeSpecial = true;
};

class PasswordGenerator {
public:
    static const QString LOWERCASE;
    static const QString UPPERCASE;
    static const QString DIGITS;
    static const QString SPECIAL;

    // Exactly spec.length characters, only from the requested classes, each
    // requested class present at least once. Returns a null string on failure:
    // InvalidSpec for a bad spec, BackendUnavailable if the CSPRNG fails.
    static QString generate(const GenerationSpec& spec, EngineError* error = nullptr);

    static bool validate(const GenerationSpec& spec, EngineError* error = nullptr);
};

#endif // PASSWORDGENERATOR_H
