#include "charsetprofile.h"
#include "engineconfig.h"

#include <QChar>
#include <QList>

CharacterSetProfile CharacterSetProfile::classify(const QString& password) {
    CharacterSetProfile profile;
    const QList<uint> codePoints = password.toUcs4();
    for (uint cp : codePoints) {
        if (QChar::isLower(cp)) profile.hasLowercase = true;
        else if (QChar::isUpper(cp)) profile.hasUppercase = true;
        else if (QChar::isDigit(cp)) profile.hasDigit = true;
        else if (QChar::isPrint(cp)) profile.hasSpecial = true;
    }
    return profile;
}

int CharacterSetProfile::classCount() const {
    return (hasLowercase ? 1 : 0) + (hasUppercase ? 1 : 0) + (hasDigit ? 1 : 0) + (hasSpecial ? 1 : 0);
}

int CharacterSetProfile::alphabetSize() const {
    int size = 0;
    if (hasLowercase) size += EngineConfig::LOWERCASE_ALPHABET_SIZE;
    if (hasUppercase) size += EngineConfig::UPPERCASE_ALPHABET_SIZE;
    if (hasDigit) size += EngineConfig::DIGIT_ALPHABET_SIZE;
    if (hasSpecial) size += EngineConfig::SPECIAL_ALPHABET_SIZE;
    return size;
}

bool CharacterSetProfile::operator==(const CharacterSetProfile& other) const {
    return hasLowercase == other.hasLowercase && hasUppercase == other.hasUppercase
           && hasDigit == other.hasDigit && hasSpecial == other.hasSpecial;
}

int codePointLength(const QString& password) {
    return static_cast<int>(password.toUcs4().size());
}
