#ifndef CHARSETPROFILE_H
#define CHARSETPROFILE_H

#include <QString>

class CharacterSetProfile {
public:
    bool hasLowercase = false;
    bool hasUppercase = false;
    bool hasDigit = false;
    bool hasSpecial = false;

    static CharacterSetProfile classify(const QString& password);

    int classCount() const;
    int alphabetSize() const;

    bool operator==(const CharacterSetProfile& other) const;
};

// Number of Unicode code points, not UTF-16 units.
int codePointLength(const QString& password);

#endif // CHARSETPROFILE_H
