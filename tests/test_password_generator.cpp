#include "charsetprofile.h"
#include "passwordgenerator.h"

#include <QSet>

#include <gtest/gtest.h>

namespace {

bool onlyFrom(const QString& text, const QString& alphabet) {
    for (const QChar& ch : text) {
        if (!alphabet.contains(ch)) return false;
    }
    return true;
}

TEST(PasswordGeneratorTest, DefaultSpecUsesEveryClass) {
    EngineError error;
    const QString password = PasswordGenerator::generate(GenerationSpec(), &error);
    EXPECT_FALSE(error.isError());
    EXPECT_EQ(16, password.size());
    EXPECT_EQ(4, CharacterSetProfile::classify(password).classCount());
}

TEST(PasswordGeneratorTest, HonoursLengthBounds) {
    for (int length : {8, 9, 33, 127, 128}) {
        GenerationSpec spec;
        spec.length = length;
        EXPECT_EQ(length, PasswordGenerator::generate(spec).size());
    }
}

TEST(PasswordGeneratorTest, RejectsOutOfRangeLength) {
    for (int length : {-1, 0, 7, 129, 4096}) {
        GenerationSpec spec;
        spec.length = length;
        EngineError error;
        EXPECT_TRUE(PasswordGenerator::generate(spec, &error).isNull());
        EXPECT_EQ(EngineError::InvalidSpec, error.kind);
    }
}

TEST(PasswordGeneratorTest, RejectsEmptyClassSelection) {
    GenerationSpec spec;
    spec.includeLowercase = false;
    spec.includeUppercase = false;
    spec.includeDigits = false;
    spec.includeSpecial = false;
    EngineError error;
    EXPECT_FALSE(PasswordGenerator::validate(spec, &error));
    EXPECT_EQ(EngineError::InvalidSpec, error.kind);
    EXPECT_TRUE(PasswordGenerator::generate(spec).isNull());
}

TEST(PasswordGeneratorTest, UsesOnlyRequestedClasses) {
    GenerationSpec digits;
    digits.includeLowercase = false;
    digits.includeUppercase = false;
    digits.includeSpecial = false;
    digits.length = 40;
    EXPECT_TRUE(onlyFrom(PasswordGenerator::generate(digits), PasswordGenerator::DIGITS));

    GenerationSpec noSpecial;
    noSpecial.includeSpecial = false;
    for (int trial = 0; trial < 20; ++trial) {
        const QString password = PasswordGenerator::generate(noSpecial);
        const CharacterSetProfile profile = CharacterSetProfile::classify(password);
        EXPECT_FALSE(profile.hasSpecial);
        EXPECT_TRUE(profile.hasLowercase && profile.hasUppercase && profile.hasDigit);
    }
}

TEST(PasswordGeneratorTest, MinimumLengthStillCoversEveryClass) {
    GenerationSpec spec;
    spec.length = 8;
    for (int trial = 0; trial < 100; ++trial)
        EXPECT_EQ(4, CharacterSetProfile::classify(PasswordGenerator::generate(spec)).classCount());
}

TEST(PasswordGeneratorTest, OutputsDiffer) {
    QSet<QString> seen;
    for (int trial = 0; trial < 100; ++trial) seen.insert(PasswordGenerator::generate(GenerationSpec()));
    EXPECT_EQ(100, seen.size());
}

} // namespace
