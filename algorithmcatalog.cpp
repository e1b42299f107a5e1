#include "algorithmcatalog.h"

namespace {

QList<AlgorithmInfo> buildAlgorithms() {
    return {
        {HashAlgorithm::PlainText, "Plain Text", "N/A", "insecure", "1000 trillion H/s",
         "No protection - passwords visible to anyone with database access",
         "NEVER use in production systems"},
        {HashAlgorithm::MD5, "MD5", "Deprecated since 2004", "deprecated", "180 billion H/s",
         "Fast hashing = fast cracking. Vulnerable to rainbow tables",
         "Do not use for passwords"},
        {HashAlgorithm::SHA256, "SHA256", "Not suitable for passwords", "weak", "65 billion H/s",
         "Better than MD5 but still too fast. No built-in salting",
         "Use for checksums, NOT for passwords"},
        {HashAlgorithm::Bcrypt, "bcrypt", "Since 1999", "secure", "85 thousand H/s",
         "Slow by design, includes salt, adjustable cost factor",
         "Recommended for password storage"},
        {HashAlgorithm::Argon2, "Argon2", "Since 2015", "most_secure", "1 thousand H/s",
         "Winner of the Password Hashing Competition, memory-hard",
         "Best choice for new systems"},
    };
}

// Expected scores are what StrengthScorer produces for each password.
QList<ExamplePassword> buildExamples() {
    return {
        {"password", "Very Weak - Common Password", 0},
        {"Pass123", "Very Weak - Short & Sequential", 17},
        {"summer7", "Weak - Short Word plus Digit", 30},
        {"Monkey2019", "Moderate - Word plus Year", 52},
        {"MyP@ssw0rd", "Strong - Mixed Classes but Short", 65},
        {"Tr0ub4dor&3", "Strong - Good Mix", 65},
        {"correct-horse-battery-staple-2024", "Very Strong - Long Passphrase", 92},
    };
}

} // namespace

const QList<AlgorithmInfo>& AlgorithmCatalog::algorithms() {
    static const QList<AlgorithmInfo> table = buildAlgorithms();
    return table;
}

const QList<ExamplePassword>& AlgorithmCatalog::examples() {
    static const QList<ExamplePassword> table = buildExamples();
    return table;
}
