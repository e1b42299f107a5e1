#ifndef ENGINECONFIG_H
#define ENGINECONFIG_H

// Policy constants of the analysis engine. These are calibration choices,
// not derived values.
namespace EngineConfig {

// Alphabet sizes per character class.
constexpr int LOWERCASE_ALPHABET_SIZE = 26;
constexpr int UPPERCASE_ALPHABET_SIZE = 26;
constexpr int DIGIT_ALPHABET_SIZE = 10;
constexpr int SPECIAL_ALPHABET_SIZE = 32;

// Pattern discount table, weight of a code point that continues a pattern.
constexpr double REPEAT_WEIGHT = 0.20;
constexpr double SEQUENCE_WEIGHT = 0.30;
constexpr double KEYBOARD_WEIGHT = 0.40;
constexpr int MIN_PATTERN_RUN = 3;

// Length component, max 35.
constexpr int LENGTH_POINTS_16 = 35;
constexpr int LENGTH_POINTS_12 = 25;
constexpr int LENGTH_POINTS_8 = 15;
constexpr int LENGTH_POINTS_6 = 5;

// Diversity component, indexed by number of classes present, max 30.
constexpr int DIVERSITY_POINTS[5] = {0, 7, 15, 22, 30};

// Entropy component, max 20.
constexpr double ENTROPY_BITS_HIGH = 80.0;
constexpr double ENTROPY_BITS_GOOD = 60.0;
constexpr double ENTROPY_BITS_FAIR = 40.0;
constexpr double ENTROPY_BITS_LOW = 28.0;
constexpr int ENTROPY_POINTS_HIGH = 20;
constexpr int ENTROPY_POINTS_GOOD = 15;
constexpr int ENTROPY_POINTS_FAIR = 10;
constexpr int ENTROPY_POINTS_LOW = 5;

// Best-practice component, max 15.
constexpr int BEST_PRACTICE_MIN_LENGTH = 12;
constexpr int BEST_PRACTICE_MIN_CLASSES = 3;
constexpr int BEST_PRACTICE_POINTS = 10;
constexpr int NO_REPEAT_POINTS = 5;

// Penalties.
constexpr int COMMON_PASSWORD_PENALTY = 50;
constexpr int PATTERN_PENALTY = 20;

// Level thresholds (lower bound of each level above VeryWeak).
constexpr int WEAK_THRESHOLD = 20;
constexpr int MODERATE_THRESHOLD = 40;
constexpr int STRONG_THRESHOLD = 60;
constexpr int VERY_STRONG_THRESHOLD = 80;

// Attack throughput in hashes per second, modern GPU rig (hashcat, RTX 3090 class).
constexpr double PLAINTEXT_HASHES_PER_SECOND = 1e15;
constexpr double MD5_HASHES_PER_SECOND = 1.8e11;
constexpr double SHA256_HASHES_PER_SECOND = 6.5e10;
constexpr double BCRYPT_HASHES_PER_SECOND = 8.5e4;
constexpr double ARGON2_HASHES_PER_SECOND = 1e3;

// Suggestion and improvement targets.
constexpr int MIN_RECOMMENDED_LENGTH = 12;
constexpr int GOOD_LENGTH = 16;
constexpr int IMPROVEMENT_TARGET_LENGTH = 16;
constexpr int MAX_IMPROVEMENTS = 5;

// Generator bounds.
constexpr int MIN_GENERATED_LENGTH = 8;
constexpr int MAX_GENERATED_LENGTH = 128;
constexpr int DEFAULT_GENERATED_LENGTH = 16;

// Demonstration hash parameters. Deliberately low, never for production use.
constexpr int BCRYPT_COST = 6;
constexpr unsigned int ARGON2_ITERATIONS = 2;
constexpr unsigned int ARGON2_MEMORY_KIB = 8192;
constexpr unsigned int ARGON2_LANES = 1;
constexpr int ARGON2_SALT_BYTES = 16;
constexpr int ARGON2_TAG_BYTES = 32;

// Service output.
constexpr int HASH_DISPLAY_LIMIT = 60;

} // namespace EngineConfig

#endif // ENGINECONFIG_H
