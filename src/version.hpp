#pragma once

#include <string>
#include <string_view>

// Token classes of apk's version grammar. The numeric order matters: a
// transition to a lower class is only valid in a few explicit cases.
enum class VersionToken {
    INVALID = -1,
    DIGIT_OR_ZERO = 0,
    DIGIT = 1,
    LETTER = 2,
    SUFFIX = 3,
    SUFFIX_NO = 4,
    REVISION_NO = 5,
    END = 6
};

struct VersionTokenValue {
    VersionToken kind;
    long long value;
    // Digit runs too long for `value`, without leading zeros. Empty otherwise.
    std::string_view digits = {};
};

// Read the token that follows `previous` from `rest` and cut it off.
VersionTokenValue next_version_token(VersionToken previous, std::string_view& rest);

// Compare two apk version strings.
// Returns -1 if a < b, 0 if equal, 1 if a > b. With `fuzzy`, versions that
// only differ in the kind of their last token compare equal.
int version_compare(std::string_view a, std::string_view b, bool fuzzy = false);

bool version_validate(std::string_view version);

// Check a version against a rule like ">=1.0.0" or "<4.0".
// Throws ApkmetaException if the rule has no supported operator.
bool version_check_string(std::string_view version, std::string_view rule);
