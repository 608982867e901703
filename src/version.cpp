#include "version.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <array>
#include <cctype>
#include <limits>

// Modeled after apk-tools src/version.c so that the ordering matches apk.

namespace {

constexpr int rank(VersionToken t) {
    return static_cast<int>(t);
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_lower(char c) {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

// Classify the token after `previous` without reading its value. Separators
// ('.', '_', "-r") are consumed from `rest`.
VersionToken classify_next(VersionToken previous, std::string_view& rest) {
    VersionToken next = VersionToken::INVALID;

    if (rest.empty()) {
        next = VersionToken::END;
    } else if ((previous == VersionToken::DIGIT || previous == VersionToken::DIGIT_OR_ZERO) && is_lower(rest[0])) {
        next = VersionToken::LETTER;
    } else if (previous == VersionToken::LETTER && is_digit(rest[0])) {
        next = VersionToken::DIGIT;
    } else if (previous == VersionToken::SUFFIX && is_digit(rest[0])) {
        next = VersionToken::SUFFIX_NO;
    } else {
        if (rest[0] == '.') {
            next = VersionToken::DIGIT_OR_ZERO;
        } else if (rest[0] == '_') {
            next = VersionToken::SUFFIX;
        } else if (rest.starts_with("-r")) {
            next = VersionToken::REVISION_NO;
            rest.remove_prefix(1);
        }
        rest.remove_prefix(1);
    }

    if (rank(next) < rank(previous)) {
        const bool allowed = (next == VersionToken::DIGIT_OR_ZERO && previous == VersionToken::DIGIT) ||
                             (next == VersionToken::SUFFIX && previous == VersionToken::SUFFIX_NO) ||
                             (next == VersionToken::DIGIT && previous == VersionToken::LETTER);
        if (!allowed) next = VersionToken::INVALID;
    }
    return next;
}

// Pre-release suffixes are negative, post-release ones count up from zero.
bool parse_suffix(std::string_view& rest, long long& value) {
    static constexpr std::array<std::string_view, 4> pre_suffixes = {"alpha", "beta", "pre", "rc"};
    static constexpr std::array<std::string_view, 5> post_suffixes = {"cvs", "svn", "git", "hg", "p"};

    for (size_t i = 0; i < pre_suffixes.size(); ++i) {
        if (rest.starts_with(pre_suffixes[i])) {
            rest.remove_prefix(pre_suffixes[i].size());
            value = static_cast<long long>(i) - static_cast<long long>(pre_suffixes.size());
            return true;
        }
    }
    for (size_t i = 0; i < post_suffixes.size(); ++i) {
        if (rest.starts_with(post_suffixes[i])) {
            rest.remove_prefix(post_suffixes[i].size());
            value = static_cast<long long>(i);
            return true;
        }
    }
    return false;
}

// Longest digit run that always fits in a long long
constexpr size_t max_value_digits = 18;

int compare_values(const VersionTokenValue& a, const VersionTokenValue& b) {
    if (!a.digits.empty() || !b.digits.empty()) {
        if (a.digits.empty()) return -1;
        if (b.digits.empty()) return 1;
        if (a.digits.size() != b.digits.size()) return a.digits.size() < b.digits.size() ? -1 : 1;
        const int c = a.digits.compare(b.digits);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.value < b.value) return -1;
    if (a.value > b.value) return 1;
    return 0;
}

} // anonymous namespace

VersionTokenValue next_version_token(VersionToken previous, std::string_view& rest) {
    long long value = 0;
    std::string_view digits;
    VersionToken next = VersionToken::INVALID;
    bool invalid_suffix = false;

    if (rest.empty()) {
        return {VersionToken::END, 0};
    }

    switch (previous) {
    case VersionToken::DIGIT_OR_ZERO:
        if (rest[0] == '0') {
            // Each leading zero lowers the value, the rest is a separate digit token
            while (!rest.empty() && rest[0] == '0') {
                rest.remove_prefix(1);
                value -= 1;
            }
            next = VersionToken::DIGIT;
            break;
        }
        [[fallthrough]];
    case VersionToken::DIGIT:
    case VersionToken::SUFFIX_NO:
    case VersionToken::REVISION_NO: {
        size_t length = 0;
        while (length < rest.size() && is_digit(rest[length])) ++length;
        std::string_view run = rest.substr(0, length);
        rest.remove_prefix(length);
        while (!run.empty() && run[0] == '0') run.remove_prefix(1);
        if (run.size() > max_value_digits) {
            digits = run;
            value = std::numeric_limits<long long>::max();
        } else {
            for (char c : run) value = value * 10 + (c - '0');
        }
        break;
    }
    case VersionToken::LETTER:
        value = static_cast<unsigned char>(rest[0]);
        rest.remove_prefix(1);
        break;
    case VersionToken::SUFFIX:
        invalid_suffix = !parse_suffix(rest, value);
        break;
    default:
        value = -1;
        break;
    }

    if (rest.empty()) {
        next = VersionToken::END;
    } else if (next == VersionToken::INVALID && !invalid_suffix) {
        next = classify_next(previous, rest);
    }
    return {next, value, digits};
}

int version_compare(std::string_view a, std::string_view b, bool fuzzy) {
    VersionTokenValue at{VersionToken::DIGIT, 0};
    VersionTokenValue bt{VersionToken::DIGIT, 0};

    while (at.kind == bt.kind && at.kind != VersionToken::END && at.kind != VersionToken::INVALID &&
           compare_values(at, bt) == 0) {
        at = next_version_token(at.kind, a);
        bt = next_version_token(bt.kind, b);
    }

    if (const int order = compare_values(at, bt); order != 0) return order;

    if (at.kind == bt.kind || fuzzy) return 0;

    // Same leading components: the longer version wins, unless it continues
    // with a pre-release suffix.
    if (at.kind == VersionToken::SUFFIX) {
        at = next_version_token(at.kind, a);
        if (at.value < 0) return -1;
    }
    if (bt.kind == VersionToken::SUFFIX) {
        bt = next_version_token(bt.kind, b);
        if (bt.value < 0) return 1;
    }

    if (rank(at.kind) > rank(bt.kind)) return -1;
    if (rank(at.kind) < rank(bt.kind)) return 1;
    return 0;
}

bool version_validate(std::string_view version) {
    VersionToken current = VersionToken::DIGIT;
    while (current != VersionToken::END) {
        current = next_version_token(current, version).kind;
        if (current == VersionToken::INVALID) return false;
    }
    return true;
}

bool version_check_string(std::string_view version, std::string_view rule) {
    if (rule.starts_with(">=") && rule.size() > 2) {
        return version_compare(version, rule.substr(2)) >= 0;
    }
    if (rule.starts_with("<") && rule.size() > 1) {
        return version_compare(version, rule.substr(1)) == -1;
    }
    throw ApkmetaException(string_format("error.version_rule_operator", std::string(rule)));
}
