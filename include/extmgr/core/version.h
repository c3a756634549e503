#pragma once

#include <cstdint>
#include <string>

namespace extmgr {
namespace core {

/**
 * @brief Semantic version of an extension package (major.minor.patch).
 *
 * Compatibility rules follow SemVer:
 * - Major version changes indicate breaking changes
 * - Minor version changes indicate backward-compatible feature additions
 * - Patch version changes indicate backward-compatible bug fixes
 */
struct Version {
    uint16_t major{0};
    uint16_t minor{0};
    uint16_t patch{0};

    Version() = default;
    Version(uint16_t maj, uint16_t min, uint16_t pat)
        : major(maj), minor(min), patch(pat) {}

    /**
     * @brief Parses "1", "1.2", "1.2.3" or the same with a leading 'v'.
     *
     * Missing components default to zero.
     *
     * @throws std::invalid_argument if the text is not a version
     */
    static Version parse(const std::string& text);

    /**
     * @brief Same major version and not older than @p required.
     */
    bool isCompatibleWith(const Version& required) const {
        if (major != required.major) {
            return false;
        }
        return *this >= required;
    }

    /**
     * @brief Not older than @p required, any major version.
     */
    bool satisfies(const Version& required) const {
        return *this >= required;
    }

    std::string toString() const {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }

    bool operator<(const Version& other) const {
        if (major != other.major) return major < other.major;
        if (minor != other.minor) return minor < other.minor;
        return patch < other.patch;
    }

    bool operator>(const Version& other) const {
        return other < *this;
    }

    bool operator==(const Version& other) const {
        return major == other.major &&
               minor == other.minor &&
               patch == other.patch;
    }

    bool operator!=(const Version& other) const {
        return !(*this == other);
    }

    bool operator<=(const Version& other) const {
        return !(other < *this);
    }

    bool operator>=(const Version& other) const {
        return !(*this < other);
    }
};

/**
 * @brief Version constraint attached to a requested package.
 *
 * Supported forms:
 * - "*" or ""   any version
 * - "1.2.3"     exactly that version
 * - "^1.2"      same major, at least 1.2.0
 * - "~1.2"      same major and minor, at least 1.2.0
 * - ">=1.2", ">1.2", "<=1.2", "<1.2"
 */
class VersionConstraint {
public:
    enum class Operator {
        Any,
        Exact,
        Caret,
        Tilde,
        GreaterEqual,
        Greater,
        LessEqual,
        Less
    };

    VersionConstraint() = default;

    /**
     * @throws std::invalid_argument on malformed constraints
     */
    static VersionConstraint parse(const std::string& text);

    bool matches(const Version& version) const;

    Operator op() const { return op_; }
    const Version& version() const { return version_; }
    std::string toString() const;

private:
    VersionConstraint(Operator op, const Version& version) : op_(op), version_(version) {}

    Operator op_{Operator::Any};
    Version version_;
};

} // namespace core
} // namespace extmgr
