#include "extmgr/core/version.h"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace extmgr {
namespace core {

namespace {
    std::string trim(const std::string& text) {
        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
        return text.substr(begin, end - begin);
    }

    uint16_t parseComponent(const std::string& component, const std::string& original) {
        if (component.empty()) {
            throw std::invalid_argument("Invalid version: '" + original + "'");
        }
        unsigned long value = 0;
        for (char c : component) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Invalid version: '" + original + "'");
            }
            value = value * 10 + static_cast<unsigned long>(c - '0');
            if (value > std::numeric_limits<uint16_t>::max()) {
                throw std::invalid_argument("Version component out of range: '" + original + "'");
            }
        }
        return static_cast<uint16_t>(value);
    }
}

Version Version::parse(const std::string& text) {
    std::string value = trim(text);
    if (!value.empty() && (value[0] == 'v' || value[0] == 'V')) {
        value.erase(0, 1);
    }

    uint16_t parts[3] = {0, 0, 0};
    size_t index = 0;
    size_t start = 0;
    while (true) {
        if (index >= 3) {
            throw std::invalid_argument("Invalid version: '" + text + "'");
        }
        size_t dot = value.find('.', start);
        parts[index++] = parseComponent(value.substr(start, dot - start), text);
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    return Version(parts[0], parts[1], parts[2]);
}

VersionConstraint VersionConstraint::parse(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || value == "*") {
        return VersionConstraint();
    }

    // Two-character operators must be checked before their one-character prefixes
    if (value.compare(0, 2, ">=") == 0) {
        return VersionConstraint(Operator::GreaterEqual, Version::parse(value.substr(2)));
    }
    if (value.compare(0, 2, "<=") == 0) {
        return VersionConstraint(Operator::LessEqual, Version::parse(value.substr(2)));
    }

    switch (value[0]) {
        case '^': return VersionConstraint(Operator::Caret, Version::parse(value.substr(1)));
        case '~': return VersionConstraint(Operator::Tilde, Version::parse(value.substr(1)));
        case '>': return VersionConstraint(Operator::Greater, Version::parse(value.substr(1)));
        case '<': return VersionConstraint(Operator::Less, Version::parse(value.substr(1)));
        case '=': return VersionConstraint(Operator::Exact, Version::parse(value.substr(1)));
        default:  return VersionConstraint(Operator::Exact, Version::parse(value));
    }
}

bool VersionConstraint::matches(const Version& version) const {
    switch (op_) {
        case Operator::Any:          return true;
        case Operator::Exact:        return version == version_;
        case Operator::Caret:        return version.isCompatibleWith(version_);
        case Operator::Tilde:        return version.major == version_.major &&
                                            version.minor == version_.minor &&
                                            version >= version_;
        case Operator::GreaterEqual: return version >= version_;
        case Operator::Greater:      return version > version_;
        case Operator::LessEqual:    return version <= version_;
        case Operator::Less:         return version < version_;
    }
    return false;
}

std::string VersionConstraint::toString() const {
    switch (op_) {
        case Operator::Any:          return "*";
        case Operator::Exact:        return version_.toString();
        case Operator::Caret:        return "^" + version_.toString();
        case Operator::Tilde:        return "~" + version_.toString();
        case Operator::GreaterEqual: return ">=" + version_.toString();
        case Operator::Greater:      return ">" + version_.toString();
        case Operator::LessEqual:    return "<=" + version_.toString();
        case Operator::Less:         return "<" + version_.toString();
    }
    return "*";
}

} // namespace core
} // namespace extmgr
