#include "validator.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace scriptbox {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

size_t skip_spaces(const std::string& line, size_t pos) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
        ++pos;
    }
    return pos;
}

} // namespace

Validator::Validator(const ValidatorConfig& config) : config_(config) {}

ValidationResult Validator::validate(const std::string& script) const {
    ValidationResult result;

    if (script.empty() || is_blank(script)) {
        result.reason = RejectionReason::EMPTY_SCRIPT;
        result.message = "Script content cannot be empty";
        return result;
    }

    if (script.size() > config_.max_script_bytes) {
        result.reason = RejectionReason::SCRIPT_TOO_LARGE;
        result.message = "Script exceeds maximum size of " +
                         std::to_string(config_.max_script_bytes) + " bytes";
        return result;
    }

    if (!has_entry_point(script)) {
        result.reason = RejectionReason::MISSING_ENTRY_POINT;
        result.message = "Script must contain a 'main()' function";
        return result;
    }

    if (config_.deny_policy == DenyListPolicy::OFF) {
        return result;
    }

    std::string lowered = to_lower(script);
    for (const auto& pattern : config_.deny_patterns) {
        if (pattern.empty() || lowered.find(to_lower(pattern)) == std::string::npos) {
            continue;
        }
        if (config_.deny_policy == DenyListPolicy::BLOCK) {
            result.reason = RejectionReason::DENIED_CONSTRUCT;
            result.message = "Script contains potentially dangerous code: " + pattern;
            result.warnings.clear();
            return result;
        }
        result.warnings.push_back(pattern);
    }

    return result;
}

bool Validator::has_entry_point(const std::string& script) {
    std::istringstream stream(script);
    std::string line;
    while (std::getline(stream, line)) {
        size_t pos = skip_spaces(line, 0);
        if (line.compare(pos, 3, "def") != 0) continue;
        pos += 3;

        size_t name_pos = skip_spaces(line, pos);
        if (name_pos == pos) continue;  // "define(" etc.
        if (line.compare(name_pos, 4, "main") != 0) continue;

        size_t paren_pos = skip_spaces(line, name_pos + 4);
        if (paren_pos < line.size() && line[paren_pos] == '(') {
            return true;
        }
    }
    return false;
}

std::string Validator::reason_to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::NONE: return "none";
        case RejectionReason::EMPTY_SCRIPT: return "empty_script";
        case RejectionReason::SCRIPT_TOO_LARGE: return "script_too_large";
        case RejectionReason::MISSING_ENTRY_POINT: return "missing_entry_point";
        case RejectionReason::DENIED_CONSTRUCT: return "denied_construct";
    }
    return "unknown";
}

DenyListPolicy Validator::parse_policy(const std::string& name) {
    std::string lowered = to_lower(name);
    if (lowered == "block") return DenyListPolicy::BLOCK;
    if (lowered == "warn") return DenyListPolicy::WARN;
    if (lowered == "off") return DenyListPolicy::OFF;
    throw std::invalid_argument("Unknown deny-list policy: " + name);
}

} // namespace scriptbox
