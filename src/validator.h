#pragma once

#include <string>
#include <vector>
#include "constants.h"

namespace scriptbox {

// How matches against the deny-list are treated
enum class DenyListPolicy {
    BLOCK,  // First match rejects the submission
    WARN,   // Matches are reported but the script still runs
    OFF     // No scan
};

enum class RejectionReason {
    NONE,
    EMPTY_SCRIPT,
    SCRIPT_TOO_LARGE,
    MISSING_ENTRY_POINT,
    DENIED_CONSTRUCT
};

struct ValidatorConfig {
    size_t max_script_bytes = MAX_SCRIPT_SIZE;
    DenyListPolicy deny_policy = DenyListPolicy::BLOCK;

    // Lowercase substrings; matched case-insensitively
    std::vector<std::string> deny_patterns = {
        "import subprocess",
        "import os",
        "__import__",
        "exec(",
        "eval(",
        "open(",
        "file(",
        "input(",
        "raw_input(",
    };
};

struct ValidationResult {
    RejectionReason reason = RejectionReason::NONE;
    std::string message;
    std::vector<std::string> warnings;  // Deny-list hits under WARN policy

    bool ok() const { return reason == RejectionReason::NONE; }
};

// Surface-level checks run before anything touches the filesystem.
// This is not a security boundary; isolation is the supervisor's job.
class Validator {
public:
    explicit Validator(const ValidatorConfig& config = ValidatorConfig{});

    ValidationResult validate(const std::string& script) const;

    // True if some line declares `def main(` (any indentation and spacing)
    static bool has_entry_point(const std::string& script);

    static std::string reason_to_string(RejectionReason reason);
    static DenyListPolicy parse_policy(const std::string& name);

private:
    ValidatorConfig config_;
};

} // namespace scriptbox
