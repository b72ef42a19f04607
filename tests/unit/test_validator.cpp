/**
 * Unit tests for Validator
 *
 * Surface checks applied before a submission reaches the filesystem.
 */

#include <gtest/gtest.h>
#include "../../src/validator.h"
#include <stdexcept>

using namespace scriptbox;

class ValidatorTest : public ::testing::Test {
protected:
    Validator validator;

    static ValidatorConfig with_policy(DenyListPolicy policy) {
        ValidatorConfig config;
        config.deny_policy = policy;
        return config;
    }
};

// ============================================================================
// Accepted Submissions
// ============================================================================

TEST_F(ValidatorTest, AcceptsMinimalScript) {
    auto result = validator.validate("def main():\n    return {\"message\": \"Hello\"}\n");

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.reason, RejectionReason::NONE);
    EXPECT_TRUE(result.message.empty());
}

TEST_F(ValidatorTest, AcceptsHelpersAndImports) {
    std::string script =
        "import math\n"
        "\n"
        "def helper(x):\n"
        "    return math.sqrt(x)\n"
        "\n"
        "def main():\n"
        "    return helper(16)\n";

    EXPECT_TRUE(validator.validate(script).ok());
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(ValidatorTest, RejectsEmptyScript) {
    auto result = validator.validate("");

    EXPECT_EQ(result.reason, RejectionReason::EMPTY_SCRIPT);
    EXPECT_EQ(result.message, "Script content cannot be empty");
}

TEST_F(ValidatorTest, RejectsWhitespaceOnlyScript) {
    auto result = validator.validate("   \n\t\r\n  ");

    EXPECT_EQ(result.reason, RejectionReason::EMPTY_SCRIPT);
}

TEST_F(ValidatorTest, RejectsOversizedScript) {
    // Given: A validator with a small limit
    ValidatorConfig config;
    config.max_script_bytes = 64;
    Validator small(config);

    // When: A valid script exceeds it
    std::string script = "def main():\n    return 1\n" + std::string(100, '#');
    auto result = small.validate(script);

    // Then: Rejected with the limit in the message
    EXPECT_EQ(result.reason, RejectionReason::SCRIPT_TOO_LARGE);
    EXPECT_NE(result.message.find("64 bytes"), std::string::npos);
}

TEST_F(ValidatorTest, RejectsScriptWithoutMain) {
    auto result = validator.validate("def helper():\n    return 1\n");

    EXPECT_EQ(result.reason, RejectionReason::MISSING_ENTRY_POINT);
    EXPECT_EQ(result.message, "Script must contain a 'main()' function");
}

TEST_F(ValidatorTest, RejectsDeniedConstruct) {
    auto result = validator.validate("import os\ndef main():\n    return os.getcwd()\n");

    EXPECT_EQ(result.reason, RejectionReason::DENIED_CONSTRUCT);
    EXPECT_EQ(result.message, "Script contains potentially dangerous code: import os");
}

TEST_F(ValidatorTest, DenyScanIsCaseInsensitive) {
    auto result = validator.validate("def main():\n    return EVAL(\"1\")\n");

    EXPECT_EQ(result.reason, RejectionReason::DENIED_CONSTRUCT);
    EXPECT_NE(result.message.find("eval("), std::string::npos);
}

TEST_F(ValidatorTest, EmptinessCheckedBeforeEntryPoint) {
    // Whitespace has no main() either, but the empty message wins
    EXPECT_EQ(validator.validate("\n\n").reason, RejectionReason::EMPTY_SCRIPT);
}

// ============================================================================
// Deny-list Policy
// ============================================================================

TEST_F(ValidatorTest, WarnPolicyReportsButAccepts) {
    Validator warn(with_policy(DenyListPolicy::WARN));

    auto result = warn.validate("def main():\n    return open('/etc/hostname').read()\n");

    EXPECT_TRUE(result.ok());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0], "open(");
}

TEST_F(ValidatorTest, OffPolicySkipsScan) {
    Validator off(with_policy(DenyListPolicy::OFF));

    auto result = off.validate("import subprocess\ndef main():\n    return eval('1')\n");

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(ValidatorTest, OffPolicyStillRequiresMain) {
    Validator off(with_policy(DenyListPolicy::OFF));

    EXPECT_EQ(off.validate("print(1)\n").reason, RejectionReason::MISSING_ENTRY_POINT);
}

TEST_F(ValidatorTest, ParsesPolicyNames) {
    EXPECT_EQ(Validator::parse_policy("block"), DenyListPolicy::BLOCK);
    EXPECT_EQ(Validator::parse_policy("WARN"), DenyListPolicy::WARN);
    EXPECT_EQ(Validator::parse_policy("off"), DenyListPolicy::OFF);
    EXPECT_THROW(Validator::parse_policy("sometimes"), std::invalid_argument);
}

// ============================================================================
// Entry Point Detection
// ============================================================================

TEST_F(ValidatorTest, EntryPointAllowsSpacingVariants) {
    EXPECT_TRUE(Validator::has_entry_point("def main():\n"));
    EXPECT_TRUE(Validator::has_entry_point("def  main ():\n"));
    EXPECT_TRUE(Validator::has_entry_point("def\tmain(x=1):\n"));
    EXPECT_TRUE(Validator::has_entry_point("class A:\n    def main(self):\n"));
}

TEST_F(ValidatorTest, EntryPointRejectsLookalikes) {
    EXPECT_FALSE(Validator::has_entry_point("def main_loop():\n"));
    EXPECT_FALSE(Validator::has_entry_point("define main():\n"));
    EXPECT_FALSE(Validator::has_entry_point("# main()\n"));
    EXPECT_FALSE(Validator::has_entry_point("x = 'def main():'\n"));
    EXPECT_FALSE(Validator::has_entry_point("main = lambda: 1\n"));
}
