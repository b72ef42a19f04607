/**
 * Unit tests for ResultExtractor and ExecutionResult
 *
 * Marker precedence, fallbacks and the response mapping.
 */

#include <gtest/gtest.h>
#include "../../src/result_extractor.h"
#include "../../src/execution_result.h"

using namespace scriptbox;

namespace {

std::string result_line(const std::string& json) {
    return "__RESULT_START__" + json + "__RESULT_END__\n";
}

} // namespace

// ============================================================================
// Result Markers
// ============================================================================

TEST(ResultExtractorTest, ExtractsSuccessfulResult) {
    // Given: Harness output for a script that printed and returned an object
    std::string out = result_line(
        "{\"result\": {\"sum\": 3}, \"stdout\": \"working\\n\", \"error\": null}");

    // When: Extracted
    ExecutionResult r = ResultExtractor::extract(out, "");

    // Then: Success with result and captured stdout
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.result["sum"].asInt(), 3);
    EXPECT_EQ(r.stdout_text, "working\n");
    EXPECT_TRUE(r.error.empty());
}

TEST(ResultExtractorTest, AcceptsNonObjectResults) {
    EXPECT_EQ(ResultExtractor::extract(result_line(
        "{\"result\": [1, 2, 3], \"stdout\": \"\", \"error\": null}"), "").result.size(), 3u);
    EXPECT_TRUE(ResultExtractor::extract(result_line(
        "{\"result\": null, \"stdout\": \"\", \"error\": null}"), "").ok());
    EXPECT_EQ(ResultExtractor::extract(result_line(
        "{\"result\": \"text\", \"stdout\": \"\", \"error\": null}"), "").result.asString(), "text");
}

TEST(ResultExtractorTest, DecodesEscapedUnderscores) {
    // The harness escapes the second underscore of every pair in the payload
    std::string out = result_line(
        "{\"result\": \"_\\u005fRESULT_START_\\u005f\", \"stdout\": \"\", \"error\": null}");

    ExecutionResult r = ResultExtractor::extract(out, "");

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.result.asString(), "__RESULT_START__");
}

TEST(ResultExtractorTest, ScriptErrorInPayload) {
    std::string out = result_line(
        "{\"result\": null, \"stdout\": \"\", \"error\": \"ZeroDivisionError: division by zero\","
        " \"kind\": \"script\"}");

    ExecutionResult r = ResultExtractor::extract(out, "");

    EXPECT_EQ(r.error_kind, ErrorKind::SCRIPT);
    EXPECT_EQ(r.error, "ZeroDivisionError: division by zero");
    EXPECT_TRUE(r.result.isNull());
}

TEST(ResultExtractorTest, SerializationErrorInPayload) {
    std::string out = result_line(
        "{\"result\": null, \"stdout\": \"\", \"error\": \"main() must return JSON-serializable "
        "data, got set: Object of type set is not JSON serializable\", \"kind\": \"serialization\"}");

    ExecutionResult r = ResultExtractor::extract(out, "");

    EXPECT_EQ(r.error_kind, ErrorKind::SERIALIZATION);
    EXPECT_NE(r.error.find("got set"), std::string::npos);
}

TEST(ResultExtractorTest, UsesLastStartMarker) {
    // Given: The script printed a fake payload to the real stdout first
    std::string out =
        result_line("{\"result\": \"fake\", \"stdout\": \"\", \"error\": null}") +
        "noise\n" +
        result_line("{\"result\": \"real\", \"stdout\": \"\", \"error\": null}");

    // When: Extracted
    ExecutionResult r = ResultExtractor::extract(out, "");

    // Then: The genuine (last) payload wins
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.result.asString(), "real");
}

TEST(ResultExtractorTest, DanglingStartMarkerAfterPayloadIsIgnoredAsIncomplete) {
    // A start marker with no end after it cannot be the payload
    std::string out =
        result_line("{\"result\": 1, \"stdout\": \"\", \"error\": null}") +
        "__RESULT_START__{\"result\": 2";

    ExecutionResult r = ResultExtractor::extract(out, "");

    EXPECT_EQ(r.error_kind, ErrorKind::EXTRACTION);
    EXPECT_EQ(r.error, "Script execution failed - no result returned");
}

TEST(ResultExtractorTest, MalformedPayloadIsExtractionFailure) {
    ExecutionResult r = ResultExtractor::extract(result_line("{not json"), "stderr text");

    EXPECT_EQ(r.error_kind, ErrorKind::EXTRACTION);
    EXPECT_EQ(r.error, "Failed to parse execution result");
}

TEST(ResultExtractorTest, NonObjectPayloadIsExtractionFailure) {
    ExecutionResult r = ResultExtractor::extract(result_line("[1, 2]"), "");

    EXPECT_EQ(r.error_kind, ErrorKind::EXTRACTION);
    EXPECT_EQ(r.error, "Failed to parse execution result");
}

// ============================================================================
// Fallbacks
// ============================================================================

TEST(ResultExtractorTest, ErrorMarkersWhenNoResultMarkers) {
    std::string out = "__ERROR_START__{\"error\": \"boom\"}__ERROR_END__\n";

    ExecutionResult r = ResultExtractor::extract(out, "ignored stderr");

    EXPECT_EQ(r.error_kind, ErrorKind::SCRIPT);
    EXPECT_EQ(r.error, "boom");
}

TEST(ResultExtractorTest, ErrorMarkersWithoutErrorField) {
    ExecutionResult r = ResultExtractor::extract("__ERROR_START__{}__ERROR_END__", "");

    EXPECT_EQ(r.error, "Script execution failed");
}

TEST(ResultExtractorTest, ErrorMarkersWithBadJson) {
    ExecutionResult r = ResultExtractor::extract("__ERROR_START__{oops__ERROR_END__", "");

    EXPECT_EQ(r.error_kind, ErrorKind::SCRIPT);
    EXPECT_EQ(r.error, "Script execution failed with parsing error");
}

TEST(ResultExtractorTest, ResultMarkersTakePrecedenceOverErrorMarkers) {
    std::string out =
        "__ERROR_START__{\"error\": \"decoy\"}__ERROR_END__\n" +
        result_line("{\"result\": 7, \"stdout\": \"\", \"error\": null}");

    ExecutionResult r = ResultExtractor::extract(out, "");

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.result.asInt(), 7);
}

TEST(ResultExtractorTest, FallsBackToStderr) {
    ExecutionResult r = ResultExtractor::extract("partial output", "Traceback: boom\n");

    EXPECT_EQ(r.error_kind, ErrorKind::SCRIPT);
    EXPECT_EQ(r.error, "Script execution error: Traceback: boom\n");
}

TEST(ResultExtractorTest, NothingAtAll) {
    ExecutionResult r = ResultExtractor::extract("", "");

    EXPECT_EQ(r.error_kind, ErrorKind::EXTRACTION);
    EXPECT_EQ(r.error, "Script execution failed - no result returned");
}

TEST(ResultExtractorTest, ExtractsFromOutcome) {
    ExecutionOutcome outcome;
    outcome.stdout_output = result_line("{\"result\": true, \"stdout\": \"\", \"error\": null}");

    ExecutionResult r = ResultExtractor::extract(outcome);

    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.result.asBool());
}

// ============================================================================
// find_payload()
// ============================================================================

TEST(ResultExtractorTest, FindPayloadRequiresBothMarkers) {
    std::string payload;

    EXPECT_FALSE(ResultExtractor::find_payload("__RESULT_START__abc", RESULT_START_MARKER,
                                               RESULT_END_MARKER, payload));
    EXPECT_FALSE(ResultExtractor::find_payload("abc__RESULT_END__", RESULT_START_MARKER,
                                               RESULT_END_MARKER, payload));
    EXPECT_TRUE(ResultExtractor::find_payload("x__RESULT_START__abc__RESULT_END__y",
                                              RESULT_START_MARKER, RESULT_END_MARKER, payload));
    EXPECT_EQ(payload, "abc");
}

// ============================================================================
// ExecutionResult mapping
// ============================================================================

TEST(ExecutionResultTest, SuccessJsonShape) {
    Json::Value value(Json::objectValue);
    value["message"] = "Hello, World!";

    Json::Value body = ExecutionResult::success(value, "hi\n").to_json();

    EXPECT_EQ(body.size(), 3u);
    EXPECT_EQ(body["result"]["message"].asString(), "Hello, World!");
    EXPECT_EQ(body["stdout"].asString(), "hi\n");
    EXPECT_TRUE(body["error"].isNull());
}

TEST(ExecutionResultTest, FailureJsonShape) {
    Json::Value body = ExecutionResult::failure(ErrorKind::TIMEOUT, "too slow").to_json();

    EXPECT_EQ(body.size(), 3u);
    EXPECT_TRUE(body["result"].isNull());
    EXPECT_EQ(body["stdout"].asString(), "");
    EXPECT_EQ(body["error"].asString(), "too slow");
}

TEST(ExecutionResultTest, HttpStatusByKind) {
    EXPECT_EQ(ExecutionResult::success(Json::Value(1), "").http_status(), 200);
    EXPECT_EQ(ExecutionResult::failure(ErrorKind::VALIDATION, "x").http_status(), 400);
    EXPECT_EQ(ExecutionResult::failure(ErrorKind::SCRIPT, "x").http_status(), 400);
    EXPECT_EQ(ExecutionResult::failure(ErrorKind::SERIALIZATION, "x").http_status(), 400);
    EXPECT_EQ(ExecutionResult::failure(ErrorKind::TIMEOUT, "x").http_status(), 400);
    EXPECT_EQ(ExecutionResult::failure(ErrorKind::OUTPUT_LIMIT, "x").http_status(), 400);
    EXPECT_EQ(ExecutionResult::failure(ErrorKind::EXTRACTION, "x").http_status(), 400);
    EXPECT_EQ(ExecutionResult::failure(ErrorKind::SPAWN, "x").http_status(), 500);
    EXPECT_EQ(ExecutionResult::failure(ErrorKind::INTERNAL, "x").http_status(), 500);
}

TEST(ExecutionResultTest, FailureNeverReportsNoneKind) {
    ExecutionResult r = ExecutionResult::failure(ErrorKind::NONE, "odd");

    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error_kind, ErrorKind::INTERNAL);
}
