#pragma once

#include <string>
#include <json/json.h>
#include "execution_result.h"
#include "supervisor.h"

namespace scriptbox {

// Turns the raw capture of a completed run into an ExecutionResult.
// Precedence: result markers, then error markers, then stderr, then
// "no result".
class ResultExtractor {
public:
    static ExecutionResult extract(const ExecutionOutcome& outcome);
    static ExecutionResult extract(const std::string& stdout_output,
                                   const std::string& stderr_output);

    // Text between the last start marker and the first end marker after
    // it. False if either is missing.
    static bool find_payload(const std::string& text,
                             const std::string& start_marker,
                             const std::string& end_marker,
                             std::string& payload);

    static bool parse_json(const std::string& text, Json::Value& out);
};

} // namespace scriptbox
