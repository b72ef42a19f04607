#include "result_extractor.h"
#include "constants.h"
#include <memory>

namespace scriptbox {

bool ResultExtractor::find_payload(const std::string& text,
                                   const std::string& start_marker,
                                   const std::string& end_marker,
                                   std::string& payload) {
    // The genuine payload is the last line the harness writes, so anything
    // earlier that looks like a marker came from the script
    size_t start = text.rfind(start_marker);
    if (start == std::string::npos) {
        return false;
    }
    start += start_marker.size();

    size_t end = text.find(end_marker, start);
    if (end == std::string::npos) {
        return false;
    }

    payload = text.substr(start, end - start);
    return true;
}

bool ResultExtractor::parse_json(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    return reader->parse(text.data(), text.data() + text.size(), &out, &errors);
}

ExecutionResult ResultExtractor::extract(const ExecutionOutcome& outcome) {
    return extract(outcome.stdout_output, outcome.stderr_output);
}

ExecutionResult ResultExtractor::extract(const std::string& stdout_output,
                                         const std::string& stderr_output) {
    std::string payload;

    if (find_payload(stdout_output, RESULT_START_MARKER, RESULT_END_MARKER, payload)) {
        Json::Value data;
        if (!parse_json(payload, data) || !data.isObject()) {
            return ExecutionResult::failure(ErrorKind::EXTRACTION,
                                            "Failed to parse execution result");
        }

        std::string captured;
        if (data["stdout"].isString()) {
            captured = data["stdout"].asString();
        }

        const Json::Value& error = data["error"];
        if (!error.isNull()) {
            ErrorKind kind = ErrorKind::SCRIPT;
            if (data["kind"].isString() && data["kind"].asString() == "serialization") {
                kind = ErrorKind::SERIALIZATION;
            }
            std::string message;
            if (error.isString()) {
                message = error.asString();
            } else {
                Json::StreamWriterBuilder writer;
                writer["indentation"] = "";
                message = Json::writeString(writer, error);
            }
            ExecutionResult failed = ExecutionResult::failure(kind, message);
            failed.stdout_text = captured;
            return failed;
        }

        return ExecutionResult::success(data["result"], captured);
    }

    if (find_payload(stdout_output, ERROR_START_MARKER, ERROR_END_MARKER, payload)) {
        Json::Value data;
        if (!parse_json(payload, data) || !data.isObject()) {
            return ExecutionResult::failure(ErrorKind::SCRIPT,
                                            "Script execution failed with parsing error");
        }
        if (data["error"].isString()) {
            return ExecutionResult::failure(ErrorKind::SCRIPT, data["error"].asString());
        }
        return ExecutionResult::failure(ErrorKind::SCRIPT, "Script execution failed");
    }

    if (!stderr_output.empty()) {
        return ExecutionResult::failure(ErrorKind::SCRIPT,
                                        "Script execution error: " + stderr_output);
    }

    return ExecutionResult::failure(ErrorKind::EXTRACTION,
                                    "Script execution failed - no result returned");
}

} // namespace scriptbox
