#pragma once

#include <string>

namespace scriptbox {

// Builds the Python program that runs a submission and reports through the
// marker protocol. The submission is embedded as base64 at a single point,
// so its text cannot close a literal or reach into the wrapper code.
//
// The generated program:
//   - keeps a private dup of fd 1 for the payload line
//   - runs the script in a fresh namespace with stdout redirected to a buffer
//   - calls main() with no arguments
//   - writes exactly one __RESULT_START__{...}__RESULT_END__ line
//     ({result, stdout, error} on success, {result: null, stdout: "",
//     error, kind} on failure) and exits 0 or 1 accordingly
//
// The second underscore of every "__" in the JSON payload is written as a
// JSON unicode escape, so the payload itself can never contain a marker.
class HarnessComposer {
public:
    static std::string compose(const std::string& script);

    // Filename reported in tracebacks and syntax errors
    static constexpr const char* SCRIPT_FILENAME = "<script>";

private:
    static const char* const PREAMBLE;
    static const char* const POSTAMBLE;
};

} // namespace scriptbox
