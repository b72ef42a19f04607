#include "harness_composer.h"
#include "constants.h"
#include "crypto_utils.h"

namespace scriptbox {

const char* const HarnessComposer::PREAMBLE = R"PY(import base64
import io
import json
import os
import sys
from contextlib import redirect_stdout

_RESULT_FD = os.dup(1)
)PY";

const char* const HarnessComposer::POSTAMBLE = R"PY(

_INT_MIN = -2 ** 63
_INT_MAX = 2 ** 64 - 1


class _Unportable(ValueError):
    def __init__(self, value, detail):
        ValueError.__init__(self, detail)
        self.value = value


def _flush_streams(streams):
    for stream in streams:
        try:
            stream.flush()
        except BaseException:
            pass


def _clean_text(text):
    return text.encode("utf-8", "backslashreplace").decode("utf-8")


def _check_portable(value):
    # json.dumps accepted it; reject what a 64-bit JSON reader would
    # coerce or refuse
    pending = [value]
    while pending:
        item = pending.pop()
        if item is None or isinstance(item, (bool, float)):
            continue
        if isinstance(item, int):
            if not _INT_MIN <= item <= _INT_MAX:
                raise _Unportable(item, "integer out of 64-bit range")
        elif isinstance(item, str):
            try:
                item.encode("utf-8")
            except UnicodeEncodeError as exc:
                raise _Unportable(item, "string is not valid UTF-8 (" + exc.reason + ")")
        elif isinstance(item, dict):
            for key, entry in item.items():
                if isinstance(key, str):
                    pending.append(key)
                pending.append(entry)
        elif isinstance(item, (list, tuple)):
            pending.extend(item)


def _emit(payload):
    # Buffered script output must reach the pipe before the payload
    _flush_streams((sys.stdout, sys.stderr, sys.__stdout__, sys.__stderr__))
    for key in ("stdout", "error"):
        if isinstance(payload.get(key), str):
            payload[key] = _clean_text(payload[key])
    body = json.dumps(payload).replace("__", "_\\u005f")
    data = (_START_MARKER + body + _END_MARKER + "\n").encode("utf-8")
    while data:
        written = os.write(_RESULT_FD, data)
        data = data[written:]


def _describe(exc):
    message = str(exc)
    name = type(exc).__name__
    return name + ": " + message if message else name


def _run():
    capture = io.StringIO()
    namespace = {"__name__": "__script__", "__builtins__": __builtins__}
    try:
        with redirect_stdout(capture):
            code = compile(_SOURCE, _SCRIPT_FILENAME, "exec")
            exec(code, namespace)
            entry = namespace.get("main")
            if not callable(entry):
                raise NameError("Script must contain a 'main()' function")
            result = entry()
    except BaseException as exc:
        _emit({"result": None, "stdout": "", "error": _describe(exc), "kind": "script"})
        return 1
    try:
        json.dumps(result, allow_nan=False)
        _check_portable(result)
    except (TypeError, ValueError, RecursionError) as exc:
        offender = exc.value if isinstance(exc, _Unportable) else result
        _emit({
            "result": None,
            "stdout": "",
            "error": "main() must return JSON-serializable data, got "
                     + type(offender).__name__ + ": " + str(exc),
            "kind": "serialization",
        })
        return 1
    _emit({"result": result, "stdout": capture.getvalue(), "error": None})
    return 0


if __name__ == "__main__":
    status = _run()
    # stdout was flushed before the payload; nothing may follow it
    _flush_streams((sys.stderr, sys.__stderr__))
    os._exit(status)
)PY";

std::string HarnessComposer::compose(const std::string& script) {
    std::string harness;
    harness.reserve(script.size() * 4 / 3 + 2048);

    harness += PREAMBLE;
    harness += "_START_MARKER = \"" + std::string(RESULT_START_MARKER) + "\"\n";
    harness += "_END_MARKER = \"" + std::string(RESULT_END_MARKER) + "\"\n";
    harness += "_SCRIPT_FILENAME = \"" + std::string(SCRIPT_FILENAME) + "\"\n";

    // Injection point: base64 alphabet only, inside a double-quoted literal
    harness += "_SOURCE = base64.b64decode(\"";
    harness += CryptoUtils::base64_encode(script);
    harness += "\").decode(\"utf-8\")\n";

    harness += POSTAMBLE;
    return harness;
}

} // namespace scriptbox
