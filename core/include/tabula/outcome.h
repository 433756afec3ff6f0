#pragma once

// Classification of one execution into what callers show the user.

#include "tabula/json_mini.h"

#include <string>

namespace tabula {

struct ExecutionResult;

enum class OutcomeKind { SUCCESS, REJECTED, RUNTIME_FAILURE, TIMEOUT };

const char* outcome_kind_name(OutcomeKind k);

struct Outcome {
    OutcomeKind kind{OutcomeKind::SUCCESS};

    // SUCCESS: trimmed stdout ("" when stdout was blank).
    // Otherwise: the failure message.
    std::string text;

    // SUCCESS only: text parsed as one complete JSON document. A literal
    // `null` gives is_json with json.root == nullptr.
    bool is_json{false};
    json_mini::Doc json;
};

// Any stderr output means failure, whatever stdout or the exit code say.
Outcome interpret(const std::string& stdout_text, const std::string& stderr_text);

// Status-aware variant: rejections and timeouts keep their own kinds, a
// failed spawn is a runtime failure.
Outcome interpret(const ExecutionResult& r);

// Strip ASCII whitespace at both ends.
std::string trim_ws(const std::string& s);

} // namespace tabula
