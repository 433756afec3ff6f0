#include "tabula/outcome.h"
#include "tabula/sandbox.h"

namespace tabula {

const char* outcome_kind_name(OutcomeKind k) {
    switch (k) {
        case OutcomeKind::SUCCESS: return "success";
        case OutcomeKind::REJECTED: return "rejected";
        case OutcomeKind::RUNTIME_FAILURE: return "runtime_failure";
        case OutcomeKind::TIMEOUT: return "timeout";
    }
    return "runtime_failure";
}

std::string trim_ws(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

Outcome interpret(const std::string& stdout_text, const std::string& stderr_text) {
    Outcome o;
    if (!stderr_text.empty()) {
        o.kind = OutcomeKind::RUNTIME_FAILURE;
        o.text = stderr_text;
        return o;
    }
    o.kind = OutcomeKind::SUCCESS;
    o.text = trim_ws(stdout_text);
    if (o.text.empty()) return o;

    json_mini::Doc doc;
    if (json_mini::parse_complete(o.text, &doc)) {
        o.is_json = true;
        o.json = std::move(doc);
    }
    return o;
}

Outcome interpret(const ExecutionResult& r) {
    switch (r.status) {
        case ExecStatus::COMPLETED:
            return interpret(r.stdout_text, r.stderr_text);
        case ExecStatus::REJECTED: {
            Outcome o;
            o.kind = OutcomeKind::REJECTED;
            o.text = r.stderr_text;
            return o;
        }
        case ExecStatus::TIMED_OUT: {
            Outcome o;
            o.kind = OutcomeKind::TIMEOUT;
            o.text = r.stderr_text;
            return o;
        }
        case ExecStatus::SPAWN_FAILED:
            break;
    }
    Outcome o;
    o.kind = OutcomeKind::RUNTIME_FAILURE;
    o.text = r.stderr_text;
    return o;
}

} // namespace tabula
