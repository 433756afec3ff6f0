#pragma once

// Static security check for generated analysis scripts.
//
// Oversized input is rejected before anything else looks at it. Otherwise
// five stages run over the source and their findings are unioned:
//   1. line scan for `import X` / `from X import`
//   2. import policy (deny-set first, then allow-set)
//   3. bare calls to capability builtins (`exec(`, `open(`, ...)
//   4. dunder names and `.system(` / `.popen(` / `.call(`
//   5. syntax tree from the interpreter's own `ast` module: forbidden
//      callees, dunder names, `_`-prefixed attributes, imports
// The lexical stages are a fast filter over raw bytes. The tree walk sees
// identifiers the way the interpreter does (NFKC-normalized) and is
// authoritative. Stage 5 parses in an isolated child process; the submitted
// code is never executed.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tabula {

class JsonlLogger;
class ProcessRunner;
class ResourceLimiter;
struct SandboxConfig;

enum class ViolationKind {
    FORBIDDEN_IMPORT,
    FORBIDDEN_FUNCTION_CALL,
    FORBIDDEN_ATTRIBUTE_ACCESS,
    SYNTAX_ERROR,
    CODE_TOO_LARGE,
};

const char* violation_kind_name(ViolationKind k);

struct Violation {
    ViolationKind kind{ViolationKind::SYNTAX_ERROR};
    std::string detail;
};

struct ValidationVerdict {
    bool allowed{true};
    std::vector<Violation> violations;

    // One line per violation, "kind: detail".
    std::string summary() const;
};

// Module policy. Names are top-level module names.
bool is_denied_module(const std::string& top);
bool is_allowed_module(const std::string& top);
bool is_forbidden_function(const std::string& name);

// "a.b.c" -> "a"
std::string top_level_module(const std::string& dotted);

// Lexical import extraction (stage 1). Tolerates code that does not parse.
// Returns top-level module names in source order, duplicates kept.
std::vector<std::string> extract_imports(const std::string& code);

// True if `code` contains `name` at a word boundary followed by optional
// whitespace and `(`. With `after_dot`, `name` must be preceded by `.`.
bool has_call_pattern(const std::string& code, const std::string& name, bool after_dot = false);

struct ValidatorOptions {
    std::string interpreter{"python3"};
    std::string scratch_dir;            // empty: <tmp>/tabula_sandbox

    size_t max_code_bytes{256 * 1024};
    size_t max_line_bytes{10000};

    // Bounds for the parse child.
    int parse_timeout_ms{10000};
    uint32_t parse_cpu_seconds{10};
    uint64_t parse_memory_bytes{1024ULL * 1024 * 1024};
    size_t parse_output_max_bytes{16 * 1024 * 1024};
};

// Interpreter, scratch dir and size bounds taken from the sandbox config.
ValidatorOptions validator_options(const SandboxConfig& cfg);

class CodeValidator {
public:
    // log may be nullptr.
    explicit CodeValidator(JsonlLogger* log = nullptr);
    explicit CodeValidator(ValidatorOptions opts, JsonlLogger* log = nullptr);
    // runner == nullptr uses ForkProcessRunner.
    CodeValidator(ValidatorOptions opts, std::unique_ptr<ProcessRunner> runner,
                  JsonlLogger* log = nullptr);
    ~CodeValidator();

    CodeValidator(CodeValidator&&) noexcept;
    CodeValidator& operator=(CodeValidator&&) noexcept;

    // Deterministic, never executes code. Safe to call concurrently.
    ValidationVerdict validate(const std::string& code) const;

    const ValidatorOptions& options() const { return opts_; }

private:
    // Stage 5. Returns findings in tree order; a parse failure or an
    // unusable parse child is reported as a violation.
    std::vector<Violation> syntax_tree_stage(const std::string& code) const;

    ValidatorOptions opts_;
    std::unique_ptr<ProcessRunner> runner_;
    std::unique_ptr<ResourceLimiter> limiter_;
    JsonlLogger* log_;
};

} // namespace tabula
