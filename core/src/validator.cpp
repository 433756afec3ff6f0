#include "tabula/validator.h"
#include "tabula/config.h"
#include "tabula/json_mini.h"
#include "tabula/limiter.h"
#include "tabula/log.h"
#include "tabula/proc.h"
#include "tabula/scratch.h"

#include <json-c/json.h>

#include <cctype>
#include <set>
#include <unordered_set>
#include <utility>

namespace tabula {

namespace {

const std::unordered_set<std::string> kAllowedModules = {
    "pandas", "pd", "numpy", "np", "datetime", "json", "math", "statistics",
    "collections", "re", "itertools", "functools", "operator",
};

// Process control, OS and filesystem access, network clients, object
// serialization that can execute code, SQL clients, dynamic import.
const std::unordered_set<std::string> kDeniedModules = {
    "os", "sys", "subprocess", "shutil", "glob",
    "socket", "urllib", "requests", "http", "ftplib", "smtplib", "telnetlib",
    "pickle", "marshal", "shelve",
    "sqlite3", "mysql", "psycopg2",
    "exec", "eval", "compile", "__import__", "open", "file", "input", "raw_input",
    "importlib", "pkgutil", "imp",
};

// Ordered so stage 3 reports in a stable order.
const char* const kForbiddenFunctions[] = {
    "exec", "eval", "compile", "__import__", "open", "file", "input", "raw_input",
    "getattr", "setattr", "delattr", "hasattr", "globals", "locals", "vars", "dir",
};

const char* const kSpawnMethods[] = {"system", "popen", "call"};

// Runs under `python -I -S -c`, argv[1] is the source file. Prints one JSON
// object: {"ok":true,"facts":[[kind,value],...]} or {"ok":false,"error":...}.
// Identifiers in the tree are already NFKC-normalized by the parser.
const char kTreeScript[] = R"PY(import ast, json, sys

def scan(path):
    with open(path, 'rb') as f:
        src = f.read()
    try:
        tree = ast.parse(src, '<code>')
    except SyntaxError as e:
        msg = e.msg or 'invalid syntax'
        if e.lineno:
            msg = '%s (line %d)' % (msg, e.lineno)
        return {'ok': False, 'error': msg}
    except (ValueError, RecursionError, MemoryError) as e:
        return {'ok': False, 'error': '%s: %s' % (type(e).__name__, e)}
    seen = set()
    facts = []
    def add(kind, value):
        if (kind, value) not in seen:
            seen.add((kind, value))
            facts.append([kind, value])
    for node in ast.walk(tree):
        t = type(node)
        if t is ast.Call:
            if type(node.func) is ast.Name:
                add('call', node.func.id)
            elif type(node.func) is ast.Attribute:
                add('method', node.func.attr)
        elif t is ast.Attribute:
            add('attr', node.attr)
        elif t is ast.Name:
            add('name', node.id)
        elif t is ast.Import:
            for alias in node.names:
                add('import', alias.name)
        elif t is ast.ImportFrom:
            add('from', '.' * node.level + (node.module or ''))
    return {'ok': True, 'facts': facts}

sys.stdout.write(json.dumps(scan(sys.argv[1])) + '\n')
)PY";

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool is_word(char c) {
    return std::isalnum((unsigned char)c) || c == '_';
}

bool is_dunder(const std::string& name) {
    return name.size() > 4 && name.compare(0, 2, "__") == 0 &&
           name.compare(name.size() - 2, 2, "__") == 0;
}

// `[ws]import[ws+]X` or `[ws]from[ws+]X[ws+]import` over [p, end).
bool scan_import_line(const char* p, const char* end, std::string* module) {
    auto keyword = [&](const char* kw, size_t n) {
        return (size_t)(end - p) >= n && std::char_traits<char>::compare(p, kw, n) == 0;
    };
    auto skip_space = [&]() {
        const char* q = p;
        while (p < end && is_space(*p)) p++;
        return p != q;
    };

    (void)skip_space();
    bool from = false;
    if (keyword("import", 6)) {
        p += 6;
    } else if (keyword("from", 4)) {
        p += 4;
        from = true;
    } else {
        return false;
    }
    if (!skip_space()) return false;
    if (p >= end || !(std::isalpha((unsigned char)*p) || *p == '_')) return false;
    const char* b = p;
    while (p < end && (is_word(*p) || *p == '.')) p++;
    std::string name(b, p);
    if (from && (!skip_space() || !keyword("import", 6))) return false;
    *module = std::move(name);
    return true;
}

// Identifier around the first `__..__` pair within one line, or empty.
std::string find_dunder(const std::string& code) {
    const size_t n = code.size();
    size_t line_start = 0;
    while (line_start < n) {
        size_t first = std::string::npos;
        size_t i = line_start;
        for (; i < n && code[i] != '\n'; i++) {
            if (code[i] != '_' || i + 1 >= n || code[i + 1] != '_') continue;
            if (first == std::string::npos) {
                first = i;
                i++;
            } else if (i >= first + 2) {
                size_t b = first;
                while (b > line_start && is_word(code[b - 1])) b--;
                size_t e = first + 2;
                while (e < n && is_word(code[e])) e++;
                std::string word = code.substr(b, e - b);
                if (word.size() > 64) word = word.substr(0, 64) + "...";
                return word;
            }
        }
        line_start = i + 1;
    }
    return "";
}

std::string denied_detail(const std::string& top) {
    return "import of '" + top + "' is denied";
}

std::string not_allowed_detail(const std::string& top) {
    return "import of '" + top + "' is not in the allow-list";
}

std::string call_detail(const std::string& name) {
    return "call to '" + name + "()'";
}

class Collector {
public:
    void add(ViolationKind kind, std::string detail) {
        if (!seen_.insert({(int)kind, detail}).second) return;
        out_.push_back(Violation{kind, std::move(detail)});
    }

    void add_all(std::vector<Violation> vs) {
        for (auto& v : vs) add(v.kind, std::move(v.detail));
    }

    void import_policy(const std::string& top) {
        if (is_denied_module(top)) {
            add(ViolationKind::FORBIDDEN_IMPORT, denied_detail(top));
        } else if (!is_allowed_module(top)) {
            add(ViolationKind::FORBIDDEN_IMPORT, not_allowed_detail(top));
        }
    }

    void from_import_policy(const std::string& module) {
        if (!module.empty() && module[0] == '.') {
            add(ViolationKind::FORBIDDEN_IMPORT, "relative import from '" + module + "' is denied");
        } else {
            import_policy(top_level_module(module));
        }
    }

    std::vector<Violation> take() { return std::move(out_); }

private:
    std::vector<Violation> out_;
    std::set<std::pair<int, std::string>> seen_;
};

// Empty when the code is within bounds.
std::string size_problem(const std::string& code, size_t max_code, size_t max_line) {
    if (code.size() > max_code) {
        return "code is " + std::to_string(code.size()) + " bytes, limit " + std::to_string(max_code);
    }
    size_t line = 1;
    size_t start = 0;
    while (start <= code.size()) {
        size_t end = code.find('\n', start);
        if (end == std::string::npos) end = code.size();
        if (end - start > max_line) {
            return "line " + std::to_string(line) + " is " + std::to_string(end - start) +
                   " bytes, limit " + std::to_string(max_line);
        }
        if (end == code.size()) break;
        start = end + 1;
        line++;
    }
    return "";
}

std::string first_line(const std::string& s, size_t cap) {
    size_t b = 0;
    while (b < s.size() && is_space(s[b])) b++;
    size_t e = s.find('\n', b);
    if (e == std::string::npos) e = s.size();
    std::string line = s.substr(b, e - b);
    if (line.size() > cap) line = line.substr(0, cap) + "...";
    return line;
}

} // namespace

const char* violation_kind_name(ViolationKind k) {
    switch (k) {
        case ViolationKind::FORBIDDEN_IMPORT: return "ForbiddenImport";
        case ViolationKind::FORBIDDEN_FUNCTION_CALL: return "ForbiddenFunctionCall";
        case ViolationKind::FORBIDDEN_ATTRIBUTE_ACCESS: return "ForbiddenAttributeAccess";
        case ViolationKind::SYNTAX_ERROR: return "SyntaxError";
        case ViolationKind::CODE_TOO_LARGE: return "CodeTooLarge";
    }
    return "SyntaxError";
}

std::string ValidationVerdict::summary() const {
    std::string s;
    for (const auto& v : violations) {
        if (!s.empty()) s += "\n";
        s += violation_kind_name(v.kind);
        s += ": ";
        s += v.detail;
    }
    return s;
}

bool is_denied_module(const std::string& top) {
    return kDeniedModules.count(top) > 0;
}

bool is_allowed_module(const std::string& top) {
    return kAllowedModules.count(top) > 0;
}

bool is_forbidden_function(const std::string& name) {
    for (const char* f : kForbiddenFunctions) {
        if (name == f) return true;
    }
    return false;
}

std::string top_level_module(const std::string& dotted) {
    size_t dot = dotted.find('.');
    return dot == std::string::npos ? dotted : dotted.substr(0, dot);
}

std::vector<std::string> extract_imports(const std::string& code) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= code.size()) {
        size_t end = code.find('\n', start);
        if (end == std::string::npos) end = code.size();

        std::string module;
        if (scan_import_line(code.data() + start, code.data() + end, &module)) {
            out.push_back(top_level_module(module));
        }
        if (end == code.size()) break;
        start = end + 1;
    }
    return out;
}

bool has_call_pattern(const std::string& code, const std::string& name, bool after_dot) {
    if (name.empty()) return false;
    size_t pos = 0;
    while ((pos = code.find(name, pos)) != std::string::npos) {
        const bool boundary = after_dot ? (pos > 0 && code[pos - 1] == '.')
                                        : (pos == 0 || !is_word(code[pos - 1]));
        size_t q = pos + name.size();
        while (q < code.size() && is_space(code[q])) q++;
        if (boundary && q < code.size() && code[q] == '(') return true;
        pos++;
    }
    return false;
}

ValidatorOptions validator_options(const SandboxConfig& cfg) {
    ValidatorOptions o;
    o.interpreter = cfg.interpreter;
    o.scratch_dir = cfg.scratch_dir;
    o.max_code_bytes = cfg.max_code_bytes;
    o.max_line_bytes = cfg.max_line_bytes;
    return o;
}

CodeValidator::CodeValidator(JsonlLogger* log)
    : CodeValidator(ValidatorOptions{}, nullptr, log) {}

CodeValidator::CodeValidator(ValidatorOptions opts, JsonlLogger* log)
    : CodeValidator(std::move(opts), nullptr, log) {}

CodeValidator::CodeValidator(ValidatorOptions opts, std::unique_ptr<ProcessRunner> runner,
                             JsonlLogger* log)
    : opts_(std::move(opts)),
      runner_(runner ? std::move(runner) : std::make_unique<ForkProcessRunner>()),
      log_(log) {
    if (opts_.scratch_dir.empty()) opts_.scratch_dir = default_scratch_dir();
#ifdef _WIN32
    limiter_ = std::make_unique<NullResourceLimiter>();
#else
    limiter_ = std::make_unique<PosixResourceLimiter>(opts_.parse_cpu_seconds, opts_.parse_memory_bytes);
#endif
}

CodeValidator::~CodeValidator() = default;
CodeValidator::CodeValidator(CodeValidator&&) noexcept = default;
CodeValidator& CodeValidator::operator=(CodeValidator&&) noexcept = default;

std::vector<Violation> CodeValidator::syntax_tree_stage(const std::string& code) const {
    std::vector<Violation> out;
    auto failed = [&out](const std::string& why) {
        out.push_back(Violation{ViolationKind::SYNTAX_ERROR, "syntax check failed: " + why});
        return out;
    };

    std::string err = ensure_scratch_dir(opts_.scratch_dir);
    if (!err.empty()) return failed(err);
    ScratchFile src;
    err = ScratchFile::create(opts_.scratch_dir, "check_", ".py", code, &src);
    if (!err.empty()) return failed(err);

    ProcLimits lim;
    lim.timeout_ms = opts_.parse_timeout_ms;
    lim.output_max_bytes = opts_.parse_output_max_bytes;

    ProcResult pr;
    const bool started = runner_->run({opts_.interpreter, "-I", "-S", "-c", kTreeScript, src.path()},
                                      opts_.scratch_dir, lim, *limiter_, &pr);
    src.remove();
    if (!started) return failed(pr.error);
    if (pr.timed_out) return failed("parser timed out after " + std::to_string(lim.timeout_ms) + " ms");
    if (pr.output_truncated) return failed("parser output exceeds " + std::to_string(lim.output_max_bytes) + " bytes");

    if (pr.exit_code != 0) {
        std::string why = "parser exited with code " + std::to_string(pr.exit_code);
        const std::string detail = first_line(pr.err, 200);
        if (!detail.empty()) why += ": " + detail;
        return failed(why);
    }

    json_mini::Doc doc;
    json_object* ok = nullptr;
    if (!json_mini::parse_complete(pr.out, &doc) || !json_object_is_type(doc.root, json_type_object) ||
        !json_object_object_get_ex(doc.root, "ok", &ok)) {
        return failed("unreadable parser output");
    }

    if (!json_object_get_boolean(ok)) {
        json_object* e = nullptr;
        const char* msg = json_object_object_get_ex(doc.root, "error", &e) ? json_object_get_string(e) : nullptr;
        out.push_back(Violation{ViolationKind::SYNTAX_ERROR, msg && *msg ? msg : "invalid syntax"});
        return out;
    }

    json_object* facts = nullptr;
    if (!json_object_object_get_ex(doc.root, "facts", &facts) || !json_object_is_type(facts, json_type_array)) {
        return failed("parser output has no facts");
    }

    Collector c;
    const size_t n = json_object_array_length(facts);
    for (size_t i = 0; i < n; i++) {
        json_object* f = json_object_array_get_idx(facts, i);
        if (!json_object_is_type(f, json_type_array) || json_object_array_length(f) != 2) continue;
        json_object* k = json_object_array_get_idx(f, 0);
        json_object* val = json_object_array_get_idx(f, 1);
        if (!json_object_is_type(k, json_type_string) || !json_object_is_type(val, json_type_string)) continue;
        const std::string kind = json_object_get_string(k);
        const std::string value = json_object_get_string(val);

        if (kind == "call") {
            if (is_forbidden_function(value)) c.add(ViolationKind::FORBIDDEN_FUNCTION_CALL, call_detail(value));
        } else if (kind == "method") {
            if (is_forbidden_function(value)) c.add(ViolationKind::FORBIDDEN_FUNCTION_CALL, call_detail(value));
            for (const char* m : kSpawnMethods) {
                if (value == m) c.add(ViolationKind::FORBIDDEN_FUNCTION_CALL, call_detail("." + value));
            }
        } else if (kind == "attr") {
            if (!value.empty() && value[0] == '_') {
                c.add(ViolationKind::FORBIDDEN_ATTRIBUTE_ACCESS, "access to private attribute '" + value + "'");
            }
        } else if (kind == "name") {
            if (is_dunder(value)) c.add(ViolationKind::FORBIDDEN_ATTRIBUTE_ACCESS, "dunder name '" + value + "'");
        } else if (kind == "import") {
            c.import_policy(top_level_module(value));
        } else if (kind == "from") {
            c.from_import_policy(value);
        }
    }
    return c.take();
}

ValidationVerdict CodeValidator::validate(const std::string& code) const {
    Collector c;
    std::vector<std::string> imports;

    const std::string too_large = size_problem(code, opts_.max_code_bytes, opts_.max_line_bytes);
    if (!too_large.empty()) {
        c.add(ViolationKind::CODE_TOO_LARGE, too_large);
    } else {
        // 1-2. imports
        imports = extract_imports(code);
        for (const auto& top : imports) c.import_policy(top);

        // 3. capability builtins
        for (const char* fn : kForbiddenFunctions) {
            if (has_call_pattern(code, fn)) c.add(ViolationKind::FORBIDDEN_FUNCTION_CALL, call_detail(fn));
        }

        // 4. dunders and process-spawning methods
        const std::string dunder = find_dunder(code);
        if (!dunder.empty()) {
            c.add(ViolationKind::FORBIDDEN_ATTRIBUTE_ACCESS, "dunder name '" + dunder + "'");
        }
        for (const char* m : kSpawnMethods) {
            if (has_call_pattern(code, m, true)) {
                c.add(ViolationKind::FORBIDDEN_FUNCTION_CALL, call_detail(std::string(".") + m));
            }
        }

        // 5. syntax tree
        c.add_all(syntax_tree_stage(code));
    }

    ValidationVerdict v;
    v.violations = c.take();
    v.allowed = v.violations.empty();

    if (log_) {
        if (v.allowed) {
            json_object* p = json_object_new_object();
            json_object* arr = json_object_new_array();
            for (const auto& m : imports) json_object_array_add(arr, json_object_new_string(m.c_str()));
            json_object_object_add(p, "imports", arr);
            json_object_object_add(p, "code_bytes", json_object_new_int64((int64_t)code.size()));
            log_->event(LogLevel::DEBUG, "validate.ok", p);
        } else {
            json_object* p = json_object_new_object();
            json_object* arr = json_object_new_array();
            for (const auto& viol : v.violations) {
                json_object* o = json_object_new_object();
                json_object_object_add(o, "kind", json_object_new_string(violation_kind_name(viol.kind)));
                json_object_object_add(o, "detail", json_object_new_string(viol.detail.c_str()));
                json_object_array_add(arr, o);
            }
            json_object_object_add(p, "violations", arr);
            log_->event(LogLevel::WARN, "validate.rejected", p);
        }
    }
    return v;
}

} // namespace tabula
