#include "tabula/config.h"
#include "tabula/dataset.h"
#include "tabula/json_mini.h"
#include "tabula/log.h"
#include "tabula/outcome.h"
#include "tabula/sandbox.h"
#include "tabula/scratch.h"
#include "tabula/validator.h"

#include <json-c/json.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace tabula;

// "-" reads stdin.
static bool slurp(const std::string& path, std::string* out) {
    std::ostringstream ss;
    if (path == "-") {
        ss << std::cin.rdbuf();
    } else {
        std::ifstream f(path, std::ios::binary);
        if (!f) return false;
        ss << f.rdbuf();
    }
    *out = ss.str();
    return true;
}

static void print_json(json_object* o) {
    std::cout << json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN) << "\n";
    json_object_put(o);
}

static json_object* violations_to_json(const std::vector<Violation>& vs) {
    json_object* arr = json_object_new_array();
    for (const auto& v : vs) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "kind", json_object_new_string(violation_kind_name(v.kind)));
        json_object_object_add(o, "detail", json_object_new_string(v.detail.c_str()));
        json_object_array_add(arr, o);
    }
    return arr;
}

static bool load_config(SandboxConfig* cfg) {
    apply_profile_defaults(detect_profile());
    *cfg = load_sandbox_config();
    std::string err = validate_config(*cfg);
    if (!err.empty()) {
        std::cerr << "[config] " << err << "\n";
        return false;
    }
    return true;
}

static int cmd_validate(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: tabula_cli validate <script.py|->\n";
        return 2;
    }
    std::string code;
    if (!slurp(argv[2], &code)) {
        std::cerr << "[validate] cannot open " << argv[2] << "\n";
        return 2;
    }
    SandboxConfig cfg;
    if (!load_config(&cfg)) return 2;
    auto log = make_env_logger();
    CodeValidator validator(validator_options(cfg), log.get());
    ValidationVerdict v = validator.validate(code);

    json_object* out = json_object_new_object();
    json_object_object_add(out, "allowed", json_object_new_boolean(v.allowed ? 1 : 0));
    json_object_object_add(out, "violations", violations_to_json(v.violations));
    print_json(out);
    return v.allowed ? 0 : 1;
}

static int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: tabula_cli run <script.py|-> [dataset.json]\n";
        return 2;
    }
    std::string code;
    if (!slurp(argv[2], &code)) {
        std::cerr << "[run] cannot open " << argv[2] << "\n";
        return 2;
    }

    SandboxConfig cfg;
    if (!load_config(&cfg)) return 2;
    auto log = make_env_logger();
    ProcessSandbox sandbox(cfg, log.get());

    if (argc >= 4) {
        std::string js;
        if (!slurp(argv[3], &js)) {
            std::cerr << "[run] cannot open dataset " << argv[3] << "\n";
            return 2;
        }
        Dataset ds;
        std::string err;
        if (!Dataset::from_json(js, &ds, &err)) {
            std::cerr << "[run] bad dataset " << argv[3] << ": " << err << "\n";
            return 2;
        }
        err = sandbox.inject(ds);
        if (!err.empty()) {
            std::cerr << "[run] inject failed: " << err << "\n";
            return 3;
        }
    }

    ExecutionResult r = sandbox.execute(code);
    Outcome o = interpret(r);

    json_object* out = json_object_new_object();
    json_object_object_add(out, "outcome", json_object_new_string(outcome_kind_name(o.kind)));
    json_object_object_add(out, "status", json_object_new_string(exec_status_name(r.status)));
    json_object_object_add(out, "exit_code", json_object_new_int(r.exit_code));
    json_object_object_add(out, "duration_ms", json_object_new_int64(r.duration_ms));
    if (o.is_json) {
        // Doc keeps its reference; the output object takes a new one.
        json_object_object_add(out, "result", o.json.root ? json_object_get(o.json.root) : nullptr);
    } else {
        json_object_object_add(out, "result", json_object_new_string(o.text.c_str()));
    }
    if (o.kind != OutcomeKind::SUCCESS) {
        json_object_object_add(out, "error", json_object_new_string(o.text.c_str()));
    }
    if (!r.violations.empty()) {
        json_object_object_add(out, "violations", violations_to_json(r.violations));
    }
    if (r.output_truncated) json_object_object_add(out, "truncated", json_object_new_boolean(1));
    print_json(out);

    return o.kind == OutcomeKind::SUCCESS ? 0 : 1;
}

static int cmd_sweep(int, char**) {
    SandboxConfig cfg;
    if (!load_config(&cfg)) return 2;
    SweepStats st = sweep_scratch_dir(cfg.scratch_dir, cfg.sweep_max_age_seconds,
                                      {"script_", "dataset_", "check_"});

    json_object* out = json_object_new_object();
    json_object_object_add(out, "scratch_dir", json_object_new_string(cfg.scratch_dir.c_str()));
    json_object_object_add(out, "scanned", json_object_new_int64((int64_t)st.scanned));
    json_object_object_add(out, "removed", json_object_new_int64((int64_t)st.removed));
    json_object_object_add(out, "failed", json_object_new_int64((int64_t)st.failed));
    print_json(out);
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "tabula_cli <validate|run|sweep> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "validate") return cmd_validate(argc, argv);
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "sweep") return cmd_sweep(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
