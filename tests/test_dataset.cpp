#include "test_common.h"
#include "tabula/dataset.h"
#include "tabula/json_mini.h"

#include <json-c/json.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using tabula::Cell;
using tabula::Dataset;
using tabula::DatasetInjector;

static std::string read_all(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static Dataset sample() {
    Dataset ds;
    ds.columns = {"region", "amount"};
    ds.rows.push_back({Cell(std::string("north")), Cell(int64_t(10))});
    ds.rows.push_back({Cell(std::string("south")), Cell(2.5)});
    ds.rows.push_back({Cell(std::string("east")), Cell()});
    return ds;
}

int main() {
    const fs::path tmp = fs::temp_directory_path() / ("tabula_test_dataset_" + std::to_string(getpid()));
    fs::remove_all(tmp);

    // Test 1: to_json shape
    {
        Dataset ds = sample();
        expect_eq_ll((long long)ds.row_count(), 3, "rows");
        expect_eq_ll((long long)ds.column_count(), 2, "columns");
        expect_true(ds.check().empty(), "consistent");

        tabula::json_mini::Doc doc;
        expect_true(tabula::json_mini::parse_complete(ds.to_json(), &doc), "to_json parses");
        json_object* cols = nullptr;
        json_object* data = nullptr;
        expect_true(json_object_object_get_ex(doc.root, "columns", &cols), "columns key");
        expect_true(json_object_object_get_ex(doc.root, "data", &data), "data key");
        expect_eq_ll((long long)json_object_array_length(cols), 2, "columns length");
        expect_eq_ll((long long)json_object_array_length(data), 3, "data length");
        json_object* last = json_object_array_get_idx(json_object_array_get_idx(data, 2), 1);
        expect_true(last == nullptr || json_object_is_type(last, json_type_null), "null cell");
        json_object* amount = json_object_array_get_idx(json_object_array_get_idx(data, 0), 1);
        expect_eq_ll((long long)json_object_get_int64(amount), 10, "int cell");
    }

    // Test 2: from_json accepts the wire form and keeps cell types
    {
        Dataset ds;
        std::string err;
        expect_true(Dataset::from_json(
                        R"({"columns":["a","b","c"],"data":[[1,"x",true],[2.5,null,false]]})", &ds, &err),
                    "from_json: " + err);
        expect_eq_ll((long long)ds.row_count(), 2, "parsed rows");
        expect_true(std::holds_alternative<int64_t>(ds.rows[0][0]), "int kept");
        expect_true(std::holds_alternative<std::string>(ds.rows[0][1]), "string kept");
        expect_true(std::holds_alternative<bool>(ds.rows[0][2]), "bool kept");
        expect_true(std::holds_alternative<double>(ds.rows[1][0]), "double kept");
        expect_true(std::holds_alternative<std::monostate>(ds.rows[1][1]), "null kept");

        Dataset empty;
        expect_true(Dataset::from_json(R"({"columns":[],"data":[]})", &empty, &err), "empty table");
        expect_eq_ll((long long)empty.row_count(), 0, "no rows");
    }

    // Test 3: from_json rejects malformed input
    {
        Dataset ds;
        std::string err;
        expect_true(!Dataset::from_json("not json", &ds, &err), "garbage");
        expect_eq_str(err, "invalid JSON", "garbage err");

        expect_true(!Dataset::from_json("[1,2]", &ds, &err), "array root");
        expect_eq_str(err, "expected an object", "array root err");

        expect_true(!Dataset::from_json(R"({"data":[]})", &ds, &err), "missing columns");
        expect_eq_str(err, "missing 'columns' array", "missing columns err");

        expect_true(!Dataset::from_json(R"({"columns":["a"]})", &ds, &err), "missing data");
        expect_eq_str(err, "missing 'data' array", "missing data err");

        expect_true(!Dataset::from_json(R"({"columns":["a","b"],"data":[[1]]})", &ds, &err), "short row");
        expect_eq_str(err, "row 0 has 1 cells, expected 2", "short row err");

        expect_true(!Dataset::from_json(R"({"columns":["a"],"data":[[[1]]]})", &ds, &err), "nested cell");
        expect_contains(err, "is not a scalar", "nested cell err");
    }

    // Test 4: inject writes one blob; re-inject replaces it
    {
        DatasetInjector inj(tmp.string());
        expect_true(!inj.current(), "nothing injected yet");

        Dataset ds = sample();
        std::string err = inj.inject(ds);
        expect_true(err.empty(), "inject: " + err);
        expect_true(inj.current().has_value(), "current set");
        const std::string first = inj.current()->blob_path;
        expect_true(fs::exists(first), "blob exists");
        expect_true(fs::path(first).filename().string().rfind("dataset_", 0) == 0, "blob prefix");
        expect_eq_ll((long long)inj.current()->row_count, 3, "row count recorded");
        expect_eq_ll((long long)inj.current()->column_count, 2, "column count recorded");

        Dataset back;
        expect_true(Dataset::from_json(read_all(first), &back, &err), "blob parses back: " + err);
        expect_eq_ll((long long)back.row_count(), 3, "blob rows");
        expect_true(std::get<std::string>(back.rows[1][0]) == "south", "blob content");

        Dataset other;
        other.columns = {"x"};
        other.rows.push_back({Cell(int64_t(1))});
        err = inj.inject(other);
        expect_true(err.empty(), "re-inject: " + err);
        const std::string second = inj.current()->blob_path;
        expect_true(second != first, "new blob path");
        expect_true(!fs::exists(first), "old blob removed");
        expect_true(fs::exists(second), "new blob exists");

        // A bad dataset leaves the current one in place.
        Dataset bad;
        bad.columns = {"a", "b"};
        bad.rows.push_back({Cell(int64_t(1))});
        err = inj.inject(bad);
        expect_true(!err.empty(), "bad dataset rejected");
        expect_true(inj.current() && inj.current()->blob_path == second, "previous injection kept");
        expect_true(fs::exists(second), "previous blob kept");

        inj.clear();
        expect_true(!inj.current(), "cleared");
        expect_true(!fs::exists(second), "blob removed on clear");
        inj.clear();
        expect_true(!inj.current(), "clear is idempotent");
    }

    // Test 5: destructor removes the blob
    {
        std::string path;
        {
            DatasetInjector inj(tmp.string());
            expect_true(inj.inject(sample()).empty(), "inject");
            path = inj.current()->blob_path;
            expect_true(fs::exists(path), "blob exists");
        }
        expect_true(!fs::exists(path), "blob removed by destructor");
    }

    // Test 6: prelude
    {
        DatasetInjector inj(tmp.string());
        const std::string base = inj.build_prelude();
        expect_eq_str(base, "import pandas as pd\nimport numpy as np\nfrom datetime import datetime\n", "baseline prelude");
        expect_true(base.find("df") == std::string::npos, "no df without a dataset");

        expect_true(inj.inject(sample()).empty(), "inject");
        const std::string p = inj.build_prelude();
        expect_true(p.find("import pandas as pd\n") != std::string::npos, "pandas in prelude");
        expect_true(p.find(tabula::json_mini::json_quote(inj.current()->blob_path)) != std::string::npos,
                    "blob path quoted in prelude");
        expect_true(p.find("df = pd.DataFrame(") != std::string::npos, "df bound");
        expect_true(p.find("del _tabula_f, _tabula_blob, _tabula_json\n") != std::string::npos,
                    "helpers removed from namespace");

        inj.clear();
        expect_true(inj.build_prelude() == base, "prelude back to baseline after clear");
    }

    fs::remove_all(tmp);
    std::cerr << "test_dataset: ALL PASSED" << std::endl;
    return 0;
}
