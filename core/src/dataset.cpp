#include "tabula/dataset.h"
#include "tabula/json_mini.h"
#include "tabula/log.h"
#include "tabula/scratch.h"

#include <json-c/json.h>

#include <filesystem>
#include <sstream>

namespace tabula {

static json_object* cell_to_json(const Cell& c) {
    switch (c.index()) {
        case 1: return json_object_new_boolean(std::get<bool>(c) ? 1 : 0);
        case 2: return json_object_new_int64(std::get<int64_t>(c));
        case 3: return json_object_new_double(std::get<double>(c));
        case 4: return json_object_new_string(std::get<std::string>(c).c_str());
        default: return nullptr;
    }
}

static bool cell_from_json(json_object* v, Cell* out) {
    if (!v) { *out = std::monostate{}; return true; }
    switch (json_object_get_type(v)) {
        case json_type_null: *out = std::monostate{}; return true;
        case json_type_boolean: *out = (bool)json_object_get_boolean(v); return true;
        case json_type_int: *out = (int64_t)json_object_get_int64(v); return true;
        case json_type_double: *out = json_object_get_double(v); return true;
        case json_type_string: *out = std::string(json_object_get_string(v)); return true;
        default: return false;
    }
}

std::string Dataset::check() const {
    for (size_t i = 0; i < rows.size(); i++) {
        if (rows[i].size() != columns.size()) {
            return "row " + std::to_string(i) + " has " + std::to_string(rows[i].size()) +
                   " cells, expected " + std::to_string(columns.size());
        }
    }
    return "";
}

std::string Dataset::to_json() const {
    json_object* root = json_object_new_object();
    json_object* cols = json_object_new_array();
    for (const auto& c : columns) json_object_array_add(cols, json_object_new_string(c.c_str()));
    json_object_object_add(root, "columns", cols);

    json_object* data = json_object_new_array();
    for (const auto& row : rows) {
        json_object* r = json_object_new_array();
        for (const auto& cell : row) json_object_array_add(r, cell_to_json(cell));
        json_object_array_add(data, r);
    }
    json_object_object_add(root, "data", data);

    std::string out = json_mini::to_string(root);
    json_object_put(root);
    return out;
}

bool Dataset::from_json(const std::string& json, Dataset* out, std::string* err) {
    auto fail = [&](const std::string& m) {
        if (err) *err = m;
        return false;
    };
    json_mini::Doc doc;
    if (!json_mini::parse_complete(json, &doc) || !doc.root) return fail("invalid JSON");
    if (!json_object_is_type(doc.root, json_type_object)) return fail("expected an object");

    json_object* cols = nullptr;
    json_object* data = nullptr;
    if (!json_object_object_get_ex(doc.root, "columns", &cols) ||
        !json_object_is_type(cols, json_type_array)) {
        return fail("missing 'columns' array");
    }
    if (!json_object_object_get_ex(doc.root, "data", &data) ||
        !json_object_is_type(data, json_type_array)) {
        return fail("missing 'data' array");
    }

    Dataset ds;
    const size_t ncols = json_object_array_length(cols);
    for (size_t i = 0; i < ncols; i++) {
        json_object* c = json_object_array_get_idx(cols, i);
        if (!json_object_is_type(c, json_type_string)) {
            return fail("column " + std::to_string(i) + " name is not a string");
        }
        ds.columns.emplace_back(json_object_get_string(c));
    }

    const size_t nrows = json_object_array_length(data);
    ds.rows.reserve(nrows);
    for (size_t r = 0; r < nrows; r++) {
        json_object* row = json_object_array_get_idx(data, r);
        if (!json_object_is_type(row, json_type_array)) {
            return fail("row " + std::to_string(r) + " is not an array");
        }
        std::vector<Cell> cells;
        const size_t n = json_object_array_length(row);
        cells.reserve(n);
        for (size_t i = 0; i < n; i++) {
            Cell cell;
            if (!cell_from_json(json_object_array_get_idx(row, i), &cell)) {
                return fail("row " + std::to_string(r) + " cell " + std::to_string(i) +
                            " is not a scalar");
            }
            cells.push_back(std::move(cell));
        }
        ds.rows.push_back(std::move(cells));
    }

    std::string bad = ds.check();
    if (!bad.empty()) return fail(bad);
    *out = std::move(ds);
    return true;
}

DatasetInjector::DatasetInjector(std::string scratch_dir, JsonlLogger* log)
    : scratch_dir_(std::move(scratch_dir)), log_(log) {}

DatasetInjector::~DatasetInjector() {
    clear();
}

std::string DatasetInjector::inject(const Dataset& ds) {
    std::string err = ds.check();
    if (!err.empty()) return "invalid dataset: " + err;

    err = ensure_scratch_dir(scratch_dir_);
    if (!err.empty()) return err;

    const std::string path =
        (std::filesystem::path(scratch_dir_) / ("dataset_" + make_scratch_token() + ".json")).string();
    err = write_new_file(path, ds.to_json());
    if (!err.empty()) return err;

    // New blob is in place; only now drop the old one.
    clear();
    current_ = InjectedDataset{path, ds.row_count(), ds.column_count()};

    if (log_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "path", json_object_new_string(path.c_str()));
        json_object_object_add(p, "rows", json_object_new_int64((int64_t)ds.row_count()));
        json_object_object_add(p, "columns", json_object_new_int64((int64_t)ds.column_count()));
        log_->event(LogLevel::DEBUG, "dataset.injected", p);
    }
    return "";
}

void DatasetInjector::clear() {
    if (!current_) return;
    std::error_code ec;
    std::filesystem::remove(current_->blob_path, ec);
    if (log_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "path", json_object_new_string(current_->blob_path.c_str()));
        if (ec) json_object_object_add(p, "error", json_object_new_string(ec.message().c_str()));
        log_->event(ec ? LogLevel::WARN : LogLevel::DEBUG, "dataset.cleared", p);
    }
    current_.reset();
}

std::string DatasetInjector::build_prelude() const {
    std::ostringstream oss;
    if (current_) oss << "import json as _tabula_json\n";
    oss << "import pandas as pd\n"
        << "import numpy as np\n"
        << "from datetime import datetime\n";
    if (current_) {
        oss << "with open(" << json_mini::json_quote(current_->blob_path)
            << ", \"r\", encoding=\"utf-8\") as _tabula_f:\n"
            << "    _tabula_blob = _tabula_json.load(_tabula_f)\n"
            << "df = pd.DataFrame(_tabula_blob[\"data\"], columns=_tabula_blob[\"columns\"])\n"
            << "del _tabula_f, _tabula_blob, _tabula_json\n";
    }
    return oss.str();
}

} // namespace tabula
