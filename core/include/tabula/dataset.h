#pragma once

// In-memory table and its one-time injection into the scratch directory.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tabula {

class JsonlLogger;

// null, bool, integer, float, text
using Cell = std::variant<std::monostate, bool, int64_t, double, std::string>;

struct Dataset {
    std::vector<std::string> columns;
    std::vector<std::vector<Cell>> rows;

    size_t row_count() const { return rows.size(); }
    size_t column_count() const { return columns.size(); }

    // Every row must have exactly column_count() cells.
    // Returns empty string if consistent.
    std::string check() const;

    // {"columns":[...],"data":[[...],...]}
    std::string to_json() const;

    // Parse the to_json() form. Nested arrays/objects in cells are rejected.
    static bool from_json(const std::string& json, Dataset* out, std::string* err);
};

struct InjectedDataset {
    std::string blob_path;
    size_t row_count{0};
    size_t column_count{0};
};

// Writes a dataset blob once and produces the script prelude that loads it
// as `df`. Not safe to call inject/clear concurrently with executions that
// use build_prelude().
class DatasetInjector {
public:
    explicit DatasetInjector(std::string scratch_dir, JsonlLogger* log = nullptr);
    ~DatasetInjector();

    DatasetInjector(const DatasetInjector&) = delete;
    DatasetInjector& operator=(const DatasetInjector&) = delete;

    // Replaces any previous injection. On failure the previous dataset stays
    // active. Returns empty on success.
    std::string inject(const Dataset& ds);

    // Deletes the blob and forgets it. Idempotent.
    void clear();

    // Baseline imports, plus loading `df` when a dataset is injected.
    std::string build_prelude() const;

    const std::optional<InjectedDataset>& current() const { return current_; }

private:
    std::string scratch_dir_;
    JsonlLogger* log_;
    std::optional<InjectedDataset> current_;
};

} // namespace tabula
