#include "test_common.h"
#include "tabula/scratch.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string read_all(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static void make_old(const fs::path& p) {
    fs::last_write_time(p, fs::file_time_type::clock::now() - std::chrono::hours(2));
}

int main() {
    const fs::path tmp = fs::temp_directory_path() / ("tabula_test_scratch_" + std::to_string(getpid()));
    fs::remove_all(tmp);

    // Test 1: tokens are unique, also across threads
    {
        std::set<std::string> seen;
        for (int i = 0; i < 1000; i++) {
            expect_true(seen.insert(tabula::make_scratch_token()).second, "duplicate token");
        }
        const std::string t = tabula::make_scratch_token();
        expect_true(t.rfind(std::to_string(getpid()) + "_", 0) == 0, "token starts with pid: " + t);

        std::vector<std::string> a, b;
        std::thread ta([&] { for (int i = 0; i < 500; i++) a.push_back(tabula::make_scratch_token()); });
        std::thread tb([&] { for (int i = 0; i < 500; i++) b.push_back(tabula::make_scratch_token()); });
        ta.join();
        tb.join();
        std::set<std::string> all(a.begin(), a.end());
        all.insert(b.begin(), b.end());
        expect_eq_ll((long long)all.size(), 1000, "threaded tokens unique");
    }

    // Test 2: scratch dir creation
    {
        expect_true(!tabula::ensure_scratch_dir("").empty(), "empty dir rejected");
        std::string err = tabula::ensure_scratch_dir(tmp.string());
        expect_true(err.empty(), "ensure dir: " + err);
        expect_true(fs::is_directory(tmp), "dir exists");
        err = tabula::ensure_scratch_dir(tmp.string());
        expect_true(err.empty(), "ensure dir is idempotent: " + err);

        const fs::path file = tmp / "plain_file";
        expect_true(tabula::write_new_file(file.string(), "x").empty(), "plain file");
        expect_true(!tabula::ensure_scratch_dir(file.string()).empty(), "file is not a directory");
        fs::remove(file);

        struct stat st;
        expect_true(::stat(tmp.c_str(), &st) == 0, "stat new dir");
        expect_eq_ll((long long)(st.st_mode & 07777), 0711, "new dir mode");
    }

    // Test 2b: an existing shared directory keeps its mode
    {
        const fs::path shared = tmp / "shared";
        fs::create_directories(shared);
        fs::permissions(shared, fs::perms::all | fs::perms::sticky_bit, fs::perm_options::replace);
        std::string err = tabula::ensure_scratch_dir(shared.string());
        expect_true(err.empty(), "ensure existing dir: " + err);
        struct stat st;
        expect_true(::stat(shared.c_str(), &st) == 0, "stat shared dir");
        expect_eq_ll((long long)(st.st_mode & 07777), 01777, "sticky world-writable mode untouched");

        const fs::path nested = shared / "tabula";
        err = tabula::ensure_scratch_dir(nested.string());
        expect_true(err.empty(), "nested dir: " + err);
        expect_true(::stat(nested.c_str(), &st) == 0, "stat nested");
        expect_eq_ll((long long)(st.st_mode & 07777), 0711, "created leaf gets 0711");
        expect_true(::stat(shared.c_str(), &st) == 0, "stat shared again");
        expect_eq_ll((long long)(st.st_mode & 07777), 01777, "parent still untouched");
        fs::remove_all(shared);
    }

    // Test 3: exclusive create
    {
        const std::string p = (tmp / "excl.txt").string();
        std::string err = tabula::write_new_file(p, "hello");
        expect_true(err.empty(), "write_new_file: " + err);
        expect_true(read_all(p) == "hello", "content written");

        struct stat st;
        expect_true(::stat(p.c_str(), &st) == 0, "stat");
        expect_eq_ll((long long)(st.st_mode & 0777), 0600, "owner-only mode");

        err = tabula::write_new_file(p, "other");
        expect_true(!err.empty(), "existing file refused");
        expect_true(read_all(p) == "hello", "existing content untouched");
        fs::remove(p);

        err = tabula::write_new_file((tmp / "missing_dir" / "x").string(), "y");
        expect_true(!err.empty(), "missing parent reported");
    }

    // Test 4: ScratchFile owns its file
    {
        std::string path;
        {
            tabula::ScratchFile f;
            expect_true(f.empty(), "default empty");
            std::string err = tabula::ScratchFile::create(tmp.string(), "script_", ".py", "print(1)\n", &f);
            expect_true(err.empty(), "create: " + err);
            path = f.path();
            expect_true(fs::path(path).filename().string().rfind("script_", 0) == 0, "prefix");
            expect_true(fs::path(path).extension() == ".py", "suffix");
            expect_true(read_all(path) == "print(1)\n", "content");
        }
        expect_true(!fs::exists(path), "removed by destructor");

        tabula::ScratchFile a;
        expect_true(tabula::ScratchFile::create(tmp.string(), "script_", ".py", "", &a).empty(), "create a");
        path = a.path();
        tabula::ScratchFile b(std::move(a));
        expect_true(a.empty(), "moved-from is empty");
        expect_true(b.path() == path && fs::exists(path), "move keeps the file");
        b.remove();
        expect_true(!fs::exists(path), "explicit remove");
        b.remove();
        expect_true(b.empty(), "remove twice is safe");

        tabula::ScratchFile c;
        std::string err = tabula::ScratchFile::create((tmp / "nope").string(), "script_", ".py", "x", &c);
        expect_true(!err.empty(), "create in missing dir fails");
        expect_true(c.empty(), "no path on failure");
    }

    // Test 5: sweep removes only old files we own
    {
        const fs::path old_script = tmp / "script_old.py";
        const fs::path old_blob = tmp / "dataset_old.json";
        const fs::path kept_blob = tmp / "dataset_kept.json";
        const fs::path fresh = tmp / "script_fresh.py";
        const fs::path foreign = tmp / "notes_old.txt";
        for (const auto& p : {old_script, old_blob, kept_blob, fresh, foreign}) {
            expect_true(tabula::write_new_file(p.string(), "x").empty(), "seed " + p.string());
        }
        make_old(old_script);
        make_old(old_blob);
        make_old(kept_blob);
        make_old(foreign);

        tabula::SweepStats st = tabula::sweep_scratch_dir(tmp.string(), 3600, {"script_", "dataset_"},
                                                          {kept_blob.string()});
        expect_eq_ll((long long)st.scanned, 3, "scanned owned, non-kept files");
        expect_eq_ll((long long)st.removed, 2, "removed old files");
        expect_eq_ll((long long)st.failed, 0, "no failures");
        expect_true(!fs::exists(old_script) && !fs::exists(old_blob), "old files gone");
        expect_true(fs::exists(kept_blob), "kept blob survives");
        expect_true(fs::exists(fresh), "fresh file survives");
        expect_true(fs::exists(foreign), "foreign file survives");

        st = tabula::sweep_scratch_dir((tmp / "does_not_exist").string(), 0, {"script_"});
        expect_eq_ll((long long)st.scanned, 0, "missing dir is a no-op");
    }

    fs::remove_all(tmp);
    std::cerr << "test_scratch: ALL PASSED" << std::endl;
    return 0;
}
