// Session naming, snapshot helpers and the retention sweep.
#include "safetynet/session_store.hpp"
#include "fakes.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>

using namespace safetynet;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

static void touch(const fs::path& p, const std::string& text = "x") {
    std::ofstream out(p);
    out << text;
}

static fs::path make_session(const fs::path& root, Clock::time_point started,
                             const std::vector<std::string>& files) {
    fs::path dir = root / format_session_id(started);
    fs::create_directories(dir);
    for (const auto& f : files) touch(dir / f);
    return dir;
}

static void test_session_id_format() {
    const auto now = Clock::now();
    const std::string id = format_session_id(now);
    assert(id.size() == 15);
    assert(id[8] == '-');

    auto parsed = parse_session_id(id);
    assert(parsed.has_value());
    // Second precision only.
    assert(now - *parsed < 1s);
    assert(*parsed - now < 1s);
    assert(format_session_id(*parsed) == id);

    assert(!parse_session_id("").has_value());
    assert(!parse_session_id("notes").has_value());
    assert(!parse_session_id("20240115093000").has_value());
    assert(!parse_session_id("20240115-0930").has_value());
    assert(!parse_session_id("2024011a-093000").has_value());
    assert(!parse_session_id("20240115-093000.bak").has_value());
    assert(parse_session_id("20240115-093000").has_value());

    // Lexicographic order follows chronological order.
    assert(format_session_id(now - 24h * 3) < format_session_id(now));
}

static void test_snapshot_names_stay_inside_session_dir() {
    assert(snapshot_file_name("Untitled Document 1") == "Untitled Document 1");
    assert(snapshot_file_name("a/b") == "a_b");
    assert(snapshot_file_name("..") == "__");
    assert(snapshot_file_name("") == "untitled");

    StoreLayout layout {"/tmp/store", "20240115-093000"};
    assert(layout.sessionDir() == fs::path("/tmp/store/20240115-093000"));
    assert(layout.snapshotPath("../../etc/passwd").parent_path() == layout.sessionDir());
}

static void test_sweep_removes_only_expired_sessions() {
    const fs::path root = testing::make_temp_dir("safetynet-sweep-");
    const auto now = Clock::now();

    const fs::path old_dir = make_session(root, now - 24h * 50, {"Untitled Document 1", "Untitled Document 2"});
    const fs::path mid_dir = make_session(root, now - 24h * 20, {"Untitled Document 1"});
    const fs::path new_dir = make_session(root, now - 24h * 1, {"Untitled Document 3"});

    SessionStore store(StoreLayout {root, format_session_id(now)});
    const SweepReport r = store.sweepOldSessions(now);

    assert(r.scanned == 3);
    assert(r.removed == 1);
    assert(r.kept == 2);
    assert(r.failed == 0);
    assert(!fs::exists(old_dir));
    assert(fs::exists(mid_dir / "Untitled Document 1"));
    assert(testing::read_file(mid_dir / "Untitled Document 1") == "x");
    assert(fs::exists(new_dir / "Untitled Document 3"));

    fs::remove_all(root);
}

static void test_sweep_boundary_is_inclusive() {
    const fs::path root = testing::make_temp_dir("safetynet-boundary-");
    const auto now = Clock::now();
    const fs::path exact = make_session(root, now - kRetention, {"a"});
    const fs::path younger = make_session(root, now - kRetention + 1h, {"b"});

    SessionStore store(StoreLayout {root, format_session_id(now)});
    const SweepReport r = store.sweepOldSessions(now);

    assert(r.removed == 1);
    assert(!fs::exists(exact));
    assert(fs::exists(younger));
    fs::remove_all(root);
}

static void test_sweep_missing_root_is_not_an_error() {
    const fs::path root = testing::make_temp_dir("safetynet-missing-") / "does-not-exist";
    SessionStore store(StoreLayout {root, format_session_id(Clock::now())});
    const SweepReport r = store.sweepOldSessions();
    assert(r.scanned == 0 && r.removed == 0 && r.failed == 0);
    assert(!fs::exists(root));
    fs::remove_all(root.parent_path());
}

static void test_sweep_skips_foreign_entries_and_live_session() {
    const fs::path root = testing::make_temp_dir("safetynet-foreign-");
    const auto now = Clock::now();

    fs::create_directories(root / "backups");
    touch(root / "backups" / "keep-me");
    touch(root / "README");
    // A live session id that is somehow old must still survive.
    const fs::path live = make_session(root, now - 24h * 60, {"Untitled Document 1"});
    const fs::path stale = make_session(root, now - 24h * 40, {"Untitled Document 9"});

    SessionStore store(StoreLayout {root, live.filename().string()});
    const SweepReport r = store.sweepOldSessions(now);

    assert(r.removed == 1);
    assert(r.skipped == 3);
    assert(fs::exists(root / "backups" / "keep-me"));
    assert(fs::exists(root / "README"));
    assert(fs::exists(live / "Untitled Document 1"));
    assert(!fs::exists(stale));
    fs::remove_all(root);
}

static void test_sweep_reports_partial_failure() {
    const fs::path root = testing::make_temp_dir("safetynet-stuck-");
    const auto now = Clock::now();

    // Sessions only ever hold flat files; a nested directory cannot be removed.
    const fs::path stuck = make_session(root, now - 24h * 60, {"Untitled Document 1"});
    fs::create_directories(stuck / "nested");
    touch(stuck / "nested" / "x");
    const fs::path stale = make_session(root, now - 24h * 40, {"Untitled Document 2"});

    SessionStore store(StoreLayout {root, format_session_id(now)});
    const SweepReport r = store.sweepOldSessions(now);

    assert(r.scanned == 2);
    assert(r.failed == 1);
    assert(r.removed == 1);
    assert(fs::exists(stuck / "nested" / "x"));
    assert(!fs::exists(stuck / "Untitled Document 1"));
    assert(!fs::exists(stale));
    fs::remove_all(root);
}

static void test_list_skips_partial_files() {
    assert(partial_file_name("Untitled Document 1") == ".Untitled Document 1.partial");
    assert(is_partial_file(".Untitled Document 1.partial"));
    assert(!is_partial_file("Untitled Document 1"));
    assert(!is_partial_file("notes.partial"));
    assert(!is_partial_file(".partial"));

    const fs::path root = testing::make_temp_dir("safetynet-list-");
    const fs::path dir = make_session(root, Clock::now() - 24h, {"Untitled Document 1"});
    // Left behind by a write that never reached its rename.
    touch(dir / partial_file_name("Untitled Document 2"), "half");

    SessionStore store(StoreLayout {root, format_session_id(Clock::now())});
    const auto sessions = store.listSessions();
    assert(sessions.size() == 1);
    assert(sessions[0].files == std::vector<std::string>{"Untitled Document 1"});
    fs::remove_all(root);
}

static void test_snapshot_helpers() {
    const fs::path root = testing::make_temp_dir("safetynet-snap-");
    SessionStore store(StoreLayout {root, "20240115-093000"});
    const fs::path file = store.layout().snapshotPath("Untitled Document 1");

    // Session dir is lazy.
    assert(!fs::exists(store.layout().sessionDir()));
    assert(store.ensureSessionDir());
    assert(fs::is_directory(store.layout().sessionDir()));

    assert(store.writeSnapshot(file, "first"));
    assert(store.writeSnapshot(file, "second\nline"));
    assert(testing::read_file(file) == "second\nline");
    // Only the snapshot remains; no partial files.
    assert(std::distance(fs::directory_iterator(store.layout().sessionDir()), fs::directory_iterator()) == 1);

    auto sessions = store.listSessions();
    assert(sessions.size() == 1);
    assert(sessions[0].sessionId == "20240115-093000");
    assert(sessions[0].files == std::vector<std::string>{"Untitled Document 1"});

    assert(store.removeSnapshot(file));
    assert(!fs::exists(file));
    // Removing a missing snapshot is fine.
    assert(store.removeSnapshot(file));
    assert(store.removeSessionDirIfEmpty());
    assert(!fs::exists(store.layout().sessionDir()));
    assert(fs::exists(root));

    fs::remove_all(root);
}

int main() {
    test_session_id_format();
    test_snapshot_names_stay_inside_session_dir();
    test_sweep_removes_only_expired_sessions();
    test_sweep_boundary_is_inclusive();
    test_sweep_missing_root_is_not_an_error();
    test_sweep_skips_foreign_entries_and_live_session();
    test_sweep_reports_partial_failure();
    test_list_skips_partial_files();
    test_snapshot_helpers();
    return 0;
}
