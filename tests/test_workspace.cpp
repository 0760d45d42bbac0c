#include "../src/Errors.hpp"
#include "../src/SettingsParser.hpp"
#include "../src/Workspace.hpp"

#include "TestUtils.hpp"

#include <vector>

static void testEnsureCreatesLayout() {
    fs::path dir = makeTempDir("ws_layout");
    Workspace workspace(dir);
    workspace.ensure();

    assert(existsDir(dir / "Drop"));
    assert(existsDir(dir / "Sorted"));
    assert(existsDir(workspace.configDir()));
    assert(workspace.configDir().parent_path() == workspace.appDir());

    // idempotent
    workspace.ensure();
    fs::remove_all(dir);
}

static void testEnsureRejectsBadRoots() {
    assert(throwsA<NoLocationFound>([] { Workspace{fs::path{}}.ensure(); }));

    fs::path dir = makeTempDir("ws_bad");
    assert(throwsA<NoLocationFound>([&] { Workspace(dir / "missing").ensure(); }));

    writeFile(dir / "file.txt", "x");
    assert(throwsA<InvalidDirectory>([&] { Workspace(dir / "file.txt").ensure(); }));
    fs::remove_all(dir);
}

static void testMarkerRoundTrip() {
    fs::path dir = makeTempDir("ws_marker");
    const fs::path markerFile = dir / "state" / "workspace.txt";

    assert(!marker::load(markerFile).has_value());

    marker::save(markerFile, dir);
    const auto loaded = marker::load(markerFile);
    assert(loaded.has_value());
    assert(fs::equivalent(*loaded, dir));
    assert(loaded->is_absolute());

    // a stale path is ignored
    writeFile(markerFile, (dir / "gone").string() + "\n");
    assert(!marker::load(markerFile).has_value());
    fs::remove_all(dir);
}

static void testRecentWorkspacesDedupAndCap() {
    fs::path dir = makeTempDir("ws_recent");
    const RecentWorkspaces recent(dir / "recent_workspaces.txt");
    assert(recent.load().empty());

    std::vector<fs::path> workspaces;
    for (int i = 0; i < 7; ++i) {
        workspaces.push_back(dir / ("ws" + std::to_string(i)));
        recent.add(workspaces.back());
    }

    std::vector<fs::path> entries = recent.load();
    assert(entries.size() == RecentWorkspaces::kMaxEntries);
    assert(entries.front() == workspaces[6]);
    assert(entries.back() == workspaces[2]);

    // re-adding moves to the front without duplicating
    entries = recent.add(workspaces[4]);
    assert(entries.size() == RecentWorkspaces::kMaxEntries);
    assert(entries[0] == workspaces[4]);
    assert(entries[1] == workspaces[6]);
    assert(entries[2] == workspaces[5]);
    assert(recent.load() == entries);

    // one path per line, most recent first
    const std::string text = readFile(dir / "recent_workspaces.txt");
    assert(text.rfind(workspaces[4].string() + "\n", 0) == 0);
    fs::remove_all(dir);
}

static void testSettingsDefaultsAndOverrides() {
    fs::path dir = makeTempDir("ws_settings");
    SettingsParser parser;

    assert(parser.load(dir / "settings.json"));
    assert(parser.settings().intervalSeconds == 5);
    assert(parser.settings().moveFoldersWhole);

    writeFile(dir / "settings.json",
              R"({"interval_seconds": 30, "worker_threads": 2, "move_folders_whole": false, "log_level": "DEBUG"})");
    assert(parser.load(dir / "settings.json"));
    assert(parser.settings().intervalSeconds == 30);
    assert(parser.settings().workerThreads == 2);
    assert(!parser.settings().moveFoldersWhole);
    assert(parser.settings().logLevel == "DEBUG");

    writeFile(dir / "settings.json", R"({"interval_seconds": 0})");
    assert(!parser.load(dir / "settings.json"));
    assert(parser.settings().intervalSeconds == 5);

    // out of int range must be rejected rather than wrapped into a small interval
    writeFile(dir / "settings.json", R"({"interval_seconds": 4294967301})");
    assert(!parser.load(dir / "settings.json"));
    assert(parser.settings().intervalSeconds == 5);

    writeFile(dir / "settings.json", "[1, 2");
    assert(!parser.load(dir / "settings.json"));
    assert(parser.settings().workerThreads == 0);
    fs::remove_all(dir);
}

int main() {
    testEnsureCreatesLayout();
    testEnsureRejectsBadRoots();
    testMarkerRoundTrip();
    testRecentWorkspacesDedupAndCap();
    testSettingsDefaultsAndOverrides();
    std::cout << "test_workspace OK" << std::endl;
    return 0;
}
