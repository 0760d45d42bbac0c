#include "../src/CategoryStore.hpp"
#include "../src/Errors.hpp"
#include "../src/SortEngine.hpp"

#include "TestUtils.hpp"

#include <utility>
#include <vector>

namespace {

struct Fixture {
    fs::path root;
    fs::path drop;
    fs::path sorted;
    CategoryStore store;

    explicit Fixture(const std::string& tag)
        : root(makeTempDir(tag)), drop(root / "Drop"), sorted(root / "Sorted"), store(root / "config") {
        fs::create_directories(drop);
        fs::create_directories(sorted);
        // replace the built-in layer so no default category competes for these extensions
        writeFile(store.builtInPath(), R"({"Docs": ["pdf"], "Images": ["jpg"], "Videos": ["mkv"], "Other": []})");
    }

    ~Fixture() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
};

using Calls = std::vector<std::pair<std::size_t, std::size_t>>;

ProgressCallback recordInto(Calls& calls) {
    return [&calls](std::size_t completed, std::size_t total) { calls.emplace_back(completed, total); };
}

} // namespace

static void testScenarioMixedFiles() {
    Fixture fx("engine_mixed");
    writeFile(fx.drop / "report.pdf", "pdf");
    writeFile(fx.drop / "photo.JPG", "jpg");
    writeFile(fx.drop / "movie.mkv", "mkv");

    SortOptions options;
    options.workerThreads = 2;
    const SortEngine engine(fx.store, options);
    Calls calls;
    const SortReport report = engine.sortFolder(fx.drop, fx.sorted, recordInto(calls));

    assert(report.total == 3);
    assert(report.moved == 3);
    assert(report.ok());
    assert(existsRegular(fx.sorted / "Docs" / "report.pdf"));
    assert(existsRegular(fx.sorted / "Images" / "photo.JPG"));
    assert(existsRegular(fx.sorted / "Videos" / "movie.mkv"));
    assert(readFile(fx.sorted / "Docs" / "report.pdf") == "pdf");
    assert(isEmptyDir(fx.drop));

    assert(report.movedPerCategory.at("Images") == 1);
    assert(calls.size() == 3);
    for (std::size_t i = 0; i < calls.size(); ++i) {
        assert(calls[i].first == i + 1);
        assert(calls[i].second == 3);
    }
}

static void testUnknownExtensionGoesToFallback() {
    Fixture fx("engine_unknown");
    writeFile(fx.drop / "weird.xyz", "?");
    writeFile(fx.drop / "noext", "?");

    const SortEngine engine(fx.store);
    const SortReport report = engine.sortFolder(fx.drop, fx.sorted);

    assert(report.moved == 2);
    assert(existsRegular(fx.sorted / kFallbackCategory / "weird.xyz"));
    assert(existsRegular(fx.sorted / kFallbackCategory / "noext"));
    // no folders for categories without items
    assert(!existsDir(fx.sorted / "Docs"));
}

static void testCollisionLeavesSourceInPlace() {
    Fixture fx("engine_collision");
    writeFile(fx.sorted / "Docs" / "report.pdf", "old");
    writeFile(fx.drop / "report.pdf", "new");
    writeFile(fx.drop / "other.pdf", "other");

    const SortEngine engine(fx.store);
    Calls calls;
    const SortReport report = engine.sortFolder(fx.drop, fx.sorted, recordInto(calls));

    assert(report.total == 2);
    assert(report.moved == 1);
    assert(report.failed() == 1);
    assert(report.failures[0].source == fx.drop / "report.pdf");
    assert(report.failures[0].reason.find("already exists") != std::string::npos);

    assert(readFile(fx.drop / "report.pdf") == "new");
    assert(readFile(fx.sorted / "Docs" / "report.pdf") == "old");
    assert(existsRegular(fx.sorted / "Docs" / "other.pdf"));
    assert(!calls.empty() && calls.back() == std::make_pair(std::size_t{2}, std::size_t{2}));
}

static void testExistingNonRegularEntryIsNotReplaced() {
    Fixture fx("engine_nonregular");
    // a dangling symlink and an empty folder already occupy the targets
    fs::create_directories(fx.sorted / "Docs");
    fs::create_symlink(fx.root / "nowhere", fx.sorted / "Docs" / "report.pdf");
    fs::create_directories(fx.sorted / kFallbackCategory / "project");
    writeFile(fx.drop / "report.pdf", "new");
    writeFile(fx.drop / "project" / "readme.md", "r");

    const SortEngine engine(fx.store);
    const SortReport report = engine.sortFolder(fx.drop, fx.sorted);

    assert(report.total == 2);
    assert(report.moved == 0);
    assert(report.failed() == 2);
    for (const auto& failure : report.failures) {
        assert(failure.reason.find("already exists") != std::string::npos);
    }

    assert(readFile(fx.drop / "report.pdf") == "new");
    assert(existsRegular(fx.drop / "project" / "readme.md"));
    assert(fs::is_symlink(fs::symlink_status(fx.sorted / "Docs" / "report.pdf")));
    assert(isEmptyDir(fx.sorted / kFallbackCategory / "project"));
}

static void testFolderMovedWhole() {
    Fixture fx("engine_folder");
    writeFile(fx.drop / "project" / "main.pdf", "a");
    writeFile(fx.drop / "project" / "nested" / "img.jpg", "b");

    const SortEngine engine(fx.store);
    const SortReport report = engine.sortFolder(fx.drop, fx.sorted);

    assert(report.total == 1);
    assert(report.moved == 1);
    assert(existsRegular(fx.sorted / kFallbackCategory / "project" / "main.pdf"));
    assert(existsRegular(fx.sorted / kFallbackCategory / "project" / "nested" / "img.jpg"));
    assert(!existsDir(fx.sorted / "Docs"));
    assert(isEmptyDir(fx.drop));
}

static void testRecursiveModeSplitsFolders() {
    Fixture fx("engine_recursive");
    writeFile(fx.drop / "project" / "main.pdf", "a");
    writeFile(fx.drop / "project" / "nested" / "img.jpg", "b");
    writeFile(fx.drop / "a" / "same.pdf", "first");
    writeFile(fx.drop / "b" / "same.pdf", "second");

    SortOptions options;
    options.scan.moveFoldersWhole = false;
    const SortEngine engine(fx.store, options);
    const SortReport report = engine.sortFolder(fx.drop, fx.sorted);

    assert(report.total == 4);
    assert(report.moved == 3);
    assert(existsRegular(fx.sorted / "Docs" / "main.pdf"));
    assert(existsRegular(fx.sorted / "Images" / "img.jpg"));

    // both same.pdf files target Docs/same.pdf; the first in path order wins
    assert(readFile(fx.sorted / "Docs" / "same.pdf") == "first");
    assert(report.failed() == 1);
    assert(report.failures[0].source == fx.drop / "b" / "same.pdf");
    assert(existsRegular(fx.drop / "b" / "same.pdf"));

    // folders themselves stay behind
    assert(existsDir(fx.drop / "project" / "nested"));
}

static void testEmptySourceIsIdempotent() {
    Fixture fx("engine_empty");
    const SortEngine engine(fx.store);

    for (int run = 0; run < 2; ++run) {
        Calls calls;
        const SortReport report = engine.sortFolder(fx.drop, fx.sorted, recordInto(calls));
        assert(report.total == 0);
        assert(report.moved == 0);
        assert(calls.size() == 1);
        assert(calls[0].first == 0 && calls[0].second == 0);
        assert(report.summary() == "Nothing to sort.");
    }
}

static void testCategoryEditsApplyNextCycle() {
    Fixture fx("engine_reload");
    const SortEngine engine(fx.store);

    writeFile(fx.drop / "notes.txt", "1");
    engine.sortFolder(fx.drop, fx.sorted);
    assert(existsRegular(fx.sorted / kFallbackCategory / "notes.txt"));

    CategoryMap categories = fx.store.loadCategories();
    categories["Text"] = {"txt"};
    fx.store.saveUserCategories(categories);

    writeFile(fx.drop / "todo.txt", "2");
    engine.sortFolder(fx.drop, fx.sorted);
    assert(existsRegular(fx.sorted / "Text" / "todo.txt"));
}

static void testMalformedConfigFallsBackToDefaults() {
    Fixture fx("engine_badconfig");
    writeFile(fx.store.userPath(), "{{{");
    writeFile(fx.drop / "song.mp3", "la");

    const SortEngine engine(fx.store);
    const SortReport report = engine.sortFolder(fx.drop, fx.sorted);

    assert(!report.configWarning.empty());
    assert(report.moved == 1);
    assert(existsRegular(fx.sorted / "Music" / "song.mp3"));
}

static void testStructuralErrors() {
    Fixture fx("engine_structural");
    const SortEngine engine(fx.store);

    assert(throwsA<InvalidDirectory>([&] { engine.sortFolder(fx.root / "missing", fx.sorted); }));
    assert(throwsA<InvalidDirectory>([&] { engine.sortFolder(fx.drop, fx.root / "missing"); }));

    writeFile(fx.root / "file.txt", "x");
    assert(throwsA<InvalidDirectory>([&] { engine.sortFolder(fx.root / "file.txt", fx.sorted); }));

    fs::create_directories(fx.drop / "Sorted");
    assert(throwsA<InvalidDirectory>([&] { engine.sortFolder(fx.drop, fx.drop / "Sorted"); }));
    assert(throwsA<InvalidDirectory>([&] { engine.sortFolder(fx.drop, fx.drop); }));
}

static void testCategoryFolderCreationFailureIsPerItem() {
    Fixture fx("engine_mkdir");
    // a regular file where the Docs folder should go
    writeFile(fx.sorted / "Docs", "blocker");
    writeFile(fx.drop / "report.pdf", "pdf");
    writeFile(fx.drop / "photo.jpg", "jpg");

    const SortEngine engine(fx.store);
    Calls calls;
    const SortReport report = engine.sortFolder(fx.drop, fx.sorted, recordInto(calls));

    assert(report.total == 2);
    assert(report.moved == 1);
    assert(report.failed() == 1);
    assert(existsRegular(fx.drop / "report.pdf"));
    assert(existsRegular(fx.sorted / "Images" / "photo.jpg"));
    assert(calls.back().first == 2 && calls.back().second == 2);
}

static void testManyFilesInParallel() {
    Fixture fx("engine_many");
    for (int i = 0; i < 200; ++i) {
        writeFile(fx.drop / ("file" + std::to_string(i) + (i % 2 == 0 ? ".pdf" : ".jpg")), std::to_string(i));
    }

    SortOptions options;
    options.workerThreads = 8;
    const SortEngine engine(fx.store, options);
    Calls calls;
    const SortReport report = engine.sortFolder(fx.drop, fx.sorted, recordInto(calls));

    assert(report.moved == 200);
    assert(report.movedPerCategory.at("Docs") == 100);
    assert(report.movedPerCategory.at("Images") == 100);
    assert(calls.size() == 200);
    assert(calls.back().first == 200);
    assert(isEmptyDir(fx.drop));
}

int main() {
    testScenarioMixedFiles();
    testUnknownExtensionGoesToFallback();
    testCollisionLeavesSourceInPlace();
    testExistingNonRegularEntryIsNotReplaced();
    testFolderMovedWhole();
    testRecursiveModeSplitsFolders();
    testEmptySourceIsIdempotent();
    testCategoryEditsApplyNextCycle();
    testMalformedConfigFallsBackToDefaults();
    testStructuralErrors();
    testCategoryFolderCreationFailureIsPerItem();
    testManyFilesInParallel();
    std::cout << "test_sort_engine OK" << std::endl;
    return 0;
}
