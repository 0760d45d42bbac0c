#include "../src/DropScanner.hpp"
#include "../src/Errors.hpp"

#include "TestUtils.hpp"

static void testTopLevelListsFilesAndFoldersInOrder() {
    fs::path dir = makeTempDir("scan_top");
    writeFile(dir / "b.pdf", "b");
    writeFile(dir / "a.jpg", "a");
    writeFile(dir / "folder" / "inner.txt", "i");
    fs::create_symlink(dir / "a.jpg", dir / "link.jpg");
    fs::create_symlink(dir / "nowhere", dir / "dangling");

    const std::vector<DropItem> items = DropScanner().scan(dir);

    // symlinks are skipped, nested entries are not listed
    assert(items.size() == 3);
    assert(items[0].path == dir / "a.jpg" && !items[0].isDirectory);
    assert(items[1].path == dir / "b.pdf" && !items[1].isDirectory);
    assert(items[2].path == dir / "folder" && items[2].isDirectory);
    fs::remove_all(dir);
}

static void testRecursiveListsOnlyFiles() {
    fs::path dir = makeTempDir("scan_recursive");
    writeFile(dir / "top.pdf", "t");
    writeFile(dir / "x" / "y" / "deep.mkv", "d");
    fs::create_directories(dir / "empty");

    ScanOptions options;
    options.moveFoldersWhole = false;
    const std::vector<DropItem> items = DropScanner(options).scan(dir);

    assert(items.size() == 2);
    assert(items[0].path == dir / "top.pdf");
    assert(items[1].path == dir / "x" / "y" / "deep.mkv");
    fs::remove_all(dir);
}

static void testUnusableRootThrows() {
    fs::path dir = makeTempDir("scan_errors");
    writeFile(dir / "file.txt", "x");

    assert(throwsA<InvalidDirectory>([&] { DropScanner().scan(dir / "missing"); }));
    assert(throwsA<InvalidDirectory>([&] { DropScanner().scan(dir / "file.txt"); }));
    fs::remove_all(dir);
}

int main() {
    testTopLevelListsFilesAndFoldersInOrder();
    testRecursiveListsOnlyFiles();
    testUnusableRootThrows();
    std::cout << "test_drop_scanner OK" << std::endl;
    return 0;
}
