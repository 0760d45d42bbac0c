#include "../src/CategoryStore.hpp"
#include "../src/Classifier.hpp"

#include "TestUtils.hpp"

#include <algorithm>
#include <cctype>

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static void testEveryMappedExtensionClassifies() {
    const CategoryMap categories = CategoryStore::builtInDefaults();
    const Classifier classifier(categories);

    for (const auto& [name, extensions] : categories) {
        for (const auto& ext : extensions) {
            for (const std::string& query : {ext, "." + ext, upper(ext), "." + upper(ext)}) {
                const Classification result = classifier.classify(query);
                assert(result.found);
                assert(result.category == name);
            }
            const Classification byPath = classifier.classifyPath("some file." + upper(ext));
            assert(byPath.found && byPath.category == name);
        }
    }
}

static void testUnknownExtensionFallsBack() {
    const Classifier classifier(CategoryMap{{"Docs", {"pdf"}}});

    Classification result = classifier.classify("xyz");
    assert(!result.found);
    assert(result.category == kFallbackCategory);

    result = classifier.classify("");
    assert(!result.found && result.category == kFallbackCategory);

    result = classifier.classifyPath("README");
    assert(!result.found && result.category == kFallbackCategory);

    result = classifier.classifyPath(".bashrc");
    assert(!result.found && result.category == kFallbackCategory);
}

static void testStoredExtensionsAreNormalized() {
    const Classifier classifier(CategoryMap{{"Images", {".JPG", " Png "}}});
    assert(classifier.classify("jpg").category == "Images");
    assert(classifier.classify(".png").category == "Images");
    assert(classifier.extensionCount() == 2);
}

static void testLastExtensionDecides() {
    const Classifier classifier(CategoryMap{{"Archive", {"gz"}}, {"Docs", {"tar"}}});
    assert(classifier.classifyPath("backup.tar.gz").category == "Archive");
}

static void testDuplicateExtensionTieBreakIsAlphabetical() {
    const Classifier classifier(CategoryMap{{"Zeta", {"dat"}}, {"Alpha", {"DAT"}}});
    const Classification result = classifier.classify("dat");
    assert(result.found);
    assert(result.category == "Alpha");
}

int main() {
    testEveryMappedExtensionClassifies();
    testUnknownExtensionFallsBack();
    testStoredExtensionsAreNormalized();
    testLastExtensionDecides();
    testDuplicateExtensionTieBreakIsAlphabetical();
    std::cout << "test_classifier OK" << std::endl;
    return 0;
}
