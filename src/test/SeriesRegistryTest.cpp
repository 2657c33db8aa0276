#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include "domain/Errors.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SeriesRegistryFs.hpp"

using namespace coversync;
using namespace coversync::infrastructure;
namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void TestPersistenceWrites(const fs::path& root) {
    PersistenceService persistence;
    const fs::path target = root / "note.txt";
    persistence.saveTextAsync(target.string(), "first");
    persistence.saveTextAsync(target.string(), "second");
    persistence.flush();
    assert(ReadFile(target) == "second");
    for (const auto& entry : fs::directory_iterator(root)) {
        assert(entry.path().extension() != ".tmp");
    }

    // The parent "directory" is a regular file.
    persistence.saveTextAsync((target / "x.txt").string(), "lost");
    persistence.flush();
    assert(persistence.failedWrites() == 1);

    persistence.stop();
    persistence.saveTextAsync(target.string(), "after stop");
    assert(ReadFile(target) == "second");
    assert(persistence.failedWrites() == 2);
    std::cout << "[PASS] Atomic writes, failures counted." << std::endl;
}

void TestRegistryRoundTrip(const fs::path& root) {
    const fs::path file = root / "series.json";
    {
        PersistenceService persistence;
        SeriesRegistryFs registry(file.string(), persistence);
        assert(!registry.seriesName(1));

        registry.registerSeries(1, "Amazing Spider-Man");
        registry.registerSeries(2, "Saga");
        registry.recordIdentifiers(1, {"10"}, {"2127"});
        registry.recordIdentifiers(1, {"10"}, {});
        registry.recordIdentifiers(1, {}, {"2127", "9999"});
        registry.recordDescription(2, "Space opera.");

        auto ids = registry.identifiers(1);
        assert(ids.mirrorIds.size() == 1);
        assert(ids.catalogIds.size() == 2);
        assert(registry.identifiers(42).mirrorIds.empty());
        persistence.flush();
    }

    PersistenceService persistence;
    SeriesRegistryFs reloaded(file.string(), persistence);
    assert(reloaded.seriesName(1) == std::string("Amazing Spider-Man"));
    assert(reloaded.identifiers(1).catalogIds.count("9999") == 1);
    assert(reloaded.identifiers(1).mirrorIds.count("10") == 1);
    assert(reloaded.description(2) == std::string("Space opera."));
    assert(!reloaded.description(1));
    std::cout << "[PASS] Registry survives a reload." << std::endl;
}

void TestMalformedRegistry(const fs::path& root) {
    const fs::path file = root / "broken.json";
    {
        std::ofstream out(file);
        out << R"({"series": [{"name": "no id"}]})";
    }
    PersistenceService persistence;
    bool rejected = false;
    try {
        SeriesRegistryFs registry(file.string(), persistence);
    } catch (const domain::ConfigError&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[PASS] Malformed registry file rejected." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Series Registry Test..." << std::endl;
    const fs::path root = fs::temp_directory_path() / "coversync_registry_test";
    fs::remove_all(root);
    fs::create_directories(root);

    TestPersistenceWrites(root);
    TestRegistryRoundTrip(root);
    TestMalformedRegistry(root);

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
