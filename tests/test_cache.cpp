#include <catch2/catch.hpp>
#include <rosid/manifest_cache.hpp>
#include "test_helpers.hpp"

#include <map>

using namespace rosid;

// Loader that counts calls per path and hands out canned manifests
struct CountingLoader {
    std::map<std::string, int> calls;
    std::map<std::string, std::string> manifests;  // path -> package.xml

    ManifestCache::Loader loader() {
        return [this](const std::string& path) -> std::shared_ptr<Manifest> {
            ++calls[path];
            auto it = manifests.find(path);
            if (it == manifests.end()) return nullptr;
            auto parsed = Manifest::parse(it->second);
            if (parsed.is_err()) return nullptr;
            auto pkg = std::make_shared<Manifest>(std::move(parsed).value());
            if (pkg->evaluate_conditions({}).is_err()) return nullptr;
            return pkg;
        };
    }
};

TEST_CASE("normalize strips trailing separators and dot segments", "[cache]") {
    REQUIRE(ManifestCache::normalize("/ws/src/pkg/") == "/ws/src/pkg");
    REQUIRE(ManifestCache::normalize("/ws/src/./pkg") == "/ws/src/pkg");
    REQUIRE(ManifestCache::normalize("/ws/src/other/../pkg") == "/ws/src/pkg");
    REQUIRE(ManifestCache::normalize("/") == "/");
}

TEST_CASE("normalize makes relative paths absolute", "[cache]") {
    auto n = ManifestCache::normalize("some/rel");
    REQUIRE(std::filesystem::path(n).is_absolute());
}

TEST_CASE("each path is loaded once", "[cache]") {
    CountingLoader counting;
    counting.manifests["/ws/src/a"] = package_xml("a");
    ManifestCache cache(counting.loader());

    const CacheEntry& first = cache.lookup_or_load("/ws/src/a");
    const CacheEntry& second = cache.lookup_or_load("/ws/src/a/");
    REQUIRE(&first == &second);
    REQUIRE(counting.calls["/ws/src/a"] == 1);
    REQUIRE(first.package != nullptr);
    REQUIRE(first.package->name == "a");
    REQUIRE(first.build_type.value() == "catkin");
}

TEST_CASE("absence of a manifest is cached", "[cache]") {
    CountingLoader counting;
    ManifestCache cache(counting.loader());

    for (int i = 0; i < 3; ++i) {
        const CacheEntry& entry = cache.lookup_or_load("/ws/src/empty");
        REQUIRE(entry.package == nullptr);
        REQUIRE_FALSE(entry.build_type.has_value());
    }
    REQUIRE(counting.calls["/ws/src/empty"] == 1);
    REQUIRE(cache.size() == 1);
}

TEST_CASE("unclassifiable manifests keep the package but no build type", "[cache]") {
    CountingLoader counting;
    counting.manifests["/ws/src/twice"] = package_xml("twice",
        "  <export><build_type>cmake</build_type><build_type>ament_cmake</build_type></export>\n");
    ManifestCache cache(counting.loader());

    std::string output = capture_stderr([&] {
        const CacheEntry& entry = cache.lookup_or_load("/ws/src/twice");
        REQUIRE(entry.package != nullptr);
        REQUIRE_FALSE(entry.build_type.has_value());
    });
    REQUIRE(output.find("more than one build type") != std::string::npos);

    // The warning is not repeated on a cache hit
    output = capture_stderr([&] { cache.lookup_or_load("/ws/src/twice"); });
    REQUIRE(output.empty());
}

TEST_CASE("find does not load", "[cache]") {
    CountingLoader counting;
    ManifestCache cache(counting.loader());

    REQUIRE(cache.find("/ws/src/a") == nullptr);
    REQUIRE(counting.calls.empty());

    cache.lookup_or_load("/ws/src/a");
    REQUIRE(cache.find("/ws/src/a/") != nullptr);
}

TEST_CASE("clear forgets every entry", "[cache]") {
    CountingLoader counting;
    ManifestCache cache(counting.loader());

    cache.lookup_or_load("/ws/src/a");
    cache.clear();
    REQUIRE(cache.size() == 0);
    cache.lookup_or_load("/ws/src/a");
    REQUIRE(counting.calls["/ws/src/a"] == 2);
}

TEST_CASE("default loader reads package.xml from disk", "[cache]") {
    TempDir td;
    td.write_file("pkg/package.xml", package_xml("on_disk",
        "  <export><build_type>ament_cmake</build_type></export>\n"));
    ManifestCache cache;

    const CacheEntry& entry = cache.lookup_or_load(td.path / "pkg");
    REQUIRE(entry.package != nullptr);
    REQUIRE(entry.package->name == "on_disk");
    REQUIRE(entry.build_type.value() == "ament_cmake");
}
