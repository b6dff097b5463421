#include "packfetch/errors.hpp"
#include "packfetch/manifest_resolver.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace packfetch;
using namespace packfetch::test;

TEST(ManifestResolverTest, BuiltinCatalogHasThreeTiers) {
    const auto resolver = ManifestResolver::builtin("https://offline.example.org/");
    EXPECT_EQ(resolver.tiers(), (std::vector<std::string>{"full", "minimal", "standard"}));

    const auto minimal = resolver.resolve("minimal");
    EXPECT_EQ(minimal.tier, "minimal");
    ASSERT_EQ(minimal.resources.size(), 5u);
    EXPECT_EQ(minimal.resources.front().id, "transformers.js");
    EXPECT_EQ(minimal.resources.front().source_url,
              "https://offline.example.org/offline/packages/minimal/transformers.js");
    EXPECT_EQ(minimal.resources.front().destination_key, "libraries/transformers.js");

    std::uint64_t sum = 0;
    for (const auto& descriptor : minimal.resources) {
        ASSERT_TRUE(descriptor.expected_bytes.has_value());
        sum += *descriptor.expected_bytes;
    }
    EXPECT_EQ(minimal.total_expected_bytes, sum);
}

TEST(ManifestResolverTest, BuiltinTiersCoverAllComponentGroups) {
    const auto resolver = ManifestResolver::builtin("http://localhost");
    for (const auto& tier : resolver.tiers()) {
        const auto manifest = resolver.resolve(tier);
        EXPECT_EQ(manifest.componentGroups(), (std::vector<ComponentGroup>{
                                                  ComponentGroup::Libraries, ComponentGroup::Model,
                                                  ComponentGroup::SearchIndex}))
            << tier;
    }
    EXPECT_GT(resolver.resolve("full").total_expected_bytes, resolver.resolve("standard").total_expected_bytes);
    EXPECT_GT(resolver.resolve("standard").total_expected_bytes, resolver.resolve("minimal").total_expected_bytes);
}

TEST(ManifestResolverTest, UnknownTierThrowsInvalidTier) {
    const auto resolver = ManifestResolver::builtin("http://localhost");
    try {
        (void)resolver.resolve("enormous");
        FAIL() << "expected InvalidTierError";
    } catch (const InvalidTierError& ex) {
        EXPECT_EQ(ex.tier(), "enormous");
    }
}

TEST(ManifestResolverTest, ParsesManifestDocument) {
    const auto resolver = ManifestResolver::fromJson(R"({
        "tiny": { "resources": [
            { "id": "lib", "url": "http://h/lib.js", "bytes": 10, "componentGroup": "libraries" },
            { "id": "idx", "url": "http://h/idx.db", "bytes": null, "componentGroup": "searchIndex",
              "destination": "search/index.db", "resumable": false },
            { "id": "mdl", "url": "http://h/m.bin", "bytes": 90, "componentGroup": "model" }
        ] }
    })");

    const auto manifest = resolver.resolve("tiny");
    ASSERT_EQ(manifest.resources.size(), 3u);
    EXPECT_EQ(manifest.total_expected_bytes, 100u);

    const auto* lib = manifest.find("lib");
    ASSERT_NE(lib, nullptr);
    EXPECT_EQ(lib->destination_key, "libraries/lib");
    EXPECT_TRUE(lib->supports_resume);

    const auto* idx = manifest.find("idx");
    ASSERT_NE(idx, nullptr);
    EXPECT_FALSE(idx->expected_bytes.has_value());
    EXPECT_FALSE(idx->supports_resume);
    EXPECT_EQ(idx->destination_key, "search/index.db");
    EXPECT_EQ(manifest.find("missing"), nullptr);
}

TEST(ManifestResolverTest, RejectsMalformedDocuments) {
    EXPECT_THROW((void)ManifestResolver::fromJson("{not json"), ManifestError);
    EXPECT_THROW((void)ManifestResolver::fromJson("[1, 2]"), ManifestError);
    EXPECT_THROW((void)ManifestResolver::fromJson(R"({"t": {"files": []}})"), ManifestError);
    EXPECT_THROW((void)ManifestResolver::fromJson(
                     R"({"t": {"resources": [{"id": "a", "url": "u", "bytes": 1, "componentGroup": "video"}]}})"),
                 ManifestError);
    EXPECT_THROW((void)ManifestResolver::fromJson(
                     R"({"t": {"resources": [{"id": "a", "url": "u", "bytes": -5, "componentGroup": "model"}]}})"),
                 ManifestError);
}

TEST(ManifestResolverTest, ValidatesEntriesOnResolve) {
    TierCatalog catalog;
    catalog["dupes"] = {makeResource("a", ComponentGroup::Model, 1), makeResource("a", ComponentGroup::Model, 2)};
    auto escaping = makeResource("b", ComponentGroup::Model, 1);
    escaping.destination_key = "../outside.bin";
    catalog["escape"] = {escaping};
    auto absolute = makeResource("c", ComponentGroup::Model, 1);
    absolute.destination_key = "/etc/passwd";
    catalog["absolute"] = {absolute};
    auto no_url = makeResource("d", ComponentGroup::Model, 1);
    no_url.source_url.clear();
    catalog["nourl"] = {no_url};
    catalog["unsized"] = {makeResource("e", ComponentGroup::Model, std::nullopt)};

    const ManifestResolver resolver{catalog};
    for (const auto& tier : {"dupes", "escape", "absolute", "nourl", "unsized"}) {
        EXPECT_THROW((void)resolver.resolve(tier), ManifestError) << tier;
    }
}

TEST(ManifestResolverTest, ReadsManifestFile) {
    TempDir dir;
    const auto path = dir / "manifest.json";
    {
        std::ofstream out(path);
        out << R"({"one": {"resources": [{"id": "x", "url": "file:///x", "bytes": 3, "componentGroup": "model"}]}})";
    }
    const auto resolver = ManifestResolver::fromFile(path);
    EXPECT_EQ(resolver.resolve("one").total_expected_bytes, 3u);
    EXPECT_THROW((void)ManifestResolver::fromFile(dir / "absent.json"), ManifestError);
}

TEST(ManifestResolverTest, AcceptsSizesAboveTheSignedRange) {
    const auto resolver = ManifestResolver::fromJson(R"({
        "huge": { "resources": [
            { "id": "blob", "url": "http://h/blob", "bytes": 18446744073709551000, "componentGroup": "model" }
        ] }
    })");
    const auto manifest = resolver.resolve("huge");
    EXPECT_EQ(manifest.resources[0].expected_bytes, std::optional<std::uint64_t>(18446744073709551000ULL));
    EXPECT_EQ(manifest.total_expected_bytes, 18446744073709551000ULL);
}

TEST(ManifestResolverTest, RejectsTotalsThatWouldOverflow) {
    const auto resolver = ManifestResolver::fromJson(R"({
        "wrap": { "resources": [
            { "id": "a", "url": "http://h/a", "bytes": 18446744073709551615, "componentGroup": "model" },
            { "id": "b", "url": "http://h/b", "bytes": 1, "componentGroup": "libraries" }
        ] }
    })");
    EXPECT_THROW((void)resolver.resolve("wrap"), ManifestError);
}

TEST(ManifestResolverTest, ParsesAndValidatesChecksums) {
    const auto resolver = ManifestResolver::fromJson(R"({
        "ok": { "resources": [
            { "id": "a", "url": "http://h/a", "bytes": 3, "componentGroup": "model",
              "sha256": "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD" },
            { "id": "b", "url": "http://h/b", "bytes": 5, "componentGroup": "libraries" }
        ] },
        "bad": { "resources": [
            { "id": "c", "url": "http://h/c", "bytes": 3, "componentGroup": "model", "sha256": "abc123" }
        ] }
    })");

    const auto manifest = resolver.resolve("ok");
    EXPECT_EQ(manifest.resources[0].sha256,
              std::optional<std::string>("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    EXPECT_FALSE(manifest.resources[1].sha256.has_value());
    EXPECT_THROW((void)resolver.resolve("bad"), ManifestError);

    EXPECT_THROW((void)ManifestResolver::fromJson(R"({
        "t": { "resources": [ { "id": "d", "url": "u", "bytes": 1, "componentGroup": "model", "sha256": 7 } ] }
    })"), ManifestError);
}
