#include "packfetch/manifest_resolver.hpp"

#include "packfetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace packfetch {

namespace {

constexpr std::uint64_t KiB = 1024;
constexpr std::uint64_t MiB = KiB * 1024;

struct BuiltinEntry {
    const char* id;
    const char* filename;
    ComponentGroup group;
    std::uint64_t bytes;
};

std::string_view groupDirectory(ComponentGroup group) {
    switch (group) {
        case ComponentGroup::Libraries:
            return "libraries";
        case ComponentGroup::Model:
            return "models";
        case ComponentGroup::SearchIndex:
            return "search";
    }
    return "misc";
}

std::vector<ResourceDescriptor> buildTier(const std::string& origin, const std::string& tier,
                                          std::initializer_list<BuiltinEntry> entries) {
    std::vector<ResourceDescriptor> resources;
    resources.reserve(entries.size());
    for (const auto& entry : entries) {
        ResourceDescriptor descriptor;
        descriptor.id = entry.id;
        descriptor.source_url = fmt::format("{}/offline/packages/{}/{}", origin, tier, entry.filename);
        descriptor.expected_bytes = entry.bytes;
        descriptor.component_group = entry.group;
        descriptor.destination_key = fmt::format("{}/{}", groupDirectory(entry.group), entry.filename);
        resources.push_back(std::move(descriptor));
    }
    return resources;
}

bool isSafeDestination(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    const std::filesystem::path path{key};
    if (path.is_absolute() || path.has_root_name()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

bool isSha256Digest(const std::string& digest) {
    return digest.size() == 64 && std::all_of(digest.begin(), digest.end(), [](unsigned char c) {
               return std::isdigit(c) || (c >= 'a' && c <= 'f');
           });
}

ResourceDescriptor parseResource(const nlohmann::json& node, const std::string& tier) {
    if (!node.is_object()) {
        throw ManifestError(fmt::format("Tier '{}': resource entry is not an object", tier));
    }

    ResourceDescriptor descriptor;
    descriptor.id = node.value("id", std::string{});
    descriptor.source_url = node.value("url", std::string{});

    const auto group_name = node.value("componentGroup", std::string{});
    const auto group = componentGroupFromString(group_name);
    if (!group) {
        throw ManifestError(fmt::format("Tier '{}': resource '{}' has unknown component group '{}'",
                                        tier, descriptor.id, group_name));
    }
    descriptor.component_group = *group;

    const auto bytes = node.find("bytes");
    if (bytes != node.end() && !bytes->is_null()) {
        if (!bytes->is_number_integer()) {
            throw ManifestError(fmt::format("Tier '{}': resource '{}' has a non-numeric size", tier, descriptor.id));
        }
        if (!bytes->is_number_unsigned() && bytes->get<std::int64_t>() < 0) {
            throw ManifestError(fmt::format("Tier '{}': resource '{}' has a negative size", tier, descriptor.id));
        }
        descriptor.expected_bytes = bytes->get<std::uint64_t>();
    }

    const auto sha256 = node.find("sha256");
    if (sha256 != node.end() && !sha256->is_null()) {
        if (!sha256->is_string()) {
            throw ManifestError(
                fmt::format("Tier '{}': resource '{}' has a non-string sha256", tier, descriptor.id));
        }
        auto digest = sha256->get<std::string>();
        std::transform(digest.begin(), digest.end(), digest.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        descriptor.sha256 = std::move(digest);
    }

    descriptor.destination_key = node.value(
        "destination", fmt::format("{}/{}", groupDirectory(descriptor.component_group), descriptor.id));
    descriptor.supports_resume = node.value("resumable", true);
    return descriptor;
}

} // namespace

ManifestResolver::ManifestResolver(TierCatalog catalog) : catalog_(std::move(catalog)) {}

ManifestResolver ManifestResolver::builtin(const std::string& origin_url) {
    std::string origin = origin_url;
    while (!origin.empty() && origin.back() == '/') {
        origin.pop_back();
    }

    const auto libraries = {
        BuiltinEntry{"transformers.js", "transformers.js", ComponentGroup::Libraries, 2560 * KiB},
        BuiltinEntry{"sql-wasm.js", "sql-wasm.js", ComponentGroup::Libraries, 1228 * KiB},
        BuiltinEntry{"tokenizers.js", "tokenizers.js", ComponentGroup::Libraries, 820 * KiB},
    };

    TierCatalog catalog;
    catalog["minimal"] = buildTier(origin, "minimal", libraries);
    catalog["standard"] = buildTier(origin, "standard", libraries);
    catalog["full"] = buildTier(origin, "full", libraries);

    auto append = [](std::vector<ResourceDescriptor>& into, std::vector<ResourceDescriptor> more) {
        into.insert(into.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
    };
    append(catalog["minimal"], buildTier(origin, "minimal", {
        {"tinybert-model", "tinybert-uncased.bin", ComponentGroup::Model, 17 * MiB},
        {"wikipedia-subset", "wikipedia-subset-20mb.db", ComponentGroup::SearchIndex, 20 * MiB},
    }));
    append(catalog["standard"], buildTier(origin, "standard", {
        {"phi3-mini-model", "phi3-mini-q4.onnx", ComponentGroup::Model, 500 * MiB},
        {"simple-wikipedia", "simple-wikipedia-50mb.db", ComponentGroup::SearchIndex, 50 * MiB},
    }));
    append(catalog["full"], buildTier(origin, "full", {
        {"phi3-mini-model", "phi3-mini-q4.onnx", ComponentGroup::Model, 500 * MiB},
        {"extended-models", "extended-models.bin", ComponentGroup::Model, 1000 * MiB},
        {"extended-wikipedia", "extended-wikipedia-200mb.db", ComponentGroup::SearchIndex, 200 * MiB},
    }));

    return ManifestResolver{std::move(catalog)};
}

ManifestResolver ManifestResolver::fromJson(const std::string& document) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(document);
    } catch (const nlohmann::json::exception& ex) {
        throw ManifestError(std::string{"Invalid manifest document: "} + ex.what());
    }

    if (!root.is_object()) {
        throw ManifestError("Manifest document must map tiers to resource lists");
    }

    TierCatalog catalog;
    try {
        for (const auto& [tier, body] : root.items()) {
            if (!body.is_object() || !body.contains("resources") || !body["resources"].is_array()) {
                throw ManifestError(fmt::format("Tier '{}' has no resources array", tier));
            }
            auto& resources = catalog[tier];
            for (const auto& node : body["resources"]) {
                resources.push_back(parseResource(node, tier));
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        throw ManifestError(std::string{"Malformed manifest entry: "} + ex.what());
    }

    return ManifestResolver{std::move(catalog)};
}

ManifestResolver ManifestResolver::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ManifestError("Cannot open manifest file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return fromJson(buffer.str());
}

PackageManifest ManifestResolver::resolve(const std::string& tier) const {
    const auto it = catalog_.find(tier);
    if (it == catalog_.end()) {
        throw InvalidTierError(tier);
    }

    PackageManifest manifest;
    manifest.tier = tier;
    manifest.resources = it->second;

    std::set<std::string> ids;
    for (const auto& descriptor : manifest.resources) {
        if (descriptor.id.empty()) {
            throw ManifestError(fmt::format("Tier '{}' contains a resource without an id", tier));
        }
        if (!ids.insert(descriptor.id).second) {
            throw ManifestError(fmt::format("Tier '{}' lists resource '{}' twice", tier, descriptor.id));
        }
        if (descriptor.source_url.empty()) {
            throw ManifestError(fmt::format("Resource '{}' has no source URL", descriptor.id));
        }
        if (!isSafeDestination(descriptor.destination_key)) {
            throw ManifestError(fmt::format("Resource '{}' has an unsafe destination '{}'",
                                            descriptor.id, descriptor.destination_key));
        }
        if (descriptor.sha256 && !isSha256Digest(*descriptor.sha256)) {
            throw ManifestError(fmt::format("Resource '{}' has a malformed sha256 '{}'",
                                            descriptor.id, *descriptor.sha256));
        }
        const auto bytes = descriptor.expected_bytes.value_or(0);
        if (bytes > std::numeric_limits<std::uint64_t>::max() - manifest.total_expected_bytes) {
            throw ManifestError(fmt::format("Tier '{}' has a total size too large to represent", tier));
        }
        manifest.total_expected_bytes += bytes;
    }

    // Percentages divide by this total.
    if (manifest.total_expected_bytes == 0) {
        throw ManifestError(fmt::format("Tier '{}' has no known total size", tier));
    }
    return manifest;
}

std::vector<std::string> ManifestResolver::tiers() const {
    std::vector<std::string> names;
    names.reserve(catalog_.size());
    for (const auto& entry : catalog_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace packfetch
