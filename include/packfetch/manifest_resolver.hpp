#pragma once

#include "types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace packfetch {

using TierCatalog = std::map<std::string, std::vector<ResourceDescriptor>>;

// Turns a tier name into a validated, ordered manifest. Performs no network I/O;
// catalogs come from the built-in table or from a manifest document fetched elsewhere.
class ManifestResolver {
public:
    explicit ManifestResolver(TierCatalog catalog);

    // Tiers minimal, standard and full, served below origin_url.
    [[nodiscard]] static ManifestResolver builtin(const std::string& origin_url);

    // Parses the manifest endpoint shape:
    //   { "<tier>": { "resources": [ { "id", "url", "bytes", "componentGroup",
    //                                  "destination"?, "resumable"? } ] } }
    [[nodiscard]] static ManifestResolver fromJson(const std::string& document);
    [[nodiscard]] static ManifestResolver fromFile(const std::filesystem::path& path);

    // Throws InvalidTierError for unknown tiers and ManifestError for invalid entries.
    [[nodiscard]] PackageManifest resolve(const std::string& tier) const;
    [[nodiscard]] std::vector<std::string> tiers() const;

private:
    TierCatalog catalog_;
};

} // namespace packfetch
