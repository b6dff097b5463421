#pragma once

#include "types.hpp"

#include <cstdint>
#include <filesystem>

namespace packfetch {

struct CacheInfo {
    std::size_t total_resources{0};
    std::size_t cached_resources{0};
    std::uint64_t cached_bytes{0};

    [[nodiscard]] bool complete() const { return total_resources > 0 && cached_resources == total_resources; }
};

// On-disk home of downloaded resources. Transfers stream into "<key>.part" and are
// renamed to "<key>" once complete.
class ResourceCache {
public:
    explicit ResourceCache(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::filesystem::path finalPath(const ResourceDescriptor& descriptor) const;
    [[nodiscard]] std::filesystem::path partialPath(const ResourceDescriptor& descriptor) const;

    // A resource counts as cached when its final file exists with the expected size.
    [[nodiscard]] bool isCached(const ResourceDescriptor& descriptor) const;
    [[nodiscard]] std::uint64_t partialSize(const ResourceDescriptor& descriptor) const;
    [[nodiscard]] CacheInfo inspect(const PackageManifest& manifest) const;

    // Throws std::filesystem::filesystem_error.
    void prepare(const ResourceDescriptor& descriptor) const;
    void commit(const ResourceDescriptor& descriptor) const;
    void discardPartial(const ResourceDescriptor& descriptor) const;

    // Removes everything below the root. Returns the number of bytes freed.
    std::uint64_t clear() const;
    [[nodiscard]] std::uint64_t usedBytes() const;

private:
    std::filesystem::path root_;
};

} // namespace packfetch
