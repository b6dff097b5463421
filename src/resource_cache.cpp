#include "packfetch/resource_cache.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace packfetch {

ResourceCache::ResourceCache(fs::path root) : root_(std::move(root)) {}

fs::path ResourceCache::finalPath(const ResourceDescriptor& descriptor) const {
    return root_ / fs::path{descriptor.destination_key}.lexically_normal();
}

fs::path ResourceCache::partialPath(const ResourceDescriptor& descriptor) const {
    auto path = finalPath(descriptor);
    path += ".part";
    return path;
}

bool ResourceCache::isCached(const ResourceDescriptor& descriptor) const {
    std::error_code ec;
    const auto path = finalPath(descriptor);
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    if (!descriptor.expected_bytes) {
        return true;
    }
    const auto size = fs::file_size(path, ec);
    return !ec && size == *descriptor.expected_bytes;
}

std::uint64_t ResourceCache::partialSize(const ResourceDescriptor& descriptor) const {
    std::error_code ec;
    const auto size = fs::file_size(partialPath(descriptor), ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

CacheInfo ResourceCache::inspect(const PackageManifest& manifest) const {
    CacheInfo info;
    info.total_resources = manifest.resources.size();
    for (const auto& descriptor : manifest.resources) {
        if (isCached(descriptor)) {
            ++info.cached_resources;
            std::error_code ec;
            const auto size = fs::file_size(finalPath(descriptor), ec);
            if (!ec) {
                info.cached_bytes += size;
            }
        }
    }
    return info;
}

void ResourceCache::prepare(const ResourceDescriptor& descriptor) const {
    fs::create_directories(partialPath(descriptor).parent_path());
}

void ResourceCache::commit(const ResourceDescriptor& descriptor) const {
    const auto target = finalPath(descriptor);
    std::error_code ec;
    fs::remove(target, ec);
    fs::rename(partialPath(descriptor), target);
}

void ResourceCache::discardPartial(const ResourceDescriptor& descriptor) const {
    std::error_code ec;
    fs::remove(partialPath(descriptor), ec);
    if (ec) {
        spdlog::warn("Failed to remove partial file {}: {}", partialPath(descriptor).string(), ec.message());
    }
}

std::uint64_t ResourceCache::clear() const {
    const auto freed = usedBytes();
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return 0;
    }
    for (const auto& entry : fs::directory_iterator(root_)) {
        fs::remove_all(entry.path());
    }
    spdlog::info("Cleared offline cache at {}", root_.string());
    return freed;
}

std::uint64_t ResourceCache::usedBytes() const {
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return 0;
    }

    std::uint64_t total = 0;
    for (auto it = fs::recursive_directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code size_ec;
        if (it->is_regular_file(size_ec)) {
            const auto size = it->file_size(size_ec);
            if (!size_ec) {
                total += size;
            }
        }
    }
    return total;
}

} // namespace packfetch
