#pragma once

#include "resource_cache.hpp"
#include "transfer_executor.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace packfetch {

struct TransferOptions {
    // Abort when no byte arrives for this long; long but steady transfers never time out.
    std::chrono::seconds inactivity_timeout{30};
    std::chrono::seconds connect_timeout{20};
    std::chrono::milliseconds progress_interval{200};
    std::string user_agent{"packfetch/1.0"};
};

class CurlTransferExecutor final : public TransferExecutor {
public:
    explicit CurlTransferExecutor(const ResourceCache& cache, TransferOptions options = {});
    ~CurlTransferExecutor() override;

    TransferResult fetch(const ResourceDescriptor& descriptor,
                         std::uint64_t resume_offset,
                         const ChunkCallback& on_chunk,
                         const TransferSignal& signal) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace packfetch
