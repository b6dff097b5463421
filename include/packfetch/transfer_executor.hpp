#pragma once

#include "transfer_signal.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <optional>

namespace packfetch {

struct TransferResult {
    std::uint64_t total_bytes{0};
    bool restarted_from_zero{false};
};

// bytes_so_far is absolute (resume offset included); bytes_total is empty when the
// origin sent no length.
using ChunkCallback = std::function<void(std::uint64_t bytes_so_far, std::optional<std::uint64_t> bytes_total)>;

// Fetches one resource. Throws TransferError on failure and TransferInterrupted when
// the signal stops it.
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;

    virtual TransferResult fetch(const ResourceDescriptor& descriptor,
                                 std::uint64_t resume_offset,
                                 const ChunkCallback& on_chunk,
                                 const TransferSignal& signal) = 0;
};

} // namespace packfetch
