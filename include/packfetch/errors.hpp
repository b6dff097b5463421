#pragma once

#include "error_record.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace packfetch {

class ManifestError : public std::runtime_error {
public:
    explicit ManifestError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidTierError : public ManifestError {
public:
    explicit InvalidTierError(const std::string& tier)
        : ManifestError("Unknown package tier: " + tier), tier_(tier) {}

    [[nodiscard]] const std::string& tier() const noexcept { return tier_; }

private:
    std::string tier_;
};

class CheckpointStoreError : public std::runtime_error {
public:
    explicit CheckpointStoreError(const std::string& message) : std::runtime_error(message) {}
};

class SessionStateError : public std::runtime_error {
public:
    explicit SessionStateError(const std::string& message) : std::runtime_error(message) {}
};

class TransferError : public std::runtime_error {
public:
    explicit TransferError(RawError raw)
        : std::runtime_error(raw.detail), raw_(std::move(raw)) {}

    [[nodiscard]] const RawError& raw() const noexcept { return raw_; }

private:
    RawError raw_;
};

// Thrown when a transfer stops because pause or cancel was requested.
class TransferInterrupted : public std::runtime_error {
public:
    TransferInterrupted(std::uint64_t bytes_so_far, bool cancelled)
        : std::runtime_error(cancelled ? "transfer cancelled" : "transfer paused"),
          bytes_so_far_(bytes_so_far),
          cancelled_(cancelled) {}

    [[nodiscard]] std::uint64_t bytesSoFar() const noexcept { return bytes_so_far_; }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_; }

private:
    std::uint64_t bytes_so_far_;
    bool cancelled_;
};

} // namespace packfetch
