#include "packfetch/curl_transfer_executor.hpp"

#include "packfetch/checksum.hpp"
#include "packfetch/detail/curl_utils.hpp"
#include "packfetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace packfetch {

class CurlTransferExecutor::Impl {
public:
    Impl(const ResourceCache& cache, TransferOptions options)
        : cache_(cache), options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    TransferResult fetch(const ResourceDescriptor& descriptor,
                         std::uint64_t resume_offset,
                         const ChunkCallback& on_chunk,
                         const TransferSignal& signal) {
        if (signal.stopRequested()) {
            throw TransferInterrupted(resume_offset, signal.cancelled());
        }
        try {
            cache_.prepare(descriptor);
        } catch (const std::filesystem::filesystem_error& ex) {
            throw TransferError(detail::storageError(ex.code().value(), ex.what()));
        }

        std::uint64_t offset = 0;
        if (descriptor.supports_resume) {
            offset = std::min(resume_offset, cache_.partialSize(descriptor));
        }

        const bool restarted = descriptor.supports_resume ? offset < resume_offset : resume_offset > 0;
        try {
            return perform(descriptor, offset, restarted, on_chunk, signal);
        } catch (const RangeRejected&) {
            spdlog::warn("{} does not support resume, restarting from byte 0", descriptor.source_url);
            return perform(descriptor, 0, true, on_chunk, signal);
        }
    }

private:
    struct RangeRejected {};

    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct TransferContext {
        Impl* owner{nullptr};
        CURL* curl{nullptr};
        FILE* file{nullptr};
        const ResourceDescriptor* descriptor{nullptr};
        const ChunkCallback* on_chunk{nullptr};
        const TransferSignal* signal{nullptr};

        std::uint64_t requested_offset{0};
        std::uint64_t bytes{0};
        std::optional<std::uint64_t> total;
        bool headers_checked{false};
        bool restarted{false};

        long http_status{0};
        bool status_failed{false};
        bool length_mismatch{false};
        int write_errno{0};
        std::exception_ptr callback_error;
        curl_off_t last_report_ms{-1};
    };

    [[nodiscard]] static bool isHttp(CURL* curl) {
        const char* scheme = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_SCHEME, &scheme) != CURLE_OK || !scheme) {
            return false;
        }
        std::string lowered{scheme};
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered == "http" || lowered == "https";
    }

    TransferResult perform(const ResourceDescriptor& descriptor,
                           std::uint64_t offset,
                           bool restarted,
                           const ChunkCallback& on_chunk,
                           const TransferSignal& signal) {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        const auto part = cache_.partialPath(descriptor);
        std::unique_ptr<FILE, FileDeleter> file{std::fopen(part.c_str(), offset > 0 ? "r+b" : "wb")};
        if (!file) {
            const int err = errno;
            throw TransferError(detail::storageError(
                err, fmt::format("Cannot open {}: {}", part.string(), std::strerror(err))));
        }
        if (offset > 0) {
            // Drop anything past the offset so a torn tail is never kept.
            if (ftruncate(fileno(file.get()), static_cast<off_t>(offset)) == -1 ||
                fseeko(file.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
                const int err = errno;
                throw TransferError(detail::storageError(
                    err, fmt::format("Cannot position {}: {}", part.string(), std::strerror(err))));
            }
        }

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransferError(RawError{FailureKind::Unknown, 0, 0, "Failed to allocate curl handle"});
        }

        TransferContext ctx;
        ctx.owner = this;
        ctx.curl = curl.get();
        ctx.file = file.get();
        ctx.descriptor = &descriptor;
        ctx.on_chunk = &on_chunk;
        ctx.signal = &signal;
        ctx.requested_offset = offset;
        ctx.bytes = offset;
        ctx.restarted = restarted;

        curl_easy_setopt(curl.get(), CURLOPT_URL, descriptor.source_url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.inactivity_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        if (offset > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
        }

        spdlog::debug("Fetching {} from byte {}", descriptor.source_url, offset);
        const CURLcode res = curl_easy_perform(curl.get());

        if (std::fflush(file.get()) != 0 && res == CURLE_OK) {
            const int err = errno;
            throw TransferError(detail::storageError(err, fmt::format("Cannot flush {}", part.string())));
        }
        file.reset();

        if (ctx.callback_error) {
            std::rethrow_exception(ctx.callback_error);
        }
        if (res == CURLE_ABORTED_BY_CALLBACK) {
            throw TransferInterrupted(ctx.bytes, signal.cancelled());
        }
        if (ctx.status_failed) {
            throw TransferError(RawError{FailureKind::HttpStatus, static_cast<int>(ctx.http_status), 0,
                                         fmt::format("GET {} returned HTTP {}", descriptor.source_url,
                                                     ctx.http_status)});
        }
        if (ctx.length_mismatch) {
            throw TransferError(RawError{FailureKind::ManifestMismatch, static_cast<int>(ctx.http_status), 0,
                                         fmt::format("{} reports {} bytes, manifest expects {}", descriptor.id,
                                                     ctx.total.value_or(0),
                                                     descriptor.expected_bytes.value_or(0))});
        }
        if (res == CURLE_WRITE_ERROR && ctx.write_errno != 0) {
            throw TransferError(detail::storageError(
                ctx.write_errno, fmt::format("Failed to write {}: {}", part.string(), std::strerror(ctx.write_errno))));
        }
        if ((res == CURLE_RANGE_ERROR || res == CURLE_BAD_DOWNLOAD_RESUME) && offset > 0) {
            throw RangeRejected{};
        }
        if (res != CURLE_OK) {
            RawError raw{detail::failureKindFor(res), static_cast<int>(ctx.http_status), 0,
                         fmt::format("{}: {}", descriptor.source_url, curl_easy_strerror(res))};
            throw TransferError(std::move(raw));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (isHttp(curl.get()) && (status < 200 || status >= 300)) {
            throw TransferError(RawError{FailureKind::HttpStatus, static_cast<int>(status), 0,
                                         fmt::format("GET {} returned HTTP {}", descriptor.source_url, status)});
        }

        if (descriptor.expected_bytes && ctx.bytes != *descriptor.expected_bytes) {
            if (ctx.bytes < *descriptor.expected_bytes) {
                throw TransferError(RawError{FailureKind::Connection, static_cast<int>(status), 0,
                                             fmt::format("{} ended after {} of {} bytes", descriptor.id, ctx.bytes,
                                                         *descriptor.expected_bytes)});
            }
            throw TransferError(RawError{FailureKind::ManifestMismatch, static_cast<int>(status), 0,
                                         fmt::format("{} delivered {} bytes, manifest expects {}", descriptor.id,
                                                     ctx.bytes, *descriptor.expected_bytes)});
        }

        if (descriptor.sha256) {
            verifyChecksum(descriptor, part);
        }

        on_chunk(ctx.bytes, ctx.total ? ctx.total : std::optional<std::uint64_t>{ctx.bytes});

        try {
            cache_.commit(descriptor);
        } catch (const std::filesystem::filesystem_error& ex) {
            throw TransferError(detail::storageError(ex.code().value(), ex.what()));
        }
        return {ctx.bytes, ctx.restarted};
    }

    // A mismatching partial file is discarded so the next attempt starts from byte 0.
    void verifyChecksum(const ResourceDescriptor& descriptor, const std::filesystem::path& part) const {
        std::string actual;
        try {
            actual = sha256File(part);
        } catch (const std::runtime_error& ex) {
            throw TransferError(RawError{FailureKind::StorageWrite, 0, EIO, ex.what()});
        }
        if (actual != *descriptor.sha256) {
            cache_.discardPartial(descriptor);
            throw TransferError(RawError{FailureKind::ManifestMismatch, 0, 0,
                                         fmt::format("{} has sha256 {}, manifest expects {}", descriptor.id, actual,
                                                     *descriptor.sha256)});
        }
        spdlog::debug("{} checksum verified", descriptor.id);
    }

    // Runs once, on the first body bytes of the final response.
    static bool checkResponse(TransferContext& ctx) {
        ctx.headers_checked = true;
        curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &ctx.http_status);

        const bool http = isHttp(ctx.curl);
        if (http && (ctx.http_status < 200 || ctx.http_status >= 300)) {
            ctx.status_failed = true;
            return false;
        }

        curl_off_t length = -1;
        curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        if (length >= 0) {
            ctx.total = ctx.requested_offset + static_cast<std::uint64_t>(length);
            const auto& expected = ctx.descriptor->expected_bytes;
            if (expected && *ctx.total != *expected) {
                ctx.length_mismatch = true;
                return false;
            }
        } else {
            ctx.total = ctx.descriptor->expected_bytes;
        }
        return true;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->file) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (total == 0) {
            return 0;
        }
        if (!ctx->headers_checked && !checkResponse(*ctx)) {
            return 0;
        }

        const size_t written = std::fwrite(ptr, 1, total, ctx->file);
        ctx->bytes += written;
        if (written != total) {
            ctx->write_errno = errno != 0 ? errno : EIO;
            return written;
        }
        return written;
    }

    static int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx) {
            return 1;
        }
        if (ctx->signal->stopRequested()) {
            return 1;
        }
        if (!ctx->headers_checked) {
            return 0;
        }

        curl_off_t elapsed_us = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_TOTAL_TIME_T, &elapsed_us);
        const curl_off_t now_ms = elapsed_us / 1000;
        const curl_off_t interval_ms = ctx->owner->options_.progress_interval.count();
        if (ctx->last_report_ms >= 0 && now_ms - ctx->last_report_ms < interval_ms) {
            return 0;
        }
        ctx->last_report_ms = now_ms;

        try {
            (*ctx->on_chunk)(ctx->bytes, ctx->total);
        } catch (...) {
            ctx->callback_error = std::current_exception();
            return 1;
        }
        return 0;
    }

    const ResourceCache& cache_;
    TransferOptions options_;
};

CurlTransferExecutor::CurlTransferExecutor(const ResourceCache& cache, TransferOptions options)
    : impl_(std::make_unique<Impl>(cache, std::move(options))) {}

CurlTransferExecutor::~CurlTransferExecutor() = default;

TransferResult CurlTransferExecutor::fetch(const ResourceDescriptor& descriptor,
                                           std::uint64_t resume_offset,
                                           const ChunkCallback& on_chunk,
                                           const TransferSignal& signal) {
    return impl_->fetch(descriptor, resume_offset, on_chunk, signal);
}

} // namespace packfetch
