#include "packfetch/detail/curl_utils.hpp"

#include "packfetch/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

namespace packfetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

FailureKind failureKindFor(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return FailureKind::Timeout;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return FailureKind::Connection;
        case CURLE_FILE_COULDNT_READ_FILE:
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return FailureKind::MissingResource;
        case CURLE_HTTP_RETURNED_ERROR:
            return FailureKind::HttpStatus;
        case CURLE_WRITE_ERROR:
            return FailureKind::StorageWrite;
        case CURLE_REMOTE_ACCESS_DENIED:
            return FailureKind::PermissionDenied;
        default:
            return FailureKind::Unknown;
    }
}

RawError storageError(int error_number, std::string detail) {
    RawError raw;
    switch (error_number) {
        case EACCES:
        case EPERM:
        case EROFS:
            raw.kind = FailureKind::PermissionDenied;
            break;
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            raw.kind = FailureKind::StorageFull;
            break;
        default:
            raw.kind = FailureKind::StorageWrite;
            break;
    }
    raw.system_error = error_number;
    raw.detail = std::move(detail);
    return raw;
}

std::string httpGetText(const std::string& url, std::chrono::seconds timeout) {
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    ensureCurlInitialized();
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransferError(RawError{FailureKind::Unknown, 0, 0, "Failed to allocate curl handle"});
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
        +[](char* ptr, size_t size, size_t nmemb, std::string* out) -> size_t {
            if (!out) {
                return 0;
            }
            out->append(ptr, size * nmemb);
            return size * nmemb;
        });
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransferError(RawError{failureKindFor(res), 0, 0,
                                     fmt::format("GET {} failed: {}", url, curl_easy_strerror(res))});
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (code != 0 && (code < 200 || code >= 300)) {
        throw TransferError(RawError{FailureKind::HttpStatus, static_cast<int>(code), 0,
                                     fmt::format("GET {} returned HTTP {}", url, code)});
    }
    return body;
}

} // namespace packfetch::detail
