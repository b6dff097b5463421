#include "packfetch/error_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <string>

#include <fmt/format.h>

namespace packfetch {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

ErrorRecord networkRecord(const RawError& raw, std::string message) {
    return {ErrorCategory::Network,
            std::move(message),
            "Check your internet connection and retry the download.",
            {RecoveryAction::Retry, RecoveryAction::Cancel},
            raw.detail};
}

ErrorRecord storageRecord(const RawError& raw, std::string message) {
    return {ErrorCategory::Storage,
            std::move(message),
            "Free up disk space or clear the offline cache, then start again.",
            {RecoveryAction::ClearCache, RecoveryAction::Cancel},
            raw.detail};
}

ErrorRecord permissionRecord(const RawError& raw) {
    return {ErrorCategory::Permission,
            "Permission to write offline storage was denied",
            "Grant write access to the cache directory or choose another one.",
            {RecoveryAction::Cancel},
            raw.detail};
}

ErrorRecord notFoundRecord(const RawError& raw, std::string message) {
    return {ErrorCategory::NotFound,
            std::move(message),
            "The resource is missing from the server. Report it so the package can be fixed.",
            {RecoveryAction::Cancel, RecoveryAction::ReportMissing},
            raw.detail};
}

ErrorRecord classifyHttpStatus(const RawError& raw) {
    const int status = raw.http_status;
    if (status == 404 || status == 410) {
        return notFoundRecord(raw, fmt::format("Resource not found on server (HTTP {})", status));
    }
    if (status >= 500 && status < 600) {
        return {ErrorCategory::Server,
                fmt::format("Server error (HTTP {})", status),
                "The server is having trouble. Retry in a few minutes.",
                {RecoveryAction::Retry, RecoveryAction::Cancel},
                raw.detail};
    }
    return {ErrorCategory::Server,
            fmt::format("Server rejected the request (HTTP {})", status),
            "The request cannot succeed as is. Cancel the download and try another package.",
            {RecoveryAction::Cancel},
            raw.detail};
}

ErrorRecord classifySystemError(const RawError& raw) {
    switch (raw.system_error) {
        case EACCES:
        case EPERM:
        case EROFS:
            return permissionRecord(raw);
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return storageRecord(raw, "Not enough storage space for offline resources");
        default:
            return storageRecord(raw, "Failed to write resource to offline storage");
    }
}

ErrorRecord classifyUnknown(const RawError& raw) {
    const auto text = lowercase(raw.detail);
    if (contains(text, "quota") || contains(text, "no space")) {
        return storageRecord(raw, "Storage quota exceeded");
    }
    if (contains(text, "permission denied") || contains(text, "not allowed")) {
        return permissionRecord(raw);
    }
    if (contains(text, "timed out") || contains(text, "timeout")) {
        return networkRecord(raw, "Download timed out");
    }
    return networkRecord(raw, "Download failed unexpectedly");
}

} // namespace

bool ErrorRecord::allows(RecoveryAction action) const {
    return std::find(recoverable_actions.begin(), recoverable_actions.end(), action) !=
           recoverable_actions.end();
}

std::string_view toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Network:
            return "network";
        case ErrorCategory::Storage:
            return "storage";
        case ErrorCategory::Server:
            return "server";
        case ErrorCategory::NotFound:
            return "notFound";
        case ErrorCategory::Permission:
            return "permission";
    }
    return "network";
}

std::string_view toString(RecoveryAction action) {
    switch (action) {
        case RecoveryAction::Retry:
            return "retry";
        case RecoveryAction::Cancel:
            return "cancel";
        case RecoveryAction::ClearCache:
            return "clearCache";
        case RecoveryAction::ReportMissing:
            return "reportMissing";
    }
    return "cancel";
}

std::string_view toString(FailureKind kind) {
    switch (kind) {
        case FailureKind::Connection:
            return "connection";
        case FailureKind::Timeout:
            return "timeout";
        case FailureKind::HttpStatus:
            return "httpStatus";
        case FailureKind::StorageWrite:
            return "storageWrite";
        case FailureKind::StorageFull:
            return "storageFull";
        case FailureKind::PermissionDenied:
            return "permissionDenied";
        case FailureKind::MissingResource:
            return "missingResource";
        case FailureKind::ManifestMismatch:
            return "manifestMismatch";
        case FailureKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

ErrorRecord classify(const RawError& raw) {
    switch (raw.kind) {
        case FailureKind::Connection:
            return networkRecord(raw, "Network connection failed");
        case FailureKind::Timeout:
            return networkRecord(raw, "Download stalled with no data received");
        case FailureKind::HttpStatus:
            if (raw.http_status >= 200 && raw.http_status < 300) {
                return networkRecord(raw, "Download ended unexpectedly");
            }
            return classifyHttpStatus(raw);
        case FailureKind::StorageWrite:
            return classifySystemError(raw);
        case FailureKind::StorageFull:
            return storageRecord(raw, "Not enough storage space for offline resources");
        case FailureKind::PermissionDenied:
            return permissionRecord(raw);
        case FailureKind::MissingResource:
            return notFoundRecord(raw, "Resource not found");
        case FailureKind::ManifestMismatch:
            return notFoundRecord(raw, "Resource does not match the package manifest");
        case FailureKind::Unknown:
            return classifyUnknown(raw);
    }
    return classifyUnknown(raw);
}

} // namespace packfetch
