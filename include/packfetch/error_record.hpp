#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace packfetch {

enum class ErrorCategory {
    Network,
    Storage,
    Server,
    NotFound,
    Permission,
};

enum class RecoveryAction {
    Retry,
    Cancel,
    ClearCache,
    ReportMissing,
};

// Raw failure signal as observed by a transfer, before classification.
enum class FailureKind {
    Connection,
    Timeout,
    HttpStatus,
    StorageWrite,
    StorageFull,
    PermissionDenied,
    MissingResource,
    ManifestMismatch,
    Unknown,
};

struct RawError {
    FailureKind kind{FailureKind::Unknown};
    int http_status{0};
    int system_error{0};
    std::string detail;
};

struct ErrorRecord {
    ErrorCategory category{ErrorCategory::Network};
    std::string message;
    std::string recovery_suggestion;
    std::vector<RecoveryAction> recoverable_actions;
    std::string raw_detail;

    [[nodiscard]] bool allows(RecoveryAction action) const;
};

[[nodiscard]] std::string_view toString(ErrorCategory category);
[[nodiscard]] std::string_view toString(RecoveryAction action);
[[nodiscard]] std::string_view toString(FailureKind kind);

} // namespace packfetch
