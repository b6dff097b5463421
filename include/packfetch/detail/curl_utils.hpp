#pragma once

#include "packfetch/error_record.hpp"

#include <chrono>
#include <string>

#include <curl/curl.h>

namespace packfetch::detail {

void ensureCurlInitialized();

// Maps a libcurl result to the raw failure kinds understood by the classifier.
[[nodiscard]] FailureKind failureKindFor(CURLcode code);

// RawError for a failed filesystem operation, keyed on errno.
[[nodiscard]] RawError storageError(int error_number, std::string detail);

// Small GET used for manifest documents. Throws TransferError.
[[nodiscard]] std::string httpGetText(const std::string& url, std::chrono::seconds timeout);

} // namespace packfetch::detail
