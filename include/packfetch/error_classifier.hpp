#pragma once

#include "error_record.hpp"

namespace packfetch {

// Maps a raw failure to one of the five categories. Deterministic and side-effect free;
// unmatched failures fall back to the network category.
[[nodiscard]] ErrorRecord classify(const RawError& raw);

} // namespace packfetch
