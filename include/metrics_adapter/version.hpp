// === Version Metadata ========================================================
//
// Exposes the adapter's semantic version string used in logs and the default
// user agent of derived API clients.

#pragma once

#include <string_view>

namespace metrics_adapter {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace metrics_adapter
