#pragma once

namespace stubscan {

inline constexpr const char *kToolVersion = "0.3.0";

} // namespace stubscan
