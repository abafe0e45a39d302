#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace memoria::core {

/// Progress sink: (stage name, percent 0..100, optional detail). Implemented by the caller.
using ProgressCallback =
    std::function<void(std::string_view stage, int percent,
                       const std::optional<std::string>& detail)>;

/// Cancellation source: returns normally, or throws (typically core::Canceled)
/// when cancellation was requested. Polled; never preemptive.
using CancelCheck = std::function<void()>;

}  // namespace memoria::core
