#pragma once

#include "calx/config/schema.hpp"
#include "calx/observability/observer.hpp"

#include <memory>

namespace calx::observability {

/// Picks the observer named by observability.backend: "log", "noop"/"none",
/// or a comma list of those. Unknown names fall back to "log".
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace calx::observability
