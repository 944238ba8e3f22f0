#pragma once

#include "calsched/config/schema.hpp"
#include "calsched/observability/observer.hpp"

#include <iostream>
#include <memory>
#include <ostream>

namespace calsched::observability {

/// Picks the observer for `observability.backend`. Log output goes to
/// `log_out`; every "log" entry of a comma list shares that stream.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                                         std::ostream &log_out = std::cerr);

/// True for "", "none", "noop", "log" and comma lists made of those.
[[nodiscard]] bool is_known_backend(const std::string &backend);

} // namespace calsched::observability
