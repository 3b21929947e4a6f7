#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace mkrpki::logging {

    enum class Verbosity { Quiet, Normal, Verbose };

    // The process-wide "mkrpki" logger on standard error, created on first use.
    std::shared_ptr<spdlog::logger> logger();

    void set_verbosity(Verbosity verbosity);

} // namespace mkrpki::logging
