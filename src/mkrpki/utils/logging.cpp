#include <mkrpki/utils/logging.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mkrpki::logging {

    std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> instance;
        std::call_once(once, []() {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            sink->set_color(spdlog::level::debug, sink->green);
            sink->set_color(spdlog::level::info, sink->reset);
            sink->set_color(spdlog::level::warn, sink->yellow);
            sink->set_color(spdlog::level::err, sink->red);
            instance = std::make_shared<spdlog::logger>("mkrpki", sink);
            instance->set_pattern("mkrpki: %^%l%$: %v");
            instance->set_level(spdlog::level::info);
        });
        return instance;
    }

    void set_verbosity(Verbosity verbosity) {
        switch (verbosity) {
        case Verbosity::Quiet:
            logger()->set_level(spdlog::level::warn);
            break;
        case Verbosity::Normal:
            logger()->set_level(spdlog::level::info);
            break;
        case Verbosity::Verbose:
            logger()->set_level(spdlog::level::debug);
            break;
        }
    }

} // namespace mkrpki::logging
