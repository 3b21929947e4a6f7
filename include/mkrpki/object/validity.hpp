#pragma once

#include <cstdint>
#include <optional>

#include <mkrpki/core/result.hpp>
#include <mkrpki/core/time.hpp>

namespace mkrpki::object {

    struct Validity {
        Time not_before{};
        Time not_after{};
    };

    // This-update / next-update pair of CRLs and manifests.
    struct UpdatePeriod {
        Time this_update{};
        Time next_update{};
    };

    struct ValidityRequest {
        std::optional<Time> not_before;
        std::optional<Time> not_after;
        std::optional<int64_t> days;
    };

    struct UpdateRequest {
        std::optional<Time> this_update;
        std::optional<Time> next_update;
        std::optional<int64_t> next_days;
    };

    // The start defaults to 'now'. An explicit end wins over a day count; having neither is a
    // configuration error, as is an end that does not come after the start.
    Result<Validity> resolve_validity(const ValidityRequest &request, Time now);
    Result<UpdatePeriod> resolve_update_period(const UpdateRequest &request, Time now);

} // namespace mkrpki::object
