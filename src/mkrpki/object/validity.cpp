#include <mkrpki/object/validity.hpp>

#include <chrono>
#include <string>

namespace mkrpki::object {

    namespace {

        struct Span {
            Time start;
            Time end;
        };

        Result<Span> resolve(std::optional<Time> start_opt, std::optional<Time> end_opt, std::optional<int64_t> days,
                             Time now, const char *start_option, const char *end_option, const char *days_option) {
            const Time start = start_opt.value_or(now);

            Time end{};
            if (end_opt) {
                end = *end_opt;
            } else if (days) {
                // The end has to fit a four-digit GeneralizedTime year.
                const auto room = std::chrono::floor<std::chrono::days>(latest_time() - start).count();
                if (*days > room) {
                    return Result<Span>::failure(ErrorKind::Configuration,
                                                 "Value " + std::to_string(*days) + " for " + days_option +
                                                     " ends after " + format_time(latest_time()) + ".");
                }
                end = *days > 0 ? start + std::chrono::days(*days) : start;
            } else {
                return Result<Span>::failure(ErrorKind::Configuration, std::string("Either ") + end_option + " or " +
                                                                           days_option + " must be given.");
            }

            if (end <= start) {
                return Result<Span>::failure(ErrorKind::Configuration,
                                             std::string(end_option) + " " + format_time(end) + " must be later than " +
                                                 start_option + " " + format_time(start) + ".");
            }
            return Result<Span>::ok(Span{start, end});
        }

    } // namespace

    Result<Validity> resolve_validity(const ValidityRequest &request, Time now) {
        auto span = resolve(request.not_before, request.not_after, request.days, now, "--not-before", "--not-after",
                            "--days");
        if (!span.success) {
            return span.forward<Validity>();
        }
        return Result<Validity>::ok(Validity{span.value.start, span.value.end});
    }

    Result<UpdatePeriod> resolve_update_period(const UpdateRequest &request, Time now) {
        auto span = resolve(request.this_update, request.next_update, request.next_days, now, "--this-update",
                            "--next-update", "--next-days");
        if (!span.success) {
            return span.forward<UpdatePeriod>();
        }
        return Result<UpdatePeriod>::ok(UpdatePeriod{span.value.start, span.value.end});
    }

} // namespace mkrpki::object
