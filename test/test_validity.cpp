#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <limits>

#include <mkrpki/object/validity.hpp>

using namespace mkrpki;
using namespace mkrpki::object;
using std::chrono::days;
using std::chrono::hours;

TEST_SUITE("object/validity") {
    TEST_CASE("start defaults to now and days extend it") {
        const auto now = mkrpki_test::fixed_time();
        ValidityRequest request;
        request.days = 30;

        auto validity = resolve_validity(request, now);
        REQUIRE(validity.success);
        CHECK(validity.value.not_before == now);
        CHECK(validity.value.not_after == now + days(30));
    }

    TEST_CASE("explicit end wins over days") {
        const auto now = mkrpki_test::fixed_time();
        ValidityRequest request;
        request.not_after = now + hours(5);
        request.days = 30;

        auto validity = resolve_validity(request, now);
        REQUIRE(validity.success);
        CHECK(validity.value.not_after == now + hours(5));
    }

    TEST_CASE("explicit start is used instead of now") {
        const auto start = mkrpki_test::fixed_time() - days(2);
        ValidityRequest request;
        request.not_before = start;
        request.days = 1;

        auto validity = resolve_validity(request, mkrpki_test::fixed_time());
        REQUIRE(validity.success);
        CHECK(validity.value.not_before == start);
        CHECK(validity.value.not_after == start + days(1));
    }

    TEST_CASE("missing end is a configuration error") {
        auto validity = resolve_validity(ValidityRequest{}, mkrpki_test::fixed_time());
        CHECK_FALSE(validity.success);
        CHECK(validity.kind == ErrorKind::Configuration);
        CHECK(validity.error == "Either --not-after or --days must be given.");

        auto period = resolve_update_period(UpdateRequest{}, mkrpki_test::fixed_time());
        CHECK_FALSE(period.success);
        CHECK(period.kind == ErrorKind::Configuration);
        CHECK(period.error == "Either --next-update or --next-days must be given.");
    }

    TEST_CASE("end must come after start") {
        const auto now = mkrpki_test::fixed_time();
        ValidityRequest request;
        request.not_after = now;

        auto same = resolve_validity(request, now);
        CHECK_FALSE(same.success);
        CHECK(same.kind == ErrorKind::Configuration);
        CHECK(same.error == "--not-after 2024-01-01T00:00:00Z must be later than --not-before 2024-01-01T00:00:00Z.");

        ValidityRequest zero_days;
        zero_days.days = 0;
        CHECK_FALSE(resolve_validity(zero_days, now).success);

        ValidityRequest negative_days;
        negative_days.days = -3;
        CHECK(resolve_validity(negative_days, now).kind == ErrorKind::Configuration);
    }

    TEST_CASE("day counts may not pass the last four-digit year") {
        ValidityRequest request;
        request.days = std::numeric_limits<int64_t>::max();
        auto validity = resolve_validity(request, mkrpki_test::fixed_time());
        CHECK_FALSE(validity.success);
        CHECK(validity.kind == ErrorKind::Configuration);
        CHECK(validity.error == "Value 9223372036854775807 for --days ends after 9999-12-31T23:59:59Z.");
    }

    TEST_CASE("long validity periods") {
        ValidityRequest request;
        request.days = 100000;
        auto validity = resolve_validity(request, mkrpki_test::fixed_time());
        REQUIRE(validity.success);
        CHECK(validity.value.not_after == mkrpki_test::fixed_time() + days(100000));
        CHECK(format_time(validity.value.not_after) == "2297-10-16T00:00:00Z");

        auto no_expiry = parse_time("9999-12-31T23:59:59Z");
        REQUIRE(no_expiry.success);
        ValidityRequest open_ended;
        open_ended.not_after = no_expiry.value;
        auto forever = resolve_validity(open_ended, mkrpki_test::fixed_time());
        REQUIRE(forever.success);
        CHECK(forever.value.not_after == latest_time());
    }

    TEST_CASE("periods before 1677") {
        auto start = parse_time("1500-01-01T00:00:00Z");
        auto end = parse_time("1600-01-01T00:00:00Z");
        REQUIRE(start.success);
        REQUIRE(end.success);

        ValidityRequest request;
        request.not_before = start.value;
        request.days = 1;
        auto validity = resolve_validity(request, mkrpki_test::fixed_time());
        REQUIRE(validity.success);
        CHECK(format_time(validity.value.not_after) == "1500-01-02T00:00:00Z");

        ValidityRequest reversed;
        reversed.not_before = end.value;
        reversed.not_after = start.value;
        auto rejected = resolve_validity(reversed, mkrpki_test::fixed_time());
        CHECK_FALSE(rejected.success);
        CHECK(rejected.error ==
              "--not-after 1500-01-01T00:00:00Z must be later than --not-before 1600-01-01T00:00:00Z.");
    }

    TEST_CASE("update periods") {
        UpdateRequest request;
        request.next_days = 1;

        auto period = resolve_update_period(request, mkrpki_test::fixed_time());
        REQUIRE(period.success);
        CHECK(period.value.this_update == mkrpki_test::fixed_time());
        CHECK(period.value.next_update == mkrpki_test::fixed_time() + days(1));
    }
}
