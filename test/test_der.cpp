#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <mkrpki/der/asn1_reader.hpp>
#include <mkrpki/der/asn1_writer.hpp>
#include <mkrpki/der/oid_registry.hpp>

using namespace mkrpki;
using namespace mkrpki::der;

TEST_SUITE("der/writer") {
    TEST_CASE("integers are minimal and non-negative") {
        CHECK(encode_integer(uint64_t{0}) == Bytes{0x02, 0x01, 0x00});
        CHECK(encode_integer(uint64_t{127}) == Bytes{0x02, 0x01, 0x7F});
        CHECK(encode_integer(uint64_t{128}) == Bytes{0x02, 0x02, 0x00, 0x80});
        CHECK(encode_integer(Bytes{0x00, 0x00, 0x01}) == Bytes{0x02, 0x01, 0x01});
    }

    TEST_CASE("long form lengths") {
        const Bytes content(200, 0xAB);
        const auto der = encode_octet_string(content);
        CHECK(der[0] == 0x04);
        CHECK(der[1] == 0x81);
        CHECK(der[2] == 200);
        CHECK(der.size() == 203);
    }

    TEST_CASE("object identifiers") {
        CHECK(encode_oid(oids::sha256) ==
              Bytes{0x06, 0x09, 0x60, 0x86, 0x48, 0x01, 0x65, 0x03, 0x04, 0x02, 0x01});
        CHECK(encode_oid(oids::rsa_encryption) ==
              Bytes{0x06, 0x09, 0x2A, 0x86, 0x48, 0x86, 0xF7, 0x0D, 0x01, 0x01, 0x01});
    }

    TEST_CASE("UTCTime until 2049, GeneralizedTime afterwards") {
        const auto before = mkrpki_test::fixed_time();
        CHECK(encode_time(before)[0] == 0x17);
        CHECK(encode_time(before) == encode_utc_time(before));

        auto after = mkrpki::parse_time("2050-01-01T00:00:00Z");
        REQUIRE(after.success);
        const auto der = encode_time(after.value);
        CHECK(der[0] == 0x18);
        CHECK(std::string(der.begin() + 2, der.end()) == "20500101000000Z");

        const auto last = encode_time(mkrpki::latest_time());
        CHECK(last[0] == 0x18);
        CHECK(std::string(last.begin() + 2, last.end()) == "99991231235959Z");

        auto early = mkrpki::parse_time("1500-06-01T12:30:00Z");
        REQUIRE(early.success);
        const auto old = encode_time(early.value);
        CHECK(old[0] == 0x18);
        CHECK(std::string(old.begin() + 2, old.end()) == "15000601123000Z");

        auto decoded = der::parse_time(old);
        REQUIRE(decoded.success);
        CHECK(decoded.value == early.value);
    }

    TEST_CASE("implicit tagging keeps the constructed bit") {
        CHECK(encode_implicit(0, encode_sequence({0x05, 0x00})) == Bytes{0xA0, 0x02, 0x05, 0x00});
        CHECK(encode_implicit(1, encode_octet_string(Bytes{0x01})) == Bytes{0x81, 0x01, 0x01});
        CHECK_THROWS_AS(encode_implicit(31, encode_null()), std::invalid_argument);
    }

    TEST_CASE("SET OF members are sorted") {
        const auto set = encode_set_of({encode_integer(uint64_t{2}), encode_integer(uint64_t{1})});
        CHECK(set == Bytes{0x31, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x02});
    }

    TEST_CASE("bit strings") {
        const uint8_t bits = 0x06;
        CHECK(encode_bit_string(ByteSpan(&bits, 1), 1) == Bytes{0x03, 0x02, 0x01, 0x06});
        CHECK(encode_bit_string(ByteSpan(), 3) == Bytes{0x03, 0x01, 0x00});
    }
}

TEST_SUITE("der/reader") {
    TEST_CASE("elements report their content and full encoding") {
        const auto der = encode_sequence(concat({encode_integer(uint64_t{5}), encode_null()}));
        auto element = parse_element(der);
        REQUIRE(element.success);
        CHECK(element.value.identifier.tag_number == static_cast<uint32_t>(ASN1Tag::Sequence));
        CHECK(element.value.identifier.constructed);
        CHECK(element.value.encoded.size() == der.size());

        auto children = parse_elements(element.value.content);
        REQUIRE(children.success);
        REQUIRE(children.value.size() == 2);
        CHECK(children.value[1].identifier.tag_number == static_cast<uint32_t>(ASN1Tag::Null));
    }

    TEST_CASE("object identifiers decode") {
        auto oid = parse_oid(encode_oid(oids::rsa_encryption));
        REQUIRE(oid.success);
        CHECK(oid.value == oids::rsa_encryption);
    }

    TEST_CASE("times decode") {
        auto utc = der::parse_time(encode_utc_time(mkrpki_test::fixed_time()));
        REQUIRE(utc.success);
        CHECK(utc.value == mkrpki_test::fixed_time());
    }

    TEST_CASE("truncated input fails") {
        const Bytes truncated{0x30, 0x05, 0x02, 0x01};
        CHECK_FALSE(parse_element(truncated).success);
        CHECK_FALSE(parse_sequence(Bytes{}).success);
        CHECK_FALSE(parse_sequence(encode_null()).success);
        CHECK_FALSE(parse_oid(Bytes{0x06, 0x02, 0x2A, 0x86}).success);
    }
}
