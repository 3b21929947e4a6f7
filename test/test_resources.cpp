#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <mkrpki/encode/der_encoder.hpp>
#include <mkrpki/resources/as_block.hpp>
#include <mkrpki/resources/ip_block.hpp>
#include <mkrpki/resources/resource_set.hpp>

using namespace mkrpki;
using namespace mkrpki::resources;

namespace {

    IpBlock v4(std::string_view text) {
        auto block = IpBlock::parse(text, AddressFamily::Ipv4);
        REQUIRE(block.success);
        return block.value;
    }

    IpBlock v6(std::string_view text) {
        auto block = IpBlock::parse(text, AddressFamily::Ipv6);
        REQUIRE(block.success);
        return block.value;
    }

} // namespace

TEST_SUITE("resources/ip_block") {
    TEST_CASE("prefixes, ranges and single addresses") {
        auto prefix = v4("10.0.0.0/8");
        CHECK(prefix.prefix_length() == 8);
        CHECK(prefix.min().to_string() == "10.0.0.0");
        CHECK(prefix.max().to_string() == "10.255.255.255");
        CHECK(prefix.to_string() == "10.0.0.0/8");

        auto range = v4("10.0.0.0-10.0.0.2");
        CHECK(range.prefix_length() == -1);
        CHECK(range.to_string() == "10.0.0.0-10.0.0.2");

        auto aligned_range = v4("192.168.0.0-192.168.1.255");
        CHECK(aligned_range.prefix_length() == 23);

        auto host = v4("192.0.2.1");
        CHECK(host.prefix_length() == 32);

        auto ipv6 = v6("2001:db8::/32");
        CHECK(ipv6.family() == AddressFamily::Ipv6);
        CHECK(ipv6.to_string() == "2001:db8::/32");

        CHECK(v4("0.0.0.0/0").prefix_length() == 0);
    }

    TEST_CASE("family must match the option") {
        auto wrong = IpBlock::parse("2001:db8::/32", AddressFamily::Ipv4);
        CHECK_FALSE(wrong.success);
        CHECK(wrong.kind == ErrorKind::Parse);
        CHECK_FALSE(IpBlock::parse("10.0.0.0/8", AddressFamily::Ipv6).success);
    }

    TEST_CASE("host bits and reversed ranges are rejected") {
        auto host_bits = IpBlock::parse("10.0.0.1/8", AddressFamily::Ipv4);
        CHECK_FALSE(host_bits.success);
        CHECK(host_bits.kind == ErrorKind::Parse);

        auto reversed = IpBlock::parse("10.0.0.9-10.0.0.1", AddressFamily::Ipv4);
        CHECK_FALSE(reversed.success);
        CHECK(reversed.kind == ErrorKind::Parse);

        CHECK_FALSE(IpBlock::parse("10.0.0.0/33", AddressFamily::Ipv4).success);
        CHECK_FALSE(IpBlock::parse("10.0.0.0/", AddressFamily::Ipv4).success);
        CHECK_FALSE(IpBlock::parse("300.0.0.0/8", AddressFamily::Ipv4).success);
    }

    TEST_CASE("normalize sorts and merges") {
        auto merged = normalize({v4("10.128.0.0/9"), v4("10.0.0.0/9")});
        REQUIRE(merged.size() == 1);
        CHECK(merged[0].to_string() == "10.0.0.0/8");

        auto overlapping = normalize({v4("192.168.0.0/16"), v4("192.168.3.0/24"), v4("10.0.0.0/8")});
        REQUIRE(overlapping.size() == 2);
        CHECK(overlapping[0].to_string() == "10.0.0.0/8");
        CHECK(overlapping[1].to_string() == "192.168.0.0/16");

        auto apart = normalize({v4("10.0.0.0/24"), v4("10.0.2.0/24")});
        CHECK(apart.size() == 2);
    }
}

TEST_SUITE("resources/as_block") {
    TEST_CASE("identifiers and ranges") {
        auto id = parse_as_id("AS64512");
        REQUIRE(id.success);
        CHECK(id.value == 64512);
        CHECK(parse_as_id("as1").value == 1);
        CHECK(parse_as_id("4294967295").value == 4294967295U);

        auto block = AsBlock::parse("AS64496-AS64511");
        REQUIRE(block.success);
        CHECK(block.value.min == 64496);
        CHECK(block.value.max == 64511);
        CHECK(block.value.to_string() == "AS64496-AS64511");

        auto single = AsBlock::parse("65000");
        REQUIRE(single.success);
        CHECK(single.value.is_id());
    }

    TEST_CASE("malformed AS numbers") {
        CHECK(parse_as_id("4294967296").kind == ErrorKind::Parse);
        CHECK(parse_as_id("AS").error == "Invalid AS number 'AS'");
        CHECK_FALSE(parse_as_id("12x").success);
        CHECK_FALSE(AsBlock::parse("200-100").success);
    }

    TEST_CASE("normalize merges adjacent ranges") {
        auto merged = normalize(std::vector<AsBlock>{{10, 20}, {1, 5}, {21, 30}, {6, 6}});
        REQUIRE(merged.size() == 1);
        CHECK(merged[0] == AsBlock{1, 30});
    }
}

TEST_SUITE("resources/resource_set") {
    TEST_CASE("inherit overrides listed blocks") {
        auto set = IpResources::from_request(true, {v4("10.0.0.0/8")});
        CHECK(set.is_inherit());
        CHECK(set.blocks().empty());
    }

    TEST_CASE("no blocks and no inherit means absent") {
        auto set = AsResources::from_request(false, {});
        CHECK(set.is_absent());
        CHECK(state_name(set) == "absent");
    }

    TEST_CASE("listed blocks keep their order") {
        auto set = IpResources::from_request(false, {v4("192.168.0.0/16"), v4("10.0.0.0/8")});
        REQUIRE(set.is_explicit());
        CHECK(set.blocks()[0].to_string() == "192.168.0.0/16");
        CHECK(set.blocks()[1].to_string() == "10.0.0.0/8");
    }

    TEST_CASE("per-family resolution") {
        ResourceRequest request;
        request.inherit_v4 = true;
        request.v6 = {v6("2001:db8::/32")};
        auto res = Resources::from_request(request);
        CHECK(res.v4.is_inherit());
        CHECK(res.v6.is_explicit());
        CHECK(res.as.is_absent());
        CHECK(res.has_ip());
        CHECK_FALSE(res.has_as());
    }
}

TEST_SUITE("resources/encoding") {
    TEST_CASE("inherited IPv4 only") {
        const auto der = encode::encode_ip_resources(IpResources::inherit(), IpResources::absent());
        CHECK(der == Bytes{0x30, 0x08, 0x30, 0x06, 0x04, 0x02, 0x00, 0x01, 0x05, 0x00});
    }

    TEST_CASE("explicit prefix") {
        const auto der = encode::encode_ip_resources(IpResources::explicit_blocks({v4("10.0.0.0/8")}),
                                                     IpResources::absent());
        CHECK(der == Bytes{0x30, 0x0C, 0x30, 0x0A, 0x04, 0x02, 0x00, 0x01, 0x30, 0x04, 0x03, 0x02, 0x00, 0x0A});
    }

    TEST_CASE("adjacent prefixes are written as one") {
        const auto single = encode::encode_ip_resources(IpResources::explicit_blocks({v4("10.0.0.0/8")}),
                                                        IpResources::absent());
        const auto halves = encode::encode_ip_resources(
            IpResources::explicit_blocks({v4("10.128.0.0/9"), v4("10.0.0.0/9")}), IpResources::absent());
        CHECK(single == halves);
    }

    TEST_CASE("ranges drop trailing bits") {
        const auto der = encode::encode_ip_resources(IpResources::explicit_blocks({v4("10.0.0.0-10.0.0.2")}),
                                                     IpResources::absent());
        const Bytes range{0x30, 0x0B, 0x03, 0x02, 0x01, 0x0A, 0x03, 0x05, 0x00, 0x0A, 0x00, 0x00, 0x02};
        CHECK(mkrpki_test::contains(der, range));
    }

    TEST_CASE("IPv4 before IPv6") {
        const auto der = encode::encode_ip_resources(IpResources::inherit(), IpResources::inherit());
        CHECK(der == Bytes{0x30, 0x10, 0x30, 0x06, 0x04, 0x02, 0x00, 0x01, 0x05, 0x00, 0x30, 0x06, 0x04, 0x02, 0x00,
                           0x02, 0x05, 0x00});
    }

    TEST_CASE("AS identifiers and inherit") {
        CHECK(encode::encode_as_resources(AsResources::explicit_blocks({AsBlock{64512, 64512}})) ==
              Bytes{0x30, 0x09, 0xA0, 0x07, 0x30, 0x05, 0x02, 0x03, 0x00, 0xFC, 0x00});
        CHECK(encode::encode_as_resources(AsResources::inherit()) == Bytes{0x30, 0x04, 0xA0, 0x02, 0x05, 0x00});

        const auto range = encode::encode_as_resources(AsResources::explicit_blocks({AsBlock{64496, 64511}}));
        CHECK(mkrpki_test::contains(range, Bytes{0x30, 0x0A, 0x02, 0x03, 0x00, 0xFB, 0xF0, 0x02, 0x03, 0x00, 0xFB,
                                                 0xFF}));
    }
}
