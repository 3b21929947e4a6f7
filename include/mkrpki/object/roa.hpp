#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mkrpki/core/result.hpp>
#include <mkrpki/resources/ip_block.hpp>
#include <mkrpki/resources/resource_set.hpp>

namespace mkrpki::object {

    // One ROAIPAddress entry. Length and max length are checked only when encoding.
    struct RoaPrefix {
        resources::IpAddress address;
        uint8_t length{};
        std::optional<uint8_t> max_length;

        // "<address>/<length>" or "<address>/<length>-<max length>".
        static Result<RoaPrefix> parse(std::string_view text);

        [[nodiscard]] resources::AddressFamily family() const noexcept { return address.family; }
    };

    struct RoaContent {
        uint32_t as_id{};
        std::vector<RoaPrefix> v4;
        std::vector<RoaPrefix> v6;

        // Splits prefixes by family, keeping their order.
        static RoaContent from_prefixes(uint32_t as_id, const std::vector<RoaPrefix> &prefixes);

        // Explicit IP resources covering every prefix, for the end-entity certificate. No AS resources.
        [[nodiscard]] Result<resources::Resources> ee_resources() const;
    };

} // namespace mkrpki::object
