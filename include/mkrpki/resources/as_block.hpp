#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mkrpki/core/result.hpp>

namespace mkrpki::resources {

    // Parses "64512" or "AS64512" (prefix case-insensitive).
    Result<uint32_t> parse_as_id(std::string_view text);

    // An inclusive range of AS numbers.
    struct AsBlock {
        uint32_t min{};
        uint32_t max{};

        // Accepts "N", "ASN", "N-M" or "ASN-ASM".
        static Result<AsBlock> parse(std::string_view text);

        [[nodiscard]] bool is_id() const noexcept { return min == max; }
        [[nodiscard]] std::string to_string() const;

        bool operator==(const AsBlock &other) const = default;
    };

    std::vector<AsBlock> normalize(std::vector<AsBlock> blocks);

} // namespace mkrpki::resources
