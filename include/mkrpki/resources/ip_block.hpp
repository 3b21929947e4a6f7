#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mkrpki/core/result.hpp>

namespace mkrpki::resources {

    enum class AddressFamily { Ipv4, Ipv6 };

    inline constexpr unsigned address_bits(AddressFamily family) { return family == AddressFamily::Ipv4 ? 32 : 128; }

    // Address Family Identifier as used by IPAddressFamily (RFC 3779, 2.2.3.3).
    inline constexpr uint16_t address_family_identifier(AddressFamily family) {
        return family == AddressFamily::Ipv4 ? 1 : 2;
    }

    // An address of either family, stored big-endian. IPv4 addresses occupy the first four bytes.
    struct IpAddress {
        AddressFamily family{AddressFamily::Ipv4};
        std::array<uint8_t, 16> bytes{};

        static Result<IpAddress> parse(std::string_view text);

        [[nodiscard]] bool bit(unsigned index) const { return (bytes[index / 8] >> (7 - (index % 8))) & 1U; }

        // True if all bits from index 'from' on equal 'value'.
        [[nodiscard]] bool trailing_bits_are(unsigned from, bool value) const;

        [[nodiscard]] std::string to_string() const;

        auto operator<=>(const IpAddress &other) const = default;
    };

    // A contiguous, inclusive range of addresses.
    class IpBlock {
      public:
        IpBlock() = default;

        // Fails with ErrorKind::Parse if the address has bits set beyond the prefix length.
        static Result<IpBlock> from_prefix(const IpAddress &address, unsigned length);
        static Result<IpBlock> from_range(const IpAddress &min, const IpAddress &max);

        // Accepts "addr/len", "addr-addr" or a bare address. The family must match.
        static Result<IpBlock> parse(std::string_view text, AddressFamily family);

        [[nodiscard]] AddressFamily family() const noexcept { return min_.family; }
        [[nodiscard]] const IpAddress &min() const noexcept { return min_; }
        [[nodiscard]] const IpAddress &max() const noexcept { return max_; }

        // The prefix length if the block is exactly one prefix, otherwise -1.
        [[nodiscard]] int prefix_length() const;

        [[nodiscard]] std::string to_string() const;

        bool operator==(const IpBlock &other) const = default;

      private:
        IpBlock(IpAddress min, IpAddress max) : min_(min), max_(max) {}

        IpAddress min_{};
        IpAddress max_{};
    };

    // Sorts blocks and merges overlapping or adjacent ones.
    std::vector<IpBlock> normalize(std::vector<IpBlock> blocks);

} // namespace mkrpki::resources
