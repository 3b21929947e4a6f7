#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mkrpki/core/result.hpp>

namespace mkrpki {

    // Non-negative integer of at most 20 octets: certificate serials, CRL numbers, manifest numbers.
    class Serial {
      public:
        static constexpr size_t MAX_OCTETS = 20;

        Serial() : bytes_{0} {}
        explicit Serial(uint64_t value);

        // Accepts decimal digits or 0x-prefixed hex digits.
        static Result<Serial> parse(std::string_view text);

        [[nodiscard]] const std::vector<uint8_t> &bytes() const noexcept { return bytes_; }
        [[nodiscard]] std::string to_string() const;

        bool operator==(const Serial &other) const = default;

      private:
        explicit Serial(std::vector<uint8_t> bytes);

        std::vector<uint8_t> bytes_;
    };

} // namespace mkrpki
