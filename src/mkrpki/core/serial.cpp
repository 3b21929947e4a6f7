#include <mkrpki/core/serial.hpp>

#include <algorithm>

#include <mkrpki/utils/common.hpp>

namespace mkrpki {

    namespace {

        void strip_leading_zeros(std::vector<uint8_t> &bytes) {
            auto first = std::find_if(bytes.begin(), bytes.end(), [](uint8_t b) { return b != 0; });
            bytes.erase(bytes.begin(), first);
            if (bytes.empty()) {
                bytes.push_back(0);
            }
        }

        // bytes = bytes * base + digit, big-endian.
        void multiply_add(std::vector<uint8_t> &bytes, unsigned base, unsigned digit) {
            unsigned carry = digit;
            for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
                const unsigned value = (*it * base) + carry;
                *it = static_cast<uint8_t>(value & 0xFFU);
                carry = value >> 8U;
            }
            while (carry > 0) {
                bytes.insert(bytes.begin(), static_cast<uint8_t>(carry & 0xFFU));
                carry >>= 8U;
            }
        }

        int digit_value(char c, unsigned base) {
            int value = -1;
            if (c >= '0' && c <= '9') {
                value = c - '0';
            } else if (c >= 'a' && c <= 'f') {
                value = c - 'a' + 10;
            } else if (c >= 'A' && c <= 'F') {
                value = c - 'A' + 10;
            }
            return value >= 0 && static_cast<unsigned>(value) < base ? value : -1;
        }

    } // namespace

    Serial::Serial(uint64_t value) {
        do {
            bytes_.insert(bytes_.begin(), static_cast<uint8_t>(value & 0xFFU));
            value >>= 8U;
        } while (value);
    }

    Serial::Serial(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) { strip_leading_zeros(bytes_); }

    Result<Serial> Serial::parse(std::string_view text) {
        auto invalid = [&](std::string_view why) {
            return Result<Serial>::failure(ErrorKind::Parse,
                                           "Invalid number '" + std::string(text) + "': " + std::string(why));
        };

        unsigned base = 10;
        std::string_view digits = text;
        if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
            base = 16;
            digits.remove_prefix(2);
        }
        if (digits.empty()) {
            return invalid("no digits");
        }

        std::vector<uint8_t> bytes{0};
        for (char c : digits) {
            const int value = digit_value(c, base);
            if (value < 0) {
                return invalid("unexpected character");
            }
            multiply_add(bytes, base, static_cast<unsigned>(value));
            strip_leading_zeros(bytes);
            // The DER INTEGER, sign pad included, must fit in 20 octets.
            if (bytes.size() > MAX_OCTETS || (bytes.size() == MAX_OCTETS && (bytes[0] & 0x80U))) {
                return invalid("more than 20 octets");
            }
        }
        return Result<Serial>::ok(Serial(std::move(bytes)));
    }

    std::string Serial::to_string() const { return "0x" + utils::to_hex(bytes_); }

} // namespace mkrpki
