#include <mkrpki/utils/common.hpp>

#include <sodium.h>

#include <mkrpki/utils/sodium_utils.hpp>

namespace mkrpki::utils {

    namespace {

        char nibble_to_hex(uint8_t b, HexCase hex_case) {
            if (b < 10) {
                return static_cast<char>('0' + b);
            }
            return static_cast<char>((hex_case == HexCase::Upper ? 'A' : 'a') + b - 10);
        }

    } // namespace

    std::string to_hex(ByteSpan data, HexCase hex_case) {
        std::string hex;
        hex.reserve(data.size() * 2);
        for (uint8_t byte : data) {
            hex.push_back(nibble_to_hex((byte >> 4) & 0x0F, hex_case));
            hex.push_back(nibble_to_hex(byte & 0x0F, hex_case));
        }
        return hex;
    }

    std::string to_base64(ByteSpan data) {
        ensure_sodium_init();
        constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
        std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
        sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
        // The encoded length includes the terminating NUL.
        out.resize(out.size() - 1);
        return out;
    }

} // namespace mkrpki::utils
