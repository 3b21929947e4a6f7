#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <mkrpki/der/asn1_common.hpp>

namespace mkrpki::utils {

    enum class HexCase { Lower, Upper };

    std::string to_hex(ByteSpan data, HexCase hex_case = HexCase::Upper);

    // Standard base64 with padding and no line breaks.
    std::string to_base64(ByteSpan data);

} // namespace mkrpki::utils
