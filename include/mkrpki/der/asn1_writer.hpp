#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <mkrpki/der/asn1_common.hpp>

namespace mkrpki::der {

    std::vector<uint8_t> encode_tlv(ASN1Class cls, bool constructed, uint32_t tag, ByteSpan content);
    std::vector<uint8_t> encode_sequence(const std::vector<uint8_t> &content);
    std::vector<uint8_t> encode_set(const std::vector<uint8_t> &content);
    std::vector<uint8_t> encode_set_of(std::vector<std::vector<uint8_t>> elements);
    std::vector<uint8_t> encode_integer(const std::vector<uint8_t> &value);
    std::vector<uint8_t> encode_integer(uint64_t value);
    std::vector<uint8_t> encode_bit_string(ByteSpan bits, uint8_t unused_bits = 0);
    std::vector<uint8_t> encode_octet_string(ByteSpan bytes);
    std::vector<uint8_t> encode_boolean(bool value);
    std::vector<uint8_t> encode_null();
    std::vector<uint8_t> encode_oid(const Oid &oid);
    std::vector<uint8_t> encode_printable_string(std::string_view str);
    std::vector<uint8_t> encode_ia5_string(std::string_view str);

    // [n] EXPLICIT: wraps an already encoded element.
    std::vector<uint8_t> encode_explicit(uint32_t tag, const std::vector<uint8_t> &inner);
    // [n] IMPLICIT: replaces the identifier of an already encoded element, keeping its constructed bit.
    std::vector<uint8_t> encode_implicit(uint32_t tag, const std::vector<uint8_t> &inner);

    std::vector<uint8_t> encode_utc_time(std::chrono::sys_seconds tp);
    std::vector<uint8_t> encode_generalized_time(std::chrono::sys_seconds tp);
    // UTCTime through 2049, GeneralizedTime afterwards (RFC 5280, 4.1.2.5).
    std::vector<uint8_t> encode_time(std::chrono::sys_seconds tp);

    std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>> &parts);

} // namespace mkrpki::der
