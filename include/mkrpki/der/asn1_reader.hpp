#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <mkrpki/der/asn1_common.hpp>

namespace mkrpki::der {

    template <typename T> struct ASN1Result {
        bool success{};
        T value{};
        size_t bytes_consumed{};
        std::string error{};

        static ASN1Result<T> failure(std::string message) { return ASN1Result<T>{false, {}, 0, std::move(message)}; }

        static ASN1Result<T> ok(T value, size_t consumed) {
            return ASN1Result<T>{true, std::move(value), consumed, {}};
        }
    };

    struct ParsedHeader {
        ASN1Identifier identifier{};
        size_t length{};
        size_t header_bytes{};
    };

    struct BitStringView {
        uint8_t unused_bits{};
        ByteSpan bytes{};
    };

    // A complete element: identifier plus the spans of its content and its full encoding.
    struct Element {
        ASN1Identifier identifier{};
        ByteSpan content{};
        ByteSpan encoded{};
    };

    ASN1Result<ParsedHeader> parse_id_len(ByteSpan input);

    ASN1Result<Element> parse_element(ByteSpan input);
    ASN1Result<std::vector<Element>> parse_elements(ByteSpan content);

    ASN1Result<BitStringView> parse_bit_string(ByteSpan input);
    ASN1Result<Oid> parse_oid(ByteSpan input);
    ASN1Result<ByteSpan> parse_sequence(ByteSpan input);
    ASN1Result<std::chrono::sys_seconds> parse_time(ByteSpan input);

} // namespace mkrpki::der
