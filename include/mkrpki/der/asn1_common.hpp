#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace mkrpki {

    using Bytes = std::vector<uint8_t>;
    using ByteSpan = std::span<const uint8_t>;

} // namespace mkrpki

namespace mkrpki::der {

    constexpr inline size_t ASN1_MAX_TAG_NUMBER = (1U << 28); // Guardrail for corrupted tags

    enum class ASN1Class : uint8_t { Universal = 0x00, Application = 0x40, ContextSpecific = 0x80, Private = 0xC0 };

    enum class ASN1Tag : uint8_t {
        Boolean = 0x01,
        Integer = 0x02,
        BitString = 0x03,
        OctetString = 0x04,
        Null = 0x05,
        ObjectIdentifier = 0x06,
        UTF8String = 0x0C,
        Sequence = 0x10,
        Set = 0x11,
        PrintableString = 0x13,
        IA5String = 0x16,
        UTCTime = 0x17,
        GeneralizedTime = 0x18
    };

    struct ASN1Identifier {
        ASN1Class tag_class{};
        bool constructed{};
        uint32_t tag_number{};
    };

    struct Oid {
        std::vector<uint32_t> nodes;

        bool operator==(const Oid &other) const = default;
    };

} // namespace mkrpki::der
