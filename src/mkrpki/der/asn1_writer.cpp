#include <mkrpki/der/asn1_writer.hpp>

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mkrpki::der {

    namespace {

        void append_base128(std::vector<uint8_t> &out, uint32_t value) {
            std::array<uint8_t, 5> buffer{};
            int idx = 4;
            buffer[idx] = static_cast<uint8_t>(value & 0x7FU);
            value >>= 7U;
            while (value > 0 && idx > 0) {
                buffer[--idx] = static_cast<uint8_t>((value & 0x7FU) | 0x80U);
                value >>= 7U;
            }
            out.insert(out.end(), buffer.begin() + idx, buffer.end());
        }

        void append_identifier(std::vector<uint8_t> &out, ASN1Class cls, bool constructed, uint32_t tag) {
            uint8_t first = static_cast<uint8_t>(cls) | (constructed ? 0x20U : 0x00U);
            if (tag < 31) {
                out.push_back(static_cast<uint8_t>(first | (tag & 0x1FU)));
                return;
            }
            out.push_back(static_cast<uint8_t>(first | 0x1FU));
            append_base128(out, tag);
        }

        void append_length(std::vector<uint8_t> &out, size_t length) {
            if (length < 0x80U) {
                out.push_back(static_cast<uint8_t>(length));
                return;
            }
            std::array<uint8_t, sizeof(size_t)> buffer{};
            size_t idx = buffer.size();
            while (length > 0) {
                buffer[--idx] = static_cast<uint8_t>(length & 0xFFU);
                length >>= 8U;
            }
            out.push_back(static_cast<uint8_t>(0x80U | (buffer.size() - idx)));
            out.insert(out.end(), buffer.begin() + static_cast<std::ptrdiff_t>(idx), buffer.end());
        }

        std::vector<uint8_t> encode_string(std::string_view str, ASN1Tag tag) {
            return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(tag),
                              ByteSpan(reinterpret_cast<const uint8_t *>(str.data()), str.size()));
        }

        std::string format_time(std::chrono::sys_seconds tp, bool utc_time) {
            using namespace std::chrono;
            const auto midnight = floor<days>(tp);
            const year_month_day ymd{midnight};
            const hh_mm_ss hms{tp - midnight};
            const int year = static_cast<int>(ymd.year());
            std::ostringstream oss;
            oss << std::setfill('0');
            if (utc_time) {
                oss << std::setw(2) << (year % 100);
            } else {
                oss << std::setw(4) << year;
            }
            oss << std::setw(2) << static_cast<unsigned>(ymd.month()) << std::setw(2)
                << static_cast<unsigned>(ymd.day()) << std::setw(2) << hms.hours().count() << std::setw(2)
                << hms.minutes().count() << std::setw(2) << hms.seconds().count() << 'Z';
            return oss.str();
        }

    } // namespace

    std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>> &parts) {
        size_t total = 0;
        for (const auto &part : parts) {
            total += part.size();
        }
        std::vector<uint8_t> out;
        out.reserve(total);
        for (const auto &part : parts) {
            out.insert(out.end(), part.begin(), part.end());
        }
        return out;
    }

    std::vector<uint8_t> encode_tlv(ASN1Class cls, bool constructed, uint32_t tag, ByteSpan content) {
        std::vector<uint8_t> out;
        out.reserve(content.size() + 6);
        append_identifier(out, cls, constructed, tag);
        append_length(out, content.size());
        out.insert(out.end(), content.begin(), content.end());
        return out;
    }

    std::vector<uint8_t> encode_sequence(const std::vector<uint8_t> &content) {
        return encode_tlv(ASN1Class::Universal, true, static_cast<uint32_t>(ASN1Tag::Sequence), content);
    }

    std::vector<uint8_t> encode_set(const std::vector<uint8_t> &content) {
        return encode_tlv(ASN1Class::Universal, true, static_cast<uint32_t>(ASN1Tag::Set), content);
    }

    std::vector<uint8_t> encode_set_of(std::vector<std::vector<uint8_t>> elements) {
        // DER orders SET OF members by their encodings (X.690, 11.6).
        std::sort(elements.begin(), elements.end());
        return encode_set(concat(elements));
    }

    std::vector<uint8_t> encode_integer(const std::vector<uint8_t> &value) {
        std::vector<uint8_t> sanitized = value;
        while (sanitized.size() > 1 && sanitized[0] == 0x00 && (sanitized[1] & 0x80U) == 0) {
            sanitized.erase(sanitized.begin());
        }
        if (sanitized.empty()) {
            sanitized.push_back(0);
        }
        if (sanitized[0] & 0x80U) {
            sanitized.insert(sanitized.begin(), 0x00);
        }
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::Integer), sanitized);
    }

    std::vector<uint8_t> encode_integer(uint64_t value) {
        std::vector<uint8_t> buffer;
        do {
            buffer.insert(buffer.begin(), static_cast<uint8_t>(value & 0xFFU));
            value >>= 8U;
        } while (value);
        return encode_integer(buffer);
    }

    std::vector<uint8_t> encode_bit_string(ByteSpan bits, uint8_t unused_bits) {
        std::vector<uint8_t> content;
        content.reserve(bits.size() + 1);
        content.push_back(bits.empty() ? 0 : unused_bits);
        content.insert(content.end(), bits.begin(), bits.end());
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::BitString), content);
    }

    std::vector<uint8_t> encode_octet_string(ByteSpan bytes) {
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::OctetString), bytes);
    }

    std::vector<uint8_t> encode_boolean(bool value) {
        uint8_t byte = value ? 0xFF : 0x00;
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::Boolean), ByteSpan(&byte, 1));
    }

    std::vector<uint8_t> encode_null() { return {static_cast<uint8_t>(ASN1Tag::Null), 0x00}; }

    std::vector<uint8_t> encode_oid(const Oid &oid) {
        std::vector<uint8_t> body;
        if (oid.nodes.size() < 2) {
            body.push_back(0);
        } else {
            append_base128(body, (oid.nodes[0] * 40U) + oid.nodes[1]);
            for (size_t i = 2; i < oid.nodes.size(); ++i) {
                append_base128(body, oid.nodes[i]);
            }
        }
        return encode_tlv(ASN1Class::Universal, false, static_cast<uint32_t>(ASN1Tag::ObjectIdentifier), body);
    }

    std::vector<uint8_t> encode_printable_string(std::string_view str) {
        return encode_string(str, ASN1Tag::PrintableString);
    }

    std::vector<uint8_t> encode_ia5_string(std::string_view str) { return encode_string(str, ASN1Tag::IA5String); }

    std::vector<uint8_t> encode_explicit(uint32_t tag, const std::vector<uint8_t> &inner) {
        return encode_tlv(ASN1Class::ContextSpecific, true, tag, inner);
    }

    std::vector<uint8_t> encode_implicit(uint32_t tag, const std::vector<uint8_t> &inner) {
        if (inner.empty() || tag >= 31 || (inner[0] & 0x1FU) == 0x1FU) {
            throw std::invalid_argument("implicit tagging needs a low-tag-number element");
        }
        std::vector<uint8_t> out = inner;
        out[0] = static_cast<uint8_t>(static_cast<uint8_t>(ASN1Class::ContextSpecific) | (inner[0] & 0x20U) | tag);
        return out;
    }

    std::vector<uint8_t> encode_utc_time(std::chrono::sys_seconds tp) {
        return encode_string(format_time(tp, true), ASN1Tag::UTCTime);
    }

    std::vector<uint8_t> encode_generalized_time(std::chrono::sys_seconds tp) {
        return encode_string(format_time(tp, false), ASN1Tag::GeneralizedTime);
    }

    std::vector<uint8_t> encode_time(std::chrono::sys_seconds tp) {
        const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(tp)};
        const int year = static_cast<int>(ymd.year());
        if (year >= 1950 && year <= 2049) {
            return encode_utc_time(tp);
        }
        return encode_generalized_time(tp);
    }

} // namespace mkrpki::der
