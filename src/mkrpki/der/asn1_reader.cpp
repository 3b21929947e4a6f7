#include <mkrpki/der/asn1_reader.hpp>

#include <limits>
#include <string_view>

namespace mkrpki::der {

    namespace {

        constexpr size_t kMaxLengthOctets = sizeof(size_t);

        ASN1Result<size_t> get_length(ByteSpan input) {
            if (input.empty()) {
                return ASN1Result<size_t>::failure("missing length field");
            }
            const uint8_t first = input[0];
            if ((first & 0x80U) == 0) {
                return ASN1Result<size_t>::ok(first, 1);
            }
            const size_t octet_count = first & 0x7FU;
            if (octet_count == 0) {
                return ASN1Result<size_t>::failure("indefinite lengths are not supported in DER");
            }
            if (octet_count > kMaxLengthOctets) {
                return ASN1Result<size_t>::failure("length uses more bytes than supported");
            }
            if (input.size() < 1 + octet_count) {
                return ASN1Result<size_t>::failure("insufficient data for long-form length");
            }
            size_t length = 0;
            for (size_t i = 0; i < octet_count; ++i) {
                length = (length << 8) | input[1 + i];
            }
            return ASN1Result<size_t>::ok(length, 1 + octet_count);
        }

        // Parses one element and checks its identifier against the expected universal tag.
        ASN1Result<ByteSpan> expect(ByteSpan input, ASN1Class cls, uint32_t tag, bool constructed, const char *name) {
            const auto element = parse_element(input);
            if (!element.success) {
                return ASN1Result<ByteSpan>::failure(element.error);
            }
            const auto &id = element.value.identifier;
            if (id.tag_class != cls || id.tag_number != tag) {
                return ASN1Result<ByteSpan>::failure(std::string("expected ") + name);
            }
            if (id.constructed != constructed) {
                return ASN1Result<ByteSpan>::failure(std::string(name) +
                                                     (constructed ? " must be constructed" : " must be primitive"));
            }
            return ASN1Result<ByteSpan>::ok(element.value.content, element.bytes_consumed);
        }

        ASN1Result<ByteSpan> expect_universal(ByteSpan input, ASN1Tag tag, bool constructed, const char *name) {
            return expect(input, ASN1Class::Universal, static_cast<uint32_t>(tag), constructed, name);
        }

        bool parse_digits(std::string_view view, int &value) {
            value = 0;
            if (view.empty()) {
                return false;
            }
            for (char c : view) {
                if (c < '0' || c > '9') {
                    return false;
                }
                value = (value * 10) + (c - '0');
            }
            return true;
        }

    } // namespace

    ASN1Result<ParsedHeader> parse_id_len(ByteSpan input) {
        if (input.empty()) {
            return ASN1Result<ParsedHeader>::failure("input too small for ASN.1 header");
        }

        size_t offset = 0;
        const uint8_t first_octet = input[offset++];

        ASN1Identifier identifier{};
        identifier.tag_class = static_cast<ASN1Class>(first_octet & 0xC0U);
        identifier.constructed = (first_octet & 0x20U) != 0;

        uint32_t tag_number = first_octet & 0x1FU;
        if (tag_number == 0x1FU) {
            tag_number = 0;
            size_t iterations = 0;
            bool more = true;
            while (more) {
                if (offset >= input.size()) {
                    return ASN1Result<ParsedHeader>::failure("unterminated long-form tag number");
                }
                const uint8_t byte = input[offset++];
                more = (byte & 0x80U) != 0;
                tag_number = (tag_number << 7U) | (byte & 0x7FU);
                if (++iterations > 4 || tag_number > ASN1_MAX_TAG_NUMBER) {
                    return ASN1Result<ParsedHeader>::failure("tag number exceeds supported range");
                }
            }
        }
        identifier.tag_number = tag_number;

        const auto length_res = get_length(input.subspan(offset));
        if (!length_res.success) {
            return ASN1Result<ParsedHeader>::failure(length_res.error);
        }

        const size_t header_bytes = offset + length_res.bytes_consumed;
        if (header_bytes + length_res.value > input.size()) {
            return ASN1Result<ParsedHeader>::failure("value length exceeds buffer");
        }

        ParsedHeader header{identifier, length_res.value, header_bytes};
        return ASN1Result<ParsedHeader>::ok(header, header_bytes + length_res.value);
    }

    ASN1Result<Element> parse_element(ByteSpan input) {
        const auto header = parse_id_len(input);
        if (!header.success) {
            return ASN1Result<Element>::failure(header.error);
        }
        Element element{};
        element.identifier = header.value.identifier;
        element.content = input.subspan(header.value.header_bytes, header.value.length);
        element.encoded = input.subspan(0, header.bytes_consumed);
        return ASN1Result<Element>::ok(element, header.bytes_consumed);
    }

    ASN1Result<std::vector<Element>> parse_elements(ByteSpan content) {
        std::vector<Element> elements;
        size_t offset = 0;
        while (offset < content.size()) {
            auto element = parse_element(content.subspan(offset));
            if (!element.success) {
                return ASN1Result<std::vector<Element>>::failure(element.error);
            }
            offset += element.bytes_consumed;
            elements.push_back(element.value);
        }
        return ASN1Result<std::vector<Element>>::ok(std::move(elements), content.size());
    }

    ASN1Result<BitStringView> parse_bit_string(ByteSpan input) {
        const auto content = expect_universal(input, ASN1Tag::BitString, false, "BIT STRING");
        if (!content.success) {
            return ASN1Result<BitStringView>::failure(content.error);
        }
        if (content.value.empty()) {
            return ASN1Result<BitStringView>::failure("BIT STRING missing unused-bits byte");
        }
        const uint8_t unused_bits = content.value[0];
        if (unused_bits > 7) {
            return ASN1Result<BitStringView>::failure("invalid unused bits");
        }
        return ASN1Result<BitStringView>::ok(BitStringView{unused_bits, content.value.subspan(1)},
                                             content.bytes_consumed);
    }

    ASN1Result<Oid> parse_oid(ByteSpan input) {
        const auto content = expect_universal(input, ASN1Tag::ObjectIdentifier, false, "OBJECT IDENTIFIER");
        if (!content.success) {
            return ASN1Result<Oid>::failure(content.error);
        }
        const auto body = content.value;
        if (body.empty()) {
            return ASN1Result<Oid>::failure("OBJECT IDENTIFIER has empty body");
        }

        Oid oid{};
        const uint8_t first = body[0];
        const uint32_t first_arc = first >= 80 ? 2 : first / 40U;
        oid.nodes.push_back(first_arc);
        oid.nodes.push_back(first - (first_arc * 40U));

        uint32_t value = 0;
        bool pending = false;
        for (size_t i = 1; i < body.size(); ++i) {
            if (value > (std::numeric_limits<uint32_t>::max() >> 7U)) {
                return ASN1Result<Oid>::failure("OBJECT IDENTIFIER arc overflow");
            }
            value = (value << 7U) | (body[i] & 0x7FU);
            pending = (body[i] & 0x80U) != 0;
            if (!pending) {
                oid.nodes.push_back(value);
                value = 0;
            }
        }
        if (pending) {
            return ASN1Result<Oid>::failure("truncated OBJECT IDENTIFIER arc");
        }
        return ASN1Result<Oid>::ok(std::move(oid), content.bytes_consumed);
    }

    ASN1Result<ByteSpan> parse_sequence(ByteSpan input) {
        return expect_universal(input, ASN1Tag::Sequence, true, "SEQUENCE");
    }

    ASN1Result<std::chrono::sys_seconds> parse_time(ByteSpan input) {
        using TimeResult = ASN1Result<std::chrono::sys_seconds>;
        const auto element = parse_element(input);
        if (!element.success) {
            return TimeResult::failure(element.error);
        }
        const auto &id = element.value.identifier;
        const bool utc = id.tag_number == static_cast<uint32_t>(ASN1Tag::UTCTime);
        if (id.tag_class != ASN1Class::Universal ||
            (!utc && id.tag_number != static_cast<uint32_t>(ASN1Tag::GeneralizedTime))) {
            return TimeResult::failure("expected UTCTime or GeneralizedTime");
        }
        const auto str = std::string_view(reinterpret_cast<const char *>(element.value.content.data()),
                                          element.value.content.size());
        const size_t year_digits = utc ? 2 : 4;
        if (str.size() != year_digits + 11 || str.back() != 'Z') {
            return TimeResult::failure("time must be YYMMDDHHMMSSZ or YYYYMMDDHHMMSSZ");
        }

        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        auto rest = str.substr(year_digits);
        if (!parse_digits(str.substr(0, year_digits), year) || !parse_digits(rest.substr(0, 2), month) ||
            !parse_digits(rest.substr(2, 2), day) || !parse_digits(rest.substr(4, 2), hour) ||
            !parse_digits(rest.substr(6, 2), minute) || !parse_digits(rest.substr(8, 2), second)) {
            return TimeResult::failure("invalid time digits");
        }
        if (utc) {
            year += (year >= 50) ? 1900 : 2000;
        }

        using namespace std::chrono;
        const year_month_day ymd{std::chrono::year{year} / std::chrono::month{static_cast<unsigned>(month)} /
                                 std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
            return TimeResult::failure("invalid calendar time");
        }
        const auto tp = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
        return TimeResult::ok(tp, element.bytes_consumed);
    }

} // namespace mkrpki::der
