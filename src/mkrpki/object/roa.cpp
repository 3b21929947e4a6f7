#include <mkrpki/object/roa.hpp>

namespace mkrpki::object {

    namespace {

        // Decimal octet with an optional '+' and any number of leading zeros.
        bool parse_u8(std::string_view text, uint8_t &out) {
            if (!text.empty() && text.front() == '+') {
                text.remove_prefix(1);
            }
            if (text.empty()) {
                return false;
            }
            unsigned value = 0;
            for (char c : text) {
                if (c < '0' || c > '9') {
                    return false;
                }
                value = (value * 10) + static_cast<unsigned>(c - '0');
                if (value > 255) {
                    return false;
                }
            }
            out = static_cast<uint8_t>(value);
            return true;
        }

        Result<std::vector<resources::IpBlock>> blocks_of(const std::vector<RoaPrefix> &prefixes) {
            std::vector<resources::IpBlock> blocks;
            blocks.reserve(prefixes.size());
            for (const auto &prefix : prefixes) {
                auto block = resources::IpBlock::from_prefix(prefix.address, prefix.length);
                if (!block.success) {
                    return Result<std::vector<resources::IpBlock>>::failure(ErrorKind::Encoding,
                                                                            "Invalid ROA prefix: " + block.error);
                }
                blocks.push_back(block.value);
            }
            return Result<std::vector<resources::IpBlock>>::ok(std::move(blocks));
        }

    } // namespace

    Result<RoaPrefix> RoaPrefix::parse(std::string_view text) {
        auto invalid = [&]() {
            return Result<RoaPrefix>::failure(ErrorKind::Parse, "Invalid ROA prefix '" + std::string(text) + "'");
        };

        std::string_view prefix = text;
        std::optional<std::string_view> max_text;
        if (const auto dash = text.find('-'); dash != std::string_view::npos) {
            prefix = text.substr(0, dash);
            max_text = text.substr(dash + 1);
        }

        const auto slash = prefix.find('/');
        if (slash == std::string_view::npos) {
            return invalid();
        }

        auto address = resources::IpAddress::parse(prefix.substr(0, slash));
        if (!address.success) {
            return invalid();
        }

        RoaPrefix result;
        result.address = address.value;
        if (!parse_u8(prefix.substr(slash + 1), result.length)) {
            return invalid();
        }
        if (max_text) {
            uint8_t max_length = 0;
            if (!parse_u8(*max_text, max_length)) {
                return invalid();
            }
            result.max_length = max_length;
        }
        return Result<RoaPrefix>::ok(result);
    }

    RoaContent RoaContent::from_prefixes(uint32_t as_id, const std::vector<RoaPrefix> &prefixes) {
        RoaContent content;
        content.as_id = as_id;
        for (const auto &prefix : prefixes) {
            if (prefix.family() == resources::AddressFamily::Ipv4) {
                content.v4.push_back(prefix);
            } else {
                content.v6.push_back(prefix);
            }
        }
        return content;
    }

    Result<resources::Resources> RoaContent::ee_resources() const {
        auto v4_blocks = blocks_of(v4);
        if (!v4_blocks.success) {
            return v4_blocks.forward<resources::Resources>();
        }
        auto v6_blocks = blocks_of(v6);
        if (!v6_blocks.success) {
            return v6_blocks.forward<resources::Resources>();
        }

        resources::ResourceRequest request;
        request.v4 = std::move(v4_blocks.value);
        request.v6 = std::move(v6_blocks.value);
        return Result<resources::Resources>::ok(resources::Resources::from_request(std::move(request)));
    }

} // namespace mkrpki::object
