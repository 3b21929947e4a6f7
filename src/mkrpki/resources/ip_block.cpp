#include <mkrpki/resources/ip_block.hpp>

#include <algorithm>
#include <array>

#include <arpa/inet.h>

namespace mkrpki::resources {

    namespace {

        unsigned byte_width(AddressFamily family) { return address_bits(family) / 8; }

        void set_trailing_bits(IpAddress &address, unsigned from) {
            for (unsigned i = from; i < address_bits(address.family); ++i) {
                address.bytes[i / 8] |= static_cast<uint8_t>(0x80U >> (i % 8));
            }
        }

        // Returns false on overflow.
        bool increment(IpAddress &address) {
            for (int i = static_cast<int>(byte_width(address.family)) - 1; i >= 0; --i) {
                if (++address.bytes[static_cast<size_t>(i)] != 0) {
                    return true;
                }
            }
            return false;
        }

        bool parse_length(std::string_view text, unsigned limit, unsigned &length) {
            if (text.empty() || text.size() > 3) {
                return false;
            }
            length = 0;
            for (char c : text) {
                if (c < '0' || c > '9') {
                    return false;
                }
                length = (length * 10) + static_cast<unsigned>(c - '0');
            }
            return length <= limit;
        }

    } // namespace

    Result<IpAddress> IpAddress::parse(std::string_view text) {
        const std::string str(text);
        IpAddress address;
        if (str.find(':') != std::string::npos) {
            address.family = AddressFamily::Ipv6;
            if (inet_pton(AF_INET6, str.c_str(), address.bytes.data()) == 1) {
                return Result<IpAddress>::ok(address);
            }
        } else {
            address.family = AddressFamily::Ipv4;
            if (inet_pton(AF_INET, str.c_str(), address.bytes.data()) == 1) {
                return Result<IpAddress>::ok(address);
            }
        }
        return Result<IpAddress>::failure(ErrorKind::Parse, "Invalid IP address '" + str + "'");
    }

    bool IpAddress::trailing_bits_are(unsigned from, bool value) const {
        for (unsigned i = from; i < address_bits(family); ++i) {
            if (bit(i) != value) {
                return false;
            }
        }
        return true;
    }

    std::string IpAddress::to_string() const {
        std::array<char, INET6_ADDRSTRLEN> buffer{};
        const int af = family == AddressFamily::Ipv4 ? AF_INET : AF_INET6;
        if (inet_ntop(af, bytes.data(), buffer.data(), buffer.size()) == nullptr) {
            return "?";
        }
        return buffer.data();
    }

    Result<IpBlock> IpBlock::from_prefix(const IpAddress &address, unsigned length) {
        if (length > address_bits(address.family)) {
            return Result<IpBlock>::failure(ErrorKind::Parse, "prefix length " + std::to_string(length) +
                                                                  " exceeds address width");
        }
        if (!address.trailing_bits_are(length, false)) {
            return Result<IpBlock>::failure(ErrorKind::Parse, "host bits set in " + address.to_string() + "/" +
                                                                  std::to_string(length));
        }
        IpAddress max = address;
        set_trailing_bits(max, length);
        return Result<IpBlock>::ok(IpBlock(address, max));
    }

    Result<IpBlock> IpBlock::from_range(const IpAddress &min, const IpAddress &max) {
        if (min.family != max.family) {
            return Result<IpBlock>::failure(ErrorKind::Parse, "range mixes address families");
        }
        if (max < min) {
            return Result<IpBlock>::failure(ErrorKind::Parse, "range start " + min.to_string() + " after end " +
                                                                  max.to_string());
        }
        return Result<IpBlock>::ok(IpBlock(min, max));
    }

    Result<IpBlock> IpBlock::parse(std::string_view text, AddressFamily family) {
        const std::string family_name = family == AddressFamily::Ipv4 ? "IPv4" : "IPv6";
        auto invalid = [&](const std::string &why) {
            return Result<IpBlock>::failure(ErrorKind::Parse,
                                            "Invalid " + family_name + " block '" + std::string(text) + "': " + why);
        };
        auto address = [&](std::string_view part) -> Result<IpAddress> {
            auto parsed = IpAddress::parse(part);
            if (parsed.success && parsed.value.family != family) {
                return Result<IpAddress>::failure(ErrorKind::Parse, "not an " + family_name + " address");
            }
            return parsed;
        };

        Result<IpBlock> block;
        if (const auto slash = text.find('/'); slash != std::string_view::npos) {
            auto addr = address(text.substr(0, slash));
            if (!addr.success) {
                return invalid(addr.error);
            }
            unsigned length = 0;
            if (!parse_length(text.substr(slash + 1), address_bits(family), length)) {
                return invalid("bad prefix length");
            }
            block = from_prefix(addr.value, length);
        } else if (const auto dash = text.find('-'); dash != std::string_view::npos) {
            auto min = address(text.substr(0, dash));
            if (!min.success) {
                return invalid(min.error);
            }
            auto max = address(text.substr(dash + 1));
            if (!max.success) {
                return invalid(max.error);
            }
            block = from_range(min.value, max.value);
        } else {
            auto addr = address(text);
            if (!addr.success) {
                return invalid(addr.error);
            }
            block = from_prefix(addr.value, address_bits(family));
        }

        if (!block.success) {
            return invalid(block.error);
        }
        return block;
    }

    int IpBlock::prefix_length() const {
        const unsigned bits = address_bits(family());
        unsigned common = 0;
        while (common < bits && min_.bit(common) == max_.bit(common)) {
            ++common;
        }
        if (min_.trailing_bits_are(common, false) && max_.trailing_bits_are(common, true)) {
            return static_cast<int>(common);
        }
        return -1;
    }

    std::string IpBlock::to_string() const {
        const int length = prefix_length();
        if (length >= 0) {
            return min_.to_string() + "/" + std::to_string(length);
        }
        return min_.to_string() + "-" + max_.to_string();
    }

    std::vector<IpBlock> normalize(std::vector<IpBlock> blocks) {
        std::sort(blocks.begin(), blocks.end(),
                  [](const IpBlock &a, const IpBlock &b) { return a.min() < b.min(); });

        std::vector<IpBlock> merged;
        for (const auto &block : blocks) {
            if (!merged.empty()) {
                IpAddress next = merged.back().max();
                const bool touches = block.min() <= merged.back().max() || !increment(next) || next == block.min();
                if (touches) {
                    const IpAddress max = std::max(merged.back().max(), block.max());
                    merged.back() = IpBlock::from_range(merged.back().min(), max).value;
                    continue;
                }
            }
            merged.push_back(block);
        }
        return merged;
    }

} // namespace mkrpki::resources
