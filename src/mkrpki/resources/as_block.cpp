#include <mkrpki/resources/as_block.hpp>

#include <algorithm>
#include <limits>

namespace mkrpki::resources {

    Result<uint32_t> parse_as_id(std::string_view text) {
        auto invalid = [&]() {
            return Result<uint32_t>::failure(ErrorKind::Parse, "Invalid AS number '" + std::string(text) + "'");
        };

        std::string_view digits = text;
        if (digits.size() >= 2 && (digits[0] == 'A' || digits[0] == 'a') && (digits[1] == 'S' || digits[1] == 's')) {
            digits.remove_prefix(2);
        }
        if (digits.empty()) {
            return invalid();
        }

        uint64_t value = 0;
        for (char c : digits) {
            if (c < '0' || c > '9') {
                return invalid();
            }
            value = (value * 10) + static_cast<uint64_t>(c - '0');
            if (value > std::numeric_limits<uint32_t>::max()) {
                return invalid();
            }
        }
        return Result<uint32_t>::ok(static_cast<uint32_t>(value));
    }

    Result<AsBlock> AsBlock::parse(std::string_view text) {
        const auto dash = text.find('-');
        if (dash == std::string_view::npos) {
            auto id = parse_as_id(text);
            if (!id.success) {
                return id.forward<AsBlock>();
            }
            return Result<AsBlock>::ok(AsBlock{id.value, id.value});
        }

        auto min = parse_as_id(text.substr(0, dash));
        if (!min.success) {
            return min.forward<AsBlock>();
        }
        auto max = parse_as_id(text.substr(dash + 1));
        if (!max.success) {
            return max.forward<AsBlock>();
        }
        if (max.value < min.value) {
            return Result<AsBlock>::failure(ErrorKind::Parse,
                                            "Invalid AS block '" + std::string(text) + "': range start after end");
        }
        return Result<AsBlock>::ok(AsBlock{min.value, max.value});
    }

    std::string AsBlock::to_string() const {
        if (is_id()) {
            return "AS" + std::to_string(min);
        }
        return "AS" + std::to_string(min) + "-AS" + std::to_string(max);
    }

    std::vector<AsBlock> normalize(std::vector<AsBlock> blocks) {
        std::sort(blocks.begin(), blocks.end(), [](const AsBlock &a, const AsBlock &b) { return a.min < b.min; });

        std::vector<AsBlock> merged;
        for (const auto &block : blocks) {
            if (!merged.empty() && static_cast<uint64_t>(block.min) <= static_cast<uint64_t>(merged.back().max) + 1) {
                merged.back().max = std::max(merged.back().max, block.max);
                continue;
            }
            merged.push_back(block);
        }
        return merged;
    }

} // namespace mkrpki::resources
