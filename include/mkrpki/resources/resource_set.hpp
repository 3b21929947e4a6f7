#pragma once

#include <string_view>
#include <utility>
#include <vector>

#include <mkrpki/resources/as_block.hpp>
#include <mkrpki/resources/ip_block.hpp>

namespace mkrpki::resources {

    // Resources of one family: left out entirely, inherited from the issuer, or listed explicitly.
    template <typename Block> class ResourceSet {
      public:
        enum class State { Absent, Inherit, Explicit };

        ResourceSet() = default;

        static ResourceSet absent() { return ResourceSet(State::Absent, {}); }
        static ResourceSet inherit() { return ResourceSet(State::Inherit, {}); }
        static ResourceSet explicit_blocks(std::vector<Block> blocks) {
            return ResourceSet(State::Explicit, std::move(blocks));
        }

        // Inherit overrides any listed blocks; an empty list without inherit is Absent.
        static ResourceSet from_request(bool inherit_requested, std::vector<Block> blocks) {
            if (inherit_requested) {
                return inherit();
            }
            if (blocks.empty()) {
                return absent();
            }
            return explicit_blocks(std::move(blocks));
        }

        [[nodiscard]] State state() const noexcept { return state_; }
        [[nodiscard]] bool is_absent() const noexcept { return state_ == State::Absent; }
        [[nodiscard]] bool is_inherit() const noexcept { return state_ == State::Inherit; }
        [[nodiscard]] bool is_explicit() const noexcept { return state_ == State::Explicit; }

        // In the order given; empty unless explicit.
        [[nodiscard]] const std::vector<Block> &blocks() const noexcept { return blocks_; }

        bool operator==(const ResourceSet &other) const = default;

      private:
        ResourceSet(State state, std::vector<Block> blocks) : state_(state), blocks_(std::move(blocks)) {}

        State state_{State::Absent};
        std::vector<Block> blocks_;
    };

    using IpResources = ResourceSet<IpBlock>;
    using AsResources = ResourceSet<AsBlock>;

    // How relying parties treat resources beyond the issuer's own (RFC 8360).
    enum class OverclaimPolicy { Refuse, Trim };

    struct ResourceRequest {
        bool inherit_v4{};
        std::vector<IpBlock> v4;
        bool inherit_v6{};
        std::vector<IpBlock> v6;
        bool inherit_as{};
        std::vector<AsBlock> as;
    };

    // All three families of a certificate.
    struct Resources {
        IpResources v4;
        IpResources v6;
        AsResources as;

        static Resources from_request(ResourceRequest request) {
            return Resources{IpResources::from_request(request.inherit_v4, std::move(request.v4)),
                             IpResources::from_request(request.inherit_v6, std::move(request.v6)),
                             AsResources::from_request(request.inherit_as, std::move(request.as))};
        }

        static Resources inherit_all() {
            return Resources{IpResources::inherit(), IpResources::inherit(), AsResources::inherit()};
        }

        [[nodiscard]] bool has_ip() const { return !v4.is_absent() || !v6.is_absent(); }
        [[nodiscard]] bool has_as() const { return !as.is_absent(); }

        bool operator==(const Resources &other) const = default;
    };

    template <typename Block> std::string_view state_name(const ResourceSet<Block> &set) {
        if (set.is_inherit()) {
            return "inherit";
        }
        return set.is_explicit() ? "explicit" : "absent";
    }

} // namespace mkrpki::resources
