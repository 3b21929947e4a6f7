#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include <mkrpki/core/serial.hpp>
#include <mkrpki/core/uri.hpp>
#include <mkrpki/object/crl.hpp>
#include <mkrpki/object/roa.hpp>
#include <mkrpki/object/validity.hpp>
#include <mkrpki/resources/resource_set.hpp>

namespace mkrpki::issue {

    using Path = std::filesystem::path;

    struct KeyCommand {
        Path private_key;
        Path public_key;
    };

    struct TaCommand {
        Path key;
        Serial serial;
        object::ValidityRequest validity;
        Uri ca_repository;
        Uri rpki_manifest;
        std::optional<Uri> rpki_notify;
        std::vector<resources::IpBlock> v4;
        std::vector<resources::IpBlock> v6;
        std::vector<resources::AsBlock> as;
        Uri tal_rsync_uri;
        std::optional<Uri> tal_https_uri;
        Path output;
        std::optional<Path> output_tal;
    };

    struct CerCommand {
        Path issuer_key;
        Path subject_key;
        Serial serial;
        object::ValidityRequest validity;
        bool trim_resources{};
        Uri crl;
        Uri ca_issuer;
        Uri ca_repository;
        Uri rpki_manifest;
        std::optional<Uri> rpki_notify;
        resources::ResourceRequest resources;
        Path output;
    };

    struct CrlCommand {
        Path issuer_key;
        object::UpdateRequest update;
        std::vector<object::CrlEntry> revoked;
        Serial crl_number;
        Path output;
    };

    struct RoaCommand {
        Path issuer_key;
        Serial serial;
        object::ValidityRequest validity;
        Uri crl;
        Uri ca_issuer;
        Uri signed_object;
        uint32_t asn{};
        std::vector<object::RoaPrefix> prefixes;
        Path output;
    };

    struct MftCommand {
        Path issuer_key;
        Serial serial;
        object::ValidityRequest validity;
        Uri crl;
        Uri ca_issuer;
        Serial number;
        Uri signed_object;
        object::UpdateRequest update;
        std::vector<Path> files;
        Path output;
    };

} // namespace mkrpki::issue
