#pragma once

#include <array>
#include <string_view>
#include <utility>

#include <mkrpki/der/asn1_common.hpp>

namespace mkrpki::der::oids {

    /**
     * Object identifiers used by the RPKI profile (RFC 6487, 6488, 6482, 9286, 3779, 8360)
     * and the algorithm profile (RFC 7935).
     */

    // Algorithms
    inline const Oid rsa_encryption{{1, 2, 840, 113549, 1, 1, 1}};
    inline const Oid sha256_with_rsa{{1, 2, 840, 113549, 1, 1, 11}};
    inline const Oid sha256{{2, 16, 840, 1, 101, 3, 4, 2, 1}};

    // Name attributes
    inline const Oid common_name{{2, 5, 4, 3}};

    // Certificate and CRL extensions
    inline const Oid subject_key_identifier{{2, 5, 29, 14}};
    inline const Oid key_usage{{2, 5, 29, 15}};
    inline const Oid basic_constraints{{2, 5, 29, 19}};
    inline const Oid crl_number{{2, 5, 29, 20}};
    inline const Oid crl_distribution_points{{2, 5, 29, 31}};
    inline const Oid certificate_policies{{2, 5, 29, 32}};
    inline const Oid authority_key_identifier{{2, 5, 29, 35}};
    inline const Oid authority_info_access{{1, 3, 6, 1, 5, 5, 7, 1, 1}};
    inline const Oid subject_info_access{{1, 3, 6, 1, 5, 5, 7, 1, 11}};
    inline const Oid ip_addr_blocks{{1, 3, 6, 1, 5, 5, 7, 1, 7}};
    inline const Oid autonomous_sys_ids{{1, 3, 6, 1, 5, 5, 7, 1, 8}};
    inline const Oid ip_addr_blocks_v2{{1, 3, 6, 1, 5, 5, 7, 1, 28}};
    inline const Oid autonomous_sys_ids_v2{{1, 3, 6, 1, 5, 5, 7, 1, 29}};

    // Certificate policies
    inline const Oid cp_ip_addr_as_number{{1, 3, 6, 1, 5, 5, 7, 14, 2}};
    inline const Oid cp_ip_addr_as_number_v2{{1, 3, 6, 1, 5, 5, 7, 14, 3}};

    // Access methods
    inline const Oid ad_ca_issuers{{1, 3, 6, 1, 5, 5, 7, 48, 2}};
    inline const Oid ad_ca_repository{{1, 3, 6, 1, 5, 5, 7, 48, 5}};
    inline const Oid ad_rpki_manifest{{1, 3, 6, 1, 5, 5, 7, 48, 10}};
    inline const Oid ad_signed_object{{1, 3, 6, 1, 5, 5, 7, 48, 11}};
    inline const Oid ad_rpki_notify{{1, 3, 6, 1, 5, 5, 7, 48, 13}};

    // CMS
    inline const Oid signed_data{{1, 2, 840, 113549, 1, 7, 2}};
    inline const Oid attr_content_type{{1, 2, 840, 113549, 1, 9, 3}};
    inline const Oid attr_message_digest{{1, 2, 840, 113549, 1, 9, 4}};
    inline const Oid attr_signing_time{{1, 2, 840, 113549, 1, 9, 5}};
    inline const Oid ct_route_origin_authz{{1, 2, 840, 113549, 1, 9, 16, 1, 24}};
    inline const Oid ct_rpki_manifest{{1, 2, 840, 113549, 1, 9, 16, 1, 26}};

    inline std::string_view name_of(const Oid &oid) {
        static const std::array<std::pair<const Oid *, std::string_view>, 30> kNames = {{
            {&rsa_encryption, "rsaEncryption"},
            {&sha256_with_rsa, "sha256WithRSAEncryption"},
            {&sha256, "sha256"},
            {&common_name, "commonName"},
            {&subject_key_identifier, "subjectKeyIdentifier"},
            {&key_usage, "keyUsage"},
            {&basic_constraints, "basicConstraints"},
            {&crl_number, "cRLNumber"},
            {&crl_distribution_points, "cRLDistributionPoints"},
            {&certificate_policies, "certificatePolicies"},
            {&authority_key_identifier, "authorityKeyIdentifier"},
            {&authority_info_access, "authorityInfoAccess"},
            {&subject_info_access, "subjectInfoAccess"},
            {&ip_addr_blocks, "id-pe-ipAddrBlocks"},
            {&autonomous_sys_ids, "id-pe-autonomousSysIds"},
            {&ip_addr_blocks_v2, "id-pe-ipAddrBlocks-v2"},
            {&autonomous_sys_ids_v2, "id-pe-autonomousSysIds-v2"},
            {&cp_ip_addr_as_number, "id-cp-ipAddr-asNumber"},
            {&cp_ip_addr_as_number_v2, "id-cp-ipAddr-asNumber-v2"},
            {&ad_ca_issuers, "id-ad-caIssuers"},
            {&ad_ca_repository, "id-ad-caRepository"},
            {&ad_rpki_manifest, "id-ad-rpkiManifest"},
            {&ad_signed_object, "id-ad-signedObject"},
            {&ad_rpki_notify, "id-ad-rpkiNotify"},
            {&signed_data, "signedData"},
            {&attr_content_type, "contentType"},
            {&attr_message_digest, "messageDigest"},
            {&attr_signing_time, "signingTime"},
            {&ct_route_origin_authz, "id-ct-routeOriginAuthz"},
            {&ct_rpki_manifest, "id-ct-rpkiManifest"},
        }};
        for (const auto &[known, name] : kNames) {
            if (*known == oid) {
                return name;
            }
        }
        return "unknown";
    }

} // namespace mkrpki::der::oids
