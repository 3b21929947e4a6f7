#pragma once

#include <optional>
#include <string>

#include <mkrpki/core/result.hpp>
#include <mkrpki/core/serial.hpp>
#include <mkrpki/core/uri.hpp>
#include <mkrpki/crypto/public_key.hpp>
#include <mkrpki/crypto/signer.hpp>
#include <mkrpki/object/validity.hpp>
#include <mkrpki/resources/resource_set.hpp>

namespace mkrpki::object {

    enum class KeyUsage { Ca, Ee };

    // To-be-signed content of a resource certificate (RFC 6487).
    struct TbsCertificate {
        Serial serial;
        std::string issuer_name;
        Validity validity;
        std::string subject_name;
        crypto::PublicKey subject_key;
        KeyUsage key_usage{KeyUsage::Ca};
        resources::OverclaimPolicy overclaim{resources::OverclaimPolicy::Refuse};
        bool basic_ca{};
        std::optional<Bytes> authority_key_identifier;
        std::optional<Uri> crl_uri;
        std::optional<Uri> ca_issuer;
        std::optional<Uri> ca_repository;
        std::optional<Uri> rpki_manifest;
        std::optional<Uri> rpki_notify;
        std::optional<Uri> signed_object;
        resources::Resources resources;
    };

    struct SignedCertificate {
        Bytes tbs;
        crypto::Signature signature;
    };

    class CertificateBuilder {
      public:
        CertificateBuilder(Serial serial, const crypto::PublicKey &issuer, Validity validity,
                           crypto::PublicKey subject_key, KeyUsage key_usage);

        CertificateBuilder &set_overclaim(resources::OverclaimPolicy policy) {
            tbs_.overclaim = policy;
            return *this;
        }

        CertificateBuilder &set_basic_ca(bool ca) {
            tbs_.basic_ca = ca;
            return *this;
        }

        CertificateBuilder &set_crl_uri(Uri uri) {
            tbs_.crl_uri = std::move(uri);
            return *this;
        }

        CertificateBuilder &set_ca_issuer(Uri uri) {
            tbs_.ca_issuer = std::move(uri);
            return *this;
        }

        CertificateBuilder &set_ca_repository(Uri uri) {
            tbs_.ca_repository = std::move(uri);
            return *this;
        }

        CertificateBuilder &set_rpki_manifest(Uri uri) {
            tbs_.rpki_manifest = std::move(uri);
            return *this;
        }

        CertificateBuilder &set_rpki_notify(std::optional<Uri> uri) {
            tbs_.rpki_notify = std::move(uri);
            return *this;
        }

        CertificateBuilder &set_signed_object(Uri uri) {
            tbs_.signed_object = std::move(uri);
            return *this;
        }

        CertificateBuilder &set_resources(resources::Resources res) {
            tbs_.resources = std::move(res);
            return *this;
        }

        [[nodiscard]] TbsCertificate build() const { return tbs_; }

      private:
        TbsCertificate tbs_;
    };

    struct TrustAnchorRequest {
        Serial serial;
        Validity validity;
        Uri ca_repository;
        Uri rpki_manifest;
        std::optional<Uri> rpki_notify;
        std::vector<resources::IpBlock> v4;
        std::vector<resources::IpBlock> v6;
        std::vector<resources::AsBlock> as;
    };

    struct CaCertificateRequest {
        Serial serial;
        Validity validity;
        resources::OverclaimPolicy overclaim{resources::OverclaimPolicy::Refuse};
        Uri crl_uri;
        Uri ca_issuer;
        Uri ca_repository;
        Uri rpki_manifest;
        std::optional<Uri> rpki_notify;
        resources::ResourceRequest resources;
    };

    // Self-signed: issuer and subject are both 'key'. Overclaim is always Refuse.
    TbsCertificate build_trust_anchor(const TrustAnchorRequest &request, const crypto::PublicKey &key);

    TbsCertificate build_ca_certificate(const CaCertificateRequest &request, const crypto::PublicKey &issuer,
                                        const crypto::PublicKey &subject);

    // Fails with ErrorKind::KeyDecode if 'subject_key' is not a usable public key.
    Result<TbsCertificate> build_ca_certificate(const CaCertificateRequest &request, const crypto::PublicKey &issuer,
                                                ByteSpan subject_key);

} // namespace mkrpki::object
