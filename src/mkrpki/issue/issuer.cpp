#include <mkrpki/issue/issuer.hpp>

#include <mkrpki/object/certificate.hpp>
#include <mkrpki/object/crl.hpp>
#include <mkrpki/object/manifest.hpp>
#include <mkrpki/object/roa.hpp>
#include <mkrpki/object/signed_object.hpp>
#include <mkrpki/utils/common.hpp>
#include <mkrpki/utils/logging.hpp>

namespace mkrpki::issue {

    namespace {

        constexpr auto kSignatureAlgorithm = crypto::SignatureAlgorithm::Sha256WithRsa;
        constexpr auto kDigestAlgorithm = crypto::DigestAlgorithm::Sha256;

        void log_validity(const object::Validity &validity) {
            logging::logger()->debug("validity {} to {}", format_time(validity.not_before),
                                     format_time(validity.not_after));
        }

        void log_resources(const resources::Resources &res) {
            logging::logger()->debug("resources: v4 {}, v6 {}, as {}", resources::state_name(res.v4),
                                     resources::state_name(res.v6), resources::state_name(res.as));
        }

    } // namespace

    std::string make_tal(const Uri &rsync_uri, const std::optional<Uri> &https_uri, const crypto::PublicKey &key) {
        std::string tal = rsync_uri.str() + "\n";
        if (https_uri) {
            tal += https_uri->str() + "\n";
        }
        tal += "\n";
        tal += utils::to_base64(key.info_bytes()) + "\n";
        return tal;
    }

    Issuer::Issuer(const crypto::KeyStore &keys, const crypto::Signer &signer, const encode::Encoder &encoder,
                   const crypto::DigestStream &digests, Clock clock)
        : keys_(keys), signer_(signer), encoder_(encoder), digests_(digests), clock_(std::move(clock)) {}

    Result<Bytes> Issuer::sign_certificate(const object::TbsCertificate &tbs, crypto::KeyHandle issuer) const {
        auto tbs_der = encoder_.encode_tbs_certificate(tbs);
        if (!tbs_der.success) {
            return tbs_der;
        }
        logging::logger()->debug("signing certificate {} for {} ({} bytes)", tbs.serial.to_string(),
                                 tbs.subject_name, tbs_der.value.size());

        auto signature = signer_.sign(issuer, kSignatureAlgorithm, tbs_der.value);
        if (!signature.success) {
            return signature.forward<Bytes>();
        }
        return encoder_.encode_certificate(object::SignedCertificate{std::move(tbs_der.value),
                                                                     std::move(signature.value)});
    }

    Result<Bytes> Issuer::sign_crl(const object::TbsCrl &tbs, crypto::KeyHandle issuer) const {
        auto tbs_der = encoder_.encode_tbs_crl(tbs);
        if (!tbs_der.success) {
            return tbs_der;
        }
        logging::logger()->debug("signing CRL {} with {} entries ({} bytes)", tbs.crl_number.to_string(),
                                 tbs.entries.size(), tbs_der.value.size());

        auto signature = signer_.sign(issuer, kSignatureAlgorithm, tbs_der.value);
        if (!signature.success) {
            return signature.forward<Bytes>();
        }
        return encoder_.encode_crl(object::SignedCrl{std::move(tbs_der.value), std::move(signature.value)});
    }

    Result<Bytes> Issuer::sign_object(object::SignedContentType type, const Bytes &content,
                                      const object::SignedObjectEnvelope &envelope, resources::Resources ee_resources,
                                      crypto::KeyHandle issuer) const {
        auto issuer_key = keys_.public_key(issuer);
        if (!issuer_key.success) {
            return issuer_key.forward<Bytes>();
        }

        object::SignedAttributes attrs{object::content_type_oid(type), digests_.digest(kDigestAlgorithm, content),
                                       truncate_to_seconds(clock_())};
        auto attrs_der = encoder_.encode_signed_attributes(attrs);
        if (!attrs_der.success) {
            return attrs_der;
        }

        auto one_off = signer_.sign_one_off(kSignatureAlgorithm, attrs_der.value);
        if (!one_off.success) {
            return one_off.forward<Bytes>();
        }

        const auto ee_tbs =
            object::build_ee_certificate(envelope, issuer_key.value, one_off.value.public_key, std::move(ee_resources));
        log_resources(ee_tbs.resources);
        auto ee_cert = sign_certificate(ee_tbs, issuer);
        if (!ee_cert.success) {
            return ee_cert;
        }

        object::SignedObject signed_object;
        signed_object.content_type = attrs.content_type;
        signed_object.content = content;
        signed_object.digest_algorithm = kDigestAlgorithm;
        signed_object.signed_attributes = std::move(attrs_der.value);
        signed_object.ee_certificate = std::move(ee_cert.value);
        signed_object.signer_key_identifier = one_off.value.public_key.key_identifier();
        signed_object.signature = std::move(one_off.value.signature);
        return encoder_.encode_signed_object(signed_object);
    }

    Result<TrustAnchorOutput> Issuer::issue_trust_anchor(crypto::KeyHandle key, const TaCommand &command) const {
        auto public_key = keys_.public_key(key);
        if (!public_key.success) {
            return public_key.forward<TrustAnchorOutput>();
        }

        auto validity = object::resolve_validity(command.validity, clock_());
        if (!validity.success) {
            return validity.forward<TrustAnchorOutput>();
        }
        log_validity(validity.value);

        object::TrustAnchorRequest request{command.serial,      validity.value, command.ca_repository,
                                           command.rpki_manifest, command.rpki_notify, command.v4,
                                           command.v6,          command.as};
        const auto tbs = object::build_trust_anchor(request, public_key.value);
        log_resources(tbs.resources);

        auto certificate = sign_certificate(tbs, key);
        if (!certificate.success) {
            return certificate.forward<TrustAnchorOutput>();
        }
        return Result<TrustAnchorOutput>::ok(TrustAnchorOutput{
            std::move(certificate.value), make_tal(command.tal_rsync_uri, command.tal_https_uri, public_key.value)});
    }

    Result<Bytes> Issuer::issue_ca_certificate(crypto::KeyHandle issuer, ByteSpan subject_key,
                                               const CerCommand &command) const {
        auto issuer_key = keys_.public_key(issuer);
        if (!issuer_key.success) {
            return issuer_key.forward<Bytes>();
        }

        auto validity = object::resolve_validity(command.validity, clock_());
        if (!validity.success) {
            return validity.forward<Bytes>();
        }
        log_validity(validity.value);

        object::CaCertificateRequest request;
        request.serial = command.serial;
        request.validity = validity.value;
        request.overclaim =
            command.trim_resources ? resources::OverclaimPolicy::Trim : resources::OverclaimPolicy::Refuse;
        request.crl_uri = command.crl;
        request.ca_issuer = command.ca_issuer;
        request.ca_repository = command.ca_repository;
        request.rpki_manifest = command.rpki_manifest;
        request.rpki_notify = command.rpki_notify;
        request.resources = command.resources;

        auto tbs = object::build_ca_certificate(request, issuer_key.value, subject_key);
        if (!tbs.success) {
            return tbs.forward<Bytes>();
        }
        log_resources(tbs.value.resources);
        return sign_certificate(tbs.value, issuer);
    }

    Result<Bytes> Issuer::issue_crl(crypto::KeyHandle issuer, const CrlCommand &command) const {
        auto issuer_key = keys_.public_key(issuer);
        if (!issuer_key.success) {
            return issuer_key.forward<Bytes>();
        }

        auto period = object::resolve_update_period(command.update, clock_());
        if (!period.success) {
            return period.forward<Bytes>();
        }
        logging::logger()->debug("this update {}, next update {}", format_time(period.value.this_update),
                                 format_time(period.value.next_update));

        const auto tbs = object::build_crl(issuer_key.value, period.value, command.revoked, command.crl_number);
        return sign_crl(tbs, issuer);
    }

    Result<Bytes> Issuer::issue_roa(crypto::KeyHandle issuer, const RoaCommand &command) const {
        auto validity = object::resolve_validity(command.validity, clock_());
        if (!validity.success) {
            return validity.forward<Bytes>();
        }
        log_validity(validity.value);

        const auto roa = object::RoaContent::from_prefixes(command.asn, command.prefixes);
        logging::logger()->debug("ROA for AS{} with {} IPv4 and {} IPv6 prefixes", roa.as_id, roa.v4.size(),
                                 roa.v6.size());
        auto content = encoder_.encode_roa_content(roa);
        if (!content.success) {
            return content;
        }
        auto ee_resources = roa.ee_resources();
        if (!ee_resources.success) {
            return ee_resources.forward<Bytes>();
        }

        const object::SignedObjectEnvelope envelope{command.serial, validity.value, command.crl, command.ca_issuer,
                                                    command.signed_object};
        return sign_object(object::SignedContentType::Roa, content.value, envelope, std::move(ee_resources.value),
                           issuer);
    }

    Result<Bytes> Issuer::issue_manifest(crypto::KeyHandle issuer, const MftCommand &command) const {
        auto validity = object::resolve_validity(command.validity, clock_());
        if (!validity.success) {
            return validity.forward<Bytes>();
        }
        log_validity(validity.value);

        auto period = object::resolve_update_period(command.update, clock_());
        if (!period.success) {
            return period.forward<Bytes>();
        }

        auto files = object::list_files(command.files, digests_, kDigestAlgorithm);
        if (!files.success) {
            return files.forward<Bytes>();
        }
        logging::logger()->debug("manifest {} lists {} files", command.number.to_string(), files.value.size());

        const object::ManifestContent manifest{command.number, period.value, kDigestAlgorithm,
                                               std::move(files.value)};
        auto content = encoder_.encode_manifest_content(manifest);
        if (!content.success) {
            return content;
        }

        const object::SignedObjectEnvelope envelope{command.serial, validity.value, command.crl, command.ca_issuer,
                                                    command.signed_object};
        return sign_object(object::SignedContentType::Manifest, content.value, envelope,
                           resources::Resources::inherit_all(), issuer);
    }

} // namespace mkrpki::issue
