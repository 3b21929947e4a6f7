#include <mkrpki/object/certificate.hpp>

namespace mkrpki::object {

    CertificateBuilder::CertificateBuilder(Serial serial, const crypto::PublicKey &issuer, Validity validity,
                                           crypto::PublicKey subject_key, KeyUsage key_usage) {
        tbs_.serial = std::move(serial);
        tbs_.issuer_name = issuer.subject_name();
        tbs_.validity = validity;
        tbs_.subject_name = subject_key.subject_name();
        tbs_.subject_key = std::move(subject_key);
        tbs_.key_usage = key_usage;
        tbs_.authority_key_identifier = issuer.key_identifier();
    }

    TbsCertificate build_trust_anchor(const TrustAnchorRequest &request, const crypto::PublicKey &key) {
        resources::ResourceRequest resources;
        resources.v4 = request.v4;
        resources.v6 = request.v6;
        resources.as = request.as;

        return CertificateBuilder(request.serial, key, request.validity, key, KeyUsage::Ca)
            .set_overclaim(resources::OverclaimPolicy::Refuse)
            .set_basic_ca(true)
            .set_ca_repository(request.ca_repository)
            .set_rpki_manifest(request.rpki_manifest)
            .set_rpki_notify(request.rpki_notify)
            .set_resources(resources::Resources::from_request(std::move(resources)))
            .build();
    }

    TbsCertificate build_ca_certificate(const CaCertificateRequest &request, const crypto::PublicKey &issuer,
                                        const crypto::PublicKey &subject) {
        return CertificateBuilder(request.serial, issuer, request.validity, subject, KeyUsage::Ca)
            .set_overclaim(request.overclaim)
            .set_basic_ca(true)
            .set_crl_uri(request.crl_uri)
            .set_ca_issuer(request.ca_issuer)
            .set_ca_repository(request.ca_repository)
            .set_rpki_manifest(request.rpki_manifest)
            .set_rpki_notify(request.rpki_notify)
            .set_resources(resources::Resources::from_request(request.resources))
            .build();
    }

    Result<TbsCertificate> build_ca_certificate(const CaCertificateRequest &request, const crypto::PublicKey &issuer,
                                                ByteSpan subject_key) {
        auto subject = crypto::PublicKey::decode(subject_key);
        if (!subject.success) {
            return Result<TbsCertificate>::failure(ErrorKind::KeyDecode,
                                                   "Failed to load subject public key: " + subject.error);
        }
        return Result<TbsCertificate>::ok(build_ca_certificate(request, issuer, subject.value));
    }

} // namespace mkrpki::object
