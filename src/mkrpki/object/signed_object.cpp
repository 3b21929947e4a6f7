#include <mkrpki/object/signed_object.hpp>

#include <stdexcept>

#include <mkrpki/der/oid_registry.hpp>

namespace mkrpki::object {

    const der::Oid &content_type_oid(SignedContentType type) {
        switch (type) {
        case SignedContentType::Roa:
            return der::oids::ct_route_origin_authz;
        case SignedContentType::Manifest:
            return der::oids::ct_rpki_manifest;
        }
        throw std::invalid_argument("unknown signed content type");
    }

    TbsCertificate build_ee_certificate(const SignedObjectEnvelope &envelope, const crypto::PublicKey &issuer,
                                        const crypto::PublicKey &ee_key, resources::Resources resources) {
        return CertificateBuilder(envelope.serial, issuer, envelope.validity, ee_key, KeyUsage::Ee)
            .set_crl_uri(envelope.crl_uri)
            .set_ca_issuer(envelope.ca_issuer)
            .set_signed_object(envelope.signed_object)
            .set_resources(std::move(resources))
            .build();
    }

} // namespace mkrpki::object
