#pragma once

#include <mkrpki/core/serial.hpp>
#include <mkrpki/core/time.hpp>
#include <mkrpki/core/uri.hpp>
#include <mkrpki/crypto/digest.hpp>
#include <mkrpki/crypto/public_key.hpp>
#include <mkrpki/crypto/signer.hpp>
#include <mkrpki/der/asn1_common.hpp>
#include <mkrpki/object/certificate.hpp>
#include <mkrpki/object/validity.hpp>
#include <mkrpki/resources/resource_set.hpp>

namespace mkrpki::object {

    // Parameters shared by every RFC 6488 signed object; they end up in the end-entity certificate.
    struct SignedObjectEnvelope {
        Serial serial;
        Validity validity;
        Uri crl_uri;
        Uri ca_issuer;
        Uri signed_object;
    };

    enum class SignedContentType { Roa, Manifest };

    const der::Oid &content_type_oid(SignedContentType type);

    struct SignedAttributes {
        der::Oid content_type;
        Bytes message_digest;
        Time signing_time{};
    };

    // The single-use end-entity certificate for 'ee_key', issued by 'issuer'.
    TbsCertificate build_ee_certificate(const SignedObjectEnvelope &envelope, const crypto::PublicKey &issuer,
                                        const crypto::PublicKey &ee_key, resources::Resources resources);

    // Everything the CMS SignedData wrapper carries.
    struct SignedObject {
        der::Oid content_type;
        Bytes content;
        crypto::DigestAlgorithm digest_algorithm{crypto::DigestAlgorithm::Sha256};
        Bytes signed_attributes;
        Bytes ee_certificate;
        Bytes signer_key_identifier;
        crypto::Signature signature;
    };

} // namespace mkrpki::object
