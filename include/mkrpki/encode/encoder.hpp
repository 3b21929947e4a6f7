#pragma once

#include <mkrpki/core/result.hpp>
#include <mkrpki/object/certificate.hpp>
#include <mkrpki/object/crl.hpp>
#include <mkrpki/object/manifest.hpp>
#include <mkrpki/object/roa.hpp>
#include <mkrpki/object/signed_object.hpp>

namespace mkrpki::encode {

    // Serializes unsigned content for signing and signed results for output.
    class Encoder {
      public:
        virtual ~Encoder() = default;

        [[nodiscard]] virtual Result<Bytes> encode_tbs_certificate(const object::TbsCertificate &tbs) const = 0;
        [[nodiscard]] virtual Result<Bytes> encode_certificate(const object::SignedCertificate &cert) const = 0;

        [[nodiscard]] virtual Result<Bytes> encode_tbs_crl(const object::TbsCrl &tbs) const = 0;
        [[nodiscard]] virtual Result<Bytes> encode_crl(const object::SignedCrl &crl) const = 0;

        [[nodiscard]] virtual Result<Bytes> encode_roa_content(const object::RoaContent &roa) const = 0;
        [[nodiscard]] virtual Result<Bytes> encode_manifest_content(const object::ManifestContent &mft) const = 0;

        // The DER SET OF form that is signed.
        [[nodiscard]] virtual Result<Bytes> encode_signed_attributes(const object::SignedAttributes &attrs) const = 0;
        [[nodiscard]] virtual Result<Bytes> encode_signed_object(const object::SignedObject &object) const = 0;
    };

} // namespace mkrpki::encode
