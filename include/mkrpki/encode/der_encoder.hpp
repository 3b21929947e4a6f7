#pragma once

#include <mkrpki/encode/encoder.hpp>
#include <mkrpki/resources/resource_set.hpp>

namespace mkrpki::encode {

    class DerEncoder : public Encoder {
      public:
        [[nodiscard]] Result<Bytes> encode_tbs_certificate(const object::TbsCertificate &tbs) const override;
        [[nodiscard]] Result<Bytes> encode_certificate(const object::SignedCertificate &cert) const override;

        [[nodiscard]] Result<Bytes> encode_tbs_crl(const object::TbsCrl &tbs) const override;
        [[nodiscard]] Result<Bytes> encode_crl(const object::SignedCrl &crl) const override;

        [[nodiscard]] Result<Bytes> encode_roa_content(const object::RoaContent &roa) const override;
        [[nodiscard]] Result<Bytes> encode_manifest_content(const object::ManifestContent &mft) const override;

        [[nodiscard]] Result<Bytes> encode_signed_attributes(const object::SignedAttributes &attrs) const override;
        [[nodiscard]] Result<Bytes> encode_signed_object(const object::SignedObject &object) const override;
    };

    // RFC 3779 extension values, without the Extension wrapper.
    Bytes encode_ip_resources(const resources::IpResources &v4, const resources::IpResources &v6);
    Bytes encode_as_resources(const resources::AsResources &as);

} // namespace mkrpki::encode
