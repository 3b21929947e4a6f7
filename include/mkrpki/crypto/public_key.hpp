#pragma once

#include <string>

#include <mkrpki/core/result.hpp>
#include <mkrpki/der/asn1_common.hpp>

namespace mkrpki::crypto {

    // An RSA SubjectPublicKeyInfo together with the identifiers derived from it.
    class PublicKey {
      public:
        PublicKey() = default;

        // Fails with ErrorKind::KeyDecode unless the bytes are a DER rsaEncryption SubjectPublicKeyInfo.
        static Result<PublicKey> decode(ByteSpan der);

        // The complete DER SubjectPublicKeyInfo, as embedded in certificates and TALs.
        [[nodiscard]] const Bytes &info_bytes() const noexcept { return info_; }

        // SHA-1 of the subjectPublicKey bits (RFC 6487, 4.8.2).
        [[nodiscard]] const Bytes &key_identifier() const noexcept { return key_id_; }

        // Common name used for issuer and subject names of certificates for this key.
        [[nodiscard]] std::string subject_name() const;

        bool operator==(const PublicKey &other) const { return info_ == other.info_; }

      private:
        Bytes info_;
        Bytes key_id_;
    };

} // namespace mkrpki::crypto
