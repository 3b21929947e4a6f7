#pragma once

#include <functional>
#include <optional>
#include <string>

#include <mkrpki/core/result.hpp>
#include <mkrpki/core/time.hpp>
#include <mkrpki/crypto/digest.hpp>
#include <mkrpki/crypto/signer.hpp>
#include <mkrpki/encode/encoder.hpp>
#include <mkrpki/issue/commands.hpp>

namespace mkrpki::issue {

    struct TrustAnchorOutput {
        Bytes certificate;
        std::string tal;
    };

    // TAL text: rsync URI, optional HTTPS URI, blank line, base64 SubjectPublicKeyInfo.
    std::string make_tal(const Uri &rsync_uri, const std::optional<Uri> &https_uri, const crypto::PublicKey &key);

    // Builds, signs and encodes objects in memory. Nothing here touches output files.
    class Issuer {
      public:
        using Clock = std::function<Time()>;

        Issuer(const crypto::KeyStore &keys, const crypto::Signer &signer, const encode::Encoder &encoder,
               const crypto::DigestStream &digests, Clock clock = mkrpki::now);

        [[nodiscard]] Result<TrustAnchorOutput> issue_trust_anchor(crypto::KeyHandle key,
                                                                   const TaCommand &command) const;
        [[nodiscard]] Result<Bytes> issue_ca_certificate(crypto::KeyHandle issuer, ByteSpan subject_key,
                                                         const CerCommand &command) const;
        [[nodiscard]] Result<Bytes> issue_crl(crypto::KeyHandle issuer, const CrlCommand &command) const;
        [[nodiscard]] Result<Bytes> issue_roa(crypto::KeyHandle issuer, const RoaCommand &command) const;
        [[nodiscard]] Result<Bytes> issue_manifest(crypto::KeyHandle issuer, const MftCommand &command) const;

        [[nodiscard]] Result<Bytes> sign_certificate(const object::TbsCertificate &tbs, crypto::KeyHandle issuer) const;
        [[nodiscard]] Result<Bytes> sign_crl(const object::TbsCrl &tbs, crypto::KeyHandle issuer) const;

        // Wraps encoded eContent into a CMS signed object with a fresh end-entity certificate.
        [[nodiscard]] Result<Bytes> sign_object(object::SignedContentType type, const Bytes &content,
                                                const object::SignedObjectEnvelope &envelope,
                                                resources::Resources ee_resources, crypto::KeyHandle issuer) const;

      private:
        const crypto::KeyStore &keys_;
        const crypto::Signer &signer_;
        const encode::Encoder &encoder_;
        const crypto::DigestStream &digests_;
        Clock clock_;
    };

} // namespace mkrpki::issue
