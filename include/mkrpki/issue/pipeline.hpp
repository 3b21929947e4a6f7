#pragma once

#include <mkrpki/issue/issuer.hpp>

namespace mkrpki::issue {

    // One command end to end: load keys, issue, then write the outputs. Outputs are
    // written only after the complete object has been produced.
    class IssuancePipeline {
      public:
        IssuancePipeline(crypto::KeyStore &keys, const crypto::Signer &signer, const encode::Encoder &encoder,
                         const crypto::DigestStream &digests, Issuer::Clock clock = mkrpki::now);

        Status create_key(const KeyCommand &command);
        Status trust_anchor(const TaCommand &command);
        Status ca_certificate(const CerCommand &command);
        Status crl(const CrlCommand &command);
        Status roa(const RoaCommand &command);
        Status manifest(const MftCommand &command);

      private:
        Result<crypto::KeyHandle> load_issuer_key(const Path &path);

        crypto::KeyStore &keys_;
        Issuer issuer_;
    };

} // namespace mkrpki::issue
