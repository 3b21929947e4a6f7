#pragma once

#include <map>
#include <memory>

#include <openssl/evp.h>

#include <mkrpki/crypto/signer.hpp>

namespace mkrpki::crypto {

    namespace detail {

        struct PkeyDelete {
            void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
        };

    } // namespace detail

    using PkeyPtr = std::unique_ptr<EVP_PKEY, detail::PkeyDelete>;

    // In-memory RSA key store and signer backed by OpenSSL.
    class OpenSslSigner : public KeyStore, public Signer {
      public:
        static constexpr int RSA_KEY_BITS = 2048;

        OpenSslSigner() = default;
        OpenSslSigner(const OpenSslSigner &) = delete;
        OpenSslSigner &operator=(const OpenSslSigner &) = delete;

        Result<KeyHandle> create_key() override;

        // Accepts a DER PKCS#1 RSAPrivateKey or a DER PKCS#8 PrivateKeyInfo holding an RSA key.
        Result<KeyHandle> load_key(ByteSpan der) override;

        [[nodiscard]] Result<PublicKey> public_key(KeyHandle key) const override;
        [[nodiscard]] Result<ExportedKey> export_key(KeyHandle key) const override;

        [[nodiscard]] Result<Signature> sign(KeyHandle key, SignatureAlgorithm algorithm,
                                             ByteSpan data) const override;
        [[nodiscard]] Result<OneOffSignature> sign_one_off(SignatureAlgorithm algorithm,
                                                           ByteSpan data) const override;

      private:
        KeyHandle insert(PkeyPtr key);
        [[nodiscard]] EVP_PKEY *find(KeyHandle key) const;

        std::map<uint32_t, PkeyPtr> keys_;
        uint32_t next_id_{1};
    };

} // namespace mkrpki::crypto
