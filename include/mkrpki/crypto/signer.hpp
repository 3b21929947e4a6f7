#pragma once

#include <cstdint>

#include <mkrpki/core/result.hpp>
#include <mkrpki/crypto/public_key.hpp>
#include <mkrpki/der/asn1_common.hpp>

namespace mkrpki::crypto {

    enum class SignatureAlgorithm { Sha256WithRsa };

    // Opaque reference to a key held by a KeyStore.
    struct KeyHandle {
        uint32_t id{};

        bool operator==(const KeyHandle &other) const = default;
    };

    struct Signature {
        SignatureAlgorithm algorithm{SignatureAlgorithm::Sha256WithRsa};
        Bytes value;
    };

    // Result of signing with a throw-away key: the key itself is gone, only its public half remains.
    struct OneOffSignature {
        Signature signature;
        PublicKey public_key;
    };

    struct ExportedKey {
        Bytes private_der;
        Bytes public_der;
    };

    class KeyStore {
      public:
        virtual ~KeyStore() = default;

        virtual Result<KeyHandle> create_key() = 0;
        virtual Result<KeyHandle> load_key(ByteSpan der) = 0;
        [[nodiscard]] virtual Result<PublicKey> public_key(KeyHandle key) const = 0;
        [[nodiscard]] virtual Result<ExportedKey> export_key(KeyHandle key) const = 0;
    };

    class Signer {
      public:
        virtual ~Signer() = default;

        [[nodiscard]] virtual Result<Signature> sign(KeyHandle key, SignatureAlgorithm algorithm,
                                                     ByteSpan data) const = 0;
        [[nodiscard]] virtual Result<OneOffSignature> sign_one_off(SignatureAlgorithm algorithm,
                                                                   ByteSpan data) const = 0;
    };

} // namespace mkrpki::crypto
