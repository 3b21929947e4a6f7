#include <mkrpki/crypto/openssl_signer.hpp>

#include <array>

#include <openssl/err.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace mkrpki::crypto {

    namespace {

        struct MdCtxDelete {
            void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
        };

        using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDelete>;

        // Drains the OpenSSL error queue into one message.
        std::string openssl_error(const std::string &what) {
            std::string message = what;
            while (const unsigned long code = ERR_get_error()) {
                std::array<char, 256> buffer{};
                ERR_error_string_n(code, buffer.data(), buffer.size());
                message += ": ";
                message += buffer.data();
            }
            return message;
        }

        PkeyPtr generate_rsa() { return PkeyPtr(EVP_RSA_gen(OpenSslSigner::RSA_KEY_BITS)); }

        Result<Bytes> public_key_der(EVP_PKEY *key) {
            const int len = i2d_PUBKEY(key, nullptr);
            if (len <= 0) {
                return Result<Bytes>::failure(ErrorKind::KeyDecode, openssl_error("cannot encode public key"));
            }
            Bytes out(static_cast<size_t>(len));
            unsigned char *p = out.data();
            if (i2d_PUBKEY(key, &p) != len) {
                return Result<Bytes>::failure(ErrorKind::KeyDecode, openssl_error("cannot encode public key"));
            }
            return Result<Bytes>::ok(std::move(out));
        }

        Result<PublicKey> public_key_of(EVP_PKEY *key) {
            auto der = public_key_der(key);
            if (!der.success) {
                return der.forward<PublicKey>();
            }
            return PublicKey::decode(der.value);
        }

        Result<Signature> sign_with(EVP_PKEY *key, SignatureAlgorithm algorithm, ByteSpan data) {
            const EVP_MD *md = nullptr;
            switch (algorithm) {
            case SignatureAlgorithm::Sha256WithRsa:
                md = EVP_sha256();
                break;
            }
            if (md == nullptr) {
                return Result<Signature>::failure(ErrorKind::Signing, "unsupported signature algorithm");
            }

            MdCtxPtr ctx(EVP_MD_CTX_new());
            if (!ctx) {
                return Result<Signature>::failure(ErrorKind::Signing, openssl_error("cannot allocate digest context"));
            }
            if (EVP_DigestSignInit(ctx.get(), nullptr, md, nullptr, key) != 1) {
                return Result<Signature>::failure(ErrorKind::Signing, openssl_error("cannot initialise signing"));
            }

            size_t sig_len = 0;
            if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, data.data(), data.size()) != 1) {
                return Result<Signature>::failure(ErrorKind::Signing, openssl_error("signing failed"));
            }
            Signature signature{algorithm, Bytes(sig_len)};
            if (EVP_DigestSign(ctx.get(), signature.value.data(), &sig_len, data.data(), data.size()) != 1) {
                return Result<Signature>::failure(ErrorKind::Signing, openssl_error("signing failed"));
            }
            signature.value.resize(sig_len);
            return Result<Signature>::ok(std::move(signature));
        }

    } // namespace

    KeyHandle OpenSslSigner::insert(PkeyPtr key) {
        const KeyHandle handle{next_id_++};
        keys_.emplace(handle.id, std::move(key));
        return handle;
    }

    EVP_PKEY *OpenSslSigner::find(KeyHandle key) const {
        const auto it = keys_.find(key.id);
        return it == keys_.end() ? nullptr : it->second.get();
    }

    Result<KeyHandle> OpenSslSigner::create_key() {
        auto key = generate_rsa();
        if (!key) {
            return Result<KeyHandle>::failure(ErrorKind::Signing, openssl_error("Failed to generate key"));
        }
        return Result<KeyHandle>::ok(insert(std::move(key)));
    }

    Result<KeyHandle> OpenSslSigner::load_key(ByteSpan der) {
        const unsigned char *p = der.data();
        PkeyPtr key(d2i_AutoPrivateKey(nullptr, &p, static_cast<long>(der.size())));
        if (!key) {
            return Result<KeyHandle>::failure(ErrorKind::KeyDecode, openssl_error("not a DER private key"));
        }
        if (EVP_PKEY_get_base_id(key.get()) != EVP_PKEY_RSA) {
            return Result<KeyHandle>::failure(ErrorKind::KeyDecode, "not an RSA key");
        }
        return Result<KeyHandle>::ok(insert(std::move(key)));
    }

    Result<PublicKey> OpenSslSigner::public_key(KeyHandle key) const {
        EVP_PKEY *pkey = find(key);
        if (pkey == nullptr) {
            return Result<PublicKey>::failure(ErrorKind::KeyDecode, "unknown key handle");
        }
        return public_key_of(pkey);
    }

    Result<ExportedKey> OpenSslSigner::export_key(KeyHandle key) const {
        EVP_PKEY *pkey = find(key);
        if (pkey == nullptr) {
            return Result<ExportedKey>::failure(ErrorKind::KeyDecode, "unknown key handle");
        }

        ExportedKey exported;
        const int len = i2d_PrivateKey(pkey, nullptr);
        if (len <= 0) {
            return Result<ExportedKey>::failure(ErrorKind::Encoding, openssl_error("Failed to extract private key"));
        }
        exported.private_der.resize(static_cast<size_t>(len));
        unsigned char *p = exported.private_der.data();
        if (i2d_PrivateKey(pkey, &p) != len) {
            return Result<ExportedKey>::failure(ErrorKind::Encoding, openssl_error("Failed to extract private key"));
        }

        auto pub = public_key_der(pkey);
        if (!pub.success) {
            return Result<ExportedKey>::failure(ErrorKind::Encoding, "Failed to extract public key: " + pub.error);
        }
        exported.public_der = std::move(pub.value);
        return Result<ExportedKey>::ok(std::move(exported));
    }

    Result<Signature> OpenSslSigner::sign(KeyHandle key, SignatureAlgorithm algorithm, ByteSpan data) const {
        EVP_PKEY *pkey = find(key);
        if (pkey == nullptr) {
            return Result<Signature>::failure(ErrorKind::Signing, "unknown key handle");
        }
        return sign_with(pkey, algorithm, data);
    }

    Result<OneOffSignature> OpenSslSigner::sign_one_off(SignatureAlgorithm algorithm, ByteSpan data) const {
        auto key = generate_rsa();
        if (!key) {
            return Result<OneOffSignature>::failure(ErrorKind::Signing, openssl_error("Failed to generate key"));
        }
        auto signature = sign_with(key.get(), algorithm, data);
        if (!signature.success) {
            return signature.forward<OneOffSignature>();
        }
        auto public_key = public_key_of(key.get());
        if (!public_key.success) {
            return Result<OneOffSignature>::failure(ErrorKind::Signing, public_key.error);
        }
        return Result<OneOffSignature>::ok(OneOffSignature{std::move(signature.value), std::move(public_key.value)});
    }

} // namespace mkrpki::crypto
