#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <string_view>

#include <doctest/doctest.h>

#include <openssl/x509.h>

#include <mkrpki/core/time.hpp>
#include <mkrpki/core/uri.hpp>
#include <mkrpki/crypto/openssl_signer.hpp>
#include <mkrpki/issue/issuer.hpp>

namespace mkrpki_test {

    // 2024-01-01T00:00:00Z
    inline mkrpki::Time fixed_time() { return mkrpki::Time{std::chrono::seconds{1704067200}}; }

    inline mkrpki::issue::Issuer::Clock fixed_clock() {
        return [] { return fixed_time(); };
    }

    inline mkrpki::Uri rsync(std::string_view text) {
        auto uri = mkrpki::Uri::parse_rsync(text);
        REQUIRE(uri.success);
        return uri.value;
    }

    inline mkrpki::Uri https(std::string_view text) {
        auto uri = mkrpki::Uri::parse_https(text);
        REQUIRE(uri.success);
        return uri.value;
    }

    inline mkrpki::ByteSpan span_of(const std::string &text) {
        return mkrpki::ByteSpan(reinterpret_cast<const uint8_t *>(text.data()), text.size());
    }

    // A fresh directory under the system temp directory, removed again on destruction.
    class TempDir {
      public:
        TempDir() {
            std::random_device rd;
            path_ = std::filesystem::temp_directory_path() / ("mkrpki-test-" + std::to_string(rd()));
            std::filesystem::create_directories(path_);
        }
        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }
        [[nodiscard]] std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

        std::filesystem::path write(const std::string &name, const std::string &content) const {
            const auto file = path_ / name;
            std::ofstream out(file, std::ios::binary);
            out << content;
            return file;
        }

      private:
        std::filesystem::path path_;
    };

    // Forwards to another signer and counts how often it was asked to sign.
    class CountingSigner : public mkrpki::crypto::Signer {
      public:
        explicit CountingSigner(const mkrpki::crypto::Signer &inner) : inner_(inner) {}

        [[nodiscard]] mkrpki::Result<mkrpki::crypto::Signature> sign(mkrpki::crypto::KeyHandle key,
                                                                     mkrpki::crypto::SignatureAlgorithm algorithm,
                                                                     mkrpki::ByteSpan data) const override {
            ++calls;
            return inner_.sign(key, algorithm, data);
        }

        [[nodiscard]] mkrpki::Result<mkrpki::crypto::OneOffSignature>
        sign_one_off(mkrpki::crypto::SignatureAlgorithm algorithm, mkrpki::ByteSpan data) const override {
            ++calls;
            return inner_.sign_one_off(algorithm, data);
        }

        mutable int calls{0};

      private:
        const mkrpki::crypto::Signer &inner_;
    };

    inline mkrpki::crypto::KeyHandle make_key(mkrpki::crypto::OpenSslSigner &signer) {
        auto key = signer.create_key();
        REQUIRE(key.success);
        return key.value;
    }

    inline mkrpki::crypto::PublicKey public_key_of(const mkrpki::crypto::OpenSslSigner &signer,
                                                   mkrpki::crypto::KeyHandle key) {
        auto public_key = signer.public_key(key);
        REQUIRE(public_key.success);
        return public_key.value;
    }

    struct X509Delete {
        void operator()(X509 *cert) const { X509_free(cert); }
    };
    struct PkeyDelete {
        void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
    };

    inline std::unique_ptr<X509, X509Delete> parse_x509(const mkrpki::Bytes &der) {
        const unsigned char *p = der.data();
        std::unique_ptr<X509, X509Delete> cert(d2i_X509(nullptr, &p, static_cast<long>(der.size())));
        REQUIRE(cert != nullptr);
        return cert;
    }

    inline std::unique_ptr<EVP_PKEY, PkeyDelete> openssl_public_key(const mkrpki::crypto::PublicKey &key) {
        const unsigned char *p = key.info_bytes().data();
        std::unique_ptr<EVP_PKEY, PkeyDelete> pkey(d2i_PUBKEY(nullptr, &p, static_cast<long>(key.info_bytes().size())));
        REQUIRE(pkey != nullptr);
        return pkey;
    }

    // Looks for 'needle' anywhere in 'haystack'.
    inline bool contains(const mkrpki::Bytes &haystack, const mkrpki::Bytes &needle) {
        return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) != haystack.end();
    }

} // namespace mkrpki_test
