#include <mkrpki/crypto/public_key.hpp>

#include <openssl/evp.h>

#include <mkrpki/der/asn1_reader.hpp>
#include <mkrpki/der/oid_registry.hpp>
#include <mkrpki/utils/common.hpp>

namespace mkrpki::crypto {

    namespace {

        Result<Bytes> sha1(ByteSpan data) {
            Bytes out(EVP_MAX_MD_SIZE);
            unsigned int len = 0;
            if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha1(), nullptr) != 1) {
                return Result<Bytes>::failure(ErrorKind::KeyDecode, "cannot compute key identifier");
            }
            out.resize(len);
            return Result<Bytes>::ok(std::move(out));
        }

    } // namespace

    Result<PublicKey> PublicKey::decode(ByteSpan der) {
        auto fail = [](const std::string &why) { return Result<PublicKey>::failure(ErrorKind::KeyDecode, why); };

        const auto spki = der::parse_sequence(der);
        if (!spki.success) {
            return fail("malformed SubjectPublicKeyInfo: " + spki.error);
        }
        if (spki.bytes_consumed != der.size()) {
            return fail("trailing data after SubjectPublicKeyInfo");
        }

        const auto algorithm = der::parse_sequence(spki.value);
        if (!algorithm.success) {
            return fail("malformed key algorithm: " + algorithm.error);
        }
        const auto oid = der::parse_oid(algorithm.value);
        if (!oid.success) {
            return fail("malformed key algorithm: " + oid.error);
        }
        if (oid.value != der::oids::rsa_encryption) {
            return fail("unsupported key algorithm " + std::string(der::oids::name_of(oid.value)));
        }

        const auto bits = der::parse_bit_string(spki.value.subspan(algorithm.bytes_consumed));
        if (!bits.success) {
            return fail("malformed subjectPublicKey: " + bits.error);
        }
        if (bits.value.unused_bits != 0 || bits.value.bytes.empty()) {
            return fail("malformed subjectPublicKey");
        }

        auto key_id = sha1(bits.value.bytes);
        if (!key_id.success) {
            return key_id.forward<PublicKey>();
        }

        PublicKey key;
        key.info_.assign(der.begin(), der.end());
        key.key_id_ = std::move(key_id.value);
        return Result<PublicKey>::ok(std::move(key));
    }

    std::string PublicKey::subject_name() const { return utils::to_hex(key_id_); }

} // namespace mkrpki::crypto
