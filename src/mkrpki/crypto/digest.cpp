#include <mkrpki/crypto/digest.hpp>

#include <stdexcept>

#include <mkrpki/der/oid_registry.hpp>
#include <mkrpki/utils/sodium_utils.hpp>

namespace mkrpki::crypto {

    namespace {

        class Sha256Accumulator : public DigestAccumulator {
          public:
            Sha256Accumulator() { crypto_hash_sha256_init(&state_); }

            void update(ByteSpan data) override { crypto_hash_sha256_update(&state_, data.data(), data.size()); }

            Bytes finish() override {
                Bytes out(crypto_hash_sha256_BYTES);
                crypto_hash_sha256_final(&state_, out.data());
                return out;
            }

          private:
            crypto_hash_sha256_state state_{};
        };

    } // namespace

    size_t digest_size(DigestAlgorithm algorithm) {
        switch (algorithm) {
        case DigestAlgorithm::Sha256:
            return crypto_hash_sha256_BYTES;
        }
        return 0;
    }

    const der::Oid &digest_oid(DigestAlgorithm algorithm) {
        switch (algorithm) {
        case DigestAlgorithm::Sha256:
            return der::oids::sha256;
        }
        throw std::invalid_argument("unknown digest algorithm");
    }

    Bytes DigestStream::digest(DigestAlgorithm algorithm, ByteSpan data) const {
        auto acc = start(algorithm);
        acc->update(data);
        return acc->finish();
    }

    SodiumDigest::SodiumDigest() { utils::ensure_sodium_init(); }

    std::unique_ptr<DigestAccumulator> SodiumDigest::start(DigestAlgorithm algorithm) const {
        switch (algorithm) {
        case DigestAlgorithm::Sha256:
            return std::make_unique<Sha256Accumulator>();
        }
        throw std::invalid_argument("unknown digest algorithm");
    }

} // namespace mkrpki::crypto
