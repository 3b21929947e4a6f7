#pragma once

#include <memory>

#include <sodium.h>

#include <mkrpki/der/asn1_common.hpp>

namespace mkrpki::crypto {

    enum class DigestAlgorithm { Sha256 };

    size_t digest_size(DigestAlgorithm algorithm);
    const der::Oid &digest_oid(DigestAlgorithm algorithm);

    // Running digest over a byte stream. finish() may be called once.
    class DigestAccumulator {
      public:
        virtual ~DigestAccumulator() = default;

        virtual void update(ByteSpan data) = 0;
        virtual Bytes finish() = 0;
    };

    class DigestStream {
      public:
        virtual ~DigestStream() = default;

        [[nodiscard]] virtual std::unique_ptr<DigestAccumulator> start(DigestAlgorithm algorithm) const = 0;

        // One-shot convenience over start/update/finish.
        [[nodiscard]] Bytes digest(DigestAlgorithm algorithm, ByteSpan data) const;
    };

    // libsodium's incremental SHA-256.
    class SodiumDigest : public DigestStream {
      public:
        SodiumDigest();

        [[nodiscard]] std::unique_ptr<DigestAccumulator> start(DigestAlgorithm algorithm) const override;
    };

} // namespace mkrpki::crypto
