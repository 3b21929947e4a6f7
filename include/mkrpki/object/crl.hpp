#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mkrpki/core/result.hpp>
#include <mkrpki/core/serial.hpp>
#include <mkrpki/core/time.hpp>
#include <mkrpki/crypto/public_key.hpp>
#include <mkrpki/crypto/signer.hpp>
#include <mkrpki/object/validity.hpp>

namespace mkrpki::object {

    struct CrlEntry {
        Serial serial;
        // Unset means "revoked at the CRL's this-update".
        std::optional<Time> revoked_at;

        // "<serial>" or "<serial>@<RFC 3339 time>".
        static Result<CrlEntry> parse(std::string_view text);
    };

    // To-be-signed content of a CRL (RFC 6487, 5).
    struct TbsCrl {
        std::string issuer_name;
        UpdatePeriod period;
        std::vector<CrlEntry> entries;
        Bytes authority_key_identifier;
        Serial crl_number;
    };

    struct SignedCrl {
        Bytes tbs;
        crypto::Signature signature;
    };

    // Entries keep the given order; entries without a time get the this-update time.
    TbsCrl build_crl(const crypto::PublicKey &issuer, UpdatePeriod period, std::vector<CrlEntry> entries,
                     Serial crl_number);

} // namespace mkrpki::object
