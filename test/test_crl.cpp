#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <openssl/x509v3.h>

#include <mkrpki/crypto/digest.hpp>
#include <mkrpki/encode/der_encoder.hpp>
#include <mkrpki/issue/issuer.hpp>
#include <mkrpki/object/crl.hpp>

using namespace mkrpki;
using namespace mkrpki::object;

namespace {

    struct CrlDelete {
        void operator()(X509_CRL *crl) const { X509_CRL_free(crl); }
    };

    std::unique_ptr<X509_CRL, CrlDelete> parse_crl(const Bytes &der) {
        const unsigned char *p = der.data();
        std::unique_ptr<X509_CRL, CrlDelete> crl(d2i_X509_CRL(nullptr, &p, static_cast<long>(der.size())));
        REQUIRE(crl != nullptr);
        return crl;
    }

    CrlEntry entry(std::string_view text) {
        auto parsed = CrlEntry::parse(text);
        REQUIRE(parsed.success);
        return parsed.value;
    }

} // namespace

TEST_SUITE("object/crl_entry") {
    TEST_CASE("serial with and without time") {
        auto plain = entry("12");
        CHECK(plain.serial == Serial(12));
        CHECK_FALSE(plain.revoked_at.has_value());

        auto timed = entry("0x0C@2024-01-01T00:00:00Z");
        CHECK(timed.serial == Serial(12));
        REQUIRE(timed.revoked_at.has_value());
        CHECK(*timed.revoked_at == mkrpki_test::fixed_time());
    }

    TEST_CASE("malformed entries") {
        auto bad_serial = CrlEntry::parse("twelve");
        CHECK_FALSE(bad_serial.success);
        CHECK(bad_serial.kind == ErrorKind::Parse);
        CHECK(bad_serial.error.rfind("Invalid CRL entry 'twelve'", 0) == 0);

        CHECK_FALSE(CrlEntry::parse("12@tomorrow").success);
        CHECK_FALSE(CrlEntry::parse("@2024-01-01T00:00:00Z").success);
    }

    TEST_CASE("missing times default to this update") {
        crypto::OpenSslSigner signer;
        const auto key = mkrpki_test::make_key(signer);
        const UpdatePeriod period{mkrpki_test::fixed_time(), mkrpki_test::fixed_time() + std::chrono::hours(24)};

        auto tbs = build_crl(mkrpki_test::public_key_of(signer, key), period,
                             {entry("3"), entry("4@2023-06-01T00:00:00Z")}, Serial(7));
        REQUIRE(tbs.entries.size() == 2);
        CHECK(*tbs.entries[0].revoked_at == period.this_update);
        CHECK(*tbs.entries[1].revoked_at != period.this_update);
        CHECK(tbs.authority_key_identifier == mkrpki_test::public_key_of(signer, key).key_identifier());
    }
}

TEST_SUITE("object/crl") {
    TEST_CASE("signed CRL verifies and lists revoked serials") {
        crypto::OpenSslSigner signer;
        encode::DerEncoder encoder;
        crypto::SodiumDigest digests;
        issue::Issuer issuer(signer, signer, encoder, digests, mkrpki_test::fixed_clock());
        const auto key = mkrpki_test::make_key(signer);

        issue::CrlCommand command;
        command.update.next_days = 1;
        command.revoked = {entry("3"), entry("0x10")};
        command.crl_number = Serial(9);

        auto issued = issuer.issue_crl(key, command);
        REQUIRE(issued.success);

        auto crl = parse_crl(issued.value);
        auto pkey = mkrpki_test::openssl_public_key(mkrpki_test::public_key_of(signer, key));
        CHECK(X509_CRL_verify(crl.get(), pkey.get()) == 1);
        CHECK(X509_CRL_get_version(crl.get()) == 1);

        auto *revoked = X509_CRL_get_REVOKED(crl.get());
        REQUIRE(revoked != nullptr);
        CHECK(sk_X509_REVOKED_num(revoked) == 2);

        auto *number = static_cast<ASN1_INTEGER *>(X509_CRL_get_ext_d2i(crl.get(), NID_crl_number, nullptr, nullptr));
        REQUIRE(number != nullptr);
        CHECK(ASN1_INTEGER_get(number) == 9);
        ASN1_INTEGER_free(number);

        int days = 0;
        int seconds = 0;
        REQUIRE(ASN1_TIME_diff(&days, &seconds, X509_CRL_get0_lastUpdate(crl.get()),
                               X509_CRL_get0_nextUpdate(crl.get())));
        CHECK(days == 1);
    }

    TEST_CASE("empty CRL omits the revoked list") {
        crypto::OpenSslSigner signer;
        encode::DerEncoder encoder;
        crypto::SodiumDigest digests;
        issue::Issuer issuer(signer, signer, encoder, digests, mkrpki_test::fixed_clock());
        const auto key = mkrpki_test::make_key(signer);

        issue::CrlCommand command;
        command.update.next_update = mkrpki_test::fixed_time() + std::chrono::hours(12);
        command.crl_number = Serial(1);

        auto issued = issuer.issue_crl(key, command);
        REQUIRE(issued.success);
        auto crl = parse_crl(issued.value);
        auto *revoked = X509_CRL_get_REVOKED(crl.get());
        CHECK((revoked == nullptr || sk_X509_REVOKED_num(revoked) == 0));
    }

    TEST_CASE("next update before this update is rejected") {
        crypto::OpenSslSigner signer;
        mkrpki_test::CountingSigner counting(signer);
        encode::DerEncoder encoder;
        crypto::SodiumDigest digests;
        issue::Issuer issuer(signer, counting, encoder, digests, mkrpki_test::fixed_clock());
        const auto key = mkrpki_test::make_key(signer);

        issue::CrlCommand command;
        command.update.next_update = mkrpki_test::fixed_time() - std::chrono::hours(1);
        auto issued = issuer.issue_crl(key, command);
        CHECK_FALSE(issued.success);
        CHECK(issued.kind == ErrorKind::Configuration);
        CHECK(counting.calls == 0);
    }
}
