#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <openssl/bio.h>
#include <openssl/cms.h>
#include <openssl/objects.h>
#include <openssl/x509v3.h>

#include <mkrpki/crypto/digest.hpp>
#include <mkrpki/encode/der_encoder.hpp>
#include <mkrpki/issue/issuer.hpp>
#include <mkrpki/object/roa.hpp>

using namespace mkrpki;

namespace {

    struct CmsDelete {
        void operator()(CMS_ContentInfo *cms) const { CMS_ContentInfo_free(cms); }
    };
    struct BioDelete {
        void operator()(BIO *bio) const { BIO_free(bio); }
    };
    struct CertStackDelete {
        void operator()(STACK_OF(X509) * certs) const { sk_X509_pop_free(certs, X509_free); }
    };

    using CmsPtr = std::unique_ptr<CMS_ContentInfo, CmsDelete>;

    CmsPtr parse_cms(const Bytes &der) {
        const unsigned char *p = der.data();
        CmsPtr cms(d2i_CMS_ContentInfo(nullptr, &p, static_cast<long>(der.size())));
        REQUIRE(cms != nullptr);
        return cms;
    }

    // Verifies the CMS signature and message digest and returns the eContent.
    Bytes verified_content(CMS_ContentInfo *cms) {
        std::unique_ptr<BIO, BioDelete> out(BIO_new(BIO_s_mem()));
        REQUIRE(CMS_verify(cms, nullptr, nullptr, nullptr, out.get(), CMS_NO_SIGNER_CERT_VERIFY) == 1);
        char *data = nullptr;
        const long length = BIO_get_mem_data(out.get(), &data);
        return Bytes(reinterpret_cast<uint8_t *>(data), reinterpret_cast<uint8_t *>(data) + length);
    }

    std::string content_type(CMS_ContentInfo *cms) {
        char buffer[64] = {};
        OBJ_obj2txt(buffer, sizeof(buffer), CMS_get0_eContentType(cms), 1);
        return buffer;
    }

    // The embedded end-entity certificate, re-encoded.
    Bytes ee_certificate(CMS_ContentInfo *cms) {
        std::unique_ptr<STACK_OF(X509), CertStackDelete> certs(CMS_get1_certs(cms));
        REQUIRE(certs != nullptr);
        REQUIRE(sk_X509_num(certs.get()) == 1);
        unsigned char *der = nullptr;
        const int length = i2d_X509(sk_X509_value(certs.get(), 0), &der);
        REQUIRE(length > 0);
        Bytes bytes(der, der + length);
        OPENSSL_free(der);
        return bytes;
    }

    object::RoaPrefix prefix(std::string_view text) {
        auto parsed = object::RoaPrefix::parse(text);
        REQUIRE(parsed.success);
        return parsed.value;
    }

    struct Fixture {
        crypto::OpenSslSigner signer;
        encode::DerEncoder encoder;
        crypto::SodiumDigest digests;
        issue::Issuer issuer{signer, signer, encoder, digests, mkrpki_test::fixed_clock()};
        crypto::KeyHandle ca_key = mkrpki_test::make_key(signer);
    };

    issue::RoaCommand roa_command() {
        issue::RoaCommand command;
        command.serial = Serial(100);
        command.validity.days = 7;
        command.crl = mkrpki_test::rsync("rsync://example.net/repo/ca/ca.crl");
        command.ca_issuer = mkrpki_test::rsync("rsync://example.net/repo/ca.cer");
        command.signed_object = mkrpki_test::rsync("rsync://example.net/repo/ca/as64512.roa");
        command.asn = 64512;
        command.prefixes = {prefix("10.0.0.0/8-24"), prefix("2001:db8::/32")};
        return command;
    }

} // namespace

TEST_SUITE("object/roa") {
    TEST_CASE("ROA verifies and carries its content") {
        Fixture f;
        auto issued = f.issuer.issue_roa(f.ca_key, roa_command());
        REQUIRE(issued.success);

        auto cms = parse_cms(issued.value);
        CHECK(content_type(cms.get()) == "1.2.840.113549.1.9.16.1.24");

        const auto command = roa_command();
        auto expected = f.encoder.encode_roa_content(object::RoaContent::from_prefixes(command.asn, command.prefixes));
        REQUIRE(expected.success);
        CHECK(verified_content(cms.get()) == expected.value);
    }

    TEST_CASE("end-entity certificate is signed by the CA") {
        Fixture f;
        auto issued = f.issuer.issue_roa(f.ca_key, roa_command());
        REQUIRE(issued.success);
        auto cms = parse_cms(issued.value);
        const auto ee_der = ee_certificate(cms.get());

        auto ee = mkrpki_test::parse_x509(ee_der);
        auto ca_pkey = mkrpki_test::openssl_public_key(mkrpki_test::public_key_of(f.signer, f.ca_key));
        CHECK(X509_verify(ee.get(), ca_pkey.get()) == 1);
        CHECK(X509_check_ca(ee.get()) == 0);
        CHECK(X509_get_key_usage(ee.get()) == KU_DIGITAL_SIGNATURE);
        CHECK(ASN1_INTEGER_get(X509_get0_serialNumber(ee.get())) == 100);

        // Explicit IPv4 and IPv6 prefixes, no AS resources.
        CHECK(mkrpki_test::contains(ee_der, Bytes{0x04, 0x02, 0x00, 0x01, 0x30, 0x04, 0x03, 0x02, 0x00, 0x0A}));
        CHECK(mkrpki_test::contains(ee_der, Bytes{0x04, 0x02, 0x00, 0x02, 0x30, 0x07, 0x03, 0x05, 0x00, 0x20, 0x01,
                                                  0x0D, 0xB8}));
        CHECK(X509_get_ext_by_NID(ee.get(), NID_sbgp_autonomousSysNum, -1) < 0);

        const std::string object_uri = "rsync://example.net/repo/ca/as64512.roa";
        CHECK(mkrpki_test::contains(ee_der, Bytes(object_uri.begin(), object_uri.end())));
    }

    TEST_CASE("every ROA gets a fresh key") {
        Fixture f;
        auto first = f.issuer.issue_roa(f.ca_key, roa_command());
        auto second = f.issuer.issue_roa(f.ca_key, roa_command());
        REQUIRE(first.success);
        REQUIRE(second.success);
        auto first_ee = mkrpki_test::parse_x509(ee_certificate(parse_cms(first.value).get()));
        auto second_ee = mkrpki_test::parse_x509(ee_certificate(parse_cms(second.value).get()));
        CHECK(EVP_PKEY_eq(X509_get0_pubkey(first_ee.get()), X509_get0_pubkey(second_ee.get())) != 1);
    }

    TEST_CASE("invalid max length fails without output") {
        Fixture f;
        auto command = roa_command();
        command.prefixes = {prefix("10.0.0.0/24-8")};
        auto issued = f.issuer.issue_roa(f.ca_key, command);
        CHECK_FALSE(issued.success);
        CHECK(issued.kind == ErrorKind::Encoding);
    }
}

TEST_SUITE("object/manifest") {
    TEST_CASE("manifest verifies and lists files in order") {
        Fixture f;
        mkrpki_test::TempDir dir;
        issue::MftCommand command;
        command.serial = Serial(200);
        command.validity.days = 1;
        command.crl = mkrpki_test::rsync("rsync://example.net/repo/ca/ca.crl");
        command.ca_issuer = mkrpki_test::rsync("rsync://example.net/repo/ca.cer");
        command.signed_object = mkrpki_test::rsync("rsync://example.net/repo/ca/ca.mft");
        command.number = Serial(3);
        command.update.next_days = 1;
        command.files = {dir.write("z.roa", "zzz"), dir.write("ca.crl", "crl")};

        auto issued = f.issuer.issue_manifest(f.ca_key, command);
        REQUIRE(issued.success);

        auto cms = parse_cms(issued.value);
        CHECK(content_type(cms.get()) == "1.2.840.113549.1.9.16.1.26");
        const auto content = verified_content(cms.get());

        const Bytes z_name{0x16, 0x05, 'z', '.', 'r', 'o', 'a'};
        const Bytes crl_name{0x16, 0x06, 'c', 'a', '.', 'c', 'r', 'l'};
        const auto z_at = std::search(content.begin(), content.end(), z_name.begin(), z_name.end());
        const auto crl_at = std::search(content.begin(), content.end(), crl_name.begin(), crl_name.end());
        REQUIRE(z_at != content.end());
        REQUIRE(crl_at != content.end());
        CHECK(z_at < crl_at);

        // The end-entity certificate inherits every resource.
        const auto ee_der = ee_certificate(cms.get());
        CHECK(mkrpki_test::contains(ee_der, Bytes{0x30, 0x10, 0x30, 0x06, 0x04, 0x02, 0x00, 0x01, 0x05, 0x00, 0x30,
                                                  0x06, 0x04, 0x02, 0x00, 0x02, 0x05, 0x00}));
        CHECK(mkrpki_test::contains(ee_der, Bytes{0x30, 0x04, 0xA0, 0x02, 0x05, 0x00}));
    }

    TEST_CASE("unreadable file fails before signing") {
        crypto::OpenSslSigner signer;
        mkrpki_test::CountingSigner counting(signer);
        encode::DerEncoder encoder;
        crypto::SodiumDigest digests;
        issue::Issuer issuer(signer, counting, encoder, digests, mkrpki_test::fixed_clock());
        const auto key = mkrpki_test::make_key(signer);
        mkrpki_test::TempDir dir;

        issue::MftCommand command;
        command.validity.days = 1;
        command.update.next_days = 1;
        command.files = {dir / "absent.roa"};

        auto issued = issuer.issue_manifest(key, command);
        CHECK_FALSE(issued.success);
        CHECK(issued.kind == ErrorKind::Io);
        CHECK(counting.calls == 0);
    }
}
