#include <mkrpki/encode/der_encoder.hpp>

#include <string_view>

#include <mkrpki/der/asn1_writer.hpp>
#include <mkrpki/der/oid_registry.hpp>

namespace mkrpki::encode {

    using namespace mkrpki::der;

    namespace {

        constexpr uint8_t KU_DIGITAL_SIGNATURE = 0x80;
        constexpr uint8_t KU_KEY_CERT_SIGN = 0x04;
        constexpr uint8_t KU_CRL_SIGN = 0x02;

        constexpr uint32_t GENERAL_NAME_URI = 6;

        Bytes algorithm_identifier(const Oid &oid, bool null_parameters) {
            if (null_parameters) {
                return encode_sequence(concat({encode_oid(oid), encode_null()}));
            }
            return encode_sequence(encode_oid(oid));
        }

        Bytes signature_algorithm(crypto::SignatureAlgorithm algorithm) {
            switch (algorithm) {
            case crypto::SignatureAlgorithm::Sha256WithRsa:
                break;
            }
            return algorithm_identifier(oids::sha256_with_rsa, true);
        }

        Bytes name(std::string_view common_name) {
            auto attribute =
                encode_sequence(concat({encode_oid(oids::common_name), encode_printable_string(common_name)}));
            return encode_sequence(encode_set(attribute));
        }

        Bytes uri_name(const Uri &uri) {
            const auto &text = uri.str();
            return encode_tlv(ASN1Class::ContextSpecific, false, GENERAL_NAME_URI,
                              ByteSpan(reinterpret_cast<const uint8_t *>(text.data()), text.size()));
        }

        Bytes access_description(const Oid &method, const Uri &uri) {
            return encode_sequence(concat({encode_oid(method), uri_name(uri)}));
        }

        Bytes extension(const Oid &oid, bool critical, const Bytes &value) {
            if (critical) {
                return encode_sequence(concat({encode_oid(oid), encode_boolean(true), encode_octet_string(value)}));
            }
            return encode_sequence(concat({encode_oid(oid), encode_octet_string(value)}));
        }

        Bytes key_identifier(ByteSpan key_id) {
            // AuthorityKeyIdentifier with only keyIdentifier [0].
            return encode_sequence(encode_tlv(ASN1Class::ContextSpecific, false, 0, key_id));
        }

        // The first 'length' bits of an address as a BIT STRING.
        Bytes prefix_bits(const resources::IpAddress &address, unsigned length) {
            const size_t bytes = (length + 7) / 8;
            Bytes bits(address.bytes.begin(), address.bytes.begin() + static_cast<std::ptrdiff_t>(bytes));
            const auto unused = static_cast<uint8_t>((bytes * 8) - length);
            if (unused > 0) {
                bits.back() &= static_cast<uint8_t>(0xFFU << unused);
            }
            return encode_bit_string(bits, unused);
        }

        // Range bounds drop trailing zero bits (lower end) or trailing one bits (upper end).
        Bytes range_bound(const resources::IpAddress &address, bool upper) {
            unsigned length = resources::address_bits(address.family);
            while (length > 0 && address.bit(length - 1) == upper) {
                --length;
            }
            return prefix_bits(address, length);
        }

        Bytes ip_address_or_range(const resources::IpBlock &block) {
            const int length = block.prefix_length();
            if (length >= 0) {
                return prefix_bits(block.min(), static_cast<unsigned>(length));
            }
            return encode_sequence(concat({range_bound(block.min(), false), range_bound(block.max(), true)}));
        }

        Bytes address_family(resources::AddressFamily family) {
            const uint16_t afi = resources::address_family_identifier(family);
            const uint8_t bytes[2] = {static_cast<uint8_t>(afi >> 8), static_cast<uint8_t>(afi & 0xFF)};
            return encode_octet_string(ByteSpan(bytes, 2));
        }

        Bytes ip_family(resources::AddressFamily family, const resources::IpResources &set) {
            if (set.is_inherit()) {
                return encode_sequence(concat({address_family(family), encode_null()}));
            }
            Bytes blocks;
            for (const auto &block : resources::normalize(set.blocks())) {
                const auto encoded = ip_address_or_range(block);
                blocks.insert(blocks.end(), encoded.begin(), encoded.end());
            }
            return encode_sequence(concat({address_family(family), encode_sequence(blocks)}));
        }

        Bytes certificate_extensions(const object::TbsCertificate &tbs) {
            std::vector<Bytes> extensions;

            if (tbs.basic_ca) {
                extensions.push_back(extension(oids::basic_constraints, true, encode_sequence(encode_boolean(true))));
            }
            extensions.push_back(extension(oids::subject_key_identifier, false,
                                           encode_octet_string(tbs.subject_key.key_identifier())));
            if (tbs.authority_key_identifier) {
                extensions.push_back(
                    extension(oids::authority_key_identifier, false, key_identifier(*tbs.authority_key_identifier)));
            }

            if (tbs.key_usage == object::KeyUsage::Ca) {
                const uint8_t bits = KU_KEY_CERT_SIGN | KU_CRL_SIGN;
                extensions.push_back(extension(oids::key_usage, true, encode_bit_string(ByteSpan(&bits, 1), 1)));
            } else {
                const uint8_t bits = KU_DIGITAL_SIGNATURE;
                extensions.push_back(extension(oids::key_usage, true, encode_bit_string(ByteSpan(&bits, 1), 7)));
            }

            if (tbs.crl_uri) {
                // DistributionPoint { distributionPoint [0] { fullName [0] { uri } } }
                auto full_name = encode_tlv(ASN1Class::ContextSpecific, true, 0, uri_name(*tbs.crl_uri));
                auto point = encode_sequence(encode_explicit(0, full_name));
                extensions.push_back(extension(oids::crl_distribution_points, false, encode_sequence(point)));
            }
            if (tbs.ca_issuer) {
                auto aia = encode_sequence(access_description(oids::ad_ca_issuers, *tbs.ca_issuer));
                extensions.push_back(extension(oids::authority_info_access, false, aia));
            }

            Bytes sia;
            auto add_access = [&sia](const Oid &method, const std::optional<Uri> &uri) {
                if (uri) {
                    const auto encoded = access_description(method, *uri);
                    sia.insert(sia.end(), encoded.begin(), encoded.end());
                }
            };
            add_access(oids::ad_ca_repository, tbs.ca_repository);
            add_access(oids::ad_rpki_manifest, tbs.rpki_manifest);
            add_access(oids::ad_rpki_notify, tbs.rpki_notify);
            add_access(oids::ad_signed_object, tbs.signed_object);
            if (!sia.empty()) {
                extensions.push_back(extension(oids::subject_info_access, false, encode_sequence(sia)));
            }

            const bool trim = tbs.overclaim == resources::OverclaimPolicy::Trim;
            const auto &policy = trim ? oids::cp_ip_addr_as_number_v2 : oids::cp_ip_addr_as_number;
            extensions.push_back(
                extension(oids::certificate_policies, true, encode_sequence(encode_sequence(encode_oid(policy)))));

            const auto &res = tbs.resources;
            if (res.has_ip()) {
                extensions.push_back(extension(trim ? oids::ip_addr_blocks_v2 : oids::ip_addr_blocks, true,
                                               encode_ip_resources(res.v4, res.v6)));
            }
            if (res.has_as()) {
                extensions.push_back(extension(trim ? oids::autonomous_sys_ids_v2 : oids::autonomous_sys_ids, true,
                                               encode_as_resources(res.as)));
            }

            return encode_sequence(concat(extensions));
        }

        Result<Bytes> roa_address(const object::RoaPrefix &prefix) {
            const unsigned width = resources::address_bits(prefix.family());
            const std::string text = prefix.address.to_string() + "/" + std::to_string(prefix.length);
            if (prefix.length > width) {
                return Result<Bytes>::failure(ErrorKind::Encoding,
                                              "ROA prefix " + text + " is longer than the address");
            }
            if (!prefix.address.trailing_bits_are(prefix.length, false)) {
                return Result<Bytes>::failure(ErrorKind::Encoding, "ROA prefix " + text + " has host bits set");
            }

            Bytes body = prefix_bits(prefix.address, prefix.length);
            if (prefix.max_length) {
                if (*prefix.max_length < prefix.length || *prefix.max_length > width) {
                    return Result<Bytes>::failure(ErrorKind::Encoding,
                                                  "ROA prefix " + text + " has invalid max length " +
                                                      std::to_string(*prefix.max_length));
                }
                const auto max_length = encode_integer(static_cast<uint64_t>(*prefix.max_length));
                body.insert(body.end(), max_length.begin(), max_length.end());
            }
            return Result<Bytes>::ok(encode_sequence(body));
        }

        Result<Bytes> roa_family(resources::AddressFamily family, const std::vector<object::RoaPrefix> &prefixes) {
            Bytes addresses;
            for (const auto &prefix : prefixes) {
                auto encoded = roa_address(prefix);
                if (!encoded.success) {
                    return encoded;
                }
                addresses.insert(addresses.end(), encoded.value.begin(), encoded.value.end());
            }
            return Result<Bytes>::ok(encode_sequence(concat({address_family(family), encode_sequence(addresses)})));
        }

        Bytes attribute(const Oid &type, const Bytes &value) {
            return encode_sequence(concat({encode_oid(type), encode_set(value)}));
        }

    } // namespace

    Bytes encode_ip_resources(const resources::IpResources &v4, const resources::IpResources &v6) {
        Bytes families;
        if (!v4.is_absent()) {
            const auto encoded = ip_family(resources::AddressFamily::Ipv4, v4);
            families.insert(families.end(), encoded.begin(), encoded.end());
        }
        if (!v6.is_absent()) {
            const auto encoded = ip_family(resources::AddressFamily::Ipv6, v6);
            families.insert(families.end(), encoded.begin(), encoded.end());
        }
        return encode_sequence(families);
    }

    Bytes encode_as_resources(const resources::AsResources &as) {
        Bytes choice;
        if (as.is_inherit()) {
            choice = encode_null();
        } else {
            Bytes ids;
            for (const auto &block : resources::normalize(as.blocks())) {
                const auto encoded =
                    block.is_id() ? encode_integer(uint64_t{block.min})
                                  : encode_sequence(concat({encode_integer(uint64_t{block.min}),
                                                            encode_integer(uint64_t{block.max})}));
                ids.insert(ids.end(), encoded.begin(), encoded.end());
            }
            choice = encode_sequence(ids);
        }
        // ASIdentifiers { asnum [0] EXPLICIT ASIdentifierChoice }
        return encode_sequence(encode_explicit(0, choice));
    }

    Result<Bytes> DerEncoder::encode_tbs_certificate(const object::TbsCertificate &tbs) const {
        const auto &subject_key = tbs.subject_key.info_bytes();
        if (subject_key.empty()) {
            return Result<Bytes>::failure(ErrorKind::Encoding, "certificate has no subject key");
        }
        auto validity = encode_sequence(
            concat({encode_time(tbs.validity.not_before), encode_time(tbs.validity.not_after)}));

        return Result<Bytes>::ok(encode_sequence(concat({
            encode_explicit(0, encode_integer(uint64_t{2})),
            encode_integer(tbs.serial.bytes()),
            signature_algorithm(crypto::SignatureAlgorithm::Sha256WithRsa),
            name(tbs.issuer_name),
            validity,
            name(tbs.subject_name),
            subject_key,
            encode_explicit(3, certificate_extensions(tbs)),
        })));
    }

    Result<Bytes> DerEncoder::encode_certificate(const object::SignedCertificate &cert) const {
        return Result<Bytes>::ok(encode_sequence(concat({
            cert.tbs,
            signature_algorithm(cert.signature.algorithm),
            encode_bit_string(cert.signature.value),
        })));
    }

    Result<Bytes> DerEncoder::encode_tbs_crl(const object::TbsCrl &tbs) const {
        std::vector<Bytes> parts{
            encode_integer(uint64_t{1}),
            signature_algorithm(crypto::SignatureAlgorithm::Sha256WithRsa),
            name(tbs.issuer_name),
            encode_time(tbs.period.this_update),
            encode_time(tbs.period.next_update),
        };

        if (!tbs.entries.empty()) {
            Bytes revoked;
            for (const auto &entry : tbs.entries) {
                const auto encoded = encode_sequence(concat({
                    encode_integer(entry.serial.bytes()),
                    encode_time(entry.revoked_at.value_or(tbs.period.this_update)),
                }));
                revoked.insert(revoked.end(), encoded.begin(), encoded.end());
            }
            parts.push_back(encode_sequence(revoked));
        }

        auto extensions = encode_sequence(concat({
            extension(oids::authority_key_identifier, false, key_identifier(tbs.authority_key_identifier)),
            extension(oids::crl_number, false, encode_integer(tbs.crl_number.bytes())),
        }));
        parts.push_back(encode_explicit(0, extensions));

        return Result<Bytes>::ok(encode_sequence(concat(parts)));
    }

    Result<Bytes> DerEncoder::encode_crl(const object::SignedCrl &crl) const {
        return Result<Bytes>::ok(encode_sequence(concat({
            crl.tbs,
            signature_algorithm(crl.signature.algorithm),
            encode_bit_string(crl.signature.value),
        })));
    }

    Result<Bytes> DerEncoder::encode_roa_content(const object::RoaContent &roa) const {
        if (roa.v4.empty() && roa.v6.empty()) {
            return Result<Bytes>::failure(ErrorKind::Encoding, "ROA needs at least one prefix");
        }

        Bytes families;
        for (const auto &[family, prefixes] : {std::pair{resources::AddressFamily::Ipv4, &roa.v4},
                                               std::pair{resources::AddressFamily::Ipv6, &roa.v6}}) {
            if (prefixes->empty()) {
                continue;
            }
            auto encoded = roa_family(family, *prefixes);
            if (!encoded.success) {
                return encoded;
            }
            families.insert(families.end(), encoded.value.begin(), encoded.value.end());
        }

        // version [0] is left at its default.
        return Result<Bytes>::ok(encode_sequence(concat({
            encode_integer(uint64_t{roa.as_id}),
            encode_sequence(families),
        })));
    }

    Result<Bytes> DerEncoder::encode_manifest_content(const object::ManifestContent &mft) const {
        Bytes files;
        for (const auto &file : mft.files) {
            const auto encoded = encode_sequence(concat({encode_ia5_string(file.name), encode_bit_string(file.hash)}));
            files.insert(files.end(), encoded.begin(), encoded.end());
        }

        return Result<Bytes>::ok(encode_sequence(concat({
            encode_integer(mft.number.bytes()),
            encode_generalized_time(mft.period.this_update),
            encode_generalized_time(mft.period.next_update),
            encode_oid(crypto::digest_oid(mft.algorithm)),
            encode_sequence(files),
        })));
    }

    Result<Bytes> DerEncoder::encode_signed_attributes(const object::SignedAttributes &attrs) const {
        if (attrs.message_digest.empty()) {
            return Result<Bytes>::failure(ErrorKind::Encoding, "signed attributes lack a message digest");
        }
        return Result<Bytes>::ok(encode_set_of({
            attribute(oids::attr_content_type, encode_oid(attrs.content_type)),
            attribute(oids::attr_message_digest, encode_octet_string(attrs.message_digest)),
            attribute(oids::attr_signing_time, encode_time(attrs.signing_time)),
        }));
    }

    Result<Bytes> DerEncoder::encode_signed_object(const object::SignedObject &object) const {
        if (object.signed_attributes.empty() || object.ee_certificate.empty()) {
            return Result<Bytes>::failure(ErrorKind::Encoding, "incomplete signed object");
        }

        const auto digest_algorithm = algorithm_identifier(crypto::digest_oid(object.digest_algorithm), false);

        auto signer_info = encode_sequence(concat({
            encode_integer(uint64_t{3}),
            encode_tlv(ASN1Class::ContextSpecific, false, 0, object.signer_key_identifier),
            digest_algorithm,
            encode_implicit(0, object.signed_attributes),
            algorithm_identifier(oids::rsa_encryption, true),
            encode_octet_string(object.signature.value),
        }));

        auto encap_content = encode_sequence(concat({
            encode_oid(object.content_type),
            encode_explicit(0, encode_octet_string(object.content)),
        }));

        auto signed_data = encode_sequence(concat({
            encode_integer(uint64_t{3}),
            encode_set(digest_algorithm),
            encap_content,
            encode_tlv(ASN1Class::ContextSpecific, true, 0, object.ee_certificate),
            encode_set(signer_info),
        }));

        return Result<Bytes>::ok(
            encode_sequence(concat({encode_oid(oids::signed_data), encode_explicit(0, signed_data)})));
    }

} // namespace mkrpki::encode
