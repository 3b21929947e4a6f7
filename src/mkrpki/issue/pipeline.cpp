#include <mkrpki/issue/pipeline.hpp>

#include <mkrpki/io/files.hpp>
#include <mkrpki/utils/logging.hpp>

namespace mkrpki::issue {

    namespace {

        Status save(const Path &path, ByteSpan data, const char *label) {
            auto written = io::write_binary(path, data);
            if (written.success) {
                logging::logger()->info("{} {}", label, path.string());
            }
            return written;
        }

        Status save_object(const Path &path, const Result<Bytes> &object, const char *label) {
            if (!object.success) {
                return object.forward<Unit>();
            }
            return save(path, object.value, label);
        }

    } // namespace

    IssuancePipeline::IssuancePipeline(crypto::KeyStore &keys, const crypto::Signer &signer,
                                       const encode::Encoder &encoder, const crypto::DigestStream &digests,
                                       Issuer::Clock clock)
        : keys_(keys), issuer_(keys, signer, encoder, digests, std::move(clock)) {}

    Result<crypto::KeyHandle> IssuancePipeline::load_issuer_key(const Path &path) {
        auto der = io::read_binary(path);
        if (!der.success) {
            return der.forward<crypto::KeyHandle>();
        }
        auto key = keys_.load_key(der.value);
        if (!key.success) {
            return Result<crypto::KeyHandle>::failure(ErrorKind::KeyDecode,
                                                      "Invalid issuer key " + path.string() + ": " + key.error);
        }
        logging::logger()->debug("loaded key {}", path.string());
        return key;
    }

    Status IssuancePipeline::create_key(const KeyCommand &command) {
        auto key = keys_.create_key();
        if (!key.success) {
            return key.forward<Unit>();
        }
        auto exported = keys_.export_key(key.value);
        if (!exported.success) {
            return exported.forward<Unit>();
        }

        if (auto status = save(command.private_key, exported.value.private_der, "key:"); !status.success) {
            return status;
        }
        return save(command.public_key, exported.value.public_der, "pub:");
    }

    Status IssuancePipeline::trust_anchor(const TaCommand &command) {
        auto key = load_issuer_key(command.key);
        if (!key.success) {
            return key.forward<Unit>();
        }
        auto issued = issuer_.issue_trust_anchor(key.value, command);
        if (!issued.success) {
            return issued.forward<Unit>();
        }

        if (auto status = save(command.output, issued.value.certificate, "TA:"); !status.success) {
            return status;
        }
        if (command.output_tal) {
            const auto &tal = issued.value.tal;
            return save(*command.output_tal,
                        ByteSpan(reinterpret_cast<const uint8_t *>(tal.data()), tal.size()), "TAL:");
        }
        return ok_status();
    }

    Status IssuancePipeline::ca_certificate(const CerCommand &command) {
        auto key = load_issuer_key(command.issuer_key);
        if (!key.success) {
            return key.forward<Unit>();
        }
        auto subject_key = io::read_binary(command.subject_key);
        if (!subject_key.success) {
            return subject_key.forward<Unit>();
        }
        return save_object(command.output, issuer_.issue_ca_certificate(key.value, subject_key.value, command),
                           "Cer:");
    }

    Status IssuancePipeline::crl(const CrlCommand &command) {
        auto key = load_issuer_key(command.issuer_key);
        if (!key.success) {
            return key.forward<Unit>();
        }
        return save_object(command.output, issuer_.issue_crl(key.value, command), "Crl:");
    }

    Status IssuancePipeline::roa(const RoaCommand &command) {
        auto key = load_issuer_key(command.issuer_key);
        if (!key.success) {
            return key.forward<Unit>();
        }
        return save_object(command.output, issuer_.issue_roa(key.value, command), "Roa:");
    }

    Status IssuancePipeline::manifest(const MftCommand &command) {
        auto key = load_issuer_key(command.issuer_key);
        if (!key.success) {
            return key.forward<Unit>();
        }
        return save_object(command.output, issuer_.issue_manifest(key.value, command), "Mft:");
    }

} // namespace mkrpki::issue
