#include <mkrpki/object/crl.hpp>

namespace mkrpki::object {

    Result<CrlEntry> CrlEntry::parse(std::string_view text) {
        const auto at = text.find('@');
        auto serial = Serial::parse(text.substr(0, at));
        if (!serial.success) {
            return Result<CrlEntry>::failure(ErrorKind::Parse,
                                             "Invalid CRL entry '" + std::string(text) + "': " + serial.error);
        }

        CrlEntry entry{serial.value, std::nullopt};
        if (at != std::string_view::npos) {
            auto when = parse_time(text.substr(at + 1));
            if (!when.success) {
                return Result<CrlEntry>::failure(ErrorKind::Parse,
                                                 "Invalid CRL entry '" + std::string(text) + "': " + when.error);
            }
            entry.revoked_at = truncate_to_seconds(when.value);
        }
        return Result<CrlEntry>::ok(std::move(entry));
    }

    TbsCrl build_crl(const crypto::PublicKey &issuer, UpdatePeriod period, std::vector<CrlEntry> entries,
                     Serial crl_number) {
        for (auto &entry : entries) {
            if (!entry.revoked_at) {
                entry.revoked_at = period.this_update;
            }
        }
        return TbsCrl{issuer.subject_name(), period, std::move(entries), issuer.key_identifier(),
                      std::move(crl_number)};
    }

} // namespace mkrpki::object
