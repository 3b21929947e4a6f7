#include "action.hpp"
#include "options.hpp"

#include <mkrpki/resources/as_block.hpp>

namespace mkrpki::tools {

    namespace {

        // Options every signed object shares: the EE certificate envelope.
        template <typename Command> Status fill_envelope(const po::variables_map &vm, Command &command) {
            command.issuer_key = vm["issuer-key"].as<std::string>();
            command.output = vm["output"].as<std::string>();

            auto serial = serial_option(vm, "serial");
            if (!serial.success) {
                return serial.forward<Unit>();
            }
            command.serial = serial.value;

            auto validity = validity_options(vm);
            if (!validity.success) {
                return validity.forward<Unit>();
            }
            command.validity = validity.value;

            for (auto [name, target] : {std::pair{"crl", &command.crl}, std::pair{"ca-issuer", &command.ca_issuer},
                                        std::pair{"signed-object", &command.signed_object}}) {
                auto uri = rsync_option(vm, name);
                if (!uri.success) {
                    return uri.forward<Unit>();
                }
                *target = std::move(uri.value);
            }
            return ok_status();
        }

    } // namespace

    void RoaAction::add_options(po::options_description &options) const {
        // clang-format off
        options.add_options()
            ("asn", po::value<std::string>()->required(), "origin AS number")
            ("prefixes", po::value<std::vector<std::string>>()->multitoken()->required(),
             "prefixes as <addr>/<len>[-<max-len>]");
        // clang-format on
        add_signed_object_options(options);
    }

    Status RoaAction::run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const {
        issue::RoaCommand command;
        if (auto status = fill_envelope(vm, command); !status.success) {
            return status;
        }

        auto asn = resources::parse_as_id(vm["asn"].as<std::string>());
        if (!asn.success) {
            return Status::failure(asn.kind, "--asn: " + asn.error);
        }
        command.asn = asn.value;

        auto prefixes = parse_list<object::RoaPrefix>(
            vm, "prefixes", [](const std::string &text) { return object::RoaPrefix::parse(text); });
        if (!prefixes.success) {
            return prefixes.forward<Unit>();
        }
        command.prefixes = std::move(prefixes.value);
        return pipeline.roa(command);
    }

    void MftAction::add_options(po::options_description &options) const {
        // clang-format off
        options.add_options()
            ("number", po::value<std::string>()->required(), "manifest number")
            ("files", po::value<std::vector<std::string>>()->multitoken()->required(),
             "files to list on the manifest");
        // clang-format on
        add_signed_object_options(options);
        add_update_options(options);
    }

    Status MftAction::run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const {
        issue::MftCommand command;
        if (auto status = fill_envelope(vm, command); !status.success) {
            return status;
        }

        auto number = serial_option(vm, "number");
        if (!number.success) {
            return number.forward<Unit>();
        }
        command.number = number.value;

        auto update = update_options(vm);
        if (!update.success) {
            return update.forward<Unit>();
        }
        command.update = update.value;

        for (const auto &file : list_option(vm, "files")) {
            command.files.emplace_back(file);
        }
        return pipeline.manifest(command);
    }

} // namespace mkrpki::tools
