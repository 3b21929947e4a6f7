#include "action.hpp"
#include "options.hpp"

#include <mkrpki/resources/as_block.hpp>
#include <mkrpki/resources/ip_block.hpp>

namespace mkrpki::tools {

    namespace {

        using resources::AddressFamily;
        using resources::AsBlock;
        using resources::IpBlock;

        void add_resource_options(po::options_description &options) {
            // clang-format off
            options.add_options()
                ("v4", po::value<std::vector<std::string>>(), "IPv4 prefix or range, repeatable")
                ("v6", po::value<std::vector<std::string>>(), "IPv6 prefix or range, repeatable")
                ("as", po::value<std::vector<std::string>>(), "AS number or range, repeatable");
            // clang-format on
        }

        Result<std::vector<IpBlock>> ip_blocks(const po::variables_map &vm, const std::string &name,
                                               AddressFamily family) {
            return parse_list<IpBlock>(vm, name,
                                       [family](const std::string &text) { return IpBlock::parse(text, family); });
        }

        Result<std::vector<AsBlock>> as_blocks(const po::variables_map &vm) {
            return parse_list<AsBlock>(vm, "as", [](const std::string &text) { return AsBlock::parse(text); });
        }

        Result<resources::ResourceRequest> resource_options(const po::variables_map &vm) {
            resources::ResourceRequest request;
            auto v4 = ip_blocks(vm, "v4", AddressFamily::Ipv4);
            if (!v4.success) {
                return v4.forward<resources::ResourceRequest>();
            }
            auto v6 = ip_blocks(vm, "v6", AddressFamily::Ipv6);
            if (!v6.success) {
                return v6.forward<resources::ResourceRequest>();
            }
            auto as = as_blocks(vm);
            if (!as.success) {
                return as.forward<resources::ResourceRequest>();
            }
            request.v4 = std::move(v4.value);
            request.v6 = std::move(v6.value);
            request.as = std::move(as.value);
            request.inherit_v4 = vm.count("inherit-v4") && vm["inherit-v4"].as<bool>();
            request.inherit_v6 = vm.count("inherit-v6") && vm["inherit-v6"].as<bool>();
            request.inherit_as = vm.count("inherit-as") && vm["inherit-as"].as<bool>();
            return Result<resources::ResourceRequest>::ok(std::move(request));
        }

    } // namespace

    void KeyAction::add_options(po::options_description &options) const {
        // clang-format off
        options.add_options()
            ("private", po::value<std::string>()->required(), "output file for the DER private key")
            ("public", po::value<std::string>()->required(), "output file for the DER public key");
        // clang-format on
    }

    Status KeyAction::run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const {
        return pipeline.create_key(issue::KeyCommand{vm["private"].as<std::string>(), vm["public"].as<std::string>()});
    }

    void TaAction::add_options(po::options_description &options) const {
        // clang-format off
        options.add_options()
            ("key", po::value<std::string>()->required(), "DER private key of the trust anchor")
            ("serial", po::value<std::string>()->required(), "serial number")
            ("ca-repository", po::value<std::string>()->required(), "rsync URI of the CA repository")
            ("rpki-manifest", po::value<std::string>()->required(), "rsync URI of the manifest")
            ("rpki-notify", po::value<std::string>(), "HTTPS URI of the RRDP notification file")
            ("tal-rsync-uri", po::value<std::string>()->required(), "rsync URI of the certificate in the TAL")
            ("tal-https-uri", po::value<std::string>(), "HTTPS URI of the certificate in the TAL")
            ("output", po::value<std::string>()->required(), "output file for the certificate")
            ("output-tal", po::value<std::string>(), "output file for the TAL");
        // clang-format on
        add_validity_options(options);
        add_resource_options(options);
    }

    Status TaAction::run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const {
        issue::TaCommand command;
        command.key = vm["key"].as<std::string>();
        command.output = vm["output"].as<std::string>();
        if (vm.count("output-tal")) {
            command.output_tal = vm["output-tal"].as<std::string>();
        }

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

        for (auto [name, target] : {std::pair{"ca-repository", &command.ca_repository},
                                    std::pair{"rpki-manifest", &command.rpki_manifest},
                                    std::pair{"tal-rsync-uri", &command.tal_rsync_uri}}) {
            auto uri = rsync_option(vm, name);
            if (!uri.success) {
                return uri.forward<Unit>();
            }
            *target = std::move(uri.value);
        }
        auto notify = optional_https_option(vm, "rpki-notify");
        if (!notify.success) {
            return notify.forward<Unit>();
        }
        command.rpki_notify = std::move(notify.value);
        auto tal_https = optional_https_option(vm, "tal-https-uri");
        if (!tal_https.success) {
            return tal_https.forward<Unit>();
        }
        command.tal_https_uri = std::move(tal_https.value);

        auto request = resource_options(vm);
        if (!request.success) {
            return request.forward<Unit>();
        }
        command.v4 = std::move(request.value.v4);
        command.v6 = std::move(request.value.v6);
        command.as = std::move(request.value.as);
        return pipeline.trust_anchor(command);
    }

    void CerAction::add_options(po::options_description &options) const {
        // clang-format off
        options.add_options()
            ("issuer-key", po::value<std::string>()->required(), "DER private key of the issuing CA")
            ("subject-key", po::value<std::string>()->required(), "DER public key of the new CA")
            ("serial", po::value<std::string>()->required(), "serial number")
            ("trim-resources", po::bool_switch(), "use the RFC 8360 validation policy")
            ("crl", po::value<std::string>()->required(), "rsync URI of the issuer's CRL")
            ("ca-issuer", po::value<std::string>()->required(), "rsync URI of the issuer's certificate")
            ("ca-repository", po::value<std::string>()->required(), "rsync URI of the CA repository")
            ("rpki-manifest", po::value<std::string>()->required(), "rsync URI of the manifest")
            ("rpki-notify", po::value<std::string>(), "HTTPS URI of the RRDP notification file")
            ("inherit-v4", po::bool_switch(), "inherit IPv4 resources")
            ("inherit-v6", po::bool_switch(), "inherit IPv6 resources")
            ("inherit-as", po::bool_switch(), "inherit AS resources")
            ("output", po::value<std::string>()->required(), "output file");
        // clang-format on
        add_validity_options(options);
        add_resource_options(options);
    }

    Status CerAction::run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const {
        issue::CerCommand command;
        command.issuer_key = vm["issuer-key"].as<std::string>();
        command.subject_key = vm["subject-key"].as<std::string>();
        command.output = vm["output"].as<std::string>();
        command.trim_resources = vm["trim-resources"].as<bool>();

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

        for (auto [name, target] :
             {std::pair{"crl", &command.crl}, std::pair{"ca-issuer", &command.ca_issuer},
              std::pair{"ca-repository", &command.ca_repository}, std::pair{"rpki-manifest", &command.rpki_manifest}}) {
            auto uri = rsync_option(vm, name);
            if (!uri.success) {
                return uri.forward<Unit>();
            }
            *target = std::move(uri.value);
        }
        auto notify = optional_https_option(vm, "rpki-notify");
        if (!notify.success) {
            return notify.forward<Unit>();
        }
        command.rpki_notify = std::move(notify.value);

        auto request = resource_options(vm);
        if (!request.success) {
            return request.forward<Unit>();
        }
        command.resources = std::move(request.value);
        return pipeline.ca_certificate(command);
    }

    void CrlAction::add_options(po::options_description &options) const {
        // clang-format off
        options.add_options()
            ("issuer-key", po::value<std::string>()->required(), "DER private key of the issuing CA")
            ("cert,c", po::value<std::vector<std::string>>(),
             "revoked serial number, optionally followed by @<time>, repeatable")
            ("crl", po::value<std::string>()->required(), "CRL number")
            ("output", po::value<std::string>()->required(), "output file");
        // clang-format on
        add_update_options(options);
    }

    Status CrlAction::run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const {
        issue::CrlCommand command;
        command.issuer_key = vm["issuer-key"].as<std::string>();
        command.output = vm["output"].as<std::string>();

        auto number = serial_option(vm, "crl");
        if (!number.success) {
            return number.forward<Unit>();
        }
        command.crl_number = number.value;

        auto update = update_options(vm);
        if (!update.success) {
            return update.forward<Unit>();
        }
        command.update = update.value;

        auto revoked = parse_list<object::CrlEntry>(
            vm, "cert", [](const std::string &text) { return object::CrlEntry::parse(text); });
        if (!revoked.success) {
            return revoked.forward<Unit>();
        }
        command.revoked = std::move(revoked.value);
        return pipeline.crl(command);
    }

} // namespace mkrpki::tools
