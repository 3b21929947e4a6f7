#include "cli.hpp"

#include <algorithm>
#include <iostream>
#include <memory>

#include <mkrpki/crypto/digest.hpp>
#include <mkrpki/crypto/openssl_signer.hpp>
#include <mkrpki/encode/der_encoder.hpp>
#include <mkrpki/issue/pipeline.hpp>
#include <mkrpki/utils/logging.hpp>

#include "actions/action.hpp"

namespace mkrpki::tools {

    namespace {

        std::vector<std::unique_ptr<Action>> make_actions() {
            std::vector<std::unique_ptr<Action>> actions;
            actions.push_back(std::make_unique<KeyAction>());
            actions.push_back(std::make_unique<TaAction>());
            actions.push_back(std::make_unique<CerAction>());
            actions.push_back(std::make_unique<CrlAction>());
            actions.push_back(std::make_unique<RoaAction>());
            actions.push_back(std::make_unique<MftAction>());
            return actions;
        }

        void print_usage(const po::options_description &global, const std::vector<std::unique_ptr<Action>> &actions) {
            std::cout << "Usage: mkrpki [--verbose|--quiet] [--config <file>] <command> [options]\n\nCommands:\n";
            for (const auto &action : actions) {
                std::cout << "  " << action->name() << "\t" << action->summary() << "\n";
            }
            std::cout << "\n" << global << "\n";
        }

        int run_action(const Action &action, const std::vector<std::string> &args, bool help,
                       const std::optional<std::string> &config, issue::Issuer::Clock clock) {
            po::options_description options("Options for '" + action.name() + "'");
            action.add_options(options);

            if (help) {
                std::cout << "Usage: mkrpki " << action.name() << " [--config <file>] [options]\n"
                          << action.summary() << "\n\n"
                          << options << "\n";
                return 0;
            }

            const auto vm = read_options(options, args, config);

            crypto::OpenSslSigner signer;
            encode::DerEncoder encoder;
            crypto::SodiumDigest digests;
            issue::IssuancePipeline pipeline(signer, signer, encoder, digests, std::move(clock));

            const auto status = action.run(vm, pipeline);
            if (!status.success) {
                logging::logger()->debug("{} failed with {}", action.name(), error_kind_name(status.kind));
                logging::logger()->error("{}", status.error);
                return 1;
            }
            return 0;
        }

    } // namespace

    po::variables_map read_options(const po::options_description &options, const std::vector<std::string> &args,
                                   const std::optional<std::string> &config) {
        // Options stored by the first store() are final; the file only fills in the rest.
        po::variables_map vm;
        po::store(po::command_line_parser(args).options(options).run(), vm);
        if (config) {
            logging::logger()->debug("reading options from {}", *config);
            po::store(po::parse_config_file<char>(config->c_str(), options), vm);
        }
        po::notify(vm);
        return vm;
    }

    int run_cli(const std::vector<std::string> &args, issue::Issuer::Clock clock) {
        const auto actions = make_actions();

        po::options_description global("Global options");
        // clang-format off
        global.add_options()
            ("help,h", "print help for mkrpki or a command")
            ("verbose,v", po::bool_switch(), "log every issuance step")
            ("quiet,q", po::bool_switch(), "only log warnings and errors")
            ("config", po::value<std::string>(), "read command options from an INI file; arguments win");
        // clang-format on

        po::options_description hidden;
        // clang-format off
        hidden.add_options()
            ("command", po::value<std::string>())
            ("args", po::value<std::vector<std::string>>());
        // clang-format on

        po::options_description all;
        all.add(global).add(hidden);

        po::positional_options_description positional;
        positional.add("command", 1).add("args", -1);

        try {
            auto parsed = po::command_line_parser(args).options(all).positional(positional).allow_unregistered().run();
            po::variables_map vm;
            po::store(parsed, vm);
            po::notify(vm);

            if (vm["quiet"].as<bool>()) {
                logging::set_verbosity(logging::Verbosity::Quiet);
            } else if (vm["verbose"].as<bool>()) {
                logging::set_verbosity(logging::Verbosity::Verbose);
            } else {
                logging::set_verbosity(logging::Verbosity::Normal);
            }

            const bool help = vm.count("help") > 0;
            if (!vm.count("command")) {
                print_usage(global, actions);
                return help ? 0 : 1;
            }

            std::optional<std::string> config;
            if (vm.count("config")) {
                config = vm["config"].as<std::string>();
            }

            const auto command = vm["command"].as<std::string>();
            for (const auto &action : actions) {
                if (action->name() != command) {
                    continue;
                }
                auto rest = po::collect_unrecognized(parsed.options, po::include_positional);
                rest.erase(std::find(rest.begin(), rest.end(), command));
                return run_action(*action, rest, help, config, std::move(clock));
            }
            logging::logger()->error("Unknown command '{}'.", command);
            return 1;
        } catch (const po::error &e) {
            logging::logger()->error("{}", e.what());
            return 1;
        } catch (const std::exception &e) {
            logging::logger()->error("{}", e.what());
            return 1;
        }
    }

} // namespace mkrpki::tools
