#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <mkrpki/core/result.hpp>
#include <mkrpki/core/serial.hpp>
#include <mkrpki/core/uri.hpp>
#include <mkrpki/issue/commands.hpp>
#include <mkrpki/object/validity.hpp>

namespace mkrpki::tools {

    namespace po = boost::program_options;

    // Option declarations shared by several subcommands.
    void add_validity_options(po::options_description &options);
    void add_update_options(po::options_description &options);
    void add_signed_object_options(po::options_description &options);

    Result<Serial> serial_option(const po::variables_map &vm, const std::string &name);
    Result<Uri> rsync_option(const po::variables_map &vm, const std::string &name);
    Result<std::optional<Uri>> optional_https_option(const po::variables_map &vm, const std::string &name);
    Result<std::optional<Time>> optional_time_option(const po::variables_map &vm, const std::string &name);
    std::vector<std::string> list_option(const po::variables_map &vm, const std::string &name);

    Result<object::ValidityRequest> validity_options(const po::variables_map &vm);
    Result<object::UpdateRequest> update_options(const po::variables_map &vm);

    // Parses every value of a repeatable option with 'parse', stopping at the first failure.
    template <typename T, typename Parse>
    Result<std::vector<T>> parse_list(const po::variables_map &vm, const std::string &name, Parse parse) {
        std::vector<T> values;
        for (const auto &text : list_option(vm, name)) {
            auto value = parse(text);
            if (!value.success) {
                return Result<std::vector<T>>::failure(value.kind, "--" + name + ": " + value.error);
            }
            values.push_back(std::move(value.value));
        }
        return Result<std::vector<T>>::ok(std::move(values));
    }

} // namespace mkrpki::tools
