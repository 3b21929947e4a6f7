#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <mkrpki/core/time.hpp>
#include <mkrpki/issue/issuer.hpp>

namespace mkrpki::tools {

    namespace po = boost::program_options;

    // Reads a subcommand's options from its arguments and, when 'config' names a file, from that INI file.
    // An option given as an argument replaces the file's value entirely, repeatable options included.
    po::variables_map read_options(const po::options_description &options, const std::vector<std::string> &args,
                                   const std::optional<std::string> &config);

    // Runs one mkrpki invocation; 'args' excludes the program name. Returns the process exit status.
    int run_cli(const std::vector<std::string> &args, issue::Issuer::Clock clock = mkrpki::now);

} // namespace mkrpki::tools
