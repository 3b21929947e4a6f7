#pragma once

#include <string>

#include <boost/program_options.hpp>

#include <mkrpki/core/result.hpp>
#include <mkrpki/issue/pipeline.hpp>

namespace mkrpki::tools {

    namespace po = boost::program_options;

    // One subcommand: its options and how a parsed option set turns into a pipeline run.
    class Action {
      public:
        virtual ~Action() = default;

        [[nodiscard]] virtual std::string name() const = 0;
        [[nodiscard]] virtual std::string summary() const = 0;
        virtual void add_options(po::options_description &options) const = 0;
        virtual Status run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const = 0;
    };

    class KeyAction : public Action {
      public:
        [[nodiscard]] std::string name() const override { return "key"; }
        [[nodiscard]] std::string summary() const override { return "Creates a key pair."; }
        void add_options(po::options_description &options) const override;
        Status run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const override;
    };

    class TaAction : public Action {
      public:
        [[nodiscard]] std::string name() const override { return "ta"; }
        [[nodiscard]] std::string summary() const override { return "Creates a trust-anchor certificate."; }
        void add_options(po::options_description &options) const override;
        Status run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const override;
    };

    class CerAction : public Action {
      public:
        [[nodiscard]] std::string name() const override { return "cer"; }
        [[nodiscard]] std::string summary() const override { return "Creates a CA certificate."; }
        void add_options(po::options_description &options) const override;
        Status run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const override;
    };

    class CrlAction : public Action {
      public:
        [[nodiscard]] std::string name() const override { return "crl"; }
        [[nodiscard]] std::string summary() const override { return "Creates a CRL."; }
        void add_options(po::options_description &options) const override;
        Status run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const override;
    };

    class RoaAction : public Action {
      public:
        [[nodiscard]] std::string name() const override { return "roa"; }
        [[nodiscard]] std::string summary() const override { return "Creates a ROA."; }
        void add_options(po::options_description &options) const override;
        Status run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const override;
    };

    class MftAction : public Action {
      public:
        [[nodiscard]] std::string name() const override { return "mft"; }
        [[nodiscard]] std::string summary() const override { return "Creates a manifest."; }
        void add_options(po::options_description &options) const override;
        Status run(const po::variables_map &vm, issue::IssuancePipeline &pipeline) const override;
    };

} // namespace mkrpki::tools
