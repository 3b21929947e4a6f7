#include "options.hpp"

namespace mkrpki::tools {

    namespace {

        template <typename T> Result<T> option_error(const std::string &name, const Result<T> &parsed) {
            return Result<T>::failure(parsed.kind, "--" + name + ": " + parsed.error);
        }

        std::optional<int64_t> optional_days(const po::variables_map &vm, const std::string &name) {
            if (!vm.count(name)) {
                return std::nullopt;
            }
            return vm[name].as<int64_t>();
        }

    } // namespace

    void add_validity_options(po::options_description &options) {
        // clang-format off
        options.add_options()
            ("not-before", po::value<std::string>(), "start of the validity period (RFC 3339, default now)")
            ("not-after", po::value<std::string>(), "end of the validity period (RFC 3339)")
            ("days", po::value<int64_t>(), "length of the validity period in days");
        // clang-format on
    }

    void add_update_options(po::options_description &options) {
        // clang-format off
        options.add_options()
            ("this-update", po::value<std::string>(), "this update time (RFC 3339, default now)")
            ("next-update", po::value<std::string>(), "next update time (RFC 3339)")
            ("next-days", po::value<int64_t>(), "days from this update until next update");
        // clang-format on
    }

    void add_signed_object_options(po::options_description &options) {
        // clang-format off
        options.add_options()
            ("issuer-key", po::value<std::string>()->required(), "DER private key of the issuing CA")
            ("serial", po::value<std::string>()->required(), "serial number of the EE certificate")
            ("crl", po::value<std::string>()->required(), "rsync URI of the issuer's CRL")
            ("ca-issuer", po::value<std::string>()->required(), "rsync URI of the issuer's certificate")
            ("signed-object", po::value<std::string>()->required(), "rsync URI of the object itself")
            ("output", po::value<std::string>()->required(), "output file");
        // clang-format on
        add_validity_options(options);
    }

    Result<Serial> serial_option(const po::variables_map &vm, const std::string &name) {
        auto serial = Serial::parse(vm[name].as<std::string>());
        return serial.success ? serial : option_error(name, serial);
    }

    Result<Uri> rsync_option(const po::variables_map &vm, const std::string &name) {
        auto uri = Uri::parse_rsync(vm[name].as<std::string>());
        return uri.success ? uri : option_error(name, uri);
    }

    Result<std::optional<Uri>> optional_https_option(const po::variables_map &vm, const std::string &name) {
        if (!vm.count(name)) {
            return Result<std::optional<Uri>>::ok(std::nullopt);
        }
        auto uri = Uri::parse_https(vm[name].as<std::string>());
        if (!uri.success) {
            return Result<std::optional<Uri>>::failure(uri.kind, "--" + name + ": " + uri.error);
        }
        return Result<std::optional<Uri>>::ok(std::move(uri.value));
    }

    Result<std::optional<Time>> optional_time_option(const po::variables_map &vm, const std::string &name) {
        if (!vm.count(name)) {
            return Result<std::optional<Time>>::ok(std::nullopt);
        }
        auto time = parse_time(vm[name].as<std::string>());
        if (!time.success) {
            return Result<std::optional<Time>>::failure(time.kind, "--" + name + ": " + time.error);
        }
        return Result<std::optional<Time>>::ok(time.value);
    }

    std::vector<std::string> list_option(const po::variables_map &vm, const std::string &name) {
        if (!vm.count(name)) {
            return {};
        }
        return vm[name].as<std::vector<std::string>>();
    }

    Result<object::ValidityRequest> validity_options(const po::variables_map &vm) {
        auto not_before = optional_time_option(vm, "not-before");
        if (!not_before.success) {
            return not_before.forward<object::ValidityRequest>();
        }
        auto not_after = optional_time_option(vm, "not-after");
        if (!not_after.success) {
            return not_after.forward<object::ValidityRequest>();
        }
        auto days = optional_days(vm, "days");
        return Result<object::ValidityRequest>::ok(
            object::ValidityRequest{not_before.value, not_after.value, days});
    }

    Result<object::UpdateRequest> update_options(const po::variables_map &vm) {
        auto this_update = optional_time_option(vm, "this-update");
        if (!this_update.success) {
            return this_update.forward<object::UpdateRequest>();
        }
        auto next_update = optional_time_option(vm, "next-update");
        if (!next_update.success) {
            return next_update.forward<object::UpdateRequest>();
        }
        auto next_days = optional_days(vm, "next-days");
        return Result<object::UpdateRequest>::ok(
            object::UpdateRequest{this_update.value, next_update.value, next_days});
    }

} // namespace mkrpki::tools
