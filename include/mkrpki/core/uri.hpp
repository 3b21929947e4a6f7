#pragma once

#include <string>
#include <string_view>

#include <mkrpki/core/result.hpp>

namespace mkrpki {

    enum class UriScheme { Rsync, Https };

    // An absolute rsync:// or https:// URI as carried in certificate access descriptions and TALs.
    class Uri {
      public:
        Uri() = default;

        static Result<Uri> parse(std::string_view text, UriScheme scheme);
        static Result<Uri> parse_rsync(std::string_view text) { return parse(text, UriScheme::Rsync); }
        static Result<Uri> parse_https(std::string_view text) { return parse(text, UriScheme::Https); }

        [[nodiscard]] UriScheme scheme() const noexcept { return scheme_; }
        [[nodiscard]] const std::string &str() const noexcept { return text_; }

        bool operator==(const Uri &other) const = default;

      private:
        Uri(UriScheme scheme, std::string text) : scheme_(scheme), text_(std::move(text)) {}

        UriScheme scheme_{UriScheme::Rsync};
        std::string text_;
    };

} // namespace mkrpki
