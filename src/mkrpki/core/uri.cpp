#include <mkrpki/core/uri.hpp>

namespace mkrpki {

    Result<Uri> Uri::parse(std::string_view text, UriScheme scheme) {
        const std::string_view prefix = scheme == UriScheme::Rsync ? "rsync://" : "https://";
        const std::string kind = scheme == UriScheme::Rsync ? "rsync" : "HTTPS";

        auto invalid = [&](std::string_view why) {
            return Result<Uri>::failure(ErrorKind::Parse,
                                        "Invalid " + kind + " URI '" + std::string(text) + "': " + std::string(why));
        };

        if (text.size() < prefix.size()) {
            return invalid("missing scheme");
        }
        for (size_t i = 0; i < prefix.size(); ++i) {
            const char c = text[i];
            const char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
            if (lower != prefix[i]) {
                return invalid("expected " + std::string(prefix.substr(0, prefix.size() - 3)) + " scheme");
            }
        }

        for (char c : text) {
            const auto uc = static_cast<unsigned char>(c);
            if (uc <= 0x20 || uc >= 0x7F) {
                return invalid("contains whitespace or non-ASCII characters");
            }
        }

        const std::string_view rest = text.substr(prefix.size());
        const auto host_end = rest.find('/');
        const std::string_view host = rest.substr(0, host_end);
        if (host.empty()) {
            return invalid("missing host");
        }

        return Result<Uri>::ok(Uri(scheme, std::string(text)));
    }

} // namespace mkrpki
