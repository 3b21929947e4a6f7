#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace mkrpki {

    enum class ErrorKind { None = 0, Configuration, Parse, KeyDecode, Io, InvalidFileName, Signing, Encoding };

    inline std::string_view error_kind_name(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::None:
            return "no error";
        case ErrorKind::Configuration:
            return "configuration error";
        case ErrorKind::Parse:
            return "parse error";
        case ErrorKind::KeyDecode:
            return "key decode error";
        case ErrorKind::Io:
            return "I/O error";
        case ErrorKind::InvalidFileName:
            return "invalid file name";
        case ErrorKind::Signing:
            return "signing error";
        case ErrorKind::Encoding:
            return "encoding error";
        }
        return "unknown error";
    }

    template <typename T> struct Result {
        bool success{};
        T value{};
        ErrorKind kind{ErrorKind::None};
        std::string error{};

        static Result<T> failure(ErrorKind kind, std::string message) {
            return Result<T>{false, {}, kind, std::move(message)};
        }

        static Result<T> ok(T value) { return Result<T>{true, std::move(value), ErrorKind::None, {}}; }

        // Re-types a failure so it can be returned from a caller with a different value type.
        template <typename U> [[nodiscard]] Result<U> forward() const { return Result<U>::failure(kind, error); }
    };

    struct Unit {};

    using Status = Result<Unit>;

    inline Status ok_status() { return Status::ok(Unit{}); }

} // namespace mkrpki
