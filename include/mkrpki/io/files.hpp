#pragma once

#include <filesystem>

#include <mkrpki/core/result.hpp>
#include <mkrpki/der/asn1_common.hpp>

namespace mkrpki::io {

    Result<Bytes> read_binary(const std::filesystem::path &path);

    // Creates or truncates 'path'. Callers pass only complete encodings.
    Status write_binary(const std::filesystem::path &path, ByteSpan data);

} // namespace mkrpki::io
