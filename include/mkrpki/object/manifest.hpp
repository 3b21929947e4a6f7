#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <mkrpki/core/result.hpp>
#include <mkrpki/core/serial.hpp>
#include <mkrpki/crypto/digest.hpp>
#include <mkrpki/object/validity.hpp>

namespace mkrpki::object {

    struct FileAndHash {
        std::string name;
        Bytes hash;
    };

    inline constexpr size_t MANIFEST_READ_CHUNK = 4096;

    // Digests each file in the order given and names it by its final path segment.
    // Stops at the first file that cannot be opened or read (ErrorKind::Io) or whose
    // name is not ASCII (ErrorKind::InvalidFileName).
    Result<std::vector<FileAndHash>> list_files(const std::vector<std::filesystem::path> &paths,
                                                const crypto::DigestStream &digests,
                                                crypto::DigestAlgorithm algorithm);

    // eContent of an RPKI manifest (RFC 9286, 4.2).
    struct ManifestContent {
        Serial number;
        UpdatePeriod period;
        crypto::DigestAlgorithm algorithm{crypto::DigestAlgorithm::Sha256};
        std::vector<FileAndHash> files;
    };

} // namespace mkrpki::object
