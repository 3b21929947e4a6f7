#include <mkrpki/object/manifest.hpp>

#include <array>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace mkrpki::object {

    namespace {

        std::string last_error() { return std::error_code(errno, std::generic_category()).message(); }

        bool is_ascii_name(const std::string &name) {
            if (name.empty()) {
                return false;
            }
            for (char c : name) {
                if (static_cast<unsigned char>(c) >= 0x80) {
                    return false;
                }
            }
            return true;
        }

    } // namespace

    Result<std::vector<FileAndHash>> list_files(const std::vector<std::filesystem::path> &paths,
                                                const crypto::DigestStream &digests,
                                                crypto::DigestAlgorithm algorithm) {
        using ListResult = Result<std::vector<FileAndHash>>;

        std::vector<FileAndHash> files;
        files.reserve(paths.size());
        for (const auto &path : paths) {
            errno = 0;
            std::ifstream file(path, std::ios::binary);
            if (!file) {
                return ListResult::failure(ErrorKind::Io, "Cannot open file " + path.string() + ": " + last_error());
            }

            std::error_code ec;
            if (std::filesystem::is_directory(path, ec)) {
                const auto why = std::make_error_code(std::errc::is_a_directory).message();
                return ListResult::failure(ErrorKind::Io, "Cannot read file " + path.string() + ": " + why);
            }

            const std::string name = path.filename().string();
            if (!is_ascii_name(name)) {
                return ListResult::failure(ErrorKind::InvalidFileName, "Illegal file name " + path.string() + ".");
            }

            auto digest = digests.start(algorithm);
            std::array<char, MANIFEST_READ_CHUNK> buffer{};
            while (file) {
                file.read(buffer.data(), buffer.size());
                const auto read = file.gcount();
                if (read > 0) {
                    digest->update(ByteSpan(reinterpret_cast<const uint8_t *>(buffer.data()),
                                            static_cast<size_t>(read)));
                }
            }
            if (file.bad()) {
                return ListResult::failure(ErrorKind::Io, "Cannot read file " + path.string() + ": " + last_error());
            }

            files.push_back(FileAndHash{name, digest->finish()});
        }
        return ListResult::ok(std::move(files));
    }

} // namespace mkrpki::object
