#include <mkrpki/io/files.hpp>

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace mkrpki::io {

    namespace {

        std::string last_error() { return std::error_code(errno, std::generic_category()).message(); }

    } // namespace

    Result<Bytes> read_binary(const std::filesystem::path &path) {
        errno = 0;
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<Bytes>::failure(ErrorKind::Io, "Failed to open file " + path.string() + ": " + last_error());
        }
        Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            return Result<Bytes>::failure(ErrorKind::Io, "Failed to read file " + path.string() + ": " + last_error());
        }
        return Result<Bytes>::ok(std::move(data));
    }

    Status write_binary(const std::filesystem::path &path, ByteSpan data) {
        errno = 0;
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Status::failure(ErrorKind::Io, "Failed to open file " + path.string() + ": " + last_error());
        }
        file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            return Status::failure(ErrorKind::Io, "Failed to write to file " + path.string() + ": " + last_error());
        }
        return ok_status();
    }

} // namespace mkrpki::io
