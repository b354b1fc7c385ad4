#include "io/source_file.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fwunpack {

Result SourceFile::Open(std::string path, SourceFile& out) {
    out.path_ = std::move(path);
    out.size_ = std::nullopt;

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result::FailErrno(
            errno, "Failed to open input: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return Result::FailErrno(
            errno, "Failed to stat input: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::FailErrno(EINVAL, "Input is not a regular file: " + out.path_);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);

    return Result::Ok();
}

std::optional<std::uint64_t> SourceFile::TotalSize() const { return size_; }

ssize_t SourceFile::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result SourceFile::Seek(std::uint64_t offset) {
    if (::lseek(fd_.Get(), static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1)) {
        return Result::FailErrno(errno,
                                 "Seek failed in " + path_ + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result SourceFile::ReadToEnd(std::vector<std::uint8_t>& out) {
    out.clear();
    if (size_) out.reserve(static_cast<size_t>(*size_));

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            return Result::FailErrno(errno,
                                     "Read failed in " + path_ + " (" + std::strerror(errno) + ")");
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

Result ReadFileToBuffer(const std::string& path, std::vector<std::uint8_t>& out) {
    SourceFile file;
    auto r = SourceFile::Open(path, file);
    if (!r.ok) return r;
    return file.ReadToEnd(out);
}

} // namespace fwunpack
