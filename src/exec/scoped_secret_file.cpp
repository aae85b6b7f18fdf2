#include <sre_gateway/exec/scoped_secret_file.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace sre_gateway {

namespace {

Error MakeSecretError(const std::string& message) {
    return Error{"ScopedSecretFile", message, std::nullopt, ErrorCategory::Internal};
}

std::string TempDir() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    return ec ? std::string("/tmp") : dir.string();
}

} // anonymous namespace

Result<ScopedSecretFile, Error> ScopedSecretFile::Create(std::string_view content,
                                                         std::string_view prefix,
                                                         std::string_view dir) {
    std::string base = dir.empty() ? TempDir() : std::string(dir);
    std::string templ = base + "/" + std::string(prefix) + "XXXXXX";
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');

    // mkstemp creates the file with mode 0600.
    int fd = ::mkstemp(buffer.data());
    if (fd < 0) {
        return Result<ScopedSecretFile, Error>::Err(
            MakeSecretError("mkstemp in " + base + " failed: " + std::strerror(errno)));
    }
    ScopedSecretFile file{std::string(buffer.data())};
    ::fchmod(fd, S_IRUSR | S_IWUSR);

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = std::strerror(errno);
            ::close(fd);
            return Result<ScopedSecretFile, Error>::Err(
                MakeSecretError("write to " + file.Path() + " failed: " + reason));
        }
        written += static_cast<size_t>(n);
    }
    if (::close(fd) != 0) {
        return Result<ScopedSecretFile, Error>::Err(
            MakeSecretError("close of " + file.Path() + " failed: " + std::strerror(errno)));
    }
    return Result<ScopedSecretFile, Error>::Ok(std::move(file));
}

ScopedSecretFile::~ScopedSecretFile() {
    Remove();
}

ScopedSecretFile::ScopedSecretFile(ScopedSecretFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedSecretFile& ScopedSecretFile::operator=(ScopedSecretFile&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScopedSecretFile::Remove() noexcept {
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace sre_gateway
