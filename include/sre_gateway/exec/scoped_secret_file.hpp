#pragma once

#include <sre_gateway/core/result.hpp>

#include <string>
#include <string_view>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// ScopedSecretFile — a uniquely named 0600 file holding secret material.
// The file is unlinked when the object is destroyed, on every exit path.
// ---------------------------------------------------------------------------
class ScopedSecretFile {
public:
    /// Creates `<dir>/<prefix>XXXXXX` (dir defaults to the system temp directory)
    /// and writes `content` to it.
    static Result<ScopedSecretFile, Error> Create(std::string_view content,
                                                  std::string_view prefix = "sre-secret-",
                                                  std::string_view dir = {});

    ~ScopedSecretFile();

    ScopedSecretFile(ScopedSecretFile&& other) noexcept;
    ScopedSecretFile& operator=(ScopedSecretFile&& other) noexcept;
    ScopedSecretFile(const ScopedSecretFile&) = delete;
    ScopedSecretFile& operator=(const ScopedSecretFile&) = delete;

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

private:
    explicit ScopedSecretFile(std::string path) : path_(std::move(path)) {}
    void Remove() noexcept;

    std::string path_;
};

} // namespace sre_gateway
