#include "temp_files.hpp"

#include "../engine_types.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <print>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;

ScopedTempFile::~ScopedTempFile() {
    remove();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScopedTempFile::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::println(stderr, "temp: failed to remove {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

TempFileManager::TempFileManager(fs::path dir, std::string prefix)
    : dir_(dir.empty() ? fs::temp_directory_path() : std::move(dir)),
      prefix_(std::move(prefix)) {}

fs::path TempFileManager::next_path(const std::string& extension) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return dir_ / std::format("{}{}-{:08x}{}", prefix_, ms, rng(), extension);
}

ScopedTempFile TempFileManager::write(std::span<const uint8_t> bytes, const std::string& extension) {
    std::error_code ec;
    fs::create_directories(dir_, ec);

    auto path = next_path(extension);
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw FilesystemError(std::format("cannot create {}: {}", path.string(), std::strerror(errno)));
    }
    ScopedTempFile guard(path);

    size_t total = 0;
    while (total < bytes.size()) {
        ssize_t n = ::write(fd, bytes.data() + total, bytes.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            throw FilesystemError(std::format("write to {} failed: {}", path.string(), std::strerror(saved)));
        }
        total += static_cast<size_t>(n);
    }

    if (::close(fd) < 0) {
        throw FilesystemError(std::format("close of {} failed: {}", path.string(), std::strerror(errno)));
    }
    return guard;
}

ScopedTempFile TempFileManager::reserve(const std::string& extension) {
    return ScopedTempFile(next_path(extension));
}

size_t TempFileManager::sweep_orphans(std::chrono::seconds max_age) {
    size_t removed = 0;
    auto now = fs::file_time_type::clock::now();

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(dir_, ec)) {
        auto name = entry.path().filename().string();
        if (!name.starts_with(prefix_)) continue;

        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;

        auto mtime = entry.last_write_time(entry_ec);
        if (entry_ec || now - mtime <= max_age) continue;

        if (fs::remove(entry.path(), entry_ec)) {
            removed++;
        } else if (entry_ec) {
            std::println(stderr, "temp: failed to remove orphan {}: {}", name, entry_ec.message());
        }
    }
    if (ec) {
        std::println(stderr, "temp: cannot scan {}: {}", dir_.string(), ec.message());
    }
    return removed;
}
