#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

// Removes the file it names when it goes out of scope.
class ScopedTempFile {
public:
    ScopedTempFile() = default;
    explicit ScopedTempFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedTempFile();

    ScopedTempFile(ScopedTempFile&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }
    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string string() const { return path_.string(); }

private:
    void remove();

    std::filesystem::path path_;
};

// Names, writes and sweeps the per-request audio files.
class TempFileManager {
public:
    TempFileManager(std::filesystem::path dir, std::string prefix);

    // Throws FilesystemError when the bytes cannot be written.
    ScopedTempFile write(std::span<const uint8_t> bytes, const std::string& extension);

    // A fresh name for a file another process will create (e.g. ffmpeg output).
    ScopedTempFile reserve(const std::string& extension);

    // Deletes prefixed files last modified more than `max_age` ago.
    // Returns the number of files removed.
    size_t sweep_orphans(std::chrono::seconds max_age);

private:
    std::filesystem::path next_path(const std::string& extension);

    std::filesystem::path dir_;
    std::string prefix_;
};
