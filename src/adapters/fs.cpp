#include "fs.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <vector>

#include "../extensions/metadata.hpp"
#include "../infra/hash/xxhash_verifier.hpp"

#ifdef _WIN32
    #include <windows.h>
#else
    #include <cerrno>
    #include <cstdio>
    #include <fcntl.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

namespace fsort::adapters::fs {

namespace {

#ifndef _WIN32
// Владелец дескриптора: закрывает при выходе из области видимости
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { if (fd_ != -1) ::close(fd_); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ != -1; }

    // close() для файла назначения: ошибка close означает потерю данных
    [[nodiscard]] int release_and_close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

auto last_errno() -> std::error_code {
    return {errno, std::generic_category()};
}

// Копирование содержимого, EINTR и частичная запись учитываются
auto copy_contents(int src_fd, int dst_fd) -> std::error_code {
    constexpr size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);

    for (;;) {
        ssize_t bytes_read = ::read(src_fd, buffer.data(), buffer_size);
        if (bytes_read == 0) return {};
        if (bytes_read < 0) {
            if (errno == EINTR) continue;
            return last_errno();
        }

        const char* out = buffer.data();
        auto remaining = static_cast<size_t>(bytes_read);
        while (remaining > 0) {
            ssize_t written = ::write(dst_fd, out, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                return last_errno();
            }
            out += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}
#endif

} // namespace

auto path_occupied(const std::filesystem::path& path)
    -> std::expected<bool, infra::Error>
{
    std::error_code ec;
    auto status = std::filesystem::symlink_status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return false;
        }
        return std::unexpected(infra::make_io_error(ec,
            fmt::format("Cannot query {}", path.string())));
    }
    return std::filesystem::exists(status);
}

auto is_hidden(const std::filesystem::path& path)
    -> std::expected<bool, infra::Error>
{
    const auto name = path.filename().string();
    if (!name.empty() && name.front() == '.') {
        return true;
    }

#ifdef _WIN32
    const DWORD attrs = ::GetFileAttributesW(path.c_str());
    if (attrs == INVALID_FILE_ATTRIBUTES) {
        return std::unexpected(infra::make_io_error(
            std::error_code(static_cast<int>(::GetLastError()), std::system_category()),
            fmt::format("Cannot read attributes of {}", path.string())));
    }
    return (attrs & (FILE_ATTRIBUTE_HIDDEN | FILE_ATTRIBUTE_SYSTEM)) != 0;
#elif defined(__APPLE__)
    struct stat sb;
    if (::lstat(path.c_str(), &sb) == -1) {
        return std::unexpected(infra::make_io_error(last_errno(),
            fmt::format("Cannot read attributes of {}", path.string())));
    }
    return (sb.st_flags & UF_HIDDEN) != 0;
#else
    // Linux: атрибута "скрытый" нет, но файл должен быть доступен для lstat
    struct stat sb;
    if (::lstat(path.c_str(), &sb) == -1) {
        return std::unexpected(infra::make_io_error(last_errno(),
            fmt::format("Cannot read attributes of {}", path.string())));
    }
    return false;
#endif
}

auto rename_no_replace(const std::filesystem::path& src,
                       const std::filesystem::path& dst) -> std::error_code
{
#ifdef _WIN32
    // Без MOVEFILE_REPLACE_EXISTING существующий dst не перезаписывается
    if (::MoveFileExW(src.c_str(), dst.c_str(), 0)) {
        return {};
    }
    const DWORD err = ::GetLastError();
    if (err == ERROR_ALREADY_EXISTS || err == ERROR_FILE_EXISTS) {
        return std::make_error_code(std::errc::file_exists);
    }
    if (err == ERROR_NOT_SAME_DEVICE) {
        return std::make_error_code(std::errc::cross_device_link);
    }
    return {static_cast<int>(err), std::system_category()};
#else
  #ifdef __linux__
    if (::renameat2(AT_FDCWD, src.c_str(), AT_FDCWD, dst.c_str(), RENAME_NOREPLACE) == 0) {
        return {};
    }
    if (errno != EINVAL && errno != ENOSYS) {
        return last_errno();
    }
    spdlog::debug("RENAME_NOREPLACE unsupported for {}, using checked rename", dst.string());
  #endif
    std::error_code ec;
    auto status = std::filesystem::symlink_status(dst, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return ec;
    }
    if (!ec && std::filesystem::exists(status)) {
        return std::make_error_code(std::errc::file_exists);
    }
    ec.clear();
    std::filesystem::rename(src, dst, ec);
    return ec;
#endif
}

auto copy_file_exclusive(const std::filesystem::path& src,
                         const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>
{
    std::error_code ec;
    if (std::filesystem::is_symlink(std::filesystem::symlink_status(src, ec))) {
        std::filesystem::copy_symlink(src, dst, ec);
        if (ec) {
            return std::unexpected(infra::make_io_error(ec,
                fmt::format("Cannot copy link {} -> {}", src.string(), dst.string())));
        }
        return {};
    }

#ifdef _WIN32
    std::filesystem::copy_file(src, dst, std::filesystem::copy_options::none, ec);
    if (ec) {
        std::error_code cleanup;
        if (ec != std::errc::file_exists) std::filesystem::remove(dst, cleanup);
        return std::unexpected(infra::make_io_error(ec,
            fmt::format("Cannot copy {} -> {}", src.string(), dst.string())));
    }
    return {};
#else
    FileDescriptor src_fd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!src_fd.valid()) {
        return std::unexpected(infra::make_io_error(last_errno(),
            fmt::format("Cannot open source {}", src.string())));
    }

    struct stat sb;
    if (::fstat(src_fd.get(), &sb) == -1) {
        return std::unexpected(infra::make_io_error(last_errno(),
            fmt::format("fstat failed for {}", src.string())));
    }

    FileDescriptor dst_fd(::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                                 sb.st_mode & 0777));
    if (!dst_fd.valid()) {
        return std::unexpected(infra::make_io_error(last_errno(),
            fmt::format("Cannot create destination {}", dst.string())));
    }

    ec = copy_contents(src_fd.get(), dst_fd.get());
    if (!ec && dst_fd.release_and_close() == -1) {
        ec = last_errno();
    }
    if (ec) {
        // Мы создали dst через O_EXCL, значит он наш и его можно удалить
        std::error_code cleanup;
        std::filesystem::remove(dst, cleanup);
        if (cleanup) {
            spdlog::warn("Cannot remove partial copy {}: {}", dst.string(), cleanup.message());
        }
        return std::unexpected(infra::make_io_error(ec,
            fmt::format("Copy {} -> {} failed", src.string(), dst.string())));
    }
    return {};
#endif
}

auto move_file(const std::filesystem::path& src,
               const std::filesystem::path& dst,
               const MoveOptions& options)
    -> std::expected<MoveResult, infra::Error>
{
    auto ec = rename_no_replace(src, dst);
    if (!ec) {
        return MoveResult{};
    }
    if (ec != std::errc::cross_device_link) {
        return std::unexpected(infra::make_io_error(ec,
            fmt::format("Cannot move {} -> {}", src.string(), dst.string())));
    }

    spdlog::debug("{} and {} are on different filesystems, copying", src.string(), dst.string());
    return copy_then_remove(src, dst, options);
}

auto copy_then_remove(const std::filesystem::path& src,
                      const std::filesystem::path& dst,
                      const MoveOptions& options)
    -> std::expected<MoveResult, infra::Error>
{
    if (auto copied = copy_file_exclusive(src, dst); !copied) {
        return std::unexpected(std::move(copied.error()));
    }

    std::error_code link_ec;
    const bool is_link = std::filesystem::is_symlink(std::filesystem::symlink_status(src, link_ec));

    if (options.verify && !is_link) {
        auto verified = options.verifier ? options.verifier(src, dst) : infra::verify_copy(src, dst);
        if (!verified) {
            // Исходник не тронут, копию убираем
            std::error_code cleanup;
            std::filesystem::remove(dst, cleanup);
            if (cleanup) {
                spdlog::warn("Cannot remove unverified copy {}: {}", dst.string(), cleanup.message());
            }
            return std::unexpected(std::move(verified.error()));
        }
    }

    // Копируем метаданные после успешной верификации
    if (options.preserve_metadata && !is_link) {
        auto metadata_res = extensions::copy_metadata(src, dst);
        if (!metadata_res) {
            spdlog::warn("Failed to copy metadata for {}: {}",
                         src.string(), metadata_res.error().message);
        }
    }

    MoveResult result{.method = MoveMethod::CopyDelete};
    std::error_code rm_ec;
    std::filesystem::remove(src, rm_ec);
    if (rm_ec) {
        result.source_removed = false;
        result.cleanup_error = rm_ec.message();
    }
    return result;
}

} // namespace fsort::adapters::fs
