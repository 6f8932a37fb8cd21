// metadata.cpp
#include <filesystem>
#include <expected>
#include <fmt/core.h>
#include "metadata.hpp"

namespace fsort::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>
{
    std::error_code ec;

    // Временные метки
    auto time = std::filesystem::last_write_time(src, ec);
    if (!ec) {
        std::filesystem::last_write_time(dst, time, ec);
    }
    if (ec) {
        return std::unexpected(infra::make_io_error(ec,
                             fmt::format("Cannot copy modification time to {}", dst.string())));
    }

    // Права (только POSIX)
#ifndef _WIN32
    auto perms = std::filesystem::status(src, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(dst, perms, ec);
    }
    if (ec) {
        return std::unexpected(infra::make_io_error(ec,
                             fmt::format("Cannot copy permissions to {}", dst.string())));
    }
#endif

    return {};
}

} // namespace fsort::extensions
