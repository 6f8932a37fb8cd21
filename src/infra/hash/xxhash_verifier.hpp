#pragma once

#include <filesystem>
#include <expected>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace fsort::infra {

// xxHash64 содержимого файла (seed 0)
[[nodiscard]] auto file_digest(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>;

/// Сверка копии с оригиналом перед удалением оригинала.
/// Расхождение -> IoError с именем исходного файла и обоими хешами.
[[nodiscard]] auto verify_copy(const std::filesystem::path& original,
                               const std::filesystem::path& copy) -> VoidResult;

} // namespace fsort::infra
