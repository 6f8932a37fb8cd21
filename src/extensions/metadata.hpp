// include/fsort/extensions/metadata.hpp
#pragma once

#include <filesystem>
#include "../infra/error_handler/error.hpp"

namespace fsort::extensions {

// Переносит время изменения и права src -> dst (после копирования между ФС)
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>;

} // namespace fsort::extensions
