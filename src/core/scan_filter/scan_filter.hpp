#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace fsort::core {

/// Причина отказа для элемента каталога или nullopt, если элемент подходит.
///
/// Подходят только обычные файлы (ссылки разыменовываются: ссылка на файл
/// подходит, на каталог или висячая - нет). Скрытые файлы отклоняются.
/// Если атрибуты не удалось прочитать, элемент отклоняется.
[[nodiscard]] auto rejection_reason(const std::filesystem::directory_entry& entry)
    -> std::optional<std::string>;

[[nodiscard]] inline auto admit(const std::filesystem::directory_entry& entry) -> bool {
    return !rejection_reason(entry).has_value();
}

} // namespace fsort::core
