#pragma once

#include <filesystem>
#include <expected>
#include <functional>
#include <string>
#include <system_error>
#include "../infra/error_handler/error.hpp"

namespace fsort::adapters::fs {

enum class MoveMethod {
    Rename,      // атомарный rename в пределах одной ФС
    CopyDelete   // ФС разные: копия, затем удаление исходника
};

// Проверка копии перед удалением исходника
using CopyVerifier = std::function<infra::VoidResult(const std::filesystem::path& original,
                                                     const std::filesystem::path& copy)>;

struct MoveOptions {
    bool verify = false;            // сверка копии перед удалением исходника
    bool preserve_metadata = true;  // mtime и права для копии
    CopyVerifier verifier;          // пустой: infra::verify_copy (xxHash64)
};

struct MoveResult {
    MoveMethod method = MoveMethod::Rename;
    bool source_removed = true;     // false: данные перенесены, но исходник остался
    std::string cleanup_error;
};

/// Занят ли путь (любым объектом, включая висячую ссылку).
/// Ошибка, отличная от "нет такого файла", возвращается как Error.
[[nodiscard]] auto path_occupied(const std::filesystem::path& path)
    -> std::expected<bool, infra::Error>;

/// Скрыт ли файл: имя начинается с '.', либо платформенный атрибут
/// (FILE_ATTRIBUTE_HIDDEN/SYSTEM на Windows, UF_HIDDEN на macOS).
[[nodiscard]] auto is_hidden(const std::filesystem::path& path)
    -> std::expected<bool, infra::Error>;

/// rename без перезаписи: если dst уже существует -> errc::file_exists.
/// Linux: renameat2(RENAME_NOREPLACE). Если ФС его не поддерживает,
/// проверка существования + rename (вызывающий держит блокировку каталога).
[[nodiscard]] auto rename_no_replace(const std::filesystem::path& src,
                                     const std::filesystem::path& dst) -> std::error_code;

/// Копирование с эксклюзивным созданием dst (O_EXCL). Символическая ссылка
/// копируется как ссылка. Недописанная копия удаляется.
[[nodiscard]] auto copy_file_exclusive(const std::filesystem::path& src,
                                       const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>;

/// Перемещение между ФС: copy_file_exclusive, сверка (options.verify),
/// метаданные, удаление исходника. Копия, не прошедшая сверку, удаляется.
/// Неудача удаления исходника возвращается как source_removed = false.
[[nodiscard]] auto copy_then_remove(const std::filesystem::path& src,
                                    const std::filesystem::path& dst,
                                    const MoveOptions& options = {})
    -> std::expected<MoveResult, infra::Error>;

/// Перемещение файла. Пытается rename_no_replace, при EXDEV переходит к
/// copy_then_remove. Ошибка удаления исходника после
/// удачной копии не считается ошибкой перемещения (см. MoveResult::source_removed).
[[nodiscard]] auto move_file(const std::filesystem::path& src,
                             const std::filesystem::path& dst,
                             const MoveOptions& options = {})
    -> std::expected<MoveResult, infra::Error>;

} // namespace fsort::adapters::fs
