#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>

namespace fsort::core {

using ExistsProbe = std::function<bool(const std::filesystem::path&)>;

/// Свободный путь для desired.
///
/// Если desired не занят, возвращается он же. Иначе перебирается
/// stem_1.ext, stem_2.ext, ... и возвращается первый, для которого
/// exists() вернул false. Состояние перебора - только счётчик.
///
/// Проверка и последующий захват пути не атомарны: вызывающий обязан
/// держать блокировку каталога назначения до завершения перемещения.
[[nodiscard]] auto resolve_conflict(const std::filesystem::path& desired,
                                    const ExistsProbe& exists) -> std::filesystem::path;

/// Кандидат с номером n: "notes.txt", 2 -> "notes_2.txt"
[[nodiscard]] auto numbered_candidate(const std::filesystem::path& desired,
                                      std::uint64_t n) -> std::filesystem::path;

} // namespace fsort::core
