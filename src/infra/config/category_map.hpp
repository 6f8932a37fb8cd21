#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fsort::infra {

inline constexpr std::string_view kDefaultCategory = "Others";

/// Неизменяемое отображение "расширение -> категория".
/// Расширения хранятся в нижнем регистре и без ведущей точки.
/// Загружается один раз до начала сканирования и дальше только читается,
/// поэтому его можно разделять между рабочими потоками без блокировок.
class CategoryMap {
public:
    using Entries = std::map<std::string, std::string, std::less<>>;

    CategoryMap() : default_category_(kDefaultCategory) {}
    CategoryMap(Entries entries, std::string default_category)
        : entries_(std::move(entries))
        , default_category_(std::move(default_category)) {}

    // extension должен быть уже в нижнем регистре
    [[nodiscard]] auto lookup_category(std::string_view extension) const
        -> std::optional<std::string>;

    [[nodiscard]] auto default_category() const -> const std::string& { return default_category_; }
    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }
    [[nodiscard]] auto entries() const -> const Entries& { return entries_; }

    // Различные имена категорий в алфавитном порядке
    [[nodiscard]] auto categories() const -> std::vector<std::string>;

private:
    Entries entries_;
    std::string default_category_;
};

/// Встроенный набор категорий: используется для создания config.yaml
/// и как запасной вариант, если в файле не оказалось ни одного правила.
[[nodiscard]] auto builtin_category_groups()
    -> const std::vector<std::pair<std::string, std::vector<std::string>>>&;

[[nodiscard]] auto builtin_category_map() -> CategoryMap;

/// Нормализует расширение из конфига: обрезает пробелы и ведущую точку,
/// переводит в нижний регистр. ".PDF " -> "pdf".
[[nodiscard]] auto normalize_extension(std::string_view raw) -> std::string;

/// Имя категории становится именем подкаталога, поэтому допускается
/// только один компонент пути: не пустой, не "." и "..", без разделителей.
[[nodiscard]] auto is_valid_category_name(std::string_view name) -> bool;

} // namespace fsort::infra
