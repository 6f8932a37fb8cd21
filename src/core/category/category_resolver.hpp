#pragma once

#include <string>
#include <string_view>
#include "../../infra/config/category_map.hpp"

namespace fsort::core {

/// Имя файла -> категория (имя подкаталога).
/// Без ввода-вывода; map живёт дольше резолвера и только читается.
class CategoryResolver {
public:
    explicit CategoryResolver(const infra::CategoryMap& map) : map_(map) {}

    [[nodiscard]] auto resolve(std::string_view file_name) const -> std::string;

    [[nodiscard]] auto default_category() const -> const std::string& { return map_.default_category(); }

private:
    const infra::CategoryMap& map_;
};

} // namespace fsort::core
