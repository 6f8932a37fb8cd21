#include "category_resolver.hpp"
#include "../naming/file_name.hpp"

namespace fsort::core {

auto CategoryResolver::resolve(std::string_view file_name) const -> std::string {
    const auto extension = file_extension(file_name);
    if (extension.empty()) {
        return map_.default_category();
    }
    return map_.lookup_category(to_lower_ascii(extension)).value_or(map_.default_category());
}

} // namespace fsort::core
