#include "file_name.hpp"

#include <algorithm>

namespace fsort::core {

auto split_file_name(std::string_view name) -> NameParts {
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot == name.size() - 1) {
        return {name, {}};
    }
    return {name.substr(0, dot), name.substr(dot)};
}

auto file_extension(std::string_view name) -> std::string_view {
    auto ext = split_file_name(name).extension;
    if (!ext.empty()) ext.remove_prefix(1);
    return ext;
}

auto to_lower_ascii(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return out;
}

} // namespace fsort::core
