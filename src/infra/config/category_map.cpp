#include "category_map.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace fsort::infra {

auto CategoryMap::lookup_category(std::string_view extension) const
    -> std::optional<std::string>
{
    if (auto it = entries_.find(extension); it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto CategoryMap::categories() const -> std::vector<std::string> {
    std::set<std::string> unique;
    for (const auto& [ext, category] : entries_) {
        unique.insert(category);
    }
    return {unique.begin(), unique.end()};
}

auto builtin_category_groups()
    -> const std::vector<std::pair<std::string, std::vector<std::string>>>&
{
    static const std::vector<std::pair<std::string, std::vector<std::string>>> groups{
        {"Documents",     {"pdf", "doc", "docx", "txt", "odt", "rtf"}},
        {"Images",        {"jpg", "jpeg", "png", "gif", "bmp", "svg", "webp"}},
        {"Videos",        {"mp4", "avi", "mkv", "mov", "wmv", "flv"}},
        {"Audio",         {"mp3", "wav", "flac", "aac", "ogg"}},
        {"Archives",      {"zip", "rar", "7z", "tar", "gz"}},
        {"Code",          {"java", "py", "js", "html", "css", "cpp", "c"}},
        {"Spreadsheets",  {"xls", "xlsx", "csv"}},
        {"Presentations", {"ppt", "pptx"}},
    };
    return groups;
}

auto builtin_category_map() -> CategoryMap {
    CategoryMap::Entries entries;
    for (const auto& [category, extensions] : builtin_category_groups()) {
        for (const auto& ext : extensions) {
            entries.emplace(ext, category);
        }
    }
    return CategoryMap{std::move(entries), std::string(kDefaultCategory)};
}

auto normalize_extension(std::string_view raw) -> std::string {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!raw.empty() && is_space(raw.front())) raw.remove_prefix(1);
    while (!raw.empty() && is_space(raw.back())) raw.remove_suffix(1);
    if (!raw.empty() && raw.front() == '.') raw.remove_prefix(1);

    std::string ext(raw);
    std::ranges::transform(ext, ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

auto is_valid_category_name(std::string_view name) -> bool {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\") == std::string_view::npos
        && name.find('\0') == std::string_view::npos;
}

} // namespace fsort::infra
