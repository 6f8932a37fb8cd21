#include "conflict_resolver.hpp"
#include "../naming/file_name.hpp"

#include <fmt/core.h>
#include <string>

namespace fsort::core {

auto numbered_candidate(const std::filesystem::path& desired, std::uint64_t n)
    -> std::filesystem::path
{
    const auto name = desired.filename().string();
    const auto [stem, extension] = split_file_name(name);
    return desired.parent_path() / fmt::format("{}_{}{}", stem, n, extension);
}

auto resolve_conflict(const std::filesystem::path& desired, const ExistsProbe& exists)
    -> std::filesystem::path
{
    if (!exists(desired)) {
        return desired;
    }

    for (std::uint64_t n = 1;; ++n) {
        auto candidate = numbered_candidate(desired, n);
        if (!exists(candidate)) {
            return candidate;
        }
    }
}

} // namespace fsort::core
