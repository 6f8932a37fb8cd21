#include "scan_filter.hpp"
#include "../../adapters/fs.hpp"

#include <fmt/core.h>

namespace fsort::core {

auto rejection_reason(const std::filesystem::directory_entry& entry)
    -> std::optional<std::string>
{
    std::error_code ec;
    const auto status = entry.status(ec);
    if (ec) {
        return fmt::format("cannot stat: {}", ec.message());
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::string("not a regular file");
    }

    auto hidden = adapters::fs::is_hidden(entry.path());
    if (!hidden) {
        return fmt::format("cannot read attributes: {}", hidden.error().message);
    }
    if (*hidden) {
        return std::string("hidden");
    }
    return std::nullopt;
}

} // namespace fsort::core
