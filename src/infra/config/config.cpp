#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace fsort::infra {

void Config::merge_with(const Config& other) {
    if (other.threads) threads = other.threads;
    if (other.timeout_seconds) timeout_seconds = other.timeout_seconds;
    if (other.verify) verify = true;
    if (other.progress) progress = true;
    if (other.quiet) quiet = true;
    if (other.verbose) verbose = true;
}

namespace {

auto read_positive(const YAML::Node& node, std::string_view key) -> Result<std::uint32_t> {
    const auto value = node.as<long long>();
    if (value < 1 || value > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(make_error(ErrorCode::ConfigLoad,
            fmt::format("'{}' must be a positive integer, got {}", key, value)));
    }
    return static_cast<std::uint32_t>(value);
}

// categories:
//   Documents: [pdf, doc]
//   Images: png           <- одиночное расширение тоже допустимо
auto read_categories(const YAML::Node& node, const std::string& default_category,
                     const std::string& origin) -> Result<CategoryMap>
{
    if (!node.IsMap()) {
        return std::unexpected(make_error(ErrorCode::ConfigLoad,
            fmt::format("{}: 'categories' must be a mapping of category -> extensions", origin)));
    }

    CategoryMap::Entries entries;
    auto add = [&](const std::string& category, const std::string& raw) {
        auto ext = normalize_extension(raw);
        if (ext.empty()) {
            spdlog::warn("{}: empty extension in category '{}' ignored", origin, category);
            return;
        }
        auto [it, inserted] = entries.emplace(ext, category);
        if (!inserted && it->second != category) {
            spdlog::warn("{}: extension '{}' already mapped to '{}', ignoring '{}'",
                         origin, ext, it->second, category);
        }
    };

    for (const auto& item : node) {
        const auto category = item.first.as<std::string>();
        if (!is_valid_category_name(category)) {
            return std::unexpected(make_error(ErrorCode::ConfigLoad,
                fmt::format("{}: invalid category name '{}'", origin, category)));
        }

        const auto& extensions = item.second;
        if (extensions.IsSequence()) {
            for (const auto& ext : extensions) {
                add(category, ext.as<std::string>());
            }
        } else if (extensions.IsScalar()) {
            add(category, extensions.as<std::string>());
        } else if (!extensions.IsNull()) {
            return std::unexpected(make_error(ErrorCode::ConfigLoad,
                fmt::format("{}: category '{}' must list extensions", origin, category)));
        }
    }

    return CategoryMap{std::move(entries), default_category};
}

} // namespace

auto parse_config(const std::string& yaml_text, const std::string& origin) -> Result<Config> {
    try {
        YAML::Node config = YAML::Load(yaml_text);
        Config cfg{};

        if (config.IsNull()) {
            spdlog::warn("{} is empty, using built-in categories", origin);
            return cfg;
        }
        if (!config.IsMap()) {
            return std::unexpected(make_error(ErrorCode::ConfigLoad,
                fmt::format("{}: top level must be a mapping", origin)));
        }

        if (config["threads"]) {
            auto threads = read_positive(config["threads"], "threads");
            if (!threads) return std::unexpected(std::move(threads.error()));
            cfg.threads = *threads;
        }
        if (config["timeout_seconds"]) {
            auto timeout = read_positive(config["timeout_seconds"], "timeout_seconds");
            if (!timeout) return std::unexpected(std::move(timeout.error()));
            cfg.timeout_seconds = *timeout;
        }
        if (config["verify"]) cfg.verify = config["verify"].as<bool>();
        if (config["preserve_metadata"]) cfg.preserve_metadata = config["preserve_metadata"].as<bool>();

        std::string default_category(kDefaultCategory);
        if (config["default_category"]) {
            default_category = config["default_category"].as<std::string>();
            if (!is_valid_category_name(default_category)) {
                return std::unexpected(make_error(ErrorCode::ConfigLoad,
                    fmt::format("{}: invalid default_category '{}'", origin, default_category)));
            }
        }

        CategoryMap categories{{}, default_category};
        if (config["categories"]) {
            auto parsed = read_categories(config["categories"], default_category, origin);
            if (!parsed) return std::unexpected(std::move(parsed.error()));
            categories = std::move(*parsed);
        }

        if (categories.empty()) {
            spdlog::warn("{} defines no categories, using built-in mappings", origin);
            categories = CategoryMap{builtin_category_map().entries(), default_category};
        }
        cfg.categories = std::move(categories);

        spdlog::debug("Loaded config from {}", origin);
        return cfg;

    } catch (const YAML::Exception& e) {
        return std::unexpected(make_error(ErrorCode::ConfigLoad,
            fmt::format("Failed to parse {}: {}", origin, e.what())));
    }
}

auto write_default_config(const std::filesystem::path& path) -> VoidResult {
    YAML::Emitter out;
    out << YAML::Comment("fsort configuration: extension -> category rules");
    out << YAML::BeginMap;
    out << YAML::Key << "default_category" << YAML::Value << std::string(kDefaultCategory);
    out << YAML::Key << "threads" << YAML::Value << kDefaultThreads;
    out << YAML::Key << "timeout_seconds" << YAML::Value << kDefaultTimeoutSeconds;
    out << YAML::Key << "verify" << YAML::Value << false;
    out << YAML::Key << "preserve_metadata" << YAML::Value << true;
    out << YAML::Key << "categories" << YAML::Value << YAML::BeginMap;
    for (const auto& [category, extensions] : builtin_category_groups()) {
        out << YAML::Key << category << YAML::Value << YAML::Flow << extensions;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    std::ofstream ofs(path);
    if (!ofs) {
        return std::unexpected(make_error(ErrorCode::ConfigLoad,
            fmt::format("Cannot create {}", path.string())));
    }
    ofs << out.c_str() << '\n';
    if (!ofs) {
        return std::unexpected(make_error(ErrorCode::ConfigLoad,
            fmt::format("Cannot write {}", path.string())));
    }
    return {};
}

auto load_config_from_file(const std::filesystem::path& path) -> Result<Config> {
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::ConfigLoad,
            fmt::format("Cannot access {}: {}", path.string(), ec.message())));
    }

    if (!exists) {
        spdlog::info("Config file not found. Creating default configuration at {}", path.string());
        if (auto written = write_default_config(path); !written) {
            spdlog::warn("{}; continuing with built-in categories", written.error().message);
        }
        return Config{};
    }

    std::ifstream ifs(path);
    if (!ifs) {
        return std::unexpected(make_error(ErrorCode::ConfigLoad,
            fmt::format("Cannot open {}", path.string())));
    }
    std::string text{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    if (ifs.bad()) {
        return std::unexpected(make_error(ErrorCode::ConfigLoad,
            fmt::format("Cannot read {}", path.string())));
    }

    return parse_config(text, path.string());
}

[[nodiscard]]
auto config_from_cli(const __CLI& args) -> Config {
    Config cfg{};
    cfg.threads = args.threads;
    cfg.timeout_seconds = args.timeout_seconds;
    cfg.verify = args.verify;
    cfg.progress = args.progress;
    cfg.quiet = args.quiet;
    cfg.verbose = args.verbose;
    return cfg;
}

} // namespace fsort::infra
