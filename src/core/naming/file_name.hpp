#pragma once

#include <string>
#include <string_view>

namespace fsort::core {

struct NameParts {
    std::string_view stem;
    std::string_view extension;   // с точкой: ".txt", или пусто
};

/// Делит имя по последней точке, если она не первая и не последняя.
///   "report.pdf"  -> {"report", ".pdf"}
///   "a.tar.gz"    -> {"a.tar", ".gz"}
///   ".bashrc"     -> {".bashrc", ""}
///   "archive."    -> {"archive.", ""}
[[nodiscard]] auto split_file_name(std::string_view name) -> NameParts;

/// Расширение без точки, регистр не меняется. "photo.JPG" -> "JPG".
[[nodiscard]] auto file_extension(std::string_view name) -> std::string_view;

[[nodiscard]] auto to_lower_ascii(std::string_view text) -> std::string;

} // namespace fsort::core
