#include "xxhash_verifier.hpp"
#include <array>
#include <fmt/core.h>
#include <fstream>
#include <memory>

namespace fsort::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

} // namespace

auto file_digest(const std::filesystem::path& path) -> std::expected<XXH64_hash_t, Error> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error(ErrorCode::IoError,
            fmt::format("Cannot open {} for verification", path.string())));
    }

    std::unique_ptr<XXH64_state_t, StateDeleter> state(XXH64_createState());
    if (!state || XXH64_reset(state.get(), 0) == XXH_ERROR) {
        return std::unexpected(make_error(ErrorCode::IoError, "Cannot initialize xxHash64 state"));
    }

    // Файлы из Downloads обычно небольшие, 256 КБ хватает
    std::array<char, 256 * 1024> chunk{};
    while (in.read(chunk.data(), chunk.size()) || in.gcount() > 0) {
        XXH64_update(state.get(), chunk.data(), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            fmt::format("Read error while verifying {}", path.string())));
    }

    return XXH64_digest(state.get());
}

auto verify_copy(const std::filesystem::path& original,
                 const std::filesystem::path& copy) -> VoidResult
{
    const auto source_hash = file_digest(original);
    if (!source_hash) return std::unexpected(source_hash.error());

    const auto copy_hash = file_digest(copy);
    if (!copy_hash) return std::unexpected(copy_hash.error());

    if (*source_hash != *copy_hash) {
        return std::unexpected(make_error(ErrorCode::IoError,
            fmt::format("Copy of {} does not match the original ({:016x} != {:016x})",
                        original.string(), *source_hash, *copy_hash)));
    }
    return {};
}

} // namespace fsort::infra
