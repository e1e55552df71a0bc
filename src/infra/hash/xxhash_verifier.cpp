#include "xxhash_verifier.hpp"
#include <fstream>
#include <memory>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace objcp::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

} // namespace

auto XXHashVerifier::hash_file(const std::filesystem::path& path)
    -> Result<XXH64_hash_t>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::ObjectNotFound,
            fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    std::unique_ptr<XXH64_state_t, StateDeleter> state(XXH64_createState());
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }

    XXH64_reset(state.get(), 0); // seed = 0

    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        XXH64_update(state.get(), buffer.data(), static_cast<size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::StorageError,
            fmt::format("Error reading file: {}", path.string())));
    }

    return XXH64_digest(state.get());
}

auto XXHashVerifier::verify_files(const std::filesystem::path& src,
                                  const std::filesystem::path& dst)
    -> VoidResult
{
    auto src_hash = hash_file(src);
    if (!src_hash) {
        return std::unexpected(std::move(src_hash.error()));
    }

    auto dst_hash = hash_file(dst);
    if (!dst_hash) {
        return std::unexpected(std::move(dst_hash.error()));
    }

    if (*src_hash != *dst_hash) {
        spdlog::warn("Hash mismatch: {} (src: {:016x}) vs {} (dst: {:016x})",
                     src.string(), *src_hash,
                     dst.string(), *dst_hash);
        return std::unexpected(make_error(ErrorCode::ChecksumMismatch,
            fmt::format("Verification failed for {}", src.string())));
    }
    return {};
}

} // namespace objcp::infra
