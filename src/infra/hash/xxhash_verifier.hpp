#pragma once

#include <filesystem>
#include <expected>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace objcp::infra {

class XXHashVerifier {
public:
    // Вычисляет xxHash64 для файла
    static auto hash_file(const std::filesystem::path& path)
        -> Result<XXH64_hash_t>;

    // Сравнивает хеши двух файлов; ChecksumMismatch при расхождении
    static auto verify_files(const std::filesystem::path& src,
                             const std::filesystem::path& dst)
        -> VoidResult;

private:
    static constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace objcp::infra
