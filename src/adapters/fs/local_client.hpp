#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "../storage/storage_client.hpp"

namespace objcp::adapters::fs {

enum class CopyStrategy {
    Buffered,    // < 1 MB
    MMap,        // >= 1 MB
};

[[nodiscard]] auto select_strategy(std::uintmax_t file_size) -> CopyStrategy;

struct LocalClientOptions {
    std::map<std::string, std::filesystem::path> aliases; // alias -> корень
    bool verify = false;                                  // xxHash после копирования
};

// Локальная ФС как хранилище. Алиасы отображаются на корневые каталоги.
class LocalClient final : public StorageClient {
public:
    explicit LocalClient(LocalClientOptions options = {});

    [[nodiscard]] auto list(const Location& location, bool recursive,
                            std::stop_token stop, const ListVisitor& visit)
        -> infra::VoidResult override;

    [[nodiscard]] auto stat(const Location& location)
        -> infra::Result<ObjectInfo> override;

    [[nodiscard]] auto copy(const Location& source, const Location& target,
                            const Metadata& metadata,
                            const Metadata& user_metadata,
                            std::stop_token stop) -> infra::VoidResult override;

    [[nodiscard]] auto resolve(std::string_view url) const -> Location override;

    [[nodiscard]] auto to_path(const Location& location) const
        -> infra::Result<std::filesystem::path>;

private:
    LocalClientOptions options_;
};

} // namespace objcp::adapters::fs
