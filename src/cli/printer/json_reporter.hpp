#pragma once

#include <cstdio>
#include "../../core/controller/reporter.hpp"

namespace objcp::cli {

// Одна JSON-запись на строку в stdout (режим --json)
class JsonReporter final : public core::Reporter {
public:
    explicit JsonReporter(std::FILE* out = stdout);

    void transferred(const core::TransferUnit& unit) override;
    void failed(const core::TransferUnit& unit) override;
    void finished(const core::RunSummary& summary) override;

private:
    std::FILE* out_;
};

/// Запись об ошибке вне прогона (сессия, аргументы)
void print_json_error(const infra::Error& error, std::FILE* out = stdout);

} // namespace objcp::cli
