#pragma once

#include "streamcat/ddl/ddl_command.hpp"
#include "streamcat/ddl/ddl_telemetry.hpp"

#include <string>

namespace streamcat::ddl {

class CatalogManager;

// Routes any DDL request to the catalog manager and keeps per-verb telemetry.
class DdlCommandDispatcher final {
public:
    struct Config final {
        CatalogManager* manager = nullptr;
        DdlTelemetryRegistry* telemetry_registry = nullptr;
        std::string telemetry_identifier;
    };

    explicit DdlCommandDispatcher(Config config);
    ~DdlCommandDispatcher();

    DdlCommandDispatcher(const DdlCommandDispatcher&) = delete;
    DdlCommandDispatcher& operator=(const DdlCommandDispatcher&) = delete;
    DdlCommandDispatcher(DdlCommandDispatcher&&) = delete;
    DdlCommandDispatcher& operator=(DdlCommandDispatcher&&) = delete;

    [[nodiscard]] DdlCommandResponse dispatch(const DdlCommand& command);
    [[nodiscard]] const DdlCommandTelemetry& telemetry() const noexcept { return telemetry_; }

private:
    [[nodiscard]] DdlCommandResponse route(const DdlCommand& command);
    [[nodiscard]] DdlVerb command_verb(const DdlCommand& command) const noexcept;

    Config config_{};
    DdlCommandTelemetry telemetry_{};
    DdlTelemetryRegistry* registry_ = nullptr;
    std::string registry_identifier_{};
};

}  // namespace streamcat::ddl
