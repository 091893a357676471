#include "streamcat/ddl/ddl_dispatcher.hpp"

#include "streamcat/ddl/catalog_manager.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace streamcat::ddl {

DdlCommandDispatcher::DdlCommandDispatcher(Config config)
    : config_{std::move(config)}
{
    if (config_.manager == nullptr) {
        throw std::invalid_argument{"DdlCommandDispatcher requires a catalog manager"};
    }

    if (config_.telemetry_registry && !config_.telemetry_identifier.empty()) {
        registry_ = config_.telemetry_registry;
        registry_identifier_ = config_.telemetry_identifier;
        registry_->register_sampler(registry_identifier_, [this] { return telemetry_.snapshot(); });
    }
}

DdlCommandDispatcher::~DdlCommandDispatcher()
{
    if (registry_) {
        registry_->unregister_sampler(registry_identifier_);
    }
}

DdlVerb DdlCommandDispatcher::command_verb(const DdlCommand& command) const noexcept
{
    return static_cast<DdlVerb>(command.index());
}

DdlCommandResponse DdlCommandDispatcher::dispatch(const DdlCommand& command)
{
    const auto verb = command_verb(command);
    telemetry_.record_attempt(verb);

    const auto start = std::chrono::steady_clock::now();
    auto response = route(command);
    const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start).count();
    telemetry_.record_duration(verb, static_cast<std::uint64_t>(duration < 0 ? 0 : duration));

    if (response.success) {
        telemetry_.record_success(verb);
    } else {
        telemetry_.record_failure(verb, response.error);
    }
    return response;
}

DdlCommandResponse DdlCommandDispatcher::route(const DdlCommand& command)
{
    auto& manager = *config_.manager;
    return std::visit(
        [&manager](const auto& request) -> DdlCommandResponse {
            using Request = std::decay_t<decltype(request)>;
            if constexpr (std::is_same_v<Request, CreateDatabaseRequest>) {
                return manager.create_database(request);
            } else if constexpr (std::is_same_v<Request, DropDatabaseRequest>) {
                return manager.drop_database(request);
            } else if constexpr (std::is_same_v<Request, CreateSchemaRequest>) {
                return manager.create_schema(request);
            } else if constexpr (std::is_same_v<Request, DropSchemaRequest>) {
                return manager.drop_schema(request);
            } else if constexpr (std::is_same_v<Request, CreateTableRequest>) {
                return manager.create_table(request);
            } else if constexpr (std::is_same_v<Request, AlterTableRequest>) {
                return manager.alter_table(request);
            } else if constexpr (std::is_same_v<Request, DropTableRequest>) {
                return manager.drop_table(request);
            } else if constexpr (std::is_same_v<Request, CreateSourceRequest>) {
                return manager.create_source(request);
            } else if constexpr (std::is_same_v<Request, DropSourceRequest>) {
                return manager.drop_source(request);
            } else if constexpr (std::is_same_v<Request, CreateSinkRequest>) {
                return manager.create_sink(request);
            } else if constexpr (std::is_same_v<Request, DropSinkRequest>) {
                return manager.drop_sink(request);
            } else if constexpr (std::is_same_v<Request, CreateIndexRequest>) {
                return manager.create_index(request);
            } else if constexpr (std::is_same_v<Request, DropIndexRequest>) {
                return manager.drop_index(request);
            } else if constexpr (std::is_same_v<Request, CreateViewRequest>) {
                return manager.create_view(request);
            } else if constexpr (std::is_same_v<Request, DropViewRequest>) {
                return manager.drop_view(request);
            } else if constexpr (std::is_same_v<Request, CreateMaterializedViewRequest>) {
                return manager.create_materialized_view(request);
            } else if constexpr (std::is_same_v<Request, DropMaterializedViewRequest>) {
                return manager.drop_materialized_view(request);
            } else if constexpr (std::is_same_v<Request, CreateFunctionRequest>) {
                return manager.create_function(request);
            } else {
                static_assert(std::is_same_v<Request, DropFunctionRequest>);
                return manager.drop_function(request);
            }
        },
        command);
}

}  // namespace streamcat::ddl
