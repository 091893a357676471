#pragma once

#include "streamcat/catalog/catalog_id_allocator.hpp"
#include "streamcat/catalog/catalog_snapshot.hpp"
#include "streamcat/catalog/catalog_store.hpp"
#include "streamcat/ddl/ddl_command.hpp"
#include "streamcat/ddl/ddl_dependency_graph.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace streamcat::notify {
class NotificationBroadcaster;
}

namespace streamcat::ddl {

enum class CatalogRequestState : std::uint8_t {
    Idle = 0,
    Validating,
    Allocating,
    Committing,
    Broadcasting,
    Done,
    Rejected,
    Aborted
};

[[nodiscard]] const char* to_string(CatalogRequestState state) noexcept;

// Single writer for the catalog. Every mutating request runs under one lock
// from validation through id allocation, the store commit and version
// stamping, then swaps in a new read snapshot. Readers call snapshot() and
// never take the writer lock.
//
// A request rejected during validation leaves the store, the counters and the
// snapshot untouched. A request whose store commit fails is aborted as a
// whole: its ids are returned and nothing is broadcast.
class CatalogManager final {
public:
    struct Config final {
        catalog::CatalogStore* store = nullptr;
        notify::NotificationBroadcaster* broadcaster = nullptr;
        catalog::CatalogIdAllocator::Config id_allocator{};
    };

    explicit CatalogManager(Config config);

    CatalogManager(const CatalogManager&) = delete;
    CatalogManager& operator=(const CatalogManager&) = delete;
    CatalogManager(CatalogManager&&) = delete;
    CatalogManager& operator=(CatalogManager&&) = delete;

    // Rebuilds the snapshot, dependency graph and id counters from the store.
    std::error_code recover();

    [[nodiscard]] std::shared_ptr<const catalog::CatalogSnapshot> snapshot() const;
    [[nodiscard]] CatalogRequestState last_request_state() const noexcept;
    [[nodiscard]] std::uint64_t catalog_version() const;

    [[nodiscard]] std::vector<catalog::RelationId> dependents(catalog::RelationId relation_id) const;
    [[nodiscard]] std::uint64_t last_allocated_id(catalog::CatalogIdCategory category) const;

    [[nodiscard]] DdlCommandResponse create_database(const CreateDatabaseRequest& request);
    [[nodiscard]] DdlCommandResponse drop_database(const DropDatabaseRequest& request);
    [[nodiscard]] DdlCommandResponse create_schema(const CreateSchemaRequest& request);
    [[nodiscard]] DdlCommandResponse drop_schema(const DropSchemaRequest& request);

    [[nodiscard]] DdlCommandResponse create_table(const CreateTableRequest& request);
    [[nodiscard]] DdlCommandResponse alter_table(const AlterTableRequest& request);
    [[nodiscard]] DdlCommandResponse drop_table(const DropTableRequest& request);

    [[nodiscard]] DdlCommandResponse create_source(const CreateSourceRequest& request);
    [[nodiscard]] DdlCommandResponse drop_source(const DropSourceRequest& request);
    [[nodiscard]] DdlCommandResponse create_sink(const CreateSinkRequest& request);
    [[nodiscard]] DdlCommandResponse drop_sink(const DropSinkRequest& request);

    [[nodiscard]] DdlCommandResponse create_index(const CreateIndexRequest& request);
    [[nodiscard]] DdlCommandResponse drop_index(const DropIndexRequest& request);

    [[nodiscard]] DdlCommandResponse create_view(const CreateViewRequest& request);
    [[nodiscard]] DdlCommandResponse drop_view(const DropViewRequest& request);
    [[nodiscard]] DdlCommandResponse create_materialized_view(const CreateMaterializedViewRequest& request);
    [[nodiscard]] DdlCommandResponse drop_materialized_view(const DropMaterializedViewRequest& request);

    [[nodiscard]] DdlCommandResponse create_function(const CreateFunctionRequest& request);
    [[nodiscard]] DdlCommandResponse drop_function(const DropFunctionRequest& request);

private:
    struct WriteScope;

    using GraphUpdate = std::function<void(DdlDependencyGraph&)>;

    [[nodiscard]] DdlCommandResponse reject(std::error_code error, std::string message);
    [[nodiscard]] DdlCommandResponse unchanged(std::optional<catalog::CatalogObject> existing);
    [[nodiscard]] DdlCommandResponse commit(WriteScope& scope,
                                            const catalog::CatalogSnapshot& base,
                                            std::vector<catalog::CatalogObject> objects,
                                            const GraphUpdate& update_graph);
    [[nodiscard]] DdlCommandResponse drop_relation(const catalog::CatalogSnapshot& base,
                                                   catalog::CatalogObjectKind kind,
                                                   catalog::RelationId relation_id,
                                                   std::string_view name);
    [[nodiscard]] DdlCommandResponse drop_table_like(const catalog::CatalogSnapshot& base,
                                                     const catalog::CatalogTable& table);

    void publish_snapshot(std::shared_ptr<const catalog::CatalogSnapshot> snapshot);
    void set_state(CatalogRequestState state) noexcept;

    Config config_{};
    mutable std::mutex writer_mutex_{};
    catalog::CatalogIdAllocator allocator_;
    DdlDependencyGraph graph_{};
    std::uint64_t next_transaction_id_ = 1U;
    std::atomic<CatalogRequestState> state_{CatalogRequestState::Idle};

    mutable std::mutex snapshot_mutex_{};
    std::shared_ptr<const catalog::CatalogSnapshot> snapshot_{};
};

}  // namespace streamcat::ddl
