#include "streamcat/ddl/ddl_command.hpp"

namespace streamcat::ddl {

const char* to_string(DdlVerb verb) noexcept
{
    switch (verb) {
    case DdlVerb::CreateDatabase:
        return "CREATE DATABASE";
    case DdlVerb::DropDatabase:
        return "DROP DATABASE";
    case DdlVerb::CreateSchema:
        return "CREATE SCHEMA";
    case DdlVerb::DropSchema:
        return "DROP SCHEMA";
    case DdlVerb::CreateTable:
        return "CREATE TABLE";
    case DdlVerb::AlterTable:
        return "ALTER TABLE";
    case DdlVerb::DropTable:
        return "DROP TABLE";
    case DdlVerb::CreateSource:
        return "CREATE SOURCE";
    case DdlVerb::DropSource:
        return "DROP SOURCE";
    case DdlVerb::CreateSink:
        return "CREATE SINK";
    case DdlVerb::DropSink:
        return "DROP SINK";
    case DdlVerb::CreateIndex:
        return "CREATE INDEX";
    case DdlVerb::DropIndex:
        return "DROP INDEX";
    case DdlVerb::CreateView:
        return "CREATE VIEW";
    case DdlVerb::DropView:
        return "DROP VIEW";
    case DdlVerb::CreateMaterializedView:
        return "CREATE MATERIALIZED VIEW";
    case DdlVerb::DropMaterializedView:
        return "DROP MATERIALIZED VIEW";
    case DdlVerb::CreateFunction:
        return "CREATE FUNCTION";
    case DdlVerb::DropFunction:
        return "DROP FUNCTION";
    default:
        return "UNKNOWN";
    }
}

}  // namespace streamcat::ddl
