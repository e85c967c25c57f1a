#pragma once

#include "docflow/database.hpp"
#include <string>

namespace docflow {

// Creates the schema and the tables the worker reads and writes outside the
// task log: documents, document_lines and progress_snapshots. Idempotent.
// The log, group and dead-letter tables are owned by TaskQueue::setup().
bool initialize_schema(DatabasePool& pool);

// Double-quoted identifier safe for interpolation into SQL
std::string quote_identifier(DatabaseConnection& conn, const std::string& name);

} // namespace docflow
