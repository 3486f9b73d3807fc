#pragma once

#include <uuidb64/uuid_b64.hpp>

struct sqlite3_stmt;

// SQLite has no UUID column type. A UuidB64 is stored as its raw 16 bytes
// in a BLOB column, so the database never sees the Base64 text:
//
//     CREATE TABLE entities (id BLOB PRIMARY KEY, val INTEGER)
#define UUIDB64_SQL_TYPE "BLOB"

namespace uuidb64::sqlite {

// Binds id to the 1-based parameter index of stmt.
Status bind_uuid(sqlite3_stmt* stmt, int index, const UuidB64& id);

// Reads the 0-based result column col of the current row. NULL or a blob
// that is not exactly 16 bytes is a Database error.
Result<UuidB64> column_uuid(sqlite3_stmt* stmt, int col);

} // namespace uuidb64::sqlite
