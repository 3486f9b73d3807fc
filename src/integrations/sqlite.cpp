#include <uuidb64/sqlite.hpp>
#include <uuidb64/log.hpp>
#include <sqlite3.h>
#include <cstring>

namespace uuidb64::sqlite {

static std::string db_errmsg(sqlite3_stmt* stmt) {
    sqlite3* db = sqlite3_db_handle(stmt);
    return db ? sqlite3_errmsg(db) : "unknown error";
}

Status bind_uuid(sqlite3_stmt* stmt, int index, const UuidB64& id) {
    if (!stmt) {
        return UuidB64Error(UuidB64Error::InvalidArg, "bind_uuid: null statement");
    }
    const auto& bytes = id.bytes();
    int rc = sqlite3_bind_blob(stmt, index, bytes.data(),
                               static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        log::debug("binding %s to parameter %d failed", id.to_istring().c_str(), index);
        return UuidB64Error(UuidB64Error::Database,
            "SQLite bind failed for parameter " + std::to_string(index)
            + ": " + db_errmsg(stmt));
    }
    return ok_status();
}

Result<UuidB64> column_uuid(sqlite3_stmt* stmt, int col) {
    if (!stmt) {
        return UuidB64Error(UuidB64Error::InvalidArg, "column_uuid: null statement");
    }
    int type = sqlite3_column_type(stmt, col);
    if (type == SQLITE_NULL) {
        return UuidB64Error(UuidB64Error::Database,
            "column " + std::to_string(col) + " is NULL, expected a UUID");
    }
    if (type != SQLITE_BLOB) {
        return UuidB64Error(UuidB64Error::Database,
            "column " + std::to_string(col) + " is not a BLOB",
            "UUID columns are declared " UUIDB64_SQL_TYPE " and hold the raw 16 bytes");
    }

    const void* data = sqlite3_column_blob(stmt, col);
    int len = sqlite3_column_bytes(stmt, col);
    if (!data || len != static_cast<int>(base64::kRawLen)) {
        return UuidB64Error(UuidB64Error::Database,
            "column " + std::to_string(col) + " holds " + std::to_string(len)
            + " bytes, a UUID is exactly 16");
    }

    base64::Bytes16 bytes{};
    std::memcpy(bytes.data(), data, bytes.size());
    return Result<UuidB64>::ok(UuidB64::from_bytes(bytes));
}

} // namespace uuidb64::sqlite
