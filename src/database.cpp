#include "database.hpp"

#include <stdexcept>
#include <string>

#include <cstring>

namespace kind {

namespace {

void check_sqlite(int const rc, sqlite3* const db, char const* const what) {
    if (rc == SQLITE_OK) {
        return;
    }

    std::string message {what};
    message.append(" failed: ");
    message.append(db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    message.append(" (rc=");
    message.append(std::to_string(rc));
    message.push_back(')');

    throw std::runtime_error {message};
}

} // namespace

void database_deleter::operator()(sqlite3* const db) const noexcept {
    sqlite3_close(db);
}

void statement_deleter::operator()(sqlite3_stmt* const stmt) const noexcept {
    sqlite3_finalize(stmt);
}

unique_database open_database(std::string const& path) {
    sqlite3* db = nullptr;
    auto const rc = sqlite3_open(path.c_str(), &db);

    // a handle is returned even on failure, and owns the error message
    unique_database out {db};
    check_sqlite(rc, db, "sqlite3_open");

    return out;
}

void execute(sqlite3* const db, std::string const& sql) {
    char* error = nullptr;
    auto const rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
    if (rc == SQLITE_OK) {
        return;
    }

    std::string message {"sqlite3_exec failed: "};
    message.append(error ? error : sqlite3_errstr(rc));
    sqlite3_free(error);

    throw std::runtime_error {message};
}

unique_statement prepare(sqlite3* const db, string_view const sql) {
    sqlite3_stmt* stmt = nullptr;

    check_sqlite(sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size())
                                  , &stmt, nullptr)
               , db, "sqlite3_prepare_v2");

    return unique_statement {stmt};
}

bool step(sqlite3_stmt* const stmt) {
    auto const rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    } else if (rc == SQLITE_DONE) {
        return false;
    }

    check_sqlite(rc, sqlite3_db_handle(stmt), "sqlite3_step");
    return false;
}

int find_column(sqlite3_stmt* const stmt, string_view const name) noexcept {
    auto const n = sqlite3_column_count(stmt);
    for (int i = 0; i < n; ++i) {
        auto const column_name = sqlite3_column_name(stmt, i);
        if (column_name && name == string_view {column_name}) {
            return i;
        }
    }

    return -1;
}

void bind_uuid(sqlite3_stmt* const stmt, int const index, uuid const& u) {
    auto const text = to_hyphenated(u);

    check_sqlite(sqlite3_bind_text(stmt, index, text.data()
                                 , static_cast<int>(text.size()), SQLITE_TRANSIENT)
               , sqlite3_db_handle(stmt), "sqlite3_bind_text");
}

void bind_uuid_blob(sqlite3_stmt* const stmt, int const index, uuid const& u) {
    check_sqlite(sqlite3_bind_blob(stmt, index, u.data
                                 , static_cast<int>(u.size()), SQLITE_TRANSIENT)
               , sqlite3_db_handle(stmt), "sqlite3_bind_blob");
}

result<uuid> column_uuid(sqlite3_stmt* const stmt, int const column) noexcept {
    switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_NULL:
        return id_error::empty_db_id;
    case SQLITE_BLOB: {
        auto const data = sqlite3_column_blob(stmt, column);
        auto const size = sqlite3_column_bytes(stmt, column);

        if (!data || size == 0) {
            return id_error::empty_db_id;
        } else if (static_cast<size_t>(size) != uuid::static_size()) {
            return id_error::invalid_format;
        }

        uuid u {};
        std::memcpy(u.data, data, uuid::static_size());
        return u;
    }
    case SQLITE_TEXT: {
        auto const data = reinterpret_cast<char const*>(
            sqlite3_column_text(stmt, column));
        auto const size = sqlite3_column_bytes(stmt, column);

        if (!data || size == 0) {
            return id_error::empty_db_id;
        }

        return parse_hyphenated(string_view {data, static_cast<size_t>(size)});
    }
    default:
        break;
    }

    return id_error::invalid_format;
}

[[noreturn]] void detail::throw_missing_column(string_view const name) {
    throw std::runtime_error {"no result column named \""
                            + std::string (name.data(), name.size()) + "\""};
}

} //namespace kind
