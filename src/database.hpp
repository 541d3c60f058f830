#pragma once

//
// Binding ids to SQLite statements. A column is typed by the schema, so only
// the bare uuid is stored and reading it back skips the class check.
//

#include "config.hpp"
#include "id.hpp"
#include "ided.hpp"
#include "result.hpp"
#include "uuid.hpp"

#include <sqlite3.h>

#include <memory>
#include <string>

namespace kind {

struct database_deleter {
    void operator()(sqlite3* db) const noexcept;
};

using unique_database = std::unique_ptr<sqlite3, database_deleter>;

struct statement_deleter {
    void operator()(sqlite3_stmt* stmt) const noexcept;
};

using unique_statement = std::unique_ptr<sqlite3_stmt, statement_deleter>;

//! Open (creating if needed) the database at @p path; ":memory:" for a
//! private in-memory one. Throws std::runtime_error on failure.
unique_database open_database(std::string const& path);

//! Run one or more statements that produce no rows.
void execute(sqlite3* db, std::string const& sql);

//! Throws std::runtime_error carrying the sqlite message on failure.
unique_statement prepare(sqlite3* db, string_view sql);

//! Advance @p stmt: true if a row is available, false once it is done.
bool step(sqlite3_stmt* stmt);

//! Index of the result column called @p name, or -1 if there is none.
int find_column(sqlite3_stmt* stmt, string_view name) noexcept;

//! Bind the hyphenated text form to parameter @p index (1 based).
void bind_uuid(sqlite3_stmt* stmt, int index, uuid const& u);

//! Bind the 16 raw bytes to parameter @p index (1 based).
void bind_uuid_blob(sqlite3_stmt* stmt, int index, uuid const& u);

//! Decode result column @p column (0 based) of the current row.
//!
//! NULL, or an empty TEXT or BLOB : empty_db_id
//! 16 byte BLOB                   : the bytes as they are
//! TEXT                           : the hyphenated form, else invalid_format
//! anything else                  : invalid_format
result<uuid> column_uuid(sqlite3_stmt* stmt, int column) noexcept;

namespace detail {
[[noreturn]] void throw_missing_column(string_view name);
} // namespace detail

template <typename T>
void bind_id(sqlite3_stmt* const stmt, int const index, id<T> const& i) {
    bind_uuid(stmt, index, i.raw());
}

template <typename T>
void bind_id_blob(sqlite3_stmt* const stmt, int const index, id<T> const& i) {
    bind_uuid_blob(stmt, index, i.raw());
}

//! The column is trusted to hold ids of class T; the class is not checked.
template <typename T>
result<id<T>> column_id(sqlite3_stmt* const stmt, int const column) noexcept {
    auto const u = column_uuid(stmt, column);
    if (!u) {
        return u.error();
    }

    return detail::id_access::from_unchecked<T>(u.value());
}

//! Read the id from the column named @p id_column and the entity from the
//! same row through @p read_entity, a callable taking the statement and
//! returning an E. Throws std::runtime_error if the column does not exist.
template <typename T, typename E = T, typename ReadEntity>
result<ided<T, E>> read_ided(
    sqlite3_stmt* const stmt
  , string_view   const id_column
  , ReadEntity          read_entity
) {
    auto const column = find_column(stmt, id_column);
    if (column < 0) {
        detail::throw_missing_column(id_column);
    }

    auto const i = column_id<T>(stmt, column);
    if (!i) {
        return i.error();
    }

    return ided<T, E> {i.value(), read_entity(stmt)};
}

} //namespace kind
