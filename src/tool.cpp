#include "tool.hpp"
#include "config.hpp"
#include "id_class.hpp"     // for id_class, is_valid_class_prefix
#include "id_error.hpp"     // for to_string
#include "json.hpp"         // for json_writer
#include "schema.hpp"       // for write_id_schema, schema_to_json
#include "uuid.hpp"         // for random_uuid_v4, parse_hyphenated

#include <limits>
#include <string>

#include <cerrno>
#include <cstdlib>

namespace kind {

namespace {

struct tool_io {
    std::FILE* out;
    std::FILE* err;
};

int print_usage(tool_io const io) {
    std::fprintf(io.err,
        "usage:\n"
        "  kind-id new <prefix> [count]    mint random public ids\n"
        "  kind-id check <prefix> <text>   validate a public id, print its db id\n"
        "  kind-id public <prefix> <db-id> render a db id as a public id\n"
        "  kind-id schema <prefix>         print the JSON schema of the id\n");
    return 2;
}

int print_error(tool_io const io, id_error const e) {
    std::fprintf(io.err, "error: %s\n", to_string(e));
    return 1;
}

//! A strictly positive decimal int, nothing before or after it.
bool parse_count(char const* const text, int& count) noexcept {
    if (!text || *text < '0' || *text > '9') {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    auto const n = std::strtol(text, &end, 10);

    if (errno == ERANGE || !end || *end != '\0'
     || n <= 0 || n > std::numeric_limits<int>::max()) {
        return false;
    }

    count = static_cast<int>(n);
    return true;
}

int run_new(tool_io const io, id_class const& c, int const count) {
    for (int i = 0; i < count; ++i) {
        std::fprintf(io.out, "%s\n", c.public_id(random_uuid_v4()).c_str());
    }

    return 0;
}

int run_check(tool_io const io, id_class const& c, string_view const text) {
    auto const u = c.parse_public_id(text);
    if (!u) {
        return print_error(io, u.error());
    }

    std::fprintf(io.out, "%s\n", to_hyphenated(u.value()).c_str());
    return 0;
}

int run_public(tool_io const io, id_class const& c, string_view const text) {
    auto const u = parse_hyphenated(text);
    if (!u) {
        return print_error(io, u.error());
    }

    std::fprintf(io.out, "%s\n", c.public_id(u.value()).c_str());
    return 0;
}

int run_schema(tool_io const io, id_class const& c) {
    auto const text = schema_to_json([&](json_writer& w) {
        write_id_schema(w, c);
    });

    std::fprintf(io.out, "%s\n", text.c_str());
    return 0;
}

} // namespace

int run_tool(
    int               const argc
  , char const* const       argv[]
  , std::FILE*        const out
  , std::FILE*        const err
) {
    tool_io const io {out, err};

    if (argc < 3) {
        return print_usage(io);
    }

    string_view const command {argv[1]};
    string_view const prefix  {argv[2]};

    // the prefix comes from the user here, so report it rather than letting
    // id_class treat it as a programming error
    if (!is_valid_class_prefix(prefix)) {
        std::fprintf(io.err, "error: invalid class prefix \"%s\"\n", argv[2]);
        return 1;
    }

    id_class const c {prefix};

    if (command == "new" && argc <= 4) {
        int count = 1;
        if (argc == 4 && !parse_count(argv[3], count)) {
            std::fprintf(io.err, "error: invalid count \"%s\"\n", argv[3]);
            return 1;
        }

        return run_new(io, c, count);
    } else if (command == "check" && argc == 4) {
        return run_check(io, c, argv[3]);
    } else if (command == "public" && argc == 4) {
        return run_public(io, c, argv[3]);
    } else if (command == "schema" && argc == 3) {
        return run_schema(io, c);
    }

    return print_usage(io);
}

} //namespace kind
