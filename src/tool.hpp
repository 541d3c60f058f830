#pragma once

#include <cstdio>

namespace kind {

//! The kind-id command line front end.
//!
//!     kind-id new <prefix> [count]
//!     kind-id check <prefix> <text>
//!     kind-id public <prefix> <db-id>
//!     kind-id schema <prefix>
//!
//! Results go to @p out, diagnostics ("error: ...") and usage to @p err.
//! Returns the process exit status: 0 on success, 1 for a rejected input,
//! 2 for a malformed command line.
int run_tool(int argc, char const* const argv[], std::FILE* out, std::FILE* err);

} //namespace kind
