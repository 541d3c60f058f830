#include "tool.hpp"

#include <exception>

#include <cstdio>

int main(int const argc, char const* argv[]) try {
    return kind::run_tool(argc, argv, stdout, stderr);
} catch (std::exception const& e) {
    std::fprintf(stderr, "Failed: %s.\n", e.what());
    return 1;
} catch (...) {
    std::fprintf(stderr, "Unexpected failure.\n");
    return 1;
}
