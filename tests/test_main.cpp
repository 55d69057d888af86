// tests/test_main.cpp
//
// The only translation unit that defines DOCTEST_CONFIG_IMPLEMENT.
// We use DOCTEST_CONFIG_IMPLEMENT (instead of ...WITH_MAIN) so we can set
// defaults and still honour doctest command-line flags.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <spdlog/spdlog.h>

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS"));
}

} // namespace

int main(int argc, char** argv) {
    // Simulation code logs lifecycle events at info; keep test output readable.
    // ANTSIM_TEST_LOG=1 turns it back on.
    spdlog::set_level(env_truthy(std::getenv("ANTSIM_TEST_LOG")) ? spdlog::level::debug
                                                                 : spdlog::level::off);

    doctest::Context context;

    context.setOption("order-by", "name"); // deterministic ordering
    context.setOption("duration", true);

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    const int res = context.run();
    if (context.shouldExit())
        return res;
    return res;
}
