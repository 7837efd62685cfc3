#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

// Tests that exercise failures use suppressed ErrorReporters, so errors showing up in the log belong to a failing test.
int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%l] %v");
    doctest::Context context;
    context.setOption("order-by", "file");
    context.applyCommandLine(argc, argv);
    return context.run();
}
