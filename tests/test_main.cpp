#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "indicators.hpp"
#include "logging.hpp"

int main(int argc, char* argv[]) {
    // Library code logs unconditionally; keep test output clean
    core::logging::initializeConsole(spdlog::level::off);
    indicators::TaLibSession ta_session;
    return Catch::Session().run(argc, argv);
}
