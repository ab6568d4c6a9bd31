#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "utils/logger.hpp"

int main(int argc, char* argv[]) {
    sealgate::Logger::getInstance().setConsoleEnabled(false);
    return Catch::Session().run(argc, argv);
}
