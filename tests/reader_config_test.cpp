#include "TestFramework.h"

#include "Anvil/World/ReaderConfig.h"

using namespace Anvil::World;

TEST_CASE(ReaderConfig_Defaults) {
    ReaderConfig config;
    CHECK_EQ(config.regionExtension, "mca");
    CHECK(!config.validateOnLoad);
    CHECK_EQ(config.maxDecompressedBytes, size_t{67108864});
    CHECK_EQ(config.logLevel, "info");
}

TEST_CASE(ReaderConfig_ApplyYamlNested) {
    ReaderConfig config;
    std::string yaml = R"(
reader:
  regionExtension: mcr
  validateOnLoad: true
  maxDecompressedBytes: 1048576
  logLevel: debug
)";
    config.applyYaml("test", yaml);
    CHECK_EQ(config.regionExtension, "mcr");
    CHECK(config.validateOnLoad);
    CHECK_EQ(config.maxDecompressedBytes, size_t{1048576});
    CHECK_EQ(config.logLevel, "debug");
}

TEST_CASE(ReaderConfig_ApplyYamlRootKeys) {
    ReaderConfig config;
    config.applyYaml("test", "validateOnLoad: yes\nunknownKey: 3\n");
    CHECK(config.validateOnLoad);
    CHECK_EQ(config.regionExtension, "mca");
    CHECK_EQ(config.logLevel, "info");
}

TEST_CASE(ReaderConfig_EmptyAndUnknownValues) {
    ReaderConfig config;
    config.applyYaml("empty", "");
    CHECK_EQ(config.logLevel, "info");

    config.applyYaml("test", "reader:\n  logLevel: chatty\n  validateOnLoad: maybe\n");
    CHECK_EQ(config.logLevel, "info");
    CHECK(!config.validateOnLoad);
}

TEST_CASE(ReaderConfig_LogLevelNames) {
    CHECK(isValidLogLevel("trace"));
    CHECK(isValidLogLevel("warn"));
    CHECK(isValidLogLevel("off"));
    CHECK(!isValidLogLevel("warning"));
    CHECK(!isValidLogLevel(""));
}
