#include <doctest/doctest.h>

#include "core/RendererConfig.h"

TEST_SUITE("RendererConfig") {
    TEST_CASE("empty object yields defaults") {
        auto config = RendererConfig::loadFromJsonString("{}");
        REQUIRE(config.has_value());
        CHECK(config->strategy == CullingStrategy::Host);
        CHECK(config->framesInFlight == 2);
        CHECK(config->maxDeviceObjects == 8192);
        CHECK(config->initialHostInstances == 1024);
        CHECK(config->shaderPath == "shaders");
        CHECK_FALSE(config->enableReadback);
    }

    TEST_CASE("all fields are read") {
        auto config = RendererConfig::loadFromJsonString(R"({
            "strategy": "device",
            "framesInFlight": 3,
            "maxDeviceObjects": 100,
            "initialHostInstances": 16,
            "shaderPath": "build/shaders",
            "enableReadback": true
        })");
        REQUIRE(config.has_value());
        CHECK(config->strategy == CullingStrategy::Device);
        CHECK(config->framesInFlight == 3);
        CHECK(config->maxDeviceObjects == 100);
        CHECK(config->initialHostInstances == 16);
        CHECK(config->shaderPath == "build/shaders");
        CHECK(config->enableReadback);
    }

    TEST_CASE("unknown strategy is rejected") {
        CHECK_FALSE(RendererConfig::loadFromJsonString(R"({"strategy": "hybrid"})").has_value());
    }

    TEST_CASE("malformed JSON is rejected") {
        CHECK_FALSE(RendererConfig::loadFromJsonString("{ strategy: ").has_value());
    }

    TEST_CASE("wrong value type is rejected") {
        CHECK_FALSE(RendererConfig::loadFromJsonString(R"({"framesInFlight": "two"})").has_value());
    }

    TEST_CASE("out of range buffering depth is rejected") {
        CHECK_FALSE(RendererConfig::loadFromJsonString(R"({"framesInFlight": 0})").has_value());
        CHECK_FALSE(RendererConfig::loadFromJsonString(R"({"framesInFlight": 5})").has_value());
        CHECK(RendererConfig::loadFromJsonString(R"({"framesInFlight": 4})").has_value());
    }

    TEST_CASE("zero capacities are rejected") {
        CHECK_FALSE(RendererConfig::loadFromJsonString(R"({"maxDeviceObjects": 0})").has_value());
        CHECK_FALSE(RendererConfig::loadFromJsonString(R"({"initialHostInstances": 0})").has_value());
    }

    TEST_CASE("missing file is rejected") {
        CHECK_FALSE(RendererConfig::loadFromJson("/nonexistent/renderer.json").has_value());
    }
}
