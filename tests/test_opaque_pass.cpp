#include <doctest/doctest.h>

#include "TestScene.h"
#include "core/passes/OpaquePass.h"

namespace {

constexpr uint64_t SAMPLER_SET = 0x10;
constexpr uint64_t OUTPUT_SET = 0x20;
constexpr uint64_t LIGHT_SET = 0x30;
constexpr uint64_t UNIFORM_SET = 0x40;
constexpr uint64_t MATERIAL_TABLE_SET = 0x50;
constexpr uint64_t TEXTURE_ARRAY_SET = 0x60;
constexpr uint64_t INDIRECT_BUFFER = 0x70;

struct PassFixture {
    TestScene scene;
    std::shared_ptr<const GraphicsPipeline> depthPipeline = std::make_shared<GraphicsPipeline>(
        GraphicsPipeline{fakeHandle<VkPipeline>(1), fakeHandle<VkPipelineLayout>(2)});
    std::shared_ptr<const GraphicsPipeline> opaquePipeline = std::make_shared<GraphicsPipeline>(
        GraphicsPipeline{fakeHandle<VkPipeline>(3), fakeHandle<VkPipelineLayout>(4)});
    OpaquePass pass{depthPipeline, opaquePipeline};

    PassFixture() {
        scene.materials.setDeviceBindGroup(fakeHandle<VkDescriptorSet>(MATERIAL_TABLE_SET));
    }

    CulledObjectSet hostSet(std::vector<HostDrawCall> calls) const {
        return CulledObjectSet{CulledCalls::host(std::move(calls)), fakeHandle<VkDescriptorSet>(OUTPUT_SET), 0};
    }

    CulledObjectSet deviceSet(uint32_t drawCount) const {
        DeviceDrawData data{};
        data.indirectBuffer = fakeHandle<VkBuffer>(INDIRECT_BUFFER);
        data.drawCount = drawCount;
        data.stride = sizeof(VkDrawIndexedIndirectCommand);
        return CulledObjectSet{CulledCalls::device(data), fakeHandle<VkDescriptorSet>(OUTPUT_SET), 0};
    }

    void prepass(RecordingRenderPassEncoder& encoder, const CulledObjectSet& culled,
                 TextureBinding textures) const {
        pass.prepass(OpaquePassPrepassArgs{
            encoder, scene.meshes, scene.materials,
            fakeHandle<VkDescriptorSet>(SAMPLER_SET), textures, culled});
    }

    void draw(RecordingRenderPassEncoder& encoder, const CulledObjectSet& culled,
              TextureBinding textures) const {
        pass.draw(OpaquePassDrawArgs{
            encoder, scene.meshes, scene.materials,
            fakeHandle<VkDescriptorSet>(SAMPLER_SET),
            fakeHandle<VkDescriptorSet>(LIGHT_SET),
            fakeHandle<VkDescriptorSet>(UNIFORM_SET),
            textures, culled});
    }
};

TextureBinding hostTextures() {
    return TextureBinding::host(std::monostate{});
}

TextureBinding deviceTextures() {
    return TextureBinding::device(fakeHandle<VkDescriptorSet>(TEXTURE_ARRAY_SET));
}

uint64_t materialSet(MaterialHandle handle) {
    return TestScene::MATERIAL_SET_BASE + handle;
}

} // namespace

TEST_SUITE("OpaquePass") {
    TEST_CASE("slot tables") {
        CHECK(OpaquePassSlots::Prepass::SAMPLERS == 0);
        CHECK(OpaquePassSlots::Prepass::CULLED_OUTPUT == 1);
        CHECK(OpaquePassSlots::Prepass::HOST_MATERIAL == 2);
        CHECK(OpaquePassSlots::Prepass::DEVICE_TEXTURES == 3);
        CHECK(OpaquePassSlots::Draw::DIRECTIONAL_LIGHT == 2);
        CHECK(OpaquePassSlots::Draw::SHADER_UNIFORMS == 3);
        CHECK(OpaquePassSlots::Draw::HOST_MATERIAL == 4);
        CHECK(OpaquePassSlots::Draw::DEVICE_TEXTURES == 5);
    }

    TEST_CASE("host prepass binds shared state then draws each batch") {
        PassFixture f;
        RecordingRenderPassEncoder encoder;
        CulledObjectSet culled = f.hostSet({
            {f.scene.cube, f.scene.stone, 0, 2},
            {f.scene.sphere, f.scene.metal, 2, 3},
        });

        f.prepass(encoder, culled, hostTextures());

        const auto& e = encoder.events;
        REQUIRE(e.size() == 9);
        CHECK(e[0].type == PassEvent::Type::SetVertexBuffer);
        CHECK(e[0].handle == TestScene::VERTEX_BUFFER);
        CHECK(e[1].type == PassEvent::Type::SetIndexBuffer);
        CHECK(e[1].handle == TestScene::INDEX_BUFFER);
        CHECK(e[2].type == PassEvent::Type::SetPipeline);
        CHECK(e[2].pipeline == f.depthPipeline.get());
        CHECK(e[3].slot == 0);
        CHECK(e[3].handle == SAMPLER_SET);
        CHECK(e[4].slot == 1);
        CHECK(e[4].handle == OUTPUT_SET);

        CHECK(e[5].type == PassEvent::Type::SetBindGroup);
        CHECK(e[5].slot == 2);
        CHECK(e[5].handle == materialSet(f.scene.stone));
        CHECK(e[6].type == PassEvent::Type::DrawIndexed);
        CHECK(e[6].indexCount == 36);
        CHECK(e[6].instanceCount == 2);
        CHECK(e[6].firstIndex == 0);
        CHECK(e[6].firstInstance == 0);

        CHECK(e[7].slot == 2);
        CHECK(e[7].handle == materialSet(f.scene.metal));
        CHECK(e[8].type == PassEvent::Type::DrawIndexed);
        CHECK(e[8].indexCount == 960);
        CHECK(e[8].firstIndex == 36);
        CHECK(e[8].vertexOffset == 24);
        CHECK(e[8].instanceCount == 3);
        CHECK(e[8].firstInstance == 2);

        CHECK(encoder.count(PassEvent::Type::DrawIndexedIndirect) == 0);
    }

    TEST_CASE("host draw uses material slot 4 after light and uniforms") {
        PassFixture f;
        RecordingRenderPassEncoder encoder;
        CulledObjectSet culled = f.hostSet({{f.scene.cube, f.scene.metal, 0, 1}});

        f.draw(encoder, culled, hostTextures());

        CHECK(encoder.events[2].pipeline == f.opaquePipeline.get());
        auto binds = encoder.bindGroups();
        REQUIRE(binds.size() == 5);
        CHECK(binds[0].slot == 0);
        CHECK(binds[1].slot == 1);
        CHECK(binds[2].slot == 2);
        CHECK(binds[2].handle == LIGHT_SET);
        CHECK(binds[3].slot == 3);
        CHECK(binds[3].handle == UNIFORM_SET);
        CHECK(binds[4].slot == 4);
        CHECK(binds[4].handle == materialSet(f.scene.metal));
        CHECK(encoder.count(PassEvent::Type::DrawIndexed) == 1);
    }

    TEST_CASE("consecutive batches with the same material bind it once") {
        PassFixture f;
        RecordingRenderPassEncoder encoder;
        CulledObjectSet culled = f.hostSet({
            {f.scene.cube, f.scene.stone, 0, 1},
            {f.scene.sphere, f.scene.stone, 1, 1},
            {f.scene.cube, f.scene.metal, 2, 1},
        });

        f.prepass(encoder, culled, hostTextures());

        auto binds = encoder.bindGroups();
        REQUIRE(binds.size() == 4);
        CHECK(binds[2].handle == materialSet(f.scene.stone));
        CHECK(binds[3].handle == materialSet(f.scene.metal));
        CHECK(encoder.count(PassEvent::Type::DrawIndexed) == 3);
    }

    TEST_CASE("device prepass issues one indirect draw over all batches") {
        PassFixture f;
        RecordingRenderPassEncoder encoder;
        CulledObjectSet culled = f.deviceSet(7);

        f.prepass(encoder, culled, deviceTextures());

        auto binds = encoder.bindGroups();
        REQUIRE(binds.size() == 4);
        CHECK(binds[2].slot == 2);
        CHECK(binds[2].handle == MATERIAL_TABLE_SET);
        CHECK(binds[3].slot == 3);
        CHECK(binds[3].handle == TEXTURE_ARRAY_SET);

        REQUIRE(encoder.count(PassEvent::Type::DrawIndexedIndirect) == 1);
        CHECK(encoder.count(PassEvent::Type::DrawIndexed) == 0);
        const PassEvent& indirect = encoder.events.back();
        CHECK(indirect.type == PassEvent::Type::DrawIndexedIndirect);
        CHECK(indirect.handle == INDIRECT_BUFFER);
        CHECK(indirect.offset == 0);
        CHECK(indirect.drawCount == 7);
        CHECK(indirect.stride == 20);
    }

    TEST_CASE("device draw binds material table and textures at 4 and 5") {
        PassFixture f;
        RecordingRenderPassEncoder encoder;
        CulledObjectSet culled = f.deviceSet(2);

        f.draw(encoder, culled, deviceTextures());

        auto binds = encoder.bindGroups();
        REQUIRE(binds.size() == 6);
        for (uint32_t i = 0; i < 6; ++i) {
            CHECK(binds[i].slot == i);
        }
        CHECK(binds[4].handle == MATERIAL_TABLE_SET);
        CHECK(binds[5].handle == TEXTURE_ARRAY_SET);
        CHECK(encoder.count(PassEvent::Type::DrawIndexedIndirect) == 1);
    }

    TEST_CASE("shared slots are identical across strategies") {
        PassFixture f;
        RecordingRenderPassEncoder hostEncoder;
        RecordingRenderPassEncoder deviceEncoder;

        f.draw(hostEncoder, f.hostSet({{f.scene.cube, f.scene.stone, 0, 1}}), hostTextures());
        f.draw(deviceEncoder, f.deviceSet(1), deviceTextures());

        auto hostBinds = hostEncoder.bindGroups();
        auto deviceBinds = deviceEncoder.bindGroups();
        for (uint32_t i = 0; i < 4; ++i) {
            CHECK(hostBinds[i].slot == deviceBinds[i].slot);
            CHECK(hostBinds[i].handle == deviceBinds[i].handle);
        }
    }

    TEST_CASE("empty device set records bindings but no draw") {
        PassFixture f;
        RecordingRenderPassEncoder encoder;
        f.prepass(encoder, f.deviceSet(0), deviceTextures());
        CHECK(encoder.count(PassEvent::Type::DrawIndexedIndirect) == 0);
        CHECK(encoder.count(PassEvent::Type::SetPipeline) == 1);
    }

    TEST_CASE("empty host set records no draws") {
        PassFixture f;
        RecordingRenderPassEncoder encoder;
        f.draw(encoder, f.hostSet({}), hostTextures());
        CHECK(encoder.count(PassEvent::Type::DrawIndexed) == 0);
        CHECK(encoder.bindGroups().size() == 4);
    }

    TEST_CASE("strategy mismatch raises before anything is recorded") {
        PassFixture f;

        RecordingRenderPassEncoder hostWithDeviceTextures;
        CHECK_THROWS_AS(f.prepass(hostWithDeviceTextures, f.hostSet({{f.scene.cube, f.scene.stone, 0, 1}}),
                                  deviceTextures()),
                        StrategyMismatchError);
        CHECK(hostWithDeviceTextures.events.empty());

        RecordingRenderPassEncoder deviceWithHostTextures;
        CHECK_THROWS_AS(f.draw(deviceWithHostTextures, f.deviceSet(3), hostTextures()),
                        StrategyMismatchError);
        CHECK(deviceWithHostTextures.events.empty());
    }

    TEST_CASE("device set without a material table raises before recording") {
        PassFixture f;
        MaterialManager noTable;
        RecordingRenderPassEncoder encoder;
        CulledObjectSet culled = f.deviceSet(1);

        CHECK_THROWS_AS(f.pass.prepass(OpaquePassPrepassArgs{
                            encoder, f.scene.meshes, noTable,
                            fakeHandle<VkDescriptorSet>(SAMPLER_SET), deviceTextures(), culled}),
                        ContractViolation);
        CHECK(encoder.events.empty());
    }

    TEST_CASE("missing pipelines are rejected") {
        std::shared_ptr<const GraphicsPipeline> none;
        auto pipeline = std::make_shared<const GraphicsPipeline>();
        CHECK_THROWS_AS(OpaquePass{none, pipeline}, ContractViolation);
        CHECK_THROWS_AS(OpaquePass{pipeline, none}, ContractViolation);
    }
}
