#include <doctest/doctest.h>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

#include "TestScene.h"
#include "culling/Frustum.h"

TEST_SUITE("Frustum") {
    TEST_CASE("planes are normalized") {
        Frustum frustum = Frustum::fromViewProj(makeTestCamera().viewProj());
        for (const auto& plane : frustum.planes) {
            CHECK(glm::length(glm::vec3(plane)) == doctest::Approx(1.0f));
        }
    }

    TEST_CASE("near and far planes follow 0..1 depth") {
        Frustum frustum = Frustum::fromViewProj(makeTestCamera().viewProj());
        const glm::vec4& nearPlane = frustum.planes[4];
        const glm::vec4& farPlane = frustum.planes[5];

        // Camera looks down -Z: near plane at z = -0.1, far plane at z = -100
        CHECK(nearPlane.z == doctest::Approx(-1.0f));
        CHECK(nearPlane.w == doctest::Approx(-0.1f).epsilon(0.01));
        CHECK(farPlane.z == doctest::Approx(1.0f));
        CHECK(farPlane.w == doctest::Approx(100.0f).epsilon(0.01));
    }

    TEST_CASE("sphere in front of the camera is visible") {
        Frustum frustum = Frustum::fromViewProj(makeTestCamera().viewProj());
        CHECK(frustum.intersectsSphere({glm::vec3(0.0f, 0.0f, -10.0f), 1.0f}));
    }

    TEST_CASE("sphere behind the camera is culled") {
        Frustum frustum = Frustum::fromViewProj(makeTestCamera().viewProj());
        CHECK_FALSE(frustum.intersectsSphere({glm::vec3(0.0f, 0.0f, 10.0f), 1.0f}));
    }

    TEST_CASE("sphere beyond the far plane is culled") {
        Frustum frustum = Frustum::fromViewProj(makeTestCamera().viewProj());
        CHECK_FALSE(frustum.intersectsSphere({glm::vec3(0.0f, 0.0f, -150.0f), 1.0f}));
    }

    TEST_CASE("sphere straddling a side plane is visible") {
        Frustum frustum = Frustum::fromViewProj(makeTestCamera().viewProj());
        // Half-width at z = -10 is 10 * tan(30deg) ~= 5.77
        CHECK(frustum.intersectsSphere({glm::vec3(6.0f, 0.0f, -10.0f), 1.0f}));
        CHECK_FALSE(frustum.intersectsSphere({glm::vec3(9.0f, 0.0f, -10.0f), 1.0f}));
    }

    TEST_CASE("transformed sphere uses the largest axis scale") {
        BoundingSphere local{glm::vec3(1.0f, 0.0f, 0.0f), 2.0f};
        glm::mat4 transform = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 5.0f, 0.0f));
        transform = glm::scale(transform, glm::vec3(1.0f, 3.0f, 2.0f));

        BoundingSphere world = local.transformed(transform);
        CHECK(world.center.x == doctest::Approx(1.0f));
        CHECK(world.center.y == doctest::Approx(5.0f));
        CHECK(world.radius == doctest::Approx(6.0f));
    }

    TEST_CASE("sphere from AABB encloses the box") {
        AABB box;
        box.expand(glm::vec3(-1.0f, -2.0f, -3.0f));
        box.expand(glm::vec3(1.0f, 2.0f, 3.0f));
        REQUIRE(box.isValid());

        BoundingSphere sphere = BoundingSphere::fromAABB(box);
        CHECK(sphere.center == glm::vec3(0.0f));
        CHECK(sphere.radius == doctest::Approx(std::sqrt(14.0f)));
    }
}
