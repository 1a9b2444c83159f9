#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <vector>

#include <glm/geometric.hpp>

#include "engine/physics/Collision.hpp"
#include "engine/physics/RayOcclusion.hpp"
#include "game/gameplay/Movement.hpp"
#include "game/maze/MazeGenerator.hpp"
#include "game/maze/MazeState.hpp"

using namespace trisolar;
using physics::Segment;

TEST_CASE("Closest point clamps to the segment ends", "[physics]")
{
    const Segment segment{{0.0F, 0.0F}, {10.0F, 0.0F}};

    const physics::ClosestPoint middle = physics::ClosestPointOnSegment({5.0F, 3.0F}, segment);
    CHECK(middle.point.x == Approx(5.0F));
    CHECK(middle.distanceSq == Approx(9.0F));

    const physics::ClosestPoint beyond = physics::ClosestPointOnSegment({14.0F, 3.0F}, segment);
    CHECK(beyond.point.x == Approx(10.0F));
    CHECK(beyond.distanceSq == Approx(25.0F));

    const Segment point{{2.0F, 2.0F}, {2.0F, 2.0F}};
    CHECK(physics::ClosestPointOnSegment({2.0F, 5.0F}, point).distanceSq == Approx(9.0F));
}

TEST_CASE("Circle is pushed out of a wall to exactly its radius", "[physics]")
{
    const std::vector<Segment> walls{Segment{{-5.0F, 0.0F}, {5.0F, 0.0F}}};

    const physics::ResolveResult result = physics::ResolveCircle({1.0F, 0.1F}, 0.4F, walls);
    CHECK(result.collided);
    CHECK(result.position.x == Approx(1.0F));
    CHECK(result.position.y == Approx(0.4F));
}

TEST_CASE("Circle clear of every wall is left alone", "[physics]")
{
    const std::vector<Segment> walls{Segment{{-5.0F, 0.0F}, {5.0F, 0.0F}}};

    const physics::ResolveResult result = physics::ResolveCircle({1.0F, 2.0F}, 0.4F, walls);
    CHECK_FALSE(result.collided);
    CHECK(result.iterations == 1);
    CHECK(result.position == glm::vec2{1.0F, 2.0F});
}

TEST_CASE("Centre on a wall is pushed along the left normal", "[physics]")
{
    const std::vector<Segment> walls{Segment{{-5.0F, 0.0F}, {5.0F, 0.0F}}};

    const physics::ResolveResult result = physics::ResolveCircle({0.0F, 0.0F}, 0.4F, walls);
    CHECK(result.collided);
    CHECK(result.position.x == Approx(0.0F).margin(1e-6));
    CHECK(result.position.y == Approx(0.4F));
}

TEST_CASE("Corner pockets resolve against both walls", "[physics]")
{
    const std::vector<Segment> walls{
        Segment{{0.0F, 0.0F}, {10.0F, 0.0F}},
        Segment{{0.0F, 0.0F}, {0.0F, 10.0F}},
    };

    const physics::ResolveResult result = physics::ResolveCircle({0.2F, 0.3F}, 0.4F, walls);
    CHECK(result.collided);
    for (const Segment& wall : walls)
    {
        CHECK(physics::ClosestPointOnSegment(result.position, wall).distanceSq >= Approx(0.16F).epsilon(1e-3));
    }
}

TEST_CASE("Grid neighbourhood matches the brute-force resolve", "[physics]")
{
    std::vector<Segment> walls;
    for (int i = -4; i <= 4; ++i)
    {
        walls.push_back(Segment{{static_cast<float>(i) * 10.0F, -40.0F}, {static_cast<float>(i) * 10.0F, 40.0F}});
    }

    physics::SegmentGrid grid(18, 10.0F);
    grid.Build(walls);

    for (const glm::vec2 sample : {glm::vec2{0.2F, 5.0F}, glm::vec2{9.9F, -12.0F}, glm::vec2{25.0F, 0.0F}})
    {
        const physics::ResolveResult fast = grid.ResolveCircleFast(sample, 0.4F, nullptr, {});
        const physics::ResolveResult full = physics::ResolveCircle(sample, 0.4F, walls);
        CHECK(fast.position.x == Approx(full.position.x));
        CHECK(fast.position.y == Approx(full.position.y));
    }

    std::vector<std::size_t> indices;
    grid.QueryNeighbourhood({0.0F, 0.0F}, indices);
    CHECK_FALSE(indices.empty());
    CHECK(indices.size() < walls.size());
}

TEST_CASE("Grid filter skips passable segments", "[physics]")
{
    const std::vector<Segment> walls{Segment{{-5.0F, 0.0F}, {5.0F, 0.0F}}};
    physics::SegmentGrid grid(18, 10.0F);
    grid.Build(walls);

    const physics::ResolveResult open = grid.ResolveCircleFast({1.0F, 0.1F}, 0.4F, [](std::size_t) { return false; }, {});
    CHECK_FALSE(open.collided);

    const std::vector<Segment> barrier{Segment{{-5.0F, 0.0F}, {5.0F, 0.0F}}};
    const physics::ResolveResult blocked = grid.ResolveCircleFast({1.0F, 0.1F}, 0.4F, [](std::size_t) { return false; }, barrier);
    CHECK(blocked.collided);
}

TEST_CASE("Ray hits a segment in front but not behind", "[physics][occlusion]")
{
    const Segment wall{{5.0F, -5.0F}, {5.0F, 5.0F}};
    CHECK(physics::RayIntersectsSegment({0.0F, 0.0F}, {1.0F, 0.0F}, wall));
    CHECK_FALSE(physics::RayIntersectsSegment({0.0F, 0.0F}, {-1.0F, 0.0F}, wall));
    CHECK_FALSE(physics::RayIntersectsSegment({0.0F, 0.0F}, {0.0F, 1.0F}, wall));
}

TEST_CASE("Hits within the minimum distance are ignored", "[physics][occlusion]")
{
    const Segment wall{{0.05F, -5.0F}, {0.05F, 5.0F}};
    CHECK_FALSE(physics::RayIntersectsSegment({0.0F, 0.0F}, {1.0F, 0.0F}, wall));

    const Segment further{{0.5F, -5.0F}, {0.5F, 5.0F}};
    CHECK(physics::RayIntersectsSegment({0.0F, 0.0F}, {1.0F, 0.0F}, further));
}

TEST_CASE("Ray past the segment end misses", "[physics][occlusion]")
{
    const Segment wall{{5.0F, 1.0F}, {5.0F, 5.0F}};
    CHECK_FALSE(physics::RayIntersectsSegment({0.0F, 0.0F}, {1.0F, 0.0F}, wall));
    CHECK(physics::IsRayBlocked({0.0F, 0.0F}, glm::normalize(glm::vec2{1.0F, 0.5F}), {wall}));
    CHECK_FALSE(physics::IsRayBlocked({0.0F, 0.0F}, {1.0F, 0.0F}, {}));
}

TEST_CASE("Forward input moves toward negative z at zero yaw", "[movement]")
{
    gameplay::PlayerInput input;
    input.forward = true;

    const glm::vec3 moved = gameplay::ApplyMovement(glm::vec3{0.0F}, input, 1.0F);
    CHECK(moved.x == Approx(0.0F).margin(1e-5));
    CHECK(moved.z == Approx(-gameplay::kDefaultPlayerSpeed));

    input.forward = false;
    input.right = true;
    const glm::vec3 strafed = gameplay::ApplyMovement(glm::vec3{0.0F}, input, 1.0F, 2.0F);
    CHECK(strafed.x == Approx(2.0F * gameplay::kDefaultPlayerSpeed));
}

TEST_CASE("Diagonal input is normalised and clamped to the map", "[movement]")
{
    gameplay::PlayerInput input;
    input.forward = true;
    input.right = true;

    const glm::vec3 moved = gameplay::ApplyMovement(glm::vec3{0.0F}, input, 1.0F);
    CHECK(std::sqrt(moved.x * moved.x + moved.z * moved.z) == Approx(gameplay::kDefaultPlayerSpeed));

    const glm::vec3 edge = gameplay::ApplyMovement(glm::vec3{89.0F, 0.0F, 0.0F}, input, 10.0F);
    CHECK(edge.x == Approx(maze::kMapHalfExtent));
}

TEST_CASE("Movement stops at closed maze walls", "[movement]")
{
    const maze::MazeLayout layout = maze::GenerateMaze(1234, 4);
    const maze::MazeState state = maze::CreateInitialMazeState(layout);
    gameplay::CollisionWorld world;
    world.Build(layout);
    world.Refresh(layout, state);

    // Walk straight at the north border from inside the top row.
    gameplay::MovementContext context;
    context.world = &world;
    gameplay::PlayerInput input;
    input.forward = true;

    glm::vec3 position{-85.0F, 0.0F, -85.0F};
    for (int i = 0; i < 40; ++i)
    {
        position = gameplay::ApplyMovement(position, input, 0.05F, 1.0F, &context);
    }
    CHECK(position.z >= -maze::kMapHalfExtent + physics::kPlayerRadius - 0.01F);
}

TEST_CASE("Fast movement never tunnels through a thin wall", "[movement]")
{
    maze::MazeLayout layout;
    maze::WallSegment wall;
    wall.id = "wall_test";
    wall.start = glm::vec2{0.0F, -5.0F};
    wall.end = glm::vec2{0.0F, 5.0F};
    layout.walls.push_back(wall);
    const maze::MazeState state;

    gameplay::CollisionWorld world;
    world.Build(layout);
    world.Refresh(layout, state);

    gameplay::MovementContext context;
    context.world = &world;
    gameplay::PlayerInput input;
    input.right = true;

    // Flash triples speed: one 20 Hz input covers 0.75 m, almost two radii.
    constexpr float kFlashMultiplier = 3.0F;
    glm::vec3 position{-physics::kPlayerRadius, 0.0F, 0.0F};
    for (int i = 0; i < 20; ++i)
    {
        position = gameplay::ApplyMovement(position, input, 0.05F, kFlashMultiplier, &context);
        REQUIRE(position.x < 0.0F);
    }
    CHECK(position.x == Approx(-physics::kPlayerRadius).margin(1e-3));

    // A longer single step still stops at the wall.
    const glm::vec3 dashed = gameplay::ApplyMovement(glm::vec3{-2.0F, 0.0F, 1.0F}, input, 0.25F, kFlashMultiplier, &context);
    CHECK(dashed.x == Approx(-physics::kPlayerRadius).margin(1e-3));
    CHECK(dashed.z == Approx(1.0F));
}

TEST_CASE("Non-finite yaw leaves the player in place", "[movement]")
{
    const maze::MazeLayout layout = maze::GenerateMaze(1234, 4);
    const maze::MazeState state = maze::CreateInitialMazeState(layout);
    gameplay::CollisionWorld world;
    world.Build(layout);
    world.Refresh(layout, state);

    gameplay::MovementContext context;
    context.world = &world;
    gameplay::PlayerInput input;
    input.forward = true;
    input.yaw = std::numeric_limits<float>::quiet_NaN();

    const glm::vec3 start{1.0F, 0.0F, 2.0F};
    const glm::vec3 moved = gameplay::ApplyMovement(start, input, 0.05F, 1.0F, &context);
    CHECK(moved == start);
}

TEST_CASE("Grid queries off the map or at NaN find nothing", "[physics]")
{
    physics::SegmentGrid grid(4, 10.0F);
    grid.Build({Segment{{-20.0F, -20.0F}, {20.0F, -20.0F}}});

    std::vector<std::size_t> indices;
    grid.QueryNeighbourhood({std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::quiet_NaN()}, indices);
    CHECK(indices.empty());
    grid.QueryNeighbourhood({1.0e9F, 1.0e9F}, indices);
    CHECK(indices.empty());
    grid.QueryNeighbourhood({-15.0F, -15.0F}, indices);
    CHECK(indices.size() == 1);
}

TEST_CASE("Gravity slows players only above one g", "[movement]")
{
    CHECK(gameplay::GravitySlowdown(0.3F) == Approx(1.0F));
    CHECK(gameplay::GravitySlowdown(1.0F) == Approx(1.0F));
    CHECK(gameplay::GravitySlowdown(4.0F) == Approx(0.5F));
}
