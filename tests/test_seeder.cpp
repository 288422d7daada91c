#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>

#include "simulation/seeder.hpp"

namespace {
float max_distance(const std::vector<Vector2> &ps) {
    float out = 0.f;
    for (const Vector2 &p : ps) {
        out = std::max(out, std::sqrt(p.x * p.x + p.y * p.y));
    }
    return out;
}
} // namespace

TEST_CASE("Same seed gives the same pile", "[seeder]") {
    BedConfig cfg;
    for (PileShape shape : {PileShape::Uniform, PileShape::Mountain}) {
        shakerbed::RandomSource a(2024);
        shakerbed::RandomSource b(2024);
        const auto pa = sample_pellets(cfg.pellet_count, shape, cfg, a);
        const auto pb = sample_pellets(cfg.pellet_count, shape, cfg, b);

        REQUIRE(pa.size() == size_t(cfg.pellet_count));
        REQUIRE(pa.size() == pb.size());
        for (size_t i = 0; i < pa.size(); ++i) {
            REQUIRE(pa[i].x == pb[i].x);
            REQUIRE(pa[i].y == pb[i].y);
        }
    }

    shakerbed::RandomSource c(1);
    shakerbed::RandomSource d(2);
    const auto pc = sample_pellets(10, PileShape::Uniform, cfg, c);
    const auto pd = sample_pellets(10, PileShape::Uniform, cfg, d);
    REQUIRE((pc[0].x != pd[0].x || pc[0].y != pd[0].y));
}

TEST_CASE("Reseeding replays the same pile", "[seeder]") {
    BedConfig cfg;
    shakerbed::RandomSource rng(77);
    const auto first = sample_pellets(50, PileShape::Mountain, cfg, rng);
    rng.reseed(77);
    const auto second = sample_pellets(50, PileShape::Mountain, cfg, rng);
    REQUIRE(first[49].x == second[49].x);
    REQUIRE(rng.seed() == 77u);
}

TEST_CASE("Piles fit their discs", "[seeder]") {
    BedConfig cfg;
    shakerbed::RandomSource rng(5);

    const auto uniform =
        sample_pellets(cfg.pellet_count, PileShape::Uniform, cfg, rng);
    REQUIRE(max_distance(uniform) <=
            cfg.bed_radius - 2.f * cfg.pellet_radius + 1e-4f);

    const auto mountain =
        sample_pellets(cfg.pellet_count, PileShape::Mountain, cfg, rng);
    REQUIRE(max_distance(mountain) <=
            cfg.bed_radius * cfg.mountain_fraction + 1e-4f);
    // the whole bed is used by the uniform pile
    REQUIRE(max_distance(uniform) > max_distance(mountain));

    REQUIRE(sample_pellets(0, PileShape::Uniform, cfg, rng).empty());
    REQUIRE(sample_pellets(-3, PileShape::Uniform, cfg, rng).empty());
}

TEST_CASE("Pile shape names", "[seeder]") {
    REQUIRE(pile_shape_name(PileShape::Uniform) == "uniform");
    REQUIRE(pile_shape_name(PileShape::Mountain) == "mountain");
}
