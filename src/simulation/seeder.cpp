#include "seeder.hpp"

#include <algorithm>
#include <cmath>

std::string_view pile_shape_name(PileShape shape) noexcept {
    switch (shape) {
    case PileShape::Uniform:
        return "uniform";
    case PileShape::Mountain:
        return "mountain";
    }
    return "unknown";
}

std::vector<Vector2> sample_pellets(int count, PileShape shape,
                                    const BedConfig &cfg,
                                    shakerbed::RandomSource &rng) {
    const float disc_radius =
        (shape == PileShape::Mountain)
            ? cfg.bed_radius * cfg.mountain_fraction
            : std::max(0.f, cfg.bed_radius - cfg.pellet_radius * 2.f);

    std::vector<Vector2> positions;
    positions.reserve(std::max(0, count));
    for (int i = 0; i < count; ++i) {
        const float r = std::sqrt(rng.uniform(0.f, 1.f)) * disc_radius;
        const float a = rng.uniform(0.f, 2.f * PI);
        positions.push_back(Vector2{r * std::cos(a), r * std::sin(a)});
    }
    return positions;
}
