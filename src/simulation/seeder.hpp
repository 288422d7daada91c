#pragma once

#include <string_view>
#include <vector>

#include <raylib.h>

#include "../utility/random.hpp"
#include "bed_config.hpp"

/**
 * @brief Initial pellet distribution
 */
enum class PileShape {
    /** @brief Uniform over the whole bed, one diameter clear of the rim */
    Uniform,
    /** @brief Uniform over a small disc at the bed centre */
    Mountain
};

std::string_view pile_shape_name(PileShape shape) noexcept;

/**
 * @brief Samples initial pellet centres uniformly by area inside a disc
 *
 * Radius is drawn as sqrt(u) * disc radius so density is even across the
 * disc. The same seed and shape always produce the same positions.
 *
 * @param count Number of pellets
 * @param shape Distribution to draw from
 * @param cfg Bed configuration (bed and pellet radius, mountain fraction)
 * @param rng Random source
 * @return Pellet centres in bed coordinates
 */
std::vector<Vector2> sample_pellets(int count, PileShape shape,
                                    const BedConfig &cfg,
                                    shakerbed::RandomSource &rng);
