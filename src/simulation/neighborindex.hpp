#pragma once

#include "uniformgrid.hpp"

/**
 * @brief Broad phase for pellet contacts
 * @details Keeps one UniformGrid covering the bed and only reallocates it when
 * the bed size, pellet size or pellet count changes. Positions are rebucketed
 * on every call.
 */
struct NeighborIndex {
    /** @brief The underlying spatial hash grid */
    UniformGrid grid;

    /** @brief Cached pellet count from last build */
    int lastN = -1;

    /** @brief Cached bed radius from last build */
    float lastRadius = -1.f;

    /** @brief Cached cell size from last build */
    float lastCell = -1.f;

    /**
     * @brief Rebuckets the given positions
     * @param px X positions (size n)
     * @param py Y positions (size n)
     * @param n Pellet count
     * @param bed_radius Bed radius; the grid covers [-R, R]²
     * @param cell Cell size, at least one pellet diameter
     */
    inline void ensure(const float *px, const float *py, int n,
                       float bed_radius, float cell) {
        if (n != lastN || bed_radius != lastRadius || cell != lastCell) {
            grid.resize(-bed_radius, -bed_radius, 2.f * bed_radius, cell, n);
            lastN = n;
            lastRadius = bed_radius;
            lastCell = cell;
        }
        grid.build(
            n,
            [px](int i) {
                return px[i];
            },
            [py](int i) {
                return py[i];
            });
    }
};
