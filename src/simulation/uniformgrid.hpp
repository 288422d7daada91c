#ifndef __UNIFORM_GRID_HPP
#define __UNIFORM_GRID_HPP

#include <algorithm>
#include <cassert>
#include <cmath>
#include <concepts>
#include <vector>

/**
 * @brief Concept for a callable that returns an item's coordinate as float.
 * @details Must be invocable as f(int index) -> float.
 */
template <typename F>
concept FloatGetter = requires(F f, int i) {
    { f(i) } -> std::convertible_to<float>;
};

/**
 * @brief Fixed-cell-size 2D spatial hash over a square region centred on an
 * arbitrary origin.
 *
 * @details
 * The region [min_x, min_x + extent) × [min_y, min_y + extent) is split into
 * square cells. After build(), every cell owns a contiguous run inside
 * @ref indices() (CSR layout): items of cell @c ci are
 * @c indices()[cell_start_at(ci) .. cell_start_at(ci) + cell_count_at(ci)).
 *
 * Items outside the region, or with non-finite coordinates, are clamped to
 * the nearest border cell so they still take part in neighbour queries.
 *
 * Typical usage:
 * @code
 * grid.resize(-R, -R, 2 * R, 2 * r, N);
 * grid.build(N, getX, getY);
 * grid.for_each_neighbor(x, y, [&](int j) { ... });
 * @endcode
 */
class UniformGrid {
  public:
    UniformGrid() = default;
    ~UniformGrid() = default;
    UniformGrid(const UniformGrid &) = delete;
    UniformGrid(UniformGrid &&) = delete;
    UniformGrid &operator=(const UniformGrid &) = delete;
    UniformGrid &operator=(UniformGrid &&) = delete;

    inline float min_x() const { return m_min_x; }
    inline float min_y() const { return m_min_y; }
    inline float extent() const { return m_extent; }
    inline float cell_size() const { return m_cell; }
    inline int cols() const { return m_cols; }
    inline int rows() const { return m_rows; }
    inline float inv_cell() const { return 1.0f / m_cell; }

    /**
     * @brief Map a point to clamped cell coordinates.
     */
    inline void cell_of(float x, float y, int &cx, int &cy) const {
        if (!std::isfinite(x) || !std::isfinite(y)) {
            x = m_min_x;
            y = m_min_y;
        }
        const float invc = 1.0f / m_cell;
        cx = std::clamp((int)std::floor((x - m_min_x) * invc), 0, m_cols - 1);
        cy = std::clamp((int)std::floor((y - m_min_y) * invc), 0, m_rows - 1);
    }

    /**
     * @brief Flat cell index for (cx, cy), or -1 if outside the grid.
     */
    inline int cell_index(int cx, int cy) const {
        if (cx < 0 || cy < 0 || cx >= m_cols || cy >= m_rows) {
            return -1;
        }
        return cy * m_cols + cx;
    }

    inline int cell_start_at(int ci) const { return m_cellStart[ci]; }
    inline int cell_count_at(int ci) const { return m_cellCount[ci]; }
    inline const std::vector<int> &indices() const { return m_indices; }

    /**
     * @brief Reinitialise the grid for a new region and item count.
     *
     * @param min_x  Left edge of the region.
     * @param min_y  Bottom edge of the region.
     * @param extent Side length of the square region (clamped to > 0).
     * @param cell   Cell side (clamped to > 0). Use at least the largest
     * interaction distance so a 3×3 neighbourhood is enough.
     * @param count  Number of items.
     */
    inline void resize(float min_x, float min_y, float extent, float cell,
                       int count) {
        m_min_x = min_x;
        m_min_y = min_y;
        m_extent = std::max(1e-3f, extent);
        m_cell = std::max(1e-3f, cell);

        m_cols = std::max(1, (int)std::ceil(m_extent / m_cell));
        m_rows = m_cols;

        const int C = m_cols * m_rows;
        m_cellStart.assign(C, 0);
        m_cellCount.assign(C, 0);
        m_cursor.assign(C, 0);
        m_indices.assign(count, -1);
        m_itemCell.assign(count, 0);
    }

    /**
     * @brief Bucket items into cells.
     *
     * @param count Number of items; must match the count given to resize().
     * @param getx  X accessor
     * @param gety  Y accessor
     */
    template <FloatGetter GetX, FloatGetter GetY>
    inline void build(int count, GetX getx, GetY gety) {
        if ((int)m_indices.size() != count)
            m_indices.assign(count, -1);
        if ((int)m_itemCell.size() != count)
            m_itemCell.assign(count, 0);
        std::fill(m_cellCount.begin(), m_cellCount.end(), 0);

#ifndef NDEBUG
        assert(m_cols > 0 && m_rows > 0);
        assert((int)m_cellStart.size() == m_cols * m_rows);
#endif

        for (int i = 0; i < count; ++i) {
            int cx, cy;
            cell_of(getx(i), gety(i), cx, cy);
            const int ci = cy * m_cols + cx;
            m_itemCell[i] = ci;
            m_cellCount[ci] += 1;
        }

        // exclusive scan over counts
        int running = 0;
        for (int ci = 0; ci < (int)m_cellStart.size(); ++ci) {
            m_cellStart[ci] = running;
            m_cursor[ci] = running;
            running += m_cellCount[ci];
        }

        for (int i = 0; i < count; ++i) {
            m_indices[m_cursor[m_itemCell[i]]++] = i;
        }
    }

    /**
     * @brief Visit every item in the 3×3 block of cells around (x, y).
     * @param fn Callable taking the item index
     */
    template <typename Fn>
    inline void for_each_neighbor(float x, float y, Fn &&fn) const {
        int cx, cy;
        cell_of(x, y, cx, cy);
        for (int dy = -1; dy <= 1; ++dy) {
            for (int dx = -1; dx <= 1; ++dx) {
                const int ci = cell_index(cx + dx, cy + dy);
                if (ci < 0) {
                    continue;
                }
                const int begin = m_cellStart[ci];
                const int end = begin + m_cellCount[ci];
                for (int pos = begin; pos < end; ++pos) {
                    fn(m_indices[pos]);
                }
            }
        }
    }

  private:
    float m_min_x = 0.f;
    float m_min_y = 0.f;
    float m_extent = 1.f;
    float m_cell = 1.f;
    int m_cols = 1;
    int m_rows = 1;

    std::vector<int> m_cellStart; // size rows*cols
    std::vector<int> m_cellCount; // size rows*cols
    std::vector<int> m_indices;   // size N, contiguous runs per cell

    // scratch reused across builds
    std::vector<int> m_itemCell; // size N
    std::vector<int> m_cursor;   // size rows*cols
};

#endif
