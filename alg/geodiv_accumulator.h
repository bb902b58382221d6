/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Per-zone running aggregates
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GEODIV_ACCUMULATOR_H_INCLUDED
#define GEODIV_ACCUMULATOR_H_INCLUDED

#include "cpl_port.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

//! @cond Doxygen_Suppress

namespace geodiv
{

/** Opaque, hashable category label. Integral codes and text codes never
 * compare equal to each other. */
using CategoryCode = std::variant<GIntBig, std::string>;

/** Category code -> accumulated weight (count or area) */
using CategoryTally = std::unordered_map<CategoryCode, double>;

struct AccumulatorOptions
{
    bool store_categories = false;
    bool calc_variance = false;
    bool calc_circular = false;
    bool track_slope = false;
    /** Number of nested relief levels, 0 to disable */
    int relief_levels = 0;

    bool operator==(const AccumulatorOptions &other) const
    {
        return store_categories == other.store_categories &&
               calc_variance == other.calc_variance &&
               calc_circular == other.calc_circular &&
               track_slope == other.track_slope &&
               relief_levels == other.relief_levels;
    }

    bool operator!=(const AccumulatorOptions &other) const
    {
        return !(*this == other);
    }
};

class WestVariance
{
    /** \brief Incremental population variance, formula WV2 of West, D.H.D.
     * (1979) "Updating Mean and Variance Estimates: An Improved Method".
     * Communications of the ACM 22(9), with unit weights.
     */

  private:
    double sum_w = 0;
    double mean_ = 0;
    double t = 0;

  public:
    void process(double x)
    {
        const double mean_old = mean_;

        sum_w += 1;
        mean_ += (x - mean_old) / sum_w;
        t += (x - mean_old) * (x - mean_);
    }

    double count() const
    {
        return sum_w;
    }

    double mean() const
    {
        return mean_;
    }

    /** \brief Return the population variance, or NaN when empty.
     */
    double variance() const
    {
        if (sum_w == 0)
            return std::numeric_limits<double>::quiet_NaN();
        // t can go very slightly negative through rounding
        return std::max(0.0, t / sum_w);
    }

    double stdev() const
    {
        return std::sqrt(variance());
    }
};

/************************************************************************/
/*                            ReliefWindows                             */
/************************************************************************/

/** Min/max elevation over the finest level of 2^(L-1) x 2^(L-1) nested
 * windows covering a zone's bounding box. Coarser levels are derived by
 * merging blocks of finer windows. */
class ReliefWindows
{
  public:
    explicit ReliefWindows(int levels)
        : m_levels(levels), m_side(levels > 0 ? (1 << (levels - 1)) : 0)
    {
    }

    int levels() const
    {
        return m_levels;
    }

    /** Number of windows along one axis at the finest level */
    int finest_side() const
    {
        return m_side;
    }

    void process(int ix, int iy, double z)
    {
        if (m_side == 0)
            return;
        if (m_min.empty())
        {
            const size_t n = static_cast<size_t>(m_side) * m_side;
            m_min.assign(n, std::numeric_limits<double>::infinity());
            m_max.assign(n, -std::numeric_limits<double>::infinity());
        }
        ix = std::clamp(ix, 0, m_side - 1);
        iy = std::clamp(iy, 0, m_side - 1);
        const size_t i = static_cast<size_t>(iy) * m_side + ix;
        m_min[i] = std::min(m_min[i], z);
        m_max[i] = std::max(m_max[i], z);
    }

    /** Sum of (max - min) over the occupied windows of a level, where level 0
     * is the whole bounding box. */
    double sum_of_ranges(int level) const
    {
        if (m_min.empty() || level < 0 || level >= m_levels)
            return 0;
        const int side = 1 << level;
        const int block = m_side / side;
        double sum = 0;
        for (int wy = 0; wy < side; ++wy)
        {
            for (int wx = 0; wx < side; ++wx)
            {
                double lo = std::numeric_limits<double>::infinity();
                double hi = -std::numeric_limits<double>::infinity();
                for (int y = wy * block; y < (wy + 1) * block; ++y)
                {
                    for (int x = wx * block; x < (wx + 1) * block; ++x)
                    {
                        const size_t i = static_cast<size_t>(y) * m_side + x;
                        lo = std::min(lo, m_min[i]);
                        hi = std::max(hi, m_max[i]);
                    }
                }
                if (lo <= hi)
                    sum += hi - lo;
            }
        }
        return sum;
    }

  private:
    int m_levels;
    int m_side;
    std::vector<double> m_min{};
    std::vector<double> m_max{};
};

/************************************************************************/
/*                              ZoneStats                               */
/************************************************************************/

class ZoneStats
{
  public:
    explicit ZoneStats(const AccumulatorOptions &options)
        : m_options{options}, m_relief{options.relief_levels}
    {
    }

    void add_element()
    {
        m_count++;
    }

    void add_category(const CategoryCode &code, double weight)
    {
        if (m_options.store_categories)
            m_categories[code] += weight;
    }

    void add_length(double length)
    {
        m_sum_length += length;
    }

    void add_value(double x)
    {
        m_count++;
        if (m_options.calc_variance)
            m_variance.process(x);
    }

    /** @param theta angle in radians */
    void add_angle(double theta)
    {
        m_count++;
        if (m_options.calc_circular)
        {
            m_sum_cos += std::cos(theta);
            m_sum_sin += std::sin(theta);
        }
    }

    void add_relief(int ix, int iy, double z)
    {
        m_count++;
        m_relief.process(ix, iy, z);
    }

    void add_slope(double slope)
    {
        if (m_options.track_slope)
            m_slope.process(slope);
    }

    void mark_nodata()
    {
        m_saw_nodata = true;
    }

    GIntBig count() const
    {
        return m_count;
    }

    const CategoryTally &categories() const
    {
        return m_categories;
    }

    double sum_length() const
    {
        return m_sum_length;
    }

    const WestVariance &variance() const
    {
        return m_variance;
    }

    double sum_cos() const
    {
        return m_sum_cos;
    }

    double sum_sin() const
    {
        return m_sum_sin;
    }

    const ReliefWindows &relief() const
    {
        return m_relief;
    }

    /** Mean slope of the zone, NaN if no slope sample was seen */
    double mean_slope() const
    {
        return m_slope.count() > 0
                   ? m_slope.mean()
                   : std::numeric_limits<double>::quiet_NaN();
    }

    bool saw_nodata() const
    {
        return m_saw_nodata;
    }

  private:
    AccumulatorOptions m_options;
    GIntBig m_count = 0;
    CategoryTally m_categories{};
    double m_sum_length = 0;
    WestVariance m_variance{};
    double m_sum_cos = 0;
    double m_sum_sin = 0;
    ReliefWindows m_relief;
    WestVariance m_slope{};
    bool m_saw_nodata = false;
};

/** Zone identifier -> aggregates. An entry only exists once a feature or
 * sample has been routed to the zone. */
class ZoneAccumulators
{
  public:
    explicit ZoneAccumulators(const AccumulatorOptions &options)
        : m_options(options)
    {
    }

    ZoneStats &operator[](GIntBig zone_id)
    {
        auto it = m_stats.find(zone_id);
        if (it == m_stats.end())
            it = m_stats.emplace(zone_id, ZoneStats(m_options)).first;
        return it->second;
    }

    const ZoneStats *find(GIntBig zone_id) const
    {
        auto it = m_stats.find(zone_id);
        return it == m_stats.end() ? nullptr : &(it->second);
    }

    size_t size() const
    {
        return m_stats.size();
    }

    const AccumulatorOptions &options() const
    {
        return m_options;
    }

  private:
    AccumulatorOptions m_options;
    std::unordered_map<GIntBig, ZoneStats> m_stats{};
};

}  // namespace geodiv

//! @endcond

#endif  // GEODIV_ACCUMULATOR_H_INCLUDED
