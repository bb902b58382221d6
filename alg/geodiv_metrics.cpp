/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Reduction of per-zone aggregates into diversity indices
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_priv.h"

#include <algorithm>
#include <cfloat>
#include <cmath>

namespace geodiv
{

/************************************************************************/
/*                       GetAccumulatorOptions()                        */
/************************************************************************/

AccumulatorOptions GetAccumulatorOptions(const Options &oOptions)
{
    AccumulatorOptions sAccOptions;
    switch (oOptions.eMetric)
    {
        case Metric::A_NC:
        case Metric::A_SHDI:
        case Metric::P_NC:
        case Metric::P_HU:
            sAccOptions.store_categories = true;
            break;

        case Metric::R_SD:
            sAccOptions.calc_variance = true;
            break;

        case Metric::R_SDC:
            sAccOptions.calc_circular = true;
            sAccOptions.track_slope = oOptions.bHasSlopeThreshold;
            break;

        case Metric::R_M:
            sAccOptions.relief_levels = oOptions.GetReliefScales();
            break;

        case Metric::A_NE:
        case Metric::L_TL:
        case Metric::P_NE:
            break;
    }
    return sAccOptions;
}

/************************************************************************/
/*                            ShannonIndex()                            */
/************************************************************************/

/** -sum(p_i * ln(p_i)) over the category weights. 0 for an empty tally. */
double ShannonIndex(const CategoryTally &oTally)
{
    double dfTotal = 0;
    for (const auto &oIter : oTally)
        dfTotal += oIter.second;
    if (!(dfTotal > 0))
        return 0.0;

    double dfH = 0.0;
    for (const auto &oIter : oTally)
    {
        const double dfWeight = oIter.second;
        if (!(dfWeight > 0))
            continue;
        const double p = dfWeight / dfTotal;
        dfH -= p * std::log(p);
    }
    // A single category gives -1 * ln(1) == -0
    return std::max(0.0, dfH);
}

/************************************************************************/
/*                        MeanResultantLength()                         */
/************************************************************************/

double MeanResultantLength(double dfSumCos, double dfSumSin, double dfCount)
{
    if (!(dfCount > 0))
        return 0;
    const double dfR = std::sqrt(dfSumCos * dfSumCos + dfSumSin * dfSumSin);
    return std::clamp(dfR / dfCount, 0.0, 1.0);
}

/************************************************************************/
/*                           CircularStdDev()                           */
/************************************************************************/

/** sqrt(-2 ln(R)) in radians. R is floored at DBL_MIN so that uniformly
 * dispersed samples give a large finite value. */
double CircularStdDev(double dfSumCos, double dfSumSin, double dfCount)
{
    const double dfRBar =
        std::max(MeanResultantLength(dfSumCos, dfSumSin, dfCount), DBL_MIN);
    return std::sqrt(-2.0 * std::log(dfRBar));
}

/************************************************************************/
/*                            ReliefIndex()                             */
/************************************************************************/

/** Steinhaus-style relief. With V_k the sum of window ranges at level k
 * divided by 2^k, the index is V_0 plus, for each finer level, the part of
 * V_k exceeding V_(k-1). A planar surface gives the same value whatever the
 * number of levels; only roughness visible at a finer level adds to it. */
double ReliefIndex(const ReliefWindows &oWindows)
{
    if (oWindows.levels() <= 0)
        return 0;
    double dfPrev = oWindows.sum_of_ranges(0);
    double dfTotal = dfPrev;
    for (int k = 1; k < oWindows.levels(); ++k)
    {
        const double dfLevel =
            oWindows.sum_of_ranges(k) / static_cast<double>(1 << k);
        dfTotal += std::max(0.0, dfLevel - dfPrev);
        dfPrev = dfLevel;
    }
    return dfTotal;
}

/************************************************************************/
/*                          ComputeZoneValue()                          */
/************************************************************************/

ZoneValue ComputeZoneValue(const Options &oOptions, GIntBig nZoneId,
                           const ZoneStats *poStats, double dfZoneArea,
                           bool *pbSparse)
{
    ZoneValue sValue;
    sValue.nZoneId = nZoneId;
    sValue.bNoData = true;
    *pbSparse = false;

    const Metric eMetric = oOptions.eMetric;
    const bool bEmpty =
        poStats == nullptr ||
        (poStats->count() == 0 && poStats->sum_length() == 0 &&
         poStats->categories().empty());
    if (bEmpty)
    {
        if (IsCountMetric(eMetric))
        {
            sValue.dfValue = 0;
            sValue.bNoData = false;
        }
        return sValue;
    }

    if (GetMetricInputKind(eMetric) == InputKind::RASTER &&
        !oOptions.bIgnoreNoData && poStats->saw_nodata())
    {
        return sValue;
    }

    const auto SetValue = [&sValue](double dfValue)
    {
        sValue.dfValue = dfValue;
        sValue.bNoData = false;
    };

    switch (eMetric)
    {
        case Metric::A_NE:
        case Metric::P_NE:
            SetValue(static_cast<double>(poStats->count()));
            break;

        case Metric::A_NC:
        case Metric::P_NC:
            if (!poStats->categories().empty())
                SetValue(static_cast<double>(poStats->categories().size()));
            break;

        case Metric::A_SHDI:
        case Metric::P_HU:
        {
            double dfTotal = 0;
            for (const auto &oIter : poStats->categories())
                dfTotal += oIter.second;
            if (dfTotal > 0)
                SetValue(ShannonIndex(poStats->categories()));
            break;
        }

        case Metric::L_TL:
            SetValue(poStats->sum_length());
            break;

        case Metric::R_SD:
            if (poStats->variance().count() > 0)
                SetValue(poStats->variance().stdev());
            break;

        case Metric::R_SDC:
        {
            if (poStats->count() < 2)
            {
                *pbSparse = true;
                break;
            }
            if (oOptions.bHasSlopeThreshold)
            {
                const double dfMeanSlope = poStats->mean_slope();
                if (!std::isnan(dfMeanSlope) &&
                    dfMeanSlope < oOptions.dfSlopeThreshold)
                {
                    SetValue(0.0);
                    break;
                }
            }
            double dfSD =
                CircularStdDev(poStats->sum_cos(), poStats->sum_sin(),
                               static_cast<double>(poStats->count()));
            if (oOptions.bOutputDegrees)
                dfSD *= 180.0 / M_PI;
            SetValue(dfSD);
            break;
        }

        case Metric::R_M:
        {
            if (poStats->count() < 2)
            {
                *pbSparse = true;
                break;
            }
            double dfRelief = ReliefIndex(poStats->relief());
            if (oOptions.bReliefNormalizeByArea && dfZoneArea > 0)
                dfRelief /= std::sqrt(dfZoneArea);
            SetValue(dfRelief);
            break;
        }
    }

    return sValue;
}

/************************************************************************/
/*                         StandardizeMinMax()                          */
/************************************************************************/

/** Rescale to [0,1] across zones. Constant input maps to 0. */
std::vector<ZoneValue> StandardizeMinMax(const std::vector<ZoneValue> &aoIn)
{
    double dfMin = 0;
    double dfMax = 0;
    bool bFirst = true;
    for (const auto &sValue : aoIn)
    {
        if (sValue.bNoData)
            continue;
        if (bFirst)
        {
            dfMin = sValue.dfValue;
            dfMax = sValue.dfValue;
            bFirst = false;
        }
        else
        {
            dfMin = std::min(dfMin, sValue.dfValue);
            dfMax = std::max(dfMax, sValue.dfValue);
        }
    }

    std::vector<ZoneValue> aoOut(aoIn);
    const double dfRange = dfMax - dfMin;
    for (auto &sValue : aoOut)
    {
        if (sValue.bNoData)
            continue;
        sValue.dfValue = dfRange > 0 ? (sValue.dfValue - dfMin) / dfRange : 0.0;
    }
    return aoOut;
}

}  // namespace geodiv
