/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Test index formulas and option parsing
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_priv.h"

#include "cpl_conv.h"
#include "cpl_error.h"
#include "cpl_string.h"

#include "gtest/gtest.h"

#include <cmath>
#include <limits>

namespace
{

using namespace geodiv;

struct test_geodiv_metrics : public ::testing::Test
{
};

static Options MakeOptions(Metric eMetric)
{
    Options oOptions;
    oOptions.eMetric = eMetric;
    oOptions.bMetricSet = true;
    return oOptions;
}

TEST_F(test_geodiv_metrics, metric_codes)
{
    Metric eMetric = Metric::P_NE;
    ASSERT_TRUE(ParseMetricCode("r-sdc", &eMetric));
    EXPECT_EQ(eMetric, Metric::R_SDC);
    ASSERT_TRUE(ParseMetricCode("A_SHDI", &eMetric));
    EXPECT_EQ(eMetric, Metric::A_SHDI);
    EXPECT_FALSE(ParseMetricCode("A_Foo", &eMetric));
    EXPECT_FALSE(ParseMetricCode(nullptr, &eMetric));

    EXPECT_EQ(GetAllMetrics().size(), 10U);
    for (const Metric e : GetAllMetrics())
    {
        Metric eParsed = Metric::P_NE;
        ASSERT_TRUE(ParseMetricCode(GetMetricCode(e), &eParsed));
        EXPECT_EQ(eParsed, e);
    }

    EXPECT_EQ(GetMetricInputKind(Metric::L_TL), InputKind::LINE);
    EXPECT_EQ(GetMetricInputKind(Metric::P_HU), InputKind::POINT);
    EXPECT_EQ(GetMetricInputKind(Metric::R_M), InputKind::RASTER);
    EXPECT_TRUE(IsCountMetric(Metric::A_NE));
    EXPECT_FALSE(IsCountMetric(Metric::A_NC));
    EXPECT_TRUE(IsCategoricalMetric(Metric::P_NC));
    EXPECT_FALSE(IsCategoricalMetric(Metric::L_TL));
}

TEST_F(test_geodiv_metrics, options_init)
{
    {
        CPLStringList aosOptions;
        aosOptions.SetNameValue("METRIC", "R_M");
        aosOptions.SetNameValue("RELIEF_SCALES", "3");
        aosOptions.SetNameValue("IGNORE_NODATA", "NO");
        aosOptions.SetNameValue("NODATA_VALUE", "-9999");
        Options oOptions;
        ASSERT_EQ(oOptions.Init(aosOptions.List()), CE_None);
        EXPECT_TRUE(oOptions.bMetricSet);
        EXPECT_EQ(oOptions.eMetric, Metric::R_M);
        EXPECT_EQ(oOptions.GetReliefScales(), 3);
        EXPECT_FALSE(oOptions.bIgnoreNoData);
        EXPECT_TRUE(oOptions.bHasNoDataValue);
        EXPECT_EQ(oOptions.dfNoDataValue, -9999.0);
    }
    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        CPLStringList aosOptions;
        aosOptions.SetNameValue("METRIC", "P_Ne");
        aosOptions.SetNameValue("BAND", "0");
        Options oOptions;
        EXPECT_EQ(oOptions.Init(aosOptions.List()), CE_Failure);
    }
    for (const char *pszBad : {"1.5", "x", "2x", "-3", "99999999999"})
    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        CPLStringList aosOptions;
        aosOptions.SetNameValue("METRIC", "R_SD");
        aosOptions.SetNameValue("BAND", pszBad);
        Options oOptions;
        EXPECT_EQ(oOptions.Init(aosOptions.List()), CE_Failure) << pszBad;
    }
    {
        CPLStringList aosOptions;
        aosOptions.SetNameValue("METRIC", "R_SD");
        aosOptions.SetNameValue("BAND", "2");
        aosOptions.SetNameValue("SLOPE_BAND", "3");
        Options oOptions;
        ASSERT_EQ(oOptions.Init(aosOptions.List()), CE_None);
        EXPECT_EQ(oOptions.nBand, 2);
        EXPECT_EQ(oOptions.nSlopeBand, 3);
    }
    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        CPLStringList aosOptions;
        aosOptions.SetNameValue("METRIC", "nope");
        Options oOptions;
        EXPECT_EQ(oOptions.Init(aosOptions.List()), CE_Failure);
    }
    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        CPLStringList aosOptions;
        aosOptions.SetNameValue("ANGLE_UNIT", "GRADIANS");
        Options oOptions;
        EXPECT_EQ(oOptions.Init(aosOptions.List()), CE_Failure);
    }
    {
        Options oOptions;
        CPLConfigOptionSetter oSetter("GEODIV_RELIEF_SCALES", "4", false);
        EXPECT_EQ(oOptions.GetReliefScales(), 4);
    }
}

TEST_F(test_geodiv_metrics, shannon_index)
{
    CategoryTally oTally;
    EXPECT_EQ(ShannonIndex(oTally), 0.0);

    oTally[CategoryCode(GIntBig(1))] = 12;
    EXPECT_EQ(ShannonIndex(oTally), 0.0);

    oTally[CategoryCode(GIntBig(2))] = 12;
    EXPECT_NEAR(ShannonIndex(oTally), std::log(2.0), 1e-12);

    oTally[CategoryCode(std::string("3"))] = 12;
    oTally[CategoryCode(std::string("4"))] = 12;
    EXPECT_NEAR(ShannonIndex(oTally), std::log(4.0), 1e-12);

    // Uneven proportions are below the maximum
    oTally[CategoryCode(GIntBig(1))] = 100;
    EXPECT_LT(ShannonIndex(oTally), std::log(4.0));
    EXPECT_GT(ShannonIndex(oTally), 0.0);
}

TEST_F(test_geodiv_metrics, category_codes)
{
    CategoryCode oCode;
    EXPECT_TRUE(ToCategoryCode(CategoryValue(GIntBig(7)), &oCode));
    EXPECT_EQ(oCode, CategoryCode(GIntBig(7)));

    EXPECT_TRUE(ToCategoryCode(CategoryValue(3.0), &oCode));
    EXPECT_EQ(oCode, CategoryCode(GIntBig(3)));

    EXPECT_FALSE(ToCategoryCode(CategoryValue(3.5), &oCode));
    EXPECT_FALSE(ToCategoryCode(
        CategoryValue(std::numeric_limits<double>::quiet_NaN()), &oCode));
    EXPECT_FALSE(ToCategoryCode(CategoryValue(std::string()), &oCode));
    EXPECT_FALSE(ToCategoryCode(CategoryValue(), &oCode));

    EXPECT_TRUE(ToCategoryCode(CategoryValue(std::string("1")), &oCode));
    EXPECT_NE(oCode, CategoryCode(GIntBig(1)));
}

TEST_F(test_geodiv_metrics, circular_std_dev)
{
    const double dfTheta = 40.0 * M_PI / 180.0;
    EXPECT_NEAR(CircularStdDev(5 * std::cos(dfTheta), 5 * std::sin(dfTheta), 5),
                0.0, 1e-7);

    const auto SpreadSD = [](double dfHalfSpreadDeg)
    {
        const double a = (90 - dfHalfSpreadDeg) * M_PI / 180.0;
        const double b = (90 + dfHalfSpreadDeg) * M_PI / 180.0;
        return CircularStdDev(std::cos(a) + std::cos(b),
                              std::sin(a) + std::sin(b), 2);
    };
    EXPECT_LT(SpreadSD(5), SpreadSD(20));
    EXPECT_LT(SpreadSD(20), SpreadSD(60));

    // Opposite directions cancel out: large but finite
    const double dfOpposite = SpreadSD(90);
    EXPECT_TRUE(std::isfinite(dfOpposite));
    EXPECT_GT(dfOpposite, SpreadSD(60));

    EXPECT_EQ(MeanResultantLength(0, 0, 0), 0.0);
}

TEST_F(test_geodiv_metrics, west_variance)
{
    const double adfValues[] = {2, 4, 4, 4, 5, 5, 7, 9};

    WestVariance oPlain;
    WestVariance oShifted;
    WestVariance oScaled;
    for (const double dfVal : adfValues)
    {
        oPlain.process(dfVal);
        oShifted.process(dfVal + 1e6);
        oScaled.process(dfVal * 3);
    }
    EXPECT_NEAR(oPlain.stdev(), 2.0, 1e-12);
    EXPECT_NEAR(oShifted.stdev(), 2.0, 1e-8);
    EXPECT_NEAR(oScaled.stdev(), 6.0, 1e-12);
    EXPECT_EQ(oPlain.count(), 8.0);
    EXPECT_NEAR(oPlain.mean(), 5.0, 1e-12);

    WestVariance oEmpty;
    EXPECT_TRUE(std::isnan(oEmpty.variance()));
}

TEST_F(test_geodiv_metrics, relief_windows)
{
    // 4x4 cells, value increasing with the column: 0, 100/3, 200/3, 100
    ReliefWindows oWindows(2);
    EXPECT_EQ(oWindows.finest_side(), 2);
    for (int iy = 0; iy < 4; ++iy)
    {
        for (int ix = 0; ix < 4; ++ix)
            oWindows.process(ix / 2, iy / 2, ix * 100.0 / 3);
    }
    EXPECT_NEAR(oWindows.sum_of_ranges(0), 100.0, 1e-9);
    EXPECT_NEAR(oWindows.sum_of_ranges(1), 4 * 100.0 / 3, 1e-9);
    // A ramp is fully counted at the coarsest level
    EXPECT_NEAR(ReliefIndex(oWindows), 100.0, 1e-9);

    // Each quarter spans the full range: the finer level adds the excess
    ReliefWindows oRough(2);
    for (int iy = 0; iy < 2; ++iy)
    {
        for (int ix = 0; ix < 2; ++ix)
        {
            oRough.process(ix, iy, 0);
            oRough.process(ix, iy, 100);
        }
    }
    EXPECT_NEAR(oRough.sum_of_ranges(1), 400.0, 1e-9);
    EXPECT_NEAR(ReliefIndex(oRough), 100.0 + (200.0 - 100.0), 1e-9);

    ReliefWindows oSingle(1);
    oSingle.process(0, 0, 10);
    oSingle.process(5, 5, 25);
    EXPECT_NEAR(ReliefIndex(oSingle), 15.0, 1e-12);
}

TEST_F(test_geodiv_metrics, relief_independent_of_scale_count)
{
    // 64x64 planar ramp of range 100
    for (int nLevels = 1; nLevels <= 4; ++nLevels)
    {
        ReliefWindows oWindows(nLevels);
        const int nSide = oWindows.finest_side();
        for (int iy = 0; iy < 64; ++iy)
        {
            for (int ix = 0; ix < 64; ++ix)
                oWindows.process(ix * nSide / 64, iy * nSide / 64,
                                 ix * 100.0 / 63);
        }
        EXPECT_NEAR(ReliefIndex(oWindows), 100.0, 1e-9) << nLevels;
    }
}

TEST_F(test_geodiv_metrics, empty_zone_values)
{
    bool bSparse = true;
    auto sValue = ComputeZoneValue(MakeOptions(Metric::P_NE), 4, nullptr, 1.0,
                                   &bSparse);
    EXPECT_EQ(sValue.nZoneId, 4);
    EXPECT_FALSE(sValue.bNoData);
    EXPECT_EQ(sValue.dfValue, 0.0);
    EXPECT_FALSE(bSparse);

    for (const Metric eMetric : {Metric::P_NC, Metric::P_HU, Metric::A_SHDI,
                                 Metric::L_TL, Metric::R_SD, Metric::R_M})
    {
        sValue = ComputeZoneValue(MakeOptions(eMetric), 4, nullptr, 1.0,
                                  &bSparse);
        EXPECT_TRUE(sValue.bNoData) << GetMetricCode(eMetric);
    }
}

TEST_F(test_geodiv_metrics, sparse_and_nodata_zones)
{
    Options oOptions = MakeOptions(Metric::R_SDC);
    ZoneStats oStats(GetAccumulatorOptions(oOptions));
    oStats.add_angle(0.5);

    bool bSparse = false;
    auto sValue = ComputeZoneValue(oOptions, 1, &oStats, 1.0, &bSparse);
    EXPECT_TRUE(bSparse);
    EXPECT_TRUE(sValue.bNoData);

    oStats.add_angle(0.5);
    sValue = ComputeZoneValue(oOptions, 1, &oStats, 1.0, &bSparse);
    EXPECT_FALSE(bSparse);
    EXPECT_FALSE(sValue.bNoData);
    EXPECT_NEAR(sValue.dfValue, 0.0, 1e-7);

    oStats.mark_nodata();
    sValue = ComputeZoneValue(oOptions, 1, &oStats, 1.0, &bSparse);
    EXPECT_FALSE(sValue.bNoData);
    oOptions.bIgnoreNoData = false;
    sValue = ComputeZoneValue(oOptions, 1, &oStats, 1.0, &bSparse);
    EXPECT_TRUE(sValue.bNoData);
}

TEST_F(test_geodiv_metrics, slope_threshold)
{
    Options oOptions = MakeOptions(Metric::R_SDC);
    oOptions.bHasSlopeThreshold = true;
    oOptions.dfSlopeThreshold = 5;
    const auto sAccOptions = GetAccumulatorOptions(oOptions);
    ASSERT_TRUE(sAccOptions.track_slope);

    ZoneStats oFlat(sAccOptions);
    oFlat.add_angle(0);
    oFlat.add_angle(M_PI / 2);
    oFlat.add_slope(1);
    oFlat.add_slope(3);
    bool bSparse = false;
    auto sValue = ComputeZoneValue(oOptions, 1, &oFlat, 1.0, &bSparse);
    EXPECT_FALSE(sValue.bNoData);
    EXPECT_EQ(sValue.dfValue, 0.0);

    ZoneStats oSteep(sAccOptions);
    oSteep.add_angle(0);
    oSteep.add_angle(M_PI / 2);
    oSteep.add_slope(10);
    sValue = ComputeZoneValue(oOptions, 2, &oSteep, 1.0, &bSparse);
    EXPECT_FALSE(sValue.bNoData);
    EXPECT_GT(sValue.dfValue, 0.0);
}

TEST_F(test_geodiv_metrics, standardize_min_max)
{
    std::vector<ZoneValue> aoIn(4);
    aoIn[0] = {1, 2.0, false};
    aoIn[1] = {2, 4.0, false};
    aoIn[2] = {3, 0.0, true};
    aoIn[3] = {4, 6.0, false};

    const auto aoOut = StandardizeMinMax(aoIn);
    ASSERT_EQ(aoOut.size(), 4U);
    EXPECT_EQ(aoOut[0].dfValue, 0.0);
    EXPECT_EQ(aoOut[1].dfValue, 0.5);
    EXPECT_TRUE(aoOut[2].bNoData);
    EXPECT_EQ(aoOut[3].dfValue, 1.0);
    EXPECT_EQ(aoOut[3].nZoneId, 4);

    std::vector<ZoneValue> aoConstant(2);
    aoConstant[0] = {1, 3.0, false};
    aoConstant[1] = {2, 3.0, false};
    for (const auto &sValue : StandardizeMinMax(aoConstant))
    {
        EXPECT_FALSE(sValue.bNoData);
        EXPECT_EQ(sValue.dfValue, 0.0);
    }
}

TEST_F(test_geodiv_metrics, geometry_helpers)
{
    OGRPolygon oSquare;
    {
        OGRLinearRing oRing;
        oRing.addPoint(0, 0);
        oRing.addPoint(4, 0);
        oRing.addPoint(4, 2);
        oRing.addPoint(0, 2);
        oRing.addPoint(0, 0);
        oSquare.addRing(&oRing);
    }
    EXPECT_EQ(GetGeometryArea(&oSquare), 8.0);
    EXPECT_TRUE(IsAxisAlignedRectangle(&oSquare));


    OGRPolygon oTriangle;
    {
        OGRLinearRing oRing;
        oRing.addPoint(0, 0);
        oRing.addPoint(3, 0);
        oRing.addPoint(0, 3);
        oRing.addPoint(0, 0);
        oTriangle.addRing(&oRing);
    }
    EXPECT_FALSE(IsAxisAlignedRectangle(&oTriangle));

    if (OGRGeometryFactory::haveGEOS())
    {
        double dfX = 0;
        double dfY = 0;
        ASSERT_TRUE(GetAreaCentroid(&oSquare, &dfX, &dfY));
        EXPECT_NEAR(dfX, 2.0, 1e-12);
        EXPECT_NEAR(dfY, 1.0, 1e-12);
        ASSERT_TRUE(GetAreaCentroid(&oTriangle, &dfX, &dfY));
        EXPECT_NEAR(dfX, 1.0, 1e-12);
        EXPECT_NEAR(dfY, 1.0, 1e-12);
    }

    OGRLineString oLine;
    oLine.addPoint(0, 0);
    oLine.addPoint(3, 4);
    EXPECT_EQ(GetGeometryLength(&oLine), 5.0);
    EXPECT_EQ(GetGeometryArea(&oLine), 0.0);
}

}  // namespace
