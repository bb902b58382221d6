/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Test the "geodiv" command line algorithms
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodivalg_main.h"
#include "geodiv_unit_test.h"

#include "cpl_error.h"
#include "cpl_vsi.h"
#include "gdal_priv.h"
#include "ogrsf_frmts.h"

#include "gtest/gtest.h"

#include <memory>
#include <string>
#include <vector>

namespace
{

struct test_geodiv_algorithm : public ::testing::Test
{
    static std::string GetOutput(GDALAlgorithm &alg)
    {
        auto outputArg =
            alg.GetActualAlgorithm().GetArg(GDAL_ARG_NAME_OUTPUT_STRING);
        if (!outputArg || outputArg->GetType() != GAAT_STRING)
            return std::string();
        return outputArg->Get<std::string>();
    }
};

static bool CreateGrid(const char *pszPath)
{
    GDALDriver *poDriver = GetGDALDriverManager()->GetDriverByName("GPKG");
    if (poDriver == nullptr)
        return false;
    std::unique_ptr<GDALDataset> poDS(
        poDriver->Create(pszPath, 0, 0, 0, GDT_Unknown, nullptr));
    if (!poDS)
        return false;
    OGRLayer *poLayer = poDS->CreateLayer("grid", nullptr, wkbPolygon, nullptr);
    if (!poLayer)
        return false;
    for (int i = 0; i < 3; ++i)
    {
        OGRFeature oFeature(poLayer->GetLayerDefn());
        auto poGeom = geodiv_test::GeomFromWkt(
            geodiv_test::RectWkt(i * 10, 0, (i + 1) * 10, 10).c_str());
        oFeature.SetGeometry(poGeom.get());
        if (poLayer->CreateFeature(&oFeature) != OGRERR_NONE)
            return false;
    }
    return true;
}

static bool CreatePoints(const char *pszPath)
{
    GDALDriver *poDriver = GetGDALDriverManager()->GetDriverByName("GPKG");
    if (poDriver == nullptr)
        return false;
    std::unique_ptr<GDALDataset> poDS(
        poDriver->Create(pszPath, 0, 0, 0, GDT_Unknown, nullptr));
    if (!poDS)
        return false;
    OGRLayer *poLayer =
        poDS->CreateLayer("wells", nullptr, wkbPoint, nullptr);
    if (!poLayer)
        return false;
    OGRFieldDefn oField("kind", OFTInteger);
    if (poLayer->CreateField(&oField) != OGRERR_NONE)
        return false;
    const double adfX[] = {1, 2, 3, 11, 12};
    for (int i = 0; i < 5; ++i)
    {
        OGRFeature oFeature(poLayer->GetLayerDefn());
        oFeature.SetField("kind", i % 2);
        OGRPoint oPoint(adfX[i], 5);
        oFeature.SetGeometry(&oPoint);
        if (poLayer->CreateFeature(&oFeature) != OGRERR_NONE)
            return false;
    }
    return true;
}

TEST_F(test_geodiv_algorithm, list_metrics)
{
    GeodivMainAlgorithm alg;
    ASSERT_TRUE(alg.ParseCommandLineArguments({"--metrics"}));
    ASSERT_TRUE(alg.Run());
    const std::string osOutput = GetOutput(alg);
    EXPECT_NE(osOutput.find("R_SDc"), std::string::npos);
    EXPECT_NE(osOutput.find("L_Tl    line"), std::string::npos);
}

TEST_F(test_geodiv_algorithm, subcommands)
{
    GeodivMainAlgorithm alg;
    const auto aosNames = alg.GetSubAlgorithmNames();
    EXPECT_EQ(aosNames.size(), 10U);
    for (const char *pszName : {"a-ne", "a-nc", "a-shdi", "l-tl", "p-ne",
                                "p-nc", "p-hu", "r-sd", "r-sdc", "r-m"})
    {
        auto poSubAlg = alg.InstantiateSubAlgorithm(pszName);
        ASSERT_NE(poSubAlg, nullptr) << pszName;
        EXPECT_NE(poSubAlg->GetArg("grid"), nullptr);
    }

    auto poRelief = alg.InstantiateSubAlgorithm("r-m");
    ASSERT_NE(poRelief, nullptr);
    EXPECT_NE(poRelief->GetArg("scales"), nullptr);
    EXPECT_EQ(poRelief->GetArg("category-field"), nullptr);

    auto poSD = alg.InstantiateSubAlgorithm("r-sd");
    ASSERT_NE(poSD, nullptr);
    ASSERT_NE(poSD->GetArg("ignore-nodata"), nullptr);
    EXPECT_TRUE(poSD->GetArg("ignore-nodata")->Get<bool>());
    EXPECT_NE(poSD->GetArg("no-ignore-nodata"), nullptr);
    EXPECT_EQ(poSD->GetArg("include-nodata"), nullptr);

    auto poShannon = alg.InstantiateSubAlgorithm("p-hu");
    ASSERT_NE(poShannon, nullptr);
    EXPECT_NE(poShannon->GetArg("category-field"), nullptr);
    EXPECT_EQ(poShannon->GetArg("slope"), nullptr);
    EXPECT_EQ(poShannon->GetArg("ignore-nodata"), nullptr);
}

TEST_F(test_geodiv_algorithm, missing_grid)
{
    CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
    GeodivMainAlgorithm alg;
    EXPECT_FALSE(alg.ParseCommandLineArguments(
        {"p-ne", "/vsimem/geodiv_algorithm_does_not_exist.gpkg"}));
}

TEST_F(test_geodiv_algorithm, no_subcommand)
{
    CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
    {
        GeodivMainAlgorithm alg;
        EXPECT_FALSE(alg.ParseCommandLineArguments({}));
    }
    {
        GeodivMainAlgorithm alg;
        EXPECT_FALSE(alg.ParseCommandLineArguments({"x-yz"}));
    }
}

TEST_F(test_geodiv_algorithm, point_category_count)
{
    const char *pszGrid = "/vsimem/test_geodiv_algorithm_grid.gpkg";
    const char *pszPoints = "/vsimem/test_geodiv_algorithm_wells.gpkg";
    if (!CreateGrid(pszGrid) || !CreatePoints(pszPoints))
        GTEST_SKIP() << "GPKG driver not available";

    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        GeodivMainAlgorithm alg;
        ASSERT_TRUE(alg.ParseCommandLineArguments(
            {"p-nc", "--grid", pszGrid, "--category-field", "kind",
             "--standardize", pszPoints}));
        ASSERT_TRUE(alg.Run());
        ASSERT_TRUE(alg.Finalize());
        const std::string osOutput = GetOutput(alg);
        EXPECT_NE(osOutput.find("WEL_PNc"), std::string::npos);
        EXPECT_NE(osOutput.find("WEL_PNc_MM"), std::string::npos);
    }

    std::unique_ptr<GDALDataset> poDS(
        GDALDataset::Open(pszGrid, GDAL_OF_VECTOR));
    ASSERT_NE(poDS, nullptr);
    OGRLayer *poLayer = poDS->GetLayer(0);
    ASSERT_NE(poLayer, nullptr);
    const int iField = poLayer->GetLayerDefn()->GetFieldIndex("WEL_PNc");
    ASSERT_GE(iField, 0);
    std::vector<double> adfValues;
    std::vector<bool> abNull;
    for (auto &&poFeature : poLayer)
    {
        abNull.push_back(poFeature->IsFieldNull(iField));
        adfValues.push_back(poFeature->GetFieldAsDouble(iField));
    }
    ASSERT_EQ(adfValues.size(), 3U);
    EXPECT_EQ(adfValues[0], 2.0);
    EXPECT_EQ(adfValues[1], 2.0);
    EXPECT_TRUE(abNull[2]);
    poDS.reset();

    VSIUnlink(pszGrid);
    VSIUnlink(pszPoints);
}

/* 6x2 raster of 5m cells over the grid, one NoData cell in the second zone */
static bool CreateDEM(const char *pszPath)
{
    GDALDriver *poDriver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (poDriver == nullptr)
        return false;
    std::unique_ptr<GDALDataset> poDS(
        poDriver->Create(pszPath, 6, 2, 1, GDT_Float32, nullptr));
    if (!poDS)
        return false;
    GDALGeoTransform gt;
    gt[0] = 0;
    gt[1] = 5;
    gt[2] = 0;
    gt[3] = 10;
    gt[4] = 0;
    gt[5] = -5;
    if (poDS->SetGeoTransform(gt) != CE_None)
        return false;
    GDALRasterBand *poBand = poDS->GetRasterBand(1);
    if (poBand->SetNoDataValue(-9999) != CE_None)
        return false;
    float afValues[] = {1, 3, -9999, 4, 5, 5, 1, 3, 2, 6, 5, 5};
    return poBand->RasterIO(GF_Write, 0, 0, 6, 2, afValues, 6, 2,
                            GDT_Float32, 0, 0, nullptr) == CE_None;
}

TEST_F(test_geodiv_algorithm, raster_nodata_flags)
{
    const char *pszGrid = "/vsimem/test_geodiv_algorithm_nodata_grid.gpkg";
    const char *pszDEM = "/vsimem/test_geodiv_algorithm_dem.tif";
    if (!CreateGrid(pszGrid) || !CreateDEM(pszDEM))
        GTEST_SKIP() << "GPKG or GTiff driver not available";

    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        GeodivMainAlgorithm alg;
        ASSERT_TRUE(alg.ParseCommandLineArguments(
            {"r-sd", "--grid", pszGrid, "--output-field", "sd_skip", pszDEM}));
        ASSERT_TRUE(alg.Run());
        ASSERT_TRUE(alg.Finalize());
    }
    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        GeodivMainAlgorithm alg;
        ASSERT_TRUE(alg.ParseCommandLineArguments(
            {"r-sd", "--grid", pszGrid, "--output-field", "sd_strict",
             "--no-ignore-nodata", pszDEM}));
        ASSERT_TRUE(alg.Run());
        ASSERT_TRUE(alg.Finalize());
    }
    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        GeodivMainAlgorithm alg;
        EXPECT_FALSE(alg.ParseCommandLineArguments(
            {"r-sd", "--grid", pszGrid, "--ignore-nodata",
             "--no-ignore-nodata", pszDEM}));
    }

    std::unique_ptr<GDALDataset> poDS(
        GDALDataset::Open(pszGrid, GDAL_OF_VECTOR));
    ASSERT_NE(poDS, nullptr);
    OGRLayer *poLayer = poDS->GetLayer(0);
    ASSERT_NE(poLayer, nullptr);
    const int iSkip = poLayer->GetLayerDefn()->GetFieldIndex("sd_skip");
    const int iStrict = poLayer->GetLayerDefn()->GetFieldIndex("sd_strict");
    ASSERT_GE(iSkip, 0);
    ASSERT_GE(iStrict, 0);
    for (auto &&poFeature : poLayer)
    {
        EXPECT_FALSE(poFeature->IsFieldNull(iSkip)) << poFeature->GetFID();
        if (poFeature->GetFID() == 2)
            EXPECT_TRUE(poFeature->IsFieldNull(iStrict));
        else
            EXPECT_DOUBLE_EQ(poFeature->GetFieldAsDouble(iStrict),
                             poFeature->GetFieldAsDouble(iSkip));
    }
    poDS.reset();

    VSIUnlink(pszGrid);
    VSIUnlink(pszDEM);
}

}  // namespace
