/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Test temporary workspaces, staging files and target locks
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
#include "cpl_multiproc.h"
#include "cpl_string.h"
#include "cpl_vsi.h"

#include "gtest/gtest.h"

#include <cstring>
#include <string>
#include <vector>

namespace
{

using namespace geodiv;

constexpr const char *TEST_ROOT = "/vsimem/geodiv_workspace_test";

struct test_geodiv_workspace : public ::testing::Test
{
    void SetUp() override
    {
        ASSERT_EQ(VSIMkdir(TEST_ROOT, 0755), 0);
    }

    void TearDown() override
    {
        CPL_IGNORE_RET_VAL(VSIRmdirRecursive(TEST_ROOT));
    }

    static bool Exists(const std::string &osPath)
    {
        VSIStatBufL sStat;
        return VSIStatL(osPath.c_str(), &sStat) == 0;
    }

    static void WriteFile(const std::string &osPath, const char *pszContent)
    {
        VSILFILE *fp = VSIFOpenL(osPath.c_str(), "wb");
        ASSERT_NE(fp, nullptr);
        EXPECT_EQ(VSIFWriteL(pszContent, 1, strlen(pszContent), fp),
                  strlen(pszContent));
        EXPECT_EQ(VSIFCloseL(fp), 0);
    }

    static std::string ReadFile(const std::string &osPath)
    {
        GByte *pabyRet = nullptr;
        if (!VSIIngestFile(nullptr, osPath.c_str(), &pabyRet, nullptr, -1))
            return std::string();
        std::string osRet(reinterpret_cast<const char *>(pabyRet));
        VSIFree(pabyRet);
        return osRet;
    }
};

TEST_F(test_geodiv_workspace, root_directory)
{
    CPLConfigOptionSetter oSetter("GEODIV_TEMP_DIR", TEST_ROOT, false);
    EXPECT_EQ(TempWorkspace::GetRootDirectory(), TEST_ROOT);
}

TEST_F(test_geodiv_workspace, create_and_release)
{
    CPLConfigOptionSetter oSetter("GEODIV_TEMP_DIR", TEST_ROOT, false);

    RunReport sReport;
    std::string osPath;
    {
        auto poWorkspace = TempWorkspace::Create(&sReport);
        ASSERT_NE(poWorkspace, nullptr);
        osPath = poWorkspace->GetPath();
        EXPECT_TRUE(STARTS_WITH(osPath.c_str(), TEST_ROOT));
        EXPECT_TRUE(Exists(osPath));

        auto poOther = TempWorkspace::Create(&sReport);
        ASSERT_NE(poOther, nullptr);
        EXPECT_NE(poOther->GetPath(), osPath);

        const std::string osFile = poWorkspace->GetFilename("values", "csv");
        EXPECT_EQ(CPLGetFilename(osFile.c_str()), std::string("values.csv"));
        WriteFile(osFile, "x");

        EXPECT_TRUE(poWorkspace->Release());
        EXPECT_FALSE(Exists(osPath));
        // Idempotent
        EXPECT_TRUE(poWorkspace->Release());
    }
    EXPECT_FALSE(sReport.bCleanupFailed);

    // Released by the destructor as well
    {
        auto poWorkspace = TempWorkspace::Create(&sReport);
        ASSERT_NE(poWorkspace, nullptr);
        osPath = poWorkspace->GetPath();
    }
    EXPECT_FALSE(Exists(osPath));
}

TEST_F(test_geodiv_workspace, keep_temp)
{
    CPLConfigOptionSetter oSetter("GEODIV_TEMP_DIR", TEST_ROOT, false);
    CPLConfigOptionSetter oKeep("GEODIV_KEEP_TEMP", "YES", false);

    auto poWorkspace = TempWorkspace::Create(nullptr);
    ASSERT_NE(poWorkspace, nullptr);
    const std::string osPath = poWorkspace->GetPath();
    EXPECT_TRUE(poWorkspace->Release());
    EXPECT_TRUE(Exists(osPath));
}

TEST_F(test_geodiv_workspace, missing_root)
{
    CPLConfigOptionSetter oSetter("GEODIV_TEMP_DIR",
                                  "/vsimem/geodiv_does_not_exist", false);
    CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
    RunReport sReport;
    EXPECT_EQ(TempWorkspace::Create(&sReport), nullptr);
    EXPECT_EQ(sReport.eFatalError, ErrorKind::IO);
}

TEST_F(test_geodiv_workspace, sweep_stale)
{
    // Process identifiers this large are not in use
    const std::string osStale =
        CPLFormFilenameSafe(TEST_ROOT, "geodiv_2147483000_0", nullptr);
    const std::string osOwn = CPLFormFilenameSafe(
        TEST_ROOT, CPLSPrintf("geodiv_%d_999", CPLGetPID()), nullptr);
    const std::string osUnrelated =
        CPLFormFilenameSafe(TEST_ROOT, "something_else", nullptr);
    ASSERT_EQ(VSIMkdir(osStale.c_str(), 0755), 0);
    ASSERT_EQ(VSIMkdir(osOwn.c_str(), 0755), 0);
    ASSERT_EQ(VSIMkdir(osUnrelated.c_str(), 0755), 0);
    WriteFile(CPLFormFilenameSafe(osStale.c_str(), "values", "csv"), "x");

    EXPECT_EQ(TempWorkspace::SweepStaleWorkspaces(TEST_ROOT), 1);
    EXPECT_FALSE(Exists(osStale));
    EXPECT_TRUE(Exists(osOwn));
    EXPECT_TRUE(Exists(osUnrelated));
}

TEST_F(test_geodiv_workspace, staging_file)
{
    RunReport sReport;
    sReport.aoValues = {{1, 2.5, false}, {2, 0.0, true}, {3, -1.0, false}};
    const std::string osFile =
        CPLFormFilenameSafe(TEST_ROOT, "staging", "csv");
    ASSERT_TRUE(WriteStagingFile(osFile, sReport));
    EXPECT_EQ(ReadFile(osFile), "zone_id,value\n1,2.5\n2,\n3,-1\n");

    CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
    EXPECT_FALSE(
        WriteStagingFile("/geodiv_no_such_dir/x/staging.csv", sReport));
}

TEST_F(test_geodiv_workspace, read_staging_file)
{
    RunReport sReport;
    sReport.aoValues = {{7, 0.1, false}, {3, 0.0, true}, {12, 1e-300, false}};
    const std::string osFile =
        CPLFormFilenameSafe(TEST_ROOT, "staging", "csv");
    ASSERT_TRUE(WriteStagingFile(osFile, sReport));

    std::vector<ZoneValue> aoValues;
    ASSERT_TRUE(ReadStagingFile(osFile, aoValues));
    ASSERT_EQ(aoValues.size(), 3U);
    EXPECT_EQ(aoValues[0].nZoneId, 7);
    EXPECT_FALSE(aoValues[0].bNoData);
    EXPECT_EQ(aoValues[0].dfValue, 0.1);
    EXPECT_EQ(aoValues[1].nZoneId, 3);
    EXPECT_TRUE(aoValues[1].bNoData);
    EXPECT_EQ(aoValues[2].nZoneId, 12);
    EXPECT_EQ(aoValues[2].dfValue, 1e-300);

    CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
    WriteFile(osFile, "zone_id,value\n1,abc\n");
    EXPECT_FALSE(ReadStagingFile(osFile, aoValues));
    WriteFile(osFile, "id;value\n1;2\n");
    EXPECT_FALSE(ReadStagingFile(osFile, aoValues));
    EXPECT_FALSE(ReadStagingFile(
        CPLFormFilenameSafe(TEST_ROOT, "missing", "csv"), aoValues));
}

TEST_F(test_geodiv_workspace, process_alive)
{
    EXPECT_TRUE(IsProcessAlive(CPLGetPID()));
    EXPECT_FALSE(IsProcessAlive(0));
    EXPECT_FALSE(IsProcessAlive(-5));
}

TEST_F(test_geodiv_workspace, target_lock)
{
    const std::string osLock =
        CPLFormFilenameSafe(TEST_ROOT, "grid.gpkg.geodiv", "lock");

    RunReport sReport;
    auto poLock = TargetLock::Acquire(osLock, 0, &sReport);
    ASSERT_NE(poLock, nullptr);
    EXPECT_TRUE(Exists(osLock));
    EXPECT_EQ(atoi(ReadFile(osLock).c_str()), CPLGetPID());

    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        RunReport sOtherReport;
        EXPECT_EQ(TargetLock::Acquire(osLock, 0.2, &sOtherReport), nullptr);
        EXPECT_EQ(sOtherReport.eFatalError, ErrorKind::IO);
    }

    EXPECT_TRUE(poLock->Release());
    EXPECT_FALSE(Exists(osLock));

    auto poAgain = TargetLock::Acquire(osLock, 0, &sReport);
    ASSERT_NE(poAgain, nullptr);
    poAgain.reset();
    EXPECT_FALSE(Exists(osLock));
}

TEST_F(test_geodiv_workspace, stale_lock_reclaimed)
{
    const std::string osLock =
        CPLFormFilenameSafe(TEST_ROOT, "grid.gpkg.geodiv", "lock");
    WriteFile(osLock, "2147483000\n");

    RunReport sReport;
    auto poLock = TargetLock::Acquire(osLock, 0, &sReport);
    ASSERT_NE(poLock, nullptr);
    EXPECT_EQ(atoi(ReadFile(osLock).c_str()), CPLGetPID());
    EXPECT_TRUE(poLock->Release());
}

TEST_F(test_geodiv_workspace, lock_without_file)
{
    RunReport sReport;
    auto poLock = TargetLock::Acquire(std::string(), 0, &sReport);
    ASSERT_NE(poLock, nullptr);
    {
        CPLErrorStateBackuper oErrorHandler(CPLQuietErrorHandler);
        EXPECT_EQ(TargetLock::Acquire(std::string(), 0, &sReport), nullptr);
    }
    EXPECT_TRUE(poLock->Release());
    EXPECT_NE(TargetLock::Acquire(std::string(), 0, &sReport), nullptr);
}

}  // namespace
