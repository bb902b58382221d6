/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Unit test runner and in-memory providers
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_unit_test.h"

#include "cpl_string.h"
#include "gdal.h"

#include "gtest/gtest.h"

namespace geodiv_test
{

std::unique_ptr<OGRGeometry> GeomFromWkt(const char *pszWkt)
{
    OGRGeometry *poGeom = nullptr;
    if (OGRGeometryFactory::createFromWkt(pszWkt, nullptr, &poGeom) !=
        OGRERR_NONE)
        return nullptr;
    return std::unique_ptr<OGRGeometry>(poGeom);
}

std::string RectWkt(double x0, double y0, double x1, double y1)
{
    return CPLSPrintf("POLYGON ((%.17g %.17g,%.17g %.17g,%.17g %.17g,"
                      "%.17g %.17g,%.17g %.17g))",
                      x0, y0, x1, y0, x1, y1, x0, y1, x0, y0);
}

/************************************************************************/
/*                          FakeZoneProvider                            */
/************************************************************************/

FakeZoneProvider FakeZoneProvider::MakeGrid(int nCols, int nRows,
                                            double dfSize)
{
    FakeZoneProvider oGrid;
    GIntBig nId = 1;
    for (int iRow = 0; iRow < nRows; ++iRow)
    {
        for (int iCol = 0; iCol < nCols; ++iCol)
        {
            oGrid.AddZone(nId++, RectWkt(iCol * dfSize, iRow * dfSize,
                                         (iCol + 1) * dfSize,
                                         (iRow + 1) * dfSize));
        }
    }
    return oGrid;
}

bool FakeZoneProvider::GetNextZone(geodiv::ZoneRecord &oZone)
{
    if (m_nNext >= m_aoZones.size())
        return false;
    const auto &oEntry = m_aoZones[m_nNext++];
    oZone.nId = oEntry.first;
    oZone.poGeom = GeomFromWkt(oEntry.second.c_str());
    return true;
}

/************************************************************************/
/*                         FakeFeatureProvider                          */
/************************************************************************/

void FakeFeatureProvider::AddPoint(double dfX, double dfY,
                                   const geodiv::CategoryValue &oCategory)
{
    Add(CPLSPrintf("POINT (%.17g %.17g)", dfX, dfY), oCategory);
}

bool FakeFeatureProvider::GetExtent(OGREnvelope *psExtent)
{
    *psExtent = OGREnvelope();
    for (const auto &oEntry : m_aoFeatures)
    {
        auto poGeom = GeomFromWkt(oEntry.first.c_str());
        if (poGeom && !poGeom->IsEmpty())
        {
            OGREnvelope sEnv;
            poGeom->getEnvelope(&sEnv);
            psExtent->Merge(sEnv);
        }
    }
    return psExtent->IsInit();
}

bool FakeFeatureProvider::GetNextFeature(geodiv::FeatureRecord &oFeature)
{
    if (m_nNext >= m_aoFeatures.size())
        return false;
    const auto &oEntry = m_aoFeatures[m_nNext];
    oFeature.nFID = static_cast<GIntBig>(m_nNext) + 1;
    oFeature.poGeom = GeomFromWkt(oEntry.first.c_str());
    oFeature.oCategory = oEntry.second;
    ++m_nNext;
    return true;
}

/************************************************************************/
/*                          FakeRasterProvider                          */
/************************************************************************/

bool FakeRasterProvider::GetExtent(OGREnvelope *psExtent)
{
    psExtent->MinX = m_dfOriginX;
    psExtent->MinY = m_dfOriginY;
    psExtent->MaxX = m_dfOriginX + m_nCols * m_dfCellSize;
    psExtent->MaxY = m_dfOriginY + m_nRows * m_dfCellSize;
    return true;
}

bool FakeRasterProvider::GetNextChunk(
    std::vector<geodiv::RasterSample> &aoSamples)
{
    aoSamples.clear();
    if (m_nNextRow >= m_nRows)
        return false;
    const int iRow = m_nNextRow++;
    for (int iCol = 0; iCol < m_nCols; ++iCol)
    {
        geodiv::RasterSample oSample;
        oSample.dfX = m_dfOriginX + (iCol + 0.5) * m_dfCellSize;
        oSample.dfY = m_dfOriginY + (iRow + 0.5) * m_dfCellSize;
        oSample.dfValue =
            m_adfValues[static_cast<size_t>(iRow) * m_nCols + iCol];
        oSample.bNoData = m_bHasNoData && oSample.dfValue == m_dfNoData;
        aoSamples.push_back(oSample);
    }
    return true;
}

/************************************************************************/
/*                         FakeAttributeTable                           */
/************************************************************************/

std::string
FakeAttributeTable::GetFieldProvenance(const std::string &osName) const
{
    auto oIter = m_oFields.find(osName);
    return oIter == m_oFields.end() ? std::string()
                                    : oIter->second.osProvenance;
}

bool FakeAttributeTable::SetFieldProvenance(const std::string &osName,
                                            const std::string &osProvenance)
{
    auto oIter = m_oFields.find(osName);
    if (oIter == m_oFields.end())
        return false;
    oIter->second.osProvenance = osProvenance;
    return true;
}

bool FakeAttributeTable::EnsureRealField(const std::string &osName,
                                         const std::string &osAlias)
{
    auto &oField = m_oFields[osName];
    if (oField.osAlias.empty())
        oField.osAlias = osAlias;
    return true;
}

bool FakeAttributeTable::WriteColumns(
    const std::vector<geodiv::FieldColumn> &aoColumns)
{
    if (m_bFailWrite)
    {
        CPLError(CE_Failure, CPLE_FileIO, "Simulated write failure");
        return false;
    }
    for (const auto &oColumn : aoColumns)
    {
        auto &oField = m_oFields[oColumn.osName];
        oField.oValues.clear();
        oField.anNullIds.clear();
        for (const auto &sValue : oColumn.aoValues)
        {
            if (sValue.bNoData)
                oField.anNullIds.push_back(sValue.nZoneId);
            else
                oField.oValues[sValue.nZoneId] = sValue.dfValue;
        }
    }
    return true;
}

bool FakeAttributeTable::StartTransaction()
{
    m_oSavedFields = m_oFields;
    m_bInTransaction = true;
    return true;
}

bool FakeAttributeTable::CommitTransaction()
{
    if (!m_bInTransaction)
        return false;
    m_bInTransaction = false;
    m_nCommits++;
    return true;
}

bool FakeAttributeTable::RollbackTransaction()
{
    if (!m_bInTransaction)
        return false;
    m_oFields = m_oSavedFields;
    m_bInTransaction = false;
    m_nRollbacks++;
    return true;
}

}  // namespace geodiv_test

/************************************************************************/
/*                                main()                                */
/************************************************************************/

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    GDALAllRegister();

    const int nRetCode = RUN_ALL_TESTS();

    GDALDestroyDriverManager();

    return nRetCode;
}
