/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  GDAL/OGR backed zone, feature, raster and attribute providers
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_ogr.h"
#include "geodiv_priv.h"

#include "cpl_conv.h"
#include "cpl_string.h"
#include "cpl_vsi.h"

#include <algorithm>
#include <cmath>
#include <map>

namespace geodiv
{

/************************************************************************/
/*                        OGRLayerZoneProvider                          */
/************************************************************************/

OGRLayerZoneProvider::OGRLayerZoneProvider(OGRLayer *poLayer,
                                           const std::string &osIdField)
    : m_poLayer(poLayer), m_osIdField(osIdField)
{
    if (!m_osIdField.empty())
        m_iIdField =
            m_poLayer->GetLayerDefn()->GetFieldIndex(m_osIdField.c_str());
}

std::string OGRLayerZoneProvider::GetName() const
{
    return m_poLayer->GetName();
}

const OGRSpatialReference *OGRLayerZoneProvider::GetSpatialRef() const
{
    return m_poLayer->GetSpatialRef();
}

void OGRLayerZoneProvider::ResetReading()
{
    m_poLayer->ResetReading();
}

bool OGRLayerZoneProvider::GetNextZone(ZoneRecord &oZone)
{
    OGRFeatureUniquePtr poFeature(m_poLayer->GetNextFeature());
    if (!poFeature)
        return false;

    if (m_iIdField >= 0)
    {
        if (!poFeature->IsFieldSetAndNotNull(m_iIdField))
        {
            CPLError(CE_Failure, CPLE_AppDefined,
                     "Feature " CPL_FRMT_GIB " of %s has no value for %s",
                     poFeature->GetFID(), m_poLayer->GetName(),
                     m_osIdField.c_str());
            return false;
        }
        oZone.nId = poFeature->GetFieldAsInteger64(m_iIdField);
    }
    else
    {
        oZone.nId = poFeature->GetFID();
    }
    oZone.poGeom.reset(poFeature->StealGeometry());
    return true;
}

/************************************************************************/
/*                       OGRLayerFeatureProvider                        */
/************************************************************************/

OGRLayerFeatureProvider::OGRLayerFeatureProvider(
    OGRLayer *poLayer, const std::string &osCategoryField)
    : m_poLayer(poLayer)
{
    if (!osCategoryField.empty())
        m_iCategoryField =
            m_poLayer->GetLayerDefn()->GetFieldIndex(osCategoryField.c_str());
}

std::string OGRLayerFeatureProvider::GetName() const
{
    return m_poLayer->GetName();
}

const OGRSpatialReference *OGRLayerFeatureProvider::GetSpatialRef() const
{
    return m_poLayer->GetSpatialRef();
}

bool OGRLayerFeatureProvider::GetExtent(OGREnvelope *psExtent)
{
    return m_poLayer->GetExtent(psExtent, true) == OGRERR_NONE;
}

OGRwkbGeometryType OGRLayerFeatureProvider::GetGeomType() const
{
    return m_poLayer->GetGeomType();
}

bool OGRLayerFeatureProvider::HasCategory() const
{
    return m_iCategoryField >= 0;
}

GIntBig OGRLayerFeatureProvider::GetFeatureCountHint()
{
    return m_poLayer->GetFeatureCount(false);
}

void OGRLayerFeatureProvider::ResetReading()
{
    m_poLayer->ResetReading();
}

bool OGRLayerFeatureProvider::GetNextFeature(FeatureRecord &oFeature)
{
    OGRFeatureUniquePtr poFeature(m_poLayer->GetNextFeature());
    if (!poFeature)
        return false;

    oFeature.nFID = poFeature->GetFID();
    oFeature.poGeom.reset(poFeature->StealGeometry());

    if (m_iCategoryField >= 0 &&
        poFeature->IsFieldSetAndNotNull(m_iCategoryField))
    {
        switch (poFeature->GetFieldDefnRef(m_iCategoryField)->GetType())
        {
            case OFTInteger:
            case OFTInteger64:
                oFeature.oCategory =
                    poFeature->GetFieldAsInteger64(m_iCategoryField);
                break;
            case OFTReal:
                oFeature.oCategory =
                    poFeature->GetFieldAsDouble(m_iCategoryField);
                break;
            default:
                oFeature.oCategory =
                    std::string(poFeature->GetFieldAsString(m_iCategoryField));
                break;
        }
    }
    return true;
}

/************************************************************************/
/*                       GDALBandSampleProvider                         */
/************************************************************************/

GDALBandSampleProvider::GDALBandSampleProvider(GDALRasterBand *poBand)
    : m_poBand(poBand), m_poDS(poBand->GetDataset())
{
    m_bHasGT = m_poDS != nullptr && m_poDS->GetGeoTransform(m_gt) == CE_None;
    const int nXSize = std::max(1, m_poBand->GetXSize());
    m_nRowsPerChunk = std::max(1, (1024 * 1024) / nXSize);
}

std::string GDALBandSampleProvider::GetName() const
{
    return m_poDS ? CPLGetBasenameSafe(m_poDS->GetDescription())
                  : std::string("raster");
}

const OGRSpatialReference *GDALBandSampleProvider::GetSpatialRef() const
{
    return m_poDS ? m_poDS->GetSpatialRefRasterOnly() : nullptr;
}

bool GDALBandSampleProvider::GetExtent(OGREnvelope *psExtent)
{
    if (!m_bHasGT)
        return false;
    const double dfXSize = m_poBand->GetXSize();
    const double dfYSize = m_poBand->GetYSize();
    double adfX[4] = {0, 0, 0, 0};
    double adfY[4] = {0, 0, 0, 0};
    m_gt.Apply(0, 0, &adfX[0], &adfY[0]);
    m_gt.Apply(dfXSize, 0, &adfX[1], &adfY[1]);
    m_gt.Apply(0, dfYSize, &adfX[2], &adfY[2]);
    m_gt.Apply(dfXSize, dfYSize, &adfX[3], &adfY[3]);
    psExtent->MinX = *std::min_element(adfX, adfX + 4);
    psExtent->MaxX = *std::max_element(adfX, adfX + 4);
    psExtent->MinY = *std::min_element(adfY, adfY + 4);
    psExtent->MaxY = *std::max_element(adfY, adfY + 4);
    return true;
}

GIntBig GDALBandSampleProvider::GetSampleCountHint()
{
    return static_cast<GIntBig>(m_poBand->GetXSize()) * m_poBand->GetYSize();
}

void GDALBandSampleProvider::ResetReading()
{
    m_nNextRow = 0;
}

bool GDALBandSampleProvider::GetNextChunk(std::vector<RasterSample> &aoSamples)
{
    aoSamples.clear();

    const int nXSize = m_poBand->GetXSize();
    const int nYSize = m_poBand->GetYSize();
    if (!m_bHasGT || m_nNextRow >= nYSize)
        return false;

    const int nRows = std::min(m_nRowsPerChunk, nYSize - m_nNextRow);
    const size_t nCells = static_cast<size_t>(nXSize) * nRows;
    m_adfValues.resize(nCells);

    if (m_poBand->RasterIO(GF_Read, 0, m_nNextRow, nXSize, nRows,
                           m_adfValues.data(), nXSize, nRows, GDT_Float64, 0,
                           0, nullptr) != CE_None)
    {
        return false;
    }

    const bool bUseMask = (m_poBand->GetMaskFlags() & GMF_ALL_VALID) == 0;
    if (bUseMask)
    {
        m_abyMask.resize(nCells);
        if (m_poBand->GetMaskBand()->RasterIO(
                GF_Read, 0, m_nNextRow, nXSize, nRows, m_abyMask.data(),
                nXSize, nRows, GDT_Byte, 0, 0, nullptr) != CE_None)
        {
            return false;
        }
    }

    aoSamples.resize(nCells);
    size_t i = 0;
    for (int iY = 0; iY < nRows; ++iY)
    {
        for (int iX = 0; iX < nXSize; ++iX, ++i)
        {
            RasterSample &oSample = aoSamples[i];
            m_gt.Apply(iX + 0.5, m_nNextRow + iY + 0.5, &oSample.dfX,
                       &oSample.dfY);
            oSample.dfValue = m_adfValues[i];
            oSample.bNoData =
                (bUseMask && m_abyMask[i] == 0) || std::isnan(oSample.dfValue);
        }
    }

    m_nNextRow += nRows;
    return true;
}

/************************************************************************/
/*                        OGRLayerAttributeTable                        */
/************************************************************************/

OGRLayerAttributeTable::OGRLayerAttributeTable(GDALDataset *poDS,
                                               OGRLayer *poLayer,
                                               const std::string &osIdField)
    : m_poDS(poDS), m_poLayer(poLayer), m_osIdField(osIdField)
{
}

std::string OGRLayerAttributeTable::GetName() const
{
    return m_poLayer->GetName();
}

bool OGRLayerAttributeTable::HasField(const std::string &osName) const
{
    return m_poLayer->GetLayerDefn()->GetFieldIndex(osName.c_str()) >= 0;
}

std::string
OGRLayerAttributeTable::GetFieldProvenance(const std::string &osName) const
{
    const char *pszValue =
        m_poLayer->GetMetadataItem(osName.c_str(), GEODIV_METADATA_DOMAIN);
    return pszValue ? pszValue : "";
}

bool OGRLayerAttributeTable::SetFieldProvenance(const std::string &osName,
                                                const std::string &osProvenance)
{
    return m_poLayer->SetMetadataItem(osName.c_str(), osProvenance.c_str(),
                                      GEODIV_METADATA_DOMAIN) == CE_None;
}

bool OGRLayerAttributeTable::EnsureRealField(const std::string &osName,
                                             const std::string &osAlias)
{
    const int iField =
        m_poLayer->GetLayerDefn()->GetFieldIndex(osName.c_str());
    if (iField >= 0)
    {
        const OGRFieldType eType =
            m_poLayer->GetLayerDefn()->GetFieldDefn(iField)->GetType();
        if (eType != OFTReal && eType != OFTInteger && eType != OFTInteger64)
        {
            CPLError(CE_Failure, CPLE_AppDefined,
                     "Field %s of %s exists and is not numeric",
                     osName.c_str(), m_poLayer->GetName());
            return false;
        }
        return true;
    }

    OGRFieldDefn oFieldDefn(osName.c_str(), OFTReal);
    if (!osAlias.empty())
        oFieldDefn.SetAlternativeName(osAlias.c_str());
    if (m_poLayer->CreateField(&oFieldDefn) != OGRERR_NONE)
        return false;
    if (m_poLayer->GetLayerDefn()->GetFieldIndex(osName.c_str()) < 0)
    {
        CPLError(CE_Failure, CPLE_AppDefined,
                 "Field %s was renamed by the %s driver", osName.c_str(),
                 m_poDS->GetDriverName());
        return false;
    }
    return true;
}

bool OGRLayerAttributeTable::WriteColumns(
    const std::vector<FieldColumn> &aoColumns)
{
    if (aoColumns.empty())
        return true;

    const OGRFeatureDefn *poDefn = m_poLayer->GetLayerDefn();
    const int iIdField =
        m_osIdField.empty() ? -1 : poDefn->GetFieldIndex(m_osIdField.c_str());

    std::vector<int> anFieldIdx;
    for (const auto &oColumn : aoColumns)
    {
        anFieldIdx.push_back(poDefn->GetFieldIndex(oColumn.osName.c_str()));
        if (anFieldIdx.back() < 0)
        {
            CPLError(CE_Failure, CPLE_AppDefined, "No field %s in %s",
                     oColumn.osName.c_str(), m_poLayer->GetName());
            return false;
        }
    }

    std::map<GIntBig, size_t> oMapIdToRow;
    const auto &aoFirst = aoColumns.front().aoValues;
    for (size_t i = 0; i < aoFirst.size(); ++i)
        oMapIdToRow[aoFirst[i].nZoneId] = i;

    m_poLayer->ResetReading();
    for (auto &&poFeature : m_poLayer)
    {
        if (iIdField >= 0 && !poFeature->IsFieldSetAndNotNull(iIdField))
        {
            CPLDebug(GEODIV_DEBUG_KEY,
                     "Feature " CPL_FRMT_GIB " of %s has no %s, left unchanged",
                     poFeature->GetFID(), m_poLayer->GetName(),
                     m_osIdField.c_str());
            continue;
        }
        const GIntBig nId = iIdField >= 0
                                ? poFeature->GetFieldAsInteger64(iIdField)
                                : poFeature->GetFID();
        const auto oIter = oMapIdToRow.find(nId);
        if (oIter == oMapIdToRow.end())
            continue;

        for (size_t iCol = 0; iCol < aoColumns.size(); ++iCol)
        {
            const ZoneValue &sValue = aoColumns[iCol].aoValues[oIter->second];
            if (sValue.bNoData)
                poFeature->SetFieldNull(anFieldIdx[iCol]);
            else
                poFeature->SetField(anFieldIdx[iCol], sValue.dfValue);
        }

        OGRGeometry *poGeom = poFeature->GetGeometryRef();
        if (poGeom && (poGeom->Is3D() || poGeom->IsMeasured()))
            poGeom->flattenTo2D();

        if (m_poLayer->SetFeature(poFeature.get()) != OGRERR_NONE)
            return false;
    }
    return true;
}

bool OGRLayerAttributeTable::StartTransaction()
{
    const OGRErr eErr = m_poDS->StartTransaction(FALSE);
    if (eErr == OGRERR_UNSUPPORTED_OPERATION)
    {
        CPLDebug(GEODIV_DEBUG_KEY, "%s does not support transactions",
                 m_poDS->GetDescription());
        m_bInTransaction = false;
        return true;
    }
    m_bInTransaction = eErr == OGRERR_NONE;
    return m_bInTransaction;
}

bool OGRLayerAttributeTable::CommitTransaction()
{
    if (!m_bInTransaction)
        return m_poLayer->SyncToDisk() == OGRERR_NONE;
    m_bInTransaction = false;
    return m_poDS->CommitTransaction() == OGRERR_NONE;
}

bool OGRLayerAttributeTable::RollbackTransaction()
{
    if (!m_bInTransaction)
        return false;
    m_bInTransaction = false;
    return m_poDS->RollbackTransaction() == OGRERR_NONE;
}

std::string OGRLayerAttributeTable::GetLockPath() const
{
    const char *pszDesc = m_poDS->GetDescription();
    VSIStatBufL sStat;
    if (pszDesc == nullptr || pszDesc[0] == '\0' ||
        VSIStatL(pszDesc, &sStat) != 0)
        return std::string();
    return std::string(pszDesc) + ".geodiv.lock";
}

/************************************************************************/
/*                              GetLayer()                              */
/************************************************************************/

static OGRLayer *GetLayer(GDALDataset *poDS, const std::string &osLayerName,
                          const char *pszRole, RunReport *psReport)
{
    if (!osLayerName.empty())
    {
        OGRLayer *poLayer = poDS->GetLayerByName(osLayerName.c_str());
        if (poLayer == nullptr)
        {
            ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                        "%s layer '%s' not found in %s", pszRole,
                        osLayerName.c_str(), poDS->GetDescription());
        }
        return poLayer;
    }
    if (poDS->GetLayerCount() != 1)
    {
        ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                    "%s dataset %s has %d layers. Specify which one to use.",
                    pszRole, poDS->GetDescription(), poDS->GetLayerCount());
        return nullptr;
    }
    return poDS->GetLayer(0);
}

static bool CheckContainer(GDALDataset *poDS, const char *pszRole,
                           RunReport *psReport)
{
    const char *pszDriver = poDS->GetDriverName();
    if (!IsAcceptedContainerDriver(pszDriver))
    {
        ReportFatal(psReport, ErrorKind::FORMAT_REJECTED, CPLE_NotSupported,
                    "%s dataset %s uses the %s format, which is not a "
                    "transactional container. Convert it to GeoPackage or "
                    "File Geodatabase first.",
                    pszRole, poDS->GetDescription(),
                    pszDriver ? pszDriver : "unknown");
        return false;
    }
    return true;
}

/************************************************************************/
/*                         ComputeForDatasets()                         */
/************************************************************************/

/** Compute a metric from GDAL datasets, writing the result on the grid layer.
 *
 * @param poGridDS vector dataset of the grid, opened in update mode.
 * @param poInputDS vector or raster input.
 * @param poSlopeDS optional slope raster (R_SDc with SLOPE_THRESHOLD).
 */
CPLErr ComputeForDatasets(GDALDataset *poGridDS, GDALDataset *poInputDS,
                          GDALDataset *poSlopeDS, const Options &oOptions,
                          RunReport *psReport, GDALProgressFunc pfnProgress,
                          void *pProgressData)
{
    RunReport sLocalReport;
    if (psReport == nullptr)
        psReport = &sLocalReport;
    *psReport = RunReport();

    if (poGridDS == nullptr || poInputDS == nullptr)
    {
        ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                    "Missing %s dataset", poGridDS ? "input" : "grid");
        return CE_Failure;
    }
    if (!oOptions.bMetricSet)
    {
        ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                    "No metric specified");
        return CE_Failure;
    }

    if (!CheckContainer(poGridDS, "Grid", psReport))
        return CE_Failure;
    OGRLayer *poGridLayer =
        GetLayer(poGridDS, oOptions.osGridLayer, "Grid", psReport);
    if (poGridLayer == nullptr)
        return CE_Failure;

    if (poGridDS->GetAccess() != GA_Update ||
        !poGridLayer->TestCapability(OLCRandomWrite))
    {
        ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                    "Grid layer %s must be writable", poGridLayer->GetName());
        return CE_Failure;
    }

    OGRLayerZoneProvider oZones(poGridLayer, oOptions.osZoneIdField);
    if (!oZones.IsValid())
    {
        ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                    "Zone identifier field '%s' not found in %s",
                    oOptions.osZoneIdField.c_str(), poGridLayer->GetName());
        return CE_Failure;
    }
    OGRLayerAttributeTable oTarget(poGridDS, poGridLayer,
                                   oOptions.osZoneIdField);

    Sources sSources;
    sSources.poZones = &oZones;
    sSources.poTarget = &oTarget;

    std::unique_ptr<OGRLayerFeatureProvider> poFeatures;
    std::unique_ptr<GDALBandSampleProvider> poRaster;
    std::unique_ptr<GDALBandSampleProvider> poSlope;

    if (GetMetricInputKind(oOptions.eMetric) == InputKind::RASTER)
    {
        if (oOptions.nBand < 1 || oOptions.nBand > poInputDS->GetRasterCount())
        {
            ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                        "Invalid band %d for %s", oOptions.nBand,
                        poInputDS->GetDescription());
            return CE_Failure;
        }
        poRaster = std::make_unique<GDALBandSampleProvider>(
            poInputDS->GetRasterBand(oOptions.nBand));
        sSources.poRaster = poRaster.get();

        if (poSlopeDS)
        {
            if (oOptions.nSlopeBand < 1 ||
                oOptions.nSlopeBand > poSlopeDS->GetRasterCount())
            {
                ReportFatal(psReport, ErrorKind::CONFIGURATION,
                            CPLE_IllegalArg, "Invalid slope band %d for %s",
                            oOptions.nSlopeBand, poSlopeDS->GetDescription());
                return CE_Failure;
            }
            poSlope = std::make_unique<GDALBandSampleProvider>(
                poSlopeDS->GetRasterBand(oOptions.nSlopeBand));
            sSources.poSlope = poSlope.get();
        }
    }
    else
    {
        if (!CheckContainer(poInputDS, "Input", psReport))
            return CE_Failure;
        OGRLayer *poInputLayer =
            GetLayer(poInputDS, oOptions.osInputLayer, "Input", psReport);
        if (poInputLayer == nullptr)
            return CE_Failure;
        if (!oOptions.osCategoryField.empty() &&
            poInputLayer->GetLayerDefn()->GetFieldIndex(
                oOptions.osCategoryField.c_str()) < 0)
        {
            ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                        "Category field '%s' not found in %s",
                        oOptions.osCategoryField.c_str(),
                        poInputLayer->GetName());
            return CE_Failure;
        }
        poFeatures = std::make_unique<OGRLayerFeatureProvider>(
            poInputLayer, oOptions.osCategoryField);
        sSources.poFeatures = poFeatures.get();
    }

    return Compute(sSources, oOptions, psReport, pfnProgress, pProgressData);
}

}  // namespace geodiv

/************************************************************************/
/*                        GeodivComputeMetric()                         */
/************************************************************************/

/** Compute one geodiversity metric for each zone of a grid layer and store it
 * as a new field of that layer.
 *
 * @param hGridDS vector dataset holding the grid, opened in update mode.
 * @param hInputDS vector or raster dataset with the landscape elements.
 * @param hSlopeDS optional slope raster, or nullptr.
 * @param papszOptions NAME=VALUE list, see geodiv::Options::Init().
 *   METRIC is required.
 * @param pfnProgress optional progress reporting callback.
 * @param pProgressData optional data for progress callback.
 * @return CE_Failure if an error occurred, CE_None otherwise.
 */
CPLErr GeodivComputeMetric(GDALDatasetH hGridDS, GDALDatasetH hInputDS,
                           GDALDatasetH hSlopeDS, CSLConstList papszOptions,
                           GDALProgressFunc pfnProgress, void *pProgressData)
{
    VALIDATE_POINTER1(hGridDS, __func__, CE_Failure);
    VALIDATE_POINTER1(hInputDS, __func__, CE_Failure);

    geodiv::Options oOptions;
    if (auto eErr = oOptions.Init(papszOptions); eErr != CE_None)
        return eErr;

    return geodiv::ComputeForDatasets(
        GDALDataset::FromHandle(hGridDS), GDALDataset::FromHandle(hInputDS),
        GDALDataset::FromHandle(hSlopeDS), oOptions, nullptr, pfnProgress,
        pProgressData);
}
