/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Zonal geodiversity pipeline: validate, assign, reduce, write
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_priv.h"

#include "cpl_conv.h"
#include "cpl_string.h"

#include <algorithm>
#include <cmath>

namespace geodiv
{

/************************************************************************/
/*                      Provider default methods                        */
/************************************************************************/

ZoneProvider::~ZoneProvider() = default;

const OGRSpatialReference *ZoneProvider::GetSpatialRef() const
{
    return nullptr;
}

FeatureProvider::~FeatureProvider() = default;

const OGRSpatialReference *FeatureProvider::GetSpatialRef() const
{
    return nullptr;
}

OGRwkbGeometryType FeatureProvider::GetGeomType() const
{
    return wkbUnknown;
}

GIntBig FeatureProvider::GetFeatureCountHint()
{
    return -1;
}

RasterSampleProvider::~RasterSampleProvider() = default;

const OGRSpatialReference *RasterSampleProvider::GetSpatialRef() const
{
    return nullptr;
}

GIntBig RasterSampleProvider::GetSampleCountHint()
{
    return -1;
}

/************************************************************************/
/*                           GeodivZonalImpl                            */
/************************************************************************/

namespace
{

class GeodivZonalImpl
{
  public:
    GeodivZonalImpl(const Sources &sSources, const Options &oOptions,
                    RunReport &sReport)
        : m_sSources(sSources), m_oOptions(oOptions), m_sReport(sReport),
          m_oAccumulators(GetAccumulatorOptions(oOptions)),
          m_bRasterInput(GetMetricInputKind(oOptions.eMetric) ==
                         InputKind::RASTER)
    {
    }

    bool Process(GDALProgressFunc pfnProgress, void *pProgressData);

  private:
    const Sources &m_sSources;
    const Options &m_oOptions;
    RunReport &m_sReport;
    ZoneCatalog m_oCatalog{};
    ZoneAccumulators m_oAccumulators;
    const bool m_bRasterInput;

    bool ValidateOptions();
    bool CheckSpatialCompatibility();
    bool StreamFeatures(FeatureAssigner &oAssigner, double dfStart,
                        double dfEnd, GDALProgressFunc pfnProgress,
                        void *pProgressData);
    bool StreamSamples(RasterSampleProvider &oProvider, bool bSlope,
                       FeatureAssigner &oAssigner, double dfStart,
                       double dfEnd, GDALProgressFunc pfnProgress,
                       void *pProgressData);
    void ReduceZones();
    void EmitSummary() const;

    std::string GetSourceName() const
    {
        if (m_bRasterInput)
            return m_sSources.poRaster->GetName();
        return m_sSources.poFeatures->GetName();
    }

    CPL_DISALLOW_COPY_ASSIGN(GeodivZonalImpl)
};

/************************************************************************/
/*                          ValidateOptions()                           */
/************************************************************************/

bool GeodivZonalImpl::ValidateOptions()
{
    if (!m_oOptions.bMetricSet)
    {
        ReportFatal(&m_sReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                    "No metric specified");
        return false;
    }
    const Metric eMetric = m_oOptions.eMetric;
    const char *pszCode = GetMetricCode(eMetric);

    if (m_sSources.poZones == nullptr)
    {
        ReportFatal(&m_sReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                    "No grid given");
        return false;
    }

    if (GetMetricInputKind(eMetric) == InputKind::RASTER)
    {
        if (m_sSources.poRaster == nullptr)
        {
            ReportFatal(&m_sReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                        "%s requires a raster input", pszCode);
            return false;
        }
        if (eMetric == Metric::R_M)
        {
            const int nScales = m_oOptions.GetReliefScales();
            if (nScales < 1 || nScales > 8)
            {
                ReportFatal(&m_sReport, ErrorKind::CONFIGURATION,
                            CPLE_IllegalArg,
                            "Number of relief scales must be in [1,8], got %d",
                            nScales);
                return false;
            }
        }
        if (m_oOptions.bHasSlopeThreshold)
        {
            if (eMetric != Metric::R_SDC)
            {
                ReportFatal(&m_sReport, ErrorKind::CONFIGURATION,
                            CPLE_IllegalArg,
                            "A slope threshold only applies to R_SDc");
                return false;
            }
            if (m_sSources.poSlope == nullptr)
            {
                ReportFatal(&m_sReport, ErrorKind::CONFIGURATION,
                            CPLE_IllegalArg,
                            "A slope threshold requires a slope raster");
                return false;
            }
        }
    }
    else
    {
        if (m_sSources.poFeatures == nullptr)
        {
            ReportFatal(&m_sReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                        "%s requires a vector input", pszCode);
            return false;
        }
        if (IsCategoricalMetric(eMetric) &&
            !m_sSources.poFeatures->HasCategory())
        {
            ReportFatal(&m_sReport, ErrorKind::CONFIGURATION, CPLE_IllegalArg,
                        "%s requires a category field", pszCode);
            return false;
        }
        // Centroids and overlays of polygons and lines go through GEOS
        if (GetMetricInputKind(eMetric) != InputKind::POINT &&
            !OGRGeometryFactory::haveGEOS())
        {
            ReportFatal(&m_sReport, ErrorKind::CONFIGURATION,
                        CPLE_NotSupported,
                        "%s requires GDAL to be built with GEOS", pszCode);
            return false;
        }
    }
    return true;
}

/************************************************************************/
/*                     CheckSpatialCompatibility()                      */
/************************************************************************/

bool GeodivZonalImpl::CheckSpatialCompatibility()
{
    const OGRSpatialReference *poInputSRS =
        m_bRasterInput ? m_sSources.poRaster->GetSpatialRef()
                       : m_sSources.poFeatures->GetSpatialRef();
    if (!ValidateSpatialRefs(m_sSources.poZones->GetSpatialRef(), poInputSRS,
                             &m_sReport))
        return false;
    if (m_sSources.poSlope &&
        !ValidateSpatialRefs(m_sSources.poZones->GetSpatialRef(),
                             m_sSources.poSlope->GetSpatialRef(), &m_sReport))
        return false;

    if (!m_oCatalog.Load(*m_sSources.poZones, &m_sReport))
        return false;

    OGREnvelope sInputExtent;
    const bool bHasExtent =
        m_bRasterInput ? m_sSources.poRaster->GetExtent(&sInputExtent)
                       : m_sSources.poFeatures->GetExtent(&sInputExtent);
    if (!bHasExtent)
    {
        ReportFatal(&m_sReport, ErrorKind::SPATIAL_MISMATCH, CPLE_AppDefined,
                    "Cannot determine the extent of %s",
                    GetSourceName().c_str());
        return false;
    }
    return ValidateExtents(m_oCatalog.GetExtent(), sInputExtent, &m_sReport);
}

/************************************************************************/
/*                           StreamFeatures()                           */
/************************************************************************/

bool GeodivZonalImpl::StreamFeatures(FeatureAssigner &oAssigner,
                                     double dfStart, double dfEnd,
                                     GDALProgressFunc pfnProgress,
                                     void *pProgressData)
{
    FeatureProvider &oProvider = *m_sSources.poFeatures;
    const GIntBig nTotal = oProvider.GetFeatureCountHint();

    oProvider.ResetReading();
    CPLErrorReset();

    FeatureRecord oFeature;
    GIntBig nRead = 0;
    while (oProvider.GetNextFeature(oFeature))
    {
        oAssigner.AssignFeature(oFeature);
        oFeature = FeatureRecord();
        ++nRead;
        if ((nRead % 1000) == 0)
        {
            const double dfRatio =
                nTotal > 0 ? std::min(1.0, static_cast<double>(nRead) /
                                               static_cast<double>(nTotal))
                           : 0.5;
            if (!ReportProgress(dfStart + (dfEnd - dfStart) * dfRatio,
                                pfnProgress, pProgressData, &m_sReport))
                return false;
        }
    }

    if (CPLGetLastErrorType() == CE_Failure)
    {
        ReportFatal(&m_sReport, ErrorKind::IO, CPLE_AppDefined,
                    "Reading features from %s failed: %s",
                    oProvider.GetName().c_str(), CPLGetLastErrorMsg());
        return false;
    }
    return ReportProgress(dfEnd, pfnProgress, pProgressData, &m_sReport);
}

/************************************************************************/
/*                           StreamSamples()                            */
/************************************************************************/

bool GeodivZonalImpl::StreamSamples(RasterSampleProvider &oProvider,
                                    bool bSlope, FeatureAssigner &oAssigner,
                                    double dfStart, double dfEnd,
                                    GDALProgressFunc pfnProgress,
                                    void *pProgressData)
{
    const GIntBig nTotal = oProvider.GetSampleCountHint();

    oProvider.ResetReading();
    CPLErrorReset();

    std::vector<RasterSample> aoSamples;
    GIntBig nRead = 0;
    while (oProvider.GetNextChunk(aoSamples))
    {
        if (bSlope)
            oAssigner.AssignSlopeSamples(aoSamples);
        else
            oAssigner.AssignSamples(aoSamples);
        nRead += static_cast<GIntBig>(aoSamples.size());
        const double dfRatio =
            nTotal > 0 ? std::min(1.0, static_cast<double>(nRead) /
                                           static_cast<double>(nTotal))
                       : 0.5;
        if (!ReportProgress(dfStart + (dfEnd - dfStart) * dfRatio, pfnProgress,
                            pProgressData, &m_sReport))
            return false;
    }

    if (CPLGetLastErrorType() == CE_Failure)
    {
        ReportFatal(&m_sReport, ErrorKind::IO, CPLE_AppDefined,
                    "Reading samples from %s failed: %s",
                    oProvider.GetName().c_str(), CPLGetLastErrorMsg());
        return false;
    }
    return true;
}

/************************************************************************/
/*                            ReduceZones()                             */
/************************************************************************/

void GeodivZonalImpl::ReduceZones()
{
    m_sReport.aoValues.clear();
    m_sReport.aoValues.reserve(m_oCatalog.size());
    m_sReport.anSparseZones.clear();

    for (size_t i = 0; i < m_oCatalog.size(); ++i)
    {
        const auto &oZone = m_oCatalog.GetZone(i);
        bool bSparse = false;
        m_sReport.aoValues.push_back(
            ComputeZoneValue(m_oOptions, oZone.nId,
                             m_oAccumulators.find(oZone.nId), oZone.dfArea,
                             &bSparse));
        if (bSparse)
            m_sReport.anSparseZones.push_back(oZone.nId);
    }
}

/************************************************************************/
/*                            EmitSummary()                             */
/************************************************************************/

void GeodivZonalImpl::EmitSummary() const
{
    if (m_sReport.nCategoryDomainErrors > 0)
    {
        CPLError(CE_Warning, CPLE_AppDefined,
                 "%s: " CPL_FRMT_GIB " feature(s) skipped because of a "
                 "missing or non-discrete category value",
                 GetErrorKindName(ErrorKind::CATEGORY_DOMAIN),
                 m_sReport.nCategoryDomainErrors);
    }
    if (!m_sReport.anSparseZones.empty())
    {
        std::string osList;
        const size_t nShown =
            std::min<size_t>(m_sReport.anSparseZones.size(), 10);
        for (size_t i = 0; i < nShown; ++i)
        {
            if (!osList.empty())
                osList += ", ";
            osList += CPLSPrintf(CPL_FRMT_GIB, m_sReport.anSparseZones[i]);
        }
        if (nShown < m_sReport.anSparseZones.size())
            osList += ", ...";
        CPLError(CE_Warning, CPLE_AppDefined,
                 "%s: %d zone(s) have fewer than 2 samples and received "
                 "no-data (%s)",
                 GetErrorKindName(ErrorKind::SPARSE_ZONE),
                 static_cast<int>(m_sReport.anSparseZones.size()),
                 osList.c_str());
    }
    if (m_sReport.nGeometryTypeSkips > 0)
    {
        CPLError(CE_Warning, CPLE_AppDefined,
                 CPL_FRMT_GIB " feature(s) skipped because of a geometry type "
                              "not usable by %s",
                 m_sReport.nGeometryTypeSkips,
                 GetMetricCode(m_oOptions.eMetric));
    }

    CPLDebug(GEODIV_DEBUG_KEY,
             "%s: " CPL_FRMT_GIB " zones, " CPL_FRMT_GIB " read, " CPL_FRMT_GIB
             " routed, " CPL_FRMT_GIB " outside, " CPL_FRMT_GIB
             " NoData samples",
             GetMetricCode(m_oOptions.eMetric), m_sReport.nZoneCount,
             m_sReport.nFeaturesRead, m_sReport.nFeaturesRouted,
             m_sReport.nFeaturesOutside, m_sReport.nNoDataSamples);
}

/************************************************************************/
/*                              Process()                               */
/************************************************************************/

bool GeodivZonalImpl::Process(GDALProgressFunc pfnProgress,
                              void *pProgressData)
{
    InterruptGuard oInterruptGuard;

    if (!ValidateOptions() || !CheckSpatialCompatibility())
        return false;

    const std::string osTempRoot = TempWorkspace::GetRootDirectory();
    const int nSwept = TempWorkspace::SweepStaleWorkspaces(osTempRoot);
    if (nSwept > 0)
        CPLDebug(GEODIV_DEBUG_KEY, "Removed %d stale workspace(s)", nSwept);

    auto poWorkspace = TempWorkspace::Create(&m_sReport);
    if (!poWorkspace)
        return false;

    if (!ReportProgress(0.05, pfnProgress, pProgressData, &m_sReport))
        return false;

    FeatureAssigner oAssigner(m_oCatalog, m_oAccumulators, m_oOptions,
                              m_sReport);
    if (!m_bRasterInput)
    {
        if (!StreamFeatures(oAssigner, 0.05, 0.85, pfnProgress, pProgressData))
            return false;
    }
    else
    {
        const bool bUseSlope =
            m_oOptions.bHasSlopeThreshold && m_sSources.poSlope != nullptr;
        if (!StreamSamples(*m_sSources.poRaster, false, oAssigner, 0.05,
                           bUseSlope ? 0.65 : 0.85, pfnProgress,
                           pProgressData))
            return false;
        if (bUseSlope &&
            !StreamSamples(*m_sSources.poSlope, true, oAssigner, 0.65, 0.85,
                           pfnProgress, pProgressData))
            return false;
    }

    ReduceZones();
    EmitSummary();

    const std::string osStaging = poWorkspace->GetFilename("values", "csv");
    if (!WriteStagingFile(osStaging, m_sReport))
    {
        ReportFatal(&m_sReport, ErrorKind::IO, CPLE_FileIO,
                    "Cannot write staging file %s", osStaging.c_str());
        return false;
    }

    if (!ReportProgress(0.9, pfnProgress, pProgressData, &m_sReport))
        return false;

    if (m_sSources.poTarget)
    {
        // The target receives the staged values, not the in-memory ones
        std::vector<ZoneValue> aoStaged;
        if (!ReadStagingFile(osStaging, aoStaged))
        {
            ReportFatal(&m_sReport, ErrorKind::IO, CPLE_FileIO,
                        "Cannot read back staging file %s", osStaging.c_str());
            return false;
        }

        // Field names are resolved while holding the lock
        const double dfTimeout =
            CPLAtof(CPLGetConfigOption("GEODIV_LOCK_TIMEOUT", "10"));
        auto poLock = TargetLock::Acquire(m_sSources.poTarget->GetLockPath(),
                                          dfTimeout, &m_sReport);
        if (!poLock)
            return false;

        FieldWriter oWriter(*m_sSources.poTarget, m_oOptions, GetSourceName());
        if (!oWriter.ResolveFieldNames(&m_sReport) ||
            !oWriter.Commit(aoStaged, &m_sReport))
            return false;

        if (!poLock->Release())
        {
            m_sReport.bCleanupFailed = true;
            m_sReport.osCleanupMessage = "Cannot remove lock file " +
                                         m_sSources.poTarget->GetLockPath();
        }
    }

    CPL_IGNORE_RET_VAL(poWorkspace->Release());

    return ReportProgress(1.0, pfnProgress, pProgressData, &m_sReport);
}

}  // namespace

/************************************************************************/
/*                              Compute()                               */
/************************************************************************/

/** Compute one geodiversity metric per zone.
 *
 * On success the per-zone values are in psReport->aoValues, in the order the
 * zones were read, and have been written to sSources.poTarget when set.
 * Fatal errors are posted with CPLError() and recorded in psReport; no write
 * happens on the target in that case.
 *
 * @param sSources grid, input and optional target.
 * @param oOptions metric and its options.
 * @param psReport run report, may be nullptr.
 * @param pfnProgress optional progress callback.
 * @param pProgressData user data of the progress callback.
 * @return CE_None on success.
 */
CPLErr Compute(const Sources &sSources, const Options &oOptions,
               RunReport *psReport, GDALProgressFunc pfnProgress,
               void *pProgressData)
{
    RunReport sLocalReport;
    RunReport &sReport = psReport ? *psReport : sLocalReport;
    sReport = RunReport();

    GeodivZonalImpl oImpl(sSources, oOptions, sReport);
    if (!oImpl.Process(pfnProgress, pProgressData))
    {
        if (sReport.Succeeded())
        {
            sReport.eFatalError = ErrorKind::IO;
            sReport.osFatalMessage = CPLGetLastErrorMsg();
        }
        return CE_Failure;
    }
    return CE_None;
}

}  // namespace geodiv
