/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Internal declarations of the geodiversity engine
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GEODIV_PRIV_H_INCLUDED
#define GEODIV_PRIV_H_INCLUDED

#include "geodiv.h"
#include "geodiv_accumulator.h"

#include "cpl_quad_tree.h"
#include "ogr_geometry.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

//! @cond Doxygen_Suppress

namespace geodiv
{

/** Post a CE_Failure and record it as the fatal outcome of the run. */
void ReportFatal(RunReport *psReport, ErrorKind eKind, CPLErrorNum nErrNo,
                 CPL_FORMAT_STRING(const char *pszFmt), ...)
    CPL_PRINT_FUNC_FORMAT(4, 5);

/************************************************************************/
/*                          Geometry helpers                            */
/************************************************************************/

double GetGeometryArea(const OGRGeometry *poGeom);
double GetGeometryLength(const OGRGeometry *poGeom);
bool GetAreaCentroid(const OGRGeometry *poGeom, double *pdfX, double *pdfY);
bool IsAxisAlignedRectangle(const OGRGeometry *poGeom);
bool ToCategoryCode(const CategoryValue &oValue, CategoryCode *poCode);

/************************************************************************/
/*                             ZoneCatalog                              */
/************************************************************************/

class ZoneCatalog
{
  public:
    struct Zone
    {
        GIntBig nId = 0;
        std::unique_ptr<OGRGeometry> poGeom{};
        OGREnvelope sEnvelope{};
        double dfArea = 0;
        bool bIsRectangle = false;
        /** No other zone envelope overlaps the interior of this one */
        bool bIsExclusive = false;
    };

    ZoneCatalog();
    ~ZoneCatalog();

    bool Load(ZoneProvider &oProvider, RunReport *psReport);

    size_t size() const
    {
        return m_apoZones.size();
    }

    const Zone &GetZone(size_t i) const
    {
        return *(m_apoZones[i]);
    }

    const Zone *FindZone(GIntBig nId) const;

    const OGREnvelope &GetExtent() const
    {
        return m_sExtent;
    }

    /** Zone owning a point: half-open containment, lowest id on ties.
     * apoScratch is a reusable work buffer. */
    const Zone *FindOwner(double dfX, double dfY,
                          std::vector<const Zone *> &apoScratch) const;
    const Zone *FindOwner(double dfX, double dfY) const;

    /** Zones whose envelope intersects sEnv, sorted by identifier. */
    void FindCandidates(const OGREnvelope &sEnv,
                        std::vector<const Zone *> &apoCandidates) const;

  private:
    std::vector<std::unique_ptr<Zone>> m_apoZones{};
    std::map<GIntBig, const Zone *> m_oMapIdToZone{};
    OGREnvelope m_sExtent{};
    CPLQuadTree *m_hQuadTree = nullptr;

    CPL_DISALLOW_COPY_ASSIGN(ZoneCatalog)
};

/************************************************************************/
/*                           Extent checks                              */
/************************************************************************/

bool ValidateExtents(const OGREnvelope &sGridExtent,
                     const OGREnvelope &sInputExtent, RunReport *psReport);
bool ValidateSpatialRefs(const OGRSpatialReference *poGridSRS,
                         const OGRSpatialReference *poInputSRS,
                         RunReport *psReport);
bool IsAcceptedContainerDriver(const char *pszDriverName);

/************************************************************************/
/*                           FeatureAssigner                            */
/************************************************************************/

class FeatureAssigner
{
  public:
    FeatureAssigner(const ZoneCatalog &oCatalog,
                    ZoneAccumulators &oAccumulators, const Options &oOptions,
                    RunReport &sReport);

    void AssignFeature(const FeatureRecord &oFeature);
    void AssignSamples(const std::vector<RasterSample> &aoSamples);
    void AssignSlopeSamples(const std::vector<RasterSample> &aoSamples);

  private:
    const ZoneCatalog &m_oCatalog;
    ZoneAccumulators &m_oAccumulators;
    const Options &m_oOptions;
    RunReport &m_sReport;
    const InputKind m_eInputKind;
    const int m_nReliefSide;
    std::vector<const ZoneCatalog::Zone *> m_apoCandidates{};
    const ZoneCatalog::Zone *m_poLastZone = nullptr;

    bool GetCategory(const FeatureRecord &oFeature, CategoryCode *poCode);
    bool AssignPoint(const OGRPoint *poPoint, const CategoryCode *poCode);
    bool AssignPolygon(const OGRGeometry *poGeom, const CategoryCode *poCode);
    bool AssignLine(const OGRGeometry *poGeom);
    void AssignSample(const RasterSample &oSample);
    const ZoneCatalog::Zone *FindSampleOwner(double dfX, double dfY);

    CPL_DISALLOW_COPY_ASSIGN(FeatureAssigner)
};

/************************************************************************/
/*                          Metric reductions                           */
/************************************************************************/

AccumulatorOptions GetAccumulatorOptions(const Options &oOptions);

double ShannonIndex(const CategoryTally &oTally);
double MeanResultantLength(double dfSumCos, double dfSumSin, double dfCount);
double CircularStdDev(double dfSumCos, double dfSumSin, double dfCount);
double ReliefIndex(const ReliefWindows &oWindows);

/** Reduce the aggregates of one zone (nullptr if none was created).
 * *pbSparse is set when a minimum sample count was not met. */
ZoneValue ComputeZoneValue(const Options &oOptions, GIntBig nZoneId,
                           const ZoneStats *poStats, double dfZoneArea,
                           bool *pbSparse);

std::vector<ZoneValue> StandardizeMinMax(const std::vector<ZoneValue> &aoIn);

/************************************************************************/
/*                             FieldWriter                              */
/************************************************************************/

std::string BuildFieldPrefix(const std::string &osSourceName);
std::string BuildDefaultFieldName(Metric eMetric,
                                  const std::string &osSourceName,
                                  int nMaxLength);
std::string BuildProvenance(Metric eMetric, const std::string &osSourceName);

class FieldWriter
{
  public:
    FieldWriter(AttributeTable &oTable, const Options &oOptions,
                const std::string &osSourceName);

    /** Decide on output field names. No mutation of the table. */
    bool ResolveFieldNames(RunReport *psReport);

    /** Persist values in one transaction. */
    bool Commit(const std::vector<ZoneValue> &aoValues, RunReport *psReport);

    const std::string &GetFieldName() const
    {
        return m_osFieldName;
    }

    const std::string &GetStandardizedFieldName() const
    {
        return m_osStdFieldName;
    }

  private:
    AttributeTable &m_oTable;
    const Options &m_oOptions;
    std::string m_osSourceName;
    std::string m_osProvenance{};
    std::string m_osFieldName{};
    std::string m_osStdFieldName{};

    std::string ResolveOne(const std::string &osWanted,
                           const std::string &osProvenance, bool bExplicit,
                           int nMaxLength) const;

    CPL_DISALLOW_COPY_ASSIGN(FieldWriter)
};

/************************************************************************/
/*                           ResourceManager                            */
/************************************************************************/

/** Scratch directory owned by one run, removed on every exit path. */
class TempWorkspace
{
  public:
    ~TempWorkspace();

    static std::unique_ptr<TempWorkspace> Create(RunReport *psReport);

    const std::string &GetPath() const
    {
        return m_osPath;
    }

    std::string GetFilename(const char *pszBasename,
                            const char *pszExtension) const;

    /** Remove the directory. A failure is a ResourceCleanupError: logged
     * as a warning and recorded, never fatal. */
    bool Release();

    static std::string GetRootDirectory();
    static int SweepStaleWorkspaces(const std::string &osRoot);

  private:
    TempWorkspace(const std::string &osPath, RunReport *psReport);

    std::string m_osPath;
    RunReport *m_psReport;
    bool m_bReleased = false;

    CPL_DISALLOW_COPY_ASSIGN(TempWorkspace)
};

/** Exclusive lock on the target attribute table: an in-process mutex plus a
 * lock file holding the owner PID. */
class TargetLock
{
  public:
    ~TargetLock();

    static std::unique_ptr<TargetLock> Acquire(const std::string &osLockPath,
                                               double dfTimeout,
                                               RunReport *psReport);

    bool Release();

  private:
    explicit TargetLock(const std::string &osLockPath);

    std::string m_osLockPath;
    bool m_bHeld = true;

    CPL_DISALLOW_COPY_ASSIGN(TargetLock)
};

bool IsProcessAlive(int nPID);

/** Scope of one run with respect to SIGINT/SIGTERM. The first guard clears
 * the interrupt flag and installs the handlers, the last one restores the
 * previous handlers and clears the flag again. */
class InterruptGuard
{
  public:
    InterruptGuard();
    ~InterruptGuard();

  private:
    CPL_DISALLOW_COPY_ASSIGN(InterruptGuard)
};

bool IsInterruptRequested();
void RequestInterrupt();
void ClearInterruptRequest();

/** Progress callback wrapper honouring the interrupt flag. */
bool ReportProgress(double dfComplete, GDALProgressFunc pfnProgress,
                    void *pProgressData, RunReport *psReport);

bool WriteStagingFile(const std::string &osFilename, const RunReport &sReport);
bool ReadStagingFile(const std::string &osFilename,
                     std::vector<ZoneValue> &aoValues);

}  // namespace geodiv

//! @endcond

#endif  // GEODIV_PRIV_H_INCLUDED
