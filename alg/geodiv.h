/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Public API of the geodiversity zonal index engine
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GEODIV_H_INCLUDED
#define GEODIV_H_INCLUDED

#include "cpl_error.h"
#include "cpl_port.h"
#include "cpl_progress.h"
#include "cpl_string.h"
#include "gdal.h"
#include "ogr_core.h"
#include "ogr_geometry.h"

#include <memory>
#include <string>
#include <variant>
#include <vector>

class GDALDataset;
class OGRSpatialReference;

/** Major version of the GeoDiv engine */
#define GEODIV_VERSION_MAJOR 1
/** Minor version of the GeoDiv engine */
#define GEODIV_VERSION_MINOR 0

/** Debug category used with CPLDebug() */
#define GEODIV_DEBUG_KEY "GEODIV"

/** Metadata domain holding field provenance on the zone layer */
#define GEODIV_METADATA_DOMAIN "GEODIV"

namespace geodiv
{

/************************************************************************/
/*                               Metric                                 */
/************************************************************************/

/** Diversity index families */
enum class Metric
{
    A_NE,   /**< polygon element count */
    A_NC,   /**< polygon category richness */
    A_SHDI, /**< Shannon diversity of category areas */
    L_TL,   /**< total line length */
    P_NE,   /**< point element count */
    P_NC,   /**< point category richness */
    P_HU,   /**< Shannon entropy of point category counts */
    R_SD,   /**< raster population standard deviation */
    R_SDC,  /**< raster circular standard deviation */
    R_M,    /**< raster multi-scale relief index */
};

/** Geometry kind consumed by a metric */
enum class InputKind
{
    POLYGON,
    LINE,
    POINT,
    RASTER,
};

const char *GetMetricCode(Metric eMetric);
bool ParseMetricCode(const char *pszCode, Metric *peMetric);
const std::vector<Metric> &GetAllMetrics();
InputKind GetMetricInputKind(Metric eMetric);
bool IsCountMetric(Metric eMetric);
bool IsCategoricalMetric(Metric eMetric);

/************************************************************************/
/*                              ErrorKind                               */
/************************************************************************/

/** Classification of the conditions a run can end up with. */
enum class ErrorKind
{
    NONE,
    CONFIGURATION,
    SPATIAL_MISMATCH,
    FORMAT_REJECTED,
    CATEGORY_DOMAIN,
    SPARSE_ZONE,
    RESOURCE_CLEANUP,
    INTERRUPTED,
    IO,
};

const char *GetErrorKindName(ErrorKind eKind);

/************************************************************************/
/*                               Options                                */
/************************************************************************/

enum class AngleUnit
{
    DEGREES,
    RADIANS,
};

struct Options
{
    /** Parse options given as a NAME=VALUE list.
     *
     * Recognized keys: METRIC, OUTPUT_FIELD, GRID_LAYER, INPUT_LAYER,
     * ZONE_ID_FIELD, CATEGORY_FIELD, BAND, SLOPE_BAND, IGNORE_NODATA,
     * STANDARDIZE, ANGLE_UNIT, OUTPUT_DEGREES, SLOPE_THRESHOLD,
     * RELIEF_SCALES, RELIEF_NORMALIZE_AREA, NODATA_VALUE.
     */
    CPLErr Init(CSLConstList papszOptions);

    Metric eMetric = Metric::P_NE;
    bool bMetricSet = false;

    std::string osOutputField{};
    std::string osGridLayer{};
    std::string osInputLayer{};
    std::string osZoneIdField{};
    std::string osCategoryField{};
    int nBand = 1;
    int nSlopeBand = 1;

    bool bIgnoreNoData = true;
    bool bStandardize = false;

    AngleUnit eAngleUnit = AngleUnit::DEGREES;
    bool bOutputDegrees = false;
    bool bHasSlopeThreshold = false;
    double dfSlopeThreshold = 0;

    /** Number of nested scales for R_M. 0 means GEODIV_RELIEF_SCALES */
    int nReliefScales = 0;
    bool bReliefNormalizeByArea = false;

    bool bHasNoDataValue = false;
    double dfNoDataValue = 0;

    int GetReliefScales() const;
};

/************************************************************************/
/*                             Run report                               */
/************************************************************************/

/** Value computed for one zone. bNoData marks the no-data sentinel. */
struct ZoneValue
{
    GIntBig nZoneId = 0;
    double dfValue = 0;
    bool bNoData = true;
};

struct RunReport
{
    ErrorKind eFatalError = ErrorKind::NONE;
    std::string osFatalMessage{};

    std::string osFieldName{};
    std::string osStandardizedFieldName{};
    std::vector<ZoneValue> aoValues{};

    GIntBig nZoneCount = 0;
    GIntBig nFeaturesRead = 0;
    GIntBig nFeaturesRouted = 0;
    GIntBig nFeaturesOutside = 0;
    GIntBig nCategoryDomainErrors = 0;
    GIntBig nGeometryTypeSkips = 0;
    GIntBig nNoDataSamples = 0;
    std::vector<GIntBig> anSparseZones{};
    bool bPartialOverlap = false;
    bool bCleanupFailed = false;
    std::string osCleanupMessage{};

    bool Succeeded() const
    {
        return eFatalError == ErrorKind::NONE;
    }

    const ZoneValue *GetValue(GIntBig nZoneId) const;
};

/************************************************************************/
/*                         Provider interfaces                          */
/************************************************************************/

/** Raw category attribute, as read from the host. */
using CategoryValue = std::variant<std::monostate, GIntBig, double, std::string>;

struct ZoneRecord
{
    GIntBig nId = 0;
    std::unique_ptr<OGRGeometry> poGeom{};
};

struct FeatureRecord
{
    GIntBig nFID = OGRNullFID;
    std::unique_ptr<OGRGeometry> poGeom{};
    CategoryValue oCategory{};
};

struct RasterSample
{
    double dfX = 0;
    double dfY = 0;
    double dfValue = 0;
    bool bNoData = false;
};

/** Read access to the analytical grid. */
class ZoneProvider
{
  public:
    virtual ~ZoneProvider();

    virtual std::string GetName() const = 0;
    virtual const OGRSpatialReference *GetSpatialRef() const;
    virtual void ResetReading() = 0;
    /** Fetch the next zone. Returns false at end of sequence or on error
     * (in which case CPLGetLastErrorType() is CE_Failure). */
    virtual bool GetNextZone(ZoneRecord &oZone) = 0;
};

/** Forward-only stream of vector features. */
class FeatureProvider
{
  public:
    virtual ~FeatureProvider();

    virtual std::string GetName() const = 0;
    virtual const OGRSpatialReference *GetSpatialRef() const;
    virtual bool GetExtent(OGREnvelope *psExtent) = 0;
    virtual OGRwkbGeometryType GetGeomType() const;
    /** Whether a category attribute is attached to the records. */
    virtual bool HasCategory() const = 0;
    /** Approximate count, or -1 if unknown. Used for progress only. */
    virtual GIntBig GetFeatureCountHint();
    virtual void ResetReading() = 0;
    virtual bool GetNextFeature(FeatureRecord &oFeature) = 0;
};

/** Forward-only stream of raster cell samples. */
class RasterSampleProvider
{
  public:
    virtual ~RasterSampleProvider();

    virtual std::string GetName() const = 0;
    virtual const OGRSpatialReference *GetSpatialRef() const;
    virtual bool GetExtent(OGREnvelope *psExtent) = 0;
    virtual GIntBig GetSampleCountHint();
    virtual void ResetReading() = 0;
    /** Fill aoSamples with the next batch. Returns false when exhausted. */
    virtual bool GetNextChunk(std::vector<RasterSample> &aoSamples) = 0;
};

/** Values for one output field. */
struct FieldColumn
{
    std::string osName{};
    std::string osAlias{};
    std::vector<ZoneValue> aoValues{};
};

/** Mutable attribute table of the zone layer. */
class AttributeTable
{
  public:
    virtual ~AttributeTable();

    virtual std::string GetName() const = 0;
    virtual bool HasField(const std::string &osName) const = 0;
    virtual int GetMaxFieldNameLength() const;
    virtual std::string GetFieldProvenance(const std::string &osName) const = 0;
    virtual bool SetFieldProvenance(const std::string &osName,
                                    const std::string &osProvenance) = 0;
    /** Create a real field, or keep the existing one. */
    virtual bool EnsureRealField(const std::string &osName,
                                 const std::string &osAlias) = 0;
    /** Write the columns onto the zone rows. bNoData values become NULL. */
    virtual bool WriteColumns(const std::vector<FieldColumn> &aoColumns) = 0;

    virtual bool StartTransaction();
    virtual bool CommitTransaction();
    virtual bool RollbackTransaction();

    /** Path of the lock file guarding concurrent writers, or empty. */
    virtual std::string GetLockPath() const;
};

/** All collaborators of one run. Only the members relevant to the metric
 * need to be set. */
struct Sources
{
    ZoneProvider *poZones = nullptr;
    FeatureProvider *poFeatures = nullptr;
    RasterSampleProvider *poRaster = nullptr;
    RasterSampleProvider *poSlope = nullptr;
    AttributeTable *poTarget = nullptr;
};

/************************************************************************/
/*                             Entry points                             */
/************************************************************************/

CPLErr Compute(const Sources &sSources, const Options &oOptions,
               RunReport *psReport, GDALProgressFunc pfnProgress,
               void *pProgressData);

CPLErr ComputeForDatasets(GDALDataset *poGridDS, GDALDataset *poInputDS,
                          GDALDataset *poSlopeDS, const Options &oOptions,
                          RunReport *psReport, GDALProgressFunc pfnProgress,
                          void *pProgressData);

}  // namespace geodiv

CPLErr GeodivComputeMetric(GDALDatasetH hGridDS, GDALDatasetH hInputDS,
                           GDALDatasetH hSlopeDS, CSLConstList papszOptions,
                           GDALProgressFunc pfnProgress, void *pProgressData);

#endif  // GEODIV_H_INCLUDED
