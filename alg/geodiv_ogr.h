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

#ifndef GEODIV_OGR_H_INCLUDED
#define GEODIV_OGR_H_INCLUDED

#include "geodiv.h"

#include "gdal_priv.h"
#include "ogrsf_frmts.h"

#include <string>
#include <vector>

namespace geodiv
{

/************************************************************************/
/*                         OGRLayerZoneProvider                         */
/************************************************************************/

/** Zones read from an OGR layer. The identifier is the FID, or an integer
 * field when pszIdField is set. */
class OGRLayerZoneProvider final : public ZoneProvider
{
  public:
    OGRLayerZoneProvider(OGRLayer *poLayer, const std::string &osIdField);

    bool IsValid() const
    {
        return m_osIdField.empty() || m_iIdField >= 0;
    }

    std::string GetName() const override;
    const OGRSpatialReference *GetSpatialRef() const override;
    void ResetReading() override;
    bool GetNextZone(ZoneRecord &oZone) override;

  private:
    OGRLayer *m_poLayer;
    std::string m_osIdField;
    int m_iIdField = -1;

    CPL_DISALLOW_COPY_ASSIGN(OGRLayerZoneProvider)
};

/************************************************************************/
/*                       OGRLayerFeatureProvider                        */
/************************************************************************/

class OGRLayerFeatureProvider final : public FeatureProvider
{
  public:
    OGRLayerFeatureProvider(OGRLayer *poLayer,
                            const std::string &osCategoryField);

    std::string GetName() const override;
    const OGRSpatialReference *GetSpatialRef() const override;
    bool GetExtent(OGREnvelope *psExtent) override;
    OGRwkbGeometryType GetGeomType() const override;
    bool HasCategory() const override;
    GIntBig GetFeatureCountHint() override;
    void ResetReading() override;
    bool GetNextFeature(FeatureRecord &oFeature) override;

  private:
    OGRLayer *m_poLayer;
    int m_iCategoryField = -1;

    CPL_DISALLOW_COPY_ASSIGN(OGRLayerFeatureProvider)
};

/************************************************************************/
/*                       GDALBandSampleProvider                         */
/************************************************************************/

/** Cell centers and values of a raster band, read by strips of rows. */
class GDALBandSampleProvider final : public RasterSampleProvider
{
  public:
    explicit GDALBandSampleProvider(GDALRasterBand *poBand);

    std::string GetName() const override;
    const OGRSpatialReference *GetSpatialRef() const override;
    bool GetExtent(OGREnvelope *psExtent) override;
    GIntBig GetSampleCountHint() override;
    void ResetReading() override;
    bool GetNextChunk(std::vector<RasterSample> &aoSamples) override;

  private:
    GDALRasterBand *m_poBand;
    GDALDataset *m_poDS;
    GDALGeoTransform m_gt{};
    bool m_bHasGT = false;
    int m_nRowsPerChunk = 1;
    int m_nNextRow = 0;
    std::vector<double> m_adfValues{};
    std::vector<GByte> m_abyMask{};

    CPL_DISALLOW_COPY_ASSIGN(GDALBandSampleProvider)
};

/************************************************************************/
/*                        OGRLayerAttributeTable                        */
/************************************************************************/

/** Output fields written on the zone layer itself. */
class OGRLayerAttributeTable final : public AttributeTable
{
  public:
    OGRLayerAttributeTable(GDALDataset *poDS, OGRLayer *poLayer,
                           const std::string &osIdField);

    std::string GetName() const override;
    bool HasField(const std::string &osName) const override;
    std::string GetFieldProvenance(const std::string &osName) const override;
    bool SetFieldProvenance(const std::string &osName,
                            const std::string &osProvenance) override;
    bool EnsureRealField(const std::string &osName,
                         const std::string &osAlias) override;
    bool WriteColumns(const std::vector<FieldColumn> &aoColumns) override;

    bool StartTransaction() override;
    bool CommitTransaction() override;
    bool RollbackTransaction() override;

    std::string GetLockPath() const override;

  private:
    GDALDataset *m_poDS;
    OGRLayer *m_poLayer;
    std::string m_osIdField;
    bool m_bInTransaction = false;

    CPL_DISALLOW_COPY_ASSIGN(OGRLayerAttributeTable)
};

}  // namespace geodiv

#endif  // GEODIV_OGR_H_INCLUDED
