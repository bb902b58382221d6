/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  "geodiv <metric>" commands
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodivalg_metric.h"

#include "cpl_string.h"
#include "gdal_priv.h"

//! @cond Doxygen_Suppress

#ifndef _
#define _(x) (x)
#endif

/************************************************************************/
/*          GeodivMetricAlgorithm::GeodivMetricAlgorithm()              */
/************************************************************************/

GeodivMetricAlgorithm::GeodivMetricAlgorithm(const std::string &name,
                                             const std::string &description,
                                             const std::string &helpURL,
                                             geodiv::Metric eMetric)
    : GDALAlgorithm(name, description, helpURL), m_metric(eMetric)
{
    const geodiv::InputKind eKind = geodiv::GetMetricInputKind(eMetric);
    const bool bRaster = eKind == geodiv::InputKind::RASTER;

    AddProgressArg();
    AddOutputStringArg(&m_output);

    AddArg("grid", 0,
           _("Vector dataset holding the analytical grid (updated in-place)"),
           &m_grid, GDAL_OF_VECTOR | GDAL_OF_UPDATE)
        .SetRequired();
    AddArg("grid-layer", 0, _("Grid layer name"), &m_gridLayer);
    AddArg("zone-id-field", 0,
           _("Integer field identifying zones (default: feature id)"),
           &m_zoneIdField);

    if (bRaster)
    {
        AddArg("input", 'i', _("Input raster dataset"), &m_input,
               GDAL_OF_RASTER)
            .SetPositional()
            .SetRequired();
        AddBandArg(&m_band).SetDefault(m_band);
        AddArg("ignore-nodata", 0,
               _("Skip NoData cells when computing zone values (default)"),
               &m_ignoreNodata)
            .SetDefault(m_ignoreNodata)
            .SetMutualExclusionGroup("nodata");
        AddArg("no-ignore-nodata", 0,
               _("Give no-data to zones containing any NoData cell"),
               &m_noIgnoreNodata)
            .SetMutualExclusionGroup("nodata");
    }
    else
    {
        AddArg("input", 'i', _("Input vector dataset"), &m_input,
               GDAL_OF_VECTOR)
            .SetPositional()
            .SetRequired();
        AddArg("input-layer", 0, _("Input layer name"), &m_inputLayer);
    }

    if (geodiv::IsCategoricalMetric(eMetric))
    {
        AddArg("category-field", 0,
               _("Field of the input layer holding category codes"),
               &m_categoryField)
            .SetRequired();
    }

    AddArg("output-field", 0,
           _("Name of the field to write (derived from the metric and input "
             "layer by default)"),
           &m_outputField);
    AddArg("standardize", 0, _("Also write a min-max standardized field"),
           &m_standardize);
    AddArg("nodata-value", 0,
           _("Value written for zones without a result, instead of NULL"),
           &m_nodataValue);

    if (eMetric == geodiv::Metric::R_SDC)
    {
        AddArg("angle-unit", 0, _("Unit of input angles"), &m_angleUnit)
            .SetChoices("degrees", "radians")
            .SetDefault(m_angleUnit);
        AddArg("output-degrees", 0, _("Express the result in degrees"),
               &m_outputDegrees);
        AddArg("slope", 0, _("Slope raster dataset"), &m_slope,
               GDAL_OF_RASTER);
        AddArg("slope-band", 0, _("Band of the slope raster"), &m_slopeBand)
            .SetDefault(m_slopeBand)
            .SetMinValueIncluded(1);
        AddArg("slope-threshold", 0,
               _("Zones whose mean slope is below this value get 0"),
               &m_slopeThreshold)
            .SetMinValueIncluded(0);
    }
    else if (eMetric == geodiv::Metric::R_M)
    {
        AddArg("scales", 0, _("Number of nested scales"), &m_scales)
            .SetMinValueIncluded(1)
            .SetMaxValueIncluded(8);
        AddArg("normalize-area", 0,
               _("Divide the index by the square root of the zone area"),
               &m_normalizeArea);
    }
}

/************************************************************************/
/*                  GeodivMetricAlgorithm::RunImpl()                    */
/************************************************************************/

bool GeodivMetricAlgorithm::RunImpl(GDALProgressFunc pfnProgress,
                                    void *pProgressData)
{
    CPLStringList aosOptions;
    aosOptions.SetNameValue("METRIC", geodiv::GetMetricCode(m_metric));
    if (!m_gridLayer.empty())
        aosOptions.SetNameValue("GRID_LAYER", m_gridLayer.c_str());
    if (!m_zoneIdField.empty())
        aosOptions.SetNameValue("ZONE_ID_FIELD", m_zoneIdField.c_str());
    if (!m_inputLayer.empty())
        aosOptions.SetNameValue("INPUT_LAYER", m_inputLayer.c_str());
    if (!m_categoryField.empty())
        aosOptions.SetNameValue("CATEGORY_FIELD", m_categoryField.c_str());
    if (!m_outputField.empty())
        aosOptions.SetNameValue("OUTPUT_FIELD", m_outputField.c_str());
    aosOptions.SetNameValue("BAND", CPLSPrintf("%d", m_band));
    aosOptions.SetNameValue("IGNORE_NODATA",
                            m_ignoreNodata && !m_noIgnoreNodata ? "YES" : "NO");
    aosOptions.SetNameValue("STANDARDIZE", m_standardize ? "YES" : "NO");
    if (GetArg("nodata-value")->IsExplicitlySet())
        aosOptions.SetNameValue("NODATA_VALUE",
                                CPLSPrintf("%.17g", m_nodataValue));

    if (m_metric == geodiv::Metric::R_SDC)
    {
        aosOptions.SetNameValue("ANGLE_UNIT", m_angleUnit == "radians"
                                                  ? "RADIANS"
                                                  : "DEGREES");
        aosOptions.SetNameValue("OUTPUT_DEGREES",
                                m_outputDegrees ? "YES" : "NO");
        aosOptions.SetNameValue("SLOPE_BAND", CPLSPrintf("%d", m_slopeBand));
        if (GetArg("slope-threshold")->IsExplicitlySet())
        {
            if (!m_slope.GetDatasetRef())
            {
                ReportError(CE_Failure, CPLE_IllegalArg,
                            "--slope-threshold requires --slope");
                return false;
            }
            aosOptions.SetNameValue("SLOPE_THRESHOLD",
                                    CPLSPrintf("%.17g", m_slopeThreshold));
        }
    }
    else if (m_metric == geodiv::Metric::R_M)
    {
        if (m_scales > 0)
            aosOptions.SetNameValue("RELIEF_SCALES",
                                    CPLSPrintf("%d", m_scales));
        aosOptions.SetNameValue("RELIEF_NORMALIZE_AREA",
                                m_normalizeArea ? "YES" : "NO");
    }

    geodiv::Options oOptions;
    if (oOptions.Init(aosOptions.List()) != CE_None)
        return false;

    geodiv::RunReport sReport;
    if (geodiv::ComputeForDatasets(m_grid.GetDatasetRef(),
                                   m_input.GetDatasetRef(),
                                   m_slope.GetDatasetRef(), oOptions, &sReport,
                                   pfnProgress, pProgressData) != CE_None)
    {
        return false;
    }

    m_output = CPLSPrintf("%s: field %s written for " CPL_FRMT_GIB " zones\n",
                          geodiv::GetMetricCode(m_metric),
                          sReport.osFieldName.c_str(), sReport.nZoneCount);
    if (!sReport.osStandardizedFieldName.empty())
    {
        m_output += CPLSPrintf("Standardized field: %s\n",
                               sReport.osStandardizedFieldName.c_str());
    }
    m_output += CPLSPrintf("Features read: " CPL_FRMT_GIB
                           ", assigned: " CPL_FRMT_GIB
                           ", outside grid: " CPL_FRMT_GIB "\n",
                           sReport.nFeaturesRead, sReport.nFeaturesRouted,
                           sReport.nFeaturesOutside);
    if (sReport.nCategoryDomainErrors > 0)
    {
        m_output += CPLSPrintf("Skipped (invalid category): " CPL_FRMT_GIB
                               "\n",
                               sReport.nCategoryDomainErrors);
    }
    if (!sReport.anSparseZones.empty())
    {
        m_output += CPLSPrintf("Zones with too few samples: %d\n",
                               static_cast<int>(sReport.anSparseZones.size()));
    }
    if (sReport.bCleanupFailed)
    {
        m_output += CPLSPrintf("Cleanup failed: %s\n",
                               sReport.osCleanupMessage.c_str());
    }
    return true;
}

//! @endcond
