/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  geodiv "main" command
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodivalg_main.h"
#include "geodivalg_metric.h"

#include "cpl_string.h"
#include "gdal_priv.h"

//! @cond Doxygen_Suppress

#ifndef _
#define _(x) (x)
#endif

/************************************************************************/
/*               GeodivMainAlgorithm::GeodivMainAlgorithm()             */
/************************************************************************/

GeodivMainAlgorithm::GeodivMainAlgorithm()
    : GDALAlgorithm(NAME, DESCRIPTION, HELP_URL)
{
    RegisterSubAlgorithm<GeodivAreaElementCountAlgorithm>();
    RegisterSubAlgorithm<GeodivAreaCategoryCountAlgorithm>();
    RegisterSubAlgorithm<GeodivAreaShannonAlgorithm>();
    RegisterSubAlgorithm<GeodivLineLengthAlgorithm>();
    RegisterSubAlgorithm<GeodivPointCountAlgorithm>();
    RegisterSubAlgorithm<GeodivPointCategoryCountAlgorithm>();
    RegisterSubAlgorithm<GeodivPointShannonAlgorithm>();
    RegisterSubAlgorithm<GeodivRasterStdDevAlgorithm>();
    RegisterSubAlgorithm<GeodivRasterCircularStdDevAlgorithm>();
    RegisterSubAlgorithm<GeodivRasterReliefAlgorithm>();

    SetCallPath({NAME});

    AddArg("version", 0, _("Display version and exit"), &m_version)
        .SetOnlyForCLI();
    AddArg("metrics", 0, _("List metric codes and their input kind"),
           &m_metrics);

    AddOutputStringArg(&m_output);

    m_longDescription =
        "Each sub-command computes one index per zone of a polygon grid and "
        "stores it as a new field of the grid layer. The grid must be in a "
        "GeoPackage, File Geodatabase, SQLite or PostgreSQL container.";
}

/************************************************************************/
/*                    GeodivMainAlgorithm::RunImpl()                    */
/************************************************************************/

bool GeodivMainAlgorithm::RunImpl(GDALProgressFunc, void *)
{
    if (m_version)
    {
        m_output = CPLSPrintf("geodiv %d.%d (GDAL %s)\n", GEODIV_VERSION_MAJOR,
                              GEODIV_VERSION_MINOR,
                              GDALVersionInfo("RELEASE_NAME"));
        return true;
    }
    if (m_metrics)
    {
        for (const geodiv::Metric eMetric : geodiv::GetAllMetrics())
        {
            const char *pszKind = "raster";
            switch (geodiv::GetMetricInputKind(eMetric))
            {
                case geodiv::InputKind::POLYGON:
                    pszKind = "polygon";
                    break;
                case geodiv::InputKind::LINE:
                    pszKind = "line";
                    break;
                case geodiv::InputKind::POINT:
                    pszKind = "point";
                    break;
                case geodiv::InputKind::RASTER:
                    break;
            }
            m_output += CPLSPrintf("%-7s %s\n", geodiv::GetMetricCode(eMetric),
                                   pszKind);
        }
        return true;
    }

    ReportError(CE_Failure, CPLE_AppDefined,
                "The Run() method should not be called directly on the \"%s\" "
                "program. A metric sub-command must be given.",
                NAME);
    return false;
}

//! @endcond
