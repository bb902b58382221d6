/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Spatial compatibility checks run before any aggregation
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_priv.h"

#include "ogr_spatialref.h"

#include <algorithm>

namespace geodiv
{

/************************************************************************/
/*                          ValidateExtents()                           */
/************************************************************************/

/** Reject inputs that share no area with the grid. A partial overlap is
 * accepted with a warning. Degenerate (zero width or height) input extents,
 * such as a single point or a horizontal line, only need to touch the grid. */
bool ValidateExtents(const OGREnvelope &sGridExtent,
                     const OGREnvelope &sInputExtent, RunReport *psReport)
{
    if (!sInputExtent.IsInit())
    {
        ReportFatal(psReport, ErrorKind::SPATIAL_MISMATCH, CPLE_AppDefined,
                    "Input layer has an empty extent");
        return false;
    }

    bool bDisjoint = !sGridExtent.Intersects(sInputExtent);
    if (!bDisjoint)
    {
        const double dfW = std::min(sGridExtent.MaxX, sInputExtent.MaxX) -
                           std::max(sGridExtent.MinX, sInputExtent.MinX);
        const double dfH = std::min(sGridExtent.MaxY, sInputExtent.MaxY) -
                           std::max(sGridExtent.MinY, sInputExtent.MinY);
        const bool bInputHasWidth = sInputExtent.MaxX > sInputExtent.MinX;
        const bool bInputHasHeight = sInputExtent.MaxY > sInputExtent.MinY;
        if ((bInputHasWidth && dfW <= 0) || (bInputHasHeight && dfH <= 0))
            bDisjoint = true;
    }

    if (bDisjoint)
    {
        ReportFatal(psReport, ErrorKind::SPATIAL_MISMATCH, CPLE_AppDefined,
                    "Input extent (%.17g,%.17g,%.17g,%.17g) does not overlap "
                    "grid extent (%.17g,%.17g,%.17g,%.17g)",
                    sInputExtent.MinX, sInputExtent.MinY, sInputExtent.MaxX,
                    sInputExtent.MaxY, sGridExtent.MinX, sGridExtent.MinY,
                    sGridExtent.MaxX, sGridExtent.MaxY);
        return false;
    }

    if (!sInputExtent.Contains(sGridExtent))
    {
        CPLError(CE_Warning, CPLE_AppDefined,
                 "Input data does not fully cover the grid. Zones outside "
                 "the input extent will receive no-data (or 0 for count "
                 "metrics).");
        if (psReport)
            psReport->bPartialOverlap = true;
    }

    return true;
}

/************************************************************************/
/*                        ValidateSpatialRefs()                         */
/************************************************************************/

bool ValidateSpatialRefs(const OGRSpatialReference *poGridSRS,
                         const OGRSpatialReference *poInputSRS,
                         RunReport *psReport)
{
    if (poGridSRS == nullptr || poInputSRS == nullptr)
    {
        if (poGridSRS != poInputSRS)
        {
            CPLDebug(GEODIV_DEBUG_KEY,
                     "Only one of grid and input has a SRS. Assuming they "
                     "share the same one.");
        }
        return true;
    }

    CPLStringList aosOptions;
    aosOptions.AddNameValue("IGNORE_DATA_AXIS_TO_SRS_AXIS_MAPPING", "1");
    if (!poGridSRS->IsSame(poInputSRS, aosOptions.List()))
    {
        const char *pszGridName = poGridSRS->GetName();
        const char *pszInputName = poInputSRS->GetName();
        ReportFatal(psReport, ErrorKind::SPATIAL_MISMATCH, CPLE_AppDefined,
                    "Grid (%s) and input (%s) do not have the same SRS",
                    pszGridName ? pszGridName : "unknown",
                    pszInputName ? pszInputName : "unknown");
        return false;
    }
    return true;
}

/************************************************************************/
/*                     IsAcceptedContainerDriver()                      */
/************************************************************************/

/** Vector inputs and the grid must live in a transactional container able
 * to hold long field names. */
bool IsAcceptedContainerDriver(const char *pszDriverName)
{
    if (pszDriverName == nullptr)
        return false;
    static const char *const apszAccepted[] = {
        "GPKG", "OpenFileGDB", "FileGDB", "SQLite", "PostgreSQL",
        "MEM",  "Memory"};
    for (const char *pszAccepted : apszAccepted)
    {
        if (EQUAL(pszDriverName, pszAccepted))
            return true;
    }
    return false;
}

}  // namespace geodiv
