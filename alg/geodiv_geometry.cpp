/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Geometry measures and category coercion
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_priv.h"

#include <cmath>
#include <limits>

namespace geodiv
{

/************************************************************************/
/*                          GetGeometryArea()                           */
/************************************************************************/

double GetGeometryArea(const OGRGeometry *poGeom)
{
    if (poGeom == nullptr || poGeom->IsEmpty())
        return 0;

    const OGRwkbGeometryType eType = wkbFlatten(poGeom->getGeometryType());
    if (OGR_GT_IsSurface(eType))
    {
        return poGeom->toSurface()->get_Area();
    }
    if (OGR_GT_IsSubClassOf(eType, wkbGeometryCollection))
    {
        double dfArea = 0;
        for (const auto *poSubGeom : *(poGeom->toGeometryCollection()))
            dfArea += GetGeometryArea(poSubGeom);
        return dfArea;
    }
    return 0;
}

/************************************************************************/
/*                         GetGeometryLength()                          */
/************************************************************************/

double GetGeometryLength(const OGRGeometry *poGeom)
{
    if (poGeom == nullptr || poGeom->IsEmpty())
        return 0;

    const OGRwkbGeometryType eType = wkbFlatten(poGeom->getGeometryType());
    if (OGR_GT_IsCurve(eType))
    {
        return poGeom->toCurve()->get_Length();
    }
    if (OGR_GT_IsSubClassOf(eType, wkbGeometryCollection))
    {
        double dfLength = 0;
        for (const auto *poSubGeom : *(poGeom->toGeometryCollection()))
            dfLength += GetGeometryLength(poSubGeom);
        return dfLength;
    }
    return 0;
}

/************************************************************************/
/*                          GetAreaCentroid()                           */
/************************************************************************/

/** Centroid of a (multi)polygon through OGRGeometry::Centroid(), which
 * needs GEOS for surfaces. */
bool GetAreaCentroid(const OGRGeometry *poGeom, double *pdfX, double *pdfY)
{
    if (poGeom == nullptr || poGeom->IsEmpty())
        return false;

    OGRPoint oCentroid;
    if (poGeom->Centroid(&oCentroid) != OGRERR_NONE || oCentroid.IsEmpty())
        return false;
    *pdfX = oCentroid.getX();
    *pdfY = oCentroid.getY();
    return true;
}

/************************************************************************/
/*                       IsAxisAlignedRectangle()                       */
/************************************************************************/

bool IsAxisAlignedRectangle(const OGRGeometry *poGeom)
{
    if (poGeom == nullptr ||
        wkbFlatten(poGeom->getGeometryType()) != wkbPolygon)
        return false;
    const OGRPolygon *poPolygon = poGeom->toPolygon();
    if (poPolygon->getNumInteriorRings() != 0)
        return false;
    const OGRLinearRing *poRing = poPolygon->getExteriorRing();
    if (poRing == nullptr || poRing->getNumPoints() != 5)
        return false;

    OGREnvelope sEnv;
    poGeom->getEnvelope(&sEnv);
    for (int i = 0; i < 5; ++i)
    {
        const double x = poRing->getX(i);
        const double y = poRing->getY(i);
        if ((x != sEnv.MinX && x != sEnv.MaxX) ||
            (y != sEnv.MinY && y != sEnv.MaxY))
            return false;
    }
    const double dfEnvArea = (sEnv.MaxX - sEnv.MinX) * (sEnv.MaxY - sEnv.MinY);
    return dfEnvArea > 0 &&
           std::fabs(poPolygon->get_Area() - dfEnvArea) <= 1e-12 * dfEnvArea;
}

/************************************************************************/
/*                           ToCategoryCode()                           */
/************************************************************************/

/** Coerce a raw attribute into a discrete label. Missing values, empty
 * strings and non-integral reals are rejected. */
bool ToCategoryCode(const CategoryValue &oValue, CategoryCode *poCode)
{
    if (const auto pnVal = std::get_if<GIntBig>(&oValue))
    {
        *poCode = *pnVal;
        return true;
    }
    if (const auto pdfVal = std::get_if<double>(&oValue))
    {
        const double dfVal = *pdfVal;
        if (!std::isfinite(dfVal) || dfVal != std::floor(dfVal) ||
            std::fabs(dfVal) >
                static_cast<double>(std::numeric_limits<GIntBig>::max() / 2))
            return false;
        *poCode = static_cast<GIntBig>(dfVal);
        return true;
    }
    if (const auto posVal = std::get_if<std::string>(&oValue))
    {
        if (posVal->empty())
            return false;
        *poCode = *posVal;
        return true;
    }
    return false;
}

}  // namespace geodiv
