/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Routing of features and raster samples to zone accumulators
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_priv.h"

#include <cmath>

namespace geodiv
{

/************************************************************************/
/*                          FeatureAssigner()                           */
/************************************************************************/

FeatureAssigner::FeatureAssigner(const ZoneCatalog &oCatalog,
                                 ZoneAccumulators &oAccumulators,
                                 const Options &oOptions, RunReport &sReport)
    : m_oCatalog(oCatalog), m_oAccumulators(oAccumulators),
      m_oOptions(oOptions), m_sReport(sReport),
      m_eInputKind(GetMetricInputKind(oOptions.eMetric)),
      m_nReliefSide(oAccumulators.options().relief_levels > 0
                        ? (1 << (oAccumulators.options().relief_levels - 1))
                        : 0)
{
}

/************************************************************************/
/*                            GetCategory()                             */
/************************************************************************/

bool FeatureAssigner::GetCategory(const FeatureRecord &oFeature,
                                  CategoryCode *poCode)
{
    if (ToCategoryCode(oFeature.oCategory, poCode))
        return true;

    m_sReport.nCategoryDomainErrors++;
    CPLDebug(GEODIV_DEBUG_KEY,
             "Feature " CPL_FRMT_GIB " skipped: missing or non-discrete "
             "category",
             oFeature.nFID);
    return false;
}

/************************************************************************/
/*                           AssignFeature()                            */
/************************************************************************/

void FeatureAssigner::AssignFeature(const FeatureRecord &oFeature)
{
    m_sReport.nFeaturesRead++;

    const OGRGeometry *poGeom = oFeature.poGeom.get();
    if (poGeom == nullptr || poGeom->IsEmpty())
    {
        m_sReport.nFeaturesOutside++;
        return;
    }

    CategoryCode oCode;
    const CategoryCode *poCode = nullptr;
    if (IsCategoricalMetric(m_oOptions.eMetric))
    {
        if (!GetCategory(oFeature, &oCode))
            return;
        poCode = &oCode;
    }

    const OGRwkbGeometryType eType = wkbFlatten(poGeom->getGeometryType());
    bool bRouted = false;
    bool bTypeMatches = false;

    switch (m_eInputKind)
    {
        case InputKind::POINT:
            if (eType == wkbPoint)
            {
                bTypeMatches = true;
                bRouted = AssignPoint(poGeom->toPoint(), poCode);
            }
            else if (eType == wkbMultiPoint)
            {
                bTypeMatches = true;
                for (const auto *poPoint : *(poGeom->toMultiPoint()))
                {
                    if (AssignPoint(poPoint, poCode))
                        bRouted = true;
                }
            }
            break;

        case InputKind::POLYGON:
            if (OGR_GT_IsSurface(eType) ||
                OGR_GT_IsSubClassOf(eType, wkbMultiSurface))
            {
                bTypeMatches = true;
                bRouted = AssignPolygon(poGeom, poCode);
            }
            break;

        case InputKind::LINE:
            if (OGR_GT_IsCurve(eType) ||
                OGR_GT_IsSubClassOf(eType, wkbMultiCurve))
            {
                bTypeMatches = true;
                bRouted = AssignLine(poGeom);
            }
            break;

        case InputKind::RASTER:
            break;
    }

    if (!bTypeMatches)
    {
        m_sReport.nGeometryTypeSkips++;
        CPLDebug(GEODIV_DEBUG_KEY,
                 "Feature " CPL_FRMT_GIB " skipped: %s geometry not usable "
                 "by %s",
                 oFeature.nFID, OGRGeometryTypeToName(eType),
                 GetMetricCode(m_oOptions.eMetric));
    }
    else if (bRouted)
    {
        m_sReport.nFeaturesRouted++;
    }
    else
    {
        m_sReport.nFeaturesOutside++;
    }
}

/************************************************************************/
/*                            AssignPoint()                             */
/************************************************************************/

bool FeatureAssigner::AssignPoint(const OGRPoint *poPoint,
                                  const CategoryCode *poCode)
{
    if (poPoint->IsEmpty())
        return false;
    const auto *poZone = m_oCatalog.FindOwner(poPoint->getX(), poPoint->getY(),
                                              m_apoCandidates);
    if (poZone == nullptr)
        return false;

    ZoneStats &oStats = m_oAccumulators[poZone->nId];
    oStats.add_element();
    if (poCode)
        oStats.add_category(*poCode, 1.0);
    return true;
}

/************************************************************************/
/*                           AssignPolygon()                            */
/************************************************************************/

bool FeatureAssigner::AssignPolygon(const OGRGeometry *poGeom,
                                    const CategoryCode *poCode)
{
    if (m_oOptions.eMetric != Metric::A_SHDI)
    {
        // Counts and richness: the whole polygon goes to its centroid zone
        double dfX = 0;
        double dfY = 0;
        if (!GetAreaCentroid(poGeom, &dfX, &dfY))
            return false;
        const auto *poZone = m_oCatalog.FindOwner(dfX, dfY, m_apoCandidates);
        if (poZone == nullptr)
            return false;
        ZoneStats &oStats = m_oAccumulators[poZone->nId];
        oStats.add_element();
        if (poCode)
            oStats.add_category(*poCode, 1.0);
        return true;
    }

    OGREnvelope sEnv;
    poGeom->getEnvelope(&sEnv);
    m_oCatalog.FindCandidates(sEnv, m_apoCandidates);

    bool bRouted = false;
    double dfFeatureArea = -1;
    for (const auto *poZone : m_apoCandidates)
    {
        double dfOverlap = 0;
        if (poZone->bIsRectangle && poZone->sEnvelope.Contains(sEnv))
        {
            if (dfFeatureArea < 0)
                dfFeatureArea = GetGeometryArea(poGeom);
            dfOverlap = dfFeatureArea;
        }
        else
        {
            std::unique_ptr<OGRGeometry> poInter(
                poZone->poGeom->Intersection(poGeom));
            if (poInter == nullptr)
            {
                CPLDebug(GEODIV_DEBUG_KEY,
                         "Intersection with zone " CPL_FRMT_GIB " failed",
                         poZone->nId);
                continue;
            }
            dfOverlap = GetGeometryArea(poInter.get());
        }
        if (dfOverlap > 0)
        {
            m_oAccumulators[poZone->nId].add_category(*poCode, dfOverlap);
            bRouted = true;
        }
    }
    return bRouted;
}

/************************************************************************/
/*                             AssignLine()                             */
/************************************************************************/

bool FeatureAssigner::AssignLine(const OGRGeometry *poGeom)
{
    OGREnvelope sEnv;
    poGeom->getEnvelope(&sEnv);
    m_oCatalog.FindCandidates(sEnv, m_apoCandidates);

    bool bRouted = false;
    double dfFeatureLength = -1;
    for (const auto *poZone : m_apoCandidates)
    {
        double dfOverlap = 0;
        if (poZone->bIsRectangle && poZone->sEnvelope.Contains(sEnv) &&
            sEnv.MinX > poZone->sEnvelope.MinX &&
            sEnv.MaxX < poZone->sEnvelope.MaxX &&
            sEnv.MinY > poZone->sEnvelope.MinY &&
            sEnv.MaxY < poZone->sEnvelope.MaxY)
        {
            if (dfFeatureLength < 0)
                dfFeatureLength = GetGeometryLength(poGeom);
            dfOverlap = dfFeatureLength;
        }
        else
        {
            std::unique_ptr<OGRGeometry> poInter(
                poZone->poGeom->Intersection(poGeom));
            if (poInter == nullptr)
            {
                CPLDebug(GEODIV_DEBUG_KEY,
                         "Intersection with zone " CPL_FRMT_GIB " failed",
                         poZone->nId);
                continue;
            }
            dfOverlap = GetGeometryLength(poInter.get());
        }
        if (dfOverlap > 0)
        {
            m_oAccumulators[poZone->nId].add_length(dfOverlap);
            bRouted = true;
        }
    }
    return bRouted;
}

/************************************************************************/
/*                          FindSampleOwner()                           */
/************************************************************************/

/* Consecutive cells of a scanline mostly fall in the same zone. The cached
 * zone is only reused strictly inside a rectangle no other zone overlaps. */
const ZoneCatalog::Zone *FeatureAssigner::FindSampleOwner(double dfX,
                                                          double dfY)
{
    if (m_poLastZone && m_poLastZone->bIsRectangle &&
        m_poLastZone->bIsExclusive)
    {
        const auto &e = m_poLastZone->sEnvelope;
        if (dfX > e.MinX && dfX < e.MaxX && dfY > e.MinY && dfY < e.MaxY)
            return m_poLastZone;
    }
    m_poLastZone = m_oCatalog.FindOwner(dfX, dfY, m_apoCandidates);
    return m_poLastZone;
}

/************************************************************************/
/*                           AssignSamples()                            */
/************************************************************************/

void FeatureAssigner::AssignSamples(const std::vector<RasterSample> &aoSamples)
{
    for (const auto &oSample : aoSamples)
        AssignSample(oSample);
}

void FeatureAssigner::AssignSample(const RasterSample &oSample)
{
    m_sReport.nFeaturesRead++;

    if (oSample.bNoData || std::isnan(oSample.dfValue))
    {
        m_sReport.nNoDataSamples++;
        if (!m_oOptions.bIgnoreNoData)
        {
            const auto *poZone = FindSampleOwner(oSample.dfX, oSample.dfY);
            if (poZone)
                m_oAccumulators[poZone->nId].mark_nodata();
        }
        return;
    }

    const auto *poZone = FindSampleOwner(oSample.dfX, oSample.dfY);
    if (poZone == nullptr)
    {
        m_sReport.nFeaturesOutside++;
        return;
    }

    ZoneStats &oStats = m_oAccumulators[poZone->nId];
    switch (m_oOptions.eMetric)
    {
        case Metric::R_SD:
            oStats.add_value(oSample.dfValue);
            break;

        case Metric::R_SDC:
        {
            const double dfTheta = m_oOptions.eAngleUnit == AngleUnit::DEGREES
                                       ? oSample.dfValue * M_PI / 180.0
                                       : oSample.dfValue;
            oStats.add_angle(dfTheta);
            break;
        }

        case Metric::R_M:
        {
            const auto &e = poZone->sEnvelope;
            const double dfWinW = (e.MaxX - e.MinX) / m_nReliefSide;
            const double dfWinH = (e.MaxY - e.MinY) / m_nReliefSide;
            const int iX =
                dfWinW > 0
                    ? static_cast<int>(std::floor((oSample.dfX - e.MinX) /
                                                  dfWinW))
                    : 0;
            const int iY =
                dfWinH > 0
                    ? static_cast<int>(std::floor((oSample.dfY - e.MinY) /
                                                  dfWinH))
                    : 0;
            oStats.add_relief(iX, iY, oSample.dfValue);
            break;
        }

        default:
            CPLAssert(false);
            break;
    }
    m_sReport.nFeaturesRouted++;
}

/************************************************************************/
/*                         AssignSlopeSamples()                         */
/************************************************************************/

void FeatureAssigner::AssignSlopeSamples(
    const std::vector<RasterSample> &aoSamples)
{
    for (const auto &oSample : aoSamples)
    {
        if (oSample.bNoData || std::isnan(oSample.dfValue))
            continue;
        const auto *poZone = FindSampleOwner(oSample.dfX, oSample.dfY);
        if (poZone)
            m_oAccumulators[poZone->nId].add_slope(oSample.dfValue);
    }
}

}  // namespace geodiv
