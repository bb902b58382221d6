/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  In-memory catalog of grid zones with a quadtree index
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_priv.h"

#include "cpl_conv.h"

#include <algorithm>
#include <climits>
#include <cmath>

namespace geodiv
{

/************************************************************************/
/*                            ZoneCatalog()                             */
/************************************************************************/

ZoneCatalog::ZoneCatalog() = default;

/************************************************************************/
/*                            ~ZoneCatalog()                            */
/************************************************************************/

ZoneCatalog::~ZoneCatalog()
{
    if (m_hQuadTree)
        CPLQuadTreeDestroy(m_hQuadTree);
}

/************************************************************************/
/*                                Load()                                */
/************************************************************************/

bool ZoneCatalog::Load(ZoneProvider &oProvider, RunReport *psReport)
{
    CPLAssert(m_apoZones.empty());

    oProvider.ResetReading();
    CPLErrorReset();

    ZoneRecord oRecord;
    while (oProvider.GetNextZone(oRecord))
    {
        auto poZone = std::make_unique<Zone>();
        poZone->nId = oRecord.nId;

        if (m_oMapIdToZone.find(poZone->nId) != m_oMapIdToZone.end())
        {
            ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_AppDefined,
                        "Zone identifier " CPL_FRMT_GIB
                        " appears more than once in %s",
                        poZone->nId, oProvider.GetName().c_str());
            return false;
        }

        if (oRecord.poGeom && !oRecord.poGeom->IsEmpty())
        {
            const OGRwkbGeometryType eType =
                wkbFlatten(oRecord.poGeom->getGeometryType());
            if (!OGR_GT_IsSurface(eType) && !OGR_GT_IsSubClassOf(
                                                eType, wkbMultiSurface))
            {
                ReportFatal(psReport, ErrorKind::CONFIGURATION,
                            CPLE_AppDefined,
                            "Zone " CPL_FRMT_GIB " of %s is a %s, not a "
                            "polygon",
                            poZone->nId, oProvider.GetName().c_str(),
                            OGRGeometryTypeToName(eType));
                return false;
            }
            if (oRecord.poGeom->hasCurveGeometry())
            {
                poZone->poGeom.reset(oRecord.poGeom->getLinearGeometry());
            }
            else
            {
                poZone->poGeom = std::move(oRecord.poGeom);
            }
            poZone->poGeom->flattenTo2D();
            poZone->poGeom->getEnvelope(&poZone->sEnvelope);
            poZone->dfArea = GetGeometryArea(poZone->poGeom.get());
            poZone->bIsRectangle = IsAxisAlignedRectangle(poZone->poGeom.get());
            m_sExtent.Merge(poZone->sEnvelope);
        }
        else
        {
            CPLDebug(GEODIV_DEBUG_KEY,
                     "Zone " CPL_FRMT_GIB " has no geometry and will not "
                     "receive any feature",
                     poZone->nId);
        }

        m_oMapIdToZone[poZone->nId] = poZone.get();
        m_apoZones.push_back(std::move(poZone));
        oRecord = ZoneRecord();
    }

    if (CPLGetLastErrorType() == CE_Failure)
    {
        ReportFatal(psReport, ErrorKind::IO, CPLE_AppDefined,
                    "Reading zones from %s failed: %s",
                    oProvider.GetName().c_str(), CPLGetLastErrorMsg());
        return false;
    }

    if (m_apoZones.empty())
    {
        ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_AppDefined,
                    "Grid %s contains no zone", oProvider.GetName().c_str());
        return false;
    }
    if (!m_sExtent.IsInit())
    {
        ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_AppDefined,
                    "No zone of grid %s has a geometry",
                    oProvider.GetName().c_str());
        return false;
    }

    CPLRectObj sGlobalBounds;
    sGlobalBounds.minx = m_sExtent.MinX;
    sGlobalBounds.miny = m_sExtent.MinY;
    sGlobalBounds.maxx = m_sExtent.MaxX;
    sGlobalBounds.maxy = m_sExtent.MaxY;
    m_hQuadTree = CPLQuadTreeCreate(&sGlobalBounds, nullptr);
    CPLQuadTreeSetMaxDepth(
        m_hQuadTree,
        CPLQuadTreeGetAdvisedMaxDepth(static_cast<int>(
            std::min<size_t>(m_apoZones.size(), INT_MAX))));

    for (const auto &poZone : m_apoZones)
    {
        if (!poZone->poGeom)
            continue;
        CPLRectObj sBounds;
        sBounds.minx = poZone->sEnvelope.MinX;
        sBounds.miny = poZone->sEnvelope.MinY;
        sBounds.maxx = poZone->sEnvelope.MaxX;
        sBounds.maxy = poZone->sEnvelope.MaxY;
        CPLQuadTreeInsertWithBounds(m_hQuadTree, poZone.get(), &sBounds);
    }

    std::vector<const Zone *> apoNeighbours;
    for (const auto &poZone : m_apoZones)
    {
        if (!poZone->poGeom)
            continue;
        const OGREnvelope &e = poZone->sEnvelope;
        FindCandidates(e, apoNeighbours);
        poZone->bIsExclusive = true;
        for (const Zone *poOther : apoNeighbours)
        {
            const OGREnvelope &o = poOther->sEnvelope;
            if (poOther != poZone.get() && o.MinX < e.MaxX &&
                e.MinX < o.MaxX && o.MinY < e.MaxY && e.MinY < o.MaxY)
            {
                poZone->bIsExclusive = false;
                break;
            }
        }
    }

    if (psReport)
        psReport->nZoneCount = static_cast<GIntBig>(m_apoZones.size());

    CPLDebug(GEODIV_DEBUG_KEY, "Loaded %d zones from %s, extent %f,%f,%f,%f",
             static_cast<int>(m_apoZones.size()), oProvider.GetName().c_str(),
             m_sExtent.MinX, m_sExtent.MinY, m_sExtent.MaxX, m_sExtent.MaxY);
    return true;
}

/************************************************************************/
/*                              FindZone()                              */
/************************************************************************/

const ZoneCatalog::Zone *ZoneCatalog::FindZone(GIntBig nId) const
{
    auto oIter = m_oMapIdToZone.find(nId);
    return oIter == m_oMapIdToZone.end() ? nullptr : oIter->second;
}

/************************************************************************/
/*                           FindCandidates()                           */
/************************************************************************/

void ZoneCatalog::FindCandidates(const OGREnvelope &sEnv,
                                 std::vector<const Zone *> &apoCandidates) const
{
    apoCandidates.clear();
    if (m_hQuadTree == nullptr || !sEnv.IsInit() || !m_sExtent.Intersects(sEnv))
        return;

    CPLRectObj sAoi;
    sAoi.minx = sEnv.MinX;
    sAoi.miny = sEnv.MinY;
    sAoi.maxx = sEnv.MaxX;
    sAoi.maxy = sEnv.MaxY;

    int nCount = 0;
    void **pahFeatures = CPLQuadTreeSearch(m_hQuadTree, &sAoi, &nCount);
    apoCandidates.reserve(nCount);
    for (int i = 0; i < nCount; ++i)
    {
        const Zone *poZone = static_cast<const Zone *>(pahFeatures[i]);
        if (poZone->sEnvelope.Intersects(sEnv))
            apoCandidates.push_back(poZone);
    }
    CPLFree(pahFeatures);

    std::sort(apoCandidates.begin(), apoCandidates.end(),
              [](const Zone *a, const Zone *b) { return a->nId < b->nId; });
}

/************************************************************************/
/*                          PointInGeometry()                           */
/************************************************************************/

/* A point on any ring is reported as on the boundary, never as inside, so
 * that ownership of shared edges is settled by the caller. */
static void PointInGeometry(const OGRGeometry *poGeom, const OGRPoint &oPoint,
                            bool &bInside, bool &bOnBoundary)
{
    const OGRwkbGeometryType eType = wkbFlatten(poGeom->getGeometryType());
    if (eType == wkbPolygon || eType == wkbTriangle)
    {
        const OGRPolygon *poPolygon = poGeom->toPolygon();
        for (const auto *poRing : *poPolygon)
        {
            if (poRing->isPointOnRingBoundary(&oPoint))
            {
                bOnBoundary = true;
                return;
            }
        }
        const OGRLinearRing *poExterior = poPolygon->getExteriorRing();
        if (poExterior == nullptr || !poExterior->isPointInRing(&oPoint))
            return;
        for (int i = 0; i < poPolygon->getNumInteriorRings(); ++i)
        {
            if (poPolygon->getInteriorRing(i)->isPointInRing(&oPoint))
                return;
        }
        bInside = true;
    }
    else if (OGR_GT_IsSubClassOf(eType, wkbGeometryCollection))
    {
        for (const auto *poSubGeom : *(poGeom->toGeometryCollection()))
        {
            PointInGeometry(poSubGeom, oPoint, bInside, bOnBoundary);
            if (bInside)
                return;
        }
    }
}

/************************************************************************/
/*                             FindOwner()                              */
/************************************************************************/

const ZoneCatalog::Zone *ZoneCatalog::FindOwner(double dfX, double dfY) const
{
    std::vector<const Zone *> apoScratch;
    return FindOwner(dfX, dfY, apoScratch);
}

const ZoneCatalog::Zone *
ZoneCatalog::FindOwner(double dfX, double dfY,
                       std::vector<const Zone *> &apoCandidates) const
{
    OGREnvelope sEnv;
    sEnv.MinX = dfX;
    sEnv.MaxX = dfX;
    sEnv.MinY = dfY;
    sEnv.MaxY = dfY;

    FindCandidates(sEnv, apoCandidates);

    const OGRPoint oPoint(dfX, dfY);
    const Zone *poBoundaryOwner = nullptr;
    for (const Zone *poZone : apoCandidates)
    {
        bool bInside = false;
        bool bOnBoundary = false;
        if (poZone->bIsRectangle)
        {
            const auto &e = poZone->sEnvelope;
            bInside = dfX >= e.MinX && dfX < e.MaxX && dfY >= e.MinY &&
                      dfY < e.MaxY;
            bOnBoundary = !bInside;
        }
        else
        {
            PointInGeometry(poZone->poGeom.get(), oPoint, bInside,
                            bOnBoundary);
        }
        if (bInside)
            return poZone;
        if (bOnBoundary && poBoundaryOwner == nullptr)
            poBoundaryOwner = poZone;
    }

    // Edge not claimed by the half-open rule of a rectangle: lowest id
    return poBoundaryOwner;
}

}  // namespace geodiv
