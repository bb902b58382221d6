/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Output field naming and commit onto the zone attribute table
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
#include <cctype>

namespace geodiv
{

/************************************************************************/
/*                          BuildFieldPrefix()                          */
/************************************************************************/

/** First three alphanumeric characters of the source name, uppercased. */
std::string BuildFieldPrefix(const std::string &osSourceName)
{
    std::string osPrefix;
    for (const char ch : osSourceName)
    {
        if (std::isalnum(static_cast<unsigned char>(ch)))
        {
            osPrefix += static_cast<char>(
                std::toupper(static_cast<unsigned char>(ch)));
            if (osPrefix.size() == 3)
                break;
        }
    }
    if (osPrefix.empty())
        osPrefix = "GEO";
    else if (std::isdigit(static_cast<unsigned char>(osPrefix[0])))
        osPrefix = "F" + osPrefix;
    return osPrefix;
}

/************************************************************************/
/*                       BuildDefaultFieldName()                        */
/************************************************************************/

std::string BuildDefaultFieldName(Metric eMetric,
                                  const std::string &osSourceName,
                                  int nMaxLength)
{
    CPLString osCode(GetMetricCode(eMetric));
    osCode.replaceAll("_", "");
    std::string osName = BuildFieldPrefix(osSourceName) + "_" + osCode;
    if (nMaxLength > 0 && static_cast<int>(osName.size()) > nMaxLength)
        osName.resize(nMaxLength);
    return osName;
}

/************************************************************************/
/*                          BuildProvenance()                           */
/************************************************************************/

std::string BuildProvenance(Metric eMetric, const std::string &osSourceName)
{
    return std::string(GetMetricCode(eMetric)) + ":" + osSourceName;
}

/************************************************************************/
/*                      AttributeTable defaults                         */
/************************************************************************/

AttributeTable::~AttributeTable() = default;

int AttributeTable::GetMaxFieldNameLength() const
{
    return std::max(
        8, atoi(CPLGetConfigOption("GEODIV_MAX_FIELD_NAME_LENGTH", "64")));
}

bool AttributeTable::StartTransaction()
{
    return true;
}

bool AttributeTable::CommitTransaction()
{
    return true;
}

bool AttributeTable::RollbackTransaction()
{
    return true;
}

std::string AttributeTable::GetLockPath() const
{
    return std::string();
}

/************************************************************************/
/*                            FieldWriter()                             */
/************************************************************************/

FieldWriter::FieldWriter(AttributeTable &oTable, const Options &oOptions,
                         const std::string &osSourceName)
    : m_oTable(oTable), m_oOptions(oOptions), m_osSourceName(osSourceName)
{
}

/************************************************************************/
/*                             ResolveOne()                             */
/************************************************************************/

/* An explicit name is always taken (and overwritten). Otherwise a field
 * written by an earlier run with the same provenance is reused; a foreign
 * field of the same name gets a numeric suffix. */
std::string FieldWriter::ResolveOne(const std::string &osWanted,
                                    const std::string &osProvenance,
                                    bool bExplicit, int nMaxLength) const
{
    std::string osName(osWanted);
    if (static_cast<int>(osName.size()) > nMaxLength)
        osName.resize(nMaxLength);

    if (bExplicit || !m_oTable.HasField(osName) ||
        m_oTable.GetFieldProvenance(osName) == osProvenance)
    {
        return osName;
    }

    for (int i = 1; i < 10000; ++i)
    {
        const std::string osSuffix = CPLSPrintf("_%d", i);
        std::string osBase(osWanted);
        const int nBaseMax = nMaxLength - static_cast<int>(osSuffix.size());
        if (static_cast<int>(osBase.size()) > nBaseMax)
            osBase.resize(std::max(0, nBaseMax));
        const std::string osCandidate = osBase + osSuffix;
        if (!m_oTable.HasField(osCandidate) ||
            m_oTable.GetFieldProvenance(osCandidate) == osProvenance)
        {
            return osCandidate;
        }
    }
    return std::string();
}

/************************************************************************/
/*                         ResolveFieldNames()                          */
/************************************************************************/

bool FieldWriter::ResolveFieldNames(RunReport *psReport)
{
    const int nMaxLength = m_oTable.GetMaxFieldNameLength();
    const bool bExplicit = !m_oOptions.osOutputField.empty();
    m_osProvenance = BuildProvenance(m_oOptions.eMetric, m_osSourceName);

    const std::string osWanted =
        bExplicit ? m_oOptions.osOutputField
                  : BuildDefaultFieldName(m_oOptions.eMetric, m_osSourceName,
                                          nMaxLength);
    m_osFieldName = ResolveOne(osWanted, m_osProvenance, bExplicit, nMaxLength);
    if (m_osFieldName.empty())
    {
        ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_AppDefined,
                    "Cannot find a free field name derived from %s in %s",
                    osWanted.c_str(), m_oTable.GetName().c_str());
        return false;
    }

    if (m_oOptions.bStandardize)
    {
        std::string osBase(m_osFieldName);
        if (static_cast<int>(osBase.size()) + 3 > nMaxLength)
            osBase.resize(nMaxLength - 3);
        // OUTPUT_FIELD only names the main field: a foreign companion is
        // never overwritten
        m_osStdFieldName = ResolveOne(osBase + "_MM", m_osProvenance + ":MM",
                                      false, nMaxLength);
        if (m_osStdFieldName.empty() ||
            EQUAL(m_osStdFieldName.c_str(), m_osFieldName.c_str()))
        {
            ReportFatal(psReport, ErrorKind::CONFIGURATION, CPLE_AppDefined,
                        "Cannot find a free name for the standardized field "
                        "of %s",
                        m_osFieldName.c_str());
            return false;
        }
    }

    CPLDebug(GEODIV_DEBUG_KEY, "Output field: %s%s%s", m_osFieldName.c_str(),
             m_osStdFieldName.empty() ? "" : ", standardized: ",
             m_osStdFieldName.c_str());
    if (psReport)
    {
        psReport->osFieldName = m_osFieldName;
        psReport->osStandardizedFieldName = m_osStdFieldName;
    }
    return true;
}

/************************************************************************/
/*                               Commit()                               */
/************************************************************************/

bool FieldWriter::Commit(const std::vector<ZoneValue> &aoValues,
                         RunReport *psReport)
{
    CPLAssert(!m_osFieldName.empty());

    const auto ApplyNoDataValue = [this](std::vector<ZoneValue> &aoColumn)
    {
        if (!m_oOptions.bHasNoDataValue)
            return;
        for (auto &sValue : aoColumn)
        {
            if (sValue.bNoData)
            {
                sValue.dfValue = m_oOptions.dfNoDataValue;
                sValue.bNoData = false;
            }
        }
    };

    std::vector<FieldColumn> aoColumns(1);
    aoColumns[0].osName = m_osFieldName;
    aoColumns[0].osAlias = GetMetricCode(m_oOptions.eMetric);
    aoColumns[0].aoValues = aoValues;
    ApplyNoDataValue(aoColumns[0].aoValues);

    if (!m_osStdFieldName.empty())
    {
        FieldColumn oStd;
        oStd.osName = m_osStdFieldName;
        oStd.osAlias = std::string("Std_") + GetMetricCode(m_oOptions.eMetric);
        oStd.aoValues = StandardizeMinMax(aoValues);
        ApplyNoDataValue(oStd.aoValues);
        aoColumns.push_back(std::move(oStd));
    }

    if (!m_oTable.StartTransaction())
    {
        ReportFatal(psReport, ErrorKind::IO, CPLE_AppDefined,
                    "Cannot start a transaction on %s",
                    m_oTable.GetName().c_str());
        return false;
    }

    bool bOK = true;
    for (const auto &oColumn : aoColumns)
    {
        const std::string osProvenance =
            (&oColumn == &aoColumns[0]) ? m_osProvenance
                                        : m_osProvenance + ":MM";
        bOK = m_oTable.EnsureRealField(oColumn.osName, oColumn.osAlias) &&
              m_oTable.SetFieldProvenance(oColumn.osName, osProvenance);
        if (!bOK)
            break;
    }
    bOK = bOK && m_oTable.WriteColumns(aoColumns);

    if (!bOK || !m_oTable.CommitTransaction())
    {
        const std::string osMsg = CPLGetLastErrorMsg();
        if (!m_oTable.RollbackTransaction())
        {
            CPLDebug(GEODIV_DEBUG_KEY, "Rollback on %s failed",
                     m_oTable.GetName().c_str());
        }
        ReportFatal(psReport, ErrorKind::IO, CPLE_AppDefined,
                    "Writing field %s on %s failed: %s", m_osFieldName.c_str(),
                    m_oTable.GetName().c_str(), osMsg.c_str());
        return false;
    }

    CPLDebug(GEODIV_DEBUG_KEY, "Wrote %d values into %s.%s",
             static_cast<int>(aoValues.size()),
             m_oTable.GetName().c_str(), m_osFieldName.c_str());
    return true;
}

}  // namespace geodiv
