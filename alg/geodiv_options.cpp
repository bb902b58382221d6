/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Metric catalogue and option parsing
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

#include <climits>
#include <cstdarg>
#include <cstdlib>

namespace geodiv
{

/************************************************************************/
/*                           GetMetricCode()                            */
/************************************************************************/

const char *GetMetricCode(Metric eMetric)
{
    switch (eMetric)
    {
        case Metric::A_NE:
            return "A_Ne";
        case Metric::A_NC:
            return "A_Nc";
        case Metric::A_SHDI:
            return "A_SHDI";
        case Metric::L_TL:
            return "L_Tl";
        case Metric::P_NE:
            return "P_Ne";
        case Metric::P_NC:
            return "P_Nc";
        case Metric::P_HU:
            return "P_Hu";
        case Metric::R_SD:
            return "R_SD";
        case Metric::R_SDC:
            return "R_SDc";
        case Metric::R_M:
            return "R_M";
    }
    return "invalid";
}

/************************************************************************/
/*                           GetAllMetrics()                            */
/************************************************************************/

const std::vector<Metric> &GetAllMetrics()
{
    static const std::vector<Metric> aeMetrics = {
        Metric::A_NE, Metric::A_NC, Metric::A_SHDI, Metric::L_TL,
        Metric::P_NE, Metric::P_NC, Metric::P_HU,   Metric::R_SD,
        Metric::R_SDC, Metric::R_M};
    return aeMetrics;
}

/************************************************************************/
/*                          ParseMetricCode()                           */
/************************************************************************/

/** Accepts "R_SDc" as well as the sub-command spelling "r-sdc". */
bool ParseMetricCode(const char *pszCode, Metric *peMetric)
{
    if (pszCode == nullptr)
        return false;
    const CPLString osCode = CPLString(pszCode).replaceAll('-', '_');
    for (const Metric eMetric : GetAllMetrics())
    {
        if (EQUAL(osCode.c_str(), GetMetricCode(eMetric)))
        {
            *peMetric = eMetric;
            return true;
        }
    }
    return false;
}

/************************************************************************/
/*                         GetMetricInputKind()                         */
/************************************************************************/

InputKind GetMetricInputKind(Metric eMetric)
{
    switch (eMetric)
    {
        case Metric::A_NE:
        case Metric::A_NC:
        case Metric::A_SHDI:
            return InputKind::POLYGON;
        case Metric::L_TL:
            return InputKind::LINE;
        case Metric::P_NE:
        case Metric::P_NC:
        case Metric::P_HU:
            return InputKind::POINT;
        case Metric::R_SD:
        case Metric::R_SDC:
        case Metric::R_M:
            break;
    }
    return InputKind::RASTER;
}

bool IsCountMetric(Metric eMetric)
{
    return eMetric == Metric::A_NE || eMetric == Metric::P_NE;
}

bool IsCategoricalMetric(Metric eMetric)
{
    return eMetric == Metric::A_NC || eMetric == Metric::A_SHDI ||
           eMetric == Metric::P_NC || eMetric == Metric::P_HU;
}

/************************************************************************/
/*                          GetErrorKindName()                          */
/************************************************************************/

const char *GetErrorKindName(ErrorKind eKind)
{
    switch (eKind)
    {
        case ErrorKind::NONE:
            return "None";
        case ErrorKind::CONFIGURATION:
            return "ConfigurationError";
        case ErrorKind::SPATIAL_MISMATCH:
            return "SpatialMismatchError";
        case ErrorKind::FORMAT_REJECTED:
            return "FormatRejectedError";
        case ErrorKind::CATEGORY_DOMAIN:
            return "CategoryDomainError";
        case ErrorKind::SPARSE_ZONE:
            return "SparseZoneWarning";
        case ErrorKind::RESOURCE_CLEANUP:
            return "ResourceCleanupError";
        case ErrorKind::INTERRUPTED:
            return "Interrupted";
        case ErrorKind::IO:
            return "IOError";
    }
    return "Unknown";
}

/************************************************************************/
/*                            ReportFatal()                             */
/************************************************************************/

void ReportFatal(RunReport *psReport, ErrorKind eKind, CPLErrorNum nErrNo,
                 const char *pszFmt, ...)
{
    va_list args;
    va_start(args, pszFmt);
    CPLString osMsg;
    osMsg.vPrintf(pszFmt, args);
    va_end(args);

    CPLError(CE_Failure, nErrNo, "%s: %s", GetErrorKindName(eKind),
             osMsg.c_str());
    if (psReport && psReport->eFatalError == ErrorKind::NONE)
    {
        psReport->eFatalError = eKind;
        psReport->osFatalMessage = osMsg;
    }
}

/************************************************************************/
/*                        RunReport::GetValue()                         */
/************************************************************************/

const ZoneValue *RunReport::GetValue(GIntBig nZoneId) const
{
    for (const auto &sValue : aoValues)
    {
        if (sValue.nZoneId == nZoneId)
            return &sValue;
    }
    return nullptr;
}

/************************************************************************/
/*                          ParsePositiveInt()                          */
/************************************************************************/

static bool ParsePositiveInt(const char *pszKey, const char *pszValue,
                             int *pnValue)
{
    const GIntBig nVal = CPLGetValueType(pszValue) == CPL_VALUE_INTEGER
                             ? CPLAtoGIntBig(pszValue)
                             : 0;
    if (nVal <= 0 || nVal > INT_MAX)
    {
        CPLError(CE_Failure, CPLE_IllegalArg, "Invalid value for %s: %s",
                 pszKey, pszValue);
        return false;
    }
    *pnValue = static_cast<int>(nVal);
    return true;
}

static bool ParseReal(const char *pszKey, const char *pszValue,
                      double *pdfValue)
{
    if (CPLGetValueType(pszValue) == CPL_VALUE_STRING)
    {
        CPLError(CE_Failure, CPLE_IllegalArg, "Invalid value for %s: %s",
                 pszKey, pszValue);
        return false;
    }
    *pdfValue = CPLAtof(pszValue);
    return true;
}

/************************************************************************/
/*                           Options::Init()                            */
/************************************************************************/

CPLErr Options::Init(CSLConstList papszOptions)
{
    for (const auto &[key, value] : cpl::IterateNameValue(papszOptions))
    {
        if (EQUAL(key, "METRIC"))
        {
            if (!ParseMetricCode(value, &eMetric))
            {
                CPLError(CE_Failure, CPLE_IllegalArg, "Unknown metric: %s",
                         value);
                return CE_Failure;
            }
            bMetricSet = true;
        }
        else if (EQUAL(key, "OUTPUT_FIELD"))
        {
            osOutputField = value;
        }
        else if (EQUAL(key, "GRID_LAYER"))
        {
            osGridLayer = value;
        }
        else if (EQUAL(key, "INPUT_LAYER"))
        {
            osInputLayer = value;
        }
        else if (EQUAL(key, "ZONE_ID_FIELD"))
        {
            osZoneIdField = value;
        }
        else if (EQUAL(key, "CATEGORY_FIELD"))
        {
            osCategoryField = value;
        }
        else if (EQUAL(key, "BAND"))
        {
            if (!ParsePositiveInt(key, value, &nBand))
                return CE_Failure;
        }
        else if (EQUAL(key, "SLOPE_BAND"))
        {
            if (!ParsePositiveInt(key, value, &nSlopeBand))
                return CE_Failure;
        }
        else if (EQUAL(key, "IGNORE_NODATA"))
        {
            bIgnoreNoData = CPLTestBool(value);
        }
        else if (EQUAL(key, "STANDARDIZE"))
        {
            bStandardize = CPLTestBool(value);
        }
        else if (EQUAL(key, "ANGLE_UNIT"))
        {
            if (EQUAL(value, "DEGREES") || EQUAL(value, "DEG"))
            {
                eAngleUnit = AngleUnit::DEGREES;
            }
            else if (EQUAL(value, "RADIANS") || EQUAL(value, "RAD"))
            {
                eAngleUnit = AngleUnit::RADIANS;
            }
            else
            {
                CPLError(CE_Failure, CPLE_IllegalArg,
                         "Unexpected value of ANGLE_UNIT: %s", value);
                return CE_Failure;
            }
        }
        else if (EQUAL(key, "OUTPUT_DEGREES"))
        {
            bOutputDegrees = CPLTestBool(value);
        }
        else if (EQUAL(key, "SLOPE_THRESHOLD"))
        {
            if (!ParseReal(key, value, &dfSlopeThreshold))
                return CE_Failure;
            bHasSlopeThreshold = true;
        }
        else if (EQUAL(key, "RELIEF_SCALES"))
        {
            if (!ParsePositiveInt(key, value, &nReliefScales))
                return CE_Failure;
        }
        else if (EQUAL(key, "RELIEF_NORMALIZE_AREA"))
        {
            bReliefNormalizeByArea = CPLTestBool(value);
        }
        else if (EQUAL(key, "NODATA_VALUE"))
        {
            if (!ParseReal(key, value, &dfNoDataValue))
                return CE_Failure;
            bHasNoDataValue = true;
        }
        else
        {
            CPLError(CE_Warning, CPLE_IllegalArg,
                     "Unexpected geodiv option: %s", key);
        }
    }

    return CE_None;
}

/************************************************************************/
/*                      Options::GetReliefScales()                      */
/************************************************************************/

int Options::GetReliefScales() const
{
    if (nReliefScales > 0)
        return nReliefScales;
    return atoi(CPLGetConfigOption("GEODIV_RELIEF_SCALES", "2"));
}

}  // namespace geodiv
