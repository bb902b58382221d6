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

#ifndef GEODIVALG_METRIC_INCLUDED
#define GEODIVALG_METRIC_INCLUDED

#include "gdalalgorithm.h"

#include "geodiv.h"

//! @cond Doxygen_Suppress

/************************************************************************/
/*                        GeodivMetricAlgorithm                         */
/************************************************************************/

/** Common arguments and run logic of the per-metric commands. */
class GeodivMetricAlgorithm /* non final */ : public GDALAlgorithm
{
  protected:
    GeodivMetricAlgorithm(const std::string &name,
                          const std::string &description,
                          const std::string &helpURL, geodiv::Metric eMetric);

  private:
    bool RunImpl(GDALProgressFunc pfnProgress, void *pProgressData) override;

    const geodiv::Metric m_metric;

    GDALArgDatasetValue m_grid{};
    std::string m_gridLayer{};
    std::string m_zoneIdField{};
    GDALArgDatasetValue m_input{};
    std::string m_inputLayer{};
    int m_band = 1;
    std::string m_categoryField{};
    std::string m_outputField{};
    bool m_standardize = false;
    bool m_ignoreNodata = true;
    bool m_noIgnoreNodata = false;
    double m_nodataValue = 0;

    // R_SDc
    std::string m_angleUnit = "degrees";
    bool m_outputDegrees = false;
    GDALArgDatasetValue m_slope{};
    int m_slopeBand = 1;
    double m_slopeThreshold = 0;

    // R_M
    int m_scales = 0;
    bool m_normalizeArea = false;

    std::string m_output{};
};

/************************************************************************/
/*                   GeodivAreaElementCountAlgorithm                    */
/************************************************************************/

class GeodivAreaElementCountAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "a-ne";
    static constexpr const char *DESCRIPTION =
        "Count polygons per zone (A_Ne).";
    static constexpr const char *HELP_URL = "";

    GeodivAreaElementCountAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::A_NE)
    {
    }
};

/************************************************************************/
/*                   GeodivAreaCategoryCountAlgorithm                   */
/************************************************************************/

class GeodivAreaCategoryCountAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "a-nc";
    static constexpr const char *DESCRIPTION =
        "Count distinct polygon categories per zone (A_Nc).";
    static constexpr const char *HELP_URL = "";

    GeodivAreaCategoryCountAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::A_NC)
    {
    }
};

/************************************************************************/
/*                      GeodivAreaShannonAlgorithm                      */
/************************************************************************/

class GeodivAreaShannonAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "a-shdi";
    static constexpr const char *DESCRIPTION =
        "Area-weighted Shannon diversity of polygon categories (A_SHDI).";
    static constexpr const char *HELP_URL = "";

    GeodivAreaShannonAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::A_SHDI)
    {
    }
};

/************************************************************************/
/*                      GeodivLineLengthAlgorithm                       */
/************************************************************************/

class GeodivLineLengthAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "l-tl";
    static constexpr const char *DESCRIPTION =
        "Total line length per zone (L_Tl).";
    static constexpr const char *HELP_URL = "";

    GeodivLineLengthAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::L_TL)
    {
    }
};

/************************************************************************/
/*                      GeodivPointCountAlgorithm                       */
/************************************************************************/

class GeodivPointCountAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "p-ne";
    static constexpr const char *DESCRIPTION =
        "Count points per zone (P_Ne).";
    static constexpr const char *HELP_URL = "";

    GeodivPointCountAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::P_NE)
    {
    }
};

/************************************************************************/
/*                  GeodivPointCategoryCountAlgorithm                   */
/************************************************************************/

class GeodivPointCategoryCountAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "p-nc";
    static constexpr const char *DESCRIPTION =
        "Count distinct point categories per zone (P_Nc).";
    static constexpr const char *HELP_URL = "";

    GeodivPointCategoryCountAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::P_NC)
    {
    }
};

/************************************************************************/
/*                     GeodivPointShannonAlgorithm                      */
/************************************************************************/

class GeodivPointShannonAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "p-hu";
    static constexpr const char *DESCRIPTION =
        "Shannon diversity of point categories (P_Hu).";
    static constexpr const char *HELP_URL = "";

    GeodivPointShannonAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::P_HU)
    {
    }
};

/************************************************************************/
/*                     GeodivRasterStdDevAlgorithm                      */
/************************************************************************/

class GeodivRasterStdDevAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "r-sd";
    static constexpr const char *DESCRIPTION =
        "Standard deviation of raster values per zone (R_SD).";
    static constexpr const char *HELP_URL = "";

    GeodivRasterStdDevAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::R_SD)
    {
    }
};

/************************************************************************/
/*                 GeodivRasterCircularStdDevAlgorithm                  */
/************************************************************************/

class GeodivRasterCircularStdDevAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "r-sdc";
    static constexpr const char *DESCRIPTION =
        "Circular standard deviation of raster angles (R_SDc).";
    static constexpr const char *HELP_URL = "";

    GeodivRasterCircularStdDevAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::R_SDC)
    {
    }
};

/************************************************************************/
/*                     GeodivRasterReliefAlgorithm                      */
/************************************************************************/

class GeodivRasterReliefAlgorithm final : public GeodivMetricAlgorithm
{
  public:
    static constexpr const char *NAME = "r-m";
    static constexpr const char *DESCRIPTION =
        "Multi-scale relief index per zone (R_M).";
    static constexpr const char *HELP_URL = "";

    GeodivRasterReliefAlgorithm()
        : GeodivMetricAlgorithm(NAME, DESCRIPTION, HELP_URL,
                                geodiv::Metric::R_M)
    {
    }
};

//! @endcond

#endif  // GEODIVALG_METRIC_INCLUDED
