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

#ifndef GEODIVALG_MAIN_INCLUDED
#define GEODIVALG_MAIN_INCLUDED

#include "gdalalgorithm.h"

//! @cond Doxygen_Suppress

/************************************************************************/
/*                         GeodivMainAlgorithm                          */
/************************************************************************/

class GeodivMainAlgorithm final : public GDALAlgorithm
{
  public:
    static constexpr const char *NAME = "geodiv";
    static constexpr const char *DESCRIPTION =
        "Geodiversity indices computed over the zones of a grid.";
    static constexpr const char *HELP_URL = "";

    GeodivMainAlgorithm();

  private:
    std::string m_output{};
    bool m_version = false;
    bool m_metrics = false;

    bool RunImpl(GDALProgressFunc, void *) override;
};

//! @endcond

#endif  // GEODIVALG_MAIN_INCLUDED
