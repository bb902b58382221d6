/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  CLI front-end
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_commonutils.h"
#include "geodivalg_main.h"

#include "cpl_error.h"
#include "cpl_string.h"
#include "gdal.h"

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

/************************************************************************/
/*                                main()                                */
/************************************************************************/

MAIN_START(argc, argv)
{
    GDALAllRegister();

    // Process generic command options, including --config KEY VALUE
    argc = GDALGeneralCmdLineProcessor(argc, &argv,
                                       GDAL_OF_RASTER | GDAL_OF_VECTOR);
    if (argc < 1)
        return -argc;

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.push_back(argv[i]);
    CSLDestroy(argv);

    int ret = 1;
    {
        GeodivMainAlgorithm alg;
        alg.SetCalledFromCommandLine();

        if (!alg.ParseCommandLineArguments(args))
        {
            if (strstr(CPLGetLastErrorMsg(), "Do you mean") == nullptr &&
                strstr(CPLGetLastErrorMsg(), "Should be one among") == nullptr)
            {
                fprintf(stderr, "%s", alg.GetUsageForCLI(true).c_str());
            }
        }
        else
        {
            GDALProgressFunc pfnProgress =
                alg.IsProgressBarRequested() ? GDALTermProgress : nullptr;
            void *pProgressData = nullptr;

            ret = (alg.Run(pfnProgress, pProgressData) && alg.Finalize()) ? 0
                                                                          : 1;

            const auto outputArg =
                alg.GetActualAlgorithm().GetArg(GDAL_ARG_NAME_OUTPUT_STRING);
            if (outputArg && outputArg->GetType() == GAAT_STRING &&
                outputArg->IsOutput())
            {
                printf("%s", outputArg->Get<std::string>().c_str());
            }
        }
    }

    GDALDestroyDriverManager();
    return ret;
}

MAIN_END
