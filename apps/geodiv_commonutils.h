/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Entry point helpers of the command line utilities
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#ifndef GEODIV_COMMONUTILS_H_INCLUDED
#define GEODIV_COMMONUTILS_H_INCLUDED

#include "cpl_port.h"

#include <cstdio>
#include <exception>

#if defined(_WIN32) && (defined(_MSC_VER) || defined(SUPPORTS_WMAIN))

#include <wchar.h>
#include "cpl_conv.h"
#include "cpl_string.h"

/** Frees the UTF-8 copy of the wide command line on exit of wmain(). */
class GeodivARGVDestroyer
{
    char **m_papszList = nullptr;
    GeodivARGVDestroyer(const GeodivARGVDestroyer &) = delete;
    GeodivARGVDestroyer &operator=(const GeodivARGVDestroyer &) = delete;

  public:
    explicit GeodivARGVDestroyer(char **papszList) : m_papszList(papszList)
    {
    }

    ~GeodivARGVDestroyer()
    {
        CSLDestroy(m_papszList);
    }
};

extern "C" int wmain(int argc, wchar_t **argv_w, wchar_t ** /* envp */);

#define MAIN_START(argc, argv)                                                 \
    extern "C" int wmain(int argc, wchar_t **argv_w, wchar_t ** /* envp */)    \
    {                                                                          \
        char **argv =                                                          \
            static_cast<char **>(CPLCalloc(argc + 1, sizeof(char *)));         \
        for (int i = 0; i < argc; i++)                                         \
        {                                                                      \
            argv[i] =                                                          \
                CPLRecodeFromWChar(argv_w[i], CPL_ENC_UCS2, CPL_ENC_UTF8);     \
        }                                                                      \
        GeodivARGVDestroyer argvDestroyer(argv);                               \
        try                                                                    \
        {

#else  // defined(_WIN32)

#define MAIN_START(argc, argv)                                                 \
    int main(int argc, char **argv)                                            \
    {                                                                          \
        try                                                                    \
        {

#endif  // defined(_WIN32)

#define MAIN_END                                                               \
    }                                                                          \
    catch (const std::exception &e)                                            \
    {                                                                          \
        fprintf(stderr, "Unexpected exception: %s\n", e.what());               \
        return -1;                                                             \
    }                                                                          \
    }

#endif  // GEODIV_COMMONUTILS_H_INCLUDED
