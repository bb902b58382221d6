/******************************************************************************
 *
 * Project:  GeoDiv
 * Purpose:  Scratch workspaces, target locking and interruption handling
 * Author:   GeoDiv developers
 *
 ******************************************************************************
 * Copyright (c) 2025, GeoDiv developers
 *
 * SPDX-License-Identifier: MIT
 ****************************************************************************/

#include "geodiv_priv.h"

#include "cpl_conv.h"
#include "cpl_multiproc.h"
#include "cpl_string.h"
#include "cpl_vsi.h"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <mutex>
#include <set>

#ifndef _WIN32
#include <sys/types.h>
#include <signal.h>
#endif

namespace geodiv
{

constexpr const char *WORKSPACE_PREFIX = "geodiv_";

/************************************************************************/
/*                          Interrupt flag                              */
/************************************************************************/

static std::atomic<bool> gbInterruptRequested{false};

static void GeodivSignalHandler(int /* nSignal */)
{
    gbInterruptRequested = true;
}

/************************************************************************/
/*                           InterruptGuard                             */
/************************************************************************/

typedef void (*SignalHandlerFunc)(int);

static std::mutex goInterruptMutex;
static int gnInterruptGuards = 0;
static SignalHandlerFunc gpfnPrevSigInt = SIG_DFL;
static SignalHandlerFunc gpfnPrevSigTerm = SIG_DFL;
static bool gbSigIntInstalled = false;
static bool gbSigTermInstalled = false;

static bool InstallSignalHandler(int nSignal, SignalHandlerFunc *ppfnPrev)
{
    const SignalHandlerFunc pfnPrev =
        std::signal(nSignal, GeodivSignalHandler);
    if (pfnPrev == SIG_ERR)
    {
        CPLDebug(GEODIV_DEBUG_KEY, "Cannot install handler for signal %d",
                 nSignal);
        return false;
    }
    *ppfnPrev = pfnPrev;
    return true;
}

InterruptGuard::InterruptGuard()
{
    std::lock_guard<std::mutex> oLock(goInterruptMutex);
    if (gnInterruptGuards++ == 0)
    {
        gbInterruptRequested = false;
        gbSigIntInstalled = InstallSignalHandler(SIGINT, &gpfnPrevSigInt);
        gbSigTermInstalled = InstallSignalHandler(SIGTERM, &gpfnPrevSigTerm);
    }
}

InterruptGuard::~InterruptGuard()
{
    std::lock_guard<std::mutex> oLock(goInterruptMutex);
    if (--gnInterruptGuards == 0)
    {
        if (gbSigIntInstalled)
            std::signal(SIGINT, gpfnPrevSigInt);
        if (gbSigTermInstalled)
            std::signal(SIGTERM, gpfnPrevSigTerm);
        gbSigIntInstalled = false;
        gbSigTermInstalled = false;
        gbInterruptRequested = false;
    }
}

bool IsInterruptRequested()
{
    return gbInterruptRequested;
}

void RequestInterrupt()
{
    gbInterruptRequested = true;
}

void ClearInterruptRequest()
{
    gbInterruptRequested = false;
}

/************************************************************************/
/*                           ReportProgress()                           */
/************************************************************************/

bool ReportProgress(double dfComplete, GDALProgressFunc pfnProgress,
                    void *pProgressData, RunReport *psReport)
{
    if (IsInterruptRequested() ||
        (pfnProgress && !pfnProgress(dfComplete, "", pProgressData)))
    {
        ReportFatal(psReport, ErrorKind::INTERRUPTED, CPLE_UserInterrupt,
                    "Interrupted by user");
        return false;
    }
    return true;
}

/************************************************************************/
/*                           IsProcessAlive()                           */
/************************************************************************/

bool IsProcessAlive(int nPID)
{
    if (nPID <= 0)
        return false;
    if (nPID == CPLGetPID())
        return true;
#ifndef _WIN32
    return kill(static_cast<pid_t>(nPID), 0) == 0 || errno == EPERM;
#else
    return true;
#endif
}

/************************************************************************/
/*                      TempWorkspace::TempWorkspace()                  */
/************************************************************************/

TempWorkspace::TempWorkspace(const std::string &osPath, RunReport *psReport)
    : m_osPath(osPath), m_psReport(psReport)
{
}

TempWorkspace::~TempWorkspace()
{
    if (!m_bReleased)
        CPL_IGNORE_RET_VAL(Release());
}

/************************************************************************/
/*                         GetRootDirectory()                           */
/************************************************************************/

std::string TempWorkspace::GetRootDirectory()
{
    const char *pszDir = CPLGetConfigOption("GEODIV_TEMP_DIR", nullptr);
    if (pszDir == nullptr)
        pszDir = CPLGetConfigOption("CPL_TMPDIR", nullptr);
    if (pszDir == nullptr)
        pszDir = CPLGetConfigOption("TMPDIR", nullptr);
    if (pszDir == nullptr)
        pszDir = CPLGetConfigOption("TEMP", nullptr);
    if (pszDir == nullptr)
        pszDir = "/tmp";
    return pszDir;
}

/************************************************************************/
/*                               Create()                               */
/************************************************************************/

std::unique_ptr<TempWorkspace> TempWorkspace::Create(RunReport *psReport)
{
    static std::atomic<int> gnCounter{0};

    const std::string osRoot = GetRootDirectory();
    VSIStatBufL sStat;
    if (VSIStatL(osRoot.c_str(), &sStat) != 0 || !VSI_ISDIR(sStat.st_mode))
    {
        ReportFatal(psReport, ErrorKind::IO, CPLE_OpenFailed,
                    "Temporary directory %s does not exist", osRoot.c_str());
        return nullptr;
    }

    for (int nAttempt = 0; nAttempt < 100; ++nAttempt)
    {
        const std::string osPath = CPLFormFilenameSafe(
            osRoot.c_str(),
            CPLSPrintf("%s%d_%d", WORKSPACE_PREFIX, CPLGetPID(),
                       gnCounter++),
            nullptr);
        if (VSIStatL(osPath.c_str(), &sStat) == 0)
            continue;
        if (VSIMkdir(osPath.c_str(), 0755) != 0)
        {
            ReportFatal(psReport, ErrorKind::IO, CPLE_FileIO,
                        "Cannot create temporary directory %s",
                        osPath.c_str());
            return nullptr;
        }
        CPLDebug(GEODIV_DEBUG_KEY, "Created workspace %s", osPath.c_str());
        return std::unique_ptr<TempWorkspace>(
            new TempWorkspace(osPath, psReport));
    }

    ReportFatal(psReport, ErrorKind::IO, CPLE_FileIO,
                "Cannot find a free temporary directory name in %s",
                osRoot.c_str());
    return nullptr;
}

/************************************************************************/
/*                            GetFilename()                             */
/************************************************************************/

std::string TempWorkspace::GetFilename(const char *pszBasename,
                                       const char *pszExtension) const
{
    return CPLFormFilenameSafe(m_osPath.c_str(), pszBasename, pszExtension);
}

/************************************************************************/
/*                              Release()                               */
/************************************************************************/

bool TempWorkspace::Release()
{
    if (m_bReleased)
        return true;
    m_bReleased = true;

    if (CPLTestBool(CPLGetConfigOption("GEODIV_KEEP_TEMP", "NO")))
    {
        CPLDebug(GEODIV_DEBUG_KEY, "Keeping workspace %s", m_osPath.c_str());
        return true;
    }

    if (VSIRmdirRecursive(m_osPath.c_str()) != 0)
    {
        const std::string osMsg =
            std::string("Cannot remove temporary directory ") + m_osPath;
        CPLError(CE_Warning, CPLE_FileIO, "%s: %s",
                 GetErrorKindName(ErrorKind::RESOURCE_CLEANUP), osMsg.c_str());
        if (m_psReport)
        {
            m_psReport->bCleanupFailed = true;
            m_psReport->osCleanupMessage = osMsg;
        }
        return false;
    }
    return true;
}

/************************************************************************/
/*                        SweepStaleWorkspaces()                        */
/************************************************************************/

/** Remove workspaces left behind by dead processes. Returns the number
 * of directories removed. */
int TempWorkspace::SweepStaleWorkspaces(const std::string &osRoot)
{
    const CPLStringList aosEntries(VSIReadDir(osRoot.c_str()));
    int nRemoved = 0;
    for (const char *pszEntry : aosEntries)
    {
        if (!STARTS_WITH(pszEntry, WORKSPACE_PREFIX))
            continue;
        const char *pszPID = pszEntry + strlen(WORKSPACE_PREFIX);
        const int nPID = atoi(pszPID);
        if (nPID <= 0 || IsProcessAlive(nPID))
            continue;

        const std::string osPath =
            CPLFormFilenameSafe(osRoot.c_str(), pszEntry, nullptr);
        if (VSIRmdirRecursive(osPath.c_str()) == 0)
        {
            CPLDebug(GEODIV_DEBUG_KEY, "Removed stale workspace %s",
                     osPath.c_str());
            ++nRemoved;
        }
        else
        {
            CPLDebug(GEODIV_DEBUG_KEY, "Cannot remove stale workspace %s",
                     osPath.c_str());
        }
    }
    return nRemoved;
}

/************************************************************************/
/*                          WriteStagingFile()                          */
/************************************************************************/

/** Dump the per-zone results as CSV, before they are committed. */
bool WriteStagingFile(const std::string &osFilename, const RunReport &sReport)
{
    VSILFILE *fp = VSIFOpenL(osFilename.c_str(), "wb");
    if (fp == nullptr)
    {
        CPLError(CE_Failure, CPLE_OpenFailed, "Cannot create %s",
                 osFilename.c_str());
        return false;
    }

    bool bOK = VSIFPrintfL(fp, "zone_id,value\n") > 0;
    for (const auto &sValue : sReport.aoValues)
    {
        if (!bOK)
            break;
        if (sValue.bNoData)
            bOK = VSIFPrintfL(fp, CPL_FRMT_GIB ",\n", sValue.nZoneId) > 0;
        else
            bOK = VSIFPrintfL(fp, CPL_FRMT_GIB ",%.17g\n", sValue.nZoneId,
                              sValue.dfValue) > 0;
    }
    if (VSIFCloseL(fp) != 0)
        bOK = false;
    if (!bOK)
        CPLError(CE_Failure, CPLE_FileIO, "Write error on %s",
                 osFilename.c_str());
    return bOK;
}

/************************************************************************/
/*                          ReadStagingFile()                           */
/************************************************************************/

/** Load back the per-zone results written by WriteStagingFile(). */
bool ReadStagingFile(const std::string &osFilename,
                     std::vector<ZoneValue> &aoValues)
{
    aoValues.clear();

    VSILFILE *fp = VSIFOpenL(osFilename.c_str(), "rb");
    if (fp == nullptr)
    {
        CPLError(CE_Failure, CPLE_OpenFailed, "Cannot open %s",
                 osFilename.c_str());
        return false;
    }

    bool bOK = true;
    const char *pszLine = CPLReadLine2L(fp, -1, nullptr);
    if (pszLine == nullptr || !EQUAL(pszLine, "zone_id,value"))
    {
        CPLError(CE_Failure, CPLE_AppDefined, "%s: unexpected header",
                 osFilename.c_str());
        bOK = false;
    }

    int nLine = 1;
    while (bOK && (pszLine = CPLReadLine2L(fp, -1, nullptr)) != nullptr)
    {
        ++nLine;
        if (pszLine[0] == '\0')
            continue;

        const CPLStringList aosTokens(CSLTokenizeString2(
            pszLine, ",", CSLT_ALLOWEMPTYTOKENS | CSLT_STRIPLEADSPACES |
                              CSLT_STRIPENDSPACES));
        if (aosTokens.size() != 2 ||
            CPLGetValueType(aosTokens[0]) != CPL_VALUE_INTEGER)
        {
            CPLError(CE_Failure, CPLE_AppDefined, "%s:%d: malformed row",
                     osFilename.c_str(), nLine);
            bOK = false;
            break;
        }

        ZoneValue sValue;
        sValue.nZoneId = CPLAtoGIntBig(aosTokens[0]);
        if (aosTokens[1][0] != '\0')
        {
            char *pszEnd = nullptr;
            sValue.dfValue = CPLStrtod(aosTokens[1], &pszEnd);
            if (pszEnd == aosTokens[1] || *pszEnd != '\0')
            {
                CPLError(CE_Failure, CPLE_AppDefined, "%s:%d: bad value '%s'",
                         osFilename.c_str(), nLine, aosTokens[1]);
                bOK = false;
                break;
            }
            sValue.bNoData = false;
        }
        aoValues.push_back(sValue);
    }

    CPL_IGNORE_RET_VAL(VSIFCloseL(fp));
    return bOK;
}

/************************************************************************/
/*                             TargetLock                               */
/************************************************************************/

static std::mutex goLockMutex;
static std::set<std::string> goHeldLocks;

TargetLock::TargetLock(const std::string &osLockPath) : m_osLockPath(osLockPath)
{
}

TargetLock::~TargetLock()
{
    if (m_bHeld)
        CPL_IGNORE_RET_VAL(Release());
}

static int ReadLockOwner(const std::string &osLockPath)
{
    VSILFILE *fp = VSIFOpenL(osLockPath.c_str(), "rb");
    if (fp == nullptr)
        return -1;
    char szBuffer[32] = {};
    const size_t nRead = VSIFReadL(szBuffer, 1, sizeof(szBuffer) - 1, fp);
    CPL_IGNORE_RET_VAL(VSIFCloseL(fp));
    szBuffer[nRead] = '\0';
    return atoi(szBuffer);
}

/************************************************************************/
/*                              Acquire()                               */
/************************************************************************/

std::unique_ptr<TargetLock> TargetLock::Acquire(const std::string &osLockPath,
                                                double dfTimeout,
                                                RunReport *psReport)
{
    double dfWaited = 0;
    bool bInProcess = false;
    while (true)
    {
        {
            std::lock_guard<std::mutex> oGuard(goLockMutex);
            if (goHeldLocks.find(osLockPath) == goHeldLocks.end())
            {
                goHeldLocks.insert(osLockPath);
                bInProcess = true;
            }
        }
        if (bInProcess)
            break;
        if (dfWaited >= dfTimeout)
        {
            ReportFatal(psReport, ErrorKind::IO, CPLE_AppDefined,
                        "%s is being written by another run of this process",
                        osLockPath.c_str());
            return nullptr;
        }
        CPLSleep(0.1);
        dfWaited += 0.1;
    }

    std::unique_ptr<TargetLock> poLock(new TargetLock(osLockPath));
    if (osLockPath.empty())
        return poLock;

    VSIStatBufL sStat;
    while (VSIStatL(osLockPath.c_str(), &sStat) == 0)
    {
        const int nOwner = ReadLockOwner(osLockPath);
        if (!IsProcessAlive(nOwner))
        {
            CPLDebug(GEODIV_DEBUG_KEY, "Reclaiming stale lock %s (pid %d)",
                     osLockPath.c_str(), nOwner);
            if (VSIUnlink(osLockPath.c_str()) != 0)
            {
                ReportFatal(psReport, ErrorKind::IO, CPLE_FileIO,
                            "Cannot remove stale lock file %s",
                            osLockPath.c_str());
                return nullptr;
            }
            break;
        }
        if (dfWaited >= dfTimeout)
        {
            ReportFatal(psReport, ErrorKind::IO, CPLE_AppDefined,
                        "%s is locked by process %d", osLockPath.c_str(),
                        nOwner);
            return nullptr;
        }
        CPLSleep(0.25);
        dfWaited += 0.25;
    }

    VSILFILE *fp = VSIFOpenL(osLockPath.c_str(), "wb");
    bool bWritten = false;
    if (fp != nullptr)
    {
        bWritten = VSIFPrintfL(fp, "%d\n", CPLGetPID()) > 0;
        if (VSIFCloseL(fp) != 0)
            bWritten = false;
    }
    if (!bWritten)
    {
        ReportFatal(psReport, ErrorKind::IO, CPLE_FileIO,
                    "Cannot create lock file %s", osLockPath.c_str());
        return nullptr;
    }
    CPLDebug(GEODIV_DEBUG_KEY, "Acquired %s", osLockPath.c_str());
    return poLock;
}

/************************************************************************/
/*                              Release()                               */
/************************************************************************/

bool TargetLock::Release()
{
    if (!m_bHeld)
        return true;
    m_bHeld = false;

    bool bOK = true;
    if (!m_osLockPath.empty() && ReadLockOwner(m_osLockPath) == CPLGetPID())
    {
        if (VSIUnlink(m_osLockPath.c_str()) != 0)
        {
            CPLError(CE_Warning, CPLE_FileIO, "%s: cannot remove %s",
                     GetErrorKindName(ErrorKind::RESOURCE_CLEANUP),
                     m_osLockPath.c_str());
            bOK = false;
        }
    }

    std::lock_guard<std::mutex> oGuard(goLockMutex);
    goHeldLocks.erase(m_osLockPath);
    return bOK;
}

}  // namespace geodiv
