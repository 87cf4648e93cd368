#pragma once

#include "dbjob/platform/platform.h"

#define INI_DRIVERLOG       "DriverLog"
#define INI_DRIVERLOGFILE   "DriverLogFile"
#define INI_TIMEOUT         "Timeout"         /* Default command timeout, seconds, 0 means driver default */
#define INI_MAXATTEMPTS     "MaxAttempts"     /* Attempts per job run, transient failures only */
#define INI_RETRYDELAY      "RetryDelay"      /* Pause between attempts, milliseconds */
#define INI_BUFFERED        "Buffered"        /* Eager vs lazy materialization of sequences */
#define INI_POOLSIZE        "PoolSize"        /* Upper bound of open connections in a pool */
#define INI_POOLTIMEOUT     "PoolTimeout"     /* Connection acquisition timeout, milliseconds */
#define INI_ISOLATION       "Isolation"       /* Default transaction isolation level */
#define INI_PLANCACHE       "PlanCache"       /* Reuse of mapping plans across runs */

#define INI_TIMEOUT_DEFAULT         "0"
#define INI_MAXATTEMPTS_DEFAULT     "1"
#define INI_RETRYDELAY_DEFAULT      "0"
#define INI_BUFFERED_DEFAULT        "on"
#define INI_POOLSIZE_DEFAULT        "8"
#define INI_POOLTIMEOUT_DEFAULT     "30000"
#define INI_ISOLATION_DEFAULT       ""
#define INI_PLANCACHE_DEFAULT       "on"

#ifdef NDEBUG
#    define INI_DRIVERLOG_DEFAULT "off"
#else
#    define INI_DRIVERLOG_DEFAULT "on"
#endif

#ifdef _win_
#    define INI_DRIVERLOGFILE_DEFAULT "\\temp\\dbjob.log"
#else
#    define INI_DRIVERLOGFILE_DEFAULT "/tmp/dbjob.log"
#endif
