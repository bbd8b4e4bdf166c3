#ifndef __E_ERROR__
#define __E_ERROR__

#include <string>

#ifdef ASSERT
#undef ASSERT
#endif

#define CHECKFORMAT __attribute__ ((__format__(__printf__, 2, 3)))

/*
 * Current loglevel
 * May be set by the E2SYNC_DEBUG_LVL environment variable.
 * main() will check the environment to set the value.
 */
extern int debugLvl;

void CHECKFORMAT eDebugImpl(int flags, const char*, ...);
enum { lvlDebug=4, lvlInfo=3, lvlWarning=2, lvlError=1, lvlFatal=0 };

#define DEFAULT_DEBUG_LVL  3

#ifndef MAX_DEBUG_LEVEL
# define MAX_DEBUG_LEVEL 4
#endif

/* When lvl is above MAX_DEBUG_LEVEL, the compiler will optimize the whole debug
 * statement away. If level is not active, nothing inside the debug call will be
 * evaluated. */
#define eDebugLow(lvl, flags, ...) \
	do { \
		if (((lvl) <= MAX_DEBUG_LEVEL) && ((lvl) <= debugLvl)) \
			eDebugImpl((flags), __VA_ARGS__); \
	} while (0)

#define _DBGFLG_NONEWLINE  1
#define _DBGFLG_NOTIME     2
#define _DBGFLG_FATAL      4
#define eFatal(...)			eDebugLow(lvlFatal,   _DBGFLG_FATAL,       __VA_ARGS__)
#define eLog(lvl, ...)			eDebugLow(lvl,        0,                   ##__VA_ARGS__)
#define eLogNoNewLine(lvl, ...)		eDebugLow(lvl,        _DBGFLG_NOTIME | _DBGFLG_NONEWLINE, ##__VA_ARGS__)
#define eWarning(...)			eDebugLow(lvlWarning, 0,                   __VA_ARGS__)
#define eDebug(...)			eDebugLow(lvlDebug,   0,                   __VA_ARGS__)
#define ASSERT(x) { if (!(x)) eFatal("%s:%d ASSERTION %s FAILED!", __FILE__, __LINE__, #x); }

int eGetDebugLvl();
void setDebugTime(int flags);

/* the log is mirrored into a ringbuffer, p2/s2 is the wrapped part (may be NULL) */
void retrieveLogBuffer(const char **p1, unsigned int *s1, const char **p2, unsigned int *s2);
std::string getLogBuffer();

#endif // __E_ERROR__
