#include <lib/base/eerror.h>
#include <lib/base/elock.h>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <time.h>
#include <sys/time.h>

#include <string>

int debugLvl = DEFAULT_DEBUG_LVL;
static int debugTime = 2; // Bitmap: 0 = none, 1 = secs since boot, 2 = local time, 3 = boot and local, 6 = local date/time, 7 = boot and date/time

static pthread_mutex_t DebugLock = PTHREAD_MUTEX_INITIALIZER;
#define RINGBUFFER_SIZE 16384
static char ringbuffer[RINGBUFFER_SIZE];
static unsigned int ringbuffer_head;
static void logOutput(const char *data, unsigned int len)
{
	singleLock s(DebugLock);
	while (len)
	{
		unsigned int remaining = RINGBUFFER_SIZE - ringbuffer_head;

		if (remaining > len)
			remaining = len;

		memcpy(ringbuffer + ringbuffer_head, data, remaining);
		len -= remaining;
		data += remaining;
		ringbuffer_head += remaining;
		if (ringbuffer_head == RINGBUFFER_SIZE)
			ringbuffer_head = 0;
	}
}

void retrieveLogBuffer(const char **p1, unsigned int *s1, const char **p2, unsigned int *s2)
{
	unsigned int begin = ringbuffer_head;
	*p1 = *p2 = NULL;
	*s1 = *s2 = 0;
	while (ringbuffer[begin] == 0)
	{
		++begin;
		if (begin == RINGBUFFER_SIZE)
			begin = 0;
		if (begin == ringbuffer_head)
			return;
	}

	if (begin < ringbuffer_head)
	{
		*p1 = ringbuffer + begin;
		*s1 = ringbuffer_head - begin;
	}
	else
	{
		*p1 = ringbuffer + begin;
		*s1 = RINGBUFFER_SIZE - begin;
		*p2 = ringbuffer;
		*s2 = ringbuffer_head;
	}
}

std::string getLogBuffer()
{
	singleLock s(DebugLock);
	const char *p1, *p2;
	unsigned int s1, s2;
	retrieveLogBuffer(&p1, &s1, &p2, &s2);
	std::string ret;
	if (p1)
		ret.assign(p1, s1);
	if (p2)
		ret.append(p2, s2);
	return ret;
}

#define eDEBUG_BUFLEN    1024

static int formatTime(char *buf, int bufferSize, int flags)
{
	int pos = 0;
	if (!(flags & _DBGFLG_NOTIME))
	{
		if (debugTime & 6)
		{
			struct tm loctime = {};
			struct timeval tim = {};
			gettimeofday(&tim, NULL);
			localtime_r(&tim.tv_sec, &loctime);
			if (debugTime & 4)
				pos += snprintf(buf + pos, bufferSize - pos, "%04d-%02d-%02d ", loctime.tm_year + 1900, loctime.tm_mon + 1, loctime.tm_mday);
			if (debugTime & 2)
				pos += snprintf(buf + pos, bufferSize - pos, "%02d:%02d:%02d.%04lld ", loctime.tm_hour, loctime.tm_min, loctime.tm_sec, (long long)tim.tv_usec / 100L);
		}
		if (debugTime & 1)
		{
			struct timespec tp = {};
			clock_gettime(CLOCK_MONOTONIC, &tp);
			pos += snprintf(buf + pos, bufferSize - pos, "<%6lld.%06lld> ", (long long)tp.tv_sec, (long long)tp.tv_nsec / 1000);
		}
	}
	return pos;
}

void eDebugImpl(int flags, const char* fmt, ...)
{
	char * buf = new char[eDEBUG_BUFLEN];

	int pos = formatTime(buf, eDEBUG_BUFLEN, flags);

	va_list ap;
	va_start(ap, fmt);
	int vsize = vsnprintf(buf + pos, eDEBUG_BUFLEN - pos, fmt, ap);
	va_end(ap);

	if (vsize < 0) {
		vsize = 0;
		pos += snprintf(buf + pos, eDEBUG_BUFLEN - pos, " Error formatting: %s", fmt);
		if (pos > eDEBUG_BUFLEN - 1)
			pos = eDEBUG_BUFLEN - 1;
	}
	else if (pos + vsize > eDEBUG_BUFLEN - 1) {
		delete[] buf;
		// +2 for \0 and optional newline
		buf = new char[pos + vsize + 2];
		pos = formatTime(buf, pos + vsize, flags);

		va_start(ap, fmt);
		vsize = vsnprintf(buf + pos, vsize + 1, fmt, ap);
		va_end(ap);
	}

	pos += vsize;

	if (!(flags & _DBGFLG_NONEWLINE))
		buf[pos++] = '\n';

	logOutput(buf, pos);

	ssize_t ret = ::write(2, buf, pos);
	if (ret < 0) (void)ret;

	delete[] buf;

	if (flags & _DBGFLG_FATAL)
		abort();
}

int eGetDebugLvl()
{
	return debugLvl;
}

void setDebugTime(int flags)
{
	debugTime = flags;
}
