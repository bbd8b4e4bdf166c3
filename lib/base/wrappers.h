#ifndef __lib_base_wrappers_h
#define __lib_base_wrappers_h
#include <string>
#include <sys/types.h>

ssize_t singleRead(int fd, void *buf, size_t count);
/* reads one line without "\r\n", -1 on timeout (ms), error or end of file */
ssize_t readLine(int fd, char** buffer, size_t* bufsize, int timeout=3000);
ssize_t writeAll(int fd, const void *buf, size_t count);
int Connect(const char *hostname, int port, int timeoutsec);
/* waits up to timeout ms for fd to become readable.
   returns 1 readable, 0 timeout, -ECANCELED when cancelfd fired first, -errno on error */
int waitReadable(int fd, int cancelfd, long timeout);
bool endsWith(const std::string &str, const std::string &suffix);
bool startsWith(const std::string &str, const std::string &prefix);

#endif
