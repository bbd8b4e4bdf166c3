#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <poll.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netdb.h>

#include <vector>
#include <string>

#include "wrappers.h"

#include <lib/base/eerror.h>

ssize_t singleRead(int fd, void *buf, size_t count)
{
	int retval;
	while (1)
	{
		retval = ::read(fd, buf, count);
		if (retval < 0)
		{
			if (errno == EINTR) continue;
			eDebug("[singleRead] error: %m");
		}
		return retval;
	}
}

ssize_t readLine(int fd, char** buffer, size_t* bufsize, int timeout)
{
	size_t i = 0;
	while (1)
	{
		if (i >= *bufsize)
		{
			char *newbuf = (char*)realloc(*buffer, (*bufsize)+1024);
			if (newbuf == NULL)
				return -ENOMEM;
			*buffer = newbuf;
			*bufsize = (*bufsize) + 1024;
		}
		/* a line is complete at '\n', a silent peer ends it after timeout ms */
		if (waitReadable(fd, -1, timeout) <= 0 || singleRead(fd, (*buffer) + i, 1) <= 0)
		{
			(*buffer)[i] = '\0';
			return -1;
		}
		if ((*buffer)[i] == '\n')
		{
			(*buffer)[i] = '\0';
			return i;
		}
		if ((*buffer)[i] != '\r') i++;
	}
}

int Connect(const char *hostname, int port, int timeoutsec)
{
	int sd = -1;
	std::vector<struct addrinfo *> addresses;
	struct addrinfo *info = NULL;
	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC; /* both ipv4 and ipv6 */
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_protocol = 0; /* any */
	hints.ai_flags = AI_ADDRCONFIG;
	char portstring[15];
	snprintf(portstring, sizeof(portstring), "%d", port);
	if (getaddrinfo(hostname, portstring, &hints, &info) || !info) return -1;
	struct addrinfo *ptr = info;
	while (ptr)
	{
		addresses.push_back(ptr);
		ptr = ptr->ai_next;
	}

	for (unsigned int i = 0; i < addresses.size(); i++)
	{
		sd = ::socket(addresses[i]->ai_family, addresses[i]->ai_socktype, addresses[i]->ai_protocol);
		if (sd < 0) break;
		int flags;
		bool setblocking = false;
		if ((flags = fcntl(sd, F_GETFL, 0)) < 0)
		{
			::close(sd);
			sd = -1;
			continue;
		}
		if (!(flags & O_NONBLOCK))
		{
			/* set socket nonblocking, to allow for our own timeout on a nonblocking connect */
			flags |= O_NONBLOCK;
			if (fcntl(sd, F_SETFL, flags) < 0)
			{
				::close(sd);
				sd = -1;
				continue;
			}
			setblocking = true;
		}
		int connectresult;
		while (1)
		{
			connectresult = ::connect(sd, addresses[i]->ai_addr, addresses[i]->ai_addrlen);
			if (connectresult < 0)
			{
				if (errno == EINTR || errno == EINPROGRESS)
				{
					int error;
					socklen_t len = sizeof(error);
					pollfd pfd;
					pfd.fd = sd;
					pfd.events = POLLOUT;
					pfd.revents = 0;

					if (::poll(&pfd, 1, timeoutsec * 1000) <= 0) break;

					if (getsockopt(sd, SOL_SOCKET, SO_ERROR, &error, &len) < 0) break;

					if (error) break;
					/* we are connected */
					connectresult = 0;
					break;
				}
			}
			break;
		}
		if (connectresult < 0)
		{
			::close(sd);
			sd = -1;
			continue;
		}
		if (setblocking)
		{
			flags &= ~O_NONBLOCK;
			if (fcntl(sd, F_SETFL, flags) < 0)
			{
				::close(sd);
				sd = -1;
				continue;
			}
		}
		/* we have a working connection */
		break;
	}
	freeaddrinfo(info);
	return sd;
}

int waitReadable(int fd, int cancelfd, long timeout)
{
	pollfd pfd[2];
	int count = 1;
	pfd[0].fd = fd;
	pfd[0].events = POLLIN;
	pfd[0].revents = 0;
	if (cancelfd >= 0)
	{
		pfd[1].fd = cancelfd;
		pfd[1].events = POLLIN;
		pfd[1].revents = 0;
		count = 2;
	}
	while (1)
	{
		int ret = ::poll(pfd, count, timeout < 0 ? -1 : (int)timeout);
		if (ret < 0)
		{
			if (errno == EINTR) continue;
			return -errno;
		}
		if (ret == 0)
			return 0;
		if (count == 2 && pfd[1].revents)
			return -ECANCELED;
		return 1;
	}
}

ssize_t writeAll(int fd, const void *buf, size_t count)
{
	int retval;
	char *ptr = (char*)buf;
	size_t handledcount = 0;
	while (handledcount < count)
	{
		retval = ::send(fd, &ptr[handledcount], count - handledcount, MSG_NOSIGNAL);
		if (retval < 0 && errno == ENOTSOCK)
			retval = ::write(fd, &ptr[handledcount], count - handledcount);

		if (retval == 0) return -1;
		if (retval < 0)
		{
			if (errno == EINTR) continue;
			eDebug("[writeAll] error: %m");
			return retval;
		}
		handledcount += retval;
	}
	return handledcount;
}

bool endsWith(const std::string &str, const std::string &suffix)
{
	return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(const std::string &str, const std::string &prefix)
{
	return str.compare(0, prefix.size(), prefix) == 0;
}
