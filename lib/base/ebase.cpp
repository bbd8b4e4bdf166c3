#include <lib/base/ebase.h>

#include <errno.h>
#include <vector>

#include <lib/base/eerror.h>

DEFINE_REF(eSocketNotifier);

eSocketNotifier::eSocketNotifier(eMainloop *context, int fd, int requested, bool startnow):
	context(*context), fd(fd), state(0), requested(requested)
{
	if (startnow)
		start();
}

eSocketNotifier::~eSocketNotifier()
{
	stop();
}

void eSocketNotifier::start()
{
	if (state)
		stop();

	context.addSocketNotifier(this);
	state=2;  // running but not in poll yet
}

void eSocketNotifier::stop()
{
	if (state)
	{
		state=0;
		context.removeSocketNotifier(this);
	}
}

eMainloop::~eMainloop()
{
	while (!notifiers.empty())
		notifiers.begin()->second->stop();
}

void eMainloop::addSocketNotifier(eSocketNotifier *sn)
{
	int fd = sn->getFD();
	if (notifiers.find(fd) != notifiers.end())
		eFatal("[eMainloop] socket notifier for fd=%d already present", fd);
	notifiers[fd]=sn;
}

void eMainloop::removeSocketNotifier(eSocketNotifier *sn)
{
	int fd = sn->getFD();
	std::map<int,eSocketNotifier*>::iterator i(notifiers.find(fd));
	if (i != notifiers.end())
	{
		notifiers.erase(i);
		return;
	}
	eFatal("[eMainloop] removed socket notifier which is not present, fd=%d", fd);
}

int eMainloop::processOneEvent(long poll_timeout)
{
	int return_reason = 0;
	int fdcount = notifiers.size();

	std::vector<pollfd> pfd(fdcount);
	std::map<int,eSocketNotifier*>::iterator it = notifiers.begin();

	for (int i = 0; i < fdcount; ++i, ++it)
	{
		it->second->state = 1; // running and in poll
		pfd[i].fd = it->first;
		pfd[i].events = it->second->getRequested();
		pfd[i].revents = 0;
	}

	int ret = ::poll(pfd.data(), fdcount, poll_timeout);

	if (ret > 0)
	{
		for (int i = 0; i < fdcount; ++i)
		{
			if (!pfd[i].revents)
				continue;
			it = notifiers.find(pfd[i].fd);
			if (it != notifiers.end() && it->second->state == 1) // added and in poll
			{
				m_inActivate = it->second;
				int req = m_inActivate->getRequested();
				if (pfd[i].revents & req)
				{
					m_inActivate->AddRef();
					m_inActivate->activate(pfd[i].revents & req);
					m_inActivate->Release();
				}
				pfd[i].revents &= ~req;
				m_inActivate = 0;
			}
			if (pfd[i].revents & (POLLERR|POLLHUP|POLLNVAL))
				eDebug("[eMainloop] poll: unhandled POLLERR/HUP/NVAL for fd %d(%d)", pfd[i].fd, pfd[i].revents);
		}
	}
	else if (ret == 0)
		return_reason = 1;
	else
	{
			/* when we got a signal, we get EINTR. */
		if (errno != EINTR)
			eDebug("[eMainloop] poll made error (%m)");
		else
			return_reason = 2;
	}

	return return_reason;
}

int eMainloop::iterate(unsigned int user_timeout)
{
	if (app_quit_now)
		return 0;

	if (!user_timeout)
		return processOneEvent(-1);

	timespec deadline = monotonicNow() + (long)user_timeout;
	int ret;
	do
	{
		long left = timeout_msec(deadline, monotonicNow());
		if (!left)
			return 1;
		ret = processOneEvent(left);
	} while (ret == 2 && !app_quit_now);

	return ret;
}

int eMainloop::runLoop()
{
	while (!app_quit_now)
		iterate();
	return retval;
}

void eMainloop::reset()
{
	app_quit_now=false;
}

void eMainloop::quit(int ret)
{
	retval = ret;
	app_quit_now = true;
}

eApplication* eApp = 0;
