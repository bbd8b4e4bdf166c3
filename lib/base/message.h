#ifndef __lib_base_message_h
#define __lib_base_message_h

#include <queue>
#include <stdint.h>
#include <unistd.h>
#include <sys/eventfd.h>
#include <lib/base/ebase.h>
#include <lib/base/eerror.h>
#include <lib/base/elock.h>

class FD
{
protected:
	int m_fd;
public:
	FD(int fd): m_fd(fd) {}
	~FD()
	{
		if (m_fd >= 0)
			::close(m_fd);
	}
};

/**
 * \brief A messagepump with fixed-length packets.
 *
 * Messages can be sent from any thread, they are delivered through \c recv_msg
 * from the thread running the eMainloop the pump was created for.
 */
template<class T>
class eFixedMessagePump: public sigc::trackable, FD
{
	const char *name;
	eSingleLock lock;
	ePtr<eSocketNotifier> sn;
	std::queue<T> m_queue;

	void do_recv(int)
	{
		uint64_t data;
		if (::read(m_fd, &data, sizeof(data)) <= 0)
		{
			eWarning("[eFixedMessagePump<%s>] read error %m", name);
			return;
		}

		/* eventfd reads the number of writes since the last read. */
		for(unsigned int count = (unsigned int)data; count != 0; --count)
		{
			lock.lock();
			if (m_queue.empty())
			{
				lock.unlock();
				eWarning("[eFixedMessagePump<%s>] Got event but queue is empty", name);
				break;
			}
			T msg = m_queue.front();
			m_queue.pop();
			lock.unlock();
			/*
			 * We should not deliver the message while holding the lock.
			 * We would risk deadlock when pump writer and reader share another
			 * mutex besides this one.
			 */
			/*emit*/ recv_msg(msg);
		}
	}
	void trigger_event()
	{
		static const uint64_t data = 1;
		if (::write(m_fd, &data, sizeof(data)) < 0)
			eFatal("[eFixedMessagePump<%s>] write error %m", name);
	}
public:
	sigc::signal<void(const T&)> recv_msg;
	void send(const T &msg)
	{
		{
			eSingleLocker s(lock);
			m_queue.push(msg);
		}
		trigger_event();
	}
	eFixedMessagePump(eMainloop *context, const char *name):
		FD(eventfd(0, EFD_CLOEXEC)),
		name(name),
		sn(eSocketNotifier::create(context, m_fd, eSocketNotifier::Read, false))
	{
		CONNECT(sn->activated, eFixedMessagePump<T>::do_recv);
		sn->start();
	}
	~eFixedMessagePump()
	{
		/* sn is refcounted and may still be referenced, so call stop() here */
		sn->stop();
	}
};

#endif
