#ifndef __ebase_h
#define __ebase_h

#include <map>
#include <sys/poll.h>
#include <time.h>

#include <lib/base/object.h>
#include <libsig_comp.h>

class eApplication;
class eMainloop;

extern eApplication* eApp;

static inline bool operator<( const timespec &t1, const timespec &t2 )
{
	return t1.tv_sec < t2.tv_sec || (t1.tv_sec == t2.tv_sec && t1.tv_nsec < t2.tv_nsec);
}

static inline bool operator<=( const timespec &t1, const timespec &t2 )
{
	return t1.tv_sec < t2.tv_sec || (t1.tv_sec == t2.tv_sec && t1.tv_nsec <= t2.tv_nsec);
}

static inline timespec operator-( const timespec &t1, const timespec &t2 )
{
	timespec tmp;
	tmp.tv_sec = t1.tv_sec - t2.tv_sec;
	if ( (tmp.tv_nsec = t1.tv_nsec - t2.tv_nsec) < 0 )
	{
		tmp.tv_sec--;
		tmp.tv_nsec += 1000000000;
	}
	return tmp;
}

static inline timespec &operator+=( timespec &t1, const long msek )
{
	t1.tv_sec += msek / 1000;
	if ( (t1.tv_nsec += (msek % 1000) * 1000000) >= 1000000000 )
	{
		t1.tv_sec++;
		t1.tv_nsec -= 1000000000;
	}
	return t1;
}

static inline timespec operator+( const timespec &t1, const long msek )
{
	timespec tmp = t1;
	tmp += msek;
	return tmp;
}

/* milliseconds left until deadline, 0 when it has passed */
static inline long timeout_msec( const timespec &deadline, const timespec &now )
{
	if (deadline <= now)
		return 0;
	timespec diff = deadline - now;
	return diff.tv_sec * 1000 + diff.tv_nsec / 1000000;
}

static inline timespec monotonicNow()
{
	timespec now;
	clock_gettime(CLOCK_MONOTONIC, &now);
	return now;
}

/**
 * \brief Gives a callback when data on a file descriptor is ready.
 *
 * This class emits the signal \c eSocketNotifier::activated whenever the
 * event specified by \c req is available.
 */
class eSocketNotifier: public iObject
{
	DECLARE_REF(eSocketNotifier);
	friend class eMainloop;
public:
	enum { Read=POLLIN, Write=POLLOUT, Priority=POLLPRI, Error=POLLERR, Hungup=POLLHUP };
private:
	eMainloop &context;
	int fd;
	int state;
	int requested;

	void activate(int what) { /*emit*/ activated(what); }
	eSocketNotifier(eMainloop *context, int fd, int req, bool startnow);
public:
	/**
	 * \brief Constructs a eSocketNotifier.
	 * \param context The thread where to bind the socketnotifier to. The signal is emitted from that thread.
	 * \param fd The filedescriptor to monitor.
	 * \param req The events to watch to, normally either \c Read or \c Write.
	 * \param startnow Specifies if the socketnotifier should start immediately.
	 */
	static eSocketNotifier* create(eMainloop *context, int fd, int req, bool startnow=true) { return new eSocketNotifier(context, fd, req, startnow); }
	~eSocketNotifier();

	sigc::signal<void(int)> activated;

	void start();
	void stop();
	bool isRunning() const { return state != 0; }

	int getFD() const { return fd; }
	int getRequested() const { return requested; }
};

class eMainloop
{
	friend class eSocketNotifier;

	std::map<int, eSocketNotifier*> notifiers;
	bool app_quit_now;
	int retval;
	eSocketNotifier *m_inActivate;

	int processOneEvent(long timeout);
	void addSocketNotifier(eSocketNotifier *sn);
	void removeSocketNotifier(eSocketNotifier *sn);
public:
	eMainloop()
		:app_quit_now(false), retval(0), m_inActivate(0)
	{
	}
	virtual ~eMainloop();

	void quit(int ret=0); // leave all pending loops

		/* a user supplied timeout in ms. iterate will return with:
		  0 - at least one event was handled, or quit was requested
		  1 - timeout
		  2 - signal
		*/
	int iterate(unsigned int timeout=0);

		/* run will iterate endlessly until the app is quit, and return
		   the exit code */
	int runLoop();
	bool isQuitting() const { return app_quit_now; }
	void reset();
};

/**
 * \brief The application class.
 *
 * An application provides a mainloop, and runs in the primary thread.
 */
class eApplication: public eMainloop
{
public:
	eApplication()
	{
		if (!eApp)
			eApp = this;
	}
	~eApplication()
	{
		if (eApp == this)
			eApp = 0;
	}
};

#endif
