#ifndef __lib_sync_syncworker_h
#define __lib_sync_syncworker_h

#include <set>
#include <string>
#include <vector>
#include <lib/base/ebase.h>
#include <lib/base/elock.h>
#include <lib/base/message.h>
#include <lib/base/thread.h>
#include <lib/sync/orchestrator.h>

/*
 * runs one sync per profile in a background thread. events are
 * marshalled to the mainloop given on construction and emitted there
 * through the event signal, Done always comes last.
 */
class eSyncWorker: private eThread, public sigc::trackable
{
	eSyncProfile m_profile;
	ePtr<iSyncConnector> m_connector;
	eSyncOrchestrator::Operation m_op;
	eSyncType m_type;
	std::vector<std::string> m_filter;
	int m_cancelfd;
	bool m_running;
	eFixedMessagePump<eSyncEvent> m_messages;

	static std::set<std::string> m_active;
	static eSingleLock m_activeLock;

	void thread();
	void post(const eSyncEvent &event);
	void gotEvent(const eSyncEvent &ev);
	void release();
public:
	eSyncWorker(eMainloop *context, const eSyncProfile &profile, iSyncConnector *connector);
	~eSyncWorker();

		/* -EBUSY while a sync for the same profile runs anywhere */
	RESULT start(eSyncOrchestrator::Operation op, eSyncType type, const std::vector<std::string> &filter = std::vector<std::string>());
		/* takes effect at the next step boundary */
	void cancel();
		/* writing a non zero count cancels too, usable from a signal handler */
	int getCancelFd() const { return m_cancelfd; }
	bool isRunning() const { return m_running; }

	static bool isActive(const std::string &profile);

	sigc::signal<void(const eSyncEvent&)> event;
};

#endif
