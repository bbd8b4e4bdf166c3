#include <errno.h>
#include <stdint.h>
#include <unistd.h>
#include <exception>
#include <sys/eventfd.h>

#include <lib/base/eerror.h>
#include <lib/sync/syncworker.h>

std::set<std::string> eSyncWorker::m_active;
eSingleLock eSyncWorker::m_activeLock;

eSyncWorker::eSyncWorker(eMainloop *context, const eSyncProfile &profile, iSyncConnector *connector)
	:m_profile(profile), m_connector(connector), m_op(eSyncOrchestrator::opDownload), m_type(syncAll),
	m_cancelfd(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)), m_running(false),
	m_messages(context, "eSyncWorker")
{
	if (m_cancelfd < 0)
		eWarning("[eSyncWorker] couldn't create cancel event: %m");
	CONNECT(m_messages.recv_msg, eSyncWorker::gotEvent);
}

eSyncWorker::~eSyncWorker()
{
	if (m_running)
	{
		cancel();
		kill();
		release();
	}
	if (m_cancelfd >= 0)
		::close(m_cancelfd);
}

bool eSyncWorker::isActive(const std::string &profile)
{
	eSingleLocker lock(m_activeLock);
	return m_active.find(profile) != m_active.end();
}

void eSyncWorker::release()
{
	eSingleLocker lock(m_activeLock);
	m_active.erase(m_profile.name);
	m_running = false;
}

RESULT eSyncWorker::start(eSyncOrchestrator::Operation op, eSyncType type, const std::vector<std::string> &filter)
{
	{
		eSingleLocker lock(m_activeLock);
		if (m_running || m_active.find(m_profile.name) != m_active.end())
		{
			eWarning("[eSyncWorker] a sync for profile %s is already running", m_profile.name.c_str());
			return -EBUSY;
		}
		m_active.insert(m_profile.name);
		m_running = true;
	}

	/* drop a cancel request of a previous run */
	uint64_t data;
	if (m_cancelfd >= 0 && ::read(m_cancelfd, &data, sizeof(data)) < 0 && errno != EAGAIN)
		eWarning("[eSyncWorker] read cancel event: %m");

	m_op = op;
	m_type = type;
	m_filter = filter;
	if (runAsync())
	{
		release();
		return -EAGAIN;
	}
	eDebug("[eSyncWorker] started %s for profile %s", getSyncTypeName(type), m_profile.name.c_str());
	return 0;
}

void eSyncWorker::cancel()
{
	static const uint64_t data = 1;
	if (m_running && m_cancelfd >= 0 && ::write(m_cancelfd, &data, sizeof(data)) < 0)
		eWarning("[eSyncWorker] cancel: %m");
}

void eSyncWorker::post(const eSyncEvent &event)
{
	m_messages.send(event);
}

void eSyncWorker::thread()
{
	hasStarted();

	eSyncOrchestrator orchestrator(m_profile, m_connector, sigc::mem_fun(*this, &eSyncWorker::post));
	orchestrator.setCancelFd(m_cancelfd);

	RESULT res;
	try
	{
		res = orchestrator.run(m_op, m_type, m_filter);
	}
	catch (std::exception &e)
	{
		eWarning("[eSyncWorker] sync aborted: %s", e.what());
		res = -EIO;
		post(eSyncEvent::error(res, e.what()));
	}
	post(eSyncEvent::done(m_type, res));
}

void eSyncWorker::gotEvent(const eSyncEvent &ev)
{
	if (ev.type == eSyncEvent::Done)
	{
		kill();
		release();
		eDebug("[eSyncWorker] %s for profile %s finished (%d)", getSyncTypeName(ev.subset), m_profile.name.c_str(), ev.result);
	}
	/*emit*/ event(ev);
}
