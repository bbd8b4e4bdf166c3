#ifndef __lib_sync_orchestrator_h
#define __lib_sync_orchestrator_h

#include <string>
#include <vector>
#include <lib/base/object.h>
#include <lib/network/deviceapi.h>
#include <lib/network/ftpclient.h>
#include <lib/network/telnet.h>
#include <lib/sync/profile.h>
#include <lib/sync/syncevent.h>
#include <libsig_comp.h>

/* opens the three protocol sessions of a profile */
class iSyncConnector: public iObject
{
public:
		/* connected and logged in, reply holds the greeting or the failure */
	virtual RESULT openFtp(const eSyncProfile &profile, ePtr<iFtpSession> &session, std::string &reply)=0;
		/* not yet opened */
	virtual RESULT createControl(const eSyncProfile &profile, int cancelfd, ePtr<iControlChannel> &control)=0;
	virtual RESULT createDeviceApi(const eSyncProfile &profile, ePtr<iDeviceApi> &api)=0;
};

class eSyncConnector: public iSyncConnector
{
	DECLARE_REF(eSyncConnector);
public:
	enum { ftpTimeout = 30 };
	RESULT openFtp(const eSyncProfile &profile, ePtr<iFtpSession> &session, std::string &reply);
	RESULT createControl(const eSyncProfile &profile, int cancelfd, ePtr<iControlChannel> &control);
	RESULT createDeviceApi(const eSyncProfile &profile, ePtr<iDeviceApi> &api);
};

/*
 * sequences transfer client, control channel and device api into one
 * download or upload. runs blocking, all status goes through the event
 * slot. a failing step ends the sync, the control channel is closed in
 * any case.
 */
class eSyncOrchestrator
{
public:
	enum Operation { opDownload, opUpload, opRemovePicons };
	typedef sigc::slot<void(const eSyncEvent&)> EventSlot;

	eSyncOrchestrator(const eSyncProfile &profile, iSyncConnector *connector, const EventSlot &events = EventSlot());

	void setCancelFd(int fd) { m_cancelfd = fd; }

		/* runs op and reports a failure as Error event, Done is left to the caller */
	RESULT run(Operation op, eSyncType type, const std::vector<std::string> &filter);

	RESULT download(eSyncType type, const std::vector<std::string> &filter);
	RESULT upload(eSyncType type, const std::vector<std::string> &filter);
	RESULT removePicons(const std::vector<std::string> &filter);

	const std::string &getError() const { return m_error; }
	static const char *getNotifyMessage(eSyncType type);
private:
	eSyncProfile m_profile;
	ePtr<iSyncConnector> m_connector;
	EventSlot m_events;
	int m_cancelfd;
	std::string m_error;
	std::string m_lastStatus;

	void progress(const std::string &message);
	RESULT fail(RESULT res, const std::string &reason);
	bool isCancelled() const;
	RESULT delay(int msec);
	RESULT openFtp(ePtr<iFtpSession> &session);
	RESULT checkSatellites();
	RESULT notify(iDeviceApi *api, eSyncType type);
	RESULT reload(iDeviceApi *api, eSyncType type);
	RESULT transfer(eSyncType type, const std::vector<std::string> &filter);
};

#endif
