#include <errno.h>
#include <string.h>

#include <lib/base/cfile.h>
#include <lib/base/eerror.h>
#include <lib/base/estring.h>
#include <lib/base/wrappers.h>
#include <lib/dvb/satxml.h>
#include <lib/sync/orchestrator.h>

DEFINE_REF(eSyncConnector);

RESULT eSyncConnector::openFtp(const eSyncProfile &profile, ePtr<iFtpSession> &session, std::string &reply)
{
	ePtr<iFtpSession> s;
	RESULT res = eFtpSession::connect(profile.host, profile.ftp_port, ftpTimeout, s, reply);
	if (res)
		return res;
	res = s->login(profile.user, profile.password, reply);
	if (res)
	{
		eWarning("[eSyncConnector] ftp login to %s failed: %s", profile.host.c_str(), reply.c_str());
		s->quit();
		return res;
	}
	session = s;
	return 0;
}

RESULT eSyncConnector::createControl(const eSyncProfile &profile, int cancelfd, ePtr<iControlChannel> &control)
{
	control = new eTelnetControl(profile.host, profile.telnet_port, profile.user, profile.password, profile.telnet_timeout, cancelfd);
	return 0;
}

RESULT eSyncConnector::createDeviceApi(const eSyncProfile &profile, ePtr<iDeviceApi> &api)
{
	api = new eDeviceApi(profile.host, profile.http_port, profile.http_use_ssl, profile.user, profile.password);
	return 0;
}

eSyncOrchestrator::eSyncOrchestrator(const eSyncProfile &profile, iSyncConnector *connector, const EventSlot &events)
	:m_profile(profile), m_connector(connector), m_events(events), m_cancelfd(-1)
{
}

const char *eSyncOrchestrator::getNotifyMessage(eSyncType type)
{
	switch (type)
	{
	case syncBouquets: return "User bouquets will be updated!";
	case syncAll: return "All user data will be reloaded!";
	case syncSatellites: return "Satellites.xml file will be updated!";
	case syncPicons: return "Picons will be updated!";
	default: return "";
	}
}

void eSyncOrchestrator::progress(const std::string &message)
{
	m_lastStatus = message;
	if (!m_events.empty())
		m_events(eSyncEvent::progress(message));
	else
		eLog(lvlInfo, "[eSyncOrchestrator] %s", message.c_str());
}

RESULT eSyncOrchestrator::fail(RESULT res, const std::string &reason)
{
	/* the first failure is the one to report */
	if (m_error.empty())
		m_error = reason;
	return res;
}

bool eSyncOrchestrator::isCancelled() const
{
	return m_cancelfd >= 0 && waitReadable(m_cancelfd, -1, 0) > 0;
}

RESULT eSyncOrchestrator::delay(int msec)
{
	if (msec <= 0)
		return 0;
	int ret = waitReadable(-1, m_cancelfd, msec);
	if (ret == -ECANCELED)
		return fail(ret, "Cancelled");
	return ret < 0 ? fail(ret, strerror(-ret)) : 0;
}

RESULT eSyncOrchestrator::run(Operation op, eSyncType type, const std::vector<std::string> &filter)
{
	m_error.clear();
	m_lastStatus.clear();

	RESULT res;
	switch (op)
	{
	case opDownload:
		res = download(type, filter);
		break;
	case opUpload:
		res = upload(type, filter);
		break;
	case opRemovePicons:
		res = removePicons(filter);
		break;
	default:
		res = fail(-EINVAL, "unknown operation");
		break;
	}

	if (res)
	{
		std::string reason = m_error.empty() ? strerror(-res) : m_error;
		eWarning("[eSyncOrchestrator] %s of %s failed: %s", op == opDownload ? "download" : op == opUpload ? "upload" : "picon removal",
			getSyncTypeName(type), reason.c_str());
		if (!m_events.empty())
			m_events(eSyncEvent::error(res, reason));
	}
	return res;
}

RESULT eSyncOrchestrator::openFtp(ePtr<iFtpSession> &session)
{
	std::string reply;
	RESULT res = m_connector->openFtp(m_profile, session, reply);
	if (res)
		return fail(res, "FTP: " + reply);
	progress("FTP OK.");
	return 0;
}

RESULT eSyncOrchestrator::download(eSyncType type, const std::vector<std::string> &filter)
{
	if (type == syncEpg)
	{
		eWarning("[eSyncOrchestrator] Not implemented yet!");
		return fail(-ENOSYS, "Not implemented yet!");
	}

	ePtr<iFtpSession> session;
	RESULT res = openFtp(session);
	if (res)
		return res;
	eFtpClient ftp(session, sigc::mem_fun(*this, &eSyncOrchestrator::progress));

	std::string savePath = m_profile.getLocalDataPath();
	std::string reply;
	res = CFile::makeDirs(savePath);
	if (res)
		fail(res, "Can't create " + savePath + ": " + strerror(-res));

	if (!res && (type == syncAll || type == syncBouquets))
	{
		res = session->cwd(m_profile.services_path, reply);
		if (res)
			fail(res, reply);
		else
		{
			std::vector<std::string> files = eFtpClient::bouquetSuffixes;
			if (type == syncAll)
				files.insert(files.end(), eFtpClient::dataFiles.begin(), eFtpClient::dataFiles.end());
			res = ftp.downloadFiles(savePath, files);
		}
	}

	if (!res && isCancelled())
		res = fail(-ECANCELED, "Cancelled");

	if (!res && (type == syncAll || type == syncSatellites))
		res = ftp.downloadXml(savePath, m_profile.satellites_path, eFtpClient::xmlFiles);

	if (!res && type == syncPicons)
		res = ftp.downloadPicons(m_profile.picons_path, m_profile.getLocalPiconPath(), filter);

	session->quit();
	if (res)
		return fail(res, m_lastStatus);

	progress("Done.");
	return 0;
}

RESULT eSyncOrchestrator::checkSatellites()
{
	std::string file = m_profile.getLocalDataPath() + "satellites.xml";
	if (!CFile::exists(file))
		return 0;

	std::vector<eSatellite> satellites;
	RESULT res = eSatellitesXml::load(file, satellites);
	if (res)
		return fail(res, "can't parse " + file);

	int invalid = 0;
	for (std::vector<eSatellite>::const_iterator sat = satellites.begin(); sat != satellites.end(); ++sat)
	{
		for (std::vector<eSatelliteTransponder>::const_iterator tp = sat->transponders.begin(); tp != sat->transponders.end(); ++tp)
		{
			if (!eSatellitesXml::isTransponderValid(*tp))
			{
				eWarning("[eSyncOrchestrator] invalid transponder %s on %s", tp->frequency.c_str(), sat->name.c_str());
				++invalid;
			}
		}
	}
	if (invalid)
		return fail(-EINVAL, getNum(invalid) + " invalid transponders in satellites.xml");
	return 0;
}

RESULT eSyncOrchestrator::notify(iDeviceApi *api, eSyncType type)
{
	eDeviceApiResult result;
	progress("Sending info message...");
	RESULT res = api->sendMessage(getNotifyMessage(type), result);
	if (res)
		return fail(res, "HTTP: " + result.reason);

	if (type == syncAll)
	{
		res = delay(m_profile.http_notify_delay);
		if (res)
			return res;
		progress("Toggle Standby");
		res = api->setPowerState(iDeviceApi::powerToggleStandby, result);
		if (res)
			return fail(res, "HTTP: " + result.reason);
		res = delay(m_profile.http_standby_delay);
	}
	return res;
}

RESULT eSyncOrchestrator::reload(iDeviceApi *api, eSyncType type)
{
	eDeviceApiResult result;
	RESULT res = 0;
	if (type == syncBouquets)
	{
		progress("Reloading Userbouquets.");
		res = api->reloadServicelist(iDeviceApi::reloadBouquets, result);
	}
	else if (type == syncAll)
	{
		progress("Reloading lamedb and Userbouquets.");
		res = api->reloadServicelist(iDeviceApi::reloadAll, result);
		if (!res)
		{
			progress("Wakeup from Standby.");
			res = api->setPowerState(iDeviceApi::powerWakeup, result);
		}
	}
	if (res)
		return fail(res, "HTTP: " + result.reason);
	return 0;
}

RESULT eSyncOrchestrator::transfer(eSyncType type, const std::vector<std::string> &filter)
{
	ePtr<iFtpSession> session;
	RESULT res = openFtp(session);
	if (res)
		return res;
	eFtpClient ftp(session, sigc::mem_fun(*this, &eSyncOrchestrator::progress));

	std::string dataPath = m_profile.getLocalDataPath();
	std::string reply;
	switch (type)
	{
	case syncSatellites:
		res = ftp.uploadXml(dataPath, m_profile.satellites_path, eFtpClient::xmlFiles);
		break;
	case syncBouquets:
		res = session->cwd(m_profile.services_path, reply);
		if (res)
			fail(res, reply);
		else
			res = ftp.uploadBouquets(dataPath, m_profile.remove_unused_bouquets);
		break;
	case syncAll:
		res = ftp.uploadXml(dataPath, m_profile.satellites_path, eFtpClient::xmlFiles);
		if (!res)
		{
			res = session->cwd(m_profile.services_path, reply);
			if (res)
				fail(res, reply);
		}
		if (!res)
			res = ftp.uploadBouquets(dataPath, m_profile.remove_unused_bouquets);
		if (!res)
			res = ftp.uploadFiles(dataPath, eFtpClient::dataFiles);
		break;
	case syncPicons:
		res = ftp.uploadPicons(m_profile.getLocalPiconPath(), m_profile.picons_path, filter);
		break;
	default:
		res = fail(-EINVAL, "nothing to upload");
		break;
	}

	session->quit();
	if (res)
		return fail(res, m_lastStatus);
	return 0;
}

RESULT eSyncOrchestrator::upload(eSyncType type, const std::vector<std::string> &filter)
{
	if (type == syncEpg)
	{
		eWarning("[eSyncOrchestrator] Not implemented yet!");
		return fail(-ENOSYS, "Not implemented yet!");
	}

	RESULT res = 0;
	if (type == syncAll || type == syncSatellites)
	{
		res = checkSatellites();
		if (res)
			return res;
	}

	ePtr<iControlChannel> control;
	ePtr<iDeviceApi> api;
	bool stopped = false;

	if (m_profile.control == eSyncProfile::controlHttp)
	{
		res = m_connector->createDeviceApi(m_profile, api);
		if (res)
			return fail(res, "HTTP: can't create client");
		res = notify(api, type);
	}
	else if (type != syncPicons)
	{
		res = m_connector->createControl(m_profile, m_cancelfd, control);
		if (res)
			return fail(res, "Telnet: can't create client");
		progress("Telnet initialization ...");
		res = control->open();
		if (res)
			fail(res, std::string("Telnet: ") + strerror(-res));
		else
		{
			res = control->stopService();
			if (res)
				fail(res, std::string("Telnet: ") + strerror(-res));
			else
			{
				stopped = true;
				progress("Stopping GUI...");
			}
		}
	}

	if (!res && isCancelled())
		res = fail(-ECANCELED, "Cancelled");

	if (!res)
		res = transfer(type, filter);

	if (control)
	{
		/* resume only after every store and delete went through */
		if (stopped && !res)
		{
			res = control->resumeService();
			if (res)
				fail(res, std::string("Telnet: ") + strerror(-res));
			else
				progress("Starting...");
		}
		control->close();
	}
	else if (api && !res)
		res = reload(api, type);

	if (!res)
		progress("Done.");
	return res;
}

RESULT eSyncOrchestrator::removePicons(const std::vector<std::string> &filter)
{
	ePtr<iFtpSession> session;
	RESULT res = openFtp(session);
	if (res)
		return res;

	eFtpClient ftp(session, sigc::mem_fun(*this, &eSyncOrchestrator::progress));
	res = ftp.deletePicons(m_profile.picons_path, filter);
	session->quit();
	if (res)
		return fail(res, m_lastStatus);

	progress("Done.");
	return 0;
}
