#include <errno.h>
#include <string.h>

#include <lib/base/eerror.h>
#include <lib/base/estring.h>
#include <lib/network/deviceapi.h>
#include <lib/network/ftpclient.h>
#include <lib/network/telnet.h>
#include <lib/sync/conntest.h>

RESULT testFtpConnection(const eSyncProfile &profile, std::string &message)
{
	ePtr<iFtpSession> session;
	std::string reply;
	RESULT res = eFtpSession::connect(profile.host, profile.ftp_port, profile.telnet_timeout, session, reply);
	if (res)
	{
		message = reply.empty() ? strerror(-res) : reply;
		return res;
	}
	res = session->login(profile.user, profile.password, reply);
	if (res)
	{
		session->quit();
		message = reply;
		return res;
	}
	message = session->getWelcome();
	session->quit();
	eDebug("[testFtpConnection] %s: %s", profile.host.c_str(), message.c_str());
	return 0;
}

RESULT testTelnetConnection(const eSyncProfile &profile, std::string &message, int cancelfd)
{
	std::string banner;
	RESULT res = eTelnetControl::test(profile.host, profile.telnet_port, profile.user, profile.password,
		profile.telnet_timeout, banner, cancelfd);
	message = strip(banner);
	if (res && message.empty())
		message = strerror(-res);
	eDebug("[testTelnetConnection] %s: %d %s", profile.host.c_str(), res, message.c_str());
	return res;
}

RESULT testHttpConnection(const eSyncProfile &profile, std::string &message)
{
	ePtr<iDeviceApi> api = new eDeviceApi(profile.host, profile.http_port, profile.http_use_ssl, profile.user, profile.password);
	eDeviceApiResult result;
	RESULT res = api->send(iDeviceApi::INFO, "", result);
	if (res)
	{
		message = result.reason.empty() ? strerror(-res) : result.reason;
		return res;
	}

	std::string model = result.get("e2model");
	if (model.empty())
		model = result.get("e2brand", "unknown receiver");
	message = "Connection successful. " + model;
	std::string image = result.get("e2imageversion");
	if (!image.empty())
		message += ", image " + image;
	std::string webif = result.get("e2webifversion");
	if (!webif.empty())
		message += ", web interface " + webif;
	return 0;
}
