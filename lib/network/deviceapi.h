#ifndef __lib_network_deviceapi_h
#define __lib_network_deviceapi_h

#include <map>
#include <string>
#include <vector>
#include <lib/base/object.h>

struct eDeviceApiResult
{
	typedef std::map<std::string, std::string> values_t;

	int error;		/* 0, or -1 with reason set */
	std::string reason;
	values_t values;		/* tag name -> text */
	std::vector<values_t> list;	/* event, timer and player lists */
	std::string data;		/* playlist or screenshot payload */

	eDeviceApiResult(): error(0) { }
	void clear();
	std::string get(const std::string &tag, const std::string &defaultvalue = "") const;
};

/* the receiver's web interface, every request is a fixed path below /web/ */
class iDeviceApi: public iObject
{
public:
	enum Request
	{
		ZAP,
		INFO,
		SIGNAL,
		STREAM,
		STREAM_CURRENT,
		CURRENT,
		POWER_STATE,
		TOKEN,
		PLAY,
		PLAYER_LIST,
		PLAYER_PLAY,
		PLAYER_NEXT,
		PLAYER_PREV,
		PLAYER_STOP,
		PLAYER_REMOVE,
		POWER,
		REMOTE,
		VOL,
		EPG,
		TIMER,
		TIMER_LIST,
		TIMER_ADD,
		TIMER_CHANGE,
		GRUB,
		MESSAGE,
		SERVICELIST_RELOAD
	};

	enum RemoteKey
	{
		keyUp = 103,
		keyLeft = 105,
		keyRight = 106,
		keyDown = 108,
		keyMenu = 139,
		keyExit = 174,
		keyOk = 352,
		keyRed = 398,
		keyGreen = 399,
		keyYellow = 400,
		keyBlue = 401
	};

	enum PowerState
	{
		powerToggleStandby = 0,
		powerDeepStandby = 1,
		powerReboot = 2,
		powerRestartGui = 3,
		powerWakeup = 4,
		powerStandby = 5
	};

	enum ReloadMode
	{
		reloadAll = 0,
		reloadLamedb = 1,
		reloadBouquets = 2
	};

		/* params is appended to the request path as is */
	virtual RESULT send(Request req, const std::string &params, eDeviceApiResult &result)=0;

		/* on screen info message */
	RESULT sendMessage(const std::string &text, eDeviceApiResult &result);
	RESULT sendKey(RemoteKey key, eDeviceApiResult &result);
	RESULT setPowerState(PowerState state, eDeviceApiResult &result);
	RESULT reloadServicelist(ReloadMode mode, eDeviceApiResult &result);
};

class eDeviceApi: public iDeviceApi
{
	DECLARE_REF(eDeviceApi);
	std::string m_base;
	std::string m_user;
	std::string m_password;
	int m_timeout;
	std::string m_token;
	bool m_authenticate;
protected:
	/*
	 * one POST request. returns 0 when a response arrived, http_code
	 * holds its status. transport errors return -errno with the
	 * reason in response.
	 */
	virtual RESULT performRequest(const std::string &url, const std::string &body, bool authenticate, long &http_code, std::string &response);
public:
	/* timeout in seconds */
	eDeviceApi(const std::string &host, int port, bool useSsl, const std::string &user, const std::string &password, int timeout = 10);

	static const char *getPath(Request req);
	static std::string getBaseUrl(const std::string &host, int port, bool useSsl);
	/* dispatches the payload by the request it answers */
	static RESULT parseResponse(Request req, const std::string &response, eDeviceApiResult &result);

	const std::string &getToken() const { return m_token; }

	RESULT send(Request req, const std::string &params, eDeviceApiResult &result);
};

#endif
