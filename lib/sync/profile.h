#ifndef __lib_sync_profile_h
#define __lib_sync_profile_h

#include <string>
#include <vector>
#include <lib/base/object.h>

/* connection and path settings of one receiver */
struct eSyncProfile
{
	enum ControlSurface { controlTelnet, controlHttp };

	std::string name;
	std::string host;
	std::string user;
	std::string password;
	int ftp_port;
	int telnet_port;
	int http_port;
	bool http_use_ssl;
	int telnet_timeout;		/* seconds */
	ControlSurface control;
	int http_notify_delay;		/* ms between the info message and standby */
	int http_standby_delay;		/* ms after entering standby */

		/* on the receiver */
	std::string services_path;
	std::string satellites_path;
	std::string picons_path;
		/* local, below these a directory per profile is used */
	std::string data_path;
	std::string picons_local_path;
	std::string backup_path;
	bool remove_unused_bouquets;

	eSyncProfile();

	/* local copy of this receiver's configuration files */
	std::string getLocalDataPath() const;
	std::string getLocalPiconPath() const;

	/* reads config.profiles.<name>.<key>, -ENOENT when there is no such profile */
	static RESULT load(const std::string &name, eSyncProfile &profile);
	static std::vector<std::string> getProfiles();
	/* config.profile, "default" when unset */
	static std::string getDefaultProfile();
};

#endif
