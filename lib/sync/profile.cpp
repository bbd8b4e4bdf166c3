#include <errno.h>
#include <stdlib.h>
#include <algorithm>

#include <lib/base/eerror.h>
#include <lib/base/esimpleconfig.h>
#include <lib/base/estring.h>
#include <lib/sync/profile.h>

static std::string withSlash(const std::string &path)
{
	if (path.empty() || path[path.size() - 1] == '/')
		return path;
	return path + "/";
}

static std::string homePath(const char *sub)
{
	const char *home = getenv("HOME");
	return std::string(home ? home : ".") + "/e2sync/" + sub + "/";
}

eSyncProfile::eSyncProfile()
	:name("default"), host("127.0.0.1"), user("root"),
	ftp_port(21), telnet_port(23), http_port(80), http_use_ssl(false),
	telnet_timeout(5), control(controlTelnet),
	http_notify_delay(5000), http_standby_delay(2000),
	services_path("/etc/enigma2/"), satellites_path("/etc/tuxbox/"), picons_path("/usr/share/enigma2/picon/"),
	data_path(homePath("data")), picons_local_path(homePath("picons")), backup_path(homePath("backup")),
	remove_unused_bouquets(false)
{
}

std::string eSyncProfile::getLocalDataPath() const
{
	return withSlash(data_path) + name + "/";
}

std::string eSyncProfile::getLocalPiconPath() const
{
	return withSlash(picons_local_path) + name + "/";
}

std::vector<std::string> eSyncProfile::getProfiles()
{
	return eSimpleConfig::getSubKeys("config.profiles.");
}

std::string eSyncProfile::getDefaultProfile()
{
	return eSimpleConfig::getString("config.profile", "default");
}

RESULT eSyncProfile::load(const std::string &name, eSyncProfile &profile)
{
	std::vector<std::string> profiles = getProfiles();
	if (name != "default" && std::find(profiles.begin(), profiles.end(), name) == profiles.end())
	{
		eWarning("[eSyncProfile] no profile '%s' in %s", name.c_str(), eSimpleConfig::getFile().c_str());
		return -ENOENT;
	}

	eSyncProfile defaults;
	std::string prefix = "config.profiles." + name + ".";
#define KEY(x) (prefix + x).c_str()
	profile.name = name;
	profile.host = eSimpleConfig::getString(KEY("host"), defaults.host.c_str());
	profile.user = eSimpleConfig::getString(KEY("user"), defaults.user.c_str());
	profile.password = eSimpleConfig::getString(KEY("password"), "");
	profile.ftp_port = eSimpleConfig::getInt(KEY("ftp_port"), defaults.ftp_port);
	profile.telnet_port = eSimpleConfig::getInt(KEY("telnet_port"), defaults.telnet_port);
	profile.http_port = eSimpleConfig::getInt(KEY("http_port"), defaults.http_port);
	profile.http_use_ssl = eSimpleConfig::getBool(KEY("http_use_ssl"), defaults.http_use_ssl);
	profile.telnet_timeout = eSimpleConfig::getInt(KEY("telnet_timeout"), defaults.telnet_timeout);
	profile.control = strcasecmp(eSimpleConfig::getString(KEY("control"), "telnet"), std::string("http")) ? controlTelnet : controlHttp;
	profile.http_notify_delay = eSimpleConfig::getInt(KEY("http_notify_delay"), defaults.http_notify_delay);
	profile.http_standby_delay = eSimpleConfig::getInt(KEY("http_standby_delay"), defaults.http_standby_delay);
	profile.services_path = withSlash(eSimpleConfig::getString(KEY("services_path"), defaults.services_path.c_str()));
	profile.satellites_path = withSlash(eSimpleConfig::getString(KEY("satellites_path"), defaults.satellites_path.c_str()));
	profile.picons_path = withSlash(eSimpleConfig::getString(KEY("picons_path"), defaults.picons_path.c_str()));
	profile.data_path = withSlash(eSimpleConfig::getString(KEY("data_path"), defaults.data_path.c_str()));
	profile.picons_local_path = withSlash(eSimpleConfig::getString(KEY("picons_local_path"), defaults.picons_local_path.c_str()));
	profile.backup_path = withSlash(eSimpleConfig::getString(KEY("backup_path"), defaults.backup_path.c_str()));
	profile.remove_unused_bouquets = eSimpleConfig::getBool(KEY("remove_unused_bouquets"), defaults.remove_unused_bouquets);
#undef KEY

	if (profile.telnet_timeout < 0)
		profile.telnet_timeout = defaults.telnet_timeout;
	eDebug("[eSyncProfile] loaded profile %s (%s, control %s)", name.c_str(), profile.host.c_str(),
		profile.control == controlHttp ? "http" : "telnet");
	return 0;
}
