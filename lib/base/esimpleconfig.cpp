#include <cstdlib>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <strings.h>
#include <sys/stat.h>
#include <lib/base/eerror.h>
#include <lib/base/elock.h>
#include <lib/base/esimpleconfig.h>

namespace eSimpleConfig
{
	static std::map<std::string, std::string> configValues;
	static std::string configFile;
	static time_t lastModified = 0;
	static pthread_mutex_t configLock = PTHREAD_MUTEX_INITIALIZER;

	static std::string defaultFile()
	{
		const char *home = getenv("HOME");
		return std::string(home ? home : ".") + "/.config/e2sync/settings";
	}

	/* must be called with configLock held */
	static void load()
	{
		std::string file = configFile.empty() ? defaultFile() : configFile;

		struct stat settings_stat = {};
		if (stat(file.c_str(), &settings_stat) == -1 || settings_stat.st_mtime <= lastModified)
			return;

		std::ifstream in(file.c_str());
		if (!in.good())
			return;

		configValues.clear();
		std::string line;
		while (std::getline(in, line))
		{
			if (line.empty() || line[0] == '#')
				continue;
			if (line[line.size() - 1] == '\r')
				line.erase(line.size() - 1);

			auto equals = line.find_first_of('=');
			if (equals != std::string::npos)
				configValues[line.substr(0, equals)] = line.substr(equals + 1);
		}
		in.close();

		lastModified = settings_stat.st_mtime;
		eDebug("[eSimpleConfig] loaded %zu values from %s", configValues.size(), file.c_str());
	}

	void setFile(const std::string &file)
	{
		singleLock s(configLock);
		configFile = file;
		configValues.clear();
		lastModified = 0;
	}

	std::string getFile()
	{
		singleLock s(configLock);
		return configFile.empty() ? defaultFile() : configFile;
	}

	std::string getString(const char *key, const char* defaultvalue)
	{
		singleLock s(configLock);
		load();
		auto it = configValues.find(key);
		return it == configValues.end() ? std::string(defaultvalue) : it->second;
	}

	int getInt(const char *key, int defaultvalue)
	{
		singleLock s(configLock);
		load();
		auto it = configValues.find(key);
		return it == configValues.end() ? defaultvalue : atoi(it->second.c_str());
	}

	bool getBool(const char *key, bool defaultvalue)
	{
		singleLock s(configLock);
		load();
		auto it = configValues.find(key);
		if (it == configValues.end())
			return defaultvalue;

		if (strcasecmp(it->second.c_str(), "true") == 0)
			return true;
		if (strcasecmp(it->second.c_str(), "false") == 0)
			return false;
		return defaultvalue;
	}

	std::vector<std::string> getSubKeys(const std::string &prefix)
	{
		singleLock s(configLock);
		load();
		std::set<std::string> seen;
		std::vector<std::string> ret;
		for (auto it = configValues.lower_bound(prefix); it != configValues.end(); ++it)
		{
			if (it->first.compare(0, prefix.size(), prefix) != 0)
				break;
			std::string rest = it->first.substr(prefix.size());
			std::string name = rest.substr(0, rest.find('.'));
			if (!name.empty() && seen.insert(name).second)
				ret.push_back(name);
		}
		return ret;
	}
}
