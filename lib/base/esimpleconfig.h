#ifndef __lib_esimpleconfig_h_
#define __lib_esimpleconfig_h_

#include <string>
#include <vector>

// Simple key=value settings reader, safe to use from worker threads.
// The file is re-read whenever its modification time changes.
namespace eSimpleConfig
{
	void setFile(const std::string &file);
	std::string getFile();
	std::string getString(const char *key, const char* defaultvalue = "");
	int getInt(const char *key, int defaultvalue = 0);
	bool getBool(const char *key, bool defaultvalue = true);
	/* distinct names of the next key component below prefix,
	   e.g. prefix "config.profiles." yields every profile name */
	std::vector<std::string> getSubKeys(const std::string &prefix);
}

#endif // __lib_esimpleconfig_h_
