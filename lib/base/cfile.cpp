#include <errno.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <lib/base/eerror.h>

#include "cfile.h"

std::string CFile::read(const std::string &filename)
{
	std::ifstream file(filename.c_str(), std::ios::binary);
	if (!file.good())
		return std::string();
	std::stringstream ss;
	ss << file.rdbuf();
	return ss.str();
}

int CFile::writeStr(const std::string &filename, const std::string &value)
{
	CFile f(filename, "wb");
	if (!f)
	{
		int err = errno;
		eDebug("[CFile] Error %d: Unable to open file '%s'!  (%m)", err, filename.c_str());
		return -err;
	}
	if (!value.empty() && fwrite(value.data(), 1, value.size(), f) != value.size())
	{
		int err = errno;
		eDebug("[CFile] Error %d: Unable to write to file '%s'!  (%m)", err, filename.c_str());
		return err ? -err : -EIO;
	}
	return 0;
}

bool CFile::exists(const std::string &filename)
{
	struct stat s = {};
	return stat(filename.c_str(), &s) == 0 && S_ISREG(s.st_mode);
}

bool CFile::isDirectory(const std::string &path)
{
	struct stat s = {};
	return stat(path.c_str(), &s) == 0 && S_ISDIR(s.st_mode);
}

int CFile::makeDirs(const std::string &path)
{
	std::string current;
	size_t pos = 0;
	while (pos != std::string::npos)
	{
		pos = path.find('/', pos + 1);
		current = path.substr(0, pos);
		if (current.empty() || isDirectory(current))
			continue;
		if (::mkdir(current.c_str(), 0755) < 0 && errno != EEXIST)
		{
			int err = errno;
			eDebug("[CFile] can't create directory '%s' (%m)", current.c_str());
			return -err;
		}
	}
	return 0;
}
