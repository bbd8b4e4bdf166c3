#ifndef __tests_testutil_h
#define __tests_testutil_h

#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>

/* scratch directory, removed with everything below it */
class eTempDir
{
	std::string m_path;

	static int removeEntry(const char *path, const struct stat *, int, struct FTW *)
	{
		return ::remove(path);
	}
public:
	eTempDir()
	{
		char tmpl[] = "/tmp/e2sync-test-XXXXXX";
		const char *dir = mkdtemp(tmpl);
		m_path = std::string(dir ? dir : "/tmp") + "/";
	}
	~eTempDir()
	{
		if (m_path != "/tmp/")
			nftw(m_path.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
	}
	const std::string &path() const { return m_path; }
	std::string operator+(const std::string &name) const { return m_path + name; }
};

#endif
