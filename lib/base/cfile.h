#ifndef __lib_base_cfile_h
#define __lib_base_cfile_h

#include <stdio.h>
#include <unistd.h>
#include <string>

/* Wrapper around FILE to prevent leaks and to make your code a bit more OO */
struct CFile
{
	FILE *handle;
	CFile(const char *fileName, const char *mode)
		: handle(fopen(fileName, mode))
	{
	}
	CFile(const std::string &fileName, const char *mode)
		: handle(fopen(fileName.c_str(), mode))
	{
	}
	~CFile()
	{
		if (handle)
			fclose(handle);
	}
	void sync() { fflush(handle); fsync(fileno(handle)); }
	operator bool() const { return handle != NULL; }
	operator FILE *() const { return handle; }

	/* whole file as bytes, empty when it can't be read */
	static std::string read(const std::string &fileName);
	/* returns 0 on success, -errno otherwise */
	static int writeStr(const std::string &fileName, const std::string &value);
	static bool exists(const std::string &fileName);
	static bool isDirectory(const std::string &path);
	/* creates path and all missing parents */
	static int makeDirs(const std::string &path);
};

#endif
