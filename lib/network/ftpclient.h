#ifndef __lib_network_ftpclient_h
#define __lib_network_ftpclient_h

#include <string>
#include <vector>
#include <lib/base/object.h>
#include <libsig_comp.h>

/*
 * one logged in ftp control connection. every call returns 0 or a
 * negative errno and stores the server reply (e.g. "226 Transfer complete.")
 * in reply. only one command is outstanding at any time.
 */
class iFtpSession: public iObject
{
public:
	virtual RESULT login(const std::string &user, const std::string &password, std::string &reply)=0;
	virtual std::string getWelcome() const=0;
	virtual RESULT retrieve(const std::string &name, std::string &data, std::string &reply)=0;
	virtual RESULT store(const std::string &name, const std::string &data, std::string &reply)=0;
	virtual RESULT deleteFile(const std::string &name, std::string &reply)=0;
	virtual RESULT rmd(const std::string &path, std::string &reply)=0;
	virtual RESULT mkd(const std::string &path, std::string &reply)=0;
	virtual RESULT cwd(const std::string &path, std::string &reply)=0;
	virtual RESULT rename(const std::string &from, const std::string &to, std::string &reply)=0;
		/* name list of the current directory */
	virtual RESULT nlst(std::vector<std::string> &names, std::string &reply)=0;
		/* raw "ls -l" style lines of path */
	virtual RESULT list(const std::string &path, std::vector<std::string> &lines, std::string &reply)=0;
	virtual void quit()=0;
};

class eFtpSession: public iFtpSession
{
	DECLARE_REF(eFtpSession);
	std::string m_host;
	int m_fd;
	int m_timeout;
	std::string m_welcome;
	char *m_linebuf;
	size_t m_linebufsize;

	eFtpSession(const std::string &host, int fd, int timeout);
	int readReply(std::string &reply);
	int sendCommand(const std::string &command, std::string &reply);
	RESULT simpleCommand(const std::string &command, std::string &reply);
	RESULT openDataConnection(const std::string &command, int &datafd, std::string &reply);
	RESULT readLines(const std::string &command, std::vector<std::string> &lines, std::string &reply);
public:
	~eFtpSession();
		/* connects and reads the greeting, timeout in seconds */
	static RESULT connect(const std::string &host, int port, int timeout, ePtr<iFtpSession> &session, std::string &reply);
		/* maps a reply code to a RESULT, 1xx-3xx are 0 */
	static RESULT replyResult(int code);

	RESULT login(const std::string &user, const std::string &password, std::string &reply);
	std::string getWelcome() const { return m_welcome; }
	RESULT retrieve(const std::string &name, std::string &data, std::string &reply);
	RESULT store(const std::string &name, const std::string &data, std::string &reply);
	RESULT deleteFile(const std::string &name, std::string &reply);
	RESULT rmd(const std::string &path, std::string &reply);
	RESULT mkd(const std::string &path, std::string &reply);
	RESULT cwd(const std::string &path, std::string &reply);
	RESULT rename(const std::string &from, const std::string &to, std::string &reply);
	RESULT nlst(std::vector<std::string> &names, std::string &reply);
	RESULT list(const std::string &path, std::vector<std::string> &lines, std::string &reply);
	void quit();
};

/*
 * file and directory transfers on top of an iFtpSession. every
 * operation reports a status line through the status slot, or to the
 * debug log when no slot is connected.
 *
 * single files and explicit file sets stop at the first failing
 * transfer, directory mirrors and picon subsets skip failing entries.
 */
class eFtpClient
{
public:
	typedef sigc::slot<void(const std::string&)> StatusSlot;

	eFtpClient(iFtpSession *session, const StatusSlot &status = StatusSlot());

	iFtpSession *getSession() const { return m_session; }

	RESULT downloadFile(const std::string &name, const std::string &savePath, std::string &reply);
	RESULT uploadFile(const std::string &name, const std::string &path, std::string &reply);
	RESULT deleteFile(const std::string &name, std::string &reply);
	RESULT renameFile(const std::string &from, const std::string &to, std::string &reply);

	RESULT downloadDir(const std::string &path, const std::string &savePath, std::string &reply);
	RESULT uploadDir(const std::string &path, std::string &reply);
	RESULT deleteDir(const std::string &path, std::string &reply);

		/* every file of the current remote directory ending with one of suffixes */
	RESULT downloadFiles(const std::string &savePath, const std::vector<std::string> &suffixes);
	RESULT downloadXml(const std::string &savePath, const std::string &xmlPath, const std::vector<std::string> &files);
	RESULT uploadXml(const std::string &dataPath, const std::string &xmlPath, const std::vector<std::string> &files);
	RESULT uploadBouquets(const std::string &dataPath, bool removeUnused);
		/* every local file ending with one of suffixes, satellite descriptors excluded */
	RESULT uploadFiles(const std::string &dataPath, const std::vector<std::string> &suffixes);
	RESULT removeUnusedBouquets();

	RESULT downloadPicons(const std::string &src, const std::string &dest, const std::vector<std::string> &filter);
	RESULT uploadPicons(const std::string &src, const std::string &dest, const std::vector<std::string> &filter);
	RESULT deletePicons(const std::string &dest, const std::vector<std::string> &filter);

		/* exact membership in filter, or the picon image suffixes when filter is empty */
	static bool isPicon(const std::string &name, const std::vector<std::string> &filter);
	static bool hasSuffix(const std::string &name, const std::vector<std::string> &suffixes);
		/* name and type of one raw listing line, false for unusable lines */
	static bool parseListLine(const std::string &line, std::string &name, bool &isDirectory);
		/* sorted names of the regular files and directories below path */
	static RESULT listLocal(const std::string &path, std::vector<std::string> &files, std::vector<std::string> &dirs);

	static const std::vector<std::string> bouquetSuffixes;
	static const std::vector<std::string> dataFiles;
	static const std::vector<std::string> xmlFiles;
	static const std::vector<std::string> piconSuffixes;
private:
	ePtr<iFtpSession> m_session;
	StatusSlot m_status;

	void report(const std::string &message, bool failed = false);
};

#endif
