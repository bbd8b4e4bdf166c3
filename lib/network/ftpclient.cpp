#include <algorithm>
#include <dirent.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>

#include <lib/base/cfile.h>
#include <lib/base/eerror.h>
#include <lib/base/estring.h>
#include <lib/base/wrappers.h>
#include <lib/network/ftpclient.h>

DEFINE_REF(eFtpSession);

eFtpSession::eFtpSession(const std::string &host, int fd, int timeout)
	:m_host(host), m_fd(fd), m_timeout(timeout), m_linebufsize(1024)
{
	m_linebuf = (char*)malloc(m_linebufsize);
}

eFtpSession::~eFtpSession()
{
	if (m_fd >= 0)
		::close(m_fd);
	free(m_linebuf);
}

RESULT eFtpSession::connect(const std::string &host, int port, int timeout, ePtr<iFtpSession> &session, std::string &reply)
{
	int fd = Connect(host.c_str(), port, timeout);
	if (fd < 0)
	{
		eWarning("[eFtpSession] couldn't connect to %s:%d", host.c_str(), port);
		reply = "Connection refused";
		return -ECONNREFUSED;
	}

	ePtr<eFtpSession> s = new eFtpSession(host, fd, timeout);
	int code = s->readReply(reply);
	if (code < 0)
		return code;
	if (code != 220)
	{
		eWarning("[eFtpSession] unexpected greeting from %s: %s", host.c_str(), reply.c_str());
		RESULT res = replyResult(code);
		return res ? res : -EPROTO;
	}
	s->m_welcome = reply;
	session = s;
	return 0;
}

RESULT eFtpSession::replyResult(int code)
{
	if (code < 0)
		return code;
	if (code < 400)
		return 0;
	switch (code)
	{
	case 530:
		return -EACCES;
	case 550:
		return -ENOENT;
	default:
		return -EIO;
	}
}

int eFtpSession::readReply(std::string &reply)
{
	reply.clear();
	ssize_t len = readLine(m_fd, &m_linebuf, &m_linebufsize, m_timeout * 1000);
	if (len < 0)
	{
		reply = "Connection timed out";
		return -ETIMEDOUT;
	}
	std::string line(m_linebuf, len);
	reply = stripInvalidUTF8(line);
	if (line.size() < 3 || !isDigits(line.substr(0, 3)))
	{
		eWarning("[eFtpSession] malformed reply '%s'", reply.c_str());
		return -EPROTO;
	}

	if (line.size() > 3 && line[3] == '-')
	{
		/* multi line reply, ends with "<code> " */
		std::string code = line.substr(0, 3);
		while (1)
		{
			len = readLine(m_fd, &m_linebuf, &m_linebufsize, m_timeout * 1000);
			if (len < 0)
			{
				reply = "Connection timed out";
				return -ETIMEDOUT;
			}
			line.assign(m_linebuf, len);
			reply += "\n" + stripInvalidUTF8(line);
			if (line.size() >= 4 && line.compare(0, 3, code) == 0 && line[3] == ' ')
				break;
		}
	}
	return atoi(reply.substr(0, 3).c_str());
}

int eFtpSession::sendCommand(const std::string &command, std::string &reply)
{
	if (m_fd < 0)
	{
		reply = "Not connected";
		return -ENOTCONN;
	}
	eDebug("[eFtpSession] > %s", startsWith(command, "PASS ") ? "PASS ****" : command.c_str());
	std::string line = command + "\r\n";
	if (writeAll(m_fd, line.data(), line.size()) < 0)
	{
		reply = "Connection lost";
		return -EPIPE;
	}
	int code = readReply(reply);
	eDebug("[eFtpSession] < %s", reply.c_str());
	return code;
}

RESULT eFtpSession::simpleCommand(const std::string &command, std::string &reply)
{
	return replyResult(sendCommand(command, reply));
}

static RESULT readAll(int fd, std::string &data, int timeout)
{
	char buf[4096];
	while (1)
	{
		int ret = waitReadable(fd, -1, timeout);
		if (ret == 0)
			return -ETIMEDOUT;
		if (ret < 0)
			return ret;
		ssize_t r = singleRead(fd, buf, sizeof(buf));
		if (r < 0)
			return -EIO;
		if (r == 0)
			return 0;
		data.append(buf, r);
	}
}

RESULT eFtpSession::openDataConnection(const std::string &command, int &datafd, std::string &reply)
{
	std::string pasv;
	int port = -1;
	int code = sendCommand("PASV", pasv);
	if (code == 227)
	{
		unsigned int h1, h2, h3, h4, p1, p2;
		size_t pos = pasv.find('(');
		if (pos != std::string::npos &&
			sscanf(pasv.c_str() + pos + 1, "%u,%u,%u,%u,%u,%u", &h1, &h2, &h3, &h4, &p1, &p2) == 6)
			port = p1 * 256 + p2;
	}
	else if (code >= 0)
	{
		/* ipv6 servers only know the extended variant, "229 ... (|||port|)" */
		code = sendCommand("EPSV", pasv);
		size_t pos = pasv.find("|||");
		if (code == 229 && pos != std::string::npos)
			port = atoi(pasv.c_str() + pos + 3);
	}
	if (port <= 0)
	{
		reply = pasv;
		return code < 0 ? code : -EPROTO;
	}

	/* the address in the reply is ignored, servers behind NAT report their private one */
	datafd = Connect(m_host.c_str(), port, m_timeout);
	if (datafd < 0)
	{
		reply = "Can't open data connection";
		return -ECONNREFUSED;
	}

	code = sendCommand(command, reply);
	if (code < 100 || code >= 200)
	{
		::close(datafd);
		datafd = -1;
		RESULT res = replyResult(code);
		return res ? res : -EPROTO;
	}
	return 0;
}

RESULT eFtpSession::login(const std::string &user, const std::string &password, std::string &reply)
{
	int code = sendCommand("USER " + user, reply);
	if (code == 331)
		code = sendCommand("PASS " + password, reply);
	if (code == 230 || code == 202)
		return 0;
	RESULT res = replyResult(code);
	return res ? res : -EACCES;
}

RESULT eFtpSession::retrieve(const std::string &name, std::string &data, std::string &reply)
{
	RESULT res = simpleCommand("TYPE I", reply);
	if (res)
		return res;
	int datafd;
	res = openDataConnection("RETR " + name, datafd, reply);
	if (res)
		return res;

	data.clear();
	res = readAll(datafd, data, m_timeout * 1000);
	::close(datafd);
	int code = readReply(reply);
	if (res)
		return res;
	return replyResult(code);
}

RESULT eFtpSession::store(const std::string &name, const std::string &data, std::string &reply)
{
	RESULT res = simpleCommand("TYPE I", reply);
	if (res)
		return res;
	int datafd;
	res = openDataConnection("STOR " + name, datafd, reply);
	if (res)
		return res;

	if (writeAll(datafd, data.data(), data.size()) < 0)
		res = -EIO;
	::close(datafd);
	int code = readReply(reply);
	if (res)
		return res;
	return replyResult(code);
}

RESULT eFtpSession::readLines(const std::string &command, std::vector<std::string> &lines, std::string &reply)
{
	RESULT res = simpleCommand("TYPE A", reply);
	if (res)
		return res;
	int datafd;
	res = openDataConnection(command, datafd, reply);
	if (res)
		return res;

	std::string data;
	res = readAll(datafd, data, m_timeout * 1000);
	::close(datafd);
	int code = readReply(reply);
	if (res)
		return res;

	lines.clear();
	size_t start = 0;
	while (start < data.size())
	{
		size_t end = data.find('\n', start);
		if (end == std::string::npos)
			end = data.size();
		std::string line = data.substr(start, end - start);
		if (!line.empty() && line[line.size() - 1] == '\r')
			line.erase(line.size() - 1);
		/* names in a foreign encoding must not break the listing */
		line = stripInvalidUTF8(line);
		if (!line.empty())
			lines.push_back(line);
		start = end + 1;
	}
	return replyResult(code);
}

RESULT eFtpSession::deleteFile(const std::string &name, std::string &reply)
{
	return simpleCommand("DELE " + name, reply);
}

RESULT eFtpSession::rmd(const std::string &path, std::string &reply)
{
	return simpleCommand("RMD " + path, reply);
}

RESULT eFtpSession::mkd(const std::string &path, std::string &reply)
{
	return simpleCommand("MKD " + path, reply);
}

RESULT eFtpSession::cwd(const std::string &path, std::string &reply)
{
	return simpleCommand("CWD " + path, reply);
}

RESULT eFtpSession::rename(const std::string &from, const std::string &to, std::string &reply)
{
	int code = sendCommand("RNFR " + from, reply);
	if (code != 350)
	{
		RESULT res = replyResult(code);
		return res ? res : -EPROTO;
	}
	return simpleCommand("RNTO " + to, reply);
}

RESULT eFtpSession::nlst(std::vector<std::string> &names, std::string &reply)
{
	return readLines("NLST", names, reply);
}

RESULT eFtpSession::list(const std::string &path, std::vector<std::string> &lines, std::string &reply)
{
	return readLines(path.empty() ? "LIST" : "LIST " + path, lines, reply);
}

void eFtpSession::quit()
{
	if (m_fd < 0)
		return;
	std::string reply;
	if (sendCommand("QUIT", reply) < 0)
		eDebug("[eFtpSession] no reply to QUIT");
	::close(m_fd);
	m_fd = -1;
}

const std::vector<std::string> eFtpClient::bouquetSuffixes = { "tv", "radio" };
const std::vector<std::string> eFtpClient::dataFiles = { "lamedb", "lamedb5", "blacklist", "whitelist" };
const std::vector<std::string> eFtpClient::xmlFiles = { "satellites.xml", "terrestrial.xml", "cables.xml" };
const std::vector<std::string> eFtpClient::piconSuffixes = { ".jpg", ".png" };

static std::string withSlash(const std::string &path)
{
	if (path.empty() || path[path.size() - 1] == '/')
		return path;
	return path + "/";
}

eFtpClient::eFtpClient(iFtpSession *session, const StatusSlot &status)
	:m_session(session), m_status(status)
{
}

void eFtpClient::report(const std::string &message, bool failed)
{
	if (failed)
		eWarning("[eFtpClient] %s", message.c_str());
	if (!m_status.empty())
		m_status(message);
	else if (!failed)
		eLog(lvlInfo, "[eFtpClient] %s", message.c_str());
}

bool eFtpClient::hasSuffix(const std::string &name, const std::vector<std::string> &suffixes)
{
	for (std::vector<std::string>::const_iterator it = suffixes.begin(); it != suffixes.end(); ++it)
	{
		if (endsWith(name, *it))
			return true;
	}
	return false;
}

bool eFtpClient::isPicon(const std::string &name, const std::vector<std::string> &filter)
{
	if (filter.empty())
		return hasSuffix(name, piconSuffixes);
	return std::find(filter.begin(), filter.end(), name) != filter.end();
}

bool eFtpClient::parseListLine(const std::string &line, std::string &name, bool &isDirectory)
{
	/* drwxr-xr-x    2 root     root          4096 Jan  1 00:00 name with spaces */
	std::vector<std::string> fields;
	size_t pos = 0;
	while (pos < line.size())
	{
		size_t start = line.find_first_not_of(" \t", pos);
		if (start == std::string::npos)
			break;
		size_t end = line.find_first_of(" \t", start);
		if (end == std::string::npos)
			end = line.size();
		fields.push_back(line.substr(start, end - start));
		pos = end;
	}
	if (fields.size() < 9)
		return false;

	name = fields[8];
	for (size_t i = 9; i < fields.size(); ++i)
		name += " " + fields[i];
	if (name == "." || name == "..")
		return false;
	isDirectory = fields[0][0] == 'd';
	return true;
}

RESULT eFtpClient::listLocal(const std::string &path, std::vector<std::string> &files, std::vector<std::string> &dirs)
{
	DIR *d = opendir(path.c_str());
	if (!d)
		return -errno;

	while (dirent *e = readdir(d))
	{
		if (!(strcmp(e->d_name, ".") && strcmp(e->d_name, "..")))
			continue;
		std::string filename = withSlash(path) + e->d_name;
		struct stat s;
		if (::stat(filename.c_str(), &s) < 0)
			continue;
		if (S_ISDIR(s.st_mode))
			dirs.push_back(e->d_name);
		else if (S_ISREG(s.st_mode))
			files.push_back(e->d_name);
	}
	closedir(d);
	std::sort(files.begin(), files.end());
	std::sort(dirs.begin(), dirs.end());
	return 0;
}

RESULT eFtpClient::downloadFile(const std::string &name, const std::string &savePath, std::string &reply)
{
	std::string data;
	RESULT res = m_session->retrieve(name, data, reply);
	if (!res)
	{
		res = CFile::writeStr(withSlash(savePath) + name, data);
		if (res)
			reply = std::string("500 ") + strerror(-res);
	}
	report("Downloading file: " + name + ".   Status: " + reply, res != 0);
	return res;
}

RESULT eFtpClient::uploadFile(const std::string &name, const std::string &path, std::string &reply)
{
	std::string src = withSlash(path) + name;
	if (!CFile::exists(src))
	{
		eWarning("[eFtpClient] Uploading file: '%s'. File not found. Skipping.", src.c_str());
		reply = "500 File not found.";
		return 0;
	}

	RESULT res = m_session->store(name, CFile::read(src), reply);
	report("Uploading file: " + name + ".   Status: " + reply, res != 0);
	return res;
}

RESULT eFtpClient::deleteFile(const std::string &name, std::string &reply)
{
	RESULT res = m_session->deleteFile(name, reply);
	report("Deleting file: " + name + ".   Status: " + reply, res != 0);
	return res;
}

RESULT eFtpClient::renameFile(const std::string &from, const std::string &to, std::string &reply)
{
	RESULT res = m_session->rename(from, to, reply);
	report("File rename: " + from + ".   Status: " + reply, res != 0);
	return res;
}

RESULT eFtpClient::downloadDir(const std::string &path, const std::string &savePath, std::string &reply)
{
	RESULT res = CFile::makeDirs(withSlash(savePath) + path);
	if (res)
	{
		reply = std::string("500 Download dir error: ") + strerror(-res);
		eWarning("[eFtpClient] %s", reply.c_str());
		return res;
	}

	std::vector<std::string> lines;
	res = m_session->list(path, lines, reply);
	if (res)
	{
		report("Copy directory " + path + ".   Status: " + reply, true);
		return res;
	}

	for (std::vector<std::string>::const_iterator it = lines.begin(); it != lines.end(); ++it)
	{
		std::string name, r;
		bool dir;
		if (!parseListLine(*it, name, dir))
			continue;
		std::string fpath = withSlash(path) + name;
		/* failing entries are skipped, the mirror continues */
		if (dir)
		{
			if (downloadDir(fpath, savePath, r))
				eDebug("[eFtpClient] skipped directory %s", fpath.c_str());
		}
		else if (downloadFile(fpath, savePath, r))
			eDebug("[eFtpClient] skipped file %s", fpath.c_str());
	}

	reply = "226 Transfer complete.";
	report("Copy directory " + path + ".   Status: " + reply);
	return 0;
}

RESULT eFtpClient::uploadDir(const std::string &path, std::string &reply)
{
	std::vector<std::string> files, dirs;
	RESULT res = listLocal(path, files, dirs);
	if (res)
	{
		reply = std::string("500 ") + strerror(-res);
		report("Uploading directory: " + path + ".   Status: " + reply, true);
		return res;
	}

	reply = "200";
	for (std::vector<std::string>::const_iterator it = files.begin(); it != files.end(); ++it)
	{
		std::string r;
		if (uploadFile(*it, path, r))
			eDebug("[eFtpClient] skipped file %s", it->c_str());
	}

	for (std::vector<std::string>::const_iterator it = dirs.begin(); it != dirs.end(); ++it)
	{
		std::string r;
		if (m_session->mkd(*it, r))
			eDebug("[eFtpClient] MKD %s: %s", it->c_str(), r.c_str());
		if (m_session->cwd(*it, r))
		{
			reply = r;
			eWarning("[eFtpClient] Uploading directory: %s.   Status: %s", it->c_str(), r.c_str());
			continue;
		}
		if (uploadDir(withSlash(path) + *it + "/", r))
			eDebug("[eFtpClient] skipped directory %s", it->c_str());
		res = m_session->cwd("..", r);
		if (res)
		{
			reply = r;
			report("Uploading directory: " + path + ".   Status: " + reply, true);
			return res;
		}
	}

	report("Uploading directory: " + path + ".   Status: " + reply);
	return 0;
}

RESULT eFtpClient::deleteDir(const std::string &path, std::string &reply)
{
	std::vector<std::string> lines;
	RESULT res = m_session->list(path, lines, reply);
	if (res)
	{
		report("Remove directory " + path + ".   Status: " + reply, true);
		return res;
	}

	for (std::vector<std::string>::const_iterator it = lines.begin(); it != lines.end(); ++it)
	{
		std::string name, r;
		bool dir;
		if (!parseListLine(*it, name, dir))
			continue;
		std::string fpath = withSlash(path) + name;
		if (dir)
		{
			if (deleteDir(fpath, r))
				eDebug("[eFtpClient] skipped directory %s", fpath.c_str());
		}
		else if (deleteFile(fpath, r))
			eDebug("[eFtpClient] skipped file %s", fpath.c_str());
	}

	res = m_session->rmd(path, reply);
	report("Remove directory " + path + ".   Status: " + reply, res != 0);
	return res;
}

RESULT eFtpClient::downloadFiles(const std::string &savePath, const std::vector<std::string> &suffixes)
{
	std::vector<std::string> names;
	std::string reply;
	RESULT res = m_session->nlst(names, reply);
	if (res)
	{
		report(reply, true);
		return res;
	}

	for (std::vector<std::string>::const_iterator it = names.begin(); it != names.end(); ++it)
	{
		if (!hasSuffix(*it, suffixes))
			continue;
		res = downloadFile(*it, savePath, reply);
		if (res)
			return res;
	}
	return 0;
}

RESULT eFtpClient::downloadXml(const std::string &savePath, const std::string &xmlPath, const std::vector<std::string> &files)
{
	std::string reply;
	RESULT res = m_session->cwd(xmlPath, reply);
	if (res)
	{
		report(reply, true);
		return res;
	}
	return downloadFiles(savePath, files);
}

RESULT eFtpClient::uploadXml(const std::string &dataPath, const std::string &xmlPath, const std::vector<std::string> &files)
{
	std::string reply;
	RESULT res = m_session->cwd(xmlPath, reply);
	if (res)
	{
		report(reply, true);
		return res;
	}
	for (std::vector<std::string>::const_iterator it = files.begin(); it != files.end(); ++it)
	{
		res = uploadFile(*it, dataPath, reply);
		if (res)
			return res;
	}
	return 0;
}

RESULT eFtpClient::uploadBouquets(const std::string &dataPath, bool removeUnused)
{
	if (removeUnused)
	{
		RESULT res = removeUnusedBouquets();
		if (res)
			return res;
	}
	return uploadFiles(dataPath, bouquetSuffixes);
}

RESULT eFtpClient::uploadFiles(const std::string &dataPath, const std::vector<std::string> &suffixes)
{
	std::vector<std::string> files, dirs;
	RESULT res = listLocal(dataPath, files, dirs);
	if (res)
	{
		report("Can't read " + dataPath + ": " + strerror(-res), true);
		return res;
	}

	for (std::vector<std::string>::const_iterator it = files.begin(); it != files.end(); ++it)
	{
		if (std::find(xmlFiles.begin(), xmlFiles.end(), *it) != xmlFiles.end())
			continue;
		if (!hasSuffix(*it, suffixes))
			continue;
		std::string reply;
		res = uploadFile(*it, dataPath, reply);
		if (res)
			return res;
	}
	return 0;
}

RESULT eFtpClient::removeUnusedBouquets()
{
	static const std::vector<std::string> prefixes = { "userbouquet.", "bouquets.xml", "ubouquets.xml" };
	std::vector<std::string> names;
	std::string reply;
	RESULT res = m_session->nlst(names, reply);
	if (res)
	{
		report(reply, true);
		return res;
	}

	for (std::vector<std::string>::const_iterator it = names.begin(); it != names.end(); ++it)
	{
		for (std::vector<std::string>::const_iterator p = prefixes.begin(); p != prefixes.end(); ++p)
		{
			if (!startsWith(*it, *p))
				continue;
			res = deleteFile(*it, reply);
			if (res)
				return res;
			break;
		}
	}
	return 0;
}

RESULT eFtpClient::downloadPicons(const std::string &src, const std::string &dest, const std::vector<std::string> &filter)
{
	std::string reply;
	RESULT res = m_session->cwd(src, reply);
	if (res)
	{
		report(reply, true);
		return res;
	}
	res = CFile::makeDirs(dest);
	if (res)
	{
		report("Can't create " + dest + ": " + strerror(-res), true);
		return res;
	}

	std::vector<std::string> names;
	res = m_session->nlst(names, reply);
	if (res)
	{
		report(reply, true);
		return res;
	}

	int failed = 0;
	for (std::vector<std::string>::const_iterator it = names.begin(); it != names.end(); ++it)
	{
		if (isPicon(*it, filter) && downloadFile(*it, dest, reply))
			++failed;
	}
	if (failed)
		eWarning("[eFtpClient] %d picons could not be downloaded", failed);
	return 0;
}

RESULT eFtpClient::uploadPicons(const std::string &src, const std::string &dest, const std::vector<std::string> &filter)
{
	std::string reply;
	RESULT res = m_session->cwd(dest, reply);
	if (res && startsWith(reply, "550"))
	{
		/* not there yet */
		if (m_session->mkd(dest, reply))
			eDebug("[eFtpClient] MKD %s: %s", dest.c_str(), reply.c_str());
		res = m_session->cwd(dest, reply);
	}
	if (res)
	{
		report(reply, true);
		return res;
	}

	std::vector<std::string> files, dirs;
	res = listLocal(src, files, dirs);
	if (res)
	{
		report("Can't read " + src + ": " + strerror(-res), true);
		return res;
	}

	int failed = 0;
	for (std::vector<std::string>::const_iterator it = files.begin(); it != files.end(); ++it)
	{
		if (isPicon(*it, filter) && uploadFile(*it, src, reply))
			++failed;
	}
	if (failed)
		eWarning("[eFtpClient] %d picons could not be uploaded", failed);
	return 0;
}

RESULT eFtpClient::deletePicons(const std::string &dest, const std::vector<std::string> &filter)
{
	std::string reply;
	RESULT res;
	if (!dest.empty())
	{
		res = m_session->cwd(dest, reply);
		if (res)
		{
			report(reply, true);
			return res;
		}
	}

	std::vector<std::string> names;
	res = m_session->nlst(names, reply);
	if (res)
	{
		report(reply, true);
		return res;
	}

	int failed = 0;
	for (std::vector<std::string>::const_iterator it = names.begin(); it != names.end(); ++it)
	{
		if (isPicon(*it, filter) && deleteFile(*it, reply))
			++failed;
	}
	if (failed)
		eWarning("[eFtpClient] %d picons could not be deleted", failed);
	return 0;
}
