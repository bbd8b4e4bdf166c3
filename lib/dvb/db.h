#ifndef __db_h
#define __db_h

#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <lib/dvb/idvb.h>

class eBouquet
{
public:
	std::string m_bouquet_name;
	std::string m_filename;  // without path
	typedef std::list<eServiceReference> list;
	list m_services;

	RESULT load(const std::string &file);
	/* writes m_filename below dir */
	RESULT flushChanges(const std::string &dir) const;
	/* files referenced by "FROM BOUQUET" entries, in list order */
	std::vector<std::string> getSubBouquetFiles() const;
	static std::string getSubBouquetFile(const eServiceReference &ref);
};

class eDVBDB
{
public:
		/* transponder lines in version 4 layout, e.g. "s 11766000:27500000:0:4:130:2:0" */
	std::map<eDVBChannelID, std::string> m_channels;
	std::map<eDVBServiceID, eDVBService> m_services;
	std::map<std::string, eBouquet> m_bouquets;

	RESULT loadServicelist(const std::string &file);
	RESULT saveServicelist(const std::string &file) const;

	/* loads bouquets.tv, bouquets.radio and every userbouquet they reference */
	RESULT loadBouquets(const std::string &dir);
	RESULT loadBouquet(const std::string &dir, const std::string &filename);
	RESULT saveBouquets(const std::string &dir) const;

	const eDVBService *getService(const eServiceReference &ref) const;

		/* blacklist / whitelist: one reference per line */
	static RESULT loadList(const std::string &file, std::set<std::string> &entries);
	static RESULT saveList(const std::string &file, const std::set<std::string> &entries);
private:
	void loadServiceListV5(FILE *f);
};

#endif
