#ifndef __lib_dvb_satxml_h
#define __lib_dvb_satxml_h

#include <map>
#include <string>
#include <vector>
#include <libxml/tree.h>
#include <lib/base/object.h>

/*
 * bidirectional code <-> display name table for the numeric
 * attributes of satellites.xml
 */
class eLookupTable
{
	const char *m_name;
	std::map<int, std::string> m_names;
	std::map<std::string, int> m_codes;
	bool m_injective;
public:
	struct entry
	{
		int code;
		const char *name;
	};
	eLookupTable(const char *name, const entry *entries, int count);

	const char *getName() const { return m_name; }
	/* false when either a code or a name appears twice */
	bool isInjective() const { return m_injective; }

	bool hasCode(int code) const { return m_names.find(code) != m_names.end(); }
	bool hasName(const std::string &name) const { return m_codes.find(name) != m_codes.end(); }
	/* returns -ENOENT for an unknown code */
	RESULT lookupName(int code, std::string &name) const;
	RESULT lookupCode(const std::string &name, int &code) const;
	/* resolves the numeric attribute text, "2" -> "8PSK" */
	RESULT lookupName(const std::string &code, std::string &name) const;
};

struct eSatelliteTransponder
{
	std::string frequency;
	std::string symbol_rate;
		/* display names, e.g. "H", "3/4", "DVB-S2", "8PSK" */
	std::string polarization;
	std::string fec_inner;
	std::string system;
	std::string modulation;
		/* multistream parameters, empty when absent */
	std::string pls_mode;
	std::string pls_code;
	std::string is_id;

	bool operator==(const eSatelliteTransponder &c) const;
};

struct eSatellite
{
	std::string name;
	std::string flags;
	std::string position;
	std::vector<eSatelliteTransponder> transponders;

		/* orbital position in tenths of a degree, west negative */
	int getPosition() const;
	int getFlags() const;
	bool operator==(const eSatellite &c) const;
};

class eSatellitesXml
{
public:
	static const eLookupTable &polarizationTable();
	static const eLookupTable &fecTable();
	static const eLookupTable &systemTable();
	static const eLookupTable &modulationTable();
	static const eLookupTable &plsModeTable();
	static const eLookupTable &rollOffTable();
	static const eLookupTable &inversionTable();
	static const eLookupTable &pilotTable();
	/* checks every table for duplicate codes or names, -EINVAL if one is broken */
	static RESULT validateTables();

	static const char *comment();

	static RESULT load(const std::string &file, std::vector<eSatellite> &satellites);
	static RESULT loadMemory(const std::string &data, std::vector<eSatellite> &satellites);
	static RESULT save(const std::string &file, const std::vector<eSatellite> &satellites);
	static RESULT write(const std::vector<eSatellite> &satellites, std::string &document);

	static RESULT parseSatellite(xmlNodePtr node, eSatellite &sat);
	static RESULT parseTransponder(xmlNodePtr node, eSatelliteTransponder &tp, std::string &error);

	static bool isTransponderValid(const eSatelliteTransponder &tp);
private:
	static RESULT parseDocument(xmlDocPtr doc, std::vector<eSatellite> &satellites);
};

#endif
