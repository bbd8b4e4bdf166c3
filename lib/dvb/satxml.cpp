#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <libxml/encoding.h>
#include <libxml/parser.h>
#include <libxml/xmlIO.h>
#include <libxml/xmlwriter.h>

#include <lib/base/cfile.h>
#include <lib/base/eerror.h>
#include <lib/base/estring.h>
#include <lib/dvb/satxml.h>

#define ARRAY_SIZE(a) (int)(sizeof(a) / sizeof(a[0]))

eLookupTable::eLookupTable(const char *name, const entry *entries, int count)
	:m_name(name), m_injective(true)
{
	for (int i = 0; i < count; ++i)
	{
		if (!m_names.insert(std::make_pair(entries[i].code, std::string(entries[i].name))).second)
			m_injective = false;
		if (!m_codes.insert(std::make_pair(std::string(entries[i].name), entries[i].code)).second)
			m_injective = false;
	}
}

RESULT eLookupTable::lookupName(int code, std::string &name) const
{
	std::map<int, std::string>::const_iterator it = m_names.find(code);
	if (it == m_names.end())
		return -ENOENT;
	name = it->second;
	return 0;
}

RESULT eLookupTable::lookupName(const std::string &code, std::string &name) const
{
	if (!isDigits(code))
		return -ENOENT;
	return lookupName(atoi(code.c_str()), name);
}

RESULT eLookupTable::lookupCode(const std::string &name, int &code) const
{
	std::map<std::string, int>::const_iterator it = m_codes.find(name);
	if (it == m_codes.end())
		return -ENOENT;
	code = it->second;
	return 0;
}

static const eLookupTable::entry polarizations[] = {
	{ 0, "H" }, { 1, "V" }, { 2, "L" }, { 3, "R" } };

static const eLookupTable::entry fecs[] = {
	{ 0, "Auto" }, { 1, "1/2" }, { 2, "2/3" }, { 3, "3/4" }, { 4, "5/6" }, { 5, "7/8" },
	{ 6, "8/9" }, { 7, "3/5" }, { 8, "4/5" }, { 9, "9/10" }, { 10, "6/7" }, { 15, "None" } };

static const eLookupTable::entry systems[] = {
	{ 0, "DVB-S" }, { 1, "DVB-S2" } };

static const eLookupTable::entry modulations[] = {
	{ 0, "Auto" }, { 1, "QPSK" }, { 2, "8PSK" }, { 4, "16APSK" }, { 5, "32APSK" } };

static const eLookupTable::entry pls_modes[] = {
	{ 0, "Root" }, { 1, "Gold" }, { 2, "Combo" } };

static const eLookupTable::entry roll_offs[] = {
	{ 0, "35%" }, { 1, "25%" }, { 2, "20%" }, { 3, "Auto" } };

static const eLookupTable::entry inversions[] = {
	{ 0, "Off" }, { 1, "On" }, { 2, "Auto" } };

static const eLookupTable::entry pilots[] = {
	{ 0, "Off" }, { 1, "On" }, { 2, "Auto" } };

const eLookupTable &eSatellitesXml::polarizationTable()
{
	static const eLookupTable table("polarization", polarizations, ARRAY_SIZE(polarizations));
	return table;
}

const eLookupTable &eSatellitesXml::fecTable()
{
	static const eLookupTable table("fec_inner", fecs, ARRAY_SIZE(fecs));
	return table;
}

const eLookupTable &eSatellitesXml::systemTable()
{
	static const eLookupTable table("system", systems, ARRAY_SIZE(systems));
	return table;
}

const eLookupTable &eSatellitesXml::modulationTable()
{
	static const eLookupTable table("modulation", modulations, ARRAY_SIZE(modulations));
	return table;
}

const eLookupTable &eSatellitesXml::plsModeTable()
{
	static const eLookupTable table("pls_mode", pls_modes, ARRAY_SIZE(pls_modes));
	return table;
}

const eLookupTable &eSatellitesXml::rollOffTable()
{
	static const eLookupTable table("rolloff", roll_offs, ARRAY_SIZE(roll_offs));
	return table;
}

const eLookupTable &eSatellitesXml::inversionTable()
{
	static const eLookupTable table("inversion", inversions, ARRAY_SIZE(inversions));
	return table;
}

const eLookupTable &eSatellitesXml::pilotTable()
{
	static const eLookupTable table("pilot", pilots, ARRAY_SIZE(pilots));
	return table;
}

RESULT eSatellitesXml::validateTables()
{
	const eLookupTable *tables[] = {
		&polarizationTable(), &fecTable(), &systemTable(), &modulationTable(),
		&plsModeTable(), &rollOffTable(), &inversionTable(), &pilotTable() };
	RESULT res = 0;
	for (int i = 0; i < ARRAY_SIZE(tables); ++i)
	{
		if (!tables[i]->isInjective())
		{
			eWarning("[eSatellitesXml] lookup table %s maps a code or name twice!", tables[i]->getName());
			res = -EINVAL;
		}
	}
	return res;
}

const char *eSatellitesXml::comment()
{
	return "This file was created in E2Toolkit.\n\n"
		"usable flags are\n"
		"\t1: Network Scan\n"
		"\t2: use BAT\n"
		"\t4: use ONIT\n"
		"\t8: skip NITs of known networks\n"
		"\tand combinations of this.\n\n"
		"transponder parameters:\n"
		"polarization: 0 - Horizontal, 1 - Vertical, 2 - Left Circular, 3 - Right Circular\n"
		"fec_inner: 0 - Auto, 1 - 1/2, 2 - 2/3, 3 - 3/4, 4 - 5/6, 5 - 7/8, 6 -  8/9, 7 - 3/5,\n"
		"8 - 4/5, 9 - 9/10, 15 - None\n"
		"modulation: 0 - Auto, 1 - QPSK, 2 - 8PSK, 4 - 16APSK, 5 - 32APSK\n"
		"rolloff: 0 - 0.35, 1 - 0.25, 2 - 0.20, 3 - Auto\n"
		"pilot: 0 - Off, 1 - On, 2 - Auto\n"
		"inversion: 0 = Off, 1 = On, 2 = Auto (default)\n"
		"system: 0 = DVB-S, 1 = DVB-S2\n"
		"is_id: 0 - 255\n"
		"pls_mode: 0 - Root, 1 - Gold, 2 - Combo\n"
		"pls_code: 0 - 262142\n\n";
}

bool eSatelliteTransponder::operator==(const eSatelliteTransponder &c) const
{
	return frequency == c.frequency && symbol_rate == c.symbol_rate &&
		polarization == c.polarization && fec_inner == c.fec_inner &&
		system == c.system && modulation == c.modulation &&
		pls_mode == c.pls_mode && pls_code == c.pls_code && is_id == c.is_id;
}

int eSatellite::getPosition() const
{
	return atoi(position.c_str());
}

int eSatellite::getFlags() const
{
	return atoi(flags.c_str());
}

bool eSatellite::operator==(const eSatellite &c) const
{
	return name == c.name && flags == c.flags && position == c.position && transponders == c.transponders;
}

static void getAttributes(xmlNodePtr node, std::map<std::string, std::string> &attributes)
{
	for (xmlAttrPtr attr = node->properties; attr; attr = attr->next)
	{
		std::string name((const char*)attr->name);
		attributes[name] = (attr->children && attr->children->content) ? (const char*)attr->children->content : "";
	}
}

static bool isElement(xmlNodePtr node, const char *name)
{
	return node->type == XML_ELEMENT_NODE && !xmlStrcmp(node->name, BAD_CAST name);
}

RESULT eSatellitesXml::parseTransponder(xmlNodePtr node, eSatelliteTransponder &tp, std::string &error)
{
	std::map<std::string, std::string> attributes;
	getAttributes(node, attributes);

	static const char *required[] = { "frequency", "symbol_rate", "polarization", "fec_inner", "system", "modulation" };
	for (int i = 0; i < ARRAY_SIZE(required); ++i)
	{
		if (attributes.find(required[i]) == attributes.end())
		{
			error = std::string("missing attribute ") + required[i];
			return -EINVAL;
		}
	}

	struct
	{
		const eLookupTable &table;
		std::string &dest;
	} lookups[] = {
		{ polarizationTable(), tp.polarization },
		{ fecTable(), tp.fec_inner },
		{ systemTable(), tp.system },
		{ modulationTable(), tp.modulation },
	};
	for (int i = 0; i < ARRAY_SIZE(lookups); ++i)
	{
		const std::string &value = attributes[lookups[i].table.getName()];
		if (lookups[i].table.lookupName(value, lookups[i].dest))
		{
			error = std::string("unknown ") + lookups[i].table.getName() + " '" + value + "'";
			return -EINVAL;
		}
	}

	tp.frequency = attributes["frequency"];
	tp.symbol_rate = attributes["symbol_rate"];
	tp.pls_mode = attributes.count("pls_mode") ? attributes["pls_mode"] : "";
	tp.pls_code = attributes.count("pls_code") ? attributes["pls_code"] : "";
	tp.is_id = attributes.count("is_id") ? attributes["is_id"] : "";
	return 0;
}

RESULT eSatellitesXml::parseSatellite(xmlNodePtr node, eSatellite &sat)
{
	std::map<std::string, std::string> attributes;
	getAttributes(node, attributes);
	if (!attributes.count("name") || !attributes.count("flags") || !attributes.count("position"))
		return -EINVAL;

	sat.name = attributes["name"];
	sat.flags = attributes["flags"];
	sat.position = attributes["position"];
	sat.transponders.clear();

	for (xmlNodePtr transponder = node->children; transponder; transponder = transponder->next)
	{
		if (!isElement(transponder, "transponder") || !transponder->properties)
			continue;
		eSatelliteTransponder tp;
		std::string error;
		if (parseTransponder(transponder, tp, error))
		{
			eWarning("[eSatellitesXml] Error: can't parse transponder for '%s' satellite! %s", sat.name.c_str(), error.c_str());
			continue;
		}
		sat.transponders.push_back(tp);
	}
	return 0;
}

RESULT eSatellitesXml::parseDocument(xmlDocPtr doc, std::vector<eSatellite> &satellites)
{
	satellites.clear();
	xmlNode *root_element = xmlDocGetRootElement(doc);
	xmlNode *satellite = root_element ? root_element->children : NULL;

	while (satellite)
	{
		if (isElement(satellite, "sat") && satellite->properties)
		{
			eSatellite sat;
			if (parseSatellite(satellite, sat))
				eWarning("[eSatellitesXml] skipping satellite without name, flags or position");
			else
				satellites.push_back(sat);
		}
		// next satellite
		satellite = satellite->next;
	}

	xmlFreeDoc(doc);
	return 0;
}

RESULT eSatellitesXml::load(const std::string &file, std::vector<eSatellite> &satellites)
{
	xmlDoc *doc = xmlReadFile(file.c_str(), NULL, 0);
	if (!doc)
	{
		eDebug("[eSatellitesXml] couldn't open %s!!", file.c_str());
		return -ENOENT;
	}
	RESULT res = parseDocument(doc, satellites);
	eDebug("[eSatellitesXml] loaded %zu satellites from %s", satellites.size(), file.c_str());
	return res;
}

RESULT eSatellitesXml::loadMemory(const std::string &data, std::vector<eSatellite> &satellites)
{
	xmlDoc *doc = xmlReadMemory(data.data(), (int)data.size(), "satellites.xml", NULL, 0);
	if (!doc)
	{
		eDebug("[eSatellitesXml] couldn't parse document");
		return -EINVAL;
	}
	return parseDocument(doc, satellites);
}

static std::string codeOf(const eLookupTable &table, const std::string &name)
{
	int code;
	if (table.lookupCode(name, code))
	{
		eWarning("[eSatellitesXml] no %s code for '%s', writing 0", table.getName(), name.c_str());
		return "0";
	}
	return getNum(code);
}

RESULT eSatellitesXml::write(const std::vector<eSatellite> &satellites, std::string &document)
{
	xmlBufferPtr buf = xmlBufferCreate();
	if (!buf)
		return -ENOMEM;
	/* the declaration is written raw, the encoder sits on the output buffer */
	xmlOutputBufferPtr out = xmlOutputBufferCreateBuffer(buf, xmlFindCharEncodingHandler("ISO-8859-1"));
	xmlTextWriterPtr writer = out ? xmlNewTextWriter(out) : NULL;
	if (!writer)
	{
		if (out)
			xmlOutputBufferClose(out);
		xmlBufferFree(buf);
		return -ENOMEM;
	}

	xmlTextWriterSetIndent(writer, 1);
	xmlTextWriterSetIndentString(writer, BAD_CAST "    ");
	int rc = xmlTextWriterWriteRaw(writer, BAD_CAST "<?xml version=\"1.0\" encoding=\"iso-8859-1\"?>\n");
	if (rc >= 0)
		rc = xmlTextWriterWriteComment(writer, BAD_CAST comment());
	if (rc >= 0)
		rc = xmlTextWriterStartElement(writer, BAD_CAST "satellites");

	for (std::vector<eSatellite>::const_iterator sat = satellites.begin(); rc >= 0 && sat != satellites.end(); ++sat)
	{
		rc = xmlTextWriterStartElement(writer, BAD_CAST "sat");
		if (rc >= 0) rc = xmlTextWriterWriteAttribute(writer, BAD_CAST "name", BAD_CAST sat->name.c_str());
		if (rc >= 0) rc = xmlTextWriterWriteAttribute(writer, BAD_CAST "flags", BAD_CAST sat->flags.c_str());
		if (rc >= 0) rc = xmlTextWriterWriteAttribute(writer, BAD_CAST "position", BAD_CAST sat->position.c_str());

		for (std::vector<eSatelliteTransponder>::const_iterator tp = sat->transponders.begin(); rc >= 0 && tp != sat->transponders.end(); ++tp)
		{
			std::vector<std::pair<const char*, std::string> > attributes;
			attributes.push_back(std::make_pair("frequency", tp->frequency));
			attributes.push_back(std::make_pair("symbol_rate", tp->symbol_rate));
			attributes.push_back(std::make_pair("polarization", codeOf(polarizationTable(), tp->polarization)));
			attributes.push_back(std::make_pair("fec_inner", codeOf(fecTable(), tp->fec_inner)));
			attributes.push_back(std::make_pair("system", codeOf(systemTable(), tp->system)));
			attributes.push_back(std::make_pair("modulation", codeOf(modulationTable(), tp->modulation)));
			if (!tp->pls_mode.empty())
				attributes.push_back(std::make_pair("pls_mode", tp->pls_mode));
			if (!tp->pls_code.empty())
				attributes.push_back(std::make_pair("pls_code", tp->pls_code));
			if (!tp->is_id.empty())
				attributes.push_back(std::make_pair("is_id", tp->is_id));

			rc = xmlTextWriterStartElement(writer, BAD_CAST "transponder");
			for (size_t i = 0; rc >= 0 && i < attributes.size(); ++i)
				rc = xmlTextWriterWriteAttribute(writer, BAD_CAST attributes[i].first, BAD_CAST attributes[i].second.c_str());
			if (rc >= 0)
				rc = xmlTextWriterEndElement(writer);
		}
		if (rc >= 0)
			rc = xmlTextWriterEndElement(writer);
	}
	if (rc >= 0)
		rc = xmlTextWriterEndDocument(writer);

	xmlFreeTextWriter(writer);
	if (rc < 0)
	{
		eWarning("[eSatellitesXml] writing satellites document failed");
		xmlBufferFree(buf);
		return -EIO;
	}
	document.assign((const char*)xmlBufferContent(buf), xmlBufferLength(buf));
	xmlBufferFree(buf);
	return 0;
}

RESULT eSatellitesXml::save(const std::string &file, const std::vector<eSatellite> &satellites)
{
	std::string document;
	RESULT res = write(satellites, document);
	if (res)
		return res;
	res = CFile::writeStr(file, document);
	if (res)
		eWarning("[eSatellitesXml] couldn't write %s: %s", file.c_str(), strerror(-res));
	return res;
}

bool eSatellitesXml::isTransponderValid(const eSatelliteTransponder &tp)
{
	if (!isInteger(tp.frequency) || !isInteger(tp.symbol_rate))
		return false;
	if (!tp.pls_mode.empty() && !isInteger(tp.pls_mode))
		return false;
	if (!tp.pls_code.empty() && !isInteger(tp.pls_code))
		return false;
	if (!tp.is_id.empty() && !isInteger(tp.is_id))
		return false;

	return polarizationTable().hasName(tp.polarization) &&
		fecTable().hasName(tp.fec_inner) &&
		systemTable().hasName(tp.system) &&
		modulationTable().hasName(tp.modulation);
}
