#ifndef __dvb_idvb_h
#define __dvb_idvb_h

#include <string>
#include <vector>
#include <lib/base/object.h>
#include <lib/service/service.h>

	/* key of a transponder in the services database: namespace:tsid:onid */
struct eDVBChannelID
{
	unsigned int dvbnamespace;
	unsigned int transport_stream_id;
	unsigned int original_network_id;

	eDVBChannelID(): dvbnamespace(0), transport_stream_id(0), original_network_id(0) { }
	eDVBChannelID(unsigned int ns, unsigned int tsid, unsigned int onid)
		: dvbnamespace(ns), transport_stream_id(tsid), original_network_id(onid) { }

	static RESULT parse(const char *line, eDVBChannelID &id);
	std::string toString() const;

	bool operator==(const eDVBChannelID &c) const
	{
		return dvbnamespace == c.dvbnamespace && transport_stream_id == c.transport_stream_id && original_network_id == c.original_network_id;
	}
	bool operator<(const eDVBChannelID &c) const
	{
		if (dvbnamespace != c.dvbnamespace)
			return dvbnamespace < c.dvbnamespace;
		if (original_network_id != c.original_network_id)
			return original_network_id < c.original_network_id;
		return transport_stream_id < c.transport_stream_id;
	}
};

	/* key of a service in the services database (the "data id"):
	   sid:namespace:tsid:onid:type:number[:source_id], ids zero padded hex */
struct eDVBServiceID
{
	unsigned int service_id;
	unsigned int dvb_namespace;
	unsigned int transport_stream_id;
	unsigned int original_network_id;
	int service_type;
	int service_number;
	unsigned int source_id;
	bool has_source_id;

	eDVBServiceID()
		: service_id(0), dvb_namespace(0), transport_stream_id(0), original_network_id(0),
		service_type(0), service_number(0), source_id(0), has_source_id(false) { }

	static RESULT parse(const char *line, eDVBServiceID &id);
	std::string toString() const;
	/* bouquet reference ("fav id") of this service */
	eServiceReference toReference() const;
	static eDVBServiceID fromReference(const eServiceReference &ref);
	eDVBChannelID getChannelID() const { return eDVBChannelID(dvb_namespace, transport_stream_id, original_network_id); }

	bool operator==(const eDVBServiceID &c) const
	{
		return service_id == c.service_id && dvb_namespace == c.dvb_namespace && transport_stream_id == c.transport_stream_id
			&& original_network_id == c.original_network_id && service_type == c.service_type && service_number == c.service_number
			&& source_id == c.source_id && has_source_id == c.has_source_id;
	}
	bool operator<(const eDVBServiceID &c) const
	{
		if (dvb_namespace != c.dvb_namespace)
			return dvb_namespace < c.dvb_namespace;
		if (original_network_id != c.original_network_id)
			return original_network_id < c.original_network_id;
		if (transport_stream_id != c.transport_stream_id)
			return transport_stream_id < c.transport_stream_id;
		if (service_id != c.service_id)
			return service_id < c.service_id;
		if (service_type != c.service_type)
			return service_type < c.service_type;
		if (service_number != c.service_number)
			return service_number < c.service_number;
		if (has_source_id != c.has_source_id)
			return has_source_id < c.has_source_id;
		return source_id < c.source_id;
	}
};

class eDVBService
{
public:
	enum cacheID
	{
		cVPID, cMPEGAPID, cTPID, cPCRPID, cAC3PID,
		cVTYPE, cACHANNEL, cAC3DELAY, cPCMDELAY,
		cSUBTITLE, cacheMax
	};

	enum
	{
		dxKeep=1,	// don't update the service parameters automatically
		dxHide=2,
		dxPids=4,	// always use the cached pids
		dxLock=8,
		dxNew=32,	// marked as new by the last scan
	};

	std::string m_service_name;
		/* "p:", "c:", "C:" and "f:" tokens in file order */
	std::vector<std::string> m_data;

	static RESULT parseData(const std::string &str, std::vector<std::string> &tokens);
	std::string dataString() const;

	std::string getProvider() const;
	void setProvider(const std::string &provider);
	int getFlags() const;
	void setFlags(int flags);
	int getCacheEntry(cacheID id) const;
	std::vector<unsigned int> getCAIDs() const;

	static int parseFlags(const std::string &token);
	static bool isKeep(int flags) { return flags & (1 << 0); }
	static bool isHide(int flags) { return flags & (1 << 1); }
	static bool isPids(int flags) { return flags & (1 << 2); }
	static bool isNew(int flags) { return flags & (1 << 5); }

	bool operator==(const eDVBService &c) const
	{
		return m_service_name == c.m_service_name && m_data == c.m_data;
	}
};

const char *getServiceTypeName(int service_type);
/* "C:0B" -> "Conax", empty for unknown systems */
std::string getCASName(const std::string &token);

#endif
