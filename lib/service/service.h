#ifndef __lib_service_service_h
#define __lib_service_service_h

#include <string.h>
#include <string>
#include <lib/base/object.h>

class eServiceReference
{
public:
	enum
	{
		idInvalid=-1,
		idStructure,	// service_id == 0 is root
		idDVB,
		idFile,
		idUser=0x1000,
		idServiceMP3=0x1001,	// IPTV streams
		idServiceHDMIIn=0x2000,
	};
	int type;

	enum
	{
		isDirectory=1,		// SHOULD enter  (implies mustDescent)
		mustDescent=2,		// cannot be played directly
		canDescent=4,			// supports enterDirectory/leaveDirectory
		flagDirectory=isDirectory|mustDescent|canDescent,
		shouldSort=8,			// should be ASCII-sorted according to service_name
		hasSortKey=16,		// has a sort key in data[3]
		sort1=32,					// sort key is 1 instead of 0
		isMarker=64,			// Marker
		isGroup=128,			// is a group of services (alternatives)
		isNumberedMarker=256, //use together with isMarker, to force the marker to be numbered
		isInvisible=512 // use to make services or markers in a list invisible
	};
	int flags;

		/* what a bouquet line refers to */
	enum
	{
		entryDefault,
		entryIPTV,
		entryMarker,
		entrySpace,		// hidden marker
		entryAlternatives,
		entryBouquet
	};

	unsigned int data[8];
	std::string path;
	/* only for override service names in bouquets or to give servicerefs a name */
	std::string name;

	eServiceReference()
		: type(idInvalid), flags(0)
	{
		memset(data, 0, sizeof(data));
	}
	eServiceReference(int type, int flags)
		: type(type), flags(flags)
	{
		memset(data, 0, sizeof(data));
	}
	eServiceReference(int type, int flags, const std::string &path)
		: type(type), flags(flags), path(path)
	{
		memset(data, 0, sizeof(data));
	}
	eServiceReference(const std::string &string);

	/* same as the string constructor, but reports a malformed reference */
	static RESULT parse(const std::string &string, eServiceReference &ref);

	std::string toString() const;
	std::string toCompareString() const;

	int getEntryType() const;
	/* logo file name, depends on the identity fields only */
	std::string getPiconName() const;

	int getServiceType() const { return data[0]; }
	unsigned int getServiceID() const { return data[1]; }
	unsigned int getTransportStreamID() const { return data[2]; }
	unsigned int getOriginalNetworkID() const { return data[3]; }
	unsigned int getDVBNamespace() const { return data[4]; }
	void setServiceType(int service_type) { data[0] = service_type; }
	void setServiceID(unsigned int sid) { data[1] = sid; }
	void setTransportStreamID(unsigned int tsid) { data[2] = tsid; }
	void setOriginalNetworkID(unsigned int onid) { data[3] = onid; }
	void setDVBNamespace(unsigned int ns) { data[4] = ns; }

	bool operator==(const eServiceReference &c) const
	{
		return type == c.type && flags == c.flags && memcmp(data, c.data, sizeof(data)) == 0 && path == c.path && name == c.name;
	}
	bool operator!=(const eServiceReference &c) const
	{
		return !(*this == c);
	}
	bool operator<(const eServiceReference &c) const
	{
		if (type != c.type)
			return type < c.type;
		int r=memcmp(data, c.data, sizeof(data));
		if (r)
			return r < 0;
		return path < c.path;
	}
	bool valid() const
	{
		return type != idInvalid;
	}
	operator bool() const
	{
		return valid();
	}
};

#endif
