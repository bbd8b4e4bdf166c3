#include <stdio.h>
#include <errno.h>
#include <lib/base/eerror.h>
#include <lib/base/estring.h>
#include <lib/service/service.h>

static std::string encode(const std::string s)
{
	int len = s.size();
	std::string res;
	int i;
	for (i=0; i<len; ++i)
	{
		unsigned char c = s[i];
		if ((c == ':') || (c < 32) || (c == '%'))
		{
			res += "%";
			char hex[8];
			snprintf(hex, 8, "%02x", c);
			res += hex;
		} else
			res += c;
	}
	return res;
}

eServiceReference::eServiceReference(const std::string &string)
{
	const char *c=string.c_str();
	int pathl=0;

	flags = 0;
	memset(data, 0, sizeof(data));

	if (!string.length())
		type = idInvalid;
	else if ( sscanf(c, "%d:%d:%x:%x:%x:%x:%x:%x:%x:%x:%n", &type, &flags, &data[0], &data[1], &data[2], &data[3], &data[4], &data[5], &data[6], &data[7], &pathl) < 8 )
	{
		memset( data, 0, sizeof(data) );
		pathl = 0;
		eDebug("[eServiceReference] old format reference '%s'", c);
		if ( sscanf(c, "%d:%d:%x:%x:%x:%x:%n", &type, &flags, &data[0], &data[1], &data[2], &data[3], &pathl) < 2 )
			type = idInvalid;
	}

	if (pathl)
	{
		const char *pathstr = c+pathl;
		const char *namestr = strchr(pathstr, ':');
		if (namestr)
		{
			if (!strncmp(namestr, "://", 3))
			{
				/*
				 * The path is a url (e.g. "http://...")
				 * We can expect more colons to be present
				 * in a url, so instead of a colon, we look
				 * for a space instead as url delimiter,
				 * after which a name may be present.
				 */
				namestr = strchr(namestr, ' ');
				if (namestr)
				{
					path.assign(pathstr, namestr - pathstr);
					if (*(namestr + 1))
						name = namestr + 1;
				}
				else
					path = pathstr;
			}
			else
			{
				if (pathstr != namestr)
					path.assign(pathstr, namestr-pathstr);
				if (*(namestr+1))
					name=namestr+1;
			}
		}
		else
		{
			path=pathstr;
		}
	}

	path = urlDecode(path);
	name = urlDecode(name);
}

RESULT eServiceReference::parse(const std::string &string, eServiceReference &ref)
{
	ref = eServiceReference(string);
	if (!ref.valid())
	{
		eDebug("[eServiceReference] can't decode '%s'", string.c_str());
		return -EINVAL;
	}
	return 0;
}

std::string eServiceReference::toString() const
{
	std::string ret;
	ret += getNum(type);
	ret += ":";
	ret += getNum(flags);
	for (unsigned int i=0; i<sizeof(data)/sizeof(*data); ++i)
		ret+=":"+ getHex(data[i], 0, true);
	ret+=":"+encode(path); /* a url path contains ':', the encoding keeps it apart from the name */
	if (name.length())
		ret+=":"+encode(name);
	return ret;
}

std::string eServiceReference::toCompareString() const
{
	std::string ret;
	ret += getNum(type);
	ret += ":0";
	for (unsigned int i=0; i<sizeof(data)/sizeof(*data); ++i)
		ret+=":"+getHex(data[i], 0, true);
	ret+=":"+encode(path);
	return ret;
}

int eServiceReference::getEntryType() const
{
	if (flags & isMarker)
		return (flags & isInvisible) ? entrySpace : entryMarker;
	if (flags & isGroup)
		return entryAlternatives;
	if ((flags & canDescent) && path.find("FROM BOUQUET") != std::string::npos)
		return entryBouquet;
	if (path.find("://") != std::string::npos)
		return entryIPTV;
	return entryDefault;
}

std::string eServiceReference::getPiconName() const
{
	char buf[128];
	snprintf(buf, sizeof(buf), "%d_0_%X_%X_%X_%X_%X_0_0_0.png",
		type, data[0], data[1], data[2], data[3], data[4]);
	return buf;
}
