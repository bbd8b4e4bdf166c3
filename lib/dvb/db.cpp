#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <lib/base/cfile.h>
#include <lib/base/eerror.h>
#include <lib/base/estring.h>
#include <lib/base/wrappers.h>
#include <lib/dvb/db.h>

RESULT eDVBChannelID::parse(const char *line, eDVBChannelID &id)
{
	unsigned int dvb_namespace, transport_stream_id, original_network_id;
	if (sscanf(line, "%x:%x:%x", &dvb_namespace, &transport_stream_id, &original_network_id) != 3)
		return -EINVAL;
	id = eDVBChannelID(dvb_namespace, transport_stream_id, original_network_id);
	return 0;
}

std::string eDVBChannelID::toString() const
{
	char buf[32];
	snprintf(buf, sizeof(buf), "%08x:%04x:%04x", dvbnamespace, transport_stream_id, original_network_id);
	return buf;
}

RESULT eDVBServiceID::parse(const char *line, eDVBServiceID &id)
{
	eDVBServiceID tmp;
	int n = sscanf(line, "%x:%x:%x:%x:%d:%d:%x", &tmp.service_id, &tmp.dvb_namespace, &tmp.transport_stream_id,
		&tmp.original_network_id, &tmp.service_type, &tmp.service_number, &tmp.source_id);
	if (n < 6)
		return -EINVAL;
	tmp.has_source_id = n == 7;
	if (!tmp.has_source_id)
		tmp.source_id = 0;
	id = tmp;
	return 0;
}

std::string eDVBServiceID::toString() const
{
	char buf[64];
	if (has_source_id)
		snprintf(buf, sizeof(buf), "%04x:%08x:%04x:%04x:%d:%d:%x", service_id, dvb_namespace,
			transport_stream_id, original_network_id, service_type, service_number, source_id);
	else
		snprintf(buf, sizeof(buf), "%04x:%08x:%04x:%04x:%d:%d", service_id, dvb_namespace,
			transport_stream_id, original_network_id, service_type, service_number);
	return buf;
}

eServiceReference eDVBServiceID::toReference() const
{
	eServiceReference ref(eServiceReference::idDVB, 0);
	ref.setServiceType(service_type);
	ref.setServiceID(service_id);
	ref.setTransportStreamID(transport_stream_id);
	ref.setOriginalNetworkID(original_network_id);
	ref.setDVBNamespace(dvb_namespace);
	return ref;
}

eDVBServiceID eDVBServiceID::fromReference(const eServiceReference &ref)
{
	eDVBServiceID id;
	id.service_type = ref.getServiceType();
	id.service_id = ref.getServiceID();
	id.transport_stream_id = ref.getTransportStreamID();
	id.original_network_id = ref.getOriginalNetworkID();
	id.dvb_namespace = ref.getDVBNamespace();
	return id;
}

RESULT eDVBService::parseData(const std::string &data, std::vector<std::string> &tokens)
{
	std::string str = data;
	tokens.clear();
	while (str.size() > 1 && str[1]==':') // p:, f:, c:%02d..., C:
	{
		size_t c=str.find(',');
		if (c == std::string::npos)
		{
			tokens.push_back(str);
			str="";
		} else
		{
			tokens.push_back(str.substr(0, c));
			str=str.substr(c+1);
		}
	}
	if (!str.empty())
	{
		eDebug("[eDVBService] ignoring malformed service data '%s'", str.c_str());
		return -EINVAL;
	}
	return 0;
}

std::string eDVBService::dataString() const
{
	std::string ret;
	for (std::vector<std::string>::const_iterator i(m_data.begin()); i != m_data.end(); ++i)
	{
		if (i != m_data.begin())
			ret += ",";
		ret += *i;
	}
	return ret;
}

std::string eDVBService::getProvider() const
{
	for (std::vector<std::string>::const_iterator i(m_data.begin()); i != m_data.end(); ++i)
		if (startsWith(*i, "p:"))
			return i->substr(2);
	return "";
}

void eDVBService::setProvider(const std::string &provider)
{
	for (std::vector<std::string>::iterator i(m_data.begin()); i != m_data.end(); ++i)
		if (startsWith(*i, "p:"))
		{
			*i = "p:" + provider;
			return;
		}
	m_data.insert(m_data.begin(), "p:" + provider);
}

int eDVBService::getFlags() const
{
	for (std::vector<std::string>::const_iterator i(m_data.begin()); i != m_data.end(); ++i)
		if (startsWith(*i, "f:"))
			return parseFlags(*i);
	return 0;
}

void eDVBService::setFlags(int flags)
{
	std::vector<std::string>::iterator i(m_data.begin());
	while (i != m_data.end() && !startsWith(*i, "f:"))
		++i;
	if (!flags)
	{
		if (i != m_data.end())
			m_data.erase(i);
		return;
	}
	std::string token = "f:" + getHex(flags);
	if (i != m_data.end())
		*i = token;
	else
		m_data.push_back(token);
}

int eDVBService::getCacheEntry(cacheID id) const
{
	for (std::vector<std::string>::const_iterator i(m_data.begin()); i != m_data.end(); ++i)
	{
		int cid, val;
		if (startsWith(*i, "c:") && sscanf(i->c_str() + 2, "%02d%x", &cid, &val) == 2 && cid == id)
			return val;
	}
	return -1;
}

std::vector<unsigned int> eDVBService::getCAIDs() const
{
	std::vector<unsigned int> ret;
	for (std::vector<std::string>::const_iterator i(m_data.begin()); i != m_data.end(); ++i)
	{
		unsigned int val;
		if (startsWith(*i, "C:") && sscanf(i->c_str() + 2, "%x", &val) == 1)
			ret.push_back(val);
	}
	return ret;
}

/* the value is usually written as hex by the receiver, but tools write
   plain decimal numbers too. All digits is read as decimal. */
int eDVBService::parseFlags(const std::string &token)
{
	if (token.size() < 3)
		return 0;
	std::string value = token.substr(2);
	if (isDigits(value))
		return strtol(value.c_str(), NULL, 10);
	return strtol(value.c_str(), NULL, 16);
}

const char *getServiceTypeName(int service_type)
{
	switch (service_type)
	{
	case 1: return "TV";
	case 2: return "Radio";
	case -2:
	case 3: return "Data";
	case 10: return "Radio";
	case 22: return "TV (H264)";
	case 25: return "TV (HD)";
	case 31: return "TV (UHD)";
	default: return "Unknown";
	}
}

std::string getCASName(const std::string &token)
{
	static const struct { const char *id, *name; } cas[] =
	{
		{ "C:26", "BISS" }, { "C:0B", "Conax" }, { "C:06", "Irdeto" }, { "C:18", "Nagravision" },
		{ "C:05", "Viaccess" }, { "C:01", "SECA" }, { "C:0E", "PowerVu" }, { "C:4A", "DRE-Crypt" },
		{ "C:7B", "DRE-Crypt" }, { "C:56", "Verimatrix" }, { "C:09", "VideoGuard" },
	};
	/* only the system part (first byte) of the ca id is significant */
	std::string key = token.substr(0, 4);
	for (unsigned int i = 0; i < sizeof(cas) / sizeof(*cas); ++i)
		if (strcasecmp(key, cas[i].id) == 0)
			return cas[i].name;
	return "";
}

// eBouquet

RESULT eBouquet::load(const std::string &file)
{
	CFile fp(file, "rt");
	if (!fp)
	{
		int err = errno;
		eDebug("[eBouquet] can't open %s: %m", file.c_str());
		return -err;
	}

	size_t pos = file.rfind('/');
	m_filename = pos == std::string::npos ? file : file.substr(pos + 1);
	m_services.clear();

	size_t linesize = 256;
	char *line = (char*)malloc(linesize);
	bool read_descr=false;
	int entries = 0, skipped = 0;
	eServiceReference *e = NULL;
	while (1)
	{
		ssize_t len;
		if ((len = getline(&line, &linesize, fp)) < 1) break;
		/* strip newline and carriage return */
		if (line[len - 1] == '\n') line[--len] = 0;
		if (len && line[len - 1] == '\r') line[--len] = 0;
		if (!strncmp(line, "#SERVICE", 8))
		{
			int offs = line[8] == ':' ? 10 : 9;
			eServiceReference tmp;
			if (len < offs || eServiceReference::parse(line + offs, tmp))
			{
				/* a broken line does not spoil the rest of the bouquet */
				++skipped;
				read_descr=false;
				continue;
			}
			m_services.push_back(tmp);
			e = &m_services.back();
			read_descr=true;
			++entries;
		}
		else if (read_descr && !strncmp(line, "#DESCRIPTION", 12))
		{
			int offs = line[12] == ':' ? 14 : 13;
			if (len >= offs)
				e->name = line+offs;
			read_descr=false;
		}
		else if (!strncmp(line, "#NAME ", 6))
			m_bouquet_name=line+6;
	}
	free(line);
	eDebug("[eBouquet] %d entries in bouquet %s (%d skipped)", entries, m_filename.c_str(), skipped);
	return 0;
}

RESULT eBouquet::flushChanges(const std::string &dir) const
{
	std::string filename = dir + m_filename;
	{
		CFile f((filename + ".writing").c_str(), "w");
		if (!f)
			goto err;
		if ( fprintf(f, "#NAME %s\r\n", m_bouquet_name.c_str()) < 0 )
			goto err;
		for (list::const_iterator i(m_services.begin()); i != m_services.end(); ++i)
		{
			if ( fprintf(f, "#SERVICE %s\r\n", i->toString().c_str()) < 0 )
				goto err;
			if ( i->name.length() )
				if ( fprintf(f, "#DESCRIPTION %s\r\n", i->name.c_str()) < 0 )
					goto err;
		}
		f.sync();
	}
	if (rename((filename + ".writing").c_str(), filename.c_str()) < 0)
		goto err;
	return 0;
err:
	eWarning("[eBouquet] couldn't write file %s", filename.c_str());
	::unlink((filename + ".writing").c_str());
	return -EIO;
}

std::string eBouquet::getSubBouquetFile(const eServiceReference &ref)
{
	size_t pos = ref.path.find("FROM BOUQUET \"");
	if (pos == std::string::npos)
		return "";
	pos += 14;
	size_t end = ref.path.find('"', pos);
	if (end == std::string::npos)
		return "";
	return ref.path.substr(pos, end - pos);
}

std::vector<std::string> eBouquet::getSubBouquetFiles() const
{
	std::vector<std::string> ret;
	for (list::const_iterator i(m_services.begin()); i != m_services.end(); ++i)
	{
		if (!(i->flags & eServiceReference::canDescent))
			continue;
		std::string file = getSubBouquetFile(*i);
		if (!file.empty())
			ret.push_back(file);
	}
	return ret;
}

// eDVBDB

void eDVBDB::loadServiceListV5(FILE * f)
{
	char *line = NULL;
	size_t linesize = 0;
	int tcount = 0;
	int scount = 0;
	ssize_t len;
	while ((len = getline(&line, &linesize, f)) > 0) {
		if (line[len - 1] == '\n')
			line[--len] = '\0';
		if (!strncmp(line, "t:", 2)) {		// Transponder/Channel data
			// t:channel,frontend
			char *fe = strchr(line, ',');
			if (!fe)
				continue;
			*fe++ = '\0';
			eDVBChannelID channelid;
			if (eDVBChannelID::parse(line + 2, channelid) || fe[0] == '\0' || fe[1] != ':')
				continue;
			std::string feparm = fe;
			feparm[1] = ' ';
			m_channels[channelid] = feparm;
			tcount++;
		}
		else if (!strncmp(line, "s:", 2)) {		// Service data
			// s:serviceref,"servicename"[,servicedata]
			char * sname = strchr(line, ',');
			if (!sname)
				continue;
			*sname = '\0';
			sname += 2;	// skip '"'
			char * sdata = strchr(sname, '"');
			if (!sdata)
				continue;
			*sdata++ = '\0';  // end string on '"'

			eDVBServiceID ref;
			if (eDVBServiceID::parse(line + 2, ref))
				continue;
			eDVBService s;
			s.m_service_name = sname;
			if (*sdata++ == ',') // expect a ',' or '\0'.
				eDVBService::parseData(sdata, s.m_data);
			m_services[ref] = s;
			scount++;
		}
	}
	free(line);
	eDebug("[eDVBDB] loaded %d channels/transponders and %d services", tcount, scount);
}

RESULT eDVBDB::loadServicelist(const std::string &file)
{
	eDebug("[eDVBDB] ---- opening lame channel db %s", file.c_str());
	CFile f(file, "rt");
	if (!f) {
		int err = errno;
		eDebug("[eDVBDB] can't open %s: %m", file.c_str());
		return -err;
	}

	m_channels.clear();
	m_services.clear();

	char line[1024];
	int version;
	if ((!fgets(line, sizeof(line), f)) || sscanf(line, "eDVB services /%d/", &version) != 1)
	{
		eWarning("[eDVBDB] not a valid servicefile");
		return -EINVAL;
	}
	eDebug("[eDVBDB] reading services (version %d)", version);

	if (version == 5) {
		loadServiceListV5(f);
		return 0;
	}

	if ((!fgets(line, sizeof(line), f)) || strcmp(line, "transponders\n"))
	{
		eWarning("[eDVBDB] services invalid, no transponders");
		return -EINVAL;
	}
	int tcount = 0;
	while (!feof(f))
	{
		if (!fgets(line, sizeof(line), f) || !strcmp(line, "end\n"))
			break;

		eDVBChannelID channelid;
		bool valid = !eDVBChannelID::parse(line, channelid);

		if (!fgets(line, sizeof(line), f))
			break;
		int len = strlen(line);
		if (len > 0 && line[len - 1] == '\n')
			line[--len] = '\0';
		if (valid && line[0] == '\t')
		{
			m_channels[channelid] = line + 1;
			tcount++;
		}
		if (!fgets(line, sizeof(line), f) || strcmp(line, "/\n"))
			break;
	}

	if ((!fgets(line, sizeof(line), f)) || strcmp(line, "services\n"))
	{
		eWarning("[eDVBDB] services invalid, no services");
		return -EINVAL;
	}
	int scount=0, skipped=0;
	while (!feof(f))
	{
		int len;
		if (!fgets(line, sizeof(line), f) || !strcmp(line, "end\n"))
			break;

		eDVBServiceID ref;
		bool valid = !eDVBServiceID::parse(line, ref);
		if (!fgets(line, sizeof(line), f))
			break;
		len = strlen(line); /* strip newline */
		if (len > 0 && line[len - 1 ] == '\n')
			line[len - 1] = '\0';
		eDVBService s;
		s.m_service_name = line;

		if (!fgets(line, sizeof(line), f))
			break;
		len = strlen(line); /* strip newline */
		if (len > 0 && line[len - 1 ] == '\n')
			line[len - 1] = '\0';
		if (!valid)
		{
			eDebug("[eDVBDB] skipping service '%s' with broken reference", s.m_service_name.c_str());
			skipped++;
			continue;
		}
		if (line[0] && line[1] != ':')	// old ... (only service_provider)
			s.m_data.push_back(std::string("p:") + line);
		else
			eDVBService::parseData(line, s.m_data);
		m_services[ref] = s;
		scount++;
	}

	eDebug("[eDVBDB] loaded %d channels/transponders and %d services (%d skipped)", tcount, scount, skipped);
	return 0;
}

RESULT eDVBDB::saveServicelist(const std::string &filename) const
{
	eDebug("[eDVBDB] ---- saving lame channel db %s", filename.c_str());

	int channels=0, services=0;
	{
		CFile f((filename + ".writing").c_str(), "w");
		if (!f)
		{
			int err = errno;
			eWarning("[eDVBDB] couldn't save lame channel db! (%m)");
			return -err;
		}

		fprintf(f, "eDVB services /4/\n");
		fprintf(f, "transponders\n");

		for (std::map<eDVBChannelID, std::string>::const_iterator i(m_channels.begin());
				i != m_channels.end(); ++i)
		{
			fprintf(f, "%s\n\t%s\n/\n", i->first.toString().c_str(), i->second.c_str());
			channels++;
		}
		fprintf(f, "end\nservices\n");

		for (std::map<eDVBServiceID, eDVBService>::const_iterator i(m_services.begin());
			i != m_services.end(); ++i)
		{
			fprintf(f, "%s\n", i->first.toString().c_str());
			fprintf(f, "%s\n", i->second.m_service_name.c_str());
			/* no tokens is an empty line, a bare "p:" is an empty provider token */
			fprintf(f, "%s\n", i->second.dataString().c_str());
			services++;
		}
		if (fprintf(f, "end\nHave a lot of bugs!\n") < 0)
		{
			eWarning("[eDVBDB] write error on %s.writing", filename.c_str());
			::unlink((filename + ".writing").c_str());
			return -EIO;
		}
		f.sync();
	}

	eDebug("[eDVBDB] saved %d channels and %d services!", channels, services);
	if (rename((filename + ".writing").c_str(), filename.c_str()) < 0)
	{
		int err = errno;
		eWarning("[eDVBDB] can't rename %s.writing (%m)", filename.c_str());
		::unlink((filename + ".writing").c_str());
		return -err;
	}
	return 0;
}

RESULT eDVBDB::loadBouquet(const std::string &dir, const std::string &filename)
{
	if (m_bouquets.find(filename) != m_bouquets.end())
		return 0;
	eBouquet &bouquet = m_bouquets[filename];
	RESULT res = bouquet.load(dir + filename);
	if (res)
	{
		m_bouquets.erase(filename);
		return res;
	}
	std::vector<std::string> sub = bouquet.getSubBouquetFiles();
	for (std::vector<std::string>::const_iterator i(sub.begin()); i != sub.end(); ++i)
	{
		if (loadBouquet(dir, *i))
			eWarning("[eDVBDB] bouquet %s references missing %s", filename.c_str(), i->c_str());
	}
	return 0;
}

RESULT eDVBDB::loadBouquets(const std::string &dir)
{
	m_bouquets.clear();
	int found = 0;
	static const char *const index[] = { "bouquets.tv", "bouquets.radio", 0 };
	for (int i = 0; index[i]; ++i)
	{
		if (!loadBouquet(dir, index[i]))
			found++;
	}
	eDebug("[eDVBDB] loaded %zu bouquet files from %s", m_bouquets.size(), dir.c_str());
	return found ? 0 : -ENOENT;
}

RESULT eDVBDB::saveBouquets(const std::string &dir) const
{
	for (std::map<std::string, eBouquet>::const_iterator i(m_bouquets.begin()); i != m_bouquets.end(); ++i)
	{
		RESULT res = i->second.flushChanges(dir);
		if (res)
			return res;
	}
	return 0;
}

const eDVBService *eDVBDB::getService(const eServiceReference &ref) const
{
	eDVBServiceID id = eDVBServiceID::fromReference(ref);
	for (std::map<eDVBServiceID, eDVBService>::const_iterator i(m_services.begin()); i != m_services.end(); ++i)
	{
		const eDVBServiceID &s = i->first;
		if (s.service_id == id.service_id && s.dvb_namespace == id.dvb_namespace
			&& s.transport_stream_id == id.transport_stream_id && s.original_network_id == id.original_network_id)
			return &i->second;
	}
	return NULL;
}

RESULT eDVBDB::loadList(const std::string &file, std::set<std::string> &entries)
{
	entries.clear();
	CFile f(file, "rt");
	if (!f)
	{
		if (errno == ENOENT)
			return 0; // no list means nothing is listed
		int err = errno;
		eDebug("[eDVBDB] can't open %s: %m", file.c_str());
		return -err;
	}
	char *line = NULL;
	size_t linesize = 0;
	while (getline(&line, &linesize, f) > 0)
	{
		std::string entry = strip(line);
		if (!entry.empty())
			entries.insert(entry);
	}
	free(line);
	return 0;
}

RESULT eDVBDB::saveList(const std::string &file, const std::set<std::string> &entries)
{
	std::string content;
	for (std::set<std::string>::const_iterator i(entries.begin()); i != entries.end(); ++i)
	{
		if (i != entries.begin())
			content += "\n";
		content += *i;
	}
	return CFile::writeStr(file, content);
}
