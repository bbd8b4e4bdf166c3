#include <errno.h>
#include <unistd.h>
#include <sys/stat.h>
#include <map>
#include <catch2/catch.hpp>

#include <lib/base/cfile.h>
#include <lib/dvb/db.h>
#include <lib/dvb/satxml.h>
#include <lib/service/service.h>
#include "testutil.h"

TEST_CASE("service references", "[service]")
{
	SECTION("dvb service")
	{
		eServiceReference ref;
		REQUIRE(eServiceReference::parse("1:0:19:283D:3FB:1:C00000:0:0:0:", ref) == 0);
		CHECK(ref.type == eServiceReference::idDVB);
		CHECK(ref.getServiceType() == 0x19);
		CHECK(ref.getServiceID() == 0x283d);
		CHECK(ref.getTransportStreamID() == 0x3fb);
		CHECK(ref.getOriginalNetworkID() == 1);
		CHECK(ref.getDVBNamespace() == 0xc00000);
		CHECK(ref.getEntryType() == eServiceReference::entryDefault);
		CHECK(ref.toString() == "1:0:19:283D:3FB:1:C00000:0:0:0:");
	}

	SECTION("markers")
	{
		eServiceReference marker("1:64:0:0:0:0:0:0:0:0::--- News ---");
		CHECK(marker.getEntryType() == eServiceReference::entryMarker);
		CHECK(marker.name == "--- News ---");
		CHECK(marker.path.empty());
		CHECK(marker.toString() == "1:64:0:0:0:0:0:0:0:0::--- News ---");

		eServiceReference space("1:832:D:0:0:0:0:0:0:0:");
		CHECK(space.getEntryType() == eServiceReference::entrySpace);
	}

	SECTION("stream urls keep their colons")
	{
		eServiceReference iptv("4097:0:1:0:0:0:0:0:0:0:http%3a//example.com%3a8001/live.m3u8:Example TV");
		CHECK(iptv.getEntryType() == eServiceReference::entryIPTV);
		CHECK(iptv.path == "http://example.com:8001/live.m3u8");
		CHECK(iptv.name == "Example TV");
		CHECK(iptv.toString() == "4097:0:1:0:0:0:0:0:0:0:http%3a//example.com%3a8001/live.m3u8:Example TV");

		eServiceReference plain("4097:0:1:0:0:0:0:0:0:0:http://example.com/live.ts Example TV");
		CHECK(plain.path == "http://example.com/live.ts");
		CHECK(plain.name == "Example TV");
	}

	SECTION("sub bouquets and alternatives")
	{
		eServiceReference sub("1:7:1:0:0:0:0:0:0:0:FROM BOUQUET \"userbouquet.favourites.tv\" ORDER BY bouquet");
		CHECK(sub.getEntryType() == eServiceReference::entryBouquet);
		CHECK(eBouquet::getSubBouquetFile(sub) == "userbouquet.favourites.tv");

		eServiceReference alt("1:134:1:0:0:0:0:0:0:0:FROM BOUQUET \"alternatives.__das_erste.tv\" ORDER BY bouquet");
		CHECK(alt.getEntryType() == eServiceReference::entryAlternatives);
	}

	SECTION("malformed references")
	{
		eServiceReference ref;
		CHECK(eServiceReference::parse("", ref) == -EINVAL);
		CHECK(eServiceReference::parse("1", ref) == -EINVAL);
		CHECK(eServiceReference::parse("garbage", ref) == -EINVAL);
	}
}

TEST_CASE("picon names depend on the identity fields only", "[service]")
{
	eServiceReference a("1:0:19:283D:3FB:1:C00000:0:0:0:");
	eServiceReference b("1:0:19:283D:3FB:1:C00000:0:0:0::Das Erste HD");
	b.flags = 64;
	CHECK(a.getPiconName() == "1_0_19_283D_3FB_1_C00000_0_0_0.png");
	CHECK(a.getPiconName() == b.getPiconName());

	eServiceReference other("1:0:19:283E:3FB:1:C00000:0:0:0:");
	CHECK(other.getPiconName() != a.getPiconName());
}

TEST_CASE("service flags", "[idvb]")
{
	CHECK(eDVBService::parseFlags("f:08") == 8);
	CHECK(eDVBService::parseFlags("f:2a") == 0x2a);
	CHECK(eDVBService::parseFlags("f:") == 0);

	int flags = eDVBService::parseFlags("f:2a");
	CHECK_FALSE(eDVBService::isKeep(flags));
	CHECK(eDVBService::isHide(flags));
	CHECK_FALSE(eDVBService::isPids(flags));
	CHECK(eDVBService::isNew(flags));

	int combined = eDVBService::dxKeep | eDVBService::dxPids;
	CHECK(eDVBService::isKeep(combined));
	CHECK(eDVBService::isPids(combined));
	CHECK_FALSE(eDVBService::isHide(combined));

	CHECK(eDVBService::isKeep(1));
	CHECK(eDVBService::isHide(2));
	CHECK(eDVBService::isKeep(3));
	CHECK(eDVBService::isHide(3));
	CHECK(eDVBService::isPids(4));
	CHECK_FALSE(eDVBService::isKeep(4));
	CHECK_FALSE(eDVBService::isHide(4));
	CHECK_FALSE(eDVBService::isNew(4));
	CHECK(eDVBService::isNew(0x20));
	CHECK_FALSE(eDVBService::isKeep(0x20));
	CHECK_FALSE(eDVBService::isHide(0x20));
	CHECK_FALSE(eDVBService::isPids(0x20));

	/* all digits is decimal, even where the receiver meant hex */
	CHECK(eDVBService::parseFlags("f:40") == 40);
	CHECK(eDVBService::parseFlags("f:12") == 12);
	CHECK(eDVBService::parseFlags("f:4a") == 0x4a);

	CHECK(std::string(getServiceTypeName(25)) == "TV (HD)");
	CHECK(std::string(getServiceTypeName(-2)) == "Data");
	CHECK(getCASName("C:0b00") == "Conax");
	CHECK(getCASName("C:2600") == "BISS");
	CHECK(getCASName("C:ffff").empty());
}

static const char *lamedb =
	"eDVB services /4/\n"
	"transponders\n"
	"00c00000:03fb:0001\n"
	"\ts 11836500:27500000:1:3:192:2:0\n"
	"/\n"
	"end\n"
	"services\n"
	"283d:00c00000:03fb:0001:25:0\n"
	"Das Erste HD\n"
	"p:ARD,c:001389,c:011398,c:03138a,C:0b00,f:40\n"
	"2b66:00c00000:03fb:0001:1:0\n"
	"arte\n"
	"p:ARD\n"
	"end\n"
	"Have a lot of bugs!\n";

TEST_CASE("primary services database", "[db]")
{
	eTempDir dir;
	REQUIRE(CFile::writeStr(dir + "lamedb", lamedb) == 0);

	eDVBDB db;
	REQUIRE(db.loadServicelist(dir + "lamedb") == 0);
	CHECK(db.m_channels.size() == 1);
	REQUIRE(db.m_services.size() == 2);

	eServiceReference ref("1:0:19:283D:3FB:1:C00000:0:0:0:");
	const eDVBService *service = db.getService(ref);
	REQUIRE(service != NULL);
	CHECK(service->m_service_name == "Das Erste HD");
	CHECK(service->getProvider() == "ARD");
	CHECK(service->getCacheEntry(eDVBService::cVPID) == 0x1389);
	CHECK(service->getCacheEntry(eDVBService::cMPEGAPID) == 0x1398);
	CHECK(service->getCacheEntry(eDVBService::cPCRPID) == 0x138a);
	CHECK(service->getCacheEntry(eDVBService::cTPID) == -1);
	REQUIRE(service->getCAIDs().size() == 1);
	CHECK(service->getCAIDs()[0] == 0x0b00);
	CHECK(service->getFlags() == 40);

	SECTION("written back unchanged")
	{
		REQUIRE(db.saveServicelist(dir + "lamedb.out") == 0);
		CHECK(CFile::read(dir + "lamedb.out") == lamedb);
	}

	SECTION("services without tokens")
	{
		eDVBServiceID id;
		REQUIRE(eDVBServiceID::parse("2b66:00c00000:03fb:0001:1:0", id) == 0);
		eDVBService &arte = db.m_services[id];
		arte.m_data.clear();
		arte.m_data.push_back("f:40");
		arte.setFlags(0);
		REQUIRE(arte.m_data.empty());

		eDVBServiceID empty_provider;
		REQUIRE(eDVBServiceID::parse("6d66:00c00000:0437:0001:1:0", empty_provider) == 0);
		db.m_services[empty_provider].m_service_name = "unknown";
		db.m_services[empty_provider].setProvider("");
		REQUIRE(db.m_services[empty_provider].m_data.size() == 1);

		REQUIRE(db.saveServicelist(dir + "lamedb.out") == 0);
		eDVBDB again;
		REQUIRE(again.loadServicelist(dir + "lamedb.out") == 0);
		CHECK(again.m_services == db.m_services);
		CHECK(again.m_services[id].m_data.empty());
		CHECK(again.m_services[empty_provider].m_data == std::vector<std::string>(1, "p:"));
	}

	SECTION("a failed save leaves no temporary file")
	{
		REQUIRE(mkdir((dir + "taken").c_str(), 0755) == 0);
		REQUIRE(CFile::writeStr(dir + "taken/file", "x") == 0);
		CHECK(db.saveServicelist(dir + "taken") < 0);
		CHECK(access((dir + "taken.writing").c_str(), F_OK) < 0);

		eBouquet bouquet;
		bouquet.m_bouquet_name = "Favourites (TV)";
		bouquet.m_filename = "taken";
		CHECK(bouquet.flushChanges(dir.path()) == -EIO);
		CHECK(access((dir + "taken.writing").c_str(), F_OK) < 0);
	}

	SECTION("not a services file")
	{
		REQUIRE(CFile::writeStr(dir + "broken", "hello\n") == 0);
		eDVBDB other;
		CHECK(other.loadServicelist(dir + "broken") == -EINVAL);
		CHECK(other.loadServicelist(dir + "missing") == -ENOENT);
	}
}

TEST_CASE("lamedb version 5", "[db]")
{
	eTempDir dir;
	REQUIRE(CFile::writeStr(dir + "lamedb5",
		"eDVB services /5/\n"
		"# Transponders: t:dvb_namespace:transport_stream_id:original_network_id,FEPARMS\n"
		"t:00c00000:03fb:0001,s:11836500:27500000:1:3:192:2:0\n"
		"s:283d:00c00000:03fb:0001:25:0,\"Das Erste HD\",p:ARD,f:40\n") == 0);

	eDVBDB db;
	REQUIRE(db.loadServicelist(dir + "lamedb5") == 0);
	REQUIRE(db.m_channels.size() == 1);
	CHECK(db.m_channels.begin()->second == "s 11836500:27500000:1:3:192:2:0");
	REQUIRE(db.m_services.size() == 1);
	CHECK(db.m_services.begin()->second.m_service_name == "Das Erste HD");
	CHECK(db.m_services.begin()->second.getProvider() == "ARD");
}

TEST_CASE("service ids order the same way they compare", "[idvb]")
{
	eDVBServiceID a, b;
	REQUIRE(eDVBServiceID::parse("283d:00c00000:03fb:0001:25:0", a) == 0);
	REQUIRE(eDVBServiceID::parse("283d:00c00000:03fb:0001:25:1", b) == 0);
	CHECK_FALSE(a == b);
	CHECK((a < b || b < a));

	eDVBServiceID c;
	REQUIRE(eDVBServiceID::parse("283d:00c00000:03fb:0001:25:0:5", c) == 0);
	CHECK_FALSE(a == c);
	CHECK((a < c || c < a));

	std::map<eDVBServiceID, int> ids;
	ids[a] = 1;
	ids[b] = 2;
	ids[c] = 3;
	CHECK(ids.size() == 3);
}

TEST_CASE("bouquet files", "[db]")
{
	eTempDir dir;
	REQUIRE(CFile::writeStr(dir + "bouquets.tv",
		"#NAME User - bouquets (TV)\r\n"
		"#SERVICE 1:7:1:0:0:0:0:0:0:0:FROM BOUQUET \"userbouquet.favourites.tv\" ORDER BY bouquet\r\n") == 0);
	REQUIRE(CFile::writeStr(dir + "userbouquet.favourites.tv",
		"#NAME Favourites (TV)\r\n"
		"#SERVICE 1:0:19:283D:3FB:1:C00000:0:0:0:\r\n"
		"#SERVICE 1:64:0:0:0:0:0:0:0:0::News\r\n"
		"#DESCRIPTION News\r\n"
		"#SERVICE broken\r\n"
		"#SERVICE 4097:0:1:0:0:0:0:0:0:0:http%3a//example.com/live.m3u8:Example TV\r\n") == 0);

	eDVBDB db;
	REQUIRE(db.loadBouquets(dir.path()) == 0);
	REQUIRE(db.m_bouquets.size() == 2);

	const eBouquet &favourites = db.m_bouquets["userbouquet.favourites.tv"];
	CHECK(favourites.m_bouquet_name == "Favourites (TV)");
	REQUIRE(favourites.m_services.size() == 3);
	CHECK(favourites.m_services.front().getEntryType() == eServiceReference::entryDefault);
	CHECK(favourites.m_services.back().getEntryType() == eServiceReference::entryIPTV);
	CHECK(favourites.m_services.back().name == "Example TV");

	eTempDir out;
	REQUIRE(db.saveBouquets(out.path()) == 0);
	CHECK(CFile::read(out + "bouquets.tv") == CFile::read(dir + "bouquets.tv"));
	CHECK(CFile::read(out + "userbouquet.favourites.tv") ==
		"#NAME Favourites (TV)\r\n"
		"#SERVICE 1:0:19:283D:3FB:1:C00000:0:0:0:\r\n"
		"#SERVICE 1:64:0:0:0:0:0:0:0:0::News\r\n"
		"#DESCRIPTION News\r\n"
		"#SERVICE 4097:0:1:0:0:0:0:0:0:0:http%3a//example.com/live.m3u8:Example TV\r\n"
		"#DESCRIPTION Example TV\r\n");

	eTempDir empty;
	eDVBDB none;
	CHECK(none.loadBouquets(empty.path()) == -ENOENT);
}

TEST_CASE("black and white lists", "[db]")
{
	eTempDir dir;
	REQUIRE(CFile::writeStr(dir + "blacklist", "1:0:1:2B66:3FB:1:C00000:0:0:0:\n\n  1:0:1:6D66:437:1:C00000:0:0:0:  \n") == 0);

	std::set<std::string> entries;
	REQUIRE(eDVBDB::loadList(dir + "blacklist", entries) == 0);
	CHECK(entries.size() == 2);
	CHECK(entries.count("1:0:1:6D66:437:1:C00000:0:0:0:") == 1);

	REQUIRE(eDVBDB::saveList(dir + "whitelist", entries) == 0);
	CHECK(CFile::read(dir + "whitelist") == "1:0:1:2B66:3FB:1:C00000:0:0:0:\n1:0:1:6D66:437:1:C00000:0:0:0:");

	std::set<std::string> none;
	CHECK(eDVBDB::loadList(dir + "missing", none) == 0);
	CHECK(none.empty());
}

static eSatellite astra()
{
	eSatellite sat;
	sat.name = "19.2E Astra 1KR/1L/1M/1N";
	sat.flags = "1";
	sat.position = "192";

	eSatelliteTransponder tp;
	tp.frequency = "11494000";
	tp.symbol_rate = "22000000";
	tp.polarization = "H";
	tp.fec_inner = "2/3";
	tp.system = "DVB-S2";
	tp.modulation = "8PSK";
	sat.transponders.push_back(tp);

	tp.frequency = "12603000";
	tp.polarization = "V";
	tp.fec_inner = "5/6";
	tp.pls_mode = "0";
	tp.pls_code = "1";
	tp.is_id = "4";
	sat.transponders.push_back(tp);
	return sat;
}

TEST_CASE("satellite lookup tables", "[satxml]")
{
	CHECK(eSatellitesXml::validateTables() == 0);

	std::string name;
	CHECK(eSatellitesXml::fecTable().lookupName(15, name) == 0);
	CHECK(name == "None");
	CHECK(eSatellitesXml::modulationTable().lookupName("2", name) == 0);
	CHECK(name == "8PSK");
	CHECK(eSatellitesXml::modulationTable().lookupName(3, name) == -ENOENT);
	CHECK(eSatellitesXml::polarizationTable().lookupName("x", name) == -ENOENT);

	int code;
	CHECK(eSatellitesXml::systemTable().lookupCode("DVB-S2", code) == 0);
	CHECK(code == 1);

	static const eLookupTable::entry broken[] = { { 0, "Off" }, { 1, "Off" } };
	eLookupTable table("broken", broken, 2);
	CHECK_FALSE(table.isInjective());
}

TEST_CASE("satellites.xml", "[satxml]")
{
	std::vector<eSatellite> satellites;
	satellites.push_back(astra());
	eSatellite west;
	west.name = "30.0W Hispasat";
	west.flags = "0";
	west.position = "-300";
	satellites.push_back(west);

	std::string document;
	REQUIRE(eSatellitesXml::write(satellites, document) == 0);
	CHECK(document.find("<?xml version=\"1.0\" encoding=\"iso-8859-1\"?>") == 0);
	CHECK(document.find("<!--This file was created in E2Toolkit.") != std::string::npos);
	CHECK(document.find("pls_code=\"1\"") != std::string::npos);

	SECTION("written documents read back unchanged")
	{
		std::vector<eSatellite> loaded;
		REQUIRE(eSatellitesXml::loadMemory(document, loaded) == 0);
		REQUIRE(loaded.size() == 2);
		CHECK(loaded[0] == satellites[0]);
		CHECK(loaded[1].getPosition() == -300);
		CHECK(loaded[0].getFlags() == 1);

		std::string again;
		REQUIRE(eSatellitesXml::write(loaded, again) == 0);
		CHECK(again == document);
	}

	SECTION("files")
	{
		eTempDir dir;
		REQUIRE(eSatellitesXml::save(dir + "satellites.xml", satellites) == 0);
		CHECK(CFile::read(dir + "satellites.xml") == document);

		std::vector<eSatellite> loaded;
		REQUIRE(eSatellitesXml::load(dir + "satellites.xml", loaded) == 0);
		CHECK(loaded == satellites);
		CHECK(eSatellitesXml::load(dir + "missing.xml", loaded) == -ENOENT);
	}
}

static const char receiverSatellites[] =
	"<?xml version=\"1.0\" encoding=\"iso-8859-1\"?>\n"
	"<!--This file was created in E2Toolkit.\n"
	"\n"
	"usable flags are\n"
	"\t1: Network Scan\n"
	"\t2: use BAT\n"
	"\t4: use ONIT\n"
	"\t8: skip NITs of known networks\n"
	"\tand combinations of this.\n"
	"\n"
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
	"pls_code: 0 - 262142\n"
	"\n"
	"-->\n"
	"<satellites>\n"
	"    <sat name=\"19.2E Astra 1KR/1L/1M/1N &amp; 2F\" flags=\"1\" position=\"192\">\n"
	"        <transponder frequency=\"11494000\" symbol_rate=\"22000000\" polarization=\"0\" fec_inner=\"2\" system=\"1\" modulation=\"2\"/>\n"
	"        <transponder frequency=\"12603000\" symbol_rate=\"22000000\" polarization=\"1\" fec_inner=\"4\" system=\"1\" modulation=\"2\" pls_mode=\"0\" pls_code=\"1\" is_id=\"4\"/>\n"
	"    </sat>\n"
	"    <sat name=\"30.0W Hispasat\" flags=\"0\" position=\"-300\"/>\n"
	"</satellites>\n";

TEST_CASE("satellites.xml from a receiver is written back byte for byte", "[satxml]")
{
	eTempDir dir;
	REQUIRE(CFile::writeStr(dir + "satellites.xml", receiverSatellites) == 0);

	std::vector<eSatellite> satellites;
	REQUIRE(eSatellitesXml::load(dir + "satellites.xml", satellites) == 0);
	REQUIRE(satellites.size() == 2);
	CHECK(satellites[0].name == "19.2E Astra 1KR/1L/1M/1N & 2F");
	CHECK(satellites[0].transponders.size() == 2);
	CHECK(satellites[1].transponders.empty());

	std::string document;
	REQUIRE(eSatellitesXml::write(satellites, document) == 0);
	CHECK(document == receiverSatellites);
}

TEST_CASE("broken transponders are skipped", "[satxml]")
{
	std::vector<eSatellite> satellites;
	REQUIRE(eSatellitesXml::loadMemory(
		"<?xml version=\"1.0\" encoding=\"iso-8859-1\"?>\n"
		"<satellites>\n"
		"  <sat name=\"19.2E Astra\" flags=\"1\" position=\"192\">\n"
		"    <transponder frequency=\"11494000\" symbol_rate=\"22000000\" polarization=\"0\" fec_inner=\"2\" system=\"1\" modulation=\"2\"/>\n"
		"    <transponder frequency=\"11538000\" symbol_rate=\"22000000\" polarization=\"7\" fec_inner=\"2\" system=\"0\" modulation=\"1\"/>\n"
		"    <transponder frequency=\"11582000\" symbol_rate=\"22000000\" polarization=\"1\" fec_inner=\"3\" system=\"0\"/>\n"
		"  </sat>\n"
		"  <sat name=\"no position\" flags=\"0\"/>\n"
		"</satellites>\n", satellites) == 0);

	REQUIRE(satellites.size() == 1);
	REQUIRE(satellites[0].transponders.size() == 1);
	const eSatelliteTransponder &tp = satellites[0].transponders[0];
	CHECK(tp.polarization == "H");
	CHECK(tp.fec_inner == "2/3");
	CHECK(tp.system == "DVB-S2");
	CHECK(tp.modulation == "8PSK");
	CHECK(tp.pls_mode.empty());

	CHECK(eSatellitesXml::loadMemory("<satellites><sat", satellites) == -EINVAL);
}

TEST_CASE("unknown names are written as code 0", "[satxml]")
{
	std::vector<eSatellite> satellites(1, astra());
	satellites[0].transponders.resize(1);
	satellites[0].transponders[0].polarization = "X";

	std::string document;
	REQUIRE(eSatellitesXml::write(satellites, document) == 0);
	std::vector<eSatellite> loaded;
	REQUIRE(eSatellitesXml::loadMemory(document, loaded) == 0);
	REQUIRE(loaded[0].transponders.size() == 1);
	CHECK(loaded[0].transponders[0].polarization == "H");
}

TEST_CASE("transponder validation", "[satxml]")
{
	eSatelliteTransponder tp = astra().transponders[1];
	CHECK(eSatellitesXml::isTransponderValid(tp));

	eSatelliteTransponder bad = tp;
	bad.frequency = "11.5GHz";
	CHECK_FALSE(eSatellitesXml::isTransponderValid(bad));

	bad = tp;
	bad.fec_inner = "1/9";
	CHECK_FALSE(eSatellitesXml::isTransponderValid(bad));

	bad = tp;
	bad.pls_code = "gold";
	CHECK_FALSE(eSatellitesXml::isTransponderValid(bad));

	bad = tp;
	bad.pls_mode.clear();
	bad.pls_code.clear();
	bad.is_id.clear();
	CHECK(eSatellitesXml::isTransponderValid(bad));
}
