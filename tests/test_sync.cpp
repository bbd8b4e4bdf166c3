#include <errno.h>
#include <signal.h>
#include <stdint.h>
#include <string.h>
#include <unistd.h>
#include <catch2/catch.hpp>

#include <lib/base/cfile.h>
#include <lib/base/ebase.h>
#include <lib/dvb/satxml.h>
#include <lib/sync/orchestrator.h>
#include <lib/sync/syncworker.h>
#include "fakes.h"
#include "testutil.h"

class eEventLog: public sigc::trackable
{
public:
	std::vector<eSyncEvent> events;
	void add(const eSyncEvent &event) { events.push_back(event); }

	bool hasMessage(const std::string &message) const
	{
		for (size_t i = 0; i < events.size(); ++i)
		{
			if (events[i].message == message)
				return true;
		}
		return false;
	}
	int errors() const
	{
		int count = 0;
		for (size_t i = 0; i < events.size(); ++i)
			count += events[i].type == eSyncEvent::Error;
		return count;
	}
};

static eSyncProfile makeProfile(const eTempDir &dir, eSyncProfile::ControlSurface control)
{
	eSyncProfile profile;
	profile.name = "box";
	profile.control = control;
	profile.data_path = dir + "data";
	profile.picons_local_path = dir + "picons";
	profile.http_notify_delay = 0;
	profile.http_standby_delay = 0;
	return profile;
}

static void writeSatellites(const eSyncProfile &profile, const std::string &frequency)
{
	eSatellite sat;
	sat.name = "19.2E Astra 1KR/1L/1M/1N";
	sat.flags = "1";
	sat.position = "192";
	eSatelliteTransponder tp;
	tp.frequency = frequency;
	tp.symbol_rate = "22000000";
	tp.polarization = "H";
	tp.fec_inner = "2/3";
	tp.system = "DVB-S2";
	tp.modulation = "8PSK";
	sat.transponders.push_back(tp);

	REQUIRE(CFile::makeDirs(profile.getLocalDataPath()) == 0);
	REQUIRE(eSatellitesXml::save(profile.getLocalDataPath() + "satellites.xml", std::vector<eSatellite>(1, sat)) == 0);
}

static void writeLocalLists(const eSyncProfile &profile)
{
	std::string path = profile.getLocalDataPath();
	REQUIRE(CFile::makeDirs(path) == 0);
	REQUIRE(CFile::writeStr(path + "bouquets.tv", "#NAME User - bouquets (TV)\n") == 0);
	REQUIRE(CFile::writeStr(path + "userbouquet.favourites.tv", "#NAME Favourites (TV)\n") == 0);
	REQUIRE(CFile::writeStr(path + "lamedb", "eDVB services /4/\n") == 0);
	REQUIRE(CFile::writeStr(path + "notes.txt", "not for the receiver") == 0);
}

static void addRemoteLists(eFakeFtpSession *ftp)
{
	ftp->addFile("/etc/enigma2/bouquets.tv", "tv");
	ftp->addFile("/etc/enigma2/bouquets.radio", "radio");
	ftp->addFile("/etc/enigma2/userbouquet.favourites.tv", "fav");
	ftp->addFile("/etc/enigma2/lamedb", "db");
	ftp->addFile("/etc/enigma2/blacklist", "");
	ftp->addFile("/etc/enigma2/settings", "config.misc.firstrun=false\n");
	ftp->addFile("/etc/tuxbox/satellites.xml", "<satellites/>");
	ftp->addFile("/etc/tuxbox/timezone.xml", "<timezones/>");
}

static int lastIndex(const eJournal &journal, const std::string &prefix)
{
	int index = -1;
	for (size_t i = 0; i < journal.size(); ++i)
	{
		if (journal[i].compare(0, prefix.size(), prefix) == 0)
			index = (int)i;
	}
	return index;
}

static int firstIndex(const eJournal &journal, const std::string &prefix)
{
	for (size_t i = 0; i < journal.size(); ++i)
	{
		if (journal[i].compare(0, prefix.size(), prefix) == 0)
			return (int)i;
	}
	return -1;
}

TEST_CASE("downloads", "[orchestrator]")
{
	eTempDir dir;
	eJournal journal;
	eEventLog log;
	eSyncProfile profile = makeProfile(dir, eSyncProfile::controlTelnet);
	ePtr<eFakeConnector> connector = new eFakeConnector(journal);
	addRemoteLists(connector->ftp);
	eSyncOrchestrator sync(profile, connector, sigc::mem_fun(log, &eEventLog::add));
	std::string local = profile.getLocalDataPath();

	SECTION("bouquets")
	{
		REQUIRE(sync.run(eSyncOrchestrator::opDownload, syncBouquets, std::vector<std::string>()) == 0);
		CHECK(CFile::read(local + "bouquets.tv") == "tv");
		CHECK(CFile::read(local + "bouquets.radio") == "radio");
		CHECK(CFile::read(local + "userbouquet.favourites.tv") == "fav");
		CHECK_FALSE(CFile::exists(local + "lamedb"));
		CHECK_FALSE(CFile::exists(local + "satellites.xml"));
		CHECK_FALSE(CFile::exists(local + "settings"));
		REQUIRE_FALSE(log.events.empty());
		CHECK(log.events.front().message == "FTP OK.");
		CHECK(log.events.back().message == "Done.");
		CHECK(connector->ftp->quitCalled);
	}

	SECTION("everything")
	{
		REQUIRE(sync.run(eSyncOrchestrator::opDownload, syncAll, std::vector<std::string>()) == 0);
		CHECK(CFile::read(local + "lamedb") == "db");
		CHECK(CFile::exists(local + "blacklist"));
		CHECK(CFile::read(local + "satellites.xml") == "<satellites/>");
		CHECK_FALSE(CFile::exists(local + "timezone.xml"));
		CHECK_FALSE(CFile::exists(local + "settings"));
		CHECK(log.errors() == 0);
	}

	SECTION("satellites only")
	{
		REQUIRE(sync.run(eSyncOrchestrator::opDownload, syncSatellites, std::vector<std::string>()) == 0);
		CHECK(CFile::exists(local + "satellites.xml"));
		CHECK_FALSE(CFile::exists(local + "bouquets.tv"));
	}

	SECTION("picons")
	{
		connector->ftp->addFile("/usr/share/enigma2/picon/1_0_19_283D_3FB_1_C00000_0_0_0.png", "png");
		connector->ftp->addFile("/usr/share/enigma2/picon/index.html", "html");
		REQUIRE(sync.run(eSyncOrchestrator::opDownload, syncPicons, std::vector<std::string>()) == 0);
		CHECK(CFile::read(profile.getLocalPiconPath() + "1_0_19_283D_3FB_1_C00000_0_0_0.png") == "png");
		CHECK_FALSE(CFile::exists(profile.getLocalPiconPath() + "index.html"));
	}

	SECTION("a failing transfer is reported with its status")
	{
		connector->ftp->failures.insert("RETR /etc/enigma2/bouquets.tv");
		CHECK(sync.run(eSyncOrchestrator::opDownload, syncBouquets, std::vector<std::string>()) == -ENOENT);
		REQUIRE(log.errors() == 1);
		CHECK(log.events.back().message == "Error: Downloading file: bouquets.tv.   Status: 550 Permission denied.");
		CHECK_FALSE(log.hasMessage("Done."));
		CHECK(connector->ftp->quitCalled);
	}

	SECTION("ftp login failures")
	{
		connector->ftpResult = -EACCES;
		CHECK(sync.run(eSyncOrchestrator::opDownload, syncAll, std::vector<std::string>()) == -EACCES);
		REQUIRE(log.errors() == 1);
		CHECK(log.events.back().message == "Error: FTP: 530 Login incorrect.");
		CHECK(log.events.back().result == -EACCES);
	}
}

TEST_CASE("epg transfers are not implemented", "[orchestrator]")
{
	eTempDir dir;
	eJournal journal;
	eEventLog log;
	ePtr<eFakeConnector> connector = new eFakeConnector(journal);
	eSyncOrchestrator sync(makeProfile(dir, eSyncProfile::controlHttp), connector, sigc::mem_fun(log, &eEventLog::add));

	CHECK(sync.run(eSyncOrchestrator::opDownload, syncEpg, std::vector<std::string>()) == -ENOSYS);
	CHECK(sync.run(eSyncOrchestrator::opUpload, syncEpg, std::vector<std::string>()) == -ENOSYS);
	CHECK(sync.getError() == "Not implemented yet!");
	CHECK(log.errors() == 2);
	CHECK(log.events.back().message == "Error: Not implemented yet!");
	CHECK(connector->ftpOpened == 0);
	CHECK(journal.empty());
}

TEST_CASE("telnet controlled uploads", "[orchestrator]")
{
	eTempDir dir;
	eJournal journal;
	eEventLog log;
	eSyncProfile profile = makeProfile(dir, eSyncProfile::controlTelnet);
	ePtr<eFakeConnector> connector = new eFakeConnector(journal);
	connector->ftp->dirs.insert("/etc/enigma2/");
	connector->ftp->dirs.insert("/etc/tuxbox/");
	writeLocalLists(profile);
	writeSatellites(profile, "11494000");
	eSyncOrchestrator sync(profile, connector, sigc::mem_fun(log, &eEventLog::add));

	SECTION("the receiver is stopped around all transfers")
	{
		REQUIRE(sync.run(eSyncOrchestrator::opUpload, syncAll, std::vector<std::string>()) == 0);
		CHECK(journalIndex(journal, "TELNET open") == 0);
		int stop = journalIndex(journal, "TELNET stop");
		int resume = journalIndex(journal, "TELNET resume");
		REQUIRE(stop >= 0);
		REQUIRE(resume >= 0);
		CHECK(stop < firstIndex(journal, "STOR "));
		CHECK(lastIndex(journal, "STOR ") < resume);
		CHECK(journal.back() == "TELNET close");

		CHECK(journalIndex(journal, "STOR /etc/tuxbox/satellites.xml") >= 0);
		CHECK(journalIndex(journal, "STOR /etc/enigma2/bouquets.tv") >= 0);
		CHECK(journalIndex(journal, "STOR /etc/enigma2/userbouquet.favourites.tv") >= 0);
		CHECK(journalIndex(journal, "STOR /etc/enigma2/lamedb") >= 0);
		CHECK(journalCount(journal, "STOR ") == 4);
		CHECK(journalCount(journal, "HTTP ") == 0);

		CHECK(log.hasMessage("Telnet initialization ..."));
		CHECK(log.hasMessage("Stopping GUI..."));
		CHECK(log.hasMessage("Starting..."));
		CHECK(log.events.back().message == "Done.");
	}

	SECTION("bouquets leave the satellite descriptors alone")
	{
		REQUIRE(sync.run(eSyncOrchestrator::opUpload, syncBouquets, std::vector<std::string>()) == 0);
		CHECK(journalCount(journal, "STOR /etc/tuxbox/") == 0);
		CHECK(journalCount(journal, "STOR /etc/enigma2/lamedb") == 0);
		CHECK(journalCount(journal, "STOR ") == 2);
	}

	SECTION("a failed transfer closes without resuming")
	{
		connector->ftp->failures.insert("STOR /etc/enigma2/lamedb");
		CHECK(sync.run(eSyncOrchestrator::opUpload, syncAll, std::vector<std::string>()) == -ENOENT);
		CHECK(journalIndex(journal, "TELNET stop") < journalIndex(journal, "STOR /etc/enigma2/lamedb"));
		CHECK(journalIndex(journal, "TELNET resume") == -1);
		CHECK(journal.back() == "TELNET close");
		REQUIRE(log.errors() == 1);
		CHECK(log.hasMessage("Error: Uploading file: lamedb.   Status: 550 Permission denied."));
		CHECK_FALSE(log.hasMessage("Done."));
	}

	SECTION("a refused login ends before any transfer")
	{
		connector->control->openResult = -ECONNREFUSED;
		CHECK(sync.run(eSyncOrchestrator::opUpload, syncBouquets, std::vector<std::string>()) == -ECONNREFUSED);
		CHECK(journalIndex(journal, "TELNET stop") == -1);
		CHECK(journalIndex(journal, "TELNET resume") == -1);
		CHECK(journal.back() == "TELNET close");
		CHECK(connector->ftpOpened == 0);
	}

	SECTION("invalid satellites are caught before anything happens")
	{
		writeSatellites(profile, "11.5GHz");
		CHECK(sync.run(eSyncOrchestrator::opUpload, syncSatellites, std::vector<std::string>()) == -EINVAL);
		CHECK(journal.empty());
		CHECK(log.events.back().message == "Error: 1 invalid transponders in satellites.xml");
	}

	SECTION("picons need no control channel")
	{
		std::string picons = profile.getLocalPiconPath();
		REQUIRE(CFile::makeDirs(picons) == 0);
		REQUIRE(CFile::writeStr(picons + "a.png", "a") == 0);
		REQUIRE(CFile::writeStr(picons + "b.png", "b") == 0);

		REQUIRE(sync.run(eSyncOrchestrator::opUpload, syncPicons, std::vector<std::string>(1, "b.png")) == 0);
		CHECK(journalCount(journal, "TELNET ") == 0);
		CHECK(journalCount(journal, "STOR ") == 1);
		CHECK(connector->ftp->files["/usr/share/enigma2/picon/b.png"] == "b");

		REQUIRE(sync.run(eSyncOrchestrator::opRemovePicons, syncPicons, std::vector<std::string>(1, "b.png")) == 0);
		CHECK(journalIndex(journal, "DELE /usr/share/enigma2/picon/b.png") >= 0);
		CHECK(connector->ftp->files.count("/usr/share/enigma2/picon/b.png") == 0);
	}
}

TEST_CASE("web interface controlled uploads", "[orchestrator]")
{
	eTempDir dir;
	eJournal journal;
	eEventLog log;
	eSyncProfile profile = makeProfile(dir, eSyncProfile::controlHttp);
	ePtr<eFakeConnector> connector = new eFakeConnector(journal);
	connector->ftp->dirs.insert("/etc/enigma2/");
	connector->ftp->dirs.insert("/etc/tuxbox/");
	writeLocalLists(profile);
	writeSatellites(profile, "11494000");
	eSyncOrchestrator sync(profile, connector, sigc::mem_fun(log, &eEventLog::add));

	SECTION("bouquets reload once")
	{
		REQUIRE(sync.run(eSyncOrchestrator::opUpload, syncBouquets, std::vector<std::string>()) == 0);
		CHECK(journal.front() == "HTTP message?text=User+bouquets+will+be+updated%21&type=2&timeout=5");
		CHECK(journalCount(journal, "STOR /etc/tuxbox/") == 0);
		CHECK(journalCount(journal, "HTTP servicelistreload?mode=") == 1);
		CHECK(journalIndex(journal, "HTTP servicelistreload?mode=2") > lastIndex(journal, "STOR "));
		CHECK(journalCount(journal, "HTTP powerstate") == 0);
		CHECK(journalCount(journal, "TELNET ") == 0);
		CHECK(log.hasMessage("Reloading Userbouquets."));
	}

	SECTION("everything goes through standby")
	{
		REQUIRE(sync.run(eSyncOrchestrator::opUpload, syncAll, std::vector<std::string>()) == 0);
		int message = journalIndex(journal, "HTTP message?text=All+user+data+will+be+reloaded%21&type=2&timeout=5");
		int standby = journalIndex(journal, "HTTP powerstate?newstate=0");
		int reload = journalIndex(journal, "HTTP servicelistreload?mode=0");
		int wakeup = journalIndex(journal, "HTTP powerstate?newstate=4");
		CHECK(message == 0);
		CHECK(standby > message);
		CHECK(firstIndex(journal, "STOR ") > standby);
		CHECK(reload > lastIndex(journal, "STOR "));
		CHECK(wakeup > reload);
		CHECK(log.hasMessage("Toggle Standby"));
		CHECK(log.hasMessage("Wakeup from Standby."));
		CHECK(log.events.back().message == "Done.");
	}

	SECTION("no reload after a failed transfer")
	{
		connector->ftp->failures.insert("STOR /etc/enigma2/bouquets.tv");
		CHECK(sync.run(eSyncOrchestrator::opUpload, syncBouquets, std::vector<std::string>()) == -ENOENT);
		CHECK(journalCount(journal, "HTTP servicelistreload") == 0);
	}

	SECTION("an unreachable web interface stops the upload")
	{
		connector->api->failures[iDeviceApi::MESSAGE] = -ECONNREFUSED;
		CHECK(sync.run(eSyncOrchestrator::opUpload, syncSatellites, std::vector<std::string>()) == -ECONNREFUSED);
		CHECK(connector->ftpOpened == 0);
		CHECK(log.events.back().message == "Error: HTTP: Couldn't connect to server");
	}
}

TEST_CASE("notification texts", "[orchestrator]")
{
	CHECK(std::string(eSyncOrchestrator::getNotifyMessage(syncBouquets)) == "User bouquets will be updated!");
	CHECK(std::string(eSyncOrchestrator::getNotifyMessage(syncAll)) == "All user data will be reloaded!");
	CHECK(std::string(eSyncOrchestrator::getNotifyMessage(syncSatellites)) == "Satellites.xml file will be updated!");
	CHECK(std::string(eSyncOrchestrator::getNotifyMessage(syncPicons)) == "Picons will be updated!");
}

static volatile sig_atomic_t signalCancelFd = -1;

static void cancelFromSignal(int)
{
	static const uint64_t one = 1;
	if (signalCancelFd >= 0 && ::write(signalCancelFd, &one, sizeof(one)) < 0)
		return;
}

static void waitDone(eApplication &app, eSyncWorker &worker)
{
	for (int i = 0; i < 200 && worker.isRunning(); ++i)
		app.iterate(50);
}

TEST_CASE("sync worker", "[syncworker]")
{
	eApplication app;
	eTempDir dir;
	eJournal journal;
	eEventLog log;
	eSyncProfile profile = makeProfile(dir, eSyncProfile::controlHttp);
	ePtr<eFakeConnector> connector = new eFakeConnector(journal);

	SECTION("one sync per profile")
	{
		connector->ftpResult = -ECONNREFUSED;
		eSyncWorker worker(&app, profile, connector);
		eSyncWorker other(&app, profile, connector);
		worker.event.connect(sigc::mem_fun(log, &eEventLog::add));

		REQUIRE(worker.start(eSyncOrchestrator::opDownload, syncBouquets) == 0);
		CHECK(eSyncWorker::isActive("box"));
		CHECK(worker.start(eSyncOrchestrator::opDownload, syncAll) == -EBUSY);
		CHECK(other.start(eSyncOrchestrator::opUpload, syncAll) == -EBUSY);

		waitDone(app, worker);
		REQUIRE_FALSE(worker.isRunning());
		CHECK_FALSE(eSyncWorker::isActive("box"));

		REQUIRE(log.events.size() == 2);
		CHECK(log.events[0].type == eSyncEvent::Error);
		CHECK(log.events[0].message == "Error: FTP: 530 Login incorrect.");
		CHECK(log.events[1].type == eSyncEvent::Done);
		CHECK(log.events[1].subset == syncBouquets);
		CHECK(log.events[1].result == -ECONNREFUSED);

		/* free again */
		connector->ftpResult = 0;
		REQUIRE(other.start(eSyncOrchestrator::opDownload, syncSatellites) == 0);
		waitDone(app, other);
		CHECK_FALSE(other.isRunning());
	}

	SECTION("cancel interrupts a waiting sync")
	{
		profile.http_notify_delay = 60000;
		eSyncWorker worker(&app, profile, connector);
		worker.event.connect(sigc::mem_fun(log, &eEventLog::add));

		REQUIRE(worker.start(eSyncOrchestrator::opUpload, syncAll) == 0);
		worker.cancel();
		waitDone(app, worker);
		REQUIRE_FALSE(worker.isRunning());

		REQUIRE_FALSE(log.events.empty());
		CHECK(log.events.back().type == eSyncEvent::Done);
		CHECK(log.events.back().result == -ECANCELED);
		CHECK(log.hasMessage("Error: Cancelled"));
		CHECK(journalCount(journal, "STOR ") == 0);
		CHECK(journalCount(journal, "HTTP powerstate") == 0);
	}

	SECTION("a signal handler cancels through the cancel descriptor")
	{
		profile.http_notify_delay = 60000;
		eSyncWorker worker(&app, profile, connector);
		worker.event.connect(sigc::mem_fun(log, &eEventLog::add));
		REQUIRE(worker.getCancelFd() >= 0);

		struct sigaction act, old;
		memset(&act, 0, sizeof(act));
		act.sa_handler = cancelFromSignal;
		sigemptyset(&act.sa_mask);
		REQUIRE(sigaction(SIGUSR1, &act, &old) == 0);

		REQUIRE(worker.start(eSyncOrchestrator::opUpload, syncAll) == 0);
		signalCancelFd = worker.getCancelFd();
		raise(SIGUSR1);
		waitDone(app, worker);
		signalCancelFd = -1;
		sigaction(SIGUSR1, &old, NULL);

		REQUIRE_FALSE(worker.isRunning());
		REQUIRE_FALSE(log.events.empty());
		CHECK(log.events.back().result == -ECANCELED);
		CHECK(journalCount(journal, "STOR ") == 0);
	}
}
