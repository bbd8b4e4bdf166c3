#include <errno.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <string>
#include <vector>
#include <curl/curl.h>
#include <libsig_comp.h>

#include <lib/base/cfile.h>
#include <lib/base/ebase.h>
#include <lib/base/eerror.h>
#include <lib/base/esimpleconfig.h>
#include <lib/base/estring.h>
#include <lib/dvb/db.h>
#include <lib/dvb/satxml.h>
#include <lib/network/deviceapi.h>
#include <lib/sync/conntest.h>
#include <lib/sync/orchestrator.h>
#include <lib/sync/profile.h>
#include <lib/sync/syncworker.h>

static volatile sig_atomic_t cancelFd = -1;
static bool syncFailed;

static void usage()
{
	fprintf(stderr,
		"usage: e2sync [-c settings] [-p profile] [-d level] <command> [args]\n"
		"\n"
		"commands:\n"
		"  info                           show the profile settings\n"
		"  show [services]                show the local copy of the receiver's lists\n"
		"  test-ftp | test-telnet | test-http\n"
		"  download <subset> [picons...]  subsets: all bouquets satellites picons epg\n"
		"  upload <subset> [picons...]\n"
		"  remove-picons [picons...]\n"
		"  message <text>\n"
		"  power <toggle|deep-standby|reboot|restart-gui|wakeup|standby>\n"
		"  key <up|down|left|right|ok|menu|exit|red|green|yellow|blue>\n");
}

static void sigintHandler(int)
{
	static const uint64_t one = 1;
	/* nothing but the write is async signal safe here, a failed write can't be reported */
	if (cancelFd >= 0 && ::write(cancelFd, &one, sizeof(one)) < 0)
		return;
}

static void gotSyncEvent(const eSyncEvent &event)
{
	switch (event.type)
	{
	case eSyncEvent::Progress:
		printf("%s\n", event.message.c_str());
		fflush(stdout);
		break;
	case eSyncEvent::Error:
		syncFailed = true;
		fprintf(stderr, "%s\n", event.message.c_str());
		break;
	case eSyncEvent::Done:
		if (event.result)
			syncFailed = true;
		eApp->quit(syncFailed ? 1 : 0);
		break;
	}
}

static void saveLog(const eSyncProfile &profile)
{
	std::string dir = profile.getLocalDataPath();
	std::string file = dir + "e2sync.log";
	if (CFile::makeDirs(dir) || CFile::writeStr(file, getLogBuffer()))
	{
		eWarning("[e2sync] couldn't write %s", file.c_str());
		return;
	}
	fprintf(stderr, "log written to %s\n", file.c_str());
}

static int runSync(const eSyncProfile &profile, eSyncOrchestrator::Operation op, eSyncType type, const std::vector<std::string> &filter)
{
	eApplication app;
	eSyncWorker worker(&app, profile, new eSyncConnector);
	worker.event.connect(sigc::ptr_fun(&gotSyncEvent));

	RESULT res = worker.start(op, type, filter);
	if (res)
	{
		fprintf(stderr, "Error: %s\n", res == -EBUSY ? "a sync for this profile is already running" : strerror(-res));
		return 1;
	}

	struct sigaction act;
	memset(&act, 0, sizeof(act));
	act.sa_handler = sigintHandler;
	sigemptyset(&act.sa_mask);
	cancelFd = worker.getCancelFd();
	sigaction(SIGINT, &act, NULL);
	sigaction(SIGTERM, &act, NULL);

	int ret = app.runLoop();

	signal(SIGINT, SIG_DFL);
	signal(SIGTERM, SIG_DFL);
	cancelFd = -1;
	if (ret)
		saveLog(profile);
	return ret;
}

static int showInfo(const eSyncProfile &profile)
{
	printf("settings:       %s\n", eSimpleConfig::getFile().c_str());
	std::vector<std::string> profiles = eSyncProfile::getProfiles();
	std::string names;
	for (std::vector<std::string>::const_iterator it = profiles.begin(); it != profiles.end(); ++it)
		names += (names.empty() ? "" : ", ") + *it;
	printf("profiles:       %s\n", names.empty() ? "-" : names.c_str());
	printf("profile:        %s\n", profile.name.c_str());
	printf("host:           %s\n", profile.host.c_str());
	printf("user:           %s\n", profile.user.c_str());
	printf("ftp port:       %d\n", profile.ftp_port);
	printf("telnet port:    %d (timeout %ds)\n", profile.telnet_port, profile.telnet_timeout);
	printf("http port:      %d%s\n", profile.http_port, profile.http_use_ssl ? " (ssl)" : "");
	printf("control:        %s\n", profile.control == eSyncProfile::controlHttp ? "http" : "telnet");
	printf("services path:  %s\n", profile.services_path.c_str());
	printf("satellites:     %s\n", profile.satellites_path.c_str());
	printf("picons path:    %s\n", profile.picons_path.c_str());
	printf("local data:     %s\n", profile.getLocalDataPath().c_str());
	printf("local picons:   %s\n", profile.getLocalPiconPath().c_str());
	return 0;
}

static int showLists(const eSyncProfile &profile, bool services)
{
	std::string dir = profile.getLocalDataPath();
	eDVBDB db;
	RESULT res = db.loadServicelist(dir + "lamedb");
	if (res)
	{
		fprintf(stderr, "Error: can't read %slamedb: %s\n", dir.c_str(), strerror(-res));
		return 1;
	}
	res = db.loadBouquets(dir);
	if (res)
		eWarning("[e2sync] no bouquets in %s", dir.c_str());

	printf("%d transponders, %d services\n", (int)db.m_channels.size(), (int)db.m_services.size());
	if (services)
	{
		for (std::map<eDVBServiceID, eDVBService>::const_iterator it = db.m_services.begin(); it != db.m_services.end(); ++it)
		{
			eServiceReference ref = it->first.toReference();
			printf("%-32s %-12s %s %s\n", it->second.m_service_name.c_str(), getServiceTypeName(it->first.service_type),
				ref.toString().c_str(), ref.getPiconName().c_str());
		}
	}

	for (std::map<std::string, eBouquet>::const_iterator it = db.m_bouquets.begin(); it != db.m_bouquets.end(); ++it)
		printf("%-40s %4d  %s\n", it->first.c_str(), (int)it->second.m_services.size(), it->second.m_bouquet_name.c_str());

	std::vector<eSatellite> satellites;
	if (CFile::exists(dir + "satellites.xml") && !eSatellitesXml::load(dir + "satellites.xml", satellites))
		printf("%d satellites in satellites.xml\n", (int)satellites.size());
	return 0;
}

static int runTest(const eSyncProfile &profile, const std::string &command)
{
	std::string message;
	RESULT res;
	if (command == "test-ftp")
		res = testFtpConnection(profile, message);
	else if (command == "test-telnet")
		res = testTelnetConnection(profile, message);
	else
		res = testHttpConnection(profile, message);

	if (res)
	{
		fprintf(stderr, "Error: %s\n", message.c_str());
		return 1;
	}
	printf("%s\n", message.c_str());
	return 0;
}

static int lookup(const char *const names[], int count, const std::string &name)
{
	for (int i = 0; i < count; ++i)
	{
		if (!strcasecmp(name, std::string(names[i])))
			return i;
	}
	return -1;
}

static int runControl(const eSyncProfile &profile, const std::string &command, const std::vector<std::string> &args)
{
	static const char *const powerNames[] = { "toggle", "deep-standby", "reboot", "restart-gui", "wakeup", "standby" };
	static const char *const keyNames[] = { "up", "left", "right", "down", "menu", "exit", "ok", "red", "green", "yellow", "blue" };
	static const iDeviceApi::RemoteKey keys[] =
	{
		iDeviceApi::keyUp, iDeviceApi::keyLeft, iDeviceApi::keyRight, iDeviceApi::keyDown, iDeviceApi::keyMenu,
		iDeviceApi::keyExit, iDeviceApi::keyOk, iDeviceApi::keyRed, iDeviceApi::keyGreen, iDeviceApi::keyYellow, iDeviceApi::keyBlue
	};

	if (args.empty())
	{
		usage();
		return 2;
	}

	ePtr<iDeviceApi> api;
	ePtr<iSyncConnector> connector = new eSyncConnector;
	RESULT res = connector->createDeviceApi(profile, api);
	if (res)
		return 1;

	eDeviceApiResult result;
	if (command == "message")
	{
		std::string text;
		for (std::vector<std::string>::const_iterator it = args.begin(); it != args.end(); ++it)
			text += (text.empty() ? "" : " ") + *it;
		res = api->sendMessage(text, result);
	}
	else if (command == "power")
	{
		int state = lookup(powerNames, sizeof(powerNames) / sizeof(*powerNames), args[0]);
		if (state < 0)
		{
			usage();
			return 2;
		}
		res = api->setPowerState((iDeviceApi::PowerState)state, result);
	}
	else
	{
		int key = lookup(keyNames, sizeof(keyNames) / sizeof(*keyNames), args[0]);
		if (key < 0)
		{
			usage();
			return 2;
		}
		res = api->sendKey(keys[key], result);
	}

	if (res)
	{
		fprintf(stderr, "Error: %s\n", result.reason.empty() ? strerror(-res) : result.reason.c_str());
		return 1;
	}
	std::string state = result.get("e2result", result.get("e2instandby"));
	std::string text = result.get("e2resulttext");
	if (!state.empty() || !text.empty())
		printf("%s %s\n", state.c_str(), text.c_str());
	return 0;
}

int main(int argc, char **argv)
{
	debugLvl = getenv("E2SYNC_DEBUG_LVL") ? atoi(getenv("E2SYNC_DEBUG_LVL")) : DEFAULT_DEBUG_LVL;

	std::string settings, profileName;
	int c;
	while ((c = getopt(argc, argv, "c:p:d:h")) != -1)
	{
		switch (c)
		{
		case 'c':
			settings = optarg;
			break;
		case 'p':
			profileName = optarg;
			break;
		case 'd':
			debugLvl = atoi(optarg);
			break;
		case 'h':
			usage();
			return 0;
		default:
			usage();
			return 2;
		}
	}
	if (debugLvl < 0)
		debugLvl = 0;

	if (optind >= argc)
	{
		usage();
		return 2;
	}
	std::string command = argv[optind++];
	std::vector<std::string> args(argv + optind, argv + argc);

	if (!settings.empty())
		eSimpleConfig::setFile(settings);
	if (profileName.empty())
		profileName = eSyncProfile::getDefaultProfile();

	if (eSatellitesXml::validateTables())
	{
		eLog(lvlError, "[e2sync] broken satellites.xml lookup tables");
		return 1;
	}

	eSyncProfile profile;
	if (eSyncProfile::load(profileName, profile))
	{
		fprintf(stderr, "Error: unknown profile '%s'\n", profileName.c_str());
		return 1;
	}
	eDebug("[e2sync] debug level %d, profile %s", debugLvl, profile.name.c_str());

	if (command == "info")
		return showInfo(profile);
	if (command == "show")
		return showLists(profile, !args.empty() && args[0] == "services");

	if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
	{
		fprintf(stderr, "Error: couldn't initialize libcurl\n");
		return 1;
	}

	int ret;
	if (command == "test-ftp" || command == "test-telnet" || command == "test-http")
		ret = runTest(profile, command);
	else if (command == "message" || command == "power" || command == "key")
		ret = runControl(profile, command, args);
	else if (command == "download" || command == "upload")
	{
		eSyncType type;
		if (args.empty() || parseSyncType(args[0], type))
		{
			usage();
			ret = 2;
		}
		else
		{
			std::vector<std::string> filter(args.begin() + 1, args.end());
			ret = runSync(profile, command == "download" ? eSyncOrchestrator::opDownload : eSyncOrchestrator::opUpload, type, filter);
		}
	}
	else if (command == "remove-picons")
		ret = runSync(profile, eSyncOrchestrator::opRemovePicons, syncPicons, args);
	else
	{
		usage();
		ret = 2;
	}

	curl_global_cleanup();
	return ret;
}
