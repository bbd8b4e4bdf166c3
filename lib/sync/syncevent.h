#ifndef __lib_sync_syncevent_h
#define __lib_sync_syncevent_h

#include <string>
#include <lib/base/object.h>

/* which part of the configuration a sync moves */
enum eSyncType
{
	syncAll = 0,
	syncBouquets,
	syncSatellites,
	syncPicons,
	syncEpg
};

const char *getSyncTypeName(eSyncType type);
/* "all", "bouquets", "satellites", "picons" or "epg", -EINVAL otherwise */
RESULT parseSyncType(const std::string &name, eSyncType &type);

/*
 * status of a running sync. Error carries the "Error: " prefixed
 * reason in message, Done is always the last event of a sync.
 */
struct eSyncEvent
{
	enum Type { Progress, Error, Done };

	Type type;
	std::string message;
	eSyncType subset;
	RESULT result;

	eSyncEvent(): type(Progress), subset(syncAll), result(0) { }

	static eSyncEvent progress(const std::string &message);
	static eSyncEvent error(RESULT result, const std::string &reason);
	static eSyncEvent done(eSyncType subset, RESULT result);
};

#endif
