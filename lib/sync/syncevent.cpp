#include <errno.h>

#include <lib/base/estring.h>
#include <lib/sync/syncevent.h>

static const char *syncTypeNames[] = { "all", "bouquets", "satellites", "picons", "epg" };

const char *getSyncTypeName(eSyncType type)
{
	if (type < syncAll || type > syncEpg)
		return "unknown";
	return syncTypeNames[type];
}

RESULT parseSyncType(const std::string &name, eSyncType &type)
{
	for (int i = syncAll; i <= syncEpg; ++i)
	{
		if (!strcasecmp(name, std::string(syncTypeNames[i])))
		{
			type = (eSyncType)i;
			return 0;
		}
	}
	return -EINVAL;
}

eSyncEvent eSyncEvent::progress(const std::string &message)
{
	eSyncEvent event;
	event.message = message;
	return event;
}

eSyncEvent eSyncEvent::error(RESULT result, const std::string &reason)
{
	eSyncEvent event;
	event.type = Error;
	event.message = "Error: " + reason;
	event.result = result;
	return event;
}

eSyncEvent eSyncEvent::done(eSyncType subset, RESULT result)
{
	eSyncEvent event;
	event.type = Done;
	event.subset = subset;
	event.result = result;
	return event;
}
