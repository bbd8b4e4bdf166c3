#ifndef __lib_sync_conntest_h
#define __lib_sync_conntest_h

#include <string>
#include <lib/base/object.h>
#include <lib/sync/profile.h>

/*
 * one shot connectivity checks for the settings of a profile.
 * on success message holds what the receiver answered, on failure
 * the reason.
 */
RESULT testFtpConnection(const eSyncProfile &profile, std::string &message);
RESULT testTelnetConnection(const eSyncProfile &profile, std::string &message, int cancelfd = -1);
RESULT testHttpConnection(const eSyncProfile &profile, std::string &message);

#endif
