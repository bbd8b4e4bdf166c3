#ifndef __lib_network_telnet_h
#define __lib_network_telnet_h

#include <string>
#include <vector>
#include <time.h>
#include <lib/base/object.h>

/*
 * pauses and resumes the configuration owning process on the receiver
 * around a destructive upload.
 */
class iControlChannel: public iObject
{
public:
		/* connect and log in */
	virtual RESULT open()=0;
	virtual RESULT stopService()=0;
	virtual RESULT resumeService()=0;
	virtual void close()=0;
};

/*
 * login and command sequencing of a remote shell, without any I/O.
 * every transition hands out the steps the driver has to perform. the
 * shell gives no reliable completion sentinel, so the sequence relies
 * on fixed delays instead of acknowledgements.
 *
 *   Disconnected -> Connected -> Authenticating -> Ready
 *     -> Command1Sent -> Command2Sent -> Closed
 */
class eControlSession
{
public:
	enum State
	{
		stateDisconnected,
		stateConnected,
		stateAuthenticating,
		stateReady,
		stateCommand1Sent,
		stateCommand2Sent,
		stateClosed,
		stateFailed
	};

	struct Step
	{
		enum Type
		{
			Send,		/* write data */
			WaitFor,	/* read until data shows up or timeout passed, a timeout is no error */
			Delay,		/* sleep timeout, never interrupted */
			Collect		/* take whatever arrived so far as output */
		};
		Type type;
		std::string data;
		long timeout;	/* ms */
		Step(Type type, const std::string &data, long timeout)
			:type(type), data(data), timeout(timeout)
		{
		}
	};

	/* timeout in seconds */
	eControlSession(const std::string &user, const std::string &password, int timeout);

	State getState() const { return m_state; }
	static const char *stateName(State state);

	/* each transition returns -EINVAL when it isn't allowed in the current state */
	RESULT connected(std::vector<Step> &steps);
	RESULT login(std::vector<Step> &steps);
		/* login sequence of the connectivity test, ends with a Collect step */
	RESULT testLogin(std::vector<Step> &steps);
	RESULT loggedIn();
		/* the first call is the stop command, the second the resume command */
	RESULT command(const std::string &cmd, std::vector<Step> &steps);
	void closed();
	void failed();
private:
	State m_state;
	std::string m_user;
	std::string m_password;
	long m_delay;
};

/* strips telnet option negotiation and refuses every option */
class eTelnetFilter
{
	enum { stData, stIAC, stOption, stSub, stSubIAC } m_state;
	unsigned char m_command;
public:
	enum { SE=240, SB=250, WILL=251, WONT=252, DO=253, DONT=254, IAC=255 };
	eTelnetFilter(): m_state(stData), m_command(0) { }
	/* appends the payload of data to text and the answers to send back to answer */
	void process(const char *data, size_t len, std::string &text, std::string &answer);
};

class eTelnetControl: public iControlChannel
{
	DECLARE_REF(eTelnetControl);
	std::string m_host;
	int m_port;
	int m_timeout;
	int m_cancelfd;
	int m_fd;
	eControlSession m_session;
	eTelnetFilter m_filter;
	std::string m_transcript;
	size_t m_consumed;
	std::string m_output;

	RESULT connectSocket();
	RESULT perform(const std::vector<eControlSession::Step> &steps);
	RESULT readChunk();
	RESULT waitFor(const std::string &prompt, const timespec &deadline);
	void collect();
	bool isCancelled() const;
public:
	/* timeout in seconds, cancelfd may be -1 */
	eTelnetControl(const std::string &host, int port, const std::string &user, const std::string &password, int timeout, int cancelfd = -1);
	~eTelnetControl();

	RESULT open();
	RESULT stopService();
	RESULT resumeService();
	void close();

	eControlSession::State getState() const { return m_session.getState(); }
	const std::string &getOutput() const { return m_output; }

	/*
	 * logs in once and returns the shell output in banner. the login
	 * is considered failed (-EACCES) when that output still asks for a password.
	 */
	static RESULT test(const std::string &host, int port, const std::string &user, const std::string &password, int timeout, std::string &banner, int cancelfd = -1);
};

#endif
