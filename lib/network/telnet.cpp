#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <lib/base/ebase.h>
#include <lib/base/eerror.h>
#include <lib/base/estring.h>
#include <lib/base/wrappers.h>
#include <lib/network/telnet.h>

eControlSession::eControlSession(const std::string &user, const std::string &password, int timeout)
	:m_state(stateDisconnected), m_user(user), m_password(password), m_delay(timeout * 1000L)
{
}

const char *eControlSession::stateName(State state)
{
	switch (state)
	{
	case stateDisconnected: return "disconnected";
	case stateConnected: return "connected";
	case stateAuthenticating: return "authenticating";
	case stateReady: return "ready";
	case stateCommand1Sent: return "command 1 sent";
	case stateCommand2Sent: return "command 2 sent";
	case stateClosed: return "closed";
	case stateFailed: return "failed";
	}
	return "unknown";
}

RESULT eControlSession::connected(std::vector<Step> &steps)
{
	if (m_state != stateDisconnected)
		return -EINVAL;
	m_state = stateConnected;
	/* the shell needs a moment before it prints its prompt */
	steps.push_back(Step(Step::Delay, "", 1000));
	return 0;
}

RESULT eControlSession::login(std::vector<Step> &steps)
{
	if (m_state != stateConnected)
		return -EINVAL;
	m_state = stateAuthenticating;
	if (!m_user.empty())
	{
		steps.push_back(Step(Step::WaitFor, "login: ", m_delay));
		steps.push_back(Step(Step::Send, m_user + "\n", 0));
		steps.push_back(Step(Step::Delay, "", m_delay));
	}
	if (!m_password.empty())
	{
		steps.push_back(Step(Step::WaitFor, "Password: ", m_delay));
		steps.push_back(Step(Step::Send, m_password + "\n", 0));
		steps.push_back(Step(Step::Delay, "", m_delay));
	}
	return 0;
}

RESULT eControlSession::testLogin(std::vector<Step> &steps)
{
	if (m_state != stateConnected)
		return -EINVAL;
	m_state = stateAuthenticating;
	steps.push_back(Step(Step::WaitFor, "login: ", 2000));
	steps.push_back(Step(Step::Send, m_user + "\r", 0));
	steps.push_back(Step(Step::Delay, "", m_delay));
	steps.push_back(Step(Step::WaitFor, "Password: ", 2000));
	steps.push_back(Step(Step::Send, m_password + "\r", 0));
	steps.push_back(Step(Step::Delay, "", m_delay));
	steps.push_back(Step(Step::Collect, "", 0));
	return 0;
}

RESULT eControlSession::loggedIn()
{
	if (m_state != stateAuthenticating)
		return -EINVAL;
	m_state = stateReady;
	return 0;
}

RESULT eControlSession::command(const std::string &cmd, std::vector<Step> &steps)
{
	switch (m_state)
	{
	case stateReady:
		m_state = stateCommand1Sent;
		steps.push_back(Step(Step::Send, cmd + "\r\n", 0));
		steps.push_back(Step(Step::Delay, "", m_delay));
		return 0;
	case stateCommand1Sent:
		m_state = stateCommand2Sent;
		steps.push_back(Step(Step::Delay, "", m_delay));
		steps.push_back(Step(Step::Send, cmd + "\r\n", 0));
		steps.push_back(Step(Step::Delay, "", m_delay));
		return 0;
	default:
		return -EINVAL;
	}
}

void eControlSession::closed()
{
	m_state = stateClosed;
}

void eControlSession::failed()
{
	m_state = stateFailed;
}

void eTelnetFilter::process(const char *data, size_t len, std::string &text, std::string &answer)
{
	for (size_t i = 0; i < len; ++i)
	{
		unsigned char c = data[i];
		switch (m_state)
		{
		case stData:
			if (c == IAC)
				m_state = stIAC;
			else
				text += (char)c;
			break;
		case stIAC:
			switch (c)
			{
			case IAC:
				text += (char)c;
				m_state = stData;
				break;
			case DO:
			case DONT:
			case WILL:
			case WONT:
				m_command = c;
				m_state = stOption;
				break;
			case SB:
				m_state = stSub;
				break;
			default:
				m_state = stData;
				break;
			}
			break;
		case stOption:
			answer += (char)IAC;
			answer += (char)((m_command == DO || m_command == DONT) ? WONT : DONT);
			answer += (char)c;
			m_state = stData;
			break;
		case stSub:
			if (c == IAC)
				m_state = stSubIAC;
			break;
		case stSubIAC:
			m_state = (c == SE) ? stData : stSub;
			break;
		}
	}
}

DEFINE_REF(eTelnetControl);

eTelnetControl::eTelnetControl(const std::string &host, int port, const std::string &user, const std::string &password, int timeout, int cancelfd)
	:m_host(host), m_port(port), m_timeout(timeout), m_cancelfd(cancelfd), m_fd(-1),
	m_session(user, password, timeout), m_consumed(0)
{
}

eTelnetControl::~eTelnetControl()
{
	close();
}

bool eTelnetControl::isCancelled() const
{
	return m_cancelfd >= 0 && waitReadable(m_cancelfd, -1, 0) > 0;
}

RESULT eTelnetControl::connectSocket()
{
	m_fd = Connect(m_host.c_str(), m_port, m_timeout);
	if (m_fd < 0)
	{
		eWarning("[eTelnetControl] telnet error: couldn't connect to %s:%d", m_host.c_str(), m_port);
		m_session.failed();
		return -ECONNREFUSED;
	}
	std::vector<eControlSession::Step> steps;
	RESULT res = m_session.connected(steps);
	if (!res)
		res = perform(steps);
	return res;
}

RESULT eTelnetControl::readChunk()
{
	char buf[1024];
	ssize_t r = singleRead(m_fd, buf, sizeof(buf));
	if (r < 0)
		return -EIO;
	if (r == 0)
		return -ECONNRESET;
	std::string text, answer;
	m_filter.process(buf, r, text, answer);
	m_transcript += text;
	if (!answer.empty() && writeAll(m_fd, answer.data(), answer.size()) < 0)
		return -EPIPE;
	return 0;
}

RESULT eTelnetControl::waitFor(const std::string &prompt, const timespec &deadline)
{
	while (1)
	{
		size_t pos = m_transcript.find(prompt, m_consumed);
		if (pos != std::string::npos)
		{
			m_consumed = pos + prompt.size();
			return 0;
		}
		long ms = timeout_msec(deadline, monotonicNow());
		if (ms == 0)
		{
			eDebug("[eTelnetControl] no '%s' prompt, continuing", prompt.c_str());
			m_consumed = m_transcript.size();
			return 0;
		}
		int ret = waitReadable(m_fd, -1, ms);
		if (ret < 0)
			return ret;
		if (ret > 0)
		{
			RESULT res = readChunk();
			if (res)
				return res;
		}
	}
}

void eTelnetControl::collect()
{
	while (waitReadable(m_fd, -1, 0) > 0)
	{
		if (readChunk())
			break;
	}
	m_output = stripInvalidUTF8(m_transcript.substr(m_consumed));
	m_consumed = m_transcript.size();
}

RESULT eTelnetControl::perform(const std::vector<eControlSession::Step> &steps)
{
	for (std::vector<eControlSession::Step>::const_iterator step = steps.begin(); step != steps.end(); ++step)
	{
		if (isCancelled())
		{
			eDebug("[eTelnetControl] cancelled in state %s", eControlSession::stateName(m_session.getState()));
			return -ECANCELED;
		}

		timespec deadline = monotonicNow() + step->timeout;
		RESULT res = 0;
		switch (step->type)
		{
		case eControlSession::Step::Send:
			if (writeAll(m_fd, step->data.data(), step->data.size()) < 0)
				res = -EPIPE;
			break;
		case eControlSession::Step::WaitFor:
			res = waitFor(step->data, deadline);
			break;
		case eControlSession::Step::Delay:
			for (long ms = timeout_msec(deadline, monotonicNow()); ms > 0; ms = timeout_msec(deadline, monotonicNow()))
			{
				if (waitReadable(-1, -1, ms) < 0)
					break;
			}
			break;
		case eControlSession::Step::Collect:
			collect();
			break;
		}
		if (res)
		{
			eWarning("[eTelnetControl] telnet error in state %s: %s", eControlSession::stateName(m_session.getState()), strerror(-res));
			m_session.failed();
			return res;
		}
	}
	return 0;
}

RESULT eTelnetControl::open()
{
	RESULT res = connectSocket();
	if (res)
		return res;
	std::vector<eControlSession::Step> steps;
	res = m_session.login(steps);
	if (!res)
		res = perform(steps);
	if (!res)
		res = m_session.loggedIn();
	return res;
}

RESULT eTelnetControl::stopService()
{
	std::vector<eControlSession::Step> steps;
	RESULT res = m_session.command("init 4", steps);
	if (res)
	{
		eWarning("[eTelnetControl] can't stop service in state %s", eControlSession::stateName(m_session.getState()));
		return res;
	}
	return perform(steps);
}

RESULT eTelnetControl::resumeService()
{
	std::vector<eControlSession::Step> steps;
	RESULT res = m_session.command("init 3", steps);
	if (res)
	{
		eWarning("[eTelnetControl] can't resume service in state %s", eControlSession::stateName(m_session.getState()));
		return res;
	}
	return perform(steps);
}

void eTelnetControl::close()
{
	if (m_fd >= 0)
	{
		::close(m_fd);
		m_fd = -1;
	}
	if (m_session.getState() != eControlSession::stateFailed)
		m_session.closed();
}

RESULT eTelnetControl::test(const std::string &host, int port, const std::string &user, const std::string &password, int timeout, std::string &banner, int cancelfd)
{
	ePtr<eTelnetControl> tn = new eTelnetControl(host, port, user, password, timeout, cancelfd);
	RESULT res = tn->connectSocket();
	if (res)
	{
		banner = "Connection refused";
		return res;
	}

	std::vector<eControlSession::Step> steps;
	res = tn->m_session.testLogin(steps);
	if (!res)
		res = tn->perform(steps);
	banner = strip(tn->m_output);
	tn->close();
	if (res)
		return res;

	eLog(lvlInfo, "[eTelnetControl] %s", banner.c_str());
	if (containsNoCase(banner, "password"))
	{
		eWarning("[eTelnetControl] login to %s failed", host.c_str());
		return -EACCES;
	}
	return 0;
}
