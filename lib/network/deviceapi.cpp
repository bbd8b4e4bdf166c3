#include <errno.h>
#include <curl/curl.h>
#include <curl/easy.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <lib/base/eerror.h>
#include <lib/base/estring.h>
#include <lib/network/deviceapi.h>

void eDeviceApiResult::clear()
{
	error = 0;
	reason.clear();
	values.clear();
	list.clear();
	data.clear();
}

std::string eDeviceApiResult::get(const std::string &tag, const std::string &defaultvalue) const
{
	values_t::const_iterator it = values.find(tag);
	return it != values.end() ? it->second : defaultvalue;
}

RESULT iDeviceApi::sendMessage(const std::string &text, eDeviceApiResult &result)
{
	return send(MESSAGE, "text=" + urlEncode(text) + "&type=2&timeout=5", result);
}

RESULT iDeviceApi::sendKey(RemoteKey key, eDeviceApiResult &result)
{
	return send(REMOTE, getNum(key), result);
}

RESULT iDeviceApi::setPowerState(PowerState state, eDeviceApiResult &result)
{
	return send(POWER, getNum(state), result);
}

RESULT iDeviceApi::reloadServicelist(ReloadMode mode, eDeviceApiResult &result)
{
	return send(SERVICELIST_RELOAD, getNum(mode), result);
}

DEFINE_REF(eDeviceApi);

eDeviceApi::eDeviceApi(const std::string &host, int port, bool useSsl, const std::string &user, const std::string &password, int timeout)
	:m_base(getBaseUrl(host, port, useSsl)), m_user(user), m_password(password), m_timeout(timeout),
	m_token("0"), m_authenticate(false)
{
}

std::string eDeviceApi::getBaseUrl(const std::string &host, int port, bool useSsl)
{
	return std::string(useSsl ? "https" : "http") + "://" + host + ":" + getNum(port) + "/web/";
}

const char *eDeviceApi::getPath(Request req)
{
	switch (req)
	{
	case ZAP: return "zap?sRef=";
	case INFO: return "about";
	case SIGNAL: return "signal";
	case STREAM: return "stream.m3u?ref=";
	case STREAM_CURRENT: return "streamcurrent.m3u";
	case CURRENT: return "getcurrent";
	case POWER_STATE: return "powerstate";
	case TOKEN: return "session";
	case PLAY: return "mediaplayerplay?file=";
	case PLAYER_LIST: return "mediaplayerlist?path=playlist";
	case PLAYER_PLAY: return "mediaplayercmd?command=play";
	case PLAYER_NEXT: return "mediaplayercmd?command=next";
	case PLAYER_PREV: return "mediaplayercmd?command=previous";
	case PLAYER_STOP: return "mediaplayercmd?command=stop";
	case PLAYER_REMOVE: return "mediaplayerremove?file=";
	case POWER: return "powerstate?newstate=";
	case REMOTE: return "remotecontrol?command=";
	case VOL: return "vol?set=set";
	case EPG: return "epgservice?sRef=";
	case TIMER: return "";
	case TIMER_LIST: return "timerlist";
	case TIMER_ADD: return "timeradd?";
	case TIMER_CHANGE: return "timerchange?";
	case GRUB: return "grab?format=jpg&";
	case MESSAGE: return "message?";
	case SERVICELIST_RELOAD: return "servicelistreload?mode=";
	}
	return "";
}

static size_t curl_write_output(void *ptr, size_t size, size_t nmemb, void *stream) // NOSONAR
{
	std::string *response = (std::string*)stream;
	response->append((const char*)ptr, size * nmemb);
	return size * nmemb;
}

RESULT eDeviceApi::performRequest(const std::string &url, const std::string &body, bool authenticate, long &http_code, std::string &response)
{
	CURL *curl = curl_easy_init();
	if (!curl)
	{
		eDebug("[eDeviceApi] Failed to init curl.");
		response = "Failed to init curl";
		return -ENOMEM;
	}

	struct curl_slist *headers = curl_slist_append(NULL, "Content-Type: application/x-www-form-urlencoded");
	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	/* receivers use self signed certificates */
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, (long)m_timeout);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)m_timeout * 3);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	if (authenticate)
	{
		curl_easy_setopt(curl, CURLOPT_HTTPAUTH, (long)CURLAUTH_BASIC);
		curl_easy_setopt(curl, CURLOPT_USERNAME, m_user.c_str());
		curl_easy_setopt(curl, CURLOPT_PASSWORD, m_password.c_str());
	}
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &curl_write_output);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

	RESULT ret = 0;
	CURLcode res = curl_easy_perform(curl);
	switch (res)
	{
	case CURLE_OK:
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
		break;
	case CURLE_COULDNT_RESOLVE_HOST:
	case CURLE_COULDNT_CONNECT:
		ret = -ECONNREFUSED;
		break;
	case CURLE_OPERATION_TIMEDOUT:
		ret = -ETIMEDOUT;
		break;
	default:
		ret = -EIO;
		break;
	}
	if (ret)
	{
		eDebug("[eDeviceApi] %s failed with error (%s).", url.c_str(), curl_easy_strerror(res));
		response = curl_easy_strerror(res);
	}

	curl_slist_free_all(headers);
	curl_easy_cleanup(curl);
	return ret;
}

RESULT eDeviceApi::send(Request req, const std::string &params, eDeviceApiResult &result)
{
	std::string url = m_base + getPath(req) + params;
	std::string response;
	long http_code = 0;
	int challenges = 0;

	result.clear();
	while (1)
	{
		response.clear();
		eDebug("[eDeviceApi] POST %s", url.c_str());
		RESULT res = performRequest(url, "sessionid=" + m_token, m_authenticate, http_code, response);
		if (res)
		{
			result.error = -1;
			result.reason = response;
			return res;
		}
		if (http_code != 401)
			break;

		/* challenged: retry with credentials and a fresh session token */
		if (++challenges >= 3)
		{
			eWarning("[eDeviceApi] authentication for %s failed", url.c_str());
			result.error = -1;
			result.reason = "Authentication required";
			return -EACCES;
		}
		m_authenticate = true;
		if (req != TOKEN)
		{
			eDeviceApiResult token;
			res = send(TOKEN, "", token);
			if (res)
			{
				result.error = -1;
				result.reason = token.reason;
				return res;
			}
			m_token = token.get("e2sessionid", "0");
		}
	}

	if (http_code >= 400)
	{
		result.error = -1;
		result.reason = "HTTP error " + getNum(http_code);
		return -EIO;
	}
	return parseResponse(req, response, result);
}

/* text before the first child element, like ElementTree's text */
static std::string elementText(xmlNodePtr node)
{
	std::string text;
	for (xmlNodePtr child = node->children; child; child = child->next)
	{
		if (child->type == XML_ELEMENT_NODE)
			break;
		if ((child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) && child->content)
			text += (const char*)child->content;
	}
	return text;
}

/* the element and all elements below it, in document order */
static void flatten(xmlNodePtr node, eDeviceApiResult::values_t &values)
{
	values[(const char*)node->name] = elementText(node);
	for (xmlNodePtr child = node->children; child; child = child->next)
	{
		if (child->type == XML_ELEMENT_NODE)
			flatten(child, values);
	}
}

static void findElements(xmlNodePtr node, const char *name, std::vector<xmlNodePtr> &found)
{
	for (; node; node = node->next)
	{
		if (node->type != XML_ELEMENT_NODE)
			continue;
		if (!xmlStrcmp(node->name, BAD_CAST name))
			found.push_back(node);
		findElements(node->children, name, found);
	}
}

RESULT eDeviceApi::parseResponse(Request req, const std::string &response, eDeviceApiResult &result)
{
	switch (req)
	{
	case STREAM:
	case STREAM_CURRENT:
	case GRUB:
		result.data = response;
		return 0;
	default:
		break;
	}

	xmlDoc *doc = xmlReadMemory(response.data(), (int)response.size(), "response.xml", NULL, XML_PARSE_NONET);
	if (!doc)
	{
		eDebug("[eDeviceApi] couldn't parse response");
		result.error = -1;
		result.reason = "Malformed response";
		return -EINVAL;
	}

	xmlNodePtr root = xmlDocGetRootElement(doc);
	std::vector<xmlNodePtr> elements;
	switch (req)
	{
	case CURRENT:
		/* the running event is the first one */
		findElements(root, "e2event", elements);
		if (!elements.empty())
			flatten(elements[0], result.values);
		break;
	case PLAYER_LIST:
	case EPG:
	case TIMER_LIST:
		findElements(root, req == PLAYER_LIST ? "e2file" : req == EPG ? "e2event" : "e2timer", elements);
		for (std::vector<xmlNodePtr>::const_iterator it = elements.begin(); it != elements.end(); ++it)
		{
			eDeviceApiResult::values_t values;
			flatten(*it, values);
			result.list.push_back(values);
		}
		break;
	default:
		if (root)
			flatten(root, result.values);
		break;
	}
	xmlFreeDoc(doc);
	return 0;
}
