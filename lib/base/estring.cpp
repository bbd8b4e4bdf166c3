#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <strings.h>
#include <lib/base/estring.h>

std::string getNum(int val, int sys)
{
//	Returns a string that contain the value val as string
//	if sys == 16 than hexadezimal if sys == 10 than decimal
	char buf[12];

	if (sys == 16)
		snprintf(buf, 12, "%X", val);
	else
		snprintf(buf, 12, "%i", val);

	return std::string(buf);
}

std::string getHex(unsigned int val, int width, bool upper)
{
	char buf[16];
	snprintf(buf, sizeof(buf), upper ? "%0*X" : "%0*x", width, val);
	return std::string(buf);
}

std::string urlDecode(const std::string &s)
{
	int len = s.size();
	std::string res;
	int i;
	for (i = 0; i < len; ++i)
	{
		unsigned char c = s[i];
		if (c != '%')
		{
			res += c;
		}
		else
		{
			i += 2;
			if (i >= len)
				break;
			char t[3] = {s[i - 1], s[i], 0};
			unsigned char r = strtoul(t, 0, 0x10);
			if (r)
				res += r;
		}
	}
	return res;
}

std::string urlEncode(const std::string &s)
{
	std::string res;
	for (std::string::const_iterator i(s.begin()); i != s.end(); ++i)
	{
		unsigned char c = *i;
		if (isalnum(c) || c == '_' || c == '.' || c == '-' || c == '~')
			res += c;
		else if (c == ' ')
			res += '+';
		else
		{
			char hex[4];
			snprintf(hex, sizeof(hex), "%%%02X", c);
			res += hex;
		}
	}
	return res;
}

std::vector<std::string> split(std::string s, const std::string& separator)
{
	std::vector<std::string> tokens;
	std::string token;
	size_t pos;
	while ((pos = s.find(separator)) != std::string::npos)
	{
		token = s.substr(0, pos);
		tokens.push_back(token);
		s.erase(0, pos + separator.length());
	}
	tokens.push_back(s);
	return tokens;
}

int strcasecmp(const std::string& s1, const std::string& s2)
{
	return ::strcasecmp(s1.c_str(), s2.c_str());
}

bool containsNoCase(const std::string &str, const std::string &substr)
{
	std::string a(str), b(substr);
	for (size_t i = 0; i < a.size(); ++i)
		a[i] = tolower((unsigned char)a[i]);
	for (size_t i = 0; i < b.size(); ++i)
		b[i] = tolower((unsigned char)b[i]);
	return a.find(b) != std::string::npos;
}

std::string strip(const std::string &s)
{
	size_t begin = s.find_first_not_of(" \t\r\n");
	if (begin == std::string::npos)
		return std::string();
	size_t end = s.find_last_not_of(" \t\r\n");
	return s.substr(begin, end - begin + 1);
}

bool isDigits(const std::string &s)
{
	if (s.empty())
		return false;
	for (size_t i = 0; i < s.size(); ++i)
		if (!isdigit((unsigned char)s[i]))
			return false;
	return true;
}

bool isInteger(const std::string &s)
{
	std::string t = strip(s);
	if (!t.empty() && (t[0] == '-' || t[0] == '+'))
		t.erase(0, 1);
	return isDigits(t);
}

std::string stripInvalidUTF8(const std::string &s)
{
	std::string res;
	size_t len = s.size();
	size_t i = 0;
	while (i < len)
	{
		unsigned char c = s[i];
		int extra;
		if (c < 0x80)
			extra = 0;
		else if ((c & 0xE0) == 0xC0 && c >= 0xC2)
			extra = 1;
		else if ((c & 0xF0) == 0xE0)
			extra = 2;
		else if ((c & 0xF8) == 0xF0 && c <= 0xF4)
			extra = 3;
		else
		{
			++i; // stray continuation or invalid lead byte
			continue;
		}
		if (extra && i + extra >= len)
		{
			++i;
			continue;
		}
		bool valid = true;
		for (int j = 1; j <= extra; ++j)
			if (((unsigned char)s[i + j] & 0xC0) != 0x80)
				valid = false;
		if (valid)
		{
			res.append(s, i, extra + 1);
			i += extra + 1;
		}
		else
			++i;
	}
	return res;
}
