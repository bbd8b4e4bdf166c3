#ifndef __E_STRING__
#define __E_STRING__

#include <vector>
#include <string>

std::string getNum(int num, int base=10);
std::string getHex(unsigned int num, int width=0, bool upper=false);

std::string urlDecode(const std::string &s);
/* application/x-www-form-urlencoded value encoding, space becomes '+' */
std::string urlEncode(const std::string &s);
std::vector<std::string> split(std::string s, const std::string& separator);
int strcasecmp(const std::string& s1, const std::string& s2);
bool containsNoCase(const std::string &str, const std::string &substr);
std::string strip(const std::string &s);
bool isDigits(const std::string &s);
bool isInteger(const std::string &s);
/* drops every byte which is not part of a valid UTF-8 sequence */
std::string stripInvalidUTF8(const std::string &s);

#endif // __E_STRING__
