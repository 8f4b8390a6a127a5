// Small string helpers shared by the parser, config and guard.
#pragma once
#include <cctype>
#include <string>

namespace autobuilder::util {

inline std::string trim(const std::string& s) {
    size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a,b-a);
}

inline std::string rtrim(const std::string& s) {
    size_t b=s.size(); while(b>0 && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(0,b);
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size()>=prefix.size() && s.compare(0,prefix.size(),prefix)==0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size()>=suffix.size() && s.compare(s.size()-suffix.size(),suffix.size(),suffix)==0;
}

} // namespace autobuilder::util
