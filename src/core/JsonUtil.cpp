#include "JsonUtil.h"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace pattern_harness {
namespace jsonutil {

std::string escape(const std::string& s) {
    std::ostringstream os;
    for(char c : s) {
        switch(c) {
            case '"': os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20) {
                    os << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    os << c;
                }
        }
    }
    return os.str();
}

std::string time_to_iso(std::chrono::system_clock::time_point tp) {
    if(tp.time_since_epoch().count() == 0) return "";
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    if(std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) return "";
    return buf;
}

}
}
