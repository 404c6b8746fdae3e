#include "Config.h"

namespace pattern_harness {

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for(char c : s) {
        if(c == ',') {
            if(!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

}
