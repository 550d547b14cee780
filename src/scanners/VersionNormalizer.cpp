#include "VersionNormalizer.h"
#include <cctype>

namespace hulud_scan {

std::string normalize_version(const std::string& range){
    std::size_t i = 0;
    while(i < range.size() && !std::isdigit(static_cast<unsigned char>(range[i]))) ++i;
    return range.substr(i);
}

}
