//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// network/host_resolver.cpp
//===----------------------------------------------------------------------===//

#include "network/host_resolver.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"
#include <regex>
#include <sstream>
#include <iomanip>

namespace exaconn {

namespace {

// Lazy prefix so that the digits directly before ".." form the lower bound
const std::regex& HostRangePattern() {
    static const std::regex pattern(R"(^(.+?)(\d+)\.\.(\d+)$)");
    return pattern;
}

void ExpandEntry(const std::string& entry, std::vector<std::string>& hosts) {
    std::smatch match;
    if (!std::regex_match(entry, match, HostRangePattern())) {
        hosts.push_back(entry);
        return;
    }

    const std::string prefix = match[1].str();
    const std::string low_text = match[2].str();
    const std::string high_text = match[3].str();

    unsigned long long low = 0;
    unsigned long long high = 0;
    try {
        low = std::stoull(low_text);
        high = std::stoull(high_text);
    } catch (const std::out_of_range&) {
        throw InvalidArgumentError(error_code::INVALID_HOST_RANGE,
                                   "invalid host range limits: '" + entry + "'");
    }

    if (high < low) {
        throw InvalidArgumentError(error_code::INVALID_HOST_RANGE,
                                   "invalid host range limits: '" + entry + "'");
    }

    for (unsigned long long i = low; i <= high; ++i) {
        std::ostringstream oss;
        oss << prefix << std::setw(static_cast<int>(low_text.size())) << std::setfill('0') << i;
        hosts.push_back(oss.str());
    }
}

} // namespace

std::vector<std::string> ResolveHosts(const std::string& spec) {
    std::vector<std::string> hosts;

    size_t start = 0;
    while (start <= spec.size()) {
        size_t end = spec.find(',', start);
        if (end == std::string::npos) {
            end = spec.size();
        }
        std::string entry = spec.substr(start, end - start);
        entry.erase(0, entry.find_first_not_of(" \t"));
        entry.erase(entry.find_last_not_of(" \t") + 1);
        if (!entry.empty()) {
            ExpandEntry(entry, hosts);
        }
        start = end + 1;
    }

    ELOG_DEBUG("resolver", "resolved '{}' to {} candidate(s)", spec, hosts.size());
    return hosts;
}

} // namespace exaconn
