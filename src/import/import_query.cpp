//===----------------------------------------------------------------------===//
//                         ExaConn Client
//
// import/import_query.cpp
//===----------------------------------------------------------------------===//

#include "import/import_query.hpp"
#include "common.hpp"
#include <vector>
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace exaconn {

namespace {

const std::regex& ImportPattern() {
    static const std::regex pattern(R"(^\s*IMPORT\b[\s\S]*\bFROM\s+LOCAL\s+CSV\b)",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& LocalCsvPattern() {
    static const std::regex pattern(R"(FROM\s+LOCAL\s+CSV\s*)",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

// Group 2 holds the path
const std::regex& FilePattern() {
    static const std::regex pattern(R"(\bFILE\s+(["'])([^"']*)\1 ?)",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& RowSeparatorPattern() {
    static const std::regex pattern(R"(ROW\s+SEPARATOR\s*=\s*(["'])(\w+)\1)",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

} // anonymous namespace

bool IsImportQuery(const std::string& query) {
    return std::regex_search(query, ImportPattern());
}

std::vector<std::string> GetFilePaths(const std::string& query) {
    std::vector<std::string> paths;
    auto begin = std::sregex_iterator(query.begin(), query.end(), FilePattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        paths.push_back((*it)[2].str());
    }
    if (paths.empty()) {
        throw InvalidArgumentError(error_code::INVALID_IMPORT_QUERY,
                                   "no file found in import query '" + query + "'");
    }
    return paths;
}

std::ifstream OpenFile(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw InvalidArgumentError(error_code::FILE_NOT_FOUND, "file '" + path + "' not found");
    }
    return file;
}

std::string GetRowSeparator(const std::string& query) {
    std::smatch match;
    if (!std::regex_search(query, match, RowSeparatorPattern())) {
        return "\n";
    }
    std::string name = match[2].str();
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (name == "CR") {
        return "\r";
    }
    if (name == "CRLF") {
        return "\r\n";
    }
    return "\n";
}

std::string UpdateImportQuery(const std::string& query, const std::string& host, uint16_t port) {
    // IPv6 literals are bracketed in URLs
    std::string url_host = host;
    if (host.find(':') != std::string::npos && host.front() != '[') {
        url_host = "[" + host + "]";
    }
    std::string location = "FROM CSV AT 'http://" + url_host + ":" + std::to_string(port) + "' ";
    std::string rewritten = std::regex_replace(query, LocalCsvPattern(), location,
                                               std::regex_constants::format_first_only);

    // First FILE clause becomes the served resource, the others go away
    std::string result;
    auto last = rewritten.cbegin();
    bool first = true;
    auto begin = std::sregex_iterator(rewritten.begin(), rewritten.end(), FilePattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        result.append(last, (*it)[0].first);
        if (first) {
            result += "FILE '" + std::string(IMPORT_RESOURCE_NAME) + "' ";
            first = false;
        }
        last = (*it)[0].second;
    }
    result.append(last, rewritten.cend());
    return result;
}

} // namespace exaconn
