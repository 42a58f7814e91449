//===----------------------------------------------------------------------===//
//                         ExaConn Client - Unit Tests
//
// tests/unit/import/test_import_query.cpp
//
// Unit tests for IMPORT ... FROM LOCAL CSV detection and rewriting
//===----------------------------------------------------------------------===//

#include "import/import_query.hpp"
#include "errors.hpp"
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <iostream>

using namespace exaconn;

//===----------------------------------------------------------------------===//
// Detection
//===----------------------------------------------------------------------===//

void TestIsImportQuery() {
    std::cout << "  Testing import detection..." << std::endl;

    assert(IsImportQuery("IMPORT into <targettable> from local CSV file '/path/to/filename.csv' <optional options>;\n"));
    assert(IsImportQuery("  import INTO t FROM LOCAL csv FILE 'a.csv'"));
    assert(IsImportQuery("IMPORT INTO t\nFROM\tLOCAL\n CSV FILE 'a.csv'"));

    assert(!IsImportQuery("SELECT * FROM table"));
    assert(!IsImportQuery("IMPORT INTO t FROM CSV AT 'http://host' FILE 'a.csv'"));
    assert(!IsImportQuery("SELECT 'IMPORT INTO t FROM LOCAL CSV' FROM dual"));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// File paths
//===----------------------------------------------------------------------===//

void TestGetFilePathNotFound() {
    std::cout << "  Testing query without files..." << std::endl;

    bool thrown = false;
    try {
        GetFilePaths("SELECT * FROM table");
    } catch (const InvalidArgumentError& e) {
        thrown = true;
        assert(e.Code() == error_code::INVALID_IMPORT_QUERY);
    }
    assert(thrown);

    std::cout << "    PASSED" << std::endl;
}

void TestGetFilePaths() {
    std::cout << "  Testing file path extraction..." << std::endl;

    const std::vector<std::vector<std::string>> cases = {
        {"/path/to/filename.csv"},
        {"/path/to/filename.csv", "/path/to/filename2.csv"},
        {"./tab1_part1.csv", "./tab1_part2.csv"},
        {"C:\\Documents\\Newsletters\\Summer2018.csv",
         "\\Program Files\\Custom Utilities\\StringFinder.csv"},
        {"/Users/User/Documents/Data/test.csv"},
    };

    for (const std::string quote : {"'", "\""}) {
        for (const auto& paths : cases) {
            std::string files;
            for (size_t i = 0; i < paths.size(); i++) {
                if (i > 0) {
                    files += " FILE ";
                }
                files += quote + paths[i] + quote;
            }
            std::string query =
                "IMPORT INTO table_1 FROM CSV\n"
                "       \t\t\tAT 'http://192.168.1.1:8080/' USER 'agent_007' IDENTIFIED BY 'secret'\n"
                "       \t\t\tFILE " + files + " \n"
                "       \t\t\tCOLUMN SEPARATOR = ';'\n"
                "       \t\t\tSKIP = 5;";

            assert(GetFilePaths(query) == paths);
        }
    }

    // Keyword case does not matter
    auto paths = GetFilePaths("IMPORT into table FROM LOCAL CSV file '/a.csv' File '/b.csv'");
    assert((paths == std::vector<std::string>{"/a.csv", "/b.csv"}));

    std::cout << "    PASSED" << std::endl;
}

void TestOpenFile() {
    std::cout << "  Testing file opening..." << std::endl;

    bool thrown = false;
    try {
        OpenFile("./.does_not_exist");
    } catch (const InvalidArgumentError& e) {
        thrown = true;
        assert(std::string(e.what()) == "E-EGOD-28: file './.does_not_exist' not found");
    }
    assert(thrown);

    auto path = (std::filesystem::temp_directory_path() / "exaconn_open_file.csv").string();
    {
        std::ofstream out(path);
        out << "1,a\n";
    }
    auto file = OpenFile(path);
    assert(file.is_open());
    std::string line;
    std::getline(file, line);
    assert(line == "1,a");
    std::remove(path.c_str());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Row separator
//===----------------------------------------------------------------------===//

void TestGetRowSeparator() {
    std::cout << "  Testing row separator..." << std::endl;

    const std::string prefix = "IMPORT into table FROM LOCAL CSV file '/path/to/filename.csv' ";
    assert(GetRowSeparator(prefix + "ROW SEPARATOR = 'LF'") == "\n");
    assert(GetRowSeparator(prefix + "ROW SEPARATOR = 'CR'") == "\r");
    assert(GetRowSeparator(prefix + "ROW SEPARATOR =  'CRLF'") == "\r\n");

    const std::vector<std::pair<std::string, std::string>> cases = {
        {"LF", "\n"}, {"lf", "\n"}, {"CRLF", "\r\n"}, {"crlf", "\r\n"}, {"CR", "\r"}, {"cr", "\r"},
    };
    for (const auto& c : cases) {
        assert(GetRowSeparator(prefix + "ROW SEPARATOR =  '" + c.first + "'") == c.second);
    }

    // Default when absent
    assert(GetRowSeparator(prefix) == "\n");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Rewriting
//===----------------------------------------------------------------------===//

void TestUpdateImportQuery() {
    std::cout << "  Testing query rewriting..." << std::endl;

    assert(UpdateImportQuery("IMPORT into table FROM LOCAL CSV file '/path/to/filename.csv'",
                             "127.0.0.1", 4333) ==
           "IMPORT into table FROM CSV AT 'http://127.0.0.1:4333' FILE 'data.csv' ");

    // Every further FILE clause is dropped
    assert(UpdateImportQuery("IMPORT into table FROM LOCAL CSV file '/path/to/filename.csv' "
                             "file '/path/to/filename2.csv'",
                             "127.0.0.1", 4333) ==
           "IMPORT into table FROM CSV AT 'http://127.0.0.1:4333' FILE 'data.csv' ");

    // Other clauses stay untouched
    assert(UpdateImportQuery("IMPORT INTO table_1 FROM LOCAL CSV USER 'agent_007' IDENTIFIED BY "
                             "'secret' FILE 'tab1_part1.csv' FILE 'tab1_part2.csv' COLUMN "
                             "SEPARATOR = ';' SKIP = 5;",
                             "127.0.0.1", 4333) ==
           "IMPORT INTO table_1 FROM CSV AT 'http://127.0.0.1:4333' USER 'agent_007' IDENTIFIED "
           "BY 'secret' FILE 'data.csv' COLUMN SEPARATOR = ';' SKIP = 5;");

    // IPv6 literals are bracketed, bracketed ones are kept
    assert(UpdateImportQuery("IMPORT INTO t FROM LOCAL CSV FILE 'a.csv'", "::1", 4333) ==
           "IMPORT INTO t FROM CSV AT 'http://[::1]:4333' FILE 'data.csv' ");
    assert(UpdateImportQuery("IMPORT INTO t FROM LOCAL CSV FILE 'a.csv'", "[fd00::5]", 4333) ==
           "IMPORT INTO t FROM CSV AT 'http://[fd00::5]:4333' FILE 'data.csv' ");

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== Import Query Unit Tests ===" << std::endl;

    std::cout << "\n1. Detection:" << std::endl;
    TestIsImportQuery();

    std::cout << "\n2. Files:" << std::endl;
    TestGetFilePathNotFound();
    TestGetFilePaths();
    TestOpenFile();

    std::cout << "\n3. Row separator:" << std::endl;
    TestGetRowSeparator();

    std::cout << "\n4. Rewriting:" << std::endl;
    TestUpdateImportQuery();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
