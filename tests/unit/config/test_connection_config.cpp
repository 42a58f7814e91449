//===----------------------------------------------------------------------===//
//                         ExaConn Client - Unit Tests
//
// tests/unit/config/test_connection_config.cpp
//
// Unit tests for ConnectionConfig
//===----------------------------------------------------------------------===//

#include "config/connection_config.hpp"
#include "config/yaml_config.hpp"
#include "errors.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <cstdio>

using namespace exaconn;

//===----------------------------------------------------------------------===//
// Helper: write temp config file
//===----------------------------------------------------------------------===//

static std::string WriteTempFile(const std::string& content, const std::string& suffix = ".conf") {
    std::string path = "/tmp/exaconn_test_config" + suffix;
    std::ofstream f(path);
    f << content;
    f.close();
    return path;
}

static void CleanupFile(const std::string& path) {
    std::remove(path.c_str());
}

//===----------------------------------------------------------------------===//
// Default Values Tests
//===----------------------------------------------------------------------===//

void TestDefaultValues() {
    std::cout << "  Testing default values..." << std::endl;

    ConnectionConfig config;

    assert(config.host == "localhost");
    assert(config.port == 8563);
    assert(config.shuffle_hosts == false);
    assert(config.user.empty());
    assert(config.password.empty());
    assert(config.schema.empty());
    assert(config.autocommit == true);
    assert(config.query_timeout_seconds == 0);
    assert(config.encryption == true);
    assert(config.validate_server_certificate == true);
    assert(config.compression == false);
    assert(config.fetch_size_kb == 2000);
    assert(config.result_set_max_rows == 0);
    assert(config.client_name == "exaconn");
    assert(config.import_host.empty());
    assert(config.log_level == "warn");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Validation Tests
//===----------------------------------------------------------------------===//

void TestValidation() {
    std::cout << "  Testing Validate..." << std::endl;

    std::string error;

    // No credentials
    ConnectionConfig config;
    assert(!config.Validate(error));
    assert(error == "User, access token or refresh token is required");

    config.user = "sys";
    assert(config.Validate(error));

    // A token replaces the user
    ConnectionConfig token;
    token.access_token = "abc";
    assert(token.Validate(error));

    // Invalid port
    config.port = 0;
    assert(!config.Validate(error));
    assert(error == "Invalid port number");

    config.port = 8563;
    config.host.clear();
    assert(!config.Validate(error));
    assert(error == "Host must not be empty");

    config.host = "localhost";
    config.fetch_size_kb = 0;
    assert(!config.Validate(error));
    assert(error == "Fetch size must be greater than 0");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// DSN Tests
//===----------------------------------------------------------------------===//

void TestParseDsn() {
    std::cout << "  Testing ParseDsn..." << std::endl;

    ConnectionConfig config;
    std::string error;
    bool ok = config.ParseDsn(
        "exa:exasol1..3:8564;user=sys;password=exasol;schema=MY_SCHEMA;autocommit=0;"
        "encryption=false;compression=1;fetchsize=500;resultsetmaxrows=1000;querytimeout=30;"
        "clientname=Tests;clientversion=2.0",
        error);
    assert(ok);

    assert(config.host == "exasol1..3");
    assert(config.port == 8564);
    assert(config.user == "sys");
    assert(config.password == "exasol");
    assert(config.schema == "MY_SCHEMA");
    assert(config.autocommit == false);
    assert(config.encryption == false);
    assert(config.compression == true);
    assert(config.fetch_size_kb == 500);
    assert(config.result_set_max_rows == 1000);
    assert(config.query_timeout_seconds == 30);
    assert(config.client_name == "Tests");
    assert(config.client_version == "2.0");

    std::cout << "    PASSED" << std::endl;
}

void TestParseDsnFingerprint() {
    std::cout << "  Testing ParseDsn with fingerprint..." << std::endl;

    ConnectionConfig config;
    std::string error;
    assert(config.ParseDsn("exa:10.0.0.1,10.0.0.2/15F9CA9B:8563;user=sys", error));
    assert(config.host == "10.0.0.1,10.0.0.2");
    assert(config.certificate_fingerprint == "15F9CA9B");
    assert(config.port == 8563);

    // Keys are case-insensitive
    ConnectionConfig tokens;
    assert(tokens.ParseDsn("exa:localhost:8563;AccessToken=a;RefreshToken=b;"
                           "ValidateServerCertificate=0",
                           error));
    assert(tokens.access_token == "a");
    assert(tokens.refresh_token == "b");
    assert(tokens.validate_server_certificate == false);

    std::cout << "    PASSED" << std::endl;
}

void TestParseDsnEscapes() {
    std::cout << "  Testing ParseDsn escaped separators..." << std::endl;

    auto parts = SplitDsnProperties("localhost:8563;password=a\\;b;user=x");
    assert(parts.size() == 3);
    assert(parts[0] == "localhost:8563");
    assert(parts[1] == "password=a;b");
    assert(parts[2] == "user=x");

    ConnectionConfig config;
    std::string error;
    assert(config.ParseDsn("exa:localhost:8563;user=sys;password=pa\\;ss=word", error));
    assert(config.password == "pa;ss=word");

    std::cout << "    PASSED" << std::endl;
}

void TestParseDsnErrors() {
    std::cout << "  Testing ParseDsn errors..." << std::endl;

    std::string error;

    ConnectionConfig c1;
    assert(!c1.ParseDsn("localhost:8563;user=sys", error));
    assert(error.find("must start with 'exa:'") != std::string::npos);

    ConnectionConfig c2;
    assert(!c2.ParseDsn("exa:localhost;user=sys", error));
    assert(error.find("host and port") != std::string::npos);

    ConnectionConfig c3;
    assert(!c3.ParseDsn("exa:localhost:abc", error));
    assert(error == "invalid port 'abc'");

    ConnectionConfig c4;
    assert(!c4.ParseDsn("exa:localhost:8563;user", error));
    assert(error == "invalid parameter 'user', expected key=value");

    ConnectionConfig c5;
    assert(!c5.ParseDsn("exa:localhost:8563;color=blue", error));
    assert(error == "unknown DSN parameter 'color'");

    ConnectionConfig c6;
    assert(!c6.ParseDsn("exa:localhost:8563;autocommit=maybe", error));
    assert(error == "invalid value 'maybe' for parameter 'autocommit'");

    ConnectionConfig c7;
    assert(!c7.ParseDsn("exa:localhost:8563;fetchsize=-1", error));

    std::cout << "    PASSED" << std::endl;
}

void TestConfigFromDsn() {
    std::cout << "  Testing ConfigFromDsn..." << std::endl;

    auto config = ConfigFromDsn("exa:localhost:8563;user=sys;password=exasol");
    assert(config.user == "sys");

    // Parse error
    bool thrown = false;
    try {
        ConfigFromDsn("exa:localhost");
    } catch (const InvalidArgumentError& e) {
        thrown = true;
        assert(e.Code() == error_code::INVALID_CONFIG);
    }
    assert(thrown);

    // Parses, but fails validation
    thrown = false;
    try {
        ConfigFromDsn("exa:localhost:8563");
    } catch (const InvalidArgumentError& e) {
        thrown = true;
        assert(e.Message() == "User, access token or refresh token is required");
    }
    assert(thrown);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// INI Config File Tests
//===----------------------------------------------------------------------===//

void TestLoadFromIni() {
    std::cout << "  Testing LoadFromIni..." << std::endl;

    std::string content =
        "# ExaConn connection\n"
        "[connection]\n"
        "host = exasol1,exasol2\n"
        "port = 9876\n"
        "shuffle_hosts = true\n"
        "\n"
        "[auth]\n"
        "user = sys\n"
        "password = \"secret\"\n"
        "\n"
        "[Session]\n"
        "Schema = TEST\n"
        "autocommit = false\n"
        "compression = true\n"
        "fetch_size = 128\n"
        "\n"
        "[client]\n"
        "import_host = 10.0.0.5\n"
        "\n"
        "[logging]\n"
        "level = debug\n";

    auto path = WriteTempFile(content);

    ConnectionConfig config;
    std::string error;
    bool ok = config.LoadFromIni(path, error);
    assert(ok);

    assert(config.host == "exasol1,exasol2");
    assert(config.port == 9876);
    assert(config.shuffle_hosts == true);
    assert(config.user == "sys");
    assert(config.password == "secret");
    assert(config.schema == "TEST");
    assert(config.autocommit == false);
    assert(config.compression == true);
    assert(config.fetch_size_kb == 128);
    assert(config.import_host == "10.0.0.5");
    assert(config.log_level == "debug");

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadFromIniComments() {
    std::cout << "  Testing LoadFromIni with comments..." << std::endl;

    std::string content =
        "# Comment line\n"
        "; Another comment\n"
        "\n"
        "[connection]\n"
        "port = 1234\n"
        "# host = not_this\n";

    auto path = WriteTempFile(content);

    ConnectionConfig config;
    std::string error;
    assert(config.LoadFromIni(path, error));
    assert(config.port == 1234);
    assert(config.host == "localhost");  // Default, commented line ignored

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadFromIniNonExistent() {
    std::cout << "  Testing LoadFromIni non-existent file..." << std::endl;

    ConnectionConfig config;
    std::string error;
    assert(!config.LoadFromIni("/nonexistent/file.conf", error));
    assert(!error.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestLoadFromIniRejectsBadEntries() {
    std::cout << "  Testing LoadFromIni rejects bad entries..." << std::endl;

    std::string error;

    auto unknown = WriteTempFile("[connection]\nhostname = exasol1\n");
    ConnectionConfig c1;
    assert(!c1.LoadFromIni(unknown, error));
    assert(error == "unknown setting 'connection.hostname'");
    CleanupFile(unknown);

    // Keys outside a section are not settings either
    auto flat = WriteTempFile("port = 1234\n");
    ConnectionConfig c2;
    assert(!c2.LoadFromIni(flat, error));
    assert(error == "unknown setting 'port'");
    CleanupFile(flat);

    auto bad_value = WriteTempFile("[session]\nfetch_size = lots\n");
    ConnectionConfig c3;
    assert(!c3.LoadFromIni(bad_value, error));
    assert(error == "invalid value 'lots' for setting 'session.fetch_size'");
    CleanupFile(bad_value);

    auto bad_header = WriteTempFile("[session\nschema = X\n");
    ConnectionConfig c4;
    assert(!c4.LoadFromIni(bad_header, error));
    assert(error.find("malformed section header") != std::string::npos);
    CleanupFile(bad_header);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// YAML Config File Tests
//===----------------------------------------------------------------------===//

void TestLoadFromYaml() {
    std::cout << "  Testing LoadFromYaml..." << std::endl;

    std::string content =
        "connection:\n"
        "  host: 192.168.1.1..4\n"
        "  port: 8564\n"
        "  shuffle_hosts: true\n"
        "  timeout_ms: 2500\n"
        "\n"
        "auth:\n"
        "  user: sys\n"
        "  password: exasol\n"
        "\n"
        "tls:\n"
        "  enabled: true\n"
        "  validate_server_certificate: false\n"
        "  certificate_fingerprint: ABCDEF\n"
        "\n"
        "session:\n"
        "  schema: RETAIL\n"
        "  autocommit: false\n"
        "  query_timeout: 60\n"
        "  compression: true\n"
        "  fetch_size: 4000\n"
        "  result_set_max_rows: 100\n"
        "\n"
        "client:\n"
        "  name: Reports\n"
        "  import_host: 10.1.1.1\n"
        "\n"
        "logging:\n"
        "  level: info\n"
        "  file: /tmp/exaconn.log\n";

    auto path = WriteTempFile(content, ".yaml");

    ConnectionConfig config;
    std::string error;
    bool ok = config.LoadFromYaml(path, error);
    assert(ok);

    assert(config.host == "192.168.1.1..4");
    assert(config.port == 8564);
    assert(config.shuffle_hosts == true);
    assert(config.connect_timeout_ms == 2500);
    assert(config.user == "sys");
    assert(config.password == "exasol");
    assert(config.encryption == true);
    assert(config.validate_server_certificate == false);
    assert(config.certificate_fingerprint == "ABCDEF");
    assert(config.schema == "RETAIL");
    assert(config.autocommit == false);
    assert(config.query_timeout_seconds == 60);
    assert(config.compression == true);
    assert(config.fetch_size_kb == 4000);
    assert(config.result_set_max_rows == 100);
    assert(config.client_name == "Reports");
    assert(config.import_host == "10.1.1.1");
    assert(config.log_level == "info");
    assert(config.log_file == "/tmp/exaconn.log");

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadFromYamlPartial() {
    std::cout << "  Testing LoadFromYaml partial config..." << std::endl;

    std::string content =
        "connection:\n"
        "  port: 9999\n";

    auto path = WriteTempFile(content, ".yaml");

    ConnectionConfig config;
    std::string error;
    assert(config.LoadFromYaml(path, error));

    // Only port changed, rest defaults
    assert(config.port == 9999);
    assert(config.host == "localhost");
    assert(config.fetch_size_kb == 2000);

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

void TestLoadFromYamlNonExistent() {
    std::cout << "  Testing LoadFromYaml non-existent file..." << std::endl;

    ConnectionConfig config;
    std::string error;
    assert(!config.LoadFromYaml("/nonexistent/file.yaml", error));
    assert(!error.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestYamlFlattening() {
    std::cout << "  Testing YAML flattening to dotted keys..." << std::endl;

    YamlConfig yaml;
    assert(yaml.LoadString("session:\n  schema: RETAIL\n  fetch_size: 64\nauth:\n  user: sys\n"));
    const auto& values = yaml.Values();
    assert(values.size() == 3);
    assert(values.at("session.schema") == "RETAIL");
    assert(values.at("session.fetch_size") == "64");

    ConnectionConfig config;
    std::string error;
    assert(config.ApplySettings(values, error));
    assert(config.schema == "RETAIL");
    assert(config.fetch_size_kb == 64);
    assert(config.user == "sys");

    YamlConfig lists;
    assert(!lists.LoadString("connection:\n  host:\n    - exasol1\n    - exasol2\n"));
    assert(lists.GetError().find("'connection.host'") != std::string::npos);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Auto-detect Format Tests
//===----------------------------------------------------------------------===//

void TestLoadFromFileAutoDetect() {
    std::cout << "  Testing LoadFromFile auto-detect format..." << std::endl;

    // YAML by extension
    std::string yaml_content = "connection:\n  port: 1111\n";
    auto yaml_path = WriteTempFile(yaml_content, ".yaml");

    ConnectionConfig config1;
    std::string error;
    assert(config1.LoadFromFile(yaml_path, error));
    assert(config1.port == 1111);
    CleanupFile(yaml_path);

    // YML by extension
    auto yml_path = WriteTempFile(yaml_content, ".yml");
    ConnectionConfig config2;
    assert(config2.LoadFromFile(yml_path, error));
    assert(config2.port == 1111);
    CleanupFile(yml_path);

    // INI by extension (default)
    std::string ini_content = "[connection]\nport = 2222\n";
    auto ini_path = WriteTempFile(ini_content, ".conf");
    ConnectionConfig config3;
    assert(config3.LoadFromFile(ini_path, error));
    assert(config3.port == 2222);
    CleanupFile(ini_path);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Command Line Parsing Tests
//===----------------------------------------------------------------------===//

void TestParseCommandLine() {
    std::cout << "  Testing ParseCommandLine..." << std::endl;

    const char* argv[] = {
        "exaconn-cli",
        "-h", "exasol1..3",
        "-p", "9876",
        "-u", "sys",
        "-P", "exasol",
        "-s", "RETAIL",
        "--no-cert-check",
        "--compression",
        "--fetch-size", "64",
        "--max-rows", "10",
        "--query-timeout", "5",
        "--log-level", "debug"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    bool show_version;
    auto config = ParseCommandLine(argc, const_cast<char**>(argv), show_version);

    assert(!show_version);
    assert(config.host == "exasol1..3");
    assert(config.port == 9876);
    assert(config.user == "sys");
    assert(config.password == "exasol");
    assert(config.schema == "RETAIL");
    assert(config.validate_server_certificate == false);
    assert(config.encryption == true);
    assert(config.compression == true);
    assert(config.fetch_size_kb == 64);
    assert(config.result_set_max_rows == 10);
    assert(config.query_timeout_seconds == 5);
    assert(config.log_level == "debug");

    std::cout << "    PASSED" << std::endl;
}

void TestParseCommandLineDsn() {
    std::cout << "  Testing ParseCommandLine with DSN..." << std::endl;

    const char* argv[] = {
        "exaconn-cli",
        "--version",
        "exa:db.example.com:8563;user=reader;schema=SALES",
        "--no-encryption"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    bool show_version;
    auto config = ParseCommandLine(argc, const_cast<char**>(argv), show_version);

    assert(show_version);
    assert(config.host == "db.example.com");
    assert(config.user == "reader");
    assert(config.schema == "SALES");
    assert(config.encryption == false);

    std::cout << "    PASSED" << std::endl;
}

void TestConfigFileOverriddenByCommandLine() {
    std::cout << "  Testing config file overridden by command line..." << std::endl;

    auto path = WriteTempFile("connection:\n  host: from_file\n  port: 1111\n", ".yaml");

    const char* argv[] = {"exaconn-cli", "-c", path.c_str(), "-p", "2222"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    bool show_version;
    auto config = ParseCommandLine(argc, const_cast<char**>(argv), show_version);
    assert(config.host == "from_file");
    assert(config.port == 2222);

    CleanupFile(path);
    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== Connection Config Unit Tests ===" << std::endl;

    std::cout << "\n1. Defaults and validation:" << std::endl;
    TestDefaultValues();
    TestValidation();

    std::cout << "\n2. DSN:" << std::endl;
    TestParseDsn();
    TestParseDsnFingerprint();
    TestParseDsnEscapes();
    TestParseDsnErrors();
    TestConfigFromDsn();

    std::cout << "\n3. INI files:" << std::endl;
    TestLoadFromIni();
    TestLoadFromIniComments();
    TestLoadFromIniNonExistent();
    TestLoadFromIniRejectsBadEntries();

    std::cout << "\n4. YAML files:" << std::endl;
    TestLoadFromYaml();
    TestLoadFromYamlPartial();
    TestLoadFromYamlNonExistent();
    TestYamlFlattening();
    TestLoadFromFileAutoDetect();

    std::cout << "\n5. Command line:" << std::endl;
    TestParseCommandLine();
    TestParseCommandLineDsn();
    TestConfigFileOverriddenByCommandLine();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
