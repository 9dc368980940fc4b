#include <gtest/gtest.h>

#include "../../common/test_helpers.h"
#include <webshell/config/shell_config.h>

#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

using namespace webshell;
using namespace webshell::config;

namespace {

EnvLookup fakeEnv(const std::map<std::string, std::string>& vars) {
    return [vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

class ShellConfigTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = webshell::test::make_temp_dir("webshell_config_test_"); }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path writeConfig(const std::string& body) {
        return webshell::test::write_file(dir_ / "config.toml", body);
    }

    std::filesystem::path dir_;
};

} // namespace

TEST_F(ShellConfigTest, DefaultsMatchOpenWebUi) {
    ShellConfig cfg;
    EXPECT_EQ(cfg.executable, "open-webui");
    EXPECT_EQ(cfg.preferredPort, 8080);
    EXPECT_EQ(cfg.host, "localhost");
    EXPECT_TRUE(cfg.evictBusyPort);
    EXPECT_EQ(cfg.interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(cfg.probeTimeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(cfg.authEnv, "WEBUI_AUTH");
    EXPECT_EQ(cfg.authValue, "False");
    EXPECT_TRUE(validate(cfg));
}

TEST_F(ShellConfigTest, MissingFileLeavesDefaults) {
    ShellConfig cfg;
    EXPECT_TRUE(loadConfigFile(cfg, dir_ / "absent.toml"));
    EXPECT_EQ(cfg.executable, "open-webui");
}

TEST_F(ShellConfigTest, FileOverridesEverySection) {
    auto path = writeConfig(R"(# webshell
[server]
executable = "/opt/webui/bin/serve"
args = ["run", "--listen", "{host}:{port}"]
host = 127.0.0.1
port = 9000
quiet = yes
auth_value = "True"

[server.env]
DATA_DIR = "/tmp/data"

[port]
evict_busy_port = false
range_min = 2000
range_max = 9999
max_attempts = 0

[readiness]
interval_ms = 250   # poll faster
probe_timeout_ms = 500
max_wait_ms = 60000

[logging]
level = debug
file = ""
console = off
)");
    ShellConfig cfg;
    auto r = loadConfigFile(cfg, path);
    ASSERT_TRUE(r) << r.error().message;

    EXPECT_EQ(cfg.executable, "/opt/webui/bin/serve");
    EXPECT_EQ(cfg.args, (std::vector<std::string>{"run", "--listen", "{host}:{port}"}));
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.preferredPort, 9000);
    EXPECT_TRUE(cfg.quietOutput);
    EXPECT_EQ(cfg.authValue, "True");
    EXPECT_EQ(cfg.extraEnv.at("DATA_DIR"), "/tmp/data");
    EXPECT_FALSE(cfg.evictBusyPort);
    EXPECT_EQ(cfg.rangeMin, 2000);
    EXPECT_EQ(cfg.rangeMax, 9999);
    EXPECT_EQ(cfg.maxPortAttempts, 0u);
    EXPECT_EQ(cfg.interval, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.probeTimeout, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.maxWait, std::chrono::milliseconds(60000));
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_TRUE(cfg.logFile.empty());
    EXPECT_FALSE(cfg.logToConsole);
    EXPECT_TRUE(validate(cfg));
}

TEST_F(ShellConfigTest, BadFileValueNamesTheKey) {
    auto path = writeConfig("[readiness]\ninterval_ms = soon\n");
    ShellConfig cfg;
    auto r = loadConfigFile(cfg, path);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(r.error().message.find("readiness.interval_ms"), std::string::npos);
}

TEST_F(ShellConfigTest, MalformedLineIsRejected) {
    auto path = writeConfig("[server]\nexecutable\n");
    ShellConfig cfg;
    auto r = loadConfigFile(cfg, path);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(r.error().message.find(":2:"), std::string::npos);
}

TEST_F(ShellConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig("[server]\nport = 9000\nexecutable = from-file\n");
    ShellConfig cfg;
    ASSERT_TRUE(loadConfigFile(cfg, path));
    auto r = applyEnvironment(cfg, fakeEnv({{"WEBSHELL_PORT", "9100"},
                                            {"WEBSHELL_EVICT", "0"},
                                            {"WEBSHELL_MAX_WAIT_MS", "5000"},
                                            {"WEBSHELL_LOG_LEVEL", "warn"},
                                            {"WEBSHELL_EXECUTABLE", ""}}));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(cfg.preferredPort, 9100);
    EXPECT_FALSE(cfg.evictBusyPort);
    EXPECT_EQ(cfg.maxWait, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.logLevel, "warn");
    // empty variables do not override
    EXPECT_EQ(cfg.executable, "from-file");
}

TEST_F(ShellConfigTest, EmptyLogFileVariableDisablesFileSink) {
    ShellConfig cfg;
    ASSERT_TRUE(applyEnvironment(cfg, fakeEnv({{"WEBSHELL_LOG_FILE", ""}})));
    EXPECT_TRUE(cfg.logFile.empty());
}

TEST_F(ShellConfigTest, BadEnvironmentValuesAreRejected) {
    for (const auto& [name, value] : std::vector<std::pair<std::string, std::string>>{
             {"WEBSHELL_PORT", "70000"},
             {"WEBSHELL_PORT", "abc"},
             {"WEBSHELL_INTERVAL_MS", "0"},
             {"WEBSHELL_EVICT", "maybe"},
             {"WEBSHELL_LOG_LEVEL", "chatty"}}) {
        ShellConfig cfg;
        auto r = applyEnvironment(cfg, fakeEnv({{name, value}}));
        ASSERT_FALSE(r) << name << "=" << value;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
        EXPECT_NE(r.error().message.find(name), std::string::npos);
    }
}

TEST_F(ShellConfigTest, ValidateRejectsInconsistentRanges) {
    ShellConfig cfg;
    cfg.rangeMin = 5000;
    cfg.rangeMax = 4000;
    EXPECT_FALSE(validate(cfg));

    cfg = ShellConfig{};
    cfg.rangeMin = 80;
    EXPECT_FALSE(validate(cfg));

    cfg = ShellConfig{};
    cfg.preferredPort = 1023;
    EXPECT_FALSE(validate(cfg));

    cfg = ShellConfig{};
    cfg.executable.clear();
    EXPECT_FALSE(validate(cfg));
}

TEST_F(ShellConfigTest, SupervisorConfigCarriesLayeredValues) {
    ShellConfig cfg;
    cfg.preferredPort = 9200;
    cfg.maxPortAttempts = 0;
    cfg.maxWait = std::chrono::milliseconds(0);
    cfg.extraEnv["A"] = "b";

    auto sup = toSupervisorConfig(cfg);
    EXPECT_EQ(sup.server.preferredPort, 9200);
    EXPECT_EQ(sup.server.executable, "open-webui");
    EXPECT_EQ(sup.server.extraEnv.at("A"), "b");
    EXPECT_FALSE(sup.ports.maxRandomAttempts.has_value());
    EXPECT_FALSE(sup.readiness.maxWait.has_value());
    EXPECT_EQ(sup.ports.host, "localhost");

    cfg.maxPortAttempts = 10;
    cfg.maxWait = std::chrono::milliseconds(1500);
    sup = toSupervisorConfig(cfg);
    ASSERT_TRUE(sup.ports.maxRandomAttempts.has_value());
    EXPECT_EQ(*sup.ports.maxRandomAttempts, 10u);
    ASSERT_TRUE(sup.readiness.maxWait.has_value());
    EXPECT_EQ(*sup.readiness.maxWait, std::chrono::milliseconds(1500));
}

TEST_F(ShellConfigTest, TomlRenderingParsesBack) {
    ShellConfig original;
    original.executable = "webui";
    original.args = {"serve", "--port", "{port}"};
    original.preferredPort = 8181;
    original.extraEnv["DATA_DIR"] = "/srv/data";
    original.logLevel = "trace";

    auto path = writeConfig(toToml(original));
    ShellConfig reloaded;
    auto r = loadConfigFile(reloaded, path);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(reloaded.executable, "webui");
    EXPECT_EQ(reloaded.args, original.args);
    EXPECT_EQ(reloaded.preferredPort, 8181);
    EXPECT_EQ(reloaded.extraEnv, original.extraEnv);
    EXPECT_EQ(reloaded.logLevel, "trace");
}

TEST(ConfigPathTest, ResolutionOrder) {
    using webshell::test::ScopedEnvVar;
    {
        ScopedEnvVar explicitPath("WEBSHELL_CONFIG", std::string("/etc/webshell.toml"));
        EXPECT_EQ(get_config_path(), std::filesystem::path("/etc/webshell.toml"));
        EXPECT_EQ(get_config_path("/other.toml"), std::filesystem::path("/other.toml"));
    }
    {
        ScopedEnvVar noExplicit("WEBSHELL_CONFIG", std::nullopt);
        ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/xdg"));
        EXPECT_EQ(get_config_path(), std::filesystem::path("/xdg/webshell/config.toml"));
    }
    {
        ScopedEnvVar noExplicit("WEBSHELL_CONFIG", std::nullopt);
        ScopedEnvVar noXdg("XDG_CONFIG_HOME", std::nullopt);
        ScopedEnvVar home("HOME", std::string("/home/tester"));
        EXPECT_EQ(get_config_path(), std::filesystem::path("/home/tester/.config/webshell/config.toml"));
    }
}

TEST(ConfigHelpersTest, ParsesListsAndScalars) {
    EXPECT_EQ(parse_string_list(R"(["a", 'b c', "d,e"])"),
              (std::vector<std::string>{"a", "b c", "d,e"}));
    EXPECT_EQ(parse_string_list("x, y"), (std::vector<std::string>{"x", "y"}));
    EXPECT_TRUE(parse_string_list("[]").empty());

    EXPECT_TRUE(parse_bool("On").value());
    EXPECT_FALSE(parse_bool("no").value());
    EXPECT_FALSE(parse_bool("2"));

    EXPECT_EQ(parse_integer(" 42 ", 0, 100).value(), 42);
    EXPECT_FALSE(parse_integer("101", 0, 100));
    EXPECT_FALSE(parse_integer("4x", 0, 100));
}
