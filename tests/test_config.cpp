#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <configuration/extra_vars.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "clusterm_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& content) {
        auto path = test_dir / "config.yaml";
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, LoadsAllSections) {
    auto path = write_config(R"(
inventory:
  state_file: /var/lib/clusterm/inventory.yaml
ansible:
  binary: /usr/local/bin/ansible-playbook
  playbook_location: /opt/playbooks
  configure_playbook: commission.yml
  cleanup_playbook: decommission.yml
  user: ops
  private_key: /etc/clusterm/id_ed25519
  extra_variables: '{"env": "prod"}'
logging:
  file: /var/log/clusterm.log
  level: debug
  job_log_dir: /var/log/clusterm/jobs
)");

    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.inventory().state_file, "/var/lib/clusterm/inventory.yaml");
    EXPECT_EQ(c.ansible().binary, "/usr/local/bin/ansible-playbook");
    EXPECT_EQ(c.ansible().playbook_location, "/opt/playbooks");
    EXPECT_EQ(c.ansible().configure_playbook, "commission.yml");
    EXPECT_EQ(c.ansible().cleanup_playbook, "decommission.yml");
    EXPECT_EQ(c.ansible().user, "ops");
    EXPECT_EQ(c.ansible().private_key, "/etc/clusterm/id_ed25519");
    EXPECT_EQ(c.ansible().extra_variables, "{\"env\": \"prod\"}");
    EXPECT_EQ(c.logging().file, "/var/log/clusterm.log");
    EXPECT_EQ(c.logging().level, "debug");
    EXPECT_EQ(c.logging().job_log_dir, "/var/log/clusterm/jobs");
}

TEST_F(ConfigTest, MissingKeysTakeDefaults) {
    auto path = write_config("logging:\n  level: warn\n");

    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.inventory().state_file, "");
    EXPECT_EQ(r.value.ansible().binary, DEFAULT_ANSIBLE_BINARY);
    EXPECT_EQ(r.value.ansible().playbook_location, DEFAULT_PLAYBOOK_LOCATION);
    EXPECT_EQ(r.value.ansible().configure_playbook, DEFAULT_CONFIGURE_PLAYBOOK);
    EXPECT_EQ(r.value.ansible().cleanup_playbook, DEFAULT_CLEANUP_PLAYBOOK);
    EXPECT_EQ(r.value.ansible().user, DEFAULT_ANSIBLE_USER);
    EXPECT_EQ(r.value.ansible().extra_variables, DEFAULT_EXTRA_VARIABLES);
    EXPECT_EQ(r.value.logging().level, "warn");
}

TEST_F(ConfigTest, EmptyFileIsAllDefaults) {
    auto path = write_config("");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ansible().user, Config::defaults().ansible().user);
    EXPECT_EQ(r.value.logging().level, DEFAULT_LOG_LEVEL);
}

TEST_F(ConfigTest, ExtraVariablesAsMap) {
    auto path = write_config("ansible:\n  extra_variables:\n    env: prod\n    replicas: 3\n");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto vars = parse_extra_vars(r.value.ansible().extra_variables);
    ASSERT_TRUE(vars.is_ok()) << vars.error;
    EXPECT_EQ(vars.value["env"].as<std::string>(), "prod");
    EXPECT_EQ(vars.value["replicas"].as<std::string>(), "3");
}

TEST_F(ConfigTest, HomeRelativePathsExpanded) {
    auto path = write_config("inventory:\n  state_file: ~/.clusterm/inventory.yaml\n");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.inventory().state_file,
              (platform::home_dir() / ".clusterm/inventory.yaml").string());
}

TEST_F(ConfigTest, MalformedYamlRejected) {
    auto path = write_config("ansible: [unterminated\n");
    EXPECT_TRUE(Config::load_file(path).is_err());
}

TEST_F(ConfigTest, NonMapRootRejected) {
    auto path = write_config("- ansible\n- logging\n");
    EXPECT_TRUE(Config::load_file(path).is_err());
}

TEST_F(ConfigTest, ExtraVariablesMapKeepsScalarTypes) {
    auto path = write_config("ansible:\n  extra_variables:\n    enable_ha: false\n"
                             "    replicas: 3\n    version: \"1.29\"\n    env: prod\n");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ansible().extra_variables,
              "{\"enable_ha\": false, \"replicas\": 3, \"version\": \"1.29\", \"env\": \"prod\"}");
}

// Config loading keeps the string as written; the service rejects it at start
TEST_F(ConfigTest, ExtraVariablesStringKeptVerbatim) {
    auto path = write_config("ansible:\n  extra_variables: \"[1, 2]\"\n");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ansible().extra_variables, "[1, 2]");
}

TEST_F(ConfigTest, EmptyPlaybookRejected) {
    auto path = write_config("ansible:\n  configure_playbook: \"\"\n");
    EXPECT_TRUE(Config::load_file(path).is_err());
}

TEST_F(ConfigTest, MissingFileRejected) {
    EXPECT_TRUE(Config::load_file(test_dir / "nope.yaml").is_err());
}

// ── Extra variables ───────────────────────────────────────────

TEST(ExtraVars, EmptyIsEmptyMap) {
    auto r = parse_extra_vars("  ");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.IsMap());
    EXPECT_EQ(r.value.size(), 0u);
}

TEST(ExtraVars, JsonObjectAccepted) {
    auto r = parse_extra_vars("{\"etcd_version\": \"3.5\", \"debug\": true}");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value["etcd_version"].as<std::string>(), "3.5");
}

TEST(ExtraVars, NonMapRejected) {
    for (const auto& bad : {"[1, 2]", "just a string", "{unterminated"}) {
        auto r = parse_extra_vars(bad);
        ASSERT_TRUE(r.is_err()) << bad;
        EXPECT_EQ(r.code, ErrorCode::Validation);
    }
}

TEST(ExtraVars, MergeRequestWins) {
    auto r = merge_extra_vars("{\"env\": \"prod\", \"user\": \"ops\"}", "{\"env\": \"staging\"}");
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto merged = parse_extra_vars(r.value);
    ASSERT_TRUE(merged.is_ok()) << merged.error;
    EXPECT_EQ(merged.value["env"].as<std::string>(), "staging");
    EXPECT_EQ(merged.value["user"].as<std::string>(), "ops");
}

TEST(ExtraVars, MergeKeepsBooleansAndNumbersUnquoted) {
    auto r = merge_extra_vars("{}", R"({"enable_ha": false, "replicas": 3, "name": "x"})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, R"({"enable_ha": false, "replicas": 3, "name": "x"})");

    auto merged = parse_extra_vars(r.value);
    ASSERT_TRUE(merged.is_ok()) << merged.error;
    EXPECT_FALSE(merged.value["enable_ha"].as<bool>());
    EXPECT_EQ(merged.value["enable_ha"].Tag(), "?");
    EXPECT_EQ(merged.value["replicas"].as<int>(), 3);
    EXPECT_EQ(merged.value["replicas"].Tag(), "?");
    EXPECT_EQ(merged.value["name"].Tag(), "!");
}

TEST(ExtraVars, MergeKeepsQuotedNumbersAsStrings) {
    auto r = merge_extra_vars(R"({"version": "1.29", "debug": true})", R"({"tags": ["a", 2], "none": null})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, R"({"version": "1.29", "debug": true, "tags": ["a", 2], "none": null})");
}

TEST(ExtraVars, MergeEscapesStrings) {
    auto r = merge_extra_vars("{}", R"({"msg": "say "hi"
now"})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, R"({"msg": "say "hi"
now"})");
}

TEST(ExtraVars, MergePropagatesParseErrors) {
    EXPECT_TRUE(merge_extra_vars("{}", "[1]").is_err());
    EXPECT_TRUE(merge_extra_vars("[1]", "{}").is_err());
}

// ── Utilities ─────────────────────────────────────────────────

TEST(Utils, JobIdCarriesKind) {
    auto id = generate_job_id("commission");
    EXPECT_EQ(id.size(), std::string("2025-01-15T10-00-00-000__commission").size());
    EXPECT_EQ(id.substr(id.size() - 12), "__commission");
}

TEST(Utils, JoinAndTrim) {
    EXPECT_EQ(join({"n1", "n2", "n3"}), "n1, n2, n3");
    EXPECT_EQ(join({}), "");
    std::string s = "  site.yml \n";
    trim(s);
    EXPECT_EQ(s, "site.yml");
}
