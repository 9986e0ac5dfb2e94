#include <gtest/gtest.h>
#include "core/ConfigValidator.h"
#include "core/Config.h"
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

namespace rack_scan {

class ConfigValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg = Config();
        cfg.subnet = "10.0.0.0/24";
    }

    void TearDown() override {
        if (!temp_path.empty()) std::remove(temp_path.c_str());
    }

    std::string write_temp(const std::string& content) {
        temp_path = "/tmp/rack_scan_exclude_" + std::to_string(getpid()) + ".txt";
        std::ofstream out(temp_path);
        out << content;
        return temp_path;
    }

    Config cfg;
    ConfigValidator validator;
    std::string temp_path;
};

TEST_F(ConfigValidatorTest, AcceptsDefaults) {
    EXPECT_TRUE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, RequiresSubnet) {
    cfg.subnet.clear();
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, RejectsEmptyNetworkId) {
    cfg.network_id.clear();
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, RejectsUnknownScanTypes) {
    cfg.scan_type = "stealth";
    EXPECT_FALSE(validator.validate(cfg));

    cfg.scan_type = "quick";
    cfg.port_scan_type = "udp";
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, RejectsOutOfRangePorts) {
    cfg.custom_ports = {22, 70000};
    EXPECT_FALSE(validator.validate(cfg));

    cfg.custom_ports = {0};
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, CustomPortsImplyCustomPolicyAndAreDeduplicated) {
    cfg.custom_ports = {443, 22, 443, 80};
    EXPECT_TRUE(validator.validate(cfg));
    EXPECT_EQ(cfg.port_scan_type, "custom");
    EXPECT_EQ(cfg.custom_ports, (std::vector<int>{22, 80, 443}));
}

TEST_F(ConfigValidatorTest, ExplicitFullPolicyKeptWithCustomPorts) {
    cfg.port_scan_type = "full";
    cfg.custom_ports = {8080};
    EXPECT_TRUE(validator.validate(cfg));
    EXPECT_EQ(cfg.port_scan_type, "full");
}

TEST_F(ConfigValidatorTest, RejectsNonPositiveTuning) {
    Config base = cfg;

    cfg.timeout_seconds = 0;
    EXPECT_FALSE(validator.validate(cfg));

    cfg = base;
    cfg.max_concurrent_hosts = 0;
    EXPECT_FALSE(validator.validate(cfg));

    cfg = base;
    cfg.progress_interval = -1;
    EXPECT_FALSE(validator.validate(cfg));

    cfg = base;
    cfg.max_hosts = 0;
    EXPECT_FALSE(validator.validate(cfg));

    cfg = base;
    cfg.banner_timeout_ms = 0;
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, RejectsTimeoutBeyondLimit) {
    cfg.timeout_seconds = ConfigValidator::kMaxTimeoutSeconds;
    EXPECT_TRUE(validator.validate(cfg));

    cfg.timeout_seconds = ConfigValidator::kMaxTimeoutSeconds + 1;
    EXPECT_FALSE(validator.validate(cfg));

    cfg.timeout_seconds = 2147484; // seconds whose millisecond count overflows int
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, CompactWinsOverPretty) {
    cfg.pretty = true;
    cfg.compact = true;
    EXPECT_TRUE(validator.validate(cfg));
    EXPECT_FALSE(cfg.pretty);
    EXPECT_TRUE(cfg.compact);
}

TEST_F(ConfigValidatorTest, DropsEmptyExclusions) {
    cfg.exclude_ips = {"", "10.0.0.5", ""};
    EXPECT_TRUE(validator.validate(cfg));
    EXPECT_EQ(cfg.exclude_ips, (std::vector<std::string>{"10.0.0.5"}));
}

TEST_F(ConfigValidatorTest, LoadsExcludeFileSkippingComments) {
    cfg.exclude_ips = {"10.0.0.1"};
    cfg.exclude_file = write_temp("# lab gear\n10.0.0.5\n\n   10.0.1.0/24  \r\n#10.0.0.9\n");
    EXPECT_TRUE(validator.load_external_files(cfg));
    EXPECT_EQ(cfg.exclude_ips, (std::vector<std::string>{"10.0.0.1", "10.0.0.5", "10.0.1.0/24"}));
}

TEST_F(ConfigValidatorTest, MissingExcludeFileFails) {
    cfg.exclude_file = "/nonexistent/rack-scan/exclude.txt";
    EXPECT_FALSE(validator.load_external_files(cfg));
}

TEST_F(ConfigValidatorTest, NoExcludeFileIsNoOp) {
    EXPECT_TRUE(validator.load_external_files(cfg));
    EXPECT_TRUE(cfg.exclude_ips.empty());
}

TEST_F(ConfigValidatorTest, MakeRuleCarriesValidatedSettings) {
    cfg.scan_type = "quick";
    cfg.custom_ports = {8080, 22};
    cfg.exclude_ips = {"10.0.0.5"};
    cfg.timeout_seconds = 3;
    ASSERT_TRUE(validator.validate(cfg));

    DiscoveryRule rule = make_rule(cfg);
    EXPECT_EQ(rule.scan_type, ScanType::Quick);
    EXPECT_EQ(rule.port_scan_type, PortScanType::Custom);
    EXPECT_EQ(rule.custom_ports, (std::set<int>{22, 8080}));
    EXPECT_EQ(rule.exclude_ips, (std::vector<std::string>{"10.0.0.5"}));
    EXPECT_EQ(rule.timeout(), std::chrono::seconds(3));
}

}
