#include <gtest/gtest.h>

#include "core/config.hpp"
#include "test_support.hpp"

using aprotate::core::DaemonConfig;

TEST(DaemonConfigTest, DefaultsMatchDocumentedValues)
{
    auto config = DaemonConfig::create_default();

    EXPECT_EQ(config->rotation_interval_sec, 300);
    EXPECT_EQ(config->client_threshold, 5);
    EXPECT_EQ(config->min_time_after_clients_sec, 120);
    EXPECT_EQ(config->manual_rotation_cooldown_sec, 30);
    EXPECT_EQ(config->ssid_prefix, "ssb-");
    EXPECT_EQ(config->ssid_length, 6);
    EXPECT_EQ(config->password_length, 16);
    EXPECT_EQ(config->country_code, "AR");
    EXPECT_EQ(config->log_retention_count, 100);
    EXPECT_FALSE(config->dual_ap_mode);
    EXPECT_EQ(config->primary_interface, "wlan0");
    EXPECT_EQ(config->paths.run_dir, "/var/run/ssb-ap");
    EXPECT_EQ(config->timeouts.restart_sec, 30);

    ASSERT_NE(config->interface_config("wlan0"), nullptr);
    EXPECT_TRUE(config->interface_config("wlan0")->enabled);
    EXPECT_EQ(config->interface_config("wlan0")->channel, 6);
    ASSERT_NE(config->interface_config("wlan1"), nullptr);
    EXPECT_FALSE(config->interface_config("wlan1")->enabled);
    EXPECT_EQ(config->interface_config("wlan1")->ap_ip, "192.168.5.1");
    EXPECT_EQ(config->interface_config("wlan1")->channel, 11);

    EXPECT_TRUE(config->validate());
}

TEST(DaemonConfigTest, PartialJsonMergesOverDefaults)
{
    auto j = nlohmann::json::parse(R"({
        "rotation_interval_sec": 600,
        "dual_ap_mode": true,
        "some_future_option": "ignored",
        "interfaces": { "wlan1": { "enabled": true } },
        "paths": { "run_dir": "/tmp/ap" }
    })");

    auto config = DaemonConfig::from_json(j);

    EXPECT_EQ(config->rotation_interval_sec, 600);
    EXPECT_EQ(config->client_threshold, 5);
    EXPECT_TRUE(config->dual_ap_mode);
    EXPECT_EQ(config->paths.run_dir, "/tmp/ap");
    EXPECT_EQ(config->paths.log_dir, "/var/log/ssb-ap");

    const auto *wlan1 = config->interface_config("wlan1");
    ASSERT_NE(wlan1, nullptr);
    EXPECT_TRUE(wlan1->enabled);
    EXPECT_EQ(wlan1->channel, 11);
    EXPECT_EQ(wlan1->ap_ip, "192.168.5.1");
}

TEST(DaemonConfigTest, CandidateInterfacesDependOnDualMode)
{
    auto config = DaemonConfig::create_default();
    EXPECT_EQ(config->candidate_interfaces(), std::vector<std::string>{"wlan0"});

    config->dual_ap_mode = true;
    EXPECT_EQ(config->candidate_interfaces(), (std::vector<std::string>{"wlan0", "wlan1"}));
}

TEST(DaemonConfigTest, SingleModeConsidersOnlyThePrimaryInterface)
{
    auto j = nlohmann::json::parse(R"({
        "primary_interface": "wlan1",
        "interfaces": {"wlan2": {"enabled": true, "channel": 11}}
    })");
    auto config = DaemonConfig::from_json(j);
    EXPECT_EQ(config->candidate_interfaces(), std::vector<std::string>{"wlan1"});

    config->dual_ap_mode = true;
    EXPECT_EQ(config->candidate_interfaces(), (std::vector<std::string>{"wlan0", "wlan1", "wlan2"}));
}

TEST(DaemonConfigTest, MistypedValueIsRejected)
{
    auto j = nlohmann::json::parse(R"({"rotation_interval_sec": "soon"})");
    EXPECT_THROW(DaemonConfig::from_json(j), std::invalid_argument);
}

TEST(DaemonConfigTest, ValidationReportsEachProblem)
{
    auto config = DaemonConfig::create_default();
    config->password_length = 7;
    config->country_code = "ARG";
    config->interfaces["wlan0"].channel = 20;
    config->interfaces["wlan0"].ap_ip = "not-an-ip";

    auto errors = config->validation_errors();
    EXPECT_GE(errors.size(), 4u);
    EXPECT_FALSE(config->validate());

    config = DaemonConfig::create_default();
    config->password_length = 63;
    config->interfaces["wlan0"].channel = 36;
    EXPECT_TRUE(config->validate());
}

TEST(DaemonConfigTest, LoadMissingFileFallsBackToDefaults)
{
    aprotate::test::TempDir dir;
    bool used_defaults = false;

    auto config = DaemonConfig::load((dir / "absent.json").string(), &used_defaults);

    EXPECT_TRUE(used_defaults);
    EXPECT_EQ(config->rotation_interval_sec, 300);
}

TEST(DaemonConfigTest, LoadMalformedFileThrows)
{
    aprotate::test::TempDir dir;
    aprotate::test::write_text(dir / "config.json", "{ \"rotation_interval_sec\": ");

    EXPECT_THROW(DaemonConfig::load((dir / "config.json").string()), std::runtime_error);
}

TEST(DaemonConfigTest, SavedFileLoadsBack)
{
    aprotate::test::TempDir dir;
    auto config = DaemonConfig::create_default();
    config->client_threshold = 9;
    config->interfaces["wlan1"].enabled = true;
    config->save_to_file((dir / "config.json").string());

    auto loaded = DaemonConfig::from_file((dir / "config.json").string());
    EXPECT_EQ(loaded->client_threshold, 9);
    EXPECT_TRUE(loaded->interface_config("wlan1")->enabled);
}
