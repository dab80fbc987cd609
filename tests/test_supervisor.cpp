#include <gtest/gtest.h>

#include <thread>

#include "core/supervisor.hpp"
#include "services/rotation_history.hpp"
#include "services/status_reader.hpp"
#include "test_support.hpp"

using namespace aprotate;
using aprotate::core::Supervisor;

class SupervisorTest : public ::testing::Test
{
protected:
    test::EngineFixture fx;
    std::shared_ptr<core::DaemonConfig> config = fx.config();
    std::shared_ptr<core::DaemonConfig> next_config;
    bool loader_fails = false;

    std::unique_ptr<Supervisor> make_supervisor()
    {
        return std::make_unique<Supervisor>(config, fx.deps(), [this]() -> std::shared_ptr<const core::DaemonConfig> {
            if (loader_fails)
            {
                throw std::runtime_error("Invalid JSON in configuration file");
            }
            return next_config;
        });
    }

    void enable_dual_mode()
    {
        config->dual_ap_mode = true;
        config->interfaces["wlan1"].enabled = true;
        fx.prober->present["wlan1"] = true;
    }
};

TEST_F(SupervisorTest, StartupRotatesEveryUsableInterface)
{
    enable_dual_mode();
    auto supervisor = make_supervisor();

    ASSERT_TRUE(supervisor->start());

    EXPECT_EQ(supervisor->active_interfaces(), (std::vector<std::string>{"wlan0", "wlan1"}));
    EXPECT_EQ(fx.network->applied, (std::vector<std::string>{"wlan0", "wlan1"}));
    EXPECT_TRUE(fx.network->last_dual_mode);

    auto history = supervisor->history().entries();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].interface, "wlan0");
    EXPECT_EQ(history[0].reason, "initial");
    EXPECT_EQ(history[1].interface, "wlan1");
    EXPECT_TRUE(std::filesystem::exists(fx.dir / "log" / "rotations.json"));
}

TEST_F(SupervisorTest, SecondaryInterfaceIgnoredOutsideDualMode)
{
    config->interfaces["wlan1"].enabled = true;
    fx.prober->present["wlan1"] = true;
    auto supervisor = make_supervisor();

    ASSERT_TRUE(supervisor->start());

    EXPECT_EQ(supervisor->active_interfaces(), std::vector<std::string>{"wlan0"});
    EXPECT_FALSE(std::filesystem::exists(fx.store->status_path("wlan1")));
}

TEST_F(SupervisorTest, AbsentInterfaceIsPublishedDisabled)
{
    config->dual_ap_mode = true;
    config->interfaces["wlan1"].enabled = true;
    auto supervisor = make_supervisor();

    ASSERT_TRUE(supervisor->start());

    EXPECT_EQ(supervisor->active_interfaces(), std::vector<std::string>{"wlan0"});
    EXPECT_EQ(supervisor->engine("wlan1"), nullptr);

    auto status = fx.published("wlan1");
    EXPECT_EQ(status["state"], "disabled");
    EXPECT_EQ(status["last_error"], "Interface not found");

    supervisor->tick();
    EXPECT_EQ(fx.network->applied, std::vector<std::string>{"wlan0"});
}

TEST_F(SupervisorTest, InterfaceDisabledInConfigIsPublishedDisabled)
{
    config->dual_ap_mode = true;
    fx.prober->present["wlan1"] = true;
    auto supervisor = make_supervisor();

    ASSERT_TRUE(supervisor->start());

    auto status = fx.published("wlan1");
    EXPECT_EQ(status["state"], "disabled");
    EXPECT_FALSE(status["enabled"].get<bool>());
}

TEST_F(SupervisorTest, StartFailsWithoutUsableInterfaces)
{
    fx.prober->present.clear();
    auto supervisor = make_supervisor();

    EXPECT_FALSE(supervisor->start());
    EXPECT_EQ(fx.published("wlan0")["last_error"], "Interface not found");
}

TEST_F(SupervisorTest, StartupRetryThenErrorThenRecovery)
{
    fx.network->succeed = false;
    auto supervisor = make_supervisor();

    ASSERT_TRUE(supervisor->start());

    auto engine = supervisor->engine("wlan0");
    ASSERT_NE(engine, nullptr);
    EXPECT_EQ(fx.network->applied.size(), 2u);
    EXPECT_EQ(engine->state(), core::InterfaceState::ERROR);
    EXPECT_EQ(engine->last_error().value_or(""), "Startup rotation failed");
    EXPECT_EQ(fx.published()["last_error"], "Startup rotation failed");
    EXPECT_TRUE(supervisor->history().entries().empty());

    fx.network->succeed = true;
    supervisor->tick();

    EXPECT_EQ(engine->state(), core::InterfaceState::READY);
    auto history = supervisor->history().entries();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].reason, "initial_retry");
}

TEST_F(SupervisorTest, ManualTriggerTakesPriority)
{
    auto supervisor = make_supervisor();
    ASSERT_TRUE(supervisor->start());

    fx.clock->advance(400);
    ASSERT_TRUE(fx.store->create_trigger("wlan0"));
    supervisor->tick();

    auto history = supervisor->history().entries();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].reason, "manual_trigger");
    EXPECT_FALSE(std::filesystem::exists(fx.store->trigger_path("wlan0")));
}

TEST_F(SupervisorTest, QuietTickOnlyRefreshesStatus)
{
    auto supervisor = make_supervisor();
    ASSERT_TRUE(supervisor->start());

    fx.prober->set_clients("wlan0", 2);
    fx.clock->advance(30);
    supervisor->tick();

    EXPECT_EQ(fx.network->applied.size(), 1u);
    auto status = fx.published();
    EXPECT_EQ(status["state"], "ready");
    EXPECT_EQ(status["client_count"], 2);
    EXPECT_EQ(status["time_remaining"], 270);
}

TEST_F(SupervisorTest, HistoryHonoursRetention)
{
    config->log_retention_count = 2;
    auto supervisor = make_supervisor();
    ASSERT_TRUE(supervisor->start());

    for (int i = 0; i < 3; ++i)
    {
        fx.clock->advance(301);
        supervisor->tick();
    }

    auto history = supervisor->history().entries();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].reason, "time_expired");
    EXPECT_EQ(history[1].reason, "time_expired");
}

TEST_F(SupervisorTest, ReloadSwapsConfigForEveryEngine)
{
    auto supervisor = make_supervisor();
    ASSERT_TRUE(supervisor->start());

    next_config = fx.config();
    next_config->client_threshold = 1;
    next_config->min_time_after_clients_sec = 10;

    fx.prober->set_clients("wlan0", 1);
    fx.clock->advance(20);
    supervisor->tick();
    EXPECT_EQ(fx.network->applied.size(), 1u);

    supervisor->request_reload();
    supervisor->tick();

    EXPECT_EQ(supervisor->config()->client_threshold, 1);
    ASSERT_EQ(fx.network->applied.size(), 2u);
    EXPECT_EQ(supervisor->history().entries().back().reason, "client_threshold_1");
}

TEST_F(SupervisorTest, FailedReloadKeepsPreviousConfig)
{
    auto supervisor = make_supervisor();
    ASSERT_TRUE(supervisor->start());
    auto before = supervisor->config();

    loader_fails = true;
    supervisor->request_reload();
    supervisor->tick();
    EXPECT_EQ(supervisor->config(), before);

    loader_fails = false;
    next_config = fx.config();
    next_config->password_length = 4;
    supervisor->request_reload();
    supervisor->tick();
    EXPECT_EQ(supervisor->config(), before);
}

TEST_F(SupervisorTest, ReloadDoesNotChangeEnablement)
{
    auto supervisor = make_supervisor();
    ASSERT_TRUE(supervisor->start());

    next_config = fx.config();
    next_config->interfaces["wlan0"].enabled = false;
    supervisor->request_reload();
    supervisor->tick();

    ASSERT_FALSE(supervisor->config()->interfaces.at("wlan0").enabled);
    auto status = fx.published();
    EXPECT_EQ(status["state"], "ready");
    EXPECT_TRUE(status["enabled"].get<bool>());

    services::StatusReader reader(fx.dir.path() / "run", "wlan0", fx.clock);
    EXPECT_EQ(reader.active_interfaces(), std::vector<std::string>{"wlan0"});

    fx.clock->advance(301);
    supervisor->tick();
    EXPECT_EQ(supervisor->history().entries().back().reason, "time_expired");
}

TEST_F(SupervisorTest, RunKeepsTickingAfterAFailedTick)
{
    config->tick_interval_sec = 1;
    config->error_backoff_sec = 1;
    auto supervisor = make_supervisor();
    ASSERT_TRUE(supervisor->start());

    fx.prober->fail_client_counts(1);
    fx.clock->advance(301);
    std::thread loop([&]() { supervisor->run(); });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (supervisor->history().entries().size() < 2 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    supervisor->request_stop();
    loop.join();

    EXPECT_EQ(fx.prober->failures.load(), 1);
    auto history = supervisor->history().entries();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[1].reason, "time_expired");
    EXPECT_EQ(supervisor->engine("wlan0")->state(), core::InterfaceState::READY);
}

TEST_F(SupervisorTest, StopInterruptsErrorBackoff)
{
    config->error_backoff_sec = 60;
    auto supervisor = make_supervisor();
    ASSERT_TRUE(supervisor->start());

    fx.prober->fail_client_counts(1000);
    std::thread loop([&]() { supervisor->run(); });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (fx.prober->failures.load() == 0 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(fx.prober->failures.load(), 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto stop_at = std::chrono::steady_clock::now();
    supervisor->request_stop();
    loop.join();

    EXPECT_LT(std::chrono::steady_clock::now() - stop_at, std::chrono::seconds(5));
    EXPECT_EQ(fx.prober->failures.load(), 1);
}

TEST_F(SupervisorTest, RunReturnsPromptlyAfterStop)
{
    config->tick_interval_sec = 30;
    auto supervisor = make_supervisor();
    ASSERT_TRUE(supervisor->start());

    std::thread loop([&]() { supervisor->run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto stop_at = std::chrono::steady_clock::now();
    supervisor->request_stop();
    loop.join();

    EXPECT_LT(std::chrono::steady_clock::now() - stop_at, std::chrono::seconds(5));
    EXPECT_TRUE(supervisor->stop_requested());
}
