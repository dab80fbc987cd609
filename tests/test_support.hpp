#ifndef APROTATE_TESTS_TEST_SUPPORT_HPP
#define APROTATE_TESTS_TEST_SUPPORT_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "core/clock.hpp"
#include "core/config.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/interface_prober.hpp"
#include "infrastructure/hostapd_config_writer.hpp"
#include "infrastructure/qr_generator.hpp"
#include "infrastructure/network_controller.hpp"
#include "services/credential_generator.hpp"
#include "services/status_store.hpp"
#include "services/rotation_engine.hpp"

namespace aprotate
{
    namespace test
    {

        /**
         * Fresh directory under the system temp dir, removed on destruction
         */
        class TempDir
        {
        public:
            TempDir()
            {
                std::string pattern = (std::filesystem::temp_directory_path() / "aprotate-test-XXXXXX").string();
                char *created = mkdtemp(pattern.data());
                if (!created)
                {
                    throw std::runtime_error("mkdtemp failed");
                }
                path_ = created;
            }

            ~TempDir()
            {
                std::error_code ec;
                std::filesystem::remove_all(path_, ec);
            }

            TempDir(const TempDir &) = delete;
            TempDir &operator=(const TempDir &) = delete;

            const std::filesystem::path &path() const { return path_; }

            std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

        private:
            std::filesystem::path path_;
        };

        inline std::string slurp(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        inline void write_text(const std::filesystem::path &path, const std::string &content)
        {
            std::ofstream out(path);
            out << content;
        }

        inline std::filesystem::perms permissions_of(const std::filesystem::path &path)
        {
            return std::filesystem::status(path).permissions() & std::filesystem::perms::mask;
        }

        class FakeClock : public core::Clock
        {
        public:
            explicit FakeClock(double start = 1000000.0) : now_(start) {}

            double now() const override { return now_; }
            void set(double value) { now_ = value; }
            void advance(double seconds) { now_ = now_ + seconds; }

        private:
            std::atomic<double> now_;
        };

        class FakeProber : public infrastructure::InterfaceProber
        {
        public:
            bool interface_exists(const std::string &interface) override
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return present.count(interface) > 0;
            }

            int client_count(const std::string &interface) override
            {
                std::lock_guard<std::mutex> lock(mutex_);
                probes++;
                if (failures_left > 0)
                {
                    failures_left--;
                    failures++;
                    throw std::runtime_error("station dump unreadable");
                }
                auto it = clients.find(interface);
                return it == clients.end() ? 0 : it->second;
            }

            void set_clients(const std::string &interface, int count)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                clients[interface] = count;
            }

            // The next `count` client_count() calls throw
            void fail_client_counts(int count)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                failures_left = count;
            }

            std::map<std::string, int> clients;
            std::map<std::string, bool> present{{"wlan0", true}};
            int probes = 0;
            int failures_left = 0;
            std::atomic<int> failures{0};

        private:
            std::mutex mutex_;
        };

        class RecordingConfigWriter : public infrastructure::ConfigWriter
        {
        public:
            bool write(const infrastructure::AccessPointSettings &settings) override
            {
                std::lock_guard<std::mutex> lock(mutex_);
                writes.push_back(settings);
                return succeed;
            }

            std::vector<infrastructure::AccessPointSettings> writes;
            bool succeed = true;

        private:
            std::mutex mutex_;
        };

        class FakeQrGenerator : public infrastructure::QrGenerator
        {
        public:
            bool generate(const std::string &interface, const std::string &ssid, const std::string &) override
            {
                calls++;
                last_interface = interface;
                last_ssid = ssid;
                return succeed;
            }

            std::atomic<int> calls{0};
            std::string last_interface;
            std::string last_ssid;
            bool succeed = true;
        };

        class FakeNetworkController : public infrastructure::NetworkController
        {
        public:
            bool apply(const std::string &interface, bool dual_mode) override
            {
                std::unique_lock<std::mutex> lock(mutex_);
                applied.push_back(interface);
                last_dual_mode = dual_mode;
                active++;
                max_active = std::max(max_active, active);
                if (delay.count() > 0)
                {
                    lock.unlock();
                    std::this_thread::sleep_for(delay);
                    lock.lock();
                }
                active--;
                if (fail_next > 0)
                {
                    fail_next--;
                    return false;
                }
                return succeed;
            }

            std::vector<std::string> applied;
            bool last_dual_mode = false;
            bool succeed = true;
            int fail_next = 0;
            int active = 0;
            int max_active = 0;
            std::chrono::milliseconds delay{0};

        private:
            std::mutex mutex_;
        };

        /**
         * Scripted command results, keyed by argv[0]
         */
        class FakeCommandRunner : public infrastructure::CommandRunner
        {
        public:
            infrastructure::CommandResult run(const std::vector<std::string> &argv,
                                              std::chrono::milliseconds) override
            {
                calls.push_back(argv);
                auto it = results.find(argv.empty() ? std::string() : argv[0]);
                if (it == results.end())
                {
                    infrastructure::CommandResult failed;
                    failed.started = true;
                    failed.exit_code = 1;
                    return failed;
                }
                return it->second;
            }

            static infrastructure::CommandResult success(const std::string &output = "")
            {
                infrastructure::CommandResult result;
                result.started = true;
                result.exit_code = 0;
                result.output = output;
                return result;
            }

            std::map<std::string, infrastructure::CommandResult> results;
            std::vector<std::vector<std::string>> calls;
        };

        /**
         * Engine wiring with fakes and a run directory under a TempDir
         */
        struct EngineFixture
        {
            TempDir dir;
            std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
            std::shared_ptr<FakeProber> prober = std::make_shared<FakeProber>();
            std::shared_ptr<RecordingConfigWriter> writer = std::make_shared<RecordingConfigWriter>();
            std::shared_ptr<FakeQrGenerator> qr = std::make_shared<FakeQrGenerator>();
            std::shared_ptr<FakeNetworkController> network = std::make_shared<FakeNetworkController>();
            std::shared_ptr<services::StatusStore> store;

            EngineFixture() : store(std::make_shared<services::StatusStore>(dir.path() / "run"))
            {
                store->ensure_run_dir();
            }

            services::EngineDependencies deps() const
            {
                services::EngineDependencies d;
                d.clock = clock;
                d.prober = prober;
                d.generator = std::make_shared<services::CredentialGenerator>();
                d.config_writer = writer;
                d.qr_generator = qr;
                d.network = network;
                d.store = store;
                return d;
            }

            std::shared_ptr<core::DaemonConfig> config() const
            {
                auto cfg = std::shared_ptr<core::DaemonConfig>(core::DaemonConfig::create_default());
                cfg->paths.run_dir = (dir.path() / "run").string();
                cfg->paths.log_dir = (dir.path() / "log").string();
                cfg->startup_retry_delay_sec = 0;
                return cfg;
            }

            nlohmann::json published(const std::string &interface = "wlan0") const
            {
                return nlohmann::json::parse(slurp(store->status_path(interface)));
            }
        };

    } // namespace test
} // namespace aprotate

#endif // APROTATE_TESTS_TEST_SUPPORT_HPP
