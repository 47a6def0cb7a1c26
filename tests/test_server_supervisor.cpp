#include <catch2/catch_test_macros.hpp>

#include "fake_server.hpp"
#include "server/server_supervisor.hpp"
#include "whisper/server_backend.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

using fakes::FakeClient;
using fakes::FakeLauncher;
using fakes::fast_options;

TEST_CASE("ServerSupervisor start", "[supervisor]") {
    FakeLauncher launcher;
    FakeClient client;
    ServerSupervisor sup(fast_options(), launcher, client);

    SECTION("LazyStart") {
        REQUIRE(sup.state() == ServerState::Stopped);
        REQUIRE(launcher.spawn_count() == 0);

        client.healthy_after = 3;
        REQUIRE(sup.ensure_running());
        REQUIRE(sup.state() == ServerState::Ready);
        REQUIRE(sup.pid() == 1001);
        REQUIRE(launcher.spawn_count() == 1);
        REQUIRE(launcher.last_argv == std::vector<std::string>{"whisper-server", "-m", "model.bin"});
        REQUIRE(client.probes >= 4);

        // Already running: no second spawn.
        REQUIRE(sup.ensure_running());
        REQUIRE(launcher.spawn_count() == 1);
    }

    SECTION("ConcurrentCallersShareOneStart") {
        client.healthy_after = 20;

        std::vector<std::future<std::expected<void, std::string>>> results;
        for (int i = 0; i < 8; ++i) {
            results.push_back(std::async(std::launch::async, [&sup] { return sup.ensure_running(); }));
        }
        for (auto& r : results) {
            REQUIRE(r.get().has_value());
        }
        REQUIRE(launcher.spawn_count() == 1);
        REQUIRE(sup.state() == ServerState::Ready);
    }

    SECTION("ConcurrentCallersShareFailure") {
        client.never_healthy = true;

        std::vector<std::future<std::expected<void, std::string>>> results;
        for (int i = 0; i < 4; ++i) {
            results.push_back(std::async(std::launch::async, [&sup] { return sup.ensure_running(); }));
        }
        for (auto& r : results) {
            REQUIRE_FALSE(r.get().has_value());
        }
        REQUIRE(launcher.spawn_count() == 1);
        REQUIRE(sup.state() == ServerState::Stopped);
        REQUIRE(launcher.signals_sent() == std::vector<int>{SIGKILL});
    }

    SECTION("StartTimeoutKillsProcess") {
        client.never_healthy = true;

        auto res = sup.ensure_running();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("not healthy") != std::string::npos);
        REQUIRE(sup.state() == ServerState::Stopped);
        REQUIRE(sup.pid() == -1);
        REQUIRE_FALSE(launcher.alive(1001));

        // The next call is a fresh attempt.
        client.never_healthy = false;
        REQUIRE(sup.ensure_running());
        REQUIRE(launcher.spawn_count() == 2);
    }

    SECTION("SpawnFailure") {
        launcher.spawn_error = "/opt/whisper-server: not executable";

        auto res = sup.ensure_running();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("spawn failed") != std::string::npos);
        REQUIRE(sup.state() == ServerState::Stopped);
    }

    SECTION("ExitDuringStartup") {
        client.healthy_after = 1000000;
        std::thread killer([&launcher] {
            std::this_thread::sleep_for(20ms);
            launcher.crash(1001);
        });
        auto res = sup.ensure_running();
        killer.join();

        REQUIRE_FALSE(res);
        REQUIRE(res.error() == "server exited during startup");
        REQUIRE(sup.state() == ServerState::Stopped);
    }
}

TEST_CASE("ServerSupervisor idle and crash handling", "[supervisor]") {
    FakeLauncher launcher;
    FakeClient client;
    ServerSupervisor sup(fast_options(), launcher, client);
    REQUIRE(sup.ensure_running());
    std::vector<int16_t> audio(16000, 0);

    SECTION("IdleShutdown") {
        auto used = sup.last_used_at();

        REQUIRE_FALSE(sup.reap_idle(used + 29min));
        REQUIRE(sup.state() == ServerState::Ready);

        REQUIRE(sup.reap_idle(used + 30min));
        REQUIRE(sup.state() == ServerState::Stopped);
        REQUIRE(launcher.signals_sent() == std::vector<int>{SIGTERM});

        // A later request starts a new process.
        REQUIRE(sup.ensure_running());
        REQUIRE(launcher.spawn_count() == 2);
    }

    SECTION("InFlightRequestNotDropped") {
        std::promise<void> entered;
        std::promise<void> release;
        client.entered = &entered;
        client.gate = release.get_future().share();

        auto pending = std::async(std::launch::async,
                                  [&sup, &audio] { return sup.transcribe(audio, 16000); });
        entered.get_future().wait();

        // Idle deadline passes while the request is still running.
        REQUIRE_FALSE(sup.reap_idle(ServerSupervisor::Clock::now() + 31min));
        REQUIRE(sup.state() == ServerState::Ready);

        release.set_value();
        auto result = pending.get();
        REQUIRE(result);
        REQUIRE(result->text == "hello world");
        REQUIRE(launcher.signals_sent().empty());

        // Finishing the request counts as use.
        auto used = sup.last_used_at();
        REQUIRE_FALSE(sup.reap_idle(used + 29min));
        REQUIRE(sup.reap_idle(used + 30min));
    }

    SECTION("CrashDetectedOnTranscribe") {
        launcher.crash(sup.pid());

        auto res = sup.transcribe(audio, 16000);
        REQUIRE_FALSE(res);
        REQUIRE(res.error() == "local server exited unexpectedly");
        REQUIRE(sup.state() == ServerState::Stopped);
        REQUIRE(client.transcriptions == 0);

        REQUIRE(sup.ensure_running());
        REQUIRE(launcher.spawn_count() == 2);
    }

    SECTION("CrashDetectedByReaper") {
        launcher.crash(sup.pid());
        REQUIRE(sup.reap_idle(ServerSupervisor::Clock::now()));
        REQUIRE(sup.state() == ServerState::Stopped);
        REQUIRE(launcher.signals_sent().empty());
    }

    SECTION("CrashDetectedOnEnsureRunning") {
        launcher.crash(sup.pid());
        REQUIRE(sup.ensure_running());
        REQUIRE(launcher.spawn_count() == 2);
        REQUIRE(sup.pid() == 1002);
    }

    SECTION("TranscribeRequiresReady") {
        REQUIRE(sup.stop());
        auto res = sup.transcribe(audio, 16000);
        REQUIRE_FALSE(res);
        REQUIRE(res.error() == "local server is stopped");
    }

    SECTION("BackgroundReaper") {
        ServerOptions opts = fast_options();
        opts.idle_timeout = 20ms;
        FakeLauncher l2;
        FakeClient c2;
        ServerSupervisor quick(opts, l2, c2);
        REQUIRE(quick.ensure_running());

        quick.start_reaper();
        for (int i = 0; i < 200 && quick.state() != ServerState::Stopped; ++i) {
            std::this_thread::sleep_for(10ms);
        }
        quick.stop_reaper();
        REQUIRE(quick.state() == ServerState::Stopped);
        REQUIRE(l2.signals_sent() == std::vector<int>{SIGTERM});
    }
}

TEST_CASE("ServerSupervisor stop", "[supervisor]") {
    FakeLauncher launcher;
    FakeClient client;
    ServerSupervisor sup(fast_options(), launcher, client);

    SECTION("StopWhenStoppedIsNoOp") {
        REQUIRE(sup.stop());
        REQUIRE(launcher.signals_sent().empty());
    }

    SECTION("GracefulStop") {
        REQUIRE(sup.ensure_running());
        REQUIRE(sup.stop());
        REQUIRE(sup.state() == ServerState::Stopped);
        REQUIRE(launcher.signals_sent() == std::vector<int>{SIGTERM});
        REQUIRE(sup.stop());
        REQUIRE(launcher.signals_sent().size() == 1);
    }

    SECTION("EscalatesToSigkill") {
        launcher.ignore_term = true;
        REQUIRE(sup.ensure_running());

        REQUIRE(sup.stop());
        REQUIRE(launcher.signals_sent() == std::vector<int>{SIGTERM, SIGKILL});
        REQUIRE(sup.state() == ServerState::Stopped);
    }

    SECTION("SurvivesSigkill") {
        launcher.ignore_term = true;
        launcher.survive_kill = true;
        REQUIRE(sup.ensure_running());

        auto res = sup.stop();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("survived SIGKILL") != std::string::npos);
        REQUIRE(sup.state() == ServerState::Stopped);
        launcher.survive_kill = false;
    }
}

TEST_CASE("ServerBackend", "[supervisor]") {
    FakeLauncher launcher;
    FakeClient client;
    ServerSupervisor sup(fast_options(), launcher, client);
    ServerBackend backend(sup);
    std::vector<int16_t> audio(8000, 0);

    SECTION("StartsServerOnDemand") {
        auto res = backend.transcribe(audio, 16000);
        REQUIRE(res);
        REQUIRE(res->text == "hello world");
        REQUIRE(res->backend == "local-server");
        REQUIRE(sup.state() == ServerState::Ready);
    }

    SECTION("ReportsStartFailure") {
        launcher.spawn_error = "no such file";
        auto res = backend.transcribe(audio, 16000);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().starts_with("local server unavailable"));
    }
}
