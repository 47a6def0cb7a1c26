#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/linux/wayland_paste_output.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      launcher_(platform::server_log_path()),
      server_client_(DaemonCore::server_base_url(config_), config_.backend.language),
      output_(make_output(config_.output)),
      feedback_(DesktopFeedback::Options{
          .sounds = config_.feedback.sounds,
          .notifications = config_.feedback.notifications,
          .sound_dir = config_.feedback.sound_dir,
      }),
      core_(config_, verbose_,
            // CaptureFactory: one PipeWire stream per session
            [bytes = config_.audio.ring_buffer_bytes(),
             rate = config_.audio.sample_rate]() -> std::unique_ptr<AudioCapture> {
                return std::make_unique<PipeWireCapture>(bytes, rate);
            },
            launcher_, server_client_, *output_, feedback_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

std::unique_ptr<OutputMethod> LinuxEventLoop::make_output(const Config::Output& output) {
    if (output.method == "clipboard") {
        return std::make_unique<WaylandClipboardOutput>();
    }
    if (output.method != "paste") {
        std::println(stderr, "Unknown output method '{}', using paste", output.method);
    }
    return std::make_unique<WaylandPasteOutput>(WaylandPasteOutput::Options{
        .keys = output.paste_keys,
        .restore_clipboard = output.restore_clipboard,
        .restore_delay = std::chrono::milliseconds(output.restore_delay_ms),
    });
}

bool LinuxEventLoop::init() {
    // Signal handling via signalfd. SIGUSR1 is the out-of-band reset.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGUSR1);
    // Blocked before any thread starts so every thread inherits the mask.
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (backends, history db, server reaper)
    if (!core_.init()) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // One-second tick for auto-stop and the safety reset
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    itimerspec interval{.it_interval = {.tv_sec = 1, .tv_nsec = 0},
                    .it_value = {.tv_sec = 1, .tv_nsec = 0}};
    if (timerfd_settime(timer_fd_, 0, &interval, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) return true;
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(timer_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                handle_signal();
                continue;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                if (::read(timer_fd_, &expirations, sizeof(expirations)) > 0) {
                    core_.on_tick();
                }
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_signal() {
    signalfd_siginfo info;
    while (::read(signal_fd_, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
        if (info.ssi_signo == SIGUSR1) {
            log("Received SIGUSR1, resetting");
            core_.on_reset_signal();
            continue;
        }
        log("Received signal, shutting down");
        running_.store(false, std::memory_order_release);
    }
}

void LinuxEventLoop::handle_client(int fd) {
    // A client may pipeline several commands in one write.
    while (true) {
        nlohmann::json cmd;
        auto res = ipc_server_.read_command(fd, cmd);
        if (res == IpcServer::ReadResult::Pending) return;
        if (res == IpcServer::ReadResult::Closed) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            ipc_server_.close_client(fd);
            return;
        }

        std::string cmd_str = cmd.is_object() ? cmd.value("cmd", "") : "";
        auto response = core_.handle_command(cmd_str, cmd);
        if (!ipc_server_.send_response(fd, response)) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            ipc_server_.close_client(fd);
            return;
        }
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[pushscribe] {}", msg);
    }
}
