#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "output/output.hpp"
#include "platform/linux/desktop_feedback.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/posix_process_launcher.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "whisper/whisper_server_client.hpp"

#include <atomic>
#include <memory>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    static std::unique_ptr<OutputMethod> make_output(const Config::Output& output);

private:
    void handle_signal();
    void handle_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    PipeWireCapture::Library pipewire_;
    PosixProcessLauncher launcher_;
    WhisperServerClient server_client_;
    std::unique_ptr<OutputMethod> output_;
    DesktopFeedback feedback_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;

    std::atomic<bool> running_{false};
};
