#include "SignalManager.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace SignalManager {

struct SignalCallbackList {
    std::vector<SignalCallback> normal_callbacks;
    std::optional<SignalCallback> final_callback;
};

static std::map<int, SignalCallbackList> callbacks;
static std::mutex cb_mutex;

static int wake_pipe[2] = {-1, -1};
static std::thread dispatcher;

extern "C" void forward_signal(int signum) {
    int saved_errno = errno;
    unsigned char byte = static_cast<unsigned char>(signum);
    if (wake_pipe[1] >= 0) {
        ssize_t rc = ::write(wake_pipe[1], &byte, 1);
        (void)rc;
    }
    errno = saved_errno;
}

static void dispatch(int signum) {
    std::vector<SignalCallback> to_run;
    {
        std::lock_guard<std::mutex> lock(cb_mutex);
        auto it = callbacks.find(signum);
        if (it == callbacks.end()) {
            return;
        }
        to_run = it->second.normal_callbacks;
        if (it->second.final_callback) {
            to_run.push_back(*it->second.final_callback);
        }
    }
    for (auto& cb : to_run) {
        cb(signum);
    }
}

static void dispatch_loop(int read_fd) {
    unsigned char byte = 0;
    while (true) {
        ssize_t n = ::read(read_fd, &byte, 1);
        if (n == 1) {
            dispatch(byte);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            // Write end closed by shutdown()
            break;
        }
    }
}

void register_signal(int signum, SignalCallback cb, bool is_final) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    if (is_final) {
        callbacks[signum].final_callback = std::move(cb);
    } else {
        callbacks[signum].normal_callbacks.push_back(std::move(cb));
    }
}

void setup() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    if (wake_pipe[0] < 0) {
        if (::pipe(wake_pipe) != 0) {
            throw std::runtime_error(std::string("Failed to create signal pipe: ") + std::strerror(errno));
        }
        ::fcntl(wake_pipe[1], F_SETFL, O_NONBLOCK);
        ::fcntl(wake_pipe[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(wake_pipe[1], F_SETFD, FD_CLOEXEC);
        dispatcher = std::thread(dispatch_loop, wake_pipe[0]);
    }
    for (const auto& kv : callbacks) {
        std::signal(kv.first, forward_signal);
    }
}

void shutdown() {
    {
        std::lock_guard<std::mutex> lock(cb_mutex);
        for (const auto& kv : callbacks) {
            std::signal(kv.first, SIG_DFL);
        }
        callbacks.clear();
        if (wake_pipe[1] >= 0) {
            ::close(wake_pipe[1]);
            wake_pipe[1] = -1;
        }
    }
    if (dispatcher.joinable()) {
        dispatcher.join();
    }
    if (wake_pipe[0] >= 0) {
        ::close(wake_pipe[0]);
        wake_pipe[0] = -1;
    }
}

}
