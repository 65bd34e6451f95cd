#include "test_helpers.hpp"

#include "logger.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <thread>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

} // namespace

modelbridge::CommandResult FakeHost::execute(const std::string& operation, const modelbridge::json& params) {
    ++execute_calls;
    int now_active = ++active_;
    int seen = max_concurrent.load();
    while (now_active > seen && !max_concurrent.compare_exchange_weak(seen, now_active)) {
    }

    {
        std::lock_guard<std::mutex> lock(executed_mutex_);
        executed_.push_back(operation);
    }

    if (execute_delay.count() > 0) {
        std::this_thread::sleep_for(execute_delay);
    }

    modelbridge::CommandResult result;
    try {
        result = on_execute ? on_execute(operation, params)
                            : modelbridge::CommandResult::ok({{"id", "fake-" + operation}});
    } catch (...) {
        --active_;
        throw;
    }
    --active_;
    return result;
}

std::vector<std::string> FakeHost::executed_operations() {
    std::lock_guard<std::mutex> lock(executed_mutex_);
    return executed_;
}

int unused_local_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return 0;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    int port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            port = ntohs(addr.sin_port);
        }
    }
    ::close(fd);
    return port;
}

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}
