#include <doctest/doctest.h>

#ifdef SMILEYS_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    EnvGuard(EnvGuard&& other) noexcept
        : key(std::move(other.key)), original(std::move(other.original)), active(other.active) {
        other.active = false;
    }

    ~EnvGuard() {
        if (!active) {
            return;
        }
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
    bool                       active{true};
};

auto makeBaselineEnv() -> std::vector<EnvGuard> {
    std::vector<EnvGuard> guards;
    for (auto const* name : {"SMILEYS_LOG_ENABLED",
                             "SMILEYS_LOG",
                             "SMILEYS_LOG_CLEAR_DEFAULT_SKIPS",
                             "SMILEYS_LOG_ENABLE_TAGS",
                             "SMILEYS_LOG_SKIP_TAGS"}) {
        guards.emplace_back(name, nullptr);
    }
    return guards;
}

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

// The destructor joins the worker, so everything queued is written by then.
auto logOnce(std::function<void(SM::TaggedLogger&)> fn) -> std::string {
    return captureStderr([&] {
        SM::TaggedLogger logger;
        fn(logger);
    });
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto env = makeBaselineEnv();
    auto output = logOnce([](SM::TaggedLogger& logger) {
        logger.log_impl("should not appear", std::source_location::current(), "Tick");
    });
    CHECK(output.empty());
}

TEST_CASE("environment_flag_enables_logging") {
    auto env = makeBaselineEnv();
    EnvGuard enableLog("SMILEYS_LOG_ENABLED", "1");

    auto output = logOnce([](SM::TaggedLogger& logger) {
        logger.log_impl("tick 1 at 100ms", std::source_location::current(), "Tick");
    });
    CHECK(output.find("[Tick]") != std::string::npos);
    CHECK(output.find("tick 1 at 100ms") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("SMILEYS_LOG_env_enables_logging") {
    auto env = makeBaselineEnv();
    EnvGuard enableLog("SMILEYS_LOG", "on");

    auto output = logOnce([](SM::TaggedLogger& logger) {
        logger.log_impl("event quit", std::source_location::current(), "Event");
    });
    CHECK(output.find("event quit") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_info_tag") {
    auto env = makeBaselineEnv();
    EnvGuard enableLog("SMILEYS_LOG_ENABLED", "1");

    auto skipped = logOnce([](SM::TaggedLogger& logger) {
        logger.log_impl("filtered", std::source_location::current(), "INFO");
    });
    CHECK(skipped.empty());

    EnvGuard clearSkips("SMILEYS_LOG_CLEAR_DEFAULT_SKIPS", "1");
    auto allowed = logOnce([](SM::TaggedLogger& logger) {
        logger.log_impl("info allowed", std::source_location::current(), "INFO");
    });
    CHECK(allowed.find("info allowed") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    auto env = makeBaselineEnv();
    EnvGuard enableLog("SMILEYS_LOG_ENABLED", "1");
    EnvGuard enableTags("SMILEYS_LOG_ENABLE_TAGS", "Face,Render");

    auto accepted = logOnce([](SM::TaggedLogger& logger) {
        logger.log_impl("keep me", std::source_location::current(), "Face");
    });
    CHECK(accepted.find("keep me") != std::string::npos);

    auto rejected = logOnce([](SM::TaggedLogger& logger) {
        logger.log_impl("drop me", std::source_location::current(), "Face", "Tick");
    });
    CHECK(rejected.empty());
}

TEST_CASE("custom_skip_tags_extend_filter") {
    auto env = makeBaselineEnv();
    EnvGuard enableLog("SMILEYS_LOG_ENABLED", "1");
    EnvGuard extraSkip("SMILEYS_LOG_SKIP_TAGS", "Tick,Event");

    auto skipped = logOnce([](SM::TaggedLogger& logger) {
        logger.log_impl("not expected", std::source_location::current(), "Event");
    });
    CHECK(skipped.empty());

    auto passed = logOnce([](SM::TaggedLogger& logger) {
        logger.log_impl("expected", std::source_location::current(), "Loop");
    });
    CHECK(passed.find("expected") != std::string::npos);
}

TEST_CASE("thread_name_is_used_in_output") {
    auto env = makeBaselineEnv();
    EnvGuard enableLog("SMILEYS_LOG_ENABLED", "1");

    auto output = logOnce([](SM::TaggedLogger& logger) {
        logger.setThreadName("Render-1");
        logger.log_impl("with name", std::source_location::current(), "Render");
    });
    CHECK(output.find("[Render-1]") != std::string::npos);
}

TEST_CASE("set_logging_enabled_overrides_env") {
    auto env = makeBaselineEnv();
    EnvGuard enableLog("SMILEYS_LOG_ENABLED", "1");

    auto suppressed = logOnce([](SM::TaggedLogger& logger) {
        logger.setLoggingEnabled(false);
        CHECK_FALSE(logger.loggingEnabled());
        logger.log_impl("disabled", std::source_location::current(), "Loop");
    });
    CHECK(suppressed.empty());
}

TEST_CASE("global_wrappers_and_macro_emit_joined_tags") {
    auto env = makeBaselineEnv();
    bool const wasEnabled = SM::logger().loggingEnabled();

    auto output = captureStderr([] {
        SM::set_thread_name("TestMain");
        SM::set_logging_enabled(true);
        sm_log("via macro", "Face", "ERROR");
        std::this_thread::sleep_for(50ms);
    });
    SM::set_logging_enabled(wasEnabled);

    CHECK(output.find("ERROR][Face") != std::string::npos);
    CHECK(output.find("[TestMain]") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto env = makeBaselineEnv();
    EnvGuard enableLog("SMILEYS_LOG_ENABLED", "1");

    auto output = logOnce([](SM::TaggedLogger& logger) {
#line 42 "dir/scene/Smiley.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Smiley");
#line 212 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(output.find("scene/Smiley.cpp:42") != std::string::npos);
}

}

#endif // SMILEYS_LOG_DEBUG
