#pragma once

#include "core/utils.hpp"
#include <string>
#include <vector>

namespace tracesdk::testing {

/**
 * @brief Redirects log output into memory for the lifetime of the object
 *
 * Restores the stderr sink and the previous minimum level on destruction.
 */
class LogCapture {
public:
    explicit LogCapture(utils::log::Level level = utils::log::Level::DEBUG)
        : previous_level_(utils::log::get_level()) {
        utils::log::set_level(level);
        utils::log::set_sink([this](utils::log::Level lvl, const std::string& msg) {
            entries_.push_back({lvl, msg});
        });
    }

    ~LogCapture() {
        utils::log::set_sink(nullptr);
        utils::log::set_level(previous_level_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] bool contains(const std::string& needle) const {
        for (const auto& e : entries_) {
            if (e.message.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    [[nodiscard]] size_t count(utils::log::Level level) const {
        size_t n = 0;
        for (const auto& e : entries_) {
            if (e.level == level) ++n;
        }
        return n;
    }

private:
    struct Entry {
        utils::log::Level level;
        std::string message;
    };

    utils::log::Level previous_level_;
    std::vector<Entry> entries_;
};

} // namespace tracesdk::testing
