#pragma once

#include "transport/transport.hpp"
#include <string>
#include <vector>

namespace tracesdk::testing {

/**
 * @brief Transport that records every request instead of delivering it
 */
class MockTransport : public ITransport {
public:
    explicit MockTransport(bool should_accept = true)
        : should_accept_(should_accept) {}

    [[nodiscard]] bool send(const Request& request) override {
        requests_.push_back(request);
        return should_accept_;
    }

    void flush() override { ++flush_count_; }

    [[nodiscard]] std::string name() const override { return "mock"; }

    [[nodiscard]] const std::vector<Request>& requests() const { return requests_; }
    [[nodiscard]] size_t flush_count() const { return flush_count_; }

    void set_should_accept(bool v) { should_accept_ = v; }

private:
    bool should_accept_;
    std::vector<Request> requests_;
    size_t flush_count_ = 0;
};

} // namespace tracesdk::testing
