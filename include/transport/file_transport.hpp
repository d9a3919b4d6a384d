#pragma once

#include "transport/transport.hpp"
#include <cstddef>
#include <fstream>
#include <string>

namespace tracesdk {

/**
 * @brief File-backed transport for offline and development use
 *
 * Appends each request body to a file, followed by a newline. Envelope
 * bodies themselves span several lines, so a reader splits on the item
 * count rather than on single lines.
 */
class FileTransport : public ITransport {
public:
    struct Config {
        std::string output_file = "envelopes.log";
        bool flush_each_request = true;
    };

    /// Throws std::runtime_error if the file cannot be opened for appending.
    explicit FileTransport(const Config& config);
    ~FileTransport() override;

    [[nodiscard]] bool send(const Request& request) override;
    void flush() override;
    [[nodiscard]] std::string name() const override;

    /// Number of requests written (for stats/testing)
    [[nodiscard]] size_t sent_count() const { return sent_count_; }

private:
    void close();

    Config config_;
    std::ofstream file_stream_;
    size_t sent_count_ = 0;
};

} // namespace tracesdk
