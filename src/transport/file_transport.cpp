#include "transport/file_transport.hpp"
#include <stdexcept>

namespace tracesdk {

FileTransport::FileTransport(const Config& config)
    : config_(config) {
    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open transport file: " + config_.output_file);
    }
}

FileTransport::~FileTransport() {
    close();
}

bool FileTransport::send(const Request& request) {
    if (!file_stream_.is_open()) return false;

    file_stream_.write(request.body.data(), static_cast<std::streamsize>(request.body.size()));
    file_stream_.put('\n');
    if (config_.flush_each_request) {
        file_stream_.flush();
    }
    if (!file_stream_.good()) return false;

    ++sent_count_;
    return true;
}

void FileTransport::flush() {
    file_stream_.flush();
}

std::string FileTransport::name() const {
    return "file:" + config_.output_file;
}

void FileTransport::close() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

} // namespace tracesdk
