#include "client/client.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "hub/hub.hpp"
#include "tracing/transaction.hpp"
#include "transport/file_transport.hpp"

#include <chrono>
#include <memory>
#include <thread>

using namespace tracesdk;

namespace {

void simulate_work(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("trace_sdk demo starting...");

        std::string config_file = "config/sdk.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info("[1/4] Loading configuration from " + config_file);

        SdkConfig config;
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (config_result.success) {
            config = std::move(config_result.config);
        } else {
            utils::log::warn(config_result.error_message + " - using defaults");
            config.client.traces_sample_rate = 1.0;
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info("[2/4] Transport: writing to " + config.transport.file);
        FileTransport::Config transport_config;
        transport_config.output_file = config.transport.file;
        transport_config.flush_each_request = config.transport.flush_each_request;
        auto transport = std::make_shared<FileTransport>(transport_config);

        auto client = std::make_shared<Client>(std::move(config.client), transport);
        Hub hub(client);

        utils::log::info("[3/4] Starting transaction");
        TransactionContext context;
        context.name = "demo.checkout";
        context.op = "task";
        auto transaction = hub.start_transaction(std::move(context),
                                                 {{"source", "trace_sdk_demo"}});
        hub.get_scope().set_span(transaction);

        SpanContext db_context;
        db_context.op = "db.query";
        db_context.description = "SELECT * FROM carts WHERE id = $1";
        auto db_span = transaction->start_child(std::move(db_context));
        simulate_work(15);
        db_span->set_status(SpanStatus::OK);
        db_span->finish();

        SpanContext http_context;
        http_context.op = "http.client";
        http_context.description = "POST /payments";
        auto http_span = transaction->start_child(std::move(http_context));
        simulate_work(25);
        http_span->set_http_status(201);
        http_span->finish();

        transaction->set_http_status(200);
        const auto event_id = transaction->finish();

        utils::log::info("[4/4] traceparent: " + transaction->to_traceparent());
        if (event_id) {
            utils::log::info("Transaction sent, event id " + *event_id);
        } else {
            utils::log::info("Transaction not sent (unsampled or no DSN)");
        }

        client->flush();

    } catch (const std::exception& e) {
        utils::log::error(std::string("Fatal: ") + e.what());
        return 1;
    }

    return 0;
}
