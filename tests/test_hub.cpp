#include <catch2/catch_test_macros.hpp>
#include "client/client.hpp"
#include "hub/hub.hpp"
#include "tracing/transaction.hpp"
#include "mocks/log_capture.hpp"
#include "mocks/mock_transport.hpp"

using namespace tracesdk;
using tracesdk::testing::LogCapture;
using tracesdk::testing::MockTransport;

namespace {

constexpr const char* kDsn = "https://abc@localhost:9000/42";

std::shared_ptr<Client> make_client(std::shared_ptr<ITransport> transport,
                                    TracesSampler sampler = nullptr,
                                    size_t max_spans = kDefaultMaxSpans) {
    ClientOptions options;
    options.dsn = kDsn;
    options.traces_sample_rate = 0.5;
    options.traces_sampler = std::move(sampler);
    options.max_spans = max_spans;
    return std::make_shared<Client>(std::move(options), std::move(transport));
}

} // anonymous namespace

TEST_CASE("Hub: start_transaction resolves sampling", "[hub]") {
    Hub hub(make_client(std::make_shared<MockTransport>()));

    hub.sampler().set_random_source([] { return 0.1; });
    auto sampled = hub.start_transaction(TransactionContext{});
    CHECK(sampled->sampled() == std::optional<bool>(true));

    hub.set_random_source([] { return 0.9; });
    auto unsampled = hub.start_transaction(TransactionContext{});
    CHECK(unsampled->sampled() == std::optional<bool>(false));
}

TEST_CASE("Hub: start_transaction without client is unsampled", "[hub]") {
    Hub hub;
    auto tx = hub.start_transaction(TransactionContext{});

    CHECK(tx->sampled() == std::optional<bool>(false));
    REQUIRE(tx->span_recorder());
    CHECK(tx->span_recorder()->maxlen() == kDefaultMaxSpans);
    CHECK(tx->tracestate().empty());
}

TEST_CASE("Hub: recorder bounded by client max_spans", "[hub]") {
    Hub hub(make_client(std::make_shared<MockTransport>(), nullptr, 3));
    auto tx = hub.start_transaction(TransactionContext{});

    REQUIRE(tx->span_recorder());
    CHECK(tx->span_recorder()->maxlen() == 3);
    CHECK(tx->span_recorder()->size() == 1);
}

TEST_CASE("Hub: sampling context carries custom and environment data", "[hub]") {
    std::optional<SamplingContext> seen;
    Hub hub(make_client(std::make_shared<MockTransport>(),
        [&seen](const SamplingContext& sc) -> nlohmann::json {
            seen = sc;
            return 1.0;
        }));

    hub.set_sampling_environment_provider([] {
        SamplingEnvironment env;
        RequestData request;
        request.method = "GET";
        request.url = "https://example.com/dogs";
        request.headers["accept"] = "application/json";
        env.request = request;
        env.location = LocationData{{"pathname", "/dogs"}};
        return env;
    });

    TransactionContext ctx;
    ctx.name = "GET /dogs";
    ctx.parent_sampled = false;
    auto tx = hub.start_transaction(ctx, {{"dog", "Charlie"}});

    REQUIRE(seen.has_value());
    CHECK(seen->transaction_context.name == "GET /dogs");
    CHECK(seen->parent_sampled == std::optional<bool>(false));
    CHECK(seen->custom["dog"] == "Charlie");
    REQUIRE(seen->request.has_value());
    CHECK(seen->request->method == "GET");
    CHECK(seen->request->to_json()["headers"]["accept"] == "application/json");
    REQUIRE(seen->location.has_value());
    CHECK(seen->location->at("pathname") == "/dogs");

    // The sampler overrides the parent's negative decision
    CHECK(tx->sampled() == std::optional<bool>(true));
}

TEST_CASE("Hub: continued trace inherits the parent decision", "[hub]") {
    Hub hub(make_client(std::make_shared<MockTransport>()));
    hub.sampler().set_random_source([] { return 0.99; });

    auto ctx = continue_from_traceparent("12312012123120121231201212312012-1121201211212012-1");
    REQUIRE(ctx.has_value());
    ctx->name = "downstream";
    auto tx = hub.start_transaction(*ctx);

    CHECK(tx->trace_id() == "12312012123120121231201212312012");
    CHECK(tx->parent_span_id() == std::optional<std::string>("1121201211212012"));
    CHECK(tx->sampled() == std::optional<bool>(true));
}

TEST_CASE("Hub: scope tracks the active span", "[hub]") {
    Hub hub(make_client(std::make_shared<MockTransport>()));
    auto tx = hub.start_transaction(TransactionContext{});

    hub.configure_scope([&tx](Scope& scope) { scope.set_span(tx); });
    CHECK(hub.get_scope().get_span() == tx->span());
    CHECK(hub.get_scope().get_transaction() == tx);

    auto child = tx->start_child();
    hub.get_scope().set_span(child);
    CHECK(hub.get_scope().get_transaction() == tx);

    hub.get_scope().clear();
    CHECK(hub.get_scope().get_span() == nullptr);
    CHECK(hub.get_scope().get_transaction() == nullptr);
}

TEST_CASE("Hub: scope tags are applied to captured events", "[hub]") {
    auto transport = std::make_shared<MockTransport>();
    Hub hub(make_client(transport));
    hub.get_scope().set_tag("region", "eu");
    hub.get_scope().set_tag("breed", "scope");

    nlohmann::json event = {{"message", "hello"}, {"tags", {{"breed", "corgi"}}}};
    const auto event_id = hub.capture_event(event);

    REQUIRE(event_id.has_value());
    REQUIRE(transport->requests().size() == 1);
    const auto sent = nlohmann::json::parse(transport->requests()[0].body);
    CHECK(sent["tags"]["region"] == "eu");
    CHECK(sent["tags"]["breed"] == "corgi");
}

TEST_CASE("Hub: non-object event with scope tags is dropped", "[hub]") {
    LogCapture logs;
    auto transport = std::make_shared<MockTransport>();
    Hub hub(make_client(transport));
    hub.get_scope().set_tag("k", "v");

    std::optional<std::string> event_id;
    CHECK_NOTHROW(event_id = hub.capture_event(nlohmann::json::array()));
    CHECK_FALSE(event_id.has_value());
    CHECK(transport->requests().empty());
    CHECK(logs.contains("must be a JSON object"));

    nlohmann::json not_an_object = nlohmann::json::array();
    hub.get_scope().apply_to_event(not_an_object);
    CHECK(not_an_object.is_array());
}

TEST_CASE("Hub: capture without client drops the event", "[hub]") {
    Hub hub;
    CHECK_FALSE(hub.capture_event({{"message", "lost"}}).has_value());
}

TEST_CASE("Hub: bind_client replaces the client", "[hub]") {
    Hub hub;
    CHECK(hub.get_client() == nullptr);

    auto client = make_client(std::make_shared<MockTransport>());
    hub.bind_client(client);
    CHECK(hub.get_client() == client);
}
