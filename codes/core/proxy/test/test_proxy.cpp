// Proxy模块单元测试

#include <gtest/gtest.h>
#include "proxy/chaos_gate.hpp"
#include "proxy/exchange_handler.hpp"
#include "proxy/json_rpc.hpp"
#include "proxy/packet_type.hpp"
#include "proxy/presenter.hpp"
#include "proxy/proxy_context.hpp"
#include "proxy/request_forwarder.hpp"
#include "proxy/rpc_modules_override.hpp"
#include "proxy/suppression_engine.hpp"
#include "utils/color.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace rpc_snoop {
namespace proxy {

namespace {

const char* const RPC_MODULES_REQUEST =
    R"({"id":1,"jsonrpc":"2.0","method":"rpc_modules","params":[]})";
const char* const BLOCK_NUMBER_REQUEST =
    R"({"id":7,"jsonrpc":"2.0","method":"eth_blockNumber","params":[]})";
const char* const BLOCK_NUMBER_RESPONSE =
    R"({"id":7,"jsonrpc":"2.0","result":"0x10"})";
const char* const ERROR_RESPONSE =
    R"({"id":7,"jsonrpc":"2.0","error":{"code":-32601,"message":"method not found"}})";

// 固定时间，便于比较输出
class FixedTimeSource : public utils::TimeSource {
public:
    explicit FixedTimeSource(uint64_t ms) : ms_(ms) {}
    uint64_t get_current_time_ms() const override { return ms_; }

private:
    uint64_t ms_;
};

// 记录调用并返回预设响应的上游
class FakeTransport : public protocol::HttpTransport {
public:
    FakeTransport() : calls(0), fail(false), throws(false) {
        response.set_status(200, "OK");
        response.add_header("content-type", "application/json");
        response.set_body(BLOCK_NUMBER_RESPONSE);
    }

    utils::Result<protocol::HttpResponse> send(const protocol::Uri& destination,
                                               const protocol::HttpRequest& request) override {
        ++calls;
        last_destination = destination;
        last_request = request;
        if (throws) {
            throw std::runtime_error("upstream exploded");
        }
        if (fail) {
            return utils::make_err<protocol::HttpResponse>(utils::ErrorCode::NETWORK_CONNECT_ERROR,
                                                           "connection refused");
        }
        return utils::make_ok(response);
    }

    int calls;
    bool fail;
    bool throws;
    protocol::HttpResponse response;
    protocol::Uri last_destination;
    protocol::HttpRequest last_request;
};

config::Config make_config(const std::string& endpoint) {
    config::Config cfg;
    cfg.set_endpoint(endpoint);
    config::ChaosConfig chaos;
    chaos.drop_delay_seconds = 0.0;
    chaos.has_seed = true;
    chaos.seed = 42;
    cfg.set_chaos(chaos);
    return cfg;
}

std::shared_ptr<ProxyContext> make_context(const config::Config& cfg) {
    auto created = ProxyContext::create(cfg);
    EXPECT_TRUE(created.is_ok()) << created.error_message();
    return created.take();
}

protocol::HttpRequest make_request(const std::string& target, const std::string& body) {
    protocol::HttpRequest request;
    request.method = "POST";
    request.target = target;
    request.add_header("Host", "localhost:3000");
    request.add_header("Content-Type", "application/json");
    request.body = body;
    return request;
}

} // namespace

// ==================== PacketType ====================

TEST(PacketTypeTest, LabelsAndDirections) {
    EXPECT_STREQ(PacketType::request().label(), "REQUEST");
    EXPECT_STREQ(PacketType::response().label(), "RESPONSE");
    EXPECT_STREQ(PacketType::request_dropped(12.0).label(), "DROPPED REQUEST");
    EXPECT_STREQ(PacketType::response_dropped(12.0).label(), "DROPPED RESPONSE");

    EXPECT_EQ(PacketType::request_dropped(1.0).direction(), Direction::REQUEST);
    EXPECT_EQ(PacketType::response().direction(), Direction::RESPONSE);
    EXPECT_TRUE(PacketType::response_dropped(3.5).is_dropped());
    EXPECT_FALSE(PacketType::request().is_dropped());
    EXPECT_DOUBLE_EQ(PacketType::response_dropped(3.5).delay_seconds(), 3.5);
    EXPECT_EQ(PacketType::request_dropped(2.0), PacketType::request_dropped(2.0));
    EXPECT_NE(PacketType::request_dropped(2.0), PacketType::request());
}

TEST(PacketTypeTest, ScopeMatches) {
    EXPECT_TRUE(scope_matches(config::SuppressScope::ALL, Direction::REQUEST));
    EXPECT_TRUE(scope_matches(config::SuppressScope::ALL, Direction::RESPONSE));
    EXPECT_TRUE(scope_matches(config::SuppressScope::REQUEST_ONLY, Direction::REQUEST));
    EXPECT_FALSE(scope_matches(config::SuppressScope::REQUEST_ONLY, Direction::RESPONSE));
    EXPECT_FALSE(scope_matches(config::SuppressScope::RESPONSE_ONLY, Direction::REQUEST));
    EXPECT_TRUE(scope_matches(config::SuppressScope::RESPONSE_ONLY, Direction::RESPONSE));
}

// ==================== ChaosGate ====================

TEST(ChaosGateTest, ZeroProbabilityNeverDrawsNorDrops) {
    for (uint64_t seed = 0; seed < 8; ++seed) {
        config::Config cfg = make_config("http://127.0.0.1:8545");
        config::ChaosConfig chaos = cfg.get_chaos();
        chaos.seed = seed;
        cfg.set_chaos(chaos);
        auto context = make_context(cfg);
        ChaosGate gate(context.get());

        for (int i = 0; i < 50; ++i) {
            EXPECT_EQ(gate.classify_request(), PacketType::request());
            EXPECT_EQ(gate.classify_response(), PacketType::response());
        }
        EXPECT_EQ(context->draw_count(), 0u);
    }
}

TEST(ChaosGateTest, CertainProbabilityAlwaysDrops) {
    config::Config cfg = make_config("http://127.0.0.1:8545");
    config::ChaosConfig chaos = cfg.get_chaos();
    chaos.drop_request_rate = 1.0;
    chaos.drop_response_rate = 1.0;
    chaos.drop_delay_seconds = 0.25;
    cfg.set_chaos(chaos);
    auto context = make_context(cfg);
    ChaosGate gate(context.get());

    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(gate.classify_request(), PacketType::request_dropped(0.25));
        EXPECT_EQ(gate.classify_response(), PacketType::response_dropped(0.25));
    }
    EXPECT_EQ(context->draw_count(), 40u);
}

TEST(ChaosGateTest, OneDrawPerNonZeroDirection) {
    config::Config cfg = make_config("http://127.0.0.1:8545");
    config::ChaosConfig chaos = cfg.get_chaos();
    chaos.drop_request_rate = 0.5;
    chaos.drop_response_rate = 0.0;
    cfg.set_chaos(chaos);
    auto context = make_context(cfg);
    ChaosGate gate(context.get());

    int dropped = 0;
    for (int i = 0; i < 200; ++i) {
        if (gate.classify_request().is_dropped()) {
            ++dropped;
        }
        EXPECT_FALSE(gate.classify_response().is_dropped());
    }
    EXPECT_EQ(context->draw_count(), 200u);
    EXPECT_GT(dropped, 0);
    EXPECT_LT(dropped, 200);
}

TEST(ChaosGateTest, SameSeedSameSequence) {
    config::Config cfg = make_config("http://127.0.0.1:8545");
    config::ChaosConfig chaos = cfg.get_chaos();
    chaos.drop_request_rate = 0.3;
    cfg.set_chaos(chaos);
    auto first = make_context(cfg);
    auto second = make_context(cfg);
    ChaosGate gate_a(first.get());
    ChaosGate gate_b(second.get());

    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(gate_a.classify_request(), gate_b.classify_request());
    }
}

TEST(ChaosGateTest, WaitReturnsImmediatelyForNormalPackets) {
    auto context = make_context(make_config("http://127.0.0.1:8545"));
    ChaosGate gate(context.get());
    utils::StopWatch watch;
    gate.wait(PacketType::request());
    gate.wait(PacketType::response_dropped(0.0));
    EXPECT_LT(watch.elapsed_ms(), 100u);
}

TEST(ChaosGateTest, CancelWaitsWakesSleepingSessions) {
    auto context = make_context(make_config("http://127.0.0.1:8545"));
    ChaosGate gate(context.get());
    utils::StopWatch watch;

    std::thread sleeper([&gate] { gate.wait(PacketType::request_dropped(30.0)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    gate.cancel_waits();
    sleeper.join();
    EXPECT_LT(watch.elapsed_ms(), 5000u);

    // 取消之后的等待不再睡眠
    utils::StopWatch after;
    gate.wait(PacketType::response_dropped(30.0));
    EXPECT_LT(after.elapsed_ms(), 100u);
}

// ==================== SuppressionEngine ====================

TEST(TrimJsonTest, NonPositiveLimitIsEmpty) {
    EXPECT_EQ(SuppressionEngine::trim_json("a\nb\nc", 0), "");
    EXPECT_EQ(SuppressionEngine::trim_json("a\nb\nc", -1), "");
}

TEST(TrimJsonTest, LimitAtLeastLineCountIsUnchanged) {
    EXPECT_EQ(SuppressionEngine::trim_json("a\nb\nc", 3), "a\nb\nc");
    EXPECT_EQ(SuppressionEngine::trim_json("a\nb\nc", 10), "a\nb\nc");
    EXPECT_EQ(SuppressionEngine::trim_json("null", 1), "null");
}

TEST(TrimJsonTest, KeepsHeadAndTailAroundMarker) {
    const std::string text = "1\n2\n3\n4\n5\n6\n7";
    EXPECT_EQ(SuppressionEngine::trim_json(text, 1), "1\n...");
    EXPECT_EQ(SuppressionEngine::trim_json(text, 2), "1\n...\n7");
    EXPECT_EQ(SuppressionEngine::trim_json(text, 3), "1\n2\n...\n7");
    EXPECT_EQ(SuppressionEngine::trim_json(text, 4), "1\n2\n...\n6\n7");
    EXPECT_EQ(SuppressionEngine::trim_json(text, 6), "1\n2\n3\n...\n5\n6\n7");
}

class SuppressionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.methods["eth_blockNumber"] = config::SuppressRule(-1, config::SuppressScope::ALL);
        config_.methods["eth_call"] = config::SuppressRule(4, config::SuppressScope::RESPONSE_ONLY);
        config_.paths["/metrics"] = config::SuppressRule(0, config::SuppressScope::ALL);
        config_.paths["/rpc"] = config::SuppressRule(2, config::SuppressScope::REQUEST_ONLY);
    }

    config::SuppressConfig config_;
};

TEST_F(SuppressionEngineTest, MethodRuleWinsOverPathRule) {
    SuppressionEngine engine(config_);
    std::string method = "eth_blockNumber";
    SuppressDecision d = engine.decide(Direction::REQUEST, &method, "/rpc",
                                       PacketType::request(), PacketType::response());
    EXPECT_TRUE(d.limited);
    EXPECT_EQ(d.line_limit, -1);
    EXPECT_EQ(d.label, "[method eth_blockNumber]");
    EXPECT_TRUE(d.is_suppressed());
}

TEST_F(SuppressionEngineTest, MethodScopeMismatchFallsThroughToPath) {
    SuppressionEngine engine(config_);
    std::string method = "eth_call";

    SuppressDecision request = engine.decide(Direction::REQUEST, &method, "/rpc",
                                             PacketType::request(), PacketType::response());
    EXPECT_TRUE(request.limited);
    EXPECT_EQ(request.line_limit, 2);
    EXPECT_EQ(request.label, "/rpc");

    SuppressDecision response = engine.decide(Direction::RESPONSE, &method, "/rpc",
                                              PacketType::request(), PacketType::response());
    EXPECT_TRUE(response.limited);
    EXPECT_EQ(response.line_limit, 4);
    EXPECT_EQ(response.label, "[method eth_call]");
}

TEST_F(SuppressionEngineTest, PathRuleAppliesWithoutRpcMethod) {
    SuppressionEngine engine(config_);
    SuppressDecision d = engine.decide(Direction::RESPONSE, nullptr, "/metrics",
                                       PacketType::request(), PacketType::response());
    EXPECT_TRUE(d.is_header_only());
    EXPECT_EQ(d.label, "/metrics");
}

TEST_F(SuppressionEngineTest, NoMatchingRuleLogsFully) {
    SuppressionEngine engine(config_);
    std::string method = "net_version";
    SuppressDecision d = engine.decide(Direction::REQUEST, &method, "/other",
                                       PacketType::request(), PacketType::response());
    EXPECT_FALSE(d.limited);
    EXPECT_TRUE(d.label.empty());

    // 方向不匹配且无其他规则
    d = engine.decide(Direction::RESPONSE, nullptr, "/rpc",
                      PacketType::request(), PacketType::response());
    EXPECT_FALSE(d.limited);
}

TEST_F(SuppressionEngineTest, DroppedExchangeBypassesRules) {
    SuppressionEngine engine(config_);
    std::string method = "eth_blockNumber";

    SuppressDecision d = engine.decide(Direction::REQUEST, &method, "/rpc",
                                       PacketType::request(), PacketType::response_dropped(12.0));
    EXPECT_FALSE(d.limited);

    d = engine.decide(Direction::RESPONSE, &method, "/rpc",
                      PacketType::request_dropped(12.0), PacketType::response());
    EXPECT_FALSE(d.limited);
}

// ==================== JSON渲染与形状识别 ====================

TEST(JsonRpcTest, RenderDisplayJson) {
    EXPECT_EQ(render_display_json(""), "null");
    EXPECT_EQ(render_display_json(R"({"a":1,"b":[true]})"),
              "{\n  \"a\": 1,\n  \"b\": [\n    true\n  ]\n}");
    EXPECT_EQ(render_display_json("not json {"), "not json {");
    EXPECT_EQ(render_display_json(std::string("\xff\xfe", 2)), std::string("\xff\xfe", 2));
}

TEST(JsonRpcTest, PrettyPrintedFormReparsesToSameValue) {
    const char* const samples[] = {
        R"({"id":1,"jsonrpc":"2.0","method":"eth_getLogs","params":[{"fromBlock":"0x1","topics":[null,"0xab"]}]})",
        R"([1,2.5,-3e10,"x\"y",{"nested":{"k":false}}])",
        R"("plain string")",
        R"({"z":1,"a":2,"m":{"y":[],"b":{}}})",
    };
    for (const char* sample : samples) {
        std::string pretty = render_display_json(sample);
        EXPECT_EQ(nlohmann::json::parse(pretty), nlohmann::json::parse(sample)) << sample;
    }
}

TEST(JsonRpcTest, DeeplyNestedBodyIsShownRaw) {
    const std::string at_limit = std::string(MAX_JSON_DEPTH, '[') +
                                 std::string(MAX_JSON_DEPTH, ']');
    std::string pretty = render_display_json(at_limit);
    EXPECT_NE(pretty, at_limit);
    EXPECT_EQ(nlohmann::json::parse(pretty), nlohmann::json::parse(at_limit));

    const std::string over_limit = "[" + at_limit + "]";
    EXPECT_EQ(render_display_json(over_limit), over_limit);

    const std::string huge = std::string(2000000, '[') + std::string(2000000, ']');
    EXPECT_EQ(render_display_json(huge), huge);
    EXPECT_FALSE(sniff_rpc_request(huge, nullptr));
    EXPECT_FALSE(is_rpc_error_response(huge));
}

TEST(JsonRpcTest, SniffRpcRequest) {
    std::string method;
    EXPECT_TRUE(sniff_rpc_request(BLOCK_NUMBER_REQUEST, &method));
    EXPECT_EQ(method, "eth_blockNumber");

    EXPECT_TRUE(sniff_rpc_request(R"({"id":2,"jsonrpc":"2.0","method":"net_version"})", &method));
    EXPECT_EQ(method, "net_version");

    EXPECT_FALSE(sniff_rpc_request(R"({"id":"1","jsonrpc":"2.0","method":"x","params":[]})", nullptr));
    EXPECT_FALSE(sniff_rpc_request(R"({"id":1,"jsonrpc":"2.0","method":"x","params":{}})", nullptr));
    EXPECT_FALSE(sniff_rpc_request(R"([{"id":1,"jsonrpc":"2.0","method":"x"}])", nullptr));
    EXPECT_FALSE(sniff_rpc_request("", nullptr));
}

TEST(JsonRpcTest, RecognizesErrorResponse) {
    EXPECT_TRUE(is_rpc_error_response(ERROR_RESPONSE));
    EXPECT_FALSE(is_rpc_error_response(BLOCK_NUMBER_RESPONSE));
    EXPECT_FALSE(is_rpc_error_response(R"({"id":1,"jsonrpc":"2.0","error":{"code":"x","message":"m"}})"));
    EXPECT_FALSE(is_rpc_error_response("null"));
}

TEST(JsonRpcTest, InternalErrorBody) {
    std::string body = make_internal_error_body("processing response", "connection refused");
    nlohmann::json j = nlohmann::json::parse(body);
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["error"]["code"], -32603);
    EXPECT_EQ(j["error"]["message"], "processing response: connection refused");
    EXPECT_TRUE(is_rpc_error_response(body));
}

// ==================== RequestForwarder ====================

TEST(RequestForwarderTest, RootWithoutQueryUsesBaseUnmodified) {
    auto context = make_context(make_config("http://h:1234"));
    RequestForwarder forwarder(context.get());

    auto uri = forwarder.compose_destination("/", false, "");
    ASSERT_TRUE(uri.is_ok());
    EXPECT_EQ(uri.value().to_string(), "http://h:1234");
}

TEST(RequestForwarderTest, ComposesPathAndQueryOntoBase) {
    auto context = make_context(make_config("http://h:1234/"));
    RequestForwarder forwarder(context.get());

    auto uri = forwarder.compose_destination("/foo", true, "x=1");
    ASSERT_TRUE(uri.is_ok());
    EXPECT_EQ(uri.value().to_string(), "http://h:1234/foo?x=1");

    uri = forwarder.compose_destination("/", true, "");
    ASSERT_TRUE(uri.is_ok());
    EXPECT_EQ(uri.value().to_string(), "http://h:1234/?");
}

TEST(RequestForwarderTest, BasePathIsPrefixed) {
    auto context = make_context(make_config("https://node.example/v3/key///"));
    RequestForwarder forwarder(context.get());

    auto uri = forwarder.compose_destination("/extra", false, "");
    ASSERT_TRUE(uri.is_ok());
    EXPECT_EQ(uri.value().to_string(), "https://node.example/v3/key/extra");
    EXPECT_TRUE(uri.value().is_tls());
}

TEST(RequestForwarderTest, SplitTarget) {
    std::string path;
    std::string query;
    bool has_query = false;

    ASSERT_TRUE(RequestForwarder::split_target("/a/b?c=d&e", &path, &has_query, &query));
    EXPECT_EQ(path, "/a/b");
    EXPECT_TRUE(has_query);
    EXPECT_EQ(query, "c=d&e");

    ASSERT_TRUE(RequestForwarder::split_target("http://other:80/x", &path, &has_query, &query));
    EXPECT_EQ(path, "/x");
    EXPECT_FALSE(has_query);

    EXPECT_FALSE(RequestForwarder::split_target("", &path, &has_query, &query));
    EXPECT_FALSE(RequestForwarder::split_target("not a uri", &path, &has_query, &query));
}

TEST(RequestForwarderTest, RewritesHostAndDropsAcceptEncoding) {
    auto context = make_context(make_config("http://upstream.test:8545"));
    RequestForwarder forwarder(context.get());

    protocol::HttpRequest inbound = make_request("/", BLOCK_NUMBER_REQUEST);
    inbound.add_header("Accept-Encoding", "gzip, deflate");
    inbound.add_header("X-Trace", "a");
    inbound.add_header("X-Trace", "b");

    auto forwarded = forwarder.forward(inbound);
    ASSERT_TRUE(forwarded.is_ok()) << forwarded.error_message();
    const protocol::HttpRequest& out = forwarded.value().request;

    EXPECT_FALSE(protocol::find_header(out.headers, "accept-encoding", nullptr));
    std::string host;
    ASSERT_TRUE(protocol::find_header(out.headers, "host", &host));
    EXPECT_EQ(host, "upstream.test:8545");

    size_t traces = 0;
    for (const auto& header : out.headers) {
        if (header.first == "x-trace") {
            ++traces;
        }
    }
    EXPECT_EQ(traces, 2u);

    EXPECT_EQ(out.method, "POST");
    EXPECT_EQ(out.target, "/");
    EXPECT_EQ(out.body, BLOCK_NUMBER_REQUEST);
    EXPECT_EQ(forwarded.value().destination.to_string(), "http://upstream.test:8545");
    EXPECT_EQ(forwarded.value().display_json, render_display_json(BLOCK_NUMBER_REQUEST));
}

TEST(RequestForwarderTest, AddsHostWhenMissing) {
    auto context = make_context(make_config("https://node.example"));
    RequestForwarder forwarder(context.get());

    protocol::HttpRequest inbound;
    inbound.method = "GET";
    inbound.target = "/status";

    auto forwarded = forwarder.forward(inbound);
    ASSERT_TRUE(forwarded.is_ok());
    std::string host;
    ASSERT_TRUE(protocol::find_header(forwarded.value().request.headers, "host", &host));
    EXPECT_EQ(host, "node.example");
    EXPECT_EQ(forwarded.value().display_json, "null");
}

TEST(RequestForwarderTest, InvalidHeaderIsConstructionError) {
    auto context = make_context(make_config("http://upstream.test:8545"));
    RequestForwarder forwarder(context.get());

    protocol::HttpRequest inbound = make_request("/", "{}");
    inbound.headers.push_back(std::make_pair("x-bad", std::string("a\nb")));

    auto forwarded = forwarder.forward(inbound);
    ASSERT_TRUE(forwarded.is_err());
    EXPECT_EQ(forwarded.error_code(), utils::ErrorCode::PROTOCOL_INVALID_HEADER);
}

// ==================== RpcModulesOverride ====================

TEST(RpcModulesOverrideTest, SynthesizesModuleList) {
    config::RpcModulesOverrideConfig cfg;
    cfg.enabled = true;
    cfg.modules = {"eth", "net", "web3"};
    RpcModulesOverride override_handler(cfg);

    std::string method = "rpc_modules";
    EXPECT_TRUE(override_handler.applies(&method));
    std::string other = "eth_chainId";
    EXPECT_FALSE(override_handler.applies(&other));
    EXPECT_FALSE(override_handler.applies(nullptr));

    protocol::HttpResponse response = override_handler.synthesize();
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body,
              R"({"jsonrpc":"2.0","result":{"eth":"1.0","net":"1.0","web3":"1.0"},"id":1})");
    std::string content_type;
    ASSERT_TRUE(protocol::find_header(response.headers, "content-type", &content_type));
    EXPECT_EQ(content_type, "application/json");
}

TEST(RpcModulesOverrideTest, DisabledNeverApplies) {
    config::RpcModulesOverrideConfig cfg;
    RpcModulesOverride override_handler(cfg);
    std::string method = "rpc_modules";
    EXPECT_FALSE(override_handler.applies(&method));
}

// ==================== Presenter ====================

class PresenterTest : public ::testing::Test {
protected:
    static constexpr uint64_t NOW_MS = 1700000000042ULL;

    PresenterTest() : clock_(NOW_MS) {}

    config::DisplayConfig display(bool headers, bool color) {
        config::DisplayConfig d;
        d.log_headers = headers;
        d.color = color;
        return d;
    }

    std::string now() const { return utils::format_time_millis(NOW_MS); }

    FixedTimeSource clock_;
    std::ostringstream out_;
};

TEST_F(PresenterTest, RequestLineAndColoredBody) {
    Presenter presenter(display(false, true), &out_, &clock_);
    PresentRecord record;
    record.type = PacketType::request();
    record.json = "{\n  \"a\": 1\n}";
    record.message = "/rpc";

    std::string text = presenter.render(record, SuppressDecision::full());
    EXPECT_EQ(text, now() + " REQUEST /rpc\n"
                    "\x1b[36m{\x1b[39m\n"
                    "\x1b[36m  \"a\": 1\x1b[39m\n"
                    "\x1b[36m}\x1b[39m\n");
}

TEST_F(PresenterTest, RootPathAndEmptyMessageAreOmitted) {
    Presenter presenter(display(false, false), &out_, &clock_);
    PresentRecord record;
    record.type = PacketType::request();
    record.json = "null";
    record.message = "/";
    EXPECT_EQ(presenter.render(record, SuppressDecision::full()), now() + " REQUEST\nnull\n");

    record.type = PacketType::response();
    record.message = "";
    record.status = 200;
    EXPECT_EQ(presenter.render(record, SuppressDecision::full()),
              now() + " RESPONSE (status 200)\nnull\n");
}

TEST_F(PresenterTest, HeaderBlock) {
    Presenter presenter(display(true, false), &out_, &clock_);
    PresentRecord record;
    record.type = PacketType::response();
    record.json = "null";
    record.status = 502;
    record.headers.push_back(std::make_pair("content-type", std::string("application/json")));
    record.headers.push_back(std::make_pair("x-quote", std::string("a\"b")));

    EXPECT_EQ(presenter.render(record, SuppressDecision::full()),
              now() + " RESPONSE (status 502)\n"
                      "headers:\n"
                      "    (content-type,\"application/json\")\n"
                      "    (x-quote,\"a\\\"b\")\n"
                      "null\n");
}

TEST_F(PresenterTest, HeadersHiddenWhenDisabled) {
    Presenter presenter(display(false, false), &out_, &clock_);
    PresentRecord record;
    record.type = PacketType::response();
    record.json = "null";
    record.status = 200;
    record.headers.push_back(std::make_pair("content-type", std::string("application/json")));
    EXPECT_EQ(presenter.render(record, SuppressDecision::full()).find("headers:"),
              std::string::npos);
}

TEST_F(PresenterTest, SuppressionDecisions) {
    Presenter presenter(display(false, false), &out_, &clock_);
    PresentRecord record;
    record.type = PacketType::request();
    record.json = "1\n2\n3\n4\n5";
    record.message = "/rpc";

    EXPECT_EQ(presenter.render(record, SuppressDecision::limit(-1, "[method m]")), "");
    EXPECT_EQ(presenter.render(record, SuppressDecision::limit(0, "[method m]")),
              now() + " REQUEST [method m]\n");
    EXPECT_EQ(presenter.render(record, SuppressDecision::limit(2, "/rpc")),
              now() + " REQUEST /rpc\n1\n...\n5\n");

    // 响应方向不显示规则标签
    record.type = PacketType::response();
    record.message = "";
    record.status = 200;
    EXPECT_EQ(presenter.render(record, SuppressDecision::limit(0, "[method m]")),
              now() + " RESPONSE (status 200)\n");
}

TEST_F(PresenterTest, ResponseColors) {
    Presenter presenter(display(false, true), &out_, &clock_);
    utils::ColorPalette palette(true);

    EXPECT_EQ(presenter.body_color(PacketType::request(), "{}"), palette.info);
    EXPECT_EQ(presenter.body_color(PacketType::response(), BLOCK_NUMBER_RESPONSE), palette.success);
    EXPECT_EQ(presenter.body_color(PacketType::response(), ERROR_RESPONSE), palette.error);
    EXPECT_EQ(presenter.body_color(PacketType::response_dropped(1.0), ERROR_RESPONSE), palette.muted);
    EXPECT_EQ(presenter.body_color(PacketType::request_dropped(1.0), "{}"), palette.muted);
}

TEST_F(PresenterTest, ColorUsesUntruncatedResponse) {
    Presenter presenter(display(false, true), &out_, &clock_);
    PresentRecord record;
    record.type = PacketType::response();
    record.json = render_display_json(ERROR_RESPONSE);
    record.status = 200;

    std::string text = presenter.render(record, SuppressDecision::limit(1, ""));
    EXPECT_NE(text.find(std::string(utils::ANSI_FG_RED) + "{"), std::string::npos);
}

TEST_F(PresenterTest, NoColorEqualsStrippedColor) {
    Presenter colored(display(true, true), &out_, &clock_);
    Presenter plain(display(true, false), &out_, &clock_);

    PresentRecord record;
    record.type = PacketType::response_dropped(12.0);
    record.json = render_display_json(ERROR_RESPONSE);
    record.status = 200;
    record.headers.push_back(std::make_pair("content-type", std::string("application/json")));

    const SuppressDecision decisions[] = {
        SuppressDecision::full(),
        SuppressDecision::limit(0, "x"),
        SuppressDecision::limit(3, "x"),
    };
    for (const auto& decision : decisions) {
        EXPECT_EQ(plain.render(record, decision),
                  utils::strip_ansi(colored.render(record, decision)));
    }
    EXPECT_EQ(plain.render_internal_error("{\n  \"id\": 1\n}"),
              utils::strip_ansi(colored.render_internal_error("{\n  \"id\": 1\n}")));
}

TEST_F(PresenterTest, PresentWritesToStream) {
    Presenter presenter(display(false, false), &out_, &clock_);
    PresentRecord record;
    record.type = PacketType::request();
    record.json = "null";
    record.message = "/x";

    presenter.present(record, SuppressDecision::limit(-1, "/x"));
    EXPECT_TRUE(out_.str().empty());

    presenter.present(record, SuppressDecision::full());
    presenter.present_internal_error("boom");
    EXPECT_EQ(out_.str(), now() + " REQUEST /x\nnull\nboom\n");
}

// ==================== ExchangeHandler ====================

class ExchangeHandlerTest : public ::testing::Test {
protected:
    ExchangeHandlerTest() : clock_(1700000000000ULL) {}

    void build(const config::Config& cfg) {
        config_ = cfg;
        context_ = make_context(config_);
        presenter_.reset(new Presenter(config_.get_display(), &out_, &clock_));
        handler_.reset(new ExchangeHandler(context_.get(), &transport_, presenter_.get(),
                                           &statistics_));
    }

    config::Config base_config() {
        config::Config cfg = make_config("http://upstream.test:8545");
        config::DisplayConfig d;
        d.color = false;
        cfg.set_display(d);
        return cfg;
    }

    FixedTimeSource clock_;
    std::ostringstream out_;
    FakeTransport transport_;
    ExchangeStatistics statistics_;
    config::Config config_;
    std::shared_ptr<ProxyContext> context_;
    std::unique_ptr<Presenter> presenter_;
    std::unique_ptr<ExchangeHandler> handler_;
};

TEST_F(ExchangeHandlerTest, ForwardsAndReturnsUpstreamResponse) {
    build(base_config());
    transport_.response.add_header("x-upstream", "1");

    ExchangeOutcome outcome = handler_->handle(make_request("/", BLOCK_NUMBER_REQUEST));
    EXPECT_FALSE(outcome.dropped);
    EXPECT_EQ(transport_.calls, 1);
    EXPECT_EQ(transport_.last_request.body, BLOCK_NUMBER_REQUEST);
    EXPECT_EQ(outcome.response.status_code, 200);
    EXPECT_EQ(outcome.response.body, BLOCK_NUMBER_RESPONSE);
    EXPECT_TRUE(protocol::find_header(outcome.response.headers, "x-upstream", nullptr));

    const std::string log = out_.str();
    size_t request_pos = log.find(" REQUEST\n");
    size_t response_pos = log.find(" RESPONSE (status 200)\n");
    ASSERT_NE(request_pos, std::string::npos);
    ASSERT_NE(response_pos, std::string::npos);
    EXPECT_LT(request_pos, response_pos);
    EXPECT_NE(log.find("\"method\": \"eth_blockNumber\""), std::string::npos);
    EXPECT_NE(log.find("\"result\": \"0x10\""), std::string::npos);

    ExchangeCounters counters;
    statistics_.get_statistics(&counters);
    EXPECT_EQ(counters.exchanges, 1u);
    EXPECT_EQ(counters.forwarded, 1u);
}

TEST_F(ExchangeHandlerTest, OverrideSkipsUpstream) {
    config::Config cfg = base_config();
    config::RpcModulesOverrideConfig override_cfg;
    override_cfg.enabled = true;
    override_cfg.modules = {"eth", "net", "web3"};
    cfg.set_rpc_modules_override(override_cfg);
    build(cfg);

    ExchangeOutcome outcome = handler_->handle(make_request("/", RPC_MODULES_REQUEST));
    EXPECT_FALSE(outcome.dropped);
    EXPECT_EQ(transport_.calls, 0);
    EXPECT_EQ(outcome.response.status_code, 200);
    EXPECT_EQ(outcome.response.body,
              R"({"jsonrpc":"2.0","result":{"eth":"1.0","net":"1.0","web3":"1.0"},"id":1})");

    // 其他方法照常转发
    outcome = handler_->handle(make_request("/", BLOCK_NUMBER_REQUEST));
    EXPECT_EQ(transport_.calls, 1);

    ExchangeCounters counters;
    statistics_.get_statistics(&counters);
    EXPECT_EQ(counters.overridden, 1u);
}

TEST_F(ExchangeHandlerTest, UpstreamFailureBecomesInternalError) {
    build(base_config());
    transport_.fail = true;

    ExchangeOutcome outcome = handler_->handle(make_request("/", BLOCK_NUMBER_REQUEST));
    EXPECT_FALSE(outcome.dropped);
    EXPECT_EQ(outcome.response.status_code, 500);

    nlohmann::json body = nlohmann::json::parse(outcome.response.body);
    EXPECT_EQ(body["error"]["code"], -32603);
    EXPECT_EQ(body["error"]["message"], "processing response: connection refused");
    EXPECT_NE(out_.str().find(" RESPONSE (status 500)\n"), std::string::npos);

    ExchangeCounters counters;
    statistics_.get_statistics(&counters);
    EXPECT_EQ(counters.response_errors, 1u);
}

TEST_F(ExchangeHandlerTest, TransportExceptionBecomesInternalError) {
    build(base_config());
    transport_.throws = true;

    ExchangeOutcome outcome = handler_->handle(make_request("/", BLOCK_NUMBER_REQUEST));
    EXPECT_FALSE(outcome.dropped);
    EXPECT_EQ(transport_.calls, 1);
    EXPECT_EQ(outcome.response.status_code, 500);

    nlohmann::json body = nlohmann::json::parse(outcome.response.body);
    EXPECT_EQ(body["error"]["code"], -32603);
    EXPECT_EQ(body["error"]["message"], "processing response: upstream exploded");
    EXPECT_NE(out_.str().find("upstream exploded"), std::string::npos);

    ExchangeCounters counters;
    statistics_.get_statistics(&counters);
    EXPECT_EQ(counters.exchanges, 1u);
    EXPECT_EQ(counters.response_errors, 1u);
}

TEST_F(ExchangeHandlerTest, DeeplyNestedBodyIsForwarded) {
    build(base_config());
    const std::string nested = std::string(1000000, '[') + std::string(1000000, ']');
    transport_.response.set_body(nested);

    ExchangeOutcome outcome = handler_->handle(make_request("/deep", nested));
    EXPECT_FALSE(outcome.dropped);
    EXPECT_EQ(transport_.calls, 1);
    EXPECT_EQ(transport_.last_request.body, nested);
    EXPECT_EQ(outcome.response.status_code, 200);
    EXPECT_EQ(outcome.response.body, nested);

    // 展示退回原文
    const std::string log = out_.str();
    EXPECT_NE(log.find(" REQUEST /deep\n" + nested), std::string::npos);
    EXPECT_NE(log.find(" RESPONSE (status 200)\n" + nested), std::string::npos);
}

TEST_F(ExchangeHandlerTest, ConstructionFailureIsNotForwarded) {
    build(base_config());
    protocol::HttpRequest inbound = make_request("/", BLOCK_NUMBER_REQUEST);
    inbound.headers.push_back(std::make_pair("x-bad", std::string("a\rb")));

    ExchangeOutcome outcome = handler_->handle(inbound);
    EXPECT_FALSE(outcome.dropped);
    EXPECT_EQ(transport_.calls, 0);
    EXPECT_EQ(outcome.response.status_code, 500);

    nlohmann::json body = nlohmann::json::parse(outcome.response.body);
    const std::string message = body["error"]["message"];
    EXPECT_EQ(message.find("processing request: "), 0u);

    // 只输出错误体，没有REQUEST标题行
    EXPECT_EQ(out_.str().find("REQUEST"), std::string::npos);
    EXPECT_NE(out_.str().find("-32603"), std::string::npos);
}

TEST_F(ExchangeHandlerTest, DroppedRequestNeverReachesUpstream) {
    config::Config cfg = base_config();
    config::ChaosConfig chaos = cfg.get_chaos();
    chaos.drop_request_rate = 1.0;
    cfg.set_chaos(chaos);
    config::SuppressConfig suppress;
    suppress.methods["eth_blockNumber"] = config::SuppressRule(-1, config::SuppressScope::ALL);
    cfg.set_suppress(suppress);
    build(cfg);

    ExchangeOutcome outcome = handler_->handle(make_request("/", BLOCK_NUMBER_REQUEST));
    EXPECT_TRUE(outcome.dropped);
    EXPECT_EQ(transport_.calls, 0);

    // 规则会完全抑制，但被丢弃的报文总是输出
    EXPECT_NE(out_.str().find(" DROPPED REQUEST\n"), std::string::npos);
    EXPECT_EQ(out_.str().find("RESPONSE"), std::string::npos);
}

TEST_F(ExchangeHandlerTest, DroppedResponseStillContactsUpstream) {
    config::Config cfg = base_config();
    config::ChaosConfig chaos = cfg.get_chaos();
    chaos.drop_response_rate = 1.0;
    cfg.set_chaos(chaos);
    config::SuppressConfig suppress;
    suppress.paths["/"] = config::SuppressRule(-1, config::SuppressScope::ALL);
    cfg.set_suppress(suppress);
    build(cfg);

    ExchangeOutcome outcome = handler_->handle(make_request("/", BLOCK_NUMBER_REQUEST));
    EXPECT_TRUE(outcome.dropped);
    EXPECT_EQ(transport_.calls, 1);

    // 响应被丢弃时请求方向也不受抑制
    const std::string log = out_.str();
    EXPECT_NE(log.find(" REQUEST\n"), std::string::npos);
    EXPECT_NE(log.find(" DROPPED RESPONSE (status 200)\n"), std::string::npos);

    ExchangeCounters counters;
    statistics_.get_statistics(&counters);
    EXPECT_EQ(counters.responses_dropped, 1u);
    EXPECT_EQ(context_->draw_count(), 1u);
}

TEST_F(ExchangeHandlerTest, SuppressedExchangeProducesNoOutput) {
    config::Config cfg = base_config();
    config::SuppressConfig suppress;
    suppress.methods["eth_blockNumber"] = config::SuppressRule(-1, config::SuppressScope::ALL);
    cfg.set_suppress(suppress);
    build(cfg);

    ExchangeOutcome outcome = handler_->handle(make_request("/", BLOCK_NUMBER_REQUEST));
    EXPECT_FALSE(outcome.dropped);
    EXPECT_EQ(outcome.response.body, BLOCK_NUMBER_RESPONSE);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ExchangeHandlerTest, ForwardsPathAndQuery) {
    build(base_config());
    handler_->handle(make_request("/api/v1?verbose=1", "{}"));
    ASSERT_EQ(transport_.calls, 1);
    EXPECT_EQ(transport_.last_destination.to_string(), "http://upstream.test:8545/api/v1?verbose=1");
    EXPECT_EQ(transport_.last_request.target, "/api/v1?verbose=1");
    EXPECT_NE(out_.str().find(" REQUEST /api/v1\n"), std::string::npos);
}

} // namespace proxy
} // namespace rpc_snoop
