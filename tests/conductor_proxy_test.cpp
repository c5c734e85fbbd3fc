// ─────────────────────────────────────────────────────────────────────────────
// Conductor Proxy Chain Tests
// ─────────────────────────────────────────────────────────────────────────────
// client <-> proxy[0] <-> ... <-> proxy[n-1] <-> agent, with every proxy
// reaching its successor through the _proxy/successor/* wrappers.

#include <catch2/catch_test_macros.hpp>

#include "acpp/conductor/conductor.hpp"
#include "acpp/conductor/instantiators.hpp"
#include "mocks/test_components.hpp"

using namespace acpp;
using namespace acpp::testing;

namespace {

struct Chain {
    std::vector<std::shared_ptr<ForwardingProxy>> proxies;
    std::shared_ptr<ScriptedAgent> agent = ScriptedAgent::create();

    explicit Chain(std::size_t length, bool last_accepts = true) {
        for (std::size_t i = 0; i < length; ++i) {
            proxies.push_back(ForwardingProxy::create(i + 1 < length || last_accepts));
        }
    }

    std::shared_ptr<IInstantiator> instantiator() {
        std::vector<std::shared_ptr<IConnector>> connectors;
        for (auto& proxy : proxies) {
            connectors.push_back(proxy->connector());
        }
        return from_connectors(agent->connector(), std::move(connectors));
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Handshake through proxies
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("A proxy receives initialize with the proxy marker", "[conductor][proxy][handshake]") {
    Chain chain(1);
    ConductorHarness harness(chain.instantiator());
    harness.connect();

    auto response = harness.initialize(1);

    REQUIRE(response.has_value());
    REQUIRE(response->contains("result"));
    REQUIRE(harness.conductor().proxy_count() == 1);

    auto proxy_saw = chain.proxies[0]->log().with_method("initialize");
    REQUIRE(proxy_saw.size() == 1);
    REQUIRE(has_proxy_marker(proxy_saw[0]["params"]));

    auto agent_saw = chain.agent->log().with_method("initialize");
    REQUIRE(agent_saw.size() == 1);
    REQUIRE(has_proxy_marker(agent_saw[0]["params"]) == false);
}

TEST_CASE("The client never sees the proxy marker in the result", "[conductor][proxy][handshake]") {
    Chain chain(1);
    ConductorHarness harness(chain.instantiator());
    harness.connect();

    auto response = harness.initialize(1);

    REQUIRE(response.has_value());
    REQUIRE(has_proxy_marker(response->at("result")) == false);
    REQUIRE(response->at("result")["protocolVersion"] == 1);
}

TEST_CASE("A proxy that does not accept the capability fails the handshake", "[conductor][proxy][handshake][error]") {
    Chain chain(1, false);
    ConductorHarness harness(chain.instantiator());
    harness.connect();

    auto response = harness.initialize(1);

    REQUIRE(response.has_value());
    REQUIRE(response->at("error")["code"] == ErrorCode::InvalidRequest);
    REQUIRE(response->at("error")["message"] == "proxy capability not accepted");
}

TEST_CASE("Every hop of a long chain is marked except the agent", "[conductor][proxy][handshake]") {
    Chain chain(3);
    ConductorHarness harness(chain.instantiator());
    harness.connect();

    auto response = harness.initialize(1);

    REQUIRE(response.has_value());
    REQUIRE(response->contains("result"));
    REQUIRE(harness.conductor().proxy_count() == 3);
    for (const auto& proxy : chain.proxies) {
        auto saw = proxy->log().with_method("initialize");
        REQUIRE(saw.size() == 1);
        REQUIRE(has_proxy_marker(saw[0]["params"]));
    }
    REQUIRE(has_proxy_marker(chain.agent->log().with_method("initialize")[0]["params"]) == false);
}

TEST_CASE("A refusal deep in the chain reaches the client", "[conductor][proxy][handshake][error]") {
    Chain chain(2, false);
    ConductorHarness harness(chain.instantiator());
    harness.connect();

    auto response = harness.initialize(1);

    REQUIRE(response.has_value());
    REQUIRE(response->at("error")["message"] == "proxy capability not accepted");
}

TEST_CASE("The agent's transport capability survives the chain", "[conductor][proxy][handshake]") {
    Chain chain(2);
    chain.agent->advertise_mcp_transport(true);
    ConductorHarness harness(chain.instantiator());
    harness.connect();

    auto response = harness.initialize(1);

    REQUIRE(response->at("result")["capabilities"]["mcp_acp_transport"] == true);
    REQUIRE(harness.conductor().agent_supports_mcp_transport() == true);
}

// ═══════════════════════════════════════════════════════════════════════════
// Successor wrapping
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Client requests reach the agent through a proxy", "[conductor][proxy][routing]") {
    Chain chain(1);
    chain.agent->on("session/prompt", [](const std::optional<Json>& params) -> tl::expected<Json, JsonRpcError> {
        return Json{{"stopReason", "end_turn"}, {"echo", params->at("prompt")}};
    });
    ConductorHarness harness(chain.instantiator());
    harness.connect();
    harness.initialize(1);

    harness.client().request(2, "session/prompt", Json{{"prompt", "hi"}});
    auto response = harness.await_response(2);

    REQUIRE(response.has_value());
    REQUIRE(response->at("result") == Json{{"stopReason", "end_turn"}, {"echo", "hi"}});

    // The proxy saw the plain request; the agent saw the unwrapped one
    REQUIRE(chain.proxies[0]->log().with_method("session/prompt").size() == 1);
    auto agent_saw = chain.agent->log().with_method("session/prompt");
    REQUIRE(agent_saw.size() == 1);
    REQUIRE(agent_saw[0]["params"] == Json{{"prompt", "hi"}});
    REQUIRE(chain.agent->log().with_method(methods::kSuccessorRequest).empty());
}

TEST_CASE("A request crosses a three-proxy chain and back", "[conductor][proxy][routing]") {
    Chain chain(3);
    ConductorHarness harness(chain.instantiator());
    harness.connect();
    harness.initialize(1);

    harness.client().request(2, "session/new", Json{{"cwd", "/work"}, {"mcpServers", Json::array()}});
    auto response = harness.await_response(2);

    REQUIRE(response.has_value());
    REQUIRE(response->at("result")["method"] == "session/new");
    REQUIRE(response->at("result")["params"]["cwd"] == "/work");
    for (const auto& proxy : chain.proxies) {
        REQUIRE(proxy->log().with_method("session/new").size() == 1);
    }
    REQUIRE(harness.conductor().pending_request_count() == 0);
}

TEST_CASE("Client notifications are unwrapped before the agent", "[conductor][proxy][routing]") {
    Chain chain(2);
    ConductorHarness harness(chain.instantiator());
    harness.connect();
    harness.initialize(1);

    harness.client().notify("session/cancel", Json{{"sessionId", "s-1"}});

    REQUIRE(harness.run_until([&] { return chain.agent->log().with_method("session/cancel").size() == 1; }));
    REQUIRE(chain.agent->log().with_method("session/cancel")[0]["params"]["sessionId"] == "s-1");
}

TEST_CASE("Agent notifications arrive wrapped at the last proxy", "[conductor][proxy][routing]") {
    Chain chain(2);
    ConductorHarness harness(chain.instantiator());
    harness.connect();
    harness.initialize(1);

    chain.agent->send(JsonRpcNotification("session/update", Json{{"chunk", "a"}}).to_json());

    REQUIRE(harness.run_until([&] { return harness.client().log().with_method("session/update").size() == 1; }));
    REQUIRE(harness.client().log().with_method("session/update")[0]["params"]["chunk"] == "a");

    auto wrapped = chain.proxies[1]->log().with_method(methods::kSuccessorNotification);
    REQUIRE(wrapped.size() == 1);
    REQUIRE(wrapped[0]["params"] == Json{{"method", "session/update"}, {"params", {{"chunk", "a"}}}});
    REQUIRE(chain.proxies[0]->log().with_method(methods::kSuccessorNotification).size() == 1);
}

TEST_CASE("Agent requests travel back through every proxy", "[conductor][proxy][routing]") {
    Chain chain(2);
    ConductorHarness harness(chain.instantiator());
    harness.connect();
    harness.initialize(1);

    chain.agent->send(JsonRpcRequest("session/request_permission", 9, Json{{"tool", "write"}}).to_json());
    REQUIRE(harness.run_until([&] {
        return harness.client().log().with_method("session/request_permission").size() == 1;
    }));

    auto request = harness.client().log().with_method("session/request_permission")[0];
    REQUIRE(request["params"]["tool"] == "write");
    harness.client().respond(id_of(request), Json{{"outcome", "allowed"}});

    REQUIRE(harness.run_until([&] { return chain.agent->log().response_for(Json(9)).has_value(); }));
    REQUIRE(chain.agent->log().response_for(Json(9))->at("result")["outcome"] == "allowed");
    REQUIRE(harness.conductor().pending_request_count() == 0);
}

TEST_CASE("A proxy can answer a request itself", "[conductor][proxy][routing]") {
    Chain chain(1);
    ConductorHarness harness(chain.instantiator());
    harness.connect();
    harness.initialize(1);

    // The proxy sends its own request to the client
    chain.proxies[0]->send(JsonRpcRequest("fs/read_text_file", 500, Json{{"path", "/a"}}).to_json());
    REQUIRE(harness.run_until([&] { return harness.client().log().with_method("fs/read_text_file").size() == 1; }));

    auto request = harness.client().log().with_method("fs/read_text_file")[0];
    harness.client().respond(id_of(request), Json{{"content", "A"}});

    REQUIRE(harness.run_until([&] { return chain.proxies[0]->log().response_for(Json(500)).has_value(); }));
    REQUIRE(chain.proxies[0]->log().response_for(Json(500))->at("result")["content"] == "A");
    REQUIRE(chain.agent->log().with_method("fs/read_text_file").empty());
}

TEST_CASE("A malformed successor request is answered with invalid params", "[conductor][proxy][routing][error]") {
    Chain chain(1);
    ConductorHarness harness(chain.instantiator());
    harness.connect();
    harness.initialize(1);

    chain.proxies[0]->send(JsonRpcRequest(std::string(methods::kSuccessorRequest), 600,
                                          Json{{"params", {{"no", "method"}}}}).to_json());

    REQUIRE(harness.run_until([&] { return chain.proxies[0]->log().response_for(Json(600)).has_value(); }));
    auto response = chain.proxies[0]->log().response_for(Json(600));
    REQUIRE(response->at("error")["code"] == ErrorCode::InvalidParams);
    REQUIRE(chain.agent->log().size() == 1);  // initialize only
    REQUIRE(harness.conductor().state() == ConductorState::Running);
}

TEST_CASE("A malformed successor notification is dropped", "[conductor][proxy][routing][error]") {
    Chain chain(1);
    ConductorHarness harness(chain.instantiator());
    harness.connect();
    harness.initialize(1);

    chain.proxies[0]->send(JsonRpcNotification(std::string(methods::kSuccessorNotification), Json{{"method", 7}}).to_json());
    chain.proxies[0]->send(JsonRpcNotification(std::string(methods::kSuccessorNotification),
                                               Json{{"method", "session/cancel"}}).to_json());

    REQUIRE(harness.run_until([&] { return chain.agent->log().with_method("session/cancel").size() == 1; }));
    REQUIRE(chain.agent->log().size() == 2);
}

TEST_CASE("Shutdown closes every proxy", "[conductor][proxy][lifecycle]") {
    Chain chain(2);
    ConductorHarness harness(chain.instantiator());
    harness.connect();
    harness.initialize(1);

    harness.shutdown();

    REQUIRE(harness.run_until([&] {
        return chain.proxies[0]->closed() && chain.proxies[1]->closed() && chain.agent->closed();
    }));
}
