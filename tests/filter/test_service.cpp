// forge_filter service and transport tests

#include <catch2/catch_test_macros.hpp>
#include <forge/filter/service.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace forge_filter;
using namespace std::chrono_literals;
using forge_core::TimerQueue;
using forge_core::WireError;

namespace {

/// Transport that records posts and answers them on demand
class RecordingTransport : public FilterTransport {
public:
    void post(const std::string& path, std::vector<std::uint8_t> payload,
              ResponseHandler on_response) override {
        paths.push_back(path);
        payloads.push_back(std::move(payload));
        handlers.push_back(std::move(on_response));
    }

    std::vector<std::string> paths;
    std::vector<std::vector<std::uint8_t>> payloads;
    std::vector<ResponseHandler> handlers;
};

FilterRequest make_request(const std::string& filter_id, std::uint32_t w, std::uint32_t h, std::uint8_t value = 10) {
    FilterRequest request;
    request.filter_id = filter_id;
    request.width = w;
    request.height = h;
    request.pixels.assign(wire::pixel_bytes(w, h), value);
    return request;
}

} // anonymous namespace

// =============================================================================
// WireFilterService
// =============================================================================

TEST_CASE("WireFilterService posts encoded requests", "[filter][service]") {
    RecordingTransport transport;
    WireFilterService service(transport, "/api/filters/");
    REQUIRE(service.endpoint() == "/api/filters");

    std::optional<FilterResult> received;
    FilterRequest request = make_request("invert", 2, 1);
    request.params = nlohmann::json{{"amount", 3}};
    service.execute(request, [&received](FilterResult result) { received = std::move(result); });

    REQUIRE(service.requests_sent() == 1);
    REQUIRE(transport.paths == std::vector<std::string>{"/api/filters/invert"});

    auto decoded = wire::decode_request(transport.payloads[0]);
    REQUIRE(decoded);
    REQUIRE(decoded->width == 2);
    REQUIRE(decoded->params["amount"] == 3);
    REQUIRE(decoded->pixels == request.pixels);

    SECTION("completion waits for the response") {
        REQUIRE_FALSE(received.has_value());
        transport.handlers[0](TransportResponse{200, std::vector<std::uint8_t>(8, 1)});
        REQUIRE(received.has_value());
        REQUIRE(received->is_ok());
        REQUIRE(received->value() == std::vector<std::uint8_t>(8, 1));
    }

    SECTION("failure status carries the detail") {
        transport.handlers[0](TransportResponse{422, wire::encode_failure("bad params")});
        REQUIRE(received->is_err());
        REQUIRE(received->error().message() == "bad params");
    }
}

TEST_CASE("WireFilterService rejects mis-sized pixels without posting", "[filter][service]") {
    RecordingTransport transport;
    WireFilterService service(transport, "/api/filters");

    FilterRequest request = make_request("invert", 2, 2);
    request.pixels.resize(5);

    std::optional<FilterResult> received;
    service.execute(request, [&received](FilterResult result) { received = std::move(result); });

    REQUIRE(transport.paths.empty());
    REQUIRE(service.requests_sent() == 0);
    REQUIRE(received.has_value());
    REQUIRE(received->error().as<WireError>()->kind == WireError::Kind::SizeMismatch);
}

// =============================================================================
// LoopbackTransport
// =============================================================================

TEST_CASE("LoopbackTransport answers through the timer queue", "[filter][service][loopback]") {
    TimerQueue timers;
    LoopbackTransport transport(timers, 40ms);
    WireFilterService service(transport, "/api/filters");

    transport.register_filter("invert", [](const wire::DecodedRequest& request) -> FilterResult {
        std::vector<std::uint8_t> out = request.pixels;
        for (auto& byte : out) {
            byte = static_cast<std::uint8_t>(255 - byte);
        }
        return out;
    });
    transport.register_filter("broken", [](const wire::DecodedRequest&) -> FilterResult {
        return forge_core::Err<std::vector<std::uint8_t>>(forge_core::Error("kernel crashed"));
    });
    transport.register_filter("short", [](const wire::DecodedRequest&) -> FilterResult {
        return std::vector<std::uint8_t>(3, 0);
    });

    std::vector<FilterResult> results;
    auto collect = [&results](FilterResult result) { results.push_back(std::move(result)); };

    SECTION("200") {
        service.execute(make_request("invert", 1, 1, 10), collect);
        REQUIRE(transport.posts() == 1);

        timers.advance(39ms);
        REQUIRE(results.empty());
        timers.advance(1ms);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].value() == std::vector<std::uint8_t>{245, 245, 245, 245});
    }

    SECTION("404 for an unknown filter") {
        service.execute(make_request("sparkle", 1, 1), collect);
        timers.advance(40ms);
        REQUIRE(results[0].error().message() == "Filter not found: sparkle");
        REQUIRE(results[0].error().code() == forge_core::ErrorCode::ServiceFailure);
    }

    SECTION("500 when the handler fails") {
        service.execute(make_request("broken", 1, 1), collect);
        timers.advance(40ms);
        REQUIRE(results[0].error().message() == "kernel crashed");
    }

    SECTION("200 with the wrong size is a mismatch") {
        service.execute(make_request("short", 1, 1), collect);
        timers.advance(40ms);
        REQUIRE(results[0].error().as<WireError>()->kind == WireError::Kind::SizeMismatch);
    }

    SECTION("400 for an undecodable payload") {
        const std::vector<std::uint8_t> garbage{0xFF, 0xFF};
        TransportResponse response = transport.handle("/api/filters/invert", garbage);
        REQUIRE(response.status == 400);
        auto decoded = wire::decode_response(response.status, response.body, 1, 1);
        REQUIRE(decoded.error().message().find("Truncated") != std::string::npos);
    }
}
