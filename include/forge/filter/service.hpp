#pragma once

/// @file service.hpp
/// @brief Asynchronous access to the filter-execution service
///
/// FilterService is what the pipeline and the filter cache talk to.
/// WireFilterService implements it over a FilterTransport using the binary
/// wire format. Completion callbacks always arrive later, from the host's
/// event loop, and may arrive in any order.

#include "wire.hpp"

#include <forge/core/error.hpp>
#include <forge/core/timer.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace forge_filter {

// =============================================================================
// Filter Service
// =============================================================================

/// One region of pixels to run through a registry filter
struct FilterRequest {
    std::string filter_id;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    nlohmann::json params = nlohmann::json::object();
    std::vector<std::uint8_t> pixels;
};

/// Output pixels (same dimensions) or the failure
using FilterResult = forge_core::Result<std::vector<std::uint8_t>>;

class FilterService {
public:
    using Completion = std::function<void(FilterResult)>;

    virtual ~FilterService() = default;

    /// Run a filter. `on_done` is invoked exactly once, asynchronously.
    virtual void execute(FilterRequest request, Completion on_done) = 0;
};

// =============================================================================
// Transport
// =============================================================================

struct TransportResponse {
    int status = 200;
    std::vector<std::uint8_t> body;
};

/// Byte-level request/response channel (HTTP POST in production)
class FilterTransport {
public:
    using ResponseHandler = std::function<void(TransportResponse)>;

    virtual ~FilterTransport() = default;

    /// POST `payload` to `path`; `on_response` is invoked exactly once, later
    virtual void post(const std::string& path, std::vector<std::uint8_t> payload,
                      ResponseHandler on_response) = 0;
};

// =============================================================================
// Wire Filter Service
// =============================================================================

/// FilterService over a transport, posting to `<endpoint>/<filter_id>`
class WireFilterService : public FilterService {
public:
    WireFilterService(FilterTransport& transport, std::string endpoint);

    void execute(FilterRequest request, Completion on_done) override;

    [[nodiscard]] const std::string& endpoint() const { return m_endpoint; }
    [[nodiscard]] std::uint64_t requests_sent() const { return m_requests_sent; }

private:
    FilterTransport& m_transport;
    std::string m_endpoint;
    std::uint64_t m_requests_sent = 0;
};

// =============================================================================
// Loopback Transport
// =============================================================================

/// In-process transport: decodes the request, runs a registered handler and
/// delivers the encoded response through the timer queue after `latency`.
class LoopbackTransport : public FilterTransport {
public:
    /// Service-side filter implementation
    using Handler = std::function<forge_core::Result<std::vector<std::uint8_t>>(const wire::DecodedRequest&)>;

    explicit LoopbackTransport(forge_core::TimerQueue& timers,
                               forge_core::TimerQueue::Duration latency = forge_core::TimerQueue::Duration{0});

    void register_filter(const std::string& filter_id, Handler handler);

    void post(const std::string& path, std::vector<std::uint8_t> payload,
              ResponseHandler on_response) override;

    void set_latency(forge_core::TimerQueue::Duration latency) { m_latency = latency; }
    [[nodiscard]] std::uint64_t posts() const { return m_posts; }

    /// Build the response the service would send
    [[nodiscard]] TransportResponse handle(const std::string& path, std::span<const std::uint8_t> payload) const;

private:
    forge_core::TimerQueue& m_timers;
    forge_core::TimerQueue::Duration m_latency;
    std::unordered_map<std::string, Handler> m_handlers;
    std::uint64_t m_posts = 0;
};

} // namespace forge_filter
