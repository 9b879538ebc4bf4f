/// @file service.cpp
/// @brief WireFilterService and LoopbackTransport

#include <forge/filter/service.hpp>
#include <forge/core/log.hpp>

namespace forge_filter {

// =============================================================================
// WireFilterService
// =============================================================================

WireFilterService::WireFilterService(FilterTransport& transport, std::string endpoint)
    : m_transport(transport)
    , m_endpoint(std::move(endpoint))
{
    while (!m_endpoint.empty() && m_endpoint.back() == '/') {
        m_endpoint.pop_back();
    }
}

void WireFilterService::execute(FilterRequest request, Completion on_done) {
    auto payload = wire::encode_request(request.width, request.height, request.params, request.pixels);
    if (!payload) {
        on_done(FilterResult(payload.error()));
        return;
    }

    ++m_requests_sent;
    const std::uint32_t width = request.width;
    const std::uint32_t height = request.height;
    const std::string path = m_endpoint + "/" + request.filter_id;

    forge_core::filter_logger()->trace("POST {} ({}x{}, {} bytes)", path, width, height, payload->size());

    m_transport.post(path, std::move(*payload),
        [width, height, done = std::move(on_done)](TransportResponse response) {
            done(wire::decode_response(response.status, response.body, width, height));
        });
}

// =============================================================================
// LoopbackTransport
// =============================================================================

LoopbackTransport::LoopbackTransport(forge_core::TimerQueue& timers, forge_core::TimerQueue::Duration latency)
    : m_timers(timers)
    , m_latency(latency)
{}

void LoopbackTransport::register_filter(const std::string& filter_id, Handler handler) {
    m_handlers[filter_id] = std::move(handler);
}

TransportResponse LoopbackTransport::handle(const std::string& path, std::span<const std::uint8_t> payload) const {
    const auto slash = path.find_last_of('/');
    const std::string filter_id = slash == std::string::npos ? path : path.substr(slash + 1);

    auto it = m_handlers.find(filter_id);
    if (it == m_handlers.end()) {
        return TransportResponse{404, wire::encode_failure("Filter not found: " + filter_id)};
    }

    auto request = wire::decode_request(payload);
    if (!request) {
        return TransportResponse{400, wire::encode_failure(request.error().message())};
    }

    auto output = it->second(*request);
    if (!output) {
        return TransportResponse{500, wire::encode_failure(output.error().message())};
    }
    return TransportResponse{200, std::move(*output)};
}

void LoopbackTransport::post(const std::string& path, std::vector<std::uint8_t> payload,
                             ResponseHandler on_response) {
    ++m_posts;
    TransportResponse response = handle(path, payload);
    m_timers.schedule(m_latency,
        [response = std::move(response), on_response = std::move(on_response)]() mutable {
            on_response(std::move(response));
        });
}

} // namespace forge_filter
