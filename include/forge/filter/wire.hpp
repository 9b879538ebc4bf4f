#pragma once

/// @file wire.hpp
/// @brief Binary wire format spoken with the filter-execution service
///
/// Request layout (bit-exact):
///
///     [u32 little-endian L][L bytes UTF-8 JSON {"width","height","params"}][width*height*4 RGBA8]
///
/// Pixels are row-major, top row first. A successful response is exactly
/// width*height*4 RGBA8 bytes. A failure response is a JSON object whose
/// "detail" string is surfaced verbatim.

#include <forge/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace forge_filter::wire {

constexpr std::size_t LENGTH_PREFIX_SIZE = 4;
constexpr std::size_t BYTES_PER_PIXEL = 4;

/// Detail used when a failure body carries none
constexpr const char* UNKNOWN_ERROR_DETAIL = "Unknown error";

/// Decoded request, as seen by the service side
struct DecodedRequest {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    nlohmann::json params = nlohmann::json::object();
    std::vector<std::uint8_t> pixels;
};

/// Expected pixel payload size for a region
[[nodiscard]] constexpr std::size_t pixel_bytes(std::uint32_t width, std::uint32_t height) {
    return static_cast<std::size_t>(width) * height * BYTES_PER_PIXEL;
}

/// Encode a request. Fails if `pixels` isn't width*height*4 bytes.
[[nodiscard]] forge_core::Result<std::vector<std::uint8_t>> encode_request(
    std::uint32_t width, std::uint32_t height,
    const nlohmann::json& params,
    std::span<const std::uint8_t> pixels);

/// Decode a request (service side)
[[nodiscard]] forge_core::Result<DecodedRequest> decode_request(std::span<const std::uint8_t> bytes);

/// Interpret a response. 2xx bodies must be exactly width*height*4 bytes;
/// anything else is a failure whose message is the body's "detail".
[[nodiscard]] forge_core::Result<std::vector<std::uint8_t>> decode_response(
    int status, std::span<const std::uint8_t> body,
    std::uint32_t width, std::uint32_t height);

/// Failure body `{"detail": ...}`
[[nodiscard]] std::vector<std::uint8_t> encode_failure(const std::string& detail);

/// True for 2xx status codes
[[nodiscard]] constexpr bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

} // namespace forge_filter::wire
