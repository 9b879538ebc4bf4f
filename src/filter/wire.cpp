/// @file wire.cpp
/// @brief Filter wire format encoding

#include <forge/filter/wire.hpp>

namespace forge_filter::wire {

using forge_core::Err;
using forge_core::WireError;

forge_core::Result<std::vector<std::uint8_t>> encode_request(
    std::uint32_t width, std::uint32_t height,
    const nlohmann::json& params,
    std::span<const std::uint8_t> pixels)
{
    const std::size_t expected = pixel_bytes(width, height);
    if (pixels.size() != expected) {
        return Err<std::vector<std::uint8_t>>(WireError::size_mismatch(expected, pixels.size()));
    }

    nlohmann::json metadata{
        {"width", width},
        {"height", height},
        {"params", params.is_null() ? nlohmann::json::object() : params},
    };
    std::string text;
    try {
        text = metadata.dump();
    } catch (const nlohmann::json::type_error& e) {
        return Err<std::vector<std::uint8_t>>(WireError::bad_metadata(e.what()));
    }
    const auto length = static_cast<std::uint32_t>(text.size());

    std::vector<std::uint8_t> out;
    out.reserve(LENGTH_PREFIX_SIZE + text.size() + pixels.size());

    // u32 little-endian, independent of host byte order
    out.push_back(static_cast<std::uint8_t>(length & 0xFF));
    out.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((length >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((length >> 24) & 0xFF));

    out.insert(out.end(), text.begin(), text.end());
    out.insert(out.end(), pixels.begin(), pixels.end());
    return out;
}

forge_core::Result<DecodedRequest> decode_request(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < LENGTH_PREFIX_SIZE) {
        return Err<DecodedRequest>(WireError::truncated(LENGTH_PREFIX_SIZE, bytes.size()));
    }

    const std::uint32_t length =
        static_cast<std::uint32_t>(bytes[0]) |
        (static_cast<std::uint32_t>(bytes[1]) << 8) |
        (static_cast<std::uint32_t>(bytes[2]) << 16) |
        (static_cast<std::uint32_t>(bytes[3]) << 24);

    const std::size_t header_end = LENGTH_PREFIX_SIZE + length;
    if (bytes.size() < header_end) {
        return Err<DecodedRequest>(WireError::truncated(header_end, bytes.size()));
    }

    nlohmann::json metadata;
    try {
        metadata = nlohmann::json::parse(bytes.begin() + LENGTH_PREFIX_SIZE, bytes.begin() + header_end);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<DecodedRequest>(WireError::bad_metadata(e.what()));
    }

    if (!metadata.is_object() ||
        !metadata.contains("width") || !metadata["width"].is_number_unsigned() ||
        !metadata.contains("height") || !metadata["height"].is_number_unsigned()) {
        return Err<DecodedRequest>(WireError::bad_metadata("width/height missing or not unsigned integers"));
    }

    DecodedRequest request;
    request.width = metadata["width"].get<std::uint32_t>();
    request.height = metadata["height"].get<std::uint32_t>();
    if (metadata.contains("params") && metadata["params"].is_object()) {
        request.params = metadata["params"];
    }

    const std::size_t expected = pixel_bytes(request.width, request.height);
    const std::size_t found = bytes.size() - header_end;
    if (found != expected) {
        return Err<DecodedRequest>(WireError::size_mismatch(expected, found));
    }

    request.pixels.assign(bytes.begin() + header_end, bytes.end());
    return request;
}

forge_core::Result<std::vector<std::uint8_t>> decode_response(
    int status, std::span<const std::uint8_t> body,
    std::uint32_t width, std::uint32_t height)
{
    if (is_success_status(status)) {
        const std::size_t expected = pixel_bytes(width, height);
        if (body.size() != expected) {
            return Err<std::vector<std::uint8_t>>(WireError::size_mismatch(expected, body.size()));
        }
        return std::vector<std::uint8_t>(body.begin(), body.end());
    }

    std::string detail = UNKNOWN_ERROR_DETAIL;
    try {
        auto parsed = nlohmann::json::parse(body.begin(), body.end());
        if (parsed.is_object()) {
            auto it = parsed.find("detail");
            if (it != parsed.end() && it->is_string() && !it->get<std::string>().empty()) {
                detail = it->get<std::string>();
            }
        }
    } catch (const nlohmann::json::parse_error&) {
        // Unparseable failure body: keep the generic detail
    }

    return Err<std::vector<std::uint8_t>>(WireError::service(detail));
}

std::vector<std::uint8_t> encode_failure(const std::string& detail) {
    const std::string text = nlohmann::json{{"detail", detail}}.dump();
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace forge_filter::wire
