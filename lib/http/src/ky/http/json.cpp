// C++ Standard Library
#include <string>

// Project
#include <ky/http/json.hpp>

namespace ky::http {

std::optional<json> decode_json(std::string_view body)
{
    // Glaze wants a NUL-terminated buffer; std::string provides one.
    const std::string buffer{body};

    json value{};
    if (const glz::error_ctx ec = glz::read<json_opts>(value, buffer); ec) {
        return std::nullopt;
    }
    return value;
}

JsonResponse to_json_response(const net::Response& response)
{
    return JsonResponse{
        .status = response.status,
        .body   = decode_json(response.body),
        .error  = response.error,
        .url    = response.url,
    };
}

} // namespace ky::http
