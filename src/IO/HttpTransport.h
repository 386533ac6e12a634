#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace AsyncFile::Core::IO {

struct HttpHeader {
    std::string name;
    std::string value;
};

/**
 * Status line and headers of one response.
 * transportError is set when the exchange failed before a complete status was
 * received (DNS, connect, TLS, reset, malformed response).
 */
struct HttpResponse {
    int status = 0;
    std::vector<HttpHeader> headers;
    bool hasBody = true;
    std::optional<std::string> transportError;

    bool ok() const noexcept { return status >= 200 && status <= 299; }
    // Case-insensitive lookup of the last header with this name
    std::optional<std::string> header(std::string_view name) const;
};

/**
 * Minimal HTTP client used by RemoteFileBackend.
 *
 * Implementations must be safe to call from several worker threads at once.
 * get() streams the body to onChunk as it arrives; each call also receives the
 * response head. Returning false from onChunk stops the transfer early, which
 * is not reported as a transport error.
 */
class IHttpTransport {
public:
    using ChunkHandler = std::function<bool(const HttpResponse& head, std::span<const std::byte> chunk)>;

    virtual ~IHttpTransport() = default;

    virtual HttpResponse head(const std::string& url) = 0;
    virtual HttpResponse get(const std::string& url,
                             const std::vector<HttpHeader>& requestHeaders,
                             const ChunkHandler& onChunk) = 0;
};

} // namespace AsyncFile::Core::IO
