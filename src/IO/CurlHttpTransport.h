#pragma once
#include "HttpTransport.h"

namespace AsyncFile::Core::IO {

/**
 * IHttpTransport over libcurl's easy interface.
 *
 * Each request uses its own easy handle, so one instance can be shared by all
 * worker threads. Redirects are followed. No timeouts are set; callers impose
 * them if needed.
 */
class CurlHttpTransport : public IHttpTransport {
public:
    CurlHttpTransport();
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    HttpResponse head(const std::string& url) override;
    HttpResponse get(const std::string& url,
                     const std::vector<HttpHeader>& requestHeaders,
                     const ChunkHandler& onChunk) override;

private:
    bool _globalReady = false;
};

} // namespace AsyncFile::Core::IO
