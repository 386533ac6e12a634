#include "CurlHttpTransport.h"

#include <curl/curl.h>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include "../Logging/Logger.h"

namespace AsyncFile::Core::IO {

namespace {

// Reference-counted curl_global_init/cleanup shared by all transports
class CurlGlobal {
public:
    static bool acquire() {
        std::lock_guard<std::mutex> lock(mutex());
        if (refs()++ == 0) {
            CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
            if (rc != CURLE_OK) {
                refs()--;
                AFILE_LOG_ERROR_CAT("CurlHttpTransport",
                                    std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
                return false;
            }
        }
        return true;
    }

    static void release() {
        std::lock_guard<std::mutex> lock(mutex());
        if (refs() > 0 && --refs() == 0) {
            curl_global_cleanup();
        }
    }

private:
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }
    static size_t& refs() {
        static size_t count = 0;
        return count;
    }
};

struct EasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

// State shared with the C callbacks of one transfer
struct Transfer {
    CURL* easy = nullptr;
    HttpResponse response;
    const IHttpTransport::ChunkHandler* onChunk = nullptr;
    bool stoppedByHandler = false;
    // Set when onChunk threw; exceptions must not cross libcurl's C frames
    std::optional<std::string> handlerError;
};

std::string_view trim(std::string_view v) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.remove_prefix(1);
    while (!v.empty() && (v.back() == '\r' || v.back() == '\n' || v.back() == ' ' || v.back() == '\t')) {
        v.remove_suffix(1);
    }
    return v;
}

size_t onHeaderLine(char* buffer, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* t = static_cast<Transfer*>(userdata);
    std::string_view line(buffer, total);

    // A new status line starts a new response (redirects, 100-continue)
    if (line.substr(0, 5) == "HTTP/") {
        t->response.headers.clear();
        return total;
    }
    auto colon = line.find(':');
    if (colon == std::string_view::npos) return total;
    t->response.headers.push_back(HttpHeader{std::string(trim(line.substr(0, colon))),
                                             std::string(trim(line.substr(colon + 1)))});
    return total;
}

size_t onBodyData(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* t = static_cast<Transfer*>(userdata);
    if (!t->onChunk || !*t->onChunk) return total;

    long code = 0;
    curl_easy_getinfo(t->easy, CURLINFO_RESPONSE_CODE, &code);
    t->response.status = static_cast<int>(code);

    std::span<const std::byte> chunk(reinterpret_cast<const std::byte*>(ptr), total);
    bool keepGoing = false;
    try {
        keepGoing = (*t->onChunk)(t->response, chunk);
    } catch (const std::exception& e) {
        t->handlerError = std::string("body handler failed: ") + e.what();
    } catch (...) {
        t->handlerError = "body handler failed with an unknown exception";
    }
    if (!keepGoing) {
        t->stoppedByHandler = true;
        // A short count makes curl abort with CURLE_WRITE_ERROR
        return 0;
    }
    return total;
}

HttpResponse perform(CURL* easy, Transfer& t, const std::string& url) {
    CURLcode rc = curl_easy_perform(easy);

    long code = 0;
    curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &code);
    t.response.status = static_cast<int>(code);

    if (t.handlerError) {
        t.response.transportError = t.handlerError;
        AFILE_LOG_ERROR_CAT("CurlHttpTransport", "Request to " + url + " aborted: " + *t.handlerError);
    } else if (rc != CURLE_OK && !(rc == CURLE_WRITE_ERROR && t.stoppedByHandler)) {
        t.response.transportError = std::string(curl_easy_strerror(rc));
        AFILE_LOG_DEBUG_CAT("CurlHttpTransport", "Request to " + url + " failed: " + *t.response.transportError);
    }
    if (t.response.status == 204 || t.response.status == 304) {
        t.response.hasBody = false;
    }
    return std::move(t.response);
}

} // namespace

CurlHttpTransport::CurlHttpTransport() : _globalReady(CurlGlobal::acquire()) {}

CurlHttpTransport::~CurlHttpTransport() {
    if (_globalReady) {
        CurlGlobal::release();
    }
}

HttpResponse CurlHttpTransport::head(const std::string& url) {
    if (!_globalReady) {
        HttpResponse r;
        r.transportError = "libcurl global initialization failed";
        return r;
    }
    std::unique_ptr<CURL, EasyDeleter> easy(curl_easy_init());
    if (!easy) {
        HttpResponse r;
        r.transportError = "curl_easy_init failed";
        return r;
    }

    Transfer t;
    t.easy = easy.get();
    curl_easy_setopt(easy.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_HEADERFUNCTION, &onHeaderLine);
    curl_easy_setopt(easy.get(), CURLOPT_HEADERDATA, &t);

    HttpResponse r = perform(easy.get(), t, url);
    r.hasBody = false;
    return r;
}

HttpResponse CurlHttpTransport::get(const std::string& url,
                                    const std::vector<HttpHeader>& requestHeaders,
                                    const ChunkHandler& onChunk) {
    if (!_globalReady) {
        HttpResponse r;
        r.transportError = "libcurl global initialization failed";
        return r;
    }
    std::unique_ptr<CURL, EasyDeleter> easy(curl_easy_init());
    if (!easy) {
        HttpResponse r;
        r.transportError = "curl_easy_init failed";
        return r;
    }

    std::unique_ptr<curl_slist, SlistDeleter> headerList;
    for (const auto& h : requestHeaders) {
        const std::string line = h.name + ": " + h.value;
        curl_slist* appended = curl_slist_append(headerList.get(), line.c_str());
        if (!appended) {
            HttpResponse r;
            r.transportError = "curl_slist_append failed";
            return r;
        }
        headerList.release();
        headerList.reset(appended);
    }

    Transfer t;
    t.easy = easy.get();
    t.onChunk = &onChunk;
    curl_easy_setopt(easy.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy.get(), CURLOPT_NOSIGNAL, 1L);
    if (headerList) {
        curl_easy_setopt(easy.get(), CURLOPT_HTTPHEADER, headerList.get());
    }
    curl_easy_setopt(easy.get(), CURLOPT_HEADERFUNCTION, &onHeaderLine);
    curl_easy_setopt(easy.get(), CURLOPT_HEADERDATA, &t);
    curl_easy_setopt(easy.get(), CURLOPT_WRITEFUNCTION, &onBodyData);
    curl_easy_setopt(easy.get(), CURLOPT_WRITEDATA, &t);

    return perform(easy.get(), t, url);
}

} // namespace AsyncFile::Core::IO
