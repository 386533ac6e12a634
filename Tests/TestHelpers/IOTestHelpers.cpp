#include "TestHelpers/IOTestHelpers.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <span>
#include <string_view>

namespace afile::test_helpers
{

using namespace AsyncFile::Core;
using namespace AsyncFile::Core::IO;

ScopedTempDir::ScopedTempDir() {
    namespace fs = std::filesystem;
    auto base = fs::temp_directory_path();
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::random_device rd;
    std::mt19937_64 gen(rd());
    auto rnd = gen();
    std::ostringstream oss;
    oss << "AsyncFile_Test_" << std::hex << now << "_" << rnd;
    _path = base / oss.str();
    std::error_code ec;
    fs::create_directories(_path, ec);
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
}

std::string ScopedTempDir::writeFile(const std::string& name, const std::string& content) const {
    auto p = join(name);
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return p.string();
}

std::string makePattern(size_t length, uint32_t seed) {
    std::mt19937 gen(seed);
    std::string out(length, '\0');
    for (auto& c : out) {
        c = static_cast<char>(gen() & 0xFF);
    }
    return out;
}

ScopedEnvVar::ScopedEnvVar(std::string name, const std::string& value) : _name(std::move(name)) {
    if (const char* prev = std::getenv(_name.c_str())) {
        _previous = prev;
    }
    ::setenv(_name.c_str(), value.c_str(), 1);
}

ScopedEnvVar::~ScopedEnvVar() {
    if (_previous) {
        ::setenv(_name.c_str(), _previous->c_str(), 1);
    } else {
        ::unsetenv(_name.c_str());
    }
}

ScopedWorkEnv::ScopedWorkEnv(bool startService, FileSystem::Config config)
    : _service(Concurrency::WorkService::Config{}),
      _group(2048, "TestIOGroup"),
      _fs(std::make_unique<FileSystem>(&_group, std::move(config))) {
    startIfRequested(startService);
}

ScopedWorkEnv::ScopedWorkEnv(bool startService, std::shared_ptr<IFileBackend> backend)
    : _service(Concurrency::WorkService::Config{}),
      _group(2048, "TestIOGroup"),
      _fs(std::make_unique<FileSystem>(&_group, std::move(backend))) {
    startIfRequested(startService);
}

void ScopedWorkEnv::startIfRequested(bool startService) {
    if (startService) {
        _service.start();
        _service.addWorkContractGroup(&_group);
    }
}

ScopedWorkEnv::~ScopedWorkEnv() {
    _service.removeWorkContractGroup(&_group);
    _service.stop();
}

std::optional<std::string> RecordedRequest::header(const std::string& name) const {
    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    };
    const auto wanted = lower(name);
    for (const auto& h : headers) {
        if (lower(h.name) == wanted) return h.value;
    }
    return std::nullopt;
}

void ScriptedHttpTransport::serve(const std::string& url, ScriptedResource resource) {
    std::lock_guard<std::mutex> lock(_mutex);
    _resources[url] = std::move(resource);
}

std::optional<ScriptedResource> ScriptedHttpTransport::find(const std::string& url) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _resources.find(url);
    if (it == _resources.end()) return std::nullopt;
    return it->second;
}

HttpResponse ScriptedHttpTransport::head(const std::string& url) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _requests.push_back(RecordedRequest{"HEAD", url, {}});
    }
    HttpResponse response;
    response.hasBody = false;
    auto resource = find(url);
    if (!resource) {
        response.status = 404;
        return response;
    }
    if (resource->transportError) {
        response.transportError = resource->transportError;
        return response;
    }
    response.status = resource->status;
    response.headers = resource->headers;
    if (resource->contentLengthOverride) {
        response.headers.push_back(HttpHeader{"Content-Length", *resource->contentLengthOverride});
    } else if (resource->sendContentLength) {
        response.headers.push_back(HttpHeader{"Content-Length", std::to_string(resource->body.size())});
    }
    return response;
}

namespace {
    // Parses "bytes=a-b"; anything else is treated as no range
    std::optional<std::pair<uint64_t, uint64_t>> parseRange(std::string_view v) {
        constexpr std::string_view prefix = "bytes=";
        if (v.substr(0, prefix.size()) != prefix) return std::nullopt;
        v.remove_prefix(prefix.size());
        auto dash = v.find('-');
        if (dash == std::string_view::npos) return std::nullopt;
        uint64_t first = 0, last = 0;
        auto a = std::from_chars(v.data(), v.data() + dash, first);
        auto b = std::from_chars(v.data() + dash + 1, v.data() + v.size(), last);
        if (a.ec != std::errc() || b.ec != std::errc() || last < first) return std::nullopt;
        return std::make_pair(first, last);
    }
}

HttpResponse ScriptedHttpTransport::get(const std::string& url,
                                        const std::vector<HttpHeader>& requestHeaders,
                                        const ChunkHandler& onChunk) {
    RecordedRequest request{"GET", url, requestHeaders};
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _requests.push_back(request);
    }

    HttpResponse response;
    auto resource = find(url);
    if (!resource) {
        response.status = 404;
        std::string notFound = "Not Found";
        onChunk(response, std::as_bytes(std::span<const char>(notFound.data(), notFound.size())));
        return response;
    }
    if (resource->transportError) {
        response.transportError = resource->transportError;
        return response;
    }

    response.status = resource->status;
    response.headers = resource->headers;
    if (!resource->hasBody) {
        response.hasBody = false;
        return response;
    }

    std::string_view payload = resource->body;
    if (resource->honorRange && response.status == 200) {
        if (auto range = request.header("Range")) {
            if (auto bounds = parseRange(*range)) {
                if (bounds->first >= payload.size()) {
                    response.status = 416;
                    return response;
                }
                const uint64_t end = std::min<uint64_t>(bounds->second + 1, payload.size());
                payload = payload.substr(bounds->first, end - bounds->first);
                response.status = 206;
            }
        }
    }

    const size_t step = std::max<size_t>(resource->chunkSize, 1);
    for (size_t offset = 0; offset < payload.size(); offset += step) {
        auto piece = payload.substr(offset, step);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _bytesDelivered += piece.size();
        }
        if (!onChunk(response, std::as_bytes(std::span<const char>(piece.data(), piece.size())))) {
            break;
        }
    }
    return response;
}

std::vector<RecordedRequest> ScriptedHttpTransport::requests() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _requests;
}

size_t ScriptedHttpTransport::requestCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _requests.size();
}

size_t ScriptedHttpTransport::bytesDelivered() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _bytesDelivered;
}

FileSystem::Config remoteConfig(std::shared_ptr<ScriptedHttpTransport> transport, std::string origin,
                                bool advanceCursorOnRead) {
    FileSystem::Config cfg;
    cfg.backend = FileSystem::BackendKind::Remote;
    cfg.remote.origin = std::move(origin);
    cfg.remote.originEnvVar.clear();
    cfg.remote.advanceCursorOnRead = advanceCursorOnRead;
    cfg.remote.transport = std::move(transport);
    return cfg;
}

} // namespace afile::test_helpers
