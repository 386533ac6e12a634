#pragma once
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "AsyncFileCore.h"

namespace afile::test_helpers
{

// RAII temporary directory that gets cleaned up on destruction
class ScopedTempDir
{
public:
    ScopedTempDir();
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const noexcept {
        return _path;
    }
    std::filesystem::path join(const std::string& name) const {
        return _path / name;
    }

    // Writes content to name inside the directory and returns the full path
    std::string writeFile(const std::string& name, const std::string& content) const;

private:
    std::filesystem::path _path;
};

// Deterministic pseudo-random payload, stable across runs
std::string makePattern(size_t length, uint32_t seed = 7);

// Sets an environment variable for the lifetime of the object
class ScopedEnvVar
{
public:
    ScopedEnvVar(std::string name, const std::string& value);
    ~ScopedEnvVar();

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    std::string _name;
    std::optional<std::string> _previous;
};

/**
 * RAII environment: a WorkContractGroup, a FileSystem on it and, unless
 * disabled, a running WorkService draining the group.
 *
 * Without a service nothing runs until wait() pumps the group, which makes
 * in-flight states observable deterministically.
 */
class ScopedWorkEnv
{
public:
    explicit ScopedWorkEnv(bool startService = true,
                           AsyncFile::Core::IO::FileSystem::Config config = {});
    ScopedWorkEnv(bool startService, std::shared_ptr<AsyncFile::Core::IO::IFileBackend> backend);
    ~ScopedWorkEnv();

    ScopedWorkEnv(const ScopedWorkEnv&) = delete;
    ScopedWorkEnv& operator=(const ScopedWorkEnv&) = delete;

    AsyncFile::Core::IO::FileSystem& fs() noexcept {
        return *_fs;
    }
    AsyncFile::Core::Concurrency::WorkContractGroup& group() noexcept {
        return _group;
    }
    bool serviceRunning() const noexcept {
        return _service.isRunning();
    }

private:
    void startIfRequested(bool startService);

    AsyncFile::Core::Concurrency::WorkService _service;
    AsyncFile::Core::Concurrency::WorkContractGroup _group;
    std::unique_ptr<AsyncFile::Core::IO::FileSystem> _fs;
};

// One canned resource served by ScriptedHttpTransport
struct ScriptedResource
{
    int status = 200;
    std::string body;
    std::vector<AsyncFile::Core::IO::HttpHeader> headers;
    bool sendContentLength = true;
    std::optional<std::string> contentLengthOverride;  // raw header value for HEAD
    bool honorRange = true;                            // false answers 200 with the whole body
    bool hasBody = true;                               // false models 204/304 style replies
    std::optional<std::string> transportError;
    size_t chunkSize = 4;                              // bytes per onChunk call
};

struct RecordedRequest
{
    std::string method;
    std::string url;
    std::vector<AsyncFile::Core::IO::HttpHeader> headers;

    std::optional<std::string> header(const std::string& name) const;
};

/**
 * In-memory IHttpTransport. Unknown URLs answer 404. GET honors a single
 * "bytes=a-b" range with 206, and answers 416 when the range starts at or
 * past the end of the body. Every request is recorded.
 */
class ScriptedHttpTransport : public AsyncFile::Core::IO::IHttpTransport
{
public:
    void serve(const std::string& url, ScriptedResource resource);

    AsyncFile::Core::IO::HttpResponse head(const std::string& url) override;
    AsyncFile::Core::IO::HttpResponse get(const std::string& url,
                                          const std::vector<AsyncFile::Core::IO::HttpHeader>& requestHeaders,
                                          const ChunkHandler& onChunk) override;

    std::vector<RecordedRequest> requests() const;
    size_t requestCount() const;
    // Bytes handed to onChunk across all GETs, after early stops
    size_t bytesDelivered() const;

private:
    std::optional<ScriptedResource> find(const std::string& url) const;

    mutable std::mutex _mutex;
    std::map<std::string, ScriptedResource> _resources;
    std::vector<RecordedRequest> _requests;
    size_t _bytesDelivered = 0;
};

// RemoteFileBackend config bound to a scripted transport and a fixed origin
AsyncFile::Core::IO::FileSystem::Config remoteConfig(std::shared_ptr<ScriptedHttpTransport> transport,
                                                     std::string origin = "http://assets.test",
                                                     bool advanceCursorOnRead = true);

} // namespace afile::test_helpers
