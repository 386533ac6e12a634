#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ExclusiveSlot.h"
#include "HttpTransport.h"
#include "IFileBackend.h"

namespace AsyncFile::Core::IO {

/**
 * Backend that treats paths as resources under an HTTP origin.
 *
 * - exists(): HEAD, true only for a 2xx status
 * - open(): HEAD; a non-2xx status or a failed request fails with FileNotFound
 * - read(n): GET with `Range: bytes=<cursor>-<cursor+n-1>`, body accumulated up to n bytes
 * - metadata(): HEAD, length taken from Content-Length
 * - seek(): cursor arithmetic only; SeekFrom::end() is Unsupported
 *
 * The origin is resolved per call: the environment variable named by
 * Config::originEnvVar first, then Config::origin, otherwise the call fails
 * with FileError::Configuration. Paths that already are http(s) URLs are used
 * unchanged.
 */
class RemoteFileBackend : public IFileBackend {
public:
    struct Config {
        std::optional<std::string> origin;        // fallback origin, e.g. "https://cdn.example.com/game"
        std::string originEnvVar;                 // empty disables the environment lookup
        bool advanceCursorOnRead;                 // false keeps the cursor where it was after read()
        std::shared_ptr<IHttpTransport> transport; // null selects CurlHttpTransport

        Config() : originEnvVar("AFILE_ORIGIN"), advanceCursorOnRead(true) {}
    };

    explicit RemoteFileBackend(Config cfg = {});

    FileOperationHandle open(const std::string& path, Concurrency::Priority priority) override;
    FileOperationHandle exists(const std::string& path, Concurrency::Priority priority) override;
    FileOperationHandle readAll(const std::string& path, Concurrency::Priority priority) override;

    BackendCapabilities getCapabilities() const override;
    std::string getBackendType() const override { return "Remote"; }

    std::optional<std::string> resolveOrigin() const;
    // Full URL for path, or nullopt when no origin is available
    std::optional<std::string> resolveUrl(const std::string& path) const;

    const std::shared_ptr<IHttpTransport>& transport() const noexcept { return _transport; }

private:
    FileOperationHandle missingOrigin(const std::string& path) const;

    Config _cfg;
    std::shared_ptr<IHttpTransport> _transport;
};

/**
 * A remote resource opened by RemoteFileBackend: a URL plus a client-side
 * cursor. The cursor lives in an ExclusiveSlot so concurrent calls on one
 * handle are rejected with FileError::HandleBusy, as for local files.
 */
class RemoteOpenFile : public OpenFile {
public:
    RemoteOpenFile(FileSystem* fs, std::string path, std::string url,
                   std::shared_ptr<IHttpTransport> transport, bool advanceCursorOnRead);

    FileOperationHandle read(size_t size, Concurrency::Priority priority) override;
    FileOperationHandle seek(SeekFrom position, Concurrency::Priority priority) override;
    FileOperationHandle metadata(Concurrency::Priority priority) override;
    FileOperationHandle readAll(Concurrency::Priority priority) override;

    const std::string& path() const noexcept override { return _path; }
    const std::string& url() const noexcept { return _url; }
    bool busy() const noexcept override { return _slot->busy(); }
    std::string backendType() const override { return "Remote"; }

private:
    using Slot = ExclusiveSlot<uint64_t>;

    FileOperationHandle busyHandle() const;

    static FileOpStatus fetchRange(IHttpTransport& transport, const std::string& url, const std::string& path,
                                   uint64_t& cursor, size_t size, bool advance,
                                   FileOperationHandle::OpState& s);
    static std::optional<uint64_t> fetchLength(IHttpTransport& transport, const std::string& url,
                                               const std::string& path, FileOperationHandle::OpState& s);

    // Existence check behind open(); any failure of the HEAD reads as a missing resource
    static bool probeForOpen(IHttpTransport& transport, const std::string& url, const std::string& path,
                             FileOperationHandle::OpState& s);

    friend class RemoteFileBackend;

    FileSystem* _fs;
    std::string _path;
    std::string _url;
    std::shared_ptr<IHttpTransport> _transport;
    bool _advanceCursorOnRead;
    std::shared_ptr<Slot> _slot;
};

} // namespace AsyncFile::Core::IO
