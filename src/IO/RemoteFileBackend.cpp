#include "RemoteFileBackend.h"
#include "CurlHttpTransport.h"
#include "FileHandle.h"
#include "FileSystem.h"

#include <algorithm>
#include <charconv>
#include <limits>
#include <string_view>
#include <vector>

#include "../CoreCommon.h"
#include "../Logging/Logger.h"

namespace AsyncFile::Core::IO {

using Concurrency::Priority;

namespace {
    constexpr const char* kCategory = "RemoteFileBackend";

    bool isAbsoluteUrl(std::string_view path) {
        return path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0;
    }

    std::string joinUrl(std::string_view origin, std::string_view path) {
        while (!origin.empty() && origin.back() == '/') origin.remove_suffix(1);
        while (!path.empty() && path.front() == '/') path.remove_prefix(1);
        std::string url;
        url.reserve(origin.size() + 1 + path.size());
        url.append(origin);
        url.push_back('/');
        url.append(path);
        return url;
    }

    // Strict decimal parse; rejects signs, empty values and trailing garbage
    std::optional<uint64_t> parseContentLength(std::string_view v) {
        while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.remove_prefix(1);
        while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.remove_suffix(1);
        if (v.empty()) return std::nullopt;
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), value);
        if (ec != std::errc() || ptr != v.data() + v.size()) return std::nullopt;
        return value;
    }

    std::string rangeHeaderValue(uint64_t start, size_t size) {
        // Inclusive end; clamp instead of wrapping at the top of the 64-bit range
        const uint64_t span = static_cast<uint64_t>(size) - 1;
        const uint64_t last = span > std::numeric_limits<uint64_t>::max() - start
                                  ? std::numeric_limits<uint64_t>::max()
                                  : start + span;
        return "bytes=" + std::to_string(start) + "-" + std::to_string(last);
    }
}

// Existence check behind open(); any failure of the HEAD reads as a missing resource
bool RemoteOpenFile::probeForOpen(IHttpTransport& transport, const std::string& url, const std::string& path,
                                  FileOperationHandle::OpState& s) {
    HttpResponse head = transport.head(url);
    if (head.transportError) {
        s.setError(FileError::FileNotFound, "HEAD " + url + " failed: " + *head.transportError, path);
        return false;
    }
    if (!head.ok()) {
        s.setError(FileError::FileNotFound, "HEAD " + url + " returned HTTP " + std::to_string(head.status),
                   path, std::nullopt, head.status);
        return false;
    }
    return true;
}

RemoteFileBackend::RemoteFileBackend(Config cfg) : _cfg(std::move(cfg)), _transport(_cfg.transport) {
    if (!_transport) {
        _transport = std::make_shared<CurlHttpTransport>();
    }
}

BackendCapabilities RemoteFileBackend::getCapabilities() const {
    BackendCapabilities caps;
    caps.isRemote = true;
    caps.supportsSeekFromEnd = false;
    // Content-Length of a HEAD may differ from what a ranged GET delivers
    caps.reportsExactLength = false;
    caps.advancesCursorOnRead = _cfg.advanceCursorOnRead;
    return caps;
}

std::optional<std::string> RemoteFileBackend::resolveOrigin() const {
    if (auto ambient = safeGetEnv(_cfg.originEnvVar.c_str()); ambient && !ambient->empty()) {
        return ambient;
    }
    if (_cfg.origin && !_cfg.origin->empty()) {
        AFILE_LOG_DEBUG_CAT(kCategory, "No ambient origin; using configured origin " + *_cfg.origin);
        return _cfg.origin;
    }
    return std::nullopt;
}

std::optional<std::string> RemoteFileBackend::resolveUrl(const std::string& path) const {
    if (isAbsoluteUrl(path)) return path;
    auto origin = resolveOrigin();
    if (!origin) return std::nullopt;
    return joinUrl(*origin, path);
}

FileOperationHandle RemoteFileBackend::missingOrigin(const std::string& path) const {
    AFILE_LOG_ERROR_CAT(kCategory, "No origin configured; cannot resolve " + path);
    return FileOperationHandle::failed(FileError::Configuration,
                                       "No remote origin available (set " + _cfg.originEnvVar +
                                       " or RemoteFileBackend::Config::origin)", path);
}

FileOperationHandle RemoteFileBackend::open(const std::string& path, Priority priority) {
    if (!_fs) {
        return FileOperationHandle::failed(FileError::Configuration, "Backend is not attached to a FileSystem", path);
    }
    auto url = resolveUrl(path);
    if (!url) return missingOrigin(path);

    FileSystem* fs = _fs;
    auto transport = _transport;
    const bool advance = _cfg.advanceCursorOnRead;
    return _fs->submit(path, priority, [fs, transport, advance, path, u = *url](FileOperationHandle::OpState& s) {
        if (!RemoteOpenFile::probeForOpen(*transport, u, path, s)) return FileOpStatus::Failed;
        s.opened = std::make_shared<RemoteOpenFile>(fs, path, u, transport, advance);
        return FileOpStatus::Complete;
    });
}

FileOperationHandle RemoteFileBackend::readAll(const std::string& path, Priority priority) {
    if (!_fs) {
        return FileOperationHandle::failed(FileError::Configuration, "Backend is not attached to a FileSystem", path);
    }
    auto url = resolveUrl(path);
    if (!url) return missingOrigin(path);

    auto transport = _transport;
    return _fs->submit(path, priority, [transport, path, u = *url](FileOperationHandle::OpState& s) {
        if (!RemoteOpenFile::probeForOpen(*transport, u, path, s)) return FileOpStatus::Failed;
        auto length = RemoteOpenFile::fetchLength(*transport, u, path, s);
        if (!length) return FileOpStatus::Failed;
        s.metadata = FileMetadata(*length);
        if (*length > std::numeric_limits<size_t>::max()) {
            s.setError(FileError::InvalidLength, "Content-Length exceeds addressable memory", path);
            return FileOpStatus::Failed;
        }
        // A freshly opened file starts at offset 0
        uint64_t cursor = 0;
        return RemoteOpenFile::fetchRange(*transport, u, path, cursor, static_cast<size_t>(*length), true, s);
    });
}

FileOperationHandle RemoteFileBackend::exists(const std::string& path, Priority priority) {
    if (!_fs) {
        return FileOperationHandle::failed(FileError::Configuration, "Backend is not attached to a FileSystem", path);
    }
    auto url = resolveUrl(path);
    auto transport = _transport;
    return _fs->submit(path, priority, [transport, path, url](FileOperationHandle::OpState& s) {
        if (!url) {
            AFILE_LOG_WARNING_CAT(kCategory, "No origin configured; reporting " + path + " as absent");
            s.exists = false;
            return FileOpStatus::Complete;
        }
        HttpResponse head = transport->head(*url);
        if (head.transportError) {
            AFILE_LOG_DEBUG_CAT(kCategory, "HEAD " + *url + " failed: " + *head.transportError);
        }
        s.exists = !head.transportError && head.ok();
        return FileOpStatus::Complete;
    });
}

RemoteOpenFile::RemoteOpenFile(FileSystem* fs, std::string path, std::string url,
                               std::shared_ptr<IHttpTransport> transport, bool advanceCursorOnRead)
    : _fs(fs)
    , _path(std::move(path))
    , _url(std::move(url))
    , _transport(std::move(transport))
    , _advanceCursorOnRead(advanceCursorOnRead)
    , _slot(Slot::create(0)) {}

FileOperationHandle RemoteOpenFile::busyHandle() const {
    return FileOperationHandle::failed(FileError::HandleBusy,
                                       "Another operation is still in flight on this file", _path);
}

FileOpStatus RemoteOpenFile::fetchRange(IHttpTransport& transport, const std::string& url, const std::string& path,
                                        uint64_t& cursor, size_t size, bool advance,
                                        FileOperationHandle::OpState& s) {
    const uint64_t start = cursor;
    if (size == 0) {
        s.data = FileData();
        return FileOpStatus::Complete;
    }

    std::vector<HttpHeader> headers{HttpHeader{"Range", rangeHeaderValue(start, size)}};
    std::vector<std::byte> accumulated;
    accumulated.reserve(std::min<size_t>(size, 1u << 20));

    // A server that ignores Range answers 200 with the whole resource
    uint64_t skip = 0;
    bool sawFirstChunk = false;

    HttpResponse response = transport.get(url, headers,
        [&](const HttpResponse& head, std::span<const std::byte> chunk) {
            if (!head.ok()) return false;
            if (!sawFirstChunk) {
                sawFirstChunk = true;
                if (head.status == 200) skip = start;
            }
            if (skip > 0) {
                const size_t dropped = static_cast<size_t>(std::min<uint64_t>(skip, chunk.size()));
                chunk = chunk.subspan(dropped);
                skip -= dropped;
            }
            const size_t take = std::min(size - accumulated.size(), chunk.size());
            accumulated.insert(accumulated.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(take));
            return accumulated.size() < size;
        });

    if (response.transportError) {
        s.setError(FileError::NetworkError, "GET " + url + " failed: " + *response.transportError, path);
        return FileOpStatus::Failed;
    }
    if (!response.ok()) {
        AFILE_LOG_ERROR_CAT(kCategory, "GET " + url + " returned HTTP " + std::to_string(response.status));
        s.setError(FileError::HttpStatus, "GET " + url + " returned HTTP " + std::to_string(response.status),
                   path, std::nullopt, response.status);
        return FileOpStatus::Failed;
    }
    if (!response.hasBody) {
        s.setError(FileError::NoBody, "GET " + url + " returned no body (HTTP " + std::to_string(response.status) + ")",
                   path, std::nullopt, response.status);
        return FileOpStatus::Failed;
    }

    const size_t got = accumulated.size();
    s.data = FileData(std::move(accumulated));
    if (advance) {
        cursor = start + got;
    }
    return got < size ? FileOpStatus::Partial : FileOpStatus::Complete;
}

std::optional<uint64_t> RemoteOpenFile::fetchLength(IHttpTransport& transport, const std::string& url,
                                                    const std::string& path, FileOperationHandle::OpState& s) {
    HttpResponse head = transport.head(url);
    if (head.transportError) {
        s.setError(FileError::NetworkError, "HEAD " + url + " failed: " + *head.transportError, path);
        return std::nullopt;
    }
    if (!head.ok()) {
        AFILE_LOG_ERROR_CAT(kCategory, "HEAD " + url + " returned HTTP " + std::to_string(head.status));
        s.setError(FileError::HttpStatus, "HEAD " + url + " returned HTTP " + std::to_string(head.status),
                   path, std::nullopt, head.status);
        return std::nullopt;
    }
    auto raw = head.header("Content-Length");
    if (!raw) {
        s.setError(FileError::InvalidLength, "HEAD " + url + " has no Content-Length header", path,
                   std::nullopt, head.status);
        return std::nullopt;
    }
    auto length = parseContentLength(*raw);
    if (!length) {
        s.setError(FileError::InvalidLength, "HEAD " + url + " has a malformed Content-Length: '" + *raw + "'",
                   path, std::nullopt, head.status);
        return std::nullopt;
    }
    return length;
}

FileOperationHandle RemoteOpenFile::read(size_t size, Priority priority) {
    auto lease = _slot->tryCheckOut();
    if (!lease) return busyHandle();
    auto held = std::make_shared<Slot::Lease>(std::move(*lease));

    return _fs->submit(_path, priority,
        [held, transport = _transport, url = _url, path = _path, advance = _advanceCursorOnRead, size]
        (FileOperationHandle::OpState& s) {
            Slot::Lease cursor = std::move(*held);
            return fetchRange(*transport, url, path, *cursor, size, advance, s);
        });
}

FileOperationHandle RemoteOpenFile::seek(SeekFrom position, Priority) {
    auto lease = _slot->tryCheckOut();
    if (!lease) return busyHandle();

    // Pure bookkeeping; completes without scheduling any work
    uint64_t& cursor = **lease;
    switch (position.origin()) {
        case SeekFrom::Origin::Start:
            cursor = position.startOffset();
            break;
        case SeekFrom::Origin::Current: {
            auto moved = applySeekDelta(cursor, position.delta());
            if (!moved) {
                return FileOperationHandle::failed(FileError::SeekOverflow,
                    "Seek by " + std::to_string(position.delta()) + " from " + std::to_string(cursor) +
                    " leaves the 64-bit offset range", _path);
            }
            cursor = *moved;
            break;
        }
        case SeekFrom::Origin::End:
            return FileOperationHandle::failed(FileError::Unsupported,
                "Seeking from the end is not supported for remote files", _path);
    }

    auto st = FileOperationHandle::makeState();
    st->position = cursor;
    lease->checkIn();
    st->complete(FileOpStatus::Complete);
    return FileOperationHandle(std::move(st));
}

FileOperationHandle RemoteOpenFile::metadata(Priority priority) {
    auto lease = _slot->tryCheckOut();
    if (!lease) return busyHandle();
    auto held = std::make_shared<Slot::Lease>(std::move(*lease));

    return _fs->submit(_path, priority,
        [held, transport = _transport, url = _url, path = _path](FileOperationHandle::OpState& s) {
            Slot::Lease checkedOut = std::move(*held);
            auto length = fetchLength(*transport, url, path, s);
            if (!length) return FileOpStatus::Failed;
            s.metadata = FileMetadata(*length);
            return FileOpStatus::Complete;
        });
}

FileOperationHandle RemoteOpenFile::readAll(Priority priority) {
    auto lease = _slot->tryCheckOut();
    if (!lease) return busyHandle();
    auto held = std::make_shared<Slot::Lease>(std::move(*lease));

    return _fs->submit(_path, priority,
        [held, transport = _transport, url = _url, path = _path, advance = _advanceCursorOnRead]
        (FileOperationHandle::OpState& s) {
            Slot::Lease cursor = std::move(*held);
            auto length = fetchLength(*transport, url, path, s);
            if (!length) return FileOpStatus::Failed;
            s.metadata = FileMetadata(*length);
            if (*length > std::numeric_limits<size_t>::max()) {
                s.setError(FileError::InvalidLength, "Content-Length exceeds addressable memory", path);
                return FileOpStatus::Failed;
            }
            return fetchRange(*transport, url, path, *cursor, static_cast<size_t>(*length), advance, s);
        });
}

} // namespace AsyncFile::Core::IO
