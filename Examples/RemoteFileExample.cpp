#include <string>

#include "AsyncFileCore.h"

using namespace AsyncFile::Core;
using namespace AsyncFile::Core::Concurrency;
using namespace AsyncFile::Core::IO;

// Usage: RemoteFileExample <path> [origin]
// The origin may also come from the AFILE_ORIGIN environment variable.
int main(int argc, char** argv) {
    if (argc < 2) {
        AFILE_LOG_ERROR("usage: RemoteFileExample <path> [origin]");
        return 2;
    }

    WorkService svc({});
    WorkContractGroup group(128, "RemoteFileExample");
    svc.start();
    svc.addWorkContractGroup(&group);

    FileSystem::Config cfg;
    cfg.backend = FileSystem::BackendKind::Remote;
    if (argc > 2) {
        cfg.remote.origin = std::string(argv[2]);
    }
    FileSystem fs(&group, cfg);

    auto exists = fs.exists(argv[1]);
    exists.wait();
    AFILE_LOG_INFO(std::string(argv[1]) + (exists.exists() ? " exists" : " does not exist"));

    auto opened = fs.open(argv[1], Priority::userInitiated());
    opened.wait();
    if (opened.status() != FileOpStatus::Complete) {
        AFILE_LOG_ERROR(std::string("open failed: ") + toString(opened.errorInfo().code) + " " +
                        opened.errorInfo().message);
        svc.stop();
        return 1;
    }
    FileHandle fh = opened.file();

    auto meta = fh.metadata();
    meta.wait();
    if (meta.status() != FileOpStatus::Complete) {
        AFILE_LOG_WARNING("metadata failed: " + meta.errorInfo().message);
    } else {
        AFILE_LOG_INFO("Content-Length: " + std::to_string(meta.metadata()->length()));
    }

    // Each read becomes one ranged GET; seeks only move the cursor
    fh.seek(SeekFrom::start(128)).wait();
    auto chunk = fh.read(256);
    chunk.wait();
    if (chunk.status() == FileOpStatus::Failed) {
        AFILE_LOG_ERROR("read failed: " + chunk.errorInfo().message);
    } else {
        AFILE_LOG_INFO("Read " + std::to_string(chunk.contentsBytes().size()) + " bytes at offset 128" +
                       (chunk.status() == FileOpStatus::Partial ? " (short read)" : ""));
    }

    svc.removeWorkContractGroup(&group);
    svc.stop();
    return 0;
}
