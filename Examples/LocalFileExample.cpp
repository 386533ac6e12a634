#include <string>

#include "AsyncFileCore.h"

using namespace AsyncFile::Core;
using namespace AsyncFile::Core::Concurrency;
using namespace AsyncFile::Core::IO;

int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : "/etc/hostname";

    // Start work service and group
    WorkService svc({});
    WorkContractGroup group(128, "LocalFileExample");
    svc.start();
    svc.addWorkContractGroup(&group);

    FileSystem fs(&group);

    auto opened = fs.open(path);
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
    if (meta.status() == FileOpStatus::Complete) {
        AFILE_LOG_INFO(path + " is " + std::to_string(meta.metadata()->length()) + " bytes");
    }

    // Read the first 64 bytes, then skip ahead and read some more
    auto head = fh.read(64);
    head.wait();
    AFILE_LOG_INFO("First bytes: " + head.contentsText());

    auto skipped = fh.seek(SeekFrom::current(16));
    skipped.wait();
    if (skipped.status() == FileOpStatus::Complete) {
        auto more = fh.read(32);
        more.wait();
        AFILE_LOG_INFO("At " + std::to_string(skipped.position()) + ": " + more.contentsText());
    }

    // One call for the whole file
    auto whole = fs.readAll(path);
    whole.wait();
    AFILE_LOG_INFO("readAll returned " + std::to_string(whole.contentsBytes().size()) + " bytes");

    svc.removeWorkContractGroup(&group);
    svc.stop();
    return 0;
}
