#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "IO/FileSystem.h"
#include "IO/LocalFileBackend.h"
#include "TestHelpers/IOTestHelpers.h"

using namespace AsyncFile::Core;
using namespace AsyncFile::Core::IO;
using afile::test_helpers::makePattern;
using afile::test_helpers::remoteConfig;
using afile::test_helpers::ScopedTempDir;
using afile::test_helpers::ScopedWorkEnv;
using afile::test_helpers::ScriptedHttpTransport;
using afile::test_helpers::ScriptedResource;

TEST(FileSystem, DefaultConfig_SelectsLocalBackend) {
    ScopedWorkEnv env;
    EXPECT_EQ(env.fs().backend()->getBackendType(), "Local");
    EXPECT_EQ(env.fs().group(), &env.group());
}

TEST(FileSystem, RemoteConfig_SelectsRemoteBackend) {
    auto transport = std::make_shared<ScriptedHttpTransport>();
    ScopedWorkEnv env(true, remoteConfig(transport));
    EXPECT_EQ(env.fs().backend()->getBackendType(), "Remote");
    EXPECT_TRUE(env.fs().backend()->getCapabilities().isRemote);
}

TEST(FileSystem, CustomBackend_IsUsedAsGiven) {
    auto backend = std::make_shared<LocalFileBackend>();
    ScopedWorkEnv env(true, backend);
    EXPECT_EQ(env.fs().backend(), backend);

    ScopedTempDir tmp;
    auto op = env.fs().readAll(tmp.writeFile("custom.txt", "custom backend"));
    op.wait();
    EXPECT_EQ(op.contentsText(), "custom backend");
}

TEST(FileSystem, ReadAllByPath_Local) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    const std::string reference = makePattern(5000);
    auto op = env.fs().readAll(tmp.writeFile("whole.bin", reference));
    op.wait();
    ASSERT_EQ(op.status(), FileOpStatus::Complete) << op.errorInfo().message;
    EXPECT_EQ(op.contentsText(), reference);
}

TEST(FileSystem, ReadAllByPath_MissingFileReportsOpenError) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("nope.txt").string();
    auto op = env.fs().readAll(path);
    op.wait();
    ASSERT_EQ(op.status(), FileOpStatus::Failed);
    EXPECT_EQ(op.errorInfo().code, FileError::FileNotFound);
    EXPECT_EQ(op.errorInfo().path, path);
}

TEST(FileSystem, ReadAllByPath_WorksWithoutService) {
    ScopedWorkEnv env(false);
    ScopedTempDir tmp;
    auto op = env.fs().readAll(tmp.writeFile("pumped.txt", "pumped by wait"));
    op.wait();
    EXPECT_EQ(op.contentsText(), "pumped by wait");
}

TEST(FileSystem, ReadAllByPath_Remote) {
    auto transport = std::make_shared<ScriptedHttpTransport>();
    ScriptedResource r;
    r.body = "remote whole file";
    transport->serve("http://assets.test/docs/readme.txt", r);
    ScopedWorkEnv env(true, remoteConfig(transport));

    auto op = env.fs().readAll("docs/readme.txt");
    op.wait();
    ASSERT_EQ(op.status(), FileOpStatus::Complete) << op.errorInfo().message;
    EXPECT_EQ(op.contentsText(), "remote whole file");
}

TEST(FileSystem, ReadAllByPath_NeedsOnlyOneContractSlot) {
    Concurrency::WorkContractGroup group(1, "SingleSlotGroup");
    FileSystem fs(&group);
    ScopedTempDir tmp;
    auto path = tmp.writeFile("single.txt", "hello");

    auto op = fs.readAll(path);
    op.wait();
    ASSERT_EQ(op.status(), FileOpStatus::Complete) << op.errorInfo().message;
    EXPECT_EQ(op.contentsText(), "hello");
    ASSERT_TRUE(op.metadata().has_value());
    EXPECT_EQ(op.metadata()->length(), 5u);

    // Matches open followed by a handle readAll on the same group
    auto opened = fs.open(path);
    opened.wait();
    ASSERT_EQ(opened.status(), FileOpStatus::Complete);
    auto viaHandle = opened.file().readAll();
    viaHandle.wait();
    EXPECT_EQ(viaHandle.contentsText(), op.contentsText());
}

TEST(FileSystem, ReadAllByPath_RemoteNeedsOnlyOneContractSlot) {
    auto transport = std::make_shared<ScriptedHttpTransport>();
    ScriptedResource r;
    r.body = "one slot remote";
    transport->serve("http://assets.test/single.txt", r);

    Concurrency::WorkContractGroup group(1, "SingleSlotRemoteGroup");
    FileSystem fs(&group, remoteConfig(transport));
    auto op = fs.readAll("single.txt");
    op.wait();
    ASSERT_EQ(op.status(), FileOpStatus::Complete) << op.errorInfo().message;
    EXPECT_EQ(op.contentsText(), "one slot remote");
}

TEST(FileSystem, ReadAllByPath_FillsGroupWithoutFailing) {
    const int N = 4;
    Concurrency::WorkContractGroup group(N, "ExactFitGroup");
    FileSystem fs(&group);
    ScopedTempDir tmp;

    std::vector<std::string> contents;
    std::vector<FileOperationHandle> ops;
    for (int i = 0; i < N; ++i) {
        contents.push_back(makePattern(200 + i, static_cast<uint32_t>(i)));
        ops.push_back(fs.readAll(tmp.writeFile("fit" + std::to_string(i) + ".bin", contents.back())));
    }
    for (int i = 0; i < N; ++i) {
        ops[i].wait();
        ASSERT_EQ(ops[i].status(), FileOpStatus::Complete) << ops[i].errorInfo().message;
        EXPECT_EQ(ops[i].contentsText(), contents[i]);
    }
}

TEST(FileSystem, ManyFilesReadConcurrently) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;

    const int N = 32;
    std::vector<std::string> contents;
    std::vector<FileOperationHandle> ops;
    for (int i = 0; i < N; ++i) {
        contents.push_back(makePattern(1000 + i * 13, static_cast<uint32_t>(i)));
        auto path = tmp.writeFile("f" + std::to_string(i) + ".bin", contents.back());
        ops.push_back(env.fs().readAll(path, Concurrency::Priority::background()));
    }
    for (int i = 0; i < N; ++i) {
        ops[i].wait();
        ASSERT_EQ(ops[i].status(), FileOpStatus::Complete) << ops[i].errorInfo().message;
        EXPECT_EQ(ops[i].contentsText(), contents[i]);
    }
}

TEST(FileSystem, PriorityOrdersPendingOperations) {
    ScopedWorkEnv env(false);
    std::vector<std::string> order;
    auto record = [&order](std::string tag) {
        return [&order, tag](auto&) {
            order.push_back(tag);
            return FileOpStatus::Complete;
        };
    };

    auto low = env.fs().submit("low", Concurrency::Priority::background(), record("low"));
    auto high = env.fs().submit("high", Concurrency::Priority::userInitiated(), record("high"));
    env.group().executeAllBackgroundWork();

    EXPECT_EQ(order, (std::vector<std::string>{"high", "low"}));
    EXPECT_EQ(low.status(), FileOpStatus::Complete);
    EXPECT_EQ(high.status(), FileOpStatus::Complete);
}
