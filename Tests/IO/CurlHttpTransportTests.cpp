#include <gtest/gtest.h>

#include <new>
#include <stdexcept>
#include <string>

#include "IO/CurlHttpTransport.h"
#include "TestHelpers/IOTestHelpers.h"

using namespace AsyncFile::Core::IO;
using afile::test_helpers::makePattern;
using afile::test_helpers::ScopedTempDir;

// file:// URLs keep these transfers on the local machine
namespace {
    std::string fileUrl(const std::string& path) {
        return "file://" + path;
    }
}

TEST(CurlHttpTransport, Get_StreamsBodyToHandler) {
    ScopedTempDir tmp;
    const std::string reference = makePattern(3000);
    auto path = tmp.writeFile("body.bin", reference);

    CurlHttpTransport transport;
    std::string received;
    auto response = transport.get(fileUrl(path), {}, [&](const HttpResponse&, std::span<const std::byte> chunk) {
        received.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
        return true;
    });
    EXPECT_FALSE(response.transportError.has_value()) << *response.transportError;
    EXPECT_EQ(received, reference);
}

TEST(CurlHttpTransport, HandlerStop_IsNotATransportError) {
    ScopedTempDir tmp;
    auto path = tmp.writeFile("stop.bin", makePattern(1 << 16));

    CurlHttpTransport transport;
    int calls = 0;
    auto response = transport.get(fileUrl(path), {}, [&](const HttpResponse&, std::span<const std::byte>) {
        ++calls;
        return false;
    });
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(response.transportError.has_value());
}

TEST(CurlHttpTransport, ThrowingHandler_BecomesTransportError) {
    ScopedTempDir tmp;
    auto path = tmp.writeFile("throw.bin", makePattern(1 << 16));

    CurlHttpTransport transport;
    auto response = transport.get(fileUrl(path), {}, [](const HttpResponse&, std::span<const std::byte>) -> bool {
        throw std::runtime_error("accumulator exhausted");
    });
    ASSERT_TRUE(response.transportError.has_value());
    EXPECT_NE(response.transportError->find("accumulator exhausted"), std::string::npos);

    auto oom = transport.get(fileUrl(path), {}, [](const HttpResponse&, std::span<const std::byte>) -> bool {
        throw std::bad_alloc();
    });
    ASSERT_TRUE(oom.transportError.has_value());
    EXPECT_NE(oom.transportError->find("body handler failed"), std::string::npos);
}
