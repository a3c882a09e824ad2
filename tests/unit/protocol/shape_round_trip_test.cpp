#include <gtest/gtest.h>

#include <chrono>
#include <wirebind/protocol/shape.h>

#include "../../common/test_shapes.h"

using namespace wirebind;
using namespace wirebind::tests;

namespace {

TimePoint atMillis(int64_t millis) {
    return TimePoint{std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds{millis})};
}

OperationDescriptor jsonOperation() {
    OperationDescriptor op;
    op.protocol = Protocol::RestJson;
    op.requestUri = "/echo";
    op.method = HttpMethod::Post;
    op.hasPayloadMembers = true;
    return op;
}

// Marshall to a JSON body and read the body back as the same shape
template <typename T> T roundTrip(const T& value) {
    auto request = marshallRequest(&value, jsonOperation());
    EXPECT_TRUE(request) << request.error().message;
    if (!request) {
        return T{};
    }
    JsonTokenStream body(request.value().body());
    auto back = unmarshall<T>(body);
    EXPECT_TRUE(back) << back.error().message;
    return back ? back.value() : T{};
}

} // namespace

TEST(ShapeRoundTripTest, EveryScalarWireType) {
    ScalarSampler s;
    s.text = "caf\xc3\xa9 \"quoted\"";
    s.count = -2147483647;
    s.size = int64_t{9007199254740993};
    s.ratio = 1.0 / 3.0;
    s.enabled = true;
    s.isoTime = atMillis(1577836800123);
    s.epochSeconds = atMillis(-1500);
    s.epochMillis = atMillis(1577836800001);
    s.data = ByteVector{std::byte{0x00}, std::byte{0xff}, std::byte{0x10}, std::byte{0x80}};
    s.limits = std::map<std::string, int32_t>{{"a", 0}, {"b", -1}};

    EXPECT_EQ(roundTrip(s), s);
}

TEST(ShapeRoundTripTest, EmptyValuesSurvive) {
    ScalarSampler s;
    s.text = "";
    s.data = ByteVector{};
    s.limits = std::map<std::string, int32_t>{};

    EXPECT_EQ(roundTrip(s), s);
}

TEST(ShapeRoundTripTest, NestedStructures) {
    DeviceFarmTest test;
    test.arn = "arn:aws:devicefarm:us-west-2:123:test:abc";
    test.name = "login";
    test.created = atMillis(1577836800000);
    test.counters = Counters{};
    test.counters->total = 10;
    test.counters->passed = 9;
    test.counters->failed = 1;

    EXPECT_EQ(roundTrip(test), test);
}

TEST(ShapeRoundTripTest, ListsOfStructures) {
    LinuxParameters params;
    params.capabilities = KernelCapabilities{};
    params.capabilities->add = std::vector<std::string>{"NET_ADMIN", "SYS_TIME"};
    params.capabilities->drop = std::vector<std::string>{};
    Device a;
    a.hostPath = "/dev/fuse";
    a.containerPath = "/dev/fuse";
    a.permissions = std::vector<std::string>{"read", "write", "mknod"};
    Device b;
    b.hostPath = "/dev/null";
    params.devices = std::vector<Device>{a, b};
    params.initProcessEnabled = false;
    params.sharedMemorySize = 64;
    params.swappiness = 0;

    EXPECT_EQ(roundTrip(params), params);
}
