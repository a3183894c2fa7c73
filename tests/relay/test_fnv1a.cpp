#include <gtest/gtest.h>
#include <relay/util/fnv1a.hpp>

using namespace relay;

TEST(FNV1aTest, KnownVectors) {
    EXPECT_EQ(FNV1a::compute(""), 0xcbf29ce484222325ULL);
    EXPECT_EQ(FNV1a::compute("a"), 0xaf63dc4c8601ec8cULL);
    EXPECT_EQ(FNV1a::compute("foobar"), 0x85944171f73967e8ULL);
}

TEST(FNV1aTest, EmptyInputIsOffsetBasis) {
    EXPECT_EQ(FNV1a::compute(std::string()), FNV1a::OFFSET_BASIS);
}

TEST(FNV1aTest, IncrementalMatchesOneShot) {
    uint64_t h = FNV1a::OFFSET_BASIS;
    h = FNV1a::update(h, std::string("foo"));
    h = FNV1a::update(h, std::string("bar"));
    EXPECT_EQ(h, FNV1a::compute("foobar"));
}

TEST(FNV1aTest, OverloadsAgree) {
    std::string s = "relay";
    EXPECT_EQ(FNV1a::compute(s), FNV1a::compute(s.data(), s.size()));
    EXPECT_EQ(FNV1a::compute(s),
              FNV1a::compute(reinterpret_cast<const uint8_t*>(s.data()), s.size()));
}
