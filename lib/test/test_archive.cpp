#include "BinaryPack.hpp"
#include <gtest/gtest.h>

#include <map>
#include <set>
#include <string>
#include <vector>

using namespace hr;

namespace {

enum class Kind : uint8_t { A = 1, B = 2 };

struct Record {
    uint64_t index{ 0 };
    int32_t delta{ 0 };
    bool flag{ false };
    double score{ 0.0 };
    Kind kind{ Kind::A };
    std::string payload;
    std::vector<std::string> items;
    std::map<std::string, bool> votes;
    std::set<std::string> members;

    template <typename Archive> void serialize(Archive& ar) {
        ar & index & delta & flag & score & kind & payload & items & votes & members;
    }
};

} // namespace

TEST(ArchiveTest, IntegersAreBigEndian) {
    std::string data = utl::binaryPack(uint32_t(0x01020304));
    ASSERT_EQ(data.size(), 4u);
    EXPECT_EQ(data[0], '\x01');
    EXPECT_EQ(data[3], '\x04');
}

TEST(ArchiveTest, StructRestoresEveryField) {
    Record in;
    in.index = 42;
    in.delta = -7;
    in.flag = true;
    in.score = 0.875;
    in.kind = Kind::B;
    in.payload = std::string("bin\0ary", 7);
    in.items = {"x", "y"};
    in.votes = {{"node-A", true}, {"node-B", false}};
    in.members = {"node-A", "node-C"};

    auto out = utl::binaryUnpack<Record>(utl::binaryPack(in));
    ASSERT_TRUE(out.isOk()) << out.error().message;
    EXPECT_EQ(out->index, 42u);
    EXPECT_EQ(out->delta, -7);
    EXPECT_TRUE(out->flag);
    EXPECT_DOUBLE_EQ(out->score, 0.875);
    EXPECT_EQ(out->kind, Kind::B);
    EXPECT_EQ(out->payload.size(), 7u);
    EXPECT_EQ(out->items, in.items);
    EXPECT_EQ(out->votes, in.votes);
    EXPECT_EQ(out->members, in.members);
}

TEST(ArchiveTest, TruncatedInputFails) {
    Record in;
    in.payload = "abcdef";
    std::string data = utl::binaryPack(in);
    auto out = utl::binaryUnpack<Record>(data.substr(0, data.size() - 3));
    ASSERT_TRUE(out.isError());
    EXPECT_EQ(out.error().code, 1);
}

TEST(ArchiveTest, TrailingBytesFail) {
    auto out = utl::binaryUnpack<uint32_t>(utl::binaryPack(uint32_t(5)) + "z");
    ASSERT_TRUE(out.isError());
    EXPECT_EQ(out.error().code, 2);
}

TEST(ArchiveTest, OversizedLengthPrefixFails) {
    std::string data = utl::binaryPack(uint64_t(InputArchive::MAX_LENGTH + 1));
    auto out = utl::binaryUnpack<std::string>(data);
    EXPECT_TRUE(out.isError());
}
