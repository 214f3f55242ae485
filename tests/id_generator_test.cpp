#include <gtest/gtest.h>
#include "flotilla/util/IdGenerator.hpp"
#include <cctype>
#include <set>

using namespace flotilla;

TEST(IdGeneratorTest, FormatIsPrefixDashHex) {
    std::string id = IdGenerator::generate("inst");
    ASSERT_EQ(id.size(), 4u + 1u + IdGenerator::kRandomBytes * 2);
    EXPECT_EQ(id.substr(0, 5), "inst-");
    for (size_t i = 5; i < id.size(); ++i) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(id[i]))) << id;
        EXPECT_FALSE(std::isupper(static_cast<unsigned char>(id[i]))) << id;
    }
}

TEST(IdGeneratorTest, IdsDoNotRepeat) {
    std::set<std::string> seen;
    for (int i = 0; i < 10000; ++i) {
        EXPECT_TRUE(seen.insert(IdGenerator::generate("job")).second);
    }
}

TEST(IdGeneratorTest, EmptyPrefixStillSeparated) {
    std::string id = IdGenerator::generate("");
    EXPECT_EQ(id.front(), '-');
    EXPECT_EQ(id.size(), 1u + IdGenerator::kRandomBytes * 2);
}
