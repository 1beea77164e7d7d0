#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "RouteNameCanonicalizer.hpp"

namespace
{
std::string canon(std::string const& s)
{
    return RouteNameCanonicalizer::canonicalize(s);
}
}

TEST(RouteNameCanonicalizer, EmptyStaysEmpty)
{
    EXPECT_EQ(canon(""), "");
    EXPECT_EQ(canon("   "), "");
}

TEST(RouteNameCanonicalizer, IgnoresCaseAndWhitespace)
{
    EXPECT_EQ(canon("  a1 "), canon("A1"));
    EXPECT_EQ(canon("611 A"), "611A");
    EXPECT_EQ(canon("\xC2\xA0" "30\t"), "30");
}

TEST(RouteNameCanonicalizer, TransliteratesGreek)
{
    EXPECT_EQ(canon("\xCE\x91" "1"), "A1");                          // Α1
    EXPECT_EQ(canon("\xCE\xB1" "1"), "A1");                          // α1
    EXPECT_EQ(canon("\xCE\x98\xCE\xA8"), "THPS");                    // ΘΨ
    EXPECT_EQ(canon("\xCF\x82"), "S");                               // ς
    EXPECT_EQ(canon("\xCE\x9E\xCE\xA7"), "XX");                      // ΞΧ
    EXPECT_EQ(canon("\xCE\xA1"), "P");                               // Ρ
}

TEST(RouteNameCanonicalizer, GreekAndLatinSpellingsMatch)
{
    EXPECT_EQ(canon("\xCE\x9B\xCE\x95\xCE\xA6 1"), canon("lef1"));   // ΛΕΦ 1
}

TEST(RouteNameCanonicalizer, AccentedGreekKeepsAccent)
{
    EXPECT_EQ(canon("\xCE\xAC"), "\xCE\x86");                        // ά -> Ά
}

TEST(RouteNameCanonicalizer, InvalidBytesBecomeReplacementCharacter)
{
    EXPECT_EQ(canon("A\xFF"), "A\xEF\xBF\xBD");
    EXPECT_EQ(canon("\xCE \x91"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(RouteNameCanonicalizer, Idempotent)
{
    std::vector<std::string> samples = {
        "", " 611 ", "\xCE\x91" "1", "\xCE\xB8\xCE\xB5\xCF\x83\xCE\xB7",
        "a\xC2\xA0" "b", "\xCE \x91", "\xFF\xFE", "Caf\xC3\xA9", "\xCE\xAC\xCF\x82"
    };
    for (std::string const& s : samples)
    {
        std::string once = canon(s);
        EXPECT_EQ(canon(once), once) << "input: " << s;
    }
}
