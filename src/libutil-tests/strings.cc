#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "gcrelay/util/strings.hh"
#include "gcrelay/util/util.hh"
#include "gcrelay/util/error.hh"

namespace gcrelay {

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, empty)
{
    Strings strings;

    ASSERT_EQ(concatStringsSep(",", strings), "");
}

TEST(concatStringsSep, justOne)
{
    Strings strings;
    strings.push_back("this");

    ASSERT_EQ(concatStringsSep(",", strings), "this");
}

TEST(concatStringsSep, emptyStrings)
{
    Strings strings;
    strings.push_back("");
    strings.push_back("");

    ASSERT_EQ(concatStringsSep(",", strings), ",");
}

TEST(concatStringsSep, buildCommaSeparatedString)
{
    Strings strings;
    strings.push_back("this");
    strings.push_back("is");
    strings.push_back("great");

    ASSERT_EQ(concatStringsSep(",", strings), "this,is,great");
}

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, empty)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString<Strings>(""), expected);
}

TEST(tokenizeString, tokenizeSpacesWithDefaults)
{
    auto s = "foo bar baz";
    Strings expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString<Strings>(s), expected);
}

TEST(tokenizeString, tokenizeTabsNewlinesWithDefaults)
{
    auto s = "foo\tbar\n\tbaz  \r\n";
    Strings expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString<Strings>(s), expected);
}

TEST(tokenizeString, tokenizeWithCustomSep)
{
    auto s = "foo\n,bar\n,baz\n";
    Strings expected = {"foo\n", "bar\n", "baz\n"};

    ASSERT_EQ(tokenizeString<Strings>(s, ","), expected);
}

/* ----------------------------------------------------------------------------
 * stripIndentation
 * --------------------------------------------------------------------------*/

TEST(stripIndentation, removesCommonIndent)
{
    ASSERT_EQ(stripIndentation("\n    foo\n      bar\n    baz\n"), "\nfoo\n  bar\nbaz\n");
}

TEST(stripIndentation, appendsFinalNewline)
{
    ASSERT_EQ(stripIndentation("description"), "description\n");
}

/* ----------------------------------------------------------------------------
 * hasPrefix
 * --------------------------------------------------------------------------*/

TEST(hasPrefix, emptyStringHasNoPrefix)
{
    ASSERT_FALSE(hasPrefix("", "foo"));
}

TEST(hasPrefix, emptyStringIsAlwaysPrefix)
{
    ASSERT_TRUE(hasPrefix("foo", ""));
    ASSERT_TRUE(hasPrefix("jshjkfhsadf", ""));
}

TEST(hasPrefix, trivialCase)
{
    ASSERT_TRUE(hasPrefix("foobar", "foo"));
}

/* ----------------------------------------------------------------------------
 * string2Int / string2IntWithUnitPrefix
 * --------------------------------------------------------------------------*/

TEST(string2Int, validNumbers)
{
    ASSERT_EQ(string2Int<int>("-42"), -42);
    ASSERT_EQ(string2Int<unsigned int>("25565"), 25565u);
}

TEST(string2Int, invalidNumbers)
{
    ASSERT_EQ(string2Int<int>("42x"), std::nullopt);
    ASSERT_EQ(string2Int<unsigned int>("-1"), std::nullopt);
    ASSERT_EQ(string2Int<uint8_t>("256"), std::nullopt);
}

TEST(string2IntWithUnitPrefix, binaryUnits)
{
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("4K"), 4096u);
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("1M"), 1u << 20);
}

TEST(string2IntWithUnitPrefix, invalidUnit)
{
    ASSERT_THROW(string2IntWithUnitPrefix<uint64_t>("1X"), UsageError);
}

/* ----------------------------------------------------------------------------
 * readLittleEndian / writeLittleEndian
 * --------------------------------------------------------------------------*/

TEST(readLittleEndian, knownBytes)
{
    unsigned char buf[4] = {0x04, 0x03, 0x02, 0x01};
    ASSERT_EQ(readLittleEndian<uint32_t>(buf), 0x01020304u);
}

#ifndef COVERAGE

RC_GTEST_PROP(writeLittleEndian, prop_inverse_of_read, (uint32_t n))
{
    unsigned char buf[4];
    writeLittleEndian<uint32_t>(n, buf);
    RC_ASSERT(readLittleEndian<uint32_t>(buf) == n);
}

#endif

} // namespace gcrelay
