#include <regex>

#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "gcrelay/store/store-dir-config.hh"
#include "gcrelay/util/hash.hh"

#include "gcrelay/store/tests/path.hh"

namespace gcrelay {

#define STORE_DIR "/nix/store/"
#define HASH_PART "g1w7hy3qg1w7hy3qg1w7hy3qg1w7hy3q"

class StorePathTest : public ::testing::Test
{
protected:
    StoreDirConfig store{"/nix/store"};
};

static std::regex nameRegex{R"((?!\.\.?(-|$))[0-9a-zA-Z\+\-\._\?=]+)"};

#define TEST_DONT_PARSE(NAME, STR)                                          \
    TEST_F(StorePathTest, bad_##NAME)                                       \
    {                                                                       \
        std::string_view str = STORE_DIR HASH_PART "-" STR;                 \
        /* ASSERT_THROW generates a duplicate goto label */                 \
        /* A lambda isolates those labels. */                               \
        [&]() { ASSERT_THROW(store.parseStorePath(str), BadStorePath); }(); \
        std::string name{STR};                                              \
        [&]() { ASSERT_THROW(checkName(name), BadStorePathName); }();       \
        EXPECT_FALSE(std::regex_match(name, nameRegex));                    \
    }

TEST_DONT_PARSE(empty, "")
TEST_DONT_PARSE(garbage, "&*()")
TEST_DONT_PARSE(double_star, "**")
TEST_DONT_PARSE(star_first, "*,foo")
TEST_DONT_PARSE(star_second, "foo,*")
TEST_DONT_PARSE(bang, "foo!o")
TEST_DONT_PARSE(dot, ".")
TEST_DONT_PARSE(dot_dot, "..")
TEST_DONT_PARSE(dot_dot_dash, "..-1")
TEST_DONT_PARSE(dot_dash, ".-1")
TEST_DONT_PARSE(dot_dot_dash_a, "..-a")
TEST_DONT_PARSE(dot_dash_a, ".-a")
TEST_DONT_PARSE(space, "foo bar")
TEST_DONT_PARSE(newline, "foo\nbar")

#undef TEST_DONT_PARSE

#define TEST_DO_PARSE(NAME, STR)                            \
    TEST_F(StorePathTest, good_##NAME)                      \
    {                                                       \
        std::string_view str = STORE_DIR HASH_PART "-" STR; \
        auto p = store.parseStorePath(str);                 \
        std::string name{p.name()};                         \
        EXPECT_EQ(p.name(), STR);                           \
        EXPECT_EQ(p.hashPart(), HASH_PART);                 \
        EXPECT_TRUE(std::regex_match(name, nameRegex));     \
    }

// 0-9 a-z A-Z + - . _ ? =

TEST_DO_PARSE(numbers, "02345")
TEST_DO_PARSE(lower_case, "foo")
TEST_DO_PARSE(upper_case, "FOO")
TEST_DO_PARSE(plus, "foo+bar")
TEST_DO_PARSE(dash, "foo-dev")
TEST_DO_PARSE(underscore, "foo_bar")
TEST_DO_PARSE(period, "foo.txt")
TEST_DO_PARSE(question_mark, "foo?why")
TEST_DO_PARSE(equals_sign, "foo=foo")
TEST_DO_PARSE(dotfile, ".gitignore")
TEST_DO_PARSE(triple_dot_a, "...a")
TEST_DO_PARSE(triple_dot_1, "...1")
TEST_DO_PARSE(triple_dot_dash, "...-")
TEST_DO_PARSE(triple_dot, "...")

#undef TEST_DO_PARSE

/* ----------------------------------------------------------------------------
 * Hash part and location
 * --------------------------------------------------------------------------*/

TEST_F(StorePathTest, bad_hash_character)
{
    // 'e' is not in the Nix32 alphabet.
    ASSERT_THROW(store.parseStorePath(STORE_DIR "g1w7hy3qg1w7hy3qg1w7hy3qg1w7hy3e-foo"), BadStorePath);
}

TEST_F(StorePathTest, bad_hash_length)
{
    ASSERT_THROW(store.parseStorePath(STORE_DIR "g1w7hy3q-foo"), BadStorePath);
}

TEST_F(StorePathTest, bad_missing_dash)
{
    ASSERT_THROW(store.parseStorePath(STORE_DIR HASH_PART "_foo"), BadStorePath);
}

TEST_F(StorePathTest, bad_name_too_long)
{
    auto name = std::string(StorePath::MaxPathLen + 1, 'a');
    ASSERT_THROW(store.parseStorePath(STORE_DIR HASH_PART "-" + name), BadStorePath);
    ASSERT_NO_THROW(store.parseStorePath(STORE_DIR HASH_PART "-" + name.substr(1)));
}

TEST_F(StorePathTest, bad_outside_store)
{
    ASSERT_THROW(store.parseStorePath("/tmp/" HASH_PART "-foo"), BadStorePath);
    ASSERT_THROW(store.parseStorePath("/nix/store2/" HASH_PART "-foo"), BadStorePath);
}

TEST_F(StorePathTest, bad_relative)
{
    ASSERT_THROW(store.parseStorePath("nix/store/" HASH_PART "-foo"), BadStorePath);
}

TEST_F(StorePathTest, bad_nested)
{
    ASSERT_THROW(store.parseStorePath(STORE_DIR HASH_PART "-foo/bin/foo"), BadStorePath);
}

TEST_F(StorePathTest, bad_store_dir_itself)
{
    ASSERT_THROW(store.parseStorePath("/nix/store"), BadStorePath);
    ASSERT_THROW(store.parseStorePath(STORE_DIR HASH_PART "-foo/.."), BadStorePath);
}

TEST_F(StorePathTest, bad_nul)
{
    using namespace std::string_literals;
    ASSERT_THROW(store.parseStorePath(STORE_DIR HASH_PART "-foo\0bar"s), BadStorePath);
}

TEST_F(StorePathTest, good_is_canonicalised)
{
    auto p = store.parseStorePath("/nix//store/./" HASH_PART "-foo/");
    EXPECT_EQ(store.printStorePath(p), STORE_DIR HASH_PART "-foo");
}

TEST_F(StorePathTest, maybeParse)
{
    EXPECT_FALSE(store.maybeParseStorePath("/tmp/foo"));
    auto p = store.maybeParseStorePath(STORE_DIR HASH_PART "-foo");
    ASSERT_TRUE(p);
    EXPECT_EQ(p->to_string(), HASH_PART "-foo");
    EXPECT_FALSE(store.maybeParseStorePath(STORE_DIR HASH_PART "-foo/bin"));
}

TEST_F(StorePathTest, fromHash)
{
    StorePath p(hashString(HashAlgorithm::SHA1, "abc"), "foo");
    EXPECT_EQ(p.to_string(), "kpcd173cq987hw957sx6m0868wv3x6d9-foo");
}

#ifndef COVERAGE

RC_GTEST_FIXTURE_PROP(StorePathTest, prop_regex_accept, (const StorePath & p))
{
    RC_ASSERT(std::regex_match(std::string{p.name()}, nameRegex));
}

RC_GTEST_FIXTURE_PROP(StorePathTest, prop_round_rip, (const StorePath & p))
{
    RC_ASSERT(p == store.parseStorePath(store.printStorePath(p)));
}

RC_GTEST_FIXTURE_PROP(StorePathTest, prop_check_regex_eq_parse, ())
{
    static auto nameFuzzer = rc::gen::container<std::string>(rc::gen::oneOf(
        // alphanum, repeated to weigh heavier
        rc::gen::oneOf(rc::gen::inRange('0', '9'), rc::gen::inRange('a', 'z'), rc::gen::inRange('A', 'Z')),
        // valid symbols
        rc::gen::oneOf(
            rc::gen::just('+'),
            rc::gen::just('-'),
            rc::gen::just('.'),
            rc::gen::just('_'),
            rc::gen::just('?'),
            rc::gen::just('=')),
        // symbols for scary .- and ..- cases, repeated for weight
        rc::gen::just('.'),
        rc::gen::just('.'),
        rc::gen::just('.'),
        rc::gen::just('.'),
        rc::gen::just('-'),
        rc::gen::just('-'),
        // ascii symbol ranges, without '/'
        rc::gen::oneOf(
            rc::gen::inRange(' ', '/'),
            rc::gen::inRange(':', '@'),
            rc::gen::inRange('[', '`'),
            rc::gen::inRange('{', '~')),
        // typical whitespace
        rc::gen::oneOf(rc::gen::just(' '), rc::gen::just('\t'), rc::gen::just('\n'), rc::gen::just('\r')),
        // some chance of control codes
        rc::gen::inRange('\x01', ' ')));

    auto name = *nameFuzzer;

    std::string path = store.storeDir + "/575s52sh487i0ylmbs9pvi606ljdszr0-" + name;
    bool parsed = false;
    try {
        store.parseStorePath(path);
        parsed = true;
    } catch (const BadStorePath &) {
    }
    RC_ASSERT(parsed == std::regex_match(std::string{name}, nameRegex));
}

#endif

} // namespace gcrelay
