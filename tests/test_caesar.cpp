#include <gtest/gtest.h>
#include "cipher/Caesar/caesar.hpp"
#include "cipher/classic.hpp"
#include "TestHelpers.hpp"
#include <limits>
#include <string>

TEST(Caesar, ShiftsWithinSmallAlphabet)
{
    Alphabet alphabet = Alphabet::fromString("abcdef");

    EXPECT_EQ(caesarCipher("ace", 2, alphabet, CipherMode::Encrypt), "cea");
    EXPECT_EQ(caesarCipher("cea", 2, alphabet, CipherMode::Decrypt), "ace");
}

TEST(Caesar, KeyIsTakenModuloAlphabetSize)
{
    Alphabet alphabet = Alphabet::fromString("abcdef");

    EXPECT_EQ(caesarCipher("ace", 8, alphabet), "cea");
    EXPECT_EQ(caesarCipher("ace", -4, alphabet), "cea");
    EXPECT_EQ(caesarCipher("abc", -1, alphabet), "fab");
    EXPECT_EQ(caesarCipher("abc", 0, alphabet), "abc");
    EXPECT_EQ(caesarCipher("abc", 6, alphabet), "abc");
}

TEST(Caesar, CyrillicKnownAnswer)
{
    Alphabet alphabet = Alphabet::fromString(kRussian);

    EXPECT_EQ(caesarCipher("привет", 3, alphabet), "тулезх");
    EXPECT_EQ(caesarCipher("тулезх", 3, alphabet, CipherMode::Decrypt), "привет");
}

TEST(Caesar, SpacesPassThrough)
{
    Alphabet alphabet = Alphabet::fromString(kRussian);

    const std::string text = "привет мир";
    const std::string encrypted = caesarCipher(text, 5, alphabet);

    EXPECT_EQ(encrypted.find(' '), text.find(' '));
    EXPECT_EQ(caesarCipher(encrypted, 5, alphabet, CipherMode::Decrypt), text);
}

TEST(Caesar, RoundTripForExtremeKeys)
{
    Alphabet alphabet = Alphabet::fromString(kRussian);
    const std::string text = "съешь же ещё этих мягких булок";

    for (long long key : {std::numeric_limits<long long>::min(),
                          std::numeric_limits<long long>::max(),
                          -1000003LL, 33LL, 34LL}) {
        Caesar caesar(key);
        EXPECT_EQ(caesar.decrypt(caesar.encrypt(text, alphabet), alphabet), text) << "key=" << key;
    }
}

TEST(Caesar, EmptyTextGivesEmptyResult)
{
    Alphabet alphabet = Alphabet::fromString("abc");
    EXPECT_EQ(caesarCipher("", 1, alphabet), "");
}

TEST(Caesar, ForeignCharacterIsAlphabetError)
{
    Alphabet alphabet = Alphabet::fromString(kRussian);
    EXPECT_EQ(errorKindOf([&] { caesarCipher("hello", 1, alphabet); }), ErrorKind::Alphabet);
}

TEST(Caesar, ParseKey)
{
    EXPECT_EQ(Caesar::parseKey("3"), 3);
    EXPECT_EQ(Caesar::parseKey(" -12 "), -12);
    EXPECT_EQ(Caesar::parseKey("+7"), 7);
    EXPECT_EQ(Caesar::parseKey("\u00A03"), 3);
    EXPECT_EQ(Caesar::parseKey("\u30004\u2003"), 4);
    EXPECT_FALSE(Caesar::parseKey("\u3000").has_value());
    EXPECT_FALSE(Caesar::parseKey("").has_value());
    EXPECT_FALSE(Caesar::parseKey("3.5").has_value());
    EXPECT_FALSE(Caesar::parseKey("abc").has_value());
    EXPECT_FALSE(Caesar::parseKey("+-1").has_value());
    EXPECT_FALSE(Caesar::parseKey("99999999999999999999999").has_value());
}
