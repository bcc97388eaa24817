#include <gtest/gtest.h>
#include "core/alphabet.hpp"
#include "TestHelpers.hpp"
#include <string>

TEST(AlphabetLoad, ReadsFileAndPreservesOrder)
{
    TempAlphabetFile file(kRussian);
    Alphabet alphabet = Alphabet::fromFile(file.path());

    EXPECT_EQ(alphabet.str(), kRussian);
    EXPECT_EQ(alphabet.size(), 33u);
    EXPECT_EQ(alphabet.symbols().front(), U'а');
    EXPECT_EQ(alphabet.indexOf(U'а'), 0u);
    EXPECT_EQ(alphabet.indexOf(U'ё'), 6u);
    EXPECT_EQ(alphabet.indexOf(U'я'), 32u);
}

TEST(AlphabetLoad, StripsSurroundingWhitespaceAndNewline)
{
    TempAlphabetFile file("  abcdef\r\n\n");
    Alphabet alphabet = Alphabet::fromFile(file.path());
    EXPECT_EQ(alphabet.str(), "abcdef");
}

TEST(AlphabetLoad, DropsByteOrderMark)
{
    TempAlphabetFile file("\xEF\xBB\xBF" "abc\n");
    EXPECT_EQ(Alphabet::fromFile(file.path()).str(), "abc");
}

TEST(AlphabetLoad, MissingFileIsNotFound)
{
    auto kind = errorKindOf([] { Alphabet::fromFile("nonexistent_alphabet_file.txt"); });
    ASSERT_TRUE(kind.has_value());
    EXPECT_EQ(*kind, ErrorKind::NotFound);
}

TEST(AlphabetLoad, EmptyFileIsAlphabetError)
{
    TempAlphabetFile empty("");
    TempAlphabetFile blank(" \n\t\n");

    EXPECT_EQ(errorKindOf([&] { Alphabet::fromFile(empty.path()); }), ErrorKind::Alphabet);
    EXPECT_EQ(errorKindOf([&] { Alphabet::fromFile(blank.path()); }), ErrorKind::Alphabet);
}

TEST(AlphabetLoad, DuplicateCharactersAreAlphabetError)
{
    TempAlphabetFile file("aab");
    try {
        Alphabet::fromFile(file.path());
        FAIL() << "expected CipherError";
    }
    catch (const CipherError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Alphabet);
        ASSERT_TRUE(e.symbol().has_value());
        EXPECT_EQ(*e.symbol(), U'a');
        EXPECT_NE(std::string(e.what()).find("duplicate"), std::string::npos);
    }
}

TEST(AlphabetLoad, InvalidUtf8IsAlphabetError)
{
    TempAlphabetFile file("ab\xFF");
    EXPECT_EQ(errorKindOf([&] { Alphabet::fromFile(file.path()); }), ErrorKind::Alphabet);
}

TEST(Alphabet, LookupAndReverse)
{
    Alphabet alphabet = Alphabet::fromString("abcdef");

    EXPECT_TRUE(alphabet.contains(U'c'));
    EXPECT_FALSE(alphabet.contains(U'z'));
    EXPECT_FALSE(alphabet.contains(U' '));
    EXPECT_EQ(alphabet.at(4), U'e');
    EXPECT_EQ(alphabet.reversed().str(), "fedcba");
    EXPECT_EQ(alphabet.symbols(), U"abcdef");
    EXPECT_EQ(alphabet.reversed().symbols(), U"fedcba");
    EXPECT_EQ(errorKindOf([&] { alphabet.indexOf(U'z'); }), ErrorKind::Alphabet);
}

TEST(ValidateText, RejectsFirstForeignCharacter)
{
    Alphabet alphabet = Alphabet::fromString("abc");
    try {
        validateText(std::string("xyz"), alphabet);
        FAIL() << "expected CipherError";
    }
    catch (const CipherError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Alphabet);
        ASSERT_TRUE(e.symbol().has_value());
        EXPECT_EQ(*e.symbol(), U'x');
        EXPECT_NE(std::string(e.what()).find("'x'"), std::string::npos);
    }
}

TEST(ValidateText, SpacesAreExempt)
{
    Alphabet alphabet = Alphabet::fromString("abc");
    EXPECT_NO_THROW(validateText(std::string("a b c"), alphabet));
    EXPECT_NO_THROW(validateText(std::string("   "), alphabet));
    EXPECT_NO_THROW(validateText(std::string(""), alphabet));
}

TEST(ValidateText, OtherWhitespaceIsNotExempt)
{
    Alphabet alphabet = Alphabet::fromString("abc");
    EXPECT_EQ(errorKindOf([&] { validateText(std::string("a\tb"), alphabet); }), ErrorKind::Alphabet);
}

TEST(ValidateText, WorksOnCyrillic)
{
    Alphabet alphabet = Alphabet::fromString(kRussian);
    EXPECT_NO_THROW(validateText(std::string("привет мир"), alphabet));
    EXPECT_EQ(errorKindOf([&] { validateText(std::string("hello"), alphabet); }), ErrorKind::Alphabet);
}
