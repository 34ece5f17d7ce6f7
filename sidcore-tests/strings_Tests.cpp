#include "stdafx.h"

using sidcore::native_string;
using sidcore::NativeChar;
using sidcore::NativeToUtf8;
using sidcore::Utf8ToNative;

TEST(StringsTest, With_Ascii_Conversion_Round_Trips)
{
    native_string native = Utf8ToNative("S-1-5-18");
    ASSERT_EQ(native.size(), 8u);
    EXPECT_EQ(native[0], static_cast<NativeChar>('S'));
    EXPECT_EQ(NativeToUtf8(native.c_str()), "S-1-5-18");
}

TEST(StringsTest, With_TwoByteSequence_Conversion_Round_Trips)
{
    // "José"
    native_string native = Utf8ToNative("Jos\xC3\xA9");
    ASSERT_EQ(native.size(), 4u);
    EXPECT_EQ(native[3], static_cast<NativeChar>(0x00E9));
    EXPECT_EQ(NativeToUtf8(native.c_str()), "Jos\xC3\xA9");
}

TEST(StringsTest, With_SupplementaryCharacter_Conversion_Uses_Surrogates)
{
    // U+1F600
    native_string native = Utf8ToNative("\xF0\x9F\x98\x80");
    ASSERT_EQ(native.size(), 2u);
    EXPECT_EQ(native[0], static_cast<NativeChar>(0xD83D));
    EXPECT_EQ(native[1], static_cast<NativeChar>(0xDE00));
    EXPECT_EQ(NativeToUtf8(native.c_str()), "\xF0\x9F\x98\x80");
}

TEST(StringsTest, With_UnpairedSurrogate_Decode_Uses_Replacement_Character)
{
    NativeChar units[] = {static_cast<NativeChar>('a'), static_cast<NativeChar>(0xD800), static_cast<NativeChar>('b'), 0};
    EXPECT_EQ(NativeToUtf8(units), "a\xEF\xBF\xBD" "b");
}

TEST(StringsTest, With_MalformedUtf8_Encode_Uses_Replacement_Character)
{
    native_string native = Utf8ToNative("a\xFF" "b\xC3");
    ASSERT_EQ(native.size(), 4u);
    EXPECT_EQ(native[1], static_cast<NativeChar>(0xFFFD));
    EXPECT_EQ(native[2], static_cast<NativeChar>('b'));
    EXPECT_EQ(native[3], static_cast<NativeChar>(0xFFFD));
}

TEST(StringsTest, With_MaxLength_Decode_Stops_Early)
{
    native_string native = Utf8ToNative("NT AUTHORITY");
    EXPECT_EQ(NativeToUtf8(native.c_str(), 2), "NT");
}

TEST(StringsTest, With_Null_Decode_Returns_Empty)
{
    EXPECT_EQ(NativeToUtf8(nullptr), "");
}

TEST(StringsTest, With_EmptyString_Conversion_Returns_Empty)
{
    EXPECT_TRUE(Utf8ToNative("").empty());
    NativeChar empty[] = {0};
    EXPECT_EQ(NativeToUtf8(empty), "");
    EXPECT_EQ(NativeToUtf8(Utf8ToNative("abc").c_str(), 0), "");
}
