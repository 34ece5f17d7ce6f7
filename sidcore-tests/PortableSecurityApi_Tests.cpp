#include "stdafx.h"
#include "PortableSecurityApi.h"

using sidcore::DWORD;
using sidcore::native_string;
using sidcore::NativeChar;
using sidcore::PortableSecurityApi;
namespace errors = sidcore::errors;

class PortableSecurityApiTest : public testing::Test
{
  protected:
    PortableSecurityApi api;

    /// Parses \p str, returning the raw bytes or the error code.
    DWORD Parse(std::string const &str, std::vector<std::uint8_t> &bytes)
    {
        native_string native = sidcore::Utf8ToNative(str);
        sidcore::PSID psid = nullptr;
        DWORD err = api.FromStringSid(native.c_str(), &psid);
        if (err != errors::kSuccess)
        {
            return err;
        }
        auto owned = sidcore::make_local<void>(psid, api);
        auto const *begin = static_cast<std::uint8_t const *>(psid);
        bytes.assign(begin, begin + api.Length(psid));
        return err;
    }

    std::string Format(std::vector<std::uint8_t> &bytes)
    {
        NativeChar *stringSid = nullptr;
        EXPECT_EQ(api.ToStringSid(bytes.data(), &stringSid), errors::kSuccess);
        auto owned = sidcore::make_local(stringSid, api);
        return sidcore::NativeToUtf8(owned.get());
    }
};

TEST_F(PortableSecurityApiTest, With_DomainSid_Parse_Correctly)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("S-1-5-21-1-2-3-1013", bytes), errors::kSuccess);
    std::vector<std::uint8_t> expected = {1, 5, 0, 0, 0, 0, 0, 5, 21, 0, 0, 0, 1, 0, 0, 0,
                                          2, 0, 0, 0, 3, 0, 0, 0, 0xF5, 0x03, 0, 0};
    EXPECT_EQ(bytes, expected);
}

TEST_F(PortableSecurityApiTest, With_NoSubAuthority_Parse_Correctly)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("S-1-5", bytes), errors::kSuccess);
    EXPECT_EQ(bytes, (std::vector<std::uint8_t>{1, 0, 0, 0, 0, 0, 0, 5}));
    EXPECT_EQ(Format(bytes), "S-1-5");
}

TEST_F(PortableSecurityApiTest, With_LowercasePrefix_Parse_Correctly)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("s-1-5-18", bytes), errors::kSuccess);
    EXPECT_EQ(Format(bytes), "S-1-5-18");
}

TEST_F(PortableSecurityApiTest, With_SddlAlias_Parse_Correctly)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("SY", bytes), errors::kSuccess);
    EXPECT_EQ(Format(bytes), "S-1-5-18");
    ASSERT_EQ(Parse("BA", bytes), errors::kSuccess);
    EXPECT_EQ(Format(bytes), "S-1-5-32-544");
    ASSERT_EQ(Parse("WD", bytes), errors::kSuccess);
    EXPECT_EQ(Format(bytes), "S-1-1-0");
}

TEST_F(PortableSecurityApiTest, With_LargeAuthority_Format_As_Hex)
{
    std::vector<std::uint8_t> bytes = {1, 0, 0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC};
    EXPECT_EQ(Format(bytes), "S-1-0x123456789ABC");

    std::vector<std::uint8_t> parsed;
    ASSERT_EQ(Parse("S-1-0x123456789abc", parsed), errors::kSuccess);
    EXPECT_EQ(parsed, bytes);
}

TEST_F(PortableSecurityApiTest, With_HexAuthorityThatFits32Bits_Format_As_Decimal)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("S-1-0x10-0x3000", bytes), errors::kSuccess);
    EXPECT_EQ(Format(bytes), "S-1-16-12288");
}

TEST_F(PortableSecurityApiTest, With_MaximumValues_Parse_Correctly)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("S-1-5-4294967295", bytes), errors::kSuccess);
    EXPECT_EQ(Format(bytes), "S-1-5-4294967295");

    std::string fifteen = "S-1-5";
    for (int i = 1; i <= 15; ++i)
    {
        fifteen += "-" + std::to_string(i);
    }
    ASSERT_EQ(Parse(fifteen, bytes), errors::kSuccess);
    EXPECT_EQ(bytes.size(), 8u + 4 * 15);
    EXPECT_EQ(Format(bytes), fifteen);
}

TEST_F(PortableSecurityApiTest, With_MalformedStrings_Parse_Fails)
{
    std::string sixteen = "S-1-5";
    for (int i = 1; i <= 16; ++i)
    {
        sixteen += "-" + std::to_string(i);
    }

    std::vector<std::string> samples = {
        "",
        "S",
        "S-",
        "S-1",
        "S-1-",
        "S-1-5-",
        "S-1-5--18",
        "S-1-5-18x",
        "S-1-5-18 ",
        " S-1-5-18",
        "S-2-5-18",
        "S-1-5-4294967296",
        "S-1-281474976710656",
        "S-1-0x1000000000000",
        "S-1-0x",
        "S-1--5",
        "X-1-5-18",
        "sy",
        "not-a-sid",
        sixteen,
    };

    for (auto const &sample : samples)
    {
        std::vector<std::uint8_t> bytes;
        EXPECT_EQ(Parse(sample, bytes), errors::kInvalidSid) << sample;
    }
}

TEST_F(PortableSecurityApiTest, With_NullArguments_Parse_Fails)
{
    sidcore::PSID psid = nullptr;
    EXPECT_EQ(api.FromStringSid(nullptr, &psid), errors::kInvalidParameter);
    native_string native = sidcore::Utf8ToNative("S-1-5-18");
    EXPECT_EQ(api.FromStringSid(native.c_str(), nullptr), errors::kInvalidParameter);
}

TEST_F(PortableSecurityApiTest, With_MalformedStructures_IsValid_Returns_False)
{
    std::vector<std::uint8_t> revision2 = {2, 1, 0, 0, 0, 0, 0, 5, 18, 0, 0, 0};
    std::vector<std::uint8_t> tooManySubAuthorities(8 + 4 * 16, 0);
    tooManySubAuthorities[0] = 1;
    tooManySubAuthorities[1] = 16;

    EXPECT_FALSE(api.IsValid(nullptr));
    EXPECT_FALSE(api.IsValid(revision2.data()));
    EXPECT_FALSE(api.IsValid(tooManySubAuthorities.data()));
    EXPECT_EQ(api.Length(revision2.data()), 0u);

    NativeChar *stringSid = nullptr;
    EXPECT_EQ(api.ToStringSid(revision2.data(), &stringSid), errors::kInvalidSid);
    EXPECT_EQ(stringSid, nullptr);
}

TEST_F(PortableSecurityApiTest, With_SmallBuffer_Copy_Fails)
{
    std::vector<std::uint8_t> src = {1, 1, 0, 0, 0, 0, 0, 5, 18, 0, 0, 0};
    std::vector<std::uint8_t> dest(12, 0xAA);

    EXPECT_EQ(api.Copy(11, dest.data(), src.data()), errors::kInsufficientBuffer);
    EXPECT_EQ(api.Copy(12, nullptr, src.data()), errors::kInvalidParameter);
    ASSERT_EQ(api.Copy(12, dest.data(), src.data()), errors::kSuccess);
    EXPECT_EQ(dest, src);
}

#ifdef SIDCORE_ACCOUNT_LOOKUP
TEST_F(PortableSecurityApiTest, With_WellKnownSid_LookupAccount_Follows_Probe_Protocol)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("S-1-5-32-544", bytes), errors::kSuccess);

    DWORD cchName = 0;
    DWORD cchDomain = 0;
    ASSERT_EQ(api.LookupAccount(nullptr, bytes.data(), nullptr, &cchName, nullptr, &cchDomain),
              errors::kInsufficientBuffer);
    EXPECT_EQ(cchName, 15u); // "Administrators" + terminator
    EXPECT_EQ(cchDomain, 8u); // "BUILTIN" + terminator

    std::vector<NativeChar> name(cchName);
    std::vector<NativeChar> domain(cchDomain);
    ASSERT_EQ(api.LookupAccount(nullptr, bytes.data(), name.data(), &cchName, domain.data(), &cchDomain),
              errors::kSuccess);
    EXPECT_EQ(cchName, 14u);
    EXPECT_EQ(cchDomain, 7u);
    EXPECT_EQ(sidcore::NativeToUtf8(name.data()), "Administrators");
    EXPECT_EQ(sidcore::NativeToUtf8(domain.data()), "BUILTIN");
}

TEST_F(PortableSecurityApiTest, With_EmptyDomain_LookupAccount_Reports_Terminator_Only)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("S-1-1-0", bytes), errors::kSuccess);

    DWORD cchName = 0;
    DWORD cchDomain = 0;
    ASSERT_EQ(api.LookupAccount(nullptr, bytes.data(), nullptr, &cchName, nullptr, &cchDomain),
              errors::kInsufficientBuffer);
    EXPECT_EQ(cchName, 9u);
    EXPECT_EQ(cchDomain, 1u);
}

TEST_F(PortableSecurityApiTest, With_UnknownSid_LookupAccount_Returns_NoneMapped)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("S-1-5-21-1-2-3-1013", bytes), errors::kSuccess);

    DWORD cchName = 0;
    DWORD cchDomain = 0;
    EXPECT_EQ(api.LookupAccount(nullptr, bytes.data(), nullptr, &cchName, nullptr, &cchDomain), errors::kNoneMapped);
}

TEST_F(PortableSecurityApiTest, With_RemoteSystem_LookupAccount_Is_Not_Supported)
{
    std::vector<std::uint8_t> bytes;
    ASSERT_EQ(Parse("S-1-5-18", bytes), errors::kSuccess);

    native_string host = sidcore::Utf8ToNative("dc01");
    DWORD cchName = 0;
    DWORD cchDomain = 0;
    EXPECT_EQ(api.LookupAccount(host.c_str(), bytes.data(), nullptr, &cchName, nullptr, &cchDomain),
              errors::kNotSupported);
}
#endif
