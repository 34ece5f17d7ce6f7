#include "stdafx.h"
#include "SecurityIdentifierTest.h"

using sidcore::Sid;

TEST_F(SecurityIdentifierTest, With_Revision1Bytes_FromBytes_Keeps_Bytes_Verbatim)
{
    std::vector<std::vector<std::uint8_t>> samples = {
        {1},
        {1, 0, 0, 0, 0, 0, 0, 5},
        localSystemBytes,
        {1, 5, 0, 0, 0, 0, 0, 5, 21, 0, 0, 0, 0xC7, 0x4F, 0xFF, 0xD7, 0x7C, 0x56, 0x4A, 0xC8, 0x94, 0x56, 0xCE, 0x01,
         0xF5, 0x03, 0x00, 0x00},
        // incomplete layouts are kept, formatting and lookup refuse them
        {1, 0xFF, 0xAB},
    };

    for (auto const &bytes : samples)
    {
        std::optional<Sid> sid = Sid::FromBytes(bytes);
        ASSERT_TRUE(sid.has_value());
        EXPECT_EQ(sid->Bytes(), bytes);
    }
}

TEST_F(SecurityIdentifierTest, With_EmptyBytes_FromBytes_Returns_Nothing)
{
    EXPECT_FALSE(Sid::FromBytes({}).has_value());
}

TEST_F(SecurityIdentifierTest, With_Revision2Bytes_FromBytes_Returns_Nothing)
{
    EXPECT_FALSE(Sid::FromBytes({2, 1, 0, 0, 0, 0, 0, 5, 18, 0, 0, 0}).has_value());
    EXPECT_FALSE(Sid::FromBytes({0}).has_value());
}

TEST_F(SecurityIdentifierTest, With_IdenticalBytes_Sids_Are_Equal_And_Hash_Identically)
{
    Sid a = MakeSid(localSystemBytes);
    Sid b = MakeSid(localSystemBytes);

    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a != b);
    EXPECT_FALSE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_TRUE(a <= b);
    EXPECT_TRUE(a >= b);
    EXPECT_EQ(a.Hash(), b.Hash());
    EXPECT_EQ(std::hash<Sid>()(a), std::hash<Sid>()(b));
}

TEST_F(SecurityIdentifierTest, With_DifferentBytes_Sids_Are_Not_Equal)
{
    Sid localSystem = MakeSid(localSystemBytes);
    Sid everyone = MakeSid(everyoneBytes);

    EXPECT_FALSE(localSystem == everyone);
    EXPECT_TRUE(localSystem != everyone);
    EXPECT_TRUE(everyone < localSystem || localSystem < everyone);
}

TEST_F(SecurityIdentifierTest, With_PrefixBytes_Sids_Are_Not_Equal)
{
    Sid ntAuthority = MakeSid({1, 0, 0, 0, 0, 0, 0, 5});
    Sid localSystem = MakeSid(localSystemBytes);

    EXPECT_NE(ntAuthority, localSystem);
    EXPECT_LT(ntAuthority, localSystem);
}

TEST_F(SecurityIdentifierTest, With_ManySids_Ordering_Is_Total_And_Transitive)
{
    std::vector<Sid> sids = {
        MakeSid(localSystemBytes),
        MakeSid(everyoneBytes),
        MakeSid({1, 0, 0, 0, 0, 0, 0, 5}),
        MakeSid({1, 1, 0, 0, 0, 0, 0, 5, 19, 0, 0, 0}),
        MakeSid({1, 2, 0, 0, 0, 0, 0, 5, 32, 0, 0, 0, 0x20, 0x02, 0, 0}),
        MakeSid({1, 2, 0, 0, 0, 0, 0, 5, 32, 0, 0, 0, 0x21, 0x02, 0, 0}),
        MakeSid(localSystemBytes),
    };

    for (auto const &a : sids)
    {
        for (auto const &b : sids)
        {
            int relations = (a < b ? 1 : 0) + (b < a ? 1 : 0) + (a == b ? 1 : 0);
            EXPECT_EQ(relations, 1);
            EXPECT_EQ(a == b, a.Bytes() == b.Bytes());
            if (a == b)
            {
                EXPECT_EQ(a.Hash(), b.Hash());
            }
            for (auto const &c : sids)
            {
                if (a < b && b < c)
                {
                    EXPECT_TRUE(a < c);
                }
            }
        }
    }
}

TEST_F(SecurityIdentifierTest, With_DuplicateSids_Sets_Keep_One)
{
    std::set<Sid> ordered;
    std::unordered_set<Sid> hashed;
    for (int i = 0; i < 3; ++i)
    {
        ordered.insert(MakeSid(localSystemBytes));
        ordered.insert(MakeSid(everyoneBytes));
        hashed.insert(MakeSid(localSystemBytes));
        hashed.insert(MakeSid(everyoneBytes));
    }

    EXPECT_EQ(ordered.size(), 2u);
    EXPECT_EQ(hashed.size(), 2u);
    EXPECT_EQ(hashed.count(MakeSid(localSystemBytes)), 1u);
}

TEST_F(SecurityIdentifierTest, With_CopiedSid_Copy_Is_Equal)
{
    Sid original = MakeSid(localSystemBytes);
    Sid copy = original;
    Sid moved = std::move(copy);

    EXPECT_EQ(moved, original);
    EXPECT_EQ(moved.Hash(), original.Hash());
}
