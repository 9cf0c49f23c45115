#include "common/Types.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using dyndns::common::AllowList;
using dyndns::common::RecordType;

TEST(AllowListTest, EmptyValueIsUnrestricted) {
  auto al = AllowList::parse("");
  EXPECT_EQ(al.mode(), AllowList::Mode::Unrestricted);
  EXPECT_TRUE(al.permits("anything.example.com"));
}

TEST(AllowListTest, FalseAndWildcardAreUnrestricted) {
  EXPECT_EQ(AllowList::parse("false").mode(), AllowList::Mode::Unrestricted);
  EXPECT_EQ(AllowList::parse(" * ").mode(), AllowList::Mode::Unrestricted);
}

TEST(AllowListTest, ListIsRestrictedToMembers) {
  auto al = AllowList::parse("home.example.com, nas.example.com");
  EXPECT_EQ(al.mode(), AllowList::Mode::Restricted);
  EXPECT_TRUE(al.permits("home.example.com"));
  EXPECT_TRUE(al.permits("nas.example.com"));
  EXPECT_FALSE(al.permits("other.example.com"));
  EXPECT_FALSE(al.permits("example.com"));
}

TEST(AllowListTest, MembershipIsExact) {
  auto al = AllowList::parse("home.example.com");
  EXPECT_FALSE(al.permits("HOME.example.com"));
  EXPECT_FALSE(al.permits("sub.home.example.com"));
}

TEST(AllowListTest, EmptyItemIsRejected) {
  EXPECT_THROW(AllowList::parse("home.example.com,"), std::runtime_error);
  EXPECT_THROW(AllowList::parse(",home.example.com"), std::runtime_error);
}

TEST(AllowListTest, RestrictedWithNoDomainsAllowsAll) {
  auto al = AllowList::restricted({});
  EXPECT_EQ(al.mode(), AllowList::Mode::Unrestricted);
  EXPECT_TRUE(al.permits("home.example.com"));
}

TEST(RecordTypeTest, StringConversion) {
  EXPECT_EQ(dyndns::common::toString(RecordType::A), "A");
  EXPECT_EQ(dyndns::common::toString(RecordType::AAAA), "AAAA");
}
