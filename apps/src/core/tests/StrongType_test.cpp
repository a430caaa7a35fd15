#include "core/StrongType.h"

#include <gtest/gtest.h>
#include <map>
#include <unordered_set>

using namespace Biomorph;

using TestIdA = StrongType<struct TestIdATag>;
using TestIdB = StrongType<struct TestIdBTag>;

TEST(StrongTypeTest, DefaultIsInvalid)
{
    TestIdA id;
    EXPECT_EQ(id.get(), -1);
    EXPECT_FALSE(id.isValid());
}

TEST(StrongTypeTest, ExplicitConstructor)
{
    TestIdA id{ 42 };
    EXPECT_EQ(id.get(), 42);
    EXPECT_TRUE(id.isValid());
}

TEST(StrongTypeTest, EqualityAndOrdering)
{
    TestIdA a{ 10 };
    TestIdA b{ 10 };
    TestIdA c{ 20 };

    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a != c);
    EXPECT_TRUE(a < c);
    EXPECT_TRUE(c > a);
}

TEST(StrongTypeTest, DifferentTagsAreDifferentTypes)
{
    static_assert(!std::is_same_v<TestIdA, TestIdB>);
    static_assert(!std::is_convertible_v<int, TestIdA>);
    static_assert(!std::is_convertible_v<TestIdA, TestIdB>);
}

TEST(StrongTypeTest, IncrementHandsOutSequentialIds)
{
    TestIdA next{ 0 };

    const TestIdA first = next++;
    const TestIdA second = next++;
    ++next;

    EXPECT_EQ(first.get(), 0);
    EXPECT_EQ(second.get(), 1);
    EXPECT_EQ(next.get(), 3);
}

TEST(StrongTypeTest, UsableAsContainerKey)
{
    std::unordered_set<TestIdA> set;
    set.insert(TestIdA{ 1 });
    set.insert(TestIdA{ 2 });
    set.insert(TestIdA{ 1 });
    EXPECT_EQ(set.size(), 2u);

    std::map<TestIdA, int> ordered{ { TestIdA{ 5 }, 50 }, { TestIdA{ 3 }, 30 } };
    EXPECT_EQ(ordered.begin()->first, TestIdA{ 3 });
}

TEST(StrongTypeTest, JsonAndFormatting)
{
    const nlohmann::json j = TestIdA{ 7 };
    EXPECT_EQ(j, 7);
    EXPECT_EQ(j.get<TestIdA>(), TestIdA{ 7 });
    EXPECT_EQ(fmt::format("creature {}", TestIdA{ 7 }), "creature 7");
}
