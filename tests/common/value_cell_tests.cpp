#include <gtest/gtest.h>
#include "stagedag/common/value_cell.hpp"
#include "stagedag/common/value_cell.inline.hpp"
#include <string>

using namespace stagedag;

namespace
{

template <typename C, typename = void>
struct has_public_set : std::false_type
{
};

template <typename C>
struct has_public_set<C, std::void_t<decltype(std::declval<C&>().set(1))>> : std::true_type
{
};

template <typename C, typename = void>
struct has_public_reset : std::false_type
{
};

template <typename C>
struct has_public_reset<C, std::void_t<decltype(std::declval<C&>().reset())>>
    : std::true_type
{
};

} // namespace

// =============================================================================
// ValueCell Basic Functionality Tests
// =============================================================================

TEST(ValueCellTests, DefaultConstructed_IsEmpty)
{
    ValueCell cell;
    EXPECT_FALSE(cell.has_value());
    EXPECT_EQ(cell.type(), std::type_index{typeid(void)});
}

TEST(ValueCellTests, Of_HoldsValueAndType)
{
    ValueCell c = ValueCell::of(42);
    EXPECT_TRUE(c.has_value());
    EXPECT_TRUE(c.has_type<int>());
    EXPECT_EQ(c.as<int>(), 42);
}

TEST(ValueCellTests, StoredValueCannotBeMutatedInPlace)
{
    static_assert(!has_public_set<ValueCell>::value);
    static_assert(!has_public_reset<ValueCell>::value);

    ValueCell cell = ValueCell::of(7);
    ValueCell copy = cell;
    EXPECT_TRUE(copy.shares_with(cell));
    EXPECT_EQ(copy.as<int>(), 7);
}

TEST(ValueCellTests, HasType_ReturnsFalseForWrongType)
{
    ValueCell cell = ValueCell::of(42);
    EXPECT_FALSE(cell.has_type<double>());
    EXPECT_FALSE(cell.has_type<std::string>());
}

TEST(ValueCellTests, TryAs_ReturnsPointerOnMatch)
{
    ValueCell cell = ValueCell::of(42);
    const int* ptr = cell.try_as<int>();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, 42);
}

TEST(ValueCellTests, TryAs_ReturnsNullptrOnMismatchOrEmpty)
{
    EXPECT_EQ(ValueCell{}.try_as<int>(), nullptr);
    EXPECT_EQ(ValueCell::of(42).try_as<double>(), nullptr);
}

TEST(ValueCellTests, AssignEmpty_ClearsValue)
{
    ValueCell cell = ValueCell::of(42);
    cell = ValueCell{};
    EXPECT_FALSE(cell.has_value());
    EXPECT_EQ(cell.type(), std::type_index{typeid(void)});
}

// =============================================================================
// ValueCell Exception Tests
// =============================================================================

TEST(ValueCellTests, As_ThrowsOnEmpty)
{
    ValueCell cell;
    EXPECT_THROW(cell.as<int>(), ValueCellEmptyError);
}

TEST(ValueCellTests, As_ThrowsOnTypeMismatch)
{
    ValueCell cell = ValueCell::of(42);
    EXPECT_THROW(cell.as<double>(), ValueCellTypeError);
}

// =============================================================================
// ValueCell Sharing Tests
// =============================================================================

TEST(ValueCellTests, Copy_SharesStoredObject)
{
    ValueCell cell = ValueCell::of(std::string("hello"));
    ValueCell copy = cell;
    EXPECT_TRUE(copy.shares_with(cell));
    EXPECT_EQ(&copy.as<std::string>(), &cell.as<std::string>());
}

TEST(ValueCellTests, Reassign_DoesNotAffectEarlierCopies)
{
    ValueCell cell = ValueCell::of(42);
    ValueCell copy = cell;
    cell = ValueCell::of(100);
    EXPECT_EQ(copy.as<int>(), 42);
    EXPECT_EQ(cell.as<int>(), 100);
    EXPECT_FALSE(copy.shares_with(cell));
}

TEST(ValueCellTests, EmptyCells_CountAsShared)
{
    ValueCell cell;
    ValueCell other;
    EXPECT_TRUE(cell.shares_with(other));
    other = ValueCell::of(1);
    EXPECT_FALSE(cell.shares_with(other));
}

// =============================================================================
// ValueCell Type Handling Tests
// =============================================================================

TEST(ValueCellTests, WorksWithVector)
{
    ValueCell cell = ValueCell::of(std::vector<std::string>{"a", "b"});
    ASSERT_TRUE(cell.has_type<std::vector<std::string>>());
    EXPECT_EQ(cell.as<std::vector<std::string>>().size(), 2u);
}

TEST(ValueCellTests, WorksWithFunction)
{
    ValueCell cell = ValueCell::of(std::function<int(int)>([](int x) { return x * 2; }));
    ASSERT_TRUE((cell.has_type<std::function<int(int)>>()));
    EXPECT_EQ(cell.as<std::function<int(int)>>()(21), 42);
}

TEST(ValueCellTests, TypeDecay_ConstIsStripped)
{
    const int x = 42;
    ValueCell cell = ValueCell::of(x);
    EXPECT_TRUE(cell.has_type<int>());
}

TEST(ValueCellTests, Reassign_ChangesType)
{
    ValueCell cell = ValueCell::of(42);
    cell = ValueCell::of(std::string("hello"));
    EXPECT_FALSE(cell.has_type<int>());
    EXPECT_TRUE(cell.has_type<std::string>());
}
