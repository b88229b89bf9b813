#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <limits>
#include <vector>

#include "allocator/allocator_factory.h"
#include "allocator/pooled_lo_allocator.h"
#include "common/errors.h"
#include "source/in_memory_sequence_source.h"
#include "test_sources.h"

using namespace IdPool;
using ::testing::Return;
using ::testing::Throw;

namespace {

int64_t Next(PooledLoAllocator& allocator, ISequenceSource& source, TenantKey tenant = std::nullopt) {
    SourceAccessCallback callback(source, std::move(tenant));
    return std::get<int64_t>(allocator.Generate(callback));
}

std::vector<int64_t> Take(PooledLoAllocator& allocator, ISequenceSource& source, int count,
                          TenantKey tenant = std::nullopt) {
    std::vector<int64_t> values;
    for (int i = 0; i < count; ++i) {
        values.push_back(Next(allocator, source, tenant));
    }
    return values;
}

} // namespace

TEST(PooledLoAllocatorConstructionTest, RejectsIncrementBelowOne) {
    EXPECT_THROW(PooledLoAllocator(IntegralType::kInt64, 0), ConfigurationError);
    EXPECT_THROW(PooledLoAllocator(IntegralType::kInt64, -5), ConfigurationError);
}

TEST(PooledLoAllocatorConstructionTest, RejectsSubPoolBelowOne) {
    EXPECT_THROW(PooledLoAllocator(IntegralType::kInt64, 10, 0), ConfigurationError);
}

TEST(PooledLoAllocatorConstructionTest, ReportsParameters) {
    PooledLoAllocator allocator(IntegralType::kInt32, 20);
    EXPECT_EQ(allocator.GetIncrementSize(), 20);
    EXPECT_EQ(allocator.GetSubPoolSize(), PooledLoAllocator::kDefaultSubPoolSize);
    EXPECT_EQ(allocator.GetIdentifierType(), IntegralType::kInt32);
    EXPECT_TRUE(allocator.ApplyIncrementSizeToSourceValues());
    EXPECT_EQ(allocator.GetSourceFetchCount(), 0u);
}

TEST(PooledLoAllocatorTest, SubPoolsAreCarvedAndClippedToTheBlock) {
    ScriptedSource source(IntegralType::kInt64, {1, 6, 11});
    PooledLoAllocator allocator(IntegralType::kInt64, 5, 2);

    EXPECT_EQ(Next(allocator, source), 1);
    EXPECT_EQ(source.fetches(), 1);
    // [1,3) [3,5) then [5,6) clipped at the block's upper limit
    EXPECT_EQ(Take(allocator, source, 4), (std::vector<int64_t>{2, 3, 4, 5}));
    EXPECT_EQ(source.fetches(), 1);

    EXPECT_EQ(Next(allocator, source), 6);
    EXPECT_EQ(source.fetches(), 2);
    EXPECT_EQ(Take(allocator, source, 4), (std::vector<int64_t>{7, 8, 9, 10}));
    EXPECT_EQ(source.fetches(), 2);

    EXPECT_EQ(Next(allocator, source), 11);
    EXPECT_EQ(source.fetches(), 3);
    EXPECT_TRUE(allocator.GetLastSourceValue()->Eq(11));
}

TEST(PooledLoAllocatorTest, IncrementOfOneBehavesAsRemoteCounter) {
    InMemorySequenceSource source(IntegralType::kInt64, 1, 1);
    PooledLoAllocator allocator(IntegralType::kInt64, 1, 5000);

    for (int64_t expected = 1; expected <= 5; ++expected) {
        EXPECT_EQ(Next(allocator, source), expected);
        EXPECT_EQ(source.fetch_count(), static_cast<uint64_t>(expected));
        EXPECT_TRUE(allocator.GetLastSourceValue()->Eq(expected));
    }
}

TEST(PooledLoAllocatorTest, SubPoolLargerThanBlockIsClipped) {
    ScriptedSource source(IntegralType::kInt64, {1, 4, 7});
    PooledLoAllocator allocator(IntegralType::kInt64, 3, 100);

    EXPECT_EQ(Take(allocator, source, 3), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(source.fetches(), 1);
    EXPECT_EQ(Take(allocator, source, 4), (std::vector<int64_t>{4, 5, 6, 7}));
    EXPECT_EQ(source.fetches(), 3);
}

TEST(PooledLoAllocatorTest, SingleThreadSequenceIsContiguous) {
    InMemorySequenceSource source(IntegralType::kInt64, 1, 100);
    PooledLoAllocator allocator(IntegralType::kInt64, 100, 7);

    auto values = Take(allocator, source, 1000);
    for (size_t i = 0; i < values.size(); ++i) {
        ASSERT_EQ(values[i], static_cast<int64_t>(i + 1));
    }
    EXPECT_EQ(source.fetch_count(), 10u);
}

TEST(PooledLoAllocatorTest, NonPositiveSourceValueSkipsForwardToOne) {
    ScriptedSource source(IntegralType::kInt64, {-3, 2});
    PooledLoAllocator allocator(IntegralType::kInt64, 5, 10);

    EXPECT_EQ(Next(allocator, source), 1);
    // The advertised block is [-3, 2); only 1 was usable.
    EXPECT_TRUE(allocator.GetLastSourceValue()->Eq(-3));
    EXPECT_EQ(Next(allocator, source), 2);
    EXPECT_EQ(source.fetches(), 2);
}

TEST(PooledLoAllocatorTest, ZeroSourceValueWithIncrementOneFetchesAgain) {
    ScriptedSource source(IntegralType::kInt64, {0, 1, 2});
    PooledLoAllocator allocator(IntegralType::kInt64, 1, 10);

    EXPECT_EQ(Next(allocator, source), 1);
    EXPECT_EQ(source.fetches(), 2);
    // The empty block [0, 1) is never recorded.
    EXPECT_TRUE(allocator.GetLastSourceValue()->Eq(1));
    EXPECT_EQ(Next(allocator, source), 2);
    EXPECT_EQ(source.fetches(), 3);
}

TEST(PooledLoAllocatorTest, StalledSourceWithEmptyBlocksFails) {
    ScriptedSource source(IntegralType::kInt64, {-10, -10});
    PooledLoAllocator allocator(IntegralType::kInt64, 5, 10);

    EXPECT_THROW(Next(allocator, source), SourceFetchError);
    EXPECT_THROW(allocator.GetLastSourceValue(), StateNotInitializedError);
}

TEST(PooledLoAllocatorTest, TenantsHaveIndependentSequences) {
    InMemorySequenceSource source(IntegralType::kInt64, 1, 10);
    PooledLoAllocator allocator(IntegralType::kInt64, 10, 3);

    std::vector<int64_t> a;
    std::vector<int64_t> b;
    for (int i = 0; i < 4; ++i) {
        a.push_back(Next(allocator, source, std::string("a")));
        b.push_back(Next(allocator, source, std::string("b")));
    }
    EXPECT_EQ(a, (std::vector<int64_t>{1, 2, 3, 4}));
    EXPECT_EQ(b, (std::vector<int64_t>{1, 2, 3, 4}));

    // The no-tenant partition has not been touched by the tenant calls.
    EXPECT_THROW(allocator.GetLastSourceValue(), StateNotInitializedError);
    EXPECT_EQ(Next(allocator, source), 1);
}

TEST(PooledLoAllocatorTest, TenantCallsDrainTheWholeBlockBeforeRefetching) {
    InMemorySequenceSource source(IntegralType::kInt64, 1, 5);
    PooledLoAllocator allocator(IntegralType::kInt64, 5, 2);

    EXPECT_EQ(Take(allocator, source, 5, std::string("acme")), (std::vector<int64_t>{1, 2, 3, 4, 5}));
    EXPECT_EQ(source.fetch_count(), 1u);
    EXPECT_EQ(Next(allocator, source, std::string("acme")), 6);
    EXPECT_EQ(source.fetch_count(), 2u);
    EXPECT_TRUE(allocator.GetLastSourceValue(std::string("acme"))->Eq(6));
}

TEST(PooledLoAllocatorTest, LastSourceValueBeforeAnyAllocationThrows) {
    PooledLoAllocator allocator(IntegralType::kInt64, 10);
    EXPECT_THROW(allocator.GetLastSourceValue(), StateNotInitializedError);
    EXPECT_THROW(allocator.GetLastSourceValue(std::string("nobody")), StateNotInitializedError);
}

TEST(PooledLoAllocatorTest, LastSourceValueIsACopy) {
    InMemorySequenceSource source(IntegralType::kInt64, 40, 10);
    PooledLoAllocator allocator(IntegralType::kInt64, 10);
    Next(allocator, source);

    auto last = allocator.GetLastSourceValue();
    last->Add(1000);
    EXPECT_TRUE(allocator.GetLastSourceValue()->Eq(40));
}

TEST(PooledLoAllocatorTest, SourceFailurePropagatesAndLeavesStateUntouched) {
    PooledLoAllocator allocator(IntegralType::kInt64, 5);
    MockAccessCallback callback;
    EXPECT_CALL(callback, GetTenantIdentifier()).WillRepeatedly(Return(TenantKey{}));
    EXPECT_CALL(callback, GetNextValue())
        .WillOnce(Throw(SourceFetchError("sequence table locked")))
        .WillOnce([] { return Int64Value(1); });

    EXPECT_THROW(allocator.Generate(callback), SourceFetchError);
    EXPECT_THROW(allocator.GetLastSourceValue(), StateNotInitializedError);
    EXPECT_EQ(allocator.GetSourceFetchCount(), 0u);

    EXPECT_EQ(std::get<int64_t>(allocator.Generate(callback)), 1);
    EXPECT_EQ(allocator.GetSourceFetchCount(), 1u);
}

TEST(PooledLoAllocatorTest, FailedRefillIsRetriedOnTheNextCall) {
    PooledLoAllocator allocator(IntegralType::kInt64, 5);
    MockAccessCallback callback;
    EXPECT_CALL(callback, GetTenantIdentifier()).WillRepeatedly(Return(TenantKey{}));
    EXPECT_CALL(callback, GetNextValue())
        .WillOnce([] { return Int64Value(1); })
        .WillOnce(Throw(SourceFetchError("connection reset")))
        .WillOnce([] { return Int64Value(6); });

    for (int64_t expected = 1; expected <= 5; ++expected) {
        EXPECT_EQ(std::get<int64_t>(allocator.Generate(callback)), expected);
    }
    EXPECT_THROW(allocator.Generate(callback), SourceFetchError);
    EXPECT_TRUE(allocator.GetLastSourceValue()->Eq(1));
    EXPECT_EQ(std::get<int64_t>(allocator.Generate(callback)), 6);
}

TEST(PooledLoAllocatorTest, TenantSourceFailureDoesNotCreateState) {
    PooledLoAllocator allocator(IntegralType::kInt64, 5);
    MockAccessCallback callback;
    EXPECT_CALL(callback, GetTenantIdentifier()).WillRepeatedly(Return(TenantKey("acme")));
    EXPECT_CALL(callback, GetNextValue()).WillOnce(Throw(SourceFetchError("timeout")));

    EXPECT_THROW(allocator.Generate(callback), SourceFetchError);
    EXPECT_THROW(allocator.GetLastSourceValue(std::string("acme")), StateNotInitializedError);
}

TEST(PooledLoAllocatorTest, MissingSourceValueIsAFetchError) {
    PooledLoAllocator allocator(IntegralType::kInt64, 5);
    MockAccessCallback callback;
    EXPECT_CALL(callback, GetTenantIdentifier()).WillRepeatedly(Return(TenantKey{}));
    EXPECT_CALL(callback, GetNextValue()).WillOnce([] { return std::unique_ptr<IntegralHolder>(); });

    EXPECT_THROW(allocator.Generate(callback), SourceFetchError);
}

TEST(PooledLoAllocatorTest, SourceOfWrongRepresentationIsRejected) {
    InMemorySequenceSource source(IntegralType::kInt32, 1, 5);
    PooledLoAllocator allocator(IntegralType::kInt64, 5);
    SourceAccessCallback callback(source);

    EXPECT_THROW(allocator.Generate(callback), HolderError);
    EXPECT_THROW(allocator.GetLastSourceValue(), StateNotInitializedError);
}

TEST(PooledLoAllocatorTest, AllocatorsInOneThreadDoNotShareSubPools) {
    InMemorySequenceSource first_source(IntegralType::kInt64, 1, 100);
    InMemorySequenceSource second_source(IntegralType::kInt64, 1000, 100);
    PooledLoAllocator first(IntegralType::kInt64, 100);
    PooledLoAllocator second(IntegralType::kInt64, 100);

    EXPECT_EQ(Next(first, first_source), 1);
    EXPECT_EQ(Next(second, second_source), 1000);
    EXPECT_EQ(Next(first, first_source), 2);
    EXPECT_EQ(Next(second, second_source), 1001);
}

TEST(PooledLoAllocatorTest, NewAllocatorStartsWithoutStaleSubPool) {
    InMemorySequenceSource source(IntegralType::kInt64, 1, 100);
    {
        PooledLoAllocator discarded(IntegralType::kInt64, 100);
        EXPECT_EQ(Next(discarded, source), 1);
    }
    PooledLoAllocator replacement(IntegralType::kInt64, 100);
    EXPECT_EQ(Next(replacement, source), 101);
    EXPECT_EQ(replacement.GetSourceFetchCount(), 1u);
}

TEST(PooledLoAllocatorTest, Int32Identifiers) {
    InMemorySequenceSource source(IntegralType::kInt32, 1, 4);
    PooledLoAllocator allocator(IntegralType::kInt32, 4, 2);
    SourceAccessCallback callback(source);

    for (int32_t expected = 1; expected <= 9; ++expected) {
        Identifier id = allocator.Generate(callback);
        ASSERT_TRUE(std::holds_alternative<int32_t>(id));
        EXPECT_EQ(std::get<int32_t>(id), expected);
    }
    EXPECT_EQ(source.fetch_count(), 3u);
}

TEST(PooledLoAllocatorTest, BigIntegerIdentifiersCrossSixtyFourBits) {
    const int64_t start = std::numeric_limits<int64_t>::max() - 2;
    InMemorySequenceSource source(IntegralType::kBigInteger, start, 3);
    PooledLoAllocator allocator(IntegralType::kBigInteger, 3, 2);
    SourceAccessCallback callback(source);

    std::vector<std::string> values;
    for (int i = 0; i < 5; ++i) {
        values.push_back(IdentifierToString(allocator.Generate(callback)));
    }
    EXPECT_EQ(values, (std::vector<std::string>{
        "9223372036854775805", "9223372036854775806", "9223372036854775807",
        "9223372036854775808", "9223372036854775809"}));
    EXPECT_EQ(allocator.GetLastSourceValue()->ToString(), "9223372036854775808");
}

TEST(AllocatorFactoryTest, BuildsFromConfiguration) {
    IdPoolConfig config;
    config.allocator.increment_size.set(25);
    config.allocator.sub_pool_size.set(5);
    config.allocator.identifier_type.set("int32");

    auto allocator = MakeAllocator(config);
    EXPECT_EQ(allocator->GetIncrementSize(), 25);
    EXPECT_EQ(allocator->GetSubPoolSize(), 5);
    EXPECT_EQ(allocator->GetIdentifierType(), IntegralType::kInt32);
}

TEST(AllocatorFactoryTest, RejectsInvalidConfiguration) {
    IdPoolConfig config;
    config.allocator.increment_size.set(0);
    EXPECT_THROW(MakeAllocator(config), ConfigurationError);

    IdPoolConfig bad_type;
    bad_type.allocator.identifier_type.set("float");
    EXPECT_THROW(MakeAllocator(bad_type), ConfigurationError);
}

TEST(AllocatorFactoryTest, DetectsIncrementMismatchWithSequencer) {
    IdPoolConfig config;
    EXPECT_TRUE(IncrementSizesAgree(config));

    config.allocator.increment_size.set(100);
    EXPECT_FALSE(IncrementSizesAgree(config));
    // A mismatch is reported, not rejected.
    EXPECT_EQ(MakeAllocator(config)->GetIncrementSize(), 100);

    config.sequencer.increment_size.set(100);
    EXPECT_TRUE(IncrementSizesAgree(config));
}

TEST(PooledLoAllocatorTest, DestroyedAllocatorReleasesCallingThreadSubPool) {
    InMemorySequenceSource source(IntegralType::kInt64, 1, 10);
    const size_t before = PooledLoAllocator::ThreadSubPoolCount();
    {
        PooledLoAllocator allocator(IntegralType::kInt64, 10);
        Next(allocator, source);
        EXPECT_EQ(PooledLoAllocator::ThreadSubPoolCount(), before + 1);
        // Tenant calls never take a sub-pool.
        Next(allocator, source, std::string("acme"));
        EXPECT_EQ(PooledLoAllocator::ThreadSubPoolCount(), before + 1);
    }
    EXPECT_EQ(PooledLoAllocator::ThreadSubPoolCount(), before);
}
