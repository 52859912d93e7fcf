/**
 * @file test_pagination.cpp
 * @brief Unit tests for offset-based paging
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/EnrichmentErrors.hpp"
#include "core/SpatialQueryPaginator.hpp"
#include "mocks/MockSpatialSource.hpp"

using namespace geoenrich;
using namespace geoenrich::test;
using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

// =============================================================================
// Fixture
// =============================================================================

class PaginatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(source_, id()).WillByDefault(Return("test_source"));
        EXPECT_CALL(source_, id()).Times(::testing::AnyNumber());
    }

    static SourcePage page(size_t count, bool has_more = false, const std::string& prefix = "f") {
        return SourcePage{raw_points(count, prefix), has_more};
    }

    ::testing::NiceMock<MockSpatialSource> source_;
    SourceQuery base_;
};

TEST_F(PaginatorTest, FullThenShortPageMakesTwoRequests) {
    SpatialQueryPaginator paginator({10, 50000});
    {
        InSequence order;
        EXPECT_CALL(source_, query(Field(&SourceQuery::offset, 0))).WillOnce(Return(page(10, false, "a")));
        EXPECT_CALL(source_, query(Field(&SourceQuery::offset, 10))).WillOnce(Return(page(9, false, "b")));
    }

    auto result = paginator.paginate(source_, base_);
    EXPECT_EQ(2u, result.pages_requested);
    EXPECT_EQ(19u, result.features.size());
    EXPECT_FALSE(result.error.has_value());
}

TEST_F(PaginatorTest, HasMoreContinuesPastShortPage) {
    SpatialQueryPaginator paginator({10, 50000});
    EXPECT_CALL(source_, query(_))
        .WillOnce(Return(page(3, true)))
        .WillOnce(Return(page(2, false)));

    auto result = paginator.paginate(source_, base_);
    EXPECT_EQ(2u, result.pages_requested);
    EXPECT_EQ(5u, result.features.size());
}

TEST_F(PaginatorTest, EmptyPageStopsEvenWithHasMore) {
    SpatialQueryPaginator paginator({10, 50000});
    EXPECT_CALL(source_, query(_)).WillOnce(Return(page(0, true)));

    auto result = paginator.paginate(source_, base_);
    EXPECT_EQ(1u, result.pages_requested);
    EXPECT_TRUE(result.features.empty());
}

TEST_F(PaginatorTest, AlwaysMoreIsBoundedBySafetyOffset) {
    SpatialQueryPaginator::Options options{2000, 50000};
    SpatialQueryPaginator paginator(options);
    EXPECT_CALL(source_, query(_)).WillRepeatedly(Return(page(1, true)));

    auto result = paginator.paginate(source_, base_);

    const size_t bound = (options.max_offset + options.page_size - 1) / options.page_size + 1;
    EXPECT_LE(result.pages_requested, bound);
    EXPECT_TRUE(result.safety_bound_hit);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(*result.error, HasSubstr("test_source"));
    EXPECT_EQ(result.pages_requested, result.features.size());
}

TEST_F(PaginatorTest, PageSizeAndOffsetOverrideTemplate) {
    SpatialQueryPaginator paginator({25, 100});
    base_.offset = 999;
    base_.page_size = 1;
    base_.buffer_meters = 100.0;
    EXPECT_CALL(source_, query(::testing::AllOf(Field(&SourceQuery::offset, 0),
                                                Field(&SourceQuery::page_size, 25),
                                                Field(&SourceQuery::buffer_meters, ::testing::Optional(100.0)))))
        .WillOnce(Return(page(1)));

    paginator.paginate(source_, base_);
}

TEST_F(PaginatorTest, LaterFailureKeepsAccumulatedFeatures) {
    SpatialQueryPaginator paginator({10, 50000});
    EXPECT_CALL(source_, query(_))
        .WillOnce(Return(page(10)))
        .WillOnce(Throw(NetworkError("timeout")));

    auto result = paginator.paginate(source_, base_);
    EXPECT_EQ(10u, result.features.size());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_FALSE(result.failed_on_first_page);
    EXPECT_TRUE(result.failure != nullptr);
}

TEST_F(PaginatorTest, FirstPageFailureIsFlagged) {
    SpatialQueryPaginator paginator({10, 50000});
    EXPECT_CALL(source_, query(_)).WillOnce(Throw(ParseError("bad body")));

    auto result = paginator.paginate(source_, base_);
    EXPECT_TRUE(result.failed_on_first_page);
    EXPECT_THROW(std::rethrow_exception(result.failure), ParseError);
}

TEST_F(PaginatorTest, FeaturesAreStampedWithSourceId) {
    SpatialQueryPaginator paginator({10, 50000});
    EXPECT_CALL(source_, query(_)).WillOnce(Return(page(2)));

    auto result = paginator.paginate(source_, base_);
    for (const auto& feature : result.features) {
        EXPECT_EQ("test_source", feature.source_id);
    }
}

TEST(PaginatorOptionsTest, InvalidOptionsRejected) {
    EXPECT_THROW(SpatialQueryPaginator({0, 100}), ConfigurationError);
    EXPECT_THROW(SpatialQueryPaginator({10, -1}), ConfigurationError);
}
