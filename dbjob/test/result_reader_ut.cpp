#include "dbjob/result_reader.h"
#include "dbjob/test/fake_driver.h"
#include "dbjob/test/test_records.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class ResultReaderTest
    : public ::testing::Test
{
protected:
    ResultReader & open(std::vector<FakeSegment> segments, CommandBehavior behavior = CommandBehavior::Default, CancellationToken token = CancellationToken{}) {
        cursor = std::make_unique<FakeCursor>(database, std::move(segments));
        reader = std::make_unique<ResultReader>(*cursor, behavior, token, ColumnMapSettings{}, true);
        return *reader;
    }

    static FakeSegment ids(std::size_t count) {
        std::vector<std::vector<Value>> rows;
        for (std::size_t i = 1; i <= count; ++i) {
            rows.push_back({Value(static_cast<std::int64_t>(i))});
        }
        return makeSegment({"id"}, std::move(rows), ValueType::Int64);
    }

    static FakeSegment people() {
        return makeSegment({"Id", "Name"}, {
            {Value(1), Value("Ann")},
            {Value(2), Value("Bob")}
        });
    }

    static FakeSegment orders() {
        return makeSegment({"OrderId", "PersonId", "Placed"}, {
            {Value(10), Value(1), Value(Date{2024, 1, 2})},
            {Value(11), Value(1), Value(Date{2024, 2, 3})},
            {Value(12), Value(2), Value(Date{2024, 3, 4})}
        });
    }

    std::shared_ptr<FakeDatabase> database = std::make_shared<FakeDatabase>();
    std::unique_ptr<FakeCursor> cursor;
    std::unique_ptr<ResultReader> reader;
};

TEST_F(ResultReaderTest, FirstTakesTheFirstRow) {
    EXPECT_EQ(open({ids(3)}).first<int>(), 1);
}

TEST_F(ResultReaderTest, FirstOfEmptyResultFails) {
    try {
        open({ids(0)}).first<int>();
        FAIL() << "no exception thrown";
    }
    catch (const JobException & ex) {
        EXPECT_EQ(ex.getKind(), ErrorKind::CardinalityError);
        EXPECT_EQ(ex.getCode(), ErrorCode::EmptyResult);
    }
}

TEST_F(ResultReaderTest, FirstOrDefaultOfEmptyResult) {
    EXPECT_EQ(open({ids(0)}).firstOrDefault<int>(), std::nullopt);
    EXPECT_EQ(open({ids(2)}).firstOrDefault<int>(), std::optional<int>{1});
}

TEST_F(ResultReaderTest, SingleRequiresExactlyOneRow) {
    EXPECT_EQ(open({ids(1)}).single<int>(), 1);

    try {
        open({ids(2)}).single<int>();
        FAIL() << "no exception thrown";
    }
    catch (const JobException & ex) {
        EXPECT_EQ(ex.getKind(), ErrorKind::CardinalityError);
        EXPECT_EQ(ex.getCode(), ErrorCode::MultipleRowsFound);
    }

    EXPECT_THROW(open({ids(0)}).single<int>(), JobException);
}

TEST_F(ResultReaderTest, SingleOrDefault) {
    EXPECT_EQ(open({ids(0)}).singleOrDefault<int>(), std::nullopt);
    EXPECT_EQ(open({ids(1)}).singleOrDefault<int>(), std::optional<int>{1});
    EXPECT_THROW(open({ids(2)}).singleOrDefault<int>(), JobException);
}

TEST_F(ResultReaderTest, SingleRowStopsAfterOneRow) {
    auto & rows_reader = open({ids(5)}, CommandBehavior::SingleRow);
    EXPECT_THAT(rows_reader.toList<int>(), ElementsAre(1));
    EXPECT_EQ(rows_reader.getState(), CursorState::AfterSegment);
}

TEST_F(ResultReaderTest, SchemaOnlyFetchesNoRows) {
    std::size_t fetched = 0;
    database->setOnFetch([&] (std::size_t) {
        ++fetched;
    });

    const auto table = open({people()}, CommandBehavior::SchemaOnly).toDataTable();

    EXPECT_THAT(table.getColumnNames(), ElementsAre("Id", "Name"));
    EXPECT_EQ(table.getRowCount(), 0u);
    EXPECT_EQ(fetched, 0u);
    EXPECT_FALSE(open({ids(3)}, CommandBehavior::SchemaOnly).firstOrDefault<int>().has_value());
}

TEST_F(ResultReaderTest, SingleResultIgnoresLaterSegments) {
    auto & segments_reader = open({ids(2), ids(3)}, CommandBehavior::SingleResult);

    EXPECT_THAT(segments_reader.toList<int>(), ElementsAre(1, 2));
    EXPECT_FALSE(segments_reader.nextSegment());
    EXPECT_EQ(segments_reader.getState(), CursorState::Exhausted);
}

TEST_F(ResultReaderTest, ScalarOfEmptyResultIsDefault) {
    EXPECT_EQ(open({ids(0)}).scalar<int>(), 0);
    EXPECT_EQ(open({ids(0)}).scalar<std::string>(), "");
    EXPECT_EQ(open({makeSegment({"n"}, {{Value(42), Value(7)}})}).scalar<std::int64_t>(), 42);
}

TEST_F(ResultReaderTest, MultiMapsSegmentsToSlots) {
    auto [persons, person_orders] = open({people(), orders()}).toMulti<Person, Order>();

    ASSERT_EQ(persons.size(), 2u);
    EXPECT_EQ(persons[1].name, "Bob");

    ASSERT_EQ(person_orders.size(), 3u);
    EXPECT_EQ(person_orders[2].order_id, 12);
    EXPECT_EQ(person_orders[2].person_id, 2);
    EXPECT_EQ(person_orders[0].placed, (Date{2024, 1, 2}));
}

TEST_F(ResultReaderTest, MultiLeavesMissingSlotsEmpty) {
    auto [persons, person_orders, tags] = open({people(), orders()}).toMulti<Person, Order, Tag>();

    EXPECT_EQ(persons.size(), 2u);
    EXPECT_EQ(person_orders.size(), 3u);
    EXPECT_THAT(tags, IsEmpty());
}

TEST_F(ResultReaderTest, MultiIgnoresExtraSegments) {
    auto [persons] = open({people(), orders()}).toMulti<Person>();
    EXPECT_EQ(persons.size(), 2u);
}

TEST_F(ResultReaderTest, MultiRequiredSlotMustBeProduced) {
    RequiredSlots required;
    required.set(2);

    try {
        open({people(), orders()}).toMulti<Person, Order, Tag>(required);
        FAIL() << "no exception thrown";
    }
    catch (const JobException & ex) {
        EXPECT_EQ(ex.getKind(), ErrorKind::CardinalityError);
        EXPECT_EQ(ex.getCode(), ErrorCode::EmptyResult);
    }
}

TEST_F(ResultReaderTest, RequiredSlotMayBeEmpty) {
    RequiredSlots required;
    required.set(1);

    auto [persons, person_orders] = open({people(), makeSegment({"OrderId"}, {})}).toMulti<Person, Order>(required);
    EXPECT_EQ(persons.size(), 2u);
    EXPECT_THAT(person_orders, IsEmpty());
}

TEST_F(ResultReaderTest, DataTableKeepsEveryColumn) {
    const auto table = open({makeSegment({"a", "a", "b"}, {{Value(1), Value(2), Value::null()}})}).toDataTable();

    EXPECT_THAT(table.getColumnNames(), ElementsAre("a", "a", "b"));
    ASSERT_EQ(table.getRowCount(), 1u);
    EXPECT_EQ(table.at(0, 1), Value(2));
    EXPECT_TRUE(table.at(0, 2).isNull());
    EXPECT_EQ(table.findColumn("B"), std::optional<std::size_t>{2});
}

TEST_F(ResultReaderTest, DataSetHasOneTablePerSegment) {
    const auto tables = open({people(), orders(), ids(0)}).toDataSet();

    ASSERT_EQ(tables.size(), 3u);
    EXPECT_EQ(tables[0].getRowCount(), 2u);
    EXPECT_EQ(tables[1].getColumnCount(), 3u);
    EXPECT_EQ(tables[2].getRowCount(), 0u);
}

TEST_F(ResultReaderTest, CancellationStopsBeforeTheNextRow) {
    CancellationSource source;
    database->setOnFetch([&] (std::size_t row_index) {
        if (row_index == 2)
            source.cancel();
    });

    auto & canceled_reader = open({ids(10)}, CommandBehavior::Default, source.getToken());

    EXPECT_THAT(canceled_reader.toList<int>(), ElementsAre(1, 2, 3));
    EXPECT_TRUE(canceled_reader.wasCanceled());
    EXPECT_FALSE(canceled_reader.nextSegment());
}

TEST_F(ResultReaderTest, CanceledMultiKeepsCompletedSlots) {
    CancellationSource source;
    std::size_t fetched = 0;
    database->setOnFetch([&] (std::size_t) {
        if (++fetched == 3)
            source.cancel();
    });

    RequiredSlots required;
    required.set(1);

    auto [persons, person_orders] = open({people(), orders()}, CommandBehavior::Default, source.getToken()).toMulti<Person, Order>(required);

    EXPECT_EQ(persons.size(), 2u);
    EXPECT_THAT(person_orders, IsEmpty());
}

TEST_F(ResultReaderTest, DriverAbortedFetchStopsReading) {
    auto cancel_requested = std::make_shared<std::atomic<bool>>(false);
    database->setOnFetch([&] (std::size_t row_index) {
        if (row_index == 3)
            cancel_requested->store(true);
    });

    FakeCursor aborted_cursor(database, {ids(10), ids(2)}, cancel_requested);
    ResultReader aborted_reader(aborted_cursor, CommandBehavior::Default, CancellationToken{}, ColumnMapSettings{}, true);

    EXPECT_THAT(aborted_reader.toList<int>(), ElementsAre(1, 2, 3));
    EXPECT_TRUE(aborted_reader.wasCanceled());
    EXPECT_FALSE(aborted_reader.nextSegment());
}

TEST_F(ResultReaderTest, CanceledBeforeReadingReturnsNothing) {
    CancellationSource source;
    source.cancel();

    auto & canceled_reader = open({ids(3), ids(2)}, CommandBehavior::Default, source.getToken());
    EXPECT_THAT(canceled_reader.toDataSet(), IsEmpty());
    EXPECT_EQ(canceled_reader.first<int>(), 0);
}
