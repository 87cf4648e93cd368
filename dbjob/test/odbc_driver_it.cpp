#include "dbjob/connector.h"
#include "dbjob/odbc/odbc_driver.h"
#include "dbjob/test/gtest_env.h"
#include "dbjob/test/test_records.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::ElementsAre;

class OdbcDriverTest
    : public ::testing::Test
{
protected:
    virtual void SetUp() override {
        auto & env = TestEnvironment::getInstance();
        if (!env.hasConnectionString())
            GTEST_SKIP() << "no --dsn given";

        EngineSettings settings;
        settings.pool_size = 2;
        settings.timeout = std::chrono::seconds{30};

        connector = std::make_unique<Connector>(std::make_shared<OdbcDriver>(env.getConnectionString()), settings);
    }

    std::unique_ptr<Connector> connector;
};

TEST_F(OdbcDriverTest, Scalar) {
    EXPECT_EQ(connector->scalar<int>("SELECT 42").execute(), 42);
    EXPECT_EQ(connector->scalar<std::string>("SELECT 'abc'").execute(), "abc");
}

/**
 * Given named markers, the command text is rewritten to '?' and values are bound in marker order.
 */
TEST_F(OdbcDriverTest, NamedParameters) {
    auto job = connector->readSingle<Person>(
        "SELECT CAST(@id AS INTEGER) AS Id, CAST(@name AS VARCHAR(32)) AS Name",
        ParameterCollection{}.add("name", std::string{"Ann"}).add("id", 7)
    );

    const auto person = job.execute();
    EXPECT_EQ(person.id, 7);
    EXPECT_EQ(person.name, "Ann");
    EXPECT_FALSE(person.score.has_value());
}

TEST_F(OdbcDriverTest, ListParameter) {
    auto rows = connector->readToList<int>(
        "SELECT n FROM (SELECT 1 AS n UNION ALL SELECT 2 UNION ALL SELECT 3) t WHERE n IN (@ids) ORDER BY n",
        ParameterCollection{}.addList("ids", std::vector<int>{1, 3})
    ).execute();

    EXPECT_THAT(rows, ElementsAre(1, 3));
}

TEST_F(OdbcDriverTest, DataTableColumns) {
    const auto table = connector->readToDataTable("SELECT 1 AS a, 'x' AS b, NULL AS c").execute();

    EXPECT_THAT(table.getColumnNames(), ElementsAre("a", "b", "c"));
    ASSERT_EQ(table.getRowCount(), 1u);
    EXPECT_EQ(table.at(0, 1), Value("x"));
    EXPECT_TRUE(table.at(0, 2).isNull());
}

/**
 * Given a syntax error, the job fails with the diagnostics of the driver and the connection stays pooled.
 */
TEST_F(OdbcDriverTest, SyntaxError) {
    auto result = connector->scalar<int>("SELEC 1").run();

    ASSERT_TRUE(result.isFailed());
    ASSERT_TRUE(result.getError());
    EXPECT_EQ(result.getError()->kind, ErrorKind::CommandExecutionError);
    EXPECT_EQ(result.getError()->component, Component::Driver);
    EXPECT_FALSE(result.getError()->message.empty());
    EXPECT_EQ(connector->getPool()->getIdleCount(), 1u);
}

TEST_F(OdbcDriverTest, LazyRead) {
    auto job = connector->read<int>("SELECT 1 UNION ALL SELECT 2");
    job.setBuffered(false);

    auto rows = job.execute();
    EXPECT_EQ(rows.toVector().size(), 2u);
    EXPECT_EQ(connector->getPool()->getIdleCount(), 1u);
}

TEST_F(OdbcDriverTest, TransactionInScope) {
    auto scope = connector->createScope(IsolationLevel::ReadCommitted);

    auto first = connector->scalar<int>("SELECT 1");
    first.setScope(scope);
    EXPECT_EQ(first.execute(), 1);

    auto second = connector->scalar<int>("SELECT 2");
    second.setScope(scope);
    EXPECT_EQ(second.execute(), 2);

    scope->commit();
    EXPECT_FALSE(scope->hasTransaction());
}
