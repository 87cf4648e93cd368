#include "dbjob/parameters.h"
#include "dbjob/mapping/record.h"
#include "dbjob/test/test_records.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

using ::testing::ElementsAre;

namespace {

    void expectBindingError(const std::function<void()> & action, ErrorKind kind, ErrorCode code) {
        try {
            action();
            FAIL() << "no exception thrown";
        }
        catch (const JobException & ex) {
            EXPECT_EQ(ex.getKind(), kind) << ex.what();
            EXPECT_EQ(ex.getCode(), code) << ex.what();
        }
    }

} // namespace

TEST(ParameterCollection, NamedValuesKeepTypeHints) {
    ParameterCollection parameters;
    parameters
        .add("@id", 42)
        .add("name", std::string{"Ann"})
        .add("score", std::optional<double>{});

    ASSERT_EQ(parameters.size(), 3u);
    EXPECT_THAT(parameters.getNames(), ElementsAre("id", "name", "score"));

    const auto * id = parameters.find("ID");
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(id->value, Value(42));
    EXPECT_EQ(id->getEffectiveType(), ValueType::Int64);

    const auto * score = parameters.find("@score");
    ASSERT_NE(score, nullptr);
    EXPECT_TRUE(score->value.isNull());
    EXPECT_EQ(score->getEffectiveType(), ValueType::Float64);
}

TEST(ParameterCollection, DuplicateNamesAreRejected) {
    ParameterCollection parameters;
    parameters.add("id", 1);

    expectBindingError([&] { parameters.add("@ID", 2); }, ErrorKind::ParameterBindingError, ErrorCode::DuplicateParameterName);
    EXPECT_EQ(parameters.size(), 1u);
}

TEST(ParameterCollection, EmptyNameIsAConfigurationError) {
    ParameterCollection parameters;
    expectBindingError([&] { parameters.add("@", 1); }, ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration);
}

TEST(ParameterCollection, PositionalParametersMayRepeat) {
    ParameterCollection parameters;
    parameters.addPositional(Value(1)).addPositional(Value("x"));

    ASSERT_EQ(parameters.size(), 2u);
    EXPECT_TRUE(parameters.begin()->isPositional());
    EXPECT_TRUE(parameters.getNames().empty());
}

TEST(ParameterCollection, ListParameter) {
    ParameterCollection parameters;
    parameters.addList("ids", std::vector<int>{3, 5, 8});

    const auto * ids = parameters.find("ids");
    ASSERT_NE(ids, nullptr);
    ASSERT_TRUE(ids->isList());
    EXPECT_EQ(ids->list_values->size(), 3u);
    EXPECT_EQ(ids->getEffectiveType(), ValueType::Int64);
}

TEST(ParameterCollection, OutputParameter) {
    ParameterCollection parameters;
    parameters.addOutput("total", ValueType::Int64);
    parameters.addOutput("status", ValueType::String, 64, ParameterDirection::InputOutput);

    EXPECT_TRUE(parameters.find("total")->isOutput());
    EXPECT_FALSE(parameters.find("total")->isInput());
    EXPECT_TRUE(parameters.find("status")->isInput());
    EXPECT_EQ(parameters.find("status")->size, 64u);

    expectBindingError([&] { parameters.addOutput("bad", ValueType::Int64, 0, ParameterDirection::Input); },
        ErrorKind::ConfigurationError, ErrorCode::InvalidConfiguration);
}

TEST(ParameterCollection, FromCompositeRecord) {
    Person person;
    person.id = 7;
    person.name = "Bob";

    ParameterCollection parameters;
    parameters.addFor(person);

    EXPECT_THAT(parameters.getNames(), ElementsAre("Id", "Name", "Score"));
    EXPECT_EQ(parameters.find("id")->value, Value(std::int64_t{7}));
    EXPECT_TRUE(parameters.find("score")->value.isNull());
    EXPECT_EQ(parameters.find("score")->getEffectiveType(), ValueType::Float64);
}

TEST(ParameterCollection, RestrictionsFilterAndDecorate) {
    Person person;
    person.id = 7;
    person.name = "Bob";

    BindingRestrictions restrictions;
    restrictions.exclude = {"@score"};
    restrictions.prefix = "p_";

    ParameterCollection parameters;
    parameters.addFor(person, restrictions);
    EXPECT_THAT(parameters.getNames(), ElementsAre("p_Id", "p_Name"));

    BindingRestrictions only_name;
    only_name.include_only = {"NAME"};

    ParameterCollection named;
    named.addFor(person, only_name);
    EXPECT_THAT(named.getNames(), ElementsAre("Name"));
}

TEST(ParameterCollection, FromGenericRecordAndMap) {
    Record record;
    record.add("a", Value(1));
    record.add("b", Value("two"));

    std::map<std::string, double> weights{{"w1", 0.5}, {"w2", 1.5}};

    ParameterCollection parameters;
    parameters.addFor(record).addFor(weights);

    EXPECT_THAT(parameters.getNames(), ElementsAre("a", "b", "w1", "w2"));
    EXPECT_EQ(parameters.find("w2")->value, Value(1.5));
}

TEST(ParameterCollection, FlatValueBindsPositionally) {
    ParameterCollection parameters;
    parameters.addFor(std::string{"only"});

    ASSERT_EQ(parameters.size(), 1u);
    EXPECT_TRUE(parameters.begin()->isPositional());
    EXPECT_EQ(parameters.begin()->value, Value("only"));
}

TEST(ParameterCollection, SequenceSourceIsUnsupported) {
    ParameterCollection parameters;
    expectBindingError([&] { parameters.addFor(std::vector<int>{1, 2}); },
        ErrorKind::ParameterBindingError, ErrorCode::UnsupportedParameterShape);
}

TEST(ParameterCollection, MergeDetectsDuplicates) {
    ParameterCollection first;
    first.add("x", 1).addPositional(Value(2));

    ParameterCollection second;
    second.add("y", 3).addPositional(Value(4));

    first.merge(second);
    EXPECT_EQ(first.size(), 4u);

    ParameterCollection clash;
    clash.add("X", 5);
    expectBindingError([&] { first.merge(clash); }, ErrorKind::ParameterBindingError, ErrorCode::DuplicateParameterName);
}
