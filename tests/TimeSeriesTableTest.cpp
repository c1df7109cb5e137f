#include "decorr/core/TimeSeriesTable.hpp"
#include "decorr/util/Parse.hpp"

#include "TestData.hpp"

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(TimeSeriesTableTest)

using namespace decorr;

using TDoubleVec = std::vector<double>;

BOOST_AUTO_TEST_CASE(testLambdaStateText) {
  BOOST_REQUIRE_EQUAL("0.5", LambdaState::scalar(0.5).to_string());
  BOOST_REQUIRE_EQUAL("(0,0.25)", LambdaState(TDoubleVec{0.0, 0.25}).to_string());
  BOOST_REQUIRE_EQUAL("coul-01", LambdaState(std::string("coul-01")).to_string());
  BOOST_REQUIRE(LambdaState(std::string("a")).is_labeled());
  BOOST_REQUIRE(LambdaState().empty());

  auto s = parse_lambda_state("(0, 0.25)");
  BOOST_REQUIRE(s);
  BOOST_REQUIRE(*s == LambdaState(TDoubleVec{0.0, 0.25}));
  s = parse_lambda_state("1");
  BOOST_REQUIRE(s);
  BOOST_REQUIRE(*s == LambdaState::scalar(1.0));
  BOOST_REQUIRE(!parse_lambda_state("fep"));
  BOOST_REQUIRE(!parse_lambda_state("(0,x)"));
}

BOOST_AUTO_TEST_CASE(testColumnSchema) {
  ColumnSchema schema;
  BOOST_REQUIRE_EQUAL(0u, schema.ensure("coul"));
  BOOST_REQUIRE_EQUAL(1u, schema.ensure_state(LambdaState::scalar(0.5)));
  BOOST_REQUIRE_EQUAL(0u, schema.ensure("coul"));
  BOOST_REQUIRE_EQUAL(1u, schema.ensure_state(LambdaState::scalar(0.5)));
  BOOST_REQUIRE_THROW(schema.ensure("0.5"), std::runtime_error);

  BOOST_REQUIRE(schema.find_state(LambdaState::scalar(0.5)));
  BOOST_REQUIRE(!schema.find_state(LambdaState::scalar(1.0)));
  BOOST_REQUIRE(schema.state_columns() == std::vector<std::size_t>{1});
  BOOST_REQUIRE_THROW(schema.require("vdw"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(testAppendAndAccess) {
  ColumnSchema schema;
  schema.ensure("a");
  schema.ensure("b");
  TimeSeriesTable t(schema, test::attrs(310.0));

  t.append_row(0.0, LambdaState::scalar(0.0), TDoubleVec{1.0, 2.0});
  t.append_row(1.0, LambdaState::scalar(0.0), TDoubleVec{3.0, std::numeric_limits<double>::quiet_NaN()});
  t.append_row(0.0, LambdaState::scalar(1.0), TDoubleVec{5.0, 6.0});
  BOOST_REQUIRE_THROW(t.append_row(2.0, LambdaState::scalar(0.0), TDoubleVec{1.0}), std::runtime_error);

  BOOST_REQUIRE_EQUAL(3u, t.size());
  BOOST_REQUIRE_EQUAL(2u, t.n_columns());
  BOOST_REQUIRE_EQUAL(3.0, t.value(1, 0));
  BOOST_REQUIRE(!t.row_has_missing(0));
  BOOST_REQUIRE(t.row_has_missing(1));

  const auto b = t.column_series("b");
  BOOST_REQUIRE_EQUAL("b", b.name());
  BOOST_REQUIRE_EQUAL(6.0, b.value(2));
  BOOST_REQUIRE_THROW(t.column_series("c"), std::runtime_error);

  const auto sum = t.row_sum();
  BOOST_REQUIRE_EQUAL(3.0, sum.value(0));
  BOOST_REQUIRE(std::isnan(sum.value(1)));
  BOOST_REQUIRE_EQUAL(11.0, sum.value(2));

  const auto counts = t.rows_per_state();
  BOOST_REQUIRE_EQUAL(2u, counts.size());
  BOOST_REQUIRE(counts[0].first == LambdaState::scalar(0.0));
  BOOST_REQUIRE_EQUAL(2u, counts[0].second);
  BOOST_REQUIRE(counts[1].first == LambdaState::scalar(1.0));
  BOOST_REQUIRE_EQUAL(1u, counts[1].second);
}

BOOST_AUTO_TEST_CASE(testTakeCopiesAttrs) {
  const auto t = test::dhdl_table(TDoubleVec{1.0, 2.0, 3.0, 4.0}, 10.0, 0.0, test::attrs(310.0, EnergyUnit::KJPerMol));
  const std::vector<std::size_t> rows{3, 1};
  const auto s = t.take(rows);
  BOOST_REQUIRE_EQUAL(2u, s.size());
  BOOST_REQUIRE_EQUAL(30.0, s.time(0));
  BOOST_REQUIRE_EQUAL(2.0, s.value(1, 0));
  BOOST_REQUIRE(s.attrs() == t.attrs());
  BOOST_REQUIRE(s.schema() == t.schema());
  BOOST_REQUIRE(t.take(test::range(0, t.size())) == t);
}

BOOST_AUTO_TEST_CASE(testConcat) {
  const auto a = test::dhdl_table({TDoubleVec{1.0, 2.0}}, {"fep"}, LambdaState::scalar(0.0));
  const auto b = test::dhdl_table({TDoubleVec{3.0}}, {"fep"}, LambdaState::scalar(1.0));
  const auto c = TimeSeriesTable::concat({a, b, a});
  BOOST_REQUIRE_EQUAL(5u, c.size());
  BOOST_REQUIRE_EQUAL(2u, c.index().states().size());
  BOOST_REQUIRE(c.state(4) == LambdaState::scalar(0.0));
  BOOST_REQUIRE_EQUAL(2.0, c.value(4, 0));

  const auto hot = test::dhdl_table(TDoubleVec{1.0}, 1.0, 0.0, test::attrs(350.0));
  BOOST_REQUIRE_THROW(TimeSeriesTable::concat({a, hot}), std::runtime_error);
  const auto other = test::dhdl_table({TDoubleVec{1.0}}, {"coul"});
  BOOST_REQUIRE_THROW(TimeSeriesTable::concat({a, other}), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(testSeries) {
  const auto t = test::dhdl_table(TDoubleVec{1.0, 2.0, 3.0});
  const auto s = t.column_series(0);
  const auto r = s.reversed();
  BOOST_REQUIRE_EQUAL(3.0, r.value(0));
  BOOST_REQUIRE_EQUAL(2.0, r.time(0));

  Series built("x");
  built.append(0.0, LambdaState::scalar(0.0), 7.0);
  built.append(1.0, LambdaState::scalar(0.5), 8.0);
  BOOST_REQUIRE_EQUAL(2u, built.index().states().size());

  const auto back = TimeSeriesTable::from_series(built, test::attrs());
  BOOST_REQUIRE_EQUAL(1u, back.n_columns());
  BOOST_REQUIRE_EQUAL("x", back.schema().info(0).name);
  BOOST_REQUIRE_EQUAL(8.0, back.value(1, 0));

  BOOST_REQUIRE_THROW(Series("y", t.index(), TDoubleVec{1.0}), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
