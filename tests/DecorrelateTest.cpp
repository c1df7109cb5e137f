#include "decorr/core/Errors.hpp"
#include "decorr/preprocess/Decorrelate.hpp"
#include "decorr/preprocess/Subsampling.hpp"

#include "TestData.hpp"

#include <boost/test/unit_test.hpp>

#include <vector>

BOOST_AUTO_TEST_SUITE(DecorrelateTest)

using namespace decorr;
using namespace decorr::preprocess;

using TDoubleVec = std::vector<double>;

namespace {

const TDoubleVec LAMBDAS{0.0, 0.5, 1.0};

TimeSeriesTable small_u_nk() {
  // Integer samples keep every energy difference exact.
  return test::u_nk_table(LAMBDAS, {TDoubleVec{2.0, -4.0}, TDoubleVec{6.0}, TDoubleVec{-8.0, 10.0}});
}

TimeSeriesTable correlated_u_nk(std::size_t n) {
  return test::u_nk_table(LAMBDAS, {test::ar1(n, 0.8, 61), test::ar1(n, 0.8, 62), test::ar1(n, 0.8, 63)});
}

}

BOOST_AUTO_TEST_CASE(testMethodNames) {
  BOOST_REQUIRE(parse_unk_method("dhdl") == UNkMethod::DHdl);
  BOOST_REQUIRE(parse_unk_method("DHDL_ALL") == UNkMethod::DHdlAll);
  BOOST_REQUIRE(parse_unk_method("dE") == UNkMethod::DE);
  BOOST_REQUIRE(parse_unk_method("de") == UNkMethod::DE);
  BOOST_REQUIRE_THROW(parse_unk_method("bar"), ValidationError);
  BOOST_REQUIRE_EQUAL("dhdl_all", unk_method_name(UNkMethod::DHdlAll));
  BOOST_REQUIRE_EQUAL("dE", unk_method_name(UNkMethod::DE));
}

BOOST_AUTO_TEST_CASE(testDHdlReference) {
  // Adjacent column is the next state, the previous one for the last state.
  const auto s = u_nk_reference_series(small_u_nk(), UNkMethod::DHdl);
  BOOST_REQUIRE(TDoubleVec(s.values().begin(), s.values().end()) == (TDoubleVec{1.0, -2.0, 3.0, 4.0, -5.0}));
  BOOST_REQUIRE_EQUAL("dhdl", s.name());
}

BOOST_AUTO_TEST_CASE(testDHdlAllReference) {
  const auto s = u_nk_reference_series(small_u_nk(), UNkMethod::DHdlAll);
  BOOST_REQUIRE(TDoubleVec(s.values().begin(), s.values().end()) == (TDoubleVec{3.0, -6.0, 0.0, 12.0, -15.0}));
}

BOOST_AUTO_TEST_CASE(testDEReference) {
  const auto s = u_nk_reference_series(small_u_nk(), UNkMethod::DE);
  BOOST_REQUIRE(TDoubleVec(s.values().begin(), s.values().end()) == (TDoubleVec{3.0, 6.0, 6.0, 12.0, 15.0}));
}

BOOST_AUTO_TEST_CASE(testDerivativeTableIsRejected) {
  const auto dhdl = test::dhdl_table({test::ar1(100, 0.5, 64), test::ar1(100, 0.5, 65)}, {"coul", "vdw"});
  BOOST_REQUIRE_THROW(decorrelate_u_nk(dhdl), DomainMismatchError);
  BOOST_REQUIRE_THROW(decorrelate_u_nk(dhdl, UNkMethod::DE), DomainMismatchError);
  BOOST_REQUIRE_THROW(decorrelate_u_nk(dhdl, UNkMethod::DHdlAll), DomainMismatchError);

  // Sampled state without a column of its own.
  ColumnSchema schema;
  schema.ensure_state(LambdaState::scalar(0.0));
  schema.ensure_state(LambdaState::scalar(0.5));
  TimeSeriesTable odd(schema, test::attrs());
  odd.append_row(0.0, LambdaState::scalar(0.25), TDoubleVec{1.0, 2.0});
  BOOST_REQUIRE_THROW(u_nk_reference_series(odd, UNkMethod::DHdlAll), DomainMismatchError);
}

BOOST_AUTO_TEST_CASE(testSingleStateColumn) {
  const auto t = test::u_nk_table({0.0}, {test::ar1(200, 0.5, 66)});
  BOOST_REQUIRE_THROW(u_nk_reference_series(t, UNkMethod::DHdl), DomainMismatchError);
  BOOST_REQUIRE_THROW(u_nk_reference_series(t, UNkMethod::DE), DomainMismatchError);
  BOOST_REQUIRE_NO_THROW(u_nk_reference_series(t, UNkMethod::DHdlAll));
}

BOOST_AUTO_TEST_CASE(testDecorrelateUNkMultipleStates) {
  const auto t = correlated_u_nk(1000);
  for (auto method : {UNkMethod::DHdl, UNkMethod::DHdlAll, UNkMethod::DE}) {
    const auto s = decorrelate_u_nk(t, method);
    BOOST_TEST_MESSAGE(unk_method_name(method) << ": " << s.size() << " of " << t.size());
    BOOST_REQUIRE(s.size() < t.size());
    BOOST_REQUIRE(s.schema() == t.schema());
    BOOST_REQUIRE(s.attrs() == t.attrs());
    const auto counts = s.rows_per_state();
    BOOST_REQUIRE_EQUAL(3u, counts.size());
    for (std::size_t i = 0; i < counts.size(); ++i) {
      BOOST_REQUIRE(counts[i].first == LambdaState::scalar(LAMBDAS[i]));
      BOOST_REQUIRE(counts[i].second <= 1000);
    }
  }
}

BOOST_AUTO_TEST_CASE(testDecorrelateUNkRoutesBurnin) {
  const auto t = correlated_u_nk(600);
  const auto ref = u_nk_reference_series(t, UNkMethod::DHdlAll);

  DecorrelateOptions opt;
  opt.conservative = true;
  SubsampleOptions sopt;
  sopt.conservative = true;
  BOOST_REQUIRE(decorrelate_u_nk(t, UNkMethod::DHdlAll, opt) == equilibrium_detection(t, ref, sopt));

  opt.remove_burnin = false;
  BOOST_REQUIRE(decorrelate_u_nk(t, UNkMethod::DHdlAll, opt) == statistical_inefficiency(t, ref, sopt));
}

BOOST_AUTO_TEST_CASE(testDecorrelateUNkSortsAndDrops) {
  const auto t = correlated_u_nk(400);
  const auto mixed = test::sorted_by_time(TimeSeriesTable::concat({t, t}));
  DecorrelateOptions opt;
  opt.sort = true;
  opt.drop_duplicates = true;
  const auto s = decorrelate_u_nk(mixed, UNkMethod::DHdl, opt);
  BOOST_REQUIRE(s.size() <= t.size());

  opt.drop_duplicates = false;
  BOOST_REQUIRE_THROW(decorrelate_u_nk(mixed, UNkMethod::DHdl, opt), OrderingError);
}

BOOST_AUTO_TEST_CASE(testDecorrelateDHdl) {
  const auto one = test::dhdl_table(test::ar1(800, 0.8, 67));
  BOOST_REQUIRE(decorrelate_dhdl(one) == equilibrium_detection(one, one.column_series(0)));

  const auto two = test::dhdl_table({test::ar1(800, 0.8, 68), test::ar1(800, 0.8, 69)}, {"coul", "vdw"},
                                    LambdaState(TDoubleVec{0.0, 0.5}));
  BOOST_REQUIRE(dhdl_reference_series(two).name() == "row_sum");
  DecorrelateOptions opt;
  opt.remove_burnin = false;
  const auto s = decorrelate_dhdl(two, opt);
  BOOST_REQUIRE(s == statistical_inefficiency(two, two.row_sum()));
  BOOST_REQUIRE(s.size() < two.size());

  const TimeSeriesTable empty(ColumnSchema(), test::attrs());
  BOOST_REQUIRE_THROW(decorrelate_dhdl(empty), DomainMismatchError);
}

BOOST_AUTO_TEST_CASE(testDecorrelateDHdlOnEnergyTable) {
  // Any table is summed across its columns.
  const auto t = correlated_u_nk(500);
  const auto s = decorrelate_dhdl(t);
  BOOST_REQUIRE(s.size() <= t.size());
  BOOST_REQUIRE_EQUAL(3u, s.rows_per_state().size());
}

BOOST_AUTO_TEST_SUITE_END()
