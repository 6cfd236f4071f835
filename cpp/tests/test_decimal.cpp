#include <boost/test/unit_test.hpp>

#include <cpamm/decimal.hpp>
#include <cpamm/errors.hpp>

using namespace cpamm;

BOOST_AUTO_TEST_SUITE(decimal_tests)

BOOST_AUTO_TEST_CASE(default_is_one) {
    BOOST_CHECK_EQUAL(Decimal(), Decimal::one());
    BOOST_CHECK_EQUAL(Decimal::one().atomics(), Decimal::fractional());
    BOOST_CHECK(Decimal::zero().is_zero());
}

BOOST_AUTO_TEST_CASE(from_ratio_truncates) {
    BOOST_CHECK_EQUAL(Decimal::from_ratio(uint256(1), uint256(3)).atomics(),
                      uint256("333333333333333333"));
    BOOST_CHECK_EQUAL(Decimal::from_ratio(uint256(3), uint256(1000)), Decimal::parse("0.003"));
    BOOST_CHECK_THROW(Decimal::from_ratio(uint256(1), uint256(0)), DegenerateState);
}

BOOST_AUTO_TEST_CASE(parse_and_print) {
    BOOST_CHECK_EQUAL(Decimal::parse("0.005").atomics(), uint256("5000000000000000"));
    BOOST_CHECK_EQUAL(Decimal::parse("1"), Decimal::one());
    BOOST_CHECK_EQUAL(Decimal::parse("12.5").to_string(), "12.5");
    BOOST_CHECK_EQUAL(Decimal::parse("0.005").to_string(), "0.005");
    BOOST_CHECK_EQUAL(Decimal::parse("0.000000000000000001").atomics(), uint256(1));
    BOOST_CHECK_EQUAL(Decimal::zero().to_string(), "0");
}

BOOST_AUTO_TEST_CASE(parse_rejects_malformed_input) {
    BOOST_CHECK_THROW(Decimal::parse(""), std::invalid_argument);
    BOOST_CHECK_THROW(Decimal::parse("1."), std::invalid_argument);
    BOOST_CHECK_THROW(Decimal::parse(".5"), std::invalid_argument);
    BOOST_CHECK_THROW(Decimal::parse("-0.5"), std::invalid_argument);
    BOOST_CHECK_THROW(Decimal::parse("0.5%"), std::invalid_argument);
    BOOST_CHECK_THROW(Decimal::parse("0.1234567890123456789"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(arithmetic) {
    const Decimal half = Decimal::parse("0.5");
    BOOST_CHECK_EQUAL(half.multiply(half), Decimal::parse("0.25"));
    BOOST_CHECK_EQUAL(Decimal::one().subtract(half), half);
    BOOST_CHECK_EQUAL(half.reverse(), Decimal::parse("2"));
    BOOST_CHECK_EQUAL(Decimal::parse("0.997").reverse().atomics(), uint256("1003009027081243731"));
    BOOST_CHECK_EQUAL(Decimal::parse("0.005").mul_floor(uint256(1000)), uint256(5));
    BOOST_CHECK_EQUAL(Decimal::parse("0.005").mul_floor(uint256(999)), uint256(4));
}

BOOST_AUTO_TEST_CASE(subtract_below_zero_and_reverse_of_zero_fail) {
    BOOST_CHECK_THROW(Decimal::parse("0.5").subtract(Decimal::one()), ArithmeticError);
    BOOST_CHECK_THROW(Decimal::zero().reverse(), DegenerateState);
}

BOOST_AUTO_TEST_CASE(ordering) {
    BOOST_CHECK(Decimal::parse("0.01") < Decimal::parse("0.1"));
    BOOST_CHECK(Decimal::parse("0.1") > Decimal::parse("0.09"));
    BOOST_CHECK(Decimal::parse("0.1") <= Decimal::parse("0.10"));
    BOOST_CHECK(Decimal::parse("0.1") != Decimal::parse("0.11"));
}

BOOST_AUTO_TEST_SUITE_END()
