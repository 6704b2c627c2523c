#include <gtest/gtest.h>
#include <quote/alpha_vantage.hpp>

static const char* GOOD_BODY = R"({
    "Global Quote": {
        "01. symbol": "ACME",
        "02. open": "24.1000",
        "03. high": "25.3000",
        "04. low": "23.9000",
        "05. price": "25.0000",
        "06. volume": "1234567",
        "07. latest trading day": "2024-05-17",
        "08. previous close": "24.0000",
        "09. change": "1.0000",
        "10. change percent": "4.1667%"
    }
})";

TEST(AlphaVantage, ParsesGlobalQuote) {
    auto r = parse_global_quote(GOOD_BODY);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.symbol, "ACME");
    EXPECT_DOUBLE_EQ(r.value.price, 25.0);
    EXPECT_EQ(r.value.latest_trading_day, "2024-05-17");
}

TEST(AlphaVantage, OnlyPriceRequired) {
    auto r = parse_global_quote(R"({"Global Quote": {"05. price": "101.25"}})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_DOUBLE_EQ(r.value.price, 101.25);
    EXPECT_EQ(r.value.symbol, "");
}

TEST(AlphaVantage, EmptyGlobalQuoteIsUnknownSymbol) {
    auto r = parse_global_quote(R"({"Global Quote": {}})");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Global Quote"), std::string::npos);
}

TEST(AlphaVantage, ErrorMessageSurfaced) {
    auto r = parse_global_quote(R"({"Error Message": "Invalid API call."})");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Invalid API call."), std::string::npos);
}

TEST(AlphaVantage, RateLimitNoteSurfaced) {
    auto r = parse_global_quote(R"({"Note": "Thank you for using Alpha Vantage! Our standard API call frequency is 5 calls per minute."})");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("call frequency"), std::string::npos);
}

TEST(AlphaVantage, InformationSurfaced) {
    auto r = parse_global_quote(R"({"Information": "The **demo** API key is for demo purposes only."})");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("demo"), std::string::npos);
}

TEST(AlphaVantage, NonNumericPrice) {
    auto r = parse_global_quote(R"({"Global Quote": {"01. symbol": "ACME", "05. price": "n/a"}})");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Invalid price"), std::string::npos);
}

TEST(AlphaVantage, MissingPrice) {
    auto r = parse_global_quote(R"({"Global Quote": {"01. symbol": "ACME"}})");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("05. price"), std::string::npos);
}

TEST(AlphaVantage, NumericPriceFieldRejected) {
    auto r = parse_global_quote(R"({"Global Quote": {"05. price": 25.0}})");
    EXPECT_TRUE(r.is_err());
}

TEST(AlphaVantage, NotJson) {
    auto r = parse_global_quote("<html>502 Bad Gateway</html>");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Malformed"), std::string::npos);
}

TEST(AlphaVantage, RootNotObject) {
    EXPECT_TRUE(parse_global_quote("[1, 2, 3]").is_err());
    EXPECT_TRUE(parse_global_quote("").is_err());
}
