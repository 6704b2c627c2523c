#pragma once

#include <string>
#include <core/constants.hpp>
#include "quote_provider.hpp"

// Quote provider backed by the Alpha Vantage GLOBAL_QUOTE endpoint (libcurl).
class AlphaVantageProvider : public QuoteProvider {
public:
    explicit AlphaVantageProvider(std::string api_key,
                                  std::string base_url = ALPHA_VANTAGE_URL);

    Result<Quote> fetch(const std::string& ticker) override;

private:
    std::string api_key_;
    std::string base_url_;
};

// Parse a GLOBAL_QUOTE response body:
//   {"Global Quote": {"01. symbol": "ACME", "05. price": "25.0000", ...}}
// API-level failures ("Error Message", "Note", "Information") and an empty
// "Global Quote" object (unknown symbol) are returned as errors.
Result<Quote> parse_global_quote(const std::string& body);
