#pragma once

#include <string>
#include <core/types.hpp>

// Source of the current price for a ticker.
class QuoteProvider {
public:
    virtual ~QuoteProvider() = default;

    // One blocking request; no retries.
    virtual Result<Quote> fetch(const std::string& ticker) = 0;
};
