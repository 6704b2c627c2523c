#include "alpha_vantage.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <utility>

using json = nlohmann::json;

// ── HTTP (libcurl) ──────────────────────────────────────────

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    out->append(ptr, total);
    return total;
}

static std::string escape(CURL* curl, const std::string& s) {
    char* esc = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
    if (!esc) return s;
    std::string out(esc);
    curl_free(esc);
    return out;
}

static Result<std::string> http_get_quote(const std::string& base_url,
                                          const std::string& ticker,
                                          const std::string& api_key) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Result<std::string>::Err("Failed to initialize HTTP client");
    }

    std::string query = fmt::format("function={}&symbol={}", ALPHA_VANTAGE_FUNC, escape(curl, ticker));
    std::string url = base_url + "?" + query + "&apikey=" + escape(curl, api_key);
    worth_log(fmt::format("quote: GET {}?{}", base_url, query));

    std::string body;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "X-Requested-With: Curl");
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, QUOTE_TIMEOUT_SECS);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return Result<std::string>::Err(fmt::format("Quote request failed: {}", curl_easy_strerror(res)));
    }
    worth_log(fmt::format("quote: HTTP {} ({} bytes)", status, body.size()));
    if (status < 200 || status >= 300) {
        return Result<std::string>::Err(fmt::format("Quote request failed: HTTP {}", status));
    }
    return Result<std::string>::Ok(body);
}

// ── Provider ────────────────────────────────────────────────

AlphaVantageProvider::AlphaVantageProvider(std::string api_key, std::string base_url)
    : api_key_(std::move(api_key)), base_url_(std::move(base_url)) {}

Result<Quote> AlphaVantageProvider::fetch(const std::string& ticker) {
    auto body = http_get_quote(base_url_, ticker, api_key_);
    if (body.is_err()) {
        return Result<Quote>::Err(body.error);
    }
    return parse_global_quote(body.value);
}

Result<Quote> parse_global_quote(const std::string& body) {
    try {
        json data = json::parse(body);
        if (!data.is_object()) {
            return Result<Quote>::Err("Malformed quote response: expected a JSON object");
        }

        // Alpha Vantage answers bad keys, bad symbols and rate limits with 200
        for (const char* key : {"Error Message", "Note", "Information"}) {
            auto it = data.find(key);
            if (it != data.end() && it->is_string()) {
                return Result<Quote>::Err("Quote provider: " + it->get<std::string>());
            }
        }

        auto gq = data.find("Global Quote");
        if (gq == data.end() || !gq->is_object() || gq->empty()) {
            return Result<Quote>::Err("Quote response has no \"Global Quote\" for the requested symbol");
        }

        auto price_it = gq->find("05. price");
        if (price_it == gq->end() || !price_it->is_string()) {
            return Result<Quote>::Err("Quote response is missing \"05. price\"");
        }
        auto price = parse_decimal(price_it->get<std::string>());
        if (price.is_err()) {
            return Result<Quote>::Err("Invalid price in quote: " + price.error);
        }

        Quote quote;
        quote.symbol = gq->value("01. symbol", std::string{});
        quote.latest_trading_day = gq->value("07. latest trading day", std::string{});
        quote.price = price.value;
        return Result<Quote>::Ok(quote);
    } catch (const json::exception& e) {
        return Result<Quote>::Err(std::string("Malformed quote response: ") + e.what());
    }
}
