/**
 * @file WeatherService.cpp
 * @brief Open-Meteo cloud cover client
 */

#include "WeatherService.hpp"
#include "Logger.hpp"
#include "ShadeErrors.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace shade {

namespace {

long long floor_div(long long value, long long divisor) {
    long long q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

// "YYYY-MM-DDTHH:MM" in the payload's local time
std::optional<long long> parse_local_hour(const std::string& text, long long utc_offset_seconds) {
    if (text.size() < 13 || text[10] != 'T') {
        return std::nullopt;
    }
    auto date = CivilDate::parse(text.substr(0, 10));
    if (!date) {
        return std::nullopt;
    }
    int hour = 0;
    int minute = 0;
    try {
        hour = std::stoi(text.substr(11, 2));
        if (text.size() >= 16 && text[13] == ':') {
            minute = std::stoi(text.substr(14, 2));
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        return std::nullopt;
    }
    return date->days_since_epoch() * 86400 + hour * 3600 + minute * 60 - utc_offset_seconds;
}

} // namespace

// Callback for CURL to write response data
static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// ============================================================================
// CloudCoverTable
// ============================================================================

long long CloudCoverTable::nearest_hour(long long utc_seconds) {
    return floor_div(utc_seconds + 1800, 3600) * 3600;
}

void CloudCoverTable::set(long long hour_utc_seconds, double cloud_cover_pct) {
    samples_[nearest_hour(hour_utc_seconds)] = cloud_cover_pct;
}

std::optional<double> CloudCoverTable::lookup(long long utc_seconds) const {
    auto it = samples_.find(nearest_hour(utc_seconds));
    if (it == samples_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double CloudCoverTable::at(long long utc_seconds) const {
    auto value = lookup(utc_seconds);
    if (!value) {
        throw WeatherLookupError("no cloud cover sample for UTC hour " +
                                 std::to_string(nearest_hour(utc_seconds)));
    }
    return *value;
}

// ============================================================================
// WeatherService
// ============================================================================

WeatherService::WeatherService()
    : options_() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

WeatherService::WeatherService(const Options& options)
    : options_(options) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

std::string WeatherService::build_url(const GeoPoint& location, const CivilDate& date) const {
    std::ostringstream url;
    url << options_.api_url << "?";
    url << std::fixed << std::setprecision(4);
    url << "latitude=" << location.lat;
    url << "&longitude=" << location.lon;
    url << "&hourly=cloud_cover";
    url << "&timezone=GMT";
    url << "&start_date=" << date.plus_days(-1).to_string();
    url << "&end_date=" << date.plus_days(1).to_string();
    return url.str();
}

CloudCoverTable WeatherService::fetch(const GeoPoint& location, const CivilDate& date) const {
    Logger logger("WeatherService");

    std::string url = build_url(location, date);
    logger.info("Fetching cloud cover for " + date.to_string());
    logger.debug("Weather URL: " + url);

    CloudCoverTable table = parse_response(make_http_request(url));
    logger.detailed("Received " + std::to_string(table.size()) + " hourly cloud cover samples");
    return table;
}

std::string WeatherService::make_http_request(const std::string& url) const {
    Logger logger("WeatherService");
    std::string response_data;

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw WeatherLookupError("failed to initialize CURL");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        std::string reason = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw WeatherLookupError("request failed: " + reason);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_easy_cleanup(curl);

    if (http_code != 200) {
        throw WeatherLookupError("HTTP error " + std::to_string(http_code));
    }

    logger.trace("Weather response: " + std::to_string(response_data.size()) + " bytes");
    return response_data;
}

CloudCoverTable WeatherService::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw WeatherLookupError("cannot open weather file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Logger logger("WeatherService");
    logger.detailed("Reading cloud cover from " + path);
    return parse_response(buffer.str());
}

CloudCoverTable WeatherService::parse_response(const std::string& json_text) {
    Logger logger("WeatherService");
    CloudCoverTable table;

    try {
        auto j = json::parse(json_text);

        if (j.contains("error") && j["error"].is_boolean() && j["error"].get<bool>()) {
            throw WeatherLookupError("API error: " + j.value("reason", std::string("unknown")));
        }
        if (!j.contains("hourly") || !j["hourly"].is_object()) {
            throw WeatherLookupError("response has no hourly block");
        }

        const auto& hourly = j["hourly"];
        if (!hourly.contains("time") || !hourly.contains("cloud_cover") ||
            !hourly["time"].is_array() || !hourly["cloud_cover"].is_array()) {
            throw WeatherLookupError("hourly block lacks time or cloud_cover");
        }

        const long long offset = j.value("utc_offset_seconds", 0LL);
        const auto& times = hourly["time"];
        const auto& covers = hourly["cloud_cover"];
        if (times.size() != covers.size()) {
            logger.warning("Weather payload has mismatched time and cloud_cover lengths");
        }

        const size_t count = std::min(times.size(), covers.size());
        for (size_t i = 0; i < count; ++i) {
            if (!times[i].is_string() || !covers[i].is_number()) {
                continue;
            }
            auto utc = parse_local_hour(times[i].get<std::string>(), offset);
            if (!utc) {
                logger.debug("Skipping malformed weather time " + times[i].get<std::string>());
                continue;
            }
            table.set(*utc, covers[i].get<double>());
        }
    } catch (const json::exception& e) {
        throw WeatherLookupError("JSON parsing error: " + std::string(e.what()));
    }

    if (table.empty()) {
        throw WeatherLookupError("response contains no cloud cover samples");
    }
    return table;
}

} // namespace shade
