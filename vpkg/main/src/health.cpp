#include "health.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

HttpHealthProbe::HttpHealthProbe(std::string url, long timeout_seconds)
    : url_(std::move(url)), timeout_seconds_(timeout_seconds) {}

bool HttpHealthProbe::healthy() {
    try {
        HttpResponse response = http_get(url_, timeout_seconds_);
        if (!response.ok()) {
            log_warning(string_format("warning.health_bad_status", url_, response.status));
            return false;
        }
        auto body = nlohmann::json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            log_warning(string_format("warning.health_bad_body", url_));
            return false;
        }
        auto status = body.find("status");
        if (status == body.end() || !status->is_string() || status->get<std::string>() != "healthy") {
            log_warning(string_format("warning.health_unhealthy", url_));
            return false;
        }
        return true;
    } catch (const VpkgException& e) {
        log_warning(string_format("warning.health_unreachable", url_, e.what()));
        return false;
    }
}
