// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxClient::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;
    int write_count = 0;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

// Response body is not needed, only the status code
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    (void)contents;
    (void)userp;
    return size * nmemb;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxClient::InfluxClient(const Config& config)
    : config_(config)
    , last_write_time_(-1e18)  // Force first write
    , impl_(std::make_unique<Impl>())
{
    if (!config_.enabled) {
        LOG_INFO("[InfluxDB] Client created but disabled (use --influx flag to enable)");
        return;
    }

    std::ostringstream url_builder;
    url_builder << config_.url << "/api/v2/write"
                << "?org=" << config_.org
                << "&bucket=" << config_.bucket
                << "&precision=ns";
    impl_->write_url = url_builder.str();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");

    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
        LOG_INFO("[InfluxDB] Authentication enabled (token configured)");
    } else {
        LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, 5L);

    LOG_INFO("[InfluxDB] Client initialized: url=%s org=%s bucket=%s interval=%.1fs",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
             config_.write_interval_s);
}

InfluxClient::~InfluxClient() {
    if (config_.enabled) {
        flush();
        LOG_INFO("[InfluxDB] Client shutdown");
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxClient::write_plan(const optim::Schedule& schedule,
                              const optim::ShadowPrice& shadow,
                              const optim::Diagnostics& diag,
                              control::EffectiveMode effective,
                              int64_t start_ns)
{
    if (!config_.enabled || schedule.empty()) {
        return false;
    }
    return send_to_influx(build_plan_lines(schedule, shadow, diag, effective, start_ns));
}

bool InfluxClient::write_control(const control::ControlAction& action,
                                 const control::LiveMeasurement& live,
                                 double soc_percent,
                                 double now_s)
{
    if (!config_.enabled) {
        return false;
    }

    if ((now_s - last_write_time_) < config_.write_interval_s) {
        return false;
    }
    last_write_time_ = now_s;

    return send_to_influx(build_control_line(action, live, soc_percent, wall_clock_time_ns()));
}

void InfluxClient::flush() {
    // Writes are synchronous, nothing is buffered
}

// ============================================================================
// Line Protocol Builders
// ============================================================================

std::string InfluxClient::build_plan_lines(const optim::Schedule& schedule,
                                           const optim::ShadowPrice& shadow,
                                           const optim::Diagnostics& diag,
                                           control::EffectiveMode effective,
                                           int64_t start_ns)
{
    std::ostringstream out;
    const int64_t step_ns = static_cast<int64_t>(std::llround(schedule.step_hours * 3600.0 * 1e9));

    for (std::size_t t = 0; t < schedule.size(); ++t) {
        const auto& s = schedule.steps[t];

        out << "battery_plan"
            << ",mode=" << optim::to_string(s.mode)
            << " "
            << "step=" << t << "i,"
            << "power_w=" << s.power_w << ","
            << "soc_wh=" << s.soc_wh << ","
            << "cost=" << s.cost << ","
            << "profit_loss=" << s.profit_loss;

        // Plan-level values ride on the first point
        if (t == 0) {
            out << ",effective_mode=\"" << control::to_string(effective) << "\""
                << ",shadow_price=" << shadow.price
                << ",charge_threshold=" << shadow.charge_threshold
                << ",discharge_threshold=" << shadow.discharge_threshold
                << ",total_cost=" << diag.total_cost
                << ",baseline_cost=" << diag.baseline_cost
                << ",savings=" << diag.savings;
        }

        out << " " << (start_ns + static_cast<int64_t>(t) * step_ns) << "\n";
    }
    return out.str();
}

std::string InfluxClient::build_control_line(const control::ControlAction& action,
                                             const control::LiveMeasurement& live,
                                             double soc_percent,
                                             int64_t timestamp_ns)
{
    std::ostringstream line;

    line << "battery_control"
         << ",mode=" << control::to_string(action.mode)
         << ",action=" << control::to_string(action.label);

    line << " "
         << "target_w=" << action.target_w << ","
         << "raw_target_w=" << action.raw_target_w << ","
         << "inert=" << (action.inert ? "true" : "false");

    // Missing telemetry is omitted rather than written as 0
    if (live.grid_w) {
        line << ",grid_w=" << *live.grid_w;
    }
    if (live.battery_w) {
        line << ",battery_w=" << *live.battery_w;
    }
    if (std::isfinite(soc_percent)) {
        line << ",soc_pct=" << soc_percent;
    }

    line << " " << timestamp_ns;
    return line.str();
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool InfluxClient::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

    CURLcode res = curl_easy_perform(impl_->curl);

    if (res != CURLE_OK) {
        LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 204) {  // InfluxDB returns 204 No Content on success
        LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        return false;
    }

    impl_->write_count++;
    if (impl_->write_count == 1) {
        LOG_INFO("[InfluxDB] First write successful");
    } else if (impl_->write_count % 100 == 0) {
        LOG_INFO("[InfluxDB] Successfully wrote %d batches", impl_->write_count);
    }

    return true;
}

// ============================================================================
// Time Conversion
// ============================================================================

int64_t InfluxClient::wall_clock_time_ns() {
    auto now = std::chrono::system_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch());
    return ns.count();
}

} // namespace utils
