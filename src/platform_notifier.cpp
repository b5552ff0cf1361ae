// SPDX-License-Identifier: Apache-2.0
#include "platform_notifier.hpp"

#include <mutex>

#include <curl/curl.h>
#include <everest/logging.hpp>

namespace pilegate {

namespace {
size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}
} // namespace

nlohmann::json PlatformEvent::to_json() const {
    return nlohmann::json{{"event_type", event_type}, {"data", data}, {"timestamp", to_iso8601(timestamp)}};
}

PlatformNotifier::PlatformNotifier(const PlatformConfig& cfg, Transport transport) :
    cfg_(cfg), transport_(std::move(transport)), url_(events_url(cfg.base_url)) {
    if (cfg_.queue_size == 0) {
        cfg_.queue_size = 1;
    }
    if (cfg_.retry_count < 0) {
        cfg_.retry_count = 0;
    }
    if (!transport_) {
        transport_ = [this](const std::string& url, const std::string& body, std::string& error) {
            return post_json(url, body, error);
        };
    }
    if (!cfg_.enabled || cfg_.base_url.empty()) {
        EVLOG_info << "Business platform notifications disabled";
        return;
    }
    const int workers = cfg_.workers > 0 ? cfg_.workers : 1;
    for (int i = 0; i < workers; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    EVLOG_info << "Business platform notifier posting to " << url_ << " with " << workers << " worker(s)";
}

PlatformNotifier::~PlatformNotifier() {
    shutdown();
}

std::string PlatformNotifier::events_url(const std::string& base_url) {
    auto base = base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/api/v1/events";
}

void PlatformNotifier::notify(const std::string& event_type, const nlohmann::json& payload) {
    PlatformEvent event;
    event.event_type = event_type;
    event.data = payload;
    if (workers_.empty()) {
        EVLOG_debug << "Platform event (not sent) " << event_type << ": " << payload.dump();
        return;
    }
    bool stopping = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!stopping_ && queue_.size() < cfg_.queue_size) {
            queue_.push_back(std::move(event));
            cv_.notify_one();
            return;
        }
        stopping = stopping_;
    }
    sync_fallbacks_++;
    EVLOG_warning << "Platform event " << (stopping ? "queue closed" : "queue full") << ", sending " << event_type
                  << " synchronously";
    if (!send_now(event)) {
        EVLOG_error << "Platform event " << event_type << " lost after synchronous send failed";
    }
}

bool PlatformNotifier::send_now(const PlatformEvent& event) {
    const auto body = event.to_json().dump();
    std::string error;
    for (int attempt = 0; attempt <= cfg_.retry_count; ++attempt) {
        if (attempt > 0) {
            std::unique_lock<std::mutex> lock(mtx_);
            if (stop_cv_.wait_for(lock, cfg_.retry_interval, [this]() { return stopping_; })) {
                break;
            }
        }
        if (transport_(url_, body, error)) {
            sent_++;
            EVLOG_debug << "Platform event " << event.event_type << " delivered";
            return true;
        }
        EVLOG_warning << "Platform event " << event.event_type << " attempt " << attempt + 1 << "/"
                      << cfg_.retry_count + 1 << " failed: " << error;
    }
    failed_++;
    return false;
}

bool PlatformNotifier::post_json(const std::string& url, const std::string& body, std::string& error) const {
    static std::once_flag curl_once;
    std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "curl_easy_init failed";
        return false;
    }
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (!cfg_.api_key.empty()) {
        headers = curl_slist_append(headers, ("X-API-Key: " + cfg_.api_key).c_str());
    }
    if (!cfg_.api_secret.empty()) {
        headers = curl_slist_append(headers, ("X-API-Secret: " + cfg_.api_secret).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(cfg_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);

    const CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        error = std::string(curl_easy_strerror(res)) + " (HTTP " + std::to_string(status) + ")";
        return false;
    }
    return true;
}

void PlatformNotifier::worker_loop() {
    while (true) {
        PlatformEvent event;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            send_now(event);
        } catch (const std::exception& e) {
            failed_++;
            EVLOG_warning << "Platform worker error for " << event.event_type << ": " << e.what();
        }
    }
}

void PlatformNotifier::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    stop_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    const auto stats_now = stats();
    EVLOG_info << "Business platform notifier stopped: sent=" << stats_now.sent << " failed=" << stats_now.failed
               << " sync_fallbacks=" << stats_now.sync_fallbacks;
}

std::size_t PlatformNotifier::queued() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
}

NotifierStats PlatformNotifier::stats() const {
    NotifierStats out;
    out.sent = sent_;
    out.failed = failed_;
    out.sync_fallbacks = sync_fallbacks_;
    return out;
}

void LoggingNotifier::notify(const std::string& event_type, const nlohmann::json& payload) {
    EVLOG_info << "Event " << event_type << ": " << payload.dump();
}

} // namespace pilegate
