#include "event_sink.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace {

size_t writeCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

} // namespace

std::string formatEvent(const Event& event) {
    return event.kind + " " + event.namespace_ + "/" + event.name + " [" + event.type + "] " +
           event.reason + ": " + event.message;
}

Event backupEvent(const std::string& namespace_, const std::string& backupName,
                  const std::string& type, const std::string& reason, const std::string& message) {
    return Event{"Backup", namespace_, backupName, type, reason, message};
}

void recordEvent(EventSink& sink, const OperatorConfig& config, const Event& event) {
    auto delivered = sink.record(event);
    if (!delivered) {
        config.logError("Failed to record event " + event.reason + ": " + describe(delivered.error()));
    }
}

LogEventSink::LogEventSink(const OperatorConfig& config) : config(config) {}

std::expected<void, Error> LogEventSink::record(const Event& event) {
    if (event.type == "Warning") {
        config.logError(formatEvent(event));
    } else {
        config.logMessage(formatEvent(event));
    }
    return {};
}

TelegramEventSink::TelegramEventSink(const Json::Value& config)
    : botToken(config.get("bot_token", "").asString()), chatId(config.get("chat_id", "").asString()) {
    if (botToken.empty() || chatId.empty()) {
        throw std::runtime_error("Telegram configuration requires bot_token and chat_id");
    }
}

std::expected<void, Error> TelegramEventSink::record(const Event& event) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return makeError(ErrorCode::Unavailable, "Failed to initialize CURL");
    }

    std::string message = formatEvent(event);
    char* escaped = curl_easy_escape(curl, message.c_str(), static_cast<int>(message.length()));
    if (!escaped) {
        curl_easy_cleanup(curl);
        return makeError(ErrorCode::Internal, "Failed to escape Telegram message");
    }
    std::string url = "https://api.telegram.org/bot" + botToken + "/sendMessage?chat_id=" + chatId + "&text=" + escaped;
    curl_free(escaped);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        return makeError(ErrorCode::Unavailable,
                         std::string("Failed to send Telegram notification: ") + curl_easy_strerror(res));
    }

    curl_easy_cleanup(curl);
    return {};
}

void MultiEventSink::add(std::unique_ptr<EventSink> sink) {
    sinks.push_back(std::move(sink));
}

std::expected<void, Error> MultiEventSink::record(const Event& event) {
    std::expected<void, Error> result;
    for (auto& sink : sinks) {
        auto delivered = sink->record(event);
        if (!delivered && result) {
            result = std::unexpected(delivered.error());
        }
    }
    return result;
}
