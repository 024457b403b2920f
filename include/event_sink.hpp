/**
 * @file event_sink.hpp
 * @brief Progress notifications emitted while backups run.
 *
 * Provides the event sink interface and its implementations: the operator log and a
 * Telegram chat. Events are observational only; nothing in PgFleet reads them back.
 *
 * @note TelegramEventSink requires libcurl.
 */

#ifndef EVENT_SINK_HPP
#define EVENT_SINK_HPP

#include <expected>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>
#include "error.hpp"
#include "operator_config.hpp"

/**
 * @brief Human-readable notification attached to an object.
 */
struct Event {
    std::string kind;        ///< Kind of the involved object, e.g. "Backup".
    std::string namespace_;  ///< Namespace of the involved object.
    std::string name;        ///< Name of the involved object.
    std::string type;        ///< "Normal" or "Warning".
    std::string reason;      ///< Short CamelCase reason, e.g. "FencePod".
    std::string message;     ///< Free-form message.
};

/**
 * @brief Formats an event as "<Kind> <ns>/<name> [<type>] <reason>: <message>".
 */
std::string formatEvent(const Event& event);

/**
 * @brief Builds an event involving a Backup.
 */
Event backupEvent(const std::string& namespace_, const std::string& backupName,
                  const std::string& type, const std::string& reason, const std::string& message);

/**
 * @brief Interface for event sinks.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    /**
     * @brief Records an event.
     *
     * @param event Event to record.
     * @return std::expected<void, Error> Success or the delivery failure.
     */
    virtual std::expected<void, Error> record(const Event& event) = 0;
};

/**
 * @brief Writes events to the operator log.
 */
class LogEventSink : public EventSink {
public:
    explicit LogEventSink(const OperatorConfig& config);

    std::expected<void, Error> record(const Event& event) override;

private:
    const OperatorConfig& config;
};

/**
 * @brief Telegram event sink.
 *
 * Sends events using the Telegram Bot API.
 */
class TelegramEventSink : public EventSink {
public:
    /**
     * @brief Constructs a Telegram event sink.
     *
     * @param config JSON configuration with bot_token and chat_id.
     * @throws std::runtime_error If bot_token or chat_id is missing.
     */
    explicit TelegramEventSink(const Json::Value& config);

    /**
     * @brief Sends the formatted event to the configured chat.
     *
     * @return std::expected<void, Error> Success, or Unavailable when the request fails.
     */
    std::expected<void, Error> record(const Event& event) override;

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId;   ///< Telegram chat ID.
};

/**
 * @brief Forwards every event to several sinks.
 *
 * All sinks are attempted; the first failure is reported.
 */
class MultiEventSink : public EventSink {
public:
    void add(std::unique_ptr<EventSink> sink);

    std::expected<void, Error> record(const Event& event) override;

private:
    std::vector<std::unique_ptr<EventSink>> sinks;
};

/**
 * @brief Records an event, logging delivery failures instead of returning them.
 */
void recordEvent(EventSink& sink, const OperatorConfig& config, const Event& event);

#endif // EVENT_SINK_HPP
