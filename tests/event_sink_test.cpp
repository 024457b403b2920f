#include <gtest/gtest.h>
#include <stdexcept>
#include "event_sink.hpp"
#include "test_support.hpp"

namespace {

class FailingSink : public EventSink {
public:
    std::expected<void, Error> record(const Event& /*event*/) override {
        ++calls;
        return makeError(ErrorCode::Unavailable, "chat unreachable");
    }

    int calls = 0;
};

} // namespace

TEST(EventSinkTest, FormatsBackupEvent) {
    Event event = backupEvent("default", "nightly", "Normal", "FencePod", "Requesting fencing for Pod db-1");
    EXPECT_EQ(formatEvent(event), "Backup default/nightly [Normal] FencePod: Requesting fencing for Pod db-1");
}

TEST(EventSinkTest, MultiSinkTriesEverySinkAndReportsFailure) {
    MultiEventSink sinks;
    auto failing = std::make_unique<FailingSink>();
    auto recording = std::make_unique<RecordingEventSink>();
    FailingSink* failingPtr = failing.get();
    RecordingEventSink* recordingPtr = recording.get();
    sinks.add(std::move(failing));
    sinks.add(std::move(recording));

    auto result = sinks.record(backupEvent("default", "nightly", "Warning", "Failed", "boom"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Unavailable);
    EXPECT_EQ(failingPtr->calls, 1);
    EXPECT_EQ(recordingPtr->events.size(), 1u);
}

TEST(EventSinkTest, DeliveryFailureDoesNotPropagate) {
    OperatorConfig config;
    makeQuiet(config);
    FailingSink sink;
    recordEvent(sink, config, backupEvent("default", "nightly", "Normal", "Starting", "go"));
    EXPECT_EQ(sink.calls, 1);
}

TEST(EventSinkTest, TelegramRequiresTokenAndChat) {
    Json::Value telegram(Json::objectValue);
    telegram["bot_token"] = "123:abc";
    EXPECT_THROW(TelegramEventSink{telegram}, std::runtime_error);

    telegram["chat_id"] = "42";
    EXPECT_NO_THROW(TelegramEventSink{telegram});
}

