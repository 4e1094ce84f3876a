#pragma once

// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <string>

#include "discrip/discrip.h"

namespace discrip::detail {

// Destination for structured events and diagnostics. Only the supervising
// thread of an execution writes to it.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void log(DiscRipLogLevels level, const std::string& message) = 0;

    void event(const std::string& message) {
        log(DISCRIP_LOG_INFO, message);
    }
    void debug(const std::string& message) {
        log(DISCRIP_LOG_DEBUG, message);
    }
    void warning(const std::string& message) {
        log(DISCRIP_LOG_WARNING, message);
    }
};

class CallbackEventSink final : public EventSink {
public:
    CallbackEventSink(DiscRipLogCallback callback, void* user_data)
        : callback_(callback), user_data_(user_data) {}

    void log(DiscRipLogLevels level, const std::string& message) override {
        if (callback_) callback_(level, message.c_str(), user_data_);
    }

private:
    DiscRipLogCallback callback_{nullptr};
    void* user_data_{nullptr};
};

}  // namespace discrip::detail
