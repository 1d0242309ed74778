#include "notifier.hpp"
#include "log.hpp"
#include <exception>
#include <utility>

namespace holdtalk {

const char* ui_event_name(UiEvent::Type type) {
    switch (type) {
        case UiEvent::Type::Idle: return "idle";
        case UiEvent::Type::Recording: return "recording";
        case UiEvent::Type::Transcribing: return "transcribing";
        case UiEvent::Type::Done: return "done";
        case UiEvent::Type::NoOp: return "no-op";
        case UiEvent::Type::Error: return "error";
    }
    return "unknown";
}

AsyncNotifier::AsyncNotifier(std::shared_ptr<Notifier> target)
    : target_(std::move(target)) {
    thread_ = std::thread([this]() {
        UiEvent event;
        while (events_.pop(event)) {
            try {
                target_->notify(event);
            } catch (const std::exception& e) {
                log_warning("notify") << "Notification failed: " << e.what();
            }
        }
    });
}

AsyncNotifier::~AsyncNotifier() {
    close();
}

void AsyncNotifier::notify(const UiEvent& event) {
    if (!events_.push(event)) {
        log_debug("notify") << "Notifier closed, dropping " << ui_event_name(event.type);
    }
}

void AsyncNotifier::close() {
    events_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void NotifierGroup::add(std::shared_ptr<Notifier> notifier) {
    if (notifier) {
        notifiers_.push_back(std::move(notifier));
    }
}

void NotifierGroup::notify(const UiEvent& event) {
    for (auto& notifier : notifiers_) {
        notifier->notify(event);
    }
}

} // namespace holdtalk
