#pragma once

#include "channel.hpp"
#include "errors.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace holdtalk {

struct UiEvent {
    enum class Type {
        Idle,
        Recording,
        Transcribing,
        Done,
        NoOp,
        Error
    };

    Type type = Type::Idle;
    size_t text_length = 0;           // Done
    ErrorKind error = ErrorKind::None; // Error
    std::string detail;

    static UiEvent idle(std::string detail = "") { return {Type::Idle, 0, ErrorKind::None, std::move(detail)}; }
    static UiEvent recording() { return {Type::Recording, 0, ErrorKind::None, ""}; }
    static UiEvent transcribing() { return {Type::Transcribing, 0, ErrorKind::None, ""}; }
    static UiEvent done(size_t length) { return {Type::Done, length, ErrorKind::None, ""}; }
    static UiEvent noop() { return {Type::NoOp, 0, ErrorKind::None, ""}; }
    static UiEvent failure(ErrorKind kind, std::string detail) { return {Type::Error, 0, kind, std::move(detail)}; }
};

const char* ui_event_name(UiEvent::Type type);

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const UiEvent& event) = 0;
};

// Forwards events to another notifier on a background thread so notify()
// returns immediately.
class AsyncNotifier : public Notifier {
public:
    explicit AsyncNotifier(std::shared_ptr<Notifier> target);
    ~AsyncNotifier() override;

    void notify(const UiEvent& event) override;

    // Delivers what is queued, then joins
    void close();

private:
    std::shared_ptr<Notifier> target_;
    Channel<UiEvent> events_;
    std::thread thread_;
};

// Fans one event out to several notifiers
class NotifierGroup : public Notifier {
public:
    void add(std::shared_ptr<Notifier> notifier);
    void notify(const UiEvent& event) override;

private:
    std::vector<std::shared_ptr<Notifier>> notifiers_;
};

} // namespace holdtalk
