#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

// A down/up notification, stamped with now_us() when the backend delivered it.
struct KeyTransition {
    std::string key;
    int64_t timestamp_us;
    bool down;
};

using KeyCallback = std::function<void(const KeyTransition& transition)>;
using SubscriptionId = uint64_t;

/*
    Delivers key transitions from the OS input layer.
    Callbacks for one source are invoked from a single delivery thread, in
    delivery order. Callbacks must not subscribe or unsubscribe.
*/
class KeyEventSource {
    public:
        virtual ~KeyEventSource() = default;

        virtual SubscriptionId subscribe(const std::string& key, KeyCallback callback) = 0;

        // Once this returns, the callback is not running and will not run again.
        virtual void unsubscribe(SubscriptionId id) = 0;

        // True once delivery has stopped because of a backend error.
        virtual bool failed() const = 0;
        virtual std::string last_error() const = 0;
};

// Unsubscribes on destruction so hooks never outlive the code that owns the callback.
class KeySubscription {
    private:
        KeyEventSource* source_;
        SubscriptionId id_;

    public:
        KeySubscription(KeyEventSource& source, const std::string& key, KeyCallback callback)
            : source_(&source), id_(source.subscribe(key, std::move(callback))) {}

        KeySubscription(KeySubscription&& other) noexcept
            : source_(other.source_), id_(other.id_) {
            other.source_ = nullptr;
        }

        KeySubscription(const KeySubscription&) = delete;
        KeySubscription& operator=(const KeySubscription&) = delete;
        KeySubscription& operator=(KeySubscription&&) = delete;

        ~KeySubscription() {
            if (source_) {
                source_->unsubscribe(id_);
            }
        }
};
