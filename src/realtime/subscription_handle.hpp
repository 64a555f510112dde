#pragma once

#include <functional>

// Owns one registration (run, pipeline or status listener). Disposing it,
// explicitly or by destruction, removes the registration. Disposing twice is
// a no-op, and a handle that outlives its engine disposes into nothing.
class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> disposer);
    ~SubscriptionHandle();

    SubscriptionHandle(SubscriptionHandle&& other) noexcept;
    SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept;
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void dispose();
    bool active() const { return static_cast<bool>(disposer_); }

private:
    std::function<void()> disposer_;
};
