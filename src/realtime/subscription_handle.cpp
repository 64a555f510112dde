#include "subscription_handle.hpp"
#include <utility>

SubscriptionHandle::SubscriptionHandle(std::function<void()> disposer)
    : disposer_(std::move(disposer)) {}

SubscriptionHandle::~SubscriptionHandle() {
    dispose();
}

SubscriptionHandle::SubscriptionHandle(SubscriptionHandle&& other) noexcept
    : disposer_(std::move(other.disposer_)) {
    other.disposer_ = nullptr;
}

SubscriptionHandle& SubscriptionHandle::operator=(SubscriptionHandle&& other) noexcept {
    if (this != &other) {
        dispose();
        disposer_ = std::move(other.disposer_);
        other.disposer_ = nullptr;
    }
    return *this;
}

void SubscriptionHandle::dispose() {
    if (!disposer_) return;
    auto fn = std::move(disposer_);
    disposer_ = nullptr;
    fn();
}
