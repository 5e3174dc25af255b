#include "context_registry.hpp"

#include <mutex>
#include <utility>

namespace curlbind::easy {

    ContextRegistry::Scoped::Scoped(ContextRegistry* registry, Token token) : registry_(registry), token_(token) {}

    ContextRegistry::Scoped::~Scoped() { release(); }

    ContextRegistry::Scoped::Scoped(Scoped&& other) noexcept
        : registry_(std::exchange(other.registry_, nullptr)), token_(std::exchange(other.token_, NO_CONTEXT)) {}

    ContextRegistry::Scoped& ContextRegistry::Scoped::operator=(Scoped&& other) noexcept {
        if (this != &other) {
            release();
            registry_ = std::exchange(other.registry_, nullptr);
            token_ = std::exchange(other.token_, NO_CONTEXT);
        }
        return *this;
    }

    void ContextRegistry::Scoped::release() {
        if (registry_ != nullptr && token_ != NO_CONTEXT) {
            registry_->remove(token_);
        }
        registry_ = nullptr;
        token_ = NO_CONTEXT;
    }

    ContextRegistry& ContextRegistry::instance() {
        static ContextRegistry registry;
        return registry;
    }

    ContextRegistry::Scoped ContextRegistry::add(Context context) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (next_token_ == NO_CONTEXT) {
            ++next_token_;
        }
        const Token token = next_token_++;
        entries_.emplace(token, context);
        return {this, token};
    }

    void ContextRegistry::remove(Token token) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(token);
    }

    size_t ContextRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

}  // namespace curlbind::easy
