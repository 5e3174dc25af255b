#ifndef CURLBIND_CONTEXT_REGISTRY_HPP
#define CURLBIND_CONTEXT_REGISTRY_HPP

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <variant>

#include "../body/body_source.hpp"
#include "../model/response.hpp"

namespace curlbind::easy {

    // Maps small integer tokens to the contexts of in-flight transfers. Only the token crosses the native
    // boundary as callback user data; the callbacks resolve it back here before touching anything.
    class ContextRegistry {
       public:
        using Token = std::uintptr_t;
        using Context = std::variant<model::ResponseBuilder*, body::IBodySource*>;

        static constexpr Token NO_CONTEXT = 0;

        // Keeps one registration alive; unregisters on destruction.
        class Scoped {
           public:
            Scoped() = default;
            Scoped(ContextRegistry* registry, Token token);

            ~Scoped();
            Scoped(const Scoped&) = delete;
            Scoped& operator=(const Scoped&) = delete;
            Scoped(Scoped&& other) noexcept;
            Scoped& operator=(Scoped&& other) noexcept;

            [[nodiscard]] Token token() const { return token_; }
            [[nodiscard]] void* opaque() const { return to_opaque(token_); }

           private:
            void release();

            ContextRegistry* registry_ = nullptr;
            Token token_ = NO_CONTEXT;
        };

        ContextRegistry() = default;

        ~ContextRegistry() = default;
        ContextRegistry(const ContextRegistry&) = delete;
        ContextRegistry& operator=(const ContextRegistry&) = delete;
        ContextRegistry(ContextRegistry&&) = delete;
        ContextRegistry& operator=(ContextRegistry&&) = delete;

        static ContextRegistry& instance();

        [[nodiscard]] Scoped add(Context context);
        void remove(Token token);
        [[nodiscard]] size_t size() const;

        // nullptr unless `opaque` is a live token registered with a T*.
        template <typename T>
        [[nodiscard]] T* find(void* opaque) const {
            const Token token = to_token(opaque);
            if (token == NO_CONTEXT) {
                return nullptr;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = entries_.find(token);
            if (it == entries_.end()) {
                return nullptr;
            }

            T* const* context = std::get_if<T*>(&it->second);
            return context != nullptr ? *context : nullptr;
        }

        static void* to_opaque(Token token) { return reinterpret_cast<void*>(token); }     // NOLINT(performance-no-int-to-ptr)
        static Token to_token(void* opaque) { return reinterpret_cast<Token>(opaque); }  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)

       private:
        mutable std::mutex mutex_;
        std::unordered_map<Token, Context> entries_;
        Token next_token_ = NO_CONTEXT + 1;
    };

}  // namespace curlbind::easy

#endif
