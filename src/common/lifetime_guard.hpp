#pragma once

/**
 * @file lifetime_guard.hpp
 * @brief Expiring wrappers for callbacks that capture an owner
 *
 * Storage completions and scheduler ticks may run after the object that
 * issued them is gone. An owner keeps a LifetimeGuard member and wraps
 * every callback that touches it with bind(); once the guard is destroyed
 * or reset(), wrapped callbacks become no-ops.
 */

#include <memory>
#include <utility>

namespace bulkstream {

class LifetimeGuard {
public:
    LifetimeGuard() : token_(std::make_shared<char>(0)) {}

    LifetimeGuard(const LifetimeGuard&) = delete;
    LifetimeGuard& operator=(const LifetimeGuard&) = delete;

    /**
     * @brief Wrap fn so it only runs while this guard generation is alive
     */
    template <typename Fn>
    [[nodiscard]] auto bind(Fn&& fn) const {
        return [weak = std::weak_ptr<char>(token_),
                fn = std::forward<Fn>(fn)](auto&&... args) mutable {
            if (weak.expired()) {
                return;
            }
            fn(std::forward<decltype(args)>(args)...);
        };
    }

    /**
     * @brief Observe the current generation
     *
     * Lets an owner that calls out to user code detect that it was
     * destroyed by that code before touching its members again.
     */
    [[nodiscard]] std::weak_ptr<char> watch() const { return token_; }

    /**
     * @brief Expire every callback bound so far
     */
    void reset() { token_ = std::make_shared<char>(0); }

private:
    std::shared_ptr<char> token_;
};

}  // namespace bulkstream
