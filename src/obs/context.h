#pragma once

#include <string>

namespace claimscan::obs {

// Per-thread correlation ids attached to every structured log event.
struct Context {
    std::string request_id;
    std::string scan_run_id;
    std::string entity_id;
};

inline thread_local Context g_context{};
inline thread_local bool g_context_set = false;

inline auto GetContext() -> const Context& {
    return g_context;
}

inline auto HasContext() -> bool {
    return g_context_set;
}

inline auto SetContext(const Context& ctx) -> void {
    g_context = ctx;
    g_context_set = true;
}

inline auto ClearContext() -> void {
    g_context = Context{};
    g_context_set = false;
}

class ScopedContext {
public:
    explicit ScopedContext(const Context& ctx)
        : prev_(g_context), prev_set_(g_context_set) {
        SetContext(ctx);
    }

    ScopedContext(const ScopedContext&) = delete;
    auto operator=(const ScopedContext&) -> ScopedContext& = delete;

    ~ScopedContext() {
        if (prev_set_) {
            g_context = prev_;
            g_context_set = true;
        } else {
            ClearContext();
        }
    }

private:
    Context prev_{};
    bool prev_set_ = false;
};

} // namespace claimscan::obs
