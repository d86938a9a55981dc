#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "backend/runtime/runtime_context.hpp"
#include "frontend/interactive/import_ledger.hpp"

namespace kiln::frontend::interactive {

template <typename T>
struct Success {
    T value;
};

/**
 * Failure
 *
 * A rendered, user-facing trace. `stop_marker` names the frame method at
 * which internal frames were cut when the failure came from a runtime fault.
 */
struct Failure {
    std::string message;
    std::optional<std::string> stop_marker;

    // "type: message" per level, frames up to (excluding) the first frame
    // whose method is `stop_marker`, causes as "Caused by: ..."
    static Failure from_fault(const backend::runtime::FaultPtr& fault, const std::string& stop_marker);
};

struct Exit {};
struct Skip {};

struct Buffer {
    std::string text;
};

/**
 * Res
 *
 * Outcome of one stage of the evaluation loop. Anything but Success
 * short-circuits map and flat_map.
 */
template <typename T>
class Res {
public:
    using Variant = std::variant<Success<T>, Failure, Exit, Skip, Buffer>;

    Res(Success<T> success) : value_(std::move(success)) {}
    Res(Failure failure) : value_(std::move(failure)) {}
    Res(Exit exit) : value_(exit) {}
    Res(Skip skip) : value_(skip) {}
    Res(Buffer buffer) : value_(std::move(buffer)) {}

    static Res success(T value) { return Res(Success<T>{std::move(value)}); }

    static Res from_optional(std::optional<T> value, std::string failure_message) {
        if (value) return success(std::move(*value));
        return Res(Failure{std::move(failure_message), std::nullopt});
    }

    bool is_success() const { return std::holds_alternative<Success<T>>(value_); }
    bool is_failure() const { return std::holds_alternative<Failure>(value_); }
    bool is_exit() const { return std::holds_alternative<Exit>(value_); }
    bool is_skip() const { return std::holds_alternative<Skip>(value_); }
    bool is_buffer() const { return std::holds_alternative<Buffer>(value_); }

    const T& value() const { return std::get<Success<T>>(value_).value; }
    const Failure& failure() const { return std::get<Failure>(value_); }
    const Buffer& buffer() const { return std::get<Buffer>(value_); }

    const Variant& variant() const { return value_; }

    // The same non-success outcome for another value type.
    template <typename U>
    Res<U> forward() const {
        switch (value_.index()) {
            case 1: return Res<U>(std::get<Failure>(value_));
            case 2: return Res<U>(Exit{});
            case 3: return Res<U>(Skip{});
            case 4: return Res<U>(std::get<Buffer>(value_));
            default: break;
        }
        return Res<U>(Failure{"forward() called on a successful result", std::nullopt});
    }

    template <typename F>
    auto map(F&& f) const -> Res<std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        if (!is_success()) return forward<U>();
        return Res<U>::success(f(value()));
    }

    template <typename F>
    auto flat_map(F&& f) const -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (!is_success()) return forward<typename R::value_type>();
        return f(value());
    }

    template <typename OnSuccess, typename OnFailure, typename OnExit, typename OnSkip, typename OnBuffer>
    auto match(OnSuccess&& on_success, OnFailure&& on_failure, OnExit&& on_exit, OnSkip&& on_skip, OnBuffer&& on_buffer) const {
        switch (value_.index()) {
            case 0: return on_success(value());
            case 1: return on_failure(std::get<Failure>(value_));
            case 2: return on_exit();
            case 3: return on_skip();
            default: return on_buffer(std::get<Buffer>(value_));
        }
    }

    using value_type = T;

private:
    Variant value_;
};

// Result of one successful fragment.
template <typename T>
struct Evaluated {
    std::string wrapper;
    std::vector<ImportEntry> imports;
    T value;
};

} // namespace kiln::frontend::interactive
