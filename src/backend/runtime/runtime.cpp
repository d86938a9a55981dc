#include "backend/runtime/kiln_runtime.h"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

#include <llvm/Support/ErrorHandling.h>

#include "backend/runtime/runtime_context.hpp"

using kiln::backend::runtime::RuntimeContext;
using kiln::backend::runtime::TrapFrame;
namespace fault_types = kiln::backend::runtime::fault_types;

namespace {

constexpr std::size_t kMaxDepth = 4096;

constexpr int64_t kModuleUninitialized = 0;
constexpr int64_t kModuleInitializing = 1;
constexpr int64_t kModuleInitialized = 2;

RuntimeContext& context() {
    RuntimeContext* ctx = kiln::backend::runtime::current_context();
    if (!ctx) {
        llvm::report_fatal_error("kiln runtime: generated code called with no runtime context");
    }
    return *ctx;
}

const char* as_str(int64_t value) {
    const char* s = reinterpret_cast<const char*>(value);
    return s ? s : "";
}

int64_t from_str(const char* s) {
    return static_cast<int64_t>(reinterpret_cast<intptr_t>(s));
}

[[noreturn]] void raise_fault(const char* type, const char* message) {
    RuntimeContext& ctx = context();
    ctx.set_pending(kiln::backend::runtime::make_fault(type, message, ctx.snapshot_frames()));
    ctx.unwind();
}

std::string quote(const char* s) {
    std::string out = "\"";
    for (const char* p = s; *p; ++p) {
        switch (*p) {
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            default: out += *p;
        }
    }
    out += '"';
    return out;
}

} // namespace

extern "C" {

int64_t kiln_rt_enter(int64_t frame_name) {
    RuntimeContext& ctx = context();
    if (kiln::backend::runtime::consume_interrupt()) {
        raise_fault(fault_types::kInterrupted, "interrupted");
    }
    if (ctx.depth() >= kMaxDepth) {
        raise_fault(fault_types::kStackOverflowError, "call depth exceeded");
    }
    ctx.push_frame(reinterpret_cast<const char*>(frame_name));
    return 0;
}

int64_t kiln_rt_leave(void) {
    context().pop_frame();
    return 0;
}

int64_t kiln_rt_init_module(int64_t init_fn, int64_t state) {
    int64_t* flag = reinterpret_cast<int64_t*>(state);
    if (*flag != kModuleUninitialized) return 0;
    *flag = kModuleInitializing;

    RuntimeContext& ctx = context();
    TrapFrame trap;
    ctx.push_trap(&trap);
    if (setjmp(trap.env) == 0) {
        reinterpret_cast<int64_t (*)()>(init_fn)();
        ctx.pop_trap(&trap);
        *flag = kModuleInitialized;
        return 0;
    }

    // A failed initializer leaves the module uninitialized so a later access retries it.
    *flag = kModuleUninitialized;
    {
        auto cause = ctx.take_pending();
        if (cause && cause->type != fault_types::kInitializerError) {
            ctx.set_pending(kiln::backend::runtime::make_fault(
                fault_types::kInitializerError, "", ctx.snapshot_frames(), std::move(cause)));
        } else {
            ctx.set_pending(std::move(cause));
        }
    }
    ctx.unwind();
}

int64_t kiln_rt_alloc(int64_t slots, int64_t class_name) {
    int64_t* object = context().allocate(static_cast<std::size_t>(slots));
    object[0] = class_name;
    return static_cast<int64_t>(reinterpret_cast<intptr_t>(object));
}

int64_t kiln_rt_concat(int64_t lhs, int64_t rhs) {
    std::string joined = as_str(lhs);
    joined += as_str(rhs);
    return from_str(context().intern(std::move(joined)));
}

int64_t kiln_rt_str_eq(int64_t lhs, int64_t rhs) {
    return std::strcmp(as_str(lhs), as_str(rhs)) == 0 ? 1 : 0;
}

int64_t kiln_rt_int_to_str(int64_t value) {
    return from_str(context().intern(std::to_string(value)));
}

int64_t kiln_rt_show_int(int64_t value) {
    return kiln_rt_int_to_str(value);
}

int64_t kiln_rt_show_str(int64_t value) {
    return from_str(context().intern(quote(as_str(value))));
}

int64_t kiln_rt_show_obj(int64_t object) {
    if (object == 0) return from_str("null");
    const int64_t* slots = reinterpret_cast<const int64_t*>(object);
    char id[32];
    std::snprintf(id, sizeof(id), "@%llx",
        static_cast<unsigned long long>((static_cast<uint64_t>(object) >> 4) & 0xffffffu));
    std::string shown = as_str(slots[0]);
    shown += id;
    return from_str(context().intern(std::move(shown)));
}

int64_t kiln_rt_div(int64_t lhs, int64_t rhs) {
    if (rhs == 0) raise_fault(fault_types::kArithmeticError, "/ by zero");
    // wraps like the other operators instead of trapping in hardware
    if (lhs == INT64_MIN && rhs == -1) return INT64_MIN;
    return lhs / rhs;
}

int64_t kiln_rt_mod(int64_t lhs, int64_t rhs) {
    if (rhs == 0) raise_fault(fault_types::kArithmeticError, "/ by zero");
    if (rhs == -1) return 0;
    return lhs % rhs;
}

int64_t kiln_rt_exit(void) {
    raise_fault(fault_types::kExit, "exit requested");
}

int64_t kiln_rt_fail(int64_t message) {
    raise_fault(fault_types::kRuntimeError, as_str(message));
}

int64_t kiln_rt_println(int64_t text) {
    std::string line = as_str(text);
    line += '\n';
    context().write(line);
    return 0;
}

} // extern "C"
