#pragma once

#include <csetjmp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kiln::backend::runtime {

namespace fault_types {
constexpr const char* kRuntimeError = "kiln.RuntimeError";
constexpr const char* kArithmeticError = "kiln.ArithmeticError";
constexpr const char* kStackOverflowError = "kiln.StackOverflowError";
constexpr const char* kExit = "kiln.Exit";
constexpr const char* kInterrupted = "kiln.Interrupted";
constexpr const char* kInitializerError = "kiln.InitializerError";
constexpr const char* kInvocationError = "kiln.InvocationError";
} // namespace fault_types

// Frame pushed by the host around every entry-point call.
constexpr const char* kHostFrame = "kiln.evaluator_run_printer";

struct Fault;
using FaultPtr = std::shared_ptr<const Fault>;

/**
 * A fault raised by generated code.
 *
 * Frames are recorded innermost first as "Owner.method". Wrapping faults
 * (initializer, invocation) keep the original fault as their cause.
 */
struct Fault {
    std::string type;
    std::string message;
    std::vector<std::string> frames;
    FaultPtr cause;
};

FaultPtr make_fault(std::string type, std::string message, std::vector<std::string> frames = {}, FaultPtr cause = nullptr);

// Raw setjmp target; must stay trivially destructible.
struct TrapFrame {
    std::jmp_buf env;
    TrapFrame* prev;
    std::size_t depth;
};

struct CallOutcome {
    std::int64_t value = 0;
    FaultPtr fault;
};

/**
 * Per-session state shared with generated code: the string/object arena,
 * the shadow call stack used for fault traces, trap frames and the output
 * sink. Made current for the calling thread through RuntimeScope.
 */
class RuntimeContext {
public:
    using OutputSink = std::function<void(const std::string&)>;

    RuntimeContext();

    void set_output(OutputSink sink) { output_ = std::move(sink); }
    void write(const std::string& text);

    const char* intern(std::string text);
    std::int64_t* allocate(std::size_t slots);

    void push_frame(const char* name);
    void pop_frame();
    std::size_t depth() const { return frames_.size(); }
    std::vector<std::string> snapshot_frames() const;

    void push_trap(TrapFrame* trap);
    void pop_trap(TrapFrame* trap);

    void set_pending(FaultPtr fault);
    FaultPtr take_pending();

    // Jumps to the innermost trap. The pending fault must be set first and no
    // frame between the trap and the caller may own non-trivial objects.
    [[noreturn]] void unwind();

    // Runs fn under a fresh trap with `frame` pushed on the shadow stack.
    CallOutcome call_guarded(std::int64_t (*fn)(), const char* frame);

    std::size_t arena_size() const { return strings_.size() + objects_.size(); }

private:
    OutputSink output_;
    std::deque<std::string> strings_;
    std::vector<std::unique_ptr<std::int64_t[]>> objects_;
    std::vector<const char*> frames_;
    TrapFrame* traps_ = nullptr;
    FaultPtr pending_;
};

class RuntimeScope {
public:
    explicit RuntimeScope(RuntimeContext& context);
    ~RuntimeScope();

    RuntimeScope(const RuntimeScope&) = delete;
    RuntimeScope& operator=(const RuntimeScope&) = delete;

private:
    RuntimeContext* previous_;
};

RuntimeContext* current_context();

// Process-wide interrupt flag; safe to set from a signal handler.
void request_interrupt();
bool consume_interrupt();
void clear_interrupt();

} // namespace kiln::backend::runtime
