#include "backend/runtime/runtime_context.hpp"

#include <atomic>

#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/raw_ostream.h>

namespace kiln::backend::runtime {

namespace {

thread_local RuntimeContext* tls_context = nullptr;

std::atomic<bool> interrupt_flag{false};

} // namespace

FaultPtr make_fault(std::string type, std::string message, std::vector<std::string> frames, FaultPtr cause) {
    auto fault = std::make_shared<Fault>();
    fault->type = std::move(type);
    fault->message = std::move(message);
    fault->frames = std::move(frames);
    fault->cause = std::move(cause);
    return fault;
}

RuntimeContext::RuntimeContext() {
    output_ = [](const std::string& text) {
        llvm::outs() << text;
        llvm::outs().flush();
    };
}

void RuntimeContext::write(const std::string& text) {
    if (output_) output_(text);
}

const char* RuntimeContext::intern(std::string text) {
    strings_.push_back(std::move(text));
    return strings_.back().c_str();
}

std::int64_t* RuntimeContext::allocate(std::size_t slots) {
    objects_.push_back(std::make_unique<std::int64_t[]>(slots == 0 ? 1 : slots));
    return objects_.back().get();
}

void RuntimeContext::push_frame(const char* name) {
    frames_.push_back(name);
}

void RuntimeContext::pop_frame() {
    if (!frames_.empty()) frames_.pop_back();
}

std::vector<std::string> RuntimeContext::snapshot_frames() const {
    std::vector<std::string> out;
    out.reserve(frames_.size());
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        out.emplace_back(*it ? *it : "<unknown>");
    }
    return out;
}

void RuntimeContext::push_trap(TrapFrame* trap) {
    trap->prev = traps_;
    trap->depth = frames_.size();
    traps_ = trap;
}

void RuntimeContext::pop_trap(TrapFrame* trap) {
    if (traps_ == trap) traps_ = trap->prev;
}

void RuntimeContext::set_pending(FaultPtr fault) {
    pending_ = std::move(fault);
}

FaultPtr RuntimeContext::take_pending() {
    FaultPtr out = std::move(pending_);
    pending_.reset();
    return out;
}

void RuntimeContext::unwind() {
    TrapFrame* trap = traps_;
    if (!trap) {
        llvm::report_fatal_error("kiln runtime: fault raised with no active trap");
    }
    traps_ = trap->prev;
    frames_.resize(trap->depth);
    std::longjmp(trap->env, 1);
}

CallOutcome RuntimeContext::call_guarded(std::int64_t (*fn)(), const char* frame) {
    CallOutcome out;
    TrapFrame trap;
    push_frame(frame);
    push_trap(&trap);
    if (setjmp(trap.env) == 0) {
        std::int64_t value = fn();
        pop_trap(&trap);
        pop_frame();
        out.value = value;
        return out;
    }
    pop_frame();
    out.fault = take_pending();
    if (!out.fault) {
        out.fault = make_fault(fault_types::kRuntimeError, "unwound without a pending fault");
    }
    return out;
}

RuntimeScope::RuntimeScope(RuntimeContext& context) : previous_(tls_context) {
    tls_context = &context;
}

RuntimeScope::~RuntimeScope() {
    tls_context = previous_;
}

RuntimeContext* current_context() {
    return tls_context;
}

void request_interrupt() {
    interrupt_flag.store(true);
}

bool consume_interrupt() {
    return interrupt_flag.exchange(false);
}

void clear_interrupt() {
    interrupt_flag.store(false);
}

} // namespace kiln::backend::runtime
