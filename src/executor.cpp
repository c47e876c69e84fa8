#include "lunar/executor.hpp"
#include "lunar/heap.hpp"
#include "lunar/runtime.hpp"
#include "lunar/type_system.hpp"

namespace lunar {

Executor::Executor(Runtime& runtime, const Value& function, std::vector<Value> args)
    : vm_(runtime.vm()), heap_(runtime.heap()) {
    Handle<ThreadObject> thread = vm_.newThread(function, false);
    thread->setTransfer(std::move(args));
    heap_.addRoot(thread.get());
    chain_.push_back(thread);
}

Executor::Executor(Runtime& runtime, Handle<ThreadObject> coroutine, std::vector<Value> args)
    : vm_(runtime.vm()), heap_(runtime.heap()) {
    if (!coroutine) {
        throw ProtocolError("cannot resume a missing coroutine");
    }
    if (!coroutine->isCoroutine()) {
        throw ProtocolError("cannot resume non-suspended coroutine");
    }
    if (coroutine->status() == ThreadStatus::Dead) {
        throw ProtocolError("cannot resume dead coroutine");
    }
    if (coroutine->status() != ThreadStatus::NotStarted && coroutine->status() != ThreadStatus::Suspended) {
        throw ProtocolError("cannot resume non-suspended coroutine");
    }
    coroutine->setTransfer(std::move(args));
    heap_.addRoot(coroutine.get());
    chain_.push_back(coroutine);
}

Executor::~Executor() {
    for (const auto& thread : chain_) {
        heap_.removeRoot(thread.get());
    }
}

void Executor::launch(ThreadObject& thread) {
    if (thread.status() == ThreadStatus::NotStarted) {
        vm_.start(thread);
    } else {
        vm_.resume(thread);
    }
}

StepResult Executor::step(std::int64_t fuel) {
    if (fatal_ || heap_.isFatal()) {
        fatal_ = true;
        throw FatalError("executor is unusable after heap exhaustion");
    }
    if (completed_) {
        throw ProtocolError("executor has already completed");
    }

    fuel_.refill(fuel);
    try {
        if (!started_) {
            started_ = true;
            launch(*chain_.back());
        }
        while (true) {
            ThreadObject& current = *chain_.back();
            const RunSignal signal = vm_.execute(current, fuel_);
            if (signal == RunSignal::OutOfFuel) {
                return {};
            }
            if (signal == RunSignal::ResumeRequested) {
                Handle<ThreadObject> child = current.resumeTarget();
                current.setStatus(ThreadStatus::Normal);
                heap_.addRoot(child.get());
                chain_.push_back(child);
                launch(*child);
                continue;
            }
            if (chain_.size() == 1) {
                return finish(signal);
            }

            // A resumed coroutine stopped: hand its outcome to the resumer.
            Handle<ThreadObject> child = chain_.back();
            chain_.pop_back();
            heap_.removeRoot(child.get());
            ThreadObject& parent = *chain_.back();
            parent.setStatus(ThreadStatus::Running);
            const ThreadSignal outcome = signal == RunSignal::Errored ? ThreadSignal::Errored : ThreadSignal::Finished;
            vm_.completeResume(parent, outcome, child->takeTransfer(), child->error());
        }
    } catch (const ProtocolError& error) {
        completed_ = true;
        StepResult result;
        result.status = StepStatus::Errored;
        result.protocolViolation = true;
        result.message = error.what();
        result.error = Value::String(heap_.intern(result.message).get());
        return result;
    } catch (const FatalError&) {
        fatal_ = true;
        completed_ = true;
        throw;
    }
}

StepResult Executor::finish(RunSignal signal) {
    completed_ = true;
    if (heap_.takeFullCollectionRequest()) {
        heap_.collectFull();
    }

    ThreadObject& root = *chain_.front();
    StepResult result;
    switch (signal) {
    case RunSignal::Finished:
        result.status = StepStatus::Finished;
        result.values = root.takeTransfer();
        break;
    case RunSignal::Yielded:
        result.status = StepStatus::Yielded;
        result.values = root.takeTransfer();
        break;
    default:
        result.status = StepStatus::Errored;
        result.error = root.error();
        result.message = toDisplayString(result.error);
        result.traceback = root.traceback();
        break;
    }
    return result;
}

} // namespace lunar
