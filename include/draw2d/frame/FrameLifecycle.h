#pragma once

namespace draw2d {

enum class FramePhase {
    Idle,
    Recording,
    InFlight
};

/**
 * Where a Frame is between beginFrame() and the GPU finishing its work.
 *
 * Only an InFlight frame has a fence that will signal, so only an InFlight
 * frame is waited on. A recording that fails before submission is abandoned
 * and the frame returns to Idle with nothing to wait for.
 */
class FrameLifecycle {
public:
    FramePhase phase() const { return phase_; }

    bool awaitsFence() const { return phase_ == FramePhase::InFlight; }
    bool canSubmit() const { return phase_ == FramePhase::Recording; }

    // False while a previous recording is still open.
    bool begin() {
        if (phase_ == FramePhase::Recording) return false;
        phase_ = FramePhase::Recording;
        return true;
    }

    bool submitted() {
        if (phase_ != FramePhase::Recording) return false;
        phase_ = FramePhase::InFlight;
        return true;
    }

    void abandon() {
        if (phase_ == FramePhase::Recording) {
            phase_ = FramePhase::Idle;
        }
    }

private:
    FramePhase phase_ = FramePhase::Idle;
};

} // namespace draw2d
