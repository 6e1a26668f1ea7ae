#include "graphweave/engine/FrameLoop.h"
#include "graphweave/common/Logger.h"

namespace graphweave {

FrameLoop::FrameLoop(LayoutEngine& engine, RenderCallback onRender)
    : engine_(engine), onRender_(std::move(onRender)) {}

bool FrameLoop::onFrame() {
    if (cancelled_.load()) {
        return false;
    }

    engine_.tick();
    ++framesRun_;

    if (onRender_) {
        onRender_(engine_.frame());
    }
    return true;
}

int FrameLoop::runUntilSettled(int maxFrames) {
    int frames = 0;
    while (frames < maxFrames && !engine_.isSettled()) {
        if (!onFrame()) {
            LOG_DEBUG("frame loop cancelled after {} frame(s)", framesRun_);
            break;
        }
        ++frames;
    }
    return frames;
}

}  // namespace graphweave
