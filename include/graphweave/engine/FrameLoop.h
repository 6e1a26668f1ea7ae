#pragma once

#include "graphweave/engine/LayoutEngine.h"
#include "graphweave/engine/RenderFrame.h"

#include <atomic>
#include <functional>

namespace graphweave {

/**
 * @brief Drives one LayoutEngine tick per host frame
 *
 * The host wires onFrame() to its animation callback (requestAnimationFrame,
 * a QTimer, a game loop). cancel() may be called from any thread; frames
 * arriving afterwards are ignored and onFrame() returns false so the host
 * can stop scheduling.
 *
 * The engine itself is not thread-safe: onFrame() must run on the thread
 * that owns the engine.
 */
class FrameLoop {
public:
    using RenderCallback = std::function<void(const RenderFrame&)>;

    explicit FrameLoop(LayoutEngine& engine, RenderCallback onRender = nullptr);

    // Non-copyable
    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;

    /// Run one tick and hand the frame to the render callback
    /// @return false once cancelled
    bool onFrame();

    /// Run frames synchronously until settled, cancelled or @p maxFrames
    /// @return Number of frames run
    int runUntilSettled(int maxFrames);

    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

    int framesRun() const { return framesRun_; }

    void setRenderCallback(RenderCallback onRender) { onRender_ = std::move(onRender); }

private:
    LayoutEngine& engine_;
    RenderCallback onRender_;
    std::atomic<bool> cancelled_{false};
    int framesRun_ = 0;
};

}  // namespace graphweave
