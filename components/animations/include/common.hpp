#pragma once

#include "color.hpp"
#include "device.hpp"
#include "esp_err.h"
#include "scheduler.hpp"
#include "segment.hpp"
#include <stddef.h>
#include <stdint.h>

namespace anim_common {

using device::Device;
using scheduler::TickScheduler;
using utils::Color;
using utils::StripSegment;

// The closed set of computed animations.
enum class Kind : uint8_t { BREATHE = 0, COUNTDOWN, BOOLEAN_INDICATOR, STATE_INDICATOR, RANGE_VALUE };

const char *kind_name(Kind kind);

// Where an animation draws and who ticks it. Pointers are not owned and must
// outlive the animation.
struct Binding {
    Device *device;
    TickScheduler *scheduler;
    StripSegment segment;
};

inline bool validate(const Binding &binding) { return binding.device != nullptr && binding.scheduler != nullptr; }

// Logs and returns ESP_ERR_INVALID_ARG when the binding is incomplete.
esp_err_t check_binding(const char *tag, const Binding &binding);

// Pixels lit by a bar filled to `fraction` of `length`: round half up, clamped to [0, length].
int bar_lit_count(double fraction, int length);

// ------------------- Lifecycle shared by every kind -------------------
//
// Idle --run()--> Running --stop()/end()/finished--> Idle
//
// run() registers the draw callback with the scheduler (no-op while running).
// stop() cancels it and leaves the pixels as they are. end() cancels it and
// always blanks and flushes the whole segment. Instances are reusable
// indefinitely.
//
// Draws only write the device buffer. Whoever drives the scheduler calls
// Device::show() once after each tick, so every tick yields one frame.
class Animation {
  public:
    virtual ~Animation();
    Animation(const Animation &) = delete;
    Animation &operator=(const Animation &) = delete;

    void run();
    void stop();
    esp_err_t end();
    bool is_running() const;

    virtual Kind kind() const = 0;
    const StripSegment &segment() const { return segment_; }

  protected:
    // Kinds take this in their public constructor; only their create() can name it.
    struct Key {
        explicit Key() = default;
    };

    explicit Animation(const Binding &binding);

    // Idle -> Running transition, with the clock read once for it.
    virtual void on_start(int64_t now_us) { (void)now_us; }
    // Writes this tick's pattern; must not flush.
    virtual esp_err_t draw(int64_t now_us) = 0;
    // Checked after each draw; true moves the animation back to Idle.
    virtual bool finished(int64_t now_us) const {
        (void)now_us;
        return false;
    }

    // Segment-relative writes, clipped to the segment.
    esp_err_t fill(const Color &color);
    esp_err_t fill_range(int offset, int count, const Color &color);
    esp_err_t fill_bar(int lit, const Color &on, const Color &off);

  private:
    esp_err_t tick();

    Device &device_;
    TickScheduler &scheduler_;
    StripSegment segment_;
    scheduler::Handle handle_ = scheduler::INVALID_HANDLE;
};

} // namespace anim_common
