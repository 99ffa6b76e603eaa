#pragma once
#include "color.hpp"
#include <stddef.h>
#include <stdint.h>

namespace device {

#define K_LOG_FRAME_MAX_PIXELS 16
// "(rr,gg,bb) " is 11 chars per pixel, plus "..." and the terminator
#define K_LOG_FRAME_LINE_LEN (K_LOG_FRAME_MAX_PIXELS * 11 + 8)

// Receiver of simulated frames (a visualizer window, a recorder in tests, ...).
class IFrameSink {
  public:
    virtual ~IFrameSink() = default;
    virtual void push_frame(const utils::Color *pixels, size_t count) = 0;
    virtual void set_status_label(const char *label) = 0;
};

// Renders the first K_LOG_FRAME_MAX_PIXELS pixels as hex triples into `line`,
// ending in "..." when the frame is longer. Returns the number of pixels written.
size_t format_frame(const utils::Color *pixels, size_t count, char *line, size_t len);

// Default sink: renders frames and labels through esp_log.
class LogFrameSink final : public IFrameSink {
  public:
    void push_frame(const utils::Color *pixels, size_t count) override;
    void set_status_label(const char *label) override;

    // Frames pushed so far
    uint32_t frames() const { return frames_; }

  private:
    uint32_t frames_ = 0;
};

} // namespace device
