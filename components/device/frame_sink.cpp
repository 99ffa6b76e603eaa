#include "include/frame_sink.hpp"
#include "esp_log.h"
#include <stdio.h>

namespace device {

static const char *TAG = "frame_sink";

size_t format_frame(const utils::Color *pixels, size_t count, char *line, size_t len) {
    if (len == 0) return 0;
    size_t pos = 0;
    size_t shown = 0;
    const size_t limit = count < K_LOG_FRAME_MAX_PIXELS ? count : K_LOG_FRAME_MAX_PIXELS;
    for (; shown < limit; ++shown) {
        const utils::Color &c = pixels[shown];
        int w = snprintf(line + pos, len - pos, "(%02x,%02x,%02x) ", c.red() & 0xff, c.green() & 0xff,
                         c.blue() & 0xff);
        if (w < 0 || pos + static_cast<size_t>(w) >= len) break;
        pos += static_cast<size_t>(w);
    }
    if (count > shown && pos + 3 < len) {
        pos += static_cast<size_t>(snprintf(line + pos, len - pos, "..."));
    }
    line[pos] = '\0';
    return shown;
}

void LogFrameSink::push_frame(const utils::Color *pixels, size_t count) {
    ++frames_;

    char line[K_LOG_FRAME_LINE_LEN];
    format_frame(pixels, count, line, sizeof(line));
    ESP_LOGD(TAG, "frame %lu (%u px): %s", (unsigned long)frames_, (unsigned)count, line);
}

void LogFrameSink::set_status_label(const char *label) { ESP_LOGI(TAG, "status: %s", label); }

} // namespace device
