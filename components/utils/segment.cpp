#include "include/segment.hpp"
#include "esp_log.h"

namespace utils {

static const char *TAG = "segment";

esp_err_t StripSegment::create(int start, int end, StripSegment &out) {
    if (start < 0 || end <= start) {
        ESP_LOGE(TAG, "invalid segment [%d, %d)", start, end);
        return ESP_ERR_INVALID_ARG;
    }
    out = StripSegment(start, end);
    return ESP_OK;
}

} // namespace utils
