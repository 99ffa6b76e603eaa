// In-memory strip forwarded to a frame sink
#include "include/device.hpp"
#include "esp_log.h"
#include <algorithm>
#include <memory>
#include <vector>

namespace device {

static const char *TAG = "sim_backend";

namespace {

class SimBackend final : public IStripBackend {
  public:
    SimBackend(uint32_t led_count, IFrameSink &sink) : frame_(led_count, utils::colors::OFF), sink_(sink) {}

    esp_err_t write_range(uint32_t start, uint32_t count, const Color &color) override {
        if (start + count > frame_.size()) return ESP_ERR_INVALID_ARG;
        std::fill(frame_.begin() + start, frame_.begin() + start + count, color);
        return ESP_OK;
    }

    esp_err_t refresh() override {
        sink_.push_frame(frame_.data(), frame_.size());
        return ESP_OK;
    }

    esp_err_t animate(const vendor::VendorAnimation &anim) override {
        vendor::describe(anim, label_, sizeof(label_));
        sink_.set_status_label(label_);
        return ESP_OK;
    }

    const char *status_label() const override { return label_; }

  private:
    std::vector<Color> frame_;
    IFrameSink &sink_;
    char label_[128] = {0};
};

} // namespace

esp_err_t new_sim_backend(const DeviceCreateArgs &args, std::unique_ptr<IStripBackend> &out) {
    if (!is_simulation()) {
        ESP_LOGE(TAG, "simulated strip requested outside a simulation build");
        return ESP_ERR_NOT_SUPPORTED;
    }
    if (args.sink == nullptr) return ESP_ERR_INVALID_ARG;

    out = std::make_unique<SimBackend>(args.led_count, *args.sink);
    return ESP_OK;
}

} // namespace device
