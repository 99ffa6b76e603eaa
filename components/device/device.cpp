#include "include/device.hpp"
#include "esp_log.h"
#include <algorithm>

namespace device {

static const char *TAG = "device";

const char *backend_name(Backend backend) {
    switch (backend) {
    case Backend::RMT:
        return "rmt";
    case Backend::SIMULATED:
        return "simulated";
    }
    return "unknown";
}

const char *color_order_name(ColorOrder order) {
    switch (order) {
    case ColorOrder::GRB:
        return "GRB";
    case ColorOrder::RGB:
        return "RGB";
    case ColorOrder::BRG:
        return "BRG";
    }
    return "unknown";
}

esp_err_t Device::create(const DeviceCreateArgs &args, std::unique_ptr<Device> &out) {
    if (!validate(args)) {
        ESP_LOGE(TAG, "invalid DeviceCreateArgs (backend=%s leds=%lu gpio=%d sink=%p order=%s)",
                 backend_name(args.backend), (unsigned long)args.led_count, args.gpio, (void *)args.sink,
                 color_order_name(args.color_order));
        return ESP_ERR_INVALID_ARG;
    }

    std::unique_ptr<IStripBackend> impl;
    esp_err_t err = ESP_ERR_NOT_SUPPORTED;
    switch (args.backend) {
    case Backend::RMT:
        err = new_rmt_backend(args, impl);
        break;
    case Backend::SIMULATED:
        err = new_sim_backend(args, impl);
        break;
    }
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "failed to create %s backend: %s", backend_name(args.backend), esp_err_to_name(err));
        return err;
    }

    out = std::make_unique<Device>(Key{}, args, std::move(impl));
    ESP_LOGI(TAG, "%s strip ready, %lu leds, %s", backend_name(args.backend), (unsigned long)args.led_count,
             color_order_name(args.color_order));
    return ESP_OK;
}

Device::Device(Key, const DeviceCreateArgs &args, std::unique_ptr<IStripBackend> impl)
    : backend_(args.backend), color_order_(args.color_order), impl_(std::move(impl)),
      buf_(args.led_count, utils::colors::OFF) {}

Color Device::pixel(int index) const {
    if (index < 0 || static_cast<size_t>(index) >= buf_.size()) return utils::colors::OFF;
    return buf_[index];
}

esp_err_t Device::write_pixels(int start, int count, const Color &color) {
    // 64-bit so start + count cannot overflow
    const int64_t lo = std::max<int64_t>(start, 0);
    const int64_t hi = std::min<int64_t>(static_cast<int64_t>(start) + count, static_cast<int64_t>(buf_.size()));
    if (hi <= lo) return ESP_OK;

    std::fill(buf_.begin() + lo, buf_.begin() + hi, color);
    esp_err_t err = impl_->write_range(static_cast<uint32_t>(lo), static_cast<uint32_t>(hi - lo), color);
    if (err != ESP_OK) return err;

    dirty_ = true;
    return ESP_OK;
}

esp_err_t Device::write_all(const Color &color) { return write_pixels(0, static_cast<int>(buf_.size()), color); }

esp_err_t Device::write_segment(const StripSegment &segment, const Color &color) {
    return write_pixels(segment.start(), segment.length(), color);
}

esp_err_t Device::animate(const vendor::VendorAnimation &anim) {
    char label[128];
    ESP_LOGI(TAG, "animate %s", vendor::describe(anim, label, sizeof(label)));
    return impl_->animate(anim);
}

esp_err_t Device::clear() {
    esp_err_t err = write_all(utils::colors::OFF);
    if (err != ESP_OK) return err;
    return show();
}

esp_err_t Device::show() {
    if (!dirty_) return ESP_OK;
    esp_err_t err = impl_->refresh();
    if (err != ESP_OK) return err;
    dirty_ = false;
    return ESP_OK;
}

esp_err_t animate_strip(Device &device, const StripSegment &segment, const Color &color,
                        vendor::VendorAnimationType type, const vendor::AnimationConfig &config) {
    vendor::VendorAnimation anim{};
    esp_err_t err = vendor::make_vendor_animation(segment, color, type, config, anim);
    if (err != ESP_OK) return err;
    return device.animate(anim);
}

} // namespace device
