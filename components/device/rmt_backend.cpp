// WS2812 strip on one RMT channel
#include "include/device.hpp"
#include "esp_log.h"
#include <memory>

#if !SEGFX_SIMULATION
#include "led_strip.h"
#endif

namespace device {

static const char *TAG = "rmt_backend";

#if !SEGFX_SIMULATION

namespace {

class RmtBackend final : public IStripBackend {
  public:
    explicit RmtBackend(led_strip_handle_t handle) : handle_(handle) {}
    ~RmtBackend() override {
        if (handle_) {
            led_strip_del(handle_);
            handle_ = nullptr;
        }
    }
    RmtBackend(const RmtBackend &) = delete;
    RmtBackend &operator=(const RmtBackend &) = delete;

    esp_err_t write_range(uint32_t start, uint32_t count, const Color &color) override {
        // channels go out as-is; the driver keeps the low byte
        for (uint32_t i = start; i < start + count; ++i) {
            esp_err_t err = led_strip_set_pixel(handle_, i, static_cast<uint32_t>(color.red()),
                                                static_cast<uint32_t>(color.green()),
                                                static_cast<uint32_t>(color.blue()));
            if (err != ESP_OK) return err;
        }
        return ESP_OK;
    }

    esp_err_t refresh() override { return led_strip_refresh(handle_); }

    esp_err_t animate(const vendor::VendorAnimation &anim) override {
        char label[128];
        ESP_LOGW(TAG, "no on-strip animation engine, dropping %s", vendor::describe(anim, label, sizeof(label)));
        return ESP_ERR_NOT_SUPPORTED;
    }

  private:
    led_strip_handle_t handle_;
};

// Position of each channel in the bytes shifted out per pixel
led_color_component_format_t component_format(ColorOrder order) {
    switch (order) {
    case ColorOrder::RGB:
        return LED_STRIP_COLOR_COMPONENT_FMT_RGB;
    case ColorOrder::BRG: {
        led_color_component_format_t fmt = {};
        fmt.format.b_pos = 0;
        fmt.format.r_pos = 1;
        fmt.format.g_pos = 2;
        fmt.format.w_pos = 3;
        fmt.format.num_components = 3;
        return fmt;
    }
    case ColorOrder::GRB:
    default:
        return LED_STRIP_COLOR_COMPONENT_FMT_GRB;
    }
}

} // namespace

esp_err_t new_rmt_backend(const DeviceCreateArgs &args, std::unique_ptr<IStripBackend> &out) {
    led_strip_config_t sc = {};
    sc.strip_gpio_num = args.gpio;
    sc.max_leds = args.led_count;
    sc.led_model = LED_MODEL_WS2812;
    sc.color_component_format = component_format(args.color_order);
    sc.flags.invert_out = false;

    led_strip_rmt_config_t rc = {};
    rc.clk_src = RMT_CLK_SRC_DEFAULT;
    rc.resolution_hz = RMT_HZ;
    rc.mem_block_symbols = 0; // default
    rc.flags.with_dma = 0;

    led_strip_handle_t handle = nullptr;
    esp_err_t err = led_strip_new_rmt_device(&sc, &rc, &handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "led_strip_new_rmt_device(gpio=%d, leds=%lu) failed: %s", args.gpio,
                 (unsigned long)args.led_count, esp_err_to_name(err));
        return err;
    }

    err = led_strip_clear(handle);
    if (err != ESP_OK) {
        led_strip_del(handle);
        return err;
    }

    out = std::make_unique<RmtBackend>(handle);
    ESP_LOGI(TAG, "WS2812 on GPIO%d, %lu leds, %s", args.gpio, (unsigned long)args.led_count,
             color_order_name(args.color_order));
    return ESP_OK;
}

#else

esp_err_t new_rmt_backend(const DeviceCreateArgs &args, std::unique_ptr<IStripBackend> &out) {
    (void)out;
    ESP_LOGE(TAG, "RMT strip on GPIO%d requested in a simulation build", args.gpio);
    return ESP_ERR_NOT_SUPPORTED;
}

#endif

} // namespace device
