#pragma once
#include "color.hpp"
#include "esp_err.h"
#include "frame_sink.hpp"
#include "segment.hpp"
#include "vendor_animation.hpp"
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <vector>

// Set by the build: 1 for the host (simulated) target, 0 for hardware.
#ifndef SEGFX_SIMULATION
#define SEGFX_SIMULATION 0
#endif

namespace device {

#define RMT_HZ (10 * 1000 * 1000)
#define K_MAX_LEDS 1024

using utils::Color;
using utils::StripSegment;

// Backend selection for the strip, fixed for the device's lifetime.
enum class Backend : uint8_t { RMT = 0, SIMULATED = 1 };

constexpr bool is_simulation() { return SEGFX_SIMULATION != 0; }

// Backend matching the execution context: simulated on the host, RMT on hardware.
constexpr Backend default_backend() { return is_simulation() ? Backend::SIMULATED : Backend::RMT; }

const char *backend_name(Backend backend);

// Byte order the strip expects on the wire.
enum class ColorOrder : uint8_t { GRB = 0, RGB = 1, BRG = 2 };

constexpr bool is_valid(ColorOrder order) {
    return static_cast<uint8_t>(order) <= static_cast<uint8_t>(ColorOrder::BRG);
}

const char *color_order_name(ColorOrder order);

struct DeviceCreateArgs {
    Backend backend;
    uint32_t led_count;
    int gpio;         // RMT only
    IFrameSink *sink; // SIMULATED only, not owned; must outlive the device
    ColorOrder color_order = ColorOrder::GRB;
};

// Lightweight validation helper; returns true if args are self-consistent
inline bool validate(const DeviceCreateArgs &args) {
    if (args.led_count == 0 || args.led_count > K_MAX_LEDS) return false;
    if (!is_valid(args.color_order)) return false;
    if (args.backend == Backend::RMT && args.gpio < 0) return false;
    if (args.backend == Backend::SIMULATED && args.sink == nullptr) return false;
    return true;
}

// Write boundary behind the Device. Exactly two implementations: the RMT
// strip and the simulated frame buffer. Ranges arrive already clipped.
class IStripBackend {
  public:
    virtual ~IStripBackend() = default;
    virtual esp_err_t write_range(uint32_t start, uint32_t count, const Color &color) = 0;
    virtual esp_err_t refresh() = 0;
    virtual esp_err_t animate(const vendor::VendorAnimation &anim) = 0;
    virtual const char *status_label() const { return ""; }
};

esp_err_t new_rmt_backend(const DeviceCreateArgs &args, std::unique_ptr<IStripBackend> &out);
esp_err_t new_sim_backend(const DeviceCreateArgs &args, std::unique_ptr<IStripBackend> &out);

class Device {
    // Only create() can name this, so only create() can construct a Device.
    struct Key {
        explicit Key() = default;
    };

  public:
    // ESP_ERR_INVALID_ARG for inconsistent args, ESP_ERR_NOT_SUPPORTED when the
    // backend does not exist in this build. `out` is only set on success.
    static esp_err_t create(const DeviceCreateArgs &args, std::unique_ptr<Device> &out);
    Device(Key, const DeviceCreateArgs &args, std::unique_ptr<IStripBackend> impl);
    ~Device() = default;
    // No copying; animations keep a pointer to the device
    Device(const Device &) = delete;
    Device &operator=(const Device &) = delete;

    // ----------------- Accessors -----------------
    uint32_t led_count() const { return static_cast<uint32_t>(buf_.size()); }
    Backend backend() const { return backend_; }
    ColorOrder color_order() const { return color_order_; }
    // OFF for indices outside the strip
    Color pixel(int index) const;
    const char *status_label() const { return impl_->status_label(); }

    // ----------------- Control APIs -----------------
    // [start, start + count) is clipped to the strip; pixels outside are dropped.
    esp_err_t write_pixels(int start, int count, const Color &color);
    esp_err_t write_all(const Color &color);
    esp_err_t write_segment(const StripSegment &segment, const Color &color);
    esp_err_t animate(const vendor::VendorAnimation &anim);
    esp_err_t clear();
    // Pushes the buffer to the strip if anything changed since the last show().
    esp_err_t show();

  private:
    Backend backend_;
    ColorOrder color_order_;
    std::unique_ptr<IStripBackend> impl_;
    std::vector<Color> buf_;
    bool dirty_ = false;
};

// Build the vendor descriptor for `segment` and push it to the device.
esp_err_t animate_strip(Device &device, const StripSegment &segment, const Color &color,
                        vendor::VendorAnimationType type,
                        const vendor::AnimationConfig &config = vendor::AnimationConfig::defaults());

} // namespace device
