#include "animations.hpp"
#include "app_config.hpp"
#include "device.hpp"
#include "esp_err.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "scheduler.hpp"
#include <memory>
#include <vector>

using namespace anim_common;
using breathe_animation::Breathe;
using countdown_animation::Countdown;
using indicator_animation::BooleanIndicator;
using indicator_animation::StateIndicator;
using range_animation::RangeValue;
using vendor::AnimationConfig;
using vendor::VendorAnimationType;

static const char *TAG = "main";

namespace {

// Stand-in for live robot state shown by the indicator scene
enum class DriveMode : uint8_t { DISABLED = 0, AUTONOMOUS, TELEOP, TEST };

struct Scene {
    const char *name;
    std::vector<std::unique_ptr<Animation>> animations;
    bool vendor_showcase = false;
};

StripSegment make_segment(int start, int end) {
    StripSegment seg;
    ESP_ERROR_CHECK(StripSegment::create(start, end, seg));
    return seg;
}

template <typename T> std::unique_ptr<Animation> checked(esp_err_t err, std::unique_ptr<T> &anim) {
    ESP_ERROR_CHECK(err);
    return std::move(anim);
}

Scene wave_scene(Device &strip, TickScheduler &sched) {
    Scene scene{.name = "breathing wave", .animations = {}};
    const int width = K_STRIP_LEDS / K_WAVE_SEGMENTS;
    for (int i = 0; i < K_WAVE_SEGMENTS; ++i) {
        std::unique_ptr<Breathe> b;
        esp_err_t err = Breathe::create(Binding{&strip, &sched, make_segment(i * width, (i + 1) * width)},
                                        breathe_animation::BreatheArgs{.color = utils::colors::CYAN,
                                                                       .frequency_hz = 0.5f,
                                                                       .dimness = 0.1f,
                                                                       .phase_shift = i * 0.6f},
                                        b);
        scene.animations.push_back(checked(err, b));
    }
    return scene;
}

Scene countdown_scene(Device &strip, TickScheduler &sched, const StripSegment &full) {
    Scene scene{.name = "countdown", .animations = {}};
    std::unique_ptr<Countdown> c;
    esp_err_t err = Countdown::create(Binding{&strip, &sched, full},
                                      countdown_animation::CountdownArgs{.seconds = 10.0f,
                                                                         .color = utils::colors::ORANGE},
                                      c);
    scene.animations.push_back(checked(err, c));
    return scene;
}

Scene indicator_scene(Device &strip, TickScheduler &sched, const StripSegment &left, const StripSegment &right) {
    Scene scene{.name = "indicators", .animations = {}};

    std::unique_ptr<BooleanIndicator> b;
    esp_err_t err = BooleanIndicator::create(
        Binding{&strip, &sched, left},
        indicator_animation::BooleanIndicatorArgs{
            .supplier = [&sched]() { return (sched.now_us() / 1000000) % 2 == 0; },
            .true_color = utils::colors::GREEN,
            .false_color = utils::colors::RED,
        },
        b);
    scene.animations.push_back(checked(err, b));

    std::unique_ptr<StateIndicator> s;
    err = StateIndicator::create(
        Binding{&strip, &sched, right},
        indicator_animation::StateIndicatorArgs{
            .state = indicator_animation::ordinal_of(
                [&sched]() { return static_cast<DriveMode>((sched.now_us() / 2000000) % 4); }),
            .colors = {utils::colors::OFF, utils::colors::YELLOW, utils::colors::BLUE, utils::colors::PURPLE},
        },
        s);
    scene.animations.push_back(checked(err, s));
    return scene;
}

Scene range_scene(Device &strip, TickScheduler &sched, const StripSegment &full) {
    Scene scene{.name = "range", .animations = {}};
    std::unique_ptr<RangeValue> r;
    esp_err_t err = RangeValue::create(Binding{&strip, &sched, full},
                                       range_animation::RangeValueArgs{
                                           .min = 0.0,
                                           .max = 100.0,
                                           // triangle wave, 0 -> 100 -> 0 every 8 s
                                           .value =
                                               [&sched]() {
                                                   const double t = (sched.now_us() / 1000) % 8000 / 4000.0;
                                                   return t < 1.0 ? t * 100.0 : (2.0 - t) * 100.0;
                                               },
                                           .fill_color = utils::colors::CYAN,
                                           .empty_color = utils::colors::OFF,
                                       },
                                       r);
    scene.animations.push_back(checked(err, r));
    return scene;
}

void start_scene(Device &strip, Scene &scene, const StripSegment &full) {
    ESP_LOGI(TAG, "scene: %s", scene.name);
    for (auto &anim : scene.animations) {
        anim->run();
    }
    if (scene.vendor_showcase) {
        // the RMT strip has no animation engine of its own; report and carry on
        ESP_ERROR_CHECK_WITHOUT_ABORT(device::animate_strip(strip, full, utils::colors::ORANGE,
                                                            VendorAnimationType::FIRE,
                                                            AnimationConfig::intense_fire()));
    }
}

void end_scene(Device &strip, Scene &scene) {
    for (auto &anim : scene.animations) {
        ESP_ERROR_CHECK(anim->end());
    }
    if (scene.vendor_showcase) ESP_ERROR_CHECK(strip.clear());
}

} // namespace

extern "C" void app_main(void) {
    static device::LogFrameSink sink;
    device::DeviceCreateArgs args{.backend = device::default_backend(),
                                  .led_count = K_STRIP_LEDS,
                                  .gpio = K_STRIP_GPIO,
                                  .sink = &sink,
                                  .color_order = K_STRIP_COLOR_ORDER};
    std::unique_ptr<Device> strip;
    ESP_ERROR_CHECK(Device::create(args, strip));
    ESP_ERROR_CHECK(strip->clear());

    const StripSegment full = make_segment(0, K_STRIP_LEDS);
    const StripSegment left = make_segment(0, K_STRIP_LEDS / 2);
    const StripSegment right = make_segment(K_STRIP_LEDS / 2, K_STRIP_LEDS);

    static TickScheduler sched;

    // Every segment and animation is built up front so bad parameters stop
    // the firmware before anything lights up.
    std::vector<Scene> scenes;
    scenes.push_back(wave_scene(*strip, sched));
    scenes.push_back(countdown_scene(*strip, sched, full));
    scenes.push_back(indicator_scene(*strip, sched, left, right));
    scenes.push_back(range_scene(*strip, sched, full));
    scenes.push_back(Scene{.name = "vendor fire", .animations = {}, .vendor_showcase = true});

    size_t current = 0;
    start_scene(*strip, scenes[current], full);
    int64_t scene_started_us = sched.now_us();

    while (true) {
        // 1) Draw every running animation, then push the frame once
        ESP_ERROR_CHECK(sched.tick());
        ESP_ERROR_CHECK(strip->show());

        // 2) Rotate scenes; only one scene owns the strip at a time
        if (sched.now_us() - scene_started_us >= K_SCENE_PERIOD_MS * 1000LL) {
            end_scene(*strip, scenes[current]);
            if (device::is_simulation()) {
                ESP_LOGI(TAG, "%s done, %lu frames simulated", scenes[current].name, (unsigned long)sink.frames());
            }
            current = (current + 1) % scenes.size();
            start_scene(*strip, scenes[current], full);
            scene_started_us = sched.now_us();
        }

        vTaskDelay(pdMS_TO_TICKS(K_TICK_PERIOD_MS));
    }
}
