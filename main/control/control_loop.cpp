#include <main/control/control_loop.hpp>
#include <main/config/config.hpp>
#include <main/config/config_fields.hpp>
#include <main/control/crop_catalog.hpp>
#include <main/control/day_clock.hpp>
#include <main/control/et0_model.hpp>
#include <main/control/irrigation_calculator.hpp>
#include <main/control/message_decoder.hpp>
#include <main/control/status_report.hpp>
#include <algorithm>
#include <cstdio>
#include <cstring>

static const char* TAG = "ControlLoop";

namespace {
    // Log lines are only forwarded from the task that owns the loop
    thread_local ControlLoop* t_forwarding_loop = nullptr;

    const char* const kSubscriptions[] = {
        Config::Mqtt::Topics::SOIL_MOISTURE,
        Config::Mqtt::Topics::CONFIG_CROP,
        Config::Mqtt::Topics::CONFIG_PLANTING_DATE,
        Config::Mqtt::Topics::CONFIG_PLANT_COUNT,
        Config::Mqtt::Topics::CONFIG_PLANT_SPACING,
        Config::Mqtt::Topics::CONFIG_ROW_SPACING,
        Config::Mqtt::Topics::CONFIG_PUMP_FLOW,
    };
}

LoopSettings LoopSettings::fromConfig() {
    LoopSettings s{};
    s.tick_interval_ms = Config::Control::tick_interval_ms;
    s.sampling_window_ms = Config::Control::sampling_window_ms;
    s.sampling_poll_ms = Config::Control::sampling_poll_ms;
    s.status_interval_ms = Config::Control::status_interval_ms;
    s.config_timeout_ms = Config::Control::config_timeout_ms;
    s.config_poll_ms = Config::Control::config_poll_ms;
    s.config_progress_log_ms = Config::Control::config_progress_log_ms;
    s.reconnect_backoff_ms = Config::Control::reconnect_backoff_ms;
    s.reconnect_failure_wait_ms = Config::Control::reconnect_failure_wait_ms;
    s.min_pump_run_s = Config::Control::min_pump_run_s;
    s.field_capacity_pct = Config::Soil::field_capacity_pct;
    s.wilting_point_pct = Config::Soil::wilting_point_pct;
    s.default_vwc_pct = Config::Soil::default_vwc_pct;
    s.min_valid_vwc_pct = Config::Soil::min_valid_vwc_pct;
    s.max_valid_vwc_pct = Config::Soil::max_valid_vwc_pct;
    s.qos = Config::Mqtt::default_qos;
    s.device_id = Config::Device::id;
    return s;
}

ControlLoop::ControlLoop(const LoopSettings& settings,
                         NetworkLink& network,
                         MessageBus& bus,
                         WeatherSource& weather,
                         DailyLogStore& log_store,
                         Clock& clock,
                         ConfigSource& startup_config)
    : settings(settings),
      network(network),
      bus(bus),
      weather(weather),
      log_store(log_store),
      clock(clock),
      startup_config(startup_config),
      live_config(nullptr),
      observer(nullptr),
      current_phase(LoopPhase::CONNECTING),
      has_config(false),
      planting{},
      total_area_m2(0.0),
      state{},
      pump_state{},
      sampler(settings.sampling_window_ms, settings.min_valid_vwc_pct, settings.max_valid_vwc_pct),
      boot_ms(clock.monotonicMs()),
      last_status_ms(0),
      status_published_once(false),
      draining_logs(false),
      forwarding_logs(false) {}

ControlLoop::~ControlLoop() {
    if (t_forwarding_loop == this) {
        Logger::clearSink();
        t_forwarding_loop = nullptr;
    }
}

void ControlLoop::setLiveConfigSource(ConfigSource* source) {
    live_config = source;
}

void ControlLoop::setStatusObserver(StatusObserver* status_observer) {
    observer = status_observer;
}

void ControlLoop::enableLogForwarding() {
    t_forwarding_loop = this;
    forwarding_logs = true;
    Logger::setSink(&ControlLoop::onLogLine, this);
}

void ControlLoop::onLogLine(void* context, LogLevel level, const char* tag, const char* message) {
    auto* self = static_cast<ControlLoop*>(context);
    if (self == nullptr || t_forwarding_loop != self || self->draining_logs) {
        return;
    }
    char stamp[20];
    DayClock::formatDateTime(self->clock.wallTime(), stamp, sizeof(stamp));
    LogLine line{};
    std::snprintf(line.text, sizeof(line.text), "%s [%s] %s: %s", stamp, Logger::levelName(level), tag, message);
    (void)self->log_outbox.pushOverwrite(line);
}

void ControlLoop::onBusMessage(void* context, const char* topic, const uint8_t* payload, int length) {
    auto* self = static_cast<ControlLoop*>(context);
    self->handleMessage(MessageDecoder::decode(topic, payload, length));
}

void ControlLoop::handleMessage(const InboundMessage& message) {
    switch (message.kind) {
        case MessageKind::SOIL_READING:
            if (sampler.isActive()) {
                (void)sampler.offer(message.payload);
            } else {
                LOG_DEBUG(TAG, "Soil reading '%s' outside sampling window ignored", message.payload);
            }
            break;
        case MessageKind::CONFIG_CROP:
        case MessageKind::CONFIG_PLANTING_DATE:
        case MessageKind::CONFIG_PLANT_COUNT:
        case MessageKind::CONFIG_PLANT_SPACING:
        case MessageKind::CONFIG_ROW_SPACING:
        case MessageKind::CONFIG_PUMP_FLOW:
            if (current_phase == LoopPhase::CONFIG_PENDING) {
                startup_config.onMessage(message);
            } else {
                LOG_WARN(TAG, "Config topic %s ignored while running; use POST /config",
                         MessageDecoder::kindName(message.kind));
            }
            break;
        case MessageKind::UNKNOWN:
            LOG_DEBUG(TAG, "Unhandled message payload='%s'", message.payload);
            break;
    }
}

bool ControlLoop::connectBus() {
    bus.setMessageHandler(&ControlLoop::onBusMessage, this);
    if (!bus.connect()) {
        LOG_ERROR(TAG, "%s", "MQTT connect failed");
        return false;
    }
    for (const char* topic : kSubscriptions) {
        if (bus.subscribe(topic, settings.qos) < 0) {
            LOG_ERROR(TAG, "Subscribe failed for %s", topic);
            bus.disconnect();
            return false;
        }
    }
    LOG_INFO(TAG, "MQTT session up, %u topics subscribed",
             static_cast<unsigned>(sizeof(kSubscriptions) / sizeof(kSubscriptions[0])));
    return true;
}

bool ControlLoop::start() {
    setPhase(LoopPhase::CONNECTING);
    if (!network.connect()) {
        LOG_ERROR(TAG, "%s", "Network unreachable at startup, halting");
        setPhase(LoopPhase::HALTED);
        return false;
    }
    if (!connectBus()) {
        LOG_ERROR(TAG, "%s", "Message bus unreachable at startup, halting");
        setPhase(LoopPhase::HALTED);
        return false;
    }

    setPhase(LoopPhase::CONFIG_PENDING);
    if (!waitForConfig()) {
        setPhase(LoopPhase::HALTED);
        return false;
    }

    setPhase(LoopPhase::RUNNING);
    return true;
}

bool ControlLoop::waitForConfig() {
    LOG_INFO(TAG, "Waiting up to %u s for configuration from %s",
             static_cast<unsigned>(settings.config_timeout_ms / 1000U), startup_config.name());
    const uint64_t started_ms = clock.monotonicMs();
    uint64_t last_progress_ms = started_ms;
    char missing[96];

    for (;;) {
        if (bus.poll() < 0) {
            LOG_WARN(TAG, "%s", "MQTT session lost while waiting for configuration");
            bus.disconnect();
            clock.sleepMs(settings.reconnect_backoff_ms);
            (void)connectBus();
        }

        PlantingConfig cfg{};
        if (startup_config.poll(cfg)) {
            ErrorCode err = ConfigFields::validate(cfg);
            if (err == ErrorCode::OK) {
                applyConfig(cfg, true);
                return true;
            }
            LOG_ERROR(TAG, "Configuration from %s rejected (%s)", startup_config.name(), errorCodeName(err));
        }

        const uint64_t now_ms = clock.monotonicMs();
        if (now_ms - started_ms >= settings.config_timeout_ms) {
            startup_config.describeMissing(missing, sizeof(missing));
            LOG_ERROR(TAG, "Configuration timeout after %u s (missing: %s), halting",
                      static_cast<unsigned>(settings.config_timeout_ms / 1000U), missing);
            return false;
        }
        if (now_ms - last_progress_ms >= settings.config_progress_log_ms) {
            startup_config.describeMissing(missing, sizeof(missing));
            LOG_INFO(TAG, "Still waiting for configuration (missing: %s)", missing);
            last_progress_ms = now_ms;
        }
        clock.sleepMs(settings.config_poll_ms);
    }
}

void ControlLoop::applyConfig(const PlantingConfig& cfg, bool initial) {
    planting = cfg;
    has_config = true;
    total_area_m2 = cfg.totalAreaM2();
    refreshCropParameters();
    LOG_INFO(TAG, "%s: crop=%s planted=%04d-%02d-%02d plants=%d spacing=%.1fx%.1fcm area=%.2fm2 flow=%.2fL/h",
             initial ? "Configuration complete" : "Configuration replaced",
             CropCatalog::name(cfg.crop), cfg.planting_date.year, cfg.planting_date.month, cfg.planting_date.day,
             static_cast<int>(cfg.plant_count), cfg.plant_spacing_cm, cfg.row_spacing_cm,
             total_area_m2, cfg.pump_flow_lph);
}

void ControlLoop::refreshCropParameters() {
    int days = 0;
    ErrorCode err = DayClock::daysAfterPlanting(planting.planting_date, clock.wallTime(), days);
    if (err != ErrorCode::OK) {
        LOG_ERROR(TAG, "Days after planting unavailable (%s), keeping day %d",
                  errorCodeName(err), static_cast<int>(state.day_index));
        days = state.day_index;
    }
    state.day_index = days;
    state.kc_today = CropCatalog::kcForDay(planting.crop, days);
    state.root_zone_mm = CropCatalog::rootZoneMmForDay(planting.crop, days);
    LOG_INFO(TAG, "Day %d: Kc=%.3f RZ=%.1fmm", days, state.kc_today, state.root_zone_mm);
}

bool ControlLoop::superviseConnections() {
    if (!network.isConnected()) {
        LOG_WARN(TAG, "%s", "Network link down, reconnecting");
        clock.sleepMs(settings.reconnect_backoff_ms);
        if (!network.connect()) {
            LOG_ERROR(TAG, "Network reconnect failed, retrying in %u s",
                      static_cast<unsigned>(settings.reconnect_failure_wait_ms / 1000U));
            clock.sleepMs(settings.reconnect_failure_wait_ms);
            return false;
        }
    }

    if (bus.poll() >= 0) {
        return true;
    }
    LOG_WARN(TAG, "%s", "MQTT session unhealthy, reconnecting");
    bus.disconnect();
    clock.sleepMs(settings.reconnect_backoff_ms);
    if (!connectBus()) {
        LOG_ERROR(TAG, "MQTT reconnect failed, retrying in %u s",
                  static_cast<unsigned>(settings.reconnect_failure_wait_ms / 1000U));
        clock.sleepMs(settings.reconnect_failure_wait_ms);
        return false;
    }
    LOG_INFO(TAG, "%s", "MQTT reconnected");
    return true;
}

void ControlLoop::tick() {
    if (current_phase != LoopPhase::RUNNING) {
        return;
    }
    if (!superviseConnections()) {
        notifyObserver();
        return;
    }

    if (live_config != nullptr) {
        PlantingConfig cfg{};
        if (live_config->poll(cfg)) {
            ErrorCode err = ConfigFields::validate(cfg);
            if (err == ErrorCode::OK) {
                applyConfig(cfg, false);
            } else {
                LOG_ERROR(TAG, "Live configuration rejected (%s)", errorCodeName(err));
            }
        }
    }

    char today[11];
    DayClock::formatDate(clock.wallTime(), today, sizeof(today));
    if (std::strcmp(today, state.last_date_processed) != 0) {
        runDailyCycle(today);
    }

    checkPumpTimeout();

    const uint64_t now_ms = clock.monotonicMs();
    if (!status_published_once || now_ms - last_status_ms >= settings.status_interval_ms) {
        publishStatus();
        last_status_ms = now_ms;
        status_published_once = true;
    }
    publishRemainingTime();
    drainLogOutbox();
    notifyObserver();
}

bool ControlLoop::run() {
    enableLogForwarding();
    if (!start()) {
        drainLogOutbox();
        return false;
    }
    for (;;) {
        tick();
        clock.sleepMs(settings.tick_interval_ms);
    }
}

void ControlLoop::runDailyCycle(const char* today) {
    LOG_INFO(TAG, "===== New day detected: %s =====", today);

    sampleSoil();
    refreshCropParameters();
    updateEt0();
    checkPumpTimeout();

    state.available_water_mm = Irrigation::availableWaterMm(state.has_mean_vwc, state.mean_vwc,
                                                            state.root_zone_mm,
                                                            settings.field_capacity_pct,
                                                            settings.wilting_point_pct);
    Irrigation::PumpPlan plan{0.0, 0.0};
    ErrorCode err = Irrigation::irrigationTime(state.kc_today, state.last_et0, state.available_water_mm,
                                               total_area_m2, planting.pump_flow_lph, plan);
    if (err != ErrorCode::OK) {
        LOG_ERROR(TAG, "Irrigation time unavailable (%s), pump stays off today", errorCodeName(err));
    }
    state.etc_mm = plan.etc_mm;
    state.pump_duration_s = plan.seconds;
    LOG_INFO(TAG, "Avail=%.1fmm ETc=%.2fmm (ET0=%.2f) pump=%.1fs",
             state.available_water_mm, state.etc_mm, state.last_et0, state.pump_duration_s);

    decidePump();
    appendDailyLog(today);

    std::snprintf(state.last_date_processed, sizeof(state.last_date_processed), "%s", today);
    LOG_INFO(TAG, "Daily cycle finished for %s", today);
}

void ControlLoop::sampleSoil() {
    sampler.begin(clock.monotonicMs());
    bool session_lost = false;
    while (sampler.isWindowOpen(clock.monotonicMs())) {
        if (bus.poll() < 0) {
            LOG_WARN(TAG, "%s", "MQTT session lost during sampling, aborting window");
            session_lost = true;
            break;
        }
        // A pump left running from yesterday must not outlast its target
        checkPumpTimeout();
        clock.sleepMs(settings.sampling_poll_ms);
    }
    SoilSampleSummary summary = sampler.finish();
    LOG_INFO(TAG, "Sampling complete, %u readings", static_cast<unsigned>(summary.count));

    if (session_lost) {
        bus.disconnect();
        clock.sleepMs(settings.reconnect_backoff_ms);
        if (!connectBus()) {
            LOG_ERROR(TAG, "%s", "MQTT reconnect after sampling failed, continuing with what arrived");
        }
    }

    if (summary.count > 0) {
        state.mean_vwc = summary.mean_vwc_pct;
        state.has_mean_vwc = true;
        LOG_INFO(TAG, "Mean VWC %.1f%%", state.mean_vwc);
    } else if (state.has_mean_vwc) {
        LOG_WARN(TAG, "No soil readings today, reusing previous mean VWC %.1f%%", state.mean_vwc);
    } else {
        state.mean_vwc = settings.default_vwc_pct;
        state.has_mean_vwc = true;
        LOG_WARN(TAG, "No soil readings yet, using default VWC %.1f%%", state.mean_vwc);
    }
}

void ControlLoop::updateEt0() {
    WeatherSample sample{};
    ErrorCode err = weather.fetch(sample);
    if (err == ErrorCode::OK) {
        state.last_weather = sample;
        state.has_weather = true;
        LOG_INFO(TAG, "Weather: Tmax=%.1fC RH=%.0f%% E=%.2fMJ/m2",
                 sample.tmax_c, sample.relative_humidity_pct, sample.solar_energy_mj_m2_day);
    } else {
        LOG_WARN(TAG, "Weather fetch failed (%s)", errorCodeName(err));
        if (!state.has_weather) {
            LOG_WARN(TAG, "%s", "No weather ever obtained, using ET0 = 0");
            state.last_et0 = 0.0;
            return;
        }
        LOG_INFO(TAG, "%s", "Using previous weather for ET0");
    }

    double raw_et0 = 0.0;
    err = Et0::predict(state.last_weather, raw_et0);
    if (err != ErrorCode::OK) {
        LOG_ERROR(TAG, "ET0 inference failed (%s), keeping %.2f mm", errorCodeName(err), state.last_et0);
        return;
    }
    state.last_et0 = std::max(0.0, raw_et0);
    LOG_INFO(TAG, "ET0=%.2f mm/day (raw %.4f)", state.last_et0, raw_et0);
}

void ControlLoop::decidePump() {
    const double seconds = state.pump_duration_s;
    if (seconds > settings.min_pump_run_s) {
        if (pump_state.running) {
            pump_state.target_duration_s = seconds;
            LOG_WARN(TAG, "Pump already running, target updated to %.1fs without restarting", seconds);
            return;
        }
        if (!publishPumpCommand(Config::Mqtt::Payloads::PUMP_ON)) {
            LOG_ERROR(TAG, "%s", "PUMP_ON not delivered, pump stays off today");
            return;
        }
        pump_state.running = true;
        pump_state.start_ms = clock.monotonicMs();
        pump_state.target_duration_s = seconds;
        LOG_INFO(TAG, "Pump ON for %.1fs", seconds);
        return;
    }

    LOG_INFO(TAG, "%s", "No irrigation required today");
    if (pump_state.running) {
        LOG_WARN(TAG, "%s", "Pump running although none is required, switching off");
        if (publishPumpCommand(Config::Mqtt::Payloads::PUMP_OFF)) {
            pump_state.running = false;
            pump_state.target_duration_s = 0.0;
        } else {
            LOG_ERROR(TAG, "%s", "PUMP_OFF not delivered, retrying next tick");
        }
    }
}

void ControlLoop::appendDailyLog(const char* today) {
    if (!state.has_mean_vwc) {
        return;
    }
    DailyLogRow row{};
    std::snprintf(row.date, sizeof(row.date), "%s", today);
    row.mean_vwc_pct = state.mean_vwc;
    row.et0_mm = state.last_et0;
    row.etc_mm = state.etc_mm;
    row.pump_time_s = state.pump_duration_s;
    row.available_water_mm = state.available_water_mm;
    row.root_zone_mm = state.root_zone_mm;
    row.kc = state.kc_today;
    if (!log_store.append(row)) {
        LOG_WARN(TAG, "Daily log row for %s not written", today);
    }
}

double ControlLoop::pumpRemainingS() const {
    if (!pump_state.running) {
        return 0.0;
    }
    const double elapsed_s = static_cast<double>(clock.monotonicMs() - pump_state.start_ms) / 1000.0;
    return std::max(0.0, pump_state.target_duration_s - elapsed_s);
}

void ControlLoop::checkPumpTimeout() {
    if (!pump_state.running) {
        return;
    }
    const double elapsed_s = static_cast<double>(clock.monotonicMs() - pump_state.start_ms) / 1000.0;
    if (elapsed_s < pump_state.target_duration_s) {
        return;
    }
    if (!publishPumpCommand(Config::Mqtt::Payloads::PUMP_OFF)) {
        LOG_WARN(TAG, "%s", "PUMP_OFF not delivered, retrying next tick");
        return;
    }
    LOG_INFO(TAG, "Pump OFF after %.1fs (target %.1fs)", elapsed_s, pump_state.target_duration_s);
    pump_state.running = false;
    pump_state.target_duration_s = 0.0;
}

bool ControlLoop::publishPumpCommand(const char* command) {
    if (!bus.isConnected()) {
        return false;
    }
    return bus.publish(Config::Mqtt::Topics::PUMP_COMMAND, command, settings.qos, false) >= 0;
}

void ControlLoop::publishRemainingTime() {
    if (!bus.isConnected()) {
        return;
    }
    char payload[24];
    std::snprintf(payload, sizeof(payload), "%.1f", pumpRemainingS());
    (void)bus.publish(Config::Mqtt::Topics::PUMP_REMAINING, payload, 0, false);
}

void ControlLoop::publishStatus() {
    ControllerStatus status = snapshot();
    StatusReport::log(status);
    if (!bus.isConnected()) {
        return;
    }
    char topic[96];
    std::snprintf(topic, sizeof(topic), Config::Mqtt::Topics::STATUS, settings.device_id);
    char payload[640];
    int n = StatusReport::toJson(status, settings.device_id, payload, sizeof(payload));
    if (n <= 0 || static_cast<size_t>(n) >= sizeof(payload)) {
        LOG_WARN(TAG, "Status document truncated (%d bytes)", n);
        return;
    }
    (void)bus.publish(topic, payload, settings.qos, true);
}

void ControlLoop::drainLogOutbox() {
    if (!forwarding_logs) {
        return;
    }
    LogLine line{};
    while (bus.isConnected() && log_outbox.peek(line)) {
        draining_logs = true;
        int mid = bus.publish(Config::Mqtt::Topics::LOG, line.text, 0, false);
        draining_logs = false;
        if (mid < 0) {
            break;
        }
        (void)log_outbox.pop(line);
    }
}

void ControlLoop::notifyObserver() {
    if (observer != nullptr) {
        observer->onStatus(snapshot());
    }
}

void ControlLoop::setPhase(LoopPhase phase) {
    if (phase == current_phase && phase != LoopPhase::CONNECTING) {
        return;
    }
    current_phase = phase;
    LOG_INFO(TAG, "Phase -> %s", StatusReport::phaseName(phase));
    notifyObserver();
}

ControllerStatus ControlLoop::snapshot() const {
    ControllerStatus status{};
    status.phase = current_phase;
    status.has_config = has_config;
    status.config = planting;
    status.total_area_m2 = total_area_m2;
    status.daily = state;
    status.pump_running = pump_state.running;
    status.pump_target_s = pump_state.target_duration_s;
    status.pump_remaining_s = pumpRemainingS();
    status.network_connected = network.isConnected();
    status.bus_connected = bus.isConnected();
    status.uptime_ms = clock.monotonicMs() - boot_ms;
    return status;
}
