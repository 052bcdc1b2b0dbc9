#ifndef CONTROL_LOOP_HPP
#define CONTROL_LOOP_HPP

#include <cstdint>
#include <main/control/collaborators.hpp>
#include <main/control/soil_sampler.hpp>
#include <main/models/controller_status.hpp>
#include <main/models/daily_state.hpp>
#include <main/models/log_line.hpp>
#include <main/utils/circular_buffer.hpp>
#include <main/utils/logger.hpp>

#ifndef CONTROL_LOG_OUTBOX_LEN
#define CONTROL_LOG_OUTBOX_LEN 16
#endif

struct LoopSettings {
    uint32_t tick_interval_ms;
    uint32_t sampling_window_ms;
    uint32_t sampling_poll_ms;
    uint32_t status_interval_ms;
    uint32_t config_timeout_ms;
    uint32_t config_poll_ms;
    uint32_t config_progress_log_ms;
    uint32_t reconnect_backoff_ms;
    uint32_t reconnect_failure_wait_ms;
    double   min_pump_run_s;
    double   field_capacity_pct;
    double   wilting_point_pct;
    double   default_vwc_pct;
    double   min_valid_vwc_pct;
    double   max_valid_vwc_pct;
    int      qos;
    const char* device_id;

    // Values from Config::Control, Config::Soil and Config::Mqtt
    static LoopSettings fromConfig();
};

// Owns every piece of mutable irrigation state and drives it from a single
// task: Connecting -> ConfigPending -> Running, or Halted when startup fails.
// Bus messages are delivered inside poll() on the same task, so no locking.
class ControlLoop {
public:
    ControlLoop(const LoopSettings& settings,
                NetworkLink& network,
                MessageBus& bus,
                WeatherSource& weather,
                DailyLogStore& log_store,
                Clock& clock,
                ConfigSource& startup_config);
    ~ControlLoop();

    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    // POST /config style replacements, applied at the start of a tick
    void setLiveConfigSource(ConfigSource* source);
    void setStatusObserver(StatusObserver* observer);

    // Forward log lines produced on the calling task to the log topic
    void enableLogForwarding();

    // Network, bus and configuration. false means Halted.
    bool start();

    // One Running iteration; never fails, errors degrade to last known values
    void tick();

    // start() followed by tick()/sleep forever. Returns only when start() fails.
    bool run();

    LoopPhase phase() const { return current_phase; }
    bool hasConfig() const { return has_config; }
    const PlantingConfig& config() const { return planting; }
    const DailyState& daily() const { return state; }
    const PumpState& pump() const { return pump_state; }
    double pumpRemainingS() const;
    ControllerStatus snapshot() const;

private:
    static void onBusMessage(void* context, const char* topic, const uint8_t* payload, int length);
    static void onLogLine(void* context, LogLevel level, const char* tag, const char* message);

    void handleMessage(const InboundMessage& message);
    bool connectBus();
    bool superviseConnections();
    bool waitForConfig();
    void applyConfig(const PlantingConfig& cfg, bool initial);
    void refreshCropParameters();

    void runDailyCycle(const char* today);
    void sampleSoil();
    void updateEt0();
    void decidePump();
    void appendDailyLog(const char* today);

    void checkPumpTimeout();
    bool publishPumpCommand(const char* command);
    void publishRemainingTime();
    void publishStatus();
    void drainLogOutbox();
    void notifyObserver();
    void setPhase(LoopPhase phase);

    LoopSettings settings;
    NetworkLink& network;
    MessageBus& bus;
    WeatherSource& weather;
    DailyLogStore& log_store;
    Clock& clock;
    ConfigSource& startup_config;
    ConfigSource* live_config;
    StatusObserver* observer;

    LoopPhase current_phase;
    bool has_config;
    PlantingConfig planting;
    double total_area_m2;
    DailyState state;
    PumpState pump_state;
    SoilSampler sampler;
    uint64_t boot_ms;
    uint64_t last_status_ms;
    bool status_published_once;

    CircularBuffer<LogLine, CONTROL_LOG_OUTBOX_LEN> log_outbox;
    bool draining_logs;
    bool forwarding_logs;
};

#endif // CONTROL_LOOP_HPP
