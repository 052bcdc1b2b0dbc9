// In-memory collaborators for driving ControlLoop on the host
#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <vector>
#include <main/control/collaborators.hpp>

// Monotonic time only moves when the code under test sleeps
class FakeClock : public Clock {
public:
    explicit FakeClock(time_t wall_base) : wall_base(wall_base), now_ms(0) {}

    uint64_t monotonicMs() const override { return now_ms; }
    time_t wallTime() const override { return wall_base + static_cast<time_t>(now_ms / 1000U); }
    void sleepMs(uint32_t ms) override { now_ms += ms; }

    void advanceMs(uint64_t ms) { now_ms += ms; }

private:
    time_t wall_base;
    uint64_t now_ms;
};

class FakeNetwork : public NetworkLink {
public:
    bool connect() override {
        ++connect_calls;
        connected = connect_result;
        return connected;
    }
    bool isConnected() const override { return connected; }

    bool connect_result = true;
    bool connected = false;
    int connect_calls = 0;
};

struct Published {
    std::string topic;
    std::string payload;
    int qos;
    bool retain;
    uint64_t at_ms;
};

class FakeBus : public MessageBus {
public:
    explicit FakeBus(const Clock& clock) : clock(clock) {}

    bool connect() override {
        ++connect_calls;
        if (connect_failures > 0) {
            --connect_failures;
            return false;
        }
        connected = true;
        return true;
    }
    void disconnect() override {
        ++disconnect_calls;
        connected = false;
    }
    bool isConnected() const override { return connected; }

    int subscribe(const char* topic, int qos) override {
        (void)qos;
        if (!connected) {
            return -1;
        }
        subscriptions.push_back(topic);
        return next_id++;
    }

    int publish(const char* topic, const char* payload, int qos, bool retain) override {
        if (!connected || fail_topic == topic) {
            return -1;
        }
        published.push_back(Published{topic, payload, qos, retain, clock.monotonicMs()});
        return next_id++;
    }

    int poll() override {
        if (drop_at_ms >= 0 && clock.monotonicMs() >= static_cast<uint64_t>(drop_at_ms)) {
            drop_at_ms = -1;
            connected = false;
        }
        if (!connected) {
            return -1;
        }
        int delivered = 0;
        for (Scheduled& msg : scheduled) {
            if (msg.delivered || msg.at_ms > clock.monotonicMs()) {
                continue;
            }
            msg.delivered = true;
            ++delivered;
            if (handler != nullptr) {
                handler(handler_context, msg.topic.c_str(),
                        reinterpret_cast<const uint8_t*>(msg.payload.data()),
                        static_cast<int>(msg.payload.size()));
            }
        }
        return delivered;
    }

    void setMessageHandler(MessageHandler h, void* context) override {
        handler = h;
        handler_context = context;
    }

    void schedule(uint64_t at_ms, const std::string& topic, const std::string& payload) {
        scheduled.push_back(Scheduled{at_ms, topic, payload, false});
    }

    std::vector<Published> publishedTo(const std::string& topic) const {
        std::vector<Published> out;
        for (const Published& p : published) {
            if (p.topic == topic) {
                out.push_back(p);
            }
        }
        return out;
    }

    int countPayload(const std::string& topic, const std::string& payload) const {
        int n = 0;
        for (const Published& p : published) {
            if (p.topic == topic && p.payload == payload) {
                ++n;
            }
        }
        return n;
    }

    bool connected = false;
    int connect_failures = 0;
    int connect_calls = 0;
    int disconnect_calls = 0;
    int64_t drop_at_ms = -1;
    std::string fail_topic;
    std::vector<std::string> subscriptions;
    std::vector<Published> published;

private:
    struct Scheduled {
        uint64_t at_ms;
        std::string topic;
        std::string payload;
        bool delivered;
    };

    const Clock& clock;
    MessageHandler handler = nullptr;
    void* handler_context = nullptr;
    std::vector<Scheduled> scheduled;
    int next_id = 1;
};

class FakeWeather : public WeatherSource {
public:
    ErrorCode fetch(WeatherSample& out_sample) override {
        ++calls;
        if (result == ErrorCode::OK) {
            out_sample = sample;
        }
        return result;
    }

    ErrorCode result = ErrorCode::OK;
    WeatherSample sample{28.0, 50.0, 15.0};
    int calls = 0;
};

class MemoryLogStore : public DailyLogStore {
public:
    bool append(const DailyLogRow& row) override {
        rows.push_back(row);
        return true;
    }

    std::vector<DailyLogRow> rows;
};

// Hands out `config` once `ready` is set
class FakeConfigSource : public ConfigSource {
public:
    const char* name() const override { return "fake"; }
    bool poll(PlantingConfig& out_config) override {
        ++polls;
        if (!ready) {
            return false;
        }
        ready = false;
        out_config = config;
        return true;
    }
    void describeMissing(char* out, std::size_t out_size) const override {
        std::snprintf(out, out_size, "%s", "everything");
    }

    bool ready = false;
    PlantingConfig config{};
    int polls = 0;
};

// Tests run in UTC so calendar arithmetic is independent of the host
inline void useUtc() {
    setenv("TZ", "UTC0", 1);
    tzset();
}

// 2024-06-01 00:00:00 UTC
static constexpr time_t kJune1st2024 = 1717200000;

inline PlantingConfig onionConfig(double flow_lph = 9.0) {
    PlantingConfig cfg{};
    cfg.crop = CropId::ONION;
    cfg.planting_date = PlantingDate{2024, 1, 1};
    cfg.plant_count = 100;
    cfg.plant_spacing_cm = 20.0;
    cfg.row_spacing_cm = 30.0;
    cfg.pump_flow_lph = flow_lph;
    return cfg;
}

#endif // TEST_FAKES_HPP
