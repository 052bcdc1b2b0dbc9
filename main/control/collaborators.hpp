// Seams between the control loop and the outside world. Firmware
// implementations live under main/network, main/storage and main/utils;
// tests substitute in-memory fakes.
#ifndef COLLABORATORS_HPP
#define COLLABORATORS_HPP

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <main/models/controller_status.hpp>
#include <main/models/daily_log_row.hpp>
#include <main/models/error_code.hpp>
#include <main/models/inbound_message.hpp>
#include <main/models/planting_config.hpp>
#include <main/models/weather_sample.hpp>

class NetworkLink {
public:
    virtual ~NetworkLink() = default;
    // Blocks until an address is obtained or the attempt times out
    virtual bool connect() = 0;
    virtual bool isConnected() const = 0;
};

class MessageBus {
public:
    // Invoked from poll() in the caller's task
    using MessageHandler = void (*)(void* context, const char* topic, const uint8_t* payload, int length);

    virtual ~MessageBus() = default;
    // Blocks until the session is up or the attempt times out
    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    // Both return a message id (>= 0) or -1
    virtual int subscribe(const char* topic, int qos) = 0;
    virtual int publish(const char* topic, const char* payload, int qos, bool retain) = 0;
    // Delivers pending inbound messages; returns how many, or -1 if the session is down
    virtual int poll() = 0;
    virtual void setMessageHandler(MessageHandler handler, void* context) = 0;
};

class WeatherSource {
public:
    virtual ~WeatherSource() = default;
    // TRANSPORT_ERROR or PARSE_ERROR leave out_sample untouched
    virtual ErrorCode fetch(WeatherSample& out_sample) = 0;
};

class DailyLogStore {
public:
    virtual ~DailyLogStore() = default;
    virtual bool append(const DailyLogRow& row) = 0;
};

class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t monotonicMs() const = 0;
    virtual time_t wallTime() const = 0;
    virtual void sleepMs(uint32_t ms) = 0;
};

class ConfigSource {
public:
    virtual ~ConfigSource() = default;
    virtual const char* name() const = 0;
    // Config-topic traffic from the bus; sources not fed by the bus ignore it
    virtual void onMessage(const InboundMessage& message) { (void)message; }
    // Hands out a complete, validated configuration once; false while none is ready
    virtual bool poll(PlantingConfig& out_config) = 0;
    virtual void describeMissing(char* out, std::size_t out_size) const = 0;
};

class StatusObserver {
public:
    virtual ~StatusObserver() = default;
    virtual void onStatus(const ControllerStatus& status) = 0;
};

#endif // COLLABORATORS_HPP
