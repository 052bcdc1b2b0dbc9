#ifndef MQTT_CLIENT_HPP
#define MQTT_CLIENT_HPP

#include <cstdint>
#include <mqtt_client.h>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <freertos/queue.h>
#include <main/config/config.hpp>
#include <main/control/collaborators.hpp>

// esp-mqtt session. Inbound messages are copied into a static queue by the
// esp-mqtt task and handed to the registered handler from poll(), i.e. on
// the caller's task.
class MqttClient : public MessageBus {
public:
    // Construct using values from Config::Mqtt and Config::Device
    MqttClient();
    MqttClient(const char* host, int port, const char* client_id);

    bool init();
    bool connect() override;
    void disconnect() override;
    bool isConnected() const override;

    int publish(const char* topic, const char* payload, int qos, bool retain) override;
    int subscribe(const char* topic, int qos) override;
    int poll() override;

    void setMessageHandler(MessageHandler handler, void* context) override;

private:
    struct RawMessage {
        char topic[64];
        char payload[128];
        int  length;
    };

    static void mqttEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);
    void handleEvent(esp_mqtt_event_handle_t event);
    void enqueueData(esp_mqtt_event_handle_t event);

    esp_mqtt_client_handle_t client;
    const char* host;
    int port;
    const char* client_id;
    volatile bool connected;
    MessageHandler on_message;
    void* handler_context;

    StaticEventGroup_t event_group_storage;
    EventGroupHandle_t event_group;
    StaticQueue_t inbound_queue_storage;
    uint8_t inbound_queue_buffer[Config::Mqtt::inbound_queue_len * sizeof(RawMessage)];
    QueueHandle_t inbound_queue;
};

#endif // MQTT_CLIENT_HPP
