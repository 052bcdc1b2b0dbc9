#include <main/network/mqtt_client.hpp>
#include <main/utils/logger.hpp>
#include <esp_crt_bundle.h>
#include <cstring>
#include <cstdio>

static const char* TAG_MQTT = "MqttClient";

namespace {
    static constexpr EventBits_t BIT_CONNECTED = BIT0;
    static constexpr EventBits_t BIT_FAILED    = BIT1;
}

MqttClient::MqttClient()
    : MqttClient(Config::Mqtt::host, Config::Mqtt::port, Config::Device::id) {}

MqttClient::MqttClient(const char* host, int port, const char* client_id)
    : client(nullptr),
      host(host),
      port(port),
      client_id(client_id),
      connected(false),
      on_message(nullptr),
      handler_context(nullptr),
      event_group_storage{},
      event_group(nullptr),
      inbound_queue_storage{},
      inbound_queue_buffer{},
      inbound_queue(nullptr) {}

bool MqttClient::init() {
    if (event_group == nullptr) {
        event_group = xEventGroupCreateStatic(&event_group_storage);
    }
    if (inbound_queue == nullptr) {
        inbound_queue = xQueueCreateStatic(Config::Mqtt::inbound_queue_len, sizeof(RawMessage),
                                           inbound_queue_buffer, &inbound_queue_storage);
    }
    return event_group != nullptr && inbound_queue != nullptr;
}

bool MqttClient::connect() {
    if (!init()) {
        LOG_ERROR(TAG_MQTT, "%s", "MQTT init failed");
        return false;
    }
    if (client != nullptr && connected) {
        return true;
    }
    if (client != nullptr) {
        disconnect();
    }

    esp_mqtt_client_config_t cfg = {};
    static char uri[128];
    snprintf(uri, sizeof(uri), "%s://%s:%d", Config::Mqtt::use_tls ? "mqtts" : "mqtt", host, port);
    cfg.broker.address.uri = uri;
    if (Config::Mqtt::use_tls) {
        cfg.broker.verification.crt_bundle_attach = esp_crt_bundle_attach;
    }
    cfg.credentials.client_id = client_id;
    cfg.credentials.username = Config::Mqtt::username;
    cfg.credentials.authentication.password = Config::Mqtt::password;
    cfg.session.keepalive = Config::Mqtt::keepalive_seconds;
    cfg.session.disable_clean_session = !Config::Mqtt::clean_session;

    LOG_INFO(TAG_MQTT, "Connecting to %s as %s", uri, client_id);

    // LWT: retained "offline" on disconnect; publish "online" on connect
    static char lwt_topic[96];
    if (Config::Mqtt::lwt_enable) {
        snprintf(lwt_topic, sizeof(lwt_topic), Config::Mqtt::Topics::STATUS, client_id);
        cfg.session.last_will.topic = lwt_topic;
        cfg.session.last_will.msg = "offline";
        cfg.session.last_will.qos = Config::Mqtt::default_qos;
        cfg.session.last_will.retain = true;
    }

    xEventGroupClearBits(event_group, BIT_CONNECTED | BIT_FAILED);
    client = esp_mqtt_client_init(&cfg);
    if (!client) {
        LOG_ERROR(TAG_MQTT, "%s", "esp_mqtt_client_init failed");
        return false;
    }
    (void)esp_mqtt_client_register_event(client, MQTT_EVENT_ANY, &MqttClient::mqttEventHandler, this);
    esp_err_t err = esp_mqtt_client_start(client);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_MQTT, "esp_mqtt_client_start failed: %s", esp_err_to_name(err));
        (void)esp_mqtt_client_destroy(client);
        client = nullptr;
        return false;
    }

    EventBits_t bits = xEventGroupWaitBits(event_group, BIT_CONNECTED | BIT_FAILED, pdFALSE, pdFALSE,
                                           pdMS_TO_TICKS(Config::Mqtt::connect_timeout_ms));
    if ((bits & BIT_CONNECTED) == 0) {
        LOG_ERROR(TAG_MQTT, "MQTT connect %s", (bits & BIT_FAILED) ? "refused" : "timed out");
        disconnect();
        return false;
    }
    return true;
}

void MqttClient::disconnect() {
    if (client) {
        (void)esp_mqtt_client_stop(client);
        (void)esp_mqtt_client_destroy(client);
        client = nullptr;
    }
    connected = false;
    if (inbound_queue != nullptr) {
        (void)xQueueReset(inbound_queue);
    }
}

bool MqttClient::isConnected() const {
    return client != nullptr && connected;
}

int MqttClient::publish(const char* topic, const char* payload, int qos, bool retain) {
    if (!isConnected()) {
        LOG_WARN(TAG_MQTT, "Skip publish (not connected) topic=%s", topic);
        return -1;
    }
    int length = static_cast<int>(std::strlen(payload));
    int mid = esp_mqtt_client_publish(client, topic, payload, length, qos, retain ? 1 : 0);
    if (mid >= 0) {
        LOG_DEBUG(TAG_MQTT, "Publish topic=%s len=%d qos=%d retain=%d mid=%d", topic, length, qos, retain ? 1 : 0, mid);
    } else {
        LOG_ERROR(TAG_MQTT, "Publish failed topic=%s rc=%d", topic, mid);
    }
    return mid;
}

int MqttClient::subscribe(const char* topic, int qos) {
    if (!isConnected()) {
        LOG_WARN(TAG_MQTT, "Skip subscribe (not connected) topic=%s", topic);
        return -1;
    }
    int mid = esp_mqtt_client_subscribe(client, topic, qos);
    if (mid >= 0) {
        LOG_INFO(TAG_MQTT, "Subscribe topic=%s qos=%d mid=%d", topic, qos, mid);
    } else {
        LOG_ERROR(TAG_MQTT, "Subscribe failed topic=%s rc=%d", topic, mid);
    }
    return mid;
}

int MqttClient::poll() {
    if (!isConnected()) {
        return -1;
    }
    int delivered = 0;
    RawMessage msg;
    while (xQueueReceive(inbound_queue, &msg, 0) == pdTRUE) {
        if (on_message) {
            on_message(handler_context, msg.topic, reinterpret_cast<const uint8_t*>(msg.payload), msg.length);
        }
        ++delivered;
    }
    return delivered;
}

void MqttClient::setMessageHandler(MessageHandler handler, void* context) {
    on_message = handler;
    handler_context = context;
}

void MqttClient::mqttEventHandler(void* handler_args, esp_event_base_t, int32_t event_id, void* event_data) {
    (void)event_id;
    auto* self = static_cast<MqttClient*>(handler_args);
    esp_mqtt_event_handle_t event = static_cast<esp_mqtt_event_handle_t>(event_data);
    self->handleEvent(event);
}

void MqttClient::enqueueData(esp_mqtt_event_handle_t event) {
    if (event->current_data_offset != 0 || event->data_len != event->total_data_len) {
        LOG_WARN(TAG_MQTT, "RX fragmented message dropped (total=%d)", event->total_data_len);
        return;
    }
    RawMessage msg{};
    int topic_len = event->topic_len < static_cast<int>(sizeof(msg.topic)) - 1
                        ? event->topic_len : static_cast<int>(sizeof(msg.topic)) - 1;
    std::memcpy(msg.topic, event->topic, static_cast<size_t>(topic_len));
    msg.topic[topic_len] = '\0';
    msg.length = event->data_len < static_cast<int>(sizeof(msg.payload)) - 1
                     ? event->data_len : static_cast<int>(sizeof(msg.payload)) - 1;
    std::memcpy(msg.payload, event->data, static_cast<size_t>(msg.length));
    msg.payload[msg.length] = '\0';
    if (xQueueSend(inbound_queue, &msg, 0) != pdTRUE) {
        LOG_WARN(TAG_MQTT, "RX queue full, dropped topic=%s", msg.topic);
    }
}

void MqttClient::handleEvent(esp_mqtt_event_handle_t event) {
    switch (event->event_id) {
        case MQTT_EVENT_CONNECTED: {
            connected = true;
            if (Config::Mqtt::lwt_enable) {
                char topic[96];
                snprintf(topic, sizeof(topic), Config::Mqtt::Topics::STATUS, client_id);
                (void)publish(topic, "online", Config::Mqtt::default_qos, true);
            }
            LOG_INFO(TAG_MQTT, "%s", "MQTT connected");
            xEventGroupSetBits(event_group, BIT_CONNECTED);
            break;
        }
        case MQTT_EVENT_DISCONNECTED:
            connected = false;
            LOG_WARN(TAG_MQTT, "%s", "MQTT disconnected");
            xEventGroupSetBits(event_group, BIT_FAILED);
            break;
        case MQTT_EVENT_DATA:
            enqueueData(event);
            break;
        case MQTT_EVENT_ERROR:
            if (event->error_handle != nullptr &&
                event->error_handle->error_type == MQTT_ERROR_TYPE_CONNECTION_REFUSED) {
                LOG_ERROR(TAG_MQTT, "MQTT connection refused: %d",
                          static_cast<int>(event->error_handle->connect_return_code));
            } else {
                LOG_ERROR(TAG_MQTT, "%s", "MQTT error");
            }
            break;
        default:
            break;
    }
}
