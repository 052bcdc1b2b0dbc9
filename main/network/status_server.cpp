#include <main/network/status_server.hpp>
#include <main/config/config.hpp>
#include <main/config/config_json.hpp>
#include <main/control/crop_catalog.hpp>
#include <main/control/status_report.hpp>
#include <main/state/status_store.hpp>
#include <main/utils/logger.hpp>
#include <cstdio>
#include <cstring>

static const char* TAG = "StatusServer";

namespace {
    static constexpr size_t STATUS_JSON_LEN = 1024;
    static constexpr size_t LOG_CHUNK_LEN = 512;

    static esp_err_t sendJson(httpd_req_t* req, const char* status, const char* body) {
        (void)httpd_resp_set_status(req, status);
        (void)httpd_resp_set_type(req, "application/json");
        return httpd_resp_send(req, body, HTTPD_RESP_USE_STRLEN);
    }
}

StatusServer::StatusServer(const char* log_path)
    : log_path(log_path),
      server(nullptr) {}

StatusServer::~StatusServer() {
    stop();
}

bool StatusServer::start() {
    if (server != nullptr) {
        return true;
    }
    StatusStore::init();

    httpd_config_t cfg = HTTPD_DEFAULT_CONFIG();
    cfg.server_port = Config::Http::port;
    cfg.task_priority = Config::TaskPriorities::HTTP;

    esp_err_t err = httpd_start(&server, &cfg);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "httpd_start failed: %s", esp_err_to_name(err));
        server = nullptr;
        return false;
    }

    httpd_uri_t status_uri = {};
    status_uri.uri = "/status";
    status_uri.method = HTTP_GET;
    status_uri.handler = &StatusServer::handleStatus;
    status_uri.user_ctx = this;

    httpd_uri_t log_uri = {};
    log_uri.uri = "/log";
    log_uri.method = HTTP_GET;
    log_uri.handler = &StatusServer::handleLog;
    log_uri.user_ctx = this;

    httpd_uri_t config_uri = {};
    config_uri.uri = "/config";
    config_uri.method = HTTP_POST;
    config_uri.handler = &StatusServer::handleConfig;
    config_uri.user_ctx = this;

    const httpd_uri_t* routes[] = { &status_uri, &log_uri, &config_uri };
    for (const httpd_uri_t* route : routes) {
        err = httpd_register_uri_handler(server, route);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "Register %s failed: %s", route->uri, esp_err_to_name(err));
            stop();
            return false;
        }
    }
    LOG_INFO(TAG, "HTTP server listening on port %u", static_cast<unsigned>(cfg.server_port));
    return true;
}

void StatusServer::stop() {
    if (server == nullptr) {
        return;
    }
    (void)httpd_stop(server);
    server = nullptr;
}

bool StatusServer::poll(PlantingConfig& out_config) {
    return StatusStore::takeConfig(out_config);
}

void StatusServer::describeMissing(char* out, std::size_t out_size) const {
    if (out == nullptr || out_size == 0) {
        return;
    }
    std::snprintf(out, out_size, "POST /config on port %u", static_cast<unsigned>(Config::Http::port));
}

void StatusServer::onStatus(const ControllerStatus& status) {
    StatusStore::publish(status);
}

esp_err_t StatusServer::handleStatus(httpd_req_t* req) {
    static ControllerStatus snapshot;
    static char json[STATUS_JSON_LEN];

    if (!StatusStore::latest(snapshot)) {
        return sendJson(req, "503 Service Unavailable", "{\"status\":\"starting\"}");
    }
    int n = StatusReport::toJson(snapshot, Config::Device::id, json, sizeof(json));
    if (n < 0 || static_cast<size_t>(n) >= sizeof(json)) {
        LOG_ERROR(TAG, "Status JSON truncated (%d bytes)", n);
        return sendJson(req, "500 Internal Server Error", "{\"status\":\"error\",\"reason\":\"status too large\"}");
    }
    return sendJson(req, "200 OK", json);
}

esp_err_t StatusServer::handleLog(httpd_req_t* req) {
    static char chunk[LOG_CHUNK_LEN];
    const StatusServer* self = static_cast<const StatusServer*>(req->user_ctx);

    FILE* f = std::fopen(self->log_path, "r");
    if (f == nullptr) {
        LOG_WARN(TAG, "Cannot open %s", self->log_path);
        (void)httpd_resp_set_status(req, "500 Internal Server Error");
        (void)httpd_resp_set_type(req, "text/plain");
        return httpd_resp_send(req, "log unavailable", HTTPD_RESP_USE_STRLEN);
    }

    (void)httpd_resp_set_type(req, "text/csv");
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
        if (httpd_resp_send_chunk(req, chunk, static_cast<ssize_t>(n)) != ESP_OK) {
            std::fclose(f);
            LOG_WARN(TAG, "%s", "Client dropped during /log");
            return ESP_FAIL;
        }
    }
    std::fclose(f);
    return httpd_resp_send_chunk(req, nullptr, 0);
}

esp_err_t StatusServer::handleConfig(httpd_req_t* req) {
    static char body[Config::Http::max_body_len + 1];
    static char reply[160];
    static ControllerStatus snapshot;

    if (req->content_len == 0 || req->content_len > Config::Http::max_body_len) {
        return sendJson(req, "400 Bad Request", "{\"status\":\"error\",\"reason\":\"body size\"}");
    }

    int received = 0;
    const int expected = static_cast<int>(req->content_len);
    while (received < expected) {
        int n = httpd_req_recv(req, body + received, expected - received);
        if (n == HTTPD_SOCK_ERR_TIMEOUT) {
            continue;
        }
        if (n <= 0) {
            LOG_WARN(TAG, "%s", "POST /config body read failed");
            return ESP_FAIL;
        }
        received += n;
    }
    body[received] = '\0';

    const PlantingConfig* current = nullptr;
    if (StatusStore::latest(snapshot) && snapshot.has_config) {
        current = &snapshot.config;
    }

    PlantingConfig parsed{};
    char reason[96] = {0};
    ErrorCode err = ConfigJson::parse(body, received, current, parsed, reason, sizeof(reason));
    if (err != ErrorCode::OK) {
        LOG_WARN(TAG, "Rejected POST /config (%s): %s", errorCodeName(err), reason);
        std::snprintf(reply, sizeof(reply), "{\"status\":\"error\",\"reason\":\"%s\"}", reason);
        return sendJson(req, "400 Bad Request", reply);
    }

    StatusStore::submitConfig(parsed);
    LOG_INFO(TAG, "Accepted POST /config: crop=%s plants=%ld flow=%.2f L/h",
             CropCatalog::name(parsed.crop), static_cast<long>(parsed.plant_count), parsed.pump_flow_lph);
    return sendJson(req, "200 OK", "{\"status\":\"ok\"}");
}
