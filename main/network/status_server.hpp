#ifndef STATUS_SERVER_HPP
#define STATUS_SERVER_HPP

#include <esp_http_server.h>
#include <main/control/collaborators.hpp>

// Local HTTP surface:
//   GET  /status  last published controller snapshot as JSON
//   GET  /log     daily log CSV
//   POST /config  replace the planting configuration
// Handlers run on the httpd task and only touch StatusStore.
class StatusServer : public ConfigSource, public StatusObserver {
public:
    explicit StatusServer(const char* log_path);
    ~StatusServer() override;

    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return server != nullptr; }

    // ConfigSource: configurations submitted through POST /config
    const char* name() const override { return "http"; }
    bool poll(PlantingConfig& out_config) override;
    void describeMissing(char* out, std::size_t out_size) const override;

    // StatusObserver: called from the control task after each tick
    void onStatus(const ControllerStatus& status) override;

private:
    static esp_err_t handleStatus(httpd_req_t* req);
    static esp_err_t handleLog(httpd_req_t* req);
    static esp_err_t handleConfig(httpd_req_t* req);

    const char* log_path;
    httpd_handle_t server;
};

#endif // STATUS_SERVER_HPP
