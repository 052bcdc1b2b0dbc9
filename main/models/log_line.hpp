// Fixed-size container for log lines waiting to be forwarded over MQTT.
#ifndef LOG_LINE_HPP
#define LOG_LINE_HPP

struct LogLine {
    char text[320];
};

#endif // LOG_LINE_HPP
