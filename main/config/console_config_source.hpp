#ifndef CONSOLE_CONFIG_SOURCE_HPP
#define CONSOLE_CONFIG_SOURCE_HPP

#include <cstdio>
#include <main/control/collaborators.hpp>

// Prompts for the planting configuration on the serial console.
// poll() never waits for input: an empty read returns false and the same
// prompt stays active, so the caller's timeout keeps working.
class ConsoleConfigSource : public ConfigSource {
public:
    ConsoleConfigSource(FILE* in, FILE* out);

    const char* name() const override { return "console"; }
    bool poll(PlantingConfig& out_config) override;
    void describeMissing(char* out, std::size_t out_size) const override;

private:
    enum class Step : uint8_t {
        CROP = 0,
        PLANTING_DATE,
        PLANT_COUNT,
        PLANT_SPACING,
        ROW_SPACING,
        PUMP_FLOW,
        DONE
    };

    void prompt();
    bool acceptLine(const char* line);

    FILE* in;
    FILE* out;
    Step step;
    bool prompted;
    bool delivered;
    PlantingConfig pending;
    char line[64];
};

#endif // CONSOLE_CONFIG_SOURCE_HPP
