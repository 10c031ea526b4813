#ifndef CHIP8VM_CONFIG_H
#define CHIP8VM_CONFIG_H

#include <array>
#include <cstdint>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "chip8.h"

typedef std::array<uint8_t, 3> vec3ub;

vec3ub vec3ubFromInts(int r, int g, int b);

struct EmulatorOptions
{
    uint32_t instructionsPerSecond = DEFAULT_INSTRUCTIONS_PER_SECOND;
    uint32_t quirks = QUIRKS_NONE;
    std::map<int, vec3ub> colorTable;
};

extern std::map<std::string, uint32_t> keywordsToQuirkValues;

// Accepts "#rgb", "#rrggbb", "rgb", "rrggbb" or one of the names in
// colorsByName.
bool parseColor(const std::string& name, uint32_t& color);

bool loadProgramDatabase(const std::string& path, nlohmann::json& programs, std::string& error);

// Merges the database entry for `program` into `options`.
bool applyProgramOptions(const nlohmann::json& programs, const std::string& program, EmulatorOptions& options, std::string& error);

#endif // CHIP8VM_CONFIG_H
