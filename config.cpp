#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <set>

#include "config.h"

std::map<std::string, uint32_t> keywordsToQuirkValues = {
    {"shift", QUIRKS_SHIFT},
    {"loadstore", QUIRKS_LOAD_STORE},
    {"jump", QUIRKS_JUMP},
    {"clip", QUIRKS_CLIP},
    {"vforder", QUIRKS_VFORDER},
    {"logic", QUIRKS_LOGIC},
};

static std::map<std::string, uint32_t> colorsByName = {
    {"aquamarine", 0x7fffd4},
    {"black", 0x000000},
    {"coral", 0xFF7F50},
    {"deeppink", 0xFF1493},
    {"gray", 0x808080},
    {"hotpink", 0xFF69B4},
    {"lavender", 0xE6E6FA},
    {"lightcyan", 0xE0FFFF},
    {"lightgray", 0xD3D3D3},
    {"navy", 0x000080},
    {"powderblue", 0xB0E0E6},
    {"red", 0xFF0000},
    {"white", 0xFFFFFF},
};

// Option keys of the program archive and the quirk each one turns on.
static std::map<std::string, uint32_t> optionNamesToQuirkValues = {
    {"shiftQuirks", QUIRKS_SHIFT},
    {"loadStoreQuirks", QUIRKS_LOAD_STORE},
    {"jumpQuirks", QUIRKS_JUMP},
    {"clipQuirks", QUIRKS_CLIP},
    {"vfOrderQuirks", QUIRKS_VFORDER},
    {"logicQuirks", QUIRKS_LOGIC},
};

// Platform ids of the program archive that run on plain CHIP-8.  An entry
// without "platform" is taken to be plain CHIP-8 too.
static std::set<std::string> chip8Platforms = {
    "originalChip8",
    "hybridVIP",
    "modernChip8",
};

vec3ub vec3ubFromInts(int r, int g, int b)
{
    return { (uint8_t)r, (uint8_t)g, (uint8_t)b };
}

static uint32_t expand12BitColorTo24(uint32_t color)
{
    uint8_t r = (color & 0xF00) >> 8;
    r = (r << 4) | r;
    uint8_t g = (color & 0x0F0) >> 4;
    g = (g << 4) | g;
    uint8_t b = (color & 0x00F) >> 0;
    b = (b << 4) | b;
    return (r << 16) | (g << 8) | (b << 0);
}

static bool isHexString(const std::string& digits)
{
    if(digits.empty()) {
        return false;
    }
    for(char c : digits) {
        if(!isxdigit((unsigned char)c)) {
            return false;
        }
    }
    return true;
}

bool parseColor(const std::string& name, uint32_t& color)
{
    std::string digits = ((name.length() > 0) && (name[0] == '#')) ? name.substr(1) : name;

    if(isHexString(digits) && ((digits.length() == 3) || (digits.length() == 6))) {
        color = strtoul(digits.c_str(), nullptr, 16);
        if(digits.length() == 3) {
            color = expand12BitColorTo24(color);
        }
        return true;
    }

    auto found = colorsByName.find(name);
    if(found == colorsByName.end()) {
        return false;
    }
    color = found->second;
    return true;
}

static bool hasTrueOption(const nlohmann::json& options, const std::string& name)
{
    if(options.contains(name)) {
        if(options[name].type() == nlohmann::json::value_t::boolean) {
            return options[name].get<bool>();
        } else {
            return options[name].get<int>();
        }
    } else {
        return false;
    }
}

bool loadProgramDatabase(const std::string& path, nlohmann::json& programs, std::string& error)
{
    std::ifstream programsFile(path);
    if(!programsFile) {
        error = "couldn't open program database \"" + path + "\"";
        return false;
    }

    try {
        programsFile >> programs;
    } catch(const nlohmann::json::parse_error& e) {
        error = "couldn't parse program database \"" + path + "\": " + e.what();
        return false;
    }

    if(!programs.is_object()) {
        error = "program database \"" + path + "\" is not a JSON object";
        return false;
    }

    return true;
}

static bool applyColorOption(const nlohmann::json& options, const std::string& name, int index, EmulatorOptions& result, std::string& error)
{
    if(!options.contains(name)) {
        return true;
    }
    uint32_t color;
    if(!options[name].is_string() || !parseColor(options[name].get<std::string>(), color)) {
        error = "unrecognized color in option \"" + name + "\"";
        return false;
    }
    result.colorTable[index] = vec3ubFromInts((color >> 16) & 0xff, (color >> 8) & 0xff, color & 0xff);
    return true;
}

bool applyProgramOptions(const nlohmann::json& programs, const std::string& chosenProgram, EmulatorOptions& result, std::string& error)
{
    if(!programs.contains(chosenProgram)) {
        error = "unknown program \"" + chosenProgram + "\"";
        return false;
    }

    const auto& program = programs[chosenProgram];

    try {
        if(program.contains("platform") && (chip8Platforms.count(program["platform"].get<std::string>()) == 0)) {
            error = "program \"" + chosenProgram + "\" requires the \"" + program["platform"].get<std::string>() + "\" platform";
            return false;
        }

        if(!program.contains("options")) {
            return true;
        }
        const auto& options = program["options"];

        if(options.contains("tickrate")) {
            int64_t ticksPerField;
            if(options["tickrate"].type() == nlohmann::json::value_t::string) {
                ticksPerField = strtoll(options["tickrate"].get<std::string>().c_str(), nullptr, 10);
            } else {
                ticksPerField = options["tickrate"].get<int64_t>();
            }
            if(ticksPerField <= 0) {
                error = "tickrate for \"" + chosenProgram + "\" must be a positive number";
                return false;
            }
            if(ticksPerField > UINT32_MAX / TIMER_HZ) {
                error = "tickrate for \"" + chosenProgram + "\" is too large";
                return false;
            }
            result.instructionsPerSecond = ticksPerField * TIMER_HZ;
        }

        for(const auto& [optionName, quirk] : optionNamesToQuirkValues) {
            if(hasTrueOption(options, optionName)) {
                result.quirks |= quirk;
            }
        }

        if(!applyColorOption(options, "backgroundColor", 0, result, error)) {
            return false;
        }
        if(!applyColorOption(options, "fillColor", 1, result, error)) {
            return false;
        }
    } catch(const nlohmann::json::type_error& e) {
        error = "malformed entry for \"" + chosenProgram + "\": " + e.what();
        return false;
    }

    return true;
}
