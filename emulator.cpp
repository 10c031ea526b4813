#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <MiniFB.h>

#include "chip8.h"
#include "clock.h"
#include "config.h"
#include "debug.h"
#include "interpreter.h"
#include "memory.h"
#include "peripherals.h"

struct Interface : Peripherals
{
    std::array<vec3ub, 2> colorTable;
    bool closed = false;

    bool succeeded = false;

    static constexpr int initialScaleFactor = 12;

    mfb_window *window;
    int windowWidth;
    int windowHeight;
    std::vector<uint32_t> windowBuffer;

    Interface(const std::string& name, const std::map<int, vec3ub>& colors) :
        windowWidth(SCREEN_WIDTH * initialScaleFactor),
        windowHeight(SCREEN_HEIGHT * initialScaleFactor)
    {
        colorTable[0] = {0, 0, 0};
        colorTable[1] = {255, 255, 255};
        for(const auto& [index, color] : colors) {
            if((index >= 0) && (index < (int)colorTable.size())) {
                colorTable[index] = color;
            }
        }
        window = mfb_open_ex(name.c_str(), windowWidth, windowHeight, WF_RESIZABLE);
        if (window) {
            windowBuffer.resize(windowWidth * windowHeight);
            mfb_set_user_data(window, (void *) this);
            mfb_set_resize_callback(window, resizecb);
            mfb_set_keyboard_callback(window, keyboardcb);
            succeeded = true;
        }
    }

    bool redraw()
    {
        for(int row = 0; row < windowHeight; row++) {
            for(int col = 0; col < windowWidth; col++) {
                int displayX = col * SCREEN_WIDTH / windowWidth;
                int displayY = row * SCREEN_HEIGHT / windowHeight;
                auto &c = colorTable.at(screen.at(displayX, displayY) ? 1 : 0);
                windowBuffer[col + row * windowWidth] = MFB_RGB(c[0], c[1], c[2]);
            }
        }
        int status = mfb_update_ex(window, windowBuffer.data(), windowWidth, windowHeight);
        closed = (status < 0);
        return status >= 0;
    }

    void resize(int width, int height)
    {
        windowWidth = width;
        windowHeight = height;
        windowBuffer.resize(windowWidth * windowHeight);
        screen.displayChanged = true;
    }

    static void resizecb(mfb_window *window, int width, int height)
    {
        Interface *ifc = static_cast<Interface *>(mfb_get_user_data(window));
        ifc->resize(width, height);
        mfb_set_viewport(window, 0, 0, width, height);
    }

    void keyboard(mfb_key key, mfb_key_mod mod, bool isPressed)
    {
        switch(key) {
            case KB_KEY_ESCAPE:
                if(isPressed) {
                    mfb_close(window);
                    closed = true;
                }
                break;
            case KB_KEY_1: keypad.set(0x1, isPressed); break;
            case KB_KEY_2: keypad.set(0x2, isPressed); break;
            case KB_KEY_3: keypad.set(0x3, isPressed); break;
            case KB_KEY_4: keypad.set(0xC, isPressed); break;
            case KB_KEY_Q: keypad.set(0x4, isPressed); break;
            case KB_KEY_W: keypad.set(0x5, isPressed); break;
            case KB_KEY_E: keypad.set(0x6, isPressed); break;
            case KB_KEY_SPACE: keypad.set(0x6, isPressed); break;
            case KB_KEY_R: keypad.set(0xD, isPressed); break;
            case KB_KEY_A: keypad.set(0x7, isPressed); break;
            case KB_KEY_S: keypad.set(0x8, isPressed); break;
            case KB_KEY_D: keypad.set(0x9, isPressed); break;
            case KB_KEY_F: keypad.set(0xE, isPressed); break;
            case KB_KEY_Z: keypad.set(0xA, isPressed); break;
            case KB_KEY_X: keypad.set(0x0, isPressed); break;
            case KB_KEY_C: keypad.set(0xB, isPressed); break;
            case KB_KEY_V: keypad.set(0xF, isPressed); break;
            default: /* pass */ break;
        }
    }

    static void keyboardcb(mfb_window *window, mfb_key key, mfb_key_mod mod, bool isPressed)
    {
        Interface *ifc = static_cast<Interface *>(mfb_get_user_data(window));
        ifc->keyboard(key, mod, isPressed);
    }

    bool iterate()
    {
        bool success = true;
        if(screen.displayChanged) {
            success = redraw();
            screen.displayChanged = false;
        } else {
            success = (mfb_update_events(window) >= 0);
        }
        if(success) {
            mfb_wait_sync(window);
        }
        return success && !closed;
    }
};

typedef Chip8Interpreter<Memory, Interface> Chip8;

void usage(const char *name)
{
    fprintf(stderr, "usage: %s [options] ROM.ch8\n", name);
    fprintf(stderr, "options:\n");
    fprintf(stderr, "\t--rate N           - execute N instructions per second (default %u)\n", DEFAULT_INSTRUCTIONS_PER_SECOND);
    fprintf(stderr, "\t--color N RRGGBB   - set color N (0 background, 1 foreground) to RRGGBB\n");
    fprintf(stderr, "\t--programs file    - read options for the ROM from a JSON program database\n");
    fprintf(stderr, "\t--program name     - database entry to use instead of the ROM file name\n");
    fprintf(stderr, "\t--debug flag       - enable debug output: \"state\", \"asm\", \"draw\", \"insn\", \"keys\"\n");
    fprintf(stderr, "\t--quirk name       - enable a CHIP-8 variant quirk\n");
    fprintf(stderr, "\t                     \"jump\" : bits 11-8 of BNNN are also register number\n");
    fprintf(stderr, "\t                     \"shift\" : shift operates on Vx, not Vy\n");
    fprintf(stderr, "\t                     \"clip\" : sprites are clipped at the screen edge instead of wrapped\n");
    fprintf(stderr, "\t                     \"loadstore\" : multi-register Vx load/store doesn't change I\n");
    fprintf(stderr, "\t                     \"vforder\" : VF is written before Vx by ALU instructions\n");
    fprintf(stderr, "\t                     \"logic\" : OR, AND and XOR clear VF\n");
}

bool readImageFile(const std::string& path, std::vector<uint8_t>& image)
{
    std::ifstream romFile(path, std::ios::binary);
    if(!romFile) {
        return false;
    }
    image.assign(std::istreambuf_iterator<char>(romFile), std::istreambuf_iterator<char>());
    return !romFile.bad();
}

int main(int argc, char **argv)
{
    const char *progname = argv[0];
    argc -= 1;
    argv += 1;

    EmulatorOptions commandLine;
    bool rateGiven = false;
    std::string programsPath;
    std::string programName;

    while((argc > 0) && (argv[0][0] == '-')) {
        if(strcmp(argv[0], "--color") == 0) {
            if(argc < 3) {
                fprintf(stderr, "--color option requires a color number and color.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            int colorIndex = atoi(argv[1]);
            uint32_t colorName;
            if(!parseColor(argv[2], colorName)) {
                fprintf(stderr, "unknown color \"%s\".\n", argv[2]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            commandLine.colorTable[colorIndex] = vec3ubFromInts((colorName >> 16) & 0xff, (colorName >> 8) & 0xff, colorName & 0xff);
            argv += 3;
            argc -= 3;
        } else if(strcmp(argv[0], "--programs") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--programs option requires a JSON file name.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            programsPath = argv[1];
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--program") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--program option requires a program name.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            programName = argv[1];
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--quirk") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--quirk option requires a quirk keyword.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            std::string quirkKeyword = argv[1];
            if(keywordsToQuirkValues.count(quirkKeyword) == 0) {
                fprintf(stderr, "unknown quirk keyword \"%s\".\n", argv[1]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            commandLine.quirks |= keywordsToQuirkValues.at(quirkKeyword);
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--debug") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--debug option requires a debug flag to enable.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            std::string debugKeyword = argv[1];
            if(keywordsToDebugFlags.count(debugKeyword) == 0) {
                fprintf(stderr, "unknown debug flag \"%s\".\n", argv[1]);
                usage(progname);
                exit(EXIT_FAILURE);
            }
            debug |= keywordsToDebugFlags.at(debugKeyword);
            fprintf(stderr, "debug value now 0x%02X\n", debug);
            argv += 2;
            argc -= 2;
        } else if(strcmp(argv[0], "--rate") == 0) {
            if(argc < 2) {
                fprintf(stderr, "--rate option requires a rate number value.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            int rate = atoi(argv[1]);
            if(rate <= 0) {
                fprintf(stderr, "--rate must be a positive number of instructions per second.\n");
                usage(progname);
                exit(EXIT_FAILURE);
            }
            commandLine.instructionsPerSecond = rate;
            rateGiven = true;
            argv += 2;
            argc -= 2;
        } else if(
            (strcmp(argv[0], "-help") == 0) ||
            (strcmp(argv[0], "-h") == 0) ||
            (strcmp(argv[0], "-?") == 0))
        {
            usage(progname);
            exit(EXIT_SUCCESS);
        } else {
            fprintf(stderr, "unknown parameter \"%s\"\n", argv[0]);
            usage(progname);
            exit(EXIT_FAILURE);
        }
    }

    if(argc < 1) {
        usage(progname);
        exit(EXIT_FAILURE);
    }

    std::filesystem::path romPath(argv[0]);

    // Database options first, then anything given on the command line.
    EmulatorOptions options;
    if(!programsPath.empty()) {
        nlohmann::json programs;
        std::string error;
        if(programName.empty()) {
            programName = romPath.stem().string();
        }
        if(!loadProgramDatabase(programsPath, programs, error) ||
            !applyProgramOptions(programs, programName, options, error))
        {
            fprintf(stderr, "%s\n", error.c_str());
            exit(EXIT_FAILURE);
        }
    }
    if(rateGiven) {
        options.instructionsPerSecond = commandLine.instructionsPerSecond;
    }
    options.quirks |= commandLine.quirks;
    for(const auto& [index, color] : commandLine.colorTable) {
        options.colorTable[index] = color;
    }

    std::vector<uint8_t> image;
    if(!readImageFile(romPath.string(), image)) {
        fprintf(stderr, "couldn't read ROM \"%s\"\n", argv[0]);
        exit(EXIT_FAILURE);
    }

    Memory memory;
    Fault loaded = memory.loadImage(image);
    if(loaded != FAULT_NONE) {
        fprintf(stderr, "couldn't load \"%s\": %s\n", argv[0], faultName(loaded));
        exit(EXIT_FAILURE);
    }

    Interface interface(romPath.filename().string(), options.colorTable);
    if(!interface.succeeded) {
        fprintf(stderr, "couldn't open a window\n");
        exit(EXIT_FAILURE);
    }

    Chip8 chip8(PROGRAM_BASE, options.quirks);
    ClockDriver driver(options.instructionsPerSecond);

    std::chrono::time_point<std::chrono::steady_clock> interfaceThen = std::chrono::steady_clock::now();

    bool done = false;
    bool reported = false;
    while(!done) {

        std::chrono::time_point<std::chrono::steady_clock> interfaceNow = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(interfaceNow - interfaceThen);
        interfaceThen = interfaceNow;

        Chip8::StepResult result = driver.advance(elapsed, chip8, memory, interface);

        if(result == Chip8::EXIT_INTERPRETER) {
            printf("program exited with code %d\n", chip8.exitCode);
            return chip8.exitCode;
        }

        if((result == Chip8::FAULT) && !reported) {
            fprintf(stderr, "halted: %s at %04X (%04X)\n", faultName(chip8.fault), chip8.faultPC, chip8.faultWord);
            if(debug & DEBUG_FAIL_UNSUPPORTED_INSN) {
                printf("exit on unsupported instruction\n");
                exit(EXIT_FAILURE);
            }
            reported = true;
        }

        done = !interface.iterate();
    }

    return EXIT_SUCCESS;
}
