#include "display.h"

bool DisplayBuffer::draw(uint8_t x, uint8_t y)
{
    bool erased = false;

    displayChanged = true; /* pixel will either be set or cleared... */

    if((x < SCREEN_WIDTH) && (y < SCREEN_HEIGHT)) {
        auto& pixel = display.at(y).at(x);
        erased = pixel;
        pixel = !pixel;
    }

    return erased;
}

void DisplayBuffer::clear()
{
    for(auto& rowOfPixels : display) {
        rowOfPixels.fill(false);
    }
    displayChanged = true;
}

int DisplayBuffer::litPixelCount() const
{
    int count = 0;
    for(const auto& rowOfPixels : display) {
        for(bool pixel : rowOfPixels) {
            count += pixel ? 1 : 0;
        }
    }
    return count;
}
