#pragma once
#include <SFML/System/Vector2.hpp>

// 3x3 sobel convolution over a square row-major grid, zero at the border ring
inline sf::Vector2f sobelGradient(const float *data, int size, int x, int y)
{
    if (x < 1 || y < 1 || x >= size - 1 || y >= size - 1)
        return {0.0f, 0.0f};

    auto at = [data, size](int cx, int cy)
    { return data[cy * size + cx]; };

    float gx = (at(x + 1, y - 1) + 2.0f * at(x + 1, y) + at(x + 1, y + 1)) -
               (at(x - 1, y - 1) + 2.0f * at(x - 1, y) + at(x - 1, y + 1));
    float gy = (at(x - 1, y + 1) + 2.0f * at(x, y + 1) + at(x + 1, y + 1)) -
               (at(x - 1, y - 1) + 2.0f * at(x, y - 1) + at(x + 1, y - 1));
    return {gx, gy};
}
