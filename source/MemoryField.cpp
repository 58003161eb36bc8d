#include "MemoryField.h"
#include "FieldMath.h"
#include <algorithm>
#include <cmath>
#include <cstring>

MemoryField::MemoryField(int size, float maxValue)
    : size_(size), maxValue_(maxValue), data_(std::make_unique<float[]>(static_cast<size_t>(size) * size))
{
    clear();
}

void MemoryField::clear()
{
    std::memset(data_.get(), 0, static_cast<size_t>(size_) * size_ * sizeof(float));
}

void MemoryField::add(int x, int y, float amount)
{
    if (!isValidCoordinate(x, y) || amount <= 0.0f)
        return;
    float &cell = data_[getIndex(x, y)];
    cell = std::min(maxValue_, cell + amount);
}

void MemoryField::addAt(const sf::Vector2f &position, float amount)
{
    if (!inBounds(position))
        return;
    add(static_cast<int>(std::floor(position.x)), static_cast<int>(std::floor(position.y)), amount);
}

float MemoryField::sample(int x, int y) const
{
    if (!isValidCoordinate(x, y))
        return 0.0f;
    return data_[getIndex(x, y)];
}

void MemoryField::decay(float rate)
{
    const size_t count = static_cast<size_t>(size_) * size_;
    float *data = data_.get();
    for (size_t i = 0; i < count; ++i)
    {
        data[i] *= rate;
    }
}

sf::Vector2f MemoryField::gradient(const sf::Vector2f &position) const
{
    if (!inBounds(position))
        return {0.0f, 0.0f};
    sf::Vector2f g = sobelGradient(data_.get(), size_,
                                   static_cast<int>(std::floor(position.x)),
                                   static_cast<int>(std::floor(position.y)));
    return g * 0.5f;
}

double MemoryField::total() const
{
    double sum = 0.0;
    const size_t count = static_cast<size_t>(size_) * size_;
    for (size_t i = 0; i < count; ++i)
        sum += data_[i];
    return sum;
}
