#pragma once
#include <SFML/System/Vector2.hpp>
#include <memory>

/**
 * decaying record of where nutrients were found
 * written by consumption, read back as a steering gradient
 */
class MemoryField
{
public:
    MemoryField(int size, float maxValue = 1.0f);
    ~MemoryField() = default;

    void clear();

    void add(int x, int y, float amount);
    void addAt(const sf::Vector2f &position, float amount);
    float sample(int x, int y) const;

    // geometric decay, value *= rate
    void decay(float rate);

    sf::Vector2f gradient(const sf::Vector2f &position) const;

    int getSize() const { return size_; }
    float getMaxValue() const { return maxValue_; }
    const float *getData() const { return data_.get(); }
    double total() const;

private:
    int size_;
    float maxValue_;
    std::unique_ptr<float[]> data_;

    bool isValidCoordinate(int x, int y) const { return x >= 0 && y >= 0 && x < size_ && y < size_; }
    // false for NaN as well
    bool inBounds(const sf::Vector2f &p) const
    {
        return p.x >= 0.0f && p.y >= 0.0f && p.x < static_cast<float>(size_) && p.y < static_cast<float>(size_);
    }
    int getIndex(int x, int y) const { return y * size_ + x; }
};
