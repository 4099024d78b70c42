#ifndef UTILS_H
#define UTILS_H

struct Vec2D {
    double x, y;
    bool operator==(const Vec2D& other) const {
        return x == other.x && y == other.y;
    }
};

#endif // UTILS_H
