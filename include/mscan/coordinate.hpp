#pragma once
#include <optional>
#include <string>

namespace mscan
{
    // Map position read from the on-screen readout. The only way to obtain one is
    // from_text(), so every Coordinate comes from text matching the readout grammar:
    //   [-]?\d{1,6} \s* , \s* [-]?\d{1,6}   (surrounding whitespace is trimmed)
    class Coordinate
    {
    public:
        static std::optional<Coordinate> from_text(const std::string &text, double confidence);

        int x() const { return x_; }
        int y() const { return y_; }
        double confidence() const { return confidence_; }

        std::string to_string() const;

    private:
        Coordinate(int x, int y, double confidence) : x_(x), y_(y), confidence_(confidence) {}

        int x_;
        int y_;
        double confidence_;
    };

    // True if text is a well-formed readout (same grammar as Coordinate::from_text).
    bool matches_coordinate_grammar(const std::string &text);

    // Caller-supplied goal, fixed for one session.
    struct TargetCoordinate
    {
        int x{0};
        int y{0};
    };

    double distance(const Coordinate &c, const TargetCoordinate &t);
}
