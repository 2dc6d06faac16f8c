#include "mscan/coordinate.hpp"

#include <cmath>
#include <regex>
#include <string>

namespace mscan
{
    namespace
    {
        const std::regex &readout_grammar()
        {
            static const std::regex re(R"(^\s*(-?\d{1,6})\s*,\s*(-?\d{1,6})\s*$)");
            return re;
        }
    }

    bool matches_coordinate_grammar(const std::string &text)
    {
        return std::regex_match(text, readout_grammar());
    }

    std::optional<Coordinate> Coordinate::from_text(const std::string &text, double confidence)
    {
        std::smatch m;
        if (!std::regex_match(text, m, readout_grammar()) || m.size() != 3)
            return std::nullopt;

        // at most 6 digits per axis, always fits an int
        const int x = std::stoi(m[1].str());
        const int y = std::stoi(m[2].str());
        return Coordinate(x, y, confidence);
    }

    std::string Coordinate::to_string() const
    {
        return "(" + std::to_string(x_) + ", " + std::to_string(y_) + ")";
    }

    double distance(const Coordinate &c, const TargetCoordinate &t)
    {
        const double dx = double(t.x) - double(c.x());
        const double dy = double(t.y) - double(c.y());
        return std::hypot(dx, dy);
    }
}
