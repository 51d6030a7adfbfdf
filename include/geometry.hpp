#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include "types.hpp"
#include <string>
#include <vector>

// Point at `fraction` (0..1) of the polyline's arc length.
Coordinate pointAlong(const Polyline &line, double fraction);

// Geometric midpoint by arc length.
Coordinate midpoint(const Polyline &line);

// `count` points evenly spaced by arc length, both ends included.
std::vector<Coordinate> samplePoints(const Polyline &line, int count);

Polyline reversed(const Polyline &line);

// "lon lat;lon lat;..." <-> Polyline
Polyline parseGeometry(const std::string &text);
std::string formatGeometry(const Polyline &line);

#endif // GEOMETRY_HPP
