#pragma once
#include "types.hpp"
#include <string>
#include <vector>

// JSON report:
// {"width":W,"height":H,"count":N,"blobs":[{"id":1,"area":5,
//   "bbox":{"min_x":..,"min_y":..,"max_x":..,"max_y":..},
//   "centroid":{"x":..,"y":..},"color":[r,g,b]}, ...]}
std::string blobs_to_json(const std::vector<Blob>& blobs, int width, int height, int indent = 2);

// Reads the "blobs" array back. Extra fields are ignored.
SegError blobs_from_json(const std::string& text, std::vector<Blob>& blobs);
