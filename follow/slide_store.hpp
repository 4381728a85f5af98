#pragma once
#include <string>
#include <vector>

#include "slide.hpp"

// Read-only stand-in for the slide store: loads one snapshot of a slide
// sequence. Editing and persistence live with the editor, not here.
namespace Follow {

// Accepts either [ {id, text, order}, ... ] or { "slides": [ ... ] }.
// A missing order defaults to the array position. Duplicate or empty ids fail.
bool loadSlidesFromJson(const std::string& jsonText,
                        std::vector<Slide>& out,
                        std::string* err = nullptr);

bool loadSlidesFromFile(const std::string& path,
                        std::vector<Slide>& out,
                        std::string* err = nullptr);

} // namespace Follow
