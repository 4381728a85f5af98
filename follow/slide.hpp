#pragma once
#include <string>
#include <vector>

namespace Follow {

// One author-defined slide. The core only ever reads snapshots of these.
struct Slide {
    std::string id;     // unique within a sequence
    std::string text;   // may span several lines
    int order = 0;      // ties keep their original position
};

// Stable sort by order
std::vector<Slide> orderedSlides(const std::vector<Slide>& slides);

// A slide is a match candidate only when its trimmed text is non-empty
bool isEligible(const Slide& slide);

} // namespace Follow
