#include "slide_store.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace Follow {

// ------------------------------------------------------------
// Slide helpers
// ------------------------------------------------------------
std::vector<Slide> orderedSlides(const std::vector<Slide>& slides) {
    std::vector<Slide> out = slides;
    std::stable_sort(out.begin(), out.end(),
                     [](const Slide& a, const Slide& b) { return a.order < b.order; });
    return out;
}

bool isEligible(const Slide& slide) {
    return std::any_of(slide.text.begin(), slide.text.end(),
                       [](unsigned char c) { return !std::isspace(c); });
}

// ------------------------------------------------------------
// Loaders
// ------------------------------------------------------------
bool loadSlidesFromJson(const std::string& jsonText,
                        std::vector<Slide>& out,
                        std::string* err) {
    try {
        nlohmann::json j = nlohmann::json::parse(jsonText);
        const nlohmann::json& list = (j.is_object() && j.contains("slides")) ? j["slides"] : j;

        if (!list.is_array()) {
            if (err) *err = "Expected an array of slides";
            return false;
        }

        std::vector<Slide> slides;
        std::unordered_set<std::string> seen;
        int position = 0;

        for (const auto& s : list) {
            Slide slide;
            slide.id    = s.value("id", "");
            slide.text  = s.value("text", "");
            slide.order = s.value("order", position);
            ++position;

            if (slide.id.empty()) {
                if (err) *err = "Slide at position " + std::to_string(position - 1) + " has no id";
                return false;
            }
            if (!seen.insert(slide.id).second) {
                if (err) *err = "Duplicate slide id: " + slide.id;
                return false;
            }
            slides.push_back(std::move(slide));
        }

        out = std::move(slides);
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

bool loadSlidesFromFile(const std::string& path,
                        std::vector<Slide>& out,
                        std::string* err) {
    std::ifstream f(path);
    if (!f) {
        if (err) *err = "Could not open file: " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << f.rdbuf();

    if (!loadSlidesFromJson(buffer.str(), out, err)) {
        return false;
    }

    LOG_DEBUG("Slides", "Loaded " + std::to_string(out.size()) + " slides from " + path);
    return true;
}

} // namespace Follow
