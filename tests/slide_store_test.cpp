#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "follow/slide_store.hpp"

using Follow::Slide;

TEST(SlideStore, LoadsBareArrayWithDefaultOrder) {
    std::vector<Slide> slides;
    std::string err;
    ASSERT_TRUE(Follow::loadSlidesFromJson(
        R"([{"id":"a","text":"Alpha"},{"id":"b","text":"Bravo","order":-1}])", slides, &err)) << err;

    ASSERT_EQ(slides.size(), 2u);
    EXPECT_EQ(slides[0].order, 0);
    EXPECT_EQ(slides[1].order, -1);

    auto ordered = Follow::orderedSlides(slides);
    EXPECT_EQ(ordered[0].id, "b");
    EXPECT_EQ(ordered[1].id, "a");
}

TEST(SlideStore, LoadsWrappedObject) {
    std::vector<Slide> slides;
    ASSERT_TRUE(Follow::loadSlidesFromJson(R"({"slides":[{"id":"x","text":"Line one\nLine two"}]})", slides));
    ASSERT_EQ(slides.size(), 1u);
    EXPECT_EQ(slides[0].text, "Line one\nLine two");
}

TEST(SlideStore, RejectsBadInputWithoutTouchingOutput) {
    std::vector<Slide> slides{ { "keep", "me", 0 } };
    std::string err;

    EXPECT_FALSE(Follow::loadSlidesFromJson(R"([{"id":"a"},{"id":"a"}])", slides, &err));
    EXPECT_NE(err.find("Duplicate"), std::string::npos);

    EXPECT_FALSE(Follow::loadSlidesFromJson(R"([{"text":"no id"}])", slides, &err));
    EXPECT_FALSE(Follow::loadSlidesFromJson(R"({"id":"a"})", slides, &err));
    EXPECT_FALSE(Follow::loadSlidesFromJson("not json", slides, &err));

    ASSERT_EQ(slides.size(), 1u);
    EXPECT_EQ(slides[0].id, "keep");
}

TEST(SlideStore, OrderTiesKeepArrayPosition) {
    std::vector<Slide> slides{ { "a", "", 1 }, { "b", "", 0 }, { "c", "", 1 } };
    auto ordered = Follow::orderedSlides(slides);
    EXPECT_EQ(ordered[0].id, "b");
    EXPECT_EQ(ordered[1].id, "a");
    EXPECT_EQ(ordered[2].id, "c");
}

TEST(SlideStore, EligibilityNeedsVisibleText) {
    EXPECT_FALSE(Follow::isEligible({ "a", "", 0 }));
    EXPECT_FALSE(Follow::isEligible({ "a", " \n\t ", 0 }));
    EXPECT_TRUE(Follow::isEligible({ "a", "  x ", 0 }));
}

TEST(SlideStore, LoadsFromFile) {
    const std::string path = testing::TempDir() + "slidefollow_slides_test.json";
    {
        std::ofstream f(path);
        f << R"([{"id":"one","text":"Hello"}])";
    }

    std::vector<Slide> slides;
    std::string err;
    ASSERT_TRUE(Follow::loadSlidesFromFile(path, slides, &err)) << err;
    EXPECT_EQ(slides.size(), 1u);
    std::remove(path.c_str());

    EXPECT_FALSE(Follow::loadSlidesFromFile(path + ".missing", slides, &err));
    EXPECT_NE(err.find("Could not open"), std::string::npos);
}
