#include <set>

#include <gtest/gtest.h>

#include "designs.hpp"
#include "lazy/elab/elaborate.hpp"
#include "lazy/vis/graphml.hpp"
#include "lazy/vis/json.hpp"

using namespace lazy;
using namespace lazy::elab;

TEST(ViewJson, ContainsEveryContainerAndLink) {
    ElabContext ctx;
    auto& top = ctx.make<demo::FanOut>("Top", 4u);
    auto res = elaborate(ctx, top);
    auto j = vis::buildViewJson(ctx, top);

    EXPECT_EQ(j["key"], "Top");
    EXPECT_EQ(j["title"], "FanOut");
    ASSERT_EQ(j["containers"].size(), res.mContainers);
    EXPECT_EQ(j["edges"].size(), res.mLinks);

    std::set<std::string> paths;
    for (const auto& jc : j["containers"])
        paths.insert(jc["path"].get<std::string>());
    std::set<std::string> expected{
      "Top", "Top.src", "Top.a", "Top.b", "Top.taps"};
    EXPECT_EQ(paths, expected);

    const auto& root = j["containers"][0];
    EXPECT_TRUE(root["parent"].is_null());
    EXPECT_EQ(root["children"].size(), 4u);
    ASSERT_EQ(root["ports"].size(), 2u);
    EXPECT_EQ(root["ports"][0]["name"], "taps_debug_0");
    EXPECT_EQ(root["ports"][0]["dir"], "Out");
    EXPECT_EQ(root["ports"][0]["width"], 4);
}

TEST(ViewJson, PipelineHasNoRootPorts) {
    ElabContext ctx;
    auto& top = ctx.make<demo::Pipeline>("Top", 8u, 1);
    auto res = elaborate(ctx, top);
    auto j = vis::buildViewJson(ctx, top);
    EXPECT_TRUE(j["containers"][0]["ports"].empty());
    EXPECT_EQ(j["edges"].size(), 2u);
    EXPECT_EQ(res.mLinks, 2u);
}

TEST(GraphML, ContainsEveryContainer) {
    ElabContext ctx;
    auto& top = ctx.make<demo::FanOut>("Top", 4u);
    elaborate(ctx, top);
    std::string g = vis::buildGraphML(ctx, top);

    EXPECT_EQ(g.rfind("<?xml", 0), 0u);
    EXPECT_NE(g.find("</graphml>"), std::string::npos);
    top.forEach([&](const Container& c) {
        std::string tag = "<node id=\"" + std::to_string(c.id()) + "\">";
        EXPECT_NE(g.find(tag), std::string::npos) << c.pathName();
    });
    // src.out drives a.in and b.in
    EXPECT_NE(g.find("<edge"), std::string::npos);
}

TEST(GraphML, XmlEscape) {
    EXPECT_EQ(vis::xmlEscape("a<b>&\"c\""), "a&lt;b&gt;&amp;&quot;c&quot;");
    EXPECT_EQ(vis::xmlEscape("plain"), "plain");
}
