#include "switchyard/placeholder-template-engine.hpp"

#include <gtest/gtest.h>

#include "switchyard/temp-file.hpp"
#include "switchyard/template-engine.hpp"

namespace switchyard {

TEST(PlaceholderTemplateEngine, SubstitutesEscapedAndRawValues) {
  PlaceholderTemplateEngine engine;
  engine.registerTemplate("page", "<title>{{title}}</title>{{{ body }}}<p>{{ title }}</p>");
  EXPECT_EQ(engine.render("page", {{"title", "A<B>"}, {"body", "<b>bold</b>"}}),
            "<title>A&lt;B&gt;</title><b>bold</b><p>A&lt;B&gt;</p>");
}

TEST(PlaceholderTemplateEngine, TextWithoutPlaceholders) {
  PlaceholderTemplateEngine engine;
  engine.registerTemplate("static", "no placeholder } here {");
  EXPECT_EQ(engine.render("static", {}), "no placeholder } here {");
}

TEST(PlaceholderTemplateEngine, Errors) {
  PlaceholderTemplateEngine engine;
  engine.registerTemplate("missing", "Hello {{name}}");
  engine.registerTemplate("open", "Hello {{name");
  EXPECT_THROW(engine.render("unknown", {}), TemplateRenderError);
  EXPECT_THROW(engine.render("missing", {{"other", "x"}}), TemplateRenderError);
  EXPECT_THROW(engine.render("open", {{"name", "x"}}), TemplateRenderError);
}

TEST(PlaceholderTemplateEngine, RegisterReplaces) {
  PlaceholderTemplateEngine engine;
  engine.registerTemplate("t", "one");
  engine.registerTemplate("t", "two");
  EXPECT_EQ(engine.render("t", {}), "two");
}

TEST(PlaceholderTemplateEngine, RegisterDirectory) {
  test::ScopedTempDir dir;
  test::ScopedTempFile index(dir, "index.hbs", "<h1>{{title}}</h1>");
  test::ScopedTempFile layout(dir, "layout.hbs", "{{{content}}}");
  test::ScopedTempFile ignored(dir, "notes.txt", "ignored");

  PlaceholderTemplateEngine engine;
  EXPECT_EQ(engine.registerDirectory(dir.dirPath()), 2U);
  EXPECT_TRUE(engine.contains("index"));
  EXPECT_TRUE(engine.contains("layout"));
  EXPECT_FALSE(engine.contains("notes"));
  EXPECT_EQ(engine.render("index", {{"title", "Home"}}), "<h1>Home</h1>");
}

TEST(PlaceholderTemplateEngine, PartialsShareTheData) {
  PlaceholderTemplateEngine engine;
  engine.registerTemplate("header", "<header>{{site}}</header>");
  engine.registerTemplate("page", "{{> header}}<main>{{title}}</main>{{>header}}");
  EXPECT_EQ(engine.render("page", {{"site", "A&B"}, {"title", "Home"}}),
            "<header>A&amp;B</header><main>Home</main><header>A&amp;B</header>");
}

TEST(PlaceholderTemplateEngine, PartialErrors) {
  PlaceholderTemplateEngine engine;
  engine.registerTemplate("unknown", "{{> nowhere}}");
  engine.registerTemplate("loop", "x{{> loop}}");
  EXPECT_THROW(engine.render("unknown", {}), TemplateRenderError);
  EXPECT_THROW(engine.render("loop", {}), TemplateRenderError);
}

TEST(PlaceholderTemplateEngine, RegisterDirectoryWithPartials) {
  test::ScopedTempDir dir;
  test::ScopedTempFile page(dir, "page.hbs", "{{> footer}}");
  test::ScopedTempFile footer(dir, "partials/footer.hbs", "<footer>{{year}}</footer>");
  test::ScopedTempFile ignored(dir, "partials/readme.md", "ignored");

  PlaceholderTemplateEngine engine;
  EXPECT_EQ(engine.registerDirectory(dir.dirPath()), 2U);
  EXPECT_TRUE(engine.contains("footer"));
  EXPECT_EQ(engine.render("page", {{"year", "2024"}}), "<footer>2024</footer>");
}

}  // namespace switchyard
