#include <gtest/gtest.h>
#include <trafficgen/config.hpp>
#include <trafficgen/url_list.hpp>

#include <sstream>

using namespace trafficgen;

TEST(UrlList, SkipsCommentsAndReadsTitles) {
  std::istringstream in("# header\n"
                        "\n"
                        "https://shop.example.com/\tStart page\n"
                        "  https://shop.example.com/products  \n"
                        "https://shop.example.com/a extra-token\n");
  const UrlList urls = parse_urls(in);
  ASSERT_EQ(urls.size(), 3u);
  EXPECT_EQ(urls[0].url, "https://shop.example.com/");
  EXPECT_EQ(urls[0].title, "Start page");
  EXPECT_EQ(urls[1].url, "https://shop.example.com/products");
  EXPECT_TRUE(urls[1].title.empty());
  EXPECT_EQ(urls[2].url, "https://shop.example.com/a");
}

TEST(UrlList, MissingOrEmptyFileIsConfigError) {
  EXPECT_THROW(read_urls("/nonexistent/urls.txt"), ConfigError);
}

TEST(UrlList, ActionNameFallsBackToPath) {
  EXPECT_EQ(action_name_for({"https://x.example.com/a/b?c=1", ""}), "/a/b");
  EXPECT_EQ(action_name_for({"https://x.example.com/", ""}), "Home");
  EXPECT_EQ(action_name_for({"https://x.example.com", ""}), "Home");
  EXPECT_EQ(action_name_for({"https://x.example.com/a", "Title"}), "Title");
}
