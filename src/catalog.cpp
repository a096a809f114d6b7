#include "trafficgen/catalog.hpp"

namespace trafficgen {
namespace catalog {

const std::vector<std::string> &user_agents() {
  static const std::vector<std::string> v{
      "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 "
      "(KHTML, like Gecko) Chrome/116.0 Safari/537.36",
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:117.0) Gecko/20100101 "
      "Firefox/117.0",
      "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
      "Chrome/120.0 Safari/537.36",
      "Mozilla/5.0 (iPhone; CPU iPhone OS 14_4 like Mac OS X) "
      "AppleWebKit/605.1.15 (KHTML, like Gecko) Version/14.0 Mobile/15E148 "
      "Safari/604.1",
      "Mozilla/5.0 (Linux; Android 13; Pixel 7) AppleWebKit/537.36 (KHTML, "
      "like Gecko) Chrome/118.0 Mobile Safari/537.36",
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
      "like Gecko) Chrome/119.0 Safari/537.36 Edg/119.0",
  };
  return v;
}

const std::vector<std::string> &referrers() {
  static const std::vector<std::string> v{
      "https://www.google.com/search?q=analytics",
      "https://www.google.com/search?q=web+tracking",
      "https://www.bing.com/search?q=privacy+analytics",
      "https://duckduckgo.com/?q=open+source+analytics",
      "https://search.yahoo.com/search?p=dashboard",
      "https://www.facebook.com/",
      "https://t.co/abc123",
      "https://www.linkedin.com/feed/",
      "https://www.reddit.com/r/webdev/",
      "https://news.ycombinator.com/",
      "https://medium.com/tag/analytics",
      "https://github.com/trending",
  };
  return v;
}

const std::vector<std::string> &search_terms() {
  static const std::vector<std::string> v{
      "product",       "service",   "contact",   "about",      "help",
      "support",       "pricing",   "features",  "login",      "register",
      "download",      "documentation", "tutorial", "guide",   "faq",
      "news",          "blog",      "updates",   "announcement", "release",
      "version",       "security",  "privacy",   "terms",      "policy",
      "legal",         "careers",   "jobs",      "team",       "company",
      "analytics",     "tracking",  "dashboard", "report",     "statistics",
      "metrics",       "data",
  };
  return v;
}

const std::vector<std::string> &search_categories() {
  static const std::vector<std::string> v{"Products", "Support",
                                          "Documentation"};
  return v;
}

const std::vector<std::string> &outlinks() {
  static const std::vector<std::string> v{
      "https://github.com",          "https://stackoverflow.com",
      "https://developer.mozilla.org", "https://www.w3.org",
      "https://nodejs.org",          "https://reactjs.org",
      "https://vuejs.org",           "https://angular.io",
      "https://jquery.com",          "https://tailwindcss.com",
      "https://fontawesome.com",     "https://unsplash.com",
      "https://fonts.google.com",    "https://codepen.io",
      "https://wikipedia.org",       "https://youtube.com",
      "https://twitter.com",         "https://linkedin.com",
      "https://reddit.com",          "https://medium.com",
      "https://dev.to",
  };
  return v;
}

const std::vector<std::string> &downloads() {
  static const std::vector<std::string> v{
      "/downloads/user-manual.pdf",     "/downloads/getting-started-guide.pdf",
      "/downloads/api-documentation.pdf", "/downloads/whitepaper.pdf",
      "/downloads/case-study.pdf",      "/downloads/technical-specs.pdf",
      "/files/product-brochure.pdf",    "/files/pricing-sheet.pdf",
      "/assets/company-presentation.pptx", "/assets/logo-pack.zip",
      "/downloads/software-v2.1.0.zip", "/downloads/mobile-app.apk",
      "/files/dataset.csv",             "/files/report-2024.xlsx",
      "/downloads/template.docx",       "/downloads/configuration.json",
      "/files/backup.tar.gz",           "/downloads/installer.exe",
      "/assets/images.zip",             "/downloads/source-code.zip",
  };
  return v;
}

const std::vector<EventDef> &click_events() {
  static const std::vector<EventDef> v{
      {"Navigation", "Click", "Main Menu", std::nullopt},
      {"Navigation", "Click", "Footer Link", std::nullopt},
      {"CTA", "Click", "Sign Up Button", std::nullopt},
      {"CTA", "Click", "Request Demo", std::nullopt},
      {"CTA", "Click", "Start Free Trial", std::nullopt},
      {"Video", "Play", "Product Tour", std::nullopt},
      {"Form", "Submit", "Newsletter Signup", std::nullopt},
      {"Form", "Submit", "Contact Form", std::nullopt},
      {"Product", "AddToCart", "Widget Pro", 49.0},
      {"Social", "Share", "LinkedIn", std::nullopt},
  };
  return v;
}

const std::vector<EventDef> &random_events() {
  static const std::vector<EventDef> v{
      {"Engagement", "Scroll", "75 Percent", 75.0},
      {"Engagement", "Scroll", "Page End", 100.0},
      {"Engagement", "Time On Page", "60 Seconds", 60.0},
      {"Media", "Pause", "Product Tour", std::nullopt},
      {"Media", "Complete", "Product Tour", std::nullopt},
      {"Error", "404", "Broken Link", std::nullopt},
      {"UI", "Toggle", "Dark Mode", std::nullopt},
      {"UI", "Open", "Chat Widget", std::nullopt},
  };
  return v;
}

const std::vector<Product> &products() {
  static const std::vector<Product> v{
      {"ELEC-001", "Wireless Headphones", "Electronics", 899.0},
      {"ELEC-002", "USB-C Charger", "Electronics", 249.0},
      {"ELEC-003", "Bluetooth Speaker", "Electronics", 599.0},
      {"BOOK-001", "Analytics Handbook", "Books", 349.0},
      {"BOOK-002", "Privacy by Design", "Books", 279.0},
      {"CLTH-001", "Logo T-Shirt", "Clothing", 199.0},
      {"CLTH-002", "Hoodie", "Clothing", 499.0},
      {"HOME-001", "Coffee Mug", "Home", 129.0},
      {"HOME-002", "Desk Lamp", "Home", 399.0},
      {"SOFT-001", "Pro License", "Software", 990.0},
      {"SOFT-002", "Support Plan", "Software", 1490.0},
  };
  return v;
}

const std::vector<CountryRanges> &countries() {
  static const std::vector<CountryRanges> v{
      {"United States", 0.35,
       {"173.252.0.0/16", "74.125.0.0/16", "208.67.0.0/16", "192.30.252.0/22",
        "199.232.0.0/16", "23.0.0.0/8", "104.16.0.0/12", "142.250.0.0/15"}},
      {"United Kingdom", 0.10,
       {"51.140.0.0/14", "81.2.69.0/24", "86.128.0.0/10"}},
      {"Germany", 0.10,
       {"78.46.0.0/15", "5.9.0.0/16", "136.243.0.0/16", "88.198.0.0/16",
        "46.4.0.0/16", "80.156.0.0/16"}},
      {"France", 0.07, {"163.172.0.0/16", "51.15.0.0/16", "90.0.0.0/9"}},
      {"Canada", 0.06, {"142.0.0.0/8", "99.224.0.0/11"}},
      {"India", 0.08, {"49.32.0.0/12", "117.192.0.0/10"}},
      {"Japan", 0.05, {"133.0.0.0/8", "126.0.0.0/8"}},
      {"Brazil", 0.05, {"177.0.0.0/8", "189.0.0.0/8"}},
      {"Australia", 0.04, {"1.128.0.0/11", "101.160.0.0/11"}},
      {"Netherlands", 0.04, {"145.0.0.0/8", "84.80.0.0/12"}},
      {"Sweden", 0.03, {"194.47.0.0/16", "81.230.0.0/16", "78.72.0.0/15"}},
      {"Spain", 0.03, {"88.0.0.0/11", "83.32.0.0/11"}},
  };
  return v;
}

} // namespace catalog
} // namespace trafficgen
