#include "trafficgen/ecommerce.hpp"
#include "trafficgen/catalog.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace trafficgen {

namespace {

inline std::int64_t to_cents(double v) { return std::llround(v * 100.0); }

inline double from_cents(std::int64_t c) { return static_cast<double>(c) / 100.0; }

struct CentTotals {
  std::int64_t subtotal;
  std::int64_t tax;
  std::int64_t revenue;
};

CentTotals totals(const std::vector<std::int64_t> &prices,
                  const std::vector<int> &qty, std::int64_t shipping,
                  double tax_rate) {
  CentTotals t{0, 0, 0};
  for (std::size_t i = 0; i < prices.size(); ++i)
    t.subtotal += prices[i] * qty[i];
  t.tax = std::llround(static_cast<double>(t.subtotal + shipping) * tax_rate);
  t.revenue = t.subtotal + shipping + t.tax;
  return t;
}

} // namespace

std::string format_amount(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

std::string EcommerceOrder::items_json() const {
  json arr = json::array();
  for (const auto &it : items)
    arr.push_back({it.sku, it.name, it.category, it.price, it.quantity});
  return arr.dump();
}

std::optional<EcommerceOrder> generate_ecommerce_order(const Config &cfg,
                                                       Random &rng,
                                                       bool force) {
  if (!force && !rng.chance(cfg.ecommerce_probability))
    return std::nullopt;

  const std::int64_t min_c = std::max<std::int64_t>(1, to_cents(cfg.ecommerce_order_value_min));
  const std::int64_t max_c = std::max(min_c, to_cents(cfg.ecommerce_order_value_max));
  const double rate = cfg.ecommerce_tax_rate;

  const std::int64_t target_c = rng.uniform_int(min_c, max_c);
  std::int64_t shipping_c =
      cfg.ecommerce_shipping_rates.empty()
          ? 0
          : to_cents(rng.pick(cfg.ecommerce_shipping_rates));

  auto n = static_cast<std::size_t>(
      rng.uniform_int(cfg.ecommerce_items_min, cfg.ecommerce_items_max));
  n = std::max<std::size_t>(1, n);

  std::vector<int> qty(n, 1);
  for (std::size_t i = 1; i < n; ++i)
    qty[i] = static_cast<int>(rng.uniform_int(1, 2));

  const auto pre_tax = static_cast<std::int64_t>(
      std::floor(static_cast<double>(target_c) / (1.0 + rate)));
  std::int64_t units = 0;
  for (int q : qty)
    units += q;

  std::int64_t goods = pre_tax - shipping_c;
  if (goods < units) {
    shipping_c = 0;
    goods = pre_tax;
  }
  if (goods < units) {
    // слишком маленький заказ: одна позиция
    n = 1;
    qty.assign(1, 1);
  }

  std::vector<double> weights(n);
  double wsum = 0.0;
  for (auto &w : weights) {
    w = rng.uniform_real(0.5, 1.5);
    wsum += w;
  }
  std::vector<std::int64_t> prices(n);
  for (std::size_t i = 0; i < n; ++i) {
    const double share = static_cast<double>(goods) * weights[i] / wsum;
    prices[i] = std::max<std::int64_t>(
        1, static_cast<std::int64_t>(std::floor(share / qty[i])));
  }

  // добиваем первую позицию (qty == 1), пока revenue не попадёт в границы.
  // Шаг revenue при +1 цент к позиции равен 1 или 2 центам (rate <= 1), а
  // validate требует минимум два допустимых значения в диапазоне.
  CentTotals t = totals(prices, qty, shipping_c, rate);
  for (int guard = 0; guard < 100000; ++guard) {
    if (t.revenue < min_c) {
      ++prices[0];
    } else if (t.revenue <= max_c) {
      break;
    } else if (prices[0] > 1) {
      --prices[0];
    } else if (shipping_c > 0) {
      shipping_c = 0;
    } else {
      auto it = std::max_element(prices.begin() + 1, prices.end());
      if (it == prices.end() || *it <= 1)
        break;
      --*it;
    }
    t = totals(prices, qty, shipping_c, rate);
  }

  EcommerceOrder order;
  std::string id = rng.hex(8);
  std::transform(id.begin(), id.end(), id.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  order.order_id = id;
  order.currency = cfg.ecommerce_currency;

  const auto &products = catalog::products();
  for (std::size_t i = 0; i < n; ++i) {
    const Product &p = rng.pick(products);
    order.items.push_back(
        OrderItem{p.sku, p.name, p.category, from_cents(prices[i]), qty[i]});
  }
  order.subtotal = from_cents(t.subtotal);
  order.shipping = from_cents(shipping_c);
  order.tax = from_cents(t.tax);
  order.revenue = from_cents(t.revenue);
  return order;
}

void apply_overrides(EcommerceOrder &order, const EcommerceOverrides &ov) {
  if (ov.subtotal)
    order.subtotal = *ov.subtotal;
  if (ov.shipping)
    order.shipping = *ov.shipping;
  if (ov.tax)
    order.tax = *ov.tax;
  if (ov.subtotal || ov.shipping || ov.tax)
    order.revenue = from_cents(to_cents(order.subtotal) +
                               to_cents(order.shipping) + to_cents(order.tax));
  if (ov.revenue)
    order.revenue = *ov.revenue;
  if (ov.currency && !ov.currency->empty())
    order.currency = *ov.currency;
}

} // namespace trafficgen
