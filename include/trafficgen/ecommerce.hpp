#pragma once
#include "config.hpp"
#include "random.hpp"

#include <optional>
#include <string>
#include <vector>

namespace trafficgen {

struct OrderItem {
  std::string sku;
  std::string name;
  std::string category;
  double price;
  int quantity;
};

struct EcommerceOrder {
  std::string order_id; // 8 hex, верхний регистр
  std::vector<OrderItem> items;
  double subtotal{0};
  double shipping{0};
  double tax{0};
  double revenue{0};
  std::string currency;

  // [[sku,name,category,price,qty],...] для ec_items
  std::string items_json() const;
};

// Переопределения из шага воронки типа ecommerce
struct EcommerceOverrides {
  std::optional<double> revenue;
  std::optional<double> subtotal;
  std::optional<double> tax;
  std::optional<double> shipping;
  std::optional<std::string> currency;
};

// Заказ с вероятностью ecommerce_probability (или всегда при force).
// Считается в центах: revenue = subtotal + shipping + tax,
// tax = round((subtotal + shipping) * tax_rate), revenue в [min, max].
std::optional<EcommerceOrder> generate_ecommerce_order(const Config &cfg,
                                                       Random &rng,
                                                       bool force = false);

void apply_overrides(EcommerceOrder &order, const EcommerceOverrides &ov);

std::string format_amount(double v);

} // namespace trafficgen
