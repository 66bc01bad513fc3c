#pragma once

#include <memory>
#include <type_traits>

namespace hvctl {

/**
 * @brief Base of every shared, identity-bearing object
 * @details
 * Objects are always owned through `std::shared_ptr` (see `hvctl::create`),
 * which lets background workers keep the object they serve alive by holding
 * `as<derived_t>()`.
 */
class object_t : public std::enable_shared_from_this<object_t> {
public:
  object_t() = default;

  object_t(const object_t &) = delete;

  object_t &operator=(const object_t &) = delete;

  virtual ~object_t() = default;

  template <typename derived_t>
    requires std::is_base_of_v<object_t, derived_t>
  std::shared_ptr<const derived_t> as() const {
    return std::dynamic_pointer_cast<const derived_t>(shared_from_this());
  }

  template <typename derived_t>
    requires std::is_base_of_v<object_t, derived_t>
  std::shared_ptr<derived_t> as() {
    return std::dynamic_pointer_cast<derived_t>(shared_from_this());
  }
};

template <typename t, typename... args_t>
std::shared_ptr<t> create(args_t &&...args) {
  return std::make_shared<t>(std::forward<args_t>(args)...);
}

} // namespace hvctl
