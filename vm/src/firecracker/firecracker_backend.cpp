#include "exception.hpp"
#include "firecracker.hpp"

namespace hvctl {

void firecracker_backend_t::validate_config(const std::string &data) const {
  auto j = nlohmann::json::parse(data, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    throw exception<value_error>(
        "firecracker configuration must be a JSON object");
}

bool firecracker_backend_t::is_available() const {
  return find_in_path("firecracker");
}

std::shared_ptr<handle_t> firecracker_backend_t::allocate() {
  return create<handle_t>(create<firecracker_driver_t>());
}

} // namespace hvctl
