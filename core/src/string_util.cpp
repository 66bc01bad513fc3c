#include "string_util.hpp"

#include <random>

namespace hvctl {
namespace utils {

std::vector<std::string> split_text(const std::string &s,
                                    const std::string &delimiter) {
  std::vector<std::string> result;
  for (auto &&subrange : std::ranges::split_view(s, delimiter))
    result.emplace_back(subrange.begin(), subrange.end());
  return result;
}

std::string random_hex(size_t n) {
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  static constexpr char digits[] = "0123456789abcdef";
  std::uniform_int_distribution<int> dist(0, 15);
  std::string rv(n, '0');
  for (auto &c : rv)
    c = digits[dist(gen)];
  return rv;
}

} // namespace utils
} // namespace hvctl
