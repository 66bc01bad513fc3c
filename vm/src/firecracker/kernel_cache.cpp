#include <fstream>

#include <httplib.h>

#include "exception.hpp"
#include "firecracker.hpp"
#include "logging.hpp"
#include "string_util.hpp"

namespace fs = std::filesystem;

namespace hvctl {

static std::pair<std::string, std::string>
split_url(const std::string &url) {
  size_t pos = url.find("://");
  if (pos == std::string::npos)
    throw exception<value_error>(std::format("invalid URL: {}", url));
  size_t slash = url.find('/', pos + 3);
  if (slash == std::string::npos)
    return {url, "/"};
  return {url.substr(0, slash), url.substr(slash)};
}

static std::pair<bool, std::string>
download_file_with_progress(httplib::Client &client,
                            const std::string &remote_path,
                            const fs::path &local_path,
                            download_progress_t progress) {
  std::ofstream ofs(local_path, std::ios::binary | std::ios::trunc);
  if (!ofs)
    return {false, std::format("Failed to create {}", local_path.string())};

  httplib::Result res = client.Get(
      remote_path,
      [&](const char *data, size_t data_length) {
        ofs.write(data, data_length);
        return ofs.good();
      },
      [&](uint64_t current, uint64_t total) {
        if (progress)
          progress(current, total);
        return true;
      });
  if (!res || res->status != httplib::OK_200) {
    return {false, std::format("Failed to download {}: HTTP {}", remote_path,
                               res ? std::to_string(res->status)
                                   : httplib::to_string(res.error()))};
  }
  return {true, ""};
}

fs::path fetch_kernel(const std::string &kernel, const fs::path &kernel_dir,
                      const std::string &base_url,
                      download_progress_t progress) {
  fs::create_directories(kernel_dir);
  fs::path local_path = kernel_dir / std::format("firecracker-{}", kernel);
  if (fs::exists(local_path))
    return local_path;

  auto [host, base_path] = split_url(base_url);
  if (!base_path.ends_with("/"))
    base_path += "/";
  auto remote_path = base_path + local_path.filename().string();

  httplib::Client client(host);
  client.set_follow_location(true);
  client.set_connection_timeout(10, 0);
  client.set_read_timeout(60, 0);

  info("downloading kernel {} from {}{}", kernel, host, remote_path);
  // Unique per download so concurrent fetches of one kernel never share a file
  fs::path partial_path = local_path;
  partial_path += ".part-" + utils::random_hex(8);
  auto [success, error_message] =
      download_file_with_progress(client, remote_path, partial_path, progress);
  if (!success) {
    std::error_code ec;
    fs::remove(partial_path, ec);
    throw exception<runtime_error>(
        std::format("kernel '{}' is not available: {}", kernel, error_message));
  }
  fs::rename(partial_path, local_path);
  return local_path;
}

} // namespace hvctl
