/**
 * @file object_store.cpp
 * @brief libcurl and filesystem object store implementations
 */

#include "cursor_fx/object_store.hpp"

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <system_error>

#include <curl/curl.h>
#include <fmt/core.h>

#include "cursor_fx/config.hpp"
#include "cursor_fx/logging.hpp"

namespace cursor_fx {

namespace fs = std::filesystem;

namespace {

void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_to_file(void *data, size_t size, size_t nmemb, void *user) {
  return std::fwrite(data, size, nmemb, static_cast<std::FILE *>(user));
}

size_t append_to_string(void *data, size_t size, size_t nmemb, void *user) {
  static_cast<std::string *>(user)->append(static_cast<char *>(data),
                                           size * nmemb);
  return size * nmemb;
}

size_t read_from_file(char *buffer, size_t size, size_t nitems, void *user) {
  return std::fread(buffer, size, nitems, static_cast<std::FILE *>(user));
}

/// Owns an easy handle, its header list and one open file
struct CurlTransfer {
  CURL *handle = nullptr;
  curl_slist *headers = nullptr;
  std::FILE *file = nullptr;

  CurlTransfer() { handle = curl_easy_init(); }
  ~CurlTransfer() {
    if (file)
      std::fclose(file);
    if (headers)
      curl_slist_free_all(headers);
    if (handle)
      curl_easy_cleanup(handle);
  }

  CurlTransfer(const CurlTransfer &) = delete;
  CurlTransfer &operator=(const CurlTransfer &) = delete;

  void add_header(const std::string &line) {
    headers = curl_slist_append(headers, line.c_str());
  }
};

std::string strip_file_scheme(const std::string &url) {
  const std::string scheme = "file://";
  if (url.compare(0, scheme.size(), scheme) == 0)
    return url.substr(scheme.size());
  return url;
}

bool is_remote_url(const std::string &url) {
  return url.compare(0, 7, "http://") == 0 ||
         url.compare(0, 8, "https://") == 0;
}

} // namespace

std::string join_url(const std::string &base, const std::string &key) {
  std::string b = base;
  while (!b.empty() && b.back() == '/')
    b.pop_back();
  size_t start = 0;
  while (start < key.size() && key[start] == '/')
    ++start;
  return b + "/" + key.substr(start);
}

// **----- HTTP BACKEND -----**

CurlObjectStore::CurlObjectStore(std::string upload_base,
                                 std::string public_base,
                                 std::string auth_token, int timeout_sec)
    : upload_base_(std::move(upload_base)),
      public_base_(std::move(public_base)), auth_token_(std::move(auth_token)),
      timeout_sec_(timeout_sec) {
  ensure_curl_global_init();
}

bool CurlObjectStore::download(const std::string &url,
                               const std::string &dest_path) {
  last_error_.clear();

  CurlTransfer t;
  if (!t.handle) {
    last_error_ = "curl_easy_init failed";
    return false;
  }
  t.file = std::fopen(dest_path.c_str(), "wb");
  if (!t.file) {
    last_error_ = fmt::format("Cannot create {}", dest_path);
    return false;
  }

  curl_easy_setopt(t.handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(t.handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(t.handle, CURLOPT_WRITEFUNCTION, write_to_file);
  curl_easy_setopt(t.handle, CURLOPT_WRITEDATA, t.file);
  curl_easy_setopt(t.handle, CURLOPT_TIMEOUT, static_cast<long>(timeout_sec_));
  curl_easy_setopt(t.handle, CURLOPT_NOSIGNAL, 1L);

  CURLcode rc = curl_easy_perform(t.handle);
  long code = 0;
  curl_easy_getinfo(t.handle, CURLINFO_RESPONSE_CODE, &code);

  std::fclose(t.file);
  t.file = nullptr;

  if (rc != CURLE_OK || code >= 400) {
    last_error_ = rc != CURLE_OK
                      ? fmt::format("Download failed: {}", curl_easy_strerror(rc))
                      : fmt::format("Download failed: {}", code);
    std::error_code ec;
    fs::remove(dest_path, ec);
    return false;
  }
  return true;
}

bool CurlObjectStore::upload(const std::string &src_path,
                             const std::string &key,
                             const std::string &content_type,
                             const ObjectMetadata &metadata,
                             std::string &public_url) {
  last_error_.clear();

  if (upload_base_.empty()) {
    last_error_ = "STORAGE_UPLOAD_URL is not set";
    return false;
  }

  std::error_code ec;
  auto size = fs::file_size(src_path, ec);
  if (ec) {
    last_error_ = fmt::format("Cannot stat {}: {}", src_path, ec.message());
    return false;
  }

  CurlTransfer t;
  if (!t.handle) {
    last_error_ = "curl_easy_init failed";
    return false;
  }
  t.file = std::fopen(src_path.c_str(), "rb");
  if (!t.file) {
    last_error_ = fmt::format("Cannot open {}", src_path);
    return false;
  }

  t.add_header("Content-Type: " + content_type);
  if (!auth_token_.empty())
    t.add_header("Authorization: Bearer " + auth_token_);
  for (const auto &kv : metadata)
    t.add_header(fmt::format("x-amz-meta-{}: {}", kv.first, kv.second));

  std::string url = join_url(upload_base_, key);
  std::string response;

  curl_easy_setopt(t.handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(t.handle, CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(t.handle, CURLOPT_READFUNCTION, read_from_file);
  curl_easy_setopt(t.handle, CURLOPT_READDATA, t.file);
  curl_easy_setopt(t.handle, CURLOPT_INFILESIZE_LARGE,
                   static_cast<curl_off_t>(size));
  curl_easy_setopt(t.handle, CURLOPT_HTTPHEADER, t.headers);
  curl_easy_setopt(t.handle, CURLOPT_WRITEFUNCTION, append_to_string);
  curl_easy_setopt(t.handle, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(t.handle, CURLOPT_TIMEOUT, static_cast<long>(timeout_sec_));
  curl_easy_setopt(t.handle, CURLOPT_NOSIGNAL, 1L);

  CURLcode rc = curl_easy_perform(t.handle);
  long code = 0;
  curl_easy_getinfo(t.handle, CURLINFO_RESPONSE_CODE, &code);

  if (rc != CURLE_OK) {
    last_error_ = fmt::format("Upload failed: {}", curl_easy_strerror(rc));
    return false;
  }
  if (code >= 400) {
    last_error_ = fmt::format("Upload failed: {} - {}", code,
                              response.substr(0, 256));
    return false;
  }

  public_url = public_base_.empty() ? url : join_url(public_base_, key);
  return true;
}

// **----- FILESYSTEM BACKEND -----**

LocalObjectStore::LocalObjectStore(std::string root, std::string public_base)
    : root_(std::move(root)), public_base_(std::move(public_base)) {}

bool LocalObjectStore::download(const std::string &url,
                                const std::string &dest_path) {
  last_error_.clear();

  if (is_remote_url(url)) {
    last_error_ = fmt::format("Local storage cannot fetch {}", url);
    return false;
  }

  std::error_code ec;
  fs::copy_file(strip_file_scheme(url), dest_path,
                fs::copy_options::overwrite_existing, ec);
  if (ec) {
    last_error_ = fmt::format("Download failed: {}", ec.message());
    fs::remove(dest_path, ec);
    return false;
  }
  return true;
}

bool LocalObjectStore::upload(const std::string &src_path,
                              const std::string &key,
                              const std::string & /*content_type*/,
                              const ObjectMetadata & /*metadata*/,
                              std::string &public_url) {
  last_error_.clear();

  fs::path dest = fs::path(root_) / key;
  std::error_code ec;
  fs::create_directories(dest.parent_path(), ec);
  if (ec) {
    last_error_ = fmt::format("Cannot create {}: {}",
                              dest.parent_path().string(), ec.message());
    return false;
  }

  fs::copy_file(src_path, dest, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    last_error_ = fmt::format("Upload failed: {}", ec.message());
    return false;
  }

  public_url = public_base_.empty()
                   ? "file://" + fs::absolute(dest).string()
                   : join_url(public_base_, key);
  return true;
}

// **----- FACTORY -----**

std::unique_ptr<ObjectStore> make_object_store(std::string &error) {
  const std::string &mode = Config::storage_mode();

  if (mode == "local") {
    LOG_INFO("Storage: local ({})", Config::storage_local_root());
    return std::make_unique<LocalObjectStore>(Config::storage_local_root(),
                                              Config::storage_public_url());
  }

  if (mode == "http") {
    if (Config::storage_upload_url().empty()) {
      error = "STORAGE_MODE=http requires STORAGE_UPLOAD_URL";
      return nullptr;
    }
    LOG_INFO("Storage: http ({})", Config::storage_upload_url());
    return std::make_unique<CurlObjectStore>(
        Config::storage_upload_url(), Config::storage_public_url(),
        Config::storage_auth_token(), Config::http_timeout_sec());
  }

  error = fmt::format("Unknown STORAGE_MODE '{}' (expected http or local)",
                      mode);
  return nullptr;
}

} // namespace cursor_fx
