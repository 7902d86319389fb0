/**
 * @file object_store.hpp
 * @brief Source download and result upload for the processing queue
 *
 * @details Two backends, selected by STORAGE_MODE:
 *
 *          - CurlObjectStore ("http"): GET the source URL, PUT the result to
 *            STORAGE_UPLOAD_URL/<key> with an optional bearer token
 *
 *          - LocalObjectStore ("local"): copy from a path or file:// URL,
 *            copy the result to STORAGE_LOCAL_ROOT/<key>
 */

#ifndef CURSOR_FX_OBJECT_STORE_HPP
#define CURSOR_FX_OBJECT_STORE_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cursor_fx {

/// Extra per-object metadata sent with an upload
using ObjectMetadata = std::vector<std::pair<std::string, std::string>>;

/**
 * @class ObjectStore
 * @brief Blocking download/upload of whole files.
 *
 * @note Implementations are used from the single queue worker thread.
 */
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  /**
   * @brief Fetch `url` into `dest_path` (overwritten).
   * @return false on any transport or HTTP error; no partial file remains
   */
  virtual bool download(const std::string &url,
                        const std::string &dest_path) = 0;

  /**
   * @brief Store `src_path` under `key`.
   * @param public_url Output: where the stored object can be fetched
   * @return false on any transport or HTTP error
   */
  virtual bool upload(const std::string &src_path, const std::string &key,
                      const std::string &content_type,
                      const ObjectMetadata &metadata,
                      std::string &public_url) = 0;

  const std::string &last_error() const { return last_error_; }

protected:
  std::string last_error_;
};

/**
 * @class CurlObjectStore
 * @brief HTTP backend built on libcurl's easy interface.
 */
class CurlObjectStore : public ObjectStore {
public:
  /**
   * @param upload_base Objects are PUT to <upload_base>/<key>
   * @param public_base Public URL prefix (empty = same as upload_base)
   * @param auth_token Bearer token for uploads (empty = none)
   * @param timeout_sec Whole-transfer timeout
   */
  CurlObjectStore(std::string upload_base, std::string public_base,
                  std::string auth_token, int timeout_sec);

  bool download(const std::string &url, const std::string &dest_path) override;
  bool upload(const std::string &src_path, const std::string &key,
              const std::string &content_type, const ObjectMetadata &metadata,
              std::string &public_url) override;

private:
  std::string upload_base_;
  std::string public_base_;
  std::string auth_token_;
  int timeout_sec_;
};

/**
 * @class LocalObjectStore
 * @brief Filesystem backend for offline runs and tests.
 */
class LocalObjectStore : public ObjectStore {
public:
  /**
   * @param root Directory objects are copied into
   * @param public_base URL prefix for results (empty = file:// URL)
   */
  explicit LocalObjectStore(std::string root, std::string public_base = "");

  bool download(const std::string &url, const std::string &dest_path) override;
  bool upload(const std::string &src_path, const std::string &key,
              const std::string &content_type, const ObjectMetadata &metadata,
              std::string &public_url) override;

private:
  std::string root_;
  std::string public_base_;
};

/**
 * @brief Backend for the current STORAGE_MODE.
 * @return nullptr (with `error` set) for an unknown mode or missing config
 */
std::unique_ptr<ObjectStore> make_object_store(std::string &error);

/**
 * @brief Join a base URL and a key with exactly one '/'.
 */
std::string join_url(const std::string &base, const std::string &key);

} // namespace cursor_fx

#endif // CURSOR_FX_OBJECT_STORE_HPP
