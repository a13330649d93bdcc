#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace fl::json {

class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  // Hand-edited state files may carry trailing commas or NaN/Inf literals.
  static Document parse(std::string_view payload) {
    return Document(yyjson_read(payload.data(), payload.size(),
                                YYJSON_READ_ALLOW_TRAILING_COMMAS |
                                    YYJSON_READ_ALLOW_INF_AND_NAN));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument &&other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  MutableDocument &operator=(MutableDocument &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() { reset(); }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }
  yyjson_mut_val *root() const noexcept {
    return doc_ ? yyjson_mut_doc_get_root(doc_) : nullptr;
  }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  std::string write(char const *fallback = "{}", bool pretty = false) const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    yyjson_write_flag flags =
        pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
    char *json = yyjson_mut_write(doc_, flags, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_mut_doc *doc_ = nullptr;
};

// Typed field readers. A missing key and a key of the wrong type both read
// as nullopt so callers can fall back to their own default per field.
inline std::optional<double> get_number(yyjson_val *obj, char const *key) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  if (value == nullptr || !yyjson_is_num(value)) {
    return std::nullopt;
  }
  return yyjson_get_num(value);
}

inline std::optional<bool> get_bool(yyjson_val *obj, char const *key) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  if (value == nullptr || !yyjson_is_bool(value)) {
    return std::nullopt;
  }
  return yyjson_get_bool(value);
}

inline std::optional<std::string> get_string(yyjson_val *obj,
                                             char const *key) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<std::int64_t> get_int(yyjson_val *obj, char const *key) {
  auto *value = obj ? yyjson_obj_get(obj, key) : nullptr;
  if (value == nullptr || !yyjson_is_int(value)) {
    return std::nullopt;
  }
  if (yyjson_is_uint(value)) {
    return static_cast<std::int64_t>(yyjson_get_uint(value));
  }
  return yyjson_get_sint(value);
}

// Adds `value` under `key`, or JSON null when absent.
inline void add_optional_number(yyjson_mut_doc *doc, yyjson_mut_val *obj,
                                char const *key,
                                std::optional<double> const &value) {
  if (value) {
    yyjson_mut_obj_add_real(doc, obj, key, *value);
  } else {
    yyjson_mut_obj_add_null(doc, obj, key);
  }
}

} // namespace fl::json
