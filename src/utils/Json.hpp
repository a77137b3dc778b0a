#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace tbl::json {

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

  static Document parse(std::string_view payload) {
    return Document(yyjson_read(payload.data(), payload.size(),
                                static_cast<yyjson_read_flag>(0)));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

  // Typed member lookups on an object root; nullopt on absence or type
  // mismatch.
  std::optional<std::string> get_string(char const *key) const {
    auto *value = member(key);
    if (value == nullptr || !yyjson_is_str(value)) {
      return std::nullopt;
    }
    return std::string(yyjson_get_str(value), yyjson_get_len(value));
  }

  std::optional<std::int64_t> get_int(char const *key) const {
    auto *value = member(key);
    if (value == nullptr || !yyjson_is_int(value)) {
      return std::nullopt;
    }
    return yyjson_get_sint(value);
  }

  std::optional<bool> get_bool(char const *key) const {
    auto *value = member(key);
    if (value == nullptr || !yyjson_is_bool(value)) {
      return std::nullopt;
    }
    return yyjson_get_bool(value);
  }

private:
  yyjson_val *member(char const *key) const {
    auto *obj = root();
    if (obj == nullptr || !yyjson_is_obj(obj)) {
      return nullptr;
    }
    return yyjson_obj_get(obj, key);
  }

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

  // Creates an empty object root and returns it.
  yyjson_mut_val *object_root() {
    if (!doc_) {
      return nullptr;
    }
    auto *obj = yyjson_mut_obj(doc_);
    yyjson_mut_doc_set_root(doc_, obj);
    return obj;
  }

  std::string write(char const *fallback = "{}",
                    yyjson_write_flag flags = 0) const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
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

} // namespace tbl::json
