#pragma once

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace ts::json
{

// Read-only view of a parsed payload. Owns the yyjson document.
class Document
{
  public:
    Document() = default;
    explicit Document(yyjson_doc *doc) : doc_(doc)
    {
    }
    Document(Document &&other) noexcept : doc_(other.doc_)
    {
        other.doc_ = nullptr;
    }
    Document &operator=(Document &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            doc_ = other.doc_;
            other.doc_ = nullptr;
        }
        return *this;
    }
    Document(Document const &) = delete;
    Document &operator=(Document const &) = delete;
    ~Document()
    {
        reset();
    }

    // An invalid document (is_valid() == false) on malformed input.
    static Document parse(std::string_view payload)
    {
        return Document(yyjson_read(payload.data(), payload.size(),
                                    YYJSON_READ_NOFLAG));
    }

    bool is_valid() const noexcept
    {
        return doc_ != nullptr;
    }
    yyjson_val *root() const noexcept
    {
        return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
    }

  private:
    void reset()
    {
        if (doc_)
        {
            yyjson_doc_free(doc_);
            doc_ = nullptr;
        }
    }

    yyjson_doc *doc_ = nullptr;
};

inline std::optional<std::string> string_field(yyjson_val *obj,
                                               char const *key)
{
    auto *value = yyjson_obj_get(obj, key);
    if (!yyjson_is_str(value))
    {
        return std::nullopt;
    }
    return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<std::uint64_t> uint_field(yyjson_val *obj,
                                               char const *key)
{
    auto *value = yyjson_obj_get(obj, key);
    if (!yyjson_is_uint(value))
    {
        return std::nullopt;
    }
    return yyjson_get_uint(value);
}

// Response builder. Every string is copied into the document, so callers
// may pass temporaries.
class MutableDocument
{
  public:
    MutableDocument() : doc_(yyjson_mut_doc_new(nullptr))
    {
    }
    MutableDocument(MutableDocument const &) = delete;
    MutableDocument &operator=(MutableDocument const &) = delete;
    ~MutableDocument()
    {
        if (doc_)
        {
            yyjson_mut_doc_free(doc_);
        }
    }

    bool is_valid() const noexcept
    {
        return doc_ != nullptr;
    }
    yyjson_mut_doc *doc() const noexcept
    {
        return doc_;
    }

    // Creates an object and makes it the document root.
    yyjson_mut_val *root_object()
    {
        auto *root = yyjson_mut_obj(doc_);
        yyjson_mut_doc_set_root(doc_, root);
        return root;
    }

    void add_string(yyjson_mut_val *obj, char const *key,
                    std::string_view value)
    {
        yyjson_mut_obj_add_strncpy(doc_, obj, key, value.data(),
                                   value.size());
    }

    std::string write(char const *fallback = "{}") const
    {
        if (!doc_)
        {
            return fallback;
        }
        std::size_t length = 0;
        char *json = yyjson_mut_write(doc_, YYJSON_WRITE_NOFLAG, &length);
        if (json == nullptr)
        {
            return fallback;
        }
        std::string result(json, length);
        std::free(json);
        return result;
    }

  private:
    yyjson_mut_doc *doc_ = nullptr;
};

} // namespace ts::json
