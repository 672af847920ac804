#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>


namespace btsalvage::bencode {

    class Value
    {
    public:
        enum class Kind { none, integer, bytes, list, dict };

        using List = std::vector<Value>;
        using Dict = std::map<std::string, Value>;

        Value() = default;
        Value(std::int64_t i);
        Value(std::string s);
        Value(List l);
        Value(Dict d);

        Kind kind() const noexcept { return kind_; }

        bool isInteger() const noexcept { return kind_ == Kind::integer; }
        bool isBytes()   const noexcept { return kind_ == Kind::bytes; }
        bool isList()    const noexcept { return kind_ == Kind::list; }
        bool isDict()    const noexcept { return kind_ == Kind::dict; }

        std::int64_t integer() const;
        const std::string& bytes() const;
        const List& list() const;
        const Dict& dict() const;

        // nullptr when this is not a dict or the key is absent
        const Value* find(std::string_view key) const;

    private:
        Kind kind_{Kind::none};
        std::int64_t int_{0};
        std::string bytes_;
        List list_;
        Dict dict_;
    };

    class DecodeError : public std::runtime_error
    {
    public:
        DecodeError(const std::string& what, std::size_t offset);
        std::size_t offset() const noexcept { return offset_; }
    private:
        std::size_t offset_;
    };

    struct Document
    {
        Value root;
        std::optional<std::string_view> infoSlice;   // raw bytes of the top-level "info" value
    };

    // Whole input must be one value; trailing bytes are an error.
    Value decode(std::string_view input);

    // Same as decode(), also records where the root dict's "info" value sits in `input`.
    Document decodeDocument(std::string_view input);

    std::string encode(const Value& v);

} // namespace btsalvage::bencode
