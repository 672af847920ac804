#include "bencode.hpp"
#include <limits>
#include <sstream>

namespace btsalvage::bencode {

    // ---------- Value ----------

    Value::Value(std::int64_t i) : kind_(Kind::integer), int_(i) {}

    Value::Value(std::string s) : kind_(Kind::bytes), bytes_(std::move(s)) {}

    Value::Value(List l) : kind_(Kind::list), list_(std::move(l)) {}

    Value::Value(Dict d) : kind_(Kind::dict), dict_(std::move(d)) {}

    std::int64_t Value::integer() const {
        if (!isInteger()) throw std::runtime_error("bencode: value is not an integer");
        return int_;
    }

    const std::string& Value::bytes() const {
        if (!isBytes()) throw std::runtime_error("bencode: value is not a byte string");
        return bytes_;
    }

    const Value::List& Value::list() const {
        if (!isList()) throw std::runtime_error("bencode: value is not a list");
        return list_;
    }

    const Value::Dict& Value::dict() const {
        if (!isDict()) throw std::runtime_error("bencode: value is not a dict");
        return dict_;
    }

    const Value* Value::find(std::string_view key) const {
        if (!isDict()) return nullptr;
        auto it = dict_.find(std::string(key));
        return it == dict_.end() ? nullptr : &it->second;
    }


    // ---------- Decoder ----------

    static std::string describe(const std::string& what, std::size_t offset) {
        std::ostringstream oss;
        oss << "bencode: " << what << " at offset " << offset;
        return oss.str();
    }

    DecodeError::DecodeError(const std::string& what, std::size_t offset)
        : std::runtime_error(describe(what, offset)), offset_(offset) {}

    namespace {

    // Nesting deeper than this is rejected rather than recursed into.
    constexpr int kMaxDepth = 64;

    class Decoder
    {
    public:
        Decoder(std::string_view input, bool captureInfo)
            : in_(input), captureInfo_(captureInfo) {}

        Value document() {
            Value v = value(0);
            if (pos_ != in_.size()) throw DecodeError("trailing data after root value", pos_);
            return v;
        }

        std::optional<std::string_view> infoSlice() const { return info_; }

    private:
        bool atEnd() const { return pos_ >= in_.size(); }

        char peek() const {
            if (atEnd()) throw DecodeError("unexpected end of input", pos_);
            return in_[pos_];
        }

        char next() {
            char c = peek();
            ++pos_;
            return c;
        }

        void consume(char c) {
            if (next() != c) throw DecodeError(std::string("expected '") + c + "'", pos_ - 1);
        }

        static bool isDigit(char c) { return c >= '0' && c <= '9'; }

        Value value(int depth) {
            if (depth > kMaxDepth) throw DecodeError("nesting too deep", pos_);

            const char c = peek();
            switch (c) {
                case 'i': return integer();
                case 'l': return list(depth);
                case 'd': return dict(depth);
                default:
                    if (isDigit(c)) return bytes();
                    throw DecodeError("invalid value prefix", pos_);
            }
        }

        Value integer() {
            consume('i');
            const std::size_t start = pos_;
            const bool negative = peek() == '-';
            if (negative) ++pos_;

            if (!isDigit(peek())) throw DecodeError("integer without digits", pos_);
            if (peek() == '0' && (negative || (pos_ + 1 < in_.size() && in_[pos_ + 1] != 'e'))) {
                throw DecodeError("integer with leading zero", start);
            }

            // accumulate as a negative number so INT64_MIN fits
            std::int64_t acc = 0;
            constexpr std::int64_t lo = std::numeric_limits<std::int64_t>::min();
            while (isDigit(peek())) {
                const int d = next() - '0';
                if (acc < (lo + d) / 10) throw DecodeError("integer overflow", start);
                acc = acc * 10 - d;
            }
            consume('e');

            if (negative) return Value(acc);
            if (acc == lo) throw DecodeError("integer overflow", start);
            return Value(-acc);
        }

        std::string rawBytes() {
            const std::size_t start = pos_;
            if (peek() == '0' && pos_ + 1 < in_.size() && isDigit(in_[pos_ + 1])) {
                throw DecodeError("string length with leading zero", start);
            }

            std::size_t len = 0;
            while (isDigit(peek())) {
                const std::size_t d = static_cast<std::size_t>(next() - '0');
                if (len > (std::numeric_limits<std::size_t>::max() - d) / 10) {
                    throw DecodeError("string length overflow", start);
                }
                len = len * 10 + d;
            }
            consume(':');

            if (in_.size() - pos_ < len) throw DecodeError("string runs past end of input", start);
            std::string out(in_.substr(pos_, len));
            pos_ += len;
            return out;
        }

        Value bytes() { return Value(rawBytes()); }

        Value list(int depth) {
            consume('l');
            Value::List items;
            while (peek() != 'e') items.push_back(value(depth + 1));
            consume('e');
            return Value(std::move(items));
        }

        Value dict(int depth) {
            consume('d');
            Value::Dict entries;

            while (peek() != 'e') {
                const std::size_t keyAt = pos_;
                if (!isDigit(peek())) throw DecodeError("dict key is not a string", keyAt);
                std::string key = rawBytes();
                if (entries.count(key)) throw DecodeError("duplicate dict key", keyAt);

                const std::size_t begin = pos_;
                Value v = value(depth + 1);

                if (captureInfo_ && depth == 0 && key == "info") {
                    info_ = in_.substr(begin, pos_ - begin);
                }
                entries.emplace(std::move(key), std::move(v));
            }

            consume('e');
            return Value(std::move(entries));
        }

        std::string_view in_;
        std::size_t pos_{0};
        bool captureInfo_{false};
        std::optional<std::string_view> info_;
    };

    } // namespace

    Value decode(std::string_view input) {
        Decoder d(input, false);
        return d.document();
    }

    Document decodeDocument(std::string_view input) {
        Decoder d(input, true);
        Document doc;
        doc.root = d.document();
        doc.infoSlice = d.infoSlice();
        return doc;
    }


    // ---------- Encoder ----------

    static void encodeInto(const Value& v, std::string& out) {
        switch (v.kind()) {
            case Value::Kind::none:
                throw std::runtime_error("bencode: cannot encode an empty value");

            case Value::Kind::integer:
                out += 'i';
                out += std::to_string(v.integer());
                out += 'e';
                break;

            case Value::Kind::bytes:
                out += std::to_string(v.bytes().size());
                out += ':';
                out += v.bytes();
                break;

            case Value::Kind::list:
                out += 'l';
                for (const auto& item : v.list()) encodeInto(item, out);
                out += 'e';
                break;

            case Value::Kind::dict:
                // std::map iterates keys in byte order, which is the canonical order
                out += 'd';
                for (const auto& [key, item] : v.dict()) {
                    out += std::to_string(key.size());
                    out += ':';
                    out += key;
                    encodeInto(item, out);
                }
                out += 'e';
                break;
        }
    }

    std::string encode(const Value& v) {
        std::string out;
        encodeInto(v, out);
        return out;
    }

} // namespace btsalvage::bencode
