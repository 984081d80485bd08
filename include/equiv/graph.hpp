// Object graph model compared by the equivalence assertions
#pragma once
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace equiv
{

    struct node; // forward declaration

    using node_ptr = std::shared_ptr<node>;

    // Symbolic value of an enumeration; an empty type is a plain keyword.
    struct enumerator
    {
        std::string type;
        std::string name;
    };

    // Ordered collection. `type` names the container ("vector", "list", "set" or a C++ type).
    struct sequence
    {
        std::string type;
        std::vector<node_ptr> elems;
    };

    struct field
    {
        std::string name;
        node_ptr value;
    };

    // Composite object. Fields are kept in declaration order; bases lists ancestor
    // type names nearest first.
    struct record
    {
        std::string type;
        std::vector<std::string> bases;
        std::vector<field> fields;
    };

    // User-defined value type compared through its own equality.
    class opaque_value
    {
    public:
        virtual ~opaque_value() = default;
        virtual const std::string &type() const = 0;
        virtual bool equals(const opaque_value &other) const = 0;
        virtual std::string render() const = 0;
    };

    using opaque_ptr = std::shared_ptr<const opaque_value>;

    // Typed text literal (`#Date "2024-01-01"`); equal to any opaque value rendering the same text.
    class literal_value final : public opaque_value
    {
    public:
        literal_value(std::string type, std::string text) : type_(std::move(type)), text_(std::move(text)) {}
        const std::string &type() const override { return type_; }
        bool equals(const opaque_value &other) const override { return text_ == other.render(); }
        std::string render() const override { return text_; }

    private:
        std::string type_;
        std::string text_;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, enumerator, sequence, record, opaque_ptr>;

    struct source_pos
    {
        int line = -1;
        int col = -1;
    };

    struct node
    {
        node_data data;
        source_pos pos;
    };

    // Closed set of comparison kinds a node is dispatched on.
    enum class node_kind
    {
        Null,
        Value,
        Text,
        Sequence,
        Composite
    };

    node_kind kind_of(const node &n);
    const char *kind_name(node_kind k);

    // Runtime type name used for compatibility checks and path annotations.
    std::string type_name(const node &n);

    inline bool is_null(const node_ptr &p) { return !p || std::holds_alternative<std::monostate>(p->data); }

    // Compact rendering in fixture notation.
    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("nil"); }

    // Field lookup by name on a composite node; nullptr when absent or not a record.
    const field *find_field(const node &n, std::string_view name);

    namespace detail
    {
        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
    }

    // ------ Factory helpers ------

    inline node_ptr n_null() { return detail::make_node(std::monostate{}); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_u64(uint64_t v) { return detail::make_node(v); }
    inline node_ptr n_f64(double v) { return detail::make_node(v); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_enum(std::string type, std::string name) { return detail::make_node(enumerator{std::move(type), std::move(name)}); }
    inline node_ptr n_opaque(opaque_ptr v) { return detail::make_node(std::move(v)); }
    inline node_ptr n_literal(std::string type, std::string text) { return n_opaque(std::make_shared<literal_value>(std::move(type), std::move(text))); }

    inline node_ptr n_seq(std::string type, std::vector<node_ptr> elems = {})
    {
        sequence s;
        s.type = std::move(type);
        s.elems = std::move(elems);
        return detail::make_node(std::move(s));
    }
    inline node_ptr n_vec(std::initializer_list<node_ptr> xs = {}) { return n_seq("vector", std::vector<node_ptr>(xs)); }
    inline node_ptr n_list(std::initializer_list<node_ptr> xs = {}) { return n_seq("list", std::vector<node_ptr>(xs)); }
    inline node_ptr n_set(std::initializer_list<node_ptr> xs = {}) { return n_seq("set", std::vector<node_ptr>(xs)); }

    inline node_ptr n_record(std::string type, std::initializer_list<field> fields = {}, std::vector<std::string> bases = {})
    {
        record r;
        r.type = std::move(type);
        r.bases = std::move(bases);
        r.fields.assign(fields.begin(), fields.end());
        return detail::make_node(std::move(r));
    }

    inline field fld(std::string name, node_ptr value) { return field{std::move(name), std::move(value)}; }

    // Append operators for collection types
    inline sequence &operator<<(sequence &s, const node_ptr &n)
    {
        s.elems.push_back(n);
        return s;
    }
    inline record &operator<<(record &r, field f)
    {
        r.fields.push_back(std::move(f));
        return r;
    }

    // Generic appender for node_ptr collections
    inline node_ptr &operator<<(node_ptr &c, const node_ptr &n)
    {
        if (!c)
            throw std::invalid_argument("operator<<: null container node");
        if (auto *s = std::get_if<sequence>(&c->data))
            s->elems.push_back(n);
        else
            throw std::invalid_argument("operator<<: container is not a sequence");
        return c;
    }
    inline node_ptr &operator<<(node_ptr &c, field f)
    {
        if (!c)
            throw std::invalid_argument("operator<<: null container node");
        if (auto *r = std::get_if<record>(&c->data))
            r->fields.push_back(std::move(f));
        else
            throw std::invalid_argument("operator<<: container is not a record");
        return c;
    }

} // namespace equiv
