#ifndef BPTREE_HPP
#define BPTREE_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#ifndef DEFAULT_BPTREE_ORDER
#define DEFAULT_BPTREE_ORDER 6
#endif
#ifdef DEBUG_MODE

#include <iostream>
#include <iomanip>
#include <libunwind.h>
#include <cxxabi.h>
#include <cstdio>
#include <cstdlib>

#define __TOKEN(x) #x
#define __STR(x) __TOKEN(x)
#define ASSERT(x) do { if (!(x)) { std::cerr << "assertion failed: " << __STR(x) << std::endl; debug_backtrace(); } } while (0)

inline void debug_backtrace() {
    unw_cursor_t cursor;
    unw_context_t context;

    // Initialize cursor to current frame for local unwinding.
    unw_getcontext(&context);
    unw_init_local(&cursor, &context);

    // Unwind frames one by one, going up the frame stack.
    while (unw_step(&cursor) > 0) {
        unw_word_t offset, pc;
        unw_get_reg(&cursor, UNW_REG_IP, &pc);
        if (pc == 0) {
            break;
        }
        std::fprintf(stderr, "0x%lx:", static_cast<unsigned long>(pc));

        char sym[256];
        if (unw_get_proc_name(&cursor, sym, sizeof(sym), &offset) == 0) {
            char *nameptr = sym;
            int status;
            char *demangled = abi::__cxa_demangle(sym, nullptr, nullptr, &status);
            if (status == 0) {
                nameptr = demangled;
            }
            std::fprintf(stderr, " (%s+0x%lx)\n", nameptr, static_cast<unsigned long>(offset));
            std::free(demangled);
        } else {
            std::fprintf(stderr, " -- error: unable to obtain symbol name for this frame\n");
        }
    }
    std::abort();
}

#else
#define ASSERT(x)
#endif

#ifdef DEBUG_MODE
inline size_t alive_node = 0;
#endif

namespace bptree {

    /// Thrown when a tree is constructed with an order below 3.
    class ConfigError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// Thrown by BPTree::check_invariants() when the structure is broken.
    class InvariantViolation : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    template<typename K, typename V, bool UseBinary = true, typename Compare = std::less<K>>
    class BPTree;

    namespace __bptree_impl {

        template<typename K, typename V, bool UseBinary = true, typename Compare = std::less<K>>
        struct AbstractBPNode;

        template<typename K, typename V, bool IsInternal, bool UseBinary = true, typename Compare = std::less<K>>
        struct BPTreeNode;

        struct Location {
            size_t position;
            bool found;
        };

        // position of the first key not less than `key`
        template<bool UseBinary, typename K, typename Compare>
        inline Location locate(const std::vector<K> &keys, const K &key, const Compare &comp) {
            if constexpr (UseBinary) {
                size_t position = std::lower_bound(keys.begin(), keys.end(), key, comp) - keys.begin();
                return {position, position != keys.size() && !comp(key, keys[position])};
            } else {
                size_t i = 0;
                for (; i < keys.size() && comp(keys[i], key); ++i);
                return {i, i != keys.size() && !comp(key, keys[i])};
            }
        }

        // child slot holding `key`: the first separator greater than it, or the last child
        template<bool UseBinary, typename K, typename Compare>
        inline size_t descent_index(const std::vector<K> &keys, const K &key, const Compare &comp) {
            if constexpr (UseBinary) {
                return std::upper_bound(keys.begin(), keys.end(), key, comp) - keys.begin();
            } else {
                size_t i = 0;
                for (; i < keys.size() && !comp(key, keys[i]); ++i);
                return i;
            }
        }

        template<typename K, typename V, bool UseBinary, typename Compare>
        struct AbstractBPNode {

            struct SplitResult {
                AbstractBPNode *left, *right;
                K separator;
            };

            struct InsertResult {
                std::optional<SplitResult> split;
                std::optional<V> replaced;
            };

            std::vector<K> keys;

            AbstractBPNode() = default;

            explicit AbstractBPNode(std::vector<K> keys) : keys(std::move(keys)) {}

            AbstractBPNode(const AbstractBPNode &) = delete;

            AbstractBPNode &operator=(const AbstractBPNode &) = delete;

            virtual bool is_leaf() const = 0;

            virtual std::optional<V> lookup(const K &key, const Compare &comp) const = 0;

            virtual InsertResult insert(const K &key, const V &value, size_t order, const Compare &comp) = 0;

            virtual size_t child_count() const = 0;

            virtual const AbstractBPNode *child_at(size_t) const = 0;

            virtual size_t value_count() const = 0;

            virtual const V &value_at(size_t) const = 0;

            virtual AbstractBPNode *clone() const = 0;

            virtual ~AbstractBPNode() = default;
        };

        template<typename K, typename V, bool IsInternal, bool UseBinary, typename Compare>
        struct BPTreeNode : AbstractBPNode<K, V, UseBinary, Compare> {
            using Node = AbstractBPNode<K, V, UseBinary, Compare>;
            using NodePtr = Node *;
            using SplitResult = typename Node::SplitResult;
            using InsertResult = typename Node::InsertResult;
            // one value per key in a leaf, one owned child more than keys in a branch
            using Payload = std::conditional_t<IsInternal, NodePtr, V>;

            std::vector<Payload> payload;

            BPTreeNode() {
#ifdef DEBUG_MODE
                alive_node++;
#endif
            }

            BPTreeNode(std::vector<K> keys, std::vector<Payload> payload)
                    : Node(std::move(keys)), payload(std::move(payload)) {
#ifdef DEBUG_MODE
                alive_node++;
#endif
            }

            inline bool is_leaf() const override {
                return !IsInternal;
            }

            std::optional<V> lookup(const K &key, const Compare &comp) const override {
                // at() keeps a caller-built node with too few children or values from being read past its end
                if constexpr (IsInternal) {
                    return payload.at(descent_index<UseBinary>(this->keys, key, comp))->lookup(key, comp);
                } else {
                    auto loc = locate<UseBinary>(this->keys, key, comp);
                    if (loc.found) {
                        return payload.at(loc.position);
                    }
                    return std::nullopt;
                }
            }

            // Either the insertion completes or the subtree is left as it was. Copies of the
            // key and value and every allocation happen before the first mutation, so this
            // holds as long as moving K and V does not throw.
            InsertResult insert(const K &key, const V &value, size_t order, const Compare &comp) override {
                InsertResult result;
                if constexpr (IsInternal) {
                    auto position = descent_index<UseBinary>(this->keys, key, comp);
                    auto child = payload.at(position);
                    // room for the child's split and, if that overflows this branch, for our own
                    std::unique_ptr<BPTreeNode> right;
                    if (this->keys.size() + 1 > order - 1) {
                        right = spare(this->keys.size() + 2);
                    }
                    this->keys.reserve(this->keys.size() + 1);
                    payload.reserve(payload.size() + 1);
                    result = child->insert(key, value, order, comp);
                    if (!result.split) {
                        return result;
                    }
                    adopt(std::move(*result.split), position);
                    result.split.reset();
                    if (this->keys.size() > order - 1) /* overflow */ {
                        ASSERT(right != nullptr);
                        result.split = split(std::move(right));
                    }
                } else {
                    if (payload.size() != this->keys.size()) {
                        throw std::out_of_range("leaf holds " + std::to_string(this->keys.size()) + " keys but " +
                                                std::to_string(payload.size()) + " values");
                    }
                    auto loc = locate<UseBinary>(this->keys, key, comp);
                    V copied(value);
                    if (loc.found) {
                        result.replaced = std::exchange(payload[loc.position], std::move(copied));
                        return result;
                    }
                    K inserted(key);
                    this->keys.reserve(this->keys.size() + 1);
                    payload.reserve(payload.size() + 1);
                    this->keys.insert(this->keys.begin() + loc.position, std::move(inserted));
                    payload.insert(payload.begin() + loc.position, std::move(copied));
                    if (this->keys.size() > order - 1) /* overflow */ {
                        try {
                            result.split = split(spare(this->keys.size()));
                        } catch (...) {
                            this->keys.erase(this->keys.begin() + loc.position);
                            payload.erase(payload.begin() + loc.position);
                            throw;
                        }
                    }
                }
                return result;
            }

            // the child at `position` kept the left half of its split; room was reserved before descending
            void adopt(SplitResult child, size_t position) {
                static_assert(IsInternal, "only branches adopt split children");
                ASSERT(child.left == payload[position]);
                this->keys.insert(this->keys.begin() + position, std::move(child.separator));
                payload.insert(payload.begin() + position + 1, child.right);
            }

            static std::unique_ptr<BPTreeNode> spare(size_t capacity) {
                auto node = std::make_unique<BPTreeNode>();
                node->keys.reserve(capacity);
                node->payload.reserve(capacity);
                return node;
            }

            // `right` must have room for the upper half; nothing here throws once the separator is taken
            SplitResult split(std::unique_ptr<BPTreeNode> right) {
                ASSERT(this->keys.size() >= 2);
                auto mid = this->keys.size() / 2;
                // a branch moves its separator up, a leaf keeps it as the right half's first key
                K separator = IsInternal ? K(std::move(this->keys[mid])) : K(this->keys[mid]);
                auto upper = mid + (IsInternal ? 1 : 0);
                right->keys.insert(right->keys.end(), std::make_move_iterator(this->keys.begin() + upper),
                                   std::make_move_iterator(this->keys.end()));
                right->payload.insert(right->payload.end(), std::make_move_iterator(payload.begin() + upper),
                                      std::make_move_iterator(payload.end()));
                this->keys.erase(this->keys.begin() + mid, this->keys.end());
                payload.erase(payload.begin() + upper, payload.end());
                return SplitResult{
                        .left = this,
                        .right = right.release(),
                        .separator = std::move(separator),
                };
            }

            inline size_t child_count() const override {
                if constexpr (IsInternal) {
                    return payload.size();
                } else {
                    return 0;
                }
            }

            inline const Node *child_at(size_t i) const override {
                if constexpr (IsInternal) {
                    return payload.at(i);
                } else {
                    return nullptr;
                }
            }

            inline size_t value_count() const override {
                if constexpr (IsInternal) {
                    return 0;
                } else {
                    return payload.size();
                }
            }

            const V &value_at(size_t i) const override {
                if constexpr (IsInternal) {
                    throw std::out_of_range("branch nodes hold no values");
                } else {
                    return payload.at(i);
                }
            }

            NodePtr clone() const override {
                auto copy = std::make_unique<BPTreeNode>();
                copy->keys = this->keys;
                if constexpr (IsInternal) {
                    copy->payload.reserve(payload.size());
                    for (auto child : payload) {
                        copy->payload.push_back(child->clone());
                    }
                } else {
                    copy->payload = payload;
                }
                return copy.release();
            }

            ~BPTreeNode() override {
#ifdef DEBUG_MODE
                alive_node--;
#endif
                if constexpr (IsInternal) {
                    for (auto child : payload) {
                        delete child;
                    }
                }
            }
        };

        // every key at or below `node` lies in [low, high); a null bound is open
        template<typename K, typename V, bool UseBinary, typename Compare>
        bool within(const AbstractBPNode<K, V, UseBinary, Compare> &node, const K *low, const K *high,
                    const Compare &comp) {
            for (auto &key : node.keys) {
                if ((low && comp(key, *low)) || (high && !comp(key, *high))) {
                    return false;
                }
            }
            for (size_t i = 0; i < node.child_count(); ++i) {
                auto child = node.child_at(i);
                if (child && !within(*child, low, high, comp)) {
                    return false;
                }
            }
            return true;
        }

        template<typename K, typename V, bool UseBinary, typename Compare>
        std::optional<size_t> balanced_height(const AbstractBPNode<K, V, UseBinary, Compare> &node) {
            if (node.is_leaf()) {
                return 0;
            }
            std::optional<size_t> height;
            for (size_t i = 0; i < node.child_count(); ++i) {
                auto child = node.child_at(i);
                if (!child) {
                    return std::nullopt;
                }
                auto h = balanced_height(*child);
                if (!h || (height && *height != *h)) {
                    return std::nullopt;
                }
                height = h;
            }
            return height.value_or(0) + 1;
        }
    }

    /// Every node's keys are strictly increasing.
    template<typename K, typename V, bool UseBinary, typename Compare>
    bool sorted(const __bptree_impl::AbstractBPNode<K, V, UseBinary, Compare> &node,
                const Compare &comp = Compare()) {
        for (size_t i = 1; i < node.keys.size(); ++i) {
            if (!comp(node.keys[i - 1], node.keys[i])) {
                return false;
            }
        }
        for (size_t i = 0; i < node.child_count(); ++i) {
            auto child = node.child_at(i);
            if (child && !sorted(*child, comp)) {
                return false;
            }
        }
        return true;
    }

    /// Child i of every branch holds only keys in [keys[i-1], keys[i]).
    template<typename K, typename V, bool UseBinary, typename Compare>
    bool separators_valid(const __bptree_impl::AbstractBPNode<K, V, UseBinary, Compare> &node,
                          const Compare &comp = Compare()) {
        if (node.is_leaf()) {
            return true;
        }
        auto &keys = node.keys;
        if (node.child_count() != keys.size() + 1) {
            return false;
        }
        for (size_t i = 0; i < node.child_count(); ++i) {
            auto child = node.child_at(i);
            if (!child) {
                return false;
            }
            auto low = i ? &keys[i - 1] : nullptr;
            auto high = i < keys.size() ? &keys[i] : nullptr;
            if (!__bptree_impl::within(*child, low, high, comp) || !separators_valid(*child, comp)) {
                return false;
            }
        }
        return true;
    }

    /// All leaves sit at the same depth.
    template<typename K, typename V, bool UseBinary, typename Compare>
    bool balanced(const __bptree_impl::AbstractBPNode<K, V, UseBinary, Compare> &node) {
        return __bptree_impl::balanced_height(node).has_value();
    }

    /// Leaves hold at most order-1 keys with one value each, branches at most
    /// `order` children with one child more than keys. False for orders below 3.
    template<typename K, typename V, bool UseBinary, typename Compare>
    bool fanout_respected(const __bptree_impl::AbstractBPNode<K, V, UseBinary, Compare> &node, size_t order) {
        if (order < 3 || node.keys.size() > order - 1) {
            return false;
        }
        if (node.is_leaf()) {
            return node.value_count() == node.keys.size();
        }
        if (node.child_count() > order || node.child_count() != node.keys.size() + 1) {
            return false;
        }
        for (size_t i = 0; i < node.child_count(); ++i) {
            auto child = node.child_at(i);
            if (!child || !fanout_respected(*child, order)) {
                return false;
            }
        }
        return true;
    }

    struct ValidationReport {
        bool sorted = true;
        bool separators_valid = true;
        bool balanced = true;
        bool fanout_respected = true;

        explicit operator bool() const {
            return sorted && separators_valid && balanced && fanout_respected;
        }

        std::string describe() const {
            if (*this) {
                return "valid";
            }
            std::string text = "invariant violated:";
            if (!sorted) text += " keys not strictly increasing;";
            if (!separators_valid) text += " separator bounds broken;";
            if (!balanced) text += " leaves at unequal depth;";
            if (!fanout_respected) text += " node over capacity or misshapen;";
            text.pop_back();
            return text;
        }
    };

    template<typename K, typename V, bool UseBinary, typename Compare>
    ValidationReport validate(const __bptree_impl::AbstractBPNode<K, V, UseBinary, Compare> &node, size_t order,
                              const Compare &comp = Compare()) {
        ValidationReport report;
        report.sorted = sorted(node, comp);
        report.separators_valid = separators_valid(node, comp);
        report.balanced = balanced(node);
        report.fanout_respected = fanout_respected(node, order);
        return report;
    }

    template<typename K, typename V, bool UseBinary, typename Compare>
    class BPTree {
    public:
        using Node = __bptree_impl::AbstractBPNode<K, V, UseBinary, Compare>;
        using Leaf = __bptree_impl::BPTreeNode<K, V, false, UseBinary, Compare>;
        using Branch = __bptree_impl::BPTreeNode<K, V, true, UseBinary, Compare>;

    private:
        size_t _size = 0;
        size_t _order;
        Node *_root = nullptr;

        Compare comp;

        static void check_order(size_t order) {
            if (order < 3) {
                throw ConfigError("bptree order must be at least 3, got " + std::to_string(order));
            }
        }

        static size_t count_entries(const Node &node) {
            if (node.is_leaf()) {
                return node.keys.size();
            }
            size_t count = 0;
            for (size_t i = 0; i < node.child_count(); ++i) {
                if (auto child = node.child_at(i)) count += count_entries(*child);
            }
            return count;
        }

        template<typename F>
        static void traverse_node(const Node &node, F &f) {
            if (node.is_leaf()) {
                for (size_t i = 0; i < node.keys.size(); ++i) {
                    f(node.keys[i], node.value_at(i));
                }
                return;
            }
            for (size_t i = 0; i < node.child_count(); ++i) {
                if (auto child = node.child_at(i)) traverse_node(*child, f);
            }
        }

        // leftmost (last == false) or rightmost leaf
        const Node *edge_leaf(bool last) const {
            const Node *node = _root;
            while (node && !node->is_leaf() && node->child_count()) {
                node = node->child_at(last ? node->child_count() - 1 : 0);
            }
            return node;
        }

#ifdef DEBUG_MODE

        static void display_node(std::ostream &os, const Node &node, size_t indent) {
            std::string idents(indent ? indent - 1 : 0, '-');
            if (indent) idents.push_back('>');
            os << idents;
            for (size_t i = 0; i < node.keys.size(); ++i) {
                os << " " << std::setw(4) << node.keys[i];
                if (node.is_leaf()) os << ":" << node.value_at(i);
            }
            os << std::endl;
            for (size_t i = 0; i < node.child_count(); ++i) {
                display_node(os, *node.child_at(i), indent + 4);
            }
        }

#endif

    public:

        explicit BPTree(size_t order = DEFAULT_BPTREE_ORDER, Compare comp = Compare())
                : _order(order), comp(std::move(comp)) {
            check_order(order);
            _root = new Leaf();
        }

        /// Takes ownership of a caller-built root. The structure is not checked.
        BPTree(size_t order, Node *root, Compare comp = Compare())
                : _order(order), _root(root), comp(std::move(comp)) {
            if (order < 3) {
                delete _root;
                check_order(order);
            }
            if (_root == nullptr) {
                _root = new Leaf();
            }
            _size = count_entries(*_root);
        }

        BPTree(BPTree &&that) noexcept
                : _size(that._size), _order(that._order), _root(that._root), comp(std::move(that.comp)) {
            that._root = nullptr;
            that._size = 0;
        }

        BPTree(const BPTree &that)
                : _size(that._size), _order(that._order), comp(that.comp) {
            if (that._root) {
                _root = that._root->clone();
            }
        }

        BPTree &operator=(BPTree that) noexcept {
            swap(that);
            return *this;
        }

        void swap(BPTree &that) noexcept {
            using std::swap;
            swap(_size, that._size);
            swap(_order, that._order);
            swap(_root, that._root);
            swap(comp, that.comp);
        }

        ~BPTree() {
            delete _root;
        }

#ifdef DEBUG_MODE

        void display(std::ostream &os = std::cout) const {
            if (_root) display_node(os, *_root, 0);
        }

#endif

        /// Inserts or replaces; returns the replaced value if the key was present.
        std::optional<V> insert(const K &key, const V &value) {
            if (_root == nullptr) {
                _root = new Leaf();
            }
            // a full root may split, so its replacement is allocated up front
            std::unique_ptr<Branch> grown;
            if (_root->keys.size() + 1 > _order - 1) {
                grown = Branch::spare(2);
            }
            auto result = _root->insert(key, value, _order, comp);
            if (result.split) {
                auto &split = *result.split;
                ASSERT(split.left == _root);
                ASSERT(grown != nullptr);
                grown->keys.push_back(std::move(split.separator));
                grown->payload.push_back(split.left);
                grown->payload.push_back(split.right);
                _root = grown.release();
            }
            if (!result.replaced) _size++;
            ASSERT(validate());
            return std::move(result.replaced);
        }

        std::optional<V> lookup(const K &key) const {
            if (_root == nullptr) return std::nullopt;
            return _root->lookup(key, comp);
        }

        bool member(const K &key) const {
            return lookup(key).has_value();
        }

        std::optional<K> min_key() const {
            auto leaf = edge_leaf(false);
            if (leaf == nullptr || leaf->keys.empty()) return std::nullopt;
            return leaf->keys.front();
        }

        std::optional<K> max_key() const {
            auto leaf = edge_leaf(true);
            if (leaf == nullptr || leaf->keys.empty()) return std::nullopt;
            return leaf->keys.back();
        }

        /// Calls f(key, value) for every entry in ascending key order.
        template<typename F>
        void traverse(F &&f) const {
            if (_root) traverse_node(*_root, f);
        }

        size_t height() const {
            size_t h = 0;
            for (const Node *node = _root; node && !node->is_leaf() && node->child_count(); node = node->child_at(0)) {
                ++h;
            }
            return h;
        }

        ValidationReport validate() const {
            if (_root == nullptr) return {};
            return bptree::validate(*_root, _order, comp);
        }

        bool valid() const {
            return static_cast<bool>(validate());
        }

        void check_invariants() const {
            auto report = validate();
            if (!report) {
                throw InvariantViolation(report.describe());
            }
        }

        const Node *root() const {
            return _root;
        }

        bool empty() const {
            return _size == 0;
        }

        size_t size() const {
            return _size;
        }

        size_t order() const {
            return _order;
        }
    };
}

#endif // BPTREE_HPP
